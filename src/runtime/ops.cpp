#include <parity/runtime/ops.hpp>

#include <fmt/core.h>
#include <robin_hood.h>

#include <algorithm>
#include <iterator>
#include <map>
#include <numeric>
#include <type_traits>

namespace parity::ops {

namespace {

using table::ColumnEntry;
using table::ColumnMeta;
using table::GroupKey;
using table::KeyEntry;
using table::Table;

constexpr std::string_view kTimeColumn = "_time";

auto execution_error(std::string message) -> std::unexpected<Error> {
    return std::unexpected(make_error(ErrorKind::Execution, std::move(message)));
}

auto column_value(const Table& table, const std::string& name, std::size_t row) -> Value {
    auto it = table.index.find(name);
    if (it == table.index.end()) {
        return std::monostate{};
    }
    return table.value_at(it->second, row);
}

auto operand(const ir::FilterExpr& expr, const Table& table, std::size_t row) -> Value {
    if (const auto* col = std::get_if<ir::FilterColumn>(&expr.node)) {
        return column_value(table, col->name, row);
    }
    if (const auto* lit = std::get_if<ir::FilterLiteral>(&expr.node)) {
        return lit->value;
    }
    return Value{matches(expr, table, row)};
}

auto holds(ir::CompareOp op, std::partial_ordering ord) -> bool {
    switch (op) {
        case ir::CompareOp::Eq:
            return ord == 0;
        case ir::CompareOp::Ne:
            return ord != 0;
        case ir::CompareOp::Lt:
            return ord < 0;
        case ir::CompareOp::Le:
            return ord <= 0;
        case ir::CompareOp::Gt:
            return ord > 0;
        case ir::CompareOp::Ge:
            return ord >= 0;
    }
    return false;
}

void copy_column(Table& out, const ColumnEntry& entry) {
    if (entry.validity.has_value()) {
        out.add_column(entry.meta.name, entry.data, *entry.validity);
    } else {
        out.add_column(entry.meta.name, entry.data);
    }
}

/// Copy the named columns, in order, and prune the key to what survives.
auto project(const Table& table, const std::vector<std::string>& names) -> Table {
    Table out;
    for (const auto& name : names) {
        const auto* entry = table.find(name);
        if (entry != nullptr && out.find(name) == nullptr) {
            copy_column(out, *entry);
        }
    }
    for (const auto& entry : table.key.entries()) {
        if (out.find(entry.meta.name) != nullptr) {
            out.key.add(entry.meta, entry.value);
        }
    }
    return out;
}

/// Length-prefixed encoding of the grouping columns of one row. Missing
/// columns and nulls encode differently.
void encode_group(const Table& table, std::size_t row, const std::vector<std::string>& columns,
                  std::string& out) {
    out.clear();
    for (const auto& name : columns) {
        auto it = table.index.find(name);
        if (it == table.index.end()) {
            out.append("~|");
            continue;
        }
        Value value = table.value_at(it->second, row);
        std::string text = format_value(value);
        fmt::format_to(std::back_inserter(out), "{}:{}:{}|", value.index(), text.size(), text);
    }
}

auto is_numeric(DataType type) -> bool {
    return type == DataType::Int || type == DataType::UInt || type == DataType::Float;
}

auto output_type(ir::AggFunc func, const ColumnMeta& input) -> Expected<DataType> {
    switch (func) {
        case ir::AggFunc::Count:
            return DataType::Int;
        case ir::AggFunc::Mean:
        case ir::AggFunc::Sum:
            if (!is_numeric(input.type)) {
                return execution_error(fmt::format("{}() is not supported on {} column '{}'",
                                                   ir::agg_func_name(func),
                                                   type_name(input.type), input.name));
            }
            return func == ir::AggFunc::Mean ? DataType::Float : input.type;
        case ir::AggFunc::Min:
        case ir::AggFunc::Max:
        case ir::AggFunc::First:
        case ir::AggFunc::Last:
            return input.type;
    }
    return input.type;
}

auto as_double(const Value& value) -> double {
    return std::visit(
        [](const auto& v) -> double {
            using T = std::decay_t<decltype(v)>;
            if constexpr (std::is_same_v<T, std::int64_t> || std::is_same_v<T, std::uint64_t> ||
                          std::is_same_v<T, double>) {
                return static_cast<double>(v);
            } else {
                return 0.0;
            }
        },
        value);
}

auto reduce(ir::AggFunc func, DataType type, const std::vector<Value>& values) -> Value {
    if (func == ir::AggFunc::Count) {
        return static_cast<std::int64_t>(values.size());
    }
    if (values.empty()) {
        return std::monostate{};
    }
    const auto less = [](const Value& a, const Value& b) { return value_order(a, b) < 0; };
    switch (func) {
        case ir::AggFunc::Sum:
            if (type == DataType::Float) {
                double sum = 0.0;
                for (const auto& v : values) {
                    sum += std::get<double>(v);
                }
                return sum;
            } else {
                // Wraps on overflow.
                std::uint64_t sum = 0;
                for (const auto& v : values) {
                    sum += type == DataType::Int
                               ? static_cast<std::uint64_t>(std::get<std::int64_t>(v))
                               : std::get<std::uint64_t>(v);
                }
                if (type == DataType::Int) {
                    return static_cast<std::int64_t>(sum);
                }
                return sum;
            }
        case ir::AggFunc::Mean: {
            double sum = 0.0;
            for (const auto& v : values) {
                sum += as_double(v);
            }
            return sum / static_cast<double>(values.size());
        }
        case ir::AggFunc::Min:
            return *std::ranges::min_element(values, less);
        case ir::AggFunc::Max:
            return *std::ranges::max_element(values, less);
        case ir::AggFunc::First:
            return values.front();
        case ir::AggFunc::Last:
            return values.back();
        case ir::AggFunc::Count:
            break;
    }
    return std::monostate{};
}

auto floor_div(std::int64_t a, std::int64_t b) -> std::int64_t {
    std::int64_t q = a / b;
    if (a % b != 0 && ((a < 0) != (b < 0))) {
        q -= 1;
    }
    return q;
}

auto aggregate_table(const Table& input, const std::vector<ir::AggSpec>& specs,
                     std::optional<Duration> every) -> Expected<Table> {
    Table out;
    out.key = input.key;
    for (const auto& entry : input.key.entries()) {
        out.add_column(entry.meta);
    }

    std::map<std::int64_t, std::vector<std::size_t>> windows;
    if (every.has_value()) {
        const auto* time = input.find(std::string(kTimeColumn));
        if (time == nullptr || time->meta.type != DataType::Time) {
            return execution_error("windowed aggregate requires a _time column of type time");
        }
        if (out.find(std::string(kTimeColumn)) != nullptr) {
            return execution_error("cannot window over a table grouped by _time");
        }
        const std::size_t col = input.index.at(std::string(kTimeColumn));
        for (std::size_t row = 0; row < input.rows(); ++row) {
            Value value = input.value_at(col, row);
            if (const auto* ts = std::get_if<Timestamp>(&value)) {
                windows[floor_div(ts->nanos, every->nanos) * every->nanos].push_back(row);
            }
        }
        out.add_column(ColumnMeta{.name = std::string(kTimeColumn), .type = DataType::Time});
    } else {
        auto& all = windows[0];
        all.resize(input.rows());
        std::iota(all.begin(), all.end(), std::size_t{0});
    }

    std::vector<std::pair<std::size_t, DataType>> sources;
    for (const auto& spec : specs) {
        auto it = input.index.find(spec.column);
        if (it == input.index.end()) {
            return execution_error(fmt::format("column '{}' not found for {}() in table {}",
                                               spec.column, ir::agg_func_name(spec.func),
                                               input.key.format()));
        }
        auto type = output_type(spec.func, input.columns[it->second].meta);
        if (!type.has_value()) {
            return std::unexpected(std::move(type.error()));
        }
        if (out.find(spec.alias) != nullptr) {
            return execution_error(fmt::format("duplicate output column '{}'", spec.alias));
        }
        out.add_column(ColumnMeta{.name = spec.alias, .type = *type});
        sources.emplace_back(it->second, input.columns[it->second].meta.type);
    }

    std::vector<Value> values;
    for (const auto& [start, rows] : windows) {
        std::vector<Value> row;
        row.reserve(out.columns.size());
        for (const auto& entry : input.key.entries()) {
            row.push_back(entry.value);
        }
        if (every.has_value()) {
            row.emplace_back(Timestamp{.nanos = start});
        }
        for (std::size_t i = 0; i < specs.size(); ++i) {
            values.clear();
            for (auto r : rows) {
                Value value = input.value_at(sources[i].first, r);
                if (!is_null(value)) {
                    values.push_back(std::move(value));
                }
            }
            row.push_back(reduce(specs[i].func, sources[i].second, values));
        }
        if (!out.append_row(row)) {
            return execution_error(
                fmt::format("aggregate row does not match schema of table {}", input.key.format()));
        }
    }
    return out;
}

}  // namespace

auto matches(const ir::FilterExpr& pred, const Table& table, std::size_t row) -> bool {
    return std::visit(
        [&](const auto& node) -> bool {
            using T = std::decay_t<decltype(node)>;
            if constexpr (std::is_same_v<T, ir::FilterCmp>) {
                auto ord = compare_values(operand(*node.left, table, row),
                                          operand(*node.right, table, row));
                return ord.has_value() && holds(node.op, *ord);
            } else if constexpr (std::is_same_v<T, ir::FilterAnd>) {
                return matches(*node.left, table, row) && matches(*node.right, table, row);
            } else if constexpr (std::is_same_v<T, ir::FilterOr>) {
                return matches(*node.left, table, row) || matches(*node.right, table, row);
            } else if constexpr (std::is_same_v<T, ir::FilterNot>) {
                return !matches(*node.operand, table, row);
            } else {
                Value value = operand(pred, table, row);
                const auto* flag = std::get_if<bool>(&value);
                return flag != nullptr && *flag;
            }
        },
        pred.node);
}

auto filter(const TableSet& tables, const ir::FilterExpr& pred) -> TableSet {
    TableSet out;
    std::vector<std::size_t> rows;
    for (const auto& t : tables) {
        rows.clear();
        for (std::size_t row = 0; row < t.rows(); ++row) {
            if (matches(pred, t, row)) {
                rows.push_back(row);
            }
        }
        if (!rows.empty()) {
            out.push_back(t.gather(rows));
        }
    }
    return out;
}

auto group(const TableSet& tables, const std::vector<std::string>& columns) -> Expected<TableSet> {
    using Member = std::pair<std::size_t, std::size_t>;
    robin_hood::unordered_flat_map<std::string, std::size_t> slots;
    std::vector<std::vector<Member>> members;
    std::string encoded;
    for (std::size_t ti = 0; ti < tables.size(); ++ti) {
        const auto& t = tables[ti];
        for (std::size_t row = 0; row < t.rows(); ++row) {
            encode_group(t, row, columns, encoded);
            auto [it, inserted] = slots.try_emplace(encoded, members.size());
            if (inserted) {
                members.emplace_back();
            }
            members[it->second].emplace_back(ti, row);
        }
    }

    TableSet out;
    out.reserve(members.size());
    for (const auto& rows : members) {
        std::vector<ColumnMeta> schema;
        std::size_t last_table = tables.size();
        for (const auto& [ti, row] : rows) {
            if (ti == last_table) {
                continue;
            }
            last_table = ti;
            for (const auto& meta : tables[ti].schema()) {
                auto it = std::ranges::find(schema, meta.name, &ColumnMeta::name);
                if (it == schema.end()) {
                    schema.push_back(meta);
                } else if (it->type != meta.type) {
                    return execution_error(fmt::format("column '{}' has conflicting types {} and {}",
                                                       meta.name, type_name(it->type),
                                                       type_name(meta.type)));
                }
            }
        }

        Table grouped;
        for (const auto& meta : schema) {
            grouped.add_column(meta);
        }
        const auto& [first_table, first_row] = rows.front();
        for (const auto& name : columns) {
            const auto* entry = tables[first_table].find(name);
            if (entry != nullptr) {
                grouped.key.add(entry->meta, column_value(tables[first_table], name, first_row));
            }
        }
        std::vector<Value> values(schema.size());
        for (const auto& [ti, row] : rows) {
            for (std::size_t c = 0; c < schema.size(); ++c) {
                values[c] = column_value(tables[ti], schema[c].name, row);
            }
            if (!grouped.append_row(values)) {
                return execution_error(
                    fmt::format("row does not fit group {}", grouped.key.format()));
            }
        }
        out.push_back(std::move(grouped));
    }
    return out;
}

auto keep(const TableSet& tables, const std::vector<std::string>& columns) -> TableSet {
    TableSet out;
    out.reserve(tables.size());
    for (const auto& t : tables) {
        out.push_back(project(t, columns));
    }
    return out;
}

auto drop(const TableSet& tables, const std::vector<std::string>& columns) -> TableSet {
    TableSet out;
    out.reserve(tables.size());
    for (const auto& t : tables) {
        std::vector<std::string> kept;
        for (const auto& entry : t.columns) {
            if (std::ranges::find(columns, entry.meta.name) == columns.end()) {
                kept.push_back(entry.meta.name);
            }
        }
        out.push_back(project(t, kept));
    }
    return out;
}

auto sort(const TableSet& tables, const std::vector<std::string>& columns, bool descending)
    -> TableSet {
    TableSet out;
    out.reserve(tables.size());
    for (const auto& t : tables) {
        std::vector<std::size_t> keys;
        for (const auto& name : columns) {
            if (auto it = t.index.find(name); it != t.index.end()) {
                keys.push_back(it->second);
            }
        }
        std::vector<std::size_t> rows(t.rows());
        std::iota(rows.begin(), rows.end(), std::size_t{0});
        std::ranges::stable_sort(rows, [&](std::size_t a, std::size_t b) {
            for (auto col : keys) {
                auto ord = value_order(t.value_at(col, a), t.value_at(col, b));
                if (ord != 0) {
                    return descending ? ord > 0 : ord < 0;
                }
            }
            return false;
        });
        out.push_back(t.gather(rows));
    }
    return out;
}

auto limit(const TableSet& tables, std::int64_t count, std::int64_t offset) -> TableSet {
    TableSet out;
    out.reserve(tables.size());
    for (const auto& t : tables) {
        const std::size_t total = t.rows();
        const auto skip = static_cast<std::size_t>(std::max<std::int64_t>(offset, 0));
        const auto wanted = static_cast<std::size_t>(std::max<std::int64_t>(count, 0));
        const std::size_t start = std::min(total, skip);
        const std::size_t take = std::min(total - start, wanted);
        std::vector<std::size_t> rows(take);
        std::iota(rows.begin(), rows.end(), start);
        out.push_back(t.gather(rows));
    }
    return out;
}

auto aggregate(const TableSet& tables, const std::vector<ir::AggSpec>& specs,
               std::optional<Duration> every) -> Expected<TableSet> {
    if (every.has_value() && every->nanos <= 0) {
        return execution_error("window duration must be positive");
    }
    TableSet out;
    out.reserve(tables.size());
    for (const auto& t : tables) {
        auto reduced = aggregate_table(t, specs, every);
        if (!reduced.has_value()) {
            return std::unexpected(std::move(reduced.error()));
        }
        out.push_back(std::move(*reduced));
    }
    return out;
}

}  // namespace parity::ops
