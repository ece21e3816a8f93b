#include <parity/codec/annotated_csv.hpp>
#include <parity/compare/comparator.hpp>

#include <fmt/core.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <map>
#include <sstream>

namespace parity::compare {

namespace {

constexpr std::size_t kMaxProblems = 10;

struct SeriesKey {
    std::vector<table::KeyEntry> key;
    std::vector<table::ColumnMeta> columns;
};

auto meta_order(const table::ColumnMeta& lhs, const table::ColumnMeta& rhs) -> std::weak_ordering {
    if (auto cmp = lhs.name <=> rhs.name; cmp != 0) {
        return cmp;
    }
    return lhs.type <=> rhs.type;
}

struct SeriesKeyLess {
    auto operator()(const SeriesKey& lhs, const SeriesKey& rhs) const -> bool {
        auto cmp = std::lexicographical_compare_three_way(
            lhs.key.begin(), lhs.key.end(), rhs.key.begin(), rhs.key.end(),
            [](const table::KeyEntry& a, const table::KeyEntry& b) -> std::weak_ordering {
                if (auto c = meta_order(a.meta, b.meta); c != 0) {
                    return c;
                }
                return value_order(a.value, b.value);
            });
        if (cmp != 0) {
            return cmp < 0;
        }
        return std::lexicographical_compare_three_way(lhs.columns.begin(), lhs.columns.end(),
                                                      rhs.columns.begin(), rhs.columns.end(),
                                                      meta_order) < 0;
    }
};

using SeriesMap = std::map<SeriesKey, table::Table, SeriesKeyLess>;

struct ReleaseBoth {
    table::ResultStream& lhs;
    table::ResultStream& rhs;
    ~ReleaseBoth() {
        lhs.release();
        rhs.release();
    }
};

void fold_table(SeriesMap& series, const table::Table& input) {
    SeriesKey key{.key = input.key.sorted(), .columns = input.schema()};
    std::ranges::sort(key.columns, [](const auto& a, const auto& b) { return a.name < b.name; });

    std::vector<std::size_t> order;
    order.reserve(key.columns.size());
    for (const auto& meta : key.columns) {
        order.push_back(input.index.at(meta.name));
    }

    auto [it, inserted] = series.try_emplace(key);
    table::Table& target = it->second;
    if (inserted) {
        target.key = input.key;
        for (const auto& meta : key.columns) {
            target.add_column(meta);
        }
    }
    std::vector<Value> row(order.size());
    for (std::size_t r = 0; r < input.rows(); ++r) {
        for (std::size_t c = 0; c < order.size(); ++c) {
            row[c] = input.value_at(order[c], r);
        }
        // Same typed column set, so the row always fits.
        static_cast<void>(target.append_row(row));
    }
}

auto fold(table::ResultStream& stream) -> Expected<SeriesMap> {
    SeriesMap series;
    while (true) {
        auto result = stream.next();
        if (!result.has_value()) {
            return std::unexpected(std::move(result.error()));
        }
        if (!result->has_value()) {
            break;
        }
        while (true) {
            auto next = (*result)->next();
            if (!next.has_value()) {
                return std::unexpected(std::move(next.error()));
            }
            if (!next->has_value()) {
                break;
            }
            fold_table(series, **next);
        }
    }
    stream.release();
    return series;
}

auto describe(const SeriesKey& key) -> std::string {
    std::string columns;
    for (const auto& meta : key.columns) {
        if (!columns.empty()) {
            columns.push_back(',');
        }
        columns.append(fmt::format("{}:{}", meta.name, type_name(meta.type)));
    }
    return fmt::format("{{{}}} [{}]", table::GroupKey(key.key).format(), columns);
}

auto describe(const Value& value) -> std::string {
    if (is_null(value)) {
        return "null";
    }
    if (const auto* text = std::get_if<std::string>(&value)) {
        return fmt::format("\"{}\"", *text);
    }
    return fmt::format("{} ({})", format_value(value), type_name(*type_of(value)));
}

auto first_difference(const table::Table& want, const table::Table& got)
    -> std::optional<std::string> {
    if (want.rows() != got.rows()) {
        return fmt::format("want {} rows, got {}", want.rows(), got.rows());
    }
    for (std::size_t r = 0; r < want.rows(); ++r) {
        for (std::size_t c = 0; c < want.columns.size(); ++c) {
            Value lhs = want.value_at(c, r);
            Value rhs = got.value_at(c, r);
            if (!values_equal(lhs, rhs)) {
                return fmt::format("row {} column '{}': want {}, got {}", r,
                                   want.columns[c].meta.name, describe(lhs), describe(rhs));
            }
        }
    }
    return std::nullopt;
}

auto render_series(const SeriesMap& series) -> Expected<std::string> {
    std::vector<table::NamedTable> tables;
    tables.reserve(series.size());
    for (const auto& [key, rows] : series) {
        tables.push_back(table::NamedTable{.result = "_result", .table = rows});
    }
    auto stream = table::ResultStream::from_tables(std::move(tables));
    std::ostringstream out;
    if (auto status = codec::AnnotatedCsvEncoder().encode(stream, out); !status.has_value()) {
        return std::unexpected(std::move(status.error()));
    }
    return out.str();
}

}  // namespace

auto compare(table::ResultStream& want, table::ResultStream& got) -> Expected<Verdict> {
    ReleaseBoth guard{.lhs = want, .rhs = got};

    auto want_series = fold(want);
    if (!want_series.has_value()) {
        return std::unexpected(std::move(want_series.error()));
    }
    auto got_series = fold(got);
    if (!got_series.has_value()) {
        return std::unexpected(std::move(got_series.error()));
    }

    std::vector<std::string> problems;
    SeriesKeyLess less;
    auto lhs = want_series->begin();
    auto rhs = got_series->begin();
    while (lhs != want_series->end() || rhs != got_series->end()) {
        if (rhs == got_series->end() || (lhs != want_series->end() && less(lhs->first, rhs->first))) {
            problems.push_back(fmt::format("missing series {}", describe(lhs->first)));
            ++lhs;
        } else if (lhs == want_series->end() || less(rhs->first, lhs->first)) {
            problems.push_back(fmt::format("unexpected series {}", describe(rhs->first)));
            ++rhs;
        } else {
            if (auto diff = first_difference(lhs->second, rhs->second)) {
                problems.push_back(fmt::format("series {}: {}", describe(lhs->first), *diff));
            }
            ++lhs;
            ++rhs;
        }
    }

    if (problems.empty()) {
        spdlog::debug("compare: {} series equal", want_series->size());
        return Verdict::equal();
    }

    std::string description;
    for (std::size_t i = 0; i < problems.size() && i < kMaxProblems; ++i) {
        description.append(problems[i]);
        description.push_back('\n');
    }
    if (problems.size() > kMaxProblems) {
        description.append(fmt::format("... and {} more\n", problems.size() - kMaxProblems));
    }
    auto want_text = render_series(*want_series);
    if (!want_text.has_value()) {
        return std::unexpected(std::move(want_text.error()));
    }
    auto got_text = render_series(*got_series);
    if (!got_text.has_value()) {
        return std::unexpected(std::move(got_text.error()));
    }
    description.append(line_diff(*want_text, *got_text));
    return Verdict::unequal(std::move(description));
}

auto render(table::ResultStream& stream) -> Expected<std::string> {
    auto series = fold(stream);
    stream.release();
    if (!series.has_value()) {
        return std::unexpected(std::move(series.error()));
    }
    return render_series(*series);
}

}  // namespace parity::compare
