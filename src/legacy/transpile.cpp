#include <parity/ir/builder.hpp>
#include <parity/legacy/parser.hpp>
#include <parity/legacy/transpile.hpp>

#include <fmt/core.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <limits>

namespace parity::legacy {

namespace {

constexpr std::string_view kDefaultResult = "_result";
constexpr std::string_view kTimeColumn = "_time";
constexpr std::string_view kMeasurementColumn = "_measurement";

auto error_at(const SelectStatement& stmt, std::string message) -> std::unexpected<Error> {
    return std::unexpected(make_error(ErrorKind::Compile, std::move(message), stmt.line,
                                      stmt.column));
}

auto column_name(const FieldRef& field) -> std::string {
    return field.name == "time" ? std::string(kTimeColumn) : field.name;
}

auto is_time(const Operand& operand) -> bool {
    const auto* field = std::get_if<FieldRef>(&operand);
    return field != nullptr && field->name == "time";
}

/// Literals compared with `time` are timestamps: RFC3339 text or integer nanoseconds.
auto time_literal(const SelectStatement& stmt, const Value& value) -> Expected<Value> {
    if (const auto* text = std::get_if<std::string>(&value)) {
        auto ts = parse_rfc3339(*text);
        if (!ts.has_value()) {
            return error_at(stmt, fmt::format("invalid time literal '{}'", *text));
        }
        return Value{*ts};
    }
    if (const auto* nanos = std::get_if<std::int64_t>(&value)) {
        return Value{Timestamp{.nanos = *nanos}};
    }
    return error_at(stmt, fmt::format("cannot compare time with {}", format_value(value)));
}

auto translate_operand(const SelectStatement& stmt, const Operand& operand, bool against_time)
    -> Expected<ir::FilterExprPtr> {
    if (const auto* field = std::get_if<FieldRef>(&operand)) {
        return ir::filter_col(column_name(*field));
    }
    const auto& value = std::get<Value>(operand);
    if (against_time) {
        auto ts = time_literal(stmt, value);
        if (!ts.has_value()) {
            return std::unexpected(std::move(ts.error()));
        }
        return ir::filter_lit(std::move(*ts));
    }
    return ir::filter_lit(value);
}

auto translate_condition(const SelectStatement& stmt, const Condition& cond)
    -> Expected<ir::FilterExprPtr> {
    if (const auto* cmp = std::get_if<Comparison>(&cond.node)) {
        auto left = translate_operand(stmt, cmp->left, is_time(cmp->right));
        if (!left.has_value()) {
            return left;
        }
        auto right = translate_operand(stmt, cmp->right, is_time(cmp->left));
        if (!right.has_value()) {
            return right;
        }
        return ir::filter_cmp(cmp->op, std::move(*left), std::move(*right));
    }
    const auto& logical = std::get<Logical>(cond.node);
    auto left = translate_condition(stmt, *logical.left);
    if (!left.has_value()) {
        return left;
    }
    auto right = translate_condition(stmt, *logical.right);
    if (!right.has_value()) {
        return right;
    }
    return logical.conjunction ? ir::filter_and(std::move(*left), std::move(*right))
                               : ir::filter_or(std::move(*left), std::move(*right));
}

auto resolve_bucket(const SelectStatement& stmt, const TranspileConfig& config)
    -> Expected<ir::Source> {
    std::string database = stmt.from.database.empty() ? config.default_database
                                                      : stmt.from.database;
    if (database.empty()) {
        return error_at(stmt, "database name required");
    }
    std::string retention_policy = stmt.from.retention_policy.empty()
                                       ? config.default_retention_policy
                                       : stmt.from.retention_policy;
    if (config.mappings == nullptr) {
        return error_at(stmt, "no mapping service configured");
    }
    auto mapping = config.mappings->find_default_mapping(config.cluster, database,
                                                         retention_policy);
    if (!mapping.has_value()) {
        return error_at(stmt, mapping.error().message);
    }
    spdlog::debug("legacy: {}.{} resolved to bucket {}", database,
                  retention_policy.empty() ? "<default>" : retention_policy,
                  mapping->bucket_id.format());
    return ir::Source{.kind = ir::Source::Kind::BucketId, .value = mapping->bucket_id.format()};
}

auto translate_statement(ir::Builder& builder, const SelectStatement& stmt,
                         const TranspileConfig& config) -> Expected<ir::NodePtr> {
    auto source = resolve_bucket(stmt, config);
    if (!source.has_value()) {
        return std::unexpected(std::move(source.error()));
    }

    const bool any_aggregate = std::ranges::any_of(
        stmt.fields, [](const SelectField& field) { return field.func.has_value(); });
    const bool all_aggregate = std::ranges::all_of(
        stmt.fields, [](const SelectField& field) { return field.func.has_value(); });
    if (any_aggregate && !all_aggregate) {
        return error_at(stmt, "mixing aggregate and non-aggregate fields is not supported");
    }
    if (stmt.group_time.has_value() && !any_aggregate) {
        return error_at(stmt, "GROUP BY time() requires an aggregate function");
    }

    auto predicate =
        ir::filter_cmp(ir::CompareOp::Eq, ir::filter_col(std::string(kMeasurementColumn)),
                       ir::filter_lit(Value{stmt.from.name}));
    if (stmt.where) {
        auto where = translate_condition(stmt, *stmt.where);
        if (!where.has_value()) {
            return std::unexpected(std::move(where.error()));
        }
        predicate = ir::filter_and(std::move(predicate), std::move(*where));
    }

    auto node = builder.scan(std::move(*source));
    node = ir::Builder::chain(std::move(node), builder.filter(std::move(predicate)));

    std::vector<std::string> group_columns{std::string(kMeasurementColumn)};
    for (const auto& tag : stmt.group_tags) {
        if (std::ranges::find(group_columns, tag) == group_columns.end()) {
            group_columns.push_back(tag);
        }
    }
    node = ir::Builder::chain(std::move(node), builder.group(group_columns));

    if (any_aggregate) {
        std::vector<ir::AggSpec> specs;
        for (const auto& field : stmt.fields) {
            if (field.column == "*") {
                return error_at(stmt, fmt::format("{}(*) is not supported",
                                                  ir::agg_func_name(*field.func)));
            }
            if (std::ranges::any_of(specs, [&](const ir::AggSpec& spec) {
                    return spec.alias == field.alias;
                })) {
                return error_at(stmt, fmt::format("duplicate output column '{}'", field.alias));
            }
            specs.push_back(
                ir::AggSpec{.func = *field.func, .column = field.column, .alias = field.alias});
        }
        node = ir::Builder::chain(std::move(node),
                                  builder.aggregate(std::move(specs), stmt.group_time));
    } else {
        const bool star = std::ranges::any_of(
            stmt.fields, [](const SelectField& field) { return field.column == "*"; });
        if (!star) {
            std::vector<std::string> columns = group_columns;
            columns.insert(columns.begin(), std::string(kTimeColumn));
            for (const auto& field : stmt.fields) {
                std::string name = field.column == "time" ? std::string(kTimeColumn) : field.column;
                if (std::ranges::find(columns, name) == columns.end()) {
                    columns.push_back(std::move(name));
                }
            }
            node = ir::Builder::chain(std::move(node), builder.keep(std::move(columns)));
        }
    }

    if (stmt.descending) {
        node = ir::Builder::chain(std::move(node),
                                  builder.sort({std::string(kTimeColumn)}, true));
    }
    if (stmt.limit.has_value() || stmt.offset > 0) {
        if (stmt.limit.has_value() && *stmt.limit < 0) {
            return error_at(stmt, "LIMIT must not be negative");
        }
        node = ir::Builder::chain(
            std::move(node),
            builder.limit(stmt.limit.value_or(std::numeric_limits<std::int64_t>::max()),
                          stmt.offset));
    }
    return node;
}

}  // namespace

auto transpile(const Query& query, const TranspileConfig& config) -> Expected<ir::Program> {
    ir::Builder builder;
    ir::Program program;
    for (std::size_t i = 0; i < query.statements.size(); ++i) {
        auto root = translate_statement(builder, query.statements[i], config);
        if (!root.has_value()) {
            return std::unexpected(std::move(root.error()));
        }
        program.pipelines.push_back(ir::Pipeline{
            .result_name = query.statements.size() == 1 ? std::string(kDefaultResult)
                                                        : std::to_string(i),
            .root = std::move(*root),
        });
    }
    return program;
}

auto transpile(std::string_view text, const TranspileConfig& config) -> Expected<ir::Program> {
    auto query = parse(text);
    if (!query.has_value()) {
        return std::unexpected(make_error(ErrorKind::Compile, query.error().message,
                                          query.error().line, query.error().column));
    }
    return transpile(*query, config);
}

}  // namespace parity::legacy
