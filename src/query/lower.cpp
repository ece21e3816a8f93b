#include <parity/ir/builder.hpp>
#include <parity/query/lower.hpp>

#include <fmt/core.h>

#include <algorithm>
#include <unordered_set>

namespace parity::query {

namespace {

constexpr std::string_view kDefaultResult = "_result";
constexpr std::string_view kValueColumn = "_value";
constexpr std::string_view kTimeColumn = "_time";

using Lowered = std::expected<ir::NodePtr, LowerError>;

auto error_at(const Call& call, std::string message) -> std::unexpected<LowerError> {
    return std::unexpected(
        LowerError{.message = std::move(message), .line = call.line, .column = call.column});
}

auto error_at(const Expr& expr, std::string message) -> std::unexpected<LowerError> {
    return std::unexpected(
        LowerError{.message = std::move(message), .line = expr.line, .column = expr.column});
}

/// Named-argument view of a call, checked against the parameters a function accepts.
class Args {
   public:
    static auto bind(const Call& call, std::initializer_list<std::string_view> allowed,
                     std::string_view positional = {}) -> std::expected<Args, LowerError> {
        Args args(call);
        for (const auto& arg : call.args) {
            std::string_view name = arg.name;
            if (name.empty()) {
                if (positional.empty()) {
                    return error_at(*arg.value,
                                    fmt::format("{}() takes named arguments only", call.name));
                }
                name = positional;
            }
            if (std::find(allowed.begin(), allowed.end(), name) == allowed.end()) {
                return error_at(*arg.value,
                                fmt::format("unknown argument '{}' for {}()", name, call.name));
            }
            if (args.find(name) != nullptr) {
                return error_at(*arg.value,
                                fmt::format("duplicate argument '{}' for {}()", name, call.name));
            }
            args.bound_.emplace_back(std::string(name), arg.value.get());
        }
        return args;
    }

    [[nodiscard]] auto find(std::string_view name) const -> const Expr* {
        for (const auto& [key, expr] : bound_) {
            if (key == name) {
                return expr;
            }
        }
        return nullptr;
    }

    [[nodiscard]] auto string(std::string_view name) const
        -> std::expected<std::optional<std::string>, LowerError> {
        const Expr* expr = find(name);
        if (expr == nullptr) {
            return std::optional<std::string>{};
        }
        if (const auto* lit = std::get_if<LiteralExpr>(&expr->node)) {
            if (const auto* text = std::get_if<std::string>(&lit->value)) {
                return std::optional<std::string>{*text};
            }
        }
        return error_at(*expr, fmt::format("{}() argument '{}' must be a string", call_.name, name));
    }

    [[nodiscard]] auto literal(std::string_view name) const
        -> std::expected<std::optional<Value>, LowerError> {
        const Expr* expr = find(name);
        if (expr == nullptr) {
            return std::optional<Value>{};
        }
        if (const auto* lit = std::get_if<LiteralExpr>(&expr->node)) {
            return std::optional<Value>{lit->value};
        }
        return error_at(*expr, fmt::format("{}() argument '{}' must be a literal", call_.name, name));
    }

    [[nodiscard]] auto strings(std::string_view name) const
        -> std::expected<std::optional<std::vector<std::string>>, LowerError> {
        const Expr* expr = find(name);
        if (expr == nullptr) {
            return std::optional<std::vector<std::string>>{};
        }
        const auto* array = std::get_if<ArrayExpr>(&expr->node);
        if (array == nullptr) {
            return error_at(*expr, fmt::format("{}() argument '{}' must be an array of strings",
                                               call_.name, name));
        }
        std::vector<std::string> out;
        for (const auto& element : array->elements) {
            const auto* lit = std::get_if<LiteralExpr>(&element->node);
            const auto* text = lit != nullptr ? std::get_if<std::string>(&lit->value) : nullptr;
            if (text == nullptr) {
                return error_at(*element,
                                fmt::format("{}() argument '{}' must be an array of strings",
                                            call_.name, name));
            }
            out.push_back(*text);
        }
        return std::optional<std::vector<std::string>>{std::move(out)};
    }

    /// Bare identifier argument, such as `fn: mean`. Strings are accepted too.
    [[nodiscard]] auto word(std::string_view name) const
        -> std::expected<std::optional<std::string>, LowerError> {
        const Expr* expr = find(name);
        if (expr != nullptr) {
            if (const auto* ident = std::get_if<IdentifierExpr>(&expr->node)) {
                return std::optional<std::string>{ident->name};
            }
        }
        return string(name);
    }

   private:
    explicit Args(const Call& call) : call_(call) {}

    const Call& call_;
    std::vector<std::pair<std::string, const Expr*>> bound_;
};

auto lower_operand(const Expr& expr) -> std::expected<ir::FilterExprPtr, LowerError> {
    if (const auto* ident = std::get_if<IdentifierExpr>(&expr.node)) {
        return ir::filter_col(ident->name);
    }
    if (const auto* lit = std::get_if<LiteralExpr>(&expr.node)) {
        return ir::filter_lit(lit->value);
    }
    return error_at(expr, "comparison operands must be columns or literals");
}

auto compare_op(BinaryOp op) -> std::optional<ir::CompareOp> {
    switch (op) {
        case BinaryOp::Eq:
            return ir::CompareOp::Eq;
        case BinaryOp::Ne:
            return ir::CompareOp::Ne;
        case BinaryOp::Lt:
            return ir::CompareOp::Lt;
        case BinaryOp::Le:
            return ir::CompareOp::Le;
        case BinaryOp::Gt:
            return ir::CompareOp::Gt;
        case BinaryOp::Ge:
            return ir::CompareOp::Ge;
        case BinaryOp::And:
        case BinaryOp::Or:
            break;
    }
    return std::nullopt;
}

auto lower_predicate(const Expr& expr) -> std::expected<ir::FilterExprPtr, LowerError> {
    if (const auto* neg = std::get_if<NotExpr>(&expr.node)) {
        auto operand = lower_predicate(*neg->operand);
        if (!operand.has_value()) {
            return operand;
        }
        return ir::filter_not(std::move(*operand));
    }
    const auto* binary = std::get_if<BinaryExpr>(&expr.node);
    if (binary == nullptr) {
        return error_at(expr, "filter expression must be a comparison");
    }
    if (binary->op == BinaryOp::And || binary->op == BinaryOp::Or) {
        auto left = lower_predicate(*binary->left);
        if (!left.has_value()) {
            return left;
        }
        auto right = lower_predicate(*binary->right);
        if (!right.has_value()) {
            return right;
        }
        if (binary->op == BinaryOp::And) {
            return ir::filter_and(std::move(*left), std::move(*right));
        }
        return ir::filter_or(std::move(*left), std::move(*right));
    }
    auto left = lower_operand(*binary->left);
    if (!left.has_value()) {
        return left;
    }
    auto right = lower_operand(*binary->right);
    if (!right.has_value()) {
        return right;
    }
    return ir::filter_cmp(*compare_op(binary->op), std::move(*left), std::move(*right));
}

class PipelineLowerer {
   public:
    explicit PipelineLowerer(ir::Builder& builder) : builder_(builder) {}

    auto lower(const PipelineStmt& stmt) -> std::expected<ir::Pipeline, LowerError> {
        ir::Pipeline pipeline{.result_name = std::string(kDefaultResult), .root = nullptr};
        const Call& head = stmt.calls.front();
        if (head.name != "from") {
            return error_at(head, fmt::format("pipeline must start with from(), found {}()",
                                              head.name));
        }
        auto scan = lower_from(head);
        if (!scan.has_value()) {
            return std::unexpected(std::move(scan.error()));
        }
        ir::NodePtr current = std::move(*scan);

        for (std::size_t i = 1; i < stmt.calls.size(); ++i) {
            const Call& call = stmt.calls[i];
            if (call.name == "yield") {
                if (i + 1 != stmt.calls.size()) {
                    return error_at(call, "yield() must be the last call of a pipeline");
                }
                auto args = Args::bind(call, {"name"});
                if (!args.has_value()) {
                    return std::unexpected(std::move(args.error()));
                }
                auto name = args->string("name");
                if (!name.has_value()) {
                    return std::unexpected(std::move(name.error()));
                }
                if (name->has_value()) {
                    pipeline.result_name = **name;
                }
                continue;
            }
            auto node = lower_call(call);
            if (!node.has_value()) {
                return std::unexpected(std::move(node.error()));
            }
            current = ir::Builder::chain(std::move(current), std::move(*node));
        }
        pipeline.root = std::move(current);
        return pipeline;
    }

   private:
    auto lower_from(const Call& call) -> Lowered {
        auto args = Args::bind(call, {"bucket", "bucketID"});
        if (!args.has_value()) {
            return std::unexpected(std::move(args.error()));
        }
        auto bucket = args->string("bucket");
        if (!bucket.has_value()) {
            return std::unexpected(std::move(bucket.error()));
        }
        auto bucket_id = args->string("bucketID");
        if (!bucket_id.has_value()) {
            return std::unexpected(std::move(bucket_id.error()));
        }
        if (bucket->has_value() == bucket_id->has_value()) {
            return error_at(call, "from() requires exactly one of 'bucket' or 'bucketID'");
        }
        if (bucket->has_value()) {
            return builder_.scan(
                ir::Source{.kind = ir::Source::Kind::BucketName, .value = **bucket});
        }
        return builder_.scan(ir::Source{.kind = ir::Source::Kind::BucketId, .value = **bucket_id});
    }

    auto lower_call(const Call& call) -> Lowered {
        if (call.name == "range") {
            return lower_range(call);
        }
        if (call.name == "filter") {
            auto args = Args::bind(call, {"fn"}, "fn");
            if (!args.has_value()) {
                return std::unexpected(std::move(args.error()));
            }
            const Expr* expr = args->find("fn");
            if (expr == nullptr) {
                return error_at(call, "filter() requires a predicate");
            }
            auto predicate = lower_predicate(*expr);
            if (!predicate.has_value()) {
                return std::unexpected(std::move(predicate.error()));
            }
            return builder_.filter(std::move(*predicate));
        }
        if (call.name == "group") {
            auto args = Args::bind(call, {"columns"});
            if (!args.has_value()) {
                return std::unexpected(std::move(args.error()));
            }
            auto columns = args->strings("columns");
            if (!columns.has_value()) {
                return std::unexpected(std::move(columns.error()));
            }
            return builder_.group(columns->value_or(std::vector<std::string>{}));
        }
        if (call.name == "keep" || call.name == "drop") {
            auto args = Args::bind(call, {"columns"});
            if (!args.has_value()) {
                return std::unexpected(std::move(args.error()));
            }
            auto columns = args->strings("columns");
            if (!columns.has_value()) {
                return std::unexpected(std::move(columns.error()));
            }
            if (!columns->has_value()) {
                return error_at(call, fmt::format("{}() requires 'columns'", call.name));
            }
            if (call.name == "keep") {
                return builder_.keep(std::move(**columns));
            }
            return builder_.drop(std::move(**columns));
        }
        if (call.name == "sort") {
            return lower_sort(call);
        }
        if (call.name == "limit") {
            return lower_limit(call);
        }
        if (call.name == "aggregateWindow") {
            return lower_window(call);
        }
        if (auto func = ir::parse_agg_func(call.name)) {
            auto args = Args::bind(call, {"column", "as"});
            if (!args.has_value()) {
                return std::unexpected(std::move(args.error()));
            }
            auto spec = agg_spec(*func, *args);
            if (!spec.has_value()) {
                return std::unexpected(std::move(spec.error()));
            }
            return builder_.aggregate({std::move(*spec)});
        }
        return error_at(call, fmt::format("unknown function '{}'", call.name));
    }

    auto lower_range(const Call& call) -> Lowered {
        auto args = Args::bind(call, {"start", "stop"});
        if (!args.has_value()) {
            return std::unexpected(std::move(args.error()));
        }
        ir::FilterExprPtr predicate;
        for (auto [name, op] : {std::pair{"start", ir::CompareOp::Ge},
                                std::pair{"stop", ir::CompareOp::Lt}}) {
            auto bound = args->literal(name);
            if (!bound.has_value()) {
                return std::unexpected(std::move(bound.error()));
            }
            if (!bound->has_value()) {
                if (std::string_view(name) == "start") {
                    return error_at(call, "range() requires 'start'");
                }
                continue;
            }
            if (!std::holds_alternative<Timestamp>(**bound)) {
                return error_at(*args->find(name),
                                fmt::format("range() '{}' must be a time literal", name));
            }
            auto cmp = ir::filter_cmp(op, ir::filter_col(std::string(kTimeColumn)),
                                      ir::filter_lit(**bound));
            predicate = predicate ? ir::filter_and(std::move(predicate), std::move(cmp))
                                  : std::move(cmp);
        }
        return builder_.filter(std::move(predicate));
    }

    auto lower_sort(const Call& call) -> Lowered {
        auto args = Args::bind(call, {"columns", "desc"});
        if (!args.has_value()) {
            return std::unexpected(std::move(args.error()));
        }
        auto columns = args->strings("columns");
        if (!columns.has_value()) {
            return std::unexpected(std::move(columns.error()));
        }
        auto desc = args->literal("desc");
        if (!desc.has_value()) {
            return std::unexpected(std::move(desc.error()));
        }
        bool descending = false;
        if (desc->has_value()) {
            const auto* flag = std::get_if<bool>(&**desc);
            if (flag == nullptr) {
                return error_at(*args->find("desc"), "sort() 'desc' must be a boolean");
            }
            descending = *flag;
        }
        return builder_.sort(
            columns->value_or(std::vector<std::string>{std::string(kValueColumn)}), descending);
    }

    auto lower_limit(const Call& call) -> Lowered {
        auto args = Args::bind(call, {"n", "offset"});
        if (!args.has_value()) {
            return std::unexpected(std::move(args.error()));
        }
        std::int64_t bounds[2] = {-1, 0};
        int slot = 0;
        for (const char* name : {"n", "offset"}) {
            auto value = args->literal(name);
            if (!value.has_value()) {
                return std::unexpected(std::move(value.error()));
            }
            if (value->has_value()) {
                const auto* number = std::get_if<std::int64_t>(&**value);
                if (number == nullptr || *number < 0) {
                    return error_at(*args->find(name),
                                    fmt::format("limit() '{}' must be a non-negative integer",
                                                name));
                }
                bounds[slot] = *number;
            }
            ++slot;
        }
        if (bounds[0] < 0) {
            return error_at(call, "limit() requires 'n'");
        }
        return builder_.limit(bounds[0], bounds[1]);
    }

    auto lower_window(const Call& call) -> Lowered {
        auto args = Args::bind(call, {"every", "fn", "column", "as"});
        if (!args.has_value()) {
            return std::unexpected(std::move(args.error()));
        }
        auto every = args->literal("every");
        if (!every.has_value()) {
            return std::unexpected(std::move(every.error()));
        }
        const Duration* period = every->has_value() ? std::get_if<Duration>(&**every) : nullptr;
        if (period == nullptr || period->nanos <= 0) {
            return error_at(call, "aggregateWindow() requires a positive 'every' duration");
        }
        auto fn = args->word("fn");
        if (!fn.has_value()) {
            return std::unexpected(std::move(fn.error()));
        }
        if (!fn->has_value()) {
            return error_at(call, "aggregateWindow() requires 'fn'");
        }
        auto func = ir::parse_agg_func(**fn);
        if (!func.has_value()) {
            return error_at(*args->find("fn"),
                            fmt::format("unknown aggregate function '{}'", **fn));
        }
        auto spec = agg_spec(*func, *args);
        if (!spec.has_value()) {
            return std::unexpected(std::move(spec.error()));
        }
        return builder_.aggregate({std::move(*spec)}, *period);
    }

    static auto agg_spec(ir::AggFunc func, const Args& args)
        -> std::expected<ir::AggSpec, LowerError> {
        auto column = args.string("column");
        if (!column.has_value()) {
            return std::unexpected(std::move(column.error()));
        }
        auto alias = args.string("as");
        if (!alias.has_value()) {
            return std::unexpected(std::move(alias.error()));
        }
        return ir::AggSpec{
            .func = func,
            .column = column->value_or(std::string(kValueColumn)),
            .alias = alias->value_or(std::string(ir::agg_func_name(func))),
        };
    }

    ir::Builder& builder_;
};

}  // namespace

auto LowerError::format() const -> std::string {
    if (line == 0) {
        return message;
    }
    return fmt::format("{}:{}: {}", line, column, message);
}

auto lower(const Program& program) -> LowerResult {
    ir::Builder builder;
    PipelineLowerer lowerer(builder);
    ir::Program out;
    std::unordered_set<std::string> names;
    for (const auto& stmt : program.pipelines) {
        auto pipeline = lowerer.lower(stmt);
        if (!pipeline.has_value()) {
            return std::unexpected(std::move(pipeline.error()));
        }
        if (!names.insert(pipeline->result_name).second) {
            const Call& last = stmt.calls.back();
            return std::unexpected(LowerError{
                .message = fmt::format("duplicate result name '{}'", pipeline->result_name),
                .line = last.line,
                .column = last.column,
            });
        }
        out.pipelines.push_back(std::move(*pipeline));
    }
    return out;
}

}  // namespace parity::query
