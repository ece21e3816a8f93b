#include <parity/ir/builder.hpp>
#include <parity/ir/program.hpp>

#include <fmt/core.h>

namespace parity::ir {

namespace {

auto op_text(CompareOp op) -> std::string_view {
    switch (op) {
        case CompareOp::Eq:
            return "==";
        case CompareOp::Ne:
            return "!=";
        case CompareOp::Lt:
            return "<";
        case CompareOp::Le:
            return "<=";
        case CompareOp::Gt:
            return ">";
        case CompareOp::Ge:
            return ">=";
    }
    return "?";
}

auto join(const std::vector<std::string>& names) -> std::string {
    std::string out;
    for (const auto& name : names) {
        if (!out.empty()) {
            out.push_back(',');
        }
        out.append(name);
    }
    return out;
}

auto describe_filter(const FilterExpr& expr) -> std::string {
    return std::visit(
        [](const auto& node) -> std::string {
            using T = std::decay_t<decltype(node)>;
            if constexpr (std::is_same_v<T, FilterColumn>) {
                return node.name;
            } else if constexpr (std::is_same_v<T, FilterLiteral>) {
                if (const auto* text = std::get_if<std::string>(&node.value)) {
                    return fmt::format("\"{}\"", *text);
                }
                return format_value(node.value);
            } else if constexpr (std::is_same_v<T, FilterCmp>) {
                return fmt::format("{} {} {}", describe_filter(*node.left), op_text(node.op),
                                   describe_filter(*node.right));
            } else if constexpr (std::is_same_v<T, FilterAnd>) {
                return fmt::format("({} and {})", describe_filter(*node.left),
                                   describe_filter(*node.right));
            } else if constexpr (std::is_same_v<T, FilterOr>) {
                return fmt::format("({} or {})", describe_filter(*node.left),
                                   describe_filter(*node.right));
            } else {
                return fmt::format("not ({})", describe_filter(*node.operand));
            }
        },
        expr.node);
}

auto describe_node(const Node& node) -> std::string {
    switch (node.kind()) {
        case NodeKind::Scan: {
            const auto& source = static_cast<const ScanNode&>(node).source();
            return fmt::format("scan {} {}",
                               source.kind == Source::Kind::BucketId ? "bucketID" : "bucket",
                               source.value);
        }
        case NodeKind::Filter:
            return fmt::format("filter {}",
                               describe_filter(static_cast<const FilterNode&>(node).predicate()));
        case NodeKind::Group:
            return fmt::format("group {}", join(static_cast<const GroupNode&>(node).columns()));
        case NodeKind::Keep:
            return fmt::format("keep {}", join(static_cast<const ProjectNode&>(node).columns()));
        case NodeKind::Drop:
            return fmt::format("drop {}", join(static_cast<const ProjectNode&>(node).columns()));
        case NodeKind::Sort: {
            const auto& sort = static_cast<const SortNode&>(node);
            return fmt::format("sort {}{}", join(sort.columns()), sort.descending() ? " desc" : "");
        }
        case NodeKind::Limit: {
            const auto& limit = static_cast<const LimitNode&>(node);
            return fmt::format("limit {} offset {}", limit.count(), limit.offset());
        }
        case NodeKind::Aggregate: {
            const auto& agg = static_cast<const AggregateNode&>(node);
            std::string out = "aggregate";
            for (const auto& spec : agg.aggregations()) {
                out.append(fmt::format(" {}({}) as {}", agg_func_name(spec.func), spec.column,
                                       spec.alias));
            }
            if (agg.every().has_value()) {
                out.append(fmt::format(" every {}", format_duration(*agg.every())));
            }
            return out;
        }
    }
    return "?";
}

void describe_tree(const Node& node, std::size_t depth, std::string& out) {
    out.append(depth * 2, ' ');
    out.append(describe_node(node));
    out.push_back('\n');
    for (const auto& child : node.children()) {
        describe_tree(*child, depth + 1, out);
    }
}

auto make_filter(auto node) -> FilterExprPtr {
    auto expr = std::make_unique<FilterExpr>();
    expr->node = std::move(node);
    return expr;
}

}  // namespace

auto agg_func_name(AggFunc func) -> std::string_view {
    switch (func) {
        case AggFunc::Count:
            return "count";
        case AggFunc::Sum:
            return "sum";
        case AggFunc::Mean:
            return "mean";
        case AggFunc::Min:
            return "min";
        case AggFunc::Max:
            return "max";
        case AggFunc::First:
            return "first";
        case AggFunc::Last:
            return "last";
    }
    return "count";
}

auto parse_agg_func(std::string_view name) -> std::optional<AggFunc> {
    for (auto func : {AggFunc::Count, AggFunc::Sum, AggFunc::Mean, AggFunc::Min, AggFunc::Max,
                      AggFunc::First, AggFunc::Last}) {
        if (agg_func_name(func) == name) {
            return func;
        }
    }
    return std::nullopt;
}

auto filter_col(std::string name) -> FilterExprPtr {
    return make_filter(FilterColumn{.name = std::move(name)});
}

auto filter_lit(Value value) -> FilterExprPtr {
    return make_filter(FilterLiteral{.value = std::move(value)});
}

auto filter_cmp(CompareOp op, FilterExprPtr l, FilterExprPtr r) -> FilterExprPtr {
    return make_filter(FilterCmp{.op = op, .left = std::move(l), .right = std::move(r)});
}

auto filter_and(FilterExprPtr l, FilterExprPtr r) -> FilterExprPtr {
    return make_filter(FilterAnd{.left = std::move(l), .right = std::move(r)});
}

auto filter_or(FilterExprPtr l, FilterExprPtr r) -> FilterExprPtr {
    return make_filter(FilterOr{.left = std::move(l), .right = std::move(r)});
}

auto filter_not(FilterExprPtr operand) -> FilterExprPtr {
    return make_filter(FilterNot{.operand = std::move(operand)});
}

auto describe(const Program& program) -> std::string {
    std::string out;
    for (const auto& pipeline : program.pipelines) {
        out.append(fmt::format("pipeline {}\n", pipeline.result_name));
        if (pipeline.root) {
            describe_tree(*pipeline.root, 1, out);
        }
    }
    return out;
}

}  // namespace parity::ir
