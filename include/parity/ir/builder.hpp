#pragma once

#include <parity/ir/node.hpp>

#include <atomic>

namespace parity::ir {

/// Factory for constructing IR nodes with unique IDs.
///
/// Thread-safe ID generation via atomic counter.
class Builder {
   public:
    Builder() = default;

    [[nodiscard]] auto scan(Source source) -> NodePtr {
        return std::make_unique<ScanNode>(next_id(), std::move(source));
    }

    [[nodiscard]] auto filter(FilterExprPtr predicate) -> NodePtr {
        return std::make_unique<FilterNode>(next_id(), std::move(predicate));
    }

    [[nodiscard]] auto group(std::vector<std::string> columns) -> NodePtr {
        return std::make_unique<GroupNode>(next_id(), std::move(columns));
    }

    [[nodiscard]] auto keep(std::vector<std::string> columns) -> NodePtr {
        return std::make_unique<ProjectNode>(NodeKind::Keep, next_id(), std::move(columns));
    }

    [[nodiscard]] auto drop(std::vector<std::string> columns) -> NodePtr {
        return std::make_unique<ProjectNode>(NodeKind::Drop, next_id(), std::move(columns));
    }

    [[nodiscard]] auto sort(std::vector<std::string> columns, bool descending) -> NodePtr {
        return std::make_unique<SortNode>(next_id(), std::move(columns), descending);
    }

    [[nodiscard]] auto limit(std::int64_t count, std::int64_t offset = 0) -> NodePtr {
        return std::make_unique<LimitNode>(next_id(), count, offset);
    }

    [[nodiscard]] auto aggregate(std::vector<AggSpec> aggregations,
                                 std::optional<Duration> every = std::nullopt) -> NodePtr {
        return std::make_unique<AggregateNode>(next_id(), std::move(aggregations), every);
    }

    /// Make `node` consume the output of `input`.
    [[nodiscard]] static auto chain(NodePtr input, NodePtr node) -> NodePtr {
        node->add_child(std::move(input));
        return node;
    }

   private:
    [[nodiscard]] auto next_id() -> NodeId {
        return next_id_.fetch_add(1, std::memory_order_relaxed);
    }

    std::atomic<NodeId> next_id_{1};
};

// FilterExpr factories.
[[nodiscard]] auto filter_col(std::string name) -> FilterExprPtr;
[[nodiscard]] auto filter_lit(Value value) -> FilterExprPtr;
[[nodiscard]] auto filter_cmp(CompareOp op, FilterExprPtr l, FilterExprPtr r) -> FilterExprPtr;
[[nodiscard]] auto filter_and(FilterExprPtr l, FilterExprPtr r) -> FilterExprPtr;
[[nodiscard]] auto filter_or(FilterExprPtr l, FilterExprPtr r) -> FilterExprPtr;
[[nodiscard]] auto filter_not(FilterExprPtr operand) -> FilterExprPtr;

}  // namespace parity::ir
