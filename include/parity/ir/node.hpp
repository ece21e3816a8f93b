#pragma once

#include <parity/core/time.hpp>
#include <parity/core/value.hpp>

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace parity::ir {

/// Unique identifier for IR nodes.
using NodeId = std::uint64_t;

class Node;
using NodePtr = std::unique_ptr<Node>;

/// Supported comparison operators for filter predicates.
enum class CompareOp : std::uint8_t {
    Eq,
    Ne,
    Lt,
    Le,
    Gt,
    Ge,
};

/// Supported aggregation functions.
enum class AggFunc : std::uint8_t {
    Count,
    Sum,
    Mean,
    Min,
    Max,
    First,
    Last,
};

/// Filter expression tree.
struct FilterExpr;
using FilterExprPtr = std::unique_ptr<FilterExpr>;

/// Column reference in a filter expression.
struct FilterColumn {
    std::string name;
};
/// Literal value in a filter expression.
struct FilterLiteral {
    Value value;
};
/// Comparison between two value expressions. Null or missing operands compare false.
struct FilterCmp {
    CompareOp op;
    FilterExprPtr left, right;
};
/// Logical AND of two boolean expressions.
struct FilterAnd {
    FilterExprPtr left, right;
};
/// Logical OR of two boolean expressions.
struct FilterOr {
    FilterExprPtr left, right;
};
/// Logical NOT of a boolean expression.
struct FilterNot {
    FilterExprPtr operand;
};

struct FilterExpr {
    std::variant<FilterColumn, FilterLiteral, FilterCmp, FilterAnd, FilterOr, FilterNot> node;
};

/// Aggregation specification: apply function to column, store as alias.
struct AggSpec {
    AggFunc func = AggFunc::Count;
    std::string column;
    std::string alias;
};

/// Where a Scan reads from: a bucket named `db/rp`, or a bucket id.
struct Source {
    enum class Kind : std::uint8_t { BucketName, BucketId };
    Kind kind = Kind::BucketName;
    std::string value;
};

/// IR node types.
enum class NodeKind : std::uint8_t {
    Scan,
    Filter,
    Group,
    Keep,
    Drop,
    Sort,
    Limit,
    Aggregate,
};

/// Base IR node for the query plan.
///
/// Represents a single table operation in a pipeline. The operation's input
/// is its only child; Scan nodes are leaves.
class Node {
   public:
    explicit Node(NodeKind kind, NodeId id) : kind_(kind), id_(id) {}
    virtual ~Node() = default;

    Node(const Node&) = delete;
    auto operator=(const Node&) -> Node& = delete;
    Node(Node&&) = default;
    auto operator=(Node&&) -> Node& = default;

    [[nodiscard]] auto kind() const noexcept -> NodeKind { return kind_; }
    [[nodiscard]] auto id() const noexcept -> NodeId { return id_; }
    [[nodiscard]] auto children() const noexcept -> const std::vector<NodePtr>& {
        return children_;
    }

    void add_child(NodePtr child) { children_.push_back(std::move(child)); }

   private:
    NodeKind kind_;
    NodeId id_;
    std::vector<NodePtr> children_;
};

/// Scan node: reads every table of a source.
class ScanNode final : public Node {
   public:
    ScanNode(NodeId id, Source source) : Node(NodeKind::Scan, id), source_(std::move(source)) {}

    [[nodiscard]] auto source() const noexcept -> const Source& { return source_; }

   private:
    Source source_;
};

/// Filter node: keeps the rows for which the predicate holds.
class FilterNode final : public Node {
   public:
    FilterNode(NodeId id, FilterExprPtr predicate)
        : Node(NodeKind::Filter, id), predicate_(std::move(predicate)) {}

    [[nodiscard]] auto predicate() const noexcept -> const FilterExpr& { return *predicate_; }

   private:
    FilterExprPtr predicate_;
};

/// Group node: regroups all rows by the listed columns.
class GroupNode final : public Node {
   public:
    GroupNode(NodeId id, std::vector<std::string> columns)
        : Node(NodeKind::Group, id), columns_(std::move(columns)) {}

    [[nodiscard]] auto columns() const noexcept -> const std::vector<std::string>& {
        return columns_;
    }

   private:
    std::vector<std::string> columns_;
};

/// Keep or Drop node: projects columns in or out; the group key follows.
class ProjectNode final : public Node {
   public:
    ProjectNode(NodeKind kind, NodeId id, std::vector<std::string> columns)
        : Node(kind, id), columns_(std::move(columns)) {}

    [[nodiscard]] auto columns() const noexcept -> const std::vector<std::string>& {
        return columns_;
    }

   private:
    std::vector<std::string> columns_;
};

/// Sort node: stable sort of the rows of each table.
class SortNode final : public Node {
   public:
    SortNode(NodeId id, std::vector<std::string> columns, bool descending)
        : Node(NodeKind::Sort, id), columns_(std::move(columns)), descending_(descending) {}

    [[nodiscard]] auto columns() const noexcept -> const std::vector<std::string>& {
        return columns_;
    }
    [[nodiscard]] auto descending() const noexcept -> bool { return descending_; }

   private:
    std::vector<std::string> columns_;
    bool descending_;
};

/// Limit node: at most `count` rows of each table after skipping `offset`.
class LimitNode final : public Node {
   public:
    LimitNode(NodeId id, std::int64_t count, std::int64_t offset)
        : Node(NodeKind::Limit, id), count_(count), offset_(offset) {}

    [[nodiscard]] auto count() const noexcept -> std::int64_t { return count_; }
    [[nodiscard]] auto offset() const noexcept -> std::int64_t { return offset_; }

   private:
    std::int64_t count_;
    std::int64_t offset_;
};

/// Aggregate node: one row per table, or per time window when `every` is set.
class AggregateNode final : public Node {
   public:
    AggregateNode(NodeId id, std::vector<AggSpec> aggregations, std::optional<Duration> every)
        : Node(NodeKind::Aggregate, id),
          aggregations_(std::move(aggregations)),
          every_(every) {}

    [[nodiscard]] auto aggregations() const noexcept -> const std::vector<AggSpec>& {
        return aggregations_;
    }
    [[nodiscard]] auto every() const noexcept -> const std::optional<Duration>& { return every_; }

   private:
    std::vector<AggSpec> aggregations_;
    std::optional<Duration> every_;
};

[[nodiscard]] auto agg_func_name(AggFunc func) -> std::string_view;
[[nodiscard]] auto parse_agg_func(std::string_view name) -> std::optional<AggFunc>;

}  // namespace parity::ir
