#pragma once

#include <parity/core/error.hpp>
#include <parity/ir/node.hpp>
#include <parity/table/table.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace parity::ops {

// ─── Table-set operations ─────────────────────────────────────────────────────
//  Each operation maps the tables of one pipeline stage to the next. Tables
//  keep their group key unless the operation says otherwise.

using TableSet = std::vector<table::Table>;

/// Keep the rows for which `pred` holds; tables left without rows are dropped.
[[nodiscard]] auto filter(const TableSet& tables, const ir::FilterExpr& pred) -> TableSet;

/// Regroup every row by `columns`, in order of first appearance. Schemas of
/// merged tables are unioned; cells a source table lacks are null.
[[nodiscard]] auto group(const TableSet& tables, const std::vector<std::string>& columns)
    -> Expected<TableSet>;

/// Keep only `columns` (in the listed order); the group key follows.
[[nodiscard]] auto keep(const TableSet& tables, const std::vector<std::string>& columns)
    -> TableSet;

/// Remove `columns`; the group key follows.
[[nodiscard]] auto drop(const TableSet& tables, const std::vector<std::string>& columns)
    -> TableSet;

/// Stable sort of each table's rows. Nulls sort first.
[[nodiscard]] auto sort(const TableSet& tables, const std::vector<std::string>& columns,
                        bool descending) -> TableSet;

/// At most `count` rows of each table after skipping `offset`.
[[nodiscard]] auto limit(const TableSet& tables, std::int64_t count, std::int64_t offset)
    -> TableSet;

/// One row per table, or one per `every` window of `_time`. The output holds
/// the key columns, `_time` (window start) when windowed, then one column per
/// aggregation.
[[nodiscard]] auto aggregate(const TableSet& tables, const std::vector<ir::AggSpec>& specs,
                             std::optional<Duration> every) -> Expected<TableSet>;

/// Evaluate a predicate against one row. Null or missing operands compare false.
[[nodiscard]] auto matches(const ir::FilterExpr& pred, const table::Table& table,
                           std::size_t row) -> bool;

}  // namespace parity::ops
