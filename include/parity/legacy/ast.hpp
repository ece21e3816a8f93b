#pragma once

#include <parity/core/time.hpp>
#include <parity/core/value.hpp>
#include <parity/ir/node.hpp>

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace parity::legacy {

struct FieldRef {
    std::string name;
};

using Operand = std::variant<FieldRef, Value>;

struct Condition;
using ConditionPtr = std::unique_ptr<Condition>;

struct Comparison {
    ir::CompareOp op = ir::CompareOp::Eq;
    Operand left;
    Operand right;
};

struct Logical {
    bool conjunction = true;  // AND when true, OR otherwise
    ConditionPtr left;
    ConditionPtr right;
};

struct Condition {
    std::variant<Comparison, Logical> node;
};

/// A projected field: `value`, `*`, or an aggregate call `mean(value) AS m`.
struct SelectField {
    std::string column;
    std::optional<ir::AggFunc> func;
    std::string alias;
};

/// `[db.[rp].]measurement`; empty parts were omitted.
struct MeasurementRef {
    std::string database;
    std::string retention_policy;
    std::string name;
};

struct SelectStatement {
    std::vector<SelectField> fields;
    MeasurementRef from;
    ConditionPtr where;
    std::optional<Duration> group_time;
    std::vector<std::string> group_tags;
    bool descending = false;
    std::optional<std::int64_t> limit;
    std::int64_t offset = 0;
    std::size_t line = 0;
    std::size_t column = 0;
};

struct Query {
    std::vector<SelectStatement> statements;
};

}  // namespace parity::legacy
