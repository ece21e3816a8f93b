#pragma once

#include <parity/core/time.hpp>

#include <compare>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <variant>

namespace parity {

/// Declared scalar type of a column.
enum class DataType : std::uint8_t {
    String,
    Int,
    UInt,
    Float,
    Bool,
    Time,
    Duration,
};

/// A single cell. std::monostate is the null value.
using Value = std::variant<std::monostate, std::string, std::int64_t, std::uint64_t, double, bool,
                           Timestamp, Duration>;

[[nodiscard]] inline auto is_null(const Value& value) noexcept -> bool {
    return std::holds_alternative<std::monostate>(value);
}

/// Type of a non-null value; std::nullopt for null.
[[nodiscard]] auto type_of(const Value& value) -> std::optional<DataType>;

/// Short lowercase name used in diagnostics ("int", "float", ...).
[[nodiscard]] auto type_name(DataType type) -> std::string_view;

/// Text form used by the delimited wire format. Null formats as the empty string.
[[nodiscard]] auto format_value(const Value& value) -> std::string;

/// Parse the text form of a value of the given type.
[[nodiscard]] auto parse_value(DataType type, std::string_view text) -> std::optional<Value>;

/// Exact equality: same type and same value. Two NaNs are equal; null equals null.
[[nodiscard]] auto values_equal(const Value& lhs, const Value& rhs) -> bool;

/// Strict weak ordering over all values: null first, then by type, then by value
/// (NaN after every other float).
[[nodiscard]] auto value_order(const Value& lhs, const Value& rhs) -> std::weak_ordering;

/// Ordering used by query predicates. Numeric types compare across Int/UInt/Float;
/// std::nullopt when the values are not comparable (null or mismatched types).
[[nodiscard]] auto compare_values(const Value& lhs, const Value& rhs)
    -> std::optional<std::partial_ordering>;

}  // namespace parity
