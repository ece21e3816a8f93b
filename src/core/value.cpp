#include <parity/core/value.hpp>

#include <fmt/core.h>

#include <array>
#include <charconv>
#include <cmath>
#include <type_traits>

namespace parity {

namespace {

auto format_float(double value) -> std::string {
    if (std::isnan(value)) {
        return "NaN";
    }
    if (std::isinf(value)) {
        return value > 0 ? "+Inf" : "-Inf";
    }
    std::array<char, 64> buffer{};
    auto [ptr, ec] = std::to_chars(buffer.data(), buffer.data() + buffer.size(), value);
    if (ec == std::errc{}) {
        return std::string(buffer.data(), ptr);
    }
    return fmt::format("{}", value);
}

template <typename T>
auto parse_integer(std::string_view text) -> std::optional<T> {
    T out{};
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), out);
    if (ec != std::errc() || ptr != text.data() + text.size()) {
        return std::nullopt;
    }
    return out;
}

auto parse_float(std::string_view text) -> std::optional<double> {
    if (text == "NaN" || text == "nan") {
        return std::nan("");
    }
    if (text == "+Inf" || text == "Inf" || text == "inf" || text == "+inf") {
        return HUGE_VAL;
    }
    if (text == "-Inf" || text == "-inf") {
        return -HUGE_VAL;
    }
    if (!text.empty() && text.front() == '+') {
        text.remove_prefix(1);
    }
    double out = 0.0;
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), out);
    if (ec != std::errc() || ptr != text.data() + text.size()) {
        return std::nullopt;
    }
    return out;
}

auto float_order(double lhs, double rhs) -> std::weak_ordering {
    bool lhs_nan = std::isnan(lhs);
    bool rhs_nan = std::isnan(rhs);
    if (lhs_nan || rhs_nan) {
        if (lhs_nan && rhs_nan) {
            return std::weak_ordering::equivalent;
        }
        return lhs_nan ? std::weak_ordering::greater : std::weak_ordering::less;
    }
    if (lhs < rhs) {
        return std::weak_ordering::less;
    }
    if (lhs > rhs) {
        return std::weak_ordering::greater;
    }
    return std::weak_ordering::equivalent;
}

auto as_double(const Value& value) -> std::optional<double> {
    if (const auto* v = std::get_if<std::int64_t>(&value)) {
        return static_cast<double>(*v);
    }
    if (const auto* v = std::get_if<std::uint64_t>(&value)) {
        return static_cast<double>(*v);
    }
    if (const auto* v = std::get_if<double>(&value)) {
        return *v;
    }
    return std::nullopt;
}

}  // namespace

auto type_of(const Value& value) -> std::optional<DataType> {
    return std::visit(
        [](const auto& v) -> std::optional<DataType> {
            using T = std::decay_t<decltype(v)>;
            if constexpr (std::is_same_v<T, std::monostate>) {
                return std::nullopt;
            } else if constexpr (std::is_same_v<T, std::string>) {
                return DataType::String;
            } else if constexpr (std::is_same_v<T, std::int64_t>) {
                return DataType::Int;
            } else if constexpr (std::is_same_v<T, std::uint64_t>) {
                return DataType::UInt;
            } else if constexpr (std::is_same_v<T, double>) {
                return DataType::Float;
            } else if constexpr (std::is_same_v<T, bool>) {
                return DataType::Bool;
            } else if constexpr (std::is_same_v<T, Timestamp>) {
                return DataType::Time;
            } else {
                return DataType::Duration;
            }
        },
        value);
}

auto type_name(DataType type) -> std::string_view {
    switch (type) {
        case DataType::String:
            return "string";
        case DataType::Int:
            return "int";
        case DataType::UInt:
            return "uint";
        case DataType::Float:
            return "float";
        case DataType::Bool:
            return "bool";
        case DataType::Time:
            return "time";
        case DataType::Duration:
            return "duration";
    }
    return "unknown";
}

auto format_value(const Value& value) -> std::string {
    return std::visit(
        [](const auto& v) -> std::string {
            using T = std::decay_t<decltype(v)>;
            if constexpr (std::is_same_v<T, std::monostate>) {
                return {};
            } else if constexpr (std::is_same_v<T, std::string>) {
                return v;
            } else if constexpr (std::is_same_v<T, double>) {
                return format_float(v);
            } else if constexpr (std::is_same_v<T, bool>) {
                return v ? "true" : "false";
            } else if constexpr (std::is_same_v<T, Timestamp>) {
                return format_rfc3339(v);
            } else if constexpr (std::is_same_v<T, Duration>) {
                return format_duration(v);
            } else {
                return fmt::format("{}", v);
            }
        },
        value);
}

auto parse_value(DataType type, std::string_view text) -> std::optional<Value> {
    switch (type) {
        case DataType::String:
            return Value{std::string(text)};
        case DataType::Int:
            if (auto v = parse_integer<std::int64_t>(text)) {
                return Value{*v};
            }
            return std::nullopt;
        case DataType::UInt:
            if (auto v = parse_integer<std::uint64_t>(text)) {
                return Value{*v};
            }
            return std::nullopt;
        case DataType::Float:
            if (auto v = parse_float(text)) {
                return Value{*v};
            }
            return std::nullopt;
        case DataType::Bool:
            if (text == "true") {
                return Value{true};
            }
            if (text == "false") {
                return Value{false};
            }
            return std::nullopt;
        case DataType::Time:
            if (auto v = parse_rfc3339(text)) {
                return Value{*v};
            }
            return std::nullopt;
        case DataType::Duration:
            if (auto v = parse_duration(text)) {
                return Value{*v};
            }
            return std::nullopt;
    }
    return std::nullopt;
}

auto values_equal(const Value& lhs, const Value& rhs) -> bool {
    if (lhs.index() != rhs.index()) {
        return false;
    }
    if (const auto* l = std::get_if<double>(&lhs)) {
        double r = std::get<double>(rhs);
        return *l == r || (std::isnan(*l) && std::isnan(r));
    }
    return lhs == rhs;
}

auto value_order(const Value& lhs, const Value& rhs) -> std::weak_ordering {
    if (lhs.index() != rhs.index()) {
        return lhs.index() <=> rhs.index();
    }
    if (const auto* l = std::get_if<double>(&lhs)) {
        return float_order(*l, std::get<double>(rhs));
    }
    return std::visit(
        [&rhs](const auto& l) -> std::weak_ordering {
            using T = std::decay_t<decltype(l)>;
            if constexpr (std::is_same_v<T, std::monostate> || std::is_same_v<T, double>) {
                return std::weak_ordering::equivalent;
            } else {
                const auto& r = std::get<T>(rhs);
                if (l < r) {
                    return std::weak_ordering::less;
                }
                if (r < l) {
                    return std::weak_ordering::greater;
                }
                return std::weak_ordering::equivalent;
            }
        },
        lhs);
}

auto compare_values(const Value& lhs, const Value& rhs) -> std::optional<std::partial_ordering> {
    if (is_null(lhs) || is_null(rhs)) {
        return std::nullopt;
    }
    if (lhs.index() == rhs.index()) {
        if (const auto* l = std::get_if<double>(&lhs)) {
            return *l <=> std::get<double>(rhs);
        }
        return std::partial_ordering{value_order(lhs, rhs)};
    }
    auto l = as_double(lhs);
    auto r = as_double(rhs);
    if (!l.has_value() || !r.has_value()) {
        return std::nullopt;
    }
    // Mixed signed/unsigned integers are compared exactly where possible.
    if (const auto* li = std::get_if<std::int64_t>(&lhs)) {
        if (const auto* ru = std::get_if<std::uint64_t>(&rhs)) {
            if (*li < 0) {
                return std::partial_ordering::less;
            }
            return static_cast<std::uint64_t>(*li) <=> *ru;
        }
    }
    if (const auto* lu = std::get_if<std::uint64_t>(&lhs)) {
        if (const auto* ri = std::get_if<std::int64_t>(&rhs)) {
            if (*ri < 0) {
                return std::partial_ordering::greater;
            }
            return *lu <=> static_cast<std::uint64_t>(*ri);
        }
    }
    return *l <=> *r;
}

}  // namespace parity
