#pragma once

#include <compare>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <string_view>

namespace parity {

/// Instant in nanoseconds since 1970-01-01T00:00:00Z (Unix epoch).
struct Timestamp {
    std::int64_t nanos = 0;
    auto operator<=>(const Timestamp&) const = default;
};

/// Signed span of time in nanoseconds.
struct Duration {
    std::int64_t nanos = 0;
    auto operator<=>(const Duration&) const = default;
};

/// Parse an RFC3339 timestamp (`2018-05-22T19:53:26.123Z`, `...+02:00`).
[[nodiscard]] auto parse_rfc3339(std::string_view text) -> std::optional<Timestamp>;

/// Format as RFC3339 in UTC with nanosecond precision, trailing fraction zeros trimmed.
[[nodiscard]] auto format_rfc3339(Timestamp ts) -> std::string;

/// Parse a duration literal such as `1h30m`, `-5ms` or `250us`.
[[nodiscard]] auto parse_duration(std::string_view text) -> std::optional<Duration>;

/// Canonical duration text (`0s` for zero).
[[nodiscard]] auto format_duration(Duration duration) -> std::string;

}  // namespace parity

namespace std {

template <>
struct hash<parity::Timestamp> {
    auto operator()(const parity::Timestamp& ts) const noexcept -> std::size_t {
        return std::hash<std::int64_t>{}(ts.nanos);
    }
};

template <>
struct hash<parity::Duration> {
    auto operator()(const parity::Duration& d) const noexcept -> std::size_t {
        return std::hash<std::int64_t>{}(d.nanos);
    }
};

}  // namespace std
