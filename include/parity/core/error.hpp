#pragma once

#include <cstddef>
#include <cstdint>
#include <expected>
#include <string>
#include <string_view>

namespace parity {

/// Failure categories surfaced by the harness.
enum class ErrorKind : std::uint8_t {
    FixtureMissing,
    FixtureUnreadable,
    Decode,
    Compile,
    Execution,
    Mismatch,
};

/// Error with an optional source location (1-based; 0 means unknown).
struct Error {
    ErrorKind kind = ErrorKind::Decode;
    std::string message;
    std::size_t line = 0;
    std::size_t column = 0;

    [[nodiscard]] auto format() const -> std::string;
};

template <typename T>
using Expected = std::expected<T, Error>;

[[nodiscard]] auto kind_name(ErrorKind kind) -> std::string_view;

[[nodiscard]] inline auto make_error(ErrorKind kind, std::string message, std::size_t line = 0,
                                     std::size_t column = 0) -> Error {
    return Error{.kind = kind, .message = std::move(message), .line = line, .column = column};
}

}  // namespace parity
