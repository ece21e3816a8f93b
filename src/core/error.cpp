#include <parity/core/error.hpp>

#include <fmt/core.h>

namespace parity {

auto Error::format() const -> std::string {
    if (line == 0) {
        return message;
    }
    if (column == 0) {
        return fmt::format("line {}: {}", line, message);
    }
    return fmt::format("{}:{}: {}", line, column, message);
}

auto kind_name(ErrorKind kind) -> std::string_view {
    switch (kind) {
        case ErrorKind::FixtureMissing:
            return "fixture missing";
        case ErrorKind::FixtureUnreadable:
            return "fixture unreadable";
        case ErrorKind::Decode:
            return "decode error";
        case ErrorKind::Compile:
            return "compile error";
        case ErrorKind::Execution:
            return "execution error";
        case ErrorKind::Mismatch:
            return "comparison mismatch";
    }
    return "error";
}

}  // namespace parity
