#pragma once

#include <parity/ir/program.hpp>
#include <parity/query/ast.hpp>

#include <expected>
#include <string>

namespace parity::query {

struct LowerError {
    std::string message;
    std::size_t line = 0;
    std::size_t column = 0;

    [[nodiscard]] auto format() const -> std::string;
};

using LowerResult = std::expected<ir::Program, LowerError>;

/// Lower a parsed Program into one IR pipeline per statement.
[[nodiscard]] auto lower(const Program& program) -> LowerResult;

}  // namespace parity::query
