#pragma once

#include <parity/legacy/ast.hpp>
#include <parity/query/parser.hpp>

#include <expected>
#include <string_view>

namespace parity::legacy {

using query::ParseError;

/// Parse `;`-separated SELECT statements. Keywords are case-insensitive.
[[nodiscard]] auto parse(std::string_view source) -> std::expected<Query, ParseError>;

}  // namespace parity::legacy
