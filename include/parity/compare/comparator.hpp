#pragma once

#include <parity/compare/verdict.hpp>
#include <parity/core/error.hpp>
#include <parity/table/result_stream.hpp>

#include <string>
#include <string_view>
#include <vector>

namespace parity::compare {

/// Decide whether two result streams hold the same logical content.
///
/// Tables are folded into series keyed by (group key, typed column set); tables
/// sharing a key are concatenated in arrival order. Streams are equal when
/// they hold the same series and each series has the same rows, in the same
/// order, with exactly equal values. Table arrival order, column order and
/// result names are not significant.
///
/// Both streams are drained and released on every path. A decode error in
/// either stream is returned as an error rather than a verdict.
[[nodiscard]] auto compare(table::ResultStream& want, table::ResultStream& got)
    -> Expected<Verdict>;

/// Deterministic annotated-text rendering of a stream: one table per series,
/// series ordered by key, columns ordered by name. Drains and releases the stream.
[[nodiscard]] auto render(table::ResultStream& stream) -> Expected<std::string>;

/// Unified line diff, `-` for `want` and `+` for `got`, 3 lines of context.
/// Empty when the texts are equal.
[[nodiscard]] auto line_diff(std::string_view want, std::string_view got) -> std::string;

}  // namespace parity::compare
