#pragma once

#include <parity/ir/node.hpp>

#include <string>
#include <vector>

namespace parity::ir {

/// One pipeline producing one named result.
struct Pipeline {
    std::string result_name;
    NodePtr root;
};

/// Compiled form of a query: its pipelines in statement order.
struct Program {
    std::vector<Pipeline> pipelines;
};

/// Indented one-line-per-node dump, used in debug logs and tests.
[[nodiscard]] auto describe(const Program& program) -> std::string;

}  // namespace parity::ir
