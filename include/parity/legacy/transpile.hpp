#pragma once

#include <parity/compiler/mapping.hpp>
#include <parity/core/error.hpp>
#include <parity/ir/program.hpp>
#include <parity/legacy/ast.hpp>

#include <string>
#include <string_view>

namespace parity::legacy {

/// Legacy coordinates used to resolve `FROM` clauses to buckets.
struct TranspileConfig {
    std::string cluster;
    std::string default_database;
    std::string default_retention_policy;
    const compiler::MappingService* mappings = nullptr;
};

/// Translate parsed statements into native pipelines. Every statement reads the
/// bucket its database and retention policy map to.
[[nodiscard]] auto transpile(const Query& query, const TranspileConfig& config)
    -> Expected<ir::Program>;

/// Parse and translate in one step; parse errors are reported as compile errors.
[[nodiscard]] auto transpile(std::string_view text, const TranspileConfig& config)
    -> Expected<ir::Program>;

}  // namespace parity::legacy
