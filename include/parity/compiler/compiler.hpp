#pragma once

#include <parity/codec/dialect.hpp>
#include <parity/compiler/mapping.hpp>
#include <parity/core/error.hpp>
#include <parity/ir/program.hpp>

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <variant>

namespace parity::compiler {

/// Compiles pipeline-language queries.
struct NativeCompiler {
    std::string query;
};

/// Compiles legacy SELECT queries by translating them to native pipelines.
/// `FROM` clauses are resolved to buckets through `mappings`.
struct TranspilingCompiler {
    std::string query;
    std::string cluster;
    std::string database;
    std::string retention_policy;
    const MappingService* mappings = nullptr;
};

/// The closed set of compiler backends.
using Compiler = std::variant<NativeCompiler, TranspilingCompiler>;

/// Redirects every source a query reads to a fixed fixture file.
struct InputOverride {
    std::filesystem::path path;
};

/// Executable form of a query, bound to an output dialect.
struct Plan {
    ir::Program program;
    std::optional<InputOverride> input;
    codec::Dialect dialect;
};

[[nodiscard]] auto backend_name(const Compiler& compiler) -> std::string_view;

/// Compile a query. The same compiler, override and dialect always yield an
/// equivalent plan. Every failure is reported with ErrorKind::Compile.
[[nodiscard]] auto compile(const Compiler& compiler, std::optional<InputOverride> input,
                           const codec::Dialect& dialect) -> Expected<Plan>;

}  // namespace parity::compiler
