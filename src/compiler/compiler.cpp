#include <parity/compiler/compiler.hpp>
#include <parity/legacy/transpile.hpp>
#include <parity/query/lower.hpp>
#include <parity/query/parser.hpp>

#include <spdlog/spdlog.h>

#include <type_traits>

namespace parity::compiler {

namespace {

auto compile_native(const NativeCompiler& native) -> Expected<ir::Program> {
    auto parsed = query::parse(native.query);
    if (!parsed.has_value()) {
        const auto& err = parsed.error();
        return std::unexpected(make_error(ErrorKind::Compile, err.message, err.line, err.column));
    }
    auto lowered = query::lower(*parsed);
    if (!lowered.has_value()) {
        const auto& err = lowered.error();
        return std::unexpected(make_error(ErrorKind::Compile, err.message, err.line, err.column));
    }
    return std::move(*lowered);
}

auto compile_legacy(const TranspilingCompiler& legacy) -> Expected<ir::Program> {
    return legacy::transpile(legacy.query, legacy::TranspileConfig{
                                               .cluster = legacy.cluster,
                                               .default_database = legacy.database,
                                               .default_retention_policy = legacy.retention_policy,
                                               .mappings = legacy.mappings,
                                           });
}

}  // namespace

auto backend_name(const Compiler& compiler) -> std::string_view {
    return std::holds_alternative<NativeCompiler>(compiler) ? "native" : "transpiling";
}

auto compile(const Compiler& compiler, std::optional<InputOverride> input,
             const codec::Dialect& dialect) -> Expected<Plan> {
    auto program = std::visit(
        [](const auto& backend) -> Expected<ir::Program> {
            using T = std::decay_t<decltype(backend)>;
            if constexpr (std::is_same_v<T, NativeCompiler>) {
                return compile_native(backend);
            } else {
                return compile_legacy(backend);
            }
        },
        compiler);
    if (!program.has_value()) {
        return std::unexpected(std::move(program.error()));
    }
    if (spdlog::should_log(spdlog::level::debug)) {
        spdlog::debug("{} plan:\n{}", backend_name(compiler), ir::describe(*program));
    }
    return Plan{
        .program = std::move(*program),
        .input = std::move(input),
        .dialect = dialect,
    };
}

}  // namespace parity::compiler
