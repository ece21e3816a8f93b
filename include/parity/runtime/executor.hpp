#pragma once

#include <parity/compiler/compiler.hpp>
#include <parity/compiler/mapping.hpp>
#include <parity/core/error.hpp>
#include <parity/ir/node.hpp>
#include <parity/runtime/ops.hpp>

#include <cstdint>
#include <filesystem>
#include <ostream>
#include <string>
#include <unordered_map>

namespace parity::runtime {

/// Runs compiled plans against fixture-backed buckets.
///
/// Buckets are registered once before any plan runs and are only read
/// afterwards. A plan with an input override reads its fixture instead of
/// any registered bucket.
class ExecutionService {
   public:
    ExecutionService() = default;

    /// Register the fixture behind a bucket name (`db/rp`).
    void add_bucket(std::string name, std::filesystem::path fixture);
    /// Register the fixture behind a bucket id.
    void add_bucket(compiler::Id id, std::filesystem::path fixture);

    /// Execute every pipeline of `plan` and encode the results into `out` in
    /// the plan's dialect. Returns the number of rows written.
    [[nodiscard]] auto execute(const compiler::Plan& plan, std::ostream& out) const
        -> Expected<std::int64_t>;

    /// Evaluate a single pipeline to its tables.
    [[nodiscard]] auto evaluate(const ir::Node& node,
                                const std::optional<compiler::InputOverride>& input) const
        -> Expected<ops::TableSet>;

   private:
    [[nodiscard]] auto load(const ir::Source& source,
                            const std::optional<compiler::InputOverride>& input) const
        -> Expected<ops::TableSet>;

    std::unordered_map<std::string, std::filesystem::path> by_name_;
    std::unordered_map<std::string, std::filesystem::path> by_id_;
};

}  // namespace parity::runtime
