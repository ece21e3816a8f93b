#pragma once

#include <parity/compare/verdict.hpp>
#include <parity/compiler/mapping.hpp>
#include <parity/harness/case.hpp>
#include <parity/harness/skip_registry.hpp>
#include <parity/runtime/executor.hpp>

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace parity::harness {

struct DriverConfig {
    // Legacy coordinates for queries whose FROM omits them.
    std::string cluster = "cluster";
    std::string database = "db0";
    bool verbose = false;
    // Cases run concurrently by up to this many workers.
    std::size_t jobs = 1;
};

struct Summary {
    std::size_t passed = 0;
    std::size_t failed = 0;
    std::size_t skipped = 0;
};

/// Runs golden cases: compile, execute, decode, compare.
///
/// The skip registry, mapping service and execution service are borrowed
/// and must outlive the driver; none of them is modified while cases run.
class Driver {
   public:
    Driver(DriverConfig config, const SkipRegistry& skips,
           const compiler::MappingService& mappings, const runtime::ExecutionService& service)
        : config_(std::move(config)), skips_(skips), mappings_(mappings), service_(service) {}

    /// Run one case. Every failure is reported in the outcome; nothing throws.
    [[nodiscard]] auto run(const CaseSpec& spec) const -> CaseOutcome;

    /// Run every case, in order. A failing case does not stop the others.
    [[nodiscard]] auto run_all(const std::vector<CaseSpec>& cases) const
        -> std::vector<CaseOutcome>;

    [[nodiscard]] auto config() const noexcept -> const DriverConfig& { return config_; }

   private:
    // An entry for the case stem skips every variant; otherwise the variant name is looked up.
    [[nodiscard]] auto skip_reason(const CaseSpec& spec) const -> const std::string*;
    [[nodiscard]] auto produce(const CaseSpec& spec) const -> Expected<std::string>;
    [[nodiscard]] auto check(const CaseSpec& spec, std::string actual) const
        -> Expected<compare::Verdict>;

    DriverConfig config_;
    const SkipRegistry& skips_;
    const compiler::MappingService& mappings_;
    const runtime::ExecutionService& service_;
};

/// Compare raw text after trimming surrounding whitespace. The description
/// of an unequal verdict is a unified diff, want (-) against got (+).
[[nodiscard]] auto check_text(std::string_view expected, std::string_view actual)
    -> compare::Verdict;

[[nodiscard]] auto summarize(const std::vector<CaseOutcome>& outcomes) -> Summary;

}  // namespace parity::harness
