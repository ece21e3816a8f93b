#include <parity/compiler/mapping.hpp>
#include <parity/harness/case.hpp>
#include <parity/harness/driver.hpp>
#include <parity/harness/skip_registry.hpp>
#include <parity/runtime/executor.hpp>

#include <CLI/CLI.hpp>
#include <fmt/core.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <cstdint>
#include <cstdlib>
#include <string>
#include <vector>

namespace {

/// Register `db/rp` mappings; the first retention policy of a database is its default.
auto build_mappings(const std::string& cluster, const std::vector<std::string>& specs)
    -> parity::Expected<parity::compiler::StaticMappingService> {
    parity::compiler::StaticMappingService service;
    std::vector<std::string> seen;
    std::uint64_t next_id = 1;
    for (const auto& spec : specs) {
        const auto slash = spec.find('/');
        if (slash == std::string::npos || slash == 0 || slash + 1 == spec.size()) {
            return std::unexpected(parity::make_error(
                parity::ErrorKind::Compile,
                fmt::format("invalid mapping '{}', expected <database>/<retention policy>", spec)));
        }
        std::string database = spec.substr(0, slash);
        const bool is_default = std::ranges::find(seen, database) == seen.end();
        if (is_default) {
            seen.push_back(database);
        }
        auto added = service.add(parity::compiler::Mapping{
            .cluster = cluster,
            .database = database,
            .retention_policy = spec.substr(slash + 1),
            .is_default = is_default,
            .organization_id = parity::compiler::Id(0x1000),
            .bucket_id = parity::compiler::Id(0x2000 + next_id++),
        });
        if (!added.has_value()) {
            return std::unexpected(std::move(added.error()));
        }
    }
    return service;
}

}  // namespace

auto main(int argc, char** argv) -> int {
    CLI::App app{"parity golden runner: differential check of query compilers"};

    std::string data_dir;
    std::vector<std::string> only;
    std::vector<std::string> mapping_specs;
    std::string skip_file;
    parity::harness::DriverConfig config;
    app.add_option("testdata", data_dir,
                   "Directory of golden cases. Defaults to PARITY_TESTDATA environment variable.");
    app.add_option("--case", only, "Run only the named case (repeatable)");
    app.add_option("--skip-file", skip_file, "File of <name><TAB><reason> lines to skip");
    app.add_option("--cluster", config.cluster, "Legacy cluster name")->capture_default_str();
    app.add_option("--database", config.database, "Default legacy database")
        ->capture_default_str();
    app.add_option("--mapping", mapping_specs,
                   "Legacy mapping <database>/<retention policy> (repeatable; default "
                   "<database>/autogen)");
    app.add_option("-j,--jobs", config.jobs, "Cases run concurrently")->capture_default_str();
    app.add_flag("-v,--verbose", config.verbose, "Enable verbose output");

    CLI11_PARSE(app, argc, argv);

    if (config.verbose) {
        spdlog::set_level(spdlog::level::debug);
    } else {
        spdlog::set_level(spdlog::level::info);
    }

    if (data_dir.empty()) {
        const char* env = std::getenv("PARITY_TESTDATA");
        if (env != nullptr) {
            data_dir = env;
        }
    }
    if (data_dir.empty()) {
        spdlog::error("no test data directory given and PARITY_TESTDATA is not set");
        return 2;
    }

    parity::harness::SkipRegistry skips;
    if (!skip_file.empty()) {
        auto loaded = parity::harness::SkipRegistry::load(skip_file);
        if (!loaded.has_value()) {
            spdlog::error("{}", loaded.error().format());
            return 2;
        }
        skips = std::move(*loaded);
    }

    if (mapping_specs.empty()) {
        mapping_specs.push_back(config.database + "/autogen");
    }
    auto mappings = build_mappings(config.cluster, mapping_specs);
    if (!mappings.has_value()) {
        spdlog::error("{}", mappings.error().format());
        return 2;
    }

    auto cases = parity::harness::discover_cases(data_dir);
    if (!cases.has_value()) {
        spdlog::error("{}", cases.error().format());
        return 2;
    }
    if (!only.empty()) {
        std::erase_if(*cases, [&only](const parity::harness::CaseSpec& spec) {
            return std::ranges::find(only, spec.name) == only.end();
        });
    }

    parity::runtime::ExecutionService service;
    parity::harness::Driver driver(config, skips, *mappings, service);
    auto outcomes = driver.run_all(*cases);

    for (const auto& outcome : outcomes) {
        if (outcome.status == parity::harness::Status::Fail) {
            spdlog::error("{}: {}", outcome.name, outcome.detail);
        }
        if (outcome.detail.empty()) {
            fmt::print("{} {}\n", parity::harness::status_name(outcome.status), outcome.name);
        } else {
            fmt::print("{} {} ({})\n", parity::harness::status_name(outcome.status), outcome.name,
                       outcome.status == parity::harness::Status::Fail ? "see log"
                                                                       : outcome.detail);
        }
    }
    auto summary = parity::harness::summarize(outcomes);
    fmt::print("{} passed, {} failed, {} skipped\n", summary.passed, summary.failed,
               summary.skipped);
    return summary.failed == 0 ? 0 : 1;
}
