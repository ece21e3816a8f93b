#include <parity/codec/codec.hpp>
#include <parity/compare/comparator.hpp>
#include <parity/compiler/compiler.hpp>
#include <parity/harness/driver.hpp>
#include <parity/io/byte_source.hpp>

#include <fmt/core.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <atomic>
#include <sstream>
#include <thread>

namespace parity::harness {

namespace {

constexpr std::string_view kQueryMissing = "query file is missing";
constexpr std::string_view kExpectedMissing = "expected output is missing";

auto trim(std::string_view text) -> std::string_view {
    const auto first = text.find_first_not_of(" \t\r\n");
    if (first == std::string_view::npos) {
        return {};
    }
    const auto last = text.find_last_not_of(" \t\r\n");
    return text.substr(first, last - first + 1);
}

auto exists(const std::filesystem::path& path) -> bool {
    std::error_code ec;
    return std::filesystem::exists(path, ec);
}

auto failure(const CaseSpec& spec, const Error& err) -> CaseOutcome {
    return CaseOutcome{
        .name = spec.name,
        .status = Status::Fail,
        .detail = fmt::format("{}: {}", kind_name(err.kind), err.format()),
    };
}

auto skip(const CaseSpec& spec, std::string reason) -> CaseOutcome {
    spdlog::warn("{}: skipped: {}", spec.name, reason);
    return CaseOutcome{.name = spec.name, .status = Status::Skip, .detail = std::move(reason)};
}

}  // namespace

auto check_text(std::string_view expected, std::string_view actual) -> compare::Verdict {
    expected = trim(expected);
    actual = trim(actual);
    if (expected == actual) {
        return compare::Verdict::equal();
    }
    return compare::Verdict::unequal(compare::line_diff(expected, actual));
}

auto summarize(const std::vector<CaseOutcome>& outcomes) -> Summary {
    Summary summary;
    for (const auto& outcome : outcomes) {
        switch (outcome.status) {
            case Status::Pass:
                summary.passed += 1;
                break;
            case Status::Fail:
                summary.failed += 1;
                break;
            case Status::Skip:
                summary.skipped += 1;
                break;
        }
    }
    return summary;
}

auto Driver::produce(const CaseSpec& spec) const -> Expected<std::string> {
    auto text = io::read_file(spec.query);
    if (!text.has_value()) {
        return std::unexpected(std::move(text.error()));
    }
    compiler::Compiler backend = compiler::NativeCompiler{.query = *text};
    if (spec.language == Language::Legacy) {
        backend = compiler::TranspilingCompiler{
            .query = std::move(*text),
            .cluster = config_.cluster,
            .database = config_.database,
            .retention_policy = {},
            .mappings = &mappings_,
        };
    }
    std::optional<compiler::InputOverride> input;
    if (spec.input.has_value()) {
        input = compiler::InputOverride{.path = *spec.input};
    }
    auto plan = compiler::compile(backend, std::move(input), spec.dialect);
    if (!plan.has_value()) {
        return std::unexpected(std::move(plan.error()));
    }
    std::ostringstream out;
    auto rows = service_.execute(*plan, out);
    if (!rows.has_value()) {
        return std::unexpected(std::move(rows.error()));
    }
    spdlog::debug("{}: {} executed, {} rows", spec.name, compiler::backend_name(backend), *rows);
    return std::move(out).str();
}

auto Driver::check(const CaseSpec& spec, std::string actual) const -> Expected<compare::Verdict> {
    if (spec.mode == Mode::RawText) {
        auto expected = io::read_file(spec.expected);
        if (!expected.has_value()) {
            return std::unexpected(std::move(expected.error()));
        }
        return check_text(*expected, actual);
    }
    auto want = codec::decode_file(spec.expected, spec.dialect.format);
    if (!want.has_value()) {
        return std::unexpected(std::move(want.error()));
    }
    auto decoder = codec::make_decoder(spec.dialect.format);
    auto got = decoder->decode(io::from_string(std::move(actual)));
    if (!got.has_value()) {
        auto err = std::move(got.error());
        err.message = fmt::format("actual output: {}", err.message);
        return std::unexpected(std::move(err));
    }
    return compare::compare(*want, *got);
}

auto Driver::skip_reason(const CaseSpec& spec) const -> const std::string* {
    if (!spec.stem.empty()) {
        if (const auto* reason = skips_.find(spec.stem)) {
            return reason;
        }
    }
    return skips_.find(spec.name);
}

auto Driver::run(const CaseSpec& spec) const -> CaseOutcome {
    if (const auto* reason = skip_reason(spec)) {
        return skip(spec, *reason);
    }
    if (!harness::exists(spec.query)) {
        return skip(spec, std::string(kQueryMissing));
    }
    if (!harness::exists(spec.expected)) {
        return skip(spec, std::string(kExpectedMissing));
    }
    if (config_.verbose) {
        spdlog::info("{}: running {} query", spec.name, language_name(spec.language));
    }

    auto actual = produce(spec);
    if (!actual.has_value()) {
        return failure(spec, actual.error());
    }
    auto verdict = check(spec, std::move(*actual));
    if (!verdict.has_value()) {
        if (verdict.error().kind == ErrorKind::FixtureMissing) {
            return skip(spec, std::string(kExpectedMissing));
        }
        return failure(spec, verdict.error());
    }
    if (!verdict->is_equal()) {
        return failure(spec, make_error(ErrorKind::Mismatch, verdict->description()));
    }
    spdlog::debug("{}: pass", spec.name);
    return CaseOutcome{.name = spec.name, .status = Status::Pass, .detail = {}};
}

auto Driver::run_all(const std::vector<CaseSpec>& cases) const -> std::vector<CaseOutcome> {
    std::vector<CaseOutcome> outcomes(cases.size());
    const std::size_t workers = std::min(std::max<std::size_t>(config_.jobs, 1), cases.size());
    if (workers <= 1) {
        for (std::size_t i = 0; i < cases.size(); ++i) {
            outcomes[i] = run(cases[i]);
        }
        return outcomes;
    }
    std::atomic<std::size_t> next{0};
    {
        // Joined on scope exit, also when starting a later worker throws.
        std::vector<std::jthread> threads;
        threads.reserve(workers);
        for (std::size_t w = 0; w < workers; ++w) {
            threads.emplace_back([&]() {
                for (std::size_t i = next.fetch_add(1); i < cases.size(); i = next.fetch_add(1)) {
                    outcomes[i] = run(cases[i]);
                }
            });
        }
    }
    return outcomes;
}

}  // namespace parity::harness
