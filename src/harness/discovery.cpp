#include <parity/harness/case.hpp>

#include <fmt/core.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <system_error>

namespace parity::harness {

namespace {

auto input_for(const std::filesystem::path& dir, const std::string& stem)
    -> std::optional<std::filesystem::path> {
    std::error_code ec;
    auto csv = dir / (stem + ".in.csv");
    if (std::filesystem::exists(csv, ec)) {
        return csv;
    }
    auto json = dir / (stem + ".in.json");
    if (std::filesystem::exists(json, ec)) {
        return json;
    }
    return std::nullopt;
}

}  // namespace

auto status_name(Status status) -> std::string_view {
    switch (status) {
        case Status::Pass:
            return "PASS";
        case Status::Fail:
            return "FAIL";
        case Status::Skip:
            return "SKIP";
    }
    return "?";
}

auto language_name(Language language) -> std::string_view {
    return language == Language::Native ? "native" : "legacy";
}

auto discover_cases(const std::filesystem::path& dir) -> Expected<std::vector<CaseSpec>> {
    std::error_code ec;
    if (!std::filesystem::is_directory(dir, ec)) {
        return std::unexpected(make_error(
            ErrorKind::FixtureMissing, fmt::format("{}: not a test data directory", dir.string())));
    }
    std::vector<CaseSpec> cases;
    std::filesystem::directory_iterator it(dir, ec);
    if (ec) {
        return std::unexpected(make_error(ErrorKind::FixtureUnreadable,
                                          fmt::format("{}: {}", dir.string(), ec.message())));
    }
    for (; it != std::filesystem::directory_iterator(); it.increment(ec)) {
        std::error_code type_ec;
        if (!it->is_regular_file(type_ec)) {
            continue;
        }
        const auto& path = it->path();
        const std::string ext = path.extension().string();
        const std::string stem = path.stem().string();
        if (ext == ".pql") {
            cases.push_back(CaseSpec{
                .name = stem + ".pql",
                .stem = stem,
                .language = Language::Native,
                .query = path,
                .input = input_for(dir, stem),
                .expected = dir / (stem + ".out.csv"),
                .dialect = codec::Dialect::csv(),
                .mode = Mode::Decoded,
            });
            auto raw = dir / (stem + ".out.txt");
            if (std::filesystem::exists(raw, type_ec)) {
                cases.push_back(CaseSpec{
                    .name = stem + ".pql.txt",
                    .stem = stem,
                    .language = Language::Native,
                    .query = path,
                    .input = input_for(dir, stem),
                    .expected = raw,
                    .dialect = codec::Dialect::csv(),
                    .mode = Mode::RawText,
                });
            }
        } else if (ext == ".lql") {
            cases.push_back(CaseSpec{
                .name = stem + ".lql",
                .stem = stem,
                .language = Language::Legacy,
                .query = path,
                .input = input_for(dir, stem),
                .expected = dir / (stem + ".out.csv"),
                .dialect = codec::Dialect::csv(),
                .mode = Mode::Decoded,
            });
            cases.push_back(CaseSpec{
                .name = stem + ".lql.json",
                .stem = stem,
                .language = Language::Legacy,
                .query = path,
                .input = input_for(dir, stem),
                .expected = dir / (stem + ".out.json"),
                .dialect = codec::Dialect::json(),
                .mode = Mode::Decoded,
            });
        }
    }
    if (ec) {
        return std::unexpected(make_error(ErrorKind::FixtureUnreadable,
                                          fmt::format("{}: {}", dir.string(), ec.message())));
    }
    std::ranges::sort(cases, {}, &CaseSpec::name);
    spdlog::debug("discovered {} cases in {}", cases.size(), dir.string());
    return cases;
}

}  // namespace parity::harness
