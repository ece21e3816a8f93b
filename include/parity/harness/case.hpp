#pragma once

#include <parity/codec/dialect.hpp>
#include <parity/core/error.hpp>

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace parity::harness {

enum class Language : std::uint8_t {
    Native,  // pipeline language, `.pql`
    Legacy,  // SELECT statements, `.lql`
};

enum class Mode : std::uint8_t {
    Decoded,  // decode both sides and compare tables
    RawText,  // compare trimmed bytes
};

/// One golden case: run `query` (reading `input` when set) and check the
/// output, encoded in `dialect`, against `expected`.
struct CaseSpec {
    std::string name;
    // Fixture file name without extensions, shared by every variant of the case.
    std::string stem;
    Language language = Language::Native;
    std::filesystem::path query;
    std::optional<std::filesystem::path> input;
    std::filesystem::path expected;
    codec::Dialect dialect;
    Mode mode = Mode::Decoded;
};

enum class Status : std::uint8_t {
    Pass,
    Fail,
    Skip,
};

struct CaseOutcome {
    std::string name;
    Status status = Status::Pass;
    // Failure detail or skip reason.
    std::string detail;
};

[[nodiscard]] auto status_name(Status status) -> std::string_view;
[[nodiscard]] auto language_name(Language language) -> std::string_view;

/// Enumerate the golden cases under `dir`, sorted by name:
///   `<stem>.pql`  native case, expected `<stem>.out.csv`
///   `<stem>.lql`  legacy case, expected `<stem>.out.csv`, plus a JSON
///                 case (`<stem>.lql.json`) expected `<stem>.out.json`
///   `<stem>.out.txt` adds a raw-text case for the native query.
/// Input is `<stem>.in.csv`, or `<stem>.in.json` when only that exists.
[[nodiscard]] auto discover_cases(const std::filesystem::path& dir)
    -> Expected<std::vector<CaseSpec>>;

}  // namespace parity::harness
