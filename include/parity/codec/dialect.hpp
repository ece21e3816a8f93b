#pragma once

#include <cstdint>
#include <filesystem>
#include <string_view>

namespace parity::codec {

enum class Format : std::uint8_t {
    AnnotatedCsv,
    Json,
};

/// Annotation rows written by the annotated-text encoder.
struct Annotations {
    bool datatype = true;
    bool group = true;
    bool defaults = true;
};

/// Output encoding selector. Affects serialization only, never logical content.
struct Dialect {
    Format format = Format::AnnotatedCsv;
    Annotations annotations;
    // JSON only: write each result as its own newline-terminated document.
    bool ndjson = false;

    [[nodiscard]] static auto csv() -> Dialect { return Dialect{}; }
    [[nodiscard]] static auto json(bool ndjson = false) -> Dialect {
        return Dialect{.format = Format::Json, .annotations = {}, .ndjson = ndjson};
    }
};

[[nodiscard]] auto format_name(Format format) -> std::string_view;

/// `.json` and `.ndjson` map to Json, everything else to AnnotatedCsv.
[[nodiscard]] auto format_for_path(const std::filesystem::path& path) -> Format;

}  // namespace parity::codec
