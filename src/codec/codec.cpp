#include <parity/codec/annotated_csv.hpp>
#include <parity/codec/codec.hpp>
#include <parity/codec/json.hpp>

#include <fmt/core.h>

namespace parity::codec {

auto format_name(Format format) -> std::string_view {
    switch (format) {
        case Format::AnnotatedCsv:
            return "annotated csv";
        case Format::Json:
            return "json";
    }
    return "unknown";
}

auto format_for_path(const std::filesystem::path& path) -> Format {
    auto ext = path.extension().string();
    if (ext == ".json" || ext == ".ndjson") {
        return Format::Json;
    }
    return Format::AnnotatedCsv;
}

auto make_decoder(Format format) -> std::unique_ptr<ResultDecoder> {
    switch (format) {
        case Format::Json:
            return std::make_unique<JsonDecoder>();
        case Format::AnnotatedCsv:
            break;
    }
    return std::make_unique<AnnotatedCsvDecoder>();
}

auto make_encoder(const Dialect& dialect) -> std::unique_ptr<ResultEncoder> {
    switch (dialect.format) {
        case Format::Json:
            return std::make_unique<JsonEncoder>(dialect.ndjson);
        case Format::AnnotatedCsv:
            break;
    }
    return std::make_unique<AnnotatedCsvEncoder>(dialect.annotations);
}

auto decode_file(const std::filesystem::path& path) -> Expected<table::ResultStream> {
    return decode_file(path, format_for_path(path));
}

auto decode_file(const std::filesystem::path& path, Format format)
    -> Expected<table::ResultStream> {
    auto source = io::open_file(path);
    if (!source.has_value()) {
        return std::unexpected(std::move(source.error()));
    }
    auto stream = make_decoder(format)->decode(std::move(*source));
    if (!stream.has_value()) {
        Error error = std::move(stream.error());
        error.message = fmt::format("{}: {}", path.filename().string(), error.message);
        return std::unexpected(std::move(error));
    }
    return stream;
}

}  // namespace parity::codec
