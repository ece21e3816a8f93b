#pragma once

#include <parity/codec/dialect.hpp>
#include <parity/core/error.hpp>
#include <parity/io/byte_source.hpp>
#include <parity/table/result_stream.hpp>

#include <cstdint>
#include <filesystem>
#include <memory>
#include <ostream>

namespace parity::codec {

/// Turns a byte stream into a lazy ResultStream.
///
/// The returned stream owns the source and closes it exactly once. When
/// decoding fails before the first table is produced no stream is returned
/// and the source has already been closed.
class ResultDecoder {
   public:
    virtual ~ResultDecoder() = default;

    [[nodiscard]] virtual auto decode(io::ByteSourcePtr source) const
        -> Expected<table::ResultStream> = 0;
};

/// Writes a ResultStream to a sink, table by table, as it is consumed.
class ResultEncoder {
   public:
    virtual ~ResultEncoder() = default;

    /// Returns the number of rows written. The stream is drained and released.
    [[nodiscard]] virtual auto encode(table::ResultStream& stream, std::ostream& out) const
        -> Expected<std::int64_t> = 0;
};

[[nodiscard]] auto make_decoder(Format format) -> std::unique_ptr<ResultDecoder>;
[[nodiscard]] auto make_encoder(const Dialect& dialect) -> std::unique_ptr<ResultEncoder>;

/// Decode a fixture file, choosing the format from its extension.
[[nodiscard]] auto decode_file(const std::filesystem::path& path) -> Expected<table::ResultStream>;
[[nodiscard]] auto decode_file(const std::filesystem::path& path, Format format)
    -> Expected<table::ResultStream>;

}  // namespace parity::codec
