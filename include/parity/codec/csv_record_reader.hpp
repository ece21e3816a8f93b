#pragma once

#include <parity/core/error.hpp>
#include <parity/io/byte_source.hpp>

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace parity::codec {

/// One delimited record. `line` is the physical line the record starts on.
struct CsvRecord {
    std::vector<std::string> fields;
    // Parallel to `fields`: whether the field was written in quotes.
    std::vector<bool> quoted;
    std::size_t line = 0;

    /// A record produced by an empty physical line.
    [[nodiscard]] auto blank() const noexcept -> bool {
        return fields.size() == 1 && fields.front().empty() && !quoted.front();
    }
};

/// Incremental RFC 4180 record reader over a ByteSource.
///
/// Holds at most one read buffer plus the record being assembled, so input
/// of any size is processed in bounded memory. Quoted fields may span lines;
/// both LF and CRLF terminate records.
class CsvRecordReader {
   public:
    explicit CsvRecordReader(io::ByteSource& source) : source_(source) {}

    /// Next record; std::nullopt at end of input.
    [[nodiscard]] auto next() -> Expected<std::optional<CsvRecord>>;

   private:
    [[nodiscard]] auto fill() -> Expected<bool>;

    io::ByteSource& source_;
    std::string buffer_;
    std::size_t pos_ = 0;
    std::size_t line_ = 1;
    bool eof_ = false;
};

}  // namespace parity::codec
