#pragma once

#include <parity/codec/codec.hpp>
#include <parity/core/value.hpp>

#include <optional>
#include <string_view>

namespace parity::codec {

/// `#datatype` token for a column type (`long`, `dateTime:RFC3339`, ...).
[[nodiscard]] auto datatype_token(DataType type) -> std::string_view;

/// Column type for a `#datatype` token; std::nullopt for unknown tokens.
[[nodiscard]] auto parse_datatype_token(std::string_view token) -> std::optional<DataType>;

class AnnotatedCsvDecoder final : public ResultDecoder {
   public:
    [[nodiscard]] auto decode(io::ByteSourcePtr source) const
        -> Expected<table::ResultStream> override;
};

class AnnotatedCsvEncoder final : public ResultEncoder {
   public:
    explicit AnnotatedCsvEncoder(Annotations annotations = {}) : annotations_(annotations) {}

    [[nodiscard]] auto encode(table::ResultStream& stream, std::ostream& out) const
        -> Expected<std::int64_t> override;

   private:
    Annotations annotations_;
};

}  // namespace parity::codec
