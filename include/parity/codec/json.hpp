#pragma once

#include <parity/codec/codec.hpp>

namespace parity::codec {

/// Decodes `{"results":[...]}` envelopes, bare result arrays or bare result
/// objects. The payload may hold several whitespace-separated documents;
/// they are parsed one at a time as the stream is consumed.
class JsonDecoder final : public ResultDecoder {
   public:
    [[nodiscard]] auto decode(io::ByteSourcePtr source) const
        -> Expected<table::ResultStream> override;
};

class JsonEncoder final : public ResultEncoder {
   public:
    explicit JsonEncoder(bool ndjson = false) : ndjson_(ndjson) {}

    [[nodiscard]] auto encode(table::ResultStream& stream, std::ostream& out) const
        -> Expected<std::int64_t> override;

   private:
    bool ndjson_;
};

}  // namespace parity::codec
