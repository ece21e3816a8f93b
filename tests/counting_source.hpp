#pragma once

#include <parity/io/byte_source.hpp>

#include <algorithm>
#include <cstring>
#include <memory>
#include <string>

namespace parity::testing {

struct SourceStats {
    int closes = 0;
    std::size_t bytes_read = 0;
};

/// In-memory byte source that records how it was used. Reads after close()
/// fail, so a consumer that touches a released source is caught.
class CountingSource final : public io::ByteSource {
   public:
    CountingSource(std::string data, std::shared_ptr<SourceStats> stats, std::size_t chunk = 7)
        : data_(std::move(data)), stats_(std::move(stats)), chunk_(chunk) {}

    auto read(char* buffer, std::size_t size) -> Expected<std::size_t> override {
        if (stats_->closes > 0) {
            return std::unexpected(make_error(ErrorKind::FixtureUnreadable, "read after close"));
        }
        std::size_t n = std::min({size, chunk_, data_.size() - offset_});
        std::memcpy(buffer, data_.data() + offset_, n);
        offset_ += n;
        stats_->bytes_read += n;
        return n;
    }

    void close() override { stats_->closes += 1; }

   private:
    std::string data_;
    std::shared_ptr<SourceStats> stats_;
    std::size_t chunk_;
    std::size_t offset_ = 0;
};

inline auto counting_source(std::string data, std::shared_ptr<SourceStats> stats)
    -> io::ByteSourcePtr {
    return std::make_unique<CountingSource>(std::move(data), std::move(stats));
}

}  // namespace parity::testing
