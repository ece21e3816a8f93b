#pragma once

#include <parity/core/error.hpp>

#include <cstddef>
#include <filesystem>
#include <fstream>
#include <memory>
#include <optional>
#include <streambuf>
#include <string>

namespace parity::io {

/// Forward-only source of bytes backing a decoder (file handle, response body, ...).
///
/// The owner calls close() exactly once when it is done with the source,
/// whether it read everything or stopped early.
class ByteSource {
   public:
    virtual ~ByteSource() = default;

    /// Read up to `size` bytes into `buffer`. Returns 0 at end of input.
    [[nodiscard]] virtual auto read(char* buffer, std::size_t size) -> Expected<std::size_t> = 0;

    /// Release the underlying resource.
    virtual void close() = 0;
};

using ByteSourcePtr = std::unique_ptr<ByteSource>;

class FileSource final : public ByteSource {
   public:
    FileSource(std::filesystem::path path, std::ifstream stream)
        : path_(std::move(path)), stream_(std::move(stream)) {}

    [[nodiscard]] auto read(char* buffer, std::size_t size) -> Expected<std::size_t> override;
    void close() override;

    [[nodiscard]] auto path() const noexcept -> const std::filesystem::path& { return path_; }

   private:
    std::filesystem::path path_;
    std::ifstream stream_;
};

class StringSource final : public ByteSource {
   public:
    explicit StringSource(std::string data) : data_(std::move(data)) {}

    [[nodiscard]] auto read(char* buffer, std::size_t size) -> Expected<std::size_t> override;
    void close() override;

   private:
    std::string data_;
    std::size_t offset_ = 0;
    bool closed_ = false;
};

/// Open a file for streaming. FixtureMissing when the path does not exist,
/// FixtureUnreadable when it exists but cannot be opened.
[[nodiscard]] auto open_file(const std::filesystem::path& path) -> Expected<ByteSourcePtr>;

[[nodiscard]] auto from_string(std::string data) -> ByteSourcePtr;

/// Read the remainder of a source into a string. Does not close the source.
[[nodiscard]] auto read_all(ByteSource& source) -> Expected<std::string>;

/// Read a whole file (used for query text and raw-text fixtures).
[[nodiscard]] auto read_file(const std::filesystem::path& path) -> Expected<std::string>;

/// std::streambuf over a ByteSource, so stream-based parsers can pull
/// bytes on demand. A read failure ends the stream and is kept in error().
class SourceStreamBuf final : public std::streambuf {
   public:
    explicit SourceStreamBuf(ByteSource& source) : source_(source) {}

    [[nodiscard]] auto error() const noexcept -> const std::optional<Error>& { return error_; }

   protected:
    auto underflow() -> int_type override;

   private:
    static constexpr std::size_t kBufferSize = 16 * 1024;

    ByteSource& source_;
    char buffer_[kBufferSize];
    std::optional<Error> error_;
};

}  // namespace parity::io
