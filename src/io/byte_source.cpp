#include <parity/io/byte_source.hpp>

#include <fmt/core.h>

#include <algorithm>
#include <cstring>
#include <system_error>

namespace parity::io {

auto FileSource::read(char* buffer, std::size_t size) -> Expected<std::size_t> {
    if (!stream_.is_open()) {
        return 0;
    }
    stream_.read(buffer, static_cast<std::streamsize>(size));
    if (stream_.bad()) {
        return std::unexpected(make_error(ErrorKind::FixtureUnreadable,
                                          fmt::format("failed reading '{}'", path_.string())));
    }
    return static_cast<std::size_t>(stream_.gcount());
}

void FileSource::close() {
    if (stream_.is_open()) {
        stream_.close();
    }
}

auto StringSource::read(char* buffer, std::size_t size) -> Expected<std::size_t> {
    if (closed_) {
        return 0;
    }
    std::size_t n = std::min(size, data_.size() - offset_);
    std::memcpy(buffer, data_.data() + offset_, n);
    offset_ += n;
    return n;
}

void StringSource::close() {
    closed_ = true;
    data_.clear();
    offset_ = 0;
}

auto open_file(const std::filesystem::path& path) -> Expected<ByteSourcePtr> {
    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) {
        return std::unexpected(
            make_error(ErrorKind::FixtureMissing, fmt::format("'{}' does not exist", path.string())));
    }
    if (std::filesystem::is_directory(path, ec)) {
        return std::unexpected(make_error(ErrorKind::FixtureUnreadable,
                                          fmt::format("'{}' is a directory", path.string())));
    }
    std::ifstream stream(path, std::ios::binary);
    if (!stream.is_open()) {
        return std::unexpected(make_error(ErrorKind::FixtureUnreadable,
                                          fmt::format("failed to open '{}'", path.string())));
    }
    return std::make_unique<FileSource>(path, std::move(stream));
}

auto from_string(std::string data) -> ByteSourcePtr {
    return std::make_unique<StringSource>(std::move(data));
}

auto read_all(ByteSource& source) -> Expected<std::string> {
    std::string out;
    char buffer[8192];
    while (true) {
        auto n = source.read(buffer, sizeof(buffer));
        if (!n.has_value()) {
            return std::unexpected(std::move(n.error()));
        }
        if (*n == 0) {
            break;
        }
        out.append(buffer, *n);
    }
    return out;
}

auto read_file(const std::filesystem::path& path) -> Expected<std::string> {
    auto source = open_file(path);
    if (!source.has_value()) {
        return std::unexpected(std::move(source.error()));
    }
    auto text = read_all(**source);
    (*source)->close();
    return text;
}

auto SourceStreamBuf::underflow() -> int_type {
    if (gptr() < egptr()) {
        return traits_type::to_int_type(*gptr());
    }
    if (error_.has_value()) {
        return traits_type::eof();
    }
    auto n = source_.read(buffer_, kBufferSize);
    if (!n.has_value()) {
        error_ = std::move(n.error());
        return traits_type::eof();
    }
    if (*n == 0) {
        return traits_type::eof();
    }
    setg(buffer_, buffer_, buffer_ + *n);
    return traits_type::to_int_type(*gptr());
}

}  // namespace parity::io
