#include <parity/codec/csv_record_reader.hpp>

#include <fmt/core.h>

namespace parity::codec {

auto CsvRecordReader::fill() -> Expected<bool> {
    if (eof_) {
        return false;
    }
    constexpr std::size_t kChunk = 16 * 1024;
    if (pos_ > 0) {
        buffer_.erase(0, pos_);
        pos_ = 0;
    }
    std::size_t old = buffer_.size();
    buffer_.resize(old + kChunk);
    auto n = source_.read(buffer_.data() + old, kChunk);
    if (!n.has_value()) {
        buffer_.resize(old);
        return std::unexpected(std::move(n.error()));
    }
    buffer_.resize(old + *n);
    if (*n == 0) {
        eof_ = true;
        return false;
    }
    return true;
}

auto CsvRecordReader::next() -> Expected<std::optional<CsvRecord>> {
    if (pos_ >= buffer_.size()) {
        auto more = fill();
        if (!more.has_value()) {
            return std::unexpected(std::move(more.error()));
        }
        if (!*more) {
            return std::optional<CsvRecord>{};
        }
    }

    CsvRecord record;
    record.line = line_;
    std::string field;
    bool quoted = false;
    bool in_quotes = false;
    // Set once a quoted field's closing quote has been read.
    bool closed = false;

    const auto finish_field = [&]() {
        record.fields.push_back(std::move(field));
        record.quoted.push_back(quoted);
        field.clear();
        quoted = false;
        closed = false;
    };
    const auto peek = [&]() -> Expected<std::optional<char>> {
        if (pos_ >= buffer_.size()) {
            auto more = fill();
            if (!more.has_value()) {
                return std::unexpected(std::move(more.error()));
            }
        }
        if (pos_ < buffer_.size()) {
            return buffer_[pos_];
        }
        return std::nullopt;
    };

    while (true) {
        if (pos_ >= buffer_.size()) {
            auto more = fill();
            if (!more.has_value()) {
                return std::unexpected(std::move(more.error()));
            }
            if (!*more) {
                if (in_quotes) {
                    return std::unexpected(make_error(ErrorKind::Decode,
                                                      "unterminated quoted field", record.line));
                }
                finish_field();
                return std::optional<CsvRecord>{std::move(record)};
            }
        }
        char ch = buffer_[pos_++];
        if (in_quotes) {
            if (ch == '"') {
                auto following = peek();
                if (!following.has_value()) {
                    return std::unexpected(std::move(following.error()));
                }
                if (*following == '"') {
                    field.push_back('"');
                    ++pos_;
                } else {
                    in_quotes = false;
                    closed = true;
                }
                continue;
            }
            if (ch == '\n') {
                ++line_;
            }
            field.push_back(ch);
            continue;
        }
        if (closed && ch != ',' && ch != '\r' && ch != '\n') {
            return std::unexpected(make_error(
                ErrorKind::Decode,
                fmt::format("text after closing quote in field {}", record.fields.size() + 1),
                line_));
        }
        switch (ch) {
            case ',':
                finish_field();
                break;
            case '"':
                if (!field.empty() || quoted) {
                    return std::unexpected(make_error(
                        ErrorKind::Decode,
                        fmt::format("unexpected quote in field {}", record.fields.size() + 1),
                        line_));
                }
                quoted = true;
                in_quotes = true;
                break;
            case '\r': {
                // Only a line ending drops the carriage return.
                auto following = peek();
                if (!following.has_value()) {
                    return std::unexpected(std::move(following.error()));
                }
                if (following->has_value() && **following != '\n') {
                    if (closed) {
                        return std::unexpected(make_error(
                            ErrorKind::Decode,
                            fmt::format("text after closing quote in field {}",
                                        record.fields.size() + 1),
                            line_));
                    }
                    field.push_back(ch);
                }
                break;
            }
            case '\n':
                ++line_;
                finish_field();
                return std::optional<CsvRecord>{std::move(record)};
            default:
                field.push_back(ch);
                break;
        }
    }
}

}  // namespace parity::codec
