#include <parity/codec/json.hpp>

#include <fmt/core.h>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <charconv>
#include <cmath>
#include <deque>
#include <istream>
#include <limits>
#include <type_traits>
#include <unordered_set>

namespace parity::codec {

namespace {

using nlohmann::json;
using nlohmann::ordered_json;

constexpr std::string_view kMeasurement = "_measurement";
constexpr std::string_view kTime = "_time";
constexpr std::string_view kWireTime = "time";

auto decode_error(std::string message) -> std::unexpected<Error> {
    return std::unexpected(make_error(ErrorKind::Decode, std::move(message)));
}

struct Seen {
    bool integer = false;
    bool negative = false;
    bool above_int64 = false;
    bool floating = false;
    bool string = false;
    bool boolean = false;
};

auto infer_type(const Seen& seen, const std::string& column) -> Expected<DataType> {
    bool number = seen.integer || seen.floating;
    int kinds = static_cast<int>(number) + static_cast<int>(seen.string) +
                static_cast<int>(seen.boolean);
    if (kinds > 1) {
        return decode_error(fmt::format("column '{}' mixes value types", column));
    }
    if (seen.string || kinds == 0) {
        return DataType::String;
    }
    if (seen.boolean) {
        return DataType::Bool;
    }
    if (seen.floating || (seen.above_int64 && seen.negative)) {
        return DataType::Float;
    }
    if (seen.above_int64) {
        return DataType::UInt;
    }
    return DataType::Int;
}

auto cell_to_value(const json& cell, DataType type) -> Value {
    if (cell.is_null()) {
        return Value{};
    }
    switch (type) {
        case DataType::String:
            return Value{cell.get<std::string>()};
        case DataType::Bool:
            return Value{cell.get<bool>()};
        case DataType::Float:
            return Value{cell.get<double>()};
        case DataType::UInt:
            return Value{cell.get<std::uint64_t>()};
        case DataType::Int:
            return Value{cell.get<std::int64_t>()};
        case DataType::Time:
        case DataType::Duration:
            break;
    }
    return Value{};
}

auto time_value(const json& cell, std::size_t row) -> Expected<Value> {
    if (cell.is_null()) {
        return Value{};
    }
    if (cell.is_string()) {
        auto ts = parse_rfc3339(cell.get_ref<const std::string&>());
        if (!ts.has_value()) {
            return decode_error(fmt::format("row {}: invalid time '{}'", row,
                                            cell.get_ref<const std::string&>()));
        }
        return Value{*ts};
    }
    if (cell.is_number_integer()) {
        return Value{Timestamp{cell.get<std::int64_t>()}};
    }
    return decode_error(fmt::format("row {}: time must be a string or an integer", row));
}

auto decode_series(const json& series) -> Expected<table::Table> {
    if (!series.is_object()) {
        return decode_error("series must be an object");
    }
    table::Table out;
    std::unordered_set<std::string> names;
    std::vector<table::KeyEntry> key;

    if (auto it = series.find("name"); it != series.end()) {
        if (!it->is_string()) {
            return decode_error("series name must be a string");
        }
        key.push_back(table::KeyEntry{
            .meta = {.name = std::string(kMeasurement), .type = DataType::String},
            .value = Value{it->get<std::string>()},
        });
    }
    if (auto it = series.find("tags"); it != series.end() && !it->is_null()) {
        if (!it->is_object()) {
            return decode_error("series tags must be an object");
        }
        for (const auto& [tag, value] : it->items()) {
            key.push_back(table::KeyEntry{
                .meta = {.name = tag, .type = DataType::String},
                .value = Value{value.is_string() ? value.get<std::string>() : value.dump()},
            });
        }
    }

    const json empty = json::array();
    const json* columns = &empty;
    const json* values = &empty;
    if (auto it = series.find("columns"); it != series.end()) {
        if (!it->is_array()) {
            return decode_error("series columns must be an array");
        }
        columns = &*it;
    }
    if (auto it = series.find("values"); it != series.end() && !it->is_null()) {
        if (!it->is_array()) {
            return decode_error("series values must be an array");
        }
        values = &*it;
    }
    const std::size_t rows = values->size();
    for (std::size_t row = 0; row < rows; ++row) {
        const json& cells = (*values)[row];
        if (!cells.is_array() || cells.size() != columns->size()) {
            return decode_error(fmt::format("series row {} has {} values, expected {}", row,
                                            cells.is_array() ? cells.size() : 0,
                                            columns->size()));
        }
    }

    for (const auto& entry : key) {
        if (!names.insert(entry.meta.name).second) {
            return decode_error(fmt::format("duplicate column '{}'", entry.meta.name));
        }
        const auto& text = std::get<std::string>(entry.value);
        out.add_column(entry.meta.name, Column<std::string>(std::vector<std::string>(rows, text)));
    }
    out.key = table::GroupKey(std::move(key));

    for (std::size_t col = 0; col < columns->size(); ++col) {
        const json& column_name = (*columns)[col];
        if (!column_name.is_string()) {
            return decode_error(fmt::format("series column {} name must be a string", col));
        }
        std::string name = column_name.get<std::string>();
        const bool is_time = name == kWireTime;
        if (is_time) {
            name = std::string(kTime);
        }
        if (!names.insert(name).second) {
            return decode_error(fmt::format("duplicate column '{}'", name));
        }

        DataType type = DataType::Time;
        if (!is_time) {
            Seen seen;
            for (std::size_t row = 0; row < rows; ++row) {
                const json& cell = (*values)[row][col];
                switch (cell.type()) {
                    case json::value_t::null:
                        break;
                    case json::value_t::number_integer:
                        seen.integer = true;
                        seen.negative = seen.negative || cell.get<std::int64_t>() < 0;
                        break;
                    case json::value_t::number_unsigned:
                        seen.integer = true;
                        seen.above_int64 =
                            seen.above_int64 ||
                            cell.get<std::uint64_t>() >
                                static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max());
                        break;
                    case json::value_t::number_float:
                        seen.floating = true;
                        break;
                    case json::value_t::string:
                        seen.string = true;
                        break;
                    case json::value_t::boolean:
                        seen.boolean = true;
                        break;
                    default:
                        return decode_error(fmt::format(
                            "column '{}' row {}: unsupported value {}", name, row, cell.dump()));
                }
            }
            auto inferred = infer_type(seen, name);
            if (!inferred.has_value()) {
                return std::unexpected(std::move(inferred.error()));
            }
            type = *inferred;
        }

        table::ColumnEntry entry{.meta = {.name = name, .type = type},
                                 .data = table::make_column(type),
                                 .validity = std::nullopt};
        for (std::size_t row = 0; row < rows; ++row) {
            const json& cell = (*values)[row][col];
            Value value;
            if (is_time) {
                auto ts = time_value(cell, row);
                if (!ts.has_value()) {
                    return std::unexpected(std::move(ts.error()));
                }
                value = std::move(*ts);
            } else {
                value = cell_to_value(cell, type);
            }
            if (!table::append_value(entry, value)) {
                return decode_error(fmt::format("column '{}' row {}: type mismatch", name, row));
            }
        }
        if (entry.validity.has_value()) {
            out.add_column(name, std::move(entry.data), std::move(*entry.validity));
        } else {
            out.add_column(name, std::move(entry.data));
        }
    }
    return out;
}

class JsonReader final : public table::TableReader {
   public:
    explicit JsonReader(io::ByteSourcePtr source)
        : source_(std::move(source)), buffer_(*source_), in_(&buffer_) {}

    auto read() -> Expected<std::optional<table::NamedTable>> override {
        while (frames_.empty()) {
            if (done_) {
                return std::optional<table::NamedTable>{};
            }
            if (auto ok = next_document(); !ok.has_value()) {
                return std::unexpected(std::move(ok.error()));
            }
        }
        table::NamedTable out = std::move(frames_.front());
        frames_.pop_front();
        return std::optional<table::NamedTable>{std::move(out)};
    }

    void close() override {
        if (closed_) {
            return;
        }
        closed_ = true;
        source_->close();
    }

   private:
    auto next_document() -> Expected<void> {
        in_ >> std::ws;
        if (buffer_.error().has_value()) {
            return std::unexpected(*buffer_.error());
        }
        if (in_.peek() == std::char_traits<char>::eof()) {
            done_ = true;
            return {};
        }
        json document;
        try {
            in_ >> document;
        } catch (const json::exception& e) {
            if (buffer_.error().has_value()) {
                return std::unexpected(*buffer_.error());
            }
            return decode_error(fmt::format("document {}: {}", documents_ + 1, e.what()));
        }
        documents_ += 1;

        if (document.is_object() && document.contains("results")) {
            const json& results = document["results"];
            if (!results.is_array()) {
                return decode_error(
                    fmt::format("document {}: 'results' must be an array", documents_));
            }
            for (const auto& result : results) {
                if (auto ok = decode_result(result); !ok.has_value()) {
                    return ok;
                }
            }
            return {};
        }
        if (document.is_array()) {
            for (const auto& result : document) {
                if (auto ok = decode_result(result); !ok.has_value()) {
                    return ok;
                }
            }
            return {};
        }
        if (document.is_object()) {
            return decode_result(document);
        }
        return decode_error(fmt::format("document {}: expected an object or an array", documents_));
    }

    auto decode_result(const json& result) -> Expected<void> {
        std::size_t ordinal = results_++;
        if (!result.is_object()) {
            return decode_error(fmt::format("result {} must be an object", ordinal));
        }
        std::string name = std::to_string(ordinal);
        if (auto it = result.find("statement_id"); it != result.end()) {
            if (it->is_number_integer()) {
                name = it->dump();
            } else if (it->is_string()) {
                name = it->get<std::string>();
            } else {
                return decode_error(fmt::format("result {}: invalid statement_id", ordinal));
            }
        }
        if (auto it = result.find("error"); it != result.end() && !it->is_null()) {
            return decode_error(fmt::format("result {}: {}", name,
                                            it->is_string() ? it->get<std::string>() : it->dump()));
        }
        auto it = result.find("series");
        if (it == result.end() || it->is_null()) {
            return {};
        }
        if (!it->is_array()) {
            return decode_error(fmt::format("result {}: 'series' must be an array", name));
        }
        for (const auto& series : *it) {
            auto decoded = decode_series(series);
            if (!decoded.has_value()) {
                Error error = std::move(decoded.error());
                error.message = fmt::format("result {}: {}", name, error.message);
                return std::unexpected(std::move(error));
            }
            spdlog::debug("json: result '{}' series ({} rows)", name, decoded->rows());
            frames_.push_back(table::NamedTable{.result = name, .table = std::move(*decoded)});
        }
        return {};
    }

    io::ByteSourcePtr source_;
    io::SourceStreamBuf buffer_;
    std::istream in_;
    std::deque<table::NamedTable> frames_;
    std::size_t documents_ = 0;
    std::size_t results_ = 0;
    bool done_ = false;
    bool closed_ = false;
};

auto cell_json(const Value& value) -> ordered_json {
    return std::visit(
        [](const auto& v) -> ordered_json {
            using T = std::decay_t<decltype(v)>;
            if constexpr (std::is_same_v<T, std::monostate>) {
                return nullptr;
            } else if constexpr (std::is_same_v<T, double>) {
                if (!std::isfinite(v)) {
                    return nullptr;
                }
                return v;
            } else if constexpr (std::is_same_v<T, Timestamp>) {
                return format_rfc3339(v);
            } else if constexpr (std::is_same_v<T, Duration>) {
                return format_duration(v);
            } else {
                return v;
            }
        },
        value);
}

auto encode_series(const table::Table& table) -> ordered_json {
    ordered_json series = ordered_json::object();
    ordered_json tags = ordered_json::object();
    for (const auto& entry : table.key.sorted()) {
        if (entry.meta.name == kMeasurement && entry.meta.type == DataType::String &&
            !is_null(entry.value)) {
            series["name"] = std::get<std::string>(entry.value);
        } else {
            tags[entry.meta.name] = format_value(entry.value);
        }
    }
    if (!tags.empty()) {
        series["tags"] = std::move(tags);
    }
    std::vector<std::size_t> fields;
    ordered_json columns = ordered_json::array();
    for (std::size_t col = 0; col < table.columns.size(); ++col) {
        const auto& meta = table.columns[col].meta;
        if (table.key.contains(meta.name)) {
            continue;
        }
        fields.push_back(col);
        columns.push_back(meta.name == kTime && meta.type == DataType::Time
                              ? std::string(kWireTime)
                              : meta.name);
    }
    series["columns"] = std::move(columns);
    ordered_json values = ordered_json::array();
    for (std::size_t row = 0; row < table.rows(); ++row) {
        ordered_json cells = ordered_json::array();
        for (auto col : fields) {
            cells.push_back(cell_json(table.value_at(col, row)));
        }
        values.push_back(std::move(cells));
    }
    series["values"] = std::move(values);
    return series;
}

auto statement_id(const std::string& name, std::int64_t ordinal) -> std::int64_t {
    std::int64_t id = 0;
    auto [ptr, ec] = std::from_chars(name.data(), name.data() + name.size(), id);
    if (ec == std::errc() && ptr == name.data() + name.size()) {
        return id;
    }
    return ordinal;
}

}  // namespace

auto JsonDecoder::decode(io::ByteSourcePtr source) const -> Expected<table::ResultStream> {
    return table::ResultStream::open(std::make_unique<JsonReader>(std::move(source)));
}

auto JsonEncoder::encode(table::ResultStream& stream, std::ostream& out) const
    -> Expected<std::int64_t> {
    std::int64_t rows = 0;
    std::int64_t ordinal = 0;
    bool first = true;
    if (!ndjson_) {
        out << "{\"results\":[";
    }
    while (true) {
        auto result = stream.next();
        if (!result.has_value()) {
            stream.release();
            return std::unexpected(std::move(result.error()));
        }
        if (!result->has_value()) {
            break;
        }
        ordered_json document = ordered_json::object();
        document["statement_id"] = statement_id((*result)->name(), ordinal);
        ordered_json series = ordered_json::array();
        while (true) {
            auto next = (*result)->next();
            if (!next.has_value()) {
                stream.release();
                return std::unexpected(std::move(next.error()));
            }
            if (!next->has_value()) {
                break;
            }
            if ((*next)->rows() == 0) {
                continue;
            }
            rows += static_cast<std::int64_t>((*next)->rows());
            series.push_back(encode_series(**next));
        }
        if (!series.empty()) {
            document["series"] = std::move(series);
        }
        ordinal += 1;
        if (ndjson_) {
            out << "{\"results\":[" << document.dump() << "]}\n";
        } else {
            if (!first) {
                out << ',';
            }
            out << document.dump();
        }
        first = false;
    }
    if (!ndjson_) {
        out << "]}\n";
    }
    stream.release();
    if (!out) {
        return std::unexpected(make_error(ErrorKind::Execution, "failed writing json"));
    }
    return rows;
}

}  // namespace parity::codec
