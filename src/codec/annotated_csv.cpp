#include <parity/codec/annotated_csv.hpp>
#include <parity/codec/csv_record_reader.hpp>

#include <fmt/core.h>
#include <spdlog/spdlog.h>

#include <string>
#include <unordered_set>
#include <utility>
#include <vector>

namespace parity::codec {

namespace {

constexpr std::string_view kDefaultResult = "_result";
constexpr std::string_view kResultColumn = "result";
constexpr std::string_view kTableColumn = "table";

struct PendingAnnotations {
    std::optional<CsvRecord> datatype;
    std::optional<CsvRecord> group;
    std::optional<CsvRecord> defaults;

    [[nodiscard]] auto empty() const -> bool {
        return !datatype.has_value() && !group.has_value() && !defaults.has_value();
    }
};

struct DataColumn {
    std::size_t field = 0;
    table::ColumnMeta meta;
    bool group = false;
    std::string default_text;
};

struct BlockSchema {
    std::size_t width = 0;
    std::vector<DataColumn> columns;
    std::optional<std::size_t> result_field;
    std::optional<std::string> result_default;
    std::optional<std::size_t> table_field;
    std::string table_default;
    std::size_t defaults_line = 0;
    bool error_table = false;
    bool header_only = true;
};

struct OpenTable {
    std::string result;
    std::string id;
    table::Table table;
    std::vector<std::size_t> key_columns;
};

class AnnotatedCsvReader final : public table::TableReader {
   public:
    explicit AnnotatedCsvReader(io::ByteSourcePtr source)
        : source_(std::move(source)), records_(*source_) {}

    auto read() -> Expected<std::optional<table::NamedTable>> override {
        while (true) {
            auto next = take();
            if (!next.has_value()) {
                return std::unexpected(std::move(next.error()));
            }
            if (!next->has_value()) {
                if (!schema_.has_value() && !annotations_.empty()) {
                    return std::unexpected(make_error(ErrorKind::Decode,
                                                      "annotation rows without a header row",
                                                      first_annotation_line()));
                }
                if (current_.has_value()) {
                    return flush();
                }
                return close_block();
            }
            CsvRecord& record = **next;

            if (record.blank()) {
                if (current_.has_value()) {
                    schema_.reset();
                    return flush();
                }
                auto empty = close_block();
                if (!empty.has_value() || empty->has_value()) {
                    return empty;
                }
                continue;
            }

            if (!record.fields.front().empty() && record.fields.front().front() == '#') {
                if (current_.has_value()) {
                    lookahead_ = std::move(record);
                    schema_.reset();
                    return flush();
                }
                if (schema_.has_value()) {
                    lookahead_ = std::move(record);
                    auto empty = close_block();
                    if (!empty.has_value() || empty->has_value()) {
                        return empty;
                    }
                    continue;
                }
                if (auto ok = add_annotation(std::move(record)); !ok.has_value()) {
                    return std::unexpected(std::move(ok.error()));
                }
                continue;
            }

            if (!schema_.has_value()) {
                if (auto ok = read_header(record); !ok.has_value()) {
                    return std::unexpected(std::move(ok.error()));
                }
                continue;
            }

            if (record.fields.size() != schema_->width) {
                return std::unexpected(make_error(
                    ErrorKind::Decode,
                    fmt::format("row has {} columns, header declares {}", record.fields.size(),
                                schema_->width),
                    record.line));
            }
            if (schema_->error_table) {
                return std::unexpected(error_from_row(record));
            }

            std::string result = result_name(record);
            std::string id = table_id(record);
            if (current_.has_value() && (current_->result != result || current_->id != id)) {
                lookahead_ = std::move(record);
                return flush();
            }

            std::vector<Value> values;
            values.reserve(schema_->columns.size());
            for (const auto& column : schema_->columns) {
                auto value = cell_value(record, column);
                if (!value.has_value()) {
                    return std::unexpected(std::move(value.error()));
                }
                values.push_back(std::move(*value));
            }

            if (!current_.has_value()) {
                start_table(std::move(result), std::move(id), values);
            } else {
                for (std::size_t i : current_->key_columns) {
                    const auto& name = schema_->columns[i].meta.name;
                    const auto* entry = current_->table.key.find(name);
                    if (entry == nullptr || !values_equal(entry->value, values[i])) {
                        return std::unexpected(make_error(
                            ErrorKind::Decode,
                            fmt::format("group key column '{}' changes value within table {}",
                                        name, current_->id),
                            record.line));
                    }
                }
            }
            if (!current_->table.append_row(values)) {
                return std::unexpected(make_error(ErrorKind::Decode,
                                                  "row does not match the table schema",
                                                  record.line));
            }
        }
    }

    void close() override {
        if (closed_) {
            return;
        }
        closed_ = true;
        source_->close();
    }

   private:
    auto take() -> Expected<std::optional<CsvRecord>> {
        if (lookahead_.has_value()) {
            std::optional<CsvRecord> out = std::move(lookahead_);
            lookahead_.reset();
            return out;
        }
        return records_.next();
    }

    auto flush() -> std::optional<table::NamedTable> {
        if (!current_.has_value()) {
            return std::nullopt;
        }
        spdlog::debug("annotated csv: result '{}' table {} ({} rows)", current_->result,
                      current_->id, current_->table.rows());
        table::NamedTable out{.result = std::move(current_->result),
                              .table = std::move(current_->table)};
        current_.reset();
        return out;
    }

    // A block whose header row is followed by no data rows still describes one
    // table: its result name and group key come from the #default row.
    auto close_block() -> Expected<std::optional<table::NamedTable>> {
        std::optional<BlockSchema> schema = std::move(schema_);
        schema_.reset();
        if (!schema.has_value() || !schema->header_only || schema->error_table) {
            return std::nullopt;
        }
        table::NamedTable out{.result = schema->result_default.value_or(std::string(kDefaultResult)),
                              .table = {}};
        for (const auto& column : schema->columns) {
            out.table.add_column(column.meta);
            if (!column.group) {
                continue;
            }
            Value value;
            if (!column.default_text.empty()) {
                auto parsed = typed_value(column.meta, column.default_text, schema->defaults_line);
                if (!parsed.has_value()) {
                    return std::unexpected(std::move(parsed.error()));
                }
                value = std::move(*parsed);
            }
            out.table.key.add(column.meta, std::move(value));
        }
        spdlog::debug("annotated csv: result '{}' table {} (header only)", out.result,
                      schema->table_default);
        return out;
    }

    [[nodiscard]] auto first_annotation_line() const -> std::size_t {
        for (const auto* row : {&annotations_.datatype, &annotations_.group, &annotations_.defaults}) {
            if (row->has_value()) {
                return (*row)->line;
            }
        }
        return 0;
    }

    auto add_annotation(CsvRecord record) -> Expected<void> {
        const std::string& name = record.fields.front();
        std::optional<CsvRecord>* slot = nullptr;
        if (name == "#datatype") {
            slot = &annotations_.datatype;
        } else if (name == "#group") {
            slot = &annotations_.group;
        } else if (name == "#default") {
            slot = &annotations_.defaults;
        } else {
            return std::unexpected(make_error(
                ErrorKind::Decode, fmt::format("unknown annotation '{}'", name), record.line));
        }
        if (slot->has_value()) {
            return std::unexpected(make_error(
                ErrorKind::Decode, fmt::format("duplicate annotation '{}'", name), record.line));
        }
        *slot = std::move(record);
        return {};
    }

    auto check_width(const std::optional<CsvRecord>& row, std::string_view name,
                     const CsvRecord& header) -> Expected<void> {
        if (row.has_value() && row->fields.size() != header.fields.size()) {
            return std::unexpected(make_error(
                ErrorKind::Decode,
                fmt::format("header has {} columns but {} declares {}", header.fields.size(), name,
                            row->fields.size()),
                header.line));
        }
        return {};
    }

    auto read_header(const CsvRecord& header) -> Expected<void> {
        if (!annotations_.datatype.has_value()) {
            return std::unexpected(make_error(ErrorKind::Decode,
                                              "missing #datatype annotation before header row",
                                              header.line));
        }
        for (auto [row, name] : {std::pair{&annotations_.datatype, "#datatype"},
                                 std::pair{&annotations_.group, "#group"},
                                 std::pair{&annotations_.defaults, "#default"}}) {
            if (auto ok = check_width(*row, name, header); !ok.has_value()) {
                return ok;
            }
        }

        BlockSchema schema;
        schema.width = header.fields.size();
        schema.defaults_line =
            annotations_.defaults.has_value() ? annotations_.defaults->line : header.line;
        std::unordered_set<std::string> seen;
        std::vector<std::string> names;
        const CsvRecord& types = *annotations_.datatype;
        for (std::size_t i = 1; i < header.fields.size(); ++i) {
            const std::string& name = header.fields[i];
            auto type = parse_datatype_token(types.fields[i]);
            if (!type.has_value()) {
                return std::unexpected(make_error(
                    ErrorKind::Decode,
                    fmt::format("unknown datatype '{}' in column {}", types.fields[i], i + 1),
                    types.line));
            }
            bool group = false;
            if (annotations_.group.has_value()) {
                const std::string& flag = annotations_.group->fields[i];
                if (flag == "true") {
                    group = true;
                } else if (flag != "false" && !flag.empty()) {
                    return std::unexpected(make_error(
                        ErrorKind::Decode,
                        fmt::format("invalid #group value '{}' in column {}", flag, i + 1),
                        annotations_.group->line));
                }
                if (group && name.empty()) {
                    return std::unexpected(make_error(
                        ErrorKind::Decode,
                        fmt::format("group key references undeclared column {}", i + 1),
                        annotations_.group->line));
                }
            }
            if (name.empty()) {
                return std::unexpected(make_error(
                    ErrorKind::Decode, fmt::format("column {} has no name", i + 1), header.line));
            }
            if (!seen.insert(name).second) {
                return std::unexpected(make_error(
                    ErrorKind::Decode, fmt::format("duplicate column '{}'", name), header.line));
            }
            std::string default_text;
            if (annotations_.defaults.has_value()) {
                default_text = annotations_.defaults->fields[i];
            }
            names.push_back(name);

            if (name == kResultColumn && *type == DataType::String) {
                schema.result_field = i;
                if (!default_text.empty()) {
                    schema.result_default = default_text;
                }
                continue;
            }
            if (name == kTableColumn && *type == DataType::Int) {
                schema.table_field = i;
                schema.table_default = default_text;
                continue;
            }
            schema.columns.push_back(DataColumn{
                .field = i,
                .meta = table::ColumnMeta{.name = name, .type = *type},
                .group = group,
                .default_text = std::move(default_text),
            });
        }
        schema.error_table = names == std::vector<std::string>{"error", "reference"};

        annotations_ = PendingAnnotations{};
        schema_ = std::move(schema);
        return {};
    }

    auto cell_value(const CsvRecord& record, const DataColumn& column) const -> Expected<Value> {
        std::string_view text = record.fields[column.field];
        if (text.empty() && !record.quoted[column.field]) {
            if (column.default_text.empty()) {
                return Value{};
            }
            text = column.default_text;
        }
        return typed_value(column.meta, text, record.line);
    }

    static auto typed_value(const table::ColumnMeta& meta, std::string_view text,
                            std::size_t line) -> Expected<Value> {
        if (meta.type == DataType::String) {
            return Value{std::string(text)};
        }
        auto value = parse_value(meta.type, text);
        if (!value.has_value()) {
            return std::unexpected(make_error(
                ErrorKind::Decode,
                fmt::format("invalid {} value '{}' in column '{}'", type_name(meta.type), text,
                            meta.name),
                line));
        }
        return std::move(*value);
    }

    [[nodiscard]] auto result_name(const CsvRecord& record) const -> std::string {
        if (schema_->result_field.has_value()) {
            const std::string& text = record.fields[*schema_->result_field];
            if (!text.empty()) {
                return text;
            }
            if (schema_->result_default.has_value()) {
                return *schema_->result_default;
            }
        }
        return std::string(kDefaultResult);
    }

    [[nodiscard]] auto table_id(const CsvRecord& record) const -> std::string {
        if (!schema_->table_field.has_value()) {
            return {};
        }
        const std::string& text = record.fields[*schema_->table_field];
        return text.empty() ? schema_->table_default : text;
    }

    [[nodiscard]] auto error_from_row(const CsvRecord& record) const -> Error {
        const std::string& message = record.fields[schema_->columns[0].field];
        const std::string& reference = record.fields[schema_->columns[1].field];
        if (reference.empty()) {
            return make_error(ErrorKind::Decode, fmt::format("error table: {}", message),
                              record.line);
        }
        return make_error(ErrorKind::Decode,
                          fmt::format("error table: {} (reference {})", message, reference),
                          record.line);
    }

    void start_table(std::string result, std::string id, const std::vector<Value>& values) {
        OpenTable open{.result = std::move(result), .id = std::move(id), .table = {},
                       .key_columns = {}};
        for (std::size_t i = 0; i < schema_->columns.size(); ++i) {
            const auto& column = schema_->columns[i];
            open.table.add_column(column.meta);
            if (column.group) {
                open.table.key.add(column.meta, values[i]);
                open.key_columns.push_back(i);
            }
        }
        current_ = std::move(open);
        schema_->header_only = false;
    }

    io::ByteSourcePtr source_;
    CsvRecordReader records_;
    std::optional<CsvRecord> lookahead_;
    PendingAnnotations annotations_;
    std::optional<BlockSchema> schema_;
    std::optional<OpenTable> current_;
    bool closed_ = false;
};

auto needs_quotes(std::string_view text) -> bool {
    return text.find_first_of(",\"\r\n") != std::string_view::npos;
}

void write_field(std::string& line, std::string_view text, bool quote_empty = false) {
    if ((quote_empty && text.empty()) || needs_quotes(text)) {
        line.push_back('"');
        for (char ch : text) {
            if (ch == '"') {
                line.push_back('"');
            }
            line.push_back(ch);
        }
        line.push_back('"');
        return;
    }
    line.append(text);
}

void write_cell(std::string& line, const table::Table& table, std::size_t column,
                std::size_t row) {
    Value value = table.value_at(column, row);
    if (is_null(value)) {
        return;
    }
    if (const auto* text = std::get_if<std::string>(&value)) {
        write_field(line, *text, true);
        return;
    }
    write_field(line, format_value(value));
}

}  // namespace

auto datatype_token(DataType type) -> std::string_view {
    switch (type) {
        case DataType::String:
            return "string";
        case DataType::Int:
            return "long";
        case DataType::UInt:
            return "unsignedLong";
        case DataType::Float:
            return "double";
        case DataType::Bool:
            return "boolean";
        case DataType::Time:
            return "dateTime:RFC3339";
        case DataType::Duration:
            return "duration";
    }
    return "string";
}

auto parse_datatype_token(std::string_view token) -> std::optional<DataType> {
    if (token == "string") {
        return DataType::String;
    }
    if (token == "long") {
        return DataType::Int;
    }
    if (token == "unsignedLong") {
        return DataType::UInt;
    }
    if (token == "double") {
        return DataType::Float;
    }
    if (token == "boolean") {
        return DataType::Bool;
    }
    if (token == "dateTime" || token == "dateTime:RFC3339" || token == "dateTime:RFC3339Nano") {
        return DataType::Time;
    }
    if (token == "duration") {
        return DataType::Duration;
    }
    return std::nullopt;
}

auto AnnotatedCsvDecoder::decode(io::ByteSourcePtr source) const
    -> Expected<table::ResultStream> {
    return table::ResultStream::open(std::make_unique<AnnotatedCsvReader>(std::move(source)));
}

auto AnnotatedCsvEncoder::encode(table::ResultStream& stream, std::ostream& out) const
    -> Expected<std::int64_t> {
    std::int64_t rows = 0;
    bool first_block = true;
    std::string line;

    const auto write_line = [&]() {
        line.push_back('\n');
        out.write(line.data(), static_cast<std::streamsize>(line.size()));
        line.clear();
    };

    while (true) {
        auto result = stream.next();
        if (!result.has_value()) {
            stream.release();
            return std::unexpected(std::move(result.error()));
        }
        if (!result->has_value()) {
            break;
        }
        const std::string name = (*result)->name();
        std::int64_t table_id = 0;
        while (true) {
            auto next = (*result)->next();
            if (!next.has_value()) {
                stream.release();
                return std::unexpected(std::move(next.error()));
            }
            if (!next->has_value()) {
                break;
            }
            const table::Table& table = **next;
            if (!first_block) {
                write_line();
            }
            first_block = false;

            if (annotations_.datatype) {
                line.append("#datatype,string,long");
                for (const auto& column : table.columns) {
                    line.push_back(',');
                    line.append(datatype_token(column.meta.type));
                }
                write_line();
            }
            if (annotations_.group) {
                line.append("#group,false,false");
                for (const auto& column : table.columns) {
                    line.append(table.key.contains(column.meta.name) ? ",true" : ",false");
                }
                write_line();
            }
            if (annotations_.defaults && table.rows() == 0) {
                // Without data rows the #default row is the only carrier of the
                // result name and the group key.
                line.append("#default,");
                write_field(line, name);
                line.append(fmt::format(",{}", table_id));
                for (const auto& column : table.columns) {
                    line.push_back(',');
                    if (const auto* entry = table.key.find(column.meta.name);
                        entry != nullptr && !is_null(entry->value)) {
                        write_field(line, format_value(entry->value));
                    }
                }
                write_line();
            } else if (annotations_.defaults) {
                line.append("#default,,");
                line.append(table.columns.size(), ',');
                write_line();
            }
            line.append(",result,table");
            for (const auto& column : table.columns) {
                line.push_back(',');
                write_field(line, column.meta.name);
            }
            write_line();

            const std::string prefix = [&] {
                std::string text(",");
                write_field(text, name);
                return fmt::format("{},{}", text, table_id);
            }();
            for (std::size_t row = 0; row < table.rows(); ++row) {
                line.append(prefix);
                for (std::size_t col = 0; col < table.columns.size(); ++col) {
                    line.push_back(',');
                    write_cell(line, table, col, row);
                }
                write_line();
            }
            rows += static_cast<std::int64_t>(table.rows());
            table_id += 1;
        }
    }
    stream.release();
    if (!out) {
        return std::unexpected(make_error(ErrorKind::Execution, "failed writing annotated csv"));
    }
    return rows;
}

}  // namespace parity::codec
