#pragma once

#include <parity/core/column.hpp>
#include <parity/core/time.hpp>
#include <parity/core/value.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <unordered_map>
#include <variant>
#include <vector>

namespace parity::table {

using ColumnData =
    std::variant<Column<std::string>, Column<std::int64_t>, Column<std::uint64_t>, Column<double>,
                 Column<bool>, Column<Timestamp>, Column<Duration>>;

/// Name and declared type of a column.
struct ColumnMeta {
    std::string name;
    DataType type = DataType::String;

    friend auto operator==(const ColumnMeta&, const ColumnMeta&) -> bool = default;
};

struct ColumnEntry {
    ColumnMeta meta;
    ColumnData data;
    // Validity bitmap: true = valid (not null), false = null.
    // nullopt means every row is valid.
    std::optional<std::vector<bool>> validity;
};

/// Returns true if row `row` of `entry` is null.
[[nodiscard]] inline auto is_null(const ColumnEntry& entry, std::size_t row) -> bool {
    return entry.validity.has_value() && !(*entry.validity)[row];
}

/// Empty column storage for a declared type.
[[nodiscard]] auto make_column(DataType type) -> ColumnData;

/// One group-key column with the value shared by every row of its table.
struct KeyEntry {
    ColumnMeta meta;
    Value value;
};

/// The columns (and their shared values) identifying the series a table belongs to.
class GroupKey {
   public:
    GroupKey() = default;
    explicit GroupKey(std::vector<KeyEntry> entries) : entries_(std::move(entries)) {}

    [[nodiscard]] auto entries() const noexcept -> const std::vector<KeyEntry>& { return entries_; }
    [[nodiscard]] auto size() const noexcept -> std::size_t { return entries_.size(); }
    [[nodiscard]] auto empty() const noexcept -> bool { return entries_.empty(); }

    [[nodiscard]] auto contains(std::string_view name) const -> bool;
    [[nodiscard]] auto find(std::string_view name) const -> const KeyEntry*;

    void add(ColumnMeta meta, Value value);

    /// Entries sorted by column name.
    [[nodiscard]] auto sorted() const -> std::vector<KeyEntry>;

    /// `name=value,...` in column-name order; `{}` for the empty key.
    [[nodiscard]] auto format() const -> std::string;

    /// Order-insensitive equality over (name, type, value).
    friend auto operator==(const GroupKey& lhs, const GroupKey& rhs) -> bool;

   private:
    std::vector<KeyEntry> entries_;
};

/// A group of rows sharing a schema and group-key values.
struct Table {
    GroupKey key;
    std::vector<ColumnEntry> columns;
    std::unordered_map<std::string, std::size_t> index;

    /// Add an empty column; replaces an existing column of the same name.
    void add_column(ColumnMeta meta);
    void add_column(std::string name, ColumnData data);
    /// Add a column with an explicit validity bitmap (true = valid, false = null).
    void add_column(std::string name, ColumnData data, std::vector<bool> validity);

    [[nodiscard]] auto find(const std::string& name) -> ColumnEntry*;
    [[nodiscard]] auto find(const std::string& name) const -> const ColumnEntry*;
    [[nodiscard]] auto rows() const noexcept -> std::size_t;
    [[nodiscard]] auto schema() const -> std::vector<ColumnMeta>;

    /// Cell value; std::monostate for null.
    [[nodiscard]] auto value_at(std::size_t column, std::size_t row) const -> Value;

    /// Append one row, one value per column in column order. Null cells are
    /// std::monostate. Returns false (and leaves the table unchanged) on a
    /// width or type mismatch.
    [[nodiscard]] auto append_row(const std::vector<Value>& row) -> bool;

    /// New table with the same key and schema holding only the given rows.
    [[nodiscard]] auto gather(const std::vector<std::size_t>& rows) const -> Table;
};

/// Type of a column storage alternative.
[[nodiscard]] auto column_type(const ColumnData& data) -> DataType;

/// Append a value to column storage, maintaining the validity bitmap.
[[nodiscard]] auto append_value(ColumnEntry& entry, const Value& value) -> bool;

}  // namespace parity::table
