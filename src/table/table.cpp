#include <parity/table/table.hpp>

#include <fmt/core.h>

#include <algorithm>
#include <type_traits>

namespace parity::table {

namespace {

auto column_size(const ColumnData& data) -> std::size_t {
    return std::visit([](const auto& col) { return col.size(); }, data);
}

auto keys_by_name(const std::vector<KeyEntry>& entries) -> std::vector<const KeyEntry*> {
    std::vector<const KeyEntry*> out;
    out.reserve(entries.size());
    for (const auto& entry : entries) {
        out.push_back(&entry);
    }
    std::ranges::sort(out, [](const KeyEntry* a, const KeyEntry* b) {
        return a->meta.name < b->meta.name;
    });
    return out;
}

}  // namespace

auto make_column(DataType type) -> ColumnData {
    switch (type) {
        case DataType::String:
            return Column<std::string>{};
        case DataType::Int:
            return Column<std::int64_t>{};
        case DataType::UInt:
            return Column<std::uint64_t>{};
        case DataType::Float:
            return Column<double>{};
        case DataType::Bool:
            return Column<bool>{};
        case DataType::Time:
            return Column<Timestamp>{};
        case DataType::Duration:
            return Column<Duration>{};
    }
    return Column<std::string>{};
}

auto column_type(const ColumnData& data) -> DataType {
    return std::visit(
        [](const auto& col) -> DataType {
            using T = typename std::decay_t<decltype(col)>::value_type;
            if constexpr (std::is_same_v<T, std::string>) {
                return DataType::String;
            } else if constexpr (std::is_same_v<T, std::int64_t>) {
                return DataType::Int;
            } else if constexpr (std::is_same_v<T, std::uint64_t>) {
                return DataType::UInt;
            } else if constexpr (std::is_same_v<T, double>) {
                return DataType::Float;
            } else if constexpr (std::is_same_v<T, bool>) {
                return DataType::Bool;
            } else if constexpr (std::is_same_v<T, Timestamp>) {
                return DataType::Time;
            } else {
                return DataType::Duration;
            }
        },
        data);
}

auto append_value(ColumnEntry& entry, const Value& value) -> bool {
    const std::size_t row = column_size(entry.data);
    if (parity::is_null(value)) {
        if (!entry.validity.has_value()) {
            entry.validity.emplace(row, true);
        }
        entry.validity->push_back(false);
        std::visit([](auto& col) { col.emplace_back(); }, entry.data);
        return true;
    }
    bool ok = std::visit(
        [&value](auto& col) -> bool {
            using T = typename std::decay_t<decltype(col)>::value_type;
            const auto* typed = std::get_if<T>(&value);
            if (typed == nullptr) {
                return false;
            }
            col.push_back(*typed);
            return true;
        },
        entry.data);
    if (ok && entry.validity.has_value()) {
        entry.validity->push_back(true);
    }
    return ok;
}

auto GroupKey::contains(std::string_view name) const -> bool {
    return find(name) != nullptr;
}

auto GroupKey::find(std::string_view name) const -> const KeyEntry* {
    for (const auto& entry : entries_) {
        if (entry.meta.name == name) {
            return &entry;
        }
    }
    return nullptr;
}

void GroupKey::add(ColumnMeta meta, Value value) {
    entries_.push_back(KeyEntry{.meta = std::move(meta), .value = std::move(value)});
}

auto GroupKey::sorted() const -> std::vector<KeyEntry> {
    std::vector<KeyEntry> out;
    out.reserve(entries_.size());
    for (const auto* entry : keys_by_name(entries_)) {
        out.push_back(*entry);
    }
    return out;
}

auto GroupKey::format() const -> std::string {
    if (entries_.empty()) {
        return "{}";
    }
    std::string out;
    for (const auto* entry : keys_by_name(entries_)) {
        if (!out.empty()) {
            out.push_back(',');
        }
        out.append(fmt::format("{}={}", entry->meta.name, format_value(entry->value)));
    }
    return out;
}

auto operator==(const GroupKey& lhs, const GroupKey& rhs) -> bool {
    if (lhs.entries_.size() != rhs.entries_.size()) {
        return false;
    }
    auto l = keys_by_name(lhs.entries_);
    auto r = keys_by_name(rhs.entries_);
    for (std::size_t i = 0; i < l.size(); ++i) {
        if (l[i]->meta != r[i]->meta || !values_equal(l[i]->value, r[i]->value)) {
            return false;
        }
    }
    return true;
}

void Table::add_column(ColumnMeta meta) {
    auto data = make_column(meta.type);
    add_column(std::move(meta.name), std::move(data));
}

void Table::add_column(std::string name, ColumnData data) {
    ColumnMeta meta{.name = std::move(name), .type = column_type(data)};
    if (auto it = index.find(meta.name); it != index.end()) {
        columns[it->second] = ColumnEntry{.meta = std::move(meta), .data = std::move(data)};
        return;
    }
    std::size_t pos = columns.size();
    columns.push_back(ColumnEntry{.meta = std::move(meta), .data = std::move(data)});
    index[columns.back().meta.name] = pos;
}

void Table::add_column(std::string name, ColumnData data, std::vector<bool> validity) {
    std::string key = name;
    add_column(std::move(name), std::move(data));
    columns[index[key]].validity = std::move(validity);
}

auto Table::find(const std::string& name) -> ColumnEntry* {
    if (auto it = index.find(name); it != index.end()) {
        return &columns[it->second];
    }
    return nullptr;
}

auto Table::find(const std::string& name) const -> const ColumnEntry* {
    if (auto it = index.find(name); it != index.end()) {
        return &columns[it->second];
    }
    return nullptr;
}

auto Table::rows() const noexcept -> std::size_t {
    if (columns.empty()) {
        return 0;
    }
    return column_size(columns.front().data);
}

auto Table::schema() const -> std::vector<ColumnMeta> {
    std::vector<ColumnMeta> out;
    out.reserve(columns.size());
    for (const auto& entry : columns) {
        out.push_back(entry.meta);
    }
    return out;
}

auto Table::value_at(std::size_t column, std::size_t row) const -> Value {
    const auto& entry = columns[column];
    if (is_null(entry, row)) {
        return std::monostate{};
    }
    return std::visit([row](const auto& col) -> Value { return col[row]; }, entry.data);
}

auto Table::append_row(const std::vector<Value>& row) -> bool {
    if (row.size() != columns.size()) {
        return false;
    }
    for (std::size_t i = 0; i < row.size(); ++i) {
        if (!parity::is_null(row[i]) && type_of(row[i]) != columns[i].meta.type) {
            return false;
        }
    }
    for (std::size_t i = 0; i < row.size(); ++i) {
        if (!append_value(columns[i], row[i])) {
            return false;
        }
    }
    return true;
}

auto Table::gather(const std::vector<std::size_t>& rows) const -> Table {
    Table out;
    out.key = key;
    for (const auto& entry : columns) {
        auto data = std::visit([&rows](const auto& col) -> ColumnData { return col.gather(rows); },
                               entry.data);
        if (entry.validity.has_value()) {
            std::vector<bool> validity;
            validity.reserve(rows.size());
            for (auto row : rows) {
                validity.push_back((*entry.validity)[row]);
            }
            out.add_column(entry.meta.name, std::move(data), std::move(validity));
        } else {
            out.add_column(entry.meta.name, std::move(data));
        }
    }
    return out;
}

}  // namespace parity::table
