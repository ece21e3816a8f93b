#pragma once

#include <concepts>
#include <cstddef>
#include <initializer_list>
#include <utility>
#include <vector>

namespace parity {

/// Concept constraining valid column element types.
template <typename T>
concept ColumnElement = std::regular<T> && std::totally_ordered<T>;

/// A typed, owning columnar storage container.
///
/// Column<T> owns a contiguous vector of homogeneously typed values.
/// References are the vector's own reference types so that Column<bool>
/// behaves like the other instantiations.
template <typename T>
class Column {
   public:
    using value_type = T;
    using size_type = std::size_t;
    using reference = typename std::vector<T>::reference;
    using const_reference = typename std::vector<T>::const_reference;

    static_assert(ColumnElement<T>,
                  "Column<T> requires T to satisfy ColumnElement (regular + totally ordered).");

    Column() = default;

    explicit Column(std::vector<T> data) : data_(std::move(data)) {}

    Column(std::initializer_list<T> init) : data_(init) {}

    /// Number of elements.
    [[nodiscard]] auto size() const noexcept -> size_type { return data_.size(); }

    /// Unchecked element access.
    [[nodiscard]] auto operator[](size_type idx) const noexcept -> const_reference {
        return data_[idx];
    }

    /// Append a value.
    void push_back(const T& value) { data_.push_back(value); }
    void push_back(T&& value) { data_.push_back(std::move(value)); }

    /// Construct a value in-place.
    template <typename... Args>
        requires std::constructible_from<T, Args...>
    auto emplace_back(Args&&... args) -> reference {
        return data_.emplace_back(std::forward<Args>(args)...);
    }

    /// Copy of the elements at the given row positions, in order.
    [[nodiscard]] auto gather(const std::vector<std::size_t>& rows) const -> Column<T> {
        std::vector<T> result;
        result.reserve(rows.size());
        for (auto row : rows) {
            result.push_back(data_[row]);
        }
        return Column<T>{std::move(result)};
    }

    friend auto operator==(const Column&, const Column&) -> bool = default;

   private:
    std::vector<T> data_;
};

}  // namespace parity
