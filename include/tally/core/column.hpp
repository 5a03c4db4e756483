#pragma once

#include <cstddef>
#include <initializer_list>
#include <utility>
#include <vector>

namespace tally {

/// Values of one fixture column, one per event row.
template <typename T>
class Column {
   public:
    using value_type = T;

    Column() = default;
    explicit Column(std::vector<T> values) : values_(std::move(values)) {}
    Column(std::initializer_list<T> values) : values_(values) {}

    [[nodiscard]] auto size() const noexcept -> std::size_t { return values_.size(); }
    [[nodiscard]] auto empty() const noexcept -> bool { return values_.empty(); }

    /// Row value; throws std::out_of_range past the last row.
    [[nodiscard]] auto at(std::size_t row) const -> const T& { return values_.at(row); }
    [[nodiscard]] auto operator[](std::size_t row) const noexcept -> const T& {
        return values_[row];
    }

    void push_back(T value) { values_.push_back(std::move(value)); }
    void reserve(std::size_t rows) { values_.reserve(rows); }

    [[nodiscard]] auto begin() const noexcept { return values_.cbegin(); }
    [[nodiscard]] auto end() const noexcept { return values_.cend(); }

   private:
    std::vector<T> values_;
};

}  // namespace tally
