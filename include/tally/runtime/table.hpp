#pragma once

#include <tally/core/column.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <unordered_map>
#include <variant>
#include <vector>

namespace tally::runtime {

/// Integer array cell, e.g. the group ids attached to a transaction.
using IntArray = std::vector<std::int64_t>;

using ColumnValue = std::variant<Column<std::int64_t>, Column<std::string>, Column<IntArray>>;

/// A single value read out of a column.
using Cell = std::variant<std::int64_t, std::string, IntArray>;

struct ColumnEntry {
    std::string name;
    ColumnValue column;
};

/// Event rows of one dataset, stored column-wise.
struct Table {
    std::vector<ColumnEntry> columns;
    std::unordered_map<std::string, std::size_t> index;

    /// Add a column, replacing any column of the same name.
    void add_column(std::string name, ColumnValue column);
    [[nodiscard]] auto find(const std::string& name) const -> const ColumnValue*;
    [[nodiscard]] auto contains(const std::string& name) const -> bool {
        return index.contains(name);
    }
    [[nodiscard]] auto rows() const noexcept -> std::size_t;

    /// Value of `name` at `row`; nullopt for unknown columns.
    [[nodiscard]] auto cell(const std::string& name, std::size_t row) const -> std::optional<Cell>;
};

[[nodiscard]] auto column_size(const ColumnValue& column) noexcept -> std::size_t;

}  // namespace tally::runtime
