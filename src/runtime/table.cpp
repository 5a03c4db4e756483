#include <tally/runtime/table.hpp>

namespace tally::runtime {

auto column_size(const ColumnValue& column) noexcept -> std::size_t {
    return std::visit([](const auto& c) { return c.size(); }, column);
}

void Table::add_column(std::string name, ColumnValue column) {
    if (auto it = index.find(name); it != index.end()) {
        columns[it->second].column = std::move(column);
        return;
    }
    std::size_t pos = columns.size();
    columns.push_back(ColumnEntry{.name = std::move(name), .column = std::move(column)});
    index[columns.back().name] = pos;
}

auto Table::find(const std::string& name) const -> const ColumnValue* {
    if (auto it = index.find(name); it != index.end()) {
        return &columns[it->second].column;
    }
    return nullptr;
}

auto Table::rows() const noexcept -> std::size_t {
    if (columns.empty()) {
        return 0;
    }
    return column_size(columns.front().column);
}

auto Table::cell(const std::string& name, std::size_t row) const -> std::optional<Cell> {
    const auto* column = find(name);
    if (column == nullptr) {
        return std::nullopt;
    }
    return std::visit([row](const auto& c) -> Cell { return c.at(row); }, *column);
}

}  // namespace tally::runtime
