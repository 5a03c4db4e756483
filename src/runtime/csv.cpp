#include <tally/core/time.hpp>
#include <tally/runtime/csv.hpp>

#include <fmt/format.h>
#include <rapidcsv.h>

#include <charconv>
#include <exception>
#include <fstream>
#include <optional>
#include <vector>

namespace tally::runtime {

namespace {

constexpr const char* kTimestampColumn = "timestamp";

auto csv_trim(std::string_view text) -> std::string_view {
    auto begin = text.find_first_not_of(" \t\r\n");
    if (begin == std::string_view::npos) {
        return {};
    }
    auto end = text.find_last_not_of(" \t\r\n");
    return text.substr(begin, end - begin + 1);
}

auto csv_try_int(std::string_view text, std::int64_t& out) -> bool {
    text = csv_trim(text);
    const char* end = text.data() + text.size();
    auto result = std::from_chars(text.data(), end, out);
    return !text.empty() && result.ec == std::errc() && result.ptr == end;
}

// `[1;2;3]`, `[]`
auto csv_try_array(std::string_view text) -> std::optional<IntArray> {
    text = csv_trim(text);
    if (text.size() < 2 || text.front() != '[' || text.back() != ']') {
        return std::nullopt;
    }
    text = csv_trim(text.substr(1, text.size() - 2));
    IntArray values;
    if (text.empty()) {
        return values;
    }
    std::size_t pos = 0;
    while (pos <= text.size()) {
        auto next = text.find(';', pos);
        if (next == std::string_view::npos) {
            next = text.size();
        }
        std::int64_t v = 0;
        if (!csv_try_int(text.substr(pos, next - pos), v)) {
            return std::nullopt;
        }
        values.push_back(v);
        pos = next + 1;
    }
    return values;
}

auto build_table(rapidcsv::Document& doc) -> std::expected<Table, std::string> {
    Table table;
    for (const auto& name : doc.GetColumnNames()) {
        std::vector<std::string> vals = doc.GetColumn<std::string>(name);

        if (name == kTimestampColumn) {
            Column<std::int64_t> col;
            col.reserve(vals.size());
            for (std::size_t i = 0; i < vals.size(); ++i) {
                auto ts = parse_timestamp(csv_trim(vals[i]));
                if (!ts) {
                    return std::unexpected(
                        fmt::format("row {}: bad timestamp '{}'", i + 1, vals[i]));
                }
                col.push_back(ts->seconds);
            }
            table.add_column(name, std::move(col));
            continue;
        }

        // Try int64
        Column<std::int64_t> ints;
        ints.reserve(vals.size());
        for (const auto& v : vals) {
            std::int64_t iv{};
            if (!csv_try_int(v, iv)) {
                break;
            }
            ints.push_back(iv);
        }
        if (!vals.empty() && ints.size() == vals.size()) {
            table.add_column(name, std::move(ints));
            continue;
        }

        // Try integer arrays
        std::vector<IntArray> arrays;
        arrays.reserve(vals.size());
        for (const auto& v : vals) {
            auto parsed = csv_try_array(v);
            if (!parsed) {
                break;
            }
            arrays.push_back(std::move(*parsed));
        }
        if (!vals.empty() && arrays.size() == vals.size()) {
            table.add_column(name, Column<IntArray>{std::move(arrays)});
            continue;
        }

        table.add_column(name, Column<std::string>{std::move(vals)});
    }
    return table;
}

}  // namespace

auto read_csv(std::istream& input) -> std::expected<Table, std::string> {
    try {
        rapidcsv::Document doc(input,
                               rapidcsv::LabelParams(0, -1),   // row 0 = header, no row-index column
                               rapidcsv::SeparatorParams(',')  // handles RFC 4180 quoting
        );
        return build_table(doc);
    } catch (const std::exception& e) {
        return std::unexpected(fmt::format("failed to read csv: {}", e.what()));
    }
}

auto read_csv(std::string_view path) -> std::expected<Table, std::string> {
    std::ifstream input{std::string(path)};
    if (!input) {
        return std::unexpected("failed to open csv: " + std::string(path));
    }
    return read_csv(input);
}

}  // namespace tally::runtime
