#pragma once

#include <tally/runtime/table.hpp>

#include <expected>
#include <istream>
#include <string>
#include <string_view>

namespace tally::runtime {

/// Read a fixture CSV (RFC 4180, header row required).
///
/// Column types are inferred: all-integer columns become Int64, columns whose
/// cells all look like `[1;2;3]` become integer arrays, everything else is a
/// string. A `timestamp` column also accepts `YYYY-MM-DDTHH:MM:SS` and is
/// stored as unix seconds.
[[nodiscard]] auto read_csv(std::string_view path) -> std::expected<Table, std::string>;

/// Same as read_csv, from an already open stream.
[[nodiscard]] auto read_csv(std::istream& input) -> std::expected<Table, std::string>;

}  // namespace tally::runtime
