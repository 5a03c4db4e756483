#pragma once

#include <tally/core/error.hpp>
#include <tally/core/tree.hpp>

#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace tally {

/// Primary keys only, e.g. a list of project ids.
using FlatKeys = std::vector<Key>;

/// Primary key -> secondary keys, e.g. group id -> environment ids.
using NestedKeys = std::map<Key, std::vector<Key>>;

/// Caller key argument. `std::monostate` stands for an unset argument and is
/// rejected by normalization.
using KeySet = std::variant<std::monostate, FlatKeys, NestedKeys>;

/// Canonical two-level form of a KeySet.
struct NormalizedKeys {
    std::vector<Key> primary;
    /// Deduplicated union of all secondary keys; nullopt for flat key sets.
    std::optional<std::vector<Key>> secondary;
};

[[nodiscard]] auto normalize(const KeySet& keys) -> QueryResult<NormalizedKeys>;

/// Number of primary keys; 0 for an unset KeySet.
[[nodiscard]] auto primary_count(const KeySet& keys) noexcept -> std::size_t;

/// Coerce primary keys to integers and drop duplicates. Integer strings are
/// accepted; any other string fails with UnsupportedKeyShape.
[[nodiscard]] auto coerce_integer_keys(const KeySet& keys) -> QueryResult<KeySet>;

/// Parse keys from text: `1,2,3` is flat, `1:10|11;2:12` is nested.
/// Integer tokens become integer keys, anything else a string key.
[[nodiscard]] auto parse_keys(std::string_view text) -> QueryResult<KeySet>;

/// Integer key when `token` is a decimal integer, string key otherwise.
[[nodiscard]] auto parse_key(std::string_view token) -> Key;

}  // namespace tally
