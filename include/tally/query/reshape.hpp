#pragma once

#include <tally/core/tree.hpp>
#include <tally/ir/request.hpp>
#include <tally/query/keys.hpp>

#include <span>
#include <string>
#include <string_view>

namespace tally::query {

/// Insert a zero for every expected key missing from the result.
///
/// `groups` is the nesting order of `tree` (the request's group-by list) and
/// `expected` maps each group to the keys that must be present. Missing keys
/// become `0` at the last level and an empty branch above it. Levels without
/// an expected list are left as they are, but their children are still filled.
void zerofill(Tree& tree, std::span<const std::string> groups, const ir::FilterKeys& expected);

/// Remove keys that were not requested.
///
/// Uses the caller's original KeySet so different branches can allow
/// different secondary keys: below primary key `k` of a nested KeySet only
/// `k`'s own secondary keys survive. Flat keys only constrain the first
/// non-time level. The `time_column` level is never trimmed.
void trim(Tree& tree, std::span<const std::string> groups, const KeySet& keys,
          std::string_view time_column = "time");

/// Collapse alias maps: any branch holding `alias` is replaced by that entry.
void unnest(Tree& tree, std::string_view alias);

}  // namespace tally::query
