#pragma once

#include <tally/core/time.hpp>
#include <tally/core/tree.hpp>
#include <tally/ir/expr.hpp>
#include <tally/model/model.hpp>

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace tally::ir {

/// Column -> allowed values. Rows whose value is not listed are excluded.
using FilterKeys = std::map<std::string, std::vector<Key>>;

/// A single backend aggregation request.
///
/// Results nest one level per `group_by` column, in order. When more than one
/// output column is requested (aggregations, computed columns and selected
/// columns together) each leaf is a branch keyed by output alias.
struct QueryRequest {
    Dataset dataset = Dataset::Events;
    /// Inclusive.
    Timestamp start;
    /// Exclusive.
    Timestamp end;
    std::vector<std::string> group_by;
    std::vector<OrderKey> order_by;
    std::vector<Condition> conditions;
    FilterKeys filter_keys;
    std::vector<AggSpec> aggregations;
    /// Derived columns, e.g. a synthetic time bucket.
    std::vector<FieldSpec> computed;
    std::optional<std::vector<FieldSpec>> selected_columns;
    /// Width of the native `time` column in seconds.
    std::int64_t rollup = 0;
    std::int64_t limit = 0;
    std::string referrer;
    bool is_grouprelease = false;
    bool use_cache = false;
};

/// One-line summary for logs.
[[nodiscard]] auto describe(const QueryRequest& request) -> std::string;

}  // namespace tally::ir
