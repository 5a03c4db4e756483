#pragma once

#include <tally/core/error.hpp>
#include <tally/core/time.hpp>
#include <tally/ir/request.hpp>
#include <tally/model/registry.hpp>
#include <tally/query/buckets.hpp>
#include <tally/query/keys.hpp>
#include <tally/tsdb/config.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace tally::query {

/// Per-call knobs of a model query.
struct RequestOptions {
    std::optional<std::int64_t> rollup;
    std::optional<std::vector<std::int64_t>> environment_ids;
    ir::AggFunc aggregation = ir::AggFunc::Count;
    /// Number of items for TopK.
    std::size_t top_k = 10;
    /// Group on the model's primary column.
    bool group_on_model = true;
    /// Group on time buckets.
    bool group_on_time = false;
    /// Caller conditions, applied before the model's own.
    std::vector<ir::Condition> conditions;
    bool use_cache = false;
    std::optional<std::int64_t> jitter_value;
};

/// A backend request plus everything needed to reshape its response.
struct BuiltQuery {
    ir::QueryRequest request;
    /// Keys after model-specific coercion; drives trimming.
    KeySet keys;
    /// Expected keys per grouping column; time columns map to the bucket series.
    ir::FilterKeys expected;
    BucketPlan plan;
    /// Name of the time grouping column (`time` or the synthetic alias); empty
    /// when not grouped on time.
    std::string time_column;
    /// No primary keys: nothing to ask the backend.
    bool skip_backend = false;
    /// Selected-column projections wrap each leaf in an alias map.
    bool unnest_selected = false;
    /// The synthetic time bucket wraps each leaf in an alias map.
    bool unnest_time = false;
};

/// Explicit time bucketing for backends that cannot group on a derived time
/// expression. Minute, hour and day rollups use the start-of functions; any
/// other rollup integer-divides the unix timestamp and multiplies back.
[[nodiscard]] auto manual_time_bucket(std::int64_t rollup, std::string alias) -> ir::FieldSpec;

/// Translates model queries into backend requests.
///
/// The builder owns the backend capability shims (the count() rewrite and the
/// manual time grouping) so the reshaper never needs to know about them.
class QueryBuilder {
   public:
    explicit QueryBuilder(const ModelRegistry& registry, TsdbConfig config = {});

    [[nodiscard]] auto build(Model model, const KeySet& keys, Timestamp start, Timestamp end,
                             const RequestOptions& options) const -> QueryResult<BuiltQuery>;

    /// Whether `model` needs the synthetic time bucket instead of `time`.
    [[nodiscard]] auto requires_manual_time(Model model) const -> bool;

    [[nodiscard]] auto config() const noexcept -> const TsdbConfig& { return config_; }
    [[nodiscard]] auto registry() const noexcept -> const ModelRegistry& { return *registry_; }

   private:
    const ModelRegistry* registry_;
    TsdbConfig config_;
    BucketPlanner planner_;
};

}  // namespace tally::query
