#pragma once

#include <tally/backend/executor.hpp>
#include <tally/core/error.hpp>
#include <tally/core/time.hpp>
#include <tally/core/tree.hpp>
#include <tally/model/registry.hpp>
#include <tally/query/builder.hpp>
#include <tally/query/keys.hpp>
#include <tally/tsdb/config.hpp>

#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <utility>
#include <vector>

namespace tally {

/// Caller options shared by all facade operations.
struct QueryOptions {
    std::optional<std::int64_t> rollup;
    std::optional<std::int64_t> environment_id;
    /// Number of items for the most-frequent operations.
    std::size_t limit = 10;
    std::vector<ir::Condition> conditions;
    /// Passed through to the executor.
    bool use_cache = false;
    std::optional<std::int64_t> jitter_value;
};

/// `(bucket start, value)`
using SeriesPoint = std::pair<std::int64_t, std::int64_t>;
using SeriesMap = std::map<Key, std::vector<SeriesPoint>>;
using TotalsMap = std::map<Key, std::int64_t>;

/// `(item, score)`; the most frequent item has the highest score.
using ScoredItem = std::pair<Key, double>;
using ScoredMap = std::map<Key, std::vector<ScoredItem>>;
using ScoredBucket = std::pair<std::int64_t, std::map<Key, double>>;
using ScoredSeriesMap = std::map<Key, std::vector<ScoredBucket>>;

using Frequencies = std::map<Key, std::int64_t>;
using FrequencyBucket = std::pair<std::int64_t, Frequencies>;
using FrequencySeriesMap = std::map<Key, std::vector<FrequencyBucket>>;
using FrequencyTotalsMap = std::map<Key, Frequencies>;

/// Score a backend top-K list (most frequent first): the last item scores
/// 1.0, the one before it 2.0, and so on. The result keeps the backend
/// order, so `[c, b, a]` becomes `[(c, 3.0), (b, 2.0), (a, 1.0)]` rather
/// than the ascending `[(a, 1.0), (b, 2.0), (c, 3.0)]`; the scores agree.
[[nodiscard]] auto rescore(const TopK& items) -> std::vector<ScoredItem>;

/// Time-series queries over an analytics executor.
///
/// Each operation builds one backend request, runs it and reshapes the
/// response into a dense per-key structure: every requested key and every
/// bucket of the window is present, zero when the backend had no rows.
/// An empty primary key set never reaches the executor.
class Tsdb {
   public:
    Tsdb(const ModelRegistry& registry, backend::Executor& executor, TsdbConfig config = {});

    /// Run a model query and return the reshaped tree. Nesting follows the
    /// request's group-by list.
    [[nodiscard]] auto get_data(Model model, const KeySet& keys, Timestamp start, Timestamp end,
                                const query::RequestOptions& options) -> QueryResult<Tree>;

    /// Per key, `(bucket, value)` pairs. Outcome models sum quantities,
    /// everything else counts events. Counting a model with an aggregate
    /// column yields per-item counts, so it fails with InvalidArgument;
    /// get_frequency_series answers that query.
    [[nodiscard]] auto get_range(Model model, const KeySet& keys, Timestamp start, Timestamp end,
                                 const QueryOptions& options = {}) -> QueryResult<SeriesMap>;

    /// Per key, the total of its get_range points.
    [[nodiscard]] auto get_sums(Model model, const KeySet& keys, Timestamp start, Timestamp end,
                                const QueryOptions& options = {}) -> QueryResult<TotalsMap>;

    [[nodiscard]] auto get_distinct_counts_series(Model model, const KeySet& keys,
                                                  Timestamp start, Timestamp end,
                                                  const QueryOptions& options = {})
        -> QueryResult<SeriesMap>;

    [[nodiscard]] auto get_distinct_counts_totals(Model model, const KeySet& keys,
                                                  Timestamp start, Timestamp end,
                                                  const QueryOptions& options = {})
        -> QueryResult<TotalsMap>;

    /// A single distinct count across all keys.
    [[nodiscard]] auto get_distinct_counts_union(Model model, const KeySet& keys,
                                                 Timestamp start, Timestamp end,
                                                 const QueryOptions& options = {})
        -> QueryResult<std::int64_t>;

    [[nodiscard]] auto get_most_frequent(Model model, const KeySet& keys, Timestamp start,
                                         Timestamp end, const QueryOptions& options = {})
        -> QueryResult<ScoredMap>;

    [[nodiscard]] auto get_most_frequent_series(Model model, const KeySet& keys,
                                                Timestamp start, Timestamp end,
                                                const QueryOptions& options = {})
        -> QueryResult<ScoredSeriesMap>;

    /// Per primary key and bucket, counts per secondary key.
    [[nodiscard]] auto get_frequency_series(Model model, const KeySet& keys, Timestamp start,
                                            Timestamp end, const QueryOptions& options = {})
        -> QueryResult<FrequencySeriesMap>;

    [[nodiscard]] auto get_frequency_totals(Model model, const KeySet& keys, Timestamp start,
                                            Timestamp end, const QueryOptions& options = {})
        -> QueryResult<FrequencyTotalsMap>;

    [[nodiscard]] auto builder() const noexcept -> const query::QueryBuilder& { return builder_; }

   private:
    [[nodiscard]] auto series(Model model, const KeySet& keys, Timestamp start, Timestamp end,
                              const QueryOptions& options, ir::AggFunc aggregation)
        -> QueryResult<SeriesMap>;

    query::QueryBuilder builder_;
    backend::Executor* executor_;
};

}  // namespace tally
