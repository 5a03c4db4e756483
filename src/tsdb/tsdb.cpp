#include <tally/query/reshape.hpp>
#include <tally/tsdb/tsdb.hpp>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

namespace tally {

namespace {

auto request_options(const QueryOptions& options, ir::AggFunc aggregation)
    -> query::RequestOptions {
    query::RequestOptions out;
    out.rollup = options.rollup;
    if (options.environment_id) {
        out.environment_ids = std::vector<std::int64_t>{*options.environment_id};
    }
    out.aggregation = aggregation;
    out.top_k = options.limit;
    out.conditions = options.conditions;
    out.use_cache = options.use_cache;
    out.jitter_value = options.jitter_value;
    return out;
}

/// Visit the `(bucket, subtree)` children of a time level. Bucket keys are
/// integers; anything else is skipped.
template <typename Fn>
void for_each_bucket(const Tree& level, Fn&& fn) {
    if (!level.is_branch()) {
        return;
    }
    for (const auto& [key, child] : level.branch()) {
        if (const auto* bucket = std::get_if<std::int64_t>(&key)) {
            fn(*bucket, child);
        }
    }
}

auto frequencies(const Tree& level) -> Frequencies {
    Frequencies out;
    if (!level.is_branch()) {
        return out;
    }
    for (const auto& [key, child] : level.branch()) {
        out.emplace(key, child.as_integer());
    }
    return out;
}

auto score_map(const TopK& items) -> std::map<Key, double> {
    std::map<Key, double> out;
    for (auto& [item, score] : rescore(items)) {
        out.emplace(std::move(item), score);
    }
    return out;
}

}  // namespace

auto rescore(const TopK& items) -> std::vector<ScoredItem> {
    std::vector<ScoredItem> scored;
    scored.reserve(items.size());
    for (std::size_t i = 0; i < items.size(); ++i) {
        scored.emplace_back(items[i], static_cast<double>(items.size() - i));
    }
    return scored;
}

Tsdb::Tsdb(const ModelRegistry& registry, backend::Executor& executor, TsdbConfig config)
    : builder_(registry, std::move(config)), executor_(&executor) {}

auto Tsdb::get_data(Model model, const KeySet& keys, Timestamp start, Timestamp end,
                    const query::RequestOptions& options) -> QueryResult<Tree> {
    auto built = builder_.build(model, keys, start, end, options);
    if (!built) {
        return std::unexpected(built.error());
    }
    const auto& config = builder_.config();

    Tree result;
    if (built->skip_backend) {
        spdlog::debug("tsdb: {} has no keys, backend not queried", model_name(model));
    } else {
        auto response = executor_->execute(built->request);
        if (!response) {
            spdlog::warn("tsdb: {} failed: {}", model_name(model), response.error().format());
            return std::unexpected(response.error());
        }
        result = std::move(*response);
        if (built->unnest_selected) {
            query::unnest(result, config.aggregate_alias);
        }
    }

    const auto& groups = built->request.group_by;
    query::zerofill(result, groups, built->expected);
    if (built->time_column.empty()) {
        query::trim(result, groups, built->keys);
    } else {
        query::trim(result, groups, built->keys, built->time_column);
    }
    if (built->unnest_time) {
        query::unnest(result, config.aggregate_alias);
    }
    return result;
}

auto Tsdb::series(Model model, const KeySet& keys, Timestamp start, Timestamp end,
                  const QueryOptions& options, ir::AggFunc aggregation)
    -> QueryResult<SeriesMap> {
    auto request = request_options(options, aggregation);
    request.group_on_time = true;
    auto tree = get_data(model, keys, start, end, request);
    if (!tree) {
        return std::unexpected(tree.error());
    }

    SeriesMap out;
    if (!tree->is_branch()) {
        return out;
    }
    for (const auto& [key, level] : tree->branch()) {
        auto& points = out[key];
        for_each_bucket(level, [&points](std::int64_t bucket, const Tree& value) {
            points.emplace_back(bucket, value.as_integer());
        });
    }
    return out;
}

auto Tsdb::get_range(Model model, const KeySet& keys, Timestamp start, Timestamp end,
                     const QueryOptions& options) -> QueryResult<SeriesMap> {
    auto settings = builder_.registry().lookup(model);
    if (!settings) {
        return std::unexpected(settings.error());
    }
    const auto aggregation =
        (*settings)->dataset == Dataset::Outcomes ? ir::AggFunc::Sum : ir::AggFunc::Count;
    // count() groups on the aggregate column, so each bucket would hold
    // per-item counts rather than one value.
    if (aggregation == ir::AggFunc::Count && (*settings)->aggregate) {
        return std::unexpected(make_error(
            ErrorKind::InvalidArgument,
            fmt::format("{} counts per {}; use get_frequency_series", model_name(model),
                        *(*settings)->aggregate)));
    }
    return series(model, keys, start, end, options, aggregation);
}

auto Tsdb::get_sums(Model model, const KeySet& keys, Timestamp start, Timestamp end,
                    const QueryOptions& options) -> QueryResult<TotalsMap> {
    auto range = get_range(model, keys, start, end, options);
    if (!range) {
        return std::unexpected(range.error());
    }
    TotalsMap out;
    for (const auto& [key, points] : *range) {
        std::int64_t total = 0;
        for (const auto& [bucket, value] : points) {
            total += value;
        }
        out.emplace(key, total);
    }
    return out;
}

auto Tsdb::get_distinct_counts_series(Model model, const KeySet& keys, Timestamp start,
                                      Timestamp end, const QueryOptions& options)
    -> QueryResult<SeriesMap> {
    return series(model, keys, start, end, options, ir::AggFunc::Uniq);
}

auto Tsdb::get_distinct_counts_totals(Model model, const KeySet& keys, Timestamp start,
                                      Timestamp end, const QueryOptions& options)
    -> QueryResult<TotalsMap> {
    auto tree = get_data(model, keys, start, end, request_options(options, ir::AggFunc::Uniq));
    if (!tree) {
        return std::unexpected(tree.error());
    }
    TotalsMap out;
    if (tree->is_branch()) {
        for (const auto& [key, value] : tree->branch()) {
            out.emplace(key, value.as_integer());
        }
    }
    return out;
}

auto Tsdb::get_distinct_counts_union(Model model, const KeySet& keys, Timestamp start,
                                     Timestamp end, const QueryOptions& options)
    -> QueryResult<std::int64_t> {
    auto request = request_options(options, ir::AggFunc::Uniq);
    request.group_on_model = false;
    auto tree = get_data(model, keys, start, end, request);
    if (!tree) {
        return std::unexpected(tree.error());
    }
    // An empty branch (no keys) reads as zero.
    return tree->as_integer();
}

auto Tsdb::get_most_frequent(Model model, const KeySet& keys, Timestamp start, Timestamp end,
                             const QueryOptions& options) -> QueryResult<ScoredMap> {
    auto tree = get_data(model, keys, start, end, request_options(options, ir::AggFunc::TopK));
    if (!tree) {
        return std::unexpected(tree.error());
    }
    ScoredMap out;
    if (tree->is_branch()) {
        for (const auto& [key, value] : tree->branch()) {
            out.emplace(key, rescore(value.as_top_k()));
        }
    }
    return out;
}

auto Tsdb::get_most_frequent_series(Model model, const KeySet& keys, Timestamp start,
                                    Timestamp end, const QueryOptions& options)
    -> QueryResult<ScoredSeriesMap> {
    auto request = request_options(options, ir::AggFunc::TopK);
    request.group_on_time = true;
    auto tree = get_data(model, keys, start, end, request);
    if (!tree) {
        return std::unexpected(tree.error());
    }
    ScoredSeriesMap out;
    if (!tree->is_branch()) {
        return out;
    }
    for (const auto& [key, level] : tree->branch()) {
        auto& buckets = out[key];
        for_each_bucket(level, [&buckets](std::int64_t bucket, const Tree& value) {
            buckets.emplace_back(bucket, score_map(value.as_top_k()));
        });
    }
    return out;
}

auto Tsdb::get_frequency_series(Model model, const KeySet& keys, Timestamp start, Timestamp end,
                                const QueryOptions& options) -> QueryResult<FrequencySeriesMap> {
    auto request = request_options(options, ir::AggFunc::Count);
    request.group_on_time = true;
    auto tree = get_data(model, keys, start, end, request);
    if (!tree) {
        return std::unexpected(tree.error());
    }
    FrequencySeriesMap out;
    if (!tree->is_branch()) {
        return out;
    }
    for (const auto& [key, level] : tree->branch()) {
        auto& buckets = out[key];
        for_each_bucket(level, [&buckets](std::int64_t bucket, const Tree& value) {
            buckets.emplace_back(bucket, frequencies(value));
        });
    }
    return out;
}

auto Tsdb::get_frequency_totals(Model model, const KeySet& keys, Timestamp start, Timestamp end,
                                const QueryOptions& options) -> QueryResult<FrequencyTotalsMap> {
    auto tree = get_data(model, keys, start, end, request_options(options, ir::AggFunc::Count));
    if (!tree) {
        return std::unexpected(tree.error());
    }
    FrequencyTotalsMap out;
    if (tree->is_branch()) {
        for (const auto& [key, value] : tree->branch()) {
            out.emplace(key, frequencies(value));
        }
    }
    return out;
}

}  // namespace tally
