#include <tally/query/builder.hpp>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <algorithm>

namespace tally::query {

namespace {

constexpr const char* kTimeColumn = "time";
constexpr const char* kEnvironmentColumn = "environment";
constexpr const char* kTimestampColumn = "timestamp";

// Project key stats hand key ids over as strings.
auto uses_integer_keys(Model model) -> bool {
    return model == Model::key_total_received || model == Model::key_total_rejected ||
           model == Model::key_total_blacklisted;
}

auto to_keys(const std::vector<std::int64_t>& values) -> std::vector<Key> {
    std::vector<Key> keys;
    keys.reserve(values.size());
    for (auto v : values) {
        keys.emplace_back(v);
    }
    return keys;
}

}  // namespace

auto manual_time_bucket(std::int64_t rollup, std::string alias) -> ir::FieldSpec {
    auto start_of = [](const char* func) {
        return ir::call("toUnixTimestamp", {ir::call(func, {ir::col(kTimestampColumn)})});
    };
    switch (rollup) {
        case kSecondsPerMinute:
            return ir::field(std::move(alias), start_of("toStartOfMinute"));
        case kSecondsPerHour:
            return ir::field(std::move(alias), start_of("toStartOfHour"));
        case kSecondsPerDay:
            return ir::field(std::move(alias), start_of("toDate"));
        default:
            break;
    }
    // multiply(intDiv(toUInt32(toUnixTimestamp(timestamp)), rollup), rollup)
    auto seconds = ir::call("toUInt32", {ir::call("toUnixTimestamp", {ir::col(kTimestampColumn)})});
    return ir::field(std::move(alias),
                     ir::call("multiply", {ir::call("intDiv", {std::move(seconds), ir::lit(rollup)}),
                                           ir::lit(rollup)}));
}

QueryBuilder::QueryBuilder(const ModelRegistry& registry, TsdbConfig config)
    : registry_(&registry), config_(std::move(config)), planner_(config_.rollups) {}

auto QueryBuilder::requires_manual_time(Model model) const -> bool {
    return std::ranges::find(config_.manual_time_models, model) !=
           config_.manual_time_models.end();
}

auto QueryBuilder::build(Model model, const KeySet& keys, Timestamp start, Timestamp end,
                         const RequestOptions& options) const -> QueryResult<BuiltQuery> {
    auto settings = registry_->lookup(model);
    if (!settings) {
        return std::unexpected(settings.error());
    }
    const ModelQuerySettings& model_settings = **settings;

    BuiltQuery built;
    built.keys = keys;
    if (uses_integer_keys(model)) {
        auto coerced = coerce_integer_keys(keys);
        if (!coerced) {
            return std::unexpected(coerced.error());
        }
        built.keys = std::move(*coerced);
    }
    auto normalized = normalize(built.keys);
    if (!normalized) {
        return std::unexpected(normalized.error());
    }

    auto plan = planner_.plan(start, end, options.rollup);
    if (!plan) {
        return std::unexpected(plan.error());
    }
    const auto rollup = plan->rollup;

    auto& request = built.request;
    request.dataset = model_settings.dataset;
    if (request.dataset == Dataset::Outcomes && rollup == config_.raw_outcomes_rollup) {
        request.dataset = Dataset::OutcomesRaw;
    }

    const bool manual_time = options.group_on_time && requires_manual_time(model);
    if (options.group_on_time) {
        built.time_column = manual_time ? config_.time_alias : kTimeColumn;
    }

    if (options.group_on_model && model_settings.group_by) {
        request.group_by.push_back(*model_settings.group_by);
    }
    if (options.group_on_time) {
        request.group_by.push_back(built.time_column);
    }
    auto aggregate_column = model_settings.aggregate;
    if (options.aggregation == ir::AggFunc::Count && aggregate_column) {
        // COUNT(col) becomes COUNT() GROUP BY col: distinct values turn into
        // their own grouping level.
        request.group_by.push_back(*aggregate_column);
        aggregate_column.reset();
    }

    if (model_settings.group_by) {
        request.filter_keys[*model_settings.group_by] = normalized->primary;
    }
    if (model_settings.aggregate && normalized->secondary) {
        request.filter_keys[*model_settings.aggregate] = *normalized->secondary;
    }
    if (options.environment_ids) {
        request.filter_keys[kEnvironmentColumn] = to_keys(*options.environment_ids);
    }

    request.aggregations.push_back(ir::AggSpec{
        .func = options.aggregation,
        .column = std::move(aggregate_column),
        .alias = config_.aggregate_alias,
        .top_k = options.aggregation == ir::AggFunc::TopK ? options.top_k : 0,
    });
    if (manual_time) {
        request.computed.push_back(manual_time_bucket(rollup, config_.time_alias));
    }

    auto series = apply_jitter(std::move(plan->series), start, rollup, options.jitter_value);
    request.start = Timestamp{series.front()};
    request.end = Timestamp{series.back() + rollup};
    request.rollup = rollup;
    const auto wanted =
        static_cast<std::int64_t>(normalized->primary.size() * series.size());
    request.limit = std::min(config_.max_limit, wanted);

    request.conditions = options.conditions;
    request.conditions.insert(request.conditions.end(), model_settings.conditions.begin(),
                              model_settings.conditions.end());

    if (options.group_on_time) {
        request.order_by.push_back(ir::OrderKey{.name = built.time_column, .ascending = false});
    }
    if (options.group_on_model && model_settings.group_by) {
        request.order_by.push_back(ir::OrderKey{.name = *model_settings.group_by});
    }

    request.selected_columns = model_settings.selected_columns;
    request.referrer = fmt::format("tsdb-modelid:{}", model_id(model));
    request.is_grouprelease = model == Model::frequent_releases_by_group;
    request.use_cache = options.use_cache;

    built.expected = request.filter_keys;
    if (options.group_on_time) {
        std::vector<Key> buckets;
        buckets.reserve(series.size());
        for (auto bucket : series) {
            buckets.emplace_back(bucket);
        }
        built.expected[built.time_column] = std::move(buckets);
    }
    built.plan = BucketPlan{.rollup = rollup, .series = std::move(series)};
    built.skip_backend = normalized->primary.empty();
    built.unnest_selected =
        request.selected_columns.has_value() && !request.selected_columns->empty();
    built.unnest_time = manual_time;

    spdlog::debug("tsdb: {} -> {}", model_name(model), ir::describe(request));
    return built;
}

}  // namespace tally::query
