#include <tally/query/buckets.hpp>

#include <fmt/format.h>

namespace tally {

auto default_rollups() -> std::vector<RollupSpec> {
    return {
        RollupSpec{.seconds = 10, .samples = 360},
        RollupSpec{.seconds = kSecondsPerHour, .samples = 24 * 7},
        RollupSpec{.seconds = kSecondsPerDay, .samples = 90},
    };
}

BucketPlanner::BucketPlanner(std::vector<RollupSpec> rollups) : rollups_(std::move(rollups)) {}

auto BucketPlanner::optimal_rollup(Timestamp start, Timestamp end) const -> std::int64_t {
    const auto span = end.seconds - start.seconds;
    for (const auto& spec : rollups_) {
        if (spec.seconds * spec.samples >= span) {
            return spec.seconds;
        }
    }
    return rollups_.back().seconds;
}

auto BucketPlanner::plan(Timestamp start, Timestamp end, std::optional<std::int64_t> rollup) const
    -> QueryResult<BucketPlan> {
    if (!rollup && rollups_.empty()) {
        return std::unexpected(
            make_error(ErrorKind::InvalidArgument, "no rollups configured"));
    }
    if (end < start) {
        return std::unexpected(make_error(
            ErrorKind::InvalidArgument,
            fmt::format("window end {} is before start {}", end.seconds, start.seconds)));
    }
    const auto resolved = rollup ? *rollup : optimal_rollup(start, end);
    if (resolved <= 0) {
        return std::unexpected(make_error(ErrorKind::InvalidArgument,
                                          fmt::format("rollup must be positive, got {}", resolved)));
    }

    BucketPlan plan{.rollup = resolved, .series = {floor_to(start.seconds, resolved)}};
    while (plan.series.back() + resolved < end.seconds) {
        plan.series.push_back(plan.series.back() + resolved);
    }
    return plan;
}

auto apply_jitter(std::vector<std::int64_t> series, Timestamp start, std::int64_t rollup,
                  std::optional<std::int64_t> seed) -> std::vector<std::int64_t> {
    if (!seed || *seed == 0 || series.empty() || rollup <= 0) {
        return series;
    }
    auto jitter = *seed % rollup;
    if (jitter < 0) {
        jitter += rollup;
    }
    if (start.seconds - series.front() < jitter) {
        jitter -= rollup;
    }
    for (auto& bucket : series) {
        bucket += jitter;
    }
    return series;
}

}  // namespace tally
