#pragma once

#include <tally/core/error.hpp>
#include <tally/core/time.hpp>

#include <cstdint>
#include <optional>
#include <vector>

namespace tally {

/// A supported rollup and how many buckets of it are kept.
struct RollupSpec {
    std::int64_t seconds = 0;
    std::int64_t samples = 0;
};

/// 10 s for an hour, hourly for a week, daily for 90 days.
[[nodiscard]] auto default_rollups() -> std::vector<RollupSpec>;

/// Resolved rollup and the bucket start timestamps covering a window.
struct BucketPlan {
    std::int64_t rollup = 0;
    std::vector<std::int64_t> series;

    /// Start of the first bucket.
    [[nodiscard]] auto start() const -> Timestamp { return Timestamp{series.front()}; }

    /// End of the last bucket. The backend is always queried over whole buckets.
    [[nodiscard]] auto end() const -> Timestamp { return Timestamp{series.back() + rollup}; }
};

class BucketPlanner {
   public:
    explicit BucketPlanner(std::vector<RollupSpec> rollups = default_rollups());

    /// Finest rollup whose retention covers `[start, end)`; the coarsest one
    /// when none does.
    [[nodiscard]] auto optimal_rollup(Timestamp start, Timestamp end) const -> std::int64_t;

    /// Bucket series from `start` rounded down to the rollup, while the next
    /// bucket still starts before `end`. Always contains at least one bucket.
    [[nodiscard]] auto plan(Timestamp start, Timestamp end,
                            std::optional<std::int64_t> rollup = std::nullopt) const
        -> QueryResult<BucketPlan>;

   private:
    std::vector<RollupSpec> rollups_;
};

/// Shift every bucket by `seed mod rollup`, moved one rollup back when the
/// shifted first bucket would start after `start`. Bucket count is unchanged;
/// a missing or zero seed leaves the series untouched.
[[nodiscard]] auto apply_jitter(std::vector<std::int64_t> series, Timestamp start,
                                std::int64_t rollup, std::optional<std::int64_t> seed)
    -> std::vector<std::int64_t>;

}  // namespace tally
