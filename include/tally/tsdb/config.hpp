#pragma once

#include <tally/model/model.hpp>
#include <tally/query/buckets.hpp>

#include <cstdint>
#include <string>
#include <vector>

namespace tally {

/// Tunables shared by the query builder and the facade.
struct TsdbConfig {
    /// Supported rollups, finest first.
    std::vector<RollupSpec> rollups = default_rollups();
    /// Upper bound on rows requested from the backend.
    std::int64_t max_limit = 10000;
    /// The one sub-hour rollup, served from the raw outcomes dataset.
    std::int64_t raw_outcomes_rollup = 10;
    /// Output alias of the aggregate expression.
    std::string aggregate_alias = "aggregate";
    /// Alias of the synthetic time bucket for models grouped on time manually.
    std::string time_alias = "time_t";
    /// Models whose dataset cannot group on the native `time` column.
    std::vector<Model> manual_time_models = {Model::group_profiling,
                                             Model::users_affected_by_profile_group};
};

}  // namespace tally
