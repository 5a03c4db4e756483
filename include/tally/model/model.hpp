#pragma once

#include <cstdint>
#include <optional>
#include <span>
#include <string_view>

namespace tally {

/// Logical metric series. Values are the stable wire ids used in referrers.
enum class Model : std::uint16_t {
    internal = 0,
    project = 1,
    group = 4,
    release = 7,
    group_performance = 20,
    group_profiling = 21,

    users_affected_by_group = 300,
    users_affected_by_project = 301,
    users_affected_by_perf_group = 302,
    users_affected_by_profile_group = 303,

    frequent_environments_by_group = 404,
    frequent_releases_by_group = 405,
    frequent_issues_by_project = 406,

    organization_total_received = 500,
    organization_total_rejected = 501,
    organization_total_blacklisted = 502,

    project_total_received = 600,
    project_total_rejected = 601,
    project_total_forwarded = 602,
    project_total_blacklisted = 603,

    key_total_received = 700,
    key_total_rejected = 701,
    key_total_blacklisted = 702,

    project_total_received_ip_address = 800,
    project_total_received_release_version = 801,
    project_total_received_error_message = 802,
    project_total_received_browser_extensions = 803,
    project_total_received_legacy_browsers = 804,
    project_total_received_localhost = 805,
    project_total_received_web_crawlers = 806,
    project_total_received_invalid_csp = 807,
    project_total_received_cors = 808,
    project_total_received_discarded_hash = 809,
    project_total_received_crash_report_limit = 810,
    project_total_received_health_check = 811,

    servicehook_fired = 900,
};

/// Backend table families.
enum class Dataset : std::uint8_t {
    Events,
    Transactions,
    IssuePlatform,
    Outcomes,
    /// Unaggregated outcomes, the only source with sub-hour buckets.
    OutcomesRaw,
};

/// Outcome codes recorded per ingested item.
enum class Outcome : std::int64_t {
    Accepted = 0,
    Filtered = 1,
    RateLimited = 2,
    Invalid = 3,
    Abuse = 4,
    ClientDiscard = 5,
};

[[nodiscard]] constexpr auto model_id(Model model) noexcept -> std::int64_t {
    return static_cast<std::int64_t>(model);
}

[[nodiscard]] auto model_name(Model model) noexcept -> std::string_view;
[[nodiscard]] auto parse_model(std::string_view name) -> std::optional<Model>;

/// Every enumerator, registered or not.
[[nodiscard]] auto all_models() noexcept -> std::span<const Model>;

[[nodiscard]] auto dataset_name(Dataset dataset) noexcept -> std::string_view;
[[nodiscard]] auto parse_dataset(std::string_view name) -> std::optional<Dataset>;

}  // namespace tally
