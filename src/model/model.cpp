#include <tally/model/model.hpp>

#include <array>
#include <utility>

namespace tally {

namespace {

using ModelName = std::pair<Model, std::string_view>;

constexpr std::array kModelNames{
    ModelName{Model::internal, "internal"},
    ModelName{Model::project, "project"},
    ModelName{Model::group, "group"},
    ModelName{Model::release, "release"},
    ModelName{Model::group_performance, "group_performance"},
    ModelName{Model::group_profiling, "group_profiling"},
    ModelName{Model::users_affected_by_group, "users_affected_by_group"},
    ModelName{Model::users_affected_by_project, "users_affected_by_project"},
    ModelName{Model::users_affected_by_perf_group, "users_affected_by_perf_group"},
    ModelName{Model::users_affected_by_profile_group, "users_affected_by_profile_group"},
    ModelName{Model::frequent_environments_by_group, "frequent_environments_by_group"},
    ModelName{Model::frequent_releases_by_group, "frequent_releases_by_group"},
    ModelName{Model::frequent_issues_by_project, "frequent_issues_by_project"},
    ModelName{Model::organization_total_received, "organization_total_received"},
    ModelName{Model::organization_total_rejected, "organization_total_rejected"},
    ModelName{Model::organization_total_blacklisted, "organization_total_blacklisted"},
    ModelName{Model::project_total_received, "project_total_received"},
    ModelName{Model::project_total_rejected, "project_total_rejected"},
    ModelName{Model::project_total_forwarded, "project_total_forwarded"},
    ModelName{Model::project_total_blacklisted, "project_total_blacklisted"},
    ModelName{Model::key_total_received, "key_total_received"},
    ModelName{Model::key_total_rejected, "key_total_rejected"},
    ModelName{Model::key_total_blacklisted, "key_total_blacklisted"},
    ModelName{Model::project_total_received_ip_address, "project_total_received_ip_address"},
    ModelName{Model::project_total_received_release_version,
              "project_total_received_release_version"},
    ModelName{Model::project_total_received_error_message,
              "project_total_received_error_message"},
    ModelName{Model::project_total_received_browser_extensions,
              "project_total_received_browser_extensions"},
    ModelName{Model::project_total_received_legacy_browsers,
              "project_total_received_legacy_browsers"},
    ModelName{Model::project_total_received_localhost, "project_total_received_localhost"},
    ModelName{Model::project_total_received_web_crawlers,
              "project_total_received_web_crawlers"},
    ModelName{Model::project_total_received_invalid_csp, "project_total_received_invalid_csp"},
    ModelName{Model::project_total_received_cors, "project_total_received_cors"},
    ModelName{Model::project_total_received_discarded_hash,
              "project_total_received_discarded_hash"},
    ModelName{Model::project_total_received_crash_report_limit,
              "project_total_received_crash_report_limit"},
    ModelName{Model::project_total_received_health_check,
              "project_total_received_health_check"},
    ModelName{Model::servicehook_fired, "servicehook_fired"},
};

constexpr auto make_model_list() {
    std::array<Model, kModelNames.size()> models{};
    for (std::size_t i = 0; i < kModelNames.size(); ++i) {
        models[i] = kModelNames[i].first;
    }
    return models;
}

constexpr auto kModels = make_model_list();

constexpr std::array kDatasetNames{
    std::pair{Dataset::Events, std::string_view{"events"}},
    std::pair{Dataset::Transactions, std::string_view{"transactions"}},
    std::pair{Dataset::IssuePlatform, std::string_view{"search_issues"}},
    std::pair{Dataset::Outcomes, std::string_view{"outcomes"}},
    std::pair{Dataset::OutcomesRaw, std::string_view{"outcomes_raw"}},
};

}  // namespace

auto model_name(Model model) noexcept -> std::string_view {
    for (const auto& [m, name] : kModelNames) {
        if (m == model) {
            return name;
        }
    }
    return "unknown";
}

auto parse_model(std::string_view name) -> std::optional<Model> {
    for (const auto& [m, n] : kModelNames) {
        if (n == name) {
            return m;
        }
    }
    return std::nullopt;
}

auto all_models() noexcept -> std::span<const Model> {
    return kModels;
}

auto dataset_name(Dataset dataset) noexcept -> std::string_view {
    for (const auto& [d, name] : kDatasetNames) {
        if (d == dataset) {
            return name;
        }
    }
    return "unknown";
}

auto parse_dataset(std::string_view name) -> std::optional<Dataset> {
    for (const auto& [d, n] : kDatasetNames) {
        if (n == name) {
            return d;
        }
    }
    return std::nullopt;
}

}  // namespace tally
