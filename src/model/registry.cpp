#include <tally/model/registry.hpp>

#include <fmt/format.h>

#include <algorithm>
#include <array>
#include <stdexcept>

namespace tally {

namespace {

constexpr std::array kFilterReasons{
    FilterReason{"ip-address", Model::project_total_received_ip_address},
    FilterReason{"release-version", Model::project_total_received_release_version},
    FilterReason{"error-message", Model::project_total_received_error_message},
    FilterReason{"browser-extensions", Model::project_total_received_browser_extensions},
    FilterReason{"legacy-browsers", Model::project_total_received_legacy_browsers},
    FilterReason{"localhost", Model::project_total_received_localhost},
    FilterReason{"web-crawlers", Model::project_total_received_web_crawlers},
    FilterReason{"invalid-csp", Model::project_total_received_invalid_csp},
    FilterReason{"cors", Model::project_total_received_cors},
    FilterReason{"discarded-hash", Model::project_total_received_discarded_hash},
    FilterReason{"crash-report-limit", Model::project_total_received_crash_report_limit},
    FilterReason{"health-check", Model::project_total_received_health_check},
};

// DEFAULT, ERROR and SECURITY are all counted as errors.
constexpr std::array<std::int64_t, 3> kErrorCategories{0, 1, 3};

constexpr std::array<std::int64_t, 6> kProfileOccurrenceTypes{2000, 2001, 2002,
                                                              2003, 2004, 2005};

auto outcome_code(Outcome outcome) -> std::int64_t {
    return static_cast<std::int64_t>(outcome);
}

// Client discards and invalid items are excluded so totals line up with
// organization stats.
auto total_received_condition() -> ir::Condition {
    return ir::Condition{
        .column = "outcome",
        .op = ir::CompareOp::In,
        .value = std::vector<std::int64_t>{outcome_code(Outcome::Accepted),
                                           outcome_code(Outcome::Filtered),
                                           outcome_code(Outcome::RateLimited)},
    };
}

auto outcome_equals(Outcome outcome) -> ir::Condition {
    return ir::Condition{
        .column = "outcome", .op = ir::CompareOp::Eq, .value = outcome_code(outcome)};
}

auto error_category_condition() -> ir::Condition {
    return ir::Condition{
        .column = "category",
        .op = ir::CompareOp::In,
        .value = std::vector<std::int64_t>(kErrorCategories.begin(), kErrorCategories.end()),
    };
}

// Transactions are stored next to errors; keep them out of event counts.
auto events_type_condition() -> ir::Condition {
    return ir::Condition{
        .column = "type", .op = ir::CompareOp::Ne, .value = std::string("transaction")};
}

auto profile_occurrence_condition() -> ir::Condition {
    return ir::Condition{
        .column = "occurrence_type_id",
        .op = ir::CompareOp::In,
        .value = std::vector<std::int64_t>(kProfileOccurrenceTypes.begin(),
                                           kProfileOccurrenceTypes.end()),
    };
}

auto group_ids_expansion() -> std::vector<ir::FieldSpec> {
    std::vector<ir::FieldSpec> columns;
    columns.push_back(ir::field("group_id", ir::call("arrayJoin", {ir::col("group_ids")})));
    return columns;
}

auto outcome_total(std::string group_by, ir::Condition outcome) -> ModelQuerySettings {
    return ModelQuerySettings{
        .dataset = Dataset::Outcomes,
        .group_by = std::move(group_by),
        .aggregate = "quantity",
        .conditions = {std::move(outcome), error_category_condition()},
    };
}

auto events_model(std::string group_by, std::optional<std::string> aggregate)
    -> ModelQuerySettings {
    return ModelQuerySettings{
        .dataset = Dataset::Events,
        .group_by = std::move(group_by),
        .aggregate = std::move(aggregate),
        .conditions = {events_type_condition()},
    };
}

}  // namespace

auto filter_reasons() noexcept -> std::span<const FilterReason> {
    return kFilterReasons;
}

auto filter_outcome_settings() -> ModelRegistry::Table {
    ModelRegistry::Table table;
    for (const auto& reason : kFilterReasons) {
        table.emplace(reason.model,
                      ModelQuerySettings{
                          .dataset = Dataset::Outcomes,
                          .group_by = "project_id",
                          .aggregate = "quantity",
                          .conditions =
                              {
                                  ir::Condition{.column = "reason",
                                                .op = ir::CompareOp::Eq,
                                                .value = std::string(reason.code)},
                                  total_received_condition(),
                                  error_category_condition(),
                              },
                      });
    }
    return table;
}

auto outcome_total_settings() -> ModelRegistry::Table {
    ModelRegistry::Table table;
    struct Level {
        const char* column;
        Model received;
        Model rejected;
        Model blacklisted;
    };
    const std::array levels{
        Level{"org_id", Model::organization_total_received, Model::organization_total_rejected,
              Model::organization_total_blacklisted},
        Level{"project_id", Model::project_total_received, Model::project_total_rejected,
              Model::project_total_blacklisted},
        Level{"key_id", Model::key_total_received, Model::key_total_rejected,
              Model::key_total_blacklisted},
    };
    for (const auto& level : levels) {
        table.emplace(level.received, outcome_total(level.column, total_received_condition()));
        table.emplace(level.rejected,
                      outcome_total(level.column, outcome_equals(Outcome::RateLimited)));
        table.emplace(level.blacklisted,
                      outcome_total(level.column, outcome_equals(Outcome::Filtered)));
    }
    return table;
}

auto non_outcome_settings() -> ModelRegistry::Table {
    ModelRegistry::Table table;
    table.emplace(Model::project, events_model("project_id", std::nullopt));
    table.emplace(Model::group, events_model("group_id", std::nullopt));
    table.emplace(Model::release, events_model("tags[sentry:release]", std::nullopt));
    table.emplace(Model::users_affected_by_group, events_model("group_id", "tags[sentry:user]"));
    table.emplace(Model::users_affected_by_project,
                  events_model("project_id", "tags[sentry:user]"));
    table.emplace(Model::frequent_environments_by_group,
                  events_model("group_id", "environment"));
    table.emplace(Model::frequent_releases_by_group,
                  events_model("group_id", "tags[sentry:release]"));
    table.emplace(Model::frequent_issues_by_project, events_model("project_id", "group_id"));

    table.emplace(Model::group_performance, ModelQuerySettings{
                                                .dataset = Dataset::Transactions,
                                                .group_by = "group_id",
                                                .aggregate = std::nullopt,
                                                .conditions = {},
                                                .selected_columns = group_ids_expansion(),
                                            });
    table.emplace(Model::users_affected_by_perf_group,
                  ModelQuerySettings{
                      .dataset = Dataset::Transactions,
                      .group_by = "group_id",
                      .aggregate = "tags[sentry:user]",
                      .conditions = {},
                      .selected_columns = group_ids_expansion(),
                  });

    table.emplace(Model::group_profiling, ModelQuerySettings{
                                              .dataset = Dataset::IssuePlatform,
                                              .group_by = "group_id",
                                              .aggregate = std::nullopt,
                                              .conditions = {profile_occurrence_condition()},
                                          });
    table.emplace(Model::users_affected_by_profile_group,
                  ModelQuerySettings{
                      .dataset = Dataset::IssuePlatform,
                      .group_by = "group_id",
                      .aggregate = "tags[sentry:user]",
                      .conditions = {profile_occurrence_condition()},
                  });
    return table;
}

ModelRegistry::ModelRegistry()
    : ModelRegistry(std::vector<Table>{filter_outcome_settings(), outcome_total_settings(),
                                       non_outcome_settings()}) {}

ModelRegistry::ModelRegistry(std::vector<Table> tables) {
    for (auto& table : tables) {
        for (auto& [model, settings] : table) {
            auto [it, inserted] = entries_.emplace(model, std::move(settings));
            if (!inserted) {
                throw std::invalid_argument(
                    fmt::format("model '{}' is defined twice", model_name(model)));
            }
        }
    }
}

auto ModelRegistry::find(Model model) const -> const ModelQuerySettings* {
    if (auto it = entries_.find(model); it != entries_.end()) {
        return &it->second;
    }
    return nullptr;
}

auto ModelRegistry::lookup(Model model) const -> QueryResult<const ModelQuerySettings*> {
    const auto* settings = find(model);
    if (settings == nullptr) {
        return std::unexpected(make_error(
            ErrorKind::UnsupportedModel,
            fmt::format("model '{}' ({}) is not registered", model_name(model), model_id(model))));
    }
    return settings;
}

auto ModelRegistry::models() const -> std::vector<Model> {
    std::vector<Model> out;
    out.reserve(entries_.size());
    for (const auto& entry : entries_) {
        out.push_back(entry.first);
    }
    std::ranges::sort(out, [](Model a, Model b) { return model_id(a) < model_id(b); });
    return out;
}

auto default_registry() -> const ModelRegistry& {
    static const ModelRegistry registry;
    return registry;
}

}  // namespace tally
