#include <tally/model/registry.hpp>

#include <catch2/catch_test_macros.hpp>

#include <algorithm>
#include <stdexcept>
#include <vector>

using tally::Dataset;
using tally::ErrorKind;
using tally::Model;

TEST_CASE("Every registered model has a known dataset", "[registry]") {
    const auto& registry = tally::default_registry();
    REQUIRE(registry.size() > 0);
    for (auto model : registry.models()) {
        auto settings = registry.lookup(model);
        REQUIRE(settings.has_value());
        const auto dataset = (*settings)->dataset;
        REQUIRE(tally::parse_dataset(tally::dataset_name(dataset)) == dataset);
    }
}

TEST_CASE("Unregistered models fail with UnsupportedModel", "[registry]") {
    const auto& registry = tally::default_registry();
    for (auto model : {Model::internal, Model::project_total_forwarded, Model::servicehook_fired}) {
        REQUIRE_FALSE(registry.contains(model));
        REQUIRE(registry.find(model) == nullptr);
        auto settings = registry.lookup(model);
        REQUIRE_FALSE(settings.has_value());
        REQUIRE(settings.error().kind == ErrorKind::UnsupportedModel);
    }
}

TEST_CASE("Registry lists models in id order", "[registry]") {
    auto models = tally::default_registry().models();
    REQUIRE(std::ranges::is_sorted(models, [](Model a, Model b) {
        return tally::model_id(a) < tally::model_id(b);
    }));
    REQUIRE(models.front() == Model::project);
}

TEST_CASE("Filter reason models count project outcomes", "[registry][outcomes]") {
    const auto& registry = tally::default_registry();
    REQUIRE(tally::filter_reasons().size() == 12);
    for (const auto& reason : tally::filter_reasons()) {
        const auto* settings = registry.find(reason.model);
        REQUIRE(settings != nullptr);
        REQUIRE(settings->dataset == Dataset::Outcomes);
        REQUIRE(settings->group_by == "project_id");
        REQUIRE(settings->aggregate == "quantity");
        REQUIRE(settings->conditions.size() == 3);
        REQUIRE(settings->conditions[0].column == "reason");
        REQUIRE(settings->conditions[0].value == tally::ir::ConditionValue{std::string(reason.code)});
    }
}

TEST_CASE("Outcome totals select the outcome per kind", "[registry][outcomes]") {
    const auto& registry = tally::default_registry();

    const auto* rejected = registry.find(Model::key_total_rejected);
    REQUIRE(rejected != nullptr);
    REQUIRE(rejected->group_by == "key_id");
    REQUIRE(rejected->conditions.front().op == tally::ir::CompareOp::Eq);
    REQUIRE(rejected->conditions.front().value == tally::ir::ConditionValue{std::int64_t{2}});

    const auto* received = registry.find(Model::organization_total_received);
    REQUIRE(received != nullptr);
    REQUIRE(received->group_by == "org_id");
    REQUIRE(received->conditions.front().op == tally::ir::CompareOp::In);
    REQUIRE(received->conditions.front().value ==
            tally::ir::ConditionValue{std::vector<std::int64_t>{0, 1, 2}});

    const auto* blacklisted = registry.find(Model::project_total_blacklisted);
    REQUIRE(blacklisted != nullptr);
    REQUIRE(blacklisted->conditions.front().value == tally::ir::ConditionValue{std::int64_t{1}});
    REQUIRE(blacklisted->conditions.back().column == "category");
}

TEST_CASE("Event models exclude transactions", "[registry][events]") {
    const auto* settings = tally::default_registry().find(Model::users_affected_by_group);
    REQUIRE(settings != nullptr);
    REQUIRE(settings->dataset == Dataset::Events);
    REQUIRE(settings->group_by == "group_id");
    REQUIRE(settings->aggregate == "tags[sentry:user]");
    REQUIRE(settings->conditions.size() == 1);
    REQUIRE(settings->conditions.front().column == "type");
    REQUIRE(settings->conditions.front().op == tally::ir::CompareOp::Ne);
}

TEST_CASE("Performance models expand group ids", "[registry][transactions]") {
    const auto* settings = tally::default_registry().find(Model::group_performance);
    REQUIRE(settings != nullptr);
    REQUIRE(settings->dataset == Dataset::Transactions);
    REQUIRE(settings->selected_columns.has_value());
    REQUIRE(settings->selected_columns->size() == 1);
    const auto& column = settings->selected_columns->front();
    REQUIRE(column.alias == "group_id");
    REQUIRE(tally::ir::format_expr(column.expr) == "arrayJoin(group_ids)");
}

TEST_CASE("Profiling models read the issue platform", "[registry][profiling]") {
    const auto* settings = tally::default_registry().find(Model::users_affected_by_profile_group);
    REQUIRE(settings != nullptr);
    REQUIRE(settings->dataset == Dataset::IssuePlatform);
    REQUIRE(tally::dataset_name(settings->dataset) == "search_issues");
    REQUIRE(settings->conditions.front().column == "occurrence_type_id");
}

TEST_CASE("Duplicate model definitions are rejected", "[registry]") {
    tally::ModelRegistry::Table first;
    first.emplace(Model::project, tally::ModelQuerySettings{.group_by = "project_id"});
    tally::ModelRegistry::Table second;
    second.emplace(Model::project, tally::ModelQuerySettings{.group_by = "other"});

    using Tables = std::vector<tally::ModelRegistry::Table>;
    REQUIRE_THROWS_AS(tally::ModelRegistry(Tables{first, second}), std::invalid_argument);

    tally::ModelRegistry single(Tables{first});
    REQUIRE(single.size() == 1);
    REQUIRE(single.contains(Model::project));
}

TEST_CASE("Model names round-trip", "[registry][model]") {
    for (auto model : tally::all_models()) {
        REQUIRE(tally::parse_model(tally::model_name(model)) == model);
    }
    REQUIRE(tally::model_name(Model::frequent_releases_by_group) == "frequent_releases_by_group");
    REQUIRE_FALSE(tally::parse_model("no_such_model").has_value());
}
