#pragma once

#include <tally/core/error.hpp>
#include <tally/ir/expr.hpp>
#include <tally/model/model.hpp>

#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace tally {

/// How a model is queried from the backend.
struct ModelQuerySettings {
    /// Table family to query.
    Dataset dataset = Dataset::Events;
    /// Primary grouping column.
    std::optional<std::string> group_by;
    /// Column the aggregate function is applied to.
    std::optional<std::string> aggregate;
    /// Mandatory predicates applied to every query for this model.
    std::vector<ir::Condition> conditions;
    /// Explicit projection for models whose rows must be expanded
    /// (`arrayJoin`) before grouping.
    std::optional<std::vector<ir::FieldSpec>> selected_columns;
};

/// Inbound filter reason code and the outcome model counting it.
struct FilterReason {
    std::string_view code;
    Model model;
};

[[nodiscard]] auto filter_reasons() noexcept -> std::span<const FilterReason>;

/// Immutable model -> settings table.
///
/// Built once from disjoint tables; never mutated afterwards, so a single
/// instance can be shared by concurrent callers without locking.
class ModelRegistry {
   public:
    using Table = std::unordered_map<Model, ModelQuerySettings>;

    /// Registry with the built-in tables.
    ModelRegistry();

    /// Merge the given tables. Throws std::invalid_argument if two tables
    /// define the same model.
    explicit ModelRegistry(std::vector<Table> tables);

    /// Look up a model; nullptr when unregistered.
    [[nodiscard]] auto find(Model model) const -> const ModelQuerySettings*;

    /// Look up a model; UnsupportedModel when unregistered.
    [[nodiscard]] auto lookup(Model model) const -> QueryResult<const ModelQuerySettings*>;

    [[nodiscard]] auto contains(Model model) const -> bool { return entries_.contains(model); }

    /// Registered models in ascending id order.
    [[nodiscard]] auto models() const -> std::vector<Model>;

    [[nodiscard]] auto size() const noexcept -> std::size_t { return entries_.size(); }

   private:
    Table entries_;
};

/// One entry per filter reason: accepted/filtered/rate-limited error outcomes
/// carrying that reason.
[[nodiscard]] auto filter_outcome_settings() -> ModelRegistry::Table;

/// Organization, project and key level received/rejected/blacklisted totals.
[[nodiscard]] auto outcome_total_settings() -> ModelRegistry::Table;

/// Event, transaction and issue-platform models.
[[nodiscard]] auto non_outcome_settings() -> ModelRegistry::Table;

/// Process-wide registry with the built-in tables, built on first use.
[[nodiscard]] auto default_registry() -> const ModelRegistry&;

}  // namespace tally
