#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace tally::ir {

/// Column reference in a backend expression.
struct ColumnRef {
    std::string name;

    auto operator==(const ColumnRef&) const -> bool = default;
};

struct Expr;
using ExprPtr = std::shared_ptr<Expr>;

struct Literal {
    std::int64_t value = 0;

    auto operator==(const Literal&) const -> bool = default;
};

/// Backend function application, e.g. `toStartOfHour(timestamp)`.
struct CallExpr {
    std::string callee;
    std::vector<ExprPtr> args;
};

struct Expr {
    std::variant<ColumnRef, Literal, CallExpr> node;
};

/// Structural equality (children compared by value, not by pointer).
[[nodiscard]] auto equal(const Expr& lhs, const Expr& rhs) -> bool;

/// A computed or projected column: an alias mapped to an expression.
struct FieldSpec {
    std::string alias;
    Expr expr;
};

struct OrderKey {
    std::string name;
    bool ascending = true;

    auto operator==(const OrderKey&) const -> bool = default;
};

/// Comparison operators accepted in filter conditions.
enum class CompareOp : std::uint8_t {
    Eq,
    Ne,
    Lt,
    Le,
    Gt,
    Ge,
    In,
    NotIn,
};

using ConditionValue = std::variant<std::int64_t, std::string, std::vector<std::int64_t>,
                                    std::vector<std::string>>;

/// A single `column op value` predicate. Conditions are plain values; copying
/// a list of them never shares state with the source.
struct Condition {
    std::string column;
    CompareOp op = CompareOp::Eq;
    ConditionValue value;

    auto operator==(const Condition&) const -> bool = default;
};

/// Aggregate functions the backend understands.
enum class AggFunc : std::uint8_t {
    /// Bare `count()`. Triggers the group-by rewrite when the model has an
    /// aggregate column.
    Count,
    Sum,
    Uniq,
    TopK,
};

/// Aggregation specification: apply function to column, store as alias.
struct AggSpec {
    AggFunc func = AggFunc::Count;
    std::optional<std::string> column;
    std::string alias;
    /// Only meaningful for TopK.
    std::size_t top_k = 0;

    auto operator==(const AggSpec&) const -> bool = default;
};

// ─── Builders ─────────────────────────────────────────────────────────────────

[[nodiscard]] auto col(std::string name) -> Expr;
[[nodiscard]] auto lit(std::int64_t value) -> Expr;
[[nodiscard]] auto call(std::string callee, std::vector<Expr> args) -> Expr;
[[nodiscard]] auto field(std::string alias, Expr expr) -> FieldSpec;

// ─── Rendering ────────────────────────────────────────────────────────────────

/// Backend spelling of an aggregate: `count()`, `sum`, `uniq`, `topK(10)`.
[[nodiscard]] auto agg_name(const AggSpec& spec) -> std::string;
[[nodiscard]] auto compare_op_name(CompareOp op) -> std::string;
[[nodiscard]] auto format_expr(const Expr& expr) -> std::string;
[[nodiscard]] auto format_condition(const Condition& cond) -> std::string;

}  // namespace tally::ir
