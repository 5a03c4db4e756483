#include <tally/ir/expr.hpp>

#include <fmt/format.h>
#include <fmt/ranges.h>

#include <type_traits>

namespace tally::ir {

auto equal(const Expr& lhs, const Expr& rhs) -> bool {
    if (lhs.node.index() != rhs.node.index()) {
        return false;
    }
    if (const auto* l = std::get_if<CallExpr>(&lhs.node)) {
        const auto& r = std::get<CallExpr>(rhs.node);
        if (l->callee != r.callee || l->args.size() != r.args.size()) {
            return false;
        }
        for (std::size_t i = 0; i < l->args.size(); ++i) {
            if (!equal(*l->args[i], *r.args[i])) {
                return false;
            }
        }
        return true;
    }
    if (const auto* l = std::get_if<ColumnRef>(&lhs.node)) {
        return *l == std::get<ColumnRef>(rhs.node);
    }
    return std::get<Literal>(lhs.node) == std::get<Literal>(rhs.node);
}

auto col(std::string name) -> Expr {
    return Expr{.node = ColumnRef{.name = std::move(name)}};
}

auto lit(std::int64_t value) -> Expr {
    return Expr{.node = Literal{.value = value}};
}

auto call(std::string callee, std::vector<Expr> args) -> Expr {
    CallExpr c;
    c.callee = std::move(callee);
    c.args.reserve(args.size());
    for (auto& arg : args) {
        c.args.push_back(std::make_shared<Expr>(std::move(arg)));
    }
    return Expr{.node = std::move(c)};
}

auto field(std::string alias, Expr expr) -> FieldSpec {
    return FieldSpec{.alias = std::move(alias), .expr = std::move(expr)};
}

auto agg_name(const AggSpec& spec) -> std::string {
    switch (spec.func) {
        case AggFunc::Count:
            return "count()";
        case AggFunc::Sum:
            return "sum";
        case AggFunc::Uniq:
            return "uniq";
        case AggFunc::TopK:
            return fmt::format("topK({})", spec.top_k);
    }
    return "?";
}

auto compare_op_name(CompareOp op) -> std::string {
    switch (op) {
        case CompareOp::Eq:
            return "=";
        case CompareOp::Ne:
            return "!=";
        case CompareOp::Lt:
            return "<";
        case CompareOp::Le:
            return "<=";
        case CompareOp::Gt:
            return ">";
        case CompareOp::Ge:
            return ">=";
        case CompareOp::In:
            return "IN";
        case CompareOp::NotIn:
            return "NOT IN";
    }
    return "?";
}

auto format_expr(const Expr& expr) -> std::string {
    return std::visit(
        [](const auto& n) -> std::string {
            using T = std::decay_t<decltype(n)>;
            if constexpr (std::is_same_v<T, ColumnRef>) {
                return n.name;
            } else if constexpr (std::is_same_v<T, Literal>) {
                return fmt::format("{}", n.value);
            } else {
                std::string out = n.callee;
                out.push_back('(');
                for (std::size_t i = 0; i < n.args.size(); ++i) {
                    if (i > 0) {
                        out.append(", ");
                    }
                    out.append(format_expr(*n.args[i]));
                }
                out.push_back(')');
                return out;
            }
        },
        expr.node);
}

auto format_condition(const Condition& cond) -> std::string {
    auto value = std::visit(
        [](const auto& v) -> std::string {
            using T = std::decay_t<decltype(v)>;
            if constexpr (std::is_same_v<T, std::int64_t>) {
                return fmt::format("{}", v);
            } else if constexpr (std::is_same_v<T, std::string>) {
                return fmt::format("'{}'", v);
            } else {
                return fmt::format("({})", fmt::join(v, ", "));
            }
        },
        cond.value);
    return fmt::format("{} {} {}", cond.column, compare_op_name(cond.op), value);
}

}  // namespace tally::ir
