#include <tally/backend/memory_executor.hpp>
#include <tally/core/time.hpp>

#include <fmt/format.h>
#include <robin_hood.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <string>
#include <type_traits>
#include <unordered_set>
#include <utility>
#include <vector>

namespace tally::backend {

namespace {

constexpr const char* kTimeColumn = "time";
constexpr const char* kTimestampColumn = "timestamp";

using runtime::Cell;
using runtime::IntArray;
using Row = robin_hood::unordered_flat_map<std::string, Cell>;
using GroupKey = std::vector<Key>;

struct GroupKeyHash {
    auto operator()(const GroupKey& keys) const noexcept -> std::size_t {
        std::size_t seed = keys.size();
        for (const auto& key : keys) {
            seed ^= KeyHash{}(key) + 0x9e3779b97f4a7c15ULL + (seed << 6) + (seed >> 2);
        }
        return seed;
    }
};

struct Accumulator {
    std::int64_t rows = 0;
    std::int64_t sum = 0;
    robin_hood::unordered_flat_map<Key, std::int64_t, KeyHash> frequencies;
};

struct Group {
    std::vector<Accumulator> aggregates;
    /// Computed and selected column values of the first row in the group.
    std::vector<Key> outputs;
};

auto backend_error(std::string message) -> QueryError {
    return make_error(ErrorKind::BackendExecution, std::move(message));
}

auto to_key(const Cell& cell) -> std::optional<Key> {
    if (const auto* v = std::get_if<std::int64_t>(&cell)) {
        return Key{*v};
    }
    if (const auto* v = std::get_if<std::string>(&cell)) {
        return Key{*v};
    }
    return std::nullopt;
}

auto key_to_tree(const Key& key) -> Tree {
    return std::visit([](const auto& v) { return Tree{v}; }, key);
}

// ─── Expressions ──────────────────────────────────────────────────────────────

auto evaluate(const ir::Expr& expr, const Row& row) -> QueryResult<Cell>;

auto evaluate_call(const ir::CallExpr& call, const Row& row) -> QueryResult<Cell> {
    std::vector<std::int64_t> args;
    args.reserve(call.args.size());
    for (const auto& arg : call.args) {
        if (!arg) {
            return std::unexpected(backend_error(fmt::format("{}: missing argument", call.callee)));
        }
        auto value = evaluate(*arg, row);
        if (!value) {
            return std::unexpected(value.error());
        }
        const auto* number = std::get_if<std::int64_t>(&*value);
        if (number == nullptr) {
            return std::unexpected(
                backend_error(fmt::format("{}: expected an integer argument", call.callee)));
        }
        args.push_back(*number);
    }

    const auto& f = call.callee;
    if (args.size() == 1) {
        if (f == "toStartOfMinute") {
            return Cell{floor_to(args[0], kSecondsPerMinute)};
        }
        if (f == "toStartOfHour") {
            return Cell{floor_to(args[0], kSecondsPerHour)};
        }
        if (f == "toDate") {
            return Cell{floor_to(args[0], kSecondsPerDay)};
        }
        // Timestamps are already unix seconds.
        if (f == "toUnixTimestamp" || f == "toUInt32") {
            return Cell{args[0]};
        }
    }
    if (args.size() == 2) {
        if (f == "intDiv") {
            if (args[1] == 0) {
                return std::unexpected(backend_error("intDiv: division by zero"));
            }
            return Cell{args[0] / args[1]};
        }
        if (f == "multiply") {
            return Cell{args[0] * args[1]};
        }
    }
    return std::unexpected(
        backend_error(fmt::format("unsupported function {}/{}", f, args.size())));
}

auto evaluate(const ir::Expr& expr, const Row& row) -> QueryResult<Cell> {
    return std::visit(
        [&row](const auto& node) -> QueryResult<Cell> {
            using T = std::decay_t<decltype(node)>;
            if constexpr (std::is_same_v<T, ir::ColumnRef>) {
                auto it = row.find(node.name);
                if (it == row.end()) {
                    return std::unexpected(
                        backend_error(fmt::format("unknown column '{}'", node.name)));
                }
                return it->second;
            } else if constexpr (std::is_same_v<T, ir::Literal>) {
                return Cell{node.value};
            } else {
                return evaluate_call(node, row);
            }
        },
        expr.node);
}

/// Argument of a top-level `arrayJoin(x)`, nullptr otherwise.
auto array_join_argument(const ir::Expr& expr) -> const ir::Expr* {
    const auto* call = std::get_if<ir::CallExpr>(&expr.node);
    if (call == nullptr || call->callee != "arrayJoin" || call->args.size() != 1) {
        return nullptr;
    }
    return call->args.front().get();
}

void collect_columns(const ir::Expr& expr, std::vector<std::string>& out) {
    if (const auto* ref = std::get_if<ir::ColumnRef>(&expr.node)) {
        out.push_back(ref->name);
        return;
    }
    if (const auto* call = std::get_if<ir::CallExpr>(&expr.node)) {
        for (const auto& arg : call->args) {
            if (arg) {
                collect_columns(*arg, out);
            }
        }
    }
}

// ─── Validation ───────────────────────────────────────────────────────────────

auto validate(const runtime::Table& table, const ir::QueryRequest& request) -> QueryResult<void> {
    const auto* timestamps = table.find(kTimestampColumn);
    if (timestamps == nullptr || !std::holds_alternative<Column<std::int64_t>>(*timestamps)) {
        return std::unexpected(backend_error("table has no integer 'timestamp' column"));
    }

    std::unordered_set<std::string> available;
    for (const auto& entry : table.columns) {
        available.insert(entry.name);
    }
    if (request.rollup > 0) {
        available.insert(kTimeColumn);
    }

    auto check_expr = [&](const ir::FieldSpec& spec) -> QueryResult<void> {
        std::vector<std::string> refs;
        collect_columns(spec.expr, refs);
        for (const auto& name : refs) {
            if (!available.contains(name)) {
                return std::unexpected(backend_error(
                    fmt::format("unknown column '{}' in '{}'", name, spec.alias)));
            }
        }
        available.insert(spec.alias);
        return {};
    };
    if (request.selected_columns) {
        for (const auto& spec : *request.selected_columns) {
            if (auto ok = check_expr(spec); !ok) {
                return ok;
            }
        }
    }
    for (const auto& spec : request.computed) {
        if (auto ok = check_expr(spec); !ok) {
            return ok;
        }
    }

    auto require = [&available](const std::string& name) -> QueryResult<void> {
        if (!available.contains(name)) {
            return std::unexpected(backend_error(fmt::format("unknown column '{}'", name)));
        }
        return {};
    };
    for (const auto& name : request.group_by) {
        if (auto ok = require(name); !ok) {
            return ok;
        }
    }
    for (const auto& [name, keys] : request.filter_keys) {
        if (auto ok = require(name); !ok) {
            return ok;
        }
    }
    for (const auto& cond : request.conditions) {
        if (auto ok = require(cond.column); !ok) {
            return ok;
        }
    }
    for (const auto& spec : request.aggregations) {
        if (spec.column) {
            if (auto ok = require(*spec.column); !ok) {
                return ok;
            }
        } else if (spec.func != ir::AggFunc::Count) {
            return std::unexpected(
                backend_error(fmt::format("{} needs a column", ir::agg_name(spec))));
        }
    }
    for (const auto& key : request.order_by) {
        if (std::ranges::find(request.group_by, key.name) == request.group_by.end()) {
            return std::unexpected(backend_error(
                fmt::format("cannot order by '{}': not a grouping column", key.name)));
        }
    }
    return {};
}

// ─── Row filters ──────────────────────────────────────────────────────────────

auto condition_values(const ir::ConditionValue& value) -> std::vector<Key> {
    return std::visit(
        [](const auto& v) -> std::vector<Key> {
            using T = std::decay_t<decltype(v)>;
            if constexpr (std::is_same_v<T, std::int64_t> || std::is_same_v<T, std::string>) {
                return {Key{v}};
            } else {
                return std::vector<Key>(v.begin(), v.end());
            }
        },
        value);
}

auto matches(const ir::Condition& cond, const Cell& cell) -> QueryResult<bool> {
    auto lhs = to_key(cell);
    if (!lhs) {
        return std::unexpected(
            backend_error(fmt::format("condition on array column '{}'", cond.column)));
    }
    const auto values = condition_values(cond.value);
    const bool is_list = std::holds_alternative<std::vector<std::int64_t>>(cond.value) ||
                         std::holds_alternative<std::vector<std::string>>(cond.value);

    if (cond.op == ir::CompareOp::In || cond.op == ir::CompareOp::NotIn) {
        const bool found = std::ranges::find(values, *lhs) != values.end();
        return cond.op == ir::CompareOp::In ? found : !found;
    }
    if (is_list) {
        return std::unexpected(backend_error(fmt::format(
            "'{}' takes a single value", ir::compare_op_name(cond.op))));
    }
    const Key& rhs = values.front();
    switch (cond.op) {
        case ir::CompareOp::Eq:
            return *lhs == rhs;
        case ir::CompareOp::Ne:
            return *lhs != rhs;
        default:
            break;
    }
    if (lhs->index() != rhs.index()) {
        return std::unexpected(
            backend_error(fmt::format("type mismatch in '{}'", ir::format_condition(cond))));
    }
    switch (cond.op) {
        case ir::CompareOp::Lt:
            return *lhs < rhs;
        case ir::CompareOp::Le:
            return *lhs <= rhs;
        case ir::CompareOp::Gt:
            return *lhs > rhs;
        case ir::CompareOp::Ge:
            return *lhs >= rhs;
        default:
            return false;
    }
}

auto keep_row(const ir::QueryRequest& request, const Row& row) -> QueryResult<bool> {
    const auto ts = std::get<std::int64_t>(row.find(kTimestampColumn)->second);
    if (ts < request.start.seconds || ts >= request.end.seconds) {
        return false;
    }
    for (const auto& [name, allowed] : request.filter_keys) {
        auto key = to_key(row.find(name)->second);
        if (!key || std::ranges::find(allowed, *key) == allowed.end()) {
            return false;
        }
    }
    for (const auto& cond : request.conditions) {
        auto ok = matches(cond, row.find(cond.column)->second);
        if (!ok) {
            return std::unexpected(ok.error());
        }
        if (!*ok) {
            return false;
        }
    }
    return true;
}

// ─── Row production ───────────────────────────────────────────────────────────

auto base_row(const runtime::Table& table, std::size_t index, std::int64_t rollup) -> Row {
    Row row;
    for (const auto& entry : table.columns) {
        row[entry.name] =
            std::visit([index](const auto& c) -> Cell { return c[index]; }, entry.column);
    }
    if (rollup > 0) {
        if (const auto* ts = std::get_if<std::int64_t>(&row[kTimestampColumn])) {
            row[kTimeColumn] = Cell{floor_to(*ts, rollup)};
        }
    }
    return row;
}

/// Apply selected columns; `arrayJoin` turns one row into one row per element.
auto expand(Row row, const ir::QueryRequest& request) -> QueryResult<std::vector<Row>> {
    std::vector<Row> rows;
    rows.push_back(std::move(row));
    if (!request.selected_columns) {
        return rows;
    }
    for (const auto& spec : *request.selected_columns) {
        std::vector<Row> next;
        for (auto& current : rows) {
            if (const auto* inner = array_join_argument(spec.expr)) {
                auto value = evaluate(*inner, current);
                if (!value) {
                    return std::unexpected(value.error());
                }
                const auto* items = std::get_if<IntArray>(&*value);
                if (items == nullptr) {
                    return std::unexpected(backend_error(
                        fmt::format("arrayJoin: '{}' is not an array", spec.alias)));
                }
                for (auto item : *items) {
                    Row copy = current;
                    copy[spec.alias] = Cell{item};
                    next.push_back(std::move(copy));
                }
                continue;
            }
            auto value = evaluate(spec.expr, current);
            if (!value) {
                return std::unexpected(value.error());
            }
            current[spec.alias] = std::move(*value);
            next.push_back(std::move(current));
        }
        rows = std::move(next);
    }
    return rows;
}

auto output_aliases(const ir::QueryRequest& request) -> std::vector<std::string> {
    std::vector<std::string> aliases;
    for (const auto& spec : request.computed) {
        aliases.push_back(spec.alias);
    }
    if (request.selected_columns) {
        for (const auto& spec : *request.selected_columns) {
            aliases.push_back(spec.alias);
        }
    }
    return aliases;
}

// ─── Aggregation ──────────────────────────────────────────────────────────────

auto accumulate(const ir::AggSpec& spec, Accumulator& acc, const Row& row) -> QueryResult<void> {
    ++acc.rows;
    if (!spec.column || spec.func == ir::AggFunc::Count) {
        return {};
    }
    const Cell& cell = row.find(*spec.column)->second;
    if (spec.func == ir::AggFunc::Sum) {
        const auto* value = std::get_if<std::int64_t>(&cell);
        if (value == nullptr) {
            return std::unexpected(
                backend_error(fmt::format("sum: column '{}' is not numeric", *spec.column)));
        }
        acc.sum += *value;
        return {};
    }
    auto key = to_key(cell);
    if (!key) {
        return std::unexpected(backend_error(
            fmt::format("{}: column '{}' holds arrays", ir::agg_name(spec), *spec.column)));
    }
    ++acc.frequencies[*key];
    return {};
}

auto finish(const ir::AggSpec& spec, const Accumulator& acc) -> Tree {
    switch (spec.func) {
        case ir::AggFunc::Count:
            return Tree{acc.rows};
        case ir::AggFunc::Sum:
            return Tree{acc.sum};
        case ir::AggFunc::Uniq:
            return Tree{static_cast<std::int64_t>(acc.frequencies.size())};
        case ir::AggFunc::TopK: {
            std::vector<std::pair<Key, std::int64_t>> ranked;
            ranked.reserve(acc.frequencies.size());
            for (const auto& entry : acc.frequencies) {
                ranked.emplace_back(entry.first, entry.second);
            }
            // Most frequent first, ties by key.
            std::ranges::sort(ranked, [](const auto& a, const auto& b) {
                if (a.second != b.second) {
                    return a.second > b.second;
                }
                return a.first < b.first;
            });
            TopK items;
            for (std::size_t i = 0; i < ranked.size() && i < spec.top_k; ++i) {
                items.push_back(ranked[i].first);
            }
            return Tree{std::move(items)};
        }
    }
    return Tree{0};
}

auto make_leaf(const ir::QueryRequest& request, const std::vector<std::string>& aliases,
               const Group& group) -> Tree {
    std::vector<std::pair<std::string, Tree>> outputs;
    for (std::size_t i = 0; i < request.aggregations.size(); ++i) {
        outputs.emplace_back(request.aggregations[i].alias,
                             finish(request.aggregations[i], group.aggregates[i]));
    }
    for (std::size_t i = 0; i < group.outputs.size(); ++i) {
        outputs.emplace_back(aliases[i], key_to_tree(group.outputs[i]));
    }
    if (outputs.size() == 1) {
        return std::move(outputs.front().second);
    }
    Branch branch;
    for (auto& [alias, value] : outputs) {
        branch.insert_or_assign(Key{alias}, std::move(value));
    }
    return Tree{std::move(branch)};
}

}  // namespace

void MemoryExecutor::add_table(Dataset dataset, runtime::Table table) {
    tables_.insert_or_assign(dataset, std::move(table));
}

auto MemoryExecutor::has_table(Dataset dataset) const -> bool {
    return table_for(dataset) != nullptr;
}

auto MemoryExecutor::table_for(Dataset dataset) const -> const runtime::Table* {
    if (auto it = tables_.find(dataset); it != tables_.end()) {
        return &it->second;
    }
    if (dataset == Dataset::OutcomesRaw) {
        return table_for(Dataset::Outcomes);
    }
    return nullptr;
}

auto MemoryExecutor::execute(const ir::QueryRequest& request) -> QueryResult<Tree> {
    ++executions_;
    last_request_ = request;

    const auto* table = table_for(request.dataset);
    if (table == nullptr) {
        return std::unexpected(backend_error(
            fmt::format("no rows loaded for dataset '{}'", dataset_name(request.dataset))));
    }
    if (auto valid = validate(*table, request); !valid) {
        return std::unexpected(valid.error());
    }

    const auto aliases = output_aliases(request);
    robin_hood::unordered_node_map<GroupKey, Group, GroupKeyHash> groups;
    std::size_t matched = 0;

    for (std::size_t index = 0; index < table->rows(); ++index) {
        auto expanded = expand(base_row(*table, index, request.rollup), request);
        if (!expanded) {
            return std::unexpected(expanded.error());
        }
        for (auto& row : *expanded) {
            for (const auto& spec : request.computed) {
                auto value = evaluate(spec.expr, row);
                if (!value) {
                    return std::unexpected(value.error());
                }
                row[spec.alias] = std::move(*value);
            }
            auto keep = keep_row(request, row);
            if (!keep) {
                return std::unexpected(keep.error());
            }
            if (!*keep) {
                continue;
            }
            ++matched;

            GroupKey group_key;
            group_key.reserve(request.group_by.size());
            for (const auto& name : request.group_by) {
                auto key = to_key(row.find(name)->second);
                if (!key) {
                    return std::unexpected(
                        backend_error(fmt::format("cannot group by array column '{}'", name)));
                }
                group_key.push_back(std::move(*key));
            }

            auto& group = groups[group_key];
            if (group.aggregates.empty()) {
                group.aggregates.resize(request.aggregations.size());
                for (const auto& alias : aliases) {
                    auto key = to_key(row.find(alias)->second);
                    if (!key) {
                        return std::unexpected(
                            backend_error(fmt::format("cannot project array '{}'", alias)));
                    }
                    group.outputs.push_back(std::move(*key));
                }
            }
            for (std::size_t i = 0; i < request.aggregations.size(); ++i) {
                if (auto ok = accumulate(request.aggregations[i], group.aggregates[i], row); !ok) {
                    return std::unexpected(ok.error());
                }
            }
        }
    }

    // Without grouping the backend always answers with one row.
    if (request.group_by.empty() && groups.empty()) {
        Group empty;
        empty.aggregates.resize(request.aggregations.size());
        spdlog::debug("memory: {} matched no rows", ir::describe(request));
        return make_leaf(request, aliases, empty);
    }

    std::vector<std::pair<GroupKey, const Group*>> ordered;
    ordered.reserve(groups.size());
    for (const auto& entry : groups) {
        ordered.emplace_back(entry.first, &entry.second);
    }

    std::vector<std::pair<std::size_t, bool>> sort_keys;
    for (const auto& key : request.order_by) {
        auto pos = std::ranges::find(request.group_by, key.name) - request.group_by.begin();
        sort_keys.emplace_back(static_cast<std::size_t>(pos), key.ascending);
    }
    std::ranges::sort(ordered, [&sort_keys](const auto& a, const auto& b) {
        for (const auto& [pos, ascending] : sort_keys) {
            if (a.first[pos] != b.first[pos]) {
                return ascending ? a.first[pos] < b.first[pos] : b.first[pos] < a.first[pos];
            }
        }
        return a.first < b.first;
    });
    if (request.limit > 0 && ordered.size() > static_cast<std::size_t>(request.limit)) {
        ordered.resize(static_cast<std::size_t>(request.limit));
    }

    Tree result;
    for (const auto& [keys, group] : ordered) {
        Tree* node = &result;
        for (const auto& key : keys) {
            node = &node->branch()[key];
        }
        *node = make_leaf(request, aliases, *group);
    }
    spdlog::debug("memory: {} rows matched, {} groups returned", matched, ordered.size());
    return result;
}

}  // namespace tally::backend
