#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <map>
#include <string>
#include <variant>
#include <vector>

namespace tally {

/// A group value: an integer id or a string (release name, user tag, ...).
/// Integers order before strings.
using Key = std::variant<std::int64_t, std::string>;

/// Ranked items of a top-K aggregate, most frequent first.
using TopK = std::vector<Key>;

struct Tree;
using Branch = std::map<Key, Tree>;

/// Nested query result.
///
/// A branch maps the values of one grouping dimension to subtrees; a leaf
/// holds the aggregate (a count, a double, a string projection or a top-K
/// list). Depth equals the number of group-by columns of the request.
struct Tree {
    std::variant<std::int64_t, double, std::string, TopK, Branch> node{Branch{}};

    Tree() = default;
    Tree(int value) : node(static_cast<std::int64_t>(value)) {}
    Tree(std::int64_t value) : node(value) {}
    Tree(double value) : node(value) {}
    Tree(std::string value) : node(std::move(value)) {}
    Tree(TopK value) : node(std::move(value)) {}
    Tree(Branch value) : node(std::move(value)) {}

    [[nodiscard]] auto is_branch() const noexcept -> bool {
        return std::holds_alternative<Branch>(node);
    }
    [[nodiscard]] auto branch() -> Branch& { return std::get<Branch>(node); }
    [[nodiscard]] auto branch() const -> const Branch& { return std::get<Branch>(node); }

    /// Child lookup; nullptr for leaves and missing keys.
    [[nodiscard]] auto find(const Key& key) -> Tree*;
    [[nodiscard]] auto find(const Key& key) const -> const Tree*;

    /// Integer view of a numeric leaf (doubles truncate). Non-numeric nodes yield 0.
    [[nodiscard]] auto as_integer() const noexcept -> std::int64_t;

    /// Top-K view of a leaf. A zero-filled leaf reads as an empty list.
    [[nodiscard]] auto as_top_k() const -> TopK;

    auto operator==(const Tree&) const -> bool = default;
};

/// Build a branch from an initializer list, mainly for tests and fixtures.
[[nodiscard]] auto make_branch(std::initializer_list<std::pair<const Key, Tree>> entries)
    -> Tree;

[[nodiscard]] auto format_key(const Key& key) -> std::string;

/// Compact single-line rendering, e.g. `{1: {10: 3, 20: 0}}`.
[[nodiscard]] auto format_tree(const Tree& tree) -> std::string;

struct KeyHash {
    auto operator()(const Key& key) const noexcept -> std::size_t {
        return std::visit(
            [](const auto& v) -> std::size_t {
                return std::hash<std::decay_t<decltype(v)>>{}(v);
            },
            key);
    }
};

}  // namespace tally
