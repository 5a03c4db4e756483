#include <tally/query/reshape.hpp>

#include <algorithm>
#include <iterator>

namespace tally::query {

namespace {

auto contains(const std::vector<Key>& keys, const Key& key) -> bool {
    return std::ranges::find(keys, key) != keys.end();
}

}  // namespace

void zerofill(Tree& tree, std::span<const std::string> groups, const ir::FilterKeys& expected) {
    if (groups.empty() || !tree.is_branch()) {
        return;
    }
    auto& children = tree.branch();
    const auto subgroups = groups.subspan(1);
    if (auto it = expected.find(groups.front()); it != expected.end()) {
        for (const auto& key : it->second) {
            if (!children.contains(key)) {
                children.emplace(key, subgroups.empty() ? Tree{0} : Tree{});
            }
        }
    }
    if (subgroups.empty()) {
        return;
    }
    for (auto& [key, child] : children) {
        zerofill(child, subgroups, expected);
    }
}

void trim(Tree& tree, std::span<const std::string> groups, const KeySet& keys,
          std::string_view time_column) {
    if (groups.empty() || !tree.is_branch()) {
        return;
    }
    auto& children = tree.branch();
    const auto subgroups = groups.subspan(1);

    if (groups.front() == time_column) {
        for (auto& [key, child] : children) {
            trim(child, subgroups, keys, time_column);
        }
        return;
    }

    if (const auto* flat = std::get_if<FlatKeys>(&keys)) {
        std::erase_if(children, [flat](const auto& entry) { return !contains(*flat, entry.first); });
        return;
    }
    if (const auto* nested = std::get_if<NestedKeys>(&keys)) {
        for (auto it = children.begin(); it != children.end();) {
            auto scope = nested->find(it->first);
            if (scope == nested->end()) {
                it = children.erase(it);
                continue;
            }
            trim(it->second, subgroups, KeySet{FlatKeys(scope->second)}, time_column);
            ++it;
        }
        return;
    }
    // No keys: nothing was requested.
    children.clear();
}

void unnest(Tree& tree, std::string_view alias) {
    if (!tree.is_branch()) {
        return;
    }
    const Key alias_key{std::string(alias)};
    if (auto* value = tree.find(alias_key)) {
        Tree collapsed = std::move(*value);
        tree = std::move(collapsed);
        return;
    }
    for (auto& [key, child] : tree.branch()) {
        unnest(child, alias);
    }
}

}  // namespace tally::query
