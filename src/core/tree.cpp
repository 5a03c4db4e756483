#include <tally/core/tree.hpp>

#include <fmt/format.h>

#include <type_traits>

namespace tally {

auto Tree::find(const Key& key) -> Tree* {
    auto* children = std::get_if<Branch>(&node);
    if (children == nullptr) {
        return nullptr;
    }
    auto it = children->find(key);
    return it == children->end() ? nullptr : &it->second;
}

auto Tree::find(const Key& key) const -> const Tree* {
    const auto* children = std::get_if<Branch>(&node);
    if (children == nullptr) {
        return nullptr;
    }
    auto it = children->find(key);
    return it == children->end() ? nullptr : &it->second;
}

auto Tree::as_integer() const noexcept -> std::int64_t {
    if (const auto* v = std::get_if<std::int64_t>(&node)) {
        return *v;
    }
    if (const auto* v = std::get_if<double>(&node)) {
        return static_cast<std::int64_t>(*v);
    }
    return 0;
}

auto Tree::as_top_k() const -> TopK {
    if (const auto* items = std::get_if<TopK>(&node)) {
        return *items;
    }
    return {};
}

auto make_branch(std::initializer_list<std::pair<const Key, Tree>> entries) -> Tree {
    return Tree{Branch(entries)};
}

auto format_key(const Key& key) -> std::string {
    return std::visit(
        [](const auto& v) -> std::string {
            if constexpr (std::is_same_v<std::decay_t<decltype(v)>, std::string>) {
                return fmt::format("\"{}\"", v);
            } else {
                return fmt::format("{}", v);
            }
        },
        key);
}

auto format_tree(const Tree& tree) -> std::string {
    return std::visit(
        [](const auto& v) -> std::string {
            using T = std::decay_t<decltype(v)>;
            if constexpr (std::is_same_v<T, Branch>) {
                std::string out = "{";
                bool first = true;
                for (const auto& [key, child] : v) {
                    if (!first) {
                        out.append(", ");
                    }
                    first = false;
                    out.append(format_key(key));
                    out.append(": ");
                    out.append(format_tree(child));
                }
                out.push_back('}');
                return out;
            } else if constexpr (std::is_same_v<T, TopK>) {
                std::string out = "[";
                for (std::size_t i = 0; i < v.size(); ++i) {
                    if (i > 0) {
                        out.append(", ");
                    }
                    out.append(format_key(v[i]));
                }
                out.push_back(']');
                return out;
            } else if constexpr (std::is_same_v<T, std::string>) {
                return fmt::format("\"{}\"", v);
            } else if constexpr (std::is_same_v<T, double>) {
                return fmt::format("{:g}", v);
            } else {
                return fmt::format("{}", v);
            }
        },
        tree.node);
}

}  // namespace tally
