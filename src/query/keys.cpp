#include <tally/query/keys.hpp>

#include <fmt/format.h>

#include <algorithm>
#include <charconv>
#include <set>

namespace tally {

namespace {

auto trim(std::string_view text) -> std::string_view {
    auto begin = text.find_first_not_of(" \t\r\n");
    if (begin == std::string_view::npos) {
        return {};
    }
    auto end = text.find_last_not_of(" \t\r\n");
    return text.substr(begin, end - begin + 1);
}

auto split(std::string_view text, char sep) -> std::vector<std::string_view> {
    std::vector<std::string_view> parts;
    std::size_t pos = 0;
    while (true) {
        auto next = text.find(sep, pos);
        if (next == std::string_view::npos) {
            parts.push_back(trim(text.substr(pos)));
            break;
        }
        parts.push_back(trim(text.substr(pos, next - pos)));
        pos = next + 1;
    }
    return parts;
}

auto try_parse_int(std::string_view text, std::int64_t& out) -> bool {
    const char* end = text.data() + text.size();
    auto result = std::from_chars(text.data(), end, out);
    return !text.empty() && result.ec == std::errc() && result.ptr == end;
}

auto shape_error(std::string message) -> std::unexpected<QueryError> {
    return std::unexpected(make_error(ErrorKind::UnsupportedKeyShape, std::move(message)));
}

auto to_integer(const Key& key) -> std::optional<std::int64_t> {
    if (const auto* v = std::get_if<std::int64_t>(&key)) {
        return *v;
    }
    std::int64_t value = 0;
    if (try_parse_int(trim(std::get<std::string>(key)), value)) {
        return value;
    }
    return std::nullopt;
}

}  // namespace

auto normalize(const KeySet& keys) -> QueryResult<NormalizedKeys> {
    if (const auto* flat = std::get_if<FlatKeys>(&keys)) {
        return NormalizedKeys{.primary = *flat, .secondary = std::nullopt};
    }
    if (const auto* nested = std::get_if<NestedKeys>(&keys)) {
        NormalizedKeys out;
        out.primary.reserve(nested->size());
        std::set<Key> secondary;
        for (const auto& [primary, children] : *nested) {
            out.primary.push_back(primary);
            secondary.insert(children.begin(), children.end());
        }
        out.secondary = std::vector<Key>(secondary.begin(), secondary.end());
        return out;
    }
    return shape_error("keys must be a list of keys or a mapping of key to keys");
}

auto primary_count(const KeySet& keys) noexcept -> std::size_t {
    if (const auto* flat = std::get_if<FlatKeys>(&keys)) {
        return flat->size();
    }
    if (const auto* nested = std::get_if<NestedKeys>(&keys)) {
        return nested->size();
    }
    return 0;
}

auto coerce_integer_keys(const KeySet& keys) -> QueryResult<KeySet> {
    auto coerce = [](const Key& key) -> QueryResult<Key> {
        auto value = to_integer(key);
        if (!value) {
            return shape_error(fmt::format("key {} is not an integer", format_key(key)));
        }
        return Key{*value};
    };

    if (const auto* flat = std::get_if<FlatKeys>(&keys)) {
        std::set<Key> seen;
        FlatKeys out;
        for (const auto& key : *flat) {
            auto coerced = coerce(key);
            if (!coerced) {
                return std::unexpected(coerced.error());
            }
            if (seen.insert(*coerced).second) {
                out.push_back(std::move(*coerced));
            }
        }
        return KeySet{std::move(out)};
    }
    if (const auto* nested = std::get_if<NestedKeys>(&keys)) {
        NestedKeys out;
        for (const auto& [key, children] : *nested) {
            auto coerced = coerce(key);
            if (!coerced) {
                return std::unexpected(coerced.error());
            }
            auto& merged = out[*coerced];
            merged.insert(merged.end(), children.begin(), children.end());
        }
        return KeySet{std::move(out)};
    }
    return shape_error("keys must be a list of keys or a mapping of key to keys");
}

auto parse_key(std::string_view token) -> Key {
    std::int64_t value = 0;
    if (try_parse_int(token, value)) {
        return value;
    }
    return std::string(token);
}

auto parse_keys(std::string_view text) -> QueryResult<KeySet> {
    text = trim(text);
    if (text.empty()) {
        return shape_error("no keys given");
    }

    const bool nested = text.find(':') != std::string_view::npos;
    if (!nested) {
        FlatKeys flat;
        for (auto token : split(text, ',')) {
            if (token.empty()) {
                return shape_error(fmt::format("empty key in '{}'", text));
            }
            flat.push_back(parse_key(token));
        }
        return KeySet{std::move(flat)};
    }

    NestedKeys out;
    for (auto entry : split(text, ';')) {
        auto colon = entry.find(':');
        if (colon == std::string_view::npos) {
            return shape_error(
                fmt::format("'{}' mixes flat and nested keys; expected primary:secondary", entry));
        }
        auto primary = trim(entry.substr(0, colon));
        if (primary.empty()) {
            return shape_error(fmt::format("missing primary key in '{}'", entry));
        }
        auto& children = out[parse_key(primary)];
        auto rest = trim(entry.substr(colon + 1));
        if (rest.empty()) {
            continue;
        }
        for (auto token : split(rest, '|')) {
            if (token.empty()) {
                return shape_error(fmt::format("empty secondary key in '{}'", entry));
            }
            children.push_back(parse_key(token));
        }
    }
    return KeySet{std::move(out)};
}

}  // namespace tally
