#include <tally/query/keys.hpp>

#include <catch2/catch_test_macros.hpp>

#include <string>
#include <vector>

using tally::ErrorKind;
using tally::FlatKeys;
using tally::Key;
using tally::KeySet;
using tally::NestedKeys;

TEST_CASE("Flat keys normalize to primary keys only", "[keys]") {
    auto normalized = tally::normalize(FlatKeys{1, 2, 3});
    REQUIRE(normalized.has_value());
    REQUIRE(normalized->primary == std::vector<Key>{1, 2, 3});
    REQUIRE_FALSE(normalized->secondary.has_value());
}

TEST_CASE("Nested keys normalize to primary and secondary keys", "[keys]") {
    NestedKeys nested;
    nested[1] = {10, 11};
    nested[2] = {12};
    auto normalized = tally::normalize(nested);
    REQUIRE(normalized.has_value());
    REQUIRE(normalized->primary == std::vector<Key>{1, 2});
    REQUIRE(normalized->secondary == std::vector<Key>{10, 11, 12});
}

TEST_CASE("Nested secondary keys are deduplicated", "[keys]") {
    NestedKeys nested;
    nested[1] = {11, 10};
    nested[2] = {10, std::string("prod")};
    auto normalized = tally::normalize(nested);
    REQUIRE(normalized.has_value());
    REQUIRE(normalized->secondary == std::vector<Key>{10, 11, std::string("prod")});
}

TEST_CASE("Unset keys fail normalization", "[keys]") {
    auto normalized = tally::normalize(KeySet{});
    REQUIRE_FALSE(normalized.has_value());
    REQUIRE(normalized.error().kind == ErrorKind::UnsupportedKeyShape);
    REQUIRE(tally::primary_count(KeySet{}) == 0);
}

TEST_CASE("Integer coercion deduplicates key ids", "[keys]") {
    auto coerced = tally::coerce_integer_keys(FlatKeys{std::string("7"), 7, std::string(" 8")});
    REQUIRE(coerced.has_value());
    const auto* flat = std::get_if<FlatKeys>(&*coerced);
    REQUIRE(flat != nullptr);
    REQUIRE(*flat == FlatKeys{7, 8});
}

TEST_CASE("Integer coercion rejects non-numeric keys", "[keys]") {
    auto coerced = tally::coerce_integer_keys(FlatKeys{std::string("abc")});
    REQUIRE_FALSE(coerced.has_value());
    REQUIRE(coerced.error().kind == ErrorKind::UnsupportedKeyShape);
}

TEST_CASE("Parse flat keys from text", "[keys][parse]") {
    auto keys = tally::parse_keys("1, 2,release-1");
    REQUIRE(keys.has_value());
    const auto* flat = std::get_if<FlatKeys>(&*keys);
    REQUIRE(flat != nullptr);
    REQUIRE(*flat == FlatKeys{1, 2, std::string("release-1")});
}

TEST_CASE("Parse nested keys from text", "[keys][parse]") {
    auto keys = tally::parse_keys("1:10|11;2:12");
    REQUIRE(keys.has_value());
    const auto* nested = std::get_if<NestedKeys>(&*keys);
    REQUIRE(nested != nullptr);
    REQUIRE(nested->size() == 2);
    REQUIRE(nested->at(1) == std::vector<Key>{10, 11});
    REQUIRE(nested->at(2) == std::vector<Key>{12});
}

TEST_CASE("Parse keys rejects malformed text", "[keys][parse]") {
    for (const char* text : {"", "   ", "1,,2", "1:10;2", ":10", "1:10||11"}) {
        auto keys = tally::parse_keys(text);
        REQUIRE_FALSE(keys.has_value());
        REQUIRE(keys.error().kind == ErrorKind::UnsupportedKeyShape);
    }
}

TEST_CASE("Parse single keys", "[keys][parse]") {
    REQUIRE(tally::parse_key("42") == Key{42});
    REQUIRE(tally::parse_key("-3") == Key{-3});
    REQUIRE(tally::parse_key("4a") == Key{std::string("4a")});
}
