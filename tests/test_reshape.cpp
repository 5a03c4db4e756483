#include <tally/query/reshape.hpp>

#include <catch2/catch_test_macros.hpp>

#include <string>
#include <vector>

using tally::Branch;
using tally::FlatKeys;
using tally::Key;
using tally::NestedKeys;
using tally::Tree;
using tally::make_branch;
using tally::ir::FilterKeys;

namespace {

auto keys(std::initializer_list<Key> values) -> std::vector<Key> {
    return std::vector<Key>(values);
}

auto str(const char* text) -> Key {
    return Key{std::string(text)};
}

}  // namespace

TEST_CASE("Zerofill inserts missing keys at every level", "[reshape][zerofill]") {
    Tree tree = make_branch({{1, make_branch({{100, 5}})}});
    const std::vector<std::string> groups{"project_id", "time"};
    FilterKeys expected;
    expected["project_id"] = keys({1, 2});
    expected["time"] = keys({100, 200});

    tally::query::zerofill(tree, groups, expected);

    REQUIRE(tree == make_branch({
                        {1, make_branch({{100, 5}, {200, 0}})},
                        {2, make_branch({{100, 0}, {200, 0}})},
                    }));
}

TEST_CASE("Zerofill of a complete tree is a no-op", "[reshape][zerofill]") {
    const Tree complete = make_branch({
        {1, make_branch({{100, 5}, {200, 1}})},
        {2, make_branch({{100, 0}, {200, 7}})},
    });
    const std::vector<std::string> groups{"project_id", "time"};
    FilterKeys expected;
    expected["project_id"] = keys({1, 2});
    expected["time"] = keys({100, 200});

    Tree tree = complete;
    tally::query::zerofill(tree, groups, expected);
    REQUIRE(tree == complete);
    tally::query::zerofill(tree, groups, expected);
    REQUIRE(tree == complete);
}

TEST_CASE("Zerofill visits levels without expected keys", "[reshape][zerofill]") {
    Tree tree = make_branch({{str("prod"), make_branch({{1, 3}})}});
    const std::vector<std::string> groups{"environment", "project_id"};
    FilterKeys expected;
    expected["project_id"] = keys({1, 2});

    tally::query::zerofill(tree, groups, expected);

    REQUIRE(tree == make_branch({{str("prod"), make_branch({{1, 3}, {2, 0}})}}));
}

TEST_CASE("Zerofill on an empty response yields zeros", "[reshape][zerofill]") {
    Tree tree;
    const std::vector<std::string> groups{"group_id"};
    FilterKeys expected;
    expected["group_id"] = keys({4, 5});

    tally::query::zerofill(tree, groups, expected);

    REQUIRE(tree == make_branch({{4, 0}, {5, 0}}));
    REQUIRE(tree.find(4)->as_integer() == 0);
}

TEST_CASE("Trim removes keys that were not requested", "[reshape][trim]") {
    Tree tree = make_branch({{1, 3}, {2, 4}, {99, 1}});
    const std::vector<std::string> groups{"project_id"};

    tally::query::trim(tree, groups, FlatKeys{1, 2});

    REQUIRE(tree == make_branch({{1, 3}, {2, 4}}));
}

TEST_CASE("Trim keeps every time bucket", "[reshape][trim]") {
    Tree tree = make_branch({{1, make_branch({{100, 1}, {200, 2}})}, {7, make_branch({{100, 1}})}});
    const std::vector<std::string> groups{"project_id", "time"};

    tally::query::trim(tree, groups, FlatKeys{1});

    REQUIRE(tree == make_branch({{1, make_branch({{100, 1}, {200, 2}})}}));
}

TEST_CASE("Trim of the synthetic time level", "[reshape][trim]") {
    Tree tree = make_branch({{1, make_branch({{100, 1}, {200, 2}})}});
    const std::vector<std::string> groups{"group_id", "time_t"};

    tally::query::trim(tree, groups, FlatKeys{1}, "time_t");

    REQUIRE(tree == make_branch({{1, make_branch({{100, 1}, {200, 2}})}}));
}

TEST_CASE("Nested keys trim each primary key's secondary keys", "[reshape][trim]") {
    Tree tree = make_branch({
        {1, make_branch({{10, 1}, {11, 2}, {12, 3}})},
        {2, make_branch({{10, 4}, {12, 5}})},
        {3, make_branch({{10, 6}})},
    });
    const std::vector<std::string> groups{"group_id", "environment"};
    NestedKeys requested;
    requested[1] = {10, 11};
    requested[2] = {12};

    tally::query::trim(tree, groups, requested);

    REQUIRE(tree == make_branch({
                        {1, make_branch({{10, 1}, {11, 2}})},
                        {2, make_branch({{12, 5}})},
                    }));
}

TEST_CASE("Nested trim skips time between primary and secondary", "[reshape][trim]") {
    Tree tree = make_branch({
        {1, make_branch({{100, make_branch({{10, 1}, {11, 2}})}})},
    });
    const std::vector<std::string> groups{"group_id", "time", "environment"};
    NestedKeys requested;
    requested[1] = {11};

    tally::query::trim(tree, groups, requested);

    REQUIRE(tree == make_branch({{1, make_branch({{100, make_branch({{11, 2}})}})}}));
}

TEST_CASE("Zerofill then trim yields exactly the requested keys", "[reshape]") {
    // Backend returned an extra project and missed one.
    Tree tree = make_branch({
        {1, make_branch({{100, 2}})},
        {42, make_branch({{100, 9}, {200, 9}})},
    });
    const std::vector<std::string> groups{"project_id", "time"};
    FilterKeys expected;
    expected["project_id"] = keys({1, 2, 3});
    expected["time"] = keys({100, 200});

    tally::query::zerofill(tree, groups, expected);
    tally::query::trim(tree, groups, FlatKeys{1, 2, 3});

    REQUIRE(tree == make_branch({
                        {1, make_branch({{100, 2}, {200, 0}})},
                        {2, make_branch({{100, 0}, {200, 0}})},
                        {3, make_branch({{100, 0}, {200, 0}})},
                    }));
}

TEST_CASE("Unnest collapses alias maps", "[reshape][unnest]") {
    Tree tree = make_branch({
        {1, make_branch({{str("aggregate"), 5}, {str("group_id"), 1}})},
        {2, make_branch({{str("aggregate"), 0}, {str("group_id"), 2}})},
    });

    tally::query::unnest(tree, "aggregate");

    // A zero value still collapses.
    REQUIRE(tree == make_branch({{1, 5}, {2, 0}}));
}

TEST_CASE("Unnest collapses at any depth and at the root", "[reshape][unnest]") {
    Tree nested = make_branch({
        {1, make_branch({{100, make_branch({{str("aggregate"), 3}, {str("time_t"), 100}})}})},
    });
    tally::query::unnest(nested, "aggregate");
    REQUIRE(nested == make_branch({{1, make_branch({{100, 3}})}}));

    Tree root = make_branch({{str("aggregate"), 8}, {str("time_t"), 100}});
    tally::query::unnest(root, "aggregate");
    REQUIRE(root == Tree{8});

    Tree untouched = make_branch({{1, 2}});
    tally::query::unnest(untouched, "aggregate");
    REQUIRE(untouched == make_branch({{1, 2}}));
}
