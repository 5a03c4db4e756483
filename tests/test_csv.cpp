#include <tally/runtime/csv.hpp>

#include <catch2/catch_test_macros.hpp>

#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>

using tally::Column;
using tally::runtime::IntArray;

namespace {

auto write_csv(const std::filesystem::path& path, const char* content) {
    std::ofstream out(path);
    out << content;
}

auto tmp(const char* name) -> std::filesystem::path {
    return std::filesystem::temp_directory_path() / name;
}

auto fixture(const char* name) -> std::string {
    return (std::filesystem::path(TALLY_SOURCE_DIR) / "tests" / "data" / name).string();
}

}  // namespace

TEST_CASE("Read CSV - int and string columns", "[csv]") {
    auto path = tmp("tally_test_simple.csv");
    write_csv(path, "project_id,type\n1,error\n2,default\n3,error\n");

    auto table = tally::runtime::read_csv(path.string());
    REQUIRE(table.has_value());
    REQUIRE(table->rows() == 3);
    const auto* ids = std::get_if<Column<std::int64_t>>(table->find("project_id"));
    REQUIRE(ids != nullptr);
    REQUIRE((*ids)[0] == 1);
    REQUIRE((*ids)[2] == 3);
    const auto* types = std::get_if<Column<std::string>>(table->find("type"));
    REQUIRE(types != nullptr);
    REQUIRE((*types)[1] == "default");
}

TEST_CASE("Read CSV - timestamps accept ISO and unix seconds", "[csv]") {
    std::istringstream input(
        "timestamp,project_id\n"
        "2024-01-01T00:00:05,1\n"
        "1704070800,1\n");

    auto table = tally::runtime::read_csv(input);
    REQUIRE(table.has_value());
    const auto* ts = std::get_if<Column<std::int64_t>>(table->find("timestamp"));
    REQUIRE(ts != nullptr);
    REQUIRE((*ts)[0] == 1704067205);
    REQUIRE((*ts)[1] == 1704070800);
}

TEST_CASE("Read CSV - bad timestamp is an error", "[csv]") {
    std::istringstream input("timestamp,project_id\nnot-a-time,1\n");

    auto table = tally::runtime::read_csv(input);
    REQUIRE_FALSE(table.has_value());
    REQUIRE(table.error().find("bad timestamp") != std::string::npos);
}

TEST_CASE("Read CSV - bracketed cells become integer arrays", "[csv]") {
    std::istringstream input(
        "timestamp,group_ids\n"
        "0,[1;2;3]\n"
        "1,[]\n"
        "2,[ 4 ]\n");

    auto table = tally::runtime::read_csv(input);
    REQUIRE(table.has_value());
    const auto* groups = std::get_if<Column<IntArray>>(table->find("group_ids"));
    REQUIRE(groups != nullptr);
    REQUIRE((*groups)[0] == IntArray{1, 2, 3});
    REQUIRE((*groups)[1].empty());
    REQUIRE((*groups)[2] == IntArray{4});
}

TEST_CASE("Read CSV - mixed numeric/non-numeric falls back to string", "[csv]") {
    std::istringstream input("release\n1\n1.0\n[2]\n");

    auto table = tally::runtime::read_csv(input);
    REQUIRE(table.has_value());
    const auto* releases = std::get_if<Column<std::string>>(table->find("release"));
    REQUIRE(releases != nullptr);
    REQUIRE((*releases)[1] == "1.0");
}

TEST_CASE("Read CSV - RFC 4180 quoted fields with embedded commas", "[csv]") {
    std::istringstream input("tags[sentry:user],n\n\"smith, jane\",1\n");

    auto table = tally::runtime::read_csv(input);
    REQUIRE(table.has_value());
    auto cell = table->cell("tags[sentry:user]", 0);
    REQUIRE(cell.has_value());
    REQUIRE(std::get<std::string>(*cell) == "smith, jane");
    REQUIRE_FALSE(table->cell("missing", 0).has_value());
}

TEST_CASE("Read CSV - missing file is an error", "[csv]") {
    auto table = tally::runtime::read_csv(tmp("tally_no_such_file.csv").string());
    REQUIRE_FALSE(table.has_value());
}

TEST_CASE("Read CSV - events fixture", "[csv]") {
    auto table = tally::runtime::read_csv(fixture("events.csv"));
    REQUIRE(table.has_value());
    REQUIRE(table->rows() == 8);
    REQUIRE(std::holds_alternative<Column<std::int64_t>>(*table->find("environment")));
    REQUIRE(std::holds_alternative<Column<std::string>>(*table->find("tags[sentry:release]")));
    REQUIRE(std::holds_alternative<Column<std::string>>(*table->find("tags[sentry:user]")));
}
