#include <tally/tally.hpp>

#include <fmt/core.h>

auto main() -> int {
    // A handful of events for two projects
    tally::runtime::Table events;
    events.add_column("timestamp", tally::Column<std::int64_t>{
                                       1704067200, 1704067260, 1704070800, 1704070900});
    events.add_column("project_id", tally::Column<std::int64_t>{1, 1, 1, 2});
    events.add_column("type", tally::Column<std::string>{"error", "error", "default", "error"});

    tally::backend::MemoryExecutor executor;
    executor.add_table(tally::Dataset::Events, std::move(events));

    tally::Tsdb tsdb(tally::default_registry(), executor);

    // Hourly event counts over two hours, with project 3 zero-filled
    fmt::print("=== Hourly range ===\n");
    const tally::Timestamp start{1704067200};
    const tally::Timestamp end{1704074400};
    auto range = tsdb.get_range(tally::Model::project, tally::FlatKeys{1, 2, 3}, start, end,
                                {.rollup = 3600});
    if (!range) {
        fmt::print("error: {}\n", range.error().format());
        return 1;
    }
    for (const auto& [project, points] : *range) {
        for (const auto& [bucket, count] : points) {
            fmt::print("project {} @ {}: {}\n", tally::format_key(project),
                       tally::format_timestamp(tally::Timestamp{bucket}), count);
        }
    }

    fmt::print("\n=== Totals ===\n");
    auto sums = tsdb.get_sums(tally::Model::project, tally::FlatKeys{1, 2, 3}, start, end,
                              {.rollup = 3600});
    if (sums) {
        for (const auto& [project, total] : *sums) {
            fmt::print("project {}: {}\n", tally::format_key(project), total);
        }
    }
    return 0;
}
