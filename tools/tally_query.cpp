#include <tally/tally.hpp>

#include <CLI/CLI.hpp>
#include <fmt/core.h>
#include <spdlog/spdlog.h>

#include <array>
#include <cstddef>
#include <cstdint>
#include <cstdlib>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace {

constexpr std::array<std::string_view, 9> kOperations = {
    "range",
    "sums",
    "distinct-series",
    "distinct-totals",
    "distinct-union",
    "most-frequent",
    "most-frequent-series",
    "frequency-series",
    "frequency-totals",
};

auto load_fixture(tally::backend::MemoryExecutor& executor, tally::Dataset dataset,
                  const std::string& path) -> bool {
    if (path.empty()) {
        return true;
    }
    auto table = tally::runtime::read_csv(path);
    if (!table) {
        spdlog::error("{}: {}", path, table.error());
        return false;
    }
    spdlog::debug("loaded {} rows into {}", table->rows(), tally::dataset_name(dataset));
    executor.add_table(dataset, std::move(*table));
    return true;
}

auto bucket_label(std::int64_t bucket) -> std::string {
    return tally::format_timestamp(tally::Timestamp{bucket});
}

void print_series(const tally::SeriesMap& series) {
    for (const auto& [key, points] : series) {
        fmt::print("{}:\n", tally::format_key(key));
        for (const auto& [bucket, value] : points) {
            fmt::print("  {}  {}\n", bucket_label(bucket), value);
        }
    }
}

void print_totals(const tally::TotalsMap& totals) {
    for (const auto& [key, value] : totals) {
        fmt::print("{}: {}\n", tally::format_key(key), value);
    }
}

void print_scores(const tally::ScoredMap& scores) {
    for (const auto& [key, items] : scores) {
        fmt::print("{}:\n", tally::format_key(key));
        for (const auto& [item, score] : items) {
            fmt::print("  {}  {:.1f}\n", tally::format_key(item), score);
        }
    }
}

void print_score_series(const tally::ScoredSeriesMap& series) {
    for (const auto& [key, buckets] : series) {
        fmt::print("{}:\n", tally::format_key(key));
        for (const auto& [bucket, items] : buckets) {
            fmt::print("  {}", bucket_label(bucket));
            for (const auto& [item, score] : items) {
                fmt::print("  {}={:.1f}", tally::format_key(item), score);
            }
            fmt::print("\n");
        }
    }
}

void print_frequencies(const tally::Frequencies& counts) {
    for (const auto& [item, count] : counts) {
        fmt::print("  {}={}", tally::format_key(item), count);
    }
    fmt::print("\n");
}

void print_frequency_series(const tally::FrequencySeriesMap& series) {
    for (const auto& [key, buckets] : series) {
        fmt::print("{}:\n", tally::format_key(key));
        for (const auto& [bucket, counts] : buckets) {
            fmt::print("  {}", bucket_label(bucket));
            print_frequencies(counts);
        }
    }
}

void print_frequency_totals(const tally::FrequencyTotalsMap& totals) {
    for (const auto& [key, counts] : totals) {
        fmt::print("{}:", tally::format_key(key));
        print_frequencies(counts);
    }
}

template <typename T, typename Print>
auto report(const tally::QueryResult<T>& result, Print&& print) -> int {
    if (!result) {
        spdlog::error("{}", result.error().format());
        return 1;
    }
    print(*result);
    return 0;
}

}  // namespace

auto main(int argc, char** argv) -> int {
    CLI::App app{"Tally: run time-series model queries against CSV fixtures"};

    bool verbose = false;
    bool list_models = false;
    std::string events_path;
    std::string transactions_path;
    std::string search_issues_path;
    std::string outcomes_path;
    std::string operation = "range";
    std::string model_text;
    std::string keys_text;
    std::string start_text;
    std::string end_text;
    std::optional<std::int64_t> rollup;
    std::optional<std::int64_t> environment_id;
    std::size_t limit = 10;
    std::optional<std::int64_t> jitter;
    bool use_cache = false;

    app.add_flag("-v,--verbose", verbose, "Enable verbose output");
    app.add_flag("--list-models", list_models, "Print the registered models and exit");
    app.add_option("--events", events_path,
                   "CSV file with event rows. Defaults to TALLY_FIXTURE environment variable.");
    app.add_option("--transactions", transactions_path, "CSV file with transaction rows");
    app.add_option("--search-issues", search_issues_path, "CSV file with issue platform rows");
    app.add_option("--outcomes", outcomes_path, "CSV file with outcome rows");
    app.add_option("--op", operation, "Operation to run")
        ->check(CLI::IsMember(std::vector<std::string>(kOperations.begin(), kOperations.end())));
    app.add_option("--model", model_text, "Model name, e.g. project or users_affected_by_group");
    app.add_option("--keys", keys_text, "Keys: '1,2,3' or '1:10|11;2:12'");
    app.add_option("--start", start_text, "Window start (YYYY-MM-DDTHH:MM:SS or unix seconds)");
    app.add_option("--end", end_text, "Window end, exclusive");
    app.add_option("--rollup", rollup, "Bucket width in seconds");
    app.add_option("--env", environment_id, "Environment id filter");
    app.add_option("--limit", limit, "Items per key for most-frequent operations");
    app.add_option("--jitter", jitter, "Jitter seed for bucket boundaries");
    app.add_flag("--use-cache", use_cache, "Ask the backend to serve cached results");

    CLI11_PARSE(app, argc, argv);

    if (verbose) {
        spdlog::set_level(spdlog::level::debug);
    } else {
        spdlog::set_level(spdlog::level::info);
    }

    const auto& registry = tally::default_registry();
    if (list_models) {
        for (auto model : registry.models()) {
            const auto* settings = registry.find(model);
            fmt::print("{:>4}  {:<45} {}\n", tally::model_id(model), tally::model_name(model),
                       tally::dataset_name(settings->dataset));
        }
        return 0;
    }

    if (events_path.empty()) {
        const char* env = std::getenv("TALLY_FIXTURE");
        if (env != nullptr) {
            events_path = env;
        }
    }

    auto model = tally::parse_model(model_text);
    if (!model) {
        spdlog::error("unknown model '{}'", model_text);
        return 2;
    }
    auto keys = tally::parse_keys(keys_text);
    if (!keys) {
        spdlog::error("{}", keys.error().format());
        return 2;
    }
    auto start = tally::parse_timestamp(start_text);
    auto end = tally::parse_timestamp(end_text);
    if (!start || !end) {
        spdlog::error("--start and --end must be timestamps");
        return 2;
    }
    if (*end <= *start) {
        spdlog::error("--end must be after --start");
        return 2;
    }

    tally::backend::MemoryExecutor executor;
    if (!load_fixture(executor, tally::Dataset::Events, events_path) ||
        !load_fixture(executor, tally::Dataset::Transactions, transactions_path) ||
        !load_fixture(executor, tally::Dataset::IssuePlatform, search_issues_path) ||
        !load_fixture(executor, tally::Dataset::Outcomes, outcomes_path)) {
        return 1;
    }

    tally::Tsdb tsdb(registry, executor);
    const tally::QueryOptions options{
        .rollup = rollup,
        .environment_id = environment_id,
        .limit = limit,
        .conditions = {},
        .use_cache = use_cache,
        .jitter_value = jitter,
    };

    if (operation == "range") {
        return report(tsdb.get_range(*model, *keys, *start, *end, options), print_series);
    }
    if (operation == "sums") {
        return report(tsdb.get_sums(*model, *keys, *start, *end, options), print_totals);
    }
    if (operation == "distinct-series") {
        return report(tsdb.get_distinct_counts_series(*model, *keys, *start, *end, options),
                      print_series);
    }
    if (operation == "distinct-totals") {
        return report(tsdb.get_distinct_counts_totals(*model, *keys, *start, *end, options),
                      print_totals);
    }
    if (operation == "distinct-union") {
        return report(tsdb.get_distinct_counts_union(*model, *keys, *start, *end, options),
                      [](std::int64_t value) { fmt::print("{}\n", value); });
    }
    if (operation == "most-frequent") {
        return report(tsdb.get_most_frequent(*model, *keys, *start, *end, options),
                      print_scores);
    }
    if (operation == "most-frequent-series") {
        return report(tsdb.get_most_frequent_series(*model, *keys, *start, *end, options),
                      print_score_series);
    }
    if (operation == "frequency-series") {
        return report(tsdb.get_frequency_series(*model, *keys, *start, *end, options),
                      print_frequency_series);
    }
    return report(tsdb.get_frequency_totals(*model, *keys, *start, *end, options),
                  print_frequency_totals);
}
