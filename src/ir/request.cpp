#include <tally/ir/request.hpp>

#include <fmt/format.h>
#include <fmt/ranges.h>

namespace tally::ir {

auto describe(const QueryRequest& request) -> std::string {
    std::vector<std::string> aggs;
    aggs.reserve(request.aggregations.size() + request.computed.size());
    for (const auto& agg : request.aggregations) {
        aggs.push_back(fmt::format("{}({}) AS {}", agg_name(agg), agg.column.value_or(""),
                                   agg.alias));
    }
    for (const auto& field : request.computed) {
        aggs.push_back(fmt::format("{} AS {}", format_expr(field.expr), field.alias));
    }
    std::vector<std::string> order;
    order.reserve(request.order_by.size());
    for (const auto& key : request.order_by) {
        order.push_back(key.ascending ? key.name : "-" + key.name);
    }
    return fmt::format("dataset={} [{}, {}) rollup={} groupby=[{}] orderby=[{}] select=[{}] "
                       "conditions={} filter_keys={} limit={} referrer={}",
                       dataset_name(request.dataset), format_timestamp(request.start),
                       format_timestamp(request.end), request.rollup,
                       fmt::join(request.group_by, ", "), fmt::join(order, ", "),
                       fmt::join(aggs, ", "), request.conditions.size(),
                       request.filter_keys.size(), request.limit, request.referrer);
}

}  // namespace tally::ir
