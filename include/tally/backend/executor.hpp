#pragma once

#include <tally/core/error.hpp>
#include <tally/core/tree.hpp>
#include <tally/ir/request.hpp>

namespace tally::backend {

/// Runs a backend aggregation request.
///
/// The result nests one level per `group_by` column, in order. Each leaf is
/// the single output value, or a branch keyed by output alias when the
/// request asks for more than one output column. Failures are reported as
/// ErrorKind::BackendExecution and passed through to callers unchanged.
class Executor {
   public:
    virtual ~Executor() = default;

    [[nodiscard]] virtual auto execute(const ir::QueryRequest& request) -> QueryResult<Tree> = 0;
};

}  // namespace tally::backend
