#pragma once

#include <tally/backend/executor.hpp>
#include <tally/model/model.hpp>
#include <tally/runtime/table.hpp>

#include <cstddef>
#include <optional>
#include <unordered_map>

namespace tally::backend {

/// Reference executor over in-memory event rows.
///
/// Each dataset is one runtime::Table with a `timestamp` column in unix
/// seconds. `outcomes_raw` reads the `outcomes` table when it has none of its
/// own. The native `time` column is derived per request as the timestamp
/// rounded down to the request rollup.
class MemoryExecutor final : public Executor {
   public:
    MemoryExecutor() = default;

    /// Register rows for a dataset, replacing any previous table.
    void add_table(Dataset dataset, runtime::Table table);
    [[nodiscard]] auto has_table(Dataset dataset) const -> bool;

    [[nodiscard]] auto execute(const ir::QueryRequest& request) -> QueryResult<Tree> override;

    /// Number of execute() calls so far, failed ones included.
    [[nodiscard]] auto executions() const noexcept -> std::size_t { return executions_; }
    [[nodiscard]] auto last_request() const noexcept -> const std::optional<ir::QueryRequest>& {
        return last_request_;
    }

   private:
    [[nodiscard]] auto table_for(Dataset dataset) const -> const runtime::Table*;

    std::unordered_map<Dataset, runtime::Table> tables_;
    std::size_t executions_ = 0;
    std::optional<ir::QueryRequest> last_request_;
};

}  // namespace tally::backend
