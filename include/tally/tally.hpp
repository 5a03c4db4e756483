#pragma once

/// Convenience umbrella header for the Tally library.

#include <tally/backend/executor.hpp>
#include <tally/backend/memory_executor.hpp>
#include <tally/core/error.hpp>
#include <tally/core/time.hpp>
#include <tally/core/tree.hpp>
#include <tally/model/registry.hpp>
#include <tally/query/buckets.hpp>
#include <tally/query/builder.hpp>
#include <tally/query/keys.hpp>
#include <tally/query/reshape.hpp>
#include <tally/runtime/csv.hpp>
#include <tally/tsdb/tsdb.hpp>
