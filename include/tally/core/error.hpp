#pragma once

#include <cstdint>
#include <expected>
#include <string>
#include <string_view>
#include <utility>

namespace tally {

enum class ErrorKind : std::uint8_t {
    /// The model has no entry in the registry.
    UnsupportedModel,
    /// Keys are neither a flat collection nor a primary -> secondary mapping.
    UnsupportedKeyShape,
    /// Surfaced unchanged from the executor.
    BackendExecution,
    /// Malformed caller input (bad rollup, unparsable option).
    InvalidArgument,
};

/// Error carried by every fallible query operation.
struct QueryError {
    ErrorKind kind = ErrorKind::InvalidArgument;
    std::string message;

    [[nodiscard]] auto format() const -> std::string;
};

template <typename T>
using QueryResult = std::expected<T, QueryError>;

[[nodiscard]] auto error_kind_name(ErrorKind kind) noexcept -> std::string_view;

[[nodiscard]] inline auto make_error(ErrorKind kind, std::string message) -> QueryError {
    return QueryError{.kind = kind, .message = std::move(message)};
}

}  // namespace tally
