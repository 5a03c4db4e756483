#include <tally/core/error.hpp>

#include <fmt/format.h>

namespace tally {

auto error_kind_name(ErrorKind kind) noexcept -> std::string_view {
    switch (kind) {
        case ErrorKind::UnsupportedModel:
            return "unsupported model";
        case ErrorKind::UnsupportedKeyShape:
            return "unsupported key shape";
        case ErrorKind::BackendExecution:
            return "backend error";
        case ErrorKind::InvalidArgument:
            return "invalid argument";
    }
    return "error";
}

auto QueryError::format() const -> std::string {
    return fmt::format("{}: {}", error_kind_name(kind), message);
}

}  // namespace tally
