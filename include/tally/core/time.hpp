#pragma once

#include <compare>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace tally {

/// Instant in whole seconds since 1970-01-01T00:00:00Z (Unix epoch).
struct Timestamp {
    std::int64_t seconds = 0;
    auto operator<=>(const Timestamp&) const = default;
};

inline constexpr std::int64_t kSecondsPerMinute = 60;
inline constexpr std::int64_t kSecondsPerHour = 3600;
inline constexpr std::int64_t kSecondsPerDay = 86400;

/// Parse `YYYY-MM-DDTHH:MM:SS` (space separator and trailing `Z` accepted)
/// or a plain integer number of seconds.
[[nodiscard]] auto parse_timestamp(std::string_view text) -> std::optional<Timestamp>;

/// Format as `YYYY-MM-DD HH:MM:SS` in UTC.
[[nodiscard]] auto format_timestamp(Timestamp ts) -> std::string;

/// Round down to a multiple of `step` seconds (floor, also for negative instants).
[[nodiscard]] constexpr auto floor_to(std::int64_t seconds, std::int64_t step) noexcept
    -> std::int64_t {
    auto rem = seconds % step;
    if (rem < 0) {
        rem += step;
    }
    return seconds - rem;
}

}  // namespace tally
