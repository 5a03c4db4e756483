#include <tally/core/time.hpp>

#include <fmt/format.h>

#include <charconv>
#include <chrono>

namespace tally {

namespace {

auto parse_fixed(std::string_view text, std::size_t pos, std::size_t width, int& out) -> bool {
    if (pos + width > text.size()) {
        return false;
    }
    const char* begin = text.data() + pos;
    const char* end = begin + width;
    auto result = std::from_chars(begin, end, out);
    return result.ec == std::errc() && result.ptr == end;
}

auto parse_epoch(std::string_view text) -> std::optional<Timestamp> {
    std::int64_t value = 0;
    const char* end = text.data() + text.size();
    auto result = std::from_chars(text.data(), end, value);
    if (result.ec != std::errc() || result.ptr != end) {
        return std::nullopt;
    }
    return Timestamp{value};
}

}  // namespace

auto parse_timestamp(std::string_view text) -> std::optional<Timestamp> {
    if (text.empty()) {
        return std::nullopt;
    }
    if (text.back() == 'Z') {
        text.remove_suffix(1);
    }
    // 0123456789012345678
    // YYYY-MM-DDTHH:MM:SS
    if (text.size() != 19 || text[4] != '-' || text[7] != '-' ||
        (text[10] != 'T' && text[10] != ' ') || text[13] != ':' || text[16] != ':') {
        return parse_epoch(text);
    }
    int y = 0;
    int mo = 0;
    int d = 0;
    int h = 0;
    int mi = 0;
    int s = 0;
    if (!parse_fixed(text, 0, 4, y) || !parse_fixed(text, 5, 2, mo) ||
        !parse_fixed(text, 8, 2, d) || !parse_fixed(text, 11, 2, h) ||
        !parse_fixed(text, 14, 2, mi) || !parse_fixed(text, 17, 2, s)) {
        return std::nullopt;
    }
    using namespace std::chrono;
    year_month_day ymd{year{y}, month{static_cast<unsigned>(mo)}, day{static_cast<unsigned>(d)}};
    if (!ymd.ok() || h > 23 || mi > 59 || s > 59) {
        return std::nullopt;
    }
    auto day_seconds = sys_days{ymd}.time_since_epoch().count() * kSecondsPerDay;
    return Timestamp{day_seconds + h * kSecondsPerHour + mi * kSecondsPerMinute + s};
}

auto format_timestamp(Timestamp ts) -> std::string {
    using namespace std::chrono;
    sys_seconds tp{seconds{ts.seconds}};
    auto day = floor<days>(tp);
    year_month_day ymd{day};
    hh_mm_ss<seconds> hms{tp - day};
    return fmt::format("{:04}-{:02}-{:02} {:02}:{:02}:{:02}", static_cast<int>(ymd.year()),
                       static_cast<unsigned>(ymd.month()), static_cast<unsigned>(ymd.day()),
                       hms.hours().count(), hms.minutes().count(), hms.seconds().count());
}

}  // namespace tally
