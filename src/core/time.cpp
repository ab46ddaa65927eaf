#include <rowbridge/core/time.hpp>

#include <fmt/format.h>

#include <cctype>
#include <charconv>
#include <chrono>
#include <limits>

namespace rowbridge {

namespace {

constexpr std::int64_t kNanosPerSecond = 1'000'000'000;
constexpr std::int64_t kNanosPerDay = 86'400 * kNanosPerSecond;

// Day numbers of 0000-01-01 and 9999-12-31.
constexpr std::int64_t kFirstIsoDay = -719'528;
constexpr std::int64_t kLastIsoDay = 2'932'896;

struct CivilDate {
    std::int64_t year;
    unsigned month;
    unsigned day;
};

// std::chrono::year stops at +-32767, so whole-int32 day counts go through
// the proleptic Gregorian conversion in 64-bit arithmetic.
auto civil_from_days(std::int64_t days) -> CivilDate {
    days += 719'468;
    const std::int64_t era = (days >= 0 ? days : days - 146'096) / 146'097;
    const auto doe = static_cast<unsigned>(days - era * 146'097);
    const unsigned yoe = (doe - doe / 1'460 + doe / 36'524 - doe / 146'096) / 365;
    const unsigned doy = doe - (365 * yoe + yoe / 4 - yoe / 100);
    const unsigned mp = (5 * doy + 2) / 153;
    const unsigned day = doy - (153 * mp + 2) / 5 + 1;
    const unsigned month = mp < 10 ? mp + 3 : mp - 9;
    const std::int64_t year = static_cast<std::int64_t>(yoe) + era * 400 + (month <= 2 ? 1 : 0);
    return CivilDate{.year = year, .month = month, .day = day};
}

auto parse_int(std::string_view part) -> std::optional<int> {
    int value = 0;
    auto result = std::from_chars(part.data(), part.data() + part.size(), value);
    if (result.ec != std::errc() || result.ptr != part.data() + part.size()) {
        return std::nullopt;
    }
    return value;
}

auto make_days(int year, int month, int day) -> std::optional<std::int64_t> {
    using namespace std::chrono;
    if (month < 1 || day < 1) {
        return std::nullopt;
    }
    year_month_day ymd{std::chrono::year{year}, std::chrono::month{static_cast<unsigned>(month)},
                       std::chrono::day{static_cast<unsigned>(day)}};
    if (!ymd.ok()) {
        return std::nullopt;
    }
    return static_cast<std::int64_t>(sys_days{ymd}.time_since_epoch().count());
}

auto checked_mul(std::int64_t lhs, std::int64_t rhs) -> std::optional<std::int64_t> {
    constexpr auto kMax = std::numeric_limits<std::int64_t>::max();
    constexpr auto kMin = std::numeric_limits<std::int64_t>::min();
    if (lhs == 0 || rhs == 0) {
        return std::int64_t{0};
    }
    if (lhs > 0) {
        if (rhs > 0) {
            if (lhs > kMax / rhs) {
                return std::nullopt;
            }
        } else if (rhs < kMin / lhs) {
            return std::nullopt;
        }
    } else if (rhs > 0) {
        if (lhs < kMin / rhs) {
            return std::nullopt;
        }
    } else if (rhs < kMax / lhs) {
        return std::nullopt;
    }
    return lhs * rhs;
}

auto checked_add(std::int64_t lhs, std::int64_t rhs) -> std::optional<std::int64_t> {
    if (rhs > 0 && lhs > std::numeric_limits<std::int64_t>::max() - rhs) {
        return std::nullopt;
    }
    if (rhs < 0 && lhs < std::numeric_limits<std::int64_t>::min() - rhs) {
        return std::nullopt;
    }
    return lhs + rhs;
}

}  // namespace

auto parse_date(std::string_view text) -> std::optional<Date> {
    if (text.size() != 10 || text[4] != '-' || text[7] != '-') {
        return std::nullopt;
    }
    auto year = parse_int(text.substr(0, 4));
    auto month = parse_int(text.substr(5, 2));
    auto day = parse_int(text.substr(8, 2));
    if (!year || !month || !day) {
        return std::nullopt;
    }
    auto days = make_days(*year, *month, *day);
    if (!days || *days < std::numeric_limits<std::int32_t>::min() ||
        *days > std::numeric_limits<std::int32_t>::max()) {
        return std::nullopt;
    }
    return Date{static_cast<std::int32_t>(*days)};
}

auto parse_timestamp(std::string_view text) -> std::optional<Timestamp> {
    if (text.size() < 19 || text[4] != '-' || text[7] != '-' ||
        (text[10] != 'T' && text[10] != ' ') || text[13] != ':' || text[16] != ':') {
        return std::nullopt;
    }
    auto year = parse_int(text.substr(0, 4));
    auto month = parse_int(text.substr(5, 2));
    auto day = parse_int(text.substr(8, 2));
    auto hour = parse_int(text.substr(11, 2));
    auto minute = parse_int(text.substr(14, 2));
    auto second = parse_int(text.substr(17, 2));
    if (!year || !month || !day || !hour || !minute || !second) {
        return std::nullopt;
    }
    if (*hour < 0 || *hour > 23 || *minute < 0 || *minute > 59 || *second < 0 || *second > 59) {
        return std::nullopt;
    }
    std::size_t pos = 19;
    std::int64_t frac_nanos = 0;
    if (pos < text.size() && text[pos] == '.') {
        pos += 1;
        std::size_t start = pos;
        while (pos < text.size() && std::isdigit(static_cast<unsigned char>(text[pos])) != 0) {
            pos += 1;
        }
        std::size_t digits = pos - start;
        if (digits == 0 || digits > 9) {
            return std::nullopt;
        }
        auto result = std::from_chars(text.data() + start, text.data() + pos, frac_nanos);
        if (result.ec != std::errc()) {
            return std::nullopt;
        }
        for (std::size_t i = digits; i < 9; ++i) {
            frac_nanos *= 10;
        }
    }
    if (pos < text.size() && text[pos] == 'Z') {
        pos += 1;
    }
    if (pos != text.size()) {
        return std::nullopt;
    }
    auto days = make_days(*year, *month, *day);
    if (!days) {
        return std::nullopt;
    }
    const std::int64_t time_of_day =
        ((static_cast<std::int64_t>(*hour) * 3600 + static_cast<std::int64_t>(*minute) * 60 +
          static_cast<std::int64_t>(*second)) *
         kNanosPerSecond) +
        frac_nanos;
    auto day_nanos = checked_mul(*days, kNanosPerDay);
    if (!day_nanos) {
        return std::nullopt;
    }
    auto total = checked_add(*day_nanos, time_of_day);
    if (!total) {
        return std::nullopt;
    }
    return Timestamp{*total};
}

auto format_date(Date date) -> std::string {
    const auto civil = civil_from_days(date.days);
    if (civil.year < 0) {
        return fmt::format("-{:04}-{:02}-{:02}", -civil.year, civil.month, civil.day);
    }
    return fmt::format("{:04}-{:02}-{:02}", civil.year, civil.month, civil.day);
}

auto format_timestamp(Timestamp ts) -> std::string {
    using namespace std::chrono;
    sys_time<nanoseconds> tp{nanoseconds{ts.nanos}};
    auto day = floor<days>(tp);
    year_month_day ymd{day};
    auto tod = tp - day;
    hh_mm_ss<nanoseconds> hms{tod};
    return fmt::format("{:04}-{:02}-{:02} {:02}:{:02}:{:02}.{:09}", static_cast<int>(ymd.year()),
                       static_cast<unsigned>(ymd.month()), static_cast<unsigned>(ymd.day()),
                       hms.hours().count(), hms.minutes().count(), hms.seconds().count(),
                       hms.subseconds().count());
}

auto has_iso_form(Date date) -> bool {
    return date.days >= kFirstIsoDay && date.days <= kLastIsoDay;
}

auto has_iso_form(Timestamp ts) -> bool {
    using namespace std::chrono;
    sys_time<nanoseconds> tp{nanoseconds{ts.nanos}};
    year_month_day ymd{floor<days>(tp)};
    const int year = static_cast<int>(ymd.year());
    return year >= 0 && year <= 9999;
}

}  // namespace rowbridge
