#pragma once

#include <compare>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <string_view>

namespace rowbridge {

/// Calendar date in days since 1970-01-01 (Unix epoch).
struct Date {
    std::int32_t days = 0;
    auto operator<=>(const Date&) const = default;
};

/// Instant in nanoseconds since 1970-01-01T00:00:00Z (Unix epoch).
struct Timestamp {
    std::int64_t nanos = 0;
    auto operator<=>(const Timestamp&) const = default;
};

/// Parse `YYYY-MM-DD`.
[[nodiscard]] auto parse_date(std::string_view text) -> std::optional<Date>;

/// Parse `YYYY-MM-DD[T ]HH:MM:SS[.f{1,9}][Z]`.
[[nodiscard]] auto parse_timestamp(std::string_view text) -> std::optional<Timestamp>;

[[nodiscard]] auto format_date(Date date) -> std::string;
[[nodiscard]] auto format_timestamp(Timestamp ts) -> std::string;

/// True when the value formats to a string that parse_date/parse_timestamp
/// read back (four digit, non-negative year).
[[nodiscard]] auto has_iso_form(Date date) -> bool;
[[nodiscard]] auto has_iso_form(Timestamp ts) -> bool;

}  // namespace rowbridge

namespace std {

template <>
struct hash<rowbridge::Date> {
    auto operator()(const rowbridge::Date& d) const noexcept -> std::size_t {
        return std::hash<std::int32_t>{}(d.days);
    }
};

template <>
struct hash<rowbridge::Timestamp> {
    auto operator()(const rowbridge::Timestamp& ts) const noexcept -> std::size_t {
        return std::hash<std::int64_t>{}(ts.nanos);
    }
};

}  // namespace std
