#include <rowbridge/core/data_type.hpp>

#include <fmt/format.h>

#include <charconv>
#include <cmath>
#include <cstdlib>
#include <limits>
#include <type_traits>
#include <utility>

namespace rowbridge {

namespace {

auto trim(std::string_view text) -> std::string_view {
    auto begin = text.find_first_not_of(" \t\r\n");
    if (begin == std::string_view::npos) {
        return {};
    }
    auto end = text.find_last_not_of(" \t\r\n");
    return text.substr(begin, end - begin + 1);
}

auto fail(DataType type, std::string reason) -> std::unexpected<ParseFailure> {
    return std::unexpected(ParseFailure{.type = type, .reason = std::move(reason)});
}

auto try_int(std::string_view text, std::int64_t& out) -> bool {
    text = trim(text);
    if (!text.empty() && text.front() == '+') {
        text.remove_prefix(1);
        if (!text.empty() && (text.front() == '-' || text.front() == '+')) {
            return false;
        }
    }
    const char* begin = text.data();
    const char* end = text.data() + text.size();
    auto result = std::from_chars(begin, end, out);
    return !text.empty() && result.ec == std::errc() && result.ptr == end;
}

auto try_double(std::string_view text, double& out) -> bool {
    const std::string owned(trim(text));
    char* end_ptr = nullptr;
    out = std::strtod(owned.c_str(), &end_ptr);
    return end_ptr != owned.c_str() && *end_ptr == '\0';
}

template <typename Int>
auto fit_integer(DataType type, std::int64_t value) -> ParseOutcome {
    if (value < std::numeric_limits<Int>::min() || value > std::numeric_limits<Int>::max()) {
        return fail(type, fmt::format("{} is out of range for {}", value, data_type_name(type)));
    }
    return Value{static_cast<Int>(value)};
}

template <typename Int>
auto parse_integer(DataType type, const RawValue& raw) -> ParseOutcome {
    return std::visit(
        [type](const auto& v) -> ParseOutcome {
            using T = std::decay_t<decltype(v)>;
            if constexpr (std::is_same_v<T, Null>) {
                return Value{};
            } else if constexpr (std::is_same_v<T, bool>) {
                return Value{static_cast<Int>(v ? 1 : 0)};
            } else if constexpr (std::is_same_v<T, std::int64_t>) {
                return fit_integer<Int>(type, v);
            } else if constexpr (std::is_same_v<T, double>) {
                // Truncates toward zero; 2^63 is the first double past int64.
                if (!std::isfinite(v)) {
                    return fail(type, fmt::format("{} has no integer value", v));
                }
                const double truncated = std::trunc(v);
                if (truncated < -9223372036854775808.0 || truncated >= 9223372036854775808.0) {
                    return fail(type, fmt::format("{} is out of range for {}", v,
                                                  data_type_name(type)));
                }
                return fit_integer<Int>(type, static_cast<std::int64_t>(truncated));
            } else {
                std::int64_t parsed = 0;
                if (!try_int(v, parsed)) {
                    return fail(type, fmt::format("'{}' is not an integer", v));
                }
                return fit_integer<Int>(type, parsed);
            }
        },
        raw);
}

template <typename Float>
auto fit_float(DataType type, double value) -> ParseOutcome {
    if constexpr (std::is_same_v<Float, float>) {
        if (std::isfinite(value) && std::fabs(value) > std::numeric_limits<float>::max()) {
            return fail(type, fmt::format("{} is out of range for float32", value));
        }
    }
    return Value{static_cast<Float>(value)};
}

template <typename Float>
auto parse_floating(DataType type, const RawValue& raw) -> ParseOutcome {
    return std::visit(
        [type](const auto& v) -> ParseOutcome {
            using T = std::decay_t<decltype(v)>;
            if constexpr (std::is_same_v<T, Null>) {
                return Value{};
            } else if constexpr (std::is_same_v<T, bool>) {
                return Value{static_cast<Float>(v ? 1.0 : 0.0)};
            } else if constexpr (std::is_same_v<T, std::int64_t>) {
                return Value{static_cast<Float>(v)};
            } else if constexpr (std::is_same_v<T, double>) {
                return fit_float<Float>(type, v);
            } else {
                double parsed = 0.0;
                if (!try_double(v, parsed)) {
                    return fail(type, fmt::format("'{}' is not a number", v));
                }
                return fit_float<Float>(type, parsed);
            }
        },
        raw);
}

auto parse_string(const RawValue& raw) -> ParseOutcome {
    return std::visit(
        [](const auto& v) -> ParseOutcome {
            using T = std::decay_t<decltype(v)>;
            if constexpr (std::is_same_v<T, Null>) {
                return Value{};
            } else if constexpr (std::is_same_v<T, bool>) {
                return Value{std::string(v ? "true" : "false")};
            } else if constexpr (std::is_same_v<T, std::string>) {
                return Value{v};
            } else {
                return Value{fmt::format("{}", v)};
            }
        },
        raw);
}

auto parse_date_value(const RawValue& raw) -> ParseOutcome {
    if (is_null(raw)) {
        return Value{};
    }
    if (const auto* days = std::get_if<std::int64_t>(&raw)) {
        if (*days < std::numeric_limits<std::int32_t>::min() ||
            *days > std::numeric_limits<std::int32_t>::max()) {
            return fail(DataType::Date, fmt::format("{} days is out of range", *days));
        }
        return Value{Date{static_cast<std::int32_t>(*days)}};
    }
    if (const auto* text = std::get_if<std::string>(&raw)) {
        if (auto date = parse_date(trim(*text))) {
            return Value{*date};
        }
        return fail(DataType::Date, fmt::format("'{}' is not a YYYY-MM-DD date", *text));
    }
    return fail(DataType::Date, "expected an ISO date string or a day count");
}

auto parse_timestamp_value(const RawValue& raw) -> ParseOutcome {
    if (is_null(raw)) {
        return Value{};
    }
    if (const auto* nanos = std::get_if<std::int64_t>(&raw)) {
        return Value{Timestamp{*nanos}};
    }
    if (const auto* text = std::get_if<std::string>(&raw)) {
        auto trimmed = trim(*text);
        if (auto ts = parse_timestamp(trimmed)) {
            return Value{*ts};
        }
        if (auto date = parse_date(trimmed)) {
            constexpr std::int64_t kNanosPerDay = 86'400LL * 1'000'000'000LL;
            constexpr std::int64_t kMaxDays = std::numeric_limits<std::int64_t>::max() / kNanosPerDay;
            if (date->days > kMaxDays || date->days < -kMaxDays) {
                return fail(DataType::Timestamp,
                            fmt::format("'{}' is out of the timestamp range", *text));
            }
            return Value{Timestamp{static_cast<std::int64_t>(date->days) * kNanosPerDay}};
        }
        return fail(DataType::Timestamp, fmt::format("'{}' is not an ISO timestamp", *text));
    }
    return fail(DataType::Timestamp, "expected an ISO timestamp string or a nanosecond count");
}

}  // namespace

auto data_type_name(DataType type) noexcept -> std::string_view {
    switch (type) {
        case DataType::Int32:
            return "int32";
        case DataType::Int64:
            return "int64";
        case DataType::Float32:
            return "float32";
        case DataType::Float64:
            return "float64";
        case DataType::String:
            return "string";
        case DataType::Date:
            return "date";
        case DataType::Timestamp:
            return "timestamp";
    }
    return "unknown";
}

auto parse_data_type(std::string_view name) -> std::optional<DataType> {
    name = trim(name);
    if (name == "int32") {
        return DataType::Int32;
    }
    if (name == "int64" || name == "int") {
        return DataType::Int64;
    }
    if (name == "float32") {
        return DataType::Float32;
    }
    if (name == "float64" || name == "float" || name == "double") {
        return DataType::Float64;
    }
    if (name == "string" || name == "str") {
        return DataType::String;
    }
    if (name == "date") {
        return DataType::Date;
    }
    if (name == "timestamp" || name == "datetime") {
        return DataType::Timestamp;
    }
    return std::nullopt;
}

auto parse_value(DataType type, const RawValue& raw) -> ParseOutcome {
    switch (type) {
        case DataType::Int32:
            return parse_integer<std::int32_t>(type, raw);
        case DataType::Int64:
            return parse_integer<std::int64_t>(type, raw);
        case DataType::Float32:
            return parse_floating<float>(type, raw);
        case DataType::Float64:
            return parse_floating<double>(type, raw);
        case DataType::String:
            return parse_string(raw);
        case DataType::Date:
            return parse_date_value(raw);
        case DataType::Timestamp:
            return parse_timestamp_value(raw);
    }
    return fail(type, "unknown column type");
}

auto parse_value(DataType type, const Value& value) -> ParseOutcome {
    if (type_of(value) == type) {
        return value;
    }
    return parse_value(type, strip(value));
}

auto strip(const Value& value) -> RawValue {
    return std::visit(
        [](const auto& v) -> RawValue {
            using T = std::decay_t<decltype(v)>;
            if constexpr (std::is_same_v<T, Null>) {
                return Null{};
            } else if constexpr (std::is_same_v<T, std::int32_t> ||
                                 std::is_same_v<T, std::int64_t>) {
                return static_cast<std::int64_t>(v);
            } else if constexpr (std::is_same_v<T, float> || std::is_same_v<T, double>) {
                return static_cast<double>(v);
            } else if constexpr (std::is_same_v<T, std::string>) {
                return v;
            } else if constexpr (std::is_same_v<T, Date>) {
                if (has_iso_form(v)) {
                    return format_date(v);
                }
                return static_cast<std::int64_t>(v.days);
            } else {
                if (has_iso_form(v)) {
                    return format_timestamp(v);
                }
                return v.nanos;
            }
        },
        value);
}

auto type_of(const Value& value) noexcept -> std::optional<DataType> {
    switch (value.index()) {
        case 1:
            return DataType::Int32;
        case 2:
            return DataType::Int64;
        case 3:
            return DataType::Float32;
        case 4:
            return DataType::Float64;
        case 5:
            return DataType::String;
        case 6:
            return DataType::Date;
        case 7:
            return DataType::Timestamp;
        default:
            return std::nullopt;
    }
}

}  // namespace rowbridge
