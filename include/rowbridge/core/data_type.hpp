#pragma once

#include <rowbridge/core/value.hpp>

#include <cstdint>
#include <expected>
#include <optional>
#include <string>
#include <string_view>

namespace rowbridge {

/// Closed set of column types.
enum class DataType : std::uint8_t {
    Int32,
    Int64,
    Float32,
    Float64,
    String,
    Date,
    Timestamp,
};

/// Why a raw value could not be converted to a column type.
struct ParseFailure {
    DataType type = DataType::String;
    std::string reason;
};

/// Result of parsing one cell. A null input yields a null value, never a
/// failure.
using ParseOutcome = std::expected<Value, ParseFailure>;

/// Canonical lower-case name ("int64", "float64", ...).
[[nodiscard]] auto data_type_name(DataType type) noexcept -> std::string_view;

/// Look up a type by name. Accepts the canonical names plus the aliases
/// int, float, double, str and datetime.
[[nodiscard]] auto parse_data_type(std::string_view name) -> std::optional<DataType>;

/// Convert `raw` to the canonical representation of `type`.
///
/// Native values pass through (an int64 into an Int64 column); generic
/// values are coerced where the conversion is well defined: decimal strings
/// into integers, numbers into strings, ISO strings or epoch counts into
/// dates and timestamps.
[[nodiscard]] auto parse_value(DataType type, const RawValue& raw) -> ParseOutcome;

/// Re-parse an already canonical value into `type`.
[[nodiscard]] auto parse_value(DataType type, const Value& value) -> ParseOutcome;

/// Drop the type tag of a canonical value. int32 widens to int64, float32 to
/// double; dates and timestamps become ISO strings when they have one and
/// epoch counts otherwise.
[[nodiscard]] auto strip(const Value& value) -> RawValue;

/// The type a canonical value belongs to, or nullopt for null.
[[nodiscard]] auto type_of(const Value& value) noexcept -> std::optional<DataType>;

}  // namespace rowbridge
