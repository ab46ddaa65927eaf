#pragma once

#include <rowbridge/core/time.hpp>

#include <cstdint>
#include <string>
#include <variant>
#include <vector>

namespace rowbridge {

/// Missing value. Both value families use it as their first alternative so a
/// default-constructed value is null.
using Null = std::monostate;

/// Canonical, schema-typed cell value.
using Value = std::variant<Null, std::int32_t, std::int64_t, float, double, std::string, Date,
                           Timestamp>;

/// Untyped cell value as exchanged with a foreign runtime: the type tag of the
/// declaring column is gone, only the wire-level shape remains.
using RawValue = std::variant<Null, bool, std::int64_t, double, std::string>;

/// A canonical row. Positional against its schema.
using Row = std::vector<Value>;

/// An untyped row as decoded from a batch.
using RawRow = std::vector<RawValue>;

[[nodiscard]] inline auto is_null(const Value& value) noexcept -> bool {
    return std::holds_alternative<Null>(value);
}

[[nodiscard]] inline auto is_null(const RawValue& value) noexcept -> bool {
    return std::holds_alternative<Null>(value);
}

}  // namespace rowbridge
