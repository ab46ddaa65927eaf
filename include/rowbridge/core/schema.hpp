#pragma once

#include <rowbridge/core/data_type.hpp>
#include <rowbridge/core/error.hpp>

#include <cstddef>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace rowbridge {

/// A named, typed column declaration.
struct Column {
    std::string name;
    DataType type = DataType::String;

    auto operator==(const Column&) const -> bool = default;
};

/// Ordered set of uniquely named columns.
///
/// A Schema is immutable: every mutating operation returns a new Schema and
/// leaves the receiver untouched, so one instance can be shared read-only by
/// any number of concurrent partition tasks.
class Schema {
   public:
    Schema() = default;

    /// Build a schema, rejecting duplicate names.
    [[nodiscard]] static auto make(std::vector<Column> columns) -> Result<Schema>;

    [[nodiscard]] auto size() const noexcept -> std::size_t { return columns_.size(); }
    [[nodiscard]] auto empty() const noexcept -> bool { return columns_.empty(); }

    /// Bounds-checked column access.
    [[nodiscard]] auto column(std::size_t index) const -> Result<Column>;

    /// Unchecked column access.
    [[nodiscard]] auto operator[](std::size_t index) const noexcept -> const Column& {
        return columns_[index];
    }

    [[nodiscard]] auto columns() const noexcept -> std::span<const Column> { return columns_; }

    [[nodiscard]] auto find(const std::string& name) const -> std::optional<std::size_t>;
    [[nodiscard]] auto contains(const std::string& name) const -> bool {
        return index_.contains(name);
    }

    [[nodiscard]] auto column_names() const -> std::vector<std::string>;

    /// New schema with `name` appended.
    [[nodiscard]] auto add_column(std::string name, DataType type) const -> Result<Schema>;

    /// New schema with `old_name` renamed. Renaming a column to itself is a
    /// no-op.
    [[nodiscard]] auto rename_column(const std::string& old_name, const std::string& new_name) const
        -> Result<Schema>;

    auto operator==(const Schema& other) const -> bool { return columns_ == other.columns_; }

   private:
    explicit Schema(std::vector<Column> columns);

    std::vector<Column> columns_;
    std::unordered_map<std::string, std::size_t> index_;
};

using SchemaPtr = std::shared_ptr<const Schema>;

/// Parse "name:type,name:type" (types as accepted by parse_data_type).
[[nodiscard]] auto parse_schema_spec(std::string_view spec) -> Result<Schema>;

/// Inverse of parse_schema_spec, with canonical type names.
[[nodiscard]] auto format_schema_spec(const Schema& schema) -> std::string;

}  // namespace rowbridge
