#include <rowbridge/core/schema.hpp>

#include <fmt/format.h>

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

}  // namespace

Schema::Schema(std::vector<Column> columns) : columns_(std::move(columns)) {
    index_.reserve(columns_.size());
    for (std::size_t i = 0; i < columns_.size(); ++i) {
        index_.emplace(columns_[i].name, i);
    }
}

auto Schema::make(std::vector<Column> columns) -> Result<Schema> {
    std::unordered_map<std::string, std::size_t> seen;
    seen.reserve(columns.size());
    for (std::size_t i = 0; i < columns.size(); ++i) {
        if (!seen.emplace(columns[i].name, i).second) {
            return make_error(ErrorKind::DuplicateColumnName,
                              fmt::format("duplicate column name '{}'", columns[i].name));
        }
    }
    return Schema{std::move(columns)};
}

auto Schema::column(std::size_t index) const -> Result<Column> {
    if (index >= columns_.size()) {
        return make_error(ErrorKind::IndexOutOfRange,
                          fmt::format("column index {} out of range (schema has {} columns)",
                                      index, columns_.size()));
    }
    return columns_[index];
}

auto Schema::find(const std::string& name) const -> std::optional<std::size_t> {
    if (auto it = index_.find(name); it != index_.end()) {
        return it->second;
    }
    return std::nullopt;
}

auto Schema::column_names() const -> std::vector<std::string> {
    std::vector<std::string> names;
    names.reserve(columns_.size());
    for (const auto& column : columns_) {
        names.push_back(column.name);
    }
    return names;
}

auto Schema::add_column(std::string name, DataType type) const -> Result<Schema> {
    if (contains(name)) {
        return make_error(ErrorKind::DuplicateColumnName,
                          fmt::format("column '{}' already exists", name));
    }
    auto columns = columns_;
    columns.push_back(Column{.name = std::move(name), .type = type});
    return Schema{std::move(columns)};
}

auto Schema::rename_column(const std::string& old_name, const std::string& new_name) const
    -> Result<Schema> {
    auto pos = find(old_name);
    if (!pos.has_value()) {
        return make_error(ErrorKind::ColumnNotFound,
                          fmt::format("column '{}' not found", old_name));
    }
    if (old_name == new_name) {
        return *this;
    }
    if (contains(new_name)) {
        return make_error(ErrorKind::DuplicateColumnName,
                          fmt::format("cannot rename '{}' to '{}': column already exists",
                                      old_name, new_name));
    }
    auto columns = columns_;
    columns[*pos].name = new_name;
    return Schema{std::move(columns)};
}

auto parse_schema_spec(std::string_view spec) -> Result<Schema> {
    std::vector<Column> columns;
    std::size_t pos = 0;
    while (pos <= spec.size()) {
        std::size_t comma = spec.find(',', pos);
        if (comma == std::string_view::npos) {
            comma = spec.size();
        }
        auto entry = trim(spec.substr(pos, comma - pos));
        auto colon = entry.rfind(':');
        if (colon == std::string_view::npos) {
            return make_error(ErrorKind::InvalidArgument,
                              fmt::format("expected name:type, got '{}'", entry));
        }
        auto name = trim(entry.substr(0, colon));
        auto type = parse_data_type(entry.substr(colon + 1));
        if (name.empty() || !type.has_value()) {
            return make_error(ErrorKind::InvalidArgument,
                              fmt::format("invalid column spec '{}'", entry));
        }
        columns.push_back(Column{.name = std::string(name), .type = *type});
        if (comma == spec.size()) {
            break;
        }
        pos = comma + 1;
    }
    return Schema::make(std::move(columns));
}

auto format_schema_spec(const Schema& schema) -> std::string {
    std::string out;
    for (std::size_t i = 0; i < schema.size(); ++i) {
        if (i > 0) {
            out += ',';
        }
        out += fmt::format("{}:{}", schema[i].name, data_type_name(schema[i].type));
    }
    return out;
}

}  // namespace rowbridge
