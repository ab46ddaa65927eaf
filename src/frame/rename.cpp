#include <rowbridge/frame/rename.hpp>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <optional>

namespace rowbridge::frame {

namespace {

auto trim(std::string_view text) -> std::string_view {
    auto begin = text.find_first_not_of(" \t\r\n");
    if (begin == std::string_view::npos) {
        return {};
    }
    auto end = text.find_last_not_of(" \t\r\n");
    return text.substr(begin, end - begin + 1);
}

auto find_source(const std::vector<std::string>& names, const std::vector<bool>& renamed,
                 const std::string& name) -> std::optional<std::size_t> {
    std::optional<std::size_t> chained;
    for (std::size_t i = 0; i < names.size(); ++i) {
        if (names[i] != name) {
            continue;
        }
        if (!renamed[i]) {
            return i;
        }
        if (!chained.has_value()) {
            chained = i;
        }
    }
    return chained;
}

}  // namespace

auto rename_column(const Dataset& dataset, const std::string& old_name,
                   const std::string& new_name) -> Result<Dataset> {
    auto schema = dataset.schema().rename_column(old_name, new_name);
    if (!schema) {
        return std::unexpected(std::move(schema.error()));
    }
    return dataset.with_schema(std::move(*schema));
}

auto rename_columns(const Dataset& dataset, const RenameMap& names) -> Result<Dataset> {
    if (names.empty()) {
        return dataset;
    }
    const auto& schema = dataset.schema();
    auto current = schema.column_names();
    std::vector<bool> renamed(current.size(), false);
    for (const auto& [old_name, new_name] : names) {
        auto pos = find_source(current, renamed, old_name);
        if (!pos.has_value()) {
            return make_error(ErrorKind::ColumnNotFound,
                              fmt::format("column '{}' not found", old_name));
        }
        current[*pos] = new_name;
        renamed[*pos] = true;
    }

    std::vector<Column> columns;
    columns.reserve(current.size());
    for (std::size_t i = 0; i < current.size(); ++i) {
        columns.push_back(Column{.name = std::move(current[i]), .type = schema[i].type});
    }
    auto next = Schema::make(std::move(columns));
    if (!next) {
        next.error().message = fmt::format("rename would leave a {}", next.error().message);
        return std::unexpected(std::move(next.error()));
    }
    spdlog::debug("renamed {} column(s)", names.size());
    return dataset.with_schema(std::move(*next));
}

auto parse_rename_spec(std::string_view spec) -> Result<RenameMap> {
    RenameMap names;
    std::size_t pos = 0;
    while (pos <= spec.size()) {
        std::size_t comma = spec.find(',', pos);
        if (comma == std::string_view::npos) {
            comma = spec.size();
        }
        auto entry = trim(spec.substr(pos, comma - pos));
        if (!entry.empty()) {
            auto eq = entry.find('=');
            if (eq == std::string_view::npos) {
                return make_error(ErrorKind::InvalidArgument,
                                  fmt::format("expected old=new, got '{}'", entry));
            }
            auto old_name = trim(entry.substr(0, eq));
            auto new_name = trim(entry.substr(eq + 1));
            if (old_name.empty() || new_name.empty()) {
                return make_error(ErrorKind::InvalidArgument,
                                  fmt::format("empty column name in '{}'", entry));
            }
            names.emplace_back(std::string(old_name), std::string(new_name));
        }
        if (comma == spec.size()) {
            break;
        }
        pos = comma + 1;
    }
    return names;
}

}  // namespace rowbridge::frame
