#include <rowbridge/core/data_type.hpp>
#include <rowbridge/core/format.hpp>

#include <fmt/format.h>

#include <algorithm>
#include <type_traits>
#include <vector>

namespace rowbridge {

auto format_value(const Value& value) -> std::string {
    return std::visit(
        [](const auto& v) -> std::string {
            using T = std::decay_t<decltype(v)>;
            if constexpr (std::is_same_v<T, Null>) {
                return "null";
            } else if constexpr (std::is_same_v<T, Date>) {
                return format_date(v);
            } else if constexpr (std::is_same_v<T, Timestamp>) {
                return format_timestamp(v);
            } else {
                return fmt::format("{}", v);
            }
        },
        value);
}

auto format_raw(const RawValue& value) -> std::string {
    return std::visit(
        [](const auto& v) -> std::string {
            using T = std::decay_t<decltype(v)>;
            if constexpr (std::is_same_v<T, Null>) {
                return "null";
            } else if constexpr (std::is_same_v<T, std::string>) {
                return fmt::format("\"{}\"", v);
            } else {
                return fmt::format("{}", v);
            }
        },
        value);
}

void print(const Dataset& dataset, std::ostream& out, std::size_t max_rows) {
    const auto& schema = dataset.schema();
    if (schema.empty()) {
        out << "(empty frame)\n";
        return;
    }

    // Column 0 holds the "[#]" row index.
    std::vector<std::vector<std::string>> cells(schema.size() + 1);
    std::vector<std::size_t> widths(schema.size() + 1);
    widths[0] = 3;
    for (std::size_t c = 0; c < schema.size(); ++c) {
        widths[c + 1] = schema[c].name.size();
    }

    std::size_t shown = 0;
    for (const auto& partition : dataset.partitions()) {
        for (const auto& row : partition) {
            if (shown == max_rows) {
                break;
            }
            auto index = fmt::format("[{}]", shown);
            widths[0] = std::max(widths[0], index.size());
            cells[0].push_back(std::move(index));
            for (std::size_t c = 0; c < row.size(); ++c) {
                auto s = format_value(row[c]);
                widths[c + 1] = std::max(widths[c + 1], s.size());
                cells[c + 1].push_back(std::move(s));
            }
            ++shown;
        }
    }

    out << fmt::format("{:<{}}", "[#]", widths[0]);
    for (std::size_t c = 0; c < schema.size(); ++c) {
        out << "  " << fmt::format("{:<{}}", schema[c].name, widths[c + 1]);
    }
    out << "\n";

    std::size_t total_width = widths[0];
    for (std::size_t c = 1; c < widths.size(); ++c) {
        total_width += 2 + widths[c];
    }
    out << std::string(total_width, '=') << "\n";

    for (std::size_t r = 0; r < shown; ++r) {
        out << fmt::format("{:<{}}", cells[0][r], widths[0]);
        for (std::size_t c = 1; c < cells.size(); ++c) {
            out << "  " << fmt::format("{:<{}}", cells[c][r], widths[c]);
        }
        out << "\n";
    }
    if (dataset.rows() > shown) {
        out << fmt::format("... ({} more rows)\n", dataset.rows() - shown);
    }
}

}  // namespace rowbridge
