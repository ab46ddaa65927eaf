#include <rowbridge/convert/row_converter.hpp>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <utility>

namespace rowbridge::convert {

void ConversionReport::merge(const ConversionReport& other) {
    rows_converted += other.rows_converted;
    rows_dropped += other.rows_dropped;
    cells_nulled += other.cells_nulled;
    partition_errors.insert(partition_errors.end(), other.partition_errors.begin(),
                            other.partition_errors.end());
}

auto ConversionReport::summary() const -> std::string {
    auto text = fmt::format("rows converted: {}, rows dropped: {}, cells nulled: {}",
                            rows_converted, rows_dropped, cells_nulled);
    if (!partition_errors.empty()) {
        text += fmt::format(", failed partitions: {}", partition_errors.size());
        for (const auto& failure : partition_errors) {
            text += fmt::format("\n  partition {}: {}", failure.partition, failure.error.format());
        }
    }
    return text;
}

auto RowConverter::convert(std::span<const RawValue> raw, const Schema& schema) const
    -> Result<Row> {
    auto converted = convert_counted(raw, schema);
    if (!converted) {
        return std::unexpected(std::move(converted.error()));
    }
    return std::move(converted->row);
}

auto RowConverter::convert_counted(std::span<const RawValue> raw, const Schema& schema) const
    -> Result<ConvertedRow> {
    if (raw.size() != schema.size()) {
        return make_error(ErrorKind::SchemaMismatch,
                          fmt::format("row has {} values, schema has {} columns", raw.size(),
                                      schema.size()));
    }
    ConvertedRow out;
    out.row.resize(raw.size());
    for (std::size_t i = 0; i < raw.size(); ++i) {
        if (is_null(raw[i])) {
            continue;
        }
        auto parsed = parse_value(schema[i].type, raw[i]);
        if (parsed) {
            out.row[i] = std::move(*parsed);
            continue;
        }
        if (options_.policy == ConversionPolicy::Strict) {
            Error error{.kind = ErrorKind::ParseError,
                        .message = fmt::format("column '{}' ({}): {}", schema[i].name,
                                               data_type_name(schema[i].type),
                                               parsed.error().reason),
                        .column = i};
            return std::unexpected(std::move(error));
        }
        out.nulled_cells += 1;
    }
    return out;
}

auto RowConverter::convert_partition(std::span<const RawRow> rows, const Schema& schema) const
    -> Result<PartitionResult> {
    PartitionResult result;
    result.rows.reserve(rows.size());
    for (std::size_t r = 0; r < rows.size(); ++r) {
        auto converted = convert_counted(rows[r], schema);
        if (converted) {
            result.report.cells_nulled += converted->nulled_cells;
            result.report.rows_converted += 1;
            result.rows.push_back(std::move(converted->row));
            continue;
        }
        if (converted.error().kind != ErrorKind::SchemaMismatch) {
            converted.error().message =
                fmt::format("row {}: {}", r, converted.error().message);
            return std::unexpected(std::move(converted.error()));
        }
        spdlog::debug("dropping row {}: {}", r, converted.error().message);
        result.report.rows_dropped += 1;
    }
    if (result.report.rows_dropped > 0) {
        spdlog::warn("dropped {} of {} rows whose length does not match the schema",
                     result.report.rows_dropped, rows.size());
    }
    return result;
}

}  // namespace rowbridge::convert
