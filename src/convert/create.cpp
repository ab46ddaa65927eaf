#include <rowbridge/convert/create.hpp>

#include <fmt/format.h>

#include <algorithm>
#include <type_traits>
#include <utility>

namespace rowbridge::convert {

namespace {

// Ordered from most to least specific; inference only ever moves right.
enum class Inferred : std::uint8_t {
    Unknown,
    Int,
    Float,
    Text,
};

auto classify(const RawValue& raw) -> Inferred {
    return std::visit(
        [](const auto& v) -> Inferred {
            using T = std::decay_t<decltype(v)>;
            if constexpr (std::is_same_v<T, Null>) {
                return Inferred::Unknown;
            } else if constexpr (std::is_same_v<T, bool> || std::is_same_v<T, std::int64_t>) {
                return Inferred::Int;
            } else if constexpr (std::is_same_v<T, double>) {
                return Inferred::Float;
            } else {
                if (parse_value(DataType::Int64, RawValue{v})) {
                    return Inferred::Int;
                }
                if (parse_value(DataType::Float64, RawValue{v})) {
                    return Inferred::Float;
                }
                return Inferred::Text;
            }
        },
        raw);
}

auto to_data_type(Inferred inferred) -> DataType {
    switch (inferred) {
        case Inferred::Int:
            return DataType::Int64;
        case Inferred::Float:
            return DataType::Float64;
        case Inferred::Unknown:
        case Inferred::Text:
            return DataType::String;
    }
    return DataType::String;
}

}  // namespace

auto infer_schema(std::span<const RawRow> rows, const InferOptions& options,
                  const std::vector<std::string>& names) -> Result<Schema> {
    const auto sample = rows.first(std::min(options.sample_rows, rows.size()));
    std::size_t width = names.size();
    for (const auto& row : sample) {
        width = std::max(width, row.size());
    }
    if (!names.empty() && names.size() != width) {
        return make_error(ErrorKind::SchemaMismatch,
                          fmt::format("{} column names given for {} columns", names.size(),
                                      width));
    }

    std::vector<Inferred> kinds(width, Inferred::Unknown);
    for (const auto& row : sample) {
        for (std::size_t i = 0; i < row.size(); ++i) {
            kinds[i] = std::max(kinds[i], classify(row[i]));
        }
    }

    std::vector<Column> columns;
    columns.reserve(width);
    for (std::size_t i = 0; i < width; ++i) {
        columns.push_back(Column{.name = names.empty() ? fmt::format("C{}", i) : names[i],
                                 .type = to_data_type(kinds[i])});
    }
    return Schema::make(std::move(columns));
}

auto create_dataset(std::span<const std::vector<RawRow>> partitions, const Schema& schema,
                    const ConvertOptions& options) -> Result<ConvertedDataset> {
    const RowConverter converter{options};
    ConversionReport report;
    std::vector<Partition> converted;
    converted.reserve(partitions.size());
    for (std::size_t p = 0; p < partitions.size(); ++p) {
        auto result = converter.convert_partition(partitions[p], schema);
        if (!result) {
            result.error().message =
                fmt::format("partition {}: {}", p, result.error().message);
            return std::unexpected(std::move(result.error()));
        }
        report.merge(result->report);
        converted.push_back(std::move(result->rows));
    }
    return ConvertedDataset{.dataset = Dataset::adopt(schema, std::move(converted)),
                            .report = std::move(report)};
}

}  // namespace rowbridge::convert
