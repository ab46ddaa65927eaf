#include <rowbridge/io/persist.hpp>

#include <arrow/api.h>
#include <arrow/io/api.h>
#include <fmt/format.h>
#include <parquet/arrow/reader.h>
#include <parquet/arrow/writer.h>
#include <parquet/properties.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <charconv>
#include <cstddef>
#include <iterator>
#include <limits>
#include <memory>
#include <numeric>
#include <utility>
#include <vector>

namespace rowbridge::io {

namespace {

auto arrow_error(ErrorKind kind, std::string_view what, const std::string& path,
                 const arrow::Status& status) -> std::unexpected<Error> {
    return make_error(kind, fmt::format("{} '{}': {}", what, path, status.ToString()));
}

auto to_arrow_type(DataType type) -> std::shared_ptr<arrow::DataType> {
    switch (type) {
        case DataType::Int32:
            return arrow::int32();
        case DataType::Int64:
            return arrow::int64();
        case DataType::Float32:
            return arrow::float32();
        case DataType::Float64:
            return arrow::float64();
        case DataType::String:
            return arrow::utf8();
        case DataType::Date:
            return arrow::date32();
        case DataType::Timestamp:
            return arrow::timestamp(arrow::TimeUnit::NANO);
    }
    return arrow::utf8();
}

auto from_arrow_type(const arrow::DataType& type) -> std::optional<DataType> {
    switch (type.id()) {
        case arrow::Type::INT32:
            return DataType::Int32;
        case arrow::Type::INT64:
            return DataType::Int64;
        case arrow::Type::FLOAT:
            return DataType::Float32;
        case arrow::Type::DOUBLE:
            return DataType::Float64;
        case arrow::Type::STRING:
        case arrow::Type::LARGE_STRING:
            return DataType::String;
        case arrow::Type::DATE32:
            return DataType::Date;
        case arrow::Type::TIMESTAMP:
            return DataType::Timestamp;
        default:
            return std::nullopt;
    }
}

template <class Cell, class Builder, class Get>
auto build_column(Builder& builder, const Dataset& dataset, std::size_t col, Get get,
                  std::shared_ptr<arrow::Array>* out) -> arrow::Status {
    ARROW_RETURN_NOT_OK(builder.Reserve(static_cast<std::int64_t>(dataset.rows())));
    for (const auto& partition : dataset.partitions()) {
        for (const auto& row : partition) {
            const auto& cell = row[col];
            if (is_null(cell)) {
                ARROW_RETURN_NOT_OK(builder.AppendNull());
            } else {
                ARROW_RETURN_NOT_OK(builder.Append(get(std::get<Cell>(cell))));
            }
        }
    }
    return builder.Finish(out);
}

auto build_array(const Dataset& dataset, std::size_t col, std::shared_ptr<arrow::Array>* out)
    -> arrow::Status {
    auto pass = [](const auto& v) { return v; };
    switch (dataset.schema()[col].type) {
        case DataType::Int32: {
            arrow::Int32Builder builder;
            return build_column<std::int32_t>(builder, dataset, col, pass, out);
        }
        case DataType::Int64: {
            arrow::Int64Builder builder;
            return build_column<std::int64_t>(builder, dataset, col, pass, out);
        }
        case DataType::Float32: {
            arrow::FloatBuilder builder;
            return build_column<float>(builder, dataset, col, pass, out);
        }
        case DataType::Float64: {
            arrow::DoubleBuilder builder;
            return build_column<double>(builder, dataset, col, pass, out);
        }
        case DataType::String: {
            arrow::StringBuilder builder;
            return build_column<std::string>(
                builder, dataset, col, [](const std::string& s) { return std::string_view(s); },
                out);
        }
        case DataType::Date: {
            arrow::Date32Builder builder;
            return build_column<Date>(builder, dataset, col, [](Date d) { return d.days; }, out);
        }
        case DataType::Timestamp: {
            arrow::TimestampBuilder builder(arrow::timestamp(arrow::TimeUnit::NANO),
                                            arrow::default_memory_pool());
            return build_column<Timestamp>(builder, dataset, col,
                                           [](Timestamp t) { return t.nanos; }, out);
        }
    }
    return arrow::Status::Invalid("unknown column type");
}

auto format_partition_sizes(const Dataset& dataset) -> std::string {
    std::string out;
    for (std::size_t p = 0; p < dataset.num_partitions(); ++p) {
        if (p > 0) {
            out += ',';
        }
        out += fmt::format("{}", dataset.partitions()[p].size());
    }
    return out;
}

auto parse_partition_sizes(std::string_view text, std::size_t total)
    -> Result<std::vector<std::size_t>> {
    std::vector<std::size_t> sizes;
    std::size_t pos = 0;
    while (!text.empty() && pos <= text.size()) {
        std::size_t comma = text.find(',', pos);
        if (comma == std::string_view::npos) {
            comma = text.size();
        }
        auto token = text.substr(pos, comma - pos);
        std::size_t size = 0;
        auto [ptr, ec] = std::from_chars(token.data(), token.data() + token.size(), size);
        if (ec != std::errc() || ptr != token.data() + token.size()) {
            return make_error(ErrorKind::DeserializationError,
                              fmt::format("invalid partition size '{}'", token));
        }
        sizes.push_back(size);
        if (comma == text.size()) {
            break;
        }
        pos = comma + 1;
    }
    if (std::accumulate(sizes.begin(), sizes.end(), std::size_t{0}) != total) {
        return make_error(ErrorKind::DeserializationError,
                          fmt::format("partition sizes do not add up to {} rows", total));
    }
    return sizes;
}

auto find_metadata(const arrow::KeyValueMetadata* metadata, std::string_view key)
    -> std::optional<std::string> {
    if (metadata == nullptr) {
        return std::nullopt;
    }
    int index = metadata->FindKey(std::string(key));
    if (index < 0) {
        return std::nullopt;
    }
    return metadata->value(index);
}

template <class ArrayT, class Make>
void read_cells(const arrow::ChunkedArray& chunked, std::vector<Row>& rows, std::size_t col,
                Make make) {
    std::size_t r = 0;
    for (const auto& chunk : chunked.chunks()) {
        const auto& array = static_cast<const ArrayT&>(*chunk);
        for (std::int64_t i = 0; i < array.length(); ++i, ++r) {
            if (!array.IsNull(i)) {
                rows[r][col] = make(array, i);
            }
        }
    }
}

auto nanos_per_unit(arrow::TimeUnit::type unit) -> std::int64_t {
    switch (unit) {
        case arrow::TimeUnit::SECOND:
            return 1'000'000'000;
        case arrow::TimeUnit::MILLI:
            return 1'000'000;
        case arrow::TimeUnit::MICRO:
            return 1'000;
        case arrow::TimeUnit::NANO:
            return 1;
    }
    return 1;
}

/// Timestamps are stored in any unit; scale them to nanoseconds and reject
/// values that do not fit.
auto read_timestamps(const arrow::ChunkedArray& chunked, std::vector<Row>& rows, std::size_t col)
    -> Result<void> {
    const auto& ts_type = static_cast<const arrow::TimestampType&>(*chunked.type());
    const std::int64_t scale = nanos_per_unit(ts_type.unit());
    constexpr auto kMax = std::numeric_limits<std::int64_t>::max();
    constexpr auto kMin = std::numeric_limits<std::int64_t>::min();
    std::size_t r = 0;
    for (const auto& chunk : chunked.chunks()) {
        const auto& array = static_cast<const arrow::TimestampArray&>(*chunk);
        for (std::int64_t i = 0; i < array.length(); ++i, ++r) {
            if (array.IsNull(i)) {
                continue;
            }
            const std::int64_t value = array.Value(i);
            if (value > kMax / scale || value < kMin / scale) {
                return make_error(ErrorKind::DeserializationError,
                                  fmt::format("timestamp {} in row {} does not fit in nanoseconds",
                                              value, r));
            }
            rows[r][col] = Value{Timestamp{value * scale}};
        }
    }
    return {};
}

auto read_column(const arrow::ChunkedArray& chunked, DataType type, std::vector<Row>& rows,
                 std::size_t col) -> Result<void> {
    switch (type) {
        case DataType::Int32:
            read_cells<arrow::Int32Array>(chunked, rows, col, [](const auto& a, std::int64_t i) {
                return Value{a.Value(i)};
            });
            break;
        case DataType::Int64:
            read_cells<arrow::Int64Array>(chunked, rows, col, [](const auto& a, std::int64_t i) {
                return Value{a.Value(i)};
            });
            break;
        case DataType::Float32:
            read_cells<arrow::FloatArray>(chunked, rows, col, [](const auto& a, std::int64_t i) {
                return Value{a.Value(i)};
            });
            break;
        case DataType::Float64:
            read_cells<arrow::DoubleArray>(chunked, rows, col, [](const auto& a, std::int64_t i) {
                return Value{a.Value(i)};
            });
            break;
        case DataType::String:
            if (chunked.type()->id() == arrow::Type::LARGE_STRING) {
                read_cells<arrow::LargeStringArray>(
                    chunked, rows, col,
                    [](const auto& a, std::int64_t i) { return Value{a.GetString(i)}; });
            } else {
                read_cells<arrow::StringArray>(
                    chunked, rows, col,
                    [](const auto& a, std::int64_t i) { return Value{a.GetString(i)}; });
            }
            break;
        case DataType::Date:
            read_cells<arrow::Date32Array>(chunked, rows, col, [](const auto& a, std::int64_t i) {
                return Value{Date{a.Value(i)}};
            });
            break;
        case DataType::Timestamp:
            return read_timestamps(chunked, rows, col);
    }
    return {};
}

struct OpenedFrame {
    std::unique_ptr<parquet::arrow::FileReader> reader;
    Artifact artifact;
    std::optional<std::string> partitions;
};

auto open_frame(const std::string& path) -> Result<OpenedFrame> {
    auto input_result = arrow::io::ReadableFile::Open(path);
    if (!input_result.ok()) {
        return arrow_error(ErrorKind::IoError, "failed to open", path, input_result.status());
    }

    OpenedFrame opened;
    auto st = parquet::arrow::OpenFile(input_result.ValueOrDie(), arrow::default_memory_pool(),
                                       &opened.reader);
    if (!st.ok()) {
        return arrow_error(ErrorKind::DeserializationError, "failed to read", path, st);
    }

    std::shared_ptr<arrow::Schema> schema;
    st = opened.reader->GetSchema(&schema);
    if (!st.ok()) {
        return arrow_error(ErrorKind::DeserializationError, "failed to read schema of", path, st);
    }

    // Layout checks come before anything else is decoded.
    const auto* metadata = schema->metadata().get();
    auto format_id = find_metadata(metadata, kFormatIdKey);
    if (format_id != kFormatId) {
        return make_error(ErrorKind::UnsupportedFormatVersion,
                          fmt::format("'{}' is not a rowbridge frame file", path));
    }
    auto version_text = find_metadata(metadata, kFormatVersionKey);
    auto version = validate_format_version(
        version_text.has_value() ? parse_format_version(*version_text) : std::nullopt);
    if (!version) {
        version.error().message = fmt::format("'{}': {}", path, version.error().message);
        return std::unexpected(std::move(version.error()));
    }

    std::vector<Column> columns;
    columns.reserve(static_cast<std::size_t>(schema->num_fields()));
    for (const auto& field : schema->fields()) {
        auto type = from_arrow_type(*field->type());
        if (!type.has_value()) {
            return make_error(ErrorKind::DeserializationError,
                              fmt::format("'{}': unsupported column type {} for '{}'", path,
                                          field->type()->ToString(), field->name()));
        }
        columns.push_back(Column{.name = field->name(), .type = *type});
    }
    auto frame_schema = Schema::make(std::move(columns));
    if (!frame_schema) {
        return std::unexpected(std::move(frame_schema.error()));
    }

    opened.artifact = Artifact{.schema = std::move(*frame_schema),
                               .format_version = *version,
                               .metadata = find_metadata(metadata, kMetadataKey).value_or("")};
    opened.partitions = find_metadata(metadata, kPartitionsKey);
    return opened;
}

}  // namespace

auto validate_format_version(std::optional<int> version, std::span<const int> supported)
    -> Result<int> {
    if (!version.has_value()) {
        return make_error(ErrorKind::UnsupportedFormatVersion, "missing format version");
    }
    if (std::find(supported.begin(), supported.end(), *version) == supported.end()) {
        return make_error(ErrorKind::UnsupportedFormatVersion,
                          fmt::format("unsupported format version {}", *version));
    }
    return *version;
}

auto parse_format_version(std::string_view text) -> std::optional<int> {
    int version = 0;
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), version);
    if (ec != std::errc() || ptr != text.data() + text.size()) {
        return std::nullopt;
    }
    return version;
}

auto save_frame(const std::string& path, const Dataset& dataset, std::string_view metadata)
    -> Result<std::int64_t> {
    const auto& schema = dataset.schema();
    if (schema.empty()) {
        return make_error(ErrorKind::InvalidArgument, "cannot save a frame with no columns");
    }

    std::vector<std::shared_ptr<arrow::Field>> fields;
    std::vector<std::shared_ptr<arrow::Array>> arrays;
    fields.reserve(schema.size());
    arrays.reserve(schema.size());
    for (std::size_t c = 0; c < schema.size(); ++c) {
        fields.push_back(arrow::field(schema[c].name, to_arrow_type(schema[c].type)));
        std::shared_ptr<arrow::Array> array;
        auto st = build_array(dataset, c, &array);
        if (!st.ok()) {
            return arrow_error(ErrorKind::IoError,
                               fmt::format("failed to build column '{}' for", schema[c].name),
                               path, st);
        }
        arrays.push_back(std::move(array));
    }

    auto tags = arrow::key_value_metadata(
        {std::string(kFormatIdKey), std::string(kFormatVersionKey), std::string(kMetadataKey),
         std::string(kPartitionsKey)},
        {std::string(kFormatId), fmt::format("{}", kFormatVersion), std::string(metadata),
         format_partition_sizes(dataset)});
    auto arrow_schema = arrow::schema(std::move(fields), std::move(tags));
    auto table = arrow::Table::Make(arrow_schema, arrays,
                                    static_cast<std::int64_t>(dataset.rows()));

    auto sink_result = arrow::io::FileOutputStream::Open(path);
    if (!sink_result.ok()) {
        return arrow_error(ErrorKind::IoError, "cannot open for writing", path,
                           sink_result.status());
    }
    auto sink = sink_result.ValueOrDie();

    parquet::WriterProperties::Builder properties_builder;
    properties_builder.version(parquet::ParquetVersion::PARQUET_2_6);
    auto properties = properties_builder.build();
    auto arrow_properties = parquet::ArrowWriterProperties::Builder().store_schema()->build();
    auto st = parquet::arrow::WriteTable(*table, arrow::default_memory_pool(), sink,
                                         /*chunk_size=*/static_cast<std::int64_t>(64) * 1024 * 1024,
                                         properties, arrow_properties);
    if (!st.ok()) {
        return arrow_error(ErrorKind::IoError, "failed to write", path, st);
    }
    st = sink->Close();
    if (!st.ok()) {
        return arrow_error(ErrorKind::IoError, "failed to close", path, st);
    }

    spdlog::debug("saved {} rows in {} partitions to {}", dataset.rows(),
                  dataset.num_partitions(), path);
    return static_cast<std::int64_t>(dataset.rows());
}

auto read_artifact(const std::string& path) -> Result<Artifact> {
    auto opened = open_frame(path);
    if (!opened) {
        return std::unexpected(std::move(opened.error()));
    }
    return std::move(opened->artifact);
}

auto load_frame(const std::string& path) -> Result<LoadedFrame> {
    auto opened = open_frame(path);
    if (!opened) {
        return std::unexpected(std::move(opened.error()));
    }
    const auto& schema = opened->artifact.schema;

    std::shared_ptr<arrow::Table> table;
    auto st = opened->reader->ReadTable(&table);
    if (!st.ok()) {
        return arrow_error(ErrorKind::DeserializationError, "failed to load table", path, st);
    }
    if (static_cast<std::size_t>(table->num_columns()) != schema.size()) {
        return make_error(ErrorKind::DeserializationError,
                          fmt::format("'{}': table has {} columns, schema has {}", path,
                                      table->num_columns(), schema.size()));
    }

    const auto total = static_cast<std::size_t>(table->num_rows());
    std::vector<Row> rows(total, Row(schema.size()));
    for (std::size_t c = 0; c < schema.size(); ++c) {
        auto read = read_column(*table->column(static_cast<int>(c)), schema[c].type, rows, c);
        if (!read) {
            read.error().message =
                fmt::format("'{}': column '{}': {}", path, schema[c].name, read.error().message);
            return std::unexpected(std::move(read.error()));
        }
    }

    std::vector<std::size_t> sizes{total};
    if (opened->partitions.has_value()) {
        auto parsed = parse_partition_sizes(*opened->partitions, total);
        if (!parsed) {
            parsed.error().message = fmt::format("'{}': {}", path, parsed.error().message);
            return std::unexpected(std::move(parsed.error()));
        }
        sizes = std::move(*parsed);
    }

    std::vector<Partition> partitions;
    partitions.reserve(sizes.size());
    auto next = rows.begin();
    for (auto size : sizes) {
        auto end = next + static_cast<std::ptrdiff_t>(size);
        partitions.emplace_back(std::make_move_iterator(next), std::make_move_iterator(end));
        next = end;
    }

    auto dataset = Dataset::make(schema, std::move(partitions));
    if (!dataset) {
        dataset.error().kind = ErrorKind::DeserializationError;
        dataset.error().message = fmt::format("'{}': {}", path, dataset.error().message);
        return std::unexpected(std::move(dataset.error()));
    }
    return LoadedFrame{.dataset = std::move(*dataset),
                       .format_version = opened->artifact.format_version,
                       .metadata = std::move(opened->artifact.metadata)};
}

}  // namespace rowbridge::io
