#include <rowbridge/codec/batch_codec.hpp>

#include <arrow/api.h>
#include <arrow/io/memory.h>
#include <arrow/ipc/api.h>
#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <atomic>
#include <exception>
#include <future>
#include <limits>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <thread>
#include <type_traits>
#include <utility>

namespace rowbridge::codec {

namespace {

constexpr std::int8_t kNullCode = 0;
constexpr std::int8_t kBoolCode = 1;
constexpr std::int8_t kInt64Code = 2;
constexpr std::int8_t kFloat64Code = 3;
constexpr std::int8_t kStringCode = 4;

auto cell_type() -> std::shared_ptr<arrow::DataType> {
    return arrow::dense_union({arrow::field("null", arrow::null()),
                               arrow::field("bool", arrow::boolean()),
                               arrow::field("int64", arrow::int64()),
                               arrow::field("float64", arrow::float64()),
                               arrow::field("utf8", arrow::utf8())},
                              {kNullCode, kBoolCode, kInt64Code, kFloat64Code, kStringCode});
}

auto row_type() -> std::shared_ptr<arrow::DataType> {
    return arrow::list(arrow::field("item", cell_type()));
}

auto wire_schema() -> std::shared_ptr<arrow::Schema> {
    return arrow::schema({arrow::field("row", row_type())});
}

auto arrow_error(ErrorKind kind, std::string_view what, const arrow::Status& status)
    -> std::unexpected<Error> {
    return make_error(kind, fmt::format("{}: {}", what, status.ToString()));
}

/// Builds the `row` column of one batch.
class RowWriter {
   public:
    RowWriter()
        : nulls_(std::make_shared<arrow::NullBuilder>()),
          bools_(std::make_shared<arrow::BooleanBuilder>()),
          ints_(std::make_shared<arrow::Int64Builder>()),
          doubles_(std::make_shared<arrow::DoubleBuilder>()),
          strings_(std::make_shared<arrow::StringBuilder>()),
          cells_(std::make_shared<arrow::DenseUnionBuilder>(
              arrow::default_memory_pool(),
              std::vector<std::shared_ptr<arrow::ArrayBuilder>>{nulls_, bools_, ints_, doubles_,
                                                                strings_},
              cell_type())),
          rows_(arrow::default_memory_pool(), cells_, row_type()) {}

    auto append(const RawRow& row) -> arrow::Status {
        ARROW_RETURN_NOT_OK(rows_.Append());
        for (const auto& cell : row) {
            ARROW_RETURN_NOT_OK(append_cell(cell));
        }
        return arrow::Status::OK();
    }

    auto append(const Row& row) -> arrow::Status {
        ARROW_RETURN_NOT_OK(rows_.Append());
        for (const auto& cell : row) {
            ARROW_RETURN_NOT_OK(append_cell(strip(cell)));
        }
        return arrow::Status::OK();
    }

    auto finish(std::shared_ptr<arrow::Array>* out) -> arrow::Status { return rows_.Finish(out); }

   private:
    auto append_cell(const RawValue& cell) -> arrow::Status {
        return std::visit(
            [this](const auto& v) -> arrow::Status {
                using T = std::decay_t<decltype(v)>;
                if constexpr (std::is_same_v<T, Null>) {
                    ARROW_RETURN_NOT_OK(cells_->Append(kNullCode));
                    return nulls_->AppendNull();
                } else if constexpr (std::is_same_v<T, bool>) {
                    ARROW_RETURN_NOT_OK(cells_->Append(kBoolCode));
                    return bools_->Append(v);
                } else if constexpr (std::is_same_v<T, std::int64_t>) {
                    ARROW_RETURN_NOT_OK(cells_->Append(kInt64Code));
                    return ints_->Append(v);
                } else if constexpr (std::is_same_v<T, double>) {
                    ARROW_RETURN_NOT_OK(cells_->Append(kFloat64Code));
                    return doubles_->Append(v);
                } else {
                    ARROW_RETURN_NOT_OK(cells_->Append(kStringCode));
                    return strings_->Append(v);
                }
            },
            cell);
    }

    std::shared_ptr<arrow::NullBuilder> nulls_;
    std::shared_ptr<arrow::BooleanBuilder> bools_;
    std::shared_ptr<arrow::Int64Builder> ints_;
    std::shared_ptr<arrow::DoubleBuilder> doubles_;
    std::shared_ptr<arrow::StringBuilder> strings_;
    std::shared_ptr<arrow::DenseUnionBuilder> cells_;
    arrow::ListBuilder rows_;
};

auto write_stream(RowWriter& writer) -> Result<Batch> {
    std::shared_ptr<arrow::Array> rows;
    auto st = writer.finish(&rows);
    if (!st.ok()) {
        return arrow_error(ErrorKind::IoError, "cannot build batch", st);
    }
    auto record_batch = arrow::RecordBatch::Make(wire_schema(), rows->length(),
                                                 std::vector<std::shared_ptr<arrow::Array>>{rows});

    auto sink_result = arrow::io::BufferOutputStream::Create();
    if (!sink_result.ok()) {
        return arrow_error(ErrorKind::IoError, "cannot allocate batch buffer",
                           sink_result.status());
    }
    auto sink = sink_result.ValueOrDie();
    auto writer_result = arrow::ipc::MakeStreamWriter(sink, record_batch->schema());
    if (!writer_result.ok()) {
        return arrow_error(ErrorKind::IoError, "cannot open batch stream", writer_result.status());
    }
    auto stream = writer_result.ValueOrDie();
    st = stream->WriteRecordBatch(*record_batch);
    if (!st.ok()) {
        return arrow_error(ErrorKind::IoError, "cannot write batch", st);
    }
    st = stream->Close();
    if (!st.ok()) {
        return arrow_error(ErrorKind::IoError, "cannot close batch stream", st);
    }
    auto buffer_result = sink->Finish();
    if (!buffer_result.ok()) {
        return arrow_error(ErrorKind::IoError, "cannot finish batch buffer",
                           buffer_result.status());
    }
    const auto& buffer = buffer_result.ValueOrDie();
    return Batch(buffer->data(), buffer->data() + buffer->size());
}

template <typename ArrayT>
auto integer_at(const arrow::Array& array, std::int64_t i) -> RawValue {
    return static_cast<std::int64_t>(static_cast<const ArrayT&>(array).Value(i));
}

auto cell_at(const arrow::Array& array, std::int64_t i) -> Result<RawValue> {
    switch (array.type_id()) {
        case arrow::Type::DENSE_UNION:
        case arrow::Type::SPARSE_UNION: {
            const auto& cells = static_cast<const arrow::UnionArray&>(array);
            const auto code = cells.raw_type_codes()[i];
            const auto& child_ids = cells.union_type()->child_ids();
            const int child = code < 0 ? -1 : child_ids[static_cast<std::size_t>(code)];
            if (child < 0 || child >= cells.num_fields()) {
                return make_error(ErrorKind::DeserializationError,
                                  fmt::format("invalid union type code {}", code));
            }
            const std::int64_t pos =
                array.type_id() == arrow::Type::DENSE_UNION
                    ? static_cast<const arrow::DenseUnionArray&>(array).value_offset(i)
                    : i;
            return cell_at(*cells.field(child), pos);
        }
        default:
            break;
    }

    if (array.IsNull(i)) {
        return RawValue{};
    }
    switch (array.type_id()) {
        case arrow::Type::NA:
            return RawValue{};
        case arrow::Type::BOOL:
            return RawValue{static_cast<const arrow::BooleanArray&>(array).Value(i)};
        case arrow::Type::INT8:
            return integer_at<arrow::Int8Array>(array, i);
        case arrow::Type::INT16:
            return integer_at<arrow::Int16Array>(array, i);
        case arrow::Type::INT32:
            return integer_at<arrow::Int32Array>(array, i);
        case arrow::Type::INT64:
            return integer_at<arrow::Int64Array>(array, i);
        case arrow::Type::UINT8:
            return integer_at<arrow::UInt8Array>(array, i);
        case arrow::Type::UINT16:
            return integer_at<arrow::UInt16Array>(array, i);
        case arrow::Type::UINT32:
            return integer_at<arrow::UInt32Array>(array, i);
        case arrow::Type::UINT64: {
            // Values past int64 keep their exact digits as text.
            const auto value = static_cast<const arrow::UInt64Array&>(array).Value(i);
            if (value > static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max())) {
                return RawValue{fmt::format("{}", value)};
            }
            return RawValue{static_cast<std::int64_t>(value)};
        }
        case arrow::Type::FLOAT:
            return RawValue{static_cast<double>(static_cast<const arrow::FloatArray&>(array).Value(i))};
        case arrow::Type::DOUBLE:
            return RawValue{static_cast<const arrow::DoubleArray&>(array).Value(i)};
        case arrow::Type::STRING:
            return RawValue{static_cast<const arrow::StringArray&>(array).GetString(i)};
        case arrow::Type::LARGE_STRING:
            return RawValue{static_cast<const arrow::LargeStringArray&>(array).GetString(i)};
        default:
            return make_error(ErrorKind::DeserializationError,
                              fmt::format("unsupported cell type {}", array.type()->ToString()));
    }
}

/// Normalizes the accepted row container shapes into one RawRow. A null
/// list entry reads as a row with no values.
auto to_raw_row(const arrow::Array& rows, std::int64_t r) -> Result<RawRow> {
    std::shared_ptr<arrow::Array> values;
    std::int64_t offset = 0;
    std::int64_t length = 0;
    switch (rows.type_id()) {
        case arrow::Type::LIST: {
            const auto& list = static_cast<const arrow::ListArray&>(rows);
            values = list.values();
            offset = list.value_offset(r);
            length = list.value_length(r);
            break;
        }
        case arrow::Type::LARGE_LIST: {
            const auto& list = static_cast<const arrow::LargeListArray&>(rows);
            values = list.values();
            offset = list.value_offset(r);
            length = list.value_length(r);
            break;
        }
        case arrow::Type::FIXED_SIZE_LIST: {
            const auto& list = static_cast<const arrow::FixedSizeListArray&>(rows);
            values = list.values();
            offset = list.value_offset(r);
            length = list.value_length(r);
            break;
        }
        default:
            return make_error(ErrorKind::DeserializationError,
                              fmt::format("row column must be a list, got {}",
                                          rows.type()->ToString()));
    }

    RawRow row;
    if (rows.IsNull(r)) {
        return row;
    }
    row.reserve(static_cast<std::size_t>(length));
    for (std::int64_t k = 0; k < length; ++k) {
        auto cell = cell_at(*values, offset + k);
        if (!cell) {
            return std::unexpected(std::move(cell.error()));
        }
        row.push_back(std::move(*cell));
    }
    return row;
}

/// Run `task(p)` for every partition index and return the results in
/// partition order. With `parallel` set, up to `max_workers` workers (0 for
/// the hardware concurrency) pull indices from a shared counter. Exceptions
/// thrown by a task become a ResourceError for that partition.
template <typename Task>
auto run_partitions(std::size_t count, bool parallel, std::size_t max_workers, Task task)
    -> std::vector<std::invoke_result_t<Task&, std::size_t>> {
    using R = std::invoke_result_t<Task&, std::size_t>;
    auto guarded = [&task](std::size_t p) -> R {
        try {
            return task(p);
        } catch (const std::exception& e) {
            return make_error(ErrorKind::ResourceError, e.what());
        }
    };

    std::vector<std::optional<R>> slots(count);
    std::atomic<std::size_t> next{0};
    auto drain = [&]() {
        for (std::size_t p = next.fetch_add(1); p < count; p = next.fetch_add(1)) {
            slots[p].emplace(guarded(p));
        }
    };

    if (parallel && count > 1) {
        if (max_workers == 0) {
            max_workers = std::max<std::size_t>(std::thread::hardware_concurrency(), 1);
        }
        const std::size_t workers = std::min(count, max_workers);
        std::vector<std::future<void>> futures;
        futures.reserve(workers);
        for (std::size_t w = 0; w < workers; ++w) {
            try {
                futures.push_back(std::async(std::launch::async, drain));
            } catch (const std::system_error& e) {
                spdlog::warn("started {} of {} workers: {}", w, workers, e.what());
                break;
            }
        }
        for (auto& f : futures) {
            f.get();
        }
    }
    // Serial runs, and whatever no worker picked up.
    drain();

    std::vector<R> results;
    results.reserve(count);
    for (auto& slot : slots) {
        results.push_back(std::move(*slot));
    }
    return results;
}

}  // namespace

AutoBatcher::AutoBatcher(BatchingOptions options)
    : options_(options),
      next_rows_(std::clamp<std::size_t>(options.initial_rows, 1,
                                         std::max<std::size_t>(options.max_rows, 1))) {}

void AutoBatcher::record(std::size_t rows, std::size_t bytes) {
    const std::size_t max_rows = std::max<std::size_t>(options_.max_rows, 1);
    if (bytes < options_.target_batch_bytes) {
        next_rows_ = std::min(next_rows_ * 2, max_rows);
    } else if (bytes > options_.target_batch_bytes * 10 && next_rows_ > 1) {
        next_rows_ /= 2;
    }
    spdlog::debug("batch of {} rows took {} bytes, next batch {} rows", rows, bytes, next_rows_);
}

auto EncodedDataset::num_batches() const noexcept -> std::size_t {
    std::size_t total = 0;
    for (const auto& partition : partitions) {
        total += partition.size();
    }
    return total;
}

auto EncodedDataset::num_bytes() const noexcept -> std::size_t {
    std::size_t total = 0;
    for (const auto& partition : partitions) {
        for (const auto& batch : partition) {
            total += batch.size();
        }
    }
    return total;
}

auto encode_rows(std::span<const RawRow> rows) -> Result<Batch> {
    RowWriter writer;
    for (const auto& row : rows) {
        auto st = writer.append(row);
        if (!st.ok()) {
            return arrow_error(ErrorKind::IoError, "cannot append row", st);
        }
    }
    return write_stream(writer);
}

auto encode_partition(const Partition& rows, const BatchingOptions& options)
    -> Result<std::vector<Batch>> {
    std::vector<Batch> batches;
    AutoBatcher batcher{options};
    auto it = rows.begin();
    while (it != rows.end()) {
        RowWriter writer;
        const std::size_t wanted = batcher.next_rows();
        std::size_t count = 0;
        for (; it != rows.end() && count < wanted; ++it, ++count) {
            auto st = writer.append(*it);
            if (!st.ok()) {
                return arrow_error(ErrorKind::IoError, "cannot append row", st);
            }
        }
        auto batch = write_stream(writer);
        if (!batch) {
            return std::unexpected(std::move(batch.error()));
        }
        batcher.record(count, batch->size());
        batches.push_back(std::move(*batch));
    }
    return batches;
}

auto encode(const Dataset& dataset, const EncodeOptions& options) -> Result<EncodedDataset> {
    const auto& partitions = dataset.partitions();
    auto results = run_partitions(partitions.size(), options.parallel, options.max_workers,
                                  [&](std::size_t p) {
                                      return encode_partition(partitions[p], options.batching);
                                  });
    EncodedDataset encoded;
    encoded.partitions.reserve(results.size());
    for (std::size_t p = 0; p < results.size(); ++p) {
        if (!results[p]) {
            results[p].error().message =
                fmt::format("partition {}: {}", p, results[p].error().message);
            return std::unexpected(std::move(results[p].error()));
        }
        encoded.partitions.push_back(std::move(*results[p]));
    }
    return encoded;
}

auto decode_batch(std::span<const std::uint8_t> bytes) -> Result<std::vector<RawRow>> {
    auto buffer =
        std::make_shared<arrow::Buffer>(bytes.data(), static_cast<std::int64_t>(bytes.size()));
    auto input = std::make_shared<arrow::io::BufferReader>(buffer);
    auto reader_result = arrow::ipc::RecordBatchStreamReader::Open(input);
    if (!reader_result.ok()) {
        return arrow_error(ErrorKind::DeserializationError, "cannot open batch stream",
                           reader_result.status());
    }
    auto reader = reader_result.ValueOrDie();
    if (reader->schema()->num_fields() != 1) {
        return make_error(ErrorKind::DeserializationError,
                          fmt::format("batch has {} columns, expected 1",
                                      reader->schema()->num_fields()));
    }

    std::vector<RawRow> rows;
    while (true) {
        std::shared_ptr<arrow::RecordBatch> batch;
        auto st = reader->ReadNext(&batch);
        if (!st.ok()) {
            return arrow_error(ErrorKind::DeserializationError, "cannot read batch", st);
        }
        if (batch == nullptr) {
            break;
        }
        st = batch->ValidateFull();
        if (!st.ok()) {
            return arrow_error(ErrorKind::DeserializationError, "invalid batch", st);
        }
        const auto& column = *batch->column(0);
        rows.reserve(rows.size() + static_cast<std::size_t>(batch->num_rows()));
        for (std::int64_t r = 0; r < batch->num_rows(); ++r) {
            auto row = to_raw_row(column, r);
            if (!row) {
                return std::unexpected(std::move(row.error()));
            }
            rows.push_back(std::move(*row));
        }
    }
    return rows;
}

auto decode_partition(std::span<const Batch> batches, const Schema& schema,
                      const DecodeOptions& options) -> Result<convert::PartitionResult> {
    const convert::RowConverter converter{options.convert};
    convert::PartitionResult result;
    for (std::size_t b = 0; b < batches.size(); ++b) {
        auto raw = decode_batch(batches[b]);
        if (!raw) {
            raw.error().message = fmt::format("batch {}: {}", b, raw.error().message);
            return std::unexpected(std::move(raw.error()));
        }
        auto converted = converter.convert_partition(*raw, schema);
        if (!converted) {
            converted.error().message =
                fmt::format("batch {}: {}", b, converted.error().message);
            return std::unexpected(std::move(converted.error()));
        }
        result.report.merge(converted->report);
        result.rows.insert(result.rows.end(), std::make_move_iterator(converted->rows.begin()),
                           std::make_move_iterator(converted->rows.end()));
    }
    return result;
}

auto decode(const EncodedDataset& encoded, const Schema& schema, const DecodeOptions& options)
    -> convert::ConvertedDataset {
    const auto& sources = encoded.partitions;
    auto results = run_partitions(sources.size(), options.parallel, options.max_workers,
                                  [&](std::size_t p) {
                                      return decode_partition(sources[p], schema, options);
                                  });

    convert::ConversionReport report;
    std::vector<Partition> partitions;
    partitions.reserve(results.size());
    for (std::size_t p = 0; p < results.size(); ++p) {
        if (results[p]) {
            report.merge(results[p]->report);
            partitions.push_back(std::move(results[p]->rows));
            continue;
        }
        spdlog::warn("partition {} failed to decode: {}", p, results[p].error().format());
        report.partition_errors.push_back(
            convert::PartitionError{.partition = p, .error = std::move(results[p].error())});
        partitions.emplace_back();
    }
    return convert::ConvertedDataset{.dataset = Dataset::adopt(schema, std::move(partitions)),
                                     .report = std::move(report)};
}

}  // namespace rowbridge::codec
