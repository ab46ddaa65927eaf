#include <rowbridge/codec/batch_codec.hpp>

#include <arrow/api.h>
#include <arrow/io/memory.h>
#include <arrow/ipc/api.h>
#include <catch2/catch_test_macros.hpp>
#include <fmt/format.h>

#include <algorithm>
#include <cstdint>
#include <limits>
#include <memory>
#include <string>
#include <thread>
#include <vector>

using namespace std::string_literals;

using rowbridge::DataType;
using rowbridge::Dataset;
using rowbridge::ErrorKind;
using rowbridge::Null;
using rowbridge::RawRow;
using rowbridge::Row;
using rowbridge::codec::Batch;

namespace {

auto all_types_schema() -> rowbridge::Schema {
    auto schema = rowbridge::parse_schema_spec(
        "i32:int32,i64:int64,f32:float32,f64:float64,s:string,d:date,ts:timestamp");
    REQUIRE(schema.has_value());
    return *schema;
}

// Every fifth row is all nulls. Dates start before year 0 so both the ISO
// and the day-count wire forms are covered; rows 1 and 2 hold the int32
// extremes.
auto sample_rows(std::size_t count) -> std::vector<Row> {
    std::vector<Row> rows;
    for (std::size_t i = 0; i < count; ++i) {
        const auto n = static_cast<std::int64_t>(i);
        if (i % 5 == 4) {
            rows.push_back(Row(7, Null{}));
            continue;
        }
        auto date = rowbridge::Date{static_cast<std::int32_t>(n * 9'000 - 800'000)};
        if (i == 1) {
            date = rowbridge::Date{std::numeric_limits<std::int32_t>::max()};
        } else if (i == 2) {
            date = rowbridge::Date{std::numeric_limits<std::int32_t>::min()};
        }
        rows.push_back({static_cast<std::int32_t>(-n), n * 1'000'000'007,
                        static_cast<float>(n) / 3.0F, static_cast<double>(n) * 0.1,
                        fmt::format("row {}", i), date,
                        rowbridge::Timestamp{n * 1'234'567'891'011}});
    }
    return rows;
}

auto sample_dataset(std::size_t count, std::size_t partitions) -> Dataset {
    auto dataset = Dataset::from_rows(all_types_schema(), sample_rows(count), partitions);
    REQUIRE(dataset.has_value());
    return *dataset;
}

/// Wrap a single row column in an IPC stream, the way a foreign runtime
/// would ship it.
auto stream_of(const std::shared_ptr<arrow::Array>& rows) -> Batch {
    auto schema = arrow::schema({arrow::field("row", rows->type())});
    auto batch = arrow::RecordBatch::Make(schema, rows->length(),
                                          std::vector<std::shared_ptr<arrow::Array>>{rows});
    auto sink = arrow::io::BufferOutputStream::Create().ValueOrDie();
    auto writer = arrow::ipc::MakeStreamWriter(sink, schema).ValueOrDie();
    REQUIRE(writer->WriteRecordBatch(*batch).ok());
    REQUIRE(writer->Close().ok());
    auto buffer = sink->Finish().ValueOrDie();
    return Batch(buffer->data(), buffer->data() + buffer->size());
}

}  // namespace

TEST_CASE("Round trip keeps row count, order and values", "[codec]") {
    auto dataset = sample_dataset(200, 3);

    auto encoded = rowbridge::codec::encode(dataset);
    REQUIRE(encoded.has_value());
    REQUIRE(encoded->partitions.size() == 3);

    auto decoded = rowbridge::codec::decode(*encoded, dataset.schema());
    REQUIRE(decoded.report.ok());
    REQUIRE(decoded.report.rows_dropped == 0);
    REQUIRE(decoded.report.cells_nulled == 0);
    REQUIRE(decoded.dataset.schema() == dataset.schema());
    REQUIRE(decoded.dataset.num_partitions() == 3);
    for (std::size_t p = 0; p < 3; ++p) {
        REQUIRE(decoded.dataset.partitions()[p] == dataset.partitions()[p]);
    }
}

TEST_CASE("Sequential and parallel codecs agree", "[codec]") {
    auto dataset = sample_dataset(60, 4);

    auto parallel = rowbridge::codec::encode(dataset, {.parallel = true});
    auto sequential = rowbridge::codec::encode(dataset, {.parallel = false});
    REQUIRE(parallel.has_value());
    REQUIRE(sequential.has_value());
    REQUIRE(parallel->partitions == sequential->partitions);

    auto decoded = rowbridge::codec::decode(*sequential, dataset.schema(), {.parallel = false});
    REQUIRE(decoded.dataset.collect() == dataset.collect());
}

TEST_CASE("Partitions outnumbering the workers all come back in order", "[codec]") {
    const std::size_t partitions =
        std::max<std::size_t>(std::thread::hardware_concurrency(), 1) * 4 + 3;
    auto dataset = sample_dataset(partitions * 2, partitions);

    SECTION("default worker cap") {
        auto encoded = rowbridge::codec::encode(dataset);
        REQUIRE(encoded.has_value());
        REQUIRE(encoded->partitions.size() == partitions);

        auto decoded = rowbridge::codec::decode(*encoded, dataset.schema());
        REQUIRE(decoded.report.ok());
        REQUIRE(decoded.dataset.num_partitions() == partitions);
        REQUIRE(decoded.dataset.collect() == dataset.collect());
    }

    SECTION("two workers, one bad partition") {
        auto encoded = rowbridge::codec::encode(dataset, {.parallel = true, .max_workers = 2});
        REQUIRE(encoded.has_value());
        encoded->partitions[5].front().resize(4);

        auto decoded = rowbridge::codec::decode(*encoded, dataset.schema(),
                                                {.parallel = true, .max_workers = 2});
        REQUIRE(decoded.dataset.num_partitions() == partitions);
        REQUIRE(decoded.report.partition_errors.size() == 1);
        REQUIRE(decoded.report.partition_errors[0].partition == 5);
        REQUIRE(decoded.report.partition_errors[0].error.kind == ErrorKind::DeserializationError);
        REQUIRE(decoded.dataset.partitions()[5].empty());
        REQUIRE(decoded.dataset.partitions()[4] == dataset.partitions()[4]);
        REQUIRE(decoded.dataset.partitions()[6] == dataset.partitions()[6]);
    }
}

TEST_CASE("Decoding no batches gives an empty dataset with the schema", "[codec]") {
    auto schema = all_types_schema();

    auto decoded = rowbridge::codec::decode(rowbridge::codec::EncodedDataset{}, schema);
    REQUIRE(decoded.report.ok());
    REQUIRE(decoded.dataset.rows() == 0);
    REQUIRE(decoded.dataset.num_partitions() == 0);
    REQUIRE(decoded.dataset.schema() == schema);

    auto empty_partition = rowbridge::codec::decode_partition({}, schema);
    REQUIRE(empty_partition.has_value());
    REQUIRE(empty_partition->rows.empty());
}

TEST_CASE("Batch sizes adapt to serialized size", "[codec]") {
    SECTION("small batches grow") {
        rowbridge::codec::AutoBatcher batcher{{.initial_rows = 1, .target_batch_bytes = 100,
                                               .max_rows = 4}};
        REQUIRE(batcher.next_rows() == 1);
        batcher.record(1, 10);
        REQUIRE(batcher.next_rows() == 2);
        batcher.record(2, 20);
        batcher.record(4, 40);
        REQUIRE(batcher.next_rows() == 4);
    }

    SECTION("huge batches shrink, in-range batches hold") {
        rowbridge::codec::AutoBatcher batcher{{.initial_rows = 8, .target_batch_bytes = 100}};
        batcher.record(8, 500);
        REQUIRE(batcher.next_rows() == 8);
        batcher.record(8, 1001);
        REQUIRE(batcher.next_rows() == 4);
    }

    SECTION("partition encoding doubles from one row") {
        auto dataset = sample_dataset(100, 1);
        auto batches = rowbridge::codec::encode_partition(dataset.partitions()[0]);
        REQUIRE(batches.has_value());
        // 1 + 2 + 4 + ... + 64 covers 100 rows.
        REQUIRE(batches->size() == 7);
    }
}

TEST_CASE("A corrupt batch fails only its partition", "[codec]") {
    auto dataset = sample_dataset(30, 3);
    auto encoded = rowbridge::codec::encode(dataset);
    REQUIRE(encoded.has_value());

    // Cut into the body of the first record batch.
    auto& victim = encoded->partitions[1].front();
    victim.resize(victim.size() - 20);

    auto decoded = rowbridge::codec::decode(*encoded, dataset.schema());
    REQUIRE_FALSE(decoded.report.ok());
    REQUIRE(decoded.report.partition_errors.size() == 1);
    REQUIRE(decoded.report.partition_errors[0].partition == 1);
    REQUIRE(decoded.report.partition_errors[0].error.kind == ErrorKind::DeserializationError);

    REQUIRE(decoded.dataset.num_partitions() == 3);
    REQUIRE(decoded.dataset.partitions()[0] == dataset.partitions()[0]);
    REQUIRE(decoded.dataset.partitions()[1].empty());
    REQUIRE(decoded.dataset.partitions()[2] == dataset.partitions()[2]);
}

TEST_CASE("Garbage bytes are a DeserializationError", "[codec]") {
    // Continuation marker and a 16 byte metadata length, then only 3 bytes.
    const Batch garbage{0xff, 0xff, 0xff, 0xff, 0x10, 0x00, 0x00, 0x00, 0x01, 0x02, 0x03};
    auto rows = rowbridge::codec::decode_batch(garbage);
    REQUIRE_FALSE(rows.has_value());
    REQUIRE(rows.error().kind == ErrorKind::DeserializationError);
}

TEST_CASE("Raw rows of mixed length survive encoding", "[codec]") {
    const std::vector<RawRow> raw{
        {std::int64_t{1}, "x"s, Null{}},
        {},
        {true, 2.5},
    };
    auto batch = rowbridge::codec::encode_rows(raw);
    REQUIRE(batch.has_value());

    auto decoded = rowbridge::codec::decode_batch(*batch);
    REQUIRE(decoded.has_value());
    REQUIRE(*decoded == raw);
}

TEST_CASE("Strict decoding fails the partition with the bad cell", "[codec]") {
    auto text_schema = rowbridge::parse_schema_spec("v:string");
    REQUIRE(text_schema.has_value());
    auto dataset = Dataset::from_rows(*text_schema, {{"1"s}, {"2"s}, {"x"s}, {"4"s}}, 2);
    REQUIRE(dataset.has_value());
    auto encoded = rowbridge::codec::encode(*dataset);
    REQUIRE(encoded.has_value());

    auto int_schema = rowbridge::parse_schema_spec("v:int64");
    REQUIRE(int_schema.has_value());

    SECTION("lenient") {
        auto decoded = rowbridge::codec::decode(*encoded, *int_schema);
        REQUIRE(decoded.report.ok());
        REQUIRE(decoded.report.cells_nulled == 1);
        REQUIRE(decoded.dataset.rows() == 4);
    }

    SECTION("strict") {
        rowbridge::codec::DecodeOptions options;
        options.convert.policy = rowbridge::convert::ConversionPolicy::Strict;
        auto decoded = rowbridge::codec::decode(*encoded, *int_schema, options);
        REQUIRE(decoded.report.partition_errors.size() == 1);
        REQUIRE(decoded.report.partition_errors[0].partition == 1);
        REQUIRE(decoded.report.partition_errors[0].error.kind == ErrorKind::ParseError);
        REQUIRE(decoded.dataset.partitions()[0].size() == 2);
        REQUIRE(decoded.dataset.partitions()[1].empty());
    }
}

TEST_CASE("Foreign row containers are normalized", "[codec]") {
    auto* pool = arrow::default_memory_pool();

    SECTION("fixed_size_list of int64") {
        arrow::FixedSizeListBuilder builder(pool, std::make_shared<arrow::Int64Builder>(pool), 2);
        auto* values = static_cast<arrow::Int64Builder*>(builder.value_builder());
        REQUIRE(builder.Append().ok());
        REQUIRE(values->Append(1).ok());
        REQUIRE(values->Append(2).ok());
        REQUIRE(builder.Append().ok());
        REQUIRE(values->Append(3).ok());
        REQUIRE(values->AppendNull().ok());
        std::shared_ptr<arrow::Array> rows;
        REQUIRE(builder.Finish(&rows).ok());

        auto decoded = rowbridge::codec::decode_batch(stream_of(rows));
        REQUIRE(decoded.has_value());
        REQUIRE(decoded->size() == 2);
        REQUIRE((*decoded)[0] == RawRow{std::int64_t{1}, std::int64_t{2}});
        REQUIRE((*decoded)[1] == RawRow{std::int64_t{3}, Null{}});
    }

    SECTION("large_list of strings") {
        arrow::LargeListBuilder builder(pool, std::make_shared<arrow::StringBuilder>(pool));
        auto* values = static_cast<arrow::StringBuilder*>(builder.value_builder());
        REQUIRE(builder.Append().ok());
        REQUIRE(values->Append("7").ok());
        REQUIRE(values->Append("x").ok());
        std::shared_ptr<arrow::Array> rows;
        REQUIRE(builder.Finish(&rows).ok());

        auto schema = rowbridge::parse_schema_spec("id:int64,label:string");
        REQUIRE(schema.has_value());
        const std::vector<Batch> batches{stream_of(rows)};
        auto partition = rowbridge::codec::decode_partition(batches, *schema);
        REQUIRE(partition.has_value());
        REQUIRE(partition->rows.size() == 1);
        REQUIRE(std::get<std::int64_t>(partition->rows[0][0]) == 7);
        REQUIRE(std::get<std::string>(partition->rows[0][1]) == "x");
    }

    SECTION("uint64 past int64 keeps its digits") {
        arrow::ListBuilder builder(pool, std::make_shared<arrow::UInt64Builder>(pool));
        auto* values = static_cast<arrow::UInt64Builder*>(builder.value_builder());
        REQUIRE(builder.Append().ok());
        REQUIRE(values->Append(18'446'744'073'709'551'615ULL).ok());
        std::shared_ptr<arrow::Array> rows;
        REQUIRE(builder.Finish(&rows).ok());

        auto decoded = rowbridge::codec::decode_batch(stream_of(rows));
        REQUIRE(decoded.has_value());
        REQUIRE((*decoded)[0] == RawRow{"18446744073709551615"s});
    }

    SECTION("non-list row column") {
        arrow::Int64Builder builder(pool);
        REQUIRE(builder.Append(1).ok());
        std::shared_ptr<arrow::Array> rows;
        REQUIRE(builder.Finish(&rows).ok());

        auto decoded = rowbridge::codec::decode_batch(stream_of(rows));
        REQUIRE_FALSE(decoded.has_value());
        REQUIRE(decoded.error().kind == ErrorKind::DeserializationError);
    }
}
