#include <rowbridge/convert/create.hpp>

#include <catch2/catch_test_macros.hpp>

#include <string>
#include <vector>

using namespace std::string_literals;

using rowbridge::DataType;
using rowbridge::ErrorKind;
using rowbridge::Null;
using rowbridge::RawRow;

TEST_CASE("infer_schema picks the most general type per column", "[infer]") {
    const std::vector<RawRow> rows{
        {std::int64_t{1}, "2"s, 1.5, "x"s, Null{}},
        {true, "2.5"s, std::int64_t{3}, "4"s, Null{}},
    };

    auto schema = rowbridge::convert::infer_schema(rows);
    REQUIRE(schema.has_value());
    REQUIRE(schema->column_names() == std::vector<std::string>{"C0", "C1", "C2", "C3", "C4"});
    REQUIRE((*schema)[0].type == DataType::Int64);
    REQUIRE((*schema)[1].type == DataType::Float64);
    REQUIRE((*schema)[2].type == DataType::Float64);
    REQUIRE((*schema)[3].type == DataType::String);
    REQUIRE((*schema)[4].type == DataType::String);
}

TEST_CASE("infer_schema only looks at the sample", "[infer]") {
    const std::vector<RawRow> rows{{"1"s}, {"2"s}, {"not a number"s}};

    auto sampled = rowbridge::convert::infer_schema(rows, {.sample_rows = 2});
    REQUIRE(sampled.has_value());
    REQUIRE((*sampled)[0].type == DataType::Int64);

    auto full = rowbridge::convert::infer_schema(rows);
    REQUIRE(full.has_value());
    REQUIRE((*full)[0].type == DataType::String);
}

TEST_CASE("infer_schema uses given names", "[infer]") {
    const std::vector<RawRow> rows{{"1"s, "a"s}};

    auto named = rowbridge::convert::infer_schema(rows, {}, {"id", "label"});
    REQUIRE(named.has_value());
    REQUIRE(named->column_names() == std::vector<std::string>{"id", "label"});

    auto short_names = rowbridge::convert::infer_schema(rows, {}, {"id"});
    REQUIRE_FALSE(short_names.has_value());
    REQUIRE(short_names.error().kind == ErrorKind::SchemaMismatch);
}

TEST_CASE("create_dataset converts every partition in order", "[infer]") {
    auto schema = rowbridge::parse_schema_spec("id:int64,label:string");
    REQUIRE(schema.has_value());

    const std::vector<std::vector<RawRow>> partitions{
        {{"1"s, "a"s}, {"2"s, "b"s}},
        {},
        {{"bad"s, "c"s}, {"3"s}},
    };

    auto created = rowbridge::convert::create_dataset(partitions, *schema);
    REQUIRE(created.has_value());
    const auto& dataset = created->dataset;
    REQUIRE(dataset.num_partitions() == 3);
    REQUIRE(dataset.partitions()[0].size() == 2);
    REQUIRE(dataset.partitions()[1].empty());
    REQUIRE(dataset.partitions()[2].size() == 1);
    REQUIRE(std::get<std::string>(dataset.partitions()[2][0][1]) == "c");
    REQUIRE(created->report.rows_converted == 3);
    REQUIRE(created->report.rows_dropped == 1);
    REQUIRE(created->report.cells_nulled == 1);

    SECTION("strict policy names the partition") {
        auto strict = rowbridge::convert::create_dataset(
            partitions, *schema, {.policy = rowbridge::convert::ConversionPolicy::Strict});
        REQUIRE_FALSE(strict.has_value());
        REQUIRE(strict.error().kind == ErrorKind::ParseError);
        REQUIRE(strict.error().message.starts_with("partition 2: row 0: "));
    }
}
