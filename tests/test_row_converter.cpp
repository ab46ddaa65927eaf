#include <rowbridge/convert/row_converter.hpp>

#include <catch2/catch_test_macros.hpp>

#include <string>
#include <vector>

using namespace std::string_literals;

using rowbridge::DataType;
using rowbridge::ErrorKind;
using rowbridge::Null;
using rowbridge::RawRow;
using rowbridge::convert::ConversionPolicy;
using rowbridge::convert::RowConverter;

namespace {

auto id_label_schema() -> rowbridge::Schema {
    auto schema =
        rowbridge::Schema::make({{"id", DataType::Int64}, {"label", DataType::String}});
    REQUIRE(schema.has_value());
    return *schema;
}

const RowConverter kLenient{{.policy = ConversionPolicy::Lenient}};
const RowConverter kStrict{{.policy = ConversionPolicy::Strict}};

}  // namespace

TEST_CASE("String digits coerce to int64", "[convert]") {
    auto schema = id_label_schema();
    const RawRow raw{"7"s, "x"s};

    auto row = kLenient.convert(raw, schema);
    REQUIRE(row.has_value());
    REQUIRE(row->size() == 2);
    REQUIRE(std::get<std::int64_t>((*row)[0]) == 7);
    REQUIRE(std::get<std::string>((*row)[1]) == "x");

    auto strict = kStrict.convert(raw, schema);
    REQUIRE(strict.has_value());
    REQUIRE(*strict == *row);
}

TEST_CASE("Unparseable cell: lenient nulls it, strict fails on its column", "[convert]") {
    auto schema = id_label_schema();
    const RawRow raw{"abc"s, "x"s};

    SECTION("lenient") {
        auto row = kLenient.convert_counted(raw, schema);
        REQUIRE(row.has_value());
        REQUIRE(rowbridge::is_null(row->row[0]));
        REQUIRE(std::get<std::string>(row->row[1]) == "x");
        REQUIRE(row->nulled_cells == 1);
    }

    SECTION("strict") {
        auto row = kStrict.convert(raw, schema);
        REQUIRE_FALSE(row.has_value());
        REQUIRE(row.error().kind == ErrorKind::ParseError);
        REQUIRE(row.error().column == 0);
    }
}

TEST_CASE("Lenient conversion never fails on a row of the right length", "[convert]") {
    auto schema = rowbridge::Schema::make({{"a", DataType::Int32},
                                           {"b", DataType::Float32},
                                           {"c", DataType::Date},
                                           {"d", DataType::Timestamp}});
    REQUIRE(schema.has_value());

    const std::vector<RawRow> inputs{
        {Null{}, Null{}, Null{}, Null{}},
        {"x"s, "y"s, "z"s, "w"s},
        {1e30, 1e300, 2.5, true},
        {std::int64_t{1} << 50, false, std::int64_t{1} << 40, "1999-12-31"s},
    };
    for (const auto& raw : inputs) {
        auto row = kLenient.convert(raw, *schema);
        REQUIRE(row.has_value());
        REQUIRE(row->size() == schema->size());
    }
}

TEST_CASE("Null raw values stay null without counting as failures", "[convert]") {
    auto schema = id_label_schema();
    auto row = kStrict.convert_counted(RawRow{Null{}, Null{}}, schema);
    REQUIRE(row.has_value());
    REQUIRE(row->nulled_cells == 0);
    REQUIRE(rowbridge::is_null(row->row[0]));
    REQUIRE(rowbridge::is_null(row->row[1]));
}

TEST_CASE("Row length mismatch is a SchemaMismatch", "[convert]") {
    auto schema = id_label_schema();
    auto row = kLenient.convert(RawRow{"1"s}, schema);
    REQUIRE_FALSE(row.has_value());
    REQUIRE(row.error().kind == ErrorKind::SchemaMismatch);
}

TEST_CASE("convert_partition drops mismatched rows and keeps order", "[convert]") {
    auto schema = id_label_schema();
    const std::vector<RawRow> rows{
        {"1"s, "a"s},
        {"2"s},
        {"3"s, "c"s, "extra"s},
        {"oops"s, "d"s},
        {std::int64_t{5}, "e"s},
    };

    auto result = kLenient.convert_partition(rows, schema);
    REQUIRE(result.has_value());
    REQUIRE(result->rows.size() == 3);
    REQUIRE(std::get<std::int64_t>(result->rows[0][0]) == 1);
    REQUIRE(rowbridge::is_null(result->rows[1][0]));
    REQUIRE(std::get<std::string>(result->rows[1][1]) == "d");
    REQUIRE(std::get<std::int64_t>(result->rows[2][0]) == 5);

    REQUIRE(result->report.rows_converted == 3);
    REQUIRE(result->report.rows_dropped == 2);
    REQUIRE(result->report.cells_nulled == 1);
    REQUIRE(result->report.ok());
}

TEST_CASE("convert_partition fails under strict policy", "[convert]") {
    auto schema = id_label_schema();
    const std::vector<RawRow> rows{{"1"s, "a"s}, {"oops"s, "b"s}};

    auto result = kStrict.convert_partition(rows, schema);
    REQUIRE_FALSE(result.has_value());
    REQUIRE(result.error().kind == ErrorKind::ParseError);
    REQUIRE(result.error().column == 0);
    REQUIRE(result.error().message.starts_with("row 1: "));
}

TEST_CASE("ConversionReport merges counters", "[convert]") {
    rowbridge::convert::ConversionReport total;
    rowbridge::convert::ConversionReport part{.rows_converted = 2, .rows_dropped = 1,
                                              .cells_nulled = 3};
    part.partition_errors.push_back(
        {.partition = 4,
         .error = {.kind = ErrorKind::DeserializationError, .message = "corrupt"}});

    total.merge(part);
    total.merge(part);
    REQUIRE(total.rows_converted == 4);
    REQUIRE(total.rows_dropped == 2);
    REQUIRE(total.cells_nulled == 6);
    REQUIRE(total.partition_errors.size() == 2);
    REQUIRE_FALSE(total.ok());
    REQUIRE(total.summary().find("failed partitions: 2") != std::string::npos);
}
