#include <rowbridge/frame/rename.hpp>
#include <rowbridge/frame/transform.hpp>

#include <catch2/catch_test_macros.hpp>

#include <string>
#include <vector>

using namespace std::string_literals;

using rowbridge::Dataset;
using rowbridge::ErrorKind;
using rowbridge::Row;
using rowbridge::frame::RenameMap;

namespace {

auto dataset_of(std::string_view spec, std::vector<Row> rows, std::size_t partitions = 1)
    -> Dataset {
    auto schema = rowbridge::parse_schema_spec(spec);
    REQUIRE(schema.has_value());
    auto dataset = Dataset::from_rows(*schema, std::move(rows), partitions);
    REQUIRE(dataset.has_value());
    return *dataset;
}

auto ab_dataset() -> Dataset {
    return dataset_of("a:int64,b:string",
                      {{std::int64_t{1}, "x"s}, {std::int64_t{2}, "y"s}, {std::int64_t{3}, "z"s}},
                      2);
}

auto names(const Dataset& dataset) -> std::vector<std::string> {
    return dataset.schema().column_names();
}

/// Swaps in an empty dataset, for exercising Frame on a custom transform.
class Clear final : public rowbridge::frame::FrameTransform {
   public:
    [[nodiscard]] auto name() const -> std::string override { return "clear"; }
    [[nodiscard]] auto work(const Dataset& state) const -> rowbridge::Result<Dataset> override {
        return Dataset::empty(state.schema());
    }
};

}  // namespace

TEST_CASE("Renaming one column leaves the rows alone", "[rename]") {
    auto dataset = ab_dataset();

    auto renamed = rowbridge::frame::rename_column(dataset, "a", "id");
    REQUIRE(renamed.has_value());
    REQUIRE(names(*renamed) == std::vector<std::string>{"id", "b"});
    REQUIRE(renamed->schema()[0].type == rowbridge::DataType::Int64);
    REQUIRE(renamed->shares_rows_with(dataset));
    REQUIRE(renamed->collect() == dataset.collect());
    REQUIRE(renamed->num_partitions() == 2);
    REQUIRE(names(dataset) == std::vector<std::string>{"a", "b"});
}

TEST_CASE("Renaming a column to itself changes nothing", "[rename]") {
    auto dataset = ab_dataset();

    auto renamed = rowbridge::frame::rename_column(dataset, "a", "a");
    REQUIRE(renamed.has_value());
    REQUIRE(renamed->schema() == dataset.schema());
    REQUIRE(renamed->shares_rows_with(dataset));

    auto bulk = rowbridge::frame::rename_columns(dataset, {{"a", "a"}, {"b", "b"}});
    REQUIRE(bulk.has_value());
    REQUIRE(bulk->schema() == dataset.schema());
}

TEST_CASE("Bulk rename applies pairs in order", "[rename]") {
    const RenameMap chain{{"a", "b"}, {"b", "c"}};

    SECTION("second pair renames the original column") {
        auto dataset = ab_dataset();
        auto renamed = rowbridge::frame::rename_columns(dataset, chain);
        REQUIRE(renamed.has_value());
        REQUIRE(names(*renamed) == std::vector<std::string>{"b", "c"});
        REQUIRE(renamed->collect() == dataset.collect());
    }

    SECTION("second pair follows the chain when nothing else matches") {
        auto dataset = dataset_of("a:int64", {{std::int64_t{1}}});
        auto renamed = rowbridge::frame::rename_columns(dataset, chain);
        REQUIRE(renamed.has_value());
        REQUIRE(names(*renamed) == std::vector<std::string>{"c"});
    }

    SECTION("swap") {
        auto dataset = ab_dataset();
        auto renamed = rowbridge::frame::rename_columns(dataset, {{"a", "b"}, {"b", "a"}});
        REQUIRE(renamed.has_value());
        REQUIRE(names(*renamed) == std::vector<std::string>{"b", "a"});
        REQUIRE(renamed->schema()[0].type == rowbridge::DataType::Int64);
    }

    SECTION("empty map") {
        auto dataset = ab_dataset();
        auto renamed = rowbridge::frame::rename_columns(dataset, {});
        REQUIRE(renamed.has_value());
        REQUIRE(renamed->schema() == dataset.schema());
        REQUIRE(renamed->shares_rows_with(dataset));
    }
}

TEST_CASE("Rename errors", "[rename]") {
    auto dataset = ab_dataset();

    SECTION("unknown column") {
        auto renamed = rowbridge::frame::rename_columns(dataset, {{"zzz", "q"}});
        REQUIRE_FALSE(renamed.has_value());
        REQUIRE(renamed.error().kind == ErrorKind::ColumnNotFound);
    }

    SECTION("collision with an existing column") {
        auto renamed = rowbridge::frame::rename_column(dataset, "a", "b");
        REQUIRE_FALSE(renamed.has_value());
        REQUIRE(renamed.error().kind == ErrorKind::DuplicateColumnName);

        auto bulk = rowbridge::frame::rename_columns(dataset, {{"a", "b"}});
        REQUIRE_FALSE(bulk.has_value());
        REQUIRE(bulk.error().kind == ErrorKind::DuplicateColumnName);
    }

    SECTION("a consumed name cannot be renamed again") {
        auto renamed = rowbridge::frame::rename_columns(dataset, {{"a", "q"}, {"a", "r"}});
        REQUIRE_FALSE(renamed.has_value());
        REQUIRE(renamed.error().kind == ErrorKind::ColumnNotFound);
    }
}

TEST_CASE("parse_rename_spec", "[rename]") {
    auto map = rowbridge::frame::parse_rename_spec(" a = b ,b=c,");
    REQUIRE(map.has_value());
    REQUIRE(*map == RenameMap{{"a", "b"}, {"b", "c"}});

    REQUIRE(rowbridge::frame::parse_rename_spec("").value().empty());
    REQUIRE(rowbridge::frame::parse_rename_spec("a").error().kind == ErrorKind::InvalidArgument);
    REQUIRE(rowbridge::frame::parse_rename_spec("a=").error().kind ==
            ErrorKind::InvalidArgument);
}

TEST_CASE("Frame keeps its state when a transform fails", "[rename]") {
    auto dataset = ab_dataset();
    rowbridge::frame::Frame frame{dataset};

    auto done = frame.execute(rowbridge::frame::RenameColumns{RenameMap{{"a", "id"}}});
    REQUIRE(done.has_value());
    REQUIRE(names(frame.state()) == std::vector<std::string>{"id", "b"});

    auto failed = frame.execute(rowbridge::frame::RenameColumns{RenameMap{{"a", "x"}}});
    REQUIRE_FALSE(failed.has_value());
    REQUIRE(failed.error().kind == ErrorKind::ColumnNotFound);
    REQUIRE(names(frame.state()) == std::vector<std::string>{"id", "b"});
    REQUIRE(frame.state().shares_rows_with(dataset));

    REQUIRE(frame.execute(Clear{}).has_value());
    REQUIRE(frame.state().rows() == 0);
    REQUIRE(names(frame.state()) == std::vector<std::string>{"id", "b"});
}
