#include <rowbridge/rowbridge.hpp>

#include <fmt/core.h>

#include <cstdint>
#include <string>
#include <vector>

using namespace std::string_literals;

auto main() -> int {
    // Declare a schema
    auto schema = rowbridge::parse_schema_spec("id:int64,label:string,score:float64");
    if (!schema) {
        fmt::print("schema error: {}\n", schema.error().format());
        return 1;
    }

    fmt::print("=== Row conversion ===\n");

    // Two partitions of untyped rows, as a foreign runtime would hand them over
    std::vector<std::vector<rowbridge::RawRow>> partitions{
        {{"7"s, "x"s, 1.5}, {std::int64_t{8}, "y"s, "2.25"s}},
        {{"abc"s, "z"s, rowbridge::Null{}}, {"9"s, "short"s}},
    };
    auto converted = rowbridge::convert::create_dataset(partitions, *schema);
    if (!converted) {
        fmt::print("conversion failed: {}\n", converted.error().format());
        return 1;
    }
    fmt::print("{}\n", converted->report.summary());
    rowbridge::print(converted->dataset);

    // Ship it through the batch codec and back
    fmt::print("\n=== Batch codec ===\n");

    auto encoded = rowbridge::codec::encode(converted->dataset);
    if (!encoded) {
        fmt::print("encode failed: {}\n", encoded.error().format());
        return 1;
    }
    fmt::print("{} batches, {} bytes\n", encoded->num_batches(), encoded->num_bytes());
    auto decoded = rowbridge::codec::decode(*encoded, *schema);
    fmt::print("decoded {} rows in {} partitions\n", decoded.dataset.rows(),
               decoded.dataset.num_partitions());

    // Rename, applied in order
    fmt::print("\n=== Rename ===\n");

    rowbridge::frame::Frame frame{decoded.dataset};
    rowbridge::frame::RenameMap names{{"label", "name"}, {"score", "points"}};
    auto renamed = frame.execute(rowbridge::frame::RenameColumns{names});
    if (!renamed) {
        fmt::print("rename failed: {}\n", renamed.error().format());
        return 1;
    }
    fmt::print("columns: {}\n", rowbridge::format_schema_spec(frame.schema()));
    fmt::print("rows shared with input: {}\n", frame.state().shares_rows_with(decoded.dataset));

    return 0;
}
