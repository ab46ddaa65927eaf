#include <rowbridge/rowbridge.hpp>

#include <CLI/CLI.hpp>
#include <fmt/core.h>
#include <spdlog/spdlog.h>

#include <cstddef>
#include <cstdlib>
#include <iostream>
#include <string>
#include <utility>

namespace {

auto fail(const rowbridge::Error& error) -> int {
    std::cerr << "rowbridge_cli: " << error.format() << "\n";
    return 1;
}

struct ImportArgs {
    std::string input;
    std::string schema;
    std::string nulls;
    std::string output;
    std::string metadata;
    std::size_t partitions = 1;
    bool strict = false;
};

auto run_import(const ImportArgs& args) -> int {
    auto options = rowbridge::io::parse_null_spec(args.nulls);
    options.partitions = args.partitions;
    if (args.strict) {
        options.convert.policy = rowbridge::convert::ConversionPolicy::Strict;
    }

    auto converted = [&]() -> rowbridge::Result<rowbridge::convert::ConvertedDataset> {
        if (args.schema.empty()) {
            return rowbridge::io::read_csv_inferred(args.input, options);
        }
        auto schema = rowbridge::parse_schema_spec(args.schema);
        if (!schema) {
            return std::unexpected(std::move(schema.error()));
        }
        return rowbridge::io::read_csv(args.input, *schema, options);
    }();
    if (!converted) {
        return fail(converted.error());
    }
    fmt::print("{}\n", converted->report.summary());

    auto written = rowbridge::io::save_frame(args.output, converted->dataset, args.metadata);
    if (!written) {
        return fail(written.error());
    }
    fmt::print("wrote {} rows ({}) to {}\n", *written,
               rowbridge::format_schema_spec(converted->dataset.schema()), args.output);
    return 0;
}

auto run_show(const std::string& input, std::size_t rows) -> int {
    auto loaded = rowbridge::io::load_frame(input);
    if (!loaded) {
        return fail(loaded.error());
    }
    fmt::print("format version {}, {} partitions, schema {}\n", loaded->format_version,
               loaded->dataset.num_partitions(),
               rowbridge::format_schema_spec(loaded->dataset.schema()));
    if (!loaded->metadata.empty()) {
        fmt::print("metadata: {}\n", loaded->metadata);
    }
    rowbridge::print(loaded->dataset, std::cout, rows);
    return 0;
}

auto run_rename(const std::string& input, const std::string& map, const std::string& output)
    -> int {
    auto names = rowbridge::frame::parse_rename_spec(map);
    if (!names) {
        return fail(names.error());
    }
    auto loaded = rowbridge::io::load_frame(input);
    if (!loaded) {
        return fail(loaded.error());
    }

    rowbridge::frame::Frame frame{loaded->dataset};
    if (auto done = frame.execute(rowbridge::frame::RenameColumns{*names}); !done) {
        return fail(done.error());
    }
    auto written = rowbridge::io::save_frame(output, frame.state(), loaded->metadata);
    if (!written) {
        return fail(written.error());
    }
    fmt::print("{} -> {}\n", rowbridge::format_schema_spec(loaded->dataset.schema()),
               rowbridge::format_schema_spec(frame.schema()));
    return 0;
}

auto run_roundtrip(const std::string& input, std::size_t partitions,
                   const rowbridge::codec::BatchingOptions& batching) -> int {
    auto loaded = rowbridge::io::load_frame(input);
    if (!loaded) {
        return fail(loaded.error());
    }
    auto dataset = loaded->dataset;
    if (partitions > 0) {
        auto split = rowbridge::Dataset::from_rows(dataset.schema(), dataset.collect(), partitions);
        if (!split) {
            return fail(split.error());
        }
        dataset = std::move(*split);
    }

    auto encoded = rowbridge::codec::encode(dataset, {.batching = batching});
    if (!encoded) {
        return fail(encoded.error());
    }
    fmt::print("encoded {} rows into {} batches ({} bytes) over {} partitions\n", dataset.rows(),
               encoded->num_batches(), encoded->num_bytes(), encoded->partitions.size());

    auto decoded = rowbridge::codec::decode(*encoded, dataset.schema());
    fmt::print("{}\n", decoded.report.summary());
    const bool same = decoded.dataset.collect() == dataset.collect();
    fmt::print("rows identical: {}\n", same ? "yes" : "no");
    return same && decoded.report.ok() ? 0 : 1;
}

void configure_logging(bool verbose) {
    if (verbose) {
        spdlog::set_level(spdlog::level::debug);
        return;
    }
    // Fall back to ROWBRIDGE_LOG_LEVEL (trace, debug, info, warn, err, off).
    const char* env = std::getenv("ROWBRIDGE_LOG_LEVEL");
    if (env != nullptr) {
        spdlog::set_level(spdlog::level::from_str(env));
    } else {
        spdlog::set_level(spdlog::level::info);
    }
}

}  // namespace

auto main(int argc, char** argv) -> int {
    CLI::App app{"rowbridge: typed row frames across runtimes"};
    app.set_version_flag("--version", "rowbridge_cli 0.1.0");
    app.require_subcommand(1);

    bool verbose = false;
    app.add_flag("-v,--verbose", verbose, "Enable debug logging");

    ImportArgs import_args;
    auto* import_cmd = app.add_subcommand("import", "Convert a CSV file into a frame file");
    import_cmd->add_option("input", import_args.input, "CSV file with a header row")
        ->required()
        ->check(CLI::ExistingFile);
    import_cmd->add_option("--schema", import_args.schema,
                           "Column types as name:type,... (default: inferred)");
    import_cmd->add_option("--nulls", import_args.nulls, "Null tokens, e.g. \"<empty>,NA\"");
    import_cmd->add_option("--partitions", import_args.partitions, "Number of partitions")
        ->check(CLI::PositiveNumber);
    import_cmd->add_option("--metadata", import_args.metadata, "Opaque metadata to store");
    import_cmd->add_flag("--strict", import_args.strict, "Fail on the first unparseable cell");
    import_cmd->add_option("-o,--output", import_args.output, "Output frame file")->required();

    std::string show_input;
    std::size_t show_rows = 20;
    auto* show_cmd = app.add_subcommand("show", "Print a frame file");
    show_cmd->add_option("input", show_input, "Frame file")->required()->check(CLI::ExistingFile);
    show_cmd->add_option("--rows", show_rows, "Rows to print (default: 20)");

    std::string rename_input;
    std::string rename_map;
    std::string rename_output;
    auto* rename_cmd = app.add_subcommand("rename", "Rename columns of a frame file");
    rename_cmd->add_option("input", rename_input, "Frame file")
        ->required()
        ->check(CLI::ExistingFile);
    rename_cmd->add_option("--map", rename_map, "Renames as old=new,... applied in order")
        ->required();
    rename_cmd->add_option("-o,--output", rename_output, "Output frame file")->required();

    std::string roundtrip_input;
    std::size_t roundtrip_partitions = 0;
    rowbridge::codec::BatchingOptions batching;
    auto* roundtrip_cmd =
        app.add_subcommand("roundtrip", "Encode and decode a frame through the batch codec");
    roundtrip_cmd->add_option("input", roundtrip_input, "Frame file")
        ->required()
        ->check(CLI::ExistingFile);
    roundtrip_cmd->add_option("--partitions", roundtrip_partitions,
                              "Repartition before encoding (default: keep)");
    roundtrip_cmd->add_option("--target-bytes", batching.target_batch_bytes,
                              "Target serialized batch size (default: 65536)")
        ->check(CLI::PositiveNumber);

    CLI11_PARSE(app, argc, argv);
    configure_logging(verbose);

    if (*import_cmd) {
        return run_import(import_args);
    }
    if (*show_cmd) {
        return run_show(show_input, show_rows);
    }
    if (*rename_cmd) {
        return run_rename(rename_input, rename_map, rename_output);
    }
    return run_roundtrip(roundtrip_input, roundtrip_partitions, batching);
}
