#include <rowbridge/io/csv.hpp>

#include <fmt/format.h>
#include <rapidcsv.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <exception>
#include <utility>
#include <vector>

namespace rowbridge::io {

namespace {

auto csv_trim(std::string_view text) -> std::string_view {
    auto begin = text.find_first_not_of(" \t\r\n");
    if (begin == std::string_view::npos) {
        return {};
    }
    auto end = text.find_last_not_of(" \t\r\n");
    return text.substr(begin, end - begin + 1);
}

struct CsvText {
    std::vector<std::string> header;
    std::vector<RawRow> rows;
};

auto load_text(const std::string& path, const CsvReadOptions& options) -> Result<CsvText> {
    CsvText text;
    try {
        rapidcsv::Document doc(path,
                               rapidcsv::LabelParams(0, -1),   // row 0 = header, no row labels
                               rapidcsv::SeparatorParams(',')  // RFC 4180 quoting
        );
        text.header = doc.GetColumnNames();
        const std::size_t count = doc.GetRowCount();
        text.rows.reserve(count);
        for (std::size_t r = 0; r < count; ++r) {
            auto fields = doc.GetRow<std::string>(r);
            RawRow row;
            row.reserve(fields.size());
            for (auto& field : fields) {
                const bool is_null = (options.null_if_empty && field.empty()) ||
                                     options.null_tokens.contains(field);
                if (is_null) {
                    row.emplace_back(Null{});
                } else {
                    row.emplace_back(std::move(field));
                }
            }
            text.rows.push_back(std::move(row));
        }
    } catch (const std::exception& e) {
        return make_error(ErrorKind::IoError,
                          fmt::format("failed to read CSV '{}': {}", path, e.what()));
    }
    return text;
}

auto split_rows(std::vector<RawRow> rows, std::size_t partitions)
    -> std::vector<std::vector<RawRow>> {
    std::vector<std::vector<RawRow>> out(partitions);
    const std::size_t chunk = (rows.size() + partitions - 1) / partitions;
    for (std::size_t i = 0; i < rows.size(); ++i) {
        out[i / chunk].push_back(std::move(rows[i]));
    }
    return out;
}

auto convert_text(const std::string& path, CsvText text, const Schema& schema,
                  const CsvReadOptions& options) -> Result<convert::ConvertedDataset> {
    if (options.partitions == 0) {
        return make_error(ErrorKind::InvalidArgument, "number of partitions must be positive");
    }
    if (text.header.size() != schema.size()) {
        return make_error(ErrorKind::SchemaMismatch,
                          fmt::format("'{}' has {} columns, schema has {}", path,
                                      text.header.size(), schema.size()));
    }
    for (std::size_t c = 0; c < schema.size(); ++c) {
        if (text.header[c] != schema[c].name) {
            spdlog::warn("{}: header column {} is '{}', schema names it '{}'", path, c,
                         text.header[c], schema[c].name);
        }
    }

    auto partitions = split_rows(std::move(text.rows), options.partitions);
    auto result = convert::create_dataset(partitions, schema, options.convert);
    if (result) {
        spdlog::debug("{}: {}", path, result->report.summary());
    }
    return result;
}

}  // namespace

auto parse_null_spec(std::string_view spec) -> CsvReadOptions {
    CsvReadOptions options;
    std::size_t pos = 0;
    while (pos <= spec.size()) {
        std::size_t comma = spec.find(',', pos);
        if (comma == std::string_view::npos) {
            comma = spec.size();
        }
        auto token = csv_trim(spec.substr(pos, comma - pos));
        if (!token.empty()) {
            if (token == "<empty>") {
                options.null_if_empty = true;
            } else {
                options.null_tokens.emplace(token);
            }
        }
        if (comma == spec.size()) {
            break;
        }
        pos = comma + 1;
    }
    return options;
}

auto read_csv(const std::string& path, const Schema& schema, const CsvReadOptions& options)
    -> Result<convert::ConvertedDataset> {
    auto text = load_text(path, options);
    if (!text) {
        return std::unexpected(std::move(text.error()));
    }
    return convert_text(path, std::move(*text), schema, options);
}

auto read_csv_inferred(const std::string& path, const CsvReadOptions& options)
    -> Result<convert::ConvertedDataset> {
    auto text = load_text(path, options);
    if (!text) {
        return std::unexpected(std::move(text.error()));
    }
    // Ragged lines are dropped during conversion; keep them out of the sample too.
    std::vector<RawRow> sample;
    for (const auto& row : text->rows) {
        if (sample.size() == options.infer.sample_rows) {
            break;
        }
        if (row.size() == text->header.size()) {
            sample.push_back(row);
        }
    }
    auto schema = convert::infer_schema(sample, options.infer, text->header);
    if (!schema) {
        return std::unexpected(std::move(schema.error()));
    }
    spdlog::debug("{}: inferred schema {}", path, format_schema_spec(*schema));
    return convert_text(path, std::move(*text), *schema, options);
}

}  // namespace rowbridge::io
