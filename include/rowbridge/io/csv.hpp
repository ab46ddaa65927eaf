#pragma once
// CSV import via rapidcsv. Every field is read as text and then converted to
// the declared column type by the row converter.

#include <rowbridge/convert/create.hpp>
#include <rowbridge/convert/row_converter.hpp>
#include <rowbridge/core/error.hpp>
#include <rowbridge/core/schema.hpp>

#include <cstddef>
#include <string>
#include <string_view>
#include <unordered_set>

namespace rowbridge::io {

struct CsvReadOptions {
    /// Treat empty fields as null.
    bool null_if_empty = false;
    /// Field values that read as null.
    std::unordered_set<std::string> null_tokens;
    /// Number of contiguous partitions the rows are split into.
    std::size_t partitions = 1;
    convert::ConvertOptions convert;
    /// Rows sampled by read_csv_inferred.
    convert::InferOptions infer;
};

/// Parse a null spec such as "<empty>,NA,null". `<empty>` turns on
/// null_if_empty; every other token is matched verbatim.
[[nodiscard]] auto parse_null_spec(std::string_view spec) -> CsvReadOptions;

/// Read a CSV file with a header row into a dataset of `schema`.
///
/// The header must have as many columns as the schema; names are matched by
/// position. Lines with the wrong number of fields are dropped and counted.
[[nodiscard]] auto read_csv(const std::string& path, const Schema& schema,
                            const CsvReadOptions& options = {})
    -> Result<convert::ConvertedDataset>;

/// Read a CSV file, inferring the schema from the header names and the
/// first `options.infer.sample_rows` lines.
[[nodiscard]] auto read_csv_inferred(const std::string& path, const CsvReadOptions& options = {})
    -> Result<convert::ConvertedDataset>;

}  // namespace rowbridge::io
