#pragma once

#include <rowbridge/convert/row_converter.hpp>
#include <rowbridge/core/error.hpp>
#include <rowbridge/core/schema.hpp>
#include <rowbridge/core/value.hpp>

#include <cstddef>
#include <span>
#include <string>
#include <vector>

namespace rowbridge::convert {

struct InferOptions {
    /// Rows inspected from the start of the data.
    std::size_t sample_rows = 100;
};

/// Infer a schema from untyped rows.
///
/// Each column gets the most general type among the sampled values:
/// int64 < float64 < string. Booleans count as int64, strings that parse as
/// numbers count as that number, and a column with only nulls becomes a
/// string column. Columns are named C0, C1, ... unless `names` is given, in
/// which case it must have one name per column.
[[nodiscard]] auto infer_schema(std::span<const RawRow> rows, const InferOptions& options = {},
                                const std::vector<std::string>& names = {}) -> Result<Schema>;

/// Build a dataset from foreign rows, one vector per partition, validating
/// every cell against `schema` under the configured policy.
[[nodiscard]] auto create_dataset(std::span<const std::vector<RawRow>> partitions,
                                  const Schema& schema, const ConvertOptions& options = {})
    -> Result<ConvertedDataset>;

}  // namespace rowbridge::convert
