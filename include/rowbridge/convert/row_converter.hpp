#pragma once

#include <rowbridge/core/dataset.hpp>
#include <rowbridge/core/error.hpp>
#include <rowbridge/core/schema.hpp>
#include <rowbridge/core/value.hpp>

#include <cstddef>
#include <cstdint>
#include <span>
#include <string>
#include <vector>

namespace rowbridge::convert {

/// What happens to a cell whose raw value does not parse as its column type.
enum class ConversionPolicy : std::uint8_t {
    /// The cell becomes null and conversion continues.
    Lenient,
    /// Conversion stops with a ParseError naming the column.
    Strict,
};

struct ConvertOptions {
    ConversionPolicy policy = ConversionPolicy::Lenient;
};

struct ConvertedRow {
    Row row;
    /// Cells that failed to parse and were replaced by null.
    std::size_t nulled_cells = 0;
};

struct PartitionError {
    std::size_t partition = 0;
    Error error;
};

/// Counters aggregated over a conversion job. Row- and cell-level issues are
/// counted here instead of failing the job.
struct ConversionReport {
    std::size_t rows_converted = 0;
    /// Rows whose length disagreed with the schema.
    std::size_t rows_dropped = 0;
    std::size_t cells_nulled = 0;
    /// Partitions that could not be processed at all.
    std::vector<PartitionError> partition_errors;

    [[nodiscard]] auto ok() const noexcept -> bool { return partition_errors.empty(); }

    void merge(const ConversionReport& other);

    [[nodiscard]] auto summary() const -> std::string;
};

struct PartitionResult {
    Partition rows;
    ConversionReport report;
};

/// A dataset produced from foreign rows, with the issues met on the way.
struct ConvertedDataset {
    Dataset dataset;
    ConversionReport report;
};

/// Turns untyped positional rows into canonical rows of a schema.
///
/// Holds nothing but its immutable options, so a single instance can be
/// shared by every partition task of a job.
class RowConverter {
   public:
    RowConverter() = default;
    explicit RowConverter(ConvertOptions options) : options_(options) {}

    [[nodiscard]] auto options() const noexcept -> const ConvertOptions& { return options_; }

    /// Convert one row. Fails with SchemaMismatch when the lengths differ,
    /// and under the strict policy with ParseError on the first bad cell.
    [[nodiscard]] auto convert(std::span<const RawValue> raw, const Schema& schema) const
        -> Result<Row>;

    /// As convert(), also reporting how many cells were nulled.
    [[nodiscard]] auto convert_counted(std::span<const RawValue> raw, const Schema& schema) const
        -> Result<ConvertedRow>;

    /// Convert the ordered rows of one partition. Mismatched rows are
    /// dropped and counted; a strict-mode parse error fails the partition.
    [[nodiscard]] auto convert_partition(std::span<const RawRow> rows, const Schema& schema) const
        -> Result<PartitionResult>;

   private:
    ConvertOptions options_;
};

}  // namespace rowbridge::convert
