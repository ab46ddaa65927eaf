#pragma once

#include <rowbridge/convert/row_converter.hpp>
#include <rowbridge/core/dataset.hpp>
#include <rowbridge/core/error.hpp>
#include <rowbridge/core/schema.hpp>
#include <rowbridge/core/value.hpp>

#include <cstddef>
#include <cstdint>
#include <span>
#include <vector>

// Cross-runtime batch codec.
//
// A batch is one Arrow IPC stream holding a single record batch with one
// column:
//
//   row: list<item: dense_union<null, bool, int64, float64, utf8>>
//
// Each list entry is one row, each union element one cell. The union keeps
// the untyped runtime's value shape (None/bool/int/float/str) and nothing
// more; column types live only in the rowbridge Schema.

namespace rowbridge::codec {

using Batch = std::vector<std::uint8_t>;

struct BatchingOptions {
    /// Rows in the first batch of a partition.
    std::size_t initial_rows = 1;
    /// Batches smaller than this double the row count of the next batch;
    /// batches over ten times this halve it.
    std::size_t target_batch_bytes = 64 * 1024;
    std::size_t max_rows = 1 << 16;
};

/// Picks the row count of the next batch from the size of the previous one:
/// rows that serialize small get large batches and vice versa.
class AutoBatcher {
   public:
    explicit AutoBatcher(BatchingOptions options);

    [[nodiscard]] auto next_rows() const noexcept -> std::size_t { return next_rows_; }

    /// Feed back the size of a batch that was just written.
    void record(std::size_t rows, std::size_t bytes);

   private:
    BatchingOptions options_;
    std::size_t next_rows_;
};

struct EncodeOptions {
    BatchingOptions batching;
    /// Encode partitions concurrently.
    bool parallel = true;
    /// Worker cap; 0 uses the hardware concurrency.
    std::size_t max_workers = 0;
};

struct DecodeOptions {
    convert::ConvertOptions convert;
    /// Decode partitions concurrently.
    bool parallel = true;
    std::size_t max_workers = 0;
};

/// Batches of every partition, in partition order.
struct EncodedDataset {
    std::vector<std::vector<Batch>> partitions;

    [[nodiscard]] auto num_batches() const noexcept -> std::size_t;
    [[nodiscard]] auto num_bytes() const noexcept -> std::size_t;
};

/// Serialize untyped rows as one batch. Rows may differ in length.
[[nodiscard]] auto encode_rows(std::span<const RawRow> rows) -> Result<Batch>;

/// Strip type tags from the rows of one partition and write them as
/// adaptively sized batches, in order.
[[nodiscard]] auto encode_partition(const Partition& rows, const BatchingOptions& options = {})
    -> Result<std::vector<Batch>>;

[[nodiscard]] auto encode(const Dataset& dataset, const EncodeOptions& options = {})
    -> Result<EncodedDataset>;

/// Read the untyped rows of one batch. The row column may be a list,
/// large_list or fixed_size_list; any element array Arrow can hold as a
/// plain scalar (integers, floats, booleans, strings, nulls, unions of these)
/// is accepted. Anything unreadable is a DeserializationError.
[[nodiscard]] auto decode_batch(std::span<const std::uint8_t> bytes) -> Result<std::vector<RawRow>>;

/// Decode the batches of one partition and convert them against `schema`.
/// A corrupt batch fails the whole partition.
[[nodiscard]] auto decode_partition(std::span<const Batch> batches, const Schema& schema,
                                    const DecodeOptions& options = {})
    -> Result<convert::PartitionResult>;

/// Decode every partition. The result has exactly one partition per input
/// partition; a partition that failed is left empty and its error is
/// recorded in the report.
[[nodiscard]] auto decode(const EncodedDataset& encoded, const Schema& schema,
                          const DecodeOptions& options = {}) -> convert::ConvertedDataset;

}  // namespace rowbridge::codec
