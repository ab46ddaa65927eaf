#pragma once

#include <rowbridge/core/error.hpp>
#include <rowbridge/core/schema.hpp>
#include <rowbridge/core/value.hpp>

#include <cstddef>
#include <memory>
#include <vector>

namespace rowbridge {

/// Ordered rows of one partition. Partitioning is owned by the host engine;
/// rowbridge only promises to keep row order within a partition.
using Partition = std::vector<Row>;

/// A schema plus an ordered list of partitions of canonical rows.
///
/// Rows live in immutable shared storage. Metadata-only transforms (a
/// column rename) produce a new Dataset that points at the same rows;
/// transforms that change row contents build new partitions.
class Dataset {
   public:
    /// Empty dataset with an empty schema and no partitions.
    Dataset();

    /// Validate that every row matches `schema` in length and cell types.
    [[nodiscard]] static auto make(Schema schema, std::vector<Partition> partitions)
        -> Result<Dataset>;

    /// Split `rows` into `num_partitions` contiguous, order-preserving chunks.
    [[nodiscard]] static auto from_rows(Schema schema, std::vector<Row> rows,
                                        std::size_t num_partitions = 1) -> Result<Dataset>;

    /// Take ownership of partitions already known to conform to `schema`,
    /// such as the output of a RowConverter.
    [[nodiscard]] static auto adopt(Schema schema, std::vector<Partition> partitions) -> Dataset;

    /// A dataset with `schema` attached and no partitions.
    [[nodiscard]] static auto empty(Schema schema) -> Dataset;

    [[nodiscard]] auto schema() const noexcept -> const Schema& { return *schema_; }
    [[nodiscard]] auto schema_ptr() const noexcept -> const SchemaPtr& { return schema_; }

    [[nodiscard]] auto partitions() const noexcept -> const std::vector<Partition>& {
        return *partitions_;
    }
    [[nodiscard]] auto num_partitions() const noexcept -> std::size_t {
        return partitions_->size();
    }

    /// Total number of rows across partitions.
    [[nodiscard]] auto rows() const noexcept -> std::size_t;

    /// All rows, partition by partition, in order.
    [[nodiscard]] auto collect() const -> std::vector<Row>;

    /// Same rows under a different schema of equal shape (same column count
    /// and types). Used by metadata-only transforms.
    [[nodiscard]] auto with_schema(Schema schema) const -> Result<Dataset>;

    /// True when both datasets read the same row storage.
    [[nodiscard]] auto shares_rows_with(const Dataset& other) const noexcept -> bool {
        return partitions_ == other.partitions_;
    }

   private:
    Dataset(SchemaPtr schema, std::shared_ptr<const std::vector<Partition>> partitions);

    SchemaPtr schema_;
    std::shared_ptr<const std::vector<Partition>> partitions_;
};

/// Check one row against a schema: length, then per-cell type (nulls allowed
/// anywhere).
[[nodiscard]] auto validate_row(const Row& row, const Schema& schema) -> Result<void>;

}  // namespace rowbridge
