#include <rowbridge/core/dataset.hpp>

#include <fmt/format.h>

#include <algorithm>
#include <utility>

namespace rowbridge {

Dataset::Dataset()
    : schema_(std::make_shared<const Schema>()),
      partitions_(std::make_shared<const std::vector<Partition>>()) {}

Dataset::Dataset(SchemaPtr schema, std::shared_ptr<const std::vector<Partition>> partitions)
    : schema_(std::move(schema)), partitions_(std::move(partitions)) {}

auto validate_row(const Row& row, const Schema& schema) -> Result<void> {
    if (row.size() != schema.size()) {
        return make_error(ErrorKind::SchemaMismatch,
                          fmt::format("row has {} values, schema has {} columns", row.size(),
                                      schema.size()));
    }
    for (std::size_t i = 0; i < row.size(); ++i) {
        auto type = type_of(row[i]);
        if (type.has_value() && *type != schema[i].type) {
            Error error{.kind = ErrorKind::SchemaMismatch,
                        .message = fmt::format("value of type {} in {} column '{}'",
                                               data_type_name(*type),
                                               data_type_name(schema[i].type), schema[i].name),
                        .column = i};
            return std::unexpected(std::move(error));
        }
    }
    return {};
}

auto Dataset::make(Schema schema, std::vector<Partition> partitions) -> Result<Dataset> {
    for (const auto& partition : partitions) {
        for (const auto& row : partition) {
            if (auto valid = validate_row(row, schema); !valid) {
                return std::unexpected(std::move(valid.error()));
            }
        }
    }
    return Dataset{std::make_shared<const Schema>(std::move(schema)),
                   std::make_shared<const std::vector<Partition>>(std::move(partitions))};
}

auto Dataset::from_rows(Schema schema, std::vector<Row> rows, std::size_t num_partitions)
    -> Result<Dataset> {
    if (num_partitions == 0) {
        return make_error(ErrorKind::InvalidArgument, "number of partitions must be positive");
    }
    std::vector<Partition> partitions(num_partitions);
    const std::size_t per_partition = (rows.size() + num_partitions - 1) / num_partitions;
    std::size_t next = 0;
    for (auto& partition : partitions) {
        const std::size_t count = std::min(per_partition, rows.size() - next);
        partition.reserve(count);
        for (std::size_t i = 0; i < count; ++i) {
            partition.push_back(std::move(rows[next++]));
        }
    }
    return make(std::move(schema), std::move(partitions));
}

auto Dataset::adopt(Schema schema, std::vector<Partition> partitions) -> Dataset {
    return Dataset{std::make_shared<const Schema>(std::move(schema)),
                   std::make_shared<const std::vector<Partition>>(std::move(partitions))};
}

auto Dataset::empty(Schema schema) -> Dataset {
    return Dataset{std::make_shared<const Schema>(std::move(schema)),
                   std::make_shared<const std::vector<Partition>>()};
}

auto Dataset::rows() const noexcept -> std::size_t {
    std::size_t total = 0;
    for (const auto& partition : *partitions_) {
        total += partition.size();
    }
    return total;
}

auto Dataset::collect() const -> std::vector<Row> {
    std::vector<Row> out;
    out.reserve(rows());
    for (const auto& partition : *partitions_) {
        out.insert(out.end(), partition.begin(), partition.end());
    }
    return out;
}

auto Dataset::with_schema(Schema schema) const -> Result<Dataset> {
    if (schema.size() != schema_->size()) {
        return make_error(ErrorKind::SchemaMismatch,
                          fmt::format("schema has {} columns, dataset has {}", schema.size(),
                                      schema_->size()));
    }
    for (std::size_t i = 0; i < schema.size(); ++i) {
        if (schema[i].type != (*schema_)[i].type) {
            Error error{.kind = ErrorKind::SchemaMismatch,
                        .message = fmt::format("column '{}' changes type from {} to {}",
                                               schema[i].name,
                                               data_type_name((*schema_)[i].type),
                                               data_type_name(schema[i].type)),
                        .column = i};
            return std::unexpected(std::move(error));
        }
    }
    return Dataset{std::make_shared<const Schema>(std::move(schema)), partitions_};
}

}  // namespace rowbridge
