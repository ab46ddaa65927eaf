#pragma once
// Versioned frame files.
//
// A frame file is a Parquet file whose schema metadata carries
//   rowbridge.format_id       always "rowbridge.frame"
//   rowbridge.format_version  integer layout version
//   rowbridge.metadata        opaque caller blob
//   rowbridge.partitions      comma-separated partition sizes
// Files with a missing or unknown version are rejected before any row data
// is read.
//
// Column type mappings:
//   int32     → Parquet INT32
//   int64     → Parquet INT64
//   float32   → Parquet FLOAT
//   float64   → Parquet DOUBLE
//   string    → Parquet UTF8
//   date      → Parquet DATE32
//   timestamp → Parquet TIMESTAMP (nanoseconds, UTC)

#include <rowbridge/core/dataset.hpp>
#include <rowbridge/core/error.hpp>
#include <rowbridge/core/schema.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>

namespace rowbridge::io {

inline constexpr int kFormatVersion = 1;
inline constexpr std::array<int, 1> kSupportedFormatVersions{1};
inline constexpr std::string_view kFormatId = "rowbridge.frame";

inline constexpr std::string_view kFormatIdKey = "rowbridge.format_id";
inline constexpr std::string_view kFormatVersionKey = "rowbridge.format_version";
inline constexpr std::string_view kMetadataKey = "rowbridge.metadata";
inline constexpr std::string_view kPartitionsKey = "rowbridge.partitions";

/// Schema and metadata of a frame file, without its rows.
struct Artifact {
    Schema schema;
    int format_version = 0;
    std::string metadata;
};

struct LoadedFrame {
    Dataset dataset;
    int format_version = 0;
    std::string metadata;
};

/// Check a version tag read from a file. A missing tag is as unsupported as
/// an unknown one.
[[nodiscard]] auto validate_format_version(
    std::optional<int> version, std::span<const int> supported = kSupportedFormatVersions)
    -> Result<int>;

/// Parse the textual version tag stored in a file.
[[nodiscard]] auto parse_format_version(std::string_view text) -> std::optional<int>;

/// Write `dataset` to `path`, tagged with the current format version.
/// Returns the number of rows written.
[[nodiscard]] auto save_frame(const std::string& path, const Dataset& dataset,
                              std::string_view metadata = {}) -> Result<std::int64_t>;

/// Read only the schema and metadata of a frame file.
[[nodiscard]] auto read_artifact(const std::string& path) -> Result<Artifact>;

/// Read a frame file written by save_frame, restoring its partitioning.
[[nodiscard]] auto load_frame(const std::string& path) -> Result<LoadedFrame>;

}  // namespace rowbridge::io
