#pragma once

#include <cstddef>
#include <cstdint>
#include <expected>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

namespace rowbridge {

enum class ErrorKind : std::uint8_t {
    ParseError,
    SchemaMismatch,
    DeserializationError,
    ColumnNotFound,
    DuplicateColumnName,
    IndexOutOfRange,
    UnsupportedFormatVersion,
    InvalidArgument,
    IoError,
    ResourceError,
};

[[nodiscard]] auto error_kind_name(ErrorKind kind) noexcept -> std::string_view;

/// Error with a kind and, for cell-level failures, the column position.
struct Error {
    ErrorKind kind = ErrorKind::InvalidArgument;
    std::string message;
    std::optional<std::size_t> column;

    [[nodiscard]] auto format() const -> std::string;
};

template <typename T>
using Result = std::expected<T, Error>;

[[nodiscard]] inline auto make_error(ErrorKind kind, std::string message) -> std::unexpected<Error> {
    return std::unexpected(Error{.kind = kind, .message = std::move(message), .column = std::nullopt});
}

}  // namespace rowbridge
