#include <rowbridge/core/error.hpp>

#include <fmt/format.h>

namespace rowbridge {

auto error_kind_name(ErrorKind kind) noexcept -> std::string_view {
    switch (kind) {
        case ErrorKind::ParseError:
            return "ParseError";
        case ErrorKind::SchemaMismatch:
            return "SchemaMismatch";
        case ErrorKind::DeserializationError:
            return "DeserializationError";
        case ErrorKind::ColumnNotFound:
            return "ColumnNotFound";
        case ErrorKind::DuplicateColumnName:
            return "DuplicateColumnName";
        case ErrorKind::IndexOutOfRange:
            return "IndexOutOfRange";
        case ErrorKind::UnsupportedFormatVersion:
            return "UnsupportedFormatVersion";
        case ErrorKind::InvalidArgument:
            return "InvalidArgument";
        case ErrorKind::IoError:
            return "IoError";
        case ErrorKind::ResourceError:
            return "ResourceError";
    }
    return "Unknown";
}

auto Error::format() const -> std::string {
    if (column.has_value()) {
        return fmt::format("{}: column {}: {}", error_kind_name(kind), *column, message);
    }
    return fmt::format("{}: {}", error_kind_name(kind), message);
}

}  // namespace rowbridge
