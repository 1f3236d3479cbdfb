/// @file archive_error.hpp
/// @brief Archive operation error types

#pragma once

#include <string_view>

#include "../operation/operation.hpp"

namespace laxy::archive {

/// @brief Archive error types
enum class ArchiveError {
    NotFound,
    AccessDenied,
    UnsupportedFormat,
    CorruptedArchive,
    PasswordRequired,
    UnsafeEntry,        // Entry path escapes the extraction directory
    LibraryNotFound,    // 7z.so not found
    LibraryLoadFailed,  // 7z.so could not be loaded
    Cancelled,
    IoError,
};

/// @brief Convert error to string
[[nodiscard]] constexpr std::string_view to_string(ArchiveError error) noexcept {
    switch (error) {
    case ArchiveError::NotFound:
        return "Archive not found";
    case ArchiveError::AccessDenied:
        return "Access denied";
    case ArchiveError::UnsupportedFormat:
        return "Unsupported archive format";
    case ArchiveError::CorruptedArchive:
        return "Corrupted archive";
    case ArchiveError::PasswordRequired:
        return "Password required";
    case ArchiveError::UnsafeEntry:
        return "Entry escapes the destination directory";
    case ArchiveError::LibraryNotFound:
        return "7z.so not found";
    case ArchiveError::LibraryLoadFailed:
        return "Failed to load 7z.so";
    case ArchiveError::Cancelled:
        return "Cancelled";
    case ArchiveError::IoError:
        return "I/O error";
    }
    return "Unknown error";
}

/// @brief Map to the engine-wide error category
[[nodiscard]] constexpr ErrorKind toErrorKind(ArchiveError error) noexcept {
    switch (error) {
    case ArchiveError::NotFound:
        return ErrorKind::NotFound;
    case ArchiveError::AccessDenied:
        return ErrorKind::PermissionDenied;
    case ArchiveError::UnsupportedFormat:
    case ArchiveError::LibraryNotFound:
    case ArchiveError::LibraryLoadFailed:
        return ErrorKind::UnsupportedFormat;
    case ArchiveError::CorruptedArchive:
    case ArchiveError::PasswordRequired:
        return ErrorKind::CorruptedArchive;
    case ArchiveError::UnsafeEntry:
        return ErrorKind::InvalidArgument;
    case ArchiveError::Cancelled:
        return ErrorKind::Cancelled;
    case ArchiveError::IoError:
        return ErrorKind::IoFailure;
    }
    return ErrorKind::IoFailure;
}

}  // namespace laxy::archive
