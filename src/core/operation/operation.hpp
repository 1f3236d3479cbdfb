/// @file operation.hpp
/// @brief Operation kinds, error kinds and the aggregate operation result
///
/// Every public engine operation reports an OperationResult. Preconditions
/// that prevent an operation from starting are reported as OperationError
/// through OperationOutcome instead.

#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

#include "../util/result.hpp"

namespace laxy {

/// @brief Kind of file operation
enum class OperationType {
    Copy,
    Move,
    Delete,
    Rename,
    CreateDirectory,
    CreateFile,
    CreateArchive,
    ExtractArchive,
    Batch,
};

/// @brief Get string representation of OperationType
[[nodiscard]] constexpr std::string_view to_string(OperationType type) noexcept {
    switch (type) {
    case OperationType::Copy:
        return "copy";
    case OperationType::Move:
        return "move";
    case OperationType::Delete:
        return "delete";
    case OperationType::Rename:
        return "rename";
    case OperationType::CreateDirectory:
        return "create_dir";
    case OperationType::CreateFile:
        return "create_file";
    case OperationType::CreateArchive:
        return "archive_create";
    case OperationType::ExtractArchive:
        return "archive_extract";
    case OperationType::Batch:
        return "batch";
    }
    return "unknown";
}

/// @brief Lifecycle state of a tracked operation
enum class OperationStatus {
    Pending,
    InProgress,
    Completed,
    Failed,
    Cancelled,
};

/// @brief Get string representation of OperationStatus
[[nodiscard]] constexpr std::string_view to_string(OperationStatus status) noexcept {
    switch (status) {
    case OperationStatus::Pending:
        return "pending";
    case OperationStatus::InProgress:
        return "in_progress";
    case OperationStatus::Completed:
        return "completed";
    case OperationStatus::Failed:
        return "failed";
    case OperationStatus::Cancelled:
        return "cancelled";
    }
    return "unknown";
}

/// @brief Terminal states accept no further updates
[[nodiscard]] constexpr bool isTerminal(OperationStatus status) noexcept {
    return status == OperationStatus::Completed || status == OperationStatus::Failed ||
           status == OperationStatus::Cancelled;
}

/// @brief Failure categories shared by all engine operations
enum class ErrorKind {
    NotFound,
    PermissionDenied,
    DestinationConflict,
    VerificationFailed,
    UnsupportedFormat,
    CorruptedArchive,
    Cancelled,
    DiskFull,
    IoFailure,
    InvalidArgument,
};

/// @brief Get string representation of ErrorKind
[[nodiscard]] constexpr std::string_view to_string(ErrorKind kind) noexcept {
    switch (kind) {
    case ErrorKind::NotFound:
        return "Path not found";
    case ErrorKind::PermissionDenied:
        return "Permission denied";
    case ErrorKind::DestinationConflict:
        return "Destination already exists";
    case ErrorKind::VerificationFailed:
        return "Verification failed";
    case ErrorKind::UnsupportedFormat:
        return "Unsupported format";
    case ErrorKind::CorruptedArchive:
        return "Corrupted archive";
    case ErrorKind::Cancelled:
        return "Operation cancelled";
    case ErrorKind::DiskFull:
        return "No space left on device";
    case ErrorKind::IoFailure:
        return "I/O error";
    case ErrorKind::InvalidArgument:
        return "Invalid argument";
    }
    return "Unknown error";
}

/// @brief Map an OS error code to an ErrorKind
[[nodiscard]] ErrorKind errorKindFromCode(const std::error_code& ec) noexcept;

/// @brief Error raised before an operation starts
using OperationError = ErrorInfo<ErrorKind>;

/// @brief Aggregate result of a public operation
struct OperationResult {
    bool success = false;
    std::string message;
    std::vector<std::filesystem::path> affected_files;
    std::vector<std::string> errors;
    double progress = 0.0;  // 0-100
    std::chrono::milliseconds duration{0};
    uint64_t bytes_processed = 0;
    bool cancelled = false;
    size_t items_completed = 0;
};

/// @brief Result of an operation, or the precondition that stopped it
using OperationOutcome = Result<OperationResult, OperationError>;

/// @brief Whether a call that could not start may succeed when repeated
///
/// Only whole-call I/O failures qualify. Per-item errors inside an
/// OperationResult are final: repeating a copy or move would revisit
/// items that already completed.
[[nodiscard]] bool isRetryable(const OperationError& error) noexcept;

/// @brief Generate a process-unique operation id ("copy_1718000000123_7")
[[nodiscard]] std::string generateOperationId(std::string_view prefix);

/// @brief Format a per-item error line ("<path>: <kind>: <detail>")
[[nodiscard]] std::string formatItemError(const std::filesystem::path& path, ErrorKind kind,
                                          std::string_view detail = {});

}  // namespace laxy
