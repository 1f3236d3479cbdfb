/// @file operation.cpp
/// @brief Operation helpers

#include "operation.hpp"

#include <atomic>
#include <cerrno>

#include <fmt/format.h>

#include "../util/string_utils.hpp"

namespace laxy {

ErrorKind errorKindFromCode(const std::error_code& ec) noexcept {
    if (ec.category() != std::generic_category() && ec.category() != std::system_category()) {
        return ErrorKind::IoFailure;
    }

    switch (ec.value()) {
    case ENOENT:
    case ENOTDIR:
        return ErrorKind::NotFound;
    case EACCES:
    case EPERM:
    case EROFS:
        return ErrorKind::PermissionDenied;
    case EEXIST:
    case ENOTEMPTY:
        return ErrorKind::DestinationConflict;
    case ENOSPC:
    case EDQUOT:
        return ErrorKind::DiskFull;
    case EINVAL:
    case ENAMETOOLONG:
        return ErrorKind::InvalidArgument;
    case ECANCELED:
        return ErrorKind::Cancelled;
    default:
        return ErrorKind::IoFailure;
    }
}

bool isRetryable(const OperationError& error) noexcept {
    return error.code() == ErrorKind::IoFailure;
}

std::string generateOperationId(std::string_view prefix) {
    static std::atomic<uint64_t> counter{0};
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                  std::chrono::system_clock::now().time_since_epoch())
                  .count();
    return fmt::format("{}_{}_{}", prefix, ms, counter.fetch_add(1, std::memory_order_relaxed));
}

std::string formatItemError(const std::filesystem::path& path, ErrorKind kind,
                            std::string_view detail) {
    if (detail.empty()) {
        return fmt::format("{}: {}", pathToUtf8(path), to_string(kind));
    }
    return fmt::format("{}: {}: {}", pathToUtf8(path), to_string(kind), detail);
}

}  // namespace laxy
