/// @file trash.hpp
/// @brief Recoverable deletion through the desktop trash
///
/// The desktop trash is reached through GIO. When it is unavailable
/// (no session, unsupported mount) items go to a local trash directory
/// using the freedesktop.org layout: files/ holds the items, info/ holds
/// one .trashinfo record per item.

#pragma once

#include <cstdint>
#include <expected>
#include <filesystem>
#include <string_view>

namespace laxy::fs {

/// @brief Trash operation error types
enum class TrashError {
    NotFound,
    AccessDenied,
    Unavailable,  // Neither the desktop trash nor the local directory can be used
    IoError
};

/// @brief Convert error to string
[[nodiscard]] constexpr std::string_view to_string(TrashError error) noexcept {
    switch (error) {
    case TrashError::NotFound:
        return "Not found";
    case TrashError::AccessDenied:
        return "Access denied";
    case TrashError::Unavailable:
        return "Trash unavailable";
    case TrashError::IoError:
        return "I/O error";
    }
    return "Unknown error";
}

/// @brief Options for trash operations
struct TrashOptions {
    bool use_system_trash = true;     // Try g_file_trash first
    std::filesystem::path trash_dir;  // Local trash root used as fallback
};

/// @brief Where a trashed item ended up
struct TrashedItem {
    std::filesystem::path original;
    std::filesystem::path location;  // Empty when the desktop trash took it
    bool system_trash = false;
};

/// @brief Move a file or directory to the trash
/// @param path Item to trash
/// @param options Trash options
/// @return Trashed item or error
[[nodiscard]] std::expected<TrashedItem, TrashError> trashFile(const std::filesystem::path& path,
                                                               const TrashOptions& options);

/// @brief Permanently delete a file or directory tree
/// @param path Item to delete
/// @return Number of filesystem entries removed, or error
[[nodiscard]] std::expected<uint64_t, TrashError>
permanentDelete(const std::filesystem::path& path);

}  // namespace laxy::fs
