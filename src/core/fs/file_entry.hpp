/// @file file_entry.hpp
/// @brief File metadata snapshot and the stat-based metadata provider

#pragma once

#include <chrono>
#include <cstdint>
#include <expected>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

#include "../operation/operation.hpp"

namespace laxy::fs {

/// @brief Kind of directory entry
enum class FileKind {
    File,
    Directory,
    Symlink,
    Archive,
    Other,
};

/// @brief Convert file kind to string
[[nodiscard]] constexpr std::string_view to_string(FileKind kind) noexcept {
    switch (kind) {
    case FileKind::File:
        return "file";
    case FileKind::Directory:
        return "directory";
    case FileKind::Symlink:
        return "symlink";
    case FileKind::Archive:
        return "archive";
    case FileKind::Other:
        return "other";
    }
    return "other";
}

/// @brief Metadata snapshot of one path
///
/// For symlinks, size, time and directory flag describe the target when it
/// resolves, and the link itself otherwise.
struct FileEntry {
    std::filesystem::path path;
    std::string name;
    uint64_t size = 0;
    std::chrono::system_clock::time_point modified_time;
    bool is_directory = false;
    bool is_symlink = false;
    FileKind kind = FileKind::Other;
    std::filesystem::perms permissions = std::filesystem::perms::none;
    uint64_t device_id = 0;

    /// @brief Dot-file convention
    [[nodiscard]] bool is_hidden() const noexcept { return !name.empty() && name.front() == '.'; }

    /// @brief Lowercase extension including the dot, or empty
    [[nodiscard]] std::string extension() const;

    bool operator==(const FileEntry&) const = default;
};

/// @brief FileEntry plus presentation hints for list views
struct EnrichedFileEntry {
    FileEntry entry;
    std::string icon_hint;  // "folder", "archive", "image", "code", "text", "link", "file"
    bool hidden = false;
    bool executable = false;
};

/// @brief Derive presentation hints from an entry
[[nodiscard]] EnrichedFileEntry enrich(const FileEntry& entry);

/// @brief Check for a known archive suffix (.zip, .tar.gz, .7z, ...)
[[nodiscard]] bool isArchiveName(std::string_view filename) noexcept;

/// @brief Read metadata with lstat, following a resolvable symlink
/// @param path Path to inspect
/// @return Entry, or NotFound / PermissionDenied / IoFailure
[[nodiscard]] std::expected<FileEntry, ErrorKind> readFileEntry(const std::filesystem::path& path);

/// @brief Device id of the nearest existing ancestor of @p path (inclusive)
[[nodiscard]] std::optional<uint64_t> deviceIdOf(const std::filesystem::path& path);

/// @brief True when both paths resolve to the same filesystem device
[[nodiscard]] bool sameVolume(const std::filesystem::path& a, const std::filesystem::path& b);

}  // namespace laxy::fs
