/// @file archive_entry.hpp
/// @brief Archive formats, entries and archive information

#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace laxy::archive {

/// @brief Supported archive formats
enum class ArchiveFormat {
    Unknown,
    Zip,
    Tar,
    TarGz,
    TarBz2,
    TarXz,
    SevenZip,
    Rar,  // Extract and list only
};

/// @brief Convert format to string
[[nodiscard]] constexpr std::string_view to_string(ArchiveFormat format) noexcept {
    switch (format) {
    case ArchiveFormat::Zip:
        return "zip";
    case ArchiveFormat::Tar:
        return "tar";
    case ArchiveFormat::TarGz:
        return "tar.gz";
    case ArchiveFormat::TarBz2:
        return "tar.bz2";
    case ArchiveFormat::TarXz:
        return "tar.xz";
    case ArchiveFormat::SevenZip:
        return "7z";
    case ArchiveFormat::Rar:
        return "rar";
    case ArchiveFormat::Unknown:
        break;
    }
    return "unknown";
}

/// @brief Parse a format name ("zip", "tar.gz", "tgz", "7z", ...)
[[nodiscard]] std::optional<ArchiveFormat> format_from_string(std::string_view name);

/// @brief Whether archives of this format can be written
[[nodiscard]] constexpr bool can_create(ArchiveFormat format) noexcept {
    return format != ArchiveFormat::Unknown && format != ArchiveFormat::Rar;
}

/// @brief Tar wrapped in a single-stream compressor
[[nodiscard]] constexpr bool is_compressed_tar(ArchiveFormat format) noexcept {
    return format == ArchiveFormat::TarGz || format == ArchiveFormat::TarBz2 ||
           format == ArchiveFormat::TarXz;
}

/// @brief Canonical file extension including the dot (".tar.gz")
[[nodiscard]] std::string_view default_extension(ArchiveFormat format) noexcept;

/// @brief Detect format from the file name only
[[nodiscard]] ArchiveFormat format_from_extension(const std::filesystem::path& path);

/// @brief Detect format from leading bytes of the file content
/// @param head At least the first 262 bytes for tar detection
[[nodiscard]] ArchiveFormat format_from_signature(std::span<const uint8_t> head) noexcept;

/// @brief Detect format by extension, then by magic bytes
[[nodiscard]] ArchiveFormat detect_format(const std::filesystem::path& path);

/// @brief Compression levels
enum class CompressionLevel {
    None = 0,
    Fastest = 1,
    Fast = 3,
    Normal = 6,
    Best = 9,
};

/// @brief Nearest level at or below @p level (clamped to 0-9)
[[nodiscard]] constexpr CompressionLevel compression_level_from_int(int level) noexcept {
    if (level >= 9)
        return CompressionLevel::Best;
    if (level >= 6)
        return CompressionLevel::Normal;
    if (level >= 3)
        return CompressionLevel::Fast;
    if (level >= 1)
        return CompressionLevel::Fastest;
    return CompressionLevel::None;
}

/// @brief Check that an entry path stays inside the extraction directory
///
/// Rejects absolute paths and any ".." component.
[[nodiscard]] bool is_safe_entry_path(std::string_view entry_path) noexcept;

/// @brief Archive entry (file or directory inside archive)
struct ArchiveEntry {
    std::string path;  // Path inside archive, '/' separated
    std::string name;  // Entry name (filename)
    bool is_directory = false;
    bool is_encrypted = false;

    uint64_t compressed_size = 0;
    uint64_t uncompressed_size = 0;
    std::chrono::system_clock::time_point modified_time;

    uint32_t crc32 = 0;

    /// @brief Get parent path inside archive
    [[nodiscard]] std::string parent_path() const;

    /// @brief Get compression ratio (0.0 - 1.0)
    [[nodiscard]] double compression_ratio() const noexcept {
        if (uncompressed_size == 0)
            return 0.0;
        return 1.0 - (static_cast<double>(compressed_size) / uncompressed_size);
    }
};

/// @brief Archive information
struct ArchiveInfo {
    std::filesystem::path path;  // Path to archive file
    ArchiveFormat format = ArchiveFormat::Unknown;
    bool is_encrypted = false;
    bool is_solid = false;

    uint64_t archive_size = 0;  // Size of the archive file on disk
    uint64_t total_compressed_size = 0;
    uint64_t total_uncompressed_size = 0;
    uint64_t file_count = 0;
    uint64_t directory_count = 0;

    std::vector<ArchiveEntry> entries;

    /// @brief Get total entry count
    [[nodiscard]] uint64_t total_entries() const noexcept { return file_count + directory_count; }

    /// @brief Get overall compression ratio
    [[nodiscard]] double compression_ratio() const noexcept {
        if (total_uncompressed_size == 0)
            return 0.0;
        return 1.0 - (static_cast<double>(archive_size > 0 ? archive_size
                                                           : total_compressed_size) /
                      total_uncompressed_size);
    }

    /// @brief Find entry by path
    [[nodiscard]] const ArchiveEntry* find_entry(std::string_view entry_path) const;
};

}  // namespace laxy::archive
