/// @file archive_writer.hpp
/// @brief Archive writer interface

#pragma once

#include <expected>
#include <filesystem>
#include <memory>
#include <span>
#include <string>

#include "archive_entry.hpp"
#include "archive_error.hpp"
#include "archive_reader.hpp"

namespace laxy::archive {

/// @brief One filesystem item and its path inside the archive
struct ArchiveSource {
    std::filesystem::path file;
    std::string entry_path;  // '/' separated
};

/// @brief Archive writer interface
class IArchiveWriter {
public:
    virtual ~IArchiveWriter() = default;

    /// @brief Write a new archive, replacing @p archive_path if it exists
    /// @param sources Files and empty directories to store
    /// @param archive_path Output file
    /// @param format Any format for which can_create() holds
    /// @param level Compression level (ignored by plain tar)
    /// @param progress Progress callback (optional)
    [[nodiscard]] virtual std::expected<void, ArchiveError>
    write(std::span<const ArchiveSource> sources, const std::filesystem::path& archive_path,
          ArchiveFormat format, CompressionLevel level,
          ArchiveProgressCallback progress = nullptr) = 0;
};

/// @brief Factory for creating archive writers
class ArchiveWriterFactory {
public:
    /// @param library Configured 7z.so path (empty = search)
    [[nodiscard]] static std::expected<std::unique_ptr<IArchiveWriter>, ArchiveError>
    create(const std::filesystem::path& library = {});
};

}  // namespace laxy::archive
