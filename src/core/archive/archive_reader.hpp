/// @file archive_reader.hpp
/// @brief Archive reader interface

#pragma once

#include <expected>
#include <filesystem>
#include <functional>
#include <memory>
#include <vector>

#include "archive_entry.hpp"
#include "archive_error.hpp"

namespace laxy::archive {

/// @brief Progress callback for archive processing
/// @param current Bytes processed so far
/// @param total Total bytes to process (0 if not known yet)
/// @return false to cancel
using ArchiveProgressCallback = std::function<bool(uint64_t current, uint64_t total)>;

/// @brief Archive reader interface
///
/// Abstract interface for reading archive contents.
/// Implemented by Bit7zReader (bit7z over 7z.so).
class IArchiveReader {
public:
    virtual ~IArchiveReader() = default;

    /// @brief Open an archive file
    /// @param path Archive file path
    /// @param format Container format; compressed tars are unwrapped transparently
    /// @param progress Reports the unwrap pass of compressed tars (optional)
    /// @return Success or error (Cancelled when @p progress returned false)
    [[nodiscard]] virtual std::expected<void, ArchiveError>
    open(const std::filesystem::path& path, ArchiveFormat format,
         ArchiveProgressCallback progress = nullptr) = 0;

    /// @brief Close the archive
    virtual void close() = 0;

    /// @brief Check if archive is open
    [[nodiscard]] virtual bool isOpen() const noexcept = 0;

    /// @brief Get archive information
    [[nodiscard]] virtual std::expected<ArchiveInfo, ArchiveError> getInfo() const = 0;

    /// @brief List all entries in the archive
    [[nodiscard]] virtual std::expected<std::vector<ArchiveEntry>, ArchiveError>
    listEntries() const = 0;

    /// @brief Extract all entries to directory
    ///
    /// Nothing is written when any entry path would escape @p dest_dir.
    /// @param dest_dir Destination directory
    /// @param progress Progress callback (optional)
    /// @return Success or error
    [[nodiscard]] virtual std::expected<void, ArchiveError>
    extractAll(const std::filesystem::path& dest_dir,
               ArchiveProgressCallback progress = nullptr) const = 0;

    /// @brief Test archive integrity
    /// @return Success or error describing the problem
    [[nodiscard]] virtual std::expected<void, ArchiveError> test() const = 0;
};

/// @brief Factory for creating archive readers
class ArchiveReaderFactory {
public:
    /// @brief Create default archive reader
    /// @param library Configured 7z.so path (empty = search)
    /// @return Archive reader or error (e.g., LibraryNotFound)
    [[nodiscard]] static std::expected<std::unique_ptr<IArchiveReader>, ArchiveError>
    create(const std::filesystem::path& library = {});
};

}  // namespace laxy::archive
