/// @file archive_codec.hpp
/// @brief Archive creation, extraction and inspection

#pragma once

#include <expected>
#include <filesystem>
#include <optional>
#include <span>
#include <string_view>
#include <vector>

#include "../config/settings.hpp"
#include "../fs/file_operations.hpp"
#include "../operation/operation.hpp"
#include "../progress/progress_tracker.hpp"
#include "archive_entry.hpp"
#include "archive_error.hpp"
#include "archive_reader.hpp"
#include "archive_writer.hpp"

namespace laxy::cache {
class MetadataCache;
}

namespace laxy::archive {

/// @brief What the codec can do with one format
struct ArchiveFormatSupport {
    ArchiveFormat format = ArchiveFormat::Unknown;
    bool can_create = false;
    bool can_extract = false;
    std::vector<std::string_view> extensions;
};

/// @brief Creates, extracts and inspects archives
///
/// create() and extract() follow the executor's contract: they register
/// with the ProgressTracker (percentage of uncompressed bytes), invalidate
/// the MetadataCache and report an OperationResult. Failures that prevent
/// the work from starting, such as an unsupported format or a missing
/// 7z.so, are returned as OperationError.
///
/// Thread-safe: each call opens its own reader or writer.
class ArchiveCodec {
public:
    ArchiveCodec(cache::MetadataCache& cache, progress::ProgressTracker& tracker,
                 config::ArchiveSettings settings = {});

    // Non-copyable, non-movable
    ArchiveCodec(const ArchiveCodec&) = delete;
    ArchiveCodec& operator=(const ArchiveCodec&) = delete;
    ArchiveCodec(ArchiveCodec&&) = delete;
    ArchiveCodec& operator=(ArchiveCodec&&) = delete;

    /// @brief Create an archive from files and directories
    ///
    /// Each input directory becomes a top-level directory in the archive.
    /// @param format Unknown = infer from @p archive_path
    /// @param level nullopt = archive.default_compression_level
    [[nodiscard]] OperationOutcome create(std::span<const std::filesystem::path> files,
                                          const std::filesystem::path& archive_path,
                                          ArchiveFormat format = ArchiveFormat::Unknown,
                                          std::optional<CompressionLevel> level = std::nullopt,
                                          const fs::OperationControl& control = {});

    /// @brief Extract every entry into @p dest_dir
    [[nodiscard]] OperationOutcome extract(const std::filesystem::path& archive_path,
                                           const std::filesystem::path& dest_dir,
                                           const fs::OperationControl& control = {});

    [[nodiscard]] std::expected<std::vector<ArchiveEntry>, ArchiveError>
    listContents(const std::filesystem::path& archive_path) const;

    [[nodiscard]] std::expected<ArchiveInfo, ArchiveError>
    info(const std::filesystem::path& archive_path) const;

    /// @brief Extension first, then magic bytes
    [[nodiscard]] ArchiveFormat detectFormat(const std::filesystem::path& path) const;

    /// @brief Re-read every entry and check its checksum
    [[nodiscard]] std::expected<void, ArchiveError>
    test(const std::filesystem::path& archive_path) const;

    [[nodiscard]] static std::vector<ArchiveFormatSupport> supportedFormats();

    /// @brief Whether 7z.so can be found
    [[nodiscard]] bool isAvailable() const;

private:
    [[nodiscard]] std::expected<std::unique_ptr<IArchiveReader>, ArchiveError>
    open_reader(const std::filesystem::path& archive_path,
                ArchiveProgressCallback progress = nullptr) const;

    cache::MetadataCache& cache_;
    progress::ProgressTracker& tracker_;
    config::ArchiveSettings settings_;
};

}  // namespace laxy::archive
