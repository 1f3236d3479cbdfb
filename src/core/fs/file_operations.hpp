/// @file file_operations.hpp
/// @brief File operations (copy, move, delete, rename, create)

#pragma once

#include <atomic>
#include <expected>
#include <filesystem>
#include <functional>
#include <optional>
#include <span>
#include <stop_token>
#include <string>
#include <string_view>

#include "../config/settings.hpp"
#include "../operation/operation.hpp"
#include "../progress/progress_tracker.hpp"
#include "file_conflict.hpp"
#include "verifier.hpp"

namespace laxy::cache {
class MetadataCache;
}

namespace laxy::fs {

/// @brief Options for copy/move operations
struct CopyOptions {
    bool overwrite_existing = false;        // Replace an existing destination when no resolver is set
    std::optional<bool> verify;             // Overrides verification.enabled
    std::optional<bool> preserve_metadata;  // Overrides transfer.preserve_metadata
    ConflictResolver* resolver = nullptr;   // Decides existing destinations when set
    DecisionCallback decide;                // Passed to the resolver for Ask
};

/// @brief Options for delete operations
struct DeleteOptions {
    bool permanent = false;  // Skip the trash
};

/// @brief Identity, cancellation and observation of one call
struct OperationControl {
    std::string operation_id;  // Empty = generated
    std::stop_token stop_token;
    progress::ProgressCallback observer;
};

/// @brief Performs file operations against single paths or trees
///
/// Every call registers itself with the ProgressTracker under its
/// operation id, invalidates the MetadataCache for every path it touches
/// and reports an OperationResult. Per-item failures are collected in
/// OperationResult::errors while the remaining items continue; an
/// OperationError is returned only when the call cannot start at all.
///
/// Copies stream through a hidden temporary file beside the destination
/// that is renamed into place after verification, so an interrupted copy
/// never leaves a truncated file at the destination path.
///
/// Thread-safe: independent calls may run concurrently.
class FileOperationExecutor {
public:
    /// @brief Compares a finished temporary copy with its source
    using ContentCheck = std::function<std::expected<void, ErrorKind>(
        const std::filesystem::path& source, const std::filesystem::path& copy)>;

    /// @param check Replaces the Verifier's check when set
    FileOperationExecutor(cache::MetadataCache& cache, progress::ProgressTracker& tracker,
                          config::EngineSettings settings = {}, ContentCheck check = {});

    // Non-copyable, non-movable
    FileOperationExecutor(const FileOperationExecutor&) = delete;
    FileOperationExecutor& operator=(const FileOperationExecutor&) = delete;
    FileOperationExecutor(FileOperationExecutor&&) = delete;
    FileOperationExecutor& operator=(FileOperationExecutor&&) = delete;

    /// @brief Copy sources into a destination directory
    /// @param sources Files or directories (directories recurse)
    /// @param dest_dir Destination directory, created if missing
    [[nodiscard]] OperationOutcome copy(std::span<const std::filesystem::path> sources,
                                        const std::filesystem::path& dest_dir,
                                        const CopyOptions& options = {},
                                        const OperationControl& control = {});

    /// @brief Move sources into a destination directory
    ///
    /// Same-device moves are a rename with no data copied; otherwise the
    /// source is copied, verified, then deleted.
    [[nodiscard]] OperationOutcome move(std::span<const std::filesystem::path> sources,
                                        const std::filesystem::path& dest_dir,
                                        const CopyOptions& options = {},
                                        const OperationControl& control = {});

    /// @brief Copy one item to an explicit destination path
    [[nodiscard]] OperationOutcome copyTo(const std::filesystem::path& source,
                                          const std::filesystem::path& destination,
                                          const CopyOptions& options = {},
                                          const OperationControl& control = {});

    /// @brief Move one item to an explicit destination path
    [[nodiscard]] OperationOutcome moveTo(const std::filesystem::path& source,
                                          const std::filesystem::path& destination,
                                          const CopyOptions& options = {},
                                          const OperationControl& control = {});

    /// @brief Delete paths (trash by default)
    ///
    /// A path that does not exist counts as deleted with nothing affected.
    [[nodiscard]] OperationOutcome remove(std::span<const std::filesystem::path> paths,
                                          const DeleteOptions& options = {},
                                          const OperationControl& control = {});

    /// @brief Rename a file or directory within its parent
    [[nodiscard]] OperationOutcome rename(const std::filesystem::path& path,
                                          std::string_view new_name,
                                          const OperationControl& control = {});

    /// @brief Create a directory (and missing parents)
    [[nodiscard]] OperationOutcome createDirectory(const std::filesystem::path& path);

    /// @brief Create a new file; fails if it exists
    [[nodiscard]] OperationOutcome createFile(const std::filesystem::path& path,
                                              std::string_view content = {});

    /// @brief Bytes physically copied by this executor since the last reset
    [[nodiscard]] uint64_t bytesCopied() const noexcept {
        return bytes_copied_.load(std::memory_order_relaxed);
    }

    void resetBytesCopied() noexcept { bytes_copied_.store(0, std::memory_order_relaxed); }

    [[nodiscard]] const Verifier& verifier() const noexcept { return verifier_; }
    [[nodiscard]] const config::EngineSettings& settings() const noexcept { return settings_; }

private:
    struct Run;

    OperationOutcome into_directory(OperationType type,
                                    std::span<const std::filesystem::path> sources,
                                    const std::filesystem::path& dest_dir,
                                    const CopyOptions& options, const OperationControl& control);
    OperationOutcome transfer(OperationType type, std::span<const std::filesystem::path> sources,
                              std::span<const std::filesystem::path> destinations,
                              const CopyOptions& options, const OperationControl& control);

    /// @return true when the item completed (false when skipped or failed)
    bool transfer_item(Run& run, const std::filesystem::path& source,
                       const std::filesystem::path& destination);
    bool place(Run& run, const std::filesystem::path& source,
               const std::filesystem::path& destination, bool move);
    bool copy_item(Run& run, const std::filesystem::path& source,
                   const std::filesystem::path& destination);
    bool copy_tree(Run& run, const std::filesystem::path& source,
                   const std::filesystem::path& destination);
    bool copy_symlink(Run& run, const std::filesystem::path& source,
                      const std::filesystem::path& destination);
    bool move_item(Run& run, const std::filesystem::path& source,
                   const std::filesystem::path& destination);
    std::expected<void, ErrorKind> copy_file_data(Run& run, const std::filesystem::path& source,
                                                  const std::filesystem::path& destination);

    /// @brief Latch cancellation from the stop token or the tracker
    bool stop_requested(Run& run);

    void record_error(Run& run, const std::filesystem::path& path, ErrorKind kind,
                      std::string_view detail = {});

    cache::MetadataCache& cache_;
    progress::ProgressTracker& tracker_;
    config::EngineSettings settings_;
    Verifier verifier_;
    ContentCheck check_;
    std::atomic<uint64_t> bytes_copied_{0};
};

/// @brief Check a single path component for use as a new name
[[nodiscard]] bool isValidFilename(std::string_view name) noexcept;

}  // namespace laxy::fs
