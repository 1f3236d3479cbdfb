/// @file engine.hpp
/// @brief Owner of the file operations and caching components
#pragma once

#include <chrono>
#include <expected>
#include <filesystem>
#include <future>
#include <memory>
#include <optional>
#include <span>
#include <stop_token>
#include <string>
#include <string_view>
#include <vector>

#include "../archive/archive_codec.hpp"
#include "../batch/batch_manager.hpp"
#include "../cache/metadata_cache.hpp"
#include "../config/settings.hpp"
#include "../fs/file_conflict.hpp"
#include "../fs/file_operations.hpp"
#include "../operation/operation.hpp"
#include "../progress/progress_tracker.hpp"
#include "../util/thread_pool.hpp"

namespace laxy {

/// @brief Handle to an operation running on the engine's worker pool
///
/// Move-only. Dropping the handle does not cancel the operation.
class OperationTask {
public:
    OperationTask(std::string id, std::future<OperationOutcome> future, std::stop_source stop)
        : id_(std::move(id)), future_(std::move(future)), stop_(std::move(stop)) {}

    OperationTask(const OperationTask&) = delete;
    OperationTask& operator=(const OperationTask&) = delete;
    OperationTask(OperationTask&&) noexcept = default;
    OperationTask& operator=(OperationTask&&) noexcept = default;

    [[nodiscard]] const std::string& id() const noexcept { return id_; }

    /// @brief Request cancellation; the result still has to be collected
    void cancel() noexcept { stop_.request_stop(); }

    [[nodiscard]] bool cancelRequested() const noexcept { return stop_.stop_requested(); }

    /// @brief true once the result is available
    [[nodiscard]] bool ready() const {
        return future_.wait_for(std::chrono::seconds(0)) == std::future_status::ready;
    }

    void wait() const { future_.wait(); }

    /// @return false on timeout
    [[nodiscard]] bool waitFor(std::chrono::milliseconds timeout) const {
        return future_.wait_for(timeout) == std::future_status::ready;
    }

    /// @brief Block for the result (callable once)
    [[nodiscard]] OperationOutcome get() { return future_.get(); }

private:
    std::string id_;
    std::future<OperationOutcome> future_;
    std::stop_source stop_;
};

/// @brief File operations and caching engine
///
/// Constructed once by the application and passed by reference to whoever
/// needs it. Owns the metadata cache, the progress tracker, the conflict
/// resolver, the executor, the batch manager, the archive codec and a
/// worker pool for submitted operations.
///
/// Synchronous methods run on the calling thread; submit* methods return
/// an OperationTask immediately. Destroying the engine cancels everything
/// still running or queued and waits for the workers.
class Engine {
public:
    explicit Engine(config::EngineSettings settings = {});
    ~Engine();

    // Non-copyable, non-movable
    Engine(const Engine&) = delete;
    Engine& operator=(const Engine&) = delete;
    Engine(Engine&&) = delete;
    Engine& operator=(Engine&&) = delete;

    // ===== File operations =====

    /// @brief Copy into a directory
    ///
    /// Existing destinations go through the engine's resolver unless
    /// @p options names another resolver or requests a plain overwrite.
    [[nodiscard]] OperationOutcome copy(std::span<const std::filesystem::path> sources,
                                        const std::filesystem::path& dest_dir,
                                        fs::CopyOptions options = {},
                                        const fs::OperationControl& control = {});

    [[nodiscard]] OperationOutcome move(std::span<const std::filesystem::path> sources,
                                        const std::filesystem::path& dest_dir,
                                        fs::CopyOptions options = {},
                                        const fs::OperationControl& control = {});

    [[nodiscard]] OperationOutcome remove(std::span<const std::filesystem::path> paths,
                                          const fs::DeleteOptions& options = {},
                                          const fs::OperationControl& control = {});

    [[nodiscard]] OperationOutcome rename(const std::filesystem::path& path,
                                          std::string_view new_name);

    [[nodiscard]] OperationOutcome createDirectory(const std::filesystem::path& path);

    [[nodiscard]] OperationOutcome createFile(const std::filesystem::path& path,
                                              std::string_view content = {});

    /// @brief Run a batch to completion on the calling thread
    [[nodiscard]] OperationOutcome executeBatch(batch::BatchOperation batch,
                                                const batch::BatchControl& control = {});

    // ===== Archives =====

    [[nodiscard]] OperationOutcome
    createArchive(std::span<const std::filesystem::path> files,
                  const std::filesystem::path& archive_path,
                  archive::ArchiveFormat format = archive::ArchiveFormat::Unknown,
                  std::optional<archive::CompressionLevel> level = std::nullopt,
                  const fs::OperationControl& control = {});

    [[nodiscard]] OperationOutcome extractArchive(const std::filesystem::path& archive_path,
                                                  const std::filesystem::path& dest_dir,
                                                  const fs::OperationControl& control = {});

    // ===== Background submission =====

    [[nodiscard]] OperationTask submitCopy(std::vector<std::filesystem::path> sources,
                                           std::filesystem::path dest_dir,
                                           fs::CopyOptions options = {},
                                           progress::ProgressCallback observer = {});

    [[nodiscard]] OperationTask submitMove(std::vector<std::filesystem::path> sources,
                                           std::filesystem::path dest_dir,
                                           fs::CopyOptions options = {},
                                           progress::ProgressCallback observer = {});

    [[nodiscard]] OperationTask submitDelete(std::vector<std::filesystem::path> paths,
                                             fs::DeleteOptions options = {},
                                             progress::ProgressCallback observer = {});

    /// @brief Run a batch on the worker pool
    ///
    /// The task id is the batch id; cancel(id) and batchProgress(id) work
    /// while it runs.
    [[nodiscard]] OperationTask submitBatch(batch::BatchOperation batch,
                                            progress::ProgressCallback observer = {},
                                            fs::DecisionCallback decide = {});

    [[nodiscard]] OperationTask
    submitCreateArchive(std::vector<std::filesystem::path> files,
                        std::filesystem::path archive_path,
                        archive::ArchiveFormat format = archive::ArchiveFormat::Unknown,
                        std::optional<archive::CompressionLevel> level = std::nullopt,
                        progress::ProgressCallback observer = {});

    [[nodiscard]] OperationTask submitExtractArchive(std::filesystem::path archive_path,
                                                     std::filesystem::path dest_dir,
                                                     progress::ProgressCallback observer = {});

    /// @brief Cancel a running operation or batch by id
    /// @return false if nothing with that id is running
    bool cancel(const std::string& operation_id);

    // ===== Queries =====

    [[nodiscard]] std::expected<std::vector<fs::FileEntry>, ErrorKind>
    listDirectory(const std::filesystem::path& path, const fs::ListingOptions& options = {});

    [[nodiscard]] std::expected<fs::FileEntry, ErrorKind>
    fileInfo(const std::filesystem::path& path);

    [[nodiscard]] std::optional<progress::OperationProgress>
    operationProgress(const std::string& operation_id) const;

    [[nodiscard]] std::optional<batch::BatchProgress>
    batchProgress(const std::string& batch_id) const;

    // ===== Components =====

    [[nodiscard]] const config::EngineSettings& settings() const noexcept { return settings_; }
    [[nodiscard]] cache::MetadataCache& cache() noexcept { return *cache_; }
    [[nodiscard]] progress::ProgressTracker& tracker() noexcept { return *tracker_; }
    [[nodiscard]] fs::ConflictResolver& resolver() noexcept { return *resolver_; }
    [[nodiscard]] fs::FileOperationExecutor& executor() noexcept { return *executor_; }
    [[nodiscard]] batch::BatchOperationManager& batches() noexcept { return *batches_; }
    [[nodiscard]] archive::ArchiveCodec& archives() noexcept { return *archives_; }

private:
    /// @brief Queue @p work with a fresh stop source wired to its control
    template <typename Work>
    OperationTask submit(std::string id, progress::ProgressCallback observer, Work work);

    void with_default_resolver(fs::CopyOptions& options);

    config::EngineSettings settings_;

    std::unique_ptr<cache::MetadataCache> cache_;
    std::unique_ptr<progress::ProgressTracker> tracker_;
    std::unique_ptr<fs::ConflictResolver> resolver_;
    std::unique_ptr<fs::FileOperationExecutor> executor_;
    std::unique_ptr<batch::BatchOperationManager> batches_;
    std::unique_ptr<archive::ArchiveCodec> archives_;

    // Declared last: joined before the components above are destroyed
    std::unique_ptr<ThreadPool> pool_;
};

}  // namespace laxy
