/// @file batch_manager.hpp
/// @brief Batched copy/move/delete with conflict resolution

#pragma once

#include <memory>
#include <mutex>
#include <optional>
#include <stop_token>
#include <string>
#include <unordered_map>
#include <vector>

#include "../config/settings.hpp"
#include "../fs/file_conflict.hpp"
#include "../fs/file_operations.hpp"
#include "../operation/operation.hpp"
#include "../progress/progress_tracker.hpp"
#include "batch_operation.hpp"

namespace laxy::batch {

/// @brief Cancellation, observation and conflict decisions for one batch
struct BatchControl {
    std::stop_token stop_token;
    progress::ProgressCallback observer;  // Receives the batch-level progress record
    fs::DecisionCallback decide;          // Consulted when the rules answer Ask
};

/// @brief Runs batches of items through the executor
///
/// Each item is processed as: detect conflict, resolve, apply the action,
/// execute through FileOperationExecutor, update the counters. Items run
/// sequentially, on a per-batch worker pool, or adaptively: a short
/// parallel probe measures the average time per item and the remainder
/// runs in parallel when items are fast, sequentially otherwise.
///
/// Cancelling stops dispatch; items not yet started count as skipped.
class BatchOperationManager {
public:
    BatchOperationManager(fs::FileOperationExecutor& executor, fs::ConflictResolver& resolver,
                          progress::ProgressTracker& tracker, config::BatchSettings settings = {});
    ~BatchOperationManager();

    // Non-copyable, non-movable
    BatchOperationManager(const BatchOperationManager&) = delete;
    BatchOperationManager& operator=(const BatchOperationManager&) = delete;
    BatchOperationManager(BatchOperationManager&&) = delete;
    BatchOperationManager& operator=(BatchOperationManager&&) = delete;

    /// @brief Run a batch to completion on the calling thread
    /// @return Aggregated result; an error if the batch is malformed
    [[nodiscard]] OperationOutcome execute(BatchOperation batch, const BatchControl& control = {});

    /// @brief Stop dispatching further items of a running batch
    /// @return false if no batch with that id is running
    bool cancel(const std::string& batch_id);

    /// @brief Snapshot of a running batch
    [[nodiscard]] std::optional<BatchProgress> progress(const std::string& batch_id) const;

    [[nodiscard]] std::vector<std::string> activeBatches() const;

    /// @brief Strategy that execute() uses for @p batch
    ///
    /// Adaptive batches resolve to Sequential below batch.sequential_below
    /// items, to Parallel above batch.parallel_threshold copy/move items,
    /// and stay Adaptive (probe first) in between.
    [[nodiscard]] config::BatchStrategy chooseStrategy(const BatchOperation& batch) const;

    [[nodiscard]] const config::BatchSettings& settings() const noexcept { return settings_; }

private:
    struct ActiveBatch;

    void run_sequential(ActiveBatch& active, size_t begin, size_t end);
    void run_parallel(ActiveBatch& active, size_t begin, size_t end, size_t workers);
    void process_item(ActiveBatch& active, size_t index);
    void process_item_unchecked(ActiveBatch& active, size_t index);

    fs::FileOperationExecutor& executor_;
    fs::ConflictResolver& resolver_;
    progress::ProgressTracker& tracker_;
    config::BatchSettings settings_;

    mutable std::mutex mutex_;
    std::unordered_map<std::string, std::shared_ptr<ActiveBatch>> active_;
};

}  // namespace laxy::batch
