/// @file batch_operation.hpp
/// @brief Batch operation description and progress snapshot

#pragma once

#include <filesystem>
#include <map>
#include <span>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "../config/settings.hpp"
#include "../fs/file_conflict.hpp"
#include "../fs/file_operations.hpp"
#include "../operation/operation.hpp"

namespace laxy::batch {

/// @brief Batch lifecycle: Pending -> Running -> Completed | Failed | Cancelled
enum class BatchState {
    Pending,
    Running,
    Completed,
    Failed,
    Cancelled,
};

/// @brief Get string representation of BatchState
[[nodiscard]] constexpr std::string_view to_string(BatchState state) noexcept {
    switch (state) {
    case BatchState::Pending:
        return "pending";
    case BatchState::Running:
        return "running";
    case BatchState::Completed:
        return "completed";
    case BatchState::Failed:
        return "failed";
    case BatchState::Cancelled:
        return "cancelled";
    }
    return "unknown";
}

/// @brief One unit of a batch; delete items carry the same path twice
struct BatchItem {
    std::filesystem::path source;
    std::filesystem::path destination;
};

/// @brief A batch of copy, move or delete items
struct BatchOperation {
    std::string id;
    OperationType type = OperationType::Copy;
    std::vector<BatchItem> items;
    config::BatchStrategy strategy = config::BatchStrategy::Adaptive;
    int max_parallel = 0;  // 0 = batch.max_parallel setting
    fs::DeleteOptions delete_options;

    /// Actions decided up front for specific (source, destination) pairs
    std::map<std::pair<std::filesystem::path, std::filesystem::path>, fs::ConflictAction>
        conflict_actions;
};

/// @brief Point-in-time view of a running batch
struct BatchProgress {
    std::string id;
    OperationType type = OperationType::Copy;
    BatchState state = BatchState::Pending;
    config::BatchStrategy strategy = config::BatchStrategy::Adaptive;
    size_t total_items = 0;
    size_t completed_items = 0;
    size_t failed_items = 0;
    size_t skipped_items = 0;
    std::vector<fs::ConflictInfo> conflicts;

    [[nodiscard]] size_t processedItems() const noexcept {
        return completed_items + failed_items + skipped_items;
    }
};

/// @brief Copy each source into @p dest_dir
[[nodiscard]] BatchOperation batchCopy(std::span<const std::filesystem::path> sources,
                                       const std::filesystem::path& dest_dir,
                                       config::BatchStrategy strategy = config::BatchStrategy::Adaptive);

/// @brief Move each source into @p dest_dir
[[nodiscard]] BatchOperation batchMove(std::span<const std::filesystem::path> sources,
                                       const std::filesystem::path& dest_dir,
                                       config::BatchStrategy strategy = config::BatchStrategy::Adaptive);

/// @brief Delete each path
[[nodiscard]] BatchOperation batchDelete(std::span<const std::filesystem::path> paths,
                                         bool permanent = false,
                                         config::BatchStrategy strategy = config::BatchStrategy::Adaptive);

}  // namespace laxy::batch
