/// @file progress_tracker.hpp
/// @brief Per-operation progress counters with observer fan-out

#pragma once

#include <chrono>
#include <cstdint>
#include <deque>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include "../operation/operation.hpp"

namespace laxy::progress {

/// @brief Snapshot of one tracked operation
struct OperationProgress {
    std::string operation_id;
    OperationType type = OperationType::Copy;
    uint64_t total_files = 0;
    uint64_t total_bytes = 0;
    uint64_t processed_files = 0;
    uint64_t processed_bytes = 0;
    std::string current_file;
    OperationStatus status = OperationStatus::Pending;
    std::vector<std::string> errors;
    std::chrono::system_clock::time_point start_time;
    std::chrono::steady_clock::time_point started;

    // Advisory, recomputed on every update
    double speed_bps = 0.0;
    std::optional<std::chrono::seconds> eta;

    /// @brief 0-100, by bytes when the byte total is known, else by files
    [[nodiscard]] double percentage() const noexcept;

    [[nodiscard]] std::chrono::milliseconds elapsed() const;
};

/// @brief Increment applied by update()
struct ProgressDelta {
    uint64_t files = 0;
    uint64_t bytes = 0;
    std::optional<std::string> current_file;
    std::optional<std::string> error;
};

/// @brief Structured observer
using ProgressCallback = std::function<void(const OperationProgress&)>;

/// @brief Simple observer: percentage (0-100) and a status line
using PercentCallback = std::function<void(double percentage, std::string_view message)>;

/// @brief Wrap a percentage observer as a structured one
[[nodiscard]] ProgressCallback adaptPercentCallback(PercentCallback callback);

/// @brief Tracks all running operations
///
/// Callbacks run synchronously on the updating thread, outside the tracker
/// lock. A callback that throws is logged and otherwise ignored.
///
/// Finished records stay queryable until @c retained_finished newer
/// operations have finished after them; callbacks are released on finish.
class ProgressTracker {
public:
    static constexpr size_t kDefaultRetainedFinished = 256;

    explicit ProgressTracker(size_t retained_finished = kDefaultRetainedFinished)
        : retained_finished_(retained_finished) {}

    // Non-copyable, non-movable
    ProgressTracker(const ProgressTracker&) = delete;
    ProgressTracker& operator=(const ProgressTracker&) = delete;
    ProgressTracker(ProgressTracker&&) = delete;
    ProgressTracker& operator=(ProgressTracker&&) = delete;

    /// @brief Start tracking (replaces an existing record with the same id)
    OperationProgress create(const std::string& id, OperationType type, uint64_t total_files = 0,
                             uint64_t total_bytes = 0);

    /// @brief Replace the totals once they are known
    void setTotals(const std::string& id, uint64_t total_files, uint64_t total_bytes);

    /// @brief Apply a delta; processed counters are clamped to the totals
    /// @return false if the id is unknown or already terminal
    bool update(const std::string& id, const ProgressDelta& delta);

    void addCallback(const std::string& id, ProgressCallback callback);

    /// @brief Mark completed or failed
    void complete(const std::string& id, bool success);

    /// @brief Mark cancelled; running loops observe this before their next unit of work
    void cancel(const std::string& id);

    [[nodiscard]] bool isCancelled(const std::string& id) const;

    [[nodiscard]] std::optional<OperationProgress> get(const std::string& id) const;

    /// @brief Forget an operation and its callbacks
    void remove(const std::string& id);

    /// @brief Ids of operations that have not reached a terminal state
    [[nodiscard]] std::vector<std::string> activeOperations() const;

private:
    void finish(const std::string& id, OperationStatus status);
    static void notify(const std::vector<ProgressCallback>& callbacks,
                       const OperationProgress& snapshot);

    // Requires mutex_
    void retire(const std::string& id);

    size_t retained_finished_;
    mutable std::mutex mutex_;
    std::unordered_map<std::string, OperationProgress> operations_;
    std::unordered_map<std::string, std::vector<ProgressCallback>> callbacks_;
    std::deque<std::string> finished_;  // oldest first
};

}  // namespace laxy::progress
