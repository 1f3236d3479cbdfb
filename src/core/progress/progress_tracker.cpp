/// @file progress_tracker.cpp
/// @brief Progress tracker implementation

#include "progress_tracker.hpp"

#include <algorithm>
#include <exception>

#include <fmt/format.h>

#include "../util/logger.hpp"

namespace laxy::progress {

double OperationProgress::percentage() const noexcept {
    if (total_bytes > 0) {
        return std::min(100.0, 100.0 * static_cast<double>(processed_bytes) /
                                   static_cast<double>(total_bytes));
    }
    if (total_files > 0) {
        return std::min(100.0, 100.0 * static_cast<double>(processed_files) /
                                   static_cast<double>(total_files));
    }
    return status == OperationStatus::Completed ? 100.0 : 0.0;
}

std::chrono::milliseconds OperationProgress::elapsed() const {
    return std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() -
                                                                 started);
}

ProgressCallback adaptPercentCallback(PercentCallback callback) {
    return [callback = std::move(callback)](const OperationProgress& progress) {
        std::string message;
        if (progress.status == OperationStatus::InProgress && !progress.current_file.empty()) {
            message = fmt::format("{} {}", to_string(progress.type), progress.current_file);
        } else {
            message = std::string(to_string(progress.status));
        }
        callback(progress.percentage(), message);
    };
}

OperationProgress ProgressTracker::create(const std::string& id, OperationType type,
                                          uint64_t total_files, uint64_t total_bytes) {
    OperationProgress progress;
    progress.operation_id = id;
    progress.type = type;
    progress.total_files = total_files;
    progress.total_bytes = total_bytes;
    progress.start_time = std::chrono::system_clock::now();
    progress.started = std::chrono::steady_clock::now();

    std::lock_guard lock(mutex_);
    operations_[id] = progress;
    return progress;
}

void ProgressTracker::setTotals(const std::string& id, uint64_t total_files,
                                uint64_t total_bytes) {
    std::lock_guard lock(mutex_);
    auto it = operations_.find(id);
    if (it == operations_.end() || isTerminal(it->second.status)) {
        return;
    }
    it->second.total_files = total_files;
    it->second.total_bytes = total_bytes;
    it->second.processed_files = std::min(it->second.processed_files, total_files);
    it->second.processed_bytes = std::min(it->second.processed_bytes, total_bytes);
}

bool ProgressTracker::update(const std::string& id, const ProgressDelta& delta) {
    OperationProgress snapshot;
    std::vector<ProgressCallback> callbacks;
    {
        std::lock_guard lock(mutex_);
        auto it = operations_.find(id);
        if (it == operations_.end() || isTerminal(it->second.status)) {
            return false;
        }

        auto& progress = it->second;
        progress.status = OperationStatus::InProgress;
        progress.processed_files =
            std::min(progress.processed_files + delta.files, progress.total_files);
        progress.processed_bytes =
            std::min(progress.processed_bytes + delta.bytes, progress.total_bytes);
        if (delta.current_file) {
            progress.current_file = *delta.current_file;
        }
        if (delta.error) {
            progress.errors.push_back(*delta.error);
        }

        auto elapsed_ms = progress.elapsed().count();
        if (elapsed_ms > 0 && progress.processed_bytes > 0) {
            progress.speed_bps =
                static_cast<double>(progress.processed_bytes) * 1000.0 / static_cast<double>(elapsed_ms);
            auto remaining = progress.total_bytes - progress.processed_bytes;
            progress.eta = std::chrono::seconds(
                static_cast<long long>(static_cast<double>(remaining) / progress.speed_bps));
        }

        snapshot = progress;
        if (auto cb = callbacks_.find(id); cb != callbacks_.end()) {
            callbacks = cb->second;
        }
    }

    notify(callbacks, snapshot);
    return true;
}

void ProgressTracker::addCallback(const std::string& id, ProgressCallback callback) {
    if (!callback) {
        return;
    }
    std::lock_guard lock(mutex_);
    callbacks_[id].push_back(std::move(callback));
}

void ProgressTracker::complete(const std::string& id, bool success) {
    finish(id, success ? OperationStatus::Completed : OperationStatus::Failed);
}

void ProgressTracker::cancel(const std::string& id) {
    finish(id, OperationStatus::Cancelled);
}

bool ProgressTracker::isCancelled(const std::string& id) const {
    std::lock_guard lock(mutex_);
    auto it = operations_.find(id);
    return it != operations_.end() && it->second.status == OperationStatus::Cancelled;
}

std::optional<OperationProgress> ProgressTracker::get(const std::string& id) const {
    std::lock_guard lock(mutex_);
    auto it = operations_.find(id);
    if (it == operations_.end()) {
        return std::nullopt;
    }
    return it->second;
}

void ProgressTracker::remove(const std::string& id) {
    std::lock_guard lock(mutex_);
    operations_.erase(id);
    callbacks_.erase(id);
}

std::vector<std::string> ProgressTracker::activeOperations() const {
    std::lock_guard lock(mutex_);
    std::vector<std::string> ids;
    for (const auto& [id, progress] : operations_) {
        if (!isTerminal(progress.status)) {
            ids.push_back(id);
        }
    }
    return ids;
}

void ProgressTracker::finish(const std::string& id, OperationStatus status) {
    OperationProgress snapshot;
    std::vector<ProgressCallback> callbacks;
    {
        std::lock_guard lock(mutex_);
        auto it = operations_.find(id);
        if (it == operations_.end() || isTerminal(it->second.status)) {
            return;
        }
        it->second.status = status;
        if (status == OperationStatus::Completed) {
            it->second.eta = std::chrono::seconds(0);
        }
        snapshot = it->second;
        if (auto cb = callbacks_.find(id); cb != callbacks_.end()) {
            callbacks = std::move(cb->second);
            callbacks_.erase(cb);
        }
        retire(id);
    }

    LOG_DEBUG("Operation {} {}", id, to_string(status));
    notify(callbacks, snapshot);
}

void ProgressTracker::retire(const std::string& id) {
    finished_.push_back(id);
    while (finished_.size() > retained_finished_) {
        auto oldest = std::move(finished_.front());
        finished_.pop_front();
        // The id may have been reused by a newer, still running operation
        if (auto it = operations_.find(oldest);
            it != operations_.end() && isTerminal(it->second.status)) {
            operations_.erase(it);
        }
    }
}

void ProgressTracker::notify(const std::vector<ProgressCallback>& callbacks,
                             const OperationProgress& snapshot) {
    for (const auto& callback : callbacks) {
        try {
            callback(snapshot);
        } catch (const std::exception& e) {
            LOG_WARN("Progress callback for {} threw: {}", snapshot.operation_id, e.what());
        } catch (...) {
            LOG_WARN("Progress callback for {} threw a non-standard exception",
                     snapshot.operation_id);
        }
    }
}

}  // namespace laxy::progress
