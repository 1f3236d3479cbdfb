/// @file batch_manager.cpp
/// @brief Batch operation manager implementation

#include "batch_manager.hpp"

#include <algorithm>
#include <chrono>
#include <future>

#include <fmt/format.h>

#include "../util/logger.hpp"
#include "../util/string_utils.hpp"
#include "../util/thread_pool.hpp"

namespace laxy::batch {

namespace {

enum class ItemOutcome { Completed, Failed, Skipped };

[[nodiscard]] bool is_batchable(OperationType type) noexcept {
    return type == OperationType::Copy || type == OperationType::Move ||
           type == OperationType::Delete;
}

}  // namespace

struct BatchOperationManager::ActiveBatch {
    BatchOperation batch;
    fs::DecisionCallback decide;
    std::stop_source stop;

    std::mutex mutex;
    BatchProgress progress;
    std::vector<std::filesystem::path> affected;
    std::vector<std::string> errors;
    uint64_t bytes = 0;

    void finishItem(ItemOutcome outcome) {
        switch (outcome) {
        case ItemOutcome::Completed:
            ++progress.completed_items;
            break;
        case ItemOutcome::Failed:
            ++progress.failed_items;
            break;
        case ItemOutcome::Skipped:
            ++progress.skipped_items;
            break;
        }
    }
};

BatchOperationManager::BatchOperationManager(fs::FileOperationExecutor& executor,
                                             fs::ConflictResolver& resolver,
                                             progress::ProgressTracker& tracker,
                                             config::BatchSettings settings)
    : executor_(executor), resolver_(resolver), tracker_(tracker), settings_(settings) {}

BatchOperationManager::~BatchOperationManager() {
    std::lock_guard lock(mutex_);
    for (auto& [id, active] : active_) {
        active->stop.request_stop();
    }
}

config::BatchStrategy BatchOperationManager::chooseStrategy(const BatchOperation& batch) const {
    if (batch.strategy != config::BatchStrategy::Adaptive) {
        return batch.strategy;
    }

    auto count = batch.items.size();
    if (count < settings_.sequential_below) {
        return config::BatchStrategy::Sequential;
    }
    if (count > settings_.parallel_threshold &&
        (batch.type == OperationType::Copy || batch.type == OperationType::Move)) {
        return config::BatchStrategy::Parallel;
    }
    return config::BatchStrategy::Adaptive;
}

OperationOutcome BatchOperationManager::execute(BatchOperation batch, const BatchControl& control) {
    if (batch.items.empty()) {
        return logAndReturnInfo(ErrorKind::InvalidArgument, "Batch has no items");
    }
    if (!is_batchable(batch.type)) {
        return logAndReturnInfo(ErrorKind::InvalidArgument,
                                fmt::format("Unsupported batch operation: {}", to_string(batch.type)));
    }
    if (batch.id.empty()) {
        batch.id = generateOperationId("batch");
    }

    auto active = std::make_shared<ActiveBatch>();
    active->batch = std::move(batch);
    active->decide = control.decide;

    const auto& id = active->batch.id;
    auto total = active->batch.items.size();
    auto strategy = chooseStrategy(active->batch);

    active->progress.id = id;
    active->progress.type = active->batch.type;
    active->progress.state = BatchState::Running;
    active->progress.strategy = strategy;
    active->progress.total_items = total;

    {
        std::lock_guard lock(mutex_);
        if (active_.contains(id)) {
            return logAndReturnInfo(ErrorKind::InvalidArgument,
                                    fmt::format("Batch {} is already running", id));
        }
        active_.emplace(id, active);
    }

    std::stop_callback forward_stop(control.stop_token,
                                    [&active] { active->stop.request_stop(); });

    tracker_.create(id, OperationType::Batch, total, 0);
    if (control.observer) {
        tracker_.addCallback(id, control.observer);
    }

    int max_parallel = active->batch.max_parallel > 0 ? active->batch.max_parallel
                                                      : settings_.max_parallel;
    auto workers = static_cast<size_t>(std::max(1, max_parallel));

    LOG_INFO("Batch {} ({}): {} items, strategy {}", id, to_string(active->batch.type), total,
             to_string(strategy));

    auto start = std::chrono::steady_clock::now();
    switch (strategy) {
    case config::BatchStrategy::Sequential:
        run_sequential(*active, 0, total);
        break;

    case config::BatchStrategy::Parallel:
        run_parallel(*active, 0, total, workers);
        break;

    case config::BatchStrategy::Adaptive: {
        auto probe = std::min(settings_.probe_size, total);
        auto probe_start = std::chrono::steady_clock::now();
        run_parallel(*active, 0, probe, static_cast<size_t>(std::max(1, settings_.probe_parallel)));
        auto probe_time = std::chrono::steady_clock::now() - probe_start;

        if (probe < total) {
            auto average = probe_time / std::max<size_t>(1, probe);
            bool fast = average < settings_.fast_item_threshold;
            LOG_DEBUG("Batch {}: probe averaged {} per item, remainder {}", id,
                      formatDuration(std::chrono::duration_cast<std::chrono::milliseconds>(average)),
                      fast ? "parallel" : "sequential");
            if (fast) {
                run_parallel(*active, probe, total, workers);
            } else {
                run_sequential(*active, probe, total);
            }
        }
        break;
    }
    }

    {
        std::lock_guard lock(mutex_);
        active_.erase(id);
    }

    OperationResult result;
    std::lock_guard lock(active->mutex);
    auto& progress = active->progress;
    bool cancelled = active->stop.stop_requested() || tracker_.isCancelled(id);

    result.duration = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start);
    result.affected_files = std::move(active->affected);
    result.errors = std::move(active->errors);
    result.bytes_processed = active->bytes;
    result.items_completed = progress.completed_items;
    result.cancelled = cancelled;
    result.success = progress.failed_items == 0 && !cancelled;
    result.message = fmt::format("Batch operation {}: {} succeeded, {} failed, {} skipped",
                                 cancelled ? "cancelled" : "completed", progress.completed_items,
                                 progress.failed_items, progress.skipped_items);

    if (cancelled) {
        progress.state = BatchState::Cancelled;
        tracker_.cancel(id);
    } else if (progress.failed_items > 0) {
        progress.state = BatchState::Failed;
        tracker_.complete(id, false);
    } else {
        progress.state = BatchState::Completed;
        tracker_.complete(id, true);
    }
    result.progress = total > 0 ? 100.0 * static_cast<double>(progress.processedItems()) /
                                      static_cast<double>(total)
                                : 100.0;

    LOG_INFO("Batch {}: {}", id, result.message);
    return result;
}

bool BatchOperationManager::cancel(const std::string& batch_id) {
    std::shared_ptr<ActiveBatch> active;
    {
        std::lock_guard lock(mutex_);
        auto it = active_.find(batch_id);
        if (it == active_.end()) {
            return false;
        }
        active = it->second;
    }
    LOG_INFO("Cancelling batch {}", batch_id);
    active->stop.request_stop();
    return true;
}

std::optional<BatchProgress> BatchOperationManager::progress(const std::string& batch_id) const {
    std::shared_ptr<ActiveBatch> active;
    {
        std::lock_guard lock(mutex_);
        auto it = active_.find(batch_id);
        if (it == active_.end()) {
            return std::nullopt;
        }
        active = it->second;
    }
    std::lock_guard lock(active->mutex);
    return active->progress;
}

std::vector<std::string> BatchOperationManager::activeBatches() const {
    std::lock_guard lock(mutex_);
    std::vector<std::string> ids;
    ids.reserve(active_.size());
    for (const auto& [id, active] : active_) {
        ids.push_back(id);
    }
    return ids;
}

void BatchOperationManager::run_sequential(ActiveBatch& active, size_t begin, size_t end) {
    for (size_t i = begin; i < end; ++i) {
        process_item(active, i);
    }
}

void BatchOperationManager::run_parallel(ActiveBatch& active, size_t begin, size_t end,
                                         size_t workers) {
    if (begin >= end) {
        return;
    }

    ThreadPool pool(ThreadPoolConfig{std::min(workers, end - begin), "laxy-batch"});
    std::vector<std::future<void>> futures;
    futures.reserve(end - begin);
    for (size_t i = begin; i < end; ++i) {
        futures.push_back(pool.submit([this, &active, i] { process_item(active, i); }));
    }
    for (auto& future : futures) {
        future.get();
    }
}

void BatchOperationManager::process_item(ActiveBatch& active, size_t index) {
    const auto& item = active.batch.items[index];

    if (tracker_.isCancelled(active.batch.id)) {
        active.stop.request_stop();
    }
    if (active.stop.stop_requested()) {
        std::lock_guard lock(active.mutex);
        active.finishItem(ItemOutcome::Skipped);
        return;
    }

    try {
        process_item_unchecked(active, index);
    } catch (const std::exception& e) {
        auto line = formatItemError(item.source, ErrorKind::IoFailure, e.what());
        LOG_ERROR("Batch {}: {}", active.batch.id, line);
        std::lock_guard lock(active.mutex);
        active.finishItem(ItemOutcome::Failed);
        active.errors.push_back(std::move(line));
    } catch (...) {
        auto line = formatItemError(item.source, ErrorKind::IoFailure, "non-standard exception");
        LOG_ERROR("Batch {}: {}", active.batch.id, line);
        std::lock_guard lock(active.mutex);
        active.finishItem(ItemOutcome::Failed);
        active.errors.push_back(std::move(line));
    }
}

void BatchOperationManager::process_item_unchecked(ActiveBatch& active, size_t index) {
    const auto& batch = active.batch;
    const auto& item = batch.items[index];
    auto destination = item.destination;
    auto current = pathToUtf8(item.source.filename());

    auto finish = [&](ItemOutcome outcome, std::optional<std::string> error) {
        {
            std::lock_guard lock(active.mutex);
            active.finishItem(outcome);
            if (error) {
                active.errors.push_back(*error);
            }
        }
        tracker_.update(batch.id, {1, 0, current, error});
    };

    if (batch.type != OperationType::Delete) {
        auto conflict = fs::detectConflict(item.source, destination);
        bool unchanged = conflict && batch.type == OperationType::Copy &&
                         conflict->kind == fs::ConflictKind::Exists &&
                         executor_.verifier().identical(item.source, destination);
        if (conflict && !unchanged) {
            {
                std::lock_guard lock(active.mutex);
                active.progress.conflicts.push_back(*conflict);
            }

            auto pinned = batch.conflict_actions.find({item.source, destination});
            auto action = pinned != batch.conflict_actions.end()
                              ? pinned->second
                              : resolver_.resolve(*conflict, active.decide);

            auto applied = resolver_.applyAction(*conflict, action);
            if (!applied) {
                finish(ItemOutcome::Failed, formatItemError(destination, applied.error()));
                return;
            }
            if (!*applied) {
                LOG_INFO("Batch {}: skipped {} ({})", batch.id, pathToUtf8(item.source),
                         to_string(action));
                finish(ItemOutcome::Skipped, std::nullopt);
                return;
            }
            destination = **applied;
        }
    }

    fs::OperationControl control;
    control.operation_id = fmt::format("{}_{}", batch.id, index);
    control.stop_token = active.stop.get_token();

    fs::CopyOptions options;
    options.overwrite_existing = true;

    auto outcome = [&]() -> OperationOutcome {
        switch (batch.type) {
        case OperationType::Copy:
            return executor_.copyTo(item.source, destination, options, control);
        case OperationType::Move:
            return executor_.moveTo(item.source, destination, options, control);
        default:
            return executor_.remove(std::span(&item.source, 1), batch.delete_options, control);
        }
    }();
    tracker_.remove(control.operation_id);

    if (!outcome) {
        finish(ItemOutcome::Failed, formatItemError(item.source, outcome.error().code(),
                                                    outcome.error().message()));
        return;
    }
    if (outcome->cancelled) {
        finish(ItemOutcome::Skipped, std::nullopt);
        return;
    }

    {
        std::lock_guard lock(active.mutex);
        active.bytes += outcome->bytes_processed;
        if (outcome->success) {
            active.affected.insert(active.affected.end(), outcome->affected_files.begin(),
                                   outcome->affected_files.end());
        } else {
            active.errors.insert(active.errors.end(), outcome->errors.begin(),
                                 outcome->errors.end());
        }
    }
    finish(outcome->success ? ItemOutcome::Completed : ItemOutcome::Failed, std::nullopt);
}

}  // namespace laxy::batch
