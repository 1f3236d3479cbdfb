/// @file engine.cpp
/// @brief Engine implementation

#include "engine.hpp"

#include <algorithm>
#include <utility>

#include "../util/logger.hpp"

namespace laxy {

Engine::Engine(config::EngineSettings settings)
    : settings_(std::move(settings)),
      cache_(std::make_unique<cache::MetadataCache>(settings_.cache)),
      tracker_(std::make_unique<progress::ProgressTracker>()),
      resolver_(std::make_unique<fs::ConflictResolver>(settings_.conflict)),
      executor_(std::make_unique<fs::FileOperationExecutor>(*cache_, *tracker_, settings_)),
      batches_(std::make_unique<batch::BatchOperationManager>(*executor_, *resolver_, *tracker_,
                                                              settings_.batch)),
      archives_(std::make_unique<archive::ArchiveCodec>(*cache_, *tracker_, settings_.archive)),
      pool_(std::make_unique<ThreadPool>(ThreadPoolConfig{
          static_cast<size_t>(std::max(0, settings_.worker_threads)), "laxy-engine"})) {
    LOG_INFO("Engine started with {} workers", pool_->workerCount());
}

Engine::~Engine() {
    // Queued tasks start with their stop already requested
    pool_->requestStop();
    for (const auto& id : tracker_->activeOperations()) {
        tracker_->cancel(id);
    }
    for (const auto& id : batches_->activeBatches()) {
        batches_->cancel(id);
    }
    pool_.reset();
    LOG_INFO("Engine stopped");
}

void Engine::with_default_resolver(fs::CopyOptions& options) {
    if (!options.resolver && !options.overwrite_existing) {
        options.resolver = resolver_.get();
    }
}

OperationOutcome Engine::copy(std::span<const std::filesystem::path> sources,
                              const std::filesystem::path& dest_dir, fs::CopyOptions options,
                              const fs::OperationControl& control) {
    with_default_resolver(options);
    return executor_->copy(sources, dest_dir, options, control);
}

OperationOutcome Engine::move(std::span<const std::filesystem::path> sources,
                              const std::filesystem::path& dest_dir, fs::CopyOptions options,
                              const fs::OperationControl& control) {
    with_default_resolver(options);
    return executor_->move(sources, dest_dir, options, control);
}

OperationOutcome Engine::remove(std::span<const std::filesystem::path> paths,
                                const fs::DeleteOptions& options,
                                const fs::OperationControl& control) {
    return executor_->remove(paths, options, control);
}

OperationOutcome Engine::rename(const std::filesystem::path& path, std::string_view new_name) {
    return executor_->rename(path, new_name);
}

OperationOutcome Engine::createDirectory(const std::filesystem::path& path) {
    return executor_->createDirectory(path);
}

OperationOutcome Engine::createFile(const std::filesystem::path& path, std::string_view content) {
    return executor_->createFile(path, content);
}

OperationOutcome Engine::executeBatch(batch::BatchOperation batch,
                                      const batch::BatchControl& control) {
    return batches_->execute(std::move(batch), control);
}

OperationOutcome Engine::createArchive(std::span<const std::filesystem::path> files,
                                       const std::filesystem::path& archive_path,
                                       archive::ArchiveFormat format,
                                       std::optional<archive::CompressionLevel> level,
                                       const fs::OperationControl& control) {
    return archives_->create(files, archive_path, format, level, control);
}

OperationOutcome Engine::extractArchive(const std::filesystem::path& archive_path,
                                        const std::filesystem::path& dest_dir,
                                        const fs::OperationControl& control) {
    return archives_->extract(archive_path, dest_dir, control);
}

template <typename Work>
OperationTask Engine::submit(std::string id, progress::ProgressCallback observer, Work work) {
    std::stop_source stop;
    fs::OperationControl control;
    control.operation_id = id;
    control.stop_token = stop.get_token();
    control.observer = std::move(observer);

    LOG_DEBUG("Submitting {}", id);
    auto future = pool_->submitCancellable(
        [work = std::move(work), control = std::move(control),
         stop](std::stop_token engine_stop) mutable -> OperationOutcome {
            std::stop_callback forward(engine_stop, [&stop] { stop.request_stop(); });
            return work(control);
        });
    return OperationTask(std::move(id), std::move(future), std::move(stop));
}

OperationTask Engine::submitCopy(std::vector<std::filesystem::path> sources,
                                 std::filesystem::path dest_dir, fs::CopyOptions options,
                                 progress::ProgressCallback observer) {
    with_default_resolver(options);
    return submit(generateOperationId("copy"), std::move(observer),
                  [this, sources = std::move(sources), dest_dir = std::move(dest_dir),
                   options = std::move(options)](const fs::OperationControl& control) {
                      return executor_->copy(sources, dest_dir, options, control);
                  });
}

OperationTask Engine::submitMove(std::vector<std::filesystem::path> sources,
                                 std::filesystem::path dest_dir, fs::CopyOptions options,
                                 progress::ProgressCallback observer) {
    with_default_resolver(options);
    return submit(generateOperationId("move"), std::move(observer),
                  [this, sources = std::move(sources), dest_dir = std::move(dest_dir),
                   options = std::move(options)](const fs::OperationControl& control) {
                      return executor_->move(sources, dest_dir, options, control);
                  });
}

OperationTask Engine::submitDelete(std::vector<std::filesystem::path> paths,
                                   fs::DeleteOptions options,
                                   progress::ProgressCallback observer) {
    return submit(generateOperationId("delete"), std::move(observer),
                  [this, paths = std::move(paths), options](const fs::OperationControl& control) {
                      return executor_->remove(paths, options, control);
                  });
}

OperationTask Engine::submitBatch(batch::BatchOperation batch,
                                  progress::ProgressCallback observer,
                                  fs::DecisionCallback decide) {
    if (batch.id.empty()) {
        batch.id = generateOperationId("batch");
    }
    auto id = batch.id;
    return submit(std::move(id), std::move(observer),
                  [this, batch = std::move(batch),
                   decide = std::move(decide)](const fs::OperationControl& control) mutable {
                      batch::BatchControl batch_control;
                      batch_control.stop_token = control.stop_token;
                      batch_control.observer = control.observer;
                      batch_control.decide = std::move(decide);
                      return batches_->execute(std::move(batch), batch_control);
                  });
}

OperationTask Engine::submitCreateArchive(std::vector<std::filesystem::path> files,
                                          std::filesystem::path archive_path,
                                          archive::ArchiveFormat format,
                                          std::optional<archive::CompressionLevel> level,
                                          progress::ProgressCallback observer) {
    return submit(generateOperationId("archive_create"), std::move(observer),
                  [this, files = std::move(files), archive_path = std::move(archive_path), format,
                   level](const fs::OperationControl& control) {
                      return archives_->create(files, archive_path, format, level, control);
                  });
}

OperationTask Engine::submitExtractArchive(std::filesystem::path archive_path,
                                           std::filesystem::path dest_dir,
                                           progress::ProgressCallback observer) {
    return submit(generateOperationId("archive_extract"), std::move(observer),
                  [this, archive_path = std::move(archive_path),
                   dest_dir = std::move(dest_dir)](const fs::OperationControl& control) {
                      return archives_->extract(archive_path, dest_dir, control);
                  });
}

bool Engine::cancel(const std::string& operation_id) {
    if (batches_->cancel(operation_id)) {
        return true;
    }
    auto snapshot = tracker_->get(operation_id);
    if (!snapshot || isTerminal(snapshot->status)) {
        return false;
    }
    tracker_->cancel(operation_id);
    return true;
}

std::expected<std::vector<fs::FileEntry>, ErrorKind>
Engine::listDirectory(const std::filesystem::path& path, const fs::ListingOptions& options) {
    return cache_->listDirectory(path, options);
}

std::expected<fs::FileEntry, ErrorKind> Engine::fileInfo(const std::filesystem::path& path) {
    return cache_->getOrLoad(path);
}

std::optional<progress::OperationProgress>
Engine::operationProgress(const std::string& operation_id) const {
    return tracker_->get(operation_id);
}

std::optional<batch::BatchProgress> Engine::batchProgress(const std::string& batch_id) const {
    return batches_->progress(batch_id);
}

}  // namespace laxy
