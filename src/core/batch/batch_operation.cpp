/// @file batch_operation.cpp
/// @brief Batch builders

#include "batch_operation.hpp"

namespace laxy::batch {

namespace {

[[nodiscard]] std::filesystem::path item_name(const std::filesystem::path& path) {
    auto name = path.filename();
    return name.empty() ? path.parent_path().filename() : name;
}

[[nodiscard]] BatchOperation into_directory(OperationType type, std::string_view prefix,
                                            std::span<const std::filesystem::path> sources,
                                            const std::filesystem::path& dest_dir,
                                            config::BatchStrategy strategy) {
    BatchOperation batch;
    batch.id = generateOperationId(prefix);
    batch.type = type;
    batch.strategy = strategy;
    batch.items.reserve(sources.size());
    for (const auto& source : sources) {
        batch.items.push_back({source, dest_dir / item_name(source)});
    }
    return batch;
}

}  // namespace

BatchOperation batchCopy(std::span<const std::filesystem::path> sources,
                         const std::filesystem::path& dest_dir, config::BatchStrategy strategy) {
    return into_directory(OperationType::Copy, "batch_copy", sources, dest_dir, strategy);
}

BatchOperation batchMove(std::span<const std::filesystem::path> sources,
                         const std::filesystem::path& dest_dir, config::BatchStrategy strategy) {
    return into_directory(OperationType::Move, "batch_move", sources, dest_dir, strategy);
}

BatchOperation batchDelete(std::span<const std::filesystem::path> paths, bool permanent,
                           config::BatchStrategy strategy) {
    BatchOperation batch;
    batch.id = generateOperationId("batch_delete");
    batch.type = OperationType::Delete;
    batch.strategy = strategy;
    batch.delete_options.permanent = permanent;
    batch.items.reserve(paths.size());
    for (const auto& path : paths) {
        batch.items.push_back({path, path});
    }
    return batch;
}

}  // namespace laxy::batch
