#include <gtest/gtest.h>

#include <stop_token>
#include <string>
#include <vector>

#include "core/batch/batch_manager.hpp"
#include "core/cache/metadata_cache.hpp"
#include "test_helpers.hpp"

using namespace laxy;
using laxy::batch::BatchControl;
using laxy::batch::BatchOperation;
using laxy::batch::BatchOperationManager;
using laxy::config::BatchStrategy;
using laxy::test_helpers::readAll;
using laxy::test_helpers::ScopedTempDir;
using laxy::test_helpers::setAge;
using laxy::test_helpers::writeFile;

namespace {

class BatchManagerTest : public ::testing::Test {
protected:
    BatchManagerTest()
        : executor_(cache_, tracker_, settings()), manager_(executor_, resolver_, tracker_) {}

    static config::EngineSettings settings() {
        config::EngineSettings s;
        s.trash.use_system_trash = false;
        return s;
    }

    std::vector<std::filesystem::path> makeFiles(size_t count, const std::string& dir = "src") {
        std::vector<std::filesystem::path> files;
        for (size_t i = 0; i < count; ++i) {
            auto path = tmp_.join(dir + "/file" + std::to_string(i) + ".txt");
            writeFile(path, "content " + std::to_string(i));
            files.push_back(path);
        }
        return files;
    }

    ScopedTempDir tmp_;
    cache::MetadataCache cache_;
    progress::ProgressTracker tracker_;
    fs::FileOperationExecutor executor_;
    fs::ConflictResolver resolver_;
    BatchOperationManager manager_;
};

}  // namespace

TEST_F(BatchManagerTest, BuildersMapSourcesIntoDestination) {
    std::vector<std::filesystem::path> sources{"/a/one.txt", "/b/dir/"};
    auto copy = batch::batchCopy(sources, "/dest");

    EXPECT_TRUE(copy.id.starts_with("batch_copy_"));
    EXPECT_EQ(copy.type, OperationType::Copy);
    ASSERT_EQ(copy.items.size(), 2u);
    EXPECT_EQ(copy.items[0].destination, std::filesystem::path("/dest/one.txt"));
    EXPECT_EQ(copy.items[1].destination, std::filesystem::path("/dest/dir"));

    auto remove = batch::batchDelete(sources, true);
    EXPECT_TRUE(remove.delete_options.permanent);
    EXPECT_EQ(remove.items[0].source, remove.items[0].destination);
}

TEST_F(BatchManagerTest, AdaptiveStrategyFollowsItemCount) {
    BatchOperation batch;
    batch.type = OperationType::Copy;

    batch.items.resize(5);
    EXPECT_EQ(manager_.chooseStrategy(batch), BatchStrategy::Sequential);

    batch.items.resize(50);
    EXPECT_EQ(manager_.chooseStrategy(batch), BatchStrategy::Adaptive);

    batch.items.resize(150);
    EXPECT_EQ(manager_.chooseStrategy(batch), BatchStrategy::Parallel);

    batch.type = OperationType::Delete;
    EXPECT_EQ(manager_.chooseStrategy(batch), BatchStrategy::Adaptive);

    batch.strategy = BatchStrategy::Sequential;
    EXPECT_EQ(manager_.chooseStrategy(batch), BatchStrategy::Sequential);
}

TEST_F(BatchManagerTest, SequentialCopyCompletesAllItems) {
    auto files = makeFiles(3);
    auto batch = batch::batchCopy(files, tmp_.join("dst"), BatchStrategy::Sequential);
    auto id = batch.id;

    auto result = manager_.execute(std::move(batch));

    ASSERT_TRUE(result.has_value());
    EXPECT_TRUE(result->success);
    EXPECT_EQ(result->message, "Batch operation completed: 3 succeeded, 0 failed, 0 skipped");
    EXPECT_EQ(result->items_completed, 3u);
    EXPECT_EQ(result->affected_files.size(), 3u);
    EXPECT_DOUBLE_EQ(result->progress, 100.0);
    EXPECT_EQ(readAll(tmp_.join("dst/file2.txt")), "content 2");

    auto record = tracker_.get(id);
    ASSERT_TRUE(record.has_value());
    EXPECT_EQ(record->status, OperationStatus::Completed);
    EXPECT_EQ(record->processed_files, 3u);
}

TEST_F(BatchManagerTest, ParallelCopyCompletesAllItems) {
    auto files = makeFiles(24);
    auto batch = batch::batchCopy(files, tmp_.join("dst"), BatchStrategy::Parallel);
    batch.max_parallel = 4;

    auto result = manager_.execute(std::move(batch));

    ASSERT_TRUE(result.has_value());
    EXPECT_TRUE(result->success);
    EXPECT_EQ(result->items_completed, 24u);
    EXPECT_EQ(test_helpers::countEntries(tmp_.join("dst")), 24u);
}

TEST_F(BatchManagerTest, AdaptiveMiddleBandCompletesAllItems) {
    auto files = makeFiles(30);
    auto result = manager_.execute(batch::batchCopy(files, tmp_.join("dst")));

    ASSERT_TRUE(result.has_value());
    EXPECT_TRUE(result->success);
    EXPECT_EQ(result->items_completed, 30u);
}

TEST_F(BatchManagerTest, LargeAdaptiveBatchRunsInParallel) {
    auto files = makeFiles(150);
    auto batch = batch::batchCopy(files, tmp_.join("dst"));
    ASSERT_EQ(manager_.chooseStrategy(batch), BatchStrategy::Parallel);

    auto result = manager_.execute(std::move(batch));

    ASSERT_TRUE(result.has_value());
    EXPECT_TRUE(result->success);
    EXPECT_EQ(result->message, "Batch operation completed: 150 succeeded, 0 failed, 0 skipped");
    EXPECT_EQ(result->affected_files.size(), 150u);
    EXPECT_EQ(test_helpers::countEntries(tmp_.join("dst")), 150u);
    EXPECT_EQ(readAll(tmp_.join("dst/file149.txt")), "content 149");
}

TEST_F(BatchManagerTest, MoveBatchRemovesSources) {
    auto files = makeFiles(4);
    auto result = manager_.execute(batch::batchMove(files, tmp_.join("dst")));

    ASSERT_TRUE(result.has_value());
    EXPECT_TRUE(result->success);
    for (const auto& file : files) {
        EXPECT_FALSE(std::filesystem::exists(file));
    }
    EXPECT_EQ(test_helpers::countEntries(tmp_.join("dst")), 4u);
}

TEST_F(BatchManagerTest, DeleteBatchPermanent) {
    auto files = makeFiles(3);
    auto result = manager_.execute(batch::batchDelete(files, true));

    ASSERT_TRUE(result.has_value());
    EXPECT_TRUE(result->success);
    EXPECT_EQ(result->items_completed, 3u);
    EXPECT_EQ(test_helpers::countEntries(tmp_.join("src")), 0u);
}

TEST_F(BatchManagerTest, FailedItemDoesNotStopOthers) {
    auto files = makeFiles(2);
    files.insert(files.begin() + 1, tmp_.join("src/missing.txt"));

    auto result = manager_.execute(batch::batchCopy(files, tmp_.join("dst"), BatchStrategy::Sequential));

    ASSERT_TRUE(result.has_value());
    EXPECT_FALSE(result->success);
    EXPECT_EQ(result->message, "Batch operation completed: 2 succeeded, 1 failed, 0 skipped");
    ASSERT_FALSE(result->errors.empty());
    EXPECT_NE(result->errors.front().find("missing.txt"), std::string::npos);
}

TEST_F(BatchManagerTest, NewerSourceOverwritesDestination) {
    writeFile(tmp_.join("dst/file0.txt"), "stale");
    setAge(tmp_.join("dst/file0.txt"), std::chrono::hours(1));
    auto files = makeFiles(1);

    auto result = manager_.execute(batch::batchCopy(files, tmp_.join("dst")));

    ASSERT_TRUE(result.has_value());
    EXPECT_TRUE(result->success);
    EXPECT_EQ(readAll(tmp_.join("dst/file0.txt")), "content 0");
}

TEST_F(BatchManagerTest, PinnedSkipLeavesDestination) {
    writeFile(tmp_.join("dst/file0.txt"), "keep");
    setAge(tmp_.join("dst/file0.txt"), std::chrono::hours(1));
    auto files = makeFiles(1);

    auto batch = batch::batchCopy(files, tmp_.join("dst"));
    batch.conflict_actions[{files[0], tmp_.join("dst") / "file0.txt"}] = fs::ConflictAction::Skip;

    auto result = manager_.execute(std::move(batch));

    ASSERT_TRUE(result.has_value());
    EXPECT_TRUE(result->success);
    EXPECT_EQ(result->message, "Batch operation completed: 0 succeeded, 0 failed, 1 skipped");
    EXPECT_EQ(readAll(tmp_.join("dst/file0.txt")), "keep");
}

TEST_F(BatchManagerTest, RenameRuleKeepsBothFiles) {
    writeFile(tmp_.join("dst/file0.txt"), "much longer destination");
    auto files = makeFiles(1);
    setAge(files[0], std::chrono::hours(1));

    config::ConflictSettings rules;
    rules.backup_on_overwrite = false;
    resolver_.setRules(rules);

    auto result = manager_.execute(batch::batchCopy(files, tmp_.join("dst")));

    ASSERT_TRUE(result.has_value());
    EXPECT_TRUE(result->success);
    EXPECT_EQ(readAll(tmp_.join("dst/file0.txt")), "much longer destination");
    EXPECT_EQ(readAll(tmp_.join("dst/file0_1.txt")), "content 0");
}

TEST_F(BatchManagerTest, ThrowingDecisionSkipsItemAndReleasesBatch) {
    writeFile(tmp_.join("dst/file0.txt"), "keep");
    auto files = makeFiles(2);
    resolver_.registerAction(files[0], tmp_.join("dst") / "file0.txt", fs::ConflictAction::Ask);

    auto batch = batch::batchCopy(files, tmp_.join("dst"), BatchStrategy::Parallel);
    auto id = batch.id;
    BatchControl control;
    control.decide = [](const fs::ConflictInfo&) -> std::optional<fs::ConflictAction> {
        throw 42;
    };

    auto result = manager_.execute(std::move(batch), control);

    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(result->message, "Batch operation completed: 1 succeeded, 0 failed, 1 skipped");
    EXPECT_EQ(readAll(tmp_.join("dst/file0.txt")), "keep");
    EXPECT_EQ(readAll(tmp_.join("dst/file1.txt")), "content 1");
    EXPECT_TRUE(manager_.activeBatches().empty());
    EXPECT_FALSE(manager_.progress(id).has_value());
}

TEST_F(BatchManagerTest, CancelledBeforeStartSkipsEverything) {
    auto files = makeFiles(4);
    std::stop_source stop;
    stop.request_stop();
    BatchControl control;
    control.stop_token = stop.get_token();

    auto result =
        manager_.execute(batch::batchCopy(files, tmp_.join("dst"), BatchStrategy::Sequential), control);

    ASSERT_TRUE(result.has_value());
    EXPECT_TRUE(result->cancelled);
    EXPECT_FALSE(result->success);
    EXPECT_EQ(result->message, "Batch operation cancelled: 0 succeeded, 0 failed, 4 skipped");
    EXPECT_FALSE(std::filesystem::exists(tmp_.join("dst/file0.txt")));
}

TEST_F(BatchManagerTest, ObserverCancelStopsRemainingItems) {
    auto files = makeFiles(6);
    auto batch = batch::batchCopy(files, tmp_.join("dst"), BatchStrategy::Sequential);
    auto id = batch.id;

    BatchControl control;
    control.observer = [this, id](const progress::OperationProgress& p) {
        if (p.processed_files == 2) {
            manager_.cancel(id);
        }
    };

    auto result = manager_.execute(std::move(batch), control);

    ASSERT_TRUE(result.has_value());
    EXPECT_TRUE(result->cancelled);
    EXPECT_EQ(result->items_completed, 2u);
    EXPECT_EQ(result->message, "Batch operation cancelled: 2 succeeded, 0 failed, 4 skipped");
    EXPECT_FALSE(manager_.progress(id).has_value());
}

TEST_F(BatchManagerTest, MalformedBatchesAreRejected) {
    BatchOperation empty;
    auto no_items = manager_.execute(empty);
    ASSERT_FALSE(no_items.has_value());
    EXPECT_EQ(no_items.error().code(), ErrorKind::InvalidArgument);

    BatchOperation rename;
    rename.type = OperationType::Rename;
    rename.items.push_back({tmp_.join("a"), tmp_.join("b")});
    auto unsupported = manager_.execute(rename);
    ASSERT_FALSE(unsupported.has_value());
    EXPECT_EQ(unsupported.error().code(), ErrorKind::InvalidArgument);
}

TEST_F(BatchManagerTest, CancelUnknownBatchReturnsFalse) {
    EXPECT_FALSE(manager_.cancel("no-such-batch"));
    EXPECT_TRUE(manager_.activeBatches().empty());
}
