#include <gtest/gtest.h>

#include <algorithm>
#include <atomic>
#include <chrono>
#include <future>
#include <memory>
#include <thread>
#include <vector>

#include "core/engine/engine.hpp"
#include "test_helpers.hpp"

using namespace laxy;
using laxy::test_helpers::makeContent;
using laxy::test_helpers::readAll;
using laxy::test_helpers::ScopedTempDir;
using laxy::test_helpers::setAge;
using laxy::test_helpers::writeFile;

namespace {

config::EngineSettings engineSettings(const ScopedTempDir& tmp) {
    auto settings = config::EngineSettings::defaults();
    settings.worker_threads = 2;
    settings.trash.use_system_trash = false;
    settings.trash.fallback_dir = tmp.join("trash");
    settings.transfer.chunk_size = 4096;
    return settings;
}

bool listed(const std::vector<fs::FileEntry>& entries, std::string_view name) {
    return std::ranges::any_of(entries, [name](const fs::FileEntry& e) { return e.name == name; });
}

class EngineTest : public ::testing::Test {
protected:
    ScopedTempDir tmp_;
    Engine engine_{engineSettings(tmp_)};
};

}  // namespace

TEST_F(EngineTest, SubmittedCopyCompletes) {
    writeFile(tmp_.join("src/a.txt"), "alpha");
    writeFile(tmp_.join("src/b.txt"), "beta");

    std::atomic<int> notifications{0};
    auto task = engine_.submitCopy({tmp_.join("src/a.txt"), tmp_.join("src/b.txt")},
                                   tmp_.join("dst"), {},
                                   [&notifications](const progress::OperationProgress&) {
                                       ++notifications;
                                   });
    EXPECT_TRUE(task.id().starts_with("copy_"));

    ASSERT_TRUE(task.waitFor(std::chrono::seconds(10)));
    auto result = task.get();
    ASSERT_TRUE(result.has_value());
    EXPECT_TRUE(result->success);
    EXPECT_EQ(result->message, "Copied 2 files");
    EXPECT_EQ(readAll(tmp_.join("dst/b.txt")), "beta");
    EXPECT_GT(notifications.load(), 0);

    auto progress = engine_.operationProgress(task.id());
    ASSERT_TRUE(progress.has_value());
    EXPECT_EQ(progress->status, OperationStatus::Completed);
}

TEST_F(EngineTest, CancelByIdStopsSubmittedCopy) {
    writeFile(tmp_.join("src/big.bin"), makeContent(4 * 1024 * 1024));

    std::atomic<bool> cancelled{false};
    auto task = engine_.submitCopy(
        {tmp_.join("src/big.bin")}, tmp_.join("dst"), {},
        [this, &cancelled](const progress::OperationProgress& p) {
            if (p.processed_bytes > 0 && !cancelled.exchange(true)) {
                engine_.cancel(p.operation_id);
            }
        });

    auto result = task.get();
    ASSERT_TRUE(result.has_value());
    EXPECT_TRUE(result->cancelled);
    EXPECT_FALSE(std::filesystem::exists(tmp_.join("dst/big.bin")));
    EXPECT_EQ(engine_.operationProgress(task.id())->status, OperationStatus::Cancelled);
    EXPECT_FALSE(engine_.cancel(task.id()));
}

TEST_F(EngineTest, CancelUnknownIdReturnsFalse) {
    EXPECT_FALSE(engine_.cancel("copy_does_not_exist"));
    EXPECT_FALSE(engine_.operationProgress("copy_does_not_exist").has_value());
}

TEST_F(EngineTest, ListingReflectsCompletedOperations) {
    writeFile(tmp_.join("src/a.txt"), "alpha");
    std::filesystem::create_directories(tmp_.join("dst"));

    auto before = engine_.listDirectory(tmp_.join("dst"));
    ASSERT_TRUE(before.has_value());
    EXPECT_TRUE(before->empty());

    std::vector<std::filesystem::path> sources{tmp_.join("src/a.txt")};
    auto copied = engine_.copy(sources, tmp_.join("dst"));
    ASSERT_TRUE(copied.has_value());

    auto after = engine_.listDirectory(tmp_.join("dst"));
    ASSERT_TRUE(after.has_value());
    EXPECT_TRUE(listed(*after, "a.txt"));

    auto renamed = engine_.rename(tmp_.join("dst/a.txt"), "b.txt");
    ASSERT_TRUE(renamed.has_value());
    EXPECT_TRUE(renamed->success);

    auto latest = engine_.listDirectory(tmp_.join("dst"));
    ASSERT_TRUE(latest.has_value());
    EXPECT_FALSE(listed(*latest, "a.txt"));
    EXPECT_TRUE(listed(*latest, "b.txt"));
}

TEST_F(EngineTest, DefaultResolverOverwritesOlderDestination) {
    writeFile(tmp_.join("dst/a.txt"), "old");
    setAge(tmp_.join("dst/a.txt"), std::chrono::hours(2));
    writeFile(tmp_.join("src/a.txt"), "new");

    std::vector<std::filesystem::path> sources{tmp_.join("src/a.txt")};
    auto copied = engine_.copy(sources, tmp_.join("dst"));

    ASSERT_TRUE(copied.has_value());
    EXPECT_TRUE(copied->success);
    EXPECT_EQ(readAll(tmp_.join("dst/a.txt")), "new");
}

TEST_F(EngineTest, SubmittedBatchUsesBatchId) {
    std::vector<std::filesystem::path> files;
    for (int i = 0; i < 5; ++i) {
        auto path = tmp_.join("src/f" + std::to_string(i) + ".txt");
        writeFile(path, "batch " + std::to_string(i));
        files.push_back(path);
    }
    auto batch = batch::batchCopy(files, tmp_.join("dst"));
    auto id = batch.id;

    auto task = engine_.submitBatch(std::move(batch));
    EXPECT_EQ(task.id(), id);

    auto result = task.get();
    ASSERT_TRUE(result.has_value());
    EXPECT_TRUE(result->success);
    EXPECT_EQ(result->items_completed, 5u);
    EXPECT_EQ(readAll(tmp_.join("dst/f4.txt")), "batch 4");
    EXPECT_FALSE(engine_.batchProgress(id).has_value());
}

TEST_F(EngineTest, SubmittedDeleteUsesConfiguredTrash) {
    writeFile(tmp_.join("work/old.log"), "log");

    auto task = engine_.submitDelete({tmp_.join("work/old.log")});
    auto result = task.get();

    ASSERT_TRUE(result.has_value());
    EXPECT_TRUE(result->success);
    EXPECT_FALSE(std::filesystem::exists(tmp_.join("work/old.log")));
    EXPECT_EQ(readAll(tmp_.join("trash/files/old.log")), "log");
}

TEST_F(EngineTest, CreateAndInspectEntries) {
    auto dir = engine_.createDirectory(tmp_.join("made"));
    ASSERT_TRUE(dir.has_value());
    EXPECT_TRUE(dir->success);

    auto file = engine_.createFile(tmp_.join("made/note.txt"), "hello");
    ASSERT_TRUE(file.has_value());
    EXPECT_TRUE(file->success);

    auto info = engine_.fileInfo(tmp_.join("made/note.txt"));
    ASSERT_TRUE(info.has_value());
    EXPECT_EQ(info->name, "note.txt");
    EXPECT_EQ(info->size, 5u);
    EXPECT_FALSE(info->is_directory);

    auto missing = engine_.fileInfo(tmp_.join("made/absent.txt"));
    ASSERT_FALSE(missing.has_value());
    EXPECT_EQ(missing.error(), ErrorKind::NotFound);
}

TEST_F(EngineTest, InvalidSubmissionReportsError) {
    auto task = engine_.submitCopy({}, tmp_.join("dst"));
    auto result = task.get();

    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code(), ErrorKind::InvalidArgument);
}

TEST(EngineShutdownTest, DestructionCancelsQueuedOperations) {
    ScopedTempDir tmp;
    writeFile(tmp.join("src/first.bin"), makeContent(2 * 1024 * 1024, 'x'));
    writeFile(tmp.join("src/second.bin"), makeContent(2 * 1024 * 1024, 'y'));

    auto settings = engineSettings(tmp);
    settings.worker_threads = 1;
    auto engine = std::make_unique<Engine>(settings);

    std::promise<void> started;
    std::atomic<bool> signalled{false};
    auto first = engine->submitCopy(
        {tmp.join("src/first.bin")}, tmp.join("dst"), {},
        [&started, &signalled](const progress::OperationProgress& p) {
            if (p.processed_bytes > 0 && !signalled.exchange(true)) {
                started.set_value();
                // Hold the only worker while the engine shuts down
                std::this_thread::sleep_for(std::chrono::milliseconds(100));
            }
        });
    auto second = engine->submitCopy({tmp.join("src/second.bin")}, tmp.join("dst"));

    started.get_future().wait();
    engine.reset();

    auto first_result = first.get();
    ASSERT_TRUE(first_result.has_value());
    EXPECT_TRUE(first_result->cancelled);

    auto second_result = second.get();
    ASSERT_TRUE(second_result.has_value());
    EXPECT_TRUE(second_result->cancelled);
    EXPECT_EQ(second_result->items_completed, 0u);
    EXPECT_FALSE(std::filesystem::exists(tmp.join("dst/second.bin")));
}
