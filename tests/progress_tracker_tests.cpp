#include <gtest/gtest.h>

#include <stdexcept>
#include <string>
#include <vector>

#include "core/progress/progress_tracker.hpp"

using namespace laxy;
using laxy::progress::OperationProgress;
using laxy::progress::ProgressTracker;

TEST(ProgressTracker, CreateStartsPending) {
    ProgressTracker tracker;
    auto created = tracker.create("op", OperationType::Copy, 3, 300);

    EXPECT_EQ(created.status, OperationStatus::Pending);
    auto snapshot = tracker.get("op");
    ASSERT_TRUE(snapshot.has_value());
    EXPECT_EQ(snapshot->total_files, 3u);
    EXPECT_EQ(snapshot->total_bytes, 300u);
    EXPECT_EQ(snapshot->percentage(), 0.0);
}

TEST(ProgressTracker, UpdateClampsToTotals) {
    ProgressTracker tracker;
    tracker.create("op", OperationType::Copy, 2, 100);

    ASSERT_TRUE(tracker.update("op", {5, 500, std::string("big.bin"), std::nullopt}));

    auto snapshot = tracker.get("op");
    ASSERT_TRUE(snapshot.has_value());
    EXPECT_EQ(snapshot->processed_files, 2u);
    EXPECT_EQ(snapshot->processed_bytes, 100u);
    EXPECT_EQ(snapshot->current_file, "big.bin");
    EXPECT_EQ(snapshot->status, OperationStatus::InProgress);
    EXPECT_DOUBLE_EQ(snapshot->percentage(), 100.0);
}

TEST(ProgressTracker, PercentageFallsBackToFiles) {
    ProgressTracker tracker;
    tracker.create("op", OperationType::Delete, 4, 0);
    ASSERT_TRUE(tracker.update("op", {1, 0, std::nullopt, std::nullopt}));

    EXPECT_DOUBLE_EQ(tracker.get("op")->percentage(), 25.0);
}

TEST(ProgressTracker, ErrorsAccumulate) {
    ProgressTracker tracker;
    tracker.create("op", OperationType::Copy, 2, 0);
    ASSERT_TRUE(tracker.update("op", {0, 0, std::nullopt, std::string("a: Not found")}));
    ASSERT_TRUE(tracker.update("op", {0, 0, std::nullopt, std::string("b: Not found")}));

    auto snapshot = tracker.get("op");
    ASSERT_EQ(snapshot->errors.size(), 2u);
    EXPECT_EQ(snapshot->errors[1], "b: Not found");
}

TEST(ProgressTracker, TerminalOperationsIgnoreUpdates) {
    ProgressTracker tracker;
    tracker.create("op", OperationType::Copy, 2, 0);
    tracker.complete("op", true);

    EXPECT_FALSE(tracker.update("op", {1, 0, std::nullopt, std::nullopt}));
    tracker.cancel("op");

    auto snapshot = tracker.get("op");
    EXPECT_EQ(snapshot->status, OperationStatus::Completed);
    EXPECT_EQ(snapshot->processed_files, 0u);
    EXPECT_FALSE(tracker.isCancelled("op"));
}

TEST(ProgressTracker, UnknownIdIsRejected) {
    ProgressTracker tracker;
    EXPECT_FALSE(tracker.update("missing", {1, 1, std::nullopt, std::nullopt}));
    EXPECT_FALSE(tracker.get("missing").has_value());
    EXPECT_FALSE(tracker.isCancelled("missing"));
}

TEST(ProgressTracker, CancelMarksOperation) {
    ProgressTracker tracker;
    tracker.create("op", OperationType::Move, 1, 0);
    tracker.cancel("op");

    EXPECT_TRUE(tracker.isCancelled("op"));
    EXPECT_EQ(tracker.get("op")->status, OperationStatus::Cancelled);
}

TEST(ProgressTracker, CallbacksSeeEverySnapshot) {
    ProgressTracker tracker;
    tracker.create("op", OperationType::Copy, 2, 0);

    std::vector<OperationStatus> seen;
    tracker.addCallback("op", [&seen](const OperationProgress& p) { seen.push_back(p.status); });

    tracker.update("op", {1, 0, std::nullopt, std::nullopt});
    tracker.update("op", {1, 0, std::nullopt, std::nullopt});
    tracker.complete("op", false);

    ASSERT_EQ(seen.size(), 3u);
    EXPECT_EQ(seen[0], OperationStatus::InProgress);
    EXPECT_EQ(seen[2], OperationStatus::Failed);
}

TEST(ProgressTracker, ThrowingCallbackDoesNotStopOthers) {
    ProgressTracker tracker;
    tracker.create("op", OperationType::Copy, 1, 0);

    int calls = 0;
    tracker.addCallback("op", [](const OperationProgress&) {
        throw std::runtime_error("observer failed");
    });
    tracker.addCallback("op", [&calls](const OperationProgress&) { ++calls; });

    EXPECT_TRUE(tracker.update("op", {1, 0, std::nullopt, std::nullopt}));
    EXPECT_EQ(calls, 1);
}

TEST(ProgressTracker, NonStandardThrowStillFinishesOperation) {
    ProgressTracker tracker;
    tracker.create("op", OperationType::Copy, 1, 0);

    int calls = 0;
    tracker.addCallback("op", [](const OperationProgress&) { throw 42; });
    tracker.addCallback("op", [&calls](const OperationProgress&) { ++calls; });

    EXPECT_TRUE(tracker.update("op", {1, 0, std::nullopt, std::nullopt}));
    tracker.complete("op", true);

    EXPECT_EQ(calls, 2);
    EXPECT_EQ(tracker.get("op")->status, OperationStatus::Completed);
}

TEST(ProgressTracker, FinishedRecordsAreBounded) {
    ProgressTracker tracker(3);
    tracker.create("running", OperationType::Copy);
    for (int i = 0; i < 5; ++i) {
        auto id = "op" + std::to_string(i);
        tracker.create(id, OperationType::Copy);
        tracker.complete(id, true);
    }

    EXPECT_FALSE(tracker.get("op0").has_value());
    EXPECT_FALSE(tracker.get("op1").has_value());
    EXPECT_TRUE(tracker.get("op2").has_value());
    EXPECT_TRUE(tracker.get("op4").has_value());
    EXPECT_TRUE(tracker.get("running").has_value());
}

TEST(ProgressTracker, ReusedIdSurvivesEvictionOfOldRecord) {
    ProgressTracker tracker(1);
    tracker.create("op", OperationType::Copy);
    tracker.cancel("op");
    tracker.create("op", OperationType::Move);
    tracker.create("other", OperationType::Copy);
    tracker.complete("other", true);

    auto reused = tracker.get("op");
    ASSERT_TRUE(reused.has_value());
    EXPECT_EQ(reused->type, OperationType::Move);
    EXPECT_EQ(reused->status, OperationStatus::Pending);
}

TEST(ProgressTracker, ActiveOperationsExcludeFinished) {
    ProgressTracker tracker;
    tracker.create("running", OperationType::Copy);
    tracker.create("done", OperationType::Copy);
    tracker.complete("done", true);

    auto active = tracker.activeOperations();
    ASSERT_EQ(active.size(), 1u);
    EXPECT_EQ(active.front(), "running");
}

TEST(ProgressTracker, RemoveForgetsOperation) {
    ProgressTracker tracker;
    tracker.create("op", OperationType::Copy);
    tracker.remove("op");

    EXPECT_FALSE(tracker.get("op").has_value());
    EXPECT_TRUE(tracker.activeOperations().empty());
}

TEST(ProgressTracker, PercentCallbackReportsCurrentFile) {
    ProgressTracker tracker;
    tracker.create("op", OperationType::Copy, 2, 200);

    double percentage = -1.0;
    std::string message;
    tracker.addCallback("op", progress::adaptPercentCallback(
                                  [&](double p, std::string_view m) {
                                      percentage = p;
                                      message = std::string(m);
                                  }));

    tracker.update("op", {1, 100, std::string("a.txt"), std::nullopt});

    EXPECT_DOUBLE_EQ(percentage, 50.0);
    EXPECT_NE(message.find("a.txt"), std::string::npos);
}
