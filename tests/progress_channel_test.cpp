// tests/progress_channel_test.cpp
#include "twinpane/utils/ProgressChannel.hpp"
#include "twinpane/utils/ProgressTracker.hpp"
#include "twinpane/core/OperationHandle.hpp"

#include <gtest/gtest.h>

#include <chrono>
#include <string>
#include <thread>
#include <vector>

using namespace twinpane;

namespace {

class RecordingSink : public utils::ProgressSink {
public:
    void publish(const utils::OperationProgress& progress) override {
        snapshots.push_back(progress);
    }

    std::vector<utils::OperationProgress> snapshots;
};

} // namespace

TEST(ProgressChannelTest, ReaderSeesOnlyTheNewestSnapshot) {
    utils::ProgressChannel<int> channel;
    utils::OperationProgress progress;

    EXPECT_EQ(channel.latest(progress), 0u);

    for (uint64_t i = 1; i <= 5; ++i) {
        utils::OperationProgress update;
        update.bytesDone = i * 100;
        update.currentPath = "/file" + std::to_string(i);
        channel.publish(update);
    }

    EXPECT_EQ(channel.latest(progress), 5u);
    EXPECT_EQ(progress.bytesDone, 500u);
    EXPECT_EQ(progress.currentPath, "/file5");
}

TEST(ProgressChannelTest, OutcomeIsDeliveredExactlyOnce) {
    utils::ProgressChannel<std::string> channel;

    EXPECT_FALSE(channel.isFinished());
    EXPECT_FALSE(channel.tryTakeOutcome().has_value());

    EXPECT_TRUE(channel.finish("done"));
    EXPECT_FALSE(channel.finish("again"));
    EXPECT_TRUE(channel.isFinished());

    auto outcome = channel.tryTakeOutcome();
    ASSERT_TRUE(outcome.has_value());
    EXPECT_EQ(*outcome, "done");
    EXPECT_FALSE(channel.tryTakeOutcome().has_value());
    EXPECT_FALSE(channel.waitOutcome(std::chrono::milliseconds(1)).has_value());
}

TEST(ProgressChannelTest, WaitOutcomeTimesOutWhileRunning) {
    utils::ProgressChannel<int> channel;
    EXPECT_FALSE(channel.waitOutcome(std::chrono::milliseconds(10)).has_value());
}

TEST(ProgressChannelTest, WorkerAndReaderOnDifferentThreads) {
    auto channel = std::make_shared<utils::ProgressChannel<int>>();

    std::thread worker([channel]() {
        for (uint64_t i = 1; i <= 1000; ++i) {
            utils::OperationProgress update;
            update.entriesDone = i;
            channel->publish(update);
        }
        channel->finish(42);
    });

    uint64_t lastSeen = 0;
    while (!channel->isFinished()) {
        utils::OperationProgress progress;
        channel->latest(progress);
        EXPECT_GE(progress.entriesDone, lastSeen);
        lastSeen = progress.entriesDone;
    }

    auto outcome = channel->waitOutcome();
    worker.join();

    ASSERT_TRUE(outcome.has_value());
    EXPECT_EQ(*outcome, 42);
    utils::OperationProgress progress;
    EXPECT_EQ(channel->latest(progress), 1000u);
    EXPECT_EQ(progress.entriesDone, 1000u);
}

TEST(OperationHandleTest, CancelIsSharedWithTheWorker) {
    auto channel = std::make_shared<utils::ProgressChannel<int>>();
    utils::CancelToken token;
    core::OperationHandle<int> handle(channel, token);

    EXPECT_FALSE(token.isCancelled());
    handle.cancel();
    EXPECT_TRUE(token.isCancelled());
    EXPECT_TRUE(handle.isCancelled());

    EXPECT_FALSE(handle.isFinished());
    channel->finish(3);
    EXPECT_TRUE(handle.isFinished());
    auto outcome = handle.waitOutcome(std::chrono::milliseconds(100));
    ASSERT_TRUE(outcome.has_value());
    EXPECT_EQ(*outcome, 3);
}

TEST(ProgressTrackerTest, PhaseAndTotalsPublishImmediately) {
    RecordingSink sink;
    utils::ProgressTracker tracker(&sink, 1000);

    tracker.setPhase(utils::OperationPhase::EXECUTING);
    tracker.setTotals(4000, 4);

    ASSERT_EQ(sink.snapshots.size(), 2u);
    EXPECT_EQ(sink.snapshots[1].phase, utils::OperationPhase::EXECUTING);
    EXPECT_EQ(sink.snapshots[1].bytesTotal, 4000u);
    EXPECT_EQ(sink.snapshots[1].entriesTotal, 4u);
}

TEST(ProgressTrackerTest, BytesAreThrottledByInterval) {
    RecordingSink sink;
    utils::ProgressTracker tracker(&sink, 1000);
    tracker.setTotals(10000, 1);
    sink.snapshots.clear();

    for (int i = 0; i < 10; ++i) {
        tracker.addProcessedBytes(300);
    }

    // 3000 bytes in steps of 300 cross the 1000 byte interval at 1200, 2400.
    EXPECT_EQ(sink.snapshots.size(), 2u);
    EXPECT_EQ(tracker.getBytesProcessed(), 3000u);
    EXPECT_DOUBLE_EQ(tracker.getPercentage(), 30.0);
}

TEST(ProgressTrackerTest, CompletionAlwaysPublishes) {
    RecordingSink sink;
    utils::ProgressTracker tracker(&sink, 1000000);
    tracker.setTotals(500, 2);
    sink.snapshots.clear();

    tracker.addProcessedBytes(500);
    ASSERT_EQ(sink.snapshots.size(), 1u);
    EXPECT_EQ(sink.snapshots.back().bytesDone, 500u);

    tracker.entryCompleted();
    tracker.entryCompleted();
    EXPECT_EQ(sink.snapshots.back().entriesDone, 2u);
    EXPECT_EQ(tracker.getEntriesProcessed(), 2u);
}

TEST(ProgressTrackerTest, WorksWithoutSink) {
    utils::ProgressTracker tracker(nullptr);
    tracker.setPhase(utils::OperationPhase::SCANNING);
    tracker.addProcessedBytes(10);
    tracker.entryCompleted();
    tracker.forceUpdate();

    EXPECT_EQ(tracker.snapshot().phase, utils::OperationPhase::SCANNING);
    EXPECT_EQ(tracker.getBytesProcessed(), 10u);
    EXPECT_DOUBLE_EQ(tracker.getPercentage(), 0.0);
}
