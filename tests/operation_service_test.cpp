// tests/operation_service_test.cpp
#include "twinpane/core/OperationService.hpp"
#include "twinpane/io/PosixFileSystem.hpp"
#include "twinpane/utils/metrics_engine.hpp"
#include "test_helpers.hpp"

#include <gtest/gtest.h>

#include <chrono>
#include <future>
#include <stdexcept>

using namespace twinpane;
using twinpane::test::TempDir;

namespace {

const std::chrono::seconds kTimeout(10);

struct NotAnException {};

// Lstat of the armed path throws; everything else goes to the real filesystem.
class ThrowingFileSystem : public io::PosixFileSystem {
public:
    std::string armedPath;
    bool throwStandard = false;

    std::error_code symlinkStatus(const std::string& path, io::FileStatus& status) override {
        if (path == armedPath) {
            if (throwStandard) {
                throw std::runtime_error("lstat exploded");
            }
            throw NotAnException();
        }
        return io::PosixFileSystem::symlinkStatus(path, status);
    }
};

} // namespace

class OperationServiceTest : public ::testing::Test {
protected:
    TempDir dir_;
    io::PosixFileSystem fs_;
    std::shared_ptr<metrics::MemoryMetricsSink> sink_ = std::make_shared<metrics::MemoryMetricsSink>(256);
};

TEST_F(OperationServiceTest, SizeAndSearchRunThroughHandles) {
    test::writeFileOfSize(dir_ / "tree/a.log", 10);
    test::writeFileOfSize(dir_ / "tree/sub/b.log", 20);

    core::OperationService service(fs_, core::EngineConfig(), sink_);

    core::SizeHandle size = service.computeSize({dir_ / "tree"});
    scan::SearchQuery query;
    query.pattern = ".log";
    core::SearchHandle search = service.search(dir_ / "tree", query);

    auto sizeResult = size.waitOutcome(std::chrono::duration_cast<std::chrono::milliseconds>(kTimeout));
    ASSERT_TRUE(sizeResult.has_value());
    EXPECT_EQ(sizeResult->totalSize, 30u);
    EXPECT_EQ(sizeResult->fileCount, 2u);

    auto searchResult = search.waitOutcome(std::chrono::duration_cast<std::chrono::milliseconds>(kTimeout));
    ASSERT_TRUE(searchResult.has_value());
    EXPECT_EQ(searchResult->matches.size(), 2u);

    EXPECT_TRUE(size.isFinished());
    EXPECT_FALSE(size.tryTakeOutcome().has_value());
}

TEST_F(OperationServiceTest, CopyReportsProgressAndOutcome) {
    test::writeFileOfSize(dir_ / "src/big.bin", 600000);
    test::makeDirs(dir_ / "dst");

    core::EngineConfig config;
    config.progressIntervalBytes = 65536;
    core::OperationService service(fs_, config, sink_);

    core::BulkHandle handle = service.copy({dir_ / "src"}, dir_ / "dst");
    auto outcome = handle.waitOutcome();
    ASSERT_TRUE(outcome.has_value());
    EXPECT_EQ(outcome->state, ops::OperationState::COMPLETED);
    EXPECT_EQ(outcome->bytesDone, 600000u);

    utils::OperationProgress progress;
    EXPECT_GT(handle.latestProgress(progress), 0u);
    EXPECT_EQ(progress.phase, utils::OperationPhase::FINISHING);
    EXPECT_FALSE(service.bulkOperationActive());
    EXPECT_GT(sink_->countAtLevel(metrics::LogLevel::INFO), 0u);
}

TEST_F(OperationServiceTest, SecondBulkOperationIsRefusedWhileOneRuns) {
    test::writeFile(dir_ / "src/a.txt", "new");
    test::writeFile(dir_ / "dst/src/a.txt", "old");
    test::writeFile(dir_ / "other.txt", "x");

    std::promise<void> entered;
    std::promise<void> release;
    std::shared_future<void> released = release.get_future().share();

    core::OperationService service(fs_, core::EngineConfig(), sink_);

    core::BulkHandle first = service.copy({dir_ / "src"}, dir_ / "dst",
        [&entered, released](const ops::Collision&) {
            entered.set_value();
            released.wait();
            return ops::CollisionResolution(ops::CollisionDecision::OVERWRITE);
        });

    ASSERT_EQ(entered.get_future().wait_for(kTimeout), std::future_status::ready);
    EXPECT_TRUE(service.bulkOperationActive());

    core::BulkHandle second = service.remove({dir_ / "other.txt"});
    auto refused = second.tryTakeOutcome();
    ASSERT_TRUE(refused.has_value());
    EXPECT_EQ(refused->state, ops::OperationState::ABORTED);
    EXPECT_EQ(refused->fatalError, common::ErrorCode::OPERATION_IN_PROGRESS);
    EXPECT_TRUE(test::pathExists(dir_ / "other.txt"));

    release.set_value();
    auto outcome = first.waitOutcome();
    ASSERT_TRUE(outcome.has_value());
    EXPECT_EQ(outcome->state, ops::OperationState::COMPLETED);
    EXPECT_EQ(test::readFile(dir_ / "dst/src/a.txt"), "new");

    EXPECT_FALSE(service.bulkOperationActive());
    core::BulkHandle third = service.remove({dir_ / "other.txt"});
    outcome = third.waitOutcome();
    ASSERT_TRUE(outcome.has_value());
    EXPECT_EQ(outcome->state, ops::OperationState::COMPLETED);
    EXPECT_FALSE(test::pathExists(dir_ / "other.txt"));
}

TEST_F(OperationServiceTest, CancelDuringPlanningLeavesDestinationUntouched) {
    test::writeFile(dir_ / "src/a.txt", "new");
    test::writeFile(dir_ / "src/b.txt", "new");
    test::writeFile(dir_ / "dst/src/a.txt", "old");

    std::promise<void> entered;
    std::promise<void> release;
    std::shared_future<void> released = release.get_future().share();

    core::OperationService service(fs_, core::EngineConfig(), sink_);

    core::BulkHandle handle = service.copy({dir_ / "src"}, dir_ / "dst",
        [&entered, released](const ops::Collision&) {
            entered.set_value();
            released.wait();
            return ops::CollisionResolution(ops::CollisionDecision::OVERWRITE);
        });

    ASSERT_EQ(entered.get_future().wait_for(kTimeout), std::future_status::ready);
    handle.cancel();
    EXPECT_TRUE(handle.isCancelled());
    release.set_value();

    auto outcome = handle.waitOutcome();
    ASSERT_TRUE(outcome.has_value());
    EXPECT_EQ(outcome->state, ops::OperationState::CANCELLED);
    EXPECT_EQ(test::readFile(dir_ / "dst/src/a.txt"), "old");
    EXPECT_FALSE(test::pathExists(dir_ / "dst/src/b.txt"));
}

TEST_F(OperationServiceTest, MoveAndDeleteConvenienceCalls) {
    test::writeFile(dir_ / "src/a.txt", "a");
    test::makeDirs(dir_ / "dst");

    core::OperationService service(fs_, core::EngineConfig(), sink_);

    auto moved = service.move({dir_ / "src"}, dir_ / "dst").waitOutcome();
    ASSERT_TRUE(moved.has_value());
    EXPECT_EQ(moved->kind, ops::OperationKind::MOVE);
    EXPECT_EQ(moved->state, ops::OperationState::COMPLETED);
    EXPECT_EQ(test::readFile(dir_ / "dst/src/a.txt"), "a");

    auto removed = service.remove({dir_ / "dst/src"}).waitOutcome();
    ASSERT_TRUE(removed.has_value());
    EXPECT_EQ(removed->kind, ops::OperationKind::DELETE);
    EXPECT_EQ(removed->state, ops::OperationState::COMPLETED);
    EXPECT_FALSE(test::pathExists(dir_ / "dst/src"));
}

TEST_F(OperationServiceTest, ThrowingWorkerStillPublishesAndReleases) {
    test::writeFile(dir_ / "victim.txt", "v");
    test::writeFile(dir_ / "other.txt", "o");

    ThrowingFileSystem fs;
    fs.armedPath = dir_ / "victim.txt";
    core::OperationService service(fs, core::EngineConfig(), sink_);

    fs.throwStandard = true;
    auto outcome = service.remove({dir_ / "victim.txt"}).waitOutcome(
        std::chrono::duration_cast<std::chrono::milliseconds>(kTimeout));
    ASSERT_TRUE(outcome.has_value());
    EXPECT_EQ(outcome->state, ops::OperationState::ABORTED);
    EXPECT_EQ(outcome->fatalError, common::ErrorCode::UNKNOWN_ERROR);
    ASSERT_FALSE(outcome->errors.empty());
    EXPECT_EQ(outcome->errors[0].detail, "lstat exploded");
    EXPECT_FALSE(service.bulkOperationActive());

    fs.throwStandard = false;
    outcome = service.remove({dir_ / "victim.txt"}).waitOutcome(
        std::chrono::duration_cast<std::chrono::milliseconds>(kTimeout));
    ASSERT_TRUE(outcome.has_value());
    EXPECT_EQ(outcome->state, ops::OperationState::ABORTED);
    EXPECT_EQ(outcome->fatalError, common::ErrorCode::UNKNOWN_ERROR);
    EXPECT_FALSE(service.bulkOperationActive());
    EXPECT_GE(sink_->countAtLevel(metrics::LogLevel::ERROR), 2u);

    outcome = service.remove({dir_ / "other.txt"}).waitOutcome(
        std::chrono::duration_cast<std::chrono::milliseconds>(kTimeout));
    ASSERT_TRUE(outcome.has_value());
    EXPECT_EQ(outcome->state, ops::OperationState::COMPLETED);
    EXPECT_FALSE(test::pathExists(dir_ / "other.txt"));
    EXPECT_TRUE(test::pathExists(dir_ / "victim.txt"));
}
