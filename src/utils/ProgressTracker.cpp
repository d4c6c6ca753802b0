#include "twinpane/utils/ProgressTracker.hpp"
#include "twinpane/common/Constants.hpp"

twinpane::utils::ProgressTracker::ProgressTracker(ProgressSink* sink, uint64_t updateInterval)
    : sink_(sink), updateInterval_(updateInterval > 0 ? updateInterval : 1), lastReportedBytes_(0),
      minInterval_(common::Constants::PROGRESS_MIN_INTERVAL_MS) {
    startTime_ = std::chrono::steady_clock::now();
    lastPublish_ = startTime_;
}

void twinpane::utils::ProgressTracker::setPhase(OperationPhase phase) {
    current_.phase = phase;
    update();
}

void twinpane::utils::ProgressTracker::setTotals(uint64_t bytesTotal, uint64_t entriesTotal) {
    current_.bytesTotal = bytesTotal;
    current_.entriesTotal = entriesTotal;
    update();
}

void twinpane::utils::ProgressTracker::setCurrentPath(const std::string& path) {
    current_.currentPath = path;
}

void twinpane::utils::ProgressTracker::addProcessedBytes(uint64_t bytes) {
    current_.bytesDone += bytes;

    if (current_.bytesDone - lastReportedBytes_ >= updateInterval_ ||
        current_.bytesDone == current_.bytesTotal) {
        update();
        lastReportedBytes_ = current_.bytesDone;
    }
}

void twinpane::utils::ProgressTracker::entryCompleted() {
    current_.entriesDone++;

    auto now = std::chrono::steady_clock::now();
    if (now - lastPublish_ >= minInterval_ || current_.entriesDone == current_.entriesTotal) {
        update();
    }
}

void twinpane::utils::ProgressTracker::tick() {
    if (std::chrono::steady_clock::now() - lastPublish_ >= minInterval_) {
        update();
    }
}

void twinpane::utils::ProgressTracker::forceUpdate() {
    update();
}

double twinpane::utils::ProgressTracker::getPercentage() const {
    if (current_.bytesTotal == 0) {
        if (current_.entriesTotal == 0) {
            return 0.0;
        }
        return (static_cast<double>(current_.entriesDone) /
                static_cast<double>(current_.entriesTotal)) * 100.0;
    }

    return (static_cast<double>(current_.bytesDone) /
            static_cast<double>(current_.bytesTotal)) * 100.0;
}

std::chrono::milliseconds twinpane::utils::ProgressTracker::getElapsedTime() const {
    auto now = std::chrono::steady_clock::now();
    return std::chrono::duration_cast<std::chrono::milliseconds>(now - startTime_);
}

void twinpane::utils::ProgressTracker::update() {
    lastPublish_ = std::chrono::steady_clock::now();
    if (sink_) {
        sink_->publish(current_);
    }
}
