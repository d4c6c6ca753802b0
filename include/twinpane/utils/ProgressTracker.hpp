// include/twinpane/utils/ProgressTracker.hpp
#ifndef TWINPANE_PROGRESSTRACKER_HPP
#define TWINPANE_PROGRESSTRACKER_HPP

#include "../common/Types.hpp"
#include "ProgressChannel.hpp"
#include <chrono>
#include <string>

namespace twinpane {
namespace utils {

// Worker-side accumulator that forwards throttled snapshots to a sink.
// Byte progress is published every updateInterval bytes; entry progress at
// most once per minimum interval. Phase and total changes publish at once.
class ProgressTracker : public common::NonCopyable {
private:
    ProgressSink* sink_;
    OperationProgress current_;
    uint64_t updateInterval_;
    uint64_t lastReportedBytes_;
    std::chrono::steady_clock::time_point startTime_;
    std::chrono::steady_clock::time_point lastPublish_;
    std::chrono::milliseconds minInterval_;

public:
    explicit ProgressTracker(ProgressSink* sink, uint64_t updateInterval = 262144);

    void setPhase(OperationPhase phase);
    void setTotals(uint64_t bytesTotal, uint64_t entriesTotal);
    void setCurrentPath(const std::string& path);
    void addProcessedBytes(uint64_t bytes);
    void entryCompleted();
    // Publishes only if the minimum interval has passed since the last snapshot.
    void tick();
    void forceUpdate();

    const OperationProgress& snapshot() const { return current_; }
    uint64_t getBytesProcessed() const { return current_.bytesDone; }
    uint64_t getEntriesProcessed() const { return current_.entriesDone; }
    double getPercentage() const;
    std::chrono::milliseconds getElapsedTime() const;

private:
    void update();
};

} // namespace utils
} // namespace twinpane

#endif
