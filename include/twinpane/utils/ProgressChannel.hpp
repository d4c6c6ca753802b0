// include/twinpane/utils/ProgressChannel.hpp
#ifndef TWINPANE_PROGRESSCHANNEL_HPP
#define TWINPANE_PROGRESSCHANNEL_HPP

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <mutex>
#include <optional>
#include <string>

namespace twinpane {
namespace utils {

enum class OperationPhase {
    IDLE,
    SCANNING,
    PLANNING,
    EXECUTING,
    FINISHING
};

struct OperationProgress {
    std::string currentPath;
    uint64_t bytesDone;
    uint64_t bytesTotal;
    uint64_t entriesDone;
    uint64_t entriesTotal;
    OperationPhase phase;

    OperationProgress()
        : bytesDone(0), bytesTotal(0), entriesDone(0), entriesTotal(0),
          phase(OperationPhase::IDLE) {}
};

class ProgressSink {
public:
    virtual ~ProgressSink() = default;
    virtual void publish(const OperationProgress& progress) = 0;
};

// One worker writes snapshots, one control thread reads the newest. The
// terminal outcome is stored once and handed out once.
template<typename Outcome>
class ProgressChannel : public ProgressSink {
private:
    mutable std::mutex mutex_;
    std::condition_variable finished_cv_;
    OperationProgress latest_;
    uint64_t sequence_ = 0;
    std::optional<Outcome> outcome_;
    bool finished_ = false;
    bool taken_ = false;

public:
    void publish(const OperationProgress& progress) override {
        std::lock_guard<std::mutex> lock(mutex_);
        latest_ = progress;
        ++sequence_;
    }

    // Sequence number of the newest snapshot; 0 when none was published.
    uint64_t latest(OperationProgress& progress) const {
        std::lock_guard<std::mutex> lock(mutex_);
        progress = latest_;
        return sequence_;
    }

    uint64_t sequence() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return sequence_;
    }

    // Returns false if an outcome was already delivered.
    bool finish(Outcome outcome) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (finished_) {
                return false;
            }
            outcome_ = std::move(outcome);
            finished_ = true;
        }
        finished_cv_.notify_all();
        return true;
    }

    bool isFinished() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return finished_;
    }

    std::optional<Outcome> tryTakeOutcome() {
        std::lock_guard<std::mutex> lock(mutex_);
        return takeLocked();
    }

    std::optional<Outcome> waitOutcome(std::chrono::milliseconds timeout) {
        std::unique_lock<std::mutex> lock(mutex_);
        finished_cv_.wait_for(lock, timeout, [this]() { return finished_; });
        return takeLocked();
    }

    std::optional<Outcome> waitOutcome() {
        std::unique_lock<std::mutex> lock(mutex_);
        finished_cv_.wait(lock, [this]() { return finished_; });
        return takeLocked();
    }

private:
    std::optional<Outcome> takeLocked() {
        if (!finished_ || taken_) {
            return std::nullopt;
        }
        taken_ = true;
        std::optional<Outcome> result = std::move(outcome_);
        outcome_.reset();
        return result;
    }
};

} // namespace utils
} // namespace twinpane

#endif
