// include/twinpane/core/OperationHandle.hpp
#ifndef TWINPANE_OPERATIONHANDLE_HPP
#define TWINPANE_OPERATIONHANDLE_HPP

#include "../utils/CancelToken.hpp"
#include "../utils/ProgressChannel.hpp"

#include <chrono>
#include <memory>
#include <optional>

namespace twinpane {
namespace core {

// Control-thread view of one dispatched operation. Copies share state.
template<typename Outcome>
class OperationHandle {
private:
    std::shared_ptr<utils::ProgressChannel<Outcome>> channel_;
    utils::CancelToken cancel_;

public:
    OperationHandle(std::shared_ptr<utils::ProgressChannel<Outcome>> channel, utils::CancelToken cancel)
        : channel_(std::move(channel)), cancel_(std::move(cancel)) {}

    void cancel() { cancel_.cancel(); }
    bool isCancelled() const { return cancel_.isCancelled(); }

    // Newest snapshot; returns its sequence number (0 before the first one).
    uint64_t latestProgress(utils::OperationProgress& progress) const {
        return channel_->latest(progress);
    }

    bool isFinished() const { return channel_->isFinished(); }

    std::optional<Outcome> tryTakeOutcome() { return channel_->tryTakeOutcome(); }

    std::optional<Outcome> waitOutcome(std::chrono::milliseconds timeout) {
        return channel_->waitOutcome(timeout);
    }

    std::optional<Outcome> waitOutcome() { return channel_->waitOutcome(); }
};

} // namespace core
} // namespace twinpane

#endif
