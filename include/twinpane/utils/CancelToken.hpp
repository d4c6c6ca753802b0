// include/twinpane/utils/CancelToken.hpp
#ifndef TWINPANE_CANCELTOKEN_HPP
#define TWINPANE_CANCELTOKEN_HPP

#include <atomic>
#include <memory>

namespace twinpane {
namespace utils {

// Shared one-way flag. Copies observe the same state; once cancelled it
// stays cancelled.
class CancelToken {
private:
    std::shared_ptr<std::atomic<bool>> flag_;

public:
    CancelToken() : flag_(std::make_shared<std::atomic<bool>>(false)) {}

    void cancel() { flag_->store(true, std::memory_order_release); }
    bool isCancelled() const { return flag_->load(std::memory_order_acquire); }
};

} // namespace utils
} // namespace twinpane

#endif
