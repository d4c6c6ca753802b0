// include/twinpane/core/OperationService.hpp
#ifndef TWINPANE_OPERATIONSERVICE_HPP
#define TWINPANE_OPERATIONSERVICE_HPP

#include "EngineConfig.hpp"
#include "OperationHandle.hpp"
#include "../io/FileSystem.hpp"
#include "../ops/OperationTypes.hpp"
#include "../scan/SearchEngine.hpp"
#include "../scan/SizeCalculator.hpp"
#include "../utils/ThreadPool.hpp"
#include "../utils/metrics_base.hpp"

#include <atomic>
#include <functional>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace twinpane {
namespace core {

using SizeHandle = OperationHandle<scan::DirCalcResult>;
using SearchHandle = OperationHandle<scan::SearchResult>;
using BulkHandle = OperationHandle<ops::OperationResult>;

// Runs every request on its own worker task and hands back a handle. Size
// and search requests may run side by side; only one copy, move or delete
// is active at a time. Destruction waits for dispatched work to finish.
class OperationService : public MetricsBase {
public:
    OperationService(io::FileSystem& fs, const EngineConfig& config,
                     std::shared_ptr<metrics::MetricsSink> sink = nullptr);
    ~OperationService() override;

    OperationService(const OperationService&) = delete;
    OperationService& operator=(const OperationService&) = delete;

    SizeHandle computeSize(const std::vector<std::string>& roots);
    SearchHandle search(const std::string& root, const scan::SearchQuery& query);

    BulkHandle copy(const std::vector<std::string>& sources, const std::string& destinationDir,
                    ops::CollisionResolver resolver = nullptr);
    BulkHandle move(const std::vector<std::string>& sources, const std::string& destinationDir,
                    ops::CollisionResolver resolver = nullptr);
    BulkHandle remove(const std::vector<std::string>& sources);
    BulkHandle submit(const ops::OperationRequest& request);

    bool bulkOperationActive() const { return bulkActive_.load(); }
    const EngineConfig& config() const { return config_; }

private:
    // Releases the bulk slot and publishes an outcome on every exit path of
    // a worker task, including exceptions that escape it.
    template<typename Outcome>
    class OutcomeGuard {
    public:
        OutcomeGuard(std::shared_ptr<utils::ProgressChannel<Outcome>> channel,
                     std::function<void()> release)
            : channel_(std::move(channel)), release_(std::move(release)) {}

        ~OutcomeGuard() {
            if (release_) {
                release_();
            }
            channel_->finish(outcome_ ? std::move(*outcome_) : Outcome());
        }

        OutcomeGuard(const OutcomeGuard&) = delete;
        OutcomeGuard& operator=(const OutcomeGuard&) = delete;

        void set(Outcome outcome) { outcome_ = std::move(outcome); }

    private:
        std::shared_ptr<utils::ProgressChannel<Outcome>> channel_;
        std::function<void()> release_;
        std::optional<Outcome> outcome_;
    };

    // work(cancel, sink) runs on a worker; failure(message) builds the
    // outcome reported when work throws. release runs before the outcome
    // is published.
    template<typename Outcome, typename Work, typename Failure>
    OperationHandle<Outcome> dispatch(const std::string& operation, Work work, Failure failure,
                                      std::function<void()> release = nullptr);

    io::FileSystem& fs_;
    EngineConfig config_;
    std::atomic<bool> bulkActive_;
    utils::ThreadPool pool_;
};

template<typename Outcome, typename Work, typename Failure>
OperationHandle<Outcome> OperationService::dispatch(const std::string& operation, Work work,
                                                    Failure failure, std::function<void()> release) {
    auto channel = std::make_shared<utils::ProgressChannel<Outcome>>();
    utils::CancelToken cancel;

    auto task = [this, operation, channel, cancel, work, failure, release]() {
        OutcomeGuard<Outcome> guard(channel, release);
        try {
            guard.set(failure("worker ended without an outcome"));
            guard.set(work(cancel, channel.get()));
        } catch (const std::exception& e) {
            logError(operation, std::string("Operation failed: ") + e.what());
            guard.set(failure(e.what()));
        } catch (...) {
            logError(operation, "Operation failed with a non-standard exception");
            guard.set(failure("non-standard exception"));
            throw;
        }
    };

    try {
        pool_.enqueue(task);
    } catch (const std::runtime_error& e) {
        logError(operation, std::string("Could not dispatch: ") + e.what());
        if (release) {
            release();
        }
        channel->finish(failure(e.what()));
    }

    return OperationHandle<Outcome>(channel, cancel);
}

} // namespace core
} // namespace twinpane

#endif
