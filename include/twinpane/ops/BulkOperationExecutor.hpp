// include/twinpane/ops/BulkOperationExecutor.hpp
#ifndef TWINPANE_BULKOPERATIONEXECUTOR_HPP
#define TWINPANE_BULKOPERATIONEXECUTOR_HPP

#include "OperationTypes.hpp"
#include "OperationPlanner.hpp"
#include "../io/FileSystem.hpp"
#include "../io/FileHandler.hpp"
#include "../utils/CancelToken.hpp"
#include "../utils/ProgressChannel.hpp"
#include "../utils/ProgressTracker.hpp"
#include "../utils/metrics_base.hpp"

#include <memory>
#include <set>
#include <string>
#include <utility>
#include <vector>

namespace twinpane {
namespace ops {

// Copy, move and delete over a previously built plan.
//
// Files are copied into a freshly created ".<name>.twinpane-XXXXXX" beside
// the destination and renamed into place only after all data is written
// (and synced, when configured), so a destination file that exists under
// its final name is always complete.
// Cancellation is honoured between plan items; the item in flight finishes.
// Per-entry failures are recorded and skipped. A full destination volume or
// a destination directory removed mid-operation abort the whole operation.
class BulkOperationExecutor : public MetricsBase {
public:
    BulkOperationExecutor(io::FileSystem& fs, const OperationOptions& options,
                          std::shared_ptr<metrics::MetricsSink> sink = nullptr);

    // Plans, then executes. Planning failures end in ABORTED (or CANCELLED)
    // before anything is modified.
    OperationResult run(const OperationRequest& request, const utils::CancelToken& cancel,
                        utils::ProgressSink* progress = nullptr);

    OperationResult execute(const OperationPlan& plan, const utils::CancelToken& cancel,
                            utils::ProgressTracker& tracker);

private:
    struct ExecutionState {
        const OperationPlan& plan;
        OperationResult& result;
        utils::ProgressTracker& tracker;
        common::ByteArray buffer;
        // (root, relative path) of directories whose source must stay.
        std::set<std::pair<size_t, std::string>> retained;
        std::vector<const PlanItem*> createdDirectories;
        std::vector<size_t> renamedRoots;
        bool fatal;
        bool cancelled;

        ExecutionState(const OperationPlan& p, OperationResult& r, utils::ProgressTracker& t)
            : plan(p), result(r), tracker(t), fatal(false), cancelled(false) {}
    };

    void executeCopy(ExecutionState& state, const utils::CancelToken& cancel);
    void executeMove(ExecutionState& state, const utils::CancelToken& cancel);
    void executeDelete(ExecutionState& state, const utils::CancelToken& cancel);

    void moveRootEntries(ExecutionState& state, const PlanRoot& root, bool crossDevice,
                         const utils::CancelToken& cancel);
    void removeMovedDirectories(ExecutionState& state, const PlanRoot& root, size_t processedEnd);

    // Creates the destination of one item (directory, link or file copy).
    bool transferEntry(ExecutionState& state, const PlanItem& item);
    bool copyFileContent(ExecutionState& state, const PlanItem& item);
    std::error_code createPartialFile(const PlanItem& item, std::string& tempPath,
                                      std::unique_ptr<io::FileHandler>& output);
    void discardPartial(std::unique_ptr<io::FileHandler>& output, const std::string& tempPath);

    void recordFailure(ExecutionState& state, const PlanItem& item, const std::string& path,
                       const std::error_code& ec, bool destinationSide,
                       const std::string& detail = "");
    void markRetained(ExecutionState& state, const PlanItem& item);
    bool isRetained(const ExecutionState& state, const PlanItem& item) const;
    bool destinationVanished(const OperationPlan& plan, size_t rootIndex);
    void applyDirectoryAttributes(ExecutionState& state);
    void finishResult(ExecutionState& state);

    static size_t subtreeEnd(const OperationPlan& plan, size_t index);

    io::FileSystem& fs_;
    OperationOptions options_;
};

} // namespace ops
} // namespace twinpane

#endif
