// include/twinpane/ops/OperationPlanner.hpp
#ifndef TWINPANE_OPERATIONPLANNER_HPP
#define TWINPANE_OPERATIONPLANNER_HPP

#include "OperationTypes.hpp"
#include "../io/FileSystem.hpp"
#include "../traversal/Walker.hpp"
#include "../utils/CancelToken.hpp"
#include "../utils/ProgressTracker.hpp"
#include "../utils/metrics_base.hpp"

#include <memory>
#include <set>
#include <string>
#include <system_error>
#include <vector>

namespace twinpane {
namespace ops {

// Walks every source and turns it into an OperationPlan without touching
// the filesystem. Collisions with existing destination content are settled
// here through the request's resolver.
class OperationPlanner : public MetricsBase {
public:
    OperationPlanner(io::FileSystem& fs, const OperationOptions& options,
                     std::shared_ptr<metrics::MetricsSink> sink = nullptr);

    // A non-zero return means nothing may be executed: CANCELLED, or the
    // reason planning was aborted (plan.abortPath names the culprit).
    std::error_code plan(const OperationRequest& request, const utils::CancelToken& cancel,
                         utils::ProgressTracker* tracker, OperationPlan& plan);

private:
    struct DestinationFrame {
        std::string path;
        // Existed before the operation, so children may collide.
        bool preExisting;
        // Index of the directory's own item, or npos for a skipped root.
        size_t itemIndex;
        // Part of the subtree is not planned (skip, error or diagnostic).
        bool tainted;
    };

    struct CollisionState {
        bool overwriteAll = false;
        bool skipAll = false;
    };

    std::error_code planTransfer(const OperationRequest& request, const utils::CancelToken& cancel,
                                 utils::ProgressTracker* tracker, OperationPlan& plan);
    std::error_code planDelete(const OperationRequest& request, const utils::CancelToken& cancel,
                               utils::ProgressTracker* tracker, OperationPlan& plan);

    std::error_code planTransferRoot(const std::string& requestedSource, size_t rootIndex,
                                     const OperationRequest& request,
                                     const std::string& destinationReal,
                                     const utils::CancelToken& cancel,
                                     utils::ProgressTracker* tracker, OperationPlan& plan);

    // A source spelled "." or ".." is replaced by its canonical path.
    std::error_code resolveDotSource(const std::string& source, std::string& resolved);

    // Decides where a colliding source goes. Returns false when the entry
    // must be left out of the plan (error already recorded or skipped).
    bool resolveDestination(const common::Entry& entry, const std::string& parentPath,
                            const OperationRequest& request, OperationPlan& plan,
                            std::string& destination, Disposition& disposition);

    bool isSensitiveLink(const common::Entry& entry) const;
    bool isProtected(const std::string& canonicalPath) const;
    std::string generateRenamedPath(const std::string& parentPath, const std::string& name);
    bool destinationTaken(const std::string& path);

    static void taint(std::vector<DestinationFrame>& frames);

    io::FileSystem& fs_;
    OperationOptions options_;
    CollisionState collisions_;
    std::set<std::string> claimedDestinations_;
};

} // namespace ops
} // namespace twinpane

#endif
