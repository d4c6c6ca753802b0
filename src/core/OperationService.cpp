// src/core/OperationService.cpp
#include "twinpane/core/OperationService.hpp"
#include "twinpane/ops/BulkOperationExecutor.hpp"

namespace twinpane {
namespace core {

namespace {

ops::OperationResult failedOperation(ops::OperationKind kind, common::ErrorCode code,
                                     const std::string& message) {
    ops::OperationResult result;
    result.kind = kind;
    result.state = ops::OperationState::ABORTED;
    result.fatalError = code;
    result.fatalCause = code;
    result.errors.emplace_back(std::string(), code, std::error_code(), message);
    return result;
}

} // namespace

OperationService::OperationService(io::FileSystem& fs, const EngineConfig& config,
                                   std::shared_ptr<metrics::MetricsSink> sink)
    : MetricsBase("OperationService", std::move(sink))
    , fs_(fs)
    , config_(config)
    , bulkActive_(false)
    , pool_(config.workerThreads) {
    logInfo("init", "Operation service started",
            {{"workers", pool_.getThreadCount()}, {"config", config_.toJson()}});
}

OperationService::~OperationService() {
    pool_.waitAll();
    logDebug("shutdown", "Operation service stopped");
}

SizeHandle OperationService::computeSize(const std::vector<std::string>& roots) {
    auto sink = getMetricsSink();
    traversal::WalkOptions options = config_.walkOptions();

    return dispatch<scan::DirCalcResult>(
        "computeSize",
        [this, roots, options, sink](const utils::CancelToken& cancel, utils::ProgressSink* progress) {
            scan::SizeCalculator calculator(fs_, options, sink);
            calculator.enableMetrics(isMetricsEnabled());
            return calculator.calculate(roots, cancel, progress);
        },
        [](const std::string& message) {
            scan::DirCalcResult result;
            result.partial = true;
            result.errors.emplace_back(std::string(), common::ErrorCode::UNKNOWN_ERROR,
                                       std::error_code(), message);
            return result;
        });
}

SearchHandle OperationService::search(const std::string& root, const scan::SearchQuery& query) {
    auto sink = getMetricsSink();
    traversal::WalkOptions options = config_.walkOptions();

    return dispatch<scan::SearchResult>(
        "search",
        [this, root, query, options, sink](const utils::CancelToken& cancel, utils::ProgressSink* progress) {
            scan::SearchEngine engine(fs_, options, sink);
            engine.enableMetrics(isMetricsEnabled());
            return engine.search(root, query, cancel, progress);
        },
        [](const std::string& message) {
            scan::SearchResult result;
            result.partial = true;
            result.errors.emplace_back(std::string(), common::ErrorCode::UNKNOWN_ERROR,
                                       std::error_code(), message);
            return result;
        });
}

BulkHandle OperationService::copy(const std::vector<std::string>& sources,
                                  const std::string& destinationDir,
                                  ops::CollisionResolver resolver) {
    ops::OperationRequest request;
    request.kind = ops::OperationKind::COPY;
    request.sources = sources;
    request.destinationDir = destinationDir;
    request.resolver = std::move(resolver);
    return submit(request);
}

BulkHandle OperationService::move(const std::vector<std::string>& sources,
                                  const std::string& destinationDir,
                                  ops::CollisionResolver resolver) {
    ops::OperationRequest request;
    request.kind = ops::OperationKind::MOVE;
    request.sources = sources;
    request.destinationDir = destinationDir;
    request.resolver = std::move(resolver);
    return submit(request);
}

BulkHandle OperationService::remove(const std::vector<std::string>& sources) {
    ops::OperationRequest request;
    request.kind = ops::OperationKind::DELETE;
    request.sources = sources;
    return submit(request);
}

BulkHandle OperationService::submit(const ops::OperationRequest& request) {
    bool expected = false;
    if (!bulkActive_.compare_exchange_strong(expected, true)) {
        logWarning("submit", "Another bulk operation is active",
                   {{"kind", ops::operationKindName(request.kind)}});

        auto channel = std::make_shared<utils::ProgressChannel<ops::OperationResult>>();
        channel->finish(failedOperation(request.kind, common::ErrorCode::OPERATION_IN_PROGRESS,
                                        "another copy, move or delete is still running"));
        return BulkHandle(channel, utils::CancelToken());
    }

    auto sink = getMetricsSink();
    ops::OperationOptions options = config_.operationOptions();
    ops::OperationKind kind = request.kind;

    logInfo("submit", "Bulk operation dispatched",
            {{"kind", ops::operationKindName(kind)},
             {"sources", request.sources.size()},
             {"destination", request.destinationDir}});

    return dispatch<ops::OperationResult>(
        ops::operationKindName(kind),
        [this, request, options, sink](const utils::CancelToken& cancel, utils::ProgressSink* progress) {
            ops::BulkOperationExecutor executor(fs_, options, sink);
            executor.enableMetrics(isMetricsEnabled());
            return executor.run(request, cancel, progress);
        },
        [kind](const std::string& message) {
            return failedOperation(kind, common::ErrorCode::UNKNOWN_ERROR, message);
        },
        [this]() { bulkActive_.store(false); });
}

} // namespace core
} // namespace twinpane
