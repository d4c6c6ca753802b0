// src/scan/SizeCalculator.cpp
#include "twinpane/scan/SizeCalculator.hpp"
#include "twinpane/utils/ProgressTracker.hpp"

namespace twinpane {
namespace scan {

SizeCalculator::SizeCalculator(io::FileSystem& fs, const traversal::WalkOptions& options,
                               std::shared_ptr<metrics::MetricsSink> sink)
    : MetricsBase("SizeCalculator", std::move(sink))
    , fs_(fs)
    , options_(options) {
}

DirCalcResult SizeCalculator::calculate(const std::string& root, const utils::CancelToken& cancel,
                                        utils::ProgressSink* progress) {
    return calculate(std::vector<std::string>{root}, cancel, progress);
}

DirCalcResult SizeCalculator::calculate(const std::vector<std::string>& roots,
                                        const utils::CancelToken& cancel,
                                        utils::ProgressSink* progress) {
    ScopedTimer timer(*this, "calculate", {{"roots", roots.size()}});

    DirCalcResult result;
    utils::ProgressTracker tracker(progress);
    tracker.setPhase(utils::OperationPhase::SCANNING);

    for (const auto& root : roots) {
        traversal::Walker walker(fs_, root, options_, cancel);

        while (auto event = walker.next()) {
            switch (event->type) {
                case traversal::VisitType::ENTER_DIR:
                    if (event->depth > 0) {
                        result.dirCount++;
                    }
                    tracker.setCurrentPath(event->entry.path);
                    tracker.tick();
                    break;

                case traversal::VisitType::FILE_ENTRY: {
                    const common::Entry& entry = event->entry;
                    uint64_t size = entry.size;
                    if (entry.isSymlink() && options_.symlinkPolicy == common::SymlinkPolicy::FOLLOW &&
                        entry.target.valid && entry.target.kind == common::EntryKind::FILE) {
                        size = entry.target.size;
                    }
                    result.fileCount++;
                    result.totalSize += size;
                    tracker.addProcessedBytes(size);
                    tracker.entryCompleted();
                    break;
                }

                case traversal::VisitType::LEAVE_DIR:
                    break;

                case traversal::VisitType::DIAGNOSTIC:
                    result.errors.emplace_back(event->entry.path, event->diagnostic, event->cause);
                    if (event->diagnostic == common::ErrorCode::CANCELLED) {
                        result.cancelled = true;
                    } else {
                        logDebug("calculate", common::errorName(event->diagnostic),
                                 {{"path", event->entry.path}});
                    }
                    break;
            }
        }

        if (result.cancelled) {
            break;
        }
    }

    result.partial = result.cancelled || !result.errors.empty();

    tracker.setPhase(utils::OperationPhase::FINISHING);

    timer.addData("total_size", result.totalSize);
    timer.addData("file_count", result.fileCount);
    timer.addData("dir_count", result.dirCount);
    timer.addData("errors", result.errors.size());
    timer.addData("cancelled", result.cancelled);

    return result;
}

} // namespace scan
} // namespace twinpane
