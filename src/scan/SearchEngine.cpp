// src/scan/SearchEngine.cpp
#include "twinpane/scan/SearchEngine.hpp"
#include "twinpane/utils/ProgressTracker.hpp"

namespace twinpane {
namespace scan {

SearchEngine::SearchEngine(io::FileSystem& fs, const traversal::WalkOptions& options,
                           std::shared_ptr<metrics::MetricsSink> sink)
    : MetricsBase("SearchEngine", std::move(sink))
    , fs_(fs)
    , options_(options) {
}

bool SearchEngine::accepts(const SearchQuery& query, bool isDirectory) const {
    switch (query.filter) {
        case SearchFilter::FILES_ONLY: return !isDirectory;
        case SearchFilter::DIRECTORIES_ONLY: return isDirectory;
        case SearchFilter::ALL:
        default:
            return true;
    }
}

SearchResult SearchEngine::search(const std::string& root, const SearchQuery& query,
                                  const utils::CancelToken& cancel,
                                  utils::ProgressSink* progress) {
    ScopedTimer timer(*this, "search", {{"root", root}, {"pattern", query.pattern}});

    SearchResult result;
    NameMatcher matcher(query.pattern, query.mode, query.caseSensitive);
    traversal::Walker walker(fs_, root, options_, cancel);
    utils::ProgressTracker tracker(progress);
    tracker.setPhase(utils::OperationPhase::SCANNING);

    auto consider = [&](const common::Entry& entry, bool isDirectory) {
        if (!accepts(query, isDirectory)) {
            return;
        }
        MatchRange range;
        if (!matcher.match(entry.name, range)) {
            return;
        }

        SearchMatch match;
        match.relativePath = entry.relativePath;
        match.path = entry.path;
        match.kind = entry.kind;
        match.size = entry.size;
        match.nameRange = range;
        result.matches.push_back(std::move(match));

        if (query.cap > 0 && result.matches.size() >= query.cap) {
            result.capReached = true;
            walker.stop();
        }
    };

    while (auto event = walker.next()) {
        const common::Entry& entry = event->entry;

        switch (event->type) {
            case traversal::VisitType::ENTER_DIR:
                tracker.setCurrentPath(entry.path);
                tracker.tick();
                if (event->depth > 0) {
                    consider(entry, true);
                }
                break;

            case traversal::VisitType::FILE_ENTRY:
                if (event->depth > 0) {
                    consider(entry, false);
                }
                tracker.entryCompleted();
                break;

            case traversal::VisitType::LEAVE_DIR:
                break;

            case traversal::VisitType::DIAGNOSTIC:
                result.errors.emplace_back(entry.path, event->diagnostic, event->cause);
                if (event->diagnostic == common::ErrorCode::CANCELLED) {
                    result.cancelled = true;
                } else if (event->diagnostic == common::ErrorCode::PERMISSION_DENIED &&
                           event->depth > 0 && entry.isDirectory()) {
                    // An unreadable directory can still match by name.
                    consider(entry, true);
                }
                break;
        }
    }

    result.entriesVisited = walker.entriesVisited();
    result.partial = result.cancelled || result.capReached || !result.errors.empty();

    tracker.setPhase(utils::OperationPhase::FINISHING);

    timer.addData("matches", result.matches.size());
    timer.addData("entries_visited", result.entriesVisited);
    timer.addData("cap_reached", result.capReached);
    timer.addData("cancelled", result.cancelled);

    return result;
}

} // namespace scan
} // namespace twinpane
