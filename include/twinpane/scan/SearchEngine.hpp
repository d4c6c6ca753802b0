// include/twinpane/scan/SearchEngine.hpp
#ifndef TWINPANE_SEARCHENGINE_HPP
#define TWINPANE_SEARCHENGINE_HPP

#include "NameMatcher.hpp"
#include "../common/Types.hpp"
#include "../common/Constants.hpp"
#include "../io/FileSystem.hpp"
#include "../traversal/Walker.hpp"
#include "../utils/CancelToken.hpp"
#include "../utils/ProgressChannel.hpp"
#include "../utils/metrics_base.hpp"

#include <memory>
#include <string>
#include <vector>

namespace twinpane {
namespace scan {

enum class SearchFilter {
    ALL,
    FILES_ONLY,
    DIRECTORIES_ONLY
};

struct SearchQuery {
    std::string pattern;
    MatchMode mode;
    bool caseSensitive;
    // 0 means unlimited.
    size_t cap;
    SearchFilter filter;

    SearchQuery()
        : mode(MatchMode::SUBSTRING), caseSensitive(false),
          cap(common::Constants::DEFAULT_SEARCH_CAP), filter(SearchFilter::ALL) {}
};

struct SearchMatch {
    std::string relativePath;
    std::string path;
    common::EntryKind kind;
    uint64_t size;
    // Matched bytes within the entry name (the last path component).
    MatchRange nameRange;

    SearchMatch() : kind(common::EntryKind::OTHER), size(0) {}
};

struct SearchResult {
    std::vector<SearchMatch> matches;
    common::EntryErrorList errors;
    bool partial;
    bool cancelled;
    bool capReached;
    uint64_t entriesVisited;

    SearchResult() : partial(false), cancelled(false), capReached(false), entriesVisited(0) {}
};

// Name search below a root. Matches are listed in traversal order; the root
// itself is never a candidate. Once the cap is reached the walk is stopped,
// so no further directory is opened.
class SearchEngine : public MetricsBase {
public:
    SearchEngine(io::FileSystem& fs, const traversal::WalkOptions& options,
                 std::shared_ptr<metrics::MetricsSink> sink = nullptr);

    SearchResult search(const std::string& root, const SearchQuery& query,
                        const utils::CancelToken& cancel,
                        utils::ProgressSink* progress = nullptr);

private:
    bool accepts(const SearchQuery& query, bool isDirectory) const;

    io::FileSystem& fs_;
    traversal::WalkOptions options_;
};

} // namespace scan
} // namespace twinpane

#endif
