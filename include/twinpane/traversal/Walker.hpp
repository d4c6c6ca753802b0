// include/twinpane/traversal/Walker.hpp
#ifndef TWINPANE_WALKER_HPP
#define TWINPANE_WALKER_HPP

#include "../common/Types.hpp"
#include "../common/Constants.hpp"
#include "../io/FileSystem.hpp"
#include "../utils/CancelToken.hpp"

#include <deque>
#include <memory>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace twinpane {
namespace traversal {

enum class VisitType {
    ENTER_DIR,
    FILE_ENTRY,
    LEAVE_DIR,
    DIAGNOSTIC
};

struct VisitEvent {
    VisitType type;
    common::Entry entry;
    size_t depth;
    // Set for DIAGNOSTIC events only.
    common::ErrorCode diagnostic;
    std::error_code cause;

    VisitEvent() : type(VisitType::DIAGNOSTIC), depth(0), diagnostic(common::ErrorCode::SUCCESS) {}
};

struct WalkOptions {
    common::SymlinkPolicy symlinkPolicy;
    size_t maxDepth;
    // Resolve the root itself when it is a symlink, regardless of policy.
    bool followRootSymlink;

    WalkOptions()
        : symlinkPolicy(common::SymlinkPolicy::OPAQUE),
          maxDepth(common::Constants::DEFAULT_MAX_DEPTH),
          followRootSymlink(true) {}
};

// Single-pass, depth-first directory walker producing visit events on
// demand. Each walker owns the ancestry set of the directories on its
// current descent path; a directory whose identity is already on that path
// is reported as CYCLIC_SYMLINK instead of being entered. Errors become
// DIAGNOSTIC events and never end the walk, except for cancellation, which
// produces one final CANCELLED diagnostic.
//
// Sibling order is the order the directory listing returns.
class Walker : public common::NonCopyable {
public:
    Walker(io::FileSystem& fs, const std::string& root, const WalkOptions& options,
           utils::CancelToken cancel = utils::CancelToken());
    ~Walker();

    std::optional<VisitEvent> next();

    // Called right after next() returned ENTER_DIR: the directory is closed
    // without listing it and no LEAVE_DIR follows for it.
    void skipCurrentDirectory();

    // Ends the walk; further next() calls return nothing.
    void stop();

    bool finished() const { return finished_ && pending_.empty(); }
    bool wasCancelled() const { return cancelled_; }
    uint64_t entriesVisited() const { return entriesVisited_; }
    const std::string& root() const { return root_; }

private:
    struct Frame {
        common::Entry entry;
        size_t depth;
        common::Identity identity;
        std::unique_ptr<io::DirectoryStream> stream;
    };

    void start();
    void visitChild(const Frame& parent, const std::string& name);
    void descend(common::Entry entry, size_t depth, const common::Identity& identity);
    void resolveTarget(common::Entry& entry);
    void cancelAt(const std::string& path, const std::string& relativePath);

    void pushEvent(VisitType type, const common::Entry& entry, size_t depth);
    void pushDiagnostic(const common::Entry& entry, size_t depth, common::ErrorCode code,
                        const std::error_code& cause = {});
    std::optional<VisitEvent> popPending();

    io::FileSystem& fs_;
    std::string root_;
    WalkOptions options_;
    utils::CancelToken cancel_;

    std::vector<Frame> frames_;
    std::set<common::Identity> ancestry_;
    std::deque<VisitEvent> pending_;

    bool started_;
    bool finished_;
    bool cancelled_;
    bool lastWasEnter_;
    uint64_t entriesVisited_;
};

} // namespace traversal
} // namespace twinpane

#endif
