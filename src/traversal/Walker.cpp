// src/traversal/Walker.cpp
#include "twinpane/traversal/Walker.hpp"
#include "twinpane/utils/PathUtils.hpp"

namespace twinpane {
namespace traversal {

namespace {

void applyStatus(const io::FileStatus& st, common::Entry& entry) {
    entry.kind = st.kind;
    entry.size = st.size;
    entry.lastModified = st.lastModified;
    entry.mode = st.mode;
    entry.identity = st.identity;
}

} // namespace

Walker::Walker(io::FileSystem& fs, const std::string& root, const WalkOptions& options,
               utils::CancelToken cancel)
    : fs_(fs)
    , root_(root)
    , options_(options)
    , cancel_(std::move(cancel))
    , started_(false)
    , finished_(false)
    , cancelled_(false)
    , lastWasEnter_(false)
    , entriesVisited_(0) {
}

Walker::~Walker() = default;

std::optional<VisitEvent> Walker::next() {
    if (!pending_.empty()) {
        return popPending();
    }
    if (finished_) {
        return std::nullopt;
    }

    if (!started_) {
        started_ = true;
        start();
        if (frames_.empty()) {
            finished_ = true;
        }
        return popPending();
    }

    while (!frames_.empty()) {
        Frame& top = frames_.back();

        if (cancel_.isCancelled()) {
            cancelAt(top.entry.path, top.entry.relativePath);
            return popPending();
        }

        std::string name;
        std::error_code ec;
        if (!top.stream->next(name, ec)) {
            if (ec) {
                pushDiagnostic(top.entry, top.depth, common::classify(ec), ec);
            }
            pushEvent(VisitType::LEAVE_DIR, top.entry, top.depth);
            ancestry_.erase(top.identity);
            frames_.pop_back();
            if (frames_.empty()) {
                finished_ = true;
            }
            return popPending();
        }

        visitChild(top, name);
        if (!pending_.empty()) {
            return popPending();
        }
    }

    finished_ = true;
    return std::nullopt;
}

void Walker::skipCurrentDirectory() {
    if (!lastWasEnter_ || frames_.empty()) {
        return;
    }
    ancestry_.erase(frames_.back().identity);
    frames_.pop_back();
    lastWasEnter_ = false;
    if (frames_.empty()) {
        finished_ = true;
    }
}

void Walker::stop() {
    pending_.clear();
    frames_.clear();
    ancestry_.clear();
    finished_ = true;
    lastWasEnter_ = false;
}

void Walker::start() {
    common::Entry entry;
    entry.path = root_;
    entry.name = utils::PathUtils::getFileName(root_);

    if (cancel_.isCancelled()) {
        cancelAt(root_, "");
        return;
    }

    io::FileStatus st;
    std::error_code ec = fs_.symlinkStatus(root_, st);
    if (ec) {
        pushDiagnostic(entry, 0, common::classify(ec), ec);
        return;
    }
    applyStatus(st, entry);

    if (entry.isDirectory()) {
        descend(entry, 0, st.identity);
        return;
    }

    if (entry.isSymlink()) {
        resolveTarget(entry);
        bool follow = options_.followRootSymlink ||
                      options_.symlinkPolicy == common::SymlinkPolicy::FOLLOW;
        if (follow && entry.target.valid && entry.target.kind == common::EntryKind::DIRECTORY) {
            descend(entry, 0, entry.target.identity);
            return;
        }
    }

    entriesVisited_++;
    pushEvent(VisitType::FILE_ENTRY, entry, 0);
}

void Walker::visitChild(const Frame& parent, const std::string& name) {
    common::Entry entry;
    entry.name = name;
    entry.path = utils::PathUtils::combinePaths(parent.entry.path, name);
    entry.relativePath = parent.entry.relativePath.empty()
        ? name
        : parent.entry.relativePath + "/" + name;
    size_t depth = parent.depth + 1;

    entriesVisited_++;

    io::FileStatus st;
    std::error_code ec = fs_.symlinkStatus(entry.path, st);
    if (ec) {
        pushDiagnostic(entry, depth, common::classify(ec), ec);
        return;
    }
    applyStatus(st, entry);

    if (entry.isDirectory()) {
        descend(std::move(entry), depth, st.identity);
        return;
    }

    if (entry.isSymlink()) {
        resolveTarget(entry);
        if (options_.symlinkPolicy == common::SymlinkPolicy::FOLLOW &&
            entry.target.valid && entry.target.kind == common::EntryKind::DIRECTORY) {
            common::Identity targetIdentity = entry.target.identity;
            descend(std::move(entry), depth, targetIdentity);
            return;
        }
    }

    pushEvent(VisitType::FILE_ENTRY, entry, depth);
}

void Walker::descend(common::Entry entry, size_t depth, const common::Identity& identity) {
    if (cancel_.isCancelled()) {
        cancelAt(entry.path, entry.relativePath);
        return;
    }

    if (ancestry_.count(identity) > 0) {
        pushDiagnostic(entry, depth, common::ErrorCode::CYCLIC_SYMLINK);
        return;
    }

    if (depth > options_.maxDepth) {
        pushDiagnostic(entry, depth, common::ErrorCode::DEPTH_EXCEEDED);
        return;
    }

    std::unique_ptr<io::DirectoryStream> stream;
    std::error_code ec = fs_.openDirectory(entry.path, stream);
    if (ec) {
        pushDiagnostic(entry, depth, common::classify(ec), ec);
        return;
    }

    ancestry_.insert(identity);
    pushEvent(VisitType::ENTER_DIR, entry, depth);

    Frame frame;
    frame.entry = std::move(entry);
    frame.depth = depth;
    frame.identity = identity;
    frame.stream = std::move(stream);
    frames_.push_back(std::move(frame));
}

void Walker::resolveTarget(common::Entry& entry) {
    std::error_code ec = fs_.readLink(entry.path, entry.linkTarget);
    if (ec) {
        entry.target.error = ec;
    }

    io::FileStatus target;
    ec = fs_.status(entry.path, target);
    if (ec) {
        entry.target.valid = false;
        entry.target.error = ec;
        return;
    }

    entry.target.valid = true;
    entry.target.kind = target.kind;
    entry.target.size = target.size;
    entry.target.identity = target.identity;
}

void Walker::cancelAt(const std::string& path, const std::string& relativePath) {
    common::Entry entry;
    entry.path = path;
    entry.relativePath = relativePath;
    entry.name = utils::PathUtils::getFileName(path);

    size_t depth = frames_.empty() ? 0 : frames_.back().depth;
    pushDiagnostic(entry, depth, common::ErrorCode::CANCELLED);

    cancelled_ = true;
    finished_ = true;
    frames_.clear();
    ancestry_.clear();
}

void Walker::pushEvent(VisitType type, const common::Entry& entry, size_t depth) {
    VisitEvent event;
    event.type = type;
    event.entry = entry;
    event.depth = depth;
    pending_.push_back(std::move(event));
}

void Walker::pushDiagnostic(const common::Entry& entry, size_t depth, common::ErrorCode code,
                            const std::error_code& cause) {
    VisitEvent event;
    event.type = VisitType::DIAGNOSTIC;
    event.entry = entry;
    event.depth = depth;
    event.diagnostic = code;
    event.cause = cause;
    pending_.push_back(std::move(event));
}

std::optional<VisitEvent> Walker::popPending() {
    if (pending_.empty()) {
        lastWasEnter_ = false;
        return std::nullopt;
    }
    VisitEvent event = std::move(pending_.front());
    pending_.pop_front();
    lastWasEnter_ = (event.type == VisitType::ENTER_DIR);
    return event;
}

} // namespace traversal
} // namespace twinpane
