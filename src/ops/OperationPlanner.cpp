// src/ops/OperationPlanner.cpp
#include "twinpane/ops/OperationPlanner.hpp"
#include "twinpane/utils/FilenameValidator.hpp"
#include "twinpane/utils/PathUtils.hpp"

#include <algorithm>
#include <limits>

namespace twinpane {
namespace ops {

namespace {

const size_t kNoItem = std::numeric_limits<size_t>::max();

PlanItem itemFromEntry(const common::Entry& entry, size_t rootIndex) {
    PlanItem item;
    item.sourcePath = entry.path;
    item.relativePath = entry.relativePath;
    item.kind = entry.kind;
    item.size = entry.isDirectory() ? 0 : entry.size;
    item.mode = entry.mode;
    item.lastModified = entry.lastModified;
    item.linkTarget = entry.linkTarget;
    item.rootIndex = rootIndex;
    return item;
}

std::error_code diagnosticError(const traversal::VisitEvent& event) {
    if (event.cause) {
        return event.cause;
    }
    return common::make_error_code(event.diagnostic);
}

} // namespace

OperationPlanner::OperationPlanner(io::FileSystem& fs, const OperationOptions& options,
                                   std::shared_ptr<metrics::MetricsSink> sink)
    : MetricsBase("OperationPlanner", std::move(sink))
    , fs_(fs)
    , options_(options) {
}

std::error_code OperationPlanner::plan(const OperationRequest& request,
                                       const utils::CancelToken& cancel,
                                       utils::ProgressTracker* tracker, OperationPlan& plan) {
    plan = OperationPlan();
    plan.kind = request.kind;
    plan.destinationDir = request.destinationDir;
    collisions_ = CollisionState();
    claimedDestinations_.clear();

    if (tracker) {
        tracker->setPhase(utils::OperationPhase::PLANNING);
    }

    std::error_code ec = request.kind == OperationKind::DELETE
        ? planDelete(request, cancel, tracker, plan)
        : planTransfer(request, cancel, tracker, plan);

    if (ec) {
        logWarning("plan", "Planning stopped",
                   {{"kind", operationKindName(request.kind)},
                    {"reason", common::errorName(common::classify(ec))},
                    {"path", plan.abortPath}});
        return ec;
    }

    plan.totalBytes = 0;
    for (const auto& item : plan.items) {
        plan.totalBytes += item.size;
    }

    logInfo("plan", "Plan built",
            {{"kind", operationKindName(request.kind)},
             {"items", plan.items.size()},
             {"bytes", plan.totalBytes},
             {"errors", plan.errors.size()},
             {"skipped", plan.skippedEntries}});
    return {};
}

std::error_code OperationPlanner::planTransfer(const OperationRequest& request,
                                               const utils::CancelToken& cancel,
                                               utils::ProgressTracker* tracker,
                                               OperationPlan& plan) {
    if (request.destinationDir.empty()) {
        return common::ErrorCode::NOT_FOUND;
    }

    io::FileStatus st;
    std::error_code ec = fs_.status(request.destinationDir, st);
    if (ec) {
        plan.abortPath = request.destinationDir;
        return ec;
    }
    if (st.kind != common::EntryKind::DIRECTORY) {
        plan.abortPath = request.destinationDir;
        return common::ErrorCode::NOT_A_DIRECTORY;
    }

    std::string destinationReal;
    ec = fs_.realPath(request.destinationDir, destinationReal);
    if (ec) {
        plan.abortPath = request.destinationDir;
        return ec;
    }

    for (size_t i = 0; i < request.sources.size(); ++i) {
        ec = planTransferRoot(request.sources[i], i, request, destinationReal, cancel, tracker, plan);
        if (ec) {
            return ec;
        }
    }
    return {};
}

std::error_code OperationPlanner::planTransferRoot(const std::string& requestedSource, size_t rootIndex,
                                                   const OperationRequest& request,
                                                   const std::string& destinationReal,
                                                   const utils::CancelToken& cancel,
                                                   utils::ProgressTracker* tracker,
                                                   OperationPlan& plan) {
    if (cancel.isCancelled()) {
        plan.abortPath = requestedSource;
        return common::ErrorCode::CANCELLED;
    }

    std::string source;
    std::error_code ec = resolveDotSource(requestedSource, source);
    if (ec) {
        plan.abortPath = requestedSource;
        return ec;
    }

    io::FileStatus st;
    ec = fs_.symlinkStatus(source, st);
    if (ec) {
        plan.abortPath = source;
        return ec;
    }

    if (st.kind == common::EntryKind::DIRECTORY) {
        std::string sourceReal;
        ec = fs_.realPath(source, sourceReal);
        if (ec) {
            plan.abortPath = source;
            return ec;
        }
        if (utils::PathUtils::isWithin(sourceReal, destinationReal)) {
            plan.abortPath = source;
            return common::ErrorCode::SAME_SOURCE_AND_DESTINATION;
        }
    }

    std::string target = utils::PathUtils::combinePaths(request.destinationDir,
                                                       utils::PathUtils::getFileName(source));
    io::FileStatus existing;
    if (!fs_.symlinkStatus(target, existing) && existing.identity == st.identity) {
        plan.abortPath = source;
        return common::ErrorCode::SAME_SOURCE_AND_DESTINATION;
    }

    PlanRoot root;
    root.sourcePath = source;
    root.kind = st.kind;
    root.firstItem = plan.items.size();

    traversal::WalkOptions walkOptions;
    walkOptions.symlinkPolicy = common::SymlinkPolicy::OPAQUE;
    walkOptions.maxDepth = options_.maxDepth;
    walkOptions.followRootSymlink = false;

    traversal::Walker walker(fs_, source, walkOptions, cancel);
    std::vector<DestinationFrame> frames;

    while (auto event = walker.next()) {
        const common::Entry& entry = event->entry;

        if (tracker) {
            tracker->setCurrentPath(entry.path);
            tracker->tick();
        }

        std::string parentPath = frames.empty() ? request.destinationDir : frames.back().path;
        bool parentPreExisting = frames.empty() ? true : frames.back().preExisting;

        switch (event->type) {
            case traversal::VisitType::ENTER_DIR: {
                std::string destination = utils::PathUtils::combinePaths(parentPath, entry.name);
                Disposition disposition = Disposition::CREATE;
                bool preExisting = false;

                if (claimedDestinations_.count(destination) > 0) {
                    plan.errors.emplace_back(entry.path, common::ErrorCode::DESTINATION_COLLISION,
                                             std::error_code(),
                                             "destination is used by another source: " + destination);
                    taint(frames);
                    walker.skipCurrentDirectory();
                    break;
                }

                io::FileStatus present;
                if (parentPreExisting && !fs_.symlinkStatus(destination, present)) {
                    if (present.kind != common::EntryKind::DIRECTORY) {
                        plan.errors.emplace_back(entry.path, common::ErrorCode::DESTINATION_COLLISION,
                                                 std::error_code(),
                                                 "a non-directory exists at " + destination);
                        taint(frames);
                        walker.skipCurrentDirectory();
                        break;
                    }
                    disposition = Disposition::MERGE;
                    preExisting = true;
                }

                PlanItem item = itemFromEntry(entry, rootIndex);
                item.destinationPath = destination;
                item.disposition = disposition;
                plan.items.push_back(item);
                claimedDestinations_.insert(destination);

                DestinationFrame frame;
                frame.path = destination;
                frame.preExisting = preExisting;
                frame.itemIndex = plan.items.size() - 1;
                frame.tainted = false;
                frames.push_back(frame);
                break;
            }

            case traversal::VisitType::FILE_ENTRY: {
                if (entry.kind == common::EntryKind::OTHER) {
                    plan.errors.emplace_back(entry.path, common::ErrorCode::IO_FAILURE,
                                             std::error_code(), "unsupported file type");
                    taint(frames);
                    break;
                }
                if (request.kind == OperationKind::COPY && entry.isSymlink() && isSensitiveLink(entry)) {
                    plan.errors.emplace_back(entry.path, common::ErrorCode::SENSITIVE_SYMLINK_TARGET,
                                             std::error_code(), entry.linkTarget);
                    taint(frames);
                    break;
                }

                std::string destination = utils::PathUtils::combinePaths(parentPath, entry.name);
                Disposition disposition = Disposition::CREATE;
                if (parentPreExisting &&
                    !resolveDestination(entry, parentPath, request, plan, destination, disposition)) {
                    taint(frames);
                    break;
                }

                PlanItem item = itemFromEntry(entry, rootIndex);
                item.destinationPath = destination;
                item.disposition = disposition;
                plan.items.push_back(item);
                claimedDestinations_.insert(destination);
                break;
            }

            case traversal::VisitType::LEAVE_DIR: {
                if (frames.empty()) {
                    break;
                }
                DestinationFrame done = frames.back();
                frames.pop_back();
                if (done.tainted) {
                    if (done.itemIndex != kNoItem) {
                        plan.items[done.itemIndex].retainSource = true;
                    }
                    taint(frames);
                }
                break;
            }

            case traversal::VisitType::DIAGNOSTIC:
                if (event->diagnostic == common::ErrorCode::CANCELLED) {
                    plan.abortPath = entry.path;
                    return common::ErrorCode::CANCELLED;
                }
                if (event->depth == 0) {
                    plan.abortPath = entry.path;
                    return diagnosticError(*event);
                }
                plan.errors.emplace_back(entry.path, event->diagnostic, event->cause);
                taint(frames);
                break;
        }
    }

    root.itemCount = plan.items.size() - root.firstItem;
    if (root.itemCount > 0) {
        const PlanItem& first = plan.items[root.firstItem];
        root.destinationPath = first.destinationPath;
        root.renameCandidate = request.kind == OperationKind::MOVE &&
                               first.disposition != Disposition::MERGE;
    }
    for (size_t i = root.firstItem; i < plan.items.size(); ++i) {
        root.bytes += plan.items[i].size;
    }
    plan.roots.push_back(root);

    return {};
}

bool OperationPlanner::resolveDestination(const common::Entry& entry, const std::string& parentPath,
                                          const OperationRequest& request, OperationPlan& plan,
                                          std::string& destination, Disposition& disposition) {
    destination = utils::PathUtils::combinePaths(parentPath, entry.name);
    disposition = Disposition::CREATE;

    io::FileStatus existing;
    bool onDisk = !fs_.symlinkStatus(destination, existing);
    bool claimed = claimedDestinations_.count(destination) > 0;

    if (!onDisk && !claimed) {
        return true;
    }

    if (!onDisk || claimed) {
        plan.errors.emplace_back(entry.path, common::ErrorCode::DESTINATION_COLLISION,
                                 std::error_code(),
                                 "destination is used by another source: " + destination);
        return false;
    }

    if (existing.identity == entry.identity) {
        plan.errors.emplace_back(entry.path, common::ErrorCode::SAME_SOURCE_AND_DESTINATION);
        return false;
    }

    if (existing.kind == common::EntryKind::DIRECTORY) {
        plan.errors.emplace_back(entry.path, common::ErrorCode::DESTINATION_COLLISION,
                                 std::error_code(), "a directory exists at " + destination);
        return false;
    }

    CollisionDecision decision;
    std::string newName;

    if (collisions_.overwriteAll) {
        decision = CollisionDecision::OVERWRITE;
    } else if (collisions_.skipAll) {
        decision = CollisionDecision::SKIP;
    } else if (!request.resolver) {
        plan.errors.emplace_back(entry.path, common::ErrorCode::DESTINATION_COLLISION,
                                 std::error_code(), destination);
        return false;
    } else {
        Collision collision;
        collision.sourcePath = entry.path;
        collision.destinationPath = destination;
        collision.relativePath = entry.relativePath;
        collision.sourceKind = entry.kind;
        collision.destinationKind = existing.kind;
        collision.sourceSize = entry.size;
        collision.destinationSize = existing.size;
        collision.sourceModified = entry.lastModified;
        collision.destinationModified = existing.lastModified;

        CollisionResolution resolution = request.resolver(collision);
        decision = resolution.decision;
        newName = resolution.newName;
    }

    switch (decision) {
        case CollisionDecision::OVERWRITE_ALL:
            collisions_.overwriteAll = true;
            disposition = Disposition::OVERWRITE;
            return true;

        case CollisionDecision::OVERWRITE:
            disposition = Disposition::OVERWRITE;
            return true;

        case CollisionDecision::SKIP_ALL:
            collisions_.skipAll = true;
            plan.skippedEntries++;
            return false;

        case CollisionDecision::SKIP:
            plan.skippedEntries++;
            return false;

        case CollisionDecision::RENAME: {
            if (!newName.empty()) {
                std::string reason;
                if (utils::FilenameValidator::validate(newName, reason)) {
                    plan.errors.emplace_back(entry.path, common::ErrorCode::INVALID_FILENAME,
                                             std::error_code(), reason);
                    return false;
                }
                std::string renamed = utils::PathUtils::combinePaths(parentPath, newName);
                if (destinationTaken(renamed)) {
                    plan.errors.emplace_back(entry.path, common::ErrorCode::DESTINATION_COLLISION,
                                             std::error_code(), renamed);
                    return false;
                }
                destination = renamed;
            } else {
                destination = generateRenamedPath(parentPath, entry.name);
                if (destination.empty()) {
                    plan.errors.emplace_back(entry.path, common::ErrorCode::DESTINATION_COLLISION,
                                             std::error_code(), "no free name in " + parentPath);
                    return false;
                }
            }
            disposition = Disposition::RENAMED;
            return true;
        }
    }

    return false;
}

std::error_code OperationPlanner::planDelete(const OperationRequest& request,
                                             const utils::CancelToken& cancel,
                                             utils::ProgressTracker* tracker,
                                             OperationPlan& plan) {
    for (size_t rootIndex = 0; rootIndex < request.sources.size(); ++rootIndex) {
        if (cancel.isCancelled()) {
            plan.abortPath = request.sources[rootIndex];
            return common::ErrorCode::CANCELLED;
        }

        std::string source;
        std::error_code ec = resolveDotSource(request.sources[rootIndex], source);
        if (ec) {
            plan.abortPath = request.sources[rootIndex];
            return ec;
        }

        io::FileStatus st;
        ec = fs_.symlinkStatus(source, st);
        if (ec) {
            plan.abortPath = source;
            return ec;
        }

        // Canonical location of the entry itself; a symlink is not resolved.
        std::string normalized = utils::PathUtils::normalizePath(source);
        std::string canonical = "/";
        if (normalized != "/") {
            std::string parent = utils::PathUtils::getParentPath(normalized);
            std::string parentReal;
            ec = fs_.realPath(parent.empty() ? "." : parent, parentReal);
            if (ec) {
                plan.abortPath = source;
                return ec;
            }
            canonical = utils::PathUtils::combinePaths(parentReal, utils::PathUtils::getFileName(normalized));
        }

        bool protectedPath = isProtected(canonical);
        if (!protectedPath && st.kind == common::EntryKind::DIRECTORY) {
            std::string resolved;
            ec = fs_.realPath(source, resolved);
            if (ec) {
                plan.abortPath = source;
                return ec;
            }
            protectedPath = isProtected(resolved);
        }
        if (protectedPath) {
            plan.abortPath = source;
            return common::ErrorCode::PROTECTED_PATH;
        }

        PlanRoot root;
        root.sourcePath = source;
        root.kind = st.kind;
        root.firstItem = plan.items.size();

        traversal::WalkOptions walkOptions;
        walkOptions.symlinkPolicy = common::SymlinkPolicy::OPAQUE;
        walkOptions.maxDepth = options_.maxDepth;
        walkOptions.followRootSymlink = false;

        traversal::Walker walker(fs_, source, walkOptions, cancel);
        std::vector<DestinationFrame> frames;

        while (auto event = walker.next()) {
            const common::Entry& entry = event->entry;

            if (tracker) {
                tracker->setCurrentPath(entry.path);
                tracker->tick();
            }

            switch (event->type) {
                case traversal::VisitType::ENTER_DIR: {
                    DestinationFrame frame;
                    frame.path = entry.path;
                    frame.preExisting = true;
                    frame.itemIndex = kNoItem;
                    frame.tainted = false;
                    frames.push_back(frame);
                    break;
                }

                case traversal::VisitType::FILE_ENTRY: {
                    PlanItem item = itemFromEntry(entry, rootIndex);
                    item.disposition = Disposition::REMOVE;
                    plan.items.push_back(item);
                    break;
                }

                case traversal::VisitType::LEAVE_DIR: {
                    if (frames.empty()) {
                        break;
                    }
                    DestinationFrame done = frames.back();
                    frames.pop_back();
                    if (done.tainted) {
                        // Content stays behind, so the directory does too.
                        taint(frames);
                        break;
                    }
                    PlanItem item = itemFromEntry(entry, rootIndex);
                    item.disposition = Disposition::REMOVE;
                    plan.items.push_back(item);
                    break;
                }

                case traversal::VisitType::DIAGNOSTIC:
                    if (event->diagnostic == common::ErrorCode::CANCELLED) {
                        plan.abortPath = entry.path;
                        return common::ErrorCode::CANCELLED;
                    }
                    if (event->depth == 0) {
                        plan.abortPath = entry.path;
                        return diagnosticError(*event);
                    }
                    plan.errors.emplace_back(entry.path, event->diagnostic, event->cause);
                    taint(frames);
                    break;
            }
        }

        root.itemCount = plan.items.size() - root.firstItem;
        for (size_t i = root.firstItem; i < plan.items.size(); ++i) {
            root.bytes += plan.items[i].size;
        }
        plan.roots.push_back(root);
    }

    return {};
}

std::error_code OperationPlanner::resolveDotSource(const std::string& source, std::string& resolved) {
    std::string name = utils::PathUtils::getFileName(source);
    if (name != "." && name != "..") {
        resolved = source;
        return {};
    }
    // "dir/." and "dir/.." carry no name of their own to copy under.
    return fs_.realPath(source, resolved);
}

bool OperationPlanner::isSensitiveLink(const common::Entry& entry) const {
    if (!options_.rejectSensitiveSymlinks || entry.linkTarget.empty() || entry.linkTarget[0] != '/') {
        return false;
    }

    std::string target = utils::PathUtils::normalizePath(entry.linkTarget);
    const auto& sensitive = common::Constants::sensitiveSymlinkTargets();
    return std::any_of(sensitive.begin(), sensitive.end(), [&target](const std::string& prefix) {
        return utils::PathUtils::isWithin(prefix, target);
    });
}

bool OperationPlanner::isProtected(const std::string& canonicalPath) const {
    std::string path = utils::PathUtils::normalizePath(canonicalPath);
    const auto& protectedPaths = common::Constants::protectedPaths();
    return std::find(protectedPaths.begin(), protectedPaths.end(), path) != protectedPaths.end();
}

std::string OperationPlanner::generateRenamedPath(const std::string& parentPath, const std::string& name) {
    std::string stem;
    std::string extension;
    utils::PathUtils::splitExtension(name, stem, extension);

    for (int n = 1; n <= common::Constants::MAX_RENAME_ATTEMPTS; ++n) {
        std::string candidate = utils::PathUtils::combinePaths(
            parentPath, stem + " (" + std::to_string(n) + ")" + extension);
        if (!destinationTaken(candidate)) {
            return candidate;
        }
    }
    return std::string();
}

bool OperationPlanner::destinationTaken(const std::string& path) {
    return claimedDestinations_.count(path) > 0 || fs_.exists(path);
}

void OperationPlanner::taint(std::vector<DestinationFrame>& frames) {
    if (!frames.empty()) {
        frames.back().tainted = true;
    }
}

} // namespace ops
} // namespace twinpane
