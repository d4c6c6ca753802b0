// src/ops/BulkOperationExecutor.cpp
#include "twinpane/ops/BulkOperationExecutor.hpp"
#include "twinpane/io/FileDigest.hpp"
#include "twinpane/utils/PathUtils.hpp"

#include <openssl/rand.h>

#include <algorithm>

namespace twinpane {
namespace ops {

namespace {

bool isBelow(const std::string& child, const std::string& parent) {
    if (parent.empty()) {
        return !child.empty();
    }
    return child.size() > parent.size() &&
           child.compare(0, parent.size(), parent) == 0 &&
           child[parent.size()] == '/';
}

std::error_code randomToken(std::string& token) {
    static const char digits[] = "0123456789abcdef";
    unsigned char bytes[common::Constants::PARTIAL_TOKEN_LENGTH / 2];

    if (RAND_bytes(bytes, sizeof(bytes)) != 1) {
        return common::make_error_code(common::ErrorCode::IO_FAILURE);
    }
    token.clear();
    for (unsigned char byte : bytes) {
        token += digits[byte >> 4];
        token += digits[byte & 0x0f];
    }
    return {};
}

} // namespace

BulkOperationExecutor::BulkOperationExecutor(io::FileSystem& fs, const OperationOptions& options,
                                             std::shared_ptr<metrics::MetricsSink> sink)
    : MetricsBase("BulkOperationExecutor", std::move(sink))
    , fs_(fs)
    , options_(options) {
    if (options_.chunkSize < common::Constants::MIN_CHUNK_SIZE) {
        options_.chunkSize = common::Constants::MIN_CHUNK_SIZE;
    } else if (options_.chunkSize > common::Constants::MAX_CHUNK_SIZE) {
        options_.chunkSize = common::Constants::MAX_CHUNK_SIZE;
    }
}

OperationResult BulkOperationExecutor::run(const OperationRequest& request,
                                           const utils::CancelToken& cancel,
                                           utils::ProgressSink* progress) {
    utils::ProgressTracker tracker(progress, options_.progressIntervalBytes);

    OperationPlanner planner(fs_, options_, getMetricsSink());
    planner.enableMetrics(isMetricsEnabled());

    OperationPlan plan;
    std::error_code ec = planner.plan(request, cancel, &tracker, plan);
    if (!ec) {
        return execute(plan, cancel, tracker);
    }

    OperationResult result;
    result.kind = request.kind;
    result.errors = plan.errors;
    result.skippedEntries = plan.skippedEntries;

    common::ErrorCode code = common::classify(ec);
    if (code == common::ErrorCode::CANCELLED) {
        result.state = OperationState::CANCELLED;
    } else {
        result.state = OperationState::ABORTED;
        result.fatalError = code;
        result.fatalPath = plan.abortPath;
        result.fatalCause = ec;
        logError("run", "Operation aborted during planning", ec.value(),
                 {{"kind", operationKindName(request.kind)},
                  {"reason", common::errorName(code)},
                  {"path", plan.abortPath}});
    }

    tracker.setPhase(utils::OperationPhase::FINISHING);
    return result;
}

OperationResult BulkOperationExecutor::execute(const OperationPlan& plan,
                                               const utils::CancelToken& cancel,
                                               utils::ProgressTracker& tracker) {
    ScopedTimer timer(*this, "execute", {{"kind", operationKindName(plan.kind)}});

    OperationResult result;
    result.kind = plan.kind;
    result.state = OperationState::EXECUTING;
    result.entriesTotal = plan.items.size();
    result.bytesTotal = plan.totalBytes;
    result.skippedEntries = plan.skippedEntries;

    ExecutionState state(plan, result, tracker);

    tracker.setPhase(utils::OperationPhase::EXECUTING);
    tracker.setTotals(plan.totalBytes, plan.items.size());

    switch (plan.kind) {
        case OperationKind::COPY:
            executeCopy(state, cancel);
            break;
        case OperationKind::MOVE:
            executeMove(state, cancel);
            break;
        case OperationKind::DELETE:
            executeDelete(state, cancel);
            break;
    }

    applyDirectoryAttributes(state);
    finishResult(state);

    tracker.setPhase(utils::OperationPhase::FINISHING);

    timer.addData("state", operationStateName(result.state));
    timer.addData("entries", result.entriesCompleted);
    timer.addData("bytes", result.bytesDone);
    timer.addData("errors", result.errors.size());
    if (result.state == OperationState::ABORTED) {
        timer.setFailed(static_cast<int>(result.fatalError), common::errorName(result.fatalError));
    }
    return result;
}

void BulkOperationExecutor::executeCopy(ExecutionState& state, const utils::CancelToken& cancel) {
    const auto& items = state.plan.items;

    size_t i = 0;
    while (i < items.size() && !state.fatal) {
        if (cancel.isCancelled()) {
            state.cancelled = true;
            break;
        }

        const PlanItem& item = items[i];
        state.tracker.setCurrentPath(item.sourcePath);

        bool ok = transferEntry(state, item);
        state.tracker.entryCompleted();

        if (ok) {
            state.result.entriesCompleted++;
        } else if (item.kind == common::EntryKind::DIRECTORY && !state.fatal) {
            // Nothing below a directory that could not be created.
            size_t end = subtreeEnd(state.plan, i);
            state.result.skippedEntries += end - i - 1;
            for (size_t j = i + 1; j < end; ++j) {
                state.tracker.entryCompleted();
            }
            i = end;
            continue;
        }
        ++i;
    }
}

void BulkOperationExecutor::executeMove(ExecutionState& state, const utils::CancelToken& cancel) {
    for (size_t r = 0; r < state.plan.roots.size(); ++r) {
        if (state.fatal) {
            break;
        }
        if (cancel.isCancelled()) {
            state.cancelled = true;
            break;
        }

        const PlanRoot& root = state.plan.roots[r];
        if (root.itemCount == 0) {
            continue;
        }

        bool crossDevice = false;
        if (root.renameCandidate) {
            state.tracker.setCurrentPath(root.sourcePath);
            std::error_code ec = fs_.rename(root.sourcePath, root.destinationPath);
            if (!ec) {
                state.result.entriesCompleted += root.itemCount;
                state.result.bytesDone += root.bytes;
                state.tracker.addProcessedBytes(root.bytes);
                for (size_t j = 0; j < root.itemCount; ++j) {
                    state.tracker.entryCompleted();
                }
                state.renamedRoots.push_back(r);
                logDebug("move", "Moved by rename",
                         {{"source", root.sourcePath}, {"destination", root.destinationPath}});
                continue;
            }

            if (common::classify(ec) != common::ErrorCode::CROSS_DEVICE_MOVE) {
                const PlanItem& rootItem = state.plan.items[root.firstItem];
                recordFailure(state, rootItem, root.sourcePath, ec, true);
                for (size_t j = 0; j < root.itemCount; ++j) {
                    state.tracker.entryCompleted();
                }
                continue;
            }

            crossDevice = true;
            logInfo("move", "Source and destination are on different devices, copying instead",
                    {{"source", root.sourcePath}, {"destination", root.destinationPath}});
        }

        moveRootEntries(state, root, crossDevice, cancel);
    }
}

void BulkOperationExecutor::moveRootEntries(ExecutionState& state, const PlanRoot& root,
                                            bool crossDevice, const utils::CancelToken& cancel) {
    const auto& items = state.plan.items;
    size_t end = root.firstItem + root.itemCount;

    size_t i = root.firstItem;
    while (i < end && !state.fatal) {
        if (cancel.isCancelled()) {
            state.cancelled = true;
            break;
        }

        const PlanItem& item = items[i];
        state.tracker.setCurrentPath(item.sourcePath);

        if (item.kind == common::EntryKind::DIRECTORY) {
            bool ok = transferEntry(state, item);
            state.tracker.entryCompleted();
            if (ok) {
                state.result.entriesCompleted++;
                ++i;
                continue;
            }
            if (state.fatal) {
                break;
            }
            state.retained.insert(std::make_pair(item.rootIndex, item.relativePath));
            size_t skipEnd = subtreeEnd(state.plan, i);
            state.result.skippedEntries += skipEnd - i - 1;
            for (size_t j = i + 1; j < skipEnd; ++j) {
                state.tracker.entryCompleted();
            }
            i = skipEnd;
            continue;
        }

        bool moved = false;
        bool failed = false;
        if (!crossDevice) {
            std::error_code ec = fs_.rename(item.sourcePath, item.destinationPath);
            if (!ec) {
                moved = true;
            } else if (common::classify(ec) == common::ErrorCode::CROSS_DEVICE_MOVE) {
                crossDevice = true;
            } else {
                recordFailure(state, item, item.sourcePath, ec, true);
                failed = true;
            }
        }

        if (moved) {
            state.result.bytesDone += item.size;
            state.tracker.addProcessedBytes(item.size);
            state.result.entriesCompleted++;
        } else if (!failed && transferEntry(state, item)) {
            std::error_code ec = fs_.removeFile(item.sourcePath);
            if (ec) {
                recordFailure(state, item, item.sourcePath, ec, false,
                              "copied, but the source could not be removed");
            } else {
                state.result.crossDeviceFallbacks++;
                state.result.entriesCompleted++;
            }
        }

        state.tracker.entryCompleted();
        ++i;
    }

    removeMovedDirectories(state, root, i);
}

void BulkOperationExecutor::removeMovedDirectories(ExecutionState& state, const PlanRoot& root,
                                                   size_t processedEnd) {
    const auto& items = state.plan.items;

    for (size_t k = root.firstItem + root.itemCount; k-- > root.firstItem;) {
        const PlanItem& item = items[k];
        if (item.kind != common::EntryKind::DIRECTORY) {
            continue;
        }
        if (item.retainSource || isRetained(state, item) || subtreeEnd(state.plan, k) > processedEnd) {
            markRetained(state, item);
            continue;
        }
        std::error_code ec = fs_.removeDirectory(item.sourcePath);
        if (ec) {
            recordFailure(state, item, item.sourcePath, ec, false);
            if (state.fatal) {
                return;
            }
        }
    }
}

void BulkOperationExecutor::executeDelete(ExecutionState& state, const utils::CancelToken& cancel) {
    for (const auto& item : state.plan.items) {
        if (state.fatal) {
            break;
        }
        if (cancel.isCancelled()) {
            state.cancelled = true;
            break;
        }

        state.tracker.setCurrentPath(item.sourcePath);

        if (item.kind == common::EntryKind::DIRECTORY && isRetained(state, item)) {
            markRetained(state, item);
            state.tracker.entryCompleted();
            continue;
        }

        std::error_code ec = item.kind == common::EntryKind::DIRECTORY
            ? fs_.removeDirectory(item.sourcePath)
            : fs_.removeFile(item.sourcePath);

        if (ec) {
            recordFailure(state, item, item.sourcePath, ec, false);
        } else {
            state.result.entriesCompleted++;
            state.result.bytesDone += item.size;
            state.tracker.addProcessedBytes(item.size);
        }
        state.tracker.entryCompleted();
    }
}

bool BulkOperationExecutor::transferEntry(ExecutionState& state, const PlanItem& item) {
    switch (item.kind) {
        case common::EntryKind::DIRECTORY: {
            if (item.disposition == Disposition::MERGE) {
                return true;
            }
            // Owner keeps write access until the final attributes are applied.
            std::error_code ec = fs_.createDirectory(item.destinationPath, (item.mode & 07777) | 0700);
            if (ec) {
                recordFailure(state, item, item.destinationPath, ec, true);
                return false;
            }
            state.createdDirectories.push_back(&item);
            return true;
        }

        case common::EntryKind::SYMLINK: {
            if (item.disposition == Disposition::OVERWRITE) {
                std::error_code ec = fs_.removeFile(item.destinationPath);
                if (ec && common::classify(ec) != common::ErrorCode::NOT_FOUND) {
                    recordFailure(state, item, item.destinationPath, ec, true);
                    return false;
                }
            }
            std::error_code ec = fs_.createSymlink(item.linkTarget, item.destinationPath);
            if (ec) {
                recordFailure(state, item, item.destinationPath, ec, true);
                return false;
            }
            if (options_.preserveAttributes) {
                ec = fs_.setAttributes(item.destinationPath, item.mode, item.lastModified, true);
                if (ec) {
                    logWarning("transfer", "Could not set link time",
                               {{"path", item.destinationPath}, {"error", ec.message()}});
                }
            }
            state.result.bytesDone += item.size;
            state.tracker.addProcessedBytes(item.size);
            return true;
        }

        case common::EntryKind::FILE:
            return copyFileContent(state, item);

        default:
            state.result.errors.emplace_back(item.sourcePath, common::ErrorCode::IO_FAILURE,
                                             std::error_code(), "unsupported file type");
            markRetained(state, item);
            return false;
    }
}

bool BulkOperationExecutor::copyFileContent(ExecutionState& state, const PlanItem& item) {
    std::unique_ptr<io::FileHandler> input;
    std::error_code ec = fs_.openRead(item.sourcePath, input);
    if (ec) {
        recordFailure(state, item, item.sourcePath, ec, false);
        return false;
    }

    std::string tempPath;
    std::unique_ptr<io::FileHandler> output;
    ec = createPartialFile(item, tempPath, output);
    if (ec) {
        recordFailure(state, item, item.destinationPath, ec, true);
        return false;
    }

    if (state.buffer.size() != options_.chunkSize) {
        state.buffer.resize(options_.chunkSize);
    }

    uint64_t copied = 0;
    while (true) {
        size_t bytesRead = 0;
        ec = input->read(state.buffer.data(), state.buffer.size(), bytesRead);
        if (ec) {
            discardPartial(output, tempPath);
            recordFailure(state, item, item.sourcePath, ec, false);
            return false;
        }
        if (bytesRead == 0) {
            break;
        }

        ec = output->write(state.buffer.data(), bytesRead);
        if (ec) {
            discardPartial(output, tempPath);
            recordFailure(state, item, item.destinationPath, ec, true);
            return false;
        }

        copied += bytesRead;
        state.tracker.addProcessedBytes(bytesRead);
    }

    std::error_code closeInput = input->close();
    if (closeInput) {
        logWarning("copy", "Closing source failed",
                   {{"path", item.sourcePath}, {"error", closeInput.message()}});
    }

    if (options_.syncOnComplete) {
        ec = output->sync();
        if (ec) {
            discardPartial(output, tempPath);
            recordFailure(state, item, item.destinationPath, ec, true);
            return false;
        }
    }

    ec = output->close();
    if (ec) {
        discardPartial(output, tempPath);
        recordFailure(state, item, item.destinationPath, ec, true);
        return false;
    }

    if (options_.verifyCopies) {
        common::ByteArray sourceDigest;
        common::ByteArray copyDigest;
        ec = io::FileDigest::sha256(fs_, item.sourcePath, sourceDigest, options_.chunkSize);
        if (!ec) {
            ec = io::FileDigest::sha256(fs_, tempPath, copyDigest, options_.chunkSize);
        }
        if (ec || sourceDigest != copyDigest) {
            discardPartial(output, tempPath);
            state.result.errors.emplace_back(item.destinationPath, common::ErrorCode::IO_FAILURE, ec,
                                             "copy verification failed");
            markRetained(state, item);
            logError("copy", "Copy verification failed", ec.value(),
                     {{"source", item.sourcePath},
                      {"source_sha256", io::FileDigest::toHex(sourceDigest)},
                      {"copy_sha256", io::FileDigest::toHex(copyDigest)}});
            return false;
        }
    }

    if (options_.preserveAttributes) {
        ec = fs_.setAttributes(tempPath, item.mode, item.lastModified, false);
        if (ec) {
            logWarning("copy", "Could not preserve attributes",
                       {{"path", item.destinationPath}, {"error", ec.message()}});
        }
    }

    ec = fs_.rename(tempPath, item.destinationPath);
    if (ec) {
        discardPartial(output, tempPath);
        recordFailure(state, item, item.destinationPath, ec, true);
        return false;
    }

    state.result.bytesDone += copied;
    return true;
}

std::error_code BulkOperationExecutor::createPartialFile(const PlanItem& item, std::string& tempPath,
                                                        std::unique_ptr<io::FileHandler>& output) {
    const uint32_t mode = (item.mode & 07777) | 0600;
    std::error_code ec;

    // Exclusive create under a fresh name; nothing already on disk is touched.
    for (int attempt = 0; attempt < common::Constants::MAX_PARTIAL_ATTEMPTS; ++attempt) {
        std::string token;
        ec = randomToken(token);
        if (ec) {
            return ec;
        }
        tempPath = utils::PathUtils::partialFilePath(item.destinationPath, token);
        ec = fs_.openWrite(tempPath, mode, output);
        if (ec != std::errc::file_exists) {
            return ec;
        }
    }
    return ec;
}

void BulkOperationExecutor::discardPartial(std::unique_ptr<io::FileHandler>& output,
                                           const std::string& tempPath) {
    if (output && output->isOpen()) {
        std::error_code ec = output->close();
        if (ec) {
            logDebug("copy", "Closing partial file failed", {{"path", tempPath}, {"error", ec.message()}});
        }
    }
    std::error_code ec = fs_.removeFile(tempPath);
    if (ec && common::classify(ec) != common::ErrorCode::NOT_FOUND) {
        logWarning("copy", "Could not remove partial file", {{"path", tempPath}, {"error", ec.message()}});
    }
}

void BulkOperationExecutor::recordFailure(ExecutionState& state, const PlanItem& item,
                                          const std::string& path, const std::error_code& ec,
                                          bool destinationSide, const std::string& detail) {
    common::ErrorCode code = common::classify(ec);
    if (destinationSide && code == common::ErrorCode::NOT_FOUND &&
        destinationVanished(state.plan, item.rootIndex)) {
        code = common::ErrorCode::DESTINATION_VANISHED;
    }

    state.result.errors.emplace_back(path, code, ec, detail);
    markRetained(state, item);

    if (common::isFatal(code)) {
        state.fatal = true;
        state.result.fatalError = code;
        state.result.fatalPath = path;
        state.result.fatalCause = ec;
        logCritical("execute", "Operation cannot continue", ec.value(),
                    {{"reason", common::errorName(code)}, {"path", path}});
        return;
    }

    logWarning("execute", "Entry failed",
               {{"reason", common::errorName(code)}, {"path", path}, {"error", ec.message()}});
}

void BulkOperationExecutor::markRetained(ExecutionState& state, const PlanItem& item) {
    std::string relative = item.relativePath;
    while (!relative.empty()) {
        size_t slash = relative.rfind('/');
        relative = slash == std::string::npos ? std::string() : relative.substr(0, slash);
        state.retained.insert(std::make_pair(item.rootIndex, relative));
    }
}

bool BulkOperationExecutor::isRetained(const ExecutionState& state, const PlanItem& item) const {
    return state.retained.count(std::make_pair(item.rootIndex, item.relativePath)) > 0;
}

bool BulkOperationExecutor::destinationVanished(const OperationPlan& plan, size_t rootIndex) {
    if (plan.kind == OperationKind::DELETE) {
        return false;
    }
    if (!fs_.exists(plan.destinationDir)) {
        return true;
    }
    if (rootIndex < plan.roots.size()) {
        const PlanRoot& root = plan.roots[rootIndex];
        if (root.kind == common::EntryKind::DIRECTORY && !root.destinationPath.empty()) {
            return !fs_.exists(root.destinationPath);
        }
    }
    return false;
}

void BulkOperationExecutor::applyDirectoryAttributes(ExecutionState& state) {
    if (!options_.preserveAttributes) {
        return;
    }
    // Children first, so restoring a parent's mtime is not undone by a later write.
    for (auto it = state.createdDirectories.rbegin(); it != state.createdDirectories.rend(); ++it) {
        const PlanItem& item = **it;
        std::error_code ec = fs_.setAttributes(item.destinationPath, item.mode, item.lastModified, false);
        if (ec) {
            logWarning("attributes", "Could not preserve directory attributes",
                       {{"path", item.destinationPath}, {"error", ec.message()}});
        }
    }
}

void BulkOperationExecutor::finishResult(ExecutionState& state) {
    OperationResult& result = state.result;

    // Plan errors come first; those under a root moved by a single rename
    // no longer apply since the entries travelled with their directory.
    common::EntryErrorList errors;
    for (const auto& error : state.plan.errors) {
        bool moved = std::any_of(state.renamedRoots.begin(), state.renamedRoots.end(),
                                 [&](size_t r) {
                                     return utils::PathUtils::isWithin(state.plan.roots[r].sourcePath,
                                                                      error.path);
                                 });
        if (!moved) {
            errors.push_back(error);
        }
    }
    errors.insert(errors.end(), result.errors.begin(), result.errors.end());
    result.errors.swap(errors);

    if (state.fatal) {
        result.state = OperationState::ABORTED;
    } else if (state.cancelled) {
        result.state = OperationState::CANCELLED;
    } else if (result.errors.empty()) {
        result.state = OperationState::COMPLETED;
    } else {
        result.state = OperationState::PARTIALLY_COMPLETED;
    }

    logInfo("execute", "Operation finished",
            {{"kind", operationKindName(result.kind)},
             {"state", operationStateName(result.state)},
             {"entries", result.entriesCompleted},
             {"entries_total", result.entriesTotal},
             {"bytes", result.bytesDone},
             {"errors", result.errors.size()},
             {"skipped", result.skippedEntries},
             {"cross_device", result.crossDeviceFallbacks}});
}

size_t BulkOperationExecutor::subtreeEnd(const OperationPlan& plan, size_t index) {
    const PlanItem& parent = plan.items[index];
    size_t end = index + 1;
    if (parent.kind != common::EntryKind::DIRECTORY) {
        return end;
    }
    while (end < plan.items.size() &&
           plan.items[end].rootIndex == parent.rootIndex &&
           isBelow(plan.items[end].relativePath, parent.relativePath)) {
        ++end;
    }
    return end;
}

} // namespace ops
} // namespace twinpane
