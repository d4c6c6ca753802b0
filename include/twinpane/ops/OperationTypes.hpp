// include/twinpane/ops/OperationTypes.hpp
#ifndef TWINPANE_OPERATIONTYPES_HPP
#define TWINPANE_OPERATIONTYPES_HPP

#include "../common/Types.hpp"
#include "../common/Constants.hpp"

#include <functional>
#include <string>
#include <vector>

namespace twinpane {
namespace ops {

enum class OperationKind {
    COPY,
    MOVE,
    DELETE
};

// IDLE -> PLANNING -> EXECUTING -> {COMPLETED, PARTIALLY_COMPLETED, CANCELLED, ABORTED}.
// PLANNING may end in CANCELLED or ABORTED directly.
enum class OperationState {
    IDLE,
    PLANNING,
    EXECUTING,
    COMPLETED,
    PARTIALLY_COMPLETED,
    CANCELLED,
    ABORTED
};

enum class Disposition {
    CREATE,
    OVERWRITE,
    // Directory onto an existing directory; its content is planned entry by entry.
    MERGE,
    RENAMED,
    REMOVE
};

enum class CollisionDecision {
    OVERWRITE,
    SKIP,
    RENAME,
    OVERWRITE_ALL,
    SKIP_ALL
};

const char* operationKindName(OperationKind kind);
const char* operationStateName(OperationState state);
const char* dispositionName(Disposition disposition);
bool isTerminal(OperationState state);

struct PlanItem {
    std::string sourcePath;
    std::string destinationPath;
    // Relative to the item's root; "" for the root itself.
    std::string relativePath;
    common::EntryKind kind;
    uint64_t size;
    uint32_t mode;
    time_t lastModified;
    std::string linkTarget;
    Disposition disposition;
    size_t rootIndex;
    // Move only: part of this directory's content stays behind, so the
    // source directory must not be removed.
    bool retainSource;

    PlanItem()
        : kind(common::EntryKind::OTHER), size(0), mode(0), lastModified(0),
          disposition(Disposition::CREATE), rootIndex(0), retainSource(false) {}
};

struct PlanRoot {
    std::string sourcePath;
    std::string destinationPath;
    common::EntryKind kind;
    // Move only: the whole root can be moved with a single rename.
    bool renameCandidate;
    size_t firstItem;
    size_t itemCount;
    uint64_t bytes;

    PlanRoot()
        : kind(common::EntryKind::OTHER), renameCandidate(false), firstItem(0),
          itemCount(0), bytes(0) {}
};

// Built completely before anything is modified. Copy and move items are in
// pre-order (directories before their content), delete items in post-order.
struct OperationPlan {
    OperationKind kind;
    std::string destinationDir;
    std::vector<PlanItem> items;
    std::vector<PlanRoot> roots;
    uint64_t totalBytes;
    common::EntryErrorList errors;
    uint64_t skippedEntries;
    // Set when planning stops without a usable plan.
    std::string abortPath;

    OperationPlan() : kind(OperationKind::COPY), totalBytes(0), skippedEntries(0) {}
};

struct Collision {
    std::string sourcePath;
    std::string destinationPath;
    std::string relativePath;
    common::EntryKind sourceKind;
    common::EntryKind destinationKind;
    uint64_t sourceSize;
    uint64_t destinationSize;
    time_t sourceModified;
    time_t destinationModified;

    Collision()
        : sourceKind(common::EntryKind::OTHER), destinationKind(common::EntryKind::OTHER),
          sourceSize(0), destinationSize(0), sourceModified(0), destinationModified(0) {}
};

struct CollisionResolution {
    CollisionDecision decision;
    // RENAME only. Empty selects a generated "name (N).ext".
    std::string newName;

    CollisionResolution() : decision(CollisionDecision::SKIP) {}
    CollisionResolution(CollisionDecision d, std::string name = "")
        : decision(d), newName(std::move(name)) {}
};

// Called synchronously on the planning thread, before any mutation.
using CollisionResolver = std::function<CollisionResolution(const Collision&)>;

struct OperationOptions {
    size_t chunkSize;
    uint64_t progressIntervalBytes;
    bool syncOnComplete;
    bool verifyCopies;
    bool preserveAttributes;
    bool rejectSensitiveSymlinks;
    size_t maxDepth;

    OperationOptions()
        : chunkSize(common::Constants::DEFAULT_CHUNK_SIZE),
          progressIntervalBytes(common::Constants::DEFAULT_PROGRESS_INTERVAL),
          syncOnComplete(true),
          verifyCopies(false),
          preserveAttributes(true),
          rejectSensitiveSymlinks(true),
          maxDepth(common::Constants::DEFAULT_MAX_DEPTH) {}
};

struct OperationRequest {
    OperationKind kind;
    std::vector<std::string> sources;
    // Copy and move: existing directory receiving each source by its name.
    std::string destinationDir;
    CollisionResolver resolver;

    OperationRequest() : kind(OperationKind::COPY) {}
};

struct OperationResult {
    OperationKind kind;
    OperationState state;
    uint64_t entriesCompleted;
    uint64_t entriesTotal;
    uint64_t bytesDone;
    uint64_t bytesTotal;
    uint64_t skippedEntries;
    uint64_t crossDeviceFallbacks;
    common::EntryErrorList errors;
    // ABORTED only: the condition that stopped the operation.
    common::ErrorCode fatalError;
    std::string fatalPath;
    std::error_code fatalCause;

    OperationResult()
        : kind(OperationKind::COPY), state(OperationState::IDLE), entriesCompleted(0),
          entriesTotal(0), bytesDone(0), bytesTotal(0), skippedEntries(0),
          crossDeviceFallbacks(0), fatalError(common::ErrorCode::SUCCESS) {}

    // SUCCESS, PARTIAL_FAILURE, CANCELLED or the fatal error.
    std::error_code status() const;
};

} // namespace ops
} // namespace twinpane

#endif
