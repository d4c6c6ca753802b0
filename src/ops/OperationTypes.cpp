// src/ops/OperationTypes.cpp
#include "twinpane/ops/OperationTypes.hpp"

namespace twinpane {
namespace ops {

const char* operationKindName(OperationKind kind) {
    switch (kind) {
        case OperationKind::COPY: return "copy";
        case OperationKind::MOVE: return "move";
        case OperationKind::DELETE: return "delete";
        default: return "unknown";
    }
}

const char* operationStateName(OperationState state) {
    switch (state) {
        case OperationState::IDLE: return "Idle";
        case OperationState::PLANNING: return "Planning";
        case OperationState::EXECUTING: return "Executing";
        case OperationState::COMPLETED: return "Completed";
        case OperationState::PARTIALLY_COMPLETED: return "PartiallyCompleted";
        case OperationState::CANCELLED: return "Cancelled";
        case OperationState::ABORTED: return "Aborted";
        default: return "Unknown";
    }
}

const char* dispositionName(Disposition disposition) {
    switch (disposition) {
        case Disposition::CREATE: return "create";
        case Disposition::OVERWRITE: return "overwrite";
        case Disposition::MERGE: return "merge";
        case Disposition::RENAMED: return "renamed";
        case Disposition::REMOVE: return "remove";
        default: return "unknown";
    }
}

bool isTerminal(OperationState state) {
    return state == OperationState::COMPLETED ||
           state == OperationState::PARTIALLY_COMPLETED ||
           state == OperationState::CANCELLED ||
           state == OperationState::ABORTED;
}

std::error_code OperationResult::status() const {
    switch (state) {
        case OperationState::COMPLETED:
            return {};
        case OperationState::PARTIALLY_COMPLETED:
            return common::ErrorCode::PARTIAL_FAILURE;
        case OperationState::CANCELLED:
            return common::ErrorCode::CANCELLED;
        case OperationState::ABORTED:
            return fatalError == common::ErrorCode::SUCCESS
                ? std::error_code(common::ErrorCode::UNKNOWN_ERROR)
                : std::error_code(fatalError);
        default:
            return common::ErrorCode::OPERATION_IN_PROGRESS;
    }
}

} // namespace ops
} // namespace twinpane
