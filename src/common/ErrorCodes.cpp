#include "twinpane/common/ErrorCodes.hpp"

#include <cerrno>

namespace twinpane {
namespace common {

std::string TwinpaneErrorCategory::message(int ev) const {
    switch (static_cast<ErrorCode>(ev)) {
        case ErrorCode::SUCCESS:
            return "Success";

        case ErrorCode::NOT_FOUND:
            return "No such file or directory";
        case ErrorCode::PERMISSION_DENIED:
            return "Permission denied";
        case ErrorCode::NOT_A_DIRECTORY:
            return "Not a directory";
        case ErrorCode::CYCLIC_SYMLINK:
            return "Directory cycle detected through symlink";
        case ErrorCode::DEPTH_EXCEEDED:
            return "Maximum directory depth exceeded";

        case ErrorCode::CANCELLED:
            return "Operation cancelled";
        case ErrorCode::DESTINATION_COLLISION:
            return "Destination already exists";
        case ErrorCode::CROSS_DEVICE_MOVE:
            return "Source and destination are on different volumes";
        case ErrorCode::SAME_SOURCE_AND_DESTINATION:
            return "Source and destination are the same";
        case ErrorCode::PROTECTED_PATH:
            return "Refusing to modify a protected system path";
        case ErrorCode::SENSITIVE_SYMLINK_TARGET:
            return "Symlink points into a sensitive system path";
        case ErrorCode::INVALID_FILENAME:
            return "Invalid filename";
        case ErrorCode::OPERATION_IN_PROGRESS:
            return "Another file operation is already running";

        case ErrorCode::IO_FAILURE:
            return "I/O failure";
        case ErrorCode::DESTINATION_FULL:
            return "Destination volume is full";
        case ErrorCode::DESTINATION_VANISHED:
            return "Destination directory was removed";
        case ErrorCode::PARTIAL_FAILURE:
            return "Some entries could not be processed";

        case ErrorCode::INVALID_CONFIGURATION:
            return "Invalid configuration";

        case ErrorCode::UNKNOWN_ERROR:
        default:
            return "Unknown error";
    }
}

const std::error_category& twinpane_error_category() {
    static TwinpaneErrorCategory instance;
    return instance;
}

const char* errorName(ErrorCode code) {
    switch (code) {
        case ErrorCode::SUCCESS: return "Success";
        case ErrorCode::NOT_FOUND: return "NotFound";
        case ErrorCode::PERMISSION_DENIED: return "PermissionDenied";
        case ErrorCode::NOT_A_DIRECTORY: return "NotADirectory";
        case ErrorCode::CYCLIC_SYMLINK: return "CyclicSymlink";
        case ErrorCode::DEPTH_EXCEEDED: return "DepthExceeded";
        case ErrorCode::CANCELLED: return "Cancelled";
        case ErrorCode::DESTINATION_COLLISION: return "DestinationCollision";
        case ErrorCode::CROSS_DEVICE_MOVE: return "CrossDeviceMove";
        case ErrorCode::SAME_SOURCE_AND_DESTINATION: return "SameSourceAndDestination";
        case ErrorCode::PROTECTED_PATH: return "ProtectedPath";
        case ErrorCode::SENSITIVE_SYMLINK_TARGET: return "SensitiveSymlinkTarget";
        case ErrorCode::INVALID_FILENAME: return "InvalidFilename";
        case ErrorCode::OPERATION_IN_PROGRESS: return "OperationInProgress";
        case ErrorCode::IO_FAILURE: return "IOFailure";
        case ErrorCode::DESTINATION_FULL: return "DestinationFull";
        case ErrorCode::DESTINATION_VANISHED: return "DestinationVanished";
        case ErrorCode::PARTIAL_FAILURE: return "PartialFailure";
        case ErrorCode::INVALID_CONFIGURATION: return "InvalidConfiguration";
        case ErrorCode::UNKNOWN_ERROR:
        default:
            return "Unknown";
    }
}

ErrorCode errorFromErrno(int err) {
    switch (err) {
        case 0:
            return ErrorCode::SUCCESS;
        case ENOENT:
            return ErrorCode::NOT_FOUND;
        case EACCES:
        case EPERM:
        case EROFS:
            return ErrorCode::PERMISSION_DENIED;
        case ENOTDIR:
            return ErrorCode::NOT_A_DIRECTORY;
        case ELOOP:
            return ErrorCode::CYCLIC_SYMLINK;
        case ENAMETOOLONG:
            return ErrorCode::DEPTH_EXCEEDED;
        case EEXIST:
        case ENOTEMPTY:
            return ErrorCode::DESTINATION_COLLISION;
        case EXDEV:
            return ErrorCode::CROSS_DEVICE_MOVE;
        case ENOSPC:
        case EDQUOT:
            return ErrorCode::DESTINATION_FULL;
        case ECANCELED:
            return ErrorCode::CANCELLED;
        default:
            return ErrorCode::IO_FAILURE;
    }
}

ErrorCode classify(const std::error_code& ec) {
    if (!ec) {
        return ErrorCode::SUCCESS;
    }
    if (ec.category() == twinpane_error_category()) {
        return static_cast<ErrorCode>(ec.value());
    }
    if (ec.category() == std::generic_category() || ec.category() == std::system_category()) {
        return errorFromErrno(ec.value());
    }
    return ErrorCode::UNKNOWN_ERROR;
}

bool isFatal(ErrorCode code) {
    return code == ErrorCode::DESTINATION_FULL || code == ErrorCode::DESTINATION_VANISHED;
}

} // namespace common
} // namespace twinpane
