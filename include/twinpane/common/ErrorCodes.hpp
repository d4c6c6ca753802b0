// include/twinpane/common/ErrorCodes.hpp
#ifndef TWINPANE_ERRORCODES_HPP
#define TWINPANE_ERRORCODES_HPP

#include <string>
#include <system_error>

namespace twinpane {
namespace common {

enum class ErrorCode {
    SUCCESS = 0,

    // Traversal
    NOT_FOUND = 100,
    PERMISSION_DENIED,
    NOT_A_DIRECTORY,
    CYCLIC_SYMLINK,
    DEPTH_EXCEEDED,

    // Operation control
    CANCELLED = 200,
    DESTINATION_COLLISION,
    CROSS_DEVICE_MOVE,
    SAME_SOURCE_AND_DESTINATION,
    PROTECTED_PATH,
    SENSITIVE_SYMLINK_TARGET,
    INVALID_FILENAME,
    OPERATION_IN_PROGRESS,

    // I/O
    IO_FAILURE = 300,
    DESTINATION_FULL,
    DESTINATION_VANISHED,
    PARTIAL_FAILURE,

    // Configuration errors
    INVALID_CONFIGURATION = 600,

    // Unknown error
    UNKNOWN_ERROR = 999
};

class TwinpaneErrorCategory : public std::error_category {
public:
    const char* name() const noexcept override {
        return "twinpane";
    }

    std::string message(int ev) const override;
};

const std::error_category& twinpane_error_category();

inline std::error_code make_error_code(ErrorCode e) {
    return std::error_code(static_cast<int>(e), twinpane_error_category());
}

inline std::error_condition make_error_condition(ErrorCode e) {
    return std::error_condition(static_cast<int>(e), twinpane_error_category());
}

// Short stable identifier ("PermissionDenied") used in logs and JSON.
const char* errorName(ErrorCode code);

ErrorCode errorFromErrno(int err);

// Maps any error_code (system, generic or twinpane) onto the taxonomy.
ErrorCode classify(const std::error_code& ec);

// Conditions after which continuing a bulk operation is meaningless.
bool isFatal(ErrorCode code);

inline std::error_code lastSystemError(int err) {
    return std::error_code(err, std::generic_category());
}

} // namespace common
} // namespace twinpane

namespace std {
    template<>
    struct is_error_code_enum<twinpane::common::ErrorCode> : true_type {};
}

#endif
