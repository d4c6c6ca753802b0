// include/twinpane/utils/FilenameValidator.hpp
#ifndef TWINPANE_FILENAMEVALIDATOR_HPP
#define TWINPANE_FILENAMEVALIDATOR_HPP

#include "../common/ErrorCodes.hpp"
#include <string>
#include <system_error>

namespace twinpane {
namespace utils {

// Checks a single path component entered by the user (rename, new name).
class FilenameValidator {
public:
    // Returns INVALID_FILENAME with a human readable reason on rejection.
    static std::error_code validate(const std::string& name, std::string& reason);
    static bool isValid(const std::string& name);
};

} // namespace utils
} // namespace twinpane

#endif
