// src/utils/FilenameValidator.cpp
#include "twinpane/utils/FilenameValidator.hpp"
#include "twinpane/utils/Utf8.hpp"
#include "twinpane/common/Constants.hpp"

namespace twinpane {
namespace utils {

namespace {

bool isSpace(uint32_t cp) {
    return cp == ' ' || (cp >= 0x09 && cp <= 0x0D) || cp == 0x85 || cp == 0xA0 ||
           cp == 0x1680 || (cp >= 0x2000 && cp <= 0x200A) || cp == 0x2028 ||
           cp == 0x2029 || cp == 0x202F || cp == 0x205F || cp == 0x3000;
}

bool isControl(uint32_t cp) {
    return cp < 0x20 || (cp >= 0x7F && cp <= 0x9F);
}

} // namespace

std::error_code FilenameValidator::validate(const std::string& name, std::string& reason) {
    bool allSpace = true;
    bool hasControl = false;
    uint32_t first = 0;
    uint32_t last = 0;

    size_t pos = 0;
    while (pos < name.size()) {
        uint32_t cp;
        size_t length = Utf8::decode(name, pos, cp);
        if (pos == 0) {
            first = cp;
        }
        last = cp;
        if (!isSpace(cp)) {
            allSpace = false;
        }
        if (isControl(cp)) {
            hasControl = true;
        }
        pos += length;
    }

    if (name.empty() || allSpace) {
        reason = "Filename cannot be empty";
    } else if (name.find('/') != std::string::npos || name.find('\\') != std::string::npos) {
        reason = "Filename cannot contain path separators";
    } else if (name.find('\0') != std::string::npos) {
        reason = "Filename cannot contain null bytes";
    } else if (name == "." || name == "..") {
        reason = "Invalid filename";
    } else if (name.size() > common::Constants::MAX_FILENAME_LENGTH) {
        reason = "Filename too long (max 255 bytes)";
    } else if (hasControl) {
        reason = "Filename cannot contain control characters";
    } else if (isSpace(first) || isSpace(last)) {
        reason = "Filename cannot start or end with whitespace";
    } else if (first == '-') {
        reason = "Filename cannot start with hyphen";
    } else {
        reason.clear();
        return {};
    }

    return common::ErrorCode::INVALID_FILENAME;
}

bool FilenameValidator::isValid(const std::string& name) {
    std::string reason;
    return !validate(name, reason);
}

} // namespace utils
} // namespace twinpane
