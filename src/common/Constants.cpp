#include "twinpane/common/Constants.hpp"

namespace twinpane {
namespace common {

const char* Constants::PARTIAL_MARKER = ".twinpane-";
const char* Constants::ELLIPSIS = "\xE2\x80\xA6";

const std::vector<std::string>& Constants::protectedPaths() {
    static const std::vector<std::string> paths = {
        "/", "/bin", "/boot", "/dev", "/etc", "/home", "/lib", "/lib64",
        "/opt", "/proc", "/root", "/sbin", "/sys", "/tmp", "/usr", "/var",
    };
    return paths;
}

const std::vector<std::string>& Constants::sensitiveSymlinkTargets() {
    static const std::vector<std::string> targets = {
        "/etc", "/sys", "/proc", "/boot", "/root", "/var/log",
    };
    return targets;
}

} // namespace common
} // namespace twinpane
