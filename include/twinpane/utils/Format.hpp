// include/twinpane/utils/Format.hpp
#ifndef TWINPANE_FORMAT_HPP
#define TWINPANE_FORMAT_HPP

#include "ProgressChannel.hpp"
#include "twinpane/common/Types.hpp"
#include <cstdint>
#include <string>

namespace twinpane {
namespace utils {

struct ProgressLines {
    std::string fileLine;
    std::string countLine;
};

class Format {
public:
    // "512 B", "1.5 KB", "1.0 MB", "1.0 GB"
    static std::string formatSize(uint64_t bytes);
    // "rwxr-xr-x"
    static std::string formatPermissionsShort(uint32_t mode);
    // "drwxr-xr-x (755)"; the type letter comes from the S_IFMT bits of mode.
    static std::string formatPermissions(uint32_t mode);

    // Two display lines for a progress dialog, each at most width cells.
    static ProgressLines describeProgress(const OperationProgress& progress, size_t width);

    // prefix + path + suffix in at most width cells. The path loses its start
    // first; when prefix and suffix alone do not fit, the whole line is cut at the end.
    static std::string fitPath(const std::string& prefix, const std::string& path,
                               const std::string& suffix, size_t width);
    // "  PERMISSION_DENIED: <path> (detail) - cause"
    static std::string describeEntryError(const common::EntryError& error, size_t width);
};

} // namespace utils
} // namespace twinpane

#endif
