#include "twinpane/common/Types.hpp"

namespace twinpane {
namespace common {

const char* entryKindName(EntryKind kind) {
    switch (kind) {
        case EntryKind::FILE: return "file";
        case EntryKind::DIRECTORY: return "directory";
        case EntryKind::SYMLINK: return "symlink";
        case EntryKind::OTHER:
        default:
            return "other";
    }
}

} // namespace common
} // namespace twinpane
