// include/twinpane/common/Types.hpp
#ifndef TWINPANE_TYPES_HPP
#define TWINPANE_TYPES_HPP

#include "ErrorCodes.hpp"

#include <cstdint>
#include <ctime>
#include <memory>
#include <string>
#include <system_error>
#include <vector>

namespace twinpane {
namespace common {

using Byte = uint8_t;
using ByteArray = std::vector<Byte>;

enum class EntryKind {
    FILE,
    DIRECTORY,
    SYMLINK,
    OTHER
};

// OPAQUE reports symlinks as leaves; FOLLOW descends into symlinked directories.
enum class SymlinkPolicy {
    OPAQUE,
    FOLLOW
};

// Device + inode pair naming a filesystem object independent of the path used to reach it.
struct Identity {
    uint64_t device;
    uint64_t inode;

    Identity() : device(0), inode(0) {}
    Identity(uint64_t dev, uint64_t ino) : device(dev), inode(ino) {}

    bool operator==(const Identity& other) const {
        return device == other.device && inode == other.inode;
    }
    bool operator!=(const Identity& other) const { return !(*this == other); }
    bool operator<(const Identity& other) const {
        return device < other.device || (device == other.device && inode < other.inode);
    }
};

// Metadata of the object a symlink points at.
struct EntryTarget {
    bool valid;
    EntryKind kind;
    uint64_t size;
    Identity identity;
    std::error_code error;

    EntryTarget() : valid(false), kind(EntryKind::OTHER), size(0) {}
};

struct Entry {
    std::string path;
    std::string relativePath;
    std::string name;
    EntryKind kind;
    uint64_t size;
    time_t lastModified;
    uint32_t mode;
    Identity identity;
    std::string linkTarget;
    EntryTarget target;

    Entry() : kind(EntryKind::OTHER), size(0), lastModified(0), mode(0) {}

    bool isDirectory() const { return kind == EntryKind::DIRECTORY; }
    bool isSymlink() const { return kind == EntryKind::SYMLINK; }
    bool isFile() const { return kind == EntryKind::FILE; }
};

struct EntryError {
    std::string path;
    ErrorCode kind;
    std::error_code cause;
    std::string detail;

    EntryError() : kind(ErrorCode::SUCCESS) {}
    EntryError(std::string p, ErrorCode k, std::error_code c = {}, std::string d = "")
        : path(std::move(p)), kind(k), cause(c), detail(std::move(d)) {}
};

using EntryErrorList = std::vector<EntryError>;

const char* entryKindName(EntryKind kind);

class NonCopyable {
protected:
    NonCopyable() = default;
    ~NonCopyable() = default;

    NonCopyable(const NonCopyable&) = delete;
    NonCopyable& operator=(const NonCopyable&) = delete;

    NonCopyable(NonCopyable&&) = default;
    NonCopyable& operator=(NonCopyable&&) = default;
};

} // namespace common
} // namespace twinpane

#endif
