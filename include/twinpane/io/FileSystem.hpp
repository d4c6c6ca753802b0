// include/twinpane/io/FileSystem.hpp
#ifndef TWINPANE_FILESYSTEM_HPP
#define TWINPANE_FILESYSTEM_HPP

#include "../common/Types.hpp"

#include <memory>
#include <string>
#include <system_error>

namespace twinpane {
namespace io {

class FileHandler;

struct FileStatus {
    common::EntryKind kind;
    uint64_t size;
    time_t lastModified;
    uint32_t mode;
    common::Identity identity;

    FileStatus() : kind(common::EntryKind::OTHER), size(0), lastModified(0), mode(0) {}
};

// Yields directory entry names one at a time, "." and ".." excluded.
class DirectoryStream {
public:
    virtual ~DirectoryStream() = default;

    // Returns false at end of listing or on error; ec is set only on error.
    virtual bool next(std::string& name, std::error_code& ec) = 0;
};

// Every primitive the engine needs from the filesystem. All methods report
// failures as generic_category error codes carrying the original errno.
class FileSystem {
public:
    virtual ~FileSystem() = default;

    // Metadata of the path itself (a symlink is reported as SYMLINK).
    virtual std::error_code symlinkStatus(const std::string& path, FileStatus& status) = 0;
    // Metadata of the object the path resolves to.
    virtual std::error_code status(const std::string& path, FileStatus& status) = 0;
    virtual std::error_code readLink(const std::string& path, std::string& target) = 0;

    virtual std::error_code openDirectory(const std::string& path,
                                          std::unique_ptr<DirectoryStream>& stream) = 0;
    virtual std::error_code openRead(const std::string& path,
                                     std::unique_ptr<FileHandler>& handler) = 0;
    // Fails with EEXIST when the path is already present.
    virtual std::error_code openWrite(const std::string& path, uint32_t mode,
                                      std::unique_ptr<FileHandler>& handler) = 0;

    virtual std::error_code rename(const std::string& from, const std::string& to) = 0;
    virtual std::error_code removeFile(const std::string& path) = 0;
    virtual std::error_code removeDirectory(const std::string& path) = 0;
    virtual std::error_code createDirectory(const std::string& path, uint32_t mode) = 0;
    virtual std::error_code createSymlink(const std::string& target, const std::string& linkPath) = 0;
    // Applies permission bits and modification time. Symlinks only get the time.
    virtual std::error_code setAttributes(const std::string& path, uint32_t mode,
                                          time_t lastModified, bool isSymlink) = 0;
    virtual std::error_code realPath(const std::string& path, std::string& resolved) = 0;

    bool exists(const std::string& path) {
        FileStatus st;
        return !symlinkStatus(path, st);
    }
};

} // namespace io
} // namespace twinpane

#endif
