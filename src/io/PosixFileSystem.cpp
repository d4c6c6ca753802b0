// src/io/PosixFileSystem.cpp
#include "twinpane/io/PosixFileSystem.hpp"
#include "twinpane/io/FileHandler.hpp"

#include <cerrno>
#include <climits>
#include <cstdlib>
#include <cstring>
#include <dirent.h>
#include <fcntl.h>
#include <sys/stat.h>
#include <sys/types.h>
#include <unistd.h>
#include <vector>

namespace twinpane {
namespace io {

namespace {

common::EntryKind kindFromMode(mode_t mode) {
    if (S_ISDIR(mode)) return common::EntryKind::DIRECTORY;
    if (S_ISREG(mode)) return common::EntryKind::FILE;
    if (S_ISLNK(mode)) return common::EntryKind::SYMLINK;
    return common::EntryKind::OTHER;
}

void fillStatus(const struct stat& st, FileStatus& status) {
    status.kind = kindFromMode(st.st_mode);
    status.size = st.st_size > 0 ? static_cast<uint64_t>(st.st_size) : 0;
    status.lastModified = st.st_mtime;
    status.mode = static_cast<uint32_t>(st.st_mode & 07777);
    status.identity = common::Identity(static_cast<uint64_t>(st.st_dev),
                                       static_cast<uint64_t>(st.st_ino));
}

class PosixDirectoryStream : public DirectoryStream {
public:
    explicit PosixDirectoryStream(DIR* dir) : dir_(dir) {}
    ~PosixDirectoryStream() override {
        if (dir_) {
            closedir(dir_);
        }
    }

    PosixDirectoryStream(const PosixDirectoryStream&) = delete;
    PosixDirectoryStream& operator=(const PosixDirectoryStream&) = delete;

    bool next(std::string& name, std::error_code& ec) override {
        ec.clear();
        while (dir_) {
            errno = 0;
            struct dirent* entry = readdir(dir_);
            if (!entry) {
                if (errno != 0) {
                    ec = common::lastSystemError(errno);
                }
                return false;
            }
            if (strcmp(entry->d_name, ".") == 0 || strcmp(entry->d_name, "..") == 0) {
                continue;
            }
            name = entry->d_name;
            return true;
        }
        return false;
    }

private:
    DIR* dir_;
};

} // namespace

std::error_code PosixFileSystem::symlinkStatus(const std::string& path, FileStatus& status) {
    struct stat st;
    if (lstat(path.c_str(), &st) != 0) {
        return common::lastSystemError(errno);
    }
    fillStatus(st, status);
    return {};
}

std::error_code PosixFileSystem::status(const std::string& path, FileStatus& status) {
    struct stat st;
    if (stat(path.c_str(), &st) != 0) {
        return common::lastSystemError(errno);
    }
    fillStatus(st, status);
    return {};
}

std::error_code PosixFileSystem::readLink(const std::string& path, std::string& target) {
    std::vector<char> buffer(PATH_MAX);
    while (true) {
        ssize_t len = readlink(path.c_str(), buffer.data(), buffer.size());
        if (len < 0) {
            return common::lastSystemError(errno);
        }
        if (static_cast<size_t>(len) < buffer.size()) {
            target.assign(buffer.data(), static_cast<size_t>(len));
            return {};
        }
        buffer.resize(buffer.size() * 2);
    }
}

std::error_code PosixFileSystem::openDirectory(const std::string& path,
                                               std::unique_ptr<DirectoryStream>& stream) {
    DIR* dir = opendir(path.c_str());
    if (!dir) {
        return common::lastSystemError(errno);
    }
    stream = std::make_unique<PosixDirectoryStream>(dir);
    return {};
}

std::error_code PosixFileSystem::openRead(const std::string& path,
                                          std::unique_ptr<FileHandler>& handler) {
    int fd;
    do {
        fd = ::open(path.c_str(), O_RDONLY | O_CLOEXEC);
    } while (fd < 0 && errno == EINTR);

    if (fd < 0) {
        return common::lastSystemError(errno);
    }
    handler = std::make_unique<FileHandler>(path, fd);
    return {};
}

std::error_code PosixFileSystem::openWrite(const std::string& path, uint32_t mode,
                                           std::unique_ptr<FileHandler>& handler) {
    int fd;
    do {
        fd = ::open(path.c_str(), O_WRONLY | O_CREAT | O_EXCL | O_CLOEXEC,
                    static_cast<mode_t>(mode & 07777));
    } while (fd < 0 && errno == EINTR);

    if (fd < 0) {
        return common::lastSystemError(errno);
    }
    handler = std::make_unique<FileHandler>(path, fd);
    return {};
}

std::error_code PosixFileSystem::rename(const std::string& from, const std::string& to) {
    if (::rename(from.c_str(), to.c_str()) != 0) {
        return common::lastSystemError(errno);
    }
    return {};
}

std::error_code PosixFileSystem::removeFile(const std::string& path) {
    if (unlink(path.c_str()) != 0) {
        return common::lastSystemError(errno);
    }
    return {};
}

std::error_code PosixFileSystem::removeDirectory(const std::string& path) {
    if (rmdir(path.c_str()) != 0) {
        return common::lastSystemError(errno);
    }
    return {};
}

std::error_code PosixFileSystem::createDirectory(const std::string& path, uint32_t mode) {
    if (mkdir(path.c_str(), static_cast<mode_t>(mode & 07777)) != 0) {
        return common::lastSystemError(errno);
    }
    return {};
}

std::error_code PosixFileSystem::createSymlink(const std::string& target, const std::string& linkPath) {
    if (symlink(target.c_str(), linkPath.c_str()) != 0) {
        return common::lastSystemError(errno);
    }
    return {};
}

std::error_code PosixFileSystem::setAttributes(const std::string& path, uint32_t mode,
                                               time_t lastModified, bool isSymlink) {
    if (!isSymlink && chmod(path.c_str(), static_cast<mode_t>(mode & 07777)) != 0) {
        return common::lastSystemError(errno);
    }

    struct timespec times[2];
    times[0].tv_sec = 0;
    times[0].tv_nsec = UTIME_OMIT;
    times[1].tv_sec = lastModified;
    times[1].tv_nsec = 0;

    if (utimensat(AT_FDCWD, path.c_str(), times, isSymlink ? AT_SYMLINK_NOFOLLOW : 0) != 0) {
        return common::lastSystemError(errno);
    }
    return {};
}

std::error_code PosixFileSystem::realPath(const std::string& path, std::string& resolved) {
    char* result = ::realpath(path.c_str(), nullptr);
    if (!result) {
        return common::lastSystemError(errno);
    }
    resolved = result;
    free(result);
    return {};
}

} // namespace io
} // namespace twinpane
