// tests/test_helpers.hpp
#ifndef TWINPANE_TEST_HELPERS_HPP
#define TWINPANE_TEST_HELPERS_HPP

#include "twinpane/common/Constants.hpp"
#include "twinpane/io/FileHandler.hpp"
#include "twinpane/io/PosixFileSystem.hpp"
#include "twinpane/utils/PathUtils.hpp"

#include <atomic>
#include <cerrno>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <functional>
#include <sstream>
#include <stdexcept>
#include <string>

#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

namespace twinpane {
namespace test {

// Unique scratch directory removed with everything below it.
class TempDir {
public:
    TempDir() {
        std::string templ = (std::filesystem::temp_directory_path() / "twinpane_test_XXXXXX").string();
        if (!mkdtemp(&templ[0])) {
            throw std::runtime_error("mkdtemp failed");
        }
        path_ = templ;
    }

    ~TempDir() {
        std::error_code ec;
        // Unreadable directories left by a test must be opened up first.
        ::chmod(path_.c_str(), 0700);
        restorePermissions(path_);
        std::filesystem::remove_all(path_, ec);
    }

    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    const std::string& path() const { return path_; }
    std::string operator/(const std::string& relative) const { return path_ + "/" + relative; }

private:
    static void restorePermissions(const std::string& dir) {
        std::error_code ec;
        for (std::filesystem::directory_iterator it(dir, ec), end; !ec && it != end; it.increment(ec)) {
            if (it->is_directory(ec) && !it->is_symlink(ec)) {
                ::chmod(it->path().c_str(), 0700);
                restorePermissions(it->path().string());
            }
        }
    }

    std::string path_;
};

inline void writeFile(const std::string& path, const std::string& content) {
    std::filesystem::create_directories(std::filesystem::path(path).parent_path());
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    out << content;
}

inline void writeFileOfSize(const std::string& path, size_t size, char fill = 'x') {
    writeFile(path, std::string(size, fill));
}

inline std::string readFile(const std::string& path) {
    std::ifstream in(path, std::ios::binary);
    std::stringstream ss;
    ss << in.rdbuf();
    return ss.str();
}

inline void makeDirs(const std::string& path) {
    std::filesystem::create_directories(path);
}

inline void makeSymlink(const std::string& target, const std::string& link) {
    std::filesystem::create_directories(std::filesystem::path(link).parent_path());
    std::filesystem::create_symlink(target, link);
}

inline bool pathExists(const std::string& path) {
    struct stat st;
    return ::lstat(path.c_str(), &st) == 0;
}

// Every write reports a full volume.
class FullDiskFileHandler : public io::FileHandler {
public:
    FullDiskFileHandler(const std::string& path, int fd) : io::FileHandler(path, fd) {}

    std::error_code write(const common::Byte*, size_t) override {
        return common::lastSystemError(ENOSPC);
    }
};

// PosixFileSystem with switchable faults and hooks for the bulk operation tests.
class FaultyFileSystem : public io::PosixFileSystem {
public:
    // Renames of anything but partial files fail as if crossing devices.
    bool crossDeviceRename = false;
    // Files opened for writing fail every write with ENOSPC.
    bool diskFull = false;
    // Called before each openWrite / openRead with the path.
    std::function<void(const std::string&)> beforeOpenWrite;
    std::function<void(const std::string&)> beforeOpenRead;

    std::atomic<int> renameCalls{0};
    std::atomic<int> openWriteCalls{0};
    std::atomic<int> openReadCalls{0};

    std::error_code rename(const std::string& from, const std::string& to) override {
        renameCalls++;
        if (crossDeviceRename && !isPartial(from)) {
            return common::lastSystemError(EXDEV);
        }
        return io::PosixFileSystem::rename(from, to);
    }

    std::error_code openRead(const std::string& path,
                             std::unique_ptr<io::FileHandler>& handler) override {
        openReadCalls++;
        if (beforeOpenRead) {
            beforeOpenRead(path);
        }
        return io::PosixFileSystem::openRead(path, handler);
    }

    std::error_code openWrite(const std::string& path, uint32_t mode,
                              std::unique_ptr<io::FileHandler>& handler) override {
        openWriteCalls++;
        if (beforeOpenWrite) {
            beforeOpenWrite(path);
        }
        if (!diskFull) {
            return io::PosixFileSystem::openWrite(path, mode, handler);
        }
        int fd = ::open(path.c_str(), O_WRONLY | O_CREAT | O_EXCL | O_CLOEXEC,
                        static_cast<mode_t>(mode & 07777));
        if (fd < 0) {
            return common::lastSystemError(errno);
        }
        handler = std::make_unique<FullDiskFileHandler>(path, fd);
        return {};
    }

private:
    static bool isPartial(const std::string& path) {
        return utils::PathUtils::isPartialFilePath(path);
    }
};

} // namespace test
} // namespace twinpane

#endif
