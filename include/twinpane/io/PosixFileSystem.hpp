// include/twinpane/io/PosixFileSystem.hpp
#ifndef TWINPANE_POSIXFILESYSTEM_HPP
#define TWINPANE_POSIXFILESYSTEM_HPP

#include "FileSystem.hpp"

namespace twinpane {
namespace io {

class PosixFileSystem : public FileSystem {
public:
    PosixFileSystem() = default;
    ~PosixFileSystem() override = default;

    std::error_code symlinkStatus(const std::string& path, FileStatus& status) override;
    std::error_code status(const std::string& path, FileStatus& status) override;
    std::error_code readLink(const std::string& path, std::string& target) override;

    std::error_code openDirectory(const std::string& path,
                                  std::unique_ptr<DirectoryStream>& stream) override;
    std::error_code openRead(const std::string& path,
                             std::unique_ptr<FileHandler>& handler) override;
    std::error_code openWrite(const std::string& path, uint32_t mode,
                              std::unique_ptr<FileHandler>& handler) override;

    std::error_code rename(const std::string& from, const std::string& to) override;
    std::error_code removeFile(const std::string& path) override;
    std::error_code removeDirectory(const std::string& path) override;
    std::error_code createDirectory(const std::string& path, uint32_t mode) override;
    std::error_code createSymlink(const std::string& target, const std::string& linkPath) override;
    std::error_code setAttributes(const std::string& path, uint32_t mode,
                                  time_t lastModified, bool isSymlink) override;
    std::error_code realPath(const std::string& path, std::string& resolved) override;
};

} // namespace io
} // namespace twinpane

#endif
