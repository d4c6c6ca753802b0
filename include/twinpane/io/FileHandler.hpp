// include/twinpane/io/FileHandler.hpp
#ifndef TWINPANE_FILEHANDLER_HPP
#define TWINPANE_FILEHANDLER_HPP

#include "../common/Types.hpp"
#include "../common/ErrorCodes.hpp"
#include <string>
#include <system_error>

namespace twinpane {
namespace io {

// Owns one open file descriptor. Reads and writes go straight to the
// descriptor; callers do their own buffering.
class FileHandler : public common::NonCopyable {
private:
    std::string filePath_;
    int fd_;
    uint64_t bytesWritten_;

public:
    FileHandler(const std::string& filePath, int fd);
    virtual ~FileHandler();

    FileHandler(FileHandler&&) = delete;
    FileHandler& operator=(FileHandler&&) = delete;

    bool isOpen() const { return fd_ >= 0; }
    const std::string& getFilePath() const { return filePath_; }
    uint64_t getBytesWritten() const { return bytesWritten_; }

    // Reads up to bufferSize bytes; bytesRead == 0 means end of file.
    virtual std::error_code read(common::Byte* buffer, size_t bufferSize, size_t& bytesRead);
    // Writes the whole range, retrying short writes.
    virtual std::error_code write(const common::Byte* data, size_t size);
    std::error_code write(const common::ByteArray& buffer) { return write(buffer.data(), buffer.size()); }
    virtual std::error_code sync();
    std::error_code close();
};

} // namespace io
} // namespace twinpane

#endif
