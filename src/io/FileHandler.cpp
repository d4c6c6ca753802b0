// src/io/FileHandler.cpp
#include "twinpane/io/FileHandler.hpp"

#include <cerrno>
#include <unistd.h>

twinpane::io::FileHandler::FileHandler(const std::string& filePath, int fd)
    : filePath_(filePath), fd_(fd), bytesWritten_(0) {}

twinpane::io::FileHandler::~FileHandler() {
    if (fd_ >= 0) {
        ::close(fd_);
        fd_ = -1;
    }
}

std::error_code twinpane::io::FileHandler::read(common::Byte* buffer, size_t bufferSize, size_t& bytesRead) {
    bytesRead = 0;
    if (fd_ < 0 || !buffer) {
        return common::lastSystemError(EBADF);
    }

    while (true) {
        ssize_t n = ::read(fd_, buffer, bufferSize);
        if (n >= 0) {
            bytesRead = static_cast<size_t>(n);
            return {};
        }
        if (errno != EINTR) {
            return common::lastSystemError(errno);
        }
    }
}

std::error_code twinpane::io::FileHandler::write(const common::Byte* data, size_t size) {
    if (fd_ < 0 || (!data && size > 0)) {
        return common::lastSystemError(EBADF);
    }

    size_t offset = 0;
    while (offset < size) {
        ssize_t n = ::write(fd_, data + offset, size - offset);
        if (n < 0) {
            if (errno == EINTR) {
                continue;
            }
            return common::lastSystemError(errno);
        }
        if (n == 0) {
            return common::lastSystemError(EIO);
        }
        offset += static_cast<size_t>(n);
        bytesWritten_ += static_cast<uint64_t>(n);
    }

    return {};
}

std::error_code twinpane::io::FileHandler::sync() {
    if (fd_ < 0) {
        return common::lastSystemError(EBADF);
    }
    if (::fsync(fd_) != 0) {
        return common::lastSystemError(errno);
    }
    return {};
}

std::error_code twinpane::io::FileHandler::close() {
    if (fd_ < 0) {
        return {};
    }
    int result = ::close(fd_);
    fd_ = -1;
    if (result != 0 && errno != EINTR) {
        return common::lastSystemError(errno);
    }
    return {};
}
