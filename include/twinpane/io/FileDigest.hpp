// include/twinpane/io/FileDigest.hpp
#ifndef TWINPANE_FILEDIGEST_HPP
#define TWINPANE_FILEDIGEST_HPP

#include "FileSystem.hpp"

#include <string>
#include <system_error>

namespace twinpane {
namespace io {

// SHA-256 of a file's content, read through the given filesystem.
class FileDigest {
public:
    static constexpr size_t DIGEST_LENGTH = 32;

    static std::error_code sha256(FileSystem& fs, const std::string& path,
                                  common::ByteArray& digest, size_t chunkSize = 65536);
    static std::string toHex(const common::ByteArray& digest);
};

} // namespace io
} // namespace twinpane

#endif
