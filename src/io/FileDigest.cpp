// src/io/FileDigest.cpp
#include "twinpane/io/FileDigest.hpp"
#include "twinpane/io/FileHandler.hpp"

#include <iomanip>
#include <memory>
#include <openssl/evp.h>
#include <sstream>

namespace twinpane {
namespace io {

namespace {

struct DigestContextDeleter {
    void operator()(EVP_MD_CTX* ctx) const { EVP_MD_CTX_free(ctx); }
};

} // namespace

std::error_code FileDigest::sha256(FileSystem& fs, const std::string& path,
                                   common::ByteArray& digest, size_t chunkSize) {
    std::unique_ptr<FileHandler> input;
    std::error_code ec = fs.openRead(path, input);
    if (ec) {
        return ec;
    }

    std::unique_ptr<EVP_MD_CTX, DigestContextDeleter> ctx(EVP_MD_CTX_new());
    if (!ctx || EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr) != 1) {
        return common::ErrorCode::IO_FAILURE;
    }

    common::ByteArray buffer(chunkSize > 0 ? chunkSize : 65536);
    while (true) {
        size_t n = 0;
        ec = input->read(buffer.data(), buffer.size(), n);
        if (ec) {
            return ec;
        }
        if (n == 0) {
            break;
        }
        if (EVP_DigestUpdate(ctx.get(), buffer.data(), n) != 1) {
            return common::ErrorCode::IO_FAILURE;
        }
    }

    unsigned char hash[EVP_MAX_MD_SIZE];
    unsigned int length = 0;
    if (EVP_DigestFinal_ex(ctx.get(), hash, &length) != 1) {
        return common::ErrorCode::IO_FAILURE;
    }

    digest.assign(hash, hash + length);
    return input->close();
}

std::string FileDigest::toHex(const common::ByteArray& digest) {
    std::stringstream ss;
    ss << std::hex << std::setfill('0');
    for (common::Byte b : digest) {
        ss << std::setw(2) << static_cast<int>(b);
    }
    return ss.str();
}

} // namespace io
} // namespace twinpane
