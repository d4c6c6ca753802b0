// include/twinpane/common/Constants.hpp
#ifndef TWINPANE_CONSTANTS_HPP
#define TWINPANE_CONSTANTS_HPP

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace twinpane {
namespace common {

class Constants {
public:
    static constexpr size_t DEFAULT_MAX_DEPTH = 256;
    static constexpr size_t DEFAULT_SEARCH_CAP = 1000;

    static constexpr size_t DEFAULT_CHUNK_SIZE = 65536;
    static constexpr size_t MAX_CHUNK_SIZE = 16777216;
    static constexpr size_t MIN_CHUNK_SIZE = 4096;

    static constexpr uint64_t DEFAULT_PROGRESS_INTERVAL = 262144;
    static constexpr int PROGRESS_MIN_INTERVAL_MS = 50;

    static constexpr size_t MAX_FILENAME_LENGTH = 255;
    static constexpr int MAX_RENAME_ATTEMPTS = 10000;

    static constexpr size_t DEFAULT_WORKER_THREADS = 2;
    static constexpr int MAX_THREAD_POOL_SIZE = 8;
    static constexpr int MIN_THREAD_POOL_SIZE = 1;

    static constexpr uint64_t DEFAULT_LOG_FILE_SIZE = 4194304;
    static constexpr uint32_t DEFAULT_LOG_FILES = 5;
    static constexpr size_t MEMORY_SINK_CAPACITY = 512;

    static constexpr size_t PARTIAL_TOKEN_LENGTH = 6;
    static constexpr int MAX_PARTIAL_ATTEMPTS = 32;

    // In-flight copies live in ".<name><PARTIAL_MARKER><token>" beside the destination.
    static const char* PARTIAL_MARKER;
    static const char* ELLIPSIS;

    // Canonical paths that delete refuses to touch.
    static const std::vector<std::string>& protectedPaths();
    // Absolute symlink targets that copy refuses to recreate.
    static const std::vector<std::string>& sensitiveSymlinkTargets();
};

} // namespace common
} // namespace twinpane

#endif
