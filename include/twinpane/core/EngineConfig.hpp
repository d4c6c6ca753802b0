// include/twinpane/core/EngineConfig.hpp
#ifndef TWINPANE_ENGINECONFIG_HPP
#define TWINPANE_ENGINECONFIG_HPP

#include "../common/Types.hpp"
#include "../common/Constants.hpp"
#include "../ops/OperationTypes.hpp"
#include "../traversal/Walker.hpp"
#include "../utils/metrics_engine.hpp"

#include <nlohmann/json.hpp>
#include <string>
#include <system_error>

namespace twinpane {
namespace core {

struct EngineConfig {
    size_t maxDepth;
    size_t searchCap;
    size_t copyChunkSize;
    uint64_t progressIntervalBytes;
    bool syncOnComplete;
    bool verifyCopies;
    bool preserveAttributes;
    common::SymlinkPolicy symlinkPolicy;
    bool rejectSensitiveSymlinks;
    size_t workerThreads;

    // Logging goes to files only when metrics.base_path is set.
    metrics::StorageConfig metrics;
    metrics::LogLevel logLevel;

    EngineConfig() : maxDepth(common::Constants::DEFAULT_MAX_DEPTH),
                     searchCap(common::Constants::DEFAULT_SEARCH_CAP),
                     copyChunkSize(common::Constants::DEFAULT_CHUNK_SIZE),
                     progressIntervalBytes(common::Constants::DEFAULT_PROGRESS_INTERVAL),
                     syncOnComplete(true),
                     verifyCopies(false),
                     preserveAttributes(true),
                     symlinkPolicy(common::SymlinkPolicy::OPAQUE),
                     rejectSensitiveSymlinks(true),
                     workerThreads(common::Constants::DEFAULT_WORKER_THREADS),
                     logLevel(metrics::LogLevel::INFO) {}

    // Keys missing from the document keep their current value. On failure
    // config is left untouched and detail says which key was rejected.
    static std::error_code fromJson(const nlohmann::json& json, EngineConfig& config,
                                    std::string* detail = nullptr);
    static std::error_code fromJsonString(const std::string& text, EngineConfig& config,
                                          std::string* detail = nullptr);
    nlohmann::json toJson() const;

    std::error_code validate(std::string* detail = nullptr) const;

    ops::OperationOptions operationOptions() const;
    // Traversal settings for size and search; bulk operations never follow links.
    traversal::WalkOptions walkOptions() const;
};

} // namespace core
} // namespace twinpane

#endif
