// src/core/EngineConfig.cpp
#include "twinpane/core/EngineConfig.hpp"

namespace twinpane {
namespace core {

namespace {

const char* policyName(common::SymlinkPolicy policy) {
    return policy == common::SymlinkPolicy::FOLLOW ? "follow" : "opaque";
}

bool parsePolicy(const std::string& name, common::SymlinkPolicy& policy) {
    if (name == "opaque") {
        policy = common::SymlinkPolicy::OPAQUE;
        return true;
    }
    if (name == "follow") {
        policy = common::SymlinkPolicy::FOLLOW;
        return true;
    }
    return false;
}

const char* formatName(metrics::StorageFormat format) {
    return format == metrics::StorageFormat::JSON ? "json" : "text";
}

bool parseFormat(const std::string& name, metrics::StorageFormat& format) {
    if (name == "text") {
        format = metrics::StorageFormat::TEXT;
        return true;
    }
    if (name == "json") {
        format = metrics::StorageFormat::JSON;
        return true;
    }
    return false;
}

const char* rotationName(metrics::RotationPolicy rotation) {
    switch (rotation) {
        case metrics::RotationPolicy::DAILY: return "daily";
        case metrics::RotationPolicy::HOURLY: return "hourly";
        case metrics::RotationPolicy::WEEKLY: return "weekly";
        case metrics::RotationPolicy::MONTHLY: return "monthly";
        case metrics::RotationPolicy::SIZE_BASED: return "size";
        case metrics::RotationPolicy::MANUAL: return "manual";
        default: return "size";
    }
}

bool parseRotation(const std::string& name, metrics::RotationPolicy& rotation) {
    static const metrics::RotationPolicy all[] = {
        metrics::RotationPolicy::DAILY, metrics::RotationPolicy::HOURLY,
        metrics::RotationPolicy::WEEKLY, metrics::RotationPolicy::MONTHLY,
        metrics::RotationPolicy::SIZE_BASED, metrics::RotationPolicy::MANUAL
    };
    for (auto candidate : all) {
        if (name == rotationName(candidate)) {
            rotation = candidate;
            return true;
        }
    }
    return false;
}

std::string lowerLevelName(metrics::LogLevel level) {
    std::string name = metrics::levelName(level);
    for (auto& c : name) {
        if (c >= 'A' && c <= 'Z') {
            c = static_cast<char>(c - 'A' + 'a');
        }
    }
    return name;
}

template<typename T>
void readValue(const nlohmann::json& json, const char* key, T& value, std::string& current) {
    auto it = json.find(key);
    if (it != json.end()) {
        current = key;
        value = it->get<T>();
    }
}

void setDetail(std::string* detail, const std::string& text) {
    if (detail) {
        *detail = text;
    }
}

} // namespace

std::error_code EngineConfig::fromJson(const nlohmann::json& json, EngineConfig& config,
                                       std::string* detail) {
    if (!json.is_object()) {
        setDetail(detail, "configuration must be a JSON object");
        return common::ErrorCode::INVALID_CONFIGURATION;
    }

    EngineConfig parsed = config;
    std::string key;

    try {
        readValue(json, "max_depth", parsed.maxDepth, key);
        readValue(json, "search_cap", parsed.searchCap, key);
        readValue(json, "copy_chunk_size", parsed.copyChunkSize, key);
        readValue(json, "progress_interval_bytes", parsed.progressIntervalBytes, key);
        readValue(json, "sync_on_complete", parsed.syncOnComplete, key);
        readValue(json, "verify_copies", parsed.verifyCopies, key);
        readValue(json, "preserve_attributes", parsed.preserveAttributes, key);
        readValue(json, "reject_sensitive_symlinks", parsed.rejectSensitiveSymlinks, key);
        readValue(json, "worker_threads", parsed.workerThreads, key);

        std::string text;
        if (json.contains("symlink_policy")) {
            readValue(json, "symlink_policy", text, key);
            if (!parsePolicy(text, parsed.symlinkPolicy)) {
                setDetail(detail, "symlink_policy: unknown value '" + text + "'");
                return common::ErrorCode::INVALID_CONFIGURATION;
            }
        }

        if (json.contains("log_level")) {
            readValue(json, "log_level", text, key);
            if (!metrics::parseLevel(text, parsed.logLevel)) {
                setDetail(detail, "log_level: unknown value '" + text + "'");
                return common::ErrorCode::INVALID_CONFIGURATION;
            }
        }

        auto logging = json.find("metrics");
        if (logging != json.end()) {
            if (!logging->is_object()) {
                setDetail(detail, "metrics must be a JSON object");
                return common::ErrorCode::INVALID_CONFIGURATION;
            }
            metrics::StorageConfig& storage = parsed.metrics;
            readValue(*logging, "base_path", storage.base_path, key);
            readValue(*logging, "file_prefix", storage.file_prefix, key);
            readValue(*logging, "max_file_size", storage.max_file_size, key);
            readValue(*logging, "max_files", storage.max_files, key);
            readValue(*logging, "compress_old_files", storage.compress_old_files, key);
            readValue(*logging, "immediate_flush", storage.immediate_flush, key);

            if (logging->contains("format")) {
                readValue(*logging, "format", text, key);
                if (!parseFormat(text, storage.format)) {
                    setDetail(detail, "metrics.format: unknown value '" + text + "'");
                    return common::ErrorCode::INVALID_CONFIGURATION;
                }
            }
            if (logging->contains("rotation")) {
                readValue(*logging, "rotation", text, key);
                if (!parseRotation(text, storage.rotation)) {
                    setDetail(detail, "metrics.rotation: unknown value '" + text + "'");
                    return common::ErrorCode::INVALID_CONFIGURATION;
                }
            }
        }
    } catch (const nlohmann::json::exception& e) {
        setDetail(detail, key + ": " + e.what());
        return common::ErrorCode::INVALID_CONFIGURATION;
    }

    std::error_code ec = parsed.validate(detail);
    if (ec) {
        return ec;
    }

    config = parsed;
    return {};
}

std::error_code EngineConfig::fromJsonString(const std::string& text, EngineConfig& config,
                                             std::string* detail) {
    nlohmann::json json = nlohmann::json::parse(text, nullptr, false);
    if (json.is_discarded()) {
        setDetail(detail, "configuration is not valid JSON");
        return common::ErrorCode::INVALID_CONFIGURATION;
    }
    return fromJson(json, config, detail);
}

nlohmann::json EngineConfig::toJson() const {
    return {
        {"max_depth", maxDepth},
        {"search_cap", searchCap},
        {"copy_chunk_size", copyChunkSize},
        {"progress_interval_bytes", progressIntervalBytes},
        {"sync_on_complete", syncOnComplete},
        {"verify_copies", verifyCopies},
        {"preserve_attributes", preserveAttributes},
        {"symlink_policy", policyName(symlinkPolicy)},
        {"reject_sensitive_symlinks", rejectSensitiveSymlinks},
        {"worker_threads", workerThreads},
        {"log_level", lowerLevelName(logLevel)},
        {"metrics", {
            {"base_path", metrics.base_path},
            {"file_prefix", metrics.file_prefix},
            {"format", formatName(metrics.format)},
            {"rotation", rotationName(metrics.rotation)},
            {"max_file_size", metrics.max_file_size},
            {"max_files", metrics.max_files},
            {"compress_old_files", metrics.compress_old_files},
            {"immediate_flush", metrics.immediate_flush}
        }}
    };
}

std::error_code EngineConfig::validate(std::string* detail) const {
    if (maxDepth == 0) {
        setDetail(detail, "max_depth must be at least 1");
        return common::ErrorCode::INVALID_CONFIGURATION;
    }
    if (copyChunkSize < common::Constants::MIN_CHUNK_SIZE ||
        copyChunkSize > common::Constants::MAX_CHUNK_SIZE) {
        setDetail(detail, "copy_chunk_size must be between " +
                          std::to_string(common::Constants::MIN_CHUNK_SIZE) + " and " +
                          std::to_string(common::Constants::MAX_CHUNK_SIZE));
        return common::ErrorCode::INVALID_CONFIGURATION;
    }
    if (progressIntervalBytes == 0) {
        setDetail(detail, "progress_interval_bytes must be positive");
        return common::ErrorCode::INVALID_CONFIGURATION;
    }
    if (workerThreads < static_cast<size_t>(common::Constants::MIN_THREAD_POOL_SIZE) ||
        workerThreads > static_cast<size_t>(common::Constants::MAX_THREAD_POOL_SIZE)) {
        setDetail(detail, "worker_threads must be between " +
                          std::to_string(common::Constants::MIN_THREAD_POOL_SIZE) + " and " +
                          std::to_string(common::Constants::MAX_THREAD_POOL_SIZE));
        return common::ErrorCode::INVALID_CONFIGURATION;
    }
    if (metrics.max_files == 0 || metrics.max_file_size == 0) {
        setDetail(detail, "metrics.max_files and metrics.max_file_size must be positive");
        return common::ErrorCode::INVALID_CONFIGURATION;
    }
    if (metrics.file_prefix.empty() || metrics.file_prefix.find('/') != std::string::npos) {
        setDetail(detail, "metrics.file_prefix must be a plain name");
        return common::ErrorCode::INVALID_CONFIGURATION;
    }
    return {};
}

ops::OperationOptions EngineConfig::operationOptions() const {
    ops::OperationOptions options;
    options.chunkSize = copyChunkSize;
    options.progressIntervalBytes = progressIntervalBytes;
    options.syncOnComplete = syncOnComplete;
    options.verifyCopies = verifyCopies;
    options.preserveAttributes = preserveAttributes;
    options.rejectSensitiveSymlinks = rejectSensitiveSymlinks;
    options.maxDepth = maxDepth;
    return options;
}

traversal::WalkOptions EngineConfig::walkOptions() const {
    traversal::WalkOptions options;
    options.symlinkPolicy = symlinkPolicy;
    options.maxDepth = maxDepth;
    return options;
}

} // namespace core
} // namespace twinpane
