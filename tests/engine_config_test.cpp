// tests/engine_config_test.cpp
#include "twinpane/core/EngineConfig.hpp"

#include <gtest/gtest.h>

using twinpane::core::EngineConfig;
using twinpane::common::ErrorCode;
using twinpane::common::SymlinkPolicy;
namespace metrics = twinpane::metrics;

TEST(EngineConfigTest, DefaultsAreValid) {
    EngineConfig config;

    EXPECT_FALSE(config.validate());
    EXPECT_EQ(config.maxDepth, 256u);
    EXPECT_EQ(config.searchCap, 1000u);
    EXPECT_EQ(config.symlinkPolicy, SymlinkPolicy::OPAQUE);
    EXPECT_TRUE(config.rejectSensitiveSymlinks);
    EXPECT_TRUE(config.metrics.base_path.empty());
    EXPECT_EQ(config.logLevel, metrics::LogLevel::INFO);
}

TEST(EngineConfigTest, ReadsSnakeCaseKeys) {
    EngineConfig config;
    std::string detail;

    std::error_code ec = EngineConfig::fromJsonString(R"({
        "max_depth": 12,
        "search_cap": 50,
        "copy_chunk_size": 8192,
        "symlink_policy": "follow",
        "verify_copies": true,
        "log_level": "warning",
        "metrics": {"base_path": "/var/tmp/twinpane", "format": "json", "rotation": "daily",
                    "max_files": 9, "compress_old_files": true}
    })", config, &detail);

    ASSERT_FALSE(ec) << detail;
    EXPECT_EQ(config.maxDepth, 12u);
    EXPECT_EQ(config.searchCap, 50u);
    EXPECT_EQ(config.copyChunkSize, 8192u);
    EXPECT_EQ(config.symlinkPolicy, SymlinkPolicy::FOLLOW);
    EXPECT_TRUE(config.verifyCopies);
    EXPECT_EQ(config.logLevel, metrics::LogLevel::WARNING);
    EXPECT_EQ(config.metrics.base_path, "/var/tmp/twinpane");
    EXPECT_EQ(config.metrics.format, metrics::StorageFormat::JSON);
    EXPECT_EQ(config.metrics.rotation, metrics::RotationPolicy::DAILY);
    EXPECT_EQ(config.metrics.max_files, 9u);
    EXPECT_TRUE(config.metrics.compress_old_files);
    // Untouched keys keep their defaults.
    EXPECT_TRUE(config.syncOnComplete);
    EXPECT_EQ(config.workerThreads, 2u);
}

TEST(EngineConfigTest, JsonRoundTrip) {
    EngineConfig original;
    original.maxDepth = 40;
    original.symlinkPolicy = SymlinkPolicy::FOLLOW;
    original.preserveAttributes = false;
    original.logLevel = metrics::LogLevel::DEBUG;
    original.metrics.rotation = metrics::RotationPolicy::MANUAL;

    EngineConfig restored;
    ASSERT_FALSE(EngineConfig::fromJson(original.toJson(), restored));

    EXPECT_EQ(restored.toJson(), original.toJson());
    EXPECT_EQ(restored.toJson()["symlink_policy"].get<std::string>(), "follow");
    EXPECT_EQ(restored.toJson()["log_level"].get<std::string>(), "debug");
    EXPECT_EQ(restored.toJson()["metrics"]["rotation"].get<std::string>(), "manual");
}

TEST(EngineConfigTest, RejectsBadValuesAndKeepsPreviousConfig) {
    EngineConfig config;
    config.searchCap = 77;
    std::string detail;

    EXPECT_EQ(EngineConfig::fromJsonString(R"({"search_cap": 5, "max_depth": 0})", config, &detail),
              ErrorCode::INVALID_CONFIGURATION);
    EXPECT_EQ(detail, "max_depth must be at least 1");
    EXPECT_EQ(config.searchCap, 77u);

    EXPECT_EQ(EngineConfig::fromJsonString(R"({"copy_chunk_size": 100})", config, &detail),
              ErrorCode::INVALID_CONFIGURATION);
    EXPECT_EQ(EngineConfig::fromJsonString(R"({"worker_threads": 9})", config, &detail),
              ErrorCode::INVALID_CONFIGURATION);
    EXPECT_EQ(EngineConfig::fromJsonString(R"({"symlink_policy": "sometimes"})", config, &detail),
              ErrorCode::INVALID_CONFIGURATION);
    EXPECT_EQ(detail, "symlink_policy: unknown value 'sometimes'");
    EXPECT_EQ(EngineConfig::fromJsonString(R"({"metrics": {"file_prefix": "a/b"}})", config, &detail),
              ErrorCode::INVALID_CONFIGURATION);
    EXPECT_EQ(EngineConfig::fromJsonString(R"({"metrics": {"rotation": "yearly"}})", config, &detail),
              ErrorCode::INVALID_CONFIGURATION);
}

TEST(EngineConfigTest, RejectsWrongTypes) {
    EngineConfig config;
    std::string detail;

    EXPECT_EQ(EngineConfig::fromJsonString(R"({"max_depth": "deep"})", config, &detail),
              ErrorCode::INVALID_CONFIGURATION);
    EXPECT_EQ(detail.compare(0, 11, "max_depth: "), 0) << detail;

    EXPECT_EQ(EngineConfig::fromJsonString(R"({"metrics": 3})", config, &detail),
              ErrorCode::INVALID_CONFIGURATION);
    EXPECT_EQ(EngineConfig::fromJsonString("[1, 2]", config, &detail),
              ErrorCode::INVALID_CONFIGURATION);
}

TEST(EngineConfigTest, RejectsMalformedText) {
    EngineConfig config;
    std::string detail;

    EXPECT_EQ(EngineConfig::fromJsonString("{\"max_depth\": ", config, &detail),
              ErrorCode::INVALID_CONFIGURATION);
    EXPECT_EQ(detail, "configuration is not valid JSON");
}

TEST(EngineConfigTest, DerivedOptions) {
    EngineConfig config;
    config.copyChunkSize = 4096;
    config.maxDepth = 7;
    config.symlinkPolicy = SymlinkPolicy::FOLLOW;
    config.syncOnComplete = false;

    twinpane::ops::OperationOptions options = config.operationOptions();
    EXPECT_EQ(options.chunkSize, 4096u);
    EXPECT_EQ(options.maxDepth, 7u);
    EXPECT_FALSE(options.syncOnComplete);

    twinpane::traversal::WalkOptions walk = config.walkOptions();
    EXPECT_EQ(walk.symlinkPolicy, SymlinkPolicy::FOLLOW);
    EXPECT_EQ(walk.maxDepth, 7u);
}
