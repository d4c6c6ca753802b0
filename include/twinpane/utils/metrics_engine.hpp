#ifndef TWINPANE_METRICS_ENGINE_H
#define TWINPANE_METRICS_ENGINE_H

#include <string>
#include <map>
#include <deque>
#include <vector>
#include <memory>
#include <mutex>
#include <atomic>
#include <chrono>
#include <fstream>
#include <nlohmann/json.hpp>

namespace twinpane {
namespace metrics {
    enum class LogLevel {
        DEBUG,
        INFO,
        WARNING,
        ERROR,
        CRITICAL
    };

    enum class StorageFormat {
        TEXT,
        JSON
    };

    enum class RotationPolicy {
        DAILY,
        HOURLY,
        WEEKLY,
        MONTHLY,
        SIZE_BASED,
        MANUAL
    };

    struct MetricEntry {
        std::string timestamp;
        LogLevel level;
        std::string category;
        std::string operation;
        std::string message;
        nlohmann::json data;
        int error_code;
        double duration_ms;
        bool success;

        MetricEntry() : level(LogLevel::INFO), error_code(0), duration_ms(0.0), success(true) {}
    };

    struct StorageConfig {
        std::string base_path;
        std::string file_prefix;
        StorageFormat format;
        RotationPolicy rotation;
        uint64_t max_file_size;
        uint32_t max_files;
        bool compress_old_files;
        bool immediate_flush;

        StorageConfig();
    };

    const char* levelName(LogLevel level);
    bool parseLevel(const std::string& name, LogLevel& level);

    // Abstract destination for diagnostics. Components receive one through
    // their constructor; nothing in the engine logs to process-wide state.
    class MetricsSink {
    public:
        virtual ~MetricsSink() = default;

        virtual void record(const MetricEntry& entry) = 0;
        virtual bool flush() = 0;

        void logDebug(const std::string& category, const std::string& operation,
                     const std::string& message, const nlohmann::json& data = {});
        void logInfo(const std::string& category, const std::string& operation,
                    const std::string& message, const nlohmann::json& data = {});
        void logWarning(const std::string& category, const std::string& operation,
                       const std::string& message, const nlohmann::json& data = {});
        void logError(const std::string& category, const std::string& operation,
                     const std::string& message, int error_code = 0,
                     const nlohmann::json& data = {});
        void logCritical(const std::string& category, const std::string& operation,
                        const std::string& message, int error_code = 0,
                        const nlohmann::json& data = {});

        void logOperation(const std::string& category, const std::string& operation,
                         bool success, double duration_ms, const nlohmann::json& data = {});

        static std::string getCurrentTimestamp();

    private:
        void emit(LogLevel level, const std::string& category, const std::string& operation,
                  const std::string& message, int error_code, double duration_ms,
                  bool success, const nlohmann::json& data);
    };

    class NullMetricsSink : public MetricsSink {
    public:
        void record(const MetricEntry&) override {}
        bool flush() override { return true; }
    };

    // Keeps the most recent records in memory, oldest dropped first.
    class MemoryMetricsSink : public MetricsSink {
    public:
        explicit MemoryMetricsSink(size_t capacity);

        void record(const MetricEntry& entry) override;
        bool flush() override { return true; }

        std::vector<MetricEntry> entries() const;
        size_t countAtLevel(LogLevel level) const;
        size_t size() const;
        void clear();

    private:
        size_t capacity_;
        std::deque<MetricEntry> entries_;
        mutable std::mutex mutex_;
    };

    class MetricsStorage {
    public:
        virtual ~MetricsStorage() = default;
        virtual bool initialize(const StorageConfig& config) = 0;
        virtual bool store(const MetricEntry& entry) = 0;
        virtual bool flush() = 0;
        virtual bool rotate() = 0;
        virtual std::vector<std::string> getAvailableLogs() = 0;
        virtual bool cleanup() = 0;
        virtual uint64_t currentSize() const = 0;
        virtual std::string currentFile() const = 0;
    };

    // Shared by the text and JSON back-ends: one open file, rotated by name.
    class FileStorage : public MetricsStorage {
    public:
        bool initialize(const StorageConfig& config) override;
        bool store(const MetricEntry& entry) override;
        bool flush() override;
        bool rotate() override;
        std::vector<std::string> getAvailableLogs() override;
        bool cleanup() override;
        uint64_t currentSize() const override { return current_size_; }
        std::string currentFile() const override { return current_file_; }

    protected:
        virtual std::string extension() const = 0;
        virtual std::string formatEntry(const MetricEntry& entry) = 0;

    private:
        bool openNextFile();
        bool compressFile(const std::string& path);

        StorageConfig config_;
        std::string current_file_;
        std::ofstream file_stream_;
        uint64_t current_size_ = 0;
        uint32_t sequence_ = 0;
    };

    class TextStorage : public FileStorage {
    protected:
        std::string extension() const override { return ".log"; }
        std::string formatEntry(const MetricEntry& entry) override;
    };

    // One JSON object per line so a rotated file is always valid on its own.
    class JsonStorage : public FileStorage {
    protected:
        std::string extension() const override { return ".json"; }
        std::string formatEntry(const MetricEntry& entry) override;

    public:
        static nlohmann::json convertToJson(const MetricEntry& entry);
    };

    class MetricsEngine : public MetricsSink {
    public:
        MetricsEngine();
        ~MetricsEngine() override;

        MetricsEngine(const MetricsEngine&) = delete;
        MetricsEngine& operator=(const MetricsEngine&) = delete;

        bool initialize(const StorageConfig& config);
        bool shutdown();
        bool isInitialized() const { return initialized_.load(); }

        void record(const MetricEntry& entry) override;
        bool flush() override;

        bool rotateNow();

        uint64_t getTotalMetricsCount() const;
        std::map<std::string, uint64_t> getMetricsByCategory() const;
        std::map<LogLevel, uint64_t> getMetricsByLevel() const;
        std::vector<std::string> getAvailableLogs();

        void setMinLevel(LogLevel level);

    private:
        bool shouldRotate() const;
        void performRotation();
        void flushBatchLocked();

        std::unique_ptr<MetricsStorage> createStorage(StorageFormat format);

        std::unique_ptr<MetricsStorage> storage_;
        StorageConfig config_;
        std::atomic<bool> initialized_;
        std::atomic<uint64_t> total_metrics_;
        std::map<std::string, uint64_t> category_counts_;
        std::map<LogLevel, uint64_t> level_counts_;

        std::vector<MetricEntry> batch_buffer_;
        const uint32_t batch_size_;
        std::atomic<int> min_level_;
        std::chrono::system_clock::time_point last_rotation_;

        mutable std::mutex mutex_;
    };
}
}

#endif
