#include "twinpane/utils/metrics_engine.hpp"
#include "twinpane/common/Constants.hpp"

#include <algorithm>
#include <cstdio>
#include <ctime>
#include <filesystem>
#include <iomanip>
#include <sstream>
#include <zlib.h>


namespace twinpane {
namespace metrics {

StorageConfig::StorageConfig()
    : file_prefix("twinpane")
    , format(StorageFormat::TEXT)
    , rotation(RotationPolicy::SIZE_BASED)
    , max_file_size(common::Constants::DEFAULT_LOG_FILE_SIZE)
    , max_files(common::Constants::DEFAULT_LOG_FILES)
    , compress_old_files(false)
    , immediate_flush(false) {
}

const char* levelName(LogLevel level) {
    switch (level) {
        case LogLevel::DEBUG: return "DEBUG";
        case LogLevel::INFO: return "INFO";
        case LogLevel::WARNING: return "WARN";
        case LogLevel::ERROR: return "ERROR";
        case LogLevel::CRITICAL: return "CRITICAL";
        default: return "UNKNOWN";
    }
}

bool parseLevel(const std::string& name, LogLevel& level) {
    static const std::map<std::string, LogLevel> levels = {
        {"debug", LogLevel::DEBUG}, {"info", LogLevel::INFO},
        {"warning", LogLevel::WARNING}, {"warn", LogLevel::WARNING},
        {"error", LogLevel::ERROR}, {"critical", LogLevel::CRITICAL}};

    std::string lower = name;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    auto it = levels.find(lower);
    if (it == levels.end()) {
        return false;
    }
    level = it->second;
    return true;
}

// ----------------- MetricsSink -----------------

std::string MetricsSink::getCurrentTimestamp() {
    auto now = std::chrono::system_clock::now();
    auto time_t = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()) % 1000;

    std::tm local_tm{};
    localtime_r(&time_t, &local_tm);

    std::stringstream ss;
    ss << std::put_time(&local_tm, "%Y-%m-%d %H:%M:%S");
    ss << "." << std::setfill('0') << std::setw(3) << ms.count();

    return ss.str();
}

void MetricsSink::emit(LogLevel level, const std::string& category, const std::string& operation,
                       const std::string& message, int error_code, double duration_ms,
                       bool success, const nlohmann::json& data) {
    MetricEntry entry;
    entry.timestamp = getCurrentTimestamp();
    entry.level = level;
    entry.category = category;
    entry.operation = operation;
    entry.message = message;
    entry.error_code = error_code;
    entry.duration_ms = duration_ms;
    entry.data = data;
    entry.success = success;

    record(entry);
}

void MetricsSink::logDebug(const std::string& category, const std::string& operation,
                           const std::string& message, const nlohmann::json& data) {
    emit(LogLevel::DEBUG, category, operation, message, 0, 0.0, true, data);
}

void MetricsSink::logInfo(const std::string& category, const std::string& operation,
                          const std::string& message, const nlohmann::json& data) {
    emit(LogLevel::INFO, category, operation, message, 0, 0.0, true, data);
}

void MetricsSink::logWarning(const std::string& category, const std::string& operation,
                             const std::string& message, const nlohmann::json& data) {
    emit(LogLevel::WARNING, category, operation, message, 0, 0.0, false, data);
}

void MetricsSink::logError(const std::string& category, const std::string& operation,
                           const std::string& message, int error_code,
                           const nlohmann::json& data) {
    emit(LogLevel::ERROR, category, operation, message, error_code, 0.0, false, data);
}

void MetricsSink::logCritical(const std::string& category, const std::string& operation,
                              const std::string& message, int error_code,
                              const nlohmann::json& data) {
    emit(LogLevel::CRITICAL, category, operation, message, error_code, 0.0, false, data);
}

void MetricsSink::logOperation(const std::string& category, const std::string& operation,
                               bool success, double duration_ms, const nlohmann::json& data) {
    emit(success ? LogLevel::INFO : LogLevel::ERROR, category, operation,
         success ? "Operation completed successfully" : "Operation failed",
         0, duration_ms, success, data);
}

// ----------------- MemoryMetricsSink -----------------

MemoryMetricsSink::MemoryMetricsSink(size_t capacity)
    : capacity_(capacity > 0 ? capacity : 1) {
}

void MemoryMetricsSink::record(const MetricEntry& entry) {
    std::lock_guard<std::mutex> lock(mutex_);
    entries_.push_back(entry);
    while (entries_.size() > capacity_) {
        entries_.pop_front();
    }
}

std::vector<MetricEntry> MemoryMetricsSink::entries() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return std::vector<MetricEntry>(entries_.begin(), entries_.end());
}

size_t MemoryMetricsSink::countAtLevel(LogLevel level) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return static_cast<size_t>(std::count_if(entries_.begin(), entries_.end(),
        [level](const MetricEntry& e) { return e.level == level; }));
}

size_t MemoryMetricsSink::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.size();
}

void MemoryMetricsSink::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    entries_.clear();
}

// ----------------- MetricsEngine -----------------

MetricsEngine::MetricsEngine()
    : initialized_(false)
    , total_metrics_(0)
    , batch_size_(32)
    , min_level_(static_cast<int>(LogLevel::DEBUG)) {
}

MetricsEngine::~MetricsEngine() {
    shutdown();
}

bool MetricsEngine::initialize(const StorageConfig& config) {
    std::lock_guard<std::mutex> lock(mutex_);

    if (initialized_) {
        return false;
    }
    if (config.base_path.empty()) {
        return false;
    }

    config_ = config;
    storage_ = createStorage(config.format);

    if (!storage_->initialize(config)) {
        storage_.reset();
        return false;
    }

    last_rotation_ = std::chrono::system_clock::now();
    initialized_ = true;

    return true;
}

bool MetricsEngine::shutdown() {
    std::lock_guard<std::mutex> lock(mutex_);

    if (!initialized_) {
        return false;
    }

    flushBatchLocked();
    initialized_ = false;

    return true;
}

void MetricsEngine::record(const MetricEntry& entry) {
    if (static_cast<int>(entry.level) < min_level_.load()) {
        return;
    }

    std::lock_guard<std::mutex> lock(mutex_);

    if (!initialized_) {
        return;
    }

    batch_buffer_.push_back(entry);

    total_metrics_++;
    category_counts_[entry.category]++;
    level_counts_[entry.level]++;

    if (config_.immediate_flush || batch_buffer_.size() >= batch_size_) {
        flushBatchLocked();
    }
}

bool MetricsEngine::flush() {
    std::lock_guard<std::mutex> lock(mutex_);

    if (!initialized_) {
        return false;
    }
    flushBatchLocked();
    return true;
}

void MetricsEngine::flushBatchLocked() {
    if (!storage_) {
        return;
    }

    for (const auto& batch_entry : batch_buffer_) {
        if (shouldRotate()) {
            performRotation();
        }
        storage_->store(batch_entry);
    }
    batch_buffer_.clear();
    storage_->flush();

    if (shouldRotate()) {
        performRotation();
    }
}

bool MetricsEngine::rotateNow() {
    std::lock_guard<std::mutex> lock(mutex_);

    if (!initialized_) {
        return false;
    }
    flushBatchLocked();
    performRotation();
    return true;
}

uint64_t MetricsEngine::getTotalMetricsCount() const {
    return total_metrics_.load();
}

std::map<std::string, uint64_t> MetricsEngine::getMetricsByCategory() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return category_counts_;
}

std::map<LogLevel, uint64_t> MetricsEngine::getMetricsByLevel() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return level_counts_;
}

std::vector<std::string> MetricsEngine::getAvailableLogs() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!storage_) {
        return {};
    }
    return storage_->getAvailableLogs();
}

void MetricsEngine::setMinLevel(LogLevel level) {
    min_level_ = static_cast<int>(level);
}

bool MetricsEngine::shouldRotate() const {
    if (config_.rotation == RotationPolicy::MANUAL) {
        return false;
    }

    if (config_.rotation == RotationPolicy::SIZE_BASED) {
        return storage_ && config_.max_file_size > 0 &&
               storage_->currentSize() >= config_.max_file_size;
    }

    auto now = std::chrono::system_clock::now();
    auto duration = now - last_rotation_;

    switch (config_.rotation) {
        case RotationPolicy::DAILY:
            return duration >= std::chrono::hours(24);
        case RotationPolicy::HOURLY:
            return duration >= std::chrono::hours(1);
        case RotationPolicy::WEEKLY:
            return duration >= std::chrono::hours(24 * 7);
        case RotationPolicy::MONTHLY:
            return duration >= std::chrono::hours(24 * 30);
        default:
            return false;
    }
}

void MetricsEngine::performRotation() {
    if (storage_) {
        storage_->rotate();
        storage_->cleanup();
        last_rotation_ = std::chrono::system_clock::now();
    }
}

std::unique_ptr<MetricsStorage> MetricsEngine::createStorage(StorageFormat format) {
    switch (format) {
        case StorageFormat::JSON:
            return std::make_unique<JsonStorage>();
        case StorageFormat::TEXT:
        default:
            return std::make_unique<TextStorage>();
    }
}

// ----------------- FileStorage -----------------

bool FileStorage::initialize(const StorageConfig& config) {
    config_ = config;

    std::error_code ec;
    std::filesystem::create_directories(config.base_path, ec);
    if (ec) {
        return false;
    }

    return openNextFile();
}

bool FileStorage::openNextFile() {
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();

    std::stringstream name;
    name << config_.base_path << "/" << config_.file_prefix << "_"
         << std::setfill('0') << std::setw(15) << ms << "_"
         << std::setw(6) << (sequence_++ % 1000000) << extension();
    current_file_ = name.str();
    current_size_ = 0;

    file_stream_.open(current_file_, std::ios::app);
    return file_stream_.is_open();
}

bool FileStorage::store(const MetricEntry& entry) {
    if (!file_stream_.is_open()) {
        return false;
    }

    std::string line = formatEntry(entry);
    file_stream_ << line << '\n';
    current_size_ += line.size() + 1;

    if (config_.immediate_flush) {
        file_stream_.flush();
    }

    return static_cast<bool>(file_stream_);
}

bool FileStorage::flush() {
    if (file_stream_.is_open()) {
        file_stream_.flush();
    }
    return true;
}

bool FileStorage::rotate() {
    std::string finished = current_file_;

    if (file_stream_.is_open()) {
        file_stream_.close();
    }

    if (config_.compress_old_files && !finished.empty()) {
        compressFile(finished);
    }

    return openNextFile();
}

bool FileStorage::compressFile(const std::string& path) {
    std::ifstream input(path, std::ios::binary);
    if (!input.is_open()) {
        return false;
    }

    std::string gz_path = path + ".gz";
    gzFile output = gzopen(gz_path.c_str(), "wb");
    if (output == nullptr) {
        return false;
    }

    char buffer[16384];
    bool ok = true;
    while (input.read(buffer, sizeof(buffer)) || input.gcount() > 0) {
        int chunk = static_cast<int>(input.gcount());
        if (gzwrite(output, buffer, static_cast<unsigned>(chunk)) != chunk) {
            ok = false;
            break;
        }
    }

    if (gzclose(output) != Z_OK) {
        ok = false;
    }
    input.close();

    std::error_code ec;
    if (ok) {
        std::filesystem::remove(path, ec);
    } else {
        std::filesystem::remove(gz_path, ec);
    }
    return ok && !ec;
}

std::vector<std::string> FileStorage::getAvailableLogs() {
    std::vector<std::string> logs;
    std::string ext = extension();
    std::string prefix = config_.file_prefix + "_";

    std::error_code ec;
    for (const auto& entry : std::filesystem::directory_iterator(config_.base_path, ec)) {
        if (!entry.is_regular_file(ec)) {
            continue;
        }
        std::string name = entry.path().filename().string();
        if (name.compare(0, prefix.size(), prefix) != 0) {
            continue;
        }
        bool plain = name.size() > ext.size() &&
                     name.compare(name.size() - ext.size(), ext.size(), ext) == 0;
        std::string gz_ext = ext + ".gz";
        bool packed = name.size() > gz_ext.size() &&
                      name.compare(name.size() - gz_ext.size(), gz_ext.size(), gz_ext) == 0;
        if (plain || packed) {
            logs.push_back(entry.path().string());
        }
    }

    std::sort(logs.begin(), logs.end());
    return logs;
}

bool FileStorage::cleanup() {
    auto logs = getAvailableLogs();

    if (config_.max_files == 0 || logs.size() <= config_.max_files) {
        return true;
    }

    bool ok = true;
    for (size_t i = 0; i < logs.size() - config_.max_files; i++) {
        if (logs[i] == current_file_) {
            continue;
        }
        std::error_code ec;
        std::filesystem::remove(logs[i], ec);
        if (ec) {
            ok = false;
        }
    }

    return ok;
}

// ----------------- TextStorage / JsonStorage -----------------

std::string TextStorage::formatEntry(const MetricEntry& entry) {
    std::stringstream ss;
    ss << "[" << entry.timestamp << "] "
       << "[" << levelName(entry.level) << "] "
       << "[" << entry.category << "] "
       << "[" << entry.operation << "] "
       << entry.message;

    if (entry.error_code != 0) {
        ss << " (Error: " << entry.error_code << ")";
    }

    if (entry.duration_ms > 0) {
        ss << " [Duration: " << entry.duration_ms << "ms]";
    }

    if (!entry.data.is_null() && !entry.data.empty()) {
        ss << " [Data: " << entry.data.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace) << "]";
    }

    return ss.str();
}

nlohmann::json JsonStorage::convertToJson(const MetricEntry& entry) {
    nlohmann::json j;
    j["timestamp"] = entry.timestamp;
    j["level"] = levelName(entry.level);
    j["category"] = entry.category;
    j["operation"] = entry.operation;
    j["message"] = entry.message;
    j["data"] = entry.data;
    j["error_code"] = entry.error_code;
    j["duration_ms"] = entry.duration_ms;
    j["success"] = entry.success;

    return j;
}

std::string JsonStorage::formatEntry(const MetricEntry& entry) {
    return convertToJson(entry).dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

}
}
