#pragma once
#include "metrics_engine.hpp"
#include <chrono>
#include <functional>
#include <memory>
#include <string>
#include <type_traits>

namespace twinpane {

class MetricsBase {
protected:
    std::shared_ptr<metrics::MetricsSink> metrics_;
    std::string component_name_;
    bool metrics_enabled_;

    MetricsBase(const std::string& component_name,
                std::shared_ptr<metrics::MetricsSink> sink,
                bool enabled = true)
        : metrics_(sink ? std::move(sink) : std::make_shared<metrics::NullMetricsSink>())
        , component_name_(component_name)
        , metrics_enabled_(enabled) {
    }

public:
    virtual ~MetricsBase() = default;


    class ScopedTimer {
    private:
        MetricsBase& parent_;
        std::string operation_;
        std::chrono::steady_clock::time_point start_;
        nlohmann::json custom_data_;
        bool success_ = true;

    public:
        ScopedTimer(MetricsBase& parent, const std::string& operation,
                   const nlohmann::json& data = {})
            : parent_(parent), operation_(operation), custom_data_(data) {
            start_ = std::chrono::steady_clock::now();
        }

        ScopedTimer(const ScopedTimer&) = delete;
        ScopedTimer& operator=(const ScopedTimer&) = delete;

        void addData(const std::string& key, const nlohmann::json& value) {
            custom_data_[key] = value;
        }

        void setFailed(int error_code = 0, const std::string& error_msg = "") {
            success_ = false;
            if (!error_msg.empty()) {
                custom_data_["error_message"] = error_msg;
            }
            if (error_code != 0) {
                custom_data_["error_code"] = error_code;
            }
        }

        ~ScopedTimer() {
            if (!parent_.metrics_enabled_) return;

            auto end = std::chrono::steady_clock::now();
            auto duration = std::chrono::duration_cast<std::chrono::milliseconds>(end - start_);

            if (success_) {
                parent_.metrics_->logOperation(parent_.component_name_, operation_,
                                               true, static_cast<double>(duration.count()),
                                               custom_data_);
            } else {
                parent_.metrics_->logError(parent_.component_name_, operation_,
                                           "Operation failed",
                                           custom_data_.value("error_code", 0),
                                           custom_data_);
            }
        }
    };


    template<typename Func>
    auto measure(const std::string& operation, Func&& func,
                const nlohmann::json& context_data = {}) {
        ScopedTimer timer(*this, operation, context_data);

        try {
            if constexpr (std::is_void_v<std::invoke_result_t<Func>>) {
                std::invoke(std::forward<Func>(func));
            } else {
                return std::invoke(std::forward<Func>(func));
            }
        } catch (const std::exception& e) {
            timer.setFailed(-1, e.what());
            throw;
        }
    }


    void logDebug(const std::string& operation, const std::string& message,
                 const nlohmann::json& data = {}) {
        if (!metrics_enabled_) return;
        metrics_->logDebug(component_name_, operation, message, data);
    }

    void logInfo(const std::string& operation, const std::string& message,
                const nlohmann::json& data = {}) {
        if (!metrics_enabled_) return;
        metrics_->logInfo(component_name_, operation, message, data);
    }

    void logWarning(const std::string& operation, const std::string& message,
                   const nlohmann::json& data = {}) {
        if (!metrics_enabled_) return;
        metrics_->logWarning(component_name_, operation, message, data);
    }

    void logError(const std::string& operation, const std::string& message,
                 int error_code = 0, const nlohmann::json& data = {}) {
        if (!metrics_enabled_) return;
        metrics_->logError(component_name_, operation, message, error_code, data);
    }

    void logCritical(const std::string& operation, const std::string& message,
                    int error_code = 0, const nlohmann::json& data = {}) {
        if (!metrics_enabled_) return;
        metrics_->logCritical(component_name_, operation, message, error_code, data);
    }


    void enableMetrics(bool enabled = true) { metrics_enabled_ = enabled; }
    bool isMetricsEnabled() const { return metrics_enabled_; }

    const std::string& getComponentName() const { return component_name_; }
    const std::shared_ptr<metrics::MetricsSink>& getMetricsSink() const { return metrics_; }
};

} // namespace twinpane
