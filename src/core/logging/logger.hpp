#pragma once
#include <iostream>
#include <memory>
#include <mutex>
#include <string>

namespace agentrt::core::logging {

    // 1. Log levels, ordered by severity
    enum class LogLevel {
        DEBUG,
        INFO,
        WARN,
        ERROR
    };

    struct LoggerConfig {
        LogLevel level = LogLevel::INFO;
        std::ostream* sink = &std::cout;  // Not owned; must outlive the logger
        std::string context;              // Printed as "[context]" on every line
    };

    // 2. Logger instances are passed explicitly to the components that use them.
    class Logger {
    public:
        explicit Logger(LoggerConfig config = {}) : config_(std::move(config)) {}

        // Fresh stdout logger for components constructed without one
        static std::shared_ptr<Logger> make_default(const std::string& context = "") {
            LoggerConfig config;
            config.context = context;
            return std::make_shared<Logger>(std::move(config));
        }

        void set_context(const std::string& context) {
            std::lock_guard<std::mutex> lock(mutex_);
            config_.context = context;
        }

        void set_level(LogLevel level) {
            std::lock_guard<std::mutex> lock(mutex_);
            config_.level = level;
        }

        bool enabled(LogLevel level) const {
            std::lock_guard<std::mutex> lock(mutex_);
            return static_cast<int>(level) >= static_cast<int>(config_.level);
        }

        void log(LogLevel level, const std::string& message) {
            std::lock_guard<std::mutex> lock(mutex_); // Thread safety!
            if (static_cast<int>(level) < static_cast<int>(config_.level) ||
                config_.sink == nullptr) {
                return;
            }

            *config_.sink << "[" << level_to_string(level) << "] "
                          << (config_.context.empty() ? "" : "[" + config_.context + "] ")
                          << message << std::endl;
        }

    private:
        mutable std::mutex mutex_;
        LoggerConfig config_;

        static std::string level_to_string(LogLevel level) {
            switch (level) {
                case LogLevel::DEBUG: return "DEBUG";
                case LogLevel::INFO:  return "INFO ";
                case LogLevel::WARN:  return "WARN ";
                case LogLevel::ERROR: return "ERROR";
                default: return "UNKNOWN";
            }
        }
    };

    // 3. Helper macros; `logger` is any pointer-like handle to a Logger
    #define AGENTRT_LOG_DEBUG(logger, msg) (logger)->log(agentrt::core::logging::LogLevel::DEBUG, msg)
    #define AGENTRT_LOG_INFO(logger, msg)  (logger)->log(agentrt::core::logging::LogLevel::INFO, msg)
    #define AGENTRT_LOG_WARN(logger, msg)  (logger)->log(agentrt::core::logging::LogLevel::WARN, msg)
    #define AGENTRT_LOG_ERROR(logger, msg) (logger)->log(agentrt::core::logging::LogLevel::ERROR, msg)

} // namespace agentrt::core::logging
