#pragma once
#include <cstdlib>
#include <iostream>
#include <string>
#include <mutex>

namespace inkbridge::core::logging {

    // 1. Define Log Levels
    enum class LogLevel {
        DEBUG,
        INFO,
        WARN,
        ERROR
    };

    // 2. Global Logger Setup
    // Records go to stderr: stdout of the CLI carries the JSON response.
    class Logger {
    public:
        static Logger& get() {
            static Logger instance;
            return instance;
        }

        void set_request_id(const std::string& id) {
            std::lock_guard<std::mutex> lock(mutex_);
            request_id_ = id;
        }

        void set_min_level(LogLevel level) {
            std::lock_guard<std::mutex> lock(mutex_);
            min_level_ = level;
        }

        // Reads INKBRIDGE_LOG_LEVEL (debug|info|warn|error); unknown values are ignored.
        void configure_from_env() {
            const char* raw = std::getenv("INKBRIDGE_LOG_LEVEL");
            if (raw == nullptr) {
                return;
            }
            const std::string value(raw);
            if (value == "debug") set_min_level(LogLevel::DEBUG);
            else if (value == "info") set_min_level(LogLevel::INFO);
            else if (value == "warn") set_min_level(LogLevel::WARN);
            else if (value == "error") set_min_level(LogLevel::ERROR);
        }

        void log(LogLevel level, const std::string& message) {
            std::lock_guard<std::mutex> lock(mutex_);
            if (static_cast<int>(level) < static_cast<int>(min_level_)) {
                return;
            }

            std::cerr << "[" << level_to_string(level) << "] "
                      << (request_id_.empty() ? "" : "[" + request_id_ + "] ")
                      << message << std::endl;
        }

    private:
        Logger() = default;
        std::mutex mutex_;
        std::string request_id_;
        LogLevel min_level_ = LogLevel::INFO;

        std::string level_to_string(LogLevel level) {
            switch (level) {
                case LogLevel::DEBUG: return "DEBUG";
                case LogLevel::INFO:  return "INFO ";
                case LogLevel::WARN:  return "WARN ";
                case LogLevel::ERROR: return "ERROR";
                default: return "UNKNOWN";
            }
        }
    };

    #define LOG_DEBUG(msg) inkbridge::core::logging::Logger::get().log(inkbridge::core::logging::LogLevel::DEBUG, msg)
    #define LOG_INFO(msg)  inkbridge::core::logging::Logger::get().log(inkbridge::core::logging::LogLevel::INFO, msg)
    #define LOG_WARN(msg)  inkbridge::core::logging::Logger::get().log(inkbridge::core::logging::LogLevel::WARN, msg)
    #define LOG_ERROR(msg) inkbridge::core::logging::Logger::get().log(inkbridge::core::logging::LogLevel::ERROR, msg)

} // namespace inkbridge::core::logging
