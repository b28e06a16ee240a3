#pragma once
#include <iostream>
#include <string>
#include <mutex>

namespace sysintent::core::logging {

    // 1. Define Log Levels
    enum class LogLevel {
        DEBUG,
        INFO,
        WARN,
        ERROR
    };

    // 2. Global Logger Setup
    class Logger {
    public:
        // Singleton access so the whole app shares one logger
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

        LogLevel min_level() const {
            std::lock_guard<std::mutex> lock(mutex_);
            return min_level_;
        }

        // stdout is reserved for request results, so log lines go to clog.
        void log(LogLevel level, const std::string& message) {
            std::lock_guard<std::mutex> lock(mutex_); // Thread safety!
            if (static_cast<int>(level) < static_cast<int>(min_level_)) {
                return;
            }

            std::clog << "[" << level_to_string(level) << "] "
                      << (request_id_.empty() ? "" : "[" + request_id_ + "] ")
                      << message << std::endl;
        }

        static bool parse_level(const std::string& text, LogLevel& out) {
            if (text == "debug" || text == "DEBUG") { out = LogLevel::DEBUG; return true; }
            if (text == "info" || text == "INFO")   { out = LogLevel::INFO;  return true; }
            if (text == "warn" || text == "WARN")   { out = LogLevel::WARN;  return true; }
            if (text == "error" || text == "ERROR") { out = LogLevel::ERROR; return true; }
            return false;
        }

    private:
        Logger() = default;
        mutable std::mutex mutex_;
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

    // 3. Helper macros for clean syntax everywhere else in the code
    #define SYSINTENT_LOG_DEBUG(msg) sysintent::core::logging::Logger::get().log(sysintent::core::logging::LogLevel::DEBUG, msg)
    #define SYSINTENT_LOG_INFO(msg)  sysintent::core::logging::Logger::get().log(sysintent::core::logging::LogLevel::INFO, msg)
    #define SYSINTENT_LOG_WARN(msg)  sysintent::core::logging::Logger::get().log(sysintent::core::logging::LogLevel::WARN, msg)
    #define SYSINTENT_LOG_ERROR(msg) sysintent::core::logging::Logger::get().log(sysintent::core::logging::LogLevel::ERROR, msg)

} // namespace sysintent::core::logging
