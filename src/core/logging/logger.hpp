#pragma once
#include <iostream>
#include <string>
#include <mutex>

namespace ralph::core::logging {

    // 1. Log levels, ordered by severity
    enum class LogLevel {
        DEBUG,
        INFO,
        WARN,
        ERROR
    };

    // 2. Global logger
    class Logger {
    public:
        // Singleton access so the loop, harnesses and audit writer share one logger
        static Logger& get() {
            static Logger instance;
            return instance;
        }

        void set_run_id(const std::string& id) {
            std::lock_guard<std::mutex> lock(mutex_);
            run_id_ = id;
        }

        // --verbose lowers this to DEBUG
        void set_min_level(LogLevel level) {
            std::lock_guard<std::mutex> lock(mutex_);
            min_level_ = level;
        }

        bool enabled(LogLevel level) {
            std::lock_guard<std::mutex> lock(mutex_);
            return static_cast<int>(level) >= static_cast<int>(min_level_);
        }

        void log(LogLevel level, const std::string& message) {
            std::lock_guard<std::mutex> lock(mutex_); // the watchdog thread logs too
            if (static_cast<int>(level) < static_cast<int>(min_level_)) {
                return;
            }

            std::cout << "[" << level_to_string(level) << "] "
                      << (run_id_.empty() ? "" : "[" + run_id_ + "] ")
                      << message << std::endl;
        }

    private:
        Logger() = default;
        std::mutex mutex_;
        std::string run_id_;
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

    // 3. Helper macros
    #define LOG_DEBUG(msg) ralph::core::logging::Logger::get().log(ralph::core::logging::LogLevel::DEBUG, msg)
    #define LOG_INFO(msg)  ralph::core::logging::Logger::get().log(ralph::core::logging::LogLevel::INFO, msg)
    #define LOG_WARN(msg)  ralph::core::logging::Logger::get().log(ralph::core::logging::LogLevel::WARN, msg)
    #define LOG_ERROR(msg) ralph::core::logging::Logger::get().log(ralph::core::logging::LogLevel::ERROR, msg)

} // namespace ralph::core::logging
