#pragma once
#include <iostream>
#include <string>
#include <mutex>

namespace crucible::core::logging {

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
        // Singleton access so the whole process shares one logger
        static Logger& get() {
            static Logger instance;
            return instance;
        }

        // Prefix identifying the emitting process, e.g. "node k3x9ab2q-main".
        void set_process_label(const std::string& label) {
            std::lock_guard<std::mutex> lock(mutex_);
            process_label_ = label;
        }

        void set_min_level(LogLevel level) {
            std::lock_guard<std::mutex> lock(mutex_);
            min_level_ = level;
        }

        void log(LogLevel level, const std::string& message) {
            std::lock_guard<std::mutex> lock(mutex_); // Thread safety!
            if (level < min_level_) {
                return;
            }

            std::cout << "[" << level_to_string(level) << "] "
                      << (process_label_.empty() ? "" : "[" + process_label_ + "] ")
                      << message << std::endl;
        }

    private:
        Logger() = default;
        std::mutex mutex_;
        std::string process_label_;
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

    inline bool parse_log_level(const std::string& text, LogLevel& level) {
        if (text == "debug") { level = LogLevel::DEBUG; return true; }
        if (text == "info")  { level = LogLevel::INFO;  return true; }
        if (text == "warn")  { level = LogLevel::WARN;  return true; }
        if (text == "error") { level = LogLevel::ERROR; return true; }
        return false;
    }

    inline std::string to_string(LogLevel level) {
        switch (level) {
            case LogLevel::DEBUG: return "debug";
            case LogLevel::INFO:  return "info";
            case LogLevel::WARN:  return "warn";
            case LogLevel::ERROR: return "error";
        }
        return "info";
    }

    // 3. Helper macros for clean syntax everywhere else in the code
    #define LOG_DEBUG(msg) crucible::core::logging::Logger::get().log(crucible::core::logging::LogLevel::DEBUG, msg)
    #define LOG_INFO(msg)  crucible::core::logging::Logger::get().log(crucible::core::logging::LogLevel::INFO, msg)
    #define LOG_WARN(msg)  crucible::core::logging::Logger::get().log(crucible::core::logging::LogLevel::WARN, msg)
    #define LOG_ERROR(msg) crucible::core::logging::Logger::get().log(crucible::core::logging::LogLevel::ERROR, msg)

} // namespace crucible::core::logging
