#pragma once
#include <cctype>
#include <cstdlib>
#include <iostream>
#include <mutex>
#include <string>

namespace snipexec::core::logging {

    // 1. Define Log Levels
    enum class LogLevel {
        DEBUG,
        INFO,
        WARN,
        ERROR
    };

    // Parses DEBUG/INFO/WARN/ERROR (any case). Unknown text maps to WARN.
    inline LogLevel parse_level(std::string text) {
        for (auto& c : text) {
            c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
        }
        if (text == "DEBUG") return LogLevel::DEBUG;
        if (text == "INFO") return LogLevel::INFO;
        if (text == "ERROR") return LogLevel::ERROR;
        return LogLevel::WARN;
    }

    // 2. Global Logger Setup
    class Logger {
    public:
        // Singleton access so the whole process shares one logger
        static Logger& get() {
            static Logger instance;
            return instance;
        }

        void set_min_level(LogLevel level) {
            std::lock_guard<std::mutex> lock(mutex_);
            min_level_ = level;
        }

        // stdout belongs to the tool envelope, so log lines go to stderr.
        void log(LogLevel level, const std::string& message) {
            std::lock_guard<std::mutex> lock(mutex_);
            if (static_cast<int>(level) < static_cast<int>(min_level_)) {
                return;
            }
            std::clog << "[" << level_to_string(level) << "] " << message << std::endl;
        }

    private:
        Logger() {
            const char* env = std::getenv("SNIPEXEC_LOGGING_LEVEL");
            min_level_ = env != nullptr ? parse_level(env) : LogLevel::WARN;
        }

        std::mutex mutex_;
        LogLevel min_level_ = LogLevel::WARN;

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

    // 3. Helper macros for clean syntax everywhere else in the code
    #define LOG_DEBUG(msg) snipexec::core::logging::Logger::get().log(snipexec::core::logging::LogLevel::DEBUG, msg)
    #define LOG_INFO(msg)  snipexec::core::logging::Logger::get().log(snipexec::core::logging::LogLevel::INFO, msg)
    #define LOG_WARN(msg)  snipexec::core::logging::Logger::get().log(snipexec::core::logging::LogLevel::WARN, msg)
    #define LOG_ERROR(msg) snipexec::core::logging::Logger::get().log(snipexec::core::logging::LogLevel::ERROR, msg)

} // namespace snipexec::core::logging
