#pragma once
#include <iostream>
#include <string>
#include <mutex>

namespace relay::core::logging {

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
        // Singleton access so every agent in the process shares one logger
        static Logger& get() {
            static Logger instance;
            return instance;
        }

        // Tags every line, e.g. "forwarder" or "interceptor"
        void set_context(const std::string& context) {
            std::lock_guard<std::mutex> lock(mutex_);
            context_ = context;
        }

        void set_min_level(LogLevel level) {
            std::lock_guard<std::mutex> lock(mutex_);
            min_level_ = level;
        }

        void log(LogLevel level, const std::string& message) {
            std::lock_guard<std::mutex> lock(mutex_);
            if (static_cast<int>(level) < static_cast<int>(min_level_)) {
                return;
            }

            std::cout << "[" << level_to_string(level) << "] "
                      << (context_.empty() ? "" : "[" + context_ + "] ")
                      << message << std::endl;
        }

    private:
        Logger() = default;
        std::mutex mutex_;
        std::string context_;
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

    // 3. Helper macros for clean syntax everywhere else
    #define LOG_DEBUG(msg) relay::core::logging::Logger::get().log(relay::core::logging::LogLevel::DEBUG, msg)
    #define LOG_INFO(msg)  relay::core::logging::Logger::get().log(relay::core::logging::LogLevel::INFO, msg)
    #define LOG_WARN(msg)  relay::core::logging::Logger::get().log(relay::core::logging::LogLevel::WARN, msg)
    #define LOG_ERROR(msg) relay::core::logging::Logger::get().log(relay::core::logging::LogLevel::ERROR, msg)

} // namespace relay::core::logging
