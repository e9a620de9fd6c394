#pragma once
#include <iostream>
#include <ostream>
#include <string>
#include <mutex>

namespace flowlaunch::core::logging {

    // 1. Log levels, lowest first
    enum class LogLevel {
        DEBUG,
        INFO,
        WARN,
        ERROR
    };

    // 2. Global Logger
    // DEBUG/INFO are progress output; WARN/ERROR are diagnostics and go to a
    // separate stream.
    class Logger {
    public:
        static Logger& get() {
            static Logger instance;
            return instance;
        }

        void set_run_tag(const std::string& tag) {
            std::lock_guard<std::mutex> lock(mutex_);
            run_tag_ = tag;
        }

        void clear_run_tag() {
            std::lock_guard<std::mutex> lock(mutex_);
            run_tag_.clear();
        }

        void set_min_level(LogLevel level) {
            std::lock_guard<std::mutex> lock(mutex_);
            min_level_ = level;
        }

        // Passing nullptr restores the standard stream.
        void set_streams(std::ostream* progress, std::ostream* diagnostics) {
            std::lock_guard<std::mutex> lock(mutex_);
            progress_ = progress != nullptr ? progress : &std::cout;
            diagnostics_ = diagnostics != nullptr ? diagnostics : &std::cerr;
        }

        void log(LogLevel level, const std::string& message) {
            std::lock_guard<std::mutex> lock(mutex_);
            if (level < min_level_) {
                return;
            }

            std::ostream& out = level >= LogLevel::WARN ? *diagnostics_ : *progress_;
            out << "[" << level_to_string(level) << "] "
                << (run_tag_.empty() ? "" : "[" + run_tag_ + "] ")
                << message << std::endl;
        }

    private:
        Logger() = default;
        std::mutex mutex_;
        std::string run_tag_;
        LogLevel min_level_ = LogLevel::INFO;
        std::ostream* progress_ = &std::cout;
        std::ostream* diagnostics_ = &std::cerr;

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

    #define LOG_DEBUG(msg) flowlaunch::core::logging::Logger::get().log(flowlaunch::core::logging::LogLevel::DEBUG, msg)
    #define LOG_INFO(msg)  flowlaunch::core::logging::Logger::get().log(flowlaunch::core::logging::LogLevel::INFO, msg)
    #define LOG_WARN(msg)  flowlaunch::core::logging::Logger::get().log(flowlaunch::core::logging::LogLevel::WARN, msg)
    #define LOG_ERROR(msg) flowlaunch::core::logging::Logger::get().log(flowlaunch::core::logging::LogLevel::ERROR, msg)

} // namespace flowlaunch::core::logging
