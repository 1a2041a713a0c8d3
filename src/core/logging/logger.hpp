#pragma once
#include <iostream>
#include <mutex>
#include <ostream>
#include <string>

namespace tailcall::core::logging {

    enum class LogLevel {
        DEBUG,
        INFO,
        WARN,
        ERROR
    };

    // Process-wide logger. Writes to stderr so that stdout stays reserved
    // for the run's final result.
    class Logger {
    public:
        static Logger& get() {
            static Logger instance;
            return instance;
        }

        void set_run_id(const std::string& id) {
            std::lock_guard<std::mutex> lock(mutex_);
            run_id_ = id;
        }

        void set_min_level(LogLevel level) {
            std::lock_guard<std::mutex> lock(mutex_);
            min_level_ = level;
        }

        // Redirects output, mainly for tests. The stream must outlive the logger's use of it.
        void set_stream(std::ostream& out) {
            std::lock_guard<std::mutex> lock(mutex_);
            out_ = &out;
        }

        void log(LogLevel level, const std::string& message) {
            std::lock_guard<std::mutex> lock(mutex_);
            if (static_cast<int>(level) < static_cast<int>(min_level_)) {
                return;
            }

            *out_ << "[" << level_to_string(level) << "] "
                  << (run_id_.empty() ? "" : "[" + run_id_ + "] ")
                  << message << std::endl;
        }

    private:
        Logger() = default;
        std::mutex mutex_;
        std::string run_id_;
        LogLevel min_level_ = LogLevel::INFO;
        std::ostream* out_ = &std::cerr;

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

    #define TAILCALL_LOG_DEBUG(msg) tailcall::core::logging::Logger::get().log(tailcall::core::logging::LogLevel::DEBUG, msg)
    #define TAILCALL_LOG_INFO(msg)  tailcall::core::logging::Logger::get().log(tailcall::core::logging::LogLevel::INFO, msg)
    #define TAILCALL_LOG_WARN(msg)  tailcall::core::logging::Logger::get().log(tailcall::core::logging::LogLevel::WARN, msg)
    #define TAILCALL_LOG_ERROR(msg) tailcall::core::logging::Logger::get().log(tailcall::core::logging::LogLevel::ERROR, msg)

} // namespace tailcall::core::logging
