#pragma once
#include <iostream>
#include <string>
#include <mutex>

namespace overseer::core::logging {

    enum class LogLevel {
        DEBUG,
        INFO,
        WARN,
        ERROR
    };

    // Process-wide console logger used by the application entry point.
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

        void log(LogLevel level, const std::string& message) {
            std::lock_guard<std::mutex> lock(mutex_);
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

    // Observability sink handed to the reaper, supervisor and runner so that
    // callers (and tests) decide where their messages go.
    class LogSink {
    public:
        virtual ~LogSink() = default;

        virtual void debug(const std::string& message) = 0;
        virtual void info(const std::string& message) = 0;
        virtual void warn(const std::string& message) = 0;
        virtual void error(const std::string& message) = 0;
    };

    // Forwards everything to the process-wide Logger.
    class ConsoleLogSink : public LogSink {
    public:
        void debug(const std::string& message) override {
            Logger::get().log(LogLevel::DEBUG, message);
        }
        void info(const std::string& message) override {
            Logger::get().log(LogLevel::INFO, message);
        }
        void warn(const std::string& message) override {
            Logger::get().log(LogLevel::WARN, message);
        }
        void error(const std::string& message) override {
            Logger::get().log(LogLevel::ERROR, message);
        }
    };

    class NullLogSink : public LogSink {
    public:
        void debug(const std::string&) override {}
        void info(const std::string&) override {}
        void warn(const std::string&) override {}
        void error(const std::string&) override {}
    };

    inline LogSink& console_sink() {
        static ConsoleLogSink sink;
        return sink;
    }

    #define LOG_DEBUG(msg) overseer::core::logging::Logger::get().log(overseer::core::logging::LogLevel::DEBUG, msg)
    #define LOG_INFO(msg)  overseer::core::logging::Logger::get().log(overseer::core::logging::LogLevel::INFO, msg)
    #define LOG_WARN(msg)  overseer::core::logging::Logger::get().log(overseer::core::logging::LogLevel::WARN, msg)
    #define LOG_ERROR(msg) overseer::core::logging::Logger::get().log(overseer::core::logging::LogLevel::ERROR, msg)

} // namespace overseer::core::logging
