#pragma once
#include <filesystem>
#include <fstream>
#include <iostream>
#include <mutex>
#include <string>

namespace orch::core::logging {

    // 1. Log Levels
    enum class LogLevel {
        DEBUG,
        INFO,
        WARN,
        ERROR
    };

    inline LogLevel parse_level(const std::string& text) {
        if (text == "debug" || text == "trace") return LogLevel::DEBUG;
        if (text == "warn" || text == "warning") return LogLevel::WARN;
        if (text == "error") return LogLevel::ERROR;
        return LogLevel::INFO;
    }

    // 2. Global Logger
    class Logger {
    public:
        // Singleton access so the whole process shares one logger
        static Logger& get() {
            static Logger instance;
            return instance;
        }

        // Ticket or agent id printed in front of every line; empty clears it.
        void set_context(const std::string& context) {
            std::lock_guard<std::mutex> lock(mutex_);
            context_ = context;
        }

        std::string context() const {
            std::lock_guard<std::mutex> lock(mutex_);
            return context_;
        }

        void set_level(LogLevel level) {
            std::lock_guard<std::mutex> lock(mutex_);
            min_level_ = level;
        }

        // Console lines go to stderr when set, so stdout stays clean for CLI output.
        void use_stderr(bool enabled) {
            std::lock_guard<std::mutex> lock(mutex_);
            use_stderr_ = enabled;
        }

        bool open_file(const std::filesystem::path& path) {
            std::lock_guard<std::mutex> lock(mutex_);
            std::error_code ec;
            std::filesystem::create_directories(path.parent_path(), ec);
            if (ec) {
                return false;
            }
            file_.close();
            file_.open(path, std::ios::app);
            return file_.is_open();
        }

        void close_file() {
            std::lock_guard<std::mutex> lock(mutex_);
            file_.close();
        }

        void log(LogLevel level, const std::string& message) {
            std::lock_guard<std::mutex> lock(mutex_);
            if (level < min_level_) {
                return;
            }

            const std::string line = "[" + level_to_string(level) + "] " +
                                     (context_.empty() ? "" : "[" + context_ + "] ") +
                                     message;
            (use_stderr_ ? std::cerr : std::cout) << line << std::endl;
            if (file_.is_open()) {
                file_ << line << "\n";
                file_.flush();
            }
        }

    private:
        Logger() = default;
        mutable std::mutex mutex_;
        std::string context_;
        LogLevel min_level_ = LogLevel::INFO;
        bool use_stderr_ = false;
        std::ofstream file_;

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

    // Restores the previous context tag when it goes out of scope.
    class ScopedContext {
    public:
        explicit ScopedContext(const std::string& context)
            : previous_(Logger::get().context()) {
            Logger::get().set_context(context);
        }
        ~ScopedContext() { Logger::get().set_context(previous_); }

        ScopedContext(const ScopedContext&) = delete;
        ScopedContext& operator=(const ScopedContext&) = delete;

    private:
        std::string previous_;
    };

    // 3. Helper macros for clean syntax everywhere else in the code
    #define LOG_DEBUG(msg) orch::core::logging::Logger::get().log(orch::core::logging::LogLevel::DEBUG, msg)
    #define LOG_INFO(msg)  orch::core::logging::Logger::get().log(orch::core::logging::LogLevel::INFO, msg)
    #define LOG_WARN(msg)  orch::core::logging::Logger::get().log(orch::core::logging::LogLevel::WARN, msg)
    #define LOG_ERROR(msg) orch::core::logging::Logger::get().log(orch::core::logging::LogLevel::ERROR, msg)

} // namespace orch::core::logging
