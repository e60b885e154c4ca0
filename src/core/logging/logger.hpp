#pragma once
#include <chrono>
#include <ctime>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <optional>
#include <sstream>
#include <string>

namespace terminal::core::logging {

    // 1. Define Log Levels
    enum class LogLevel {
        DEBUG,
        INFO,
        WARN,
        ERROR
    };

    inline std::optional<LogLevel> parse_level(const std::string& text) {
        if (text == "debug") return LogLevel::DEBUG;
        if (text == "info") return LogLevel::INFO;
        if (text == "warn" || text == "warning") return LogLevel::WARN;
        if (text == "error") return LogLevel::ERROR;
        return std::nullopt;
    }

    // 2. Global Logger Setup
    class Logger {
    public:
        // Singleton access so the whole app shares one logger
        static Logger& get() {
            static Logger instance;
            return instance;
        }

        void set_name(const std::string& name) {
            std::lock_guard<std::mutex> lock(mutex_);
            name_ = name;
        }

        void set_level(LogLevel level) {
            std::lock_guard<std::mutex> lock(mutex_);
            min_level_ = level;
        }

        bool enabled(LogLevel level) const {
            std::lock_guard<std::mutex> lock(mutex_);
            return level >= min_level_;
        }

        // Adds an append-mode file sink next to stdout. Returns false if the
        // file cannot be opened; stdout logging continues either way.
        bool open_file(const std::filesystem::path& path) {
            std::lock_guard<std::mutex> lock(mutex_);
            file_.close();
            file_.clear();
            file_.open(path, std::ios::app);
            return file_.is_open();
        }

        void close_file() {
            std::lock_guard<std::mutex> lock(mutex_);
            file_.close();
        }

        void log(LogLevel level, const std::string& message) {
            std::lock_guard<std::mutex> lock(mutex_); // Thread safety!
            if (level < min_level_) {
                return;
            }

            const std::string line = timestamp() + " | " + level_to_string(level) +
                                     " | " + name_ + " | " + message;
            std::cout << line << std::endl;
            if (file_.is_open()) {
                file_ << line << std::endl;
            }
        }

    private:
        Logger() = default;
        mutable std::mutex mutex_;
        std::string name_ = "mcp_terminal";
        LogLevel min_level_ = LogLevel::INFO;
        std::ofstream file_;

        static std::string timestamp() {
            const auto now = std::chrono::system_clock::now();
            const std::time_t seconds = std::chrono::system_clock::to_time_t(now);
            const auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(
                                    now.time_since_epoch()) % 1000;
            std::tm local{};
            localtime_r(&seconds, &local);

            std::ostringstream out;
            out << std::put_time(&local, "%Y-%m-%d %H:%M:%S") << ','
                << std::setw(3) << std::setfill('0') << millis.count();
            return out.str();
        }

        static std::string level_to_string(LogLevel level) {
            switch (level) {
                case LogLevel::DEBUG: return "DEBUG";
                case LogLevel::INFO:  return "INFO";
                case LogLevel::WARN:  return "WARNING";
                case LogLevel::ERROR: return "ERROR";
                default: return "UNKNOWN";
            }
        }
    };

    // 3. Helper macros for clean syntax everywhere else in your code
    #define LOG_DEBUG(msg) terminal::core::logging::Logger::get().log(terminal::core::logging::LogLevel::DEBUG, msg)
    #define LOG_INFO(msg)  terminal::core::logging::Logger::get().log(terminal::core::logging::LogLevel::INFO, msg)
    #define LOG_WARN(msg)  terminal::core::logging::Logger::get().log(terminal::core::logging::LogLevel::WARN, msg)
    #define LOG_ERROR(msg) terminal::core::logging::Logger::get().log(terminal::core::logging::LogLevel::ERROR, msg)

} // namespace terminal::core::logging
