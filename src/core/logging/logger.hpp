#pragma once
#include <chrono>
#include <ctime>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <mutex>
#include <string>

namespace neoforge::core::logging {

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

        void set_run_id(const std::string& id) {
            std::lock_guard<std::mutex> lock(mutex_);
            run_id_ = id;
        }

        void set_min_level(LogLevel level) {
            std::lock_guard<std::mutex> lock(mutex_);
            min_level_ = level;
        }

        // Mirrors every line into an append-only file. Returns false if it cannot be opened.
        bool set_file_sink(const std::filesystem::path& path) {
            std::lock_guard<std::mutex> lock(mutex_);
            file_sink_.close();
            file_sink_.clear();
            file_sink_.open(path, std::ios::app);
            return file_sink_.is_open();
        }

        void log(LogLevel level, const std::string& message) {
            std::lock_guard<std::mutex> lock(mutex_); // Thread safety!
            if (level < min_level_) {
                return;
            }

            const std::string line = timestamp() + " [" + level_to_string(level) + "] " +
                                     (run_id_.empty() ? "" : "[" + run_id_ + "] ") +
                                     message;
            std::cout << line << std::endl;
            if (file_sink_.is_open()) {
                file_sink_ << line << '\n';
                file_sink_.flush();
            }
        }

    private:
        Logger() = default;
        std::mutex mutex_;
        std::string run_id_;
        LogLevel min_level_ = LogLevel::INFO;
        std::ofstream file_sink_;

        static std::string timestamp() {
            const std::time_t now =
                std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
            std::tm utc{};
            gmtime_r(&now, &utc);
            char buffer[32];
            std::strftime(buffer, sizeof(buffer), "%Y-%m-%dT%H:%M:%SZ", &utc);
            return buffer;
        }

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
    #define LOG_DEBUG(msg) neoforge::core::logging::Logger::get().log(neoforge::core::logging::LogLevel::DEBUG, msg)
    #define LOG_INFO(msg)  neoforge::core::logging::Logger::get().log(neoforge::core::logging::LogLevel::INFO, msg)
    #define LOG_WARN(msg)  neoforge::core::logging::Logger::get().log(neoforge::core::logging::LogLevel::WARN, msg)
    #define LOG_ERROR(msg) neoforge::core::logging::Logger::get().log(neoforge::core::logging::LogLevel::ERROR, msg)

} // namespace neoforge::core::logging
