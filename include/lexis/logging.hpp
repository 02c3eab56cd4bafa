#pragma once

#include <algorithm>
#include <cctype>
#include <chrono>
#include <cstdlib>
#include <cstring>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <memory>
#include <mutex>
#include <sstream>
#include <string>

namespace lexis {

enum class LogLevel {
    DEBUG = 0,
    INFO = 1,
    WARN = 2,
    ERROR = 3,
    FATAL = 4
};

class Logger {
public:
    static Logger& getInstance() {
        static Logger instance;
        return instance;
    }

    void setLevel(LogLevel level) {
        std::lock_guard<std::mutex> lock(mutex_);
        level_ = level;
    }

    LogLevel level() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return level_;
    }

    void setOutput(std::ostream& stream) {
        std::lock_guard<std::mutex> lock(mutex_);
        file_.reset();
        output_ = &stream;
    }

    // Appends to the file; keeps the current output if it cannot be opened
    bool setOutputFile(const std::string& path) {
        auto file = std::make_unique<std::ofstream>(path, std::ios::app);
        if (!file->is_open()) return false;

        std::lock_guard<std::mutex> lock(mutex_);
        file_ = std::move(file);
        output_ = file_.get();
        return true;
    }

    template<typename... Args>
    void log(LogLevel level, const char* file, int line, const char* func, Args&&... args) {
        std::lock_guard<std::mutex> lock(mutex_);
        if (level < level_) return;

        // Get current timestamp
        auto now = std::chrono::system_clock::now();
        auto time_t = std::chrono::system_clock::to_time_t(now);
        auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
            now.time_since_epoch()) % 1000;

        std::stringstream ss;
        ss << std::put_time(std::localtime(&time_t), "%Y-%m-%d %H:%M:%S")
           << '.' << std::setfill('0') << std::setw(3) << ms.count();

        // Level string
        const char* level_str = "UNKN";
        switch (level) {
            case LogLevel::DEBUG: level_str = "DEBG"; break;
            case LogLevel::INFO:  level_str = "INFO"; break;
            case LogLevel::WARN:  level_str = "WARN"; break;
            case LogLevel::ERROR: level_str = "EROR"; break;
            case LogLevel::FATAL: level_str = "FATL"; break;
        }

        // Extract filename from path
        const char* filename = strrchr(file, '/');
        if (!filename) filename = strrchr(file, '\\');
        filename = filename ? filename + 1 : file;

        // Format message
        std::stringstream msg;
        msg << "[" << ss.str() << "] " << level_str << " "
            << filename << ":" << line << " " << func << "() - ";
        format_message(msg, std::forward<Args>(args)...);

        *output_ << msg.str() << std::endl;

        if (level == LogLevel::FATAL) {
            *output_ << std::flush;
            std::abort();
        }
    }

    /// Parses "debug", "info", "warn"/"warning", "error", "fatal" (any case).
    /// Unknown names yield @p fallback.
    static LogLevel parse_level(std::string name, LogLevel fallback = LogLevel::INFO) {
        std::transform(name.begin(), name.end(), name.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        if (name == "debug") return LogLevel::DEBUG;
        if (name == "info") return LogLevel::INFO;
        if (name == "warn" || name == "warning") return LogLevel::WARN;
        if (name == "error") return LogLevel::ERROR;
        if (name == "fatal") return LogLevel::FATAL;
        return fallback;
    }

private:
    Logger() : level_(LogLevel::INFO), output_(&std::cerr) {}
    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    void format_message(std::stringstream&) {}

    template<typename T, typename... Args>
    void format_message(std::stringstream& ss, T&& value, Args&&... args) {
        ss << value;
        format_message(ss, std::forward<Args>(args)...);
    }

    LogLevel level_;
    std::ostream* output_;
    std::unique_ptr<std::ofstream> file_;
    mutable std::mutex mutex_;
};

// Convenience macros
#define LOG_DEBUG(...) lexis::Logger::getInstance().log(lexis::LogLevel::DEBUG, __FILE__, __LINE__, __func__, __VA_ARGS__)
#define LOG_INFO(...)  lexis::Logger::getInstance().log(lexis::LogLevel::INFO,  __FILE__, __LINE__, __func__, __VA_ARGS__)
#define LOG_WARN(...)  lexis::Logger::getInstance().log(lexis::LogLevel::WARN,  __FILE__, __LINE__, __func__, __VA_ARGS__)
#define LOG_ERROR(...) lexis::Logger::getInstance().log(lexis::LogLevel::ERROR, __FILE__, __LINE__, __func__, __VA_ARGS__)
#define LOG_FATAL(...) lexis::Logger::getInstance().log(lexis::LogLevel::FATAL, __FILE__, __LINE__, __func__, __VA_ARGS__)

// Set log level convenience functions
inline void set_log_level(LogLevel level) {
    Logger::getInstance().setLevel(level);
}

inline void set_log_output(std::ostream& stream) {
    Logger::getInstance().setOutput(stream);
}

} // namespace lexis
