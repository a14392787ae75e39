#pragma once

#include <atomic>
#include <chrono>
#include <cstdlib>
#include <cstring>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <sstream>
#include <string>

namespace geohash {

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
        level_.store(level, std::memory_order_relaxed);
    }

    LogLevel level() const {
        return level_.load(std::memory_order_relaxed);
    }

    void setOutput(std::ostream& stream) {
        std::lock_guard<std::mutex> lock(mutex_);
        output_ = &stream;
    }

    bool enabled(LogLevel level) const {
        return level >= this->level();
    }

    template<typename... Args>
    void log(LogLevel level, const char* file, int line, const char* func, Args&&... args) {
        if (!enabled(level)) return;

        std::lock_guard<std::mutex> lock(mutex_);

        auto now = std::chrono::system_clock::now();
        auto time_t = std::chrono::system_clock::to_time_t(now);
        auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
            now.time_since_epoch()) % 1000;

        std::tm tm_buf{};
#if defined(_WIN32)
        localtime_s(&tm_buf, &time_t);
#else
        localtime_r(&time_t, &tm_buf);
#endif

        std::stringstream ss;
        ss << std::put_time(&tm_buf, "%Y-%m-%d %H:%M:%S")
           << '.' << std::setfill('0') << std::setw(3) << ms.count();

        const char* level_str = "UNKN";
        switch (level) {
            case LogLevel::DEBUG: level_str = "DEBG"; break;
            case LogLevel::INFO:  level_str = "INFO"; break;
            case LogLevel::WARN:  level_str = "WARN"; break;
            case LogLevel::ERROR: level_str = "EROR"; break;
            case LogLevel::FATAL: level_str = "FATL"; break;
        }

        const char* filename = strrchr(file, '/');
        if (!filename) filename = strrchr(file, '\\');
        filename = filename ? filename + 1 : file;

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

private:
    Logger() : level_(LogLevel::INFO), output_(&std::cout) {}
    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    void format_message(std::stringstream&) {}

    template<typename T, typename... Args>
    void format_message(std::stringstream& ss, T&& value, Args&&... args) {
        ss << value;
        format_message(ss, std::forward<Args>(args)...);
    }

    std::atomic<LogLevel> level_;
    std::ostream* output_;
    std::mutex mutex_;
};

#define LOG_DEBUG(...) geohash::Logger::getInstance().log(geohash::LogLevel::DEBUG, __FILE__, __LINE__, __func__, __VA_ARGS__)
#define LOG_INFO(...)  geohash::Logger::getInstance().log(geohash::LogLevel::INFO,  __FILE__, __LINE__, __func__, __VA_ARGS__)
#define LOG_WARN(...)  geohash::Logger::getInstance().log(geohash::LogLevel::WARN,  __FILE__, __LINE__, __func__, __VA_ARGS__)
#define LOG_ERROR(...) geohash::Logger::getInstance().log(geohash::LogLevel::ERROR, __FILE__, __LINE__, __func__, __VA_ARGS__)
#define LOG_FATAL(...) geohash::Logger::getInstance().log(geohash::LogLevel::FATAL, __FILE__, __LINE__, __func__, __VA_ARGS__)

inline void set_log_level(LogLevel level) {
    Logger::getInstance().setLevel(level);
}

inline void set_log_output(std::ostream& stream) {
    Logger::getInstance().setOutput(stream);
}

// Accepts debug|info|warn|error|fatal; returns false and leaves `out` alone otherwise
inline bool parse_log_level(const std::string& name, LogLevel& out) {
    if (name == "debug") out = LogLevel::DEBUG;
    else if (name == "info") out = LogLevel::INFO;
    else if (name == "warn") out = LogLevel::WARN;
    else if (name == "error") out = LogLevel::ERROR;
    else if (name == "fatal") out = LogLevel::FATAL;
    else return false;
    return true;
}

} // namespace geohash
