#pragma once

#include <string>
#include <iostream>
#include <mutex>
#include <sstream>
#include <chrono>
#include <iomanip>
#include <cstdint>
#include <cstdio>
#include <unistd.h>

namespace dirpost {

enum class LogLevel {
    DEBUG = 0,
    INFO = 1,
    WARN = 2,
    ERROR = 3
};

/**
 * Parse a level name ("debug", "info", "warn"/"warning", "error"), case-insensitive
 * @param name Level name
 * @param level Output level, untouched on failure
 * @return true if the name was recognized
 */
bool parse_log_level(const std::string& name, LogLevel& level);

/**
 * Lower-case name of a level, as accepted by parse_log_level()
 */
const char* log_level_to_string(LogLevel level);

class Logger {
public:
    static Logger& getInstance();

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    void set_log_level(LogLevel level) {
        std::lock_guard<std::mutex> lock(mutex_);
        min_level_ = level;
    }

    LogLevel get_log_level() {
        std::lock_guard<std::mutex> lock(mutex_);
        return min_level_;
    }

    void set_colors_enabled(bool enabled) {
        std::lock_guard<std::mutex> lock(mutex_);
        colors_enabled_ = enabled;
    }

    void set_timestamps_enabled(bool enabled) {
        std::lock_guard<std::mutex> lock(mutex_);
        timestamps_enabled_ = enabled;
    }

    /**
     * Redirect output. Pass nullptr to restore std::cout / std::cerr.
     * Colors are only emitted when the default streams point at a terminal.
     */
    void set_streams(std::ostream* out, std::ostream* err) {
        std::lock_guard<std::mutex> lock(mutex_);
        out_ = out;
        err_ = err;
    }

    void log(LogLevel level, const std::string& module, const std::string& message) {
        std::lock_guard<std::mutex> lock(mutex_);

        if (level < min_level_) {
            return;
        }

        std::ostream& target = level >= LogLevel::ERROR ? (err_ ? *err_ : std::cerr)
                                                        : (out_ ? *out_ : std::cout);
        bool colored = colors_enabled_ && is_terminal_ && !out_ && !err_;

        std::ostringstream oss;

        if (timestamps_enabled_) {
            auto now = std::chrono::system_clock::now();
            auto time_t = std::chrono::system_clock::to_time_t(now);
            auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                now.time_since_epoch()) % 1000;

            oss << "[" << std::put_time(std::localtime(&time_t), "%H:%M:%S");
            oss << "." << std::setfill('0') << std::setw(3) << ms.count() << "] ";
        }

        if (colored) {
            oss << get_color_code(level) << "[" << get_level_string(level) << "]" << reset_code();
        } else {
            oss << "[" << get_level_string(level) << "]";
        }

        if (!module.empty()) {
            if (colored) {
                oss << " " << get_module_color(module) << "[" << module << "]" << reset_code();
            } else {
                oss << " [" << module << "]";
            }
        }

        oss << " " << message << std::endl;

        target << oss.str();
        target.flush();
    }

private:
    Logger() : min_level_(LogLevel::INFO), colors_enabled_(true), timestamps_enabled_(true),
               out_(nullptr), err_(nullptr) {
        is_terminal_ = isatty(fileno(stdout)) != 0;
    }

    static const char* get_level_string(LogLevel level) {
        switch (level) {
            case LogLevel::DEBUG: return "DEBUG";
            case LogLevel::INFO:  return "INFO ";
            case LogLevel::WARN:  return "WARN ";
            case LogLevel::ERROR: return "ERROR";
            default: return "UNKNOWN";
        }
    }

    static const char* get_color_code(LogLevel level) {
        switch (level) {
            case LogLevel::DEBUG: return "\033[36m";  // Cyan
            case LogLevel::INFO:  return "\033[32m";  // Green
            case LogLevel::WARN:  return "\033[33m";  // Yellow
            case LogLevel::ERROR: return "\033[31m";  // Red
            default: return "";
        }
    }

    // Stable color per module name (djb2 hash)
    static const char* get_module_color(const std::string& module) {
        static const char* colors[] = {
            "\033[35m",  // Magenta
            "\033[94m",  // Bright Blue
            "\033[95m",  // Bright Magenta
            "\033[96m",  // Bright Cyan
            "\033[93m",  // Bright Yellow
            "\033[92m",  // Bright Green
            "\033[34m",  // Blue
            "\033[38;5;208m", // Orange
            "\033[38;5;141m"  // Purple
        };

        uint32_t hash = 5381;
        for (char c : module) {
            hash = ((hash << 5) + hash) + static_cast<uint8_t>(c);
        }
        return colors[hash % (sizeof(colors) / sizeof(colors[0]))];
    }

    static const char* reset_code() {
        return "\033[0m";
    }

    std::mutex mutex_;
    LogLevel min_level_;
    bool colors_enabled_;
    bool timestamps_enabled_;
    bool is_terminal_;
    std::ostream* out_;
    std::ostream* err_;
};

} // namespace dirpost

// Convenience macros for easy logging
#define LOG_DEBUG(module, message) \
    do { \
        std::ostringstream oss; \
        oss << message; \
        dirpost::Logger::getInstance().log(dirpost::LogLevel::DEBUG, module, oss.str()); \
    } while(0)

#define LOG_INFO(module, message) \
    do { \
        std::ostringstream oss; \
        oss << message; \
        dirpost::Logger::getInstance().log(dirpost::LogLevel::INFO, module, oss.str()); \
    } while(0)

#define LOG_WARN(module, message) \
    do { \
        std::ostringstream oss; \
        oss << message; \
        dirpost::Logger::getInstance().log(dirpost::LogLevel::WARN, module, oss.str()); \
    } while(0)

#define LOG_ERROR(module, message) \
    do { \
        std::ostringstream oss; \
        oss << message; \
        dirpost::Logger::getInstance().log(dirpost::LogLevel::ERROR, module, oss.str()); \
    } while(0)
