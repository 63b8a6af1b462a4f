#include "logger.h"
#include <algorithm>
#include <cctype>

namespace dirpost {

Logger& Logger::getInstance() {
    static Logger instance;
    return instance;
}

bool parse_log_level(const std::string& name, LogLevel& level) {
    std::string lower = name;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lower == "debug") {
        level = LogLevel::DEBUG;
    } else if (lower == "info") {
        level = LogLevel::INFO;
    } else if (lower == "warn" || lower == "warning") {
        level = LogLevel::WARN;
    } else if (lower == "error") {
        level = LogLevel::ERROR;
    } else {
        return false;
    }
    return true;
}

const char* log_level_to_string(LogLevel level) {
    switch (level) {
        case LogLevel::DEBUG: return "debug";
        case LogLevel::INFO:  return "info";
        case LogLevel::WARN:  return "warn";
        case LogLevel::ERROR: return "error";
        default: return "unknown";
    }
}

} // namespace dirpost
