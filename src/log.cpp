// =============================================================================
// log.cpp - Levelled logger
// =============================================================================

#include "clamm/log.hpp"

#include <cctype>
#include <iostream>

namespace clamm {

const char* to_string(LogLevel level) noexcept {
    switch (level) {
        case LogLevel::Trace: return "TRACE";
        case LogLevel::Debug: return "DEBUG";
        case LogLevel::Info: return "INFO";
        case LogLevel::Warn: return "WARN";
        case LogLevel::Error: return "ERROR";
    }
    return "INFO";
}

bool parse_log_level(const std::string& name, LogLevel& level) {
    std::string lower = name;
    for (auto& c : lower) {
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    if (lower == "trace") level = LogLevel::Trace;
    else if (lower == "debug") level = LogLevel::Debug;
    else if (lower == "info") level = LogLevel::Info;
    else if (lower == "warn" || lower == "warning") level = LogLevel::Warn;
    else if (lower == "error") level = LogLevel::Error;
    else return false;
    return true;
}

Logger::Logger() : out_(&std::cerr) {}

void Logger::set_level(LogLevel level) {
    std::lock_guard<std::mutex> lock(mutex_);
    level_ = level;
}

LogLevel Logger::level() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return level_;
}

void Logger::set_stream(std::ostream& out) {
    std::lock_guard<std::mutex> lock(mutex_);
    out_ = &out;
}

bool Logger::enabled(LogLevel level) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return static_cast<int>(level) >= static_cast<int>(level_);
}

void Logger::log(LogLevel level, const std::string& msg) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (static_cast<int>(level) < static_cast<int>(level_)) return;
    *out_ << "[" << to_string(level) << "] " << msg << std::endl;
}

Logger& logger() {
    static Logger instance;
    return instance;
}

} // namespace clamm
