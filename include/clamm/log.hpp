#ifndef CLAMM_LOG_HPP
#define CLAMM_LOG_HPP

#include <mutex>
#include <ostream>
#include <string>

namespace clamm {

// =============================================================================
// Logging
// =============================================================================

enum class LogLevel : int {
    Trace = 0,
    Debug = 1,
    Info = 2,
    Warn = 3,
    Error = 4
};

const char* to_string(LogLevel level) noexcept;

// Case-insensitive "trace" .. "error". Returns false for unknown names and
// leaves level untouched.
bool parse_log_level(const std::string& name, LogLevel& level);

class Logger {
public:
    Logger();

    void set_level(LogLevel level);
    LogLevel level() const;

    // Defaults to std::cerr. The stream must outlive the logger's use of it.
    void set_stream(std::ostream& out);

    bool enabled(LogLevel level) const;
    void log(LogLevel level, const std::string& msg);

    void trace(const std::string& msg) { log(LogLevel::Trace, msg); }
    void debug(const std::string& msg) { log(LogLevel::Debug, msg); }
    void info(const std::string& msg) { log(LogLevel::Info, msg); }
    void warn(const std::string& msg) { log(LogLevel::Warn, msg); }
    void error(const std::string& msg) { log(LogLevel::Error, msg); }

private:
    mutable std::mutex mutex_;
    std::ostream* out_;
    LogLevel level_ = LogLevel::Info;
};

// Process-wide logger
Logger& logger();

} // namespace clamm

#endif // CLAMM_LOG_HPP
