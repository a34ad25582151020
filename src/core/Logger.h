#pragma once

#include <cstdint>
#include <fstream>
#include <mutex>
#include <optional>
#include <sstream>
#include <string>

namespace psmonitor {

enum class LogLevel : std::uint8_t { Debug = 0, Info, Warning, Error };

std::optional<LogLevel> parse_log_level(std::string name);
const char* to_string(LogLevel level) noexcept;

// Process-wide logger. Console output always goes to std::cerr; a log file is
// appended to once open_file() succeeds.
class Logger {
public:
    static Logger& get();

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    bool should_log(LogLevel level) const;
    void log(LogLevel level, const std::string& msg);

    void set_level(LogLevel level);
    void set_enabled(bool enabled);

    // Creates parent directories as needed. Returns false if the file
    // cannot be opened; console logging keeps working either way.
    bool open_file(const std::string& path);
    void close_file();

private:
    Logger() = default;

    mutable std::mutex mu_;
    LogLevel min_level_ = LogLevel::Info;
    bool enabled_ = true;
    std::ofstream file_;
};

#define PSM_LOG_AT(level, expr)                                          \
    do {                                                                 \
        if (::psmonitor::Logger::get().should_log(level)) {              \
            std::ostringstream psm_log_os_;                              \
            psm_log_os_ << expr;                                         \
            ::psmonitor::Logger::get().log(level, psm_log_os_.str());    \
        }                                                                \
    } while (0)

#define PSM_LOG_DEBUG(expr) PSM_LOG_AT(::psmonitor::LogLevel::Debug, expr)
#define PSM_LOG_INFO(expr)  PSM_LOG_AT(::psmonitor::LogLevel::Info, expr)
#define PSM_LOG_WARN(expr)  PSM_LOG_AT(::psmonitor::LogLevel::Warning, expr)
#define PSM_LOG_ERROR(expr) PSM_LOG_AT(::psmonitor::LogLevel::Error, expr)

} // namespace psmonitor
