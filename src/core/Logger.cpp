#include "core/Logger.h"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <ctime>
#include <filesystem>
#include <iomanip>
#include <iostream>

namespace psmonitor {

std::optional<LogLevel> parse_log_level(std::string name) {
    std::transform(name.begin(), name.end(), name.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });

    if (name == "DEBUG") return LogLevel::Debug;
    if (name == "INFO") return LogLevel::Info;
    if (name == "WARNING" || name == "WARN") return LogLevel::Warning;
    if (name == "ERROR") return LogLevel::Error;
    return std::nullopt;
}

const char* to_string(LogLevel level) noexcept {
    switch (level) {
        case LogLevel::Debug:   return "DEBUG";
        case LogLevel::Info:    return "INFO";
        case LogLevel::Warning: return "WARNING";
        case LogLevel::Error:   return "ERROR";
    }
    return "UNKNOWN";
}

Logger& Logger::get() {
    static Logger instance;
    return instance;
}

bool Logger::should_log(LogLevel level) const {
    std::lock_guard<std::mutex> lk(mu_);
    return enabled_ && level >= min_level_;
}

void Logger::log(LogLevel level, const std::string& msg) {
    const auto now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::tm tm{};
    localtime_r(&now, &tm);

    std::ostringstream line;
    line << "[" << std::put_time(&tm, "%Y-%m-%d %H:%M:%S") << "] - " << to_string(level) << " - " << msg;

    std::lock_guard<std::mutex> lk(mu_);
    if (!enabled_ || level < min_level_) return;

    std::cerr << line.str() << "\n";
    if (file_.is_open()) file_ << line.str() << std::endl;
}

void Logger::set_level(LogLevel level) {
    std::lock_guard<std::mutex> lk(mu_);
    min_level_ = level;
}

void Logger::set_enabled(bool enabled) {
    std::lock_guard<std::mutex> lk(mu_);
    enabled_ = enabled;
}

bool Logger::open_file(const std::string& path) {
    std::error_code ec;
    const std::filesystem::path p(path);
    if (p.has_parent_path()) std::filesystem::create_directories(p.parent_path(), ec);
    if (ec) {
        std::cerr << "[Logger] cannot create " << p.parent_path() << ": " << ec.message() << "\n";
        return false;
    }

    std::lock_guard<std::mutex> lk(mu_);
    if (file_.is_open()) file_.close();
    file_.open(p, std::ios::out | std::ios::app);
    return file_.is_open();
}

void Logger::close_file() {
    std::lock_guard<std::mutex> lk(mu_);
    if (file_.is_open()) file_.close();
}

} // namespace psmonitor
