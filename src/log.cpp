#include "log.hpp"

#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <strings.h>

namespace tabmux {

Logger &Logger::instance() {
    static Logger logger;
    return logger;
}

void Logger::set_level(LogLevel level) { min_level_ = level; }
LogLevel Logger::level() const { return min_level_; }

bool Logger::is_enabled(LogLevel level) const {
    return static_cast<int>(level) >= static_cast<int>(min_level_);
}

void Logger::add_sink(LogSink sink) { sinks_.push_back(std::move(sink)); }
void Logger::clear_sinks() { sinks_.clear(); }

void Logger::log(LogLevel level, std::string_view category, std::string_view message) {
    if (!is_enabled(level)) return;
    LogEntry entry{level, std::string(category), std::string(message)};
    for (auto &sink : sinks_) sink(entry);
}

const char *Logger::level_name(LogLevel level) {
    switch (level) {
        case LogLevel::Trace: return "TRACE";
        case LogLevel::Debug: return "DEBUG";
        case LogLevel::Info: return "INFO";
        case LogLevel::Warning: return "WARN";
        case LogLevel::Error: return "ERROR";
        case LogLevel::Critical: return "CRITICAL";
    }
    return "UNKNOWN";
}

bool Logger::parse_level(std::string_view name, LogLevel &out) {
    static const std::pair<const char*, LogLevel> names[] = {
        {"trace", LogLevel::Trace}, {"debug", LogLevel::Debug},
        {"info", LogLevel::Info}, {"warn", LogLevel::Warning},
        {"warning", LogLevel::Warning}, {"error", LogLevel::Error},
        {"critical", LogLevel::Critical},
    };
    std::string s(name);
    for (auto &n : names) {
        if (strcasecmp(s.c_str(), n.first) == 0) { out = n.second; return true; }
    }
    return false;
}

namespace sinks {

Logger::LogSink console_sink() {
    return [](const Logger::LogEntry &e) {
        auto now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
        std::tm tm{};
        localtime_r(&now, &tm);
        std::cerr << std::put_time(&tm, "%H:%M:%S") << " [tabmux] [" << Logger::level_name(e.level)
                  << "] [" << e.category << "] " << e.message << "\n";
    };
}

}  // namespace sinks

}  // namespace tabmux
