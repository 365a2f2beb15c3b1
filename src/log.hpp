#pragma once

#include <functional>
#include <sstream>
#include <string>
#include <string_view>
#include <type_traits>
#include <vector>

namespace tabmux {

enum class LogLevel : int {
    Trace = 0,
    Debug = 1,
    Info = 2,
    Warning = 3,
    Error = 4,
    Critical = 5
};

// Process-wide logger. Messages use "{}" placeholders filled in order.
class Logger {
public:
    struct LogEntry {
        LogLevel level;
        std::string category;
        std::string message;
    };

    using LogSink = std::function<void(const LogEntry&)>;

    static Logger &instance();

    void set_level(LogLevel level);
    LogLevel level() const;
    bool is_enabled(LogLevel level) const;

    void add_sink(LogSink sink);
    void clear_sinks();

    void log(LogLevel level, std::string_view category, std::string_view message);

    template <typename... Args>
    void log_formatted(LogLevel level, std::string_view category, std::string_view format, Args&&... args) {
        if (!is_enabled(level)) return;
        std::string msg(format);
        (replace_next(msg, std::forward<Args>(args)), ...);
        log(level, category, msg);
    }

    static const char *level_name(LogLevel level);
    static bool parse_level(std::string_view name, LogLevel &out);

private:
    Logger() = default;
    Logger(const Logger&) = delete;
    Logger &operator=(const Logger&) = delete;

    template <typename T>
    static void replace_next(std::string &msg, T &&v) {
        auto pos = msg.find("{}");
        if (pos == std::string::npos) return;
        msg.replace(pos, 2, to_text(std::forward<T>(v)));
    }

    template <typename T>
    static std::string to_text(T &&v) {
        using D = std::decay_t<T>;
        if constexpr (std::is_same_v<D, bool>) {
            return v ? "true" : "false";
        } else if constexpr (std::is_same_v<D, const char*> || std::is_same_v<D, char*>) {
            return v ? std::string(v) : std::string("(null)");
        } else {
            std::ostringstream os;
            os << v;
            return os.str();
        }
    }

    LogLevel min_level_ = LogLevel::Info;
    std::vector<LogSink> sinks_;
};

namespace sinks {
Logger::LogSink console_sink();
}

}  // namespace tabmux

#define TABMUX_LOG_AT(lvl, category, ...)                                          \
    do {                                                                           \
        if (::tabmux::Logger::instance().is_enabled(lvl))                          \
            ::tabmux::Logger::instance().log_formatted(lvl, category, __VA_ARGS__); \
    } while (0)

#define TABMUX_LOG_TRACE(category, ...) TABMUX_LOG_AT(::tabmux::LogLevel::Trace, category, __VA_ARGS__)
#define TABMUX_LOG_DEBUG(category, ...) TABMUX_LOG_AT(::tabmux::LogLevel::Debug, category, __VA_ARGS__)
#define TABMUX_LOG_INFO(category, ...) TABMUX_LOG_AT(::tabmux::LogLevel::Info, category, __VA_ARGS__)
#define TABMUX_LOG_WARN(category, ...) TABMUX_LOG_AT(::tabmux::LogLevel::Warning, category, __VA_ARGS__)
#define TABMUX_LOG_ERROR(category, ...) TABMUX_LOG_AT(::tabmux::LogLevel::Error, category, __VA_ARGS__)
#define TABMUX_LOG_CRITICAL(category, ...) TABMUX_LOG_AT(::tabmux::LogLevel::Critical, category, __VA_ARGS__)
