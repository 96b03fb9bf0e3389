#pragma once

#include <chrono>
#include <functional>
#include <mutex>
#include <optional>
#include <sstream>
#include <string>
#include <string_view>
#include <type_traits>
#include <vector>

namespace plotscope
{

enum class LogLevel : int
{
    Trace    = 0,
    Debug    = 1,
    Info     = 2,
    Warning  = 3,
    Error    = 4,
    Critical = 5
};

// Process-wide diagnostics. No sink is installed by default, so the library
// stays silent until the application adds one.
class Logger
{
   public:
    struct LogEntry
    {
        std::chrono::system_clock::time_point timestamp;
        LogLevel                              level;
        std::string                           category;   // sampler, grid, figure, svg, style
        std::string                           message;
    };

    using LogSink = std::function<void(const LogEntry&)>;

    static Logger& instance();

    void     set_level(LogLevel level);
    LogLevel get_level() const;

    // Reads PLOTSCOPE_LOG_LEVEL (trace|debug|info|warn|error|critical).
    // Returns false and leaves the level untouched when unset or unparsable.
    bool configure_from_env();

    void add_sink(LogSink sink);
    void clear_sinks();

    bool is_enabled(LogLevel level) const;

    void log(LogLevel level, std::string_view category, std::string_view message);

    // `{}` placeholders are replaced by the arguments in order; surplus
    // placeholders are left as they are.
    template <typename... Args>
    void log_formatted(LogLevel level, std::string_view category, std::string_view format, Args&&... args)
    {
        if (is_enabled(level))
            log(level, category, format_message(format, std::forward<Args>(args)...));
    }

    static std::string             level_to_string(LogLevel level);
    static std::optional<LogLevel> level_from_string(std::string_view name);
    // "<timestamp> <LEVEL> [category] message"
    static std::string format_line(const LogEntry& entry);

   private:
    Logger()                         = default;
    Logger(const Logger&)            = delete;
    Logger& operator=(const Logger&) = delete;

    template <typename T>
    static std::string arg_to_string(const T& v)
    {
        if constexpr (std::is_same_v<T, bool>)
            return v ? "true" : "false";
        else if constexpr (std::is_same_v<T, char>)
            return std::string(1, v);
        else if constexpr (std::is_arithmetic_v<T>)
        {
            // Shortest round-trippable-enough form: 0.5, 1e-09, -20
            std::ostringstream ss;
            ss << v;
            return ss.str();
        }
        else
            return std::string(std::string_view(v));
    }

    template <typename... Args>
    static std::string format_message(std::string_view format, const Args&... args)
    {
        std::string result(format);
        size_t      search_from  = 0;
        auto        replace_next = [&](const auto& arg)
        {
            auto pos = result.find("{}", search_from);
            if (pos == std::string::npos)
                return;
            std::string text = arg_to_string(arg);
            result.replace(pos, 2, text);
            search_from = pos + text.size();
        };
        (replace_next(args), ...);
        return result;
    }

    mutable std::mutex   mutex_;
    LogLevel             min_level_ = LogLevel::Info;
    std::vector<LogSink> sinks_;
};

namespace sinks
{
// Colored lines on stderr.
Logger::LogSink console_sink();
// Appends to `filename`; entries are dropped when the file cannot be opened.
Logger::LogSink file_sink(const std::string& filename);
}   // namespace sinks

#define PLOTSCOPE_LOG_AT(level, category, ...)                                                    \
    do                                                                                            \
    {                                                                                             \
        if (::plotscope::Logger::instance().is_enabled(level))                                    \
            ::plotscope::Logger::instance().log_formatted(level, category, __VA_ARGS__);          \
    } while (0)

#define PLOTSCOPE_LOG_TRACE(category, ...) PLOTSCOPE_LOG_AT(::plotscope::LogLevel::Trace, category, __VA_ARGS__)
#define PLOTSCOPE_LOG_DEBUG(category, ...) PLOTSCOPE_LOG_AT(::plotscope::LogLevel::Debug, category, __VA_ARGS__)
#define PLOTSCOPE_LOG_INFO(category, ...)  PLOTSCOPE_LOG_AT(::plotscope::LogLevel::Info, category, __VA_ARGS__)
#define PLOTSCOPE_LOG_WARN(category, ...)  PLOTSCOPE_LOG_AT(::plotscope::LogLevel::Warning, category, __VA_ARGS__)
#define PLOTSCOPE_LOG_ERROR(category, ...) PLOTSCOPE_LOG_AT(::plotscope::LogLevel::Error, category, __VA_ARGS__)
#define PLOTSCOPE_LOG_CRITICAL(category, ...) \
    PLOTSCOPE_LOG_AT(::plotscope::LogLevel::Critical, category, __VA_ARGS__)

}   // namespace plotscope
