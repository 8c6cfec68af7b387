#pragma once
#include <chrono>
#include <functional>
#include <string>
#include <vector>

namespace sizegate
{

enum class LogLevel
{
    Debug,
    Info,
    Warning,
    Error
};

std::string to_string(LogLevel level);

/// Parse "DEBUG", "INFO", "WARN"/"WARNING" or "ERROR" (case-insensitive).
/// @throws ConfigError for any other value
LogLevel log_level_from_string(const std::string& s);

/// A single log record as handed to a sink
struct LogRecord
{
    std::chrono::system_clock::time_point timestamp;
    LogLevel level;
    std::string category;
    std::string message_template; ///< e.g. "value {0} exceeds {1}"
    std::vector<std::string> args;
    std::string message; ///< message_template with {n} substituted
};

/// Sink callback type
using LogSink = std::function<void(const LogRecord&)>;

/// Replace {0}, {1}, ... in `message_template` with the matching argument.
/// Placeholders without a matching argument are left as written.
std::string format_message(const std::string& message_template,
                           const std::vector<std::string>& args);

/// Default sink: one line per record on stderr
LogSink stderr_sink();

/// Named logger bound to a sink and a minimum level.
///
/// Immutable after construction, so a single instance may be shared by all request threads.
class Logger
{
  public:
    Logger(std::string category, LogLevel min_level = LogLevel::Info, LogSink sink = nullptr);

    bool enabled(LogLevel level) const
    {
        return level >= min_level_;
    }

    void log(LogLevel level, const std::string& message_template,
             std::vector<std::string> args = {}) const;

    void debug(const std::string& message_template, std::vector<std::string> args = {}) const
    {
        log(LogLevel::Debug, message_template, std::move(args));
    }
    void info(const std::string& message_template, std::vector<std::string> args = {}) const
    {
        log(LogLevel::Info, message_template, std::move(args));
    }
    void warning(const std::string& message_template, std::vector<std::string> args = {}) const
    {
        log(LogLevel::Warning, message_template, std::move(args));
    }
    void error(const std::string& message_template, std::vector<std::string> args = {}) const
    {
        log(LogLevel::Error, message_template, std::move(args));
    }

    const std::string& category() const
    {
        return category_;
    }
    LogLevel min_level() const
    {
        return min_level_;
    }

  private:
    std::string category_;
    LogLevel min_level_;
    LogSink sink_;
};

/// Creates loggers that share one sink and minimum level.
///
/// Usage:
/// ```cpp
/// LoggerFactory loggers(LogLevel::Warning);
/// auto log = loggers.create("sizegate.SizeGate");
/// log.warning("limit {0} reached", {"10"});
/// ```
class LoggerFactory
{
  public:
    explicit LoggerFactory(LogLevel min_level = LogLevel::Info, LogSink sink = nullptr);

    Logger create(const std::string& category) const;

    LogLevel min_level() const
    {
        return min_level_;
    }

  private:
    LogLevel min_level_;
    LogSink sink_;
};

} // namespace sizegate
