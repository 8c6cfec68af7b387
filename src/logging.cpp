#include "sizegate/logging.hpp"

#include "sizegate/exceptions.hpp"

#include <algorithm>
#include <cctype>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <mutex>

namespace sizegate
{

std::string to_string(LogLevel level)
{
    switch (level)
    {
    case LogLevel::Debug:
        return "DEBUG";
    case LogLevel::Info:
        return "INFO";
    case LogLevel::Warning:
        return "WARN";
    case LogLevel::Error:
        return "ERROR";
    }
    return "INFO";
}

LogLevel log_level_from_string(const std::string& s)
{
    std::string upper = s;
    std::transform(upper.begin(), upper.end(), upper.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    if (upper == "DEBUG")
        return LogLevel::Debug;
    if (upper == "INFO")
        return LogLevel::Info;
    if (upper == "WARN" || upper == "WARNING")
        return LogLevel::Warning;
    if (upper == "ERROR")
        return LogLevel::Error;
    throw ConfigError("Unknown log level: " + s);
}

std::string format_message(const std::string& message_template,
                           const std::vector<std::string>& args)
{
    std::string out;
    out.reserve(message_template.size());

    size_t i = 0;
    while (i < message_template.size())
    {
        char c = message_template[i];
        if (c == '{')
        {
            size_t close = message_template.find('}', i + 1);
            if (close != std::string::npos && close > i + 1)
            {
                auto digits = message_template.substr(i + 1, close - i - 1);
                bool numeric = std::all_of(digits.begin(), digits.end(),
                                           [](unsigned char d) { return std::isdigit(d) != 0; });
                if (numeric && digits.size() < 6)
                {
                    size_t index = std::stoul(digits);
                    if (index < args.size())
                    {
                        out += args[index];
                        i = close + 1;
                        continue;
                    }
                }
            }
        }
        out += c;
        ++i;
    }
    return out;
}

LogSink stderr_sink()
{
    return [](const LogRecord& record)
    {
        static std::mutex write_mutex;

        std::time_t t = std::chrono::system_clock::to_time_t(record.timestamp);
        std::tm tm_buf{};
#ifdef _WIN32
        gmtime_s(&tm_buf, &t);
#else
        gmtime_r(&t, &tm_buf);
#endif
        std::lock_guard<std::mutex> lock(write_mutex);
        std::cerr << std::put_time(&tm_buf, "%Y-%m-%dT%H:%M:%SZ") << " [" << to_string(record.level)
                  << "] " << record.category << ": " << record.message << std::endl;
    };
}

Logger::Logger(std::string category, LogLevel min_level, LogSink sink)
    : category_(std::move(category)), min_level_(min_level), sink_(std::move(sink))
{
    if (!sink_)
        sink_ = stderr_sink();
}

void Logger::log(LogLevel level, const std::string& message_template,
                 std::vector<std::string> args) const
{
    if (!enabled(level))
        return;

    LogRecord record;
    record.timestamp = std::chrono::system_clock::now();
    record.level = level;
    record.category = category_;
    record.message_template = message_template;
    record.message = format_message(message_template, args);
    record.args = std::move(args);

    sink_(record);
}

LoggerFactory::LoggerFactory(LogLevel min_level, LogSink sink)
    : min_level_(min_level), sink_(std::move(sink))
{
    if (!sink_)
        sink_ = stderr_sink();
}

Logger LoggerFactory::create(const std::string& category) const
{
    return Logger(category, min_level_, sink_);
}

} // namespace sizegate
