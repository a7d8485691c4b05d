#ifndef TOOLBRIDGE_INTERNAL_LOG_HPP
#define TOOLBRIDGE_INTERNAL_LOG_HPP

#include <toolbridge/types.hpp>

#include <optional>
#include <string>

namespace toolbridge
{
namespace internal
{

// Routes diagnostics to the configured callback, or std::cerr when none is set.
class Logger
{
  public:
    Logger() = default;
    Logger(std::optional<LogCallback> callback, LogLevel level)
        : callback_(std::move(callback)), level_(level)
    {
    }

    static Logger from_options(const ClientOptions& options)
    {
        return Logger(options.log_callback, options.log_level);
    }

    bool enabled(LogLevel level) const
    {
        return level != LogLevel::Off && level_ != LogLevel::Off && level >= level_;
    }

    void log(LogLevel level, const std::string& message) const;

    void debug(const std::string& message) const
    {
        log(LogLevel::Debug, message);
    }
    void info(const std::string& message) const
    {
        log(LogLevel::Info, message);
    }
    void warning(const std::string& message) const
    {
        log(LogLevel::Warning, message);
    }
    void error(const std::string& message) const
    {
        log(LogLevel::Error, message);
    }

  private:
    std::optional<LogCallback> callback_;
    LogLevel level_ = LogLevel::Warning;
};

} // namespace internal
} // namespace toolbridge

#endif // TOOLBRIDGE_INTERNAL_LOG_HPP
