#include <toolbridge/errors.hpp>
#include <toolbridge/types.hpp>

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <fstream>
#include <stdexcept>

namespace toolbridge
{

namespace
{
std::optional<long long> parse_env_integer(const char* name)
{
    const char* env = std::getenv(name);
    if (env == nullptr || env[0] == '\0')
        return std::nullopt;

    try
    {
        size_t consumed = 0;
        long long value = std::stoll(env, &consumed);
        if (consumed != std::char_traits<char>::length(env))
            return std::nullopt;
        return value;
    }
    catch (const std::logic_error&)
    {
        // invalid_argument / out_of_range: keep default
        return std::nullopt;
    }
}

template <typename T>
void read_field(const json& config, const char* key, T& target)
{
    auto it = config.find(key);
    if (it == config.end() || it->is_null())
        return;

    try
    {
        target = it->template get<T>();
    }
    catch (const json::exception& e)
    {
        throw ConfigurationError(std::string("Invalid value for '") + key + "': " + e.what());
    }
}
} // namespace

std::string to_string(LogLevel level)
{
    switch (level)
    {
    case LogLevel::Debug:
        return "DEBUG";
    case LogLevel::Info:
        return "INFO";
    case LogLevel::Warning:
        return "WARNING";
    case LogLevel::Error:
        return "ERROR";
    case LogLevel::Off:
        return "OFF";
    }
    return "UNKNOWN";
}

std::optional<LogLevel> parse_log_level(const std::string& text)
{
    std::string lower = text;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lower == "debug")
        return LogLevel::Debug;
    if (lower == "info")
        return LogLevel::Info;
    if (lower == "warning" || lower == "warn")
        return LogLevel::Warning;
    if (lower == "error")
        return LogLevel::Error;
    if (lower == "off" || lower == "none")
        return LogLevel::Off;
    return std::nullopt;
}

std::string to_string(ConnectionState state)
{
    switch (state)
    {
    case ConnectionState::Disconnected:
        return "Disconnected";
    case ConnectionState::Connecting:
        return "Connecting";
    case ConnectionState::Initializing:
        return "Initializing";
    case ConnectionState::Ready:
        return "Ready";
    case ConnectionState::Closed:
        return "Closed";
    }
    return "Unknown";
}

void apply_environment_overrides(ClientOptions& options)
{
    if (auto timeout = parse_env_integer("TOOLBRIDGE_READ_TIMEOUT_MS"); timeout && *timeout >= 0)
        options.read_timeout = std::chrono::milliseconds(*timeout);

    if (auto skipped = parse_env_integer("TOOLBRIDGE_MAX_SKIPPED_LINES");
        skipped && *skipped >= 0 && *skipped <= 100000)
        options.max_skipped_lines = static_cast<int>(*skipped);

    if (const char* env = std::getenv("TOOLBRIDGE_LOG_LEVEL"))
        if (auto level = parse_log_level(env))
            options.log_level = *level;
}

ClientOptions client_options_from_json(const json& config)
{
    if (!config.is_object())
        throw ConfigurationError("Configuration must be a JSON object");

    ClientOptions options;
    read_field(config, "command", options.command);
    read_field(config, "args", options.args);
    read_field(config, "server_script", options.server_script);
    read_field(config, "environment", options.environment);
    read_field(config, "inherit_environment", options.inherit_environment);
    read_field(config, "protocol_version", options.protocol_version);
    read_field(config, "client_name", options.client_name);
    read_field(config, "client_version", options.client_version);
    read_field(config, "roots_list_changed", options.roots_list_changed);
    read_field(config, "sampling_enabled", options.sampling_enabled);
    read_field(config, "tools_list_changed", options.tools_list_changed);
    read_field(config, "initialized_notification", options.initialized_notification);
    read_field(config, "max_skipped_lines", options.max_skipped_lines);
    read_field(config, "max_line_size", options.max_line_size);
    read_field(config, "stderr_history_lines", options.stderr_history_lines);

    std::string working_directory;
    read_field(config, "working_directory", working_directory);
    if (!working_directory.empty())
        options.working_directory = working_directory;

    long long timeout_ms = options.read_timeout.count();
    read_field(config, "read_timeout_ms", timeout_ms);
    if (timeout_ms < 0)
        throw ConfigurationError("Invalid value for 'read_timeout_ms': must not be negative");
    options.read_timeout = std::chrono::milliseconds(timeout_ms);

    std::string level;
    read_field(config, "log_level", level);
    if (!level.empty())
    {
        auto parsed = parse_log_level(level);
        if (!parsed)
            throw ConfigurationError("Invalid value for 'log_level': " + level);
        options.log_level = *parsed;
    }

    return options;
}

ClientOptions load_client_options(const std::string& path)
{
    std::ifstream in(path);
    if (!in)
        throw ConfigurationError("Cannot open configuration file: " + path);

    json config;
    try
    {
        config = json::parse(in);
    }
    catch (const json::parse_error& e)
    {
        throw ConfigurationError("Configuration file " + path + " is not valid JSON: " + e.what());
    }

    return client_options_from_json(config);
}

} // namespace toolbridge
