#ifndef TOOLBRIDGE_TYPES_HPP
#define TOOLBRIDGE_TYPES_HPP

#include <chrono>
#include <functional>
#include <map>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

namespace toolbridge
{

// Order-preserving so schemas keep the server's parameter order
using json = nlohmann::ordered_json;

// ============================================================================
// Logging
// ============================================================================

enum class LogLevel
{
    Debug,
    Info,
    Warning,
    Error,
    Off,
};

std::string to_string(LogLevel level);
std::optional<LogLevel> parse_log_level(const std::string& text);

using LogCallback = std::function<void(LogLevel, const std::string&)>;
using StderrCallback = std::function<void(const std::string&)>;

// ============================================================================
// Connection lifecycle
// ============================================================================

enum class ConnectionState
{
    Disconnected,
    Connecting,
    Initializing,
    Ready,
    Closed,
};

std::string to_string(ConnectionState state);

// ============================================================================
// Client options
// ============================================================================

struct ClientOptions
{
    // Server launch. The child is started as `command args... [server_script]`.
    std::string command = "node";
    std::vector<std::string> args;
    std::string server_script;
    std::optional<std::string> working_directory;
    std::map<std::string, std::string> environment;
    bool inherit_environment = true;

    // Handshake parameters
    std::string protocol_version = "2024-11-05";
    std::string client_name = "toolbridge";
    std::string client_version; // Empty means version_string()
    bool roots_list_changed = true;
    bool sampling_enabled = true;
    bool tools_list_changed = true;
    std::string initialized_notification = "initialized";

    /// Upper bound on the wait for one reply, across every line skipped
    /// while waiting. Zero waits indefinitely.
    std::chrono::milliseconds read_timeout{60000};

    /// Malformed lines tolerated while awaiting one reply before
    /// MaxAttemptsExceededError is raised.
    int max_skipped_lines = 10;

    /// Longest accepted line from the child, in bytes.
    size_t max_line_size = 1024 * 1024;

    /// Library diagnostics. Without a callback, messages at or above
    /// log_level go to std::cerr.
    std::optional<LogCallback> log_callback;
    LogLevel log_level = LogLevel::Warning;

    /// Callback invoked for each line the child writes to stderr.
    /// Note: Executes on a background thread - ensure callback is thread-safe.
    std::optional<StderrCallback> stderr_callback;

    /// Number of recent stderr lines retained for ProtocolClient::recent_stderr().
    size_t stderr_history_lines = 50;
};

/// Apply TOOLBRIDGE_READ_TIMEOUT_MS, TOOLBRIDGE_MAX_SKIPPED_LINES and
/// TOOLBRIDGE_LOG_LEVEL. Unparseable values leave the option unchanged.
void apply_environment_overrides(ClientOptions& options);

/// Populate options from a JSON object using the snake_case field names above.
/// Unknown keys are ignored; wrong-typed values raise ConfigurationError.
ClientOptions client_options_from_json(const json& config);

/// Read a JSON configuration file. Throws ConfigurationError.
ClientOptions load_client_options(const std::string& path);

} // namespace toolbridge

#endif // TOOLBRIDGE_TYPES_HPP
