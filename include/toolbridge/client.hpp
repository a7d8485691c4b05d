#ifndef TOOLBRIDGE_CLIENT_HPP
#define TOOLBRIDGE_CLIENT_HPP

#include <memory>
#include <optional>
#include <string>
#include <toolbridge/transport.hpp>
#include <toolbridge/types.hpp>
#include <vector>

namespace toolbridge
{

/**
 * Client for a line-delimited JSON-RPC server running as a child process.
 *
 * Lifecycle: Disconnected -> Connecting -> Initializing -> Ready -> Closed.
 * connect() performs the initialize/initialized handshake; call() is legal
 * only once the client is Ready. Requests are strictly serialized: call()
 * blocks until the matching reply line has been read, so at most one request
 * is in flight. Calls from several threads are queued on an internal mutex.
 *
 * Lines the server writes that are not protocol envelopes are skipped, up to
 * ClientOptions::max_skipped_lines per reply.
 *
 * close() may be called from any thread; a call() blocked on a read observes
 * end-of-stream and fails with TransportClosedError.
 */
class ProtocolClient
{
  public:
    explicit ProtocolClient(const ClientOptions& options = ClientOptions{});
    // Test-only/advanced: inject a custom transport implementation.
    ProtocolClient(const ClientOptions& options, std::unique_ptr<Transport> transport);
    ~ProtocolClient();

    // No copy, move only
    ProtocolClient(const ProtocolClient&) = delete;
    ProtocolClient& operator=(const ProtocolClient&) = delete;
    ProtocolClient(ProtocolClient&&) noexcept;
    ProtocolClient& operator=(ProtocolClient&&) noexcept;

    /**
     * Start the server and perform the handshake.
     * On failure the client returns to Disconnected and rethrows:
     * ProcessSpawnError, HandshakeRejectedError, NoResponseError,
     * MaxAttemptsExceededError, ReadTimeoutError or TransportClosedError.
     * Calling connect() when already Ready is a no-op.
     */
    void connect();

    /**
     * Send a request and wait for its reply. Returns the `result` payload.
     * Throws NotConnectedError before the handshake, TransportClosedError
     * after close(), ServerError for an `error` reply, NoResponseError if the
     * stream ends first, MaxAttemptsExceededError or ReadTimeoutError.
     */
    json call(const std::string& method, const json& params = json::object());

    /**
     * Send a notification (no id, no reply expected). Same preconditions as call().
     */
    void notify(const std::string& method, const json& params = nullptr);

    // Convenience wrappers for the tool methods
    json list_tools();
    json call_tool(const std::string& name, const json& arguments = json::object());

    /**
     * Terminate the server and move to Closed. Idempotent.
     */
    void close();

    ConnectionState state() const;
    bool is_ready() const;

    // The `result` of the initialize handshake, once Ready
    std::optional<json> server_info() const;

    // Get process ID of the server process. Returns 0 if not running.
    long get_pid() const;

    // Recent lines the server wrote to stderr, oldest first
    std::vector<std::string> recent_stderr() const;

    const ClientOptions& options() const;

  private:
    class Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace toolbridge

#endif // TOOLBRIDGE_CLIENT_HPP
