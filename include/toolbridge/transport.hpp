#ifndef TOOLBRIDGE_TRANSPORT_HPP
#define TOOLBRIDGE_TRANSPORT_HPP

#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <toolbridge/types.hpp>
#include <vector>

namespace toolbridge
{

/**
 * Abstract line-oriented transport to a protocol server.
 *
 * This is the low-level byte exchange the ProtocolClient builds on. Every
 * message is exactly one line: write_line() terminates, writes and flushes a
 * message as a unit, and read_line() returns exactly one line or signals
 * end-of-stream.
 *
 * Implementations include:
 * - SubprocessTransport: child process spoken to over stdin/stdout
 * - Test doubles that replay scripted lines
 *
 * read_line() and write_line() are called by one thread at a time. terminate()
 * may be called from any thread and must wake a blocked read_line().
 */
class Transport
{
  public:
    virtual ~Transport() = default;

    /**
     * Start the transport. For subprocess transports this spawns the child.
     * Throws ProcessSpawnError if the executable cannot be started.
     */
    virtual void start() = 0;

    /**
     * Append a line terminator to text, write it and flush.
     * Throws TransportClosedError if the peer has gone away.
     */
    virtual void write_line(const std::string& text) = 0;

    /**
     * Block until one complete line is available and return it without its
     * terminator. Returns std::nullopt at end-of-stream.
     * @param timeout Upper bound on the wait; zero waits indefinitely.
     * Throws ReadTimeoutError when the timeout elapses first.
     */
    virtual std::optional<std::string> read_line(std::chrono::milliseconds timeout) = 0;

    /**
     * Request termination and release stream handles. Idempotent.
     */
    virtual void terminate() = 0;

    /**
     * Check if the transport is still running/connected.
     */
    virtual bool is_running() const = 0;

    /**
     * Get the process ID for subprocess transports.
     * Returns 0 for non-subprocess transports.
     */
    virtual long get_pid() const
    {
        return 0;
    }

    /**
     * Most recent diagnostic lines the peer wrote outside the protocol stream
     * (stderr for subprocesses), oldest first.
     */
    virtual std::vector<std::string> recent_stderr() const
    {
        return {};
    }
};

// Factory function for the child-process transport described by options
std::unique_ptr<Transport> create_subprocess_transport(const ClientOptions& options);

} // namespace toolbridge

#endif // TOOLBRIDGE_TRANSPORT_HPP
