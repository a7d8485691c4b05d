#ifndef TOOLBRIDGE_INTERNAL_SUBPROCESS_TRANSPORT_HPP
#define TOOLBRIDGE_INTERNAL_SUBPROCESS_TRANSPORT_HPP

#include "../line_buffer.hpp"
#include "../log.hpp"
#include "../subprocess/process.hpp"

#include <atomic>
#include <deque>
#include <memory>
#include <mutex>
#include <thread>
#include <toolbridge/transport.hpp>
#include <toolbridge/types.hpp>

namespace toolbridge
{
namespace internal
{

/**
 * Transport over a child process's standard streams.
 *
 * Protocol lines are written to the child's stdin and read from its stdout.
 * The child's stderr is drained by a background thread, forwarded to the
 * stderr callback and kept in a bounded history; it is never interpreted.
 */
class SubprocessTransport : public Transport
{
  public:
    explicit SubprocessTransport(const ClientOptions& options);
    ~SubprocessTransport() override;

    // Transport interface
    void start() override;
    void write_line(const std::string& text) override;
    std::optional<std::string> read_line(std::chrono::milliseconds timeout) override;
    void terminate() override;
    bool is_running() const override;
    long get_pid() const override;
    std::vector<std::string> recent_stderr() const override;

  private:
    // Command line arguments passed after the executable
    std::vector<std::string> build_arguments() const;

    // Close stdin, then escalate SIGTERM -> SIGKILL if the child lingers
    void shutdown_process();

    // Background stderr reader thread
    void stderr_reader_loop();
    void start_stderr_reader();
    void stop_stderr_reader();

    ClientOptions options_;
    Logger logger_;

    // Process management
    std::unique_ptr<subprocess::Process> process_;

    // Guards process_ pipes for line I/O and teardown
    mutable std::mutex io_mutex_;
    LineBuffer stdout_buffer_;
    bool stdout_eof_ = false;
    std::atomic<bool> terminated_{false};

    // Stderr reader thread
    std::thread stderr_reader_thread_;
    std::atomic<bool> stderr_running_{false};
    mutable std::mutex stderr_mutex_;
    std::deque<std::string> stderr_history_;
};

} // namespace internal
} // namespace toolbridge

#endif // TOOLBRIDGE_INTERNAL_SUBPROCESS_TRANSPORT_HPP
