#ifndef TOOLBRIDGE_SUBPROCESS_PROCESS_HPP
#define TOOLBRIDGE_SUBPROCESS_PROCESS_HPP

#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace toolbridge
{
namespace subprocess
{

// Owned POSIX descriptors / pid, defined in process_posix.cpp
struct ProcessHandle;
struct PipeHandle;

// Parent end of a pipe the child writes to (its stdout or stderr)
class ReadPipe
{
  public:
    ReadPipe();
    ~ReadPipe();

    // No copy, move only
    ReadPipe(const ReadPipe&) = delete;
    ReadPipe& operator=(const ReadPipe&) = delete;
    ReadPipe(ReadPipe&&) noexcept;
    ReadPipe& operator=(ReadPipe&&) noexcept;

    // Read up to size bytes. Blocks until at least one byte or EOF.
    // Returns 0 on EOF. EINTR is retried; other failures throw TransportClosedError.
    size_t read(char* buffer, size_t size);

    // Read byte-wise up to and including '\n', or max_size bytes.
    // The terminator is kept; an empty string means EOF.
    std::string read_line(size_t max_size = 4096);

    // True when a read would not block: data is pending or the writer closed
    // (EOF). Waits at most timeout_ms. A signal interruption reports false.
    bool has_data(int timeout_ms = 0);

    void close();
    bool is_open() const;

  private:
    friend class Process;
    std::unique_ptr<PipeHandle> handle_;
};

// Parent end of the child's stdin
class WritePipe
{
  public:
    WritePipe();
    ~WritePipe();

    // No copy, move only
    WritePipe(const WritePipe&) = delete;
    WritePipe& operator=(const WritePipe&) = delete;
    WritePipe(WritePipe&&) noexcept;
    WritePipe& operator=(WritePipe&&) noexcept;

    // Unbuffered. Loops over short writes and EINTR until every byte is written.
    // Throws TransportClosedError on EPIPE (child gone) or any other failure.
    size_t write(const char* data, size_t size);
    size_t write(const std::string& data);

    // Closing delivers EOF to the child
    void close();
    bool is_open() const;

  private:
    friend class Process;
    std::unique_ptr<PipeHandle> handle_;
};

struct ProcessOptions
{
    // Empty keeps the parent's directory
    std::string working_directory;
    // Overrides applied on top of (or, without inheritance, instead of) the parent environment
    std::map<std::string, std::string> environment;
    bool inherit_environment = true;
    bool redirect_stdin = true;
    bool redirect_stdout = true;
    bool redirect_stderr = false;
};

/**
 * A child process started with fork/execv.
 *
 * spawn() resolves the executable first and reports exec failures
 * synchronously: the child writes its errno to a close-on-exec status pipe,
 * so a missing or non-executable program throws ProcessSpawnError from
 * spawn() instead of surfacing later as an early exit.
 *
 * Destroying a running Process sends SIGTERM and reaps it.
 */
class Process
{
  public:
    Process();
    ~Process();

    // No copy, move only
    Process(const Process&) = delete;
    Process& operator=(const Process&) = delete;
    Process(Process&&) noexcept;
    Process& operator=(Process&&) noexcept;

    // Throws ProcessSpawnError if the executable is not found, a pipe or fork
    // fails, or exec (or chdir into working_directory) fails in the child.
    void spawn(const std::string& executable, const std::vector<std::string>& args,
               const ProcessOptions& options = {});

    // Only valid for redirected streams
    WritePipe& stdin_pipe();
    ReadPipe& stdout_pipe();
    ReadPipe& stderr_pipe();

    // False once the child has exited, even before it is reaped
    bool is_running() const;
    // Reaps without blocking. Exit code, or 128 + signal number when killed.
    std::optional<int> try_wait();
    // Blocks until exit; EINTR is retried. Same exit code convention as try_wait().
    int wait();
    void terminate(); // SIGTERM
    void kill();      // SIGKILL

    int pid() const;

  private:
    std::unique_ptr<ProcessHandle> handle_;
    std::unique_ptr<WritePipe> stdin_;
    std::unique_ptr<ReadPipe> stdout_;
    std::unique_ptr<ReadPipe> stderr_;
};

// Names containing '/' are checked directly; others are searched on PATH.
// Returns the path of a regular, executable file.
std::optional<std::string> find_executable(const std::string& name);

} // namespace subprocess
} // namespace toolbridge

#endif // TOOLBRIDGE_SUBPROCESS_PROCESS_HPP
