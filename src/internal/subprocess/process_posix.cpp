// POSIX implementation of subprocess process management
// For Linux and macOS

#include "process.hpp"

#include <cstdlib>
#include <cstring>
#include <errno.h>
#include <fcntl.h>
#include <filesystem>
#include <signal.h>
#include <stdexcept>
#include <sys/select.h>
#include <sys/wait.h>
#include <toolbridge/errors.hpp>
#include <unistd.h>

namespace toolbridge
{
namespace subprocess
{

// ============================================================================
// ProcessHandle - POSIX implementation
// ============================================================================

struct ProcessHandle
{
    pid_t pid = 0;
    bool running = false;
    int exit_code = -1;
};

// ============================================================================
// PipeHandle - POSIX implementation
// ============================================================================

struct PipeHandle
{
    int fd = -1;

    ~PipeHandle()
    {
        if (fd >= 0)
            ::close(fd);
    }
};

// ============================================================================
// Helper functions
// ============================================================================

static std::string get_errno_message(int err = errno)
{
    return std::strerror(err);
}

static void set_cloexec(int fd)
{
    int flags = fcntl(fd, F_GETFD, 0);
    if (flags != -1)
        fcntl(fd, F_SETFD, flags | FD_CLOEXEC);
}

static void close_pair(int (&fds)[2])
{
    for (int& fd : fds)
    {
        if (fd >= 0)
        {
            ::close(fd);
            fd = -1;
        }
    }
}

// ============================================================================
// ReadPipe implementation
// ============================================================================

ReadPipe::ReadPipe() : handle_(std::make_unique<PipeHandle>()) {}

ReadPipe::~ReadPipe()
{
    close();
}

ReadPipe::ReadPipe(ReadPipe&&) noexcept = default;
ReadPipe& ReadPipe::operator=(ReadPipe&&) noexcept = default;

size_t ReadPipe::read(char* buffer, size_t size)
{
    if (!is_open())
        throw TransportClosedError("Pipe is not open");

    ssize_t bytes_read;
    do
    {
        bytes_read = ::read(handle_->fd, buffer, size);
    } while (bytes_read < 0 && errno == EINTR);

    if (bytes_read < 0)
    {
        if (errno == EAGAIN || errno == EWOULDBLOCK)
            return 0; // No data available (non-blocking)
        throw TransportClosedError("Read failed: " + get_errno_message());
    }

    return static_cast<size_t>(bytes_read);
}

std::string ReadPipe::read_line(size_t max_size)
{
    std::string line;
    line.reserve(256);

    char ch;
    while (line.size() < max_size)
    {
        size_t bytes_read = read(&ch, 1);
        if (bytes_read == 0)
            break; // EOF

        line.push_back(ch);
        if (ch == '\n')
            break;
    }

    return line;
}

bool ReadPipe::has_data(int timeout_ms)
{
    if (!is_open())
        return false;

    fd_set read_fds;
    FD_ZERO(&read_fds);
    FD_SET(handle_->fd, &read_fds);

    struct timeval timeout;
    timeout.tv_sec = timeout_ms / 1000;
    timeout.tv_usec = (timeout_ms % 1000) * 1000;

    int result = select(handle_->fd + 1, &read_fds, nullptr, nullptr, &timeout);
    if (result < 0)
    {
        if (errno == EINTR)
            return false;
        throw TransportClosedError("select failed: " + get_errno_message());
    }

    return result > 0 && FD_ISSET(handle_->fd, &read_fds);
}

void ReadPipe::close()
{
    if (handle_ && handle_->fd >= 0)
    {
        ::close(handle_->fd);
        handle_->fd = -1;
    }
}

bool ReadPipe::is_open() const
{
    return handle_ && handle_->fd >= 0;
}

// ============================================================================
// WritePipe implementation
// ============================================================================

WritePipe::WritePipe() : handle_(std::make_unique<PipeHandle>()) {}

WritePipe::~WritePipe()
{
    close();
}

WritePipe::WritePipe(WritePipe&&) noexcept = default;
WritePipe& WritePipe::operator=(WritePipe&&) noexcept = default;

size_t WritePipe::write(const char* data, size_t size)
{
    if (!is_open())
        throw TransportClosedError("Pipe is not open");

    size_t total = 0;
    while (total < size)
    {
        ssize_t bytes_written = ::write(handle_->fd, data + total, size - total);
        if (bytes_written < 0)
        {
            if (errno == EINTR)
                continue;
            if (errno == EPIPE)
                throw TransportClosedError("Broken pipe (process closed stdin)");
            throw TransportClosedError("Write failed: " + get_errno_message());
        }
        total += static_cast<size_t>(bytes_written);
    }

    return total;
}

size_t WritePipe::write(const std::string& data)
{
    return write(data.data(), data.size());
}

void WritePipe::close()
{
    if (handle_ && handle_->fd >= 0)
    {
        ::close(handle_->fd);
        handle_->fd = -1;
    }
}

bool WritePipe::is_open() const
{
    return handle_ && handle_->fd >= 0;
}

// ============================================================================
// Process implementation
// ============================================================================

Process::Process() : handle_(std::make_unique<ProcessHandle>()) {}

Process::~Process()
{
    if (handle_ && handle_->running)
    {
        terminate();
        wait();
    }
}

Process::Process(Process&&) noexcept = default;
Process& Process::operator=(Process&&) noexcept = default;

void Process::spawn(const std::string& executable, const std::vector<std::string>& args,
                    const ProcessOptions& options)
{
    auto resolved = find_executable(executable);
    if (!resolved)
        throw ProcessSpawnError("Executable not found: " + executable);

    int stdin_pipe[2] = {-1, -1};
    int stdout_pipe[2] = {-1, -1};
    int stderr_pipe[2] = {-1, -1};
    // Reports exec() failure back to the parent; closed on successful exec
    int status_pipe[2] = {-1, -1};

    auto cleanup = [&]
    {
        close_pair(stdin_pipe);
        close_pair(stdout_pipe);
        close_pair(stderr_pipe);
        close_pair(status_pipe);
    };

    if (options.redirect_stdin && pipe(stdin_pipe) != 0)
    {
        cleanup();
        throw ProcessSpawnError("Failed to create stdin pipe: " + get_errno_message());
    }
    if (options.redirect_stdout && pipe(stdout_pipe) != 0)
    {
        int err = errno;
        cleanup();
        throw ProcessSpawnError("Failed to create stdout pipe: " + get_errno_message(err));
    }
    if (options.redirect_stderr && pipe(stderr_pipe) != 0)
    {
        int err = errno;
        cleanup();
        throw ProcessSpawnError("Failed to create stderr pipe: " + get_errno_message(err));
    }
    if (pipe(status_pipe) != 0)
    {
        int err = errno;
        cleanup();
        throw ProcessSpawnError("Failed to create status pipe: " + get_errno_message(err));
    }
    set_cloexec(status_pipe[1]);

    // Build argv before forking; only async-signal-safe calls after fork
    std::vector<char*> argv;
    argv.push_back(const_cast<char*>(resolved->c_str()));
    for (const auto& arg : args)
        argv.push_back(const_cast<char*>(arg.c_str()));
    argv.push_back(nullptr);

    pid_t pid = fork();
    if (pid < 0)
    {
        int err = errno;
        cleanup();
        throw ProcessSpawnError("Failed to fork process: " + get_errno_message(err));
    }

    if (pid == 0)
    {
        // Child process
        ::close(status_pipe[0]);

        auto fail = [&](int err)
        {
            ssize_t ignored = ::write(status_pipe[1], &err, sizeof(err));
            (void)ignored;
            _exit(127);
        };

        if (options.redirect_stdin)
        {
            ::close(stdin_pipe[1]);
            if (dup2(stdin_pipe[0], STDIN_FILENO) < 0)
                fail(errno);
            ::close(stdin_pipe[0]);
        }

        if (options.redirect_stdout)
        {
            ::close(stdout_pipe[0]);
            if (dup2(stdout_pipe[1], STDOUT_FILENO) < 0)
                fail(errno);
            ::close(stdout_pipe[1]);
        }

        if (options.redirect_stderr)
        {
            ::close(stderr_pipe[0]);
            if (dup2(stderr_pipe[1], STDERR_FILENO) < 0)
                fail(errno);
            ::close(stderr_pipe[1]);
        }

        if (!options.working_directory.empty())
        {
            if (chdir(options.working_directory.c_str()) != 0)
                fail(errno);
        }

        // Optionally strip inherited environment before applying overrides.
        if (!options.inherit_environment)
        {
#if defined(__linux__) && defined(_GNU_SOURCE)
            clearenv();
#else
            extern char** environ;
            if (environ)
                environ[0] = nullptr;
#endif
        }
        for (const auto& [key, value] : options.environment)
            setenv(key.c_str(), value.c_str(), 1);

        execv(argv[0], argv.data());
        fail(errno);
    }

    // Parent process
    ::close(status_pipe[1]);
    status_pipe[1] = -1;

    int child_errno = 0;
    ssize_t n;
    do
    {
        n = ::read(status_pipe[0], &child_errno, sizeof(child_errno));
    } while (n < 0 && errno == EINTR);
    close_pair(status_pipe);

    if (n > 0)
    {
        int status;
        waitpid(pid, &status, 0);
        close_pair(stdin_pipe);
        close_pair(stdout_pipe);
        close_pair(stderr_pipe);
        throw ProcessSpawnError("Failed to start " + executable + ": " +
                                get_errno_message(child_errno));
    }

    if (options.redirect_stdin)
    {
        ::close(stdin_pipe[0]);
        set_cloexec(stdin_pipe[1]);
        stdin_ = std::make_unique<WritePipe>();
        stdin_->handle_->fd = stdin_pipe[1];
    }

    if (options.redirect_stdout)
    {
        ::close(stdout_pipe[1]);
        set_cloexec(stdout_pipe[0]);
        stdout_ = std::make_unique<ReadPipe>();
        stdout_->handle_->fd = stdout_pipe[0];
    }

    if (options.redirect_stderr)
    {
        ::close(stderr_pipe[1]);
        set_cloexec(stderr_pipe[0]);
        stderr_ = std::make_unique<ReadPipe>();
        stderr_->handle_->fd = stderr_pipe[0];
    }

    handle_->pid = pid;
    handle_->running = true;
}

WritePipe& Process::stdin_pipe()
{
    if (!stdin_)
        throw std::logic_error("stdin not redirected");
    return *stdin_;
}

ReadPipe& Process::stdout_pipe()
{
    if (!stdout_)
        throw std::logic_error("stdout not redirected");
    return *stdout_;
}

ReadPipe& Process::stderr_pipe()
{
    if (!stderr_)
        throw std::logic_error("stderr not redirected");
    return *stderr_;
}

bool Process::is_running() const
{
    if (!handle_ || handle_->pid == 0 || !handle_->running)
        return false;

    // A zombie still answers kill(0); ask waitpid without reaping
    siginfo_t info{};
    if (waitid(P_PID, static_cast<id_t>(handle_->pid), &info, WEXITED | WNOHANG | WNOWAIT) == 0)
        return info.si_pid == 0;

    return ::kill(handle_->pid, 0) == 0 || errno != ESRCH;
}

std::optional<int> Process::try_wait()
{
    if (!handle_ || handle_->pid == 0)
        return handle_ ? handle_->exit_code : -1;

    if (!handle_->running)
        return handle_->exit_code;

    int status;
    pid_t result = waitpid(handle_->pid, &status, WNOHANG);

    if (result == handle_->pid)
    {
        if (WIFEXITED(status))
            handle_->exit_code = WEXITSTATUS(status);
        else if (WIFSIGNALED(status))
            handle_->exit_code = 128 + WTERMSIG(status);
        else
            handle_->exit_code = -1;
        handle_->running = false;
        return handle_->exit_code;
    }
    else if (result == 0)
    {
        return std::nullopt;
    }

    throw std::runtime_error("waitpid failed: " + get_errno_message());
}

int Process::wait()
{
    if (!handle_ || handle_->pid == 0)
        return handle_ ? handle_->exit_code : -1;

    if (!handle_->running)
        return handle_->exit_code;

    int status;
    pid_t result;
    do
    {
        result = waitpid(handle_->pid, &status, 0);
    } while (result < 0 && errno == EINTR);

    if (result == handle_->pid)
    {
        if (WIFEXITED(status))
            handle_->exit_code = WEXITSTATUS(status);
        else if (WIFSIGNALED(status))
            handle_->exit_code = 128 + WTERMSIG(status);
        else
            handle_->exit_code = -1;
        handle_->running = false;
        return handle_->exit_code;
    }

    throw std::runtime_error("waitpid failed: " + get_errno_message());
}

void Process::terminate()
{
    if (handle_ && handle_->pid > 0 && handle_->running)
        ::kill(handle_->pid, SIGTERM);
}

void Process::kill()
{
    if (handle_ && handle_->pid > 0 && handle_->running)
        ::kill(handle_->pid, SIGKILL);
}

int Process::pid() const
{
    return handle_ ? static_cast<int>(handle_->pid) : 0;
}

// ============================================================================
// Helper functions
// ============================================================================

std::optional<std::string> find_executable(const std::string& name)
{
    namespace fs = std::filesystem;

    if (name.empty())
        return std::nullopt;

    std::error_code ec;

    // Absolute or relative path: check directly
    if (name.find('/') != std::string::npos)
    {
        if (fs::is_regular_file(name, ec) && access(name.c_str(), X_OK) == 0)
            return fs::absolute(name, ec).string();
        return std::nullopt;
    }

    const char* path_env = std::getenv("PATH");
    std::string path_str = path_env ? path_env : "/usr/local/bin:/usr/bin:/bin";

    // Split PATH by colon
    size_t start = 0;
    while (start <= path_str.size())
    {
        size_t end = path_str.find(':', start);
        if (end == std::string::npos)
            end = path_str.size();

        std::string dir = path_str.substr(start, end - start);
        if (!dir.empty())
        {
            fs::path test_path = fs::path(dir) / name;
            if (fs::is_regular_file(test_path, ec) && access(test_path.c_str(), X_OK) == 0)
                return test_path.string();
        }

        start = end + 1;
    }

    return std::nullopt;
}

} // namespace subprocess
} // namespace toolbridge
