#include "subprocess_transport.hpp"

#include <chrono>
#include <csignal>
#include <stdexcept>
#include <toolbridge/errors.hpp>

namespace toolbridge
{
namespace internal
{

namespace
{
// Poll granularity for blocking reads; bounds how long terminate() waits on a reader
constexpr int READ_POLL_MS = 100;

// Grace period between closing stdin and sending SIGTERM, and between SIGTERM and SIGKILL
constexpr auto STDIN_CLOSE_GRACE = std::chrono::milliseconds(200);
constexpr auto TERMINATE_GRACE = std::chrono::milliseconds(2000);

void ignore_sigpipe()
{
    // A child that dies mid-write must surface as EPIPE, not kill the host
    static std::once_flag once;
    std::call_once(once, [] { std::signal(SIGPIPE, SIG_IGN); });
}

bool wait_for_exit(subprocess::Process& process, std::chrono::milliseconds grace)
{
    auto deadline = std::chrono::steady_clock::now() + grace;
    while (std::chrono::steady_clock::now() < deadline)
    {
        if (process.try_wait())
            return true;
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    return process.try_wait().has_value();
}
} // namespace

SubprocessTransport::SubprocessTransport(const ClientOptions& options)
    : options_(options), logger_(Logger::from_options(options)),
      stdout_buffer_(options.max_line_size)
{
}

SubprocessTransport::~SubprocessTransport()
{
    terminate();
    stop_stderr_reader();
    if (stderr_reader_thread_.joinable())
        stderr_reader_thread_.detach();
}

void SubprocessTransport::start()
{
    std::lock_guard<std::mutex> lock(io_mutex_);

    if (process_ && process_->is_running() && !terminated_)
        return; // Already started

    ignore_sigpipe();

    subprocess::ProcessOptions proc_opts;
    proc_opts.redirect_stdin = true;
    proc_opts.redirect_stdout = true;
    proc_opts.redirect_stderr = true;
    proc_opts.inherit_environment = options_.inherit_environment;
    proc_opts.environment = options_.environment;
    if (options_.working_directory)
        proc_opts.working_directory = *options_.working_directory;

    auto process = std::make_unique<subprocess::Process>();
    process->spawn(options_.command, build_arguments(), proc_opts);

    process_ = std::move(process);
    stdout_buffer_.clear_buffer();
    stdout_eof_ = false;
    terminated_ = false;
    {
        std::lock_guard<std::mutex> history_lock(stderr_mutex_);
        stderr_history_.clear();
    }

    logger_.info("Started server process '" + options_.command + "' (pid " +
                 std::to_string(process_->pid()) + ")");

    start_stderr_reader();
}

void SubprocessTransport::write_line(const std::string& text)
{
    if (text.find('\n') != std::string::npos)
        throw std::invalid_argument("Protocol message must not contain a line break");

    std::lock_guard<std::mutex> lock(io_mutex_);

    if (terminated_ || !process_)
        throw TransportClosedError("Transport is closed");

    if (!process_->is_running())
        throw TransportClosedError("Cannot write to terminated process");

    // One write call per message keeps lines from interleaving
    std::string line = text;
    line.push_back('\n');
    process_->stdin_pipe().write(line);
}

std::optional<std::string> SubprocessTransport::read_line(std::chrono::milliseconds timeout)
{
    std::lock_guard<std::mutex> lock(io_mutex_);

    if (!process_)
        return std::nullopt;

    const bool bounded = timeout.count() > 0;
    const auto deadline = std::chrono::steady_clock::now() + timeout;

    while (true)
    {
        if (auto line = stdout_buffer_.extract_line())
            return line;

        if (stdout_eof_)
            return stdout_buffer_.take_remainder();

        if (terminated_)
            return std::nullopt;

        int slice_ms = READ_POLL_MS;
        if (bounded)
        {
            auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
                deadline - std::chrono::steady_clock::now());
            if (remaining.count() <= 0)
                throw ReadTimeoutError("No line received from server within " +
                                       std::to_string(timeout.count()) + " ms");
            if (remaining.count() < slice_ms)
                slice_ms = static_cast<int>(remaining.count());
        }

        if (!process_->stdout_pipe().has_data(slice_ms))
            continue;

        char buffer[4096];
        size_t n = process_->stdout_pipe().read(buffer, sizeof(buffer));
        if (n == 0)
        {
            stdout_eof_ = true;
            continue;
        }

        stdout_buffer_.add_data(buffer, n);
    }
}

void SubprocessTransport::terminate()
{
    // Wakes a reader blocked in read_line() within one poll slice
    if (terminated_.exchange(true))
        return;

    std::lock_guard<std::mutex> lock(io_mutex_);
    if (!process_)
        return;

    shutdown_process();
    stop_stderr_reader();

    logger_.debug("Server process exited");
    process_.reset();
}

void SubprocessTransport::shutdown_process()
{
    if (process_->stdin_pipe().is_open())
        process_->stdin_pipe().close();

    try
    {
        if (wait_for_exit(*process_, STDIN_CLOSE_GRACE))
            return;

        process_->terminate();
        if (wait_for_exit(*process_, TERMINATE_GRACE))
            return;

        logger_.warning("Server process ignored SIGTERM; killing pid " +
                        std::to_string(process_->pid()));
        process_->kill();
        process_->wait();
    }
    catch (const std::runtime_error& e)
    {
        // waitpid failure: the child is no longer ours to reap
        logger_.warning(std::string("Failed to reap server process: ") + e.what());
    }
}

bool SubprocessTransport::is_running() const
{
    std::lock_guard<std::mutex> lock(io_mutex_);
    return !terminated_ && process_ && process_->is_running();
}

long SubprocessTransport::get_pid() const
{
    std::lock_guard<std::mutex> lock(io_mutex_);
    if (process_)
        return static_cast<long>(process_->pid());
    return 0;
}

std::vector<std::string> SubprocessTransport::recent_stderr() const
{
    std::lock_guard<std::mutex> lock(stderr_mutex_);
    return std::vector<std::string>(stderr_history_.begin(), stderr_history_.end());
}

std::vector<std::string> SubprocessTransport::build_arguments() const
{
    std::vector<std::string> args = options_.args;
    if (!options_.server_script.empty())
        args.push_back(options_.server_script);
    return args;
}

void SubprocessTransport::stderr_reader_loop()
{
    // Read stderr line-by-line; record and forward, never interpret
    try
    {
        auto& pipe = process_->stderr_pipe();
        while (stderr_running_)
        {
            if (!pipe.has_data(READ_POLL_MS))
                continue;

            std::string line = pipe.read_line();
            if (line.empty())
                break; // EOF

            while (!line.empty() && (line.back() == '\r' || line.back() == '\n'))
                line.pop_back();

            if (line.empty())
                continue;

            {
                std::lock_guard<std::mutex> lock(stderr_mutex_);
                stderr_history_.push_back(line);
                while (stderr_history_.size() > options_.stderr_history_lines)
                    stderr_history_.pop_front();
            }

            logger_.debug("server stderr: " + line);

            if (options_.stderr_callback.has_value())
            {
                try
                {
                    (*options_.stderr_callback)(line);
                }
                catch (const std::exception& e)
                {
                    logger_.warning(std::string("stderr callback threw: ") + e.what());
                }
            }
        }
    }
    catch (const ToolbridgeError& e)
    {
        logger_.debug(std::string("stderr reader stopped: ") + e.what());
    }
}

void SubprocessTransport::start_stderr_reader()
{
    stop_stderr_reader();
    stderr_running_ = true;
    stderr_reader_thread_ = std::thread(&SubprocessTransport::stderr_reader_loop, this);
}

void SubprocessTransport::stop_stderr_reader()
{
    stderr_running_ = false;
    if (!stderr_reader_thread_.joinable())
        return;

    // Reached from inside stderr_callback: the loop exits once the callback
    // returns and a later stop from another thread joins it
    if (stderr_reader_thread_.get_id() == std::this_thread::get_id())
        return;

    stderr_reader_thread_.join();
}

} // namespace internal

std::unique_ptr<Transport> create_subprocess_transport(const ClientOptions& options)
{
    return std::make_unique<internal::SubprocessTransport>(options);
}

} // namespace toolbridge
