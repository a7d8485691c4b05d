#include "internal/log.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <mutex>
#include <toolbridge/client.hpp>
#include <toolbridge/errors.hpp>
#include <toolbridge/protocol/jsonrpc.hpp>
#include <toolbridge/version.hpp>

namespace toolbridge
{

namespace
{
// Keep noise lines short in debug output
std::string preview(const std::string& line)
{
    constexpr size_t limit = 120;
    if (line.size() <= limit)
        return line;
    return line.substr(0, limit) + "...";
}
} // namespace

class ProtocolClient::Impl
{
  public:
    ClientOptions options_;
    internal::Logger logger_;
    std::unique_ptr<Transport> transport_;

    // Serializes connect/call/notify: one request in flight at a time
    std::mutex call_mutex_;
    std::atomic<ConnectionState> state_{ConnectionState::Disconnected};
    std::int64_t next_id_ = 1;

    mutable std::mutex info_mutex_;
    std::optional<json> server_info_;

    explicit Impl(const ClientOptions& opts)
        : options_(opts), logger_(internal::Logger::from_options(opts)),
          transport_(create_subprocess_transport(opts))
    {
    }

    Impl(const ClientOptions& opts, std::unique_ptr<Transport> transport)
        : options_(opts), logger_(internal::Logger::from_options(opts)),
          transport_(std::move(transport))
    {
    }

    ~Impl()
    {
        close();
    }

    json initialize_params() const
    {
        json capabilities = {{"roots", {{"listChanged", options_.roots_list_changed}}},
                             {"tools", {{"listChanged", options_.tools_list_changed}}}};
        if (options_.sampling_enabled)
            capabilities["sampling"] = json::object();

        std::string client_version =
            options_.client_version.empty() ? version_string() : options_.client_version;

        return json{{"protocolVersion", options_.protocol_version},
                    {"capabilities", capabilities},
                    {"clientInfo", {{"name", options_.client_name}, {"version", client_version}}}};
    }

    void connect()
    {
        std::lock_guard<std::mutex> lock(call_mutex_);

        ConnectionState current = state_.load();
        if (current == ConnectionState::Ready)
            return;
        if (current == ConnectionState::Closed)
            throw TransportClosedError("Client is closed");

        advance(ConnectionState::Disconnected, ConnectionState::Connecting);
        try
        {
            transport_->start();
            advance(ConnectionState::Connecting, ConnectionState::Initializing);

            std::int64_t id = next_id_++;
            transport_->write_line(protocol::build_request(id, "initialize", initialize_params()));

            protocol::Envelope reply = await_reply(id, "initialize");
            if (reply.kind == protocol::Envelope::Kind::Error)
            {
                throw HandshakeRejectedError(
                    "Server rejected initialize: " + protocol::describe_error(reply.error),
                    reply.error);
            }

            {
                std::lock_guard<std::mutex> info_lock(info_mutex_);
                server_info_ = reply.result;
            }

            transport_->write_line(protocol::build_notification(options_.initialized_notification));
            advance(ConnectionState::Initializing, ConnectionState::Ready);
        }
        catch (...)
        {
            abort_connect();
            throw;
        }

        logger_.info("Handshake complete (protocol " + options_.protocol_version + ")");
    }

    json call(const std::string& method, const json& params)
    {
        ensure_ready(method);
        std::lock_guard<std::mutex> lock(call_mutex_);
        ensure_ready(method);

        std::int64_t id = next_id_++;
        logger_.debug("-> " + method + " #" + std::to_string(id));
        transport_->write_line(protocol::build_request(id, method, params));

        protocol::Envelope reply = await_reply(id, method);
        if (reply.kind == protocol::Envelope::Kind::Error)
        {
            throw ServerError(method + " failed: " + protocol::describe_error(reply.error),
                              reply.error);
        }

        return reply.result;
    }

    void notify(const std::string& method, const json& params)
    {
        ensure_ready(method);
        std::lock_guard<std::mutex> lock(call_mutex_);
        ensure_ready(method);

        transport_->write_line(protocol::build_notification(method, params));
    }

    void close()
    {
        if (state_.exchange(ConnectionState::Closed) == ConnectionState::Closed)
            return;

        if (transport_)
            transport_->terminate();

        std::lock_guard<std::mutex> info_lock(info_mutex_);
        server_info_.reset();
    }

  private:
    void ensure_ready(const std::string& method) const
    {
        ConnectionState current = state_.load();
        if (current == ConnectionState::Closed)
            throw TransportClosedError("Cannot send '" + method + "': client is closed");
        if (current != ConnectionState::Ready)
        {
            throw NotConnectedError("Cannot send '" + method +
                                    "' before the handshake completes (state: " +
                                    to_string(current) + ")");
        }
    }

    // Move forward unless close() got there first
    void advance(ConnectionState from, ConnectionState to)
    {
        if (!state_.compare_exchange_strong(from, to))
            throw TransportClosedError("Client was closed during connect");
    }

    void abort_connect()
    {
        ConnectionState current = state_.load();
        while (current != ConnectionState::Closed &&
               !state_.compare_exchange_weak(current, ConnectionState::Disconnected))
        {
        }

        if (current != ConnectionState::Closed)
            transport_->terminate();

        next_id_ = 1;
    }

    // Read until the reply to request `id` arrives. read_timeout bounds the
    // whole wait, so a server streaming notifications cannot stall the call.
    protocol::Envelope await_reply(std::int64_t id, const std::string& method)
    {
        using std::chrono::milliseconds;
        using std::chrono::steady_clock;

        int skipped = 0;
        const bool bounded = options_.read_timeout.count() > 0;
        const auto deadline = steady_clock::now() + options_.read_timeout;

        while (true)
        {
            milliseconds wait = options_.read_timeout;
            if (bounded)
            {
                wait = std::chrono::duration_cast<milliseconds>(deadline - steady_clock::now());
                if (wait.count() <= 0)
                {
                    throw ReadTimeoutError("No reply to '" + method + "' within " +
                                           std::to_string(options_.read_timeout.count()) +
                                           " ms");
                }
            }

            std::optional<std::string> line = transport_->read_line(wait);
            if (!line)
            {
                if (state_.load() == ConnectionState::Closed)
                    throw TransportClosedError("Connection closed while waiting for reply to '" +
                                               method + "'");
                throw NoResponseError("Server closed its output before replying to '" + method +
                                      "'");
            }

            std::optional<protocol::Envelope> envelope = protocol::parse_envelope(*line);
            if (!envelope)
            {
                ++skipped;
                logger_.debug("Skipping non-protocol line: " + preview(*line));
                if (skipped > options_.max_skipped_lines)
                {
                    throw MaxAttemptsExceededError("Gave up waiting for reply to '" + method +
                                                       "' after " + std::to_string(skipped) +
                                                       " non-protocol lines",
                                                   skipped);
                }
                continue;
            }

            switch (envelope->kind)
            {
            case protocol::Envelope::Kind::Request:
                answer_server_request(*envelope);
                continue;
            case protocol::Envelope::Kind::Notification:
                logger_.debug("Ignoring server notification '" + envelope->method + "'");
                continue;
            case protocol::Envelope::Kind::Result:
            case protocol::Envelope::Kind::Error:
                break;
            }

            // A parse failure on the server side is reported with a null id
            bool unattributed_error =
                envelope->kind == protocol::Envelope::Kind::Error && envelope->id.is_null();
            if (envelope->answers(id) || unattributed_error)
                return std::move(*envelope);

            logger_.warning("Ignoring reply with unexpected id " + envelope->id.dump() +
                            " while waiting for #" + std::to_string(id));
        }
    }

    // The server may ask us things mid-call; we serve none of them but ping
    void answer_server_request(const protocol::Envelope& request)
    {
        if (request.method == "ping")
        {
            transport_->write_line(protocol::build_result(request.id, json::object()));
            return;
        }

        logger_.debug("Declining server request '" + request.method + "'");
        transport_->write_line(protocol::build_error(request.id, protocol::METHOD_NOT_FOUND,
                                                     "Method not supported: " + request.method));
    }
};

// ============================================================================
// ProtocolClient
// ============================================================================

ProtocolClient::ProtocolClient(const ClientOptions& options)
    : impl_(std::make_unique<Impl>(options))
{
}

ProtocolClient::ProtocolClient(const ClientOptions& options, std::unique_ptr<Transport> transport)
    : impl_(std::make_unique<Impl>(options, std::move(transport)))
{
}

ProtocolClient::~ProtocolClient() = default;

ProtocolClient::ProtocolClient(ProtocolClient&&) noexcept = default;
ProtocolClient& ProtocolClient::operator=(ProtocolClient&&) noexcept = default;

void ProtocolClient::connect()
{
    if (!impl_)
        throw TransportClosedError("Client has been moved from");
    impl_->connect();
}

json ProtocolClient::call(const std::string& method, const json& params)
{
    if (!impl_)
        throw TransportClosedError("Client has been moved from");
    return impl_->call(method, params);
}

void ProtocolClient::notify(const std::string& method, const json& params)
{
    if (!impl_)
        throw TransportClosedError("Client has been moved from");
    impl_->notify(method, params);
}

json ProtocolClient::list_tools()
{
    return call("tools/list", json::object());
}

json ProtocolClient::call_tool(const std::string& name, const json& arguments)
{
    return call("tools/call", json{{"name", name},
                                   {"arguments", arguments.is_null() ? json::object() : arguments}});
}

void ProtocolClient::close()
{
    if (impl_)
        impl_->close();
}

ConnectionState ProtocolClient::state() const
{
    return impl_ ? impl_->state_.load() : ConnectionState::Closed;
}

bool ProtocolClient::is_ready() const
{
    return state() == ConnectionState::Ready;
}

std::optional<json> ProtocolClient::server_info() const
{
    if (!impl_)
        return std::nullopt;
    std::lock_guard<std::mutex> lock(impl_->info_mutex_);
    return impl_->server_info_;
}

long ProtocolClient::get_pid() const
{
    return impl_ && impl_->transport_ ? impl_->transport_->get_pid() : 0;
}

std::vector<std::string> ProtocolClient::recent_stderr() const
{
    if (!impl_ || !impl_->transport_)
        return {};
    return impl_->transport_->recent_stderr();
}

const ClientOptions& ProtocolClient::options() const
{
    // A moved-from client reports defaults, like its other accessors
    static const ClientOptions defaults;
    return impl_ ? impl_->options_ : defaults;
}

} // namespace toolbridge
