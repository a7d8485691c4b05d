#ifndef TOOLBRIDGE_PROTOCOL_JSONRPC_HPP
#define TOOLBRIDGE_PROTOCOL_JSONRPC_HPP

#include <cstdint>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>

namespace toolbridge
{

// Also declared in types.hpp; repeated so this header stands alone
using json = nlohmann::ordered_json;

namespace protocol
{

constexpr const char* JSONRPC_VERSION = "2.0";

// One decoded line of wire data
struct Envelope
{
    enum class Kind
    {
        Request,      // method + id, expects a reply
        Notification, // method, no id
        Result,       // reply carrying `result`
        Error,        // reply carrying `error`
    };

    Kind kind = Kind::Notification;
    json id;            // null when absent
    std::string method; // Request / Notification only
    json params;        // Request / Notification only, null when absent
    json result;        // Result only
    json error;         // Error only

    bool is_response() const
    {
        return kind == Kind::Result || kind == Kind::Error;
    }

    // True when this reply answers the request with the given id
    bool answers(std::int64_t request_id) const;
};

// Serialize a request envelope (no trailing newline)
std::string build_request(std::int64_t id, const std::string& method, const json& params);

// Serialize a notification envelope; params omitted when null
std::string build_notification(const std::string& method, const json& params = nullptr);

// Serialize replies to requests the server sends us
std::string build_result(const json& id, const json& result);
std::string build_error(const json& id, int code, const std::string& message);

// Standard error codes
constexpr int METHOD_NOT_FOUND = -32601;

// Decode one line. Returns std::nullopt for anything that is not a
// well-formed envelope: non-JSON noise, empty lines, non-objects, a wrong
// protocol tag, or objects with none of result/error/method.
std::optional<Envelope> parse_envelope(const std::string& line);

// Human readable summary of an `error` payload: "<message> (code <n>)"
std::string describe_error(const json& error);

} // namespace protocol
} // namespace toolbridge

#endif // TOOLBRIDGE_PROTOCOL_JSONRPC_HPP
