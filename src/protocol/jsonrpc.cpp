#include <toolbridge/protocol/jsonrpc.hpp>

namespace toolbridge
{
namespace protocol
{

bool Envelope::answers(std::int64_t request_id) const
{
    if (!is_response())
        return false;

    if (id.is_number_integer())
        return id.get<std::int64_t>() == request_id;

    // Some servers echo ids back as strings
    if (id.is_string())
        return id.get<std::string>() == std::to_string(request_id);

    return false;
}

std::string build_request(std::int64_t id, const std::string& method, const json& params)
{
    json msg = {{"jsonrpc", JSONRPC_VERSION},
                {"id", id},
                {"method", method},
                {"params", params.is_null() ? json::object() : params}};
    return msg.dump();
}

std::string build_notification(const std::string& method, const json& params)
{
    json msg = {{"jsonrpc", JSONRPC_VERSION}, {"method", method}};
    if (!params.is_null())
        msg["params"] = params;
    return msg.dump();
}

std::string build_result(const json& id, const json& result)
{
    return json{{"jsonrpc", JSONRPC_VERSION}, {"id", id}, {"result", result}}.dump();
}

std::string build_error(const json& id, int code, const std::string& message)
{
    return json{{"jsonrpc", JSONRPC_VERSION},
                {"id", id},
                {"error", {{"code", code}, {"message", message}}}}
        .dump();
}

std::optional<Envelope> parse_envelope(const std::string& line)
{
    if (line.empty())
        return std::nullopt;

    json j = json::parse(line, nullptr, /*allow_exceptions=*/false);
    if (j.is_discarded() || !j.is_object())
        return std::nullopt;

    auto tag = j.find("jsonrpc");
    if (tag != j.end() && (!tag->is_string() || tag->get<std::string>() != JSONRPC_VERSION))
        return std::nullopt;

    Envelope envelope;
    envelope.id = j.value("id", json());

    if (j.contains("result"))
    {
        envelope.kind = Envelope::Kind::Result;
        envelope.result = j["result"];
        return envelope;
    }

    if (j.contains("error"))
    {
        envelope.kind = Envelope::Kind::Error;
        envelope.error = j["error"];
        return envelope;
    }

    auto method = j.find("method");
    if (method != j.end() && method->is_string())
    {
        envelope.kind = envelope.id.is_null() ? Envelope::Kind::Notification
                                              : Envelope::Kind::Request;
        envelope.method = method->get<std::string>();
        envelope.params = j.value("params", json());
        return envelope;
    }

    return std::nullopt;
}

std::string describe_error(const json& error)
{
    if (error.is_object())
    {
        std::string message;
        auto it = error.find("message");
        if (it != error.end() && it->is_string())
            message = it->get<std::string>();
        if (message.empty())
            message = error.dump();
        if (error.contains("code") && error["code"].is_number_integer())
            message += " (code " + std::to_string(error["code"].get<int>()) + ")";
        return message;
    }

    if (error.is_string())
        return error.get<std::string>();

    return error.dump();
}

} // namespace protocol
} // namespace toolbridge
