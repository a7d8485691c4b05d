#include <toolbridge/errors.hpp>

namespace toolbridge
{

std::string to_string(ErrorKind kind)
{
    switch (kind)
    {
    case ErrorKind::ProcessSpawnError:
        return "ProcessSpawnError";
    case ErrorKind::TransportClosed:
        return "TransportClosed";
    case ErrorKind::NotConnected:
        return "NotConnected";
    case ErrorKind::HandshakeRejected:
        return "HandshakeRejected";
    case ErrorKind::NoResponse:
        return "NoResponse";
    case ErrorKind::MaxAttemptsExceeded:
        return "MaxAttemptsExceeded";
    case ErrorKind::ReadTimeout:
        return "ReadTimeout";
    case ErrorKind::ServerError:
        return "ServerError";
    case ErrorKind::MalformedResponse:
        return "MalformedResponse";
    case ErrorKind::ToolNotFound:
        return "ToolNotFound";
    case ErrorKind::ValidationError:
        return "ValidationError";
    case ErrorKind::Configuration:
        return "Configuration";
    }
    return "Unknown";
}

} // namespace toolbridge
