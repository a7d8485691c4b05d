#ifndef TOOLBRIDGE_ERRORS_HPP
#define TOOLBRIDGE_ERRORS_HPP

#include <memory>
#include <nlohmann/json.hpp>
#include <stdexcept>
#include <string>

namespace toolbridge
{

// Order-preserving so schemas keep the server's parameter order
using json = nlohmann::ordered_json;

enum class ErrorKind
{
    ProcessSpawnError,
    TransportClosed,
    NotConnected,
    HandshakeRejected,
    NoResponse,
    MaxAttemptsExceeded,
    ReadTimeout,
    ServerError,
    MalformedResponse,
    ToolNotFound,
    ValidationError,
    Configuration,
};

std::string to_string(ErrorKind kind);

// Base exception
class ToolbridgeError : public std::runtime_error
{
  public:
    ToolbridgeError(ErrorKind kind, const std::string& message)
        : std::runtime_error(message), kind_(kind)
    {
    }

    ErrorKind kind() const
    {
        return kind_;
    }

  private:
    ErrorKind kind_;
};

// Executable missing or exec failed
class ProcessSpawnError : public ToolbridgeError
{
  public:
    explicit ProcessSpawnError(const std::string& message)
        : ToolbridgeError(ErrorKind::ProcessSpawnError, message)
    {
    }
};

// Write after the child exited, or use after close()
class TransportClosedError : public ToolbridgeError
{
  public:
    explicit TransportClosedError(const std::string& message)
        : ToolbridgeError(ErrorKind::TransportClosed, message)
    {
    }
};

// call() before the handshake completed
class NotConnectedError : public ToolbridgeError
{
  public:
    explicit NotConnectedError(const std::string& message)
        : ToolbridgeError(ErrorKind::NotConnected, message)
    {
    }
};

class ReadTimeoutError : public ToolbridgeError
{
  public:
    explicit ReadTimeoutError(const std::string& message)
        : ToolbridgeError(ErrorKind::ReadTimeout, message)
    {
    }
};

class ConfigurationError : public ToolbridgeError
{
  public:
    explicit ConfigurationError(const std::string& message)
        : ToolbridgeError(ErrorKind::Configuration, message)
    {
    }
};

// Base for failures observed on the wire. May carry the offending payload.
class ProtocolError : public ToolbridgeError
{
  public:
    ProtocolError(ErrorKind kind, const std::string& message) : ToolbridgeError(kind, message) {}

    ProtocolError(ErrorKind kind, const std::string& message, const json& data)
        : ToolbridgeError(kind, message), data_(std::make_shared<json>(data))
    {
    }

    // Get the optional data associated with the error
    const json* data() const
    {
        return data_.get();
    }

  private:
    std::shared_ptr<json> data_;
};

class HandshakeRejectedError : public ProtocolError
{
  public:
    HandshakeRejectedError(const std::string& message, const json& error)
        : ProtocolError(ErrorKind::HandshakeRejected, message, error)
    {
    }
};

class NoResponseError : public ProtocolError
{
  public:
    explicit NoResponseError(const std::string& message)
        : ProtocolError(ErrorKind::NoResponse, message)
    {
    }
};

class MaxAttemptsExceededError : public ProtocolError
{
  public:
    MaxAttemptsExceededError(const std::string& message, int attempts)
        : ProtocolError(ErrorKind::MaxAttemptsExceeded, message), attempts_(attempts)
    {
    }

    int attempts() const
    {
        return attempts_;
    }

  private:
    int attempts_;
};

// Server answered with an `error` envelope
class ServerError : public ProtocolError
{
  public:
    ServerError(const std::string& message, const json& error)
        : ProtocolError(ErrorKind::ServerError, message, error),
          code_(error.is_object() && error.contains("code") && error["code"].is_number_integer()
                    ? error["code"].get<int>()
                    : 0)
    {
    }

    int code() const
    {
        return code_;
    }

  private:
    int code_;
};

class MalformedResponseError : public ProtocolError
{
  public:
    MalformedResponseError(const std::string& message, const json& data)
        : ProtocolError(ErrorKind::MalformedResponse, message, data)
    {
    }
};

class ToolNotFoundError : public ToolbridgeError
{
  public:
    explicit ToolNotFoundError(const std::string& message)
        : ToolbridgeError(ErrorKind::ToolNotFound, message)
    {
    }
};

class ValidationError : public ToolbridgeError
{
  public:
    ValidationError(const std::string& message, std::string parameter = {})
        : ToolbridgeError(ErrorKind::ValidationError, message), parameter_(std::move(parameter))
    {
    }

    // Name of the offending parameter, empty when not tied to one
    const std::string& parameter() const
    {
        return parameter_;
    }

  private:
    std::string parameter_;
};

} // namespace toolbridge

#endif // TOOLBRIDGE_ERRORS_HPP
