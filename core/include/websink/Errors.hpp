#pragma once

#include <stdexcept>
#include <string>

namespace websink {

// Per-session failure categories; none of them escalate beyond the session
enum class ErrorKind {
    IngestOverload,
    SignalingProtocolError,
    NegotiationTimeout,
    NegotiationFailed,
    TransportClosed
};

const char* toString(ErrorKind kind);

// Malformed or out-of-order signaling; reported back to the originating client
class SignalingError : public std::runtime_error {
public:
    SignalingError(ErrorKind kind, const std::string& what, std::string sessionId = {})
        : std::runtime_error(what), kind_(kind), sessionId_(std::move(sessionId)) {}

    ErrorKind kind() const { return kind_; }
    const std::string& sessionId() const { return sessionId_; }

private:
    ErrorKind kind_;
    std::string sessionId_;
};

// Invalid configuration value or type
class ConfigError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

} // namespace websink
