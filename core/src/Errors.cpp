#include "websink/Errors.hpp"

namespace websink {

const char* toString(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::IngestOverload: return "IngestOverload";
        case ErrorKind::SignalingProtocolError: return "SignalingProtocolError";
        case ErrorKind::NegotiationTimeout: return "NegotiationTimeout";
        case ErrorKind::NegotiationFailed: return "NegotiationFailed";
        case ErrorKind::TransportClosed: return "TransportClosed";
    }
    return "Unknown";
}

} // namespace websink
