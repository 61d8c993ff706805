#pragma once

#include <string>

namespace websink {

enum class SignalType {
    Offer,
    Answer,
    IceCandidate,
    Error
};

const char* toString(SignalType type);

// One JSON text frame on the signaling channel
struct SignalingMessage {
    SignalType type = SignalType::Error;
    std::string sessionId;
    std::string sdp;          // offer, answer
    std::string candidate;    // ice-candidate; empty means end of candidates
    std::string sdpMid;       // ice-candidate
    std::string message;      // error
};

// Parses a client message. Throws SignalingError (SignalingProtocolError) for
// malformed JSON, a missing or unsupported "type", or missing required fields.
SignalingMessage parseSignalingMessage(const std::string& text);

std::string encodeOffer(const std::string& sessionId, const std::string& sdp);
std::string encodeIceCandidate(const std::string& sessionId, const std::string& candidate, const std::string& sdpMid);
// sessionId is omitted from the message when empty
std::string encodeError(const std::string& sessionId, const std::string& message);

} // namespace websink
