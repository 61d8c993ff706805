// SignalingMessage.cpp: JSON codec for the WebSocket signaling protocol
#include "websink/SignalingMessage.hpp"
#include "websink/Errors.hpp"

#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace websink {

namespace {

[[noreturn]] void protocolError(const std::string& what, const std::string& sessionId = {}) {
    throw SignalingError(ErrorKind::SignalingProtocolError, what, sessionId);
}

std::string requireString(const json& j, const char* key, const std::string& sessionId) {
    if (!j.contains(key) || !j[key].is_string()) {
        protocolError(std::string("missing or invalid \"") + key + "\"", sessionId);
    }
    return j[key].get<std::string>();
}

// Optional string that may also be null
std::string optionalString(const json& j, const char* key) {
    if (!j.contains(key) || j[key].is_null()) return {};
    if (!j[key].is_string()) protocolError(std::string("\"") + key + "\" must be a string");
    return j[key].get<std::string>();
}

} // namespace

const char* toString(SignalType type) {
    switch (type) {
        case SignalType::Offer: return "offer";
        case SignalType::Answer: return "answer";
        case SignalType::IceCandidate: return "ice-candidate";
        case SignalType::Error: return "error";
    }
    return "unknown";
}

SignalingMessage parseSignalingMessage(const std::string& text) {
    json j;
    try {
        j = json::parse(text);
    } catch (const json::parse_error& e) {
        protocolError(std::string("malformed JSON: ") + e.what());
    }
    if (!j.is_object()) protocolError("message must be a JSON object");

    SignalingMessage msg;
    msg.sessionId = optionalString(j, "sessionId");
    const std::string type = requireString(j, "type", msg.sessionId);

    if (type == "answer") {
        msg.type = SignalType::Answer;
        if (msg.sessionId.empty()) protocolError("answer without sessionId");
        msg.sdp = requireString(j, "sdp", msg.sessionId);
    } else if (type == "ice-candidate" || type == "candidate") {
        msg.type = SignalType::IceCandidate;
        if (msg.sessionId.empty()) protocolError("ice-candidate without sessionId");
        if (!j.contains("candidate")) protocolError("missing \"candidate\"", msg.sessionId);

        const auto& c = j["candidate"];
        msg.sdpMid = optionalString(j, "sdpMid");
        if (c.is_string()) {
            msg.candidate = c.get<std::string>();
        } else if (c.is_object()) {
            // RTCIceCandidateInit as produced by the browser
            msg.candidate = optionalString(c, "candidate");
            std::string mid = optionalString(c, "sdpMid");
            if (!mid.empty()) msg.sdpMid = mid;
        } else if (!c.is_null()) {
            protocolError("\"candidate\" must be a string or an object", msg.sessionId);
        }
    } else if (type == "offer") {
        msg.type = SignalType::Offer;
        msg.sdp = optionalString(j, "sdp");
    } else if (type == "error") {
        msg.type = SignalType::Error;
        msg.message = optionalString(j, "message");
    } else {
        protocolError("unsupported message type: " + type, msg.sessionId);
    }
    return msg;
}

std::string encodeOffer(const std::string& sessionId, const std::string& sdp) {
    json j = {
        {"type", "offer"},
        {"sessionId", sessionId},
        {"sdp", sdp}
    };
    return j.dump();
}

std::string encodeIceCandidate(const std::string& sessionId, const std::string& candidate, const std::string& sdpMid) {
    json j = {
        {"type", "ice-candidate"},
        {"sessionId", sessionId},
        {"candidate", candidate},
        {"sdpMid", sdpMid}
    };
    return j.dump();
}

std::string encodeError(const std::string& sessionId, const std::string& message) {
    json j = {
        {"type", "error"},
        {"message", message}
    };
    if (!sessionId.empty()) j["sessionId"] = sessionId;
    return j.dump();
}

} // namespace websink
