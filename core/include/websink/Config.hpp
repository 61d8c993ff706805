#pragma once

#include <cstdint>
#include <string>
#include <vector>
#include "websink_plugin.h"

namespace websink {

struct IceServerConfig {
    std::string url;
    std::string username;
    std::string credential;
};

// Settings for one WebSink instance, parsed from the output plugin's JSON config
struct WebSinkConfig {
    std::string bind_address = "0.0.0.0";
    uint16_t ws_port = 8081;

    std::vector<IceServerConfig> ice_servers;
    std::string stun_server = "stun:stun.l.google.com:19302";
    uint16_t ice_port_begin = 0;
    uint16_t ice_port_end = 0;

    int max_clients = 10;                 // 0 = unlimited
    int negotiation_timeout_ms = 10000;
    int sweep_interval_ms = 500;

    size_t mtu = 1200;
    uint8_t payload_type = 96;
    std::string h264_fmtp = "profile-level-id=42e01f;packetization-mode=1;level-asymmetry-allowed=1";

    size_t outbound_queue_frames = 8;
    int max_consecutive_drops = 150;      // 0 disables stall eviction
    int keyframe_request_interval_ms = 1000;
    int writer_join_timeout_ms = 1000;

    bool inject_parameter_sets = true;

    websink_log_level_t log_level = WEBSINK_LOG_INFO;
    std::vector<uint32_t> stream_filter;  // empty = accept every stream

    // ICE servers to hand to the peer transport, STUN fallback applied
    std::vector<IceServerConfig> effectiveIceServers() const;
};

// Parse a JSON object; missing keys keep their defaults. Throws ConfigError.
WebSinkConfig parseConfig(const std::string& json_cfg);

} // namespace websink
