// Config.cpp: WebSinkConfig from a plugin JSON config
#include "websink/Config.hpp"
#include "websink/Errors.hpp"
#include "websink/Log.hpp"

#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace websink {

namespace {

template <typename T>
T rangedInt(const json& j, const char* key, T def, long long lo, long long hi) {
    if (!j.contains(key)) return def;
    const auto& v = j[key];
    if (!v.is_number_integer()) {
        throw ConfigError(std::string("\"") + key + "\" must be an integer");
    }
    long long n = v.get<long long>();
    if (n < lo || n > hi) {
        throw ConfigError(std::string("\"") + key + "\" out of range: " + std::to_string(n));
    }
    return static_cast<T>(n);
}

std::string stringValue(const json& j, const char* key, const std::string& def) {
    if (!j.contains(key)) return def;
    if (!j[key].is_string()) {
        throw ConfigError(std::string("\"") + key + "\" must be a string");
    }
    return j[key].get<std::string>();
}

bool boolValue(const json& j, const char* key, bool def) {
    if (!j.contains(key)) return def;
    if (!j[key].is_boolean()) {
        throw ConfigError(std::string("\"") + key + "\" must be a boolean");
    }
    return j[key].get<bool>();
}

void parseIceServers(const json& arr, std::vector<IceServerConfig>& out) {
    if (!arr.is_array()) {
        throw ConfigError("\"ice_servers\" must be an array");
    }
    for (const auto& server : arr) {
        if (server.is_string()) {
            out.push_back({server.get<std::string>(), {}, {}});
            continue;
        }
        if (!server.is_object() || !server.contains("urls")) {
            throw ConfigError("ICE server entries need \"urls\"");
        }
        std::string username = server.value("username", "");
        std::string credential = server.value("credential", "");
        const auto& urls = server["urls"];
        if (urls.is_string()) {
            out.push_back({urls.get<std::string>(), username, credential});
        } else if (urls.is_array()) {
            for (const auto& url : urls) {
                if (!url.is_string()) throw ConfigError("ICE server url must be a string");
                out.push_back({url.get<std::string>(), username, credential});
            }
        } else {
            throw ConfigError("\"urls\" must be a string or an array");
        }
    }
}

} // namespace

std::vector<IceServerConfig> WebSinkConfig::effectiveIceServers() const {
    if (!ice_servers.empty() || stun_server.empty()) return ice_servers;
    return {IceServerConfig{stun_server, {}, {}}};
}

WebSinkConfig parseConfig(const std::string& json_cfg) {
    json j;
    try {
        j = json::parse(json_cfg.empty() ? std::string("{}") : json_cfg);
    } catch (const json::parse_error& e) {
        throw ConfigError(std::string("invalid JSON: ") + e.what());
    }
    if (!j.is_object()) {
        throw ConfigError("config root must be an object");
    }

    WebSinkConfig cfg;
    try {
        cfg.bind_address = stringValue(j, "bind_address", cfg.bind_address);
        // "port" is the older spelling
        cfg.ws_port = rangedInt<uint16_t>(j, "port", cfg.ws_port, 1, 65535);
        cfg.ws_port = rangedInt<uint16_t>(j, "ws_port", cfg.ws_port, 1, 65535);

        if (j.contains("ice_servers")) {
            // Legacy form: the whole list as a JSON string
            if (j["ice_servers"].is_string()) {
                const auto& raw = j["ice_servers"].get_ref<const std::string&>();
                if (!raw.empty()) parseIceServers(json::parse(raw), cfg.ice_servers);
            } else {
                parseIceServers(j["ice_servers"], cfg.ice_servers);
            }
        }
        cfg.stun_server = stringValue(j, "stun_server", cfg.stun_server);

        if (j.contains("ice_port_range")) {
            const auto& r = j["ice_port_range"];
            if (!r.is_array() || r.size() != 2 || !r[0].is_number_unsigned() || !r[1].is_number_unsigned()) {
                throw ConfigError("\"ice_port_range\" must be [begin, end]");
            }
            unsigned begin = r[0].get<unsigned>();
            unsigned end = r[1].get<unsigned>();
            if (begin > 65535 || end > 65535 || begin > end) {
                throw ConfigError("\"ice_port_range\" is not a valid port range");
            }
            cfg.ice_port_begin = static_cast<uint16_t>(begin);
            cfg.ice_port_end = static_cast<uint16_t>(end);
        }

        cfg.max_clients = rangedInt<int>(j, "max_clients", cfg.max_clients, 0, 100000);
        cfg.negotiation_timeout_ms = rangedInt<int>(j, "negotiation_timeout_ms", cfg.negotiation_timeout_ms, 1, 600000);
        cfg.sweep_interval_ms = rangedInt<int>(j, "sweep_interval_ms", cfg.sweep_interval_ms, 1, 60000);
        cfg.mtu = rangedInt<size_t>(j, "mtu", cfg.mtu, 200, 1500);
        cfg.payload_type = rangedInt<uint8_t>(j, "payload_type", cfg.payload_type, 96, 127);
        cfg.h264_fmtp = stringValue(j, "h264_fmtp", cfg.h264_fmtp);
        cfg.outbound_queue_frames = rangedInt<size_t>(j, "outbound_queue_frames", cfg.outbound_queue_frames, 1, 1024);
        cfg.max_consecutive_drops = rangedInt<int>(j, "max_consecutive_drops", cfg.max_consecutive_drops, 0, 1000000);
        cfg.keyframe_request_interval_ms =
            rangedInt<int>(j, "keyframe_request_interval_ms", cfg.keyframe_request_interval_ms, 0, 600000);
        cfg.writer_join_timeout_ms =
            rangedInt<int>(j, "writer_join_timeout_ms", cfg.writer_join_timeout_ms, 0, 60000);
        cfg.inject_parameter_sets = boolValue(j, "inject_parameter_sets", cfg.inject_parameter_sets);

        if (j.contains("log_level")) {
            try {
                cfg.log_level = parseLogLevel(stringValue(j, "log_level", "info"));
            } catch (const std::invalid_argument& e) {
                throw ConfigError(e.what());
            }
        }

        if (j.contains("stream_filter")) {
            const auto& filter = j["stream_filter"];
            if (!filter.is_array()) throw ConfigError("\"stream_filter\" must be an array");
            for (const auto& sid : filter) {
                if (!sid.is_number_unsigned()) throw ConfigError("\"stream_filter\" entries must be stream ids");
                cfg.stream_filter.push_back(sid.get<uint32_t>());
            }
        }
    } catch (const json::exception& e) {
        throw ConfigError(std::string("invalid config: ") + e.what());
    }
    return cfg;
}

} // namespace websink
