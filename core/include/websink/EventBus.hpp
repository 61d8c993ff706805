#pragma once

#include <cstdint>
#include <functional>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace websink {

// Thread-safe in-process publish/subscribe bus
class EventBus {
public:
    using Callback = std::function<void(const std::string&)>;
    using Token = uint64_t;

    // Get singleton instance
    static EventBus& instance();

    // Subscribe a callback to a channel; the token undoes it
    Token subscribe(const std::string& channel, Callback cb);
    void unsubscribe(Token token);

    // Callbacks run on the publishing thread, outside the bus lock
    void publish(const std::string& channel, const std::string& message);

private:
    EventBus() = default;
    ~EventBus() = default;
    EventBus(const EventBus&) = delete;
    EventBus& operator=(const EventBus&) = delete;

    struct Subscriber {
        Token token;
        Callback cb;
    };

    std::unordered_map<std::string, std::vector<Subscriber>> subscribers_;
    Token nextToken_ = 1;
    std::mutex mutex_;
};

} // namespace websink
