// Implementation for EventBus
#include "websink/EventBus.hpp"

namespace websink {

EventBus& EventBus::instance() {
    static EventBus bus;
    return bus;
}

EventBus::Token EventBus::subscribe(const std::string& channel, Callback cb) {
    std::lock_guard<std::mutex> lock(mutex_);
    Token token = nextToken_++;
    subscribers_[channel].push_back({token, std::move(cb)});
    return token;
}

void EventBus::unsubscribe(Token token) {
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto it = subscribers_.begin(); it != subscribers_.end(); ++it) {
        auto& subs = it->second;
        for (auto sub = subs.begin(); sub != subs.end(); ++sub) {
            if (sub->token == token) {
                subs.erase(sub);
                if (subs.empty()) subscribers_.erase(it);
                return;
            }
        }
    }
}

void EventBus::publish(const std::string& channel, const std::string& message) {
    std::vector<Callback> toCall;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = subscribers_.find(channel);
        if (it != subscribers_.end()) {
            for (const auto& sub : it->second) toCall.push_back(sub.cb);
        }
    }
    for (auto& cb : toCall) {
        cb(message);
    }
}

} // namespace websink
