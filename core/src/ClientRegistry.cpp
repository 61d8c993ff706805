#include "websink/ClientRegistry.hpp"

#include <mutex>

namespace websink {

bool ClientRegistry::add(const std::shared_ptr<ClientSession>& session) {
    if (!session) return false;
    std::unique_lock<std::shared_mutex> lock(mutex_);
    return sessions_.emplace(session->id(), session).second;
}

std::shared_ptr<ClientSession> ClientRegistry::remove(const std::string& id) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    auto it = sessions_.find(id);
    if (it == sessions_.end()) return nullptr;
    auto session = std::move(it->second);
    sessions_.erase(it);
    return session;
}

bool ClientRegistry::remove(const std::shared_ptr<ClientSession>& session) {
    if (!session) return false;
    std::unique_lock<std::shared_mutex> lock(mutex_);
    auto it = sessions_.find(session->id());
    if (it == sessions_.end() || it->second != session) return false;
    sessions_.erase(it);
    return true;
}

std::shared_ptr<ClientSession> ClientRegistry::find(const std::string& id) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    auto it = sessions_.find(id);
    return it == sessions_.end() ? nullptr : it->second;
}

std::vector<std::shared_ptr<ClientSession>> ClientRegistry::snapshot() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    std::vector<std::shared_ptr<ClientSession>> out;
    out.reserve(sessions_.size());
    for (const auto& [id, session] : sessions_) {
        out.push_back(session);
    }
    return out;
}

size_t ClientRegistry::size() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return sessions_.size();
}

void ClientRegistry::closeAll(const std::string& reason) {
    for (auto& session : snapshot()) {
        session->close(reason);
        remove(session);
    }
}

} // namespace websink
