#pragma once

#include <memory>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>
#include "websink/ClientSession.hpp"

namespace websink {

// Active sessions keyed by id. Readers (the broadcast path) take a snapshot
// and never hold the lock while touching a session.
class ClientRegistry {
public:
    // False if a session with the same id is already registered
    bool add(const std::shared_ptr<ClientSession>& session);

    // Removes and returns the session, or nullptr
    std::shared_ptr<ClientSession> remove(const std::string& id);

    // Removes only if `session` is still the registered instance
    bool remove(const std::shared_ptr<ClientSession>& session);

    std::shared_ptr<ClientSession> find(const std::string& id) const;
    std::vector<std::shared_ptr<ClientSession>> snapshot() const;
    size_t size() const;

    // Close and remove every registered session
    void closeAll(const std::string& reason);

private:
    mutable std::shared_mutex mutex_;
    std::unordered_map<std::string, std::shared_ptr<ClientSession>> sessions_;
};

} // namespace websink
