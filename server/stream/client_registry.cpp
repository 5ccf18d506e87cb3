/*
 * Client Registry Implementation
 */

#include "client_registry.h"

namespace stream {

bool ClientRegistry::add(const ClientConnectionPtr& conn) {
    if (!conn) return false;
    std::lock_guard<std::mutex> lock(mutex_);
    return clients_.insert(conn).second;
}

bool ClientRegistry::remove(const ClientConnectionPtr& conn) {
    std::lock_guard<std::mutex> lock(mutex_);
    return clients_.erase(conn) > 0;
}

bool ClientRegistry::contains(const ClientConnectionPtr& conn) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return clients_.count(conn) > 0;
}

std::vector<ClientConnectionPtr> ClientRegistry::snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return std::vector<ClientConnectionPtr>(clients_.begin(), clients_.end());
}

size_t ClientRegistry::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return clients_.size();
}

bool ClientRegistry::empty() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return clients_.empty();
}

} // namespace stream
