/*
 * Client Registry
 *
 * Synchronized set of connected viewers. The WebSocket thread adds and
 * removes, the capture thread and pipeline workers snapshot and prune.
 */

#ifndef STREAM_CLIENT_REGISTRY_H
#define STREAM_CLIENT_REGISTRY_H

#include "client_connection.h"
#include <mutex>
#include <set>
#include <vector>

namespace stream {

class ClientRegistry {
public:
    // Returns false if the connection was already registered
    bool add(const ClientConnectionPtr& conn);

    // Returns false if the connection was not registered
    bool remove(const ClientConnectionPtr& conn);

    bool contains(const ClientConnectionPtr& conn) const;

    // Point-in-time copy, safe to iterate without holding the lock
    std::vector<ClientConnectionPtr> snapshot() const;

    size_t size() const;
    bool empty() const;

private:
    mutable std::mutex mutex_;
    std::set<ClientConnectionPtr> clients_;
};

} // namespace stream

#endif // STREAM_CLIENT_REGISTRY_H
