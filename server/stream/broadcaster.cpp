/*
 * Frame Broadcaster Implementation
 */

#include "broadcaster.h"
#include "protocol.h"
#include <cstdio>
#include <vector>

namespace stream {

Broadcaster::Broadcaster(ClientRegistry& registry, bool debug_frames)
    : registry_(registry)
    , debug_frames_(debug_frames)
{
}

size_t Broadcaster::broadcast(const Frame& frame) {
    std::string message = make_frame_message(frame);
    serializations_++;

    if (debug_frames_) {
        fprintf(stderr, "Broadcast: Frame %dx%d, %zu image bytes, %zu message bytes\n",
                frame.width, frame.height, frame.image.size(), message.size());
    }

    return broadcast_text(message);
}

size_t Broadcaster::broadcast_text(const std::string& message) {
    broadcasts_++;

    std::vector<ClientConnectionPtr> clients = registry_.snapshot();
    std::vector<ClientConnectionPtr> stale;
    size_t delivered = 0;

    for (const auto& client : clients) {
        send_attempts_++;
        bool ok = false;
        try {
            ok = client->send_text(message);
        } catch (const std::exception& e) {
            fprintf(stderr, "Broadcast: Send to %s threw: %s\n", client->id().c_str(), e.what());
        }

        if (ok) {
            delivered++;
        } else {
            send_failures_++;
            stale.push_back(client);
        }
    }

    // Prune after the loop, never while walking the registry
    for (const auto& client : stale) {
        if (registry_.remove(client)) {
            clients_pruned_++;
            fprintf(stderr, "Broadcast: Dropping client %s (send failed), %zu remaining\n",
                    client->id().c_str(), registry_.size());
        }
        client->close();
    }

    return delivered;
}

Broadcaster::Stats Broadcaster::get_stats() const {
    Stats stats;
    stats.broadcasts = broadcasts_.load();
    stats.serializations = serializations_.load();
    stats.send_attempts = send_attempts_.load();
    stats.send_failures = send_failures_.load();
    stats.clients_pruned = clients_pruned_.load();
    return stats;
}

} // namespace stream
