/*
 * Frame Broadcaster
 *
 * Serializes a frame once and fans the message out to every registered
 * viewer. A client whose send fails is removed from the registry after
 * the fan-out; it never holds up delivery to the others.
 */

#ifndef STREAM_BROADCASTER_H
#define STREAM_BROADCASTER_H

#include "client_registry.h"
#include "frame.h"
#include <atomic>
#include <cstdint>
#include <string>

namespace stream {

class Broadcaster {
public:
    explicit Broadcaster(ClientRegistry& registry, bool debug_frames = false);

    /**
     * Send a frame to every registered client
     * @return Number of clients the message was delivered to
     */
    size_t broadcast(const Frame& frame);

    // Fan out an already serialized message with the same pruning rules
    size_t broadcast_text(const std::string& message);

    struct Stats {
        uint64_t broadcasts;
        uint64_t serializations;
        uint64_t send_attempts;
        uint64_t send_failures;
        uint64_t clients_pruned;
    };
    Stats get_stats() const;

private:
    ClientRegistry& registry_;
    bool debug_frames_;

    std::atomic<uint64_t> broadcasts_{0};
    std::atomic<uint64_t> serializations_{0};
    std::atomic<uint64_t> send_attempts_{0};
    std::atomic<uint64_t> send_failures_{0};
    std::atomic<uint64_t> clients_pruned_{0};
};

} // namespace stream

#endif // STREAM_BROADCASTER_H
