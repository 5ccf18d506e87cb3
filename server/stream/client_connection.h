/*
 * Client Connection
 *
 * One viewer's duplex channel as seen by the streaming core. send_text()
 * must not block on the network: implementations queue and return.
 */

#ifndef STREAM_CLIENT_CONNECTION_H
#define STREAM_CLIENT_CONNECTION_H

#include <memory>
#include <string>

namespace stream {

class ClientConnection {
public:
    virtual ~ClientConnection() = default;

    virtual const std::string& id() const = 0;

    /**
     * Queue a text message for delivery
     * @return false if the connection is closed or cannot accept more data
     */
    virtual bool send_text(const std::string& message) = 0;

    // Ask the transport to drop the connection
    virtual void close() = 0;
};

using ClientConnectionPtr = std::shared_ptr<ClientConnection>;

} // namespace stream

#endif // STREAM_CLIENT_CONNECTION_H
