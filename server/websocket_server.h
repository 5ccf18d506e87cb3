/*
 * WebSocket Server for Browser Streaming
 *
 * One libwebsockets context serves the viewer page over HTTP and the
 * JSON frame/event protocol over WebSocket on the same port. All socket
 * work happens on the service thread; other threads only queue text
 * and wake it with lws_cancel_service().
 */

#ifndef WEBSOCKET_SERVER_H
#define WEBSOCKET_SERVER_H

#include "stream/client_connection.h"
#include <libwebsockets.h>
#include <atomic>
#include <cstdint>
#include <deque>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

namespace ws {

/**
 * One viewer's socket
 *
 * send_text() may be called from any thread. The message is queued and
 * written on the next writable callback. A full queue or a closed socket
 * makes send_text() fail so the broadcaster can drop the viewer.
 */
class WebSocketConnection : public stream::ClientConnection {
public:
    WebSocketConnection(struct lws_context* context, struct lws* wsi,
                        const std::string& id, size_t backlog);

    const std::string& id() const override { return id_; }
    bool send_text(const std::string& text) override;
    void close() override;

    // Service thread only
    struct lws* wsi() const { return wsi_; }
    bool wants_write();
    bool close_requested() const { return close_requested_; }
    bool pop_message(std::string& out, bool& more);
    void mark_closed();
    std::string& rx_buffer() { return rx_buffer_; }

private:
    struct lws_context* context_;
    struct lws* wsi_;
    std::string id_;
    size_t backlog_;

    std::mutex queue_mutex_;
    std::deque<std::string> queue_;
    std::atomic<bool> closed_;
    std::atomic<bool> close_requested_;

    std::string rx_buffer_;
};

// Largest client message accepted after fragment reassembly
static const size_t MAX_MESSAGE_SIZE = 1024 * 1024;

/**
 * Append one received fragment to a reassembly buffer
 * @return false if the buffer would grow past limit; the buffer is cleared
 */
bool append_fragment(std::string& buffer, const void* data, size_t len, size_t limit);

// Hooks into the streaming session
struct WebSocketCallbacks {
    std::function<void(const stream::ClientConnectionPtr&)> on_connect;
    std::function<void(const stream::ClientConnectionPtr&, const std::string&)> on_message;
    std::function<void(const stream::ClientConnectionPtr&)> on_disconnect;
};

class WebSocketServer {
public:
    // Static callback wrapper for libwebsockets (must be public for C callback)
    static int callback_wrapper(struct lws* wsi,
                                enum lws_callback_reasons reason,
                                void* user, void* in, size_t len);

    WebSocketServer(int port, const std::string& static_dir, size_t send_backlog);
    ~WebSocketServer();

    WebSocketServer(const WebSocketServer&) = delete;
    WebSocketServer& operator=(const WebSocketServer&) = delete;

    void set_callbacks(const WebSocketCallbacks& cbs) { callbacks_ = cbs; }

    /**
     * Bind the port and start the service thread
     * @return false if the context could not be created (port in use)
     */
    bool start();
    void stop();
    bool is_running() const { return running_; }

    size_t get_client_count();

    struct Stats {
        size_t clients_connected;
        uint64_t connections_total;
        uint64_t messages_received;
        uint64_t messages_sent;
        uint64_t bytes_sent;
    };
    Stats get_stats();

private:
    int handle_callback(struct lws* wsi, enum lws_callback_reasons reason,
                        void* in, size_t len);
    std::shared_ptr<WebSocketConnection> add_client(struct lws* wsi);
    std::shared_ptr<WebSocketConnection> remove_client(struct lws* wsi);
    std::shared_ptr<WebSocketConnection> find_client(struct lws* wsi);
    std::string generate_client_id();
    void request_writes();

    int port_;
    std::string static_dir_;
    size_t send_backlog_;

    struct lws_context* context_;
    struct lws_http_mount mount_;
    std::thread server_thread_;
    std::atomic<bool> running_;

    std::map<struct lws*, std::shared_ptr<WebSocketConnection>> clients_;
    std::mutex clients_mutex_;
    int next_client_;

    WebSocketCallbacks callbacks_;

    std::atomic<uint64_t> connections_total_;
    std::atomic<uint64_t> messages_received_;
    std::atomic<uint64_t> messages_sent_;
    std::atomic<uint64_t> bytes_sent_;
};

} // namespace ws

#endif // WEBSOCKET_SERVER_H
