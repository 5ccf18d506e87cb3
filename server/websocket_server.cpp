/*
 * WebSocket Server Implementation for Browser Streaming
 */

#include "websocket_server.h"
#include <chrono>
#include <cstdio>
#include <cstring>
#include <stdexcept>
#include <vector>

namespace ws {

// Viewers connect without a subprotocol; make ours the vhost default
static const struct lws_protocol_vhost_options pvo_default = {
    nullptr, nullptr, "default", "1"
};
static const struct lws_protocol_vhost_options pvo = {
    nullptr, &pvo_default, "browsercast", ""
};

static struct lws_protocols protocols[] = {
    { "http", lws_callback_http_dummy, 0, 0, 0, nullptr, 0 },
    {
        "browsercast",
        WebSocketServer::callback_wrapper,
        0,
        65536,  // rx buffer size
        0,
        nullptr,
        0
    },
    { nullptr, nullptr, 0, 0, 0, nullptr, 0 }
};

bool append_fragment(std::string& buffer, const void* data, size_t len, size_t limit) {
    if (len > limit || buffer.size() > limit - len) {
        std::string().swap(buffer);
        return false;
    }
    buffer.append(static_cast<const char*>(data), len);
    return true;
}

// ----------------------------------------------------------------------------
// WebSocketConnection
// ----------------------------------------------------------------------------

WebSocketConnection::WebSocketConnection(struct lws_context* context, struct lws* wsi,
                                         const std::string& id, size_t backlog)
    : context_(context)
    , wsi_(wsi)
    , id_(id)
    , backlog_(backlog)
    , closed_(false)
    , close_requested_(false)
{
}

bool WebSocketConnection::send_text(const std::string& text) {
    if (closed_ || close_requested_) {
        return false;
    }

    std::lock_guard<std::mutex> lock(queue_mutex_);
    if (!context_ || queue_.size() >= backlog_) {
        return false;
    }
    queue_.push_back(text);
    lws_cancel_service(context_);
    return true;
}

void WebSocketConnection::close() {
    close_requested_ = true;

    std::lock_guard<std::mutex> lock(queue_mutex_);
    queue_.clear();
    if (context_) {
        lws_cancel_service(context_);
    }
}

bool WebSocketConnection::wants_write() {
    if (close_requested_) return true;
    std::lock_guard<std::mutex> lock(queue_mutex_);
    return !queue_.empty();
}

bool WebSocketConnection::pop_message(std::string& out, bool& more) {
    std::lock_guard<std::mutex> lock(queue_mutex_);
    if (queue_.empty()) {
        more = false;
        return false;
    }
    out = std::move(queue_.front());
    queue_.pop_front();
    more = !queue_.empty();
    return true;
}

void WebSocketConnection::mark_closed() {
    closed_ = true;

    // The context may be destroyed after this; stop waking it
    std::lock_guard<std::mutex> lock(queue_mutex_);
    context_ = nullptr;
    queue_.clear();
}

// ----------------------------------------------------------------------------
// WebSocketServer
// ----------------------------------------------------------------------------

int WebSocketServer::callback_wrapper(struct lws* wsi,
                                      enum lws_callback_reasons reason,
                                      void* user, void* in, size_t len) {
    (void)user;
    struct lws_context* context = wsi ? lws_get_context(wsi) : nullptr;
    auto* server = context ? static_cast<WebSocketServer*>(lws_context_user(context)) : nullptr;
    if (server) {
        return server->handle_callback(wsi, reason, in, len);
    }
    return 0;
}

WebSocketServer::WebSocketServer(int port, const std::string& static_dir, size_t send_backlog)
    : port_(port)
    , static_dir_(static_dir)
    , send_backlog_(send_backlog)
    , context_(nullptr)
    , running_(false)
    , next_client_(0)
    , connections_total_(0)
    , messages_received_(0)
    , messages_sent_(0)
    , bytes_sent_(0)
{
    memset(&mount_, 0, sizeof(mount_));
}

WebSocketServer::~WebSocketServer() {
    stop();
}

bool WebSocketServer::start() {
    if (running_) return true;

    // Viewer page; "/" serves index.html
    memset(&mount_, 0, sizeof(mount_));
    mount_.mountpoint = "/";
    mount_.mountpoint_len = 1;
    mount_.origin = static_dir_.c_str();
    mount_.def = "index.html";
    mount_.origin_protocol = LWSMPRO_FILE;

    struct lws_context_creation_info info;
    memset(&info, 0, sizeof(info));

    info.port = port_;
    info.protocols = protocols;
    info.pvo = &pvo;
    info.mounts = &mount_;
    info.gid = -1;
    info.uid = -1;
    info.user = this;
    info.options = LWS_SERVER_OPTION_HTTP_HEADERS_SECURITY_BEST_PRACTICES_ENFORCE;

    context_ = lws_create_context(&info);
    if (!context_) {
        fprintf(stderr, "WebSocket: Failed to create context on port %d\n", port_);
        return false;
    }

    running_ = true;

    server_thread_ = std::thread([this]() {
        fprintf(stderr, "WebSocket: Listening on port %d (page from %s)\n",
                port_, static_dir_.c_str());

        while (running_) {
            lws_service(context_, 50);

            // Pick up messages queued from other threads
            request_writes();
        }

        fprintf(stderr, "WebSocket: Service thread stopped\n");
    });

    return true;
}

void WebSocketServer::stop() {
    if (!running_) return;

    running_ = false;
    lws_cancel_service(context_);

    if (server_thread_.joinable()) {
        server_thread_.join();
    }

    // Viewers still in the registry must not wake a destroyed context
    {
        std::lock_guard<std::mutex> lock(clients_mutex_);
        for (auto& entry : clients_) {
            entry.second->mark_closed();
        }
    }

    // Fires LWS_CALLBACK_CLOSED for every open socket on this thread
    lws_context_destroy(context_);
    context_ = nullptr;

    std::lock_guard<std::mutex> lock(clients_mutex_);
    clients_.clear();
}

void WebSocketServer::request_writes() {
    std::lock_guard<std::mutex> lock(clients_mutex_);
    for (auto& entry : clients_) {
        if (entry.second->wants_write()) {
            lws_callback_on_writable(entry.first);
        }
    }
}

int WebSocketServer::handle_callback(struct lws* wsi,
                                     enum lws_callback_reasons reason,
                                     void* in, size_t len) {
    switch (reason) {
        case LWS_CALLBACK_ESTABLISHED: {
            auto client = add_client(wsi);
            connections_total_++;
            fprintf(stderr, "WebSocket: Client connected: %s (Total: %zu)\n",
                    client->id().c_str(), get_client_count());

            if (callbacks_.on_connect) {
                try {
                    callbacks_.on_connect(client);
                } catch (const std::exception& e) {
                    fprintf(stderr, "WebSocket: Connect handler failed for %s: %s\n",
                            client->id().c_str(), e.what());
                }
            }
            break;
        }

        case LWS_CALLBACK_CLOSED: {
            auto client = remove_client(wsi);
            if (client) {
                client->mark_closed();
                fprintf(stderr, "WebSocket: Client disconnected: %s\n", client->id().c_str());
                if (callbacks_.on_disconnect) {
                    try {
                        callbacks_.on_disconnect(client);
                    } catch (const std::exception& e) {
                        fprintf(stderr, "WebSocket: Disconnect handler failed for %s: %s\n",
                                client->id().c_str(), e.what());
                    }
                }
            }
            break;
        }

        case LWS_CALLBACK_RECEIVE: {
            auto client = find_client(wsi);
            if (!client || !in) break;

            std::string& rx = client->rx_buffer();
            if (!append_fragment(rx, in, len, MAX_MESSAGE_SIZE)) {
                fprintf(stderr, "WebSocket: Message from %s exceeds %zu bytes, closing\n",
                        client->id().c_str(), MAX_MESSAGE_SIZE);
                lws_close_reason(wsi, LWS_CLOSE_STATUS_MESSAGE_TOO_LARGE, nullptr, 0);
                return -1;
            }
            if (!lws_is_final_fragment(wsi) || lws_remaining_packet_payload(wsi)) {
                break;
            }

            std::string text;
            text.swap(rx);
            messages_received_++;

            if (callbacks_.on_message) {
                try {
                    callbacks_.on_message(client, text);
                } catch (const std::exception& e) {
                    fprintf(stderr, "WebSocket: Message handler failed for %s: %s\n",
                            client->id().c_str(), e.what());
                }
            }
            break;
        }

        case LWS_CALLBACK_SERVER_WRITEABLE: {
            auto client = find_client(wsi);
            if (!client) break;

            // Dropped by the broadcaster
            if (client->close_requested()) {
                lws_close_reason(wsi, LWS_CLOSE_STATUS_GOINGAWAY, nullptr, 0);
                return -1;
            }

            std::string message;
            bool more = false;
            if (!client->pop_message(message, more)) break;

            std::vector<uint8_t> buf(LWS_PRE + message.size());
            memcpy(&buf[LWS_PRE], message.data(), message.size());

            int written = lws_write(wsi, &buf[LWS_PRE], message.size(), LWS_WRITE_TEXT);
            if (written < static_cast<int>(message.size())) {
                fprintf(stderr, "WebSocket: Write to %s failed, closing\n", client->id().c_str());
                return -1;
            }

            messages_sent_++;
            bytes_sent_ += message.size();

            if (more) {
                lws_callback_on_writable(wsi);
            }
            break;
        }

        case LWS_CALLBACK_PROTOCOL_INIT:
            fprintf(stderr, "WebSocket: Protocol initialized\n");
            break;

        default:
            break;
    }

    return 0;
}

std::shared_ptr<WebSocketConnection> WebSocketServer::add_client(struct lws* wsi) {
    std::shared_ptr<WebSocketConnection> client = std::make_shared<WebSocketConnection>(
        context_, wsi, generate_client_id(), send_backlog_);

    std::lock_guard<std::mutex> lock(clients_mutex_);
    clients_[wsi] = client;
    return client;
}

std::shared_ptr<WebSocketConnection> WebSocketServer::remove_client(struct lws* wsi) {
    std::lock_guard<std::mutex> lock(clients_mutex_);

    auto it = clients_.find(wsi);
    if (it == clients_.end()) {
        return nullptr;
    }
    std::shared_ptr<WebSocketConnection> client = it->second;
    clients_.erase(it);
    return client;
}

std::shared_ptr<WebSocketConnection> WebSocketServer::find_client(struct lws* wsi) {
    std::lock_guard<std::mutex> lock(clients_mutex_);

    auto it = clients_.find(wsi);
    return it == clients_.end() ? nullptr : it->second;
}

std::string WebSocketServer::generate_client_id() {
    auto now = std::chrono::system_clock::now();
    auto timestamp = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()).count();

    char buf[48];
    snprintf(buf, sizeof(buf), "client_%lld_%d",
             static_cast<long long>(timestamp), ++next_client_);
    return buf;
}

size_t WebSocketServer::get_client_count() {
    std::lock_guard<std::mutex> lock(clients_mutex_);
    return clients_.size();
}

WebSocketServer::Stats WebSocketServer::get_stats() {
    Stats stats = {};
    stats.clients_connected = get_client_count();
    stats.connections_total = connections_total_;
    stats.messages_received = messages_received_;
    stats.messages_sent = messages_sent_;
    stats.bytes_sent = bytes_sent_;
    return stats;
}

} // namespace ws
