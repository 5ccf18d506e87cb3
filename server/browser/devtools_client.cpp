/*
 * DevTools Protocol Client Implementation
 */

#include "devtools_client.h"
#include <chrono>
#include <cstdio>
#include <cstring>
#include <vector>

namespace browser {

static struct lws_protocols client_protocols[] = {
    {
        "devtools",
        DevToolsClient::callback_wrapper,
        0,
        65536,  // rx chunk size, messages are reassembled
        0,
        nullptr,
        0
    },
    { nullptr, nullptr, 0, 0, 0, nullptr, 0 }
};

int DevToolsClient::callback_wrapper(struct lws* wsi,
                                     enum lws_callback_reasons reason,
                                     void* user, void* in, size_t len) {
    (void)user;
    struct lws_context* context = wsi ? lws_get_context(wsi) : nullptr;
    auto* self = context ? static_cast<DevToolsClient*>(lws_context_user(context)) : nullptr;
    if (self) {
        return self->handle_callback(wsi, reason, in, len);
    }
    return 0;
}

DevToolsClient::DevToolsClient(int call_timeout_ms, bool debug)
    : call_timeout_ms_(call_timeout_ms)
    , debug_(debug)
    , context_(nullptr)
    , wsi_(nullptr)
    , running_(false)
    , connected_(false)
    , connect_failed_(false)
    , next_id_(1)
{
}

DevToolsClient::~DevToolsClient() {
    disconnect();
}

bool DevToolsClient::connect(const std::string& ws_url, int timeout_ms) {
    if (context_) {
        disconnect();
    }

    // lws_parse_uri() splits the buffer in place
    url_buffer_ = ws_url;
    const char* prot = nullptr;
    const char* address = nullptr;
    const char* path = nullptr;
    int port = 0;
    if (lws_parse_uri(&url_buffer_[0], &prot, &address, &port, &path) != 0) {
        fprintf(stderr, "DevTools: Invalid WebSocket URL %s\n", ws_url.c_str());
        return false;
    }
    path_ = std::string("/") + (path ? path : "");

    struct lws_context_creation_info info;
    memset(&info, 0, sizeof(info));
    info.port = CONTEXT_PORT_NO_LISTEN;
    info.protocols = client_protocols;
    info.gid = -1;
    info.uid = -1;
    info.user = this;

    context_ = lws_create_context(&info);
    if (!context_) {
        fprintf(stderr, "DevTools: Failed to create client context\n");
        return false;
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        connect_failed_ = false;
        outbound_.clear();
        rx_buffer_.clear();
    }

    struct lws_client_connect_info ci;
    memset(&ci, 0, sizeof(ci));
    ci.context = context_;
    ci.address = address;
    ci.port = port;
    ci.path = path_.c_str();
    ci.host = address;
    ci.origin = address;
    ci.local_protocol_name = client_protocols[0].name;
    ci.ssl_connection = 0;
    ci.pwsi = &wsi_;

    if (!lws_client_connect_via_info(&ci)) {
        fprintf(stderr, "DevTools: Failed to start connection to %s\n", ws_url.c_str());
        lws_context_destroy(context_);
        context_ = nullptr;
        return false;
    }

    running_ = true;
    service_thread_ = std::thread(&DevToolsClient::service_loop, this);

    std::unique_lock<std::mutex> lock(mutex_);
    bool finished = cv_.wait_for(lock, std::chrono::milliseconds(timeout_ms),
                                 [this]() { return connected_.load() || connect_failed_; });
    bool ok = finished && connected_;
    lock.unlock();

    if (!ok) {
        fprintf(stderr, "DevTools: Could not connect to %s\n", ws_url.c_str());
        disconnect();
        return false;
    }

    fprintf(stderr, "DevTools: Connected to %s\n", ws_url.c_str());
    return true;
}

void DevToolsClient::disconnect() {
    if (!context_) return;

    running_ = false;
    lws_cancel_service(context_);
    if (service_thread_.joinable()) {
        service_thread_.join();
    }

    // Runs the close callbacks on this thread
    lws_context_destroy(context_);
    context_ = nullptr;
    wsi_ = nullptr;
    connected_ = false;

    fail_pending("disconnected");
    std::lock_guard<std::mutex> lock(mutex_);
    outbound_.clear();
}

void DevToolsClient::service_loop() {
    while (running_) {
        lws_service(context_, 50);
    }
}

bool DevToolsClient::call(const std::string& method, const json_utils::json& params,
                          json_utils::json& result, std::string* error) {
    if (!connected_ || !context_) {
        if (error) *error = "not connected";
        return false;
    }

    int id;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        id = next_id_++;
        pending_[id] = PendingCall();

        json_utils::json msg;
        msg["id"] = id;
        msg["method"] = method;
        msg["params"] = params.is_null() ? json_utils::json::object() : params;
        outbound_.push_back(msg.dump());
    }

    if (debug_) {
        fprintf(stderr, "DevTools: -> #%d %s\n", id, method.c_str());
    }

    // Wake the service thread so it asks for a writable callback
    lws_cancel_service(context_);

    std::unique_lock<std::mutex> lock(mutex_);
    bool finished = cv_.wait_for(lock, std::chrono::milliseconds(call_timeout_ms_),
                                 [this, id]() { return pending_[id].done; });
    PendingCall reply = std::move(pending_[id]);
    pending_.erase(id);
    lock.unlock();

    if (!finished) {
        fprintf(stderr, "DevTools: %s timed out after %d ms\n", method.c_str(), call_timeout_ms_);
        if (error) *error = "timed out";
        return false;
    }

    if (!reply.ok) {
        fprintf(stderr, "DevTools: %s failed: %s\n", method.c_str(), reply.error.c_str());
        if (error) *error = reply.error;
        return false;
    }

    result = std::move(reply.result);
    return true;
}

bool DevToolsClient::call(const std::string& method, const json_utils::json& params) {
    json_utils::json ignored;
    return call(method, params, ignored, nullptr);
}

void DevToolsClient::fail_pending(const std::string& reason) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (auto& entry : pending_) {
            if (!entry.second.done) {
                entry.second.done = true;
                entry.second.ok = false;
                entry.second.error = reason;
            }
        }
    }
    cv_.notify_all();
}

void DevToolsClient::handle_message(const std::string& text) {
    json_utils::json j;
    std::string error;
    if (!json_utils::try_parse(text, j, error) || !j.is_object()) {
        fprintf(stderr, "DevTools: Unparseable message: %s\n", error.c_str());
        return;
    }

    auto id_it = j.find("id");
    if (id_it == j.end() || !id_it->is_number_integer()) {
        // Unsolicited protocol event
        std::string method = json_utils::get_string(j, "method");
        if (method == "Inspector.detached" || method == "Inspector.targetCrashed") {
            fprintf(stderr, "DevTools: Target gone (%s)\n", method.c_str());
        } else if (debug_) {
            fprintf(stderr, "DevTools: <- event %s\n", method.c_str());
        }
        return;
    }

    int id = id_it->get<int>();
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = pending_.find(id);
        if (it == pending_.end()) {
            // Caller already gave up on it
            return;
        }

        PendingCall& call = it->second;
        call.done = true;
        if (j.contains("error")) {
            call.ok = false;
            call.error = json_utils::get_string(j["error"], "message", "unknown error");
        } else {
            call.ok = true;
            call.result = j.contains("result") ? j["result"] : json_utils::json::object();
        }
    }
    cv_.notify_all();

    if (debug_) {
        fprintf(stderr, "DevTools: <- #%d (%zu bytes)\n", id, text.size());
    }
}

int DevToolsClient::handle_callback(struct lws* wsi, enum lws_callback_reasons reason,
                                    void* in, size_t len) {
    switch (reason) {
        case LWS_CALLBACK_CLIENT_ESTABLISHED: {
            {
                std::lock_guard<std::mutex> lock(mutex_);
                connected_ = true;
            }
            cv_.notify_all();
            break;
        }

        case LWS_CALLBACK_CLIENT_CONNECTION_ERROR: {
            fprintf(stderr, "DevTools: Connection error: %s\n",
                    in ? static_cast<const char*>(in) : "(unknown)");
            {
                std::lock_guard<std::mutex> lock(mutex_);
                connect_failed_ = true;
                connected_ = false;
                wsi_ = nullptr;
            }
            cv_.notify_all();
            fail_pending("connection error");
            break;
        }

        case LWS_CALLBACK_CLIENT_RECEIVE: {
            rx_buffer_.append(static_cast<const char*>(in), len);
            if (lws_is_final_fragment(wsi) && !lws_remaining_packet_payload(wsi)) {
                std::string message;
                message.swap(rx_buffer_);
                handle_message(message);
            }
            break;
        }

        case LWS_CALLBACK_CLIENT_WRITEABLE: {
            std::string message;
            bool more = false;
            {
                std::lock_guard<std::mutex> lock(mutex_);
                if (outbound_.empty()) break;
                message = std::move(outbound_.front());
                outbound_.pop_front();
                more = !outbound_.empty();
            }

            std::vector<unsigned char> buf(LWS_PRE + message.size());
            memcpy(&buf[LWS_PRE], message.data(), message.size());
            int written = lws_write(wsi, &buf[LWS_PRE], message.size(), LWS_WRITE_TEXT);
            if (written < static_cast<int>(message.size())) {
                fprintf(stderr, "DevTools: Write failed, closing connection\n");
                return -1;
            }

            if (more) {
                lws_callback_on_writable(wsi);
            }
            break;
        }

        case LWS_CALLBACK_EVENT_WAIT_CANCELLED: {
            // Another thread queued a call
            bool pending_write;
            {
                std::lock_guard<std::mutex> lock(mutex_);
                pending_write = !outbound_.empty() && wsi_ && connected_;
            }
            if (pending_write) {
                lws_callback_on_writable(wsi_);
            }
            break;
        }

        case LWS_CALLBACK_CLIENT_CLOSED: {
            fprintf(stderr, "DevTools: Connection closed\n");
            {
                std::lock_guard<std::mutex> lock(mutex_);
                connected_ = false;
                wsi_ = nullptr;
            }
            fail_pending("connection closed");
            break;
        }

        default:
            break;
    }

    return 0;
}

} // namespace browser
