/*
 * DevTools Protocol Client
 *
 * Request/response client for the Chrome DevTools Protocol over a
 * libwebsockets client connection. One service thread owns the socket;
 * callers on any thread block in call() until the matching reply
 * arrives, the call times out, or the socket closes.
 */

#ifndef BROWSER_DEVTOOLS_CLIENT_H
#define BROWSER_DEVTOOLS_CLIENT_H

#include "../utils/json_utils.h"
#include <libwebsockets.h>
#include <atomic>
#include <condition_variable>
#include <deque>
#include <map>
#include <mutex>
#include <string>
#include <thread>

namespace browser {

class DevToolsClient {
public:
    // Static callback wrapper for libwebsockets (must be public for C callback)
    static int callback_wrapper(struct lws* wsi,
                                enum lws_callback_reasons reason,
                                void* user, void* in, size_t len);

    explicit DevToolsClient(int call_timeout_ms = 10000, bool debug = false);
    ~DevToolsClient();

    DevToolsClient(const DevToolsClient&) = delete;
    DevToolsClient& operator=(const DevToolsClient&) = delete;

    /**
     * Connect to a target's webSocketDebuggerUrl
     * @return true once the WebSocket handshake completed
     */
    bool connect(const std::string& ws_url, int timeout_ms = 5000);

    void disconnect();

    bool is_connected() const { return connected_; }

    /**
     * Invoke a DevTools method and wait for its reply
     * @param result The reply's "result" object on success
     * @param error Protocol or transport error on failure (optional)
     */
    bool call(const std::string& method, const json_utils::json& params,
              json_utils::json& result, std::string* error = nullptr);

    // Call and discard the result
    bool call(const std::string& method, const json_utils::json& params);

private:
    struct PendingCall {
        bool done = false;
        bool ok = false;
        json_utils::json result;
        std::string error;
    };

    int handle_callback(struct lws* wsi, enum lws_callback_reasons reason,
                        void* in, size_t len);
    void handle_message(const std::string& text);
    void fail_pending(const std::string& reason);
    void service_loop();

    int call_timeout_ms_;
    bool debug_;

    struct lws_context* context_;
    struct lws* wsi_;
    std::thread service_thread_;
    std::atomic<bool> running_;
    std::atomic<bool> connected_;
    bool connect_failed_;

    // URL pieces must outlive the connect call
    std::string url_buffer_;
    std::string path_;

    std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<std::string> outbound_;
    std::map<int, PendingCall> pending_;
    int next_id_;

    std::string rx_buffer_;
};

} // namespace browser

#endif // BROWSER_DEVTOOLS_CLIENT_H
