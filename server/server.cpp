/*
 * browsercast - Live Browser Streaming Server
 *
 * Streams a headless Chromium tab to any number of browser viewers as
 * JPEG frames over WebSocket, and applies their clicks, keys, scrolls
 * and navigations back to the page (and to an optional visible mirror).
 *
 * Usage: browsercast [options]   (see --help)
 */

#include "config/server_config.h"
#include "browser/browser_provider.h"
#include "stream/session.h"
#include "websocket_server.h"

#include <libwebsockets.h>
#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdio>
#include <string>
#include <thread>

static server_config::ServerConfig g_config;
static std::atomic<bool> g_running(true);

static void signal_handler(int sig) {
    (void)sig;
    g_running = false;
}

static stream::Session::Options session_options(const server_config::ServerConfig& config) {
    stream::Session::Options options;
    options.fallback_viewport.width = config.viewport_width;
    options.fallback_viewport.height = config.viewport_height;

    options.capture.fps = config.fps;
    options.capture.idle_interval_ms = config.idle_interval_ms;
    options.capture.retry_interval_ms = config.retry_interval_ms;
    options.capture.debug_frames = config.debug_frames;

    options.events.workers = config.event_workers;
    options.events.debug_events = config.debug_events;

    options.debug_connection = config.debug_connection;
    options.debug_frames = config.debug_frames;
    return options;
}

static browser::BrowserProvider::Options browser_options(const server_config::ServerConfig& config) {
    browser::BrowserProvider::Options options;
    options.browser_path = config.browser_path;
    options.start_url = config.start_url;
    options.viewport.width = config.viewport_width;
    options.viewport.height = config.viewport_height;
    options.debug_port = config.debug_port;
    options.mirror = config.mirror;
    options.mirror_debug_port = config.mirror_debug_port;
    options.call_timeout_ms = config.call_timeout_ms;
    options.debug = config.debug_devtools;
    return options;
}

int main(int argc, char* argv[]) {
    // Parse configuration from command line and environment
    if (!g_config.parse_command_line(argc, argv)) {
        g_config.print_usage(argv[0]);
        return 1;
    }
    g_config.load_from_env();

    std::string error;
    if (!g_config.validate(error)) {
        fprintf(stderr, "Config: %s\n", error.c_str());
        return 1;
    }

    // Set up signal handlers for graceful shutdown
    signal(SIGINT, signal_handler);
    signal(SIGTERM, signal_handler);
    signal(SIGPIPE, SIG_IGN);

    lws_set_log_level(g_config.debug_connection
                          ? (LLL_ERR | LLL_WARN | LLL_NOTICE | LLL_INFO)
                          : (LLL_ERR | LLL_WARN),
                      nullptr);

    g_config.print_summary();

    browser::BrowserProvider provider(browser_options(g_config));
    stream::Session session(provider, session_options(g_config));

    // Streaming may come up disabled; viewers still get the page and meta
    session.start();

    ws::WebSocketServer ws_server(g_config.port, g_config.static_dir,
                                  static_cast<size_t>(g_config.send_backlog));
    ws::WebSocketCallbacks callbacks;
    callbacks.on_connect = [&session](const stream::ClientConnectionPtr& conn) {
        session.on_client_connected(conn);
    };
    callbacks.on_message = [&session](const stream::ClientConnectionPtr& conn, const std::string& text) {
        session.on_client_message(conn, text);
    };
    callbacks.on_disconnect = [&session](const stream::ClientConnectionPtr& conn) {
        session.on_client_disconnected(conn);
    };
    ws_server.set_callbacks(callbacks);

    if (!ws_server.start()) {
        fprintf(stderr, "Server: Failed to listen on port %d\n", g_config.port);
        session.stop();
        return 1;
    }

    fprintf(stderr, "\nOpen http://localhost:%d in your browser\n\n", g_config.port);

    while (g_running) {
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
    }

    fprintf(stderr, "\nServer: Shutting down...\n");
    ws_server.stop();
    session.stop();

    stream::Broadcaster::Stats bstats = session.broadcaster().get_stats();
    stream::EventPipeline::Stats estats = session.pipeline().get_stats();
    fprintf(stderr, "Server: %llu broadcasts, %llu events applied, %llu failed\n",
            static_cast<unsigned long long>(bstats.broadcasts),
            static_cast<unsigned long long>(estats.applied),
            static_cast<unsigned long long>(estats.failed));
    fprintf(stderr, "Server: Shutdown complete\n");
    return 0;
}
