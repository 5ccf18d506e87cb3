/*
 * Server Configuration
 *
 * Every tunable of the streaming server lives here. Values are layered:
 * built-in defaults, then the JSON config file (--config), then command
 * line options, then BROWSERCAST_DEBUG_* environment variables.
 */

#ifndef SERVER_CONFIG_H
#define SERVER_CONFIG_H

#include <string>

namespace server_config {

struct ServerConfig {
    // Network
    int port = 8000;
    std::string static_dir = "static";
    int send_backlog = 8;            // Queued messages per client before it counts as failed

    // Capture loop
    int fps = 5;
    int viewport_width = 1280;       // Also the fallback when the page cannot report its size
    int viewport_height = 720;
    int idle_interval_ms = 500;      // Registry empty
    int retry_interval_ms = 1000;    // Frame source unavailable

    // Event pipeline
    int event_workers = 4;

    // Browser
    std::string browser_path;        // Chromium/Chrome executable, searched when empty
    std::string start_url = "https://example.com";
    int debug_port = 9222;           // DevTools port of the headless browser
    bool mirror = true;              // Also drive a visible browser
    int mirror_debug_port = 9223;
    int call_timeout_ms = 10000;     // Per DevTools call

    std::string config_path;

    // Debug flags
    bool debug_connection = false;   // WebSocket connect/disconnect, libwebsockets logs
    bool debug_frames = false;       // Per-frame capture/broadcast logs
    bool debug_events = false;       // Per-event pipeline logs
    bool debug_devtools = false;     // DevTools calls

    /**
     * Parse command-line arguments
     * A --config file is loaded first so that other options override it.
     * @return false on an invalid option or unreadable config file
     */
    bool parse_command_line(int argc, char* argv[]);

    /**
     * Load values from a JSON config file
     * Missing keys keep their current value.
     * @return false if the file cannot be read or parsed
     */
    bool load_from_file(const std::string& path);

    /**
     * Load debug flags from BROWSERCAST_DEBUG_* environment variables
     */
    void load_from_env();

    /**
     * Check value ranges
     * @param error Human-readable reason when invalid
     */
    bool validate(std::string& error) const;

    void print_summary() const;

    void print_usage(const char* program_name) const;
};

} // namespace server_config

#endif // SERVER_CONFIG_H
