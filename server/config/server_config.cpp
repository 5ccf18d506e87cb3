/*
 * Server Configuration Implementation
 */

#include "server_config.h"
#include "../utils/json_utils.h"
#include <cstdlib>
#include <cstring>
#include <cstdio>
#include <getopt.h>

namespace server_config {

namespace {

bool parse_viewport(const char* arg, int& width, int& height) {
    int w = 0, h = 0;
    char tail = 0;
    if (sscanf(arg, "%dx%d%c", &w, &h, &tail) != 2) {
        return false;
    }
    width = w;
    height = h;
    return true;
}

bool parse_int(const char* arg, int& out) {
    char* end = nullptr;
    long v = strtol(arg, &end, 10);
    if (!end || *end != '\0' || end == arg) {
        return false;
    }
    out = static_cast<int>(v);
    return true;
}

// Locate --config before the main pass so the file is applied first
const char* find_config_arg(int argc, char* argv[]) {
    for (int i = 1; i < argc; i++) {
        if ((strcmp(argv[i], "-c") == 0 || strcmp(argv[i], "--config") == 0) && i + 1 < argc) {
            return argv[i + 1];
        }
        if (strncmp(argv[i], "--config=", 9) == 0) {
            return argv[i] + 9;
        }
    }
    return nullptr;
}

} // namespace

bool ServerConfig::parse_command_line(int argc, char* argv[]) {
    const char* config_arg = find_config_arg(argc, argv);
    if (config_arg) {
        config_path = config_arg;
        if (!load_from_file(config_path)) {
            return false;
        }
    }

    static struct option long_options[] = {
        {"help",        no_argument,       0, 'h'},
        {"port",        required_argument, 0, 'p'},
        {"fps",         required_argument, 0, 'f'},
        {"config",      required_argument, 0, 'c'},
        {"browser",     required_argument, 0, 'b'},
        {"start-url",   required_argument, 0, 'u'},
        {"static",      required_argument, 0, 's'},
        {"viewport",    required_argument, 0,  0 },
        {"debug-port",  required_argument, 0,  0 },
        {"mirror-port", required_argument, 0,  0 },
        {"no-mirror",   no_argument,       0,  0 },
        {"workers",     required_argument, 0,  0 },
        {0, 0, 0, 0}
    };

    // Full re-initialisation of getopt (glibc), parse may run more than once
    optind = 0;

    int option_index = 0;
    int c;
    bool ok = true;

    while ((c = getopt_long(argc, argv, "hp:f:c:b:u:s:", long_options, &option_index)) != -1) {
        switch (c) {
            case 0: {
                const char* name = long_options[option_index].name;
                if (strcmp(name, "viewport") == 0) {
                    if (!parse_viewport(optarg, viewport_width, viewport_height)) {
                        fprintf(stderr, "Config: Invalid viewport '%s' (expected WIDTHxHEIGHT)\n", optarg);
                        ok = false;
                    }
                } else if (strcmp(name, "debug-port") == 0) {
                    if (!parse_int(optarg, debug_port)) ok = false;
                } else if (strcmp(name, "mirror-port") == 0) {
                    if (!parse_int(optarg, mirror_debug_port)) ok = false;
                } else if (strcmp(name, "no-mirror") == 0) {
                    mirror = false;
                } else if (strcmp(name, "workers") == 0) {
                    if (!parse_int(optarg, event_workers)) ok = false;
                }
                break;
            }

            case 'h':
                print_usage(argv[0]);
                exit(0);

            case 'p':
                if (!parse_int(optarg, port)) ok = false;
                break;

            case 'f':
                if (!parse_int(optarg, fps)) ok = false;
                break;

            case 'c':
                // Already loaded
                break;

            case 'b':
                browser_path = optarg;
                break;

            case 'u':
                start_url = optarg;
                break;

            case 's':
                static_dir = optarg;
                break;

            case '?':
                // getopt_long already printed the reason
                ok = false;
                break;

            default:
                fprintf(stderr, "Config: Unknown option\n");
                ok = false;
                break;
        }
    }

    if (!ok) {
        fprintf(stderr, "Config: Invalid command line, see --help\n");
    }
    return ok;
}

bool ServerConfig::load_from_file(const std::string& path) {
    json_utils::json j;
    try {
        j = json_utils::parse_file(path);
    } catch (const std::exception& e) {
        fprintf(stderr, "Config: Failed to load %s: %s\n", path.c_str(), e.what());
        return false;
    }

    if (!j.is_object()) {
        fprintf(stderr, "Config: %s does not contain a JSON object\n", path.c_str());
        return false;
    }

    port = json_utils::get_int(j, "port", port);
    static_dir = json_utils::get_string(j, "static_dir", static_dir);
    send_backlog = json_utils::get_int(j, "send_backlog", send_backlog);
    fps = json_utils::get_int(j, "fps", fps);
    idle_interval_ms = json_utils::get_int(j, "idle_interval_ms", idle_interval_ms);
    retry_interval_ms = json_utils::get_int(j, "retry_interval_ms", retry_interval_ms);
    event_workers = json_utils::get_int(j, "event_workers", event_workers);

    if (j.contains("viewport")) {
        const auto& vp = j["viewport"];
        viewport_width = json_utils::get_int(vp, "width", viewport_width);
        viewport_height = json_utils::get_int(vp, "height", viewport_height);
    }

    if (j.contains("browser")) {
        const auto& browser = j["browser"];
        browser_path = json_utils::get_string(browser, "path", browser_path);
        start_url = json_utils::get_string(browser, "start_url", start_url);
        debug_port = json_utils::get_int(browser, "debug_port", debug_port);
        mirror = json_utils::get_bool(browser, "mirror", mirror);
        mirror_debug_port = json_utils::get_int(browser, "mirror_debug_port", mirror_debug_port);
        call_timeout_ms = json_utils::get_int(browser, "call_timeout_ms", call_timeout_ms);
    }

    fprintf(stderr, "Config: Loaded from %s\n", path.c_str());
    return true;
}

void ServerConfig::load_from_env() {
    if (getenv("BROWSERCAST_DEBUG_CONNECTION")) {
        debug_connection = true;
    }
    if (getenv("BROWSERCAST_DEBUG_FRAMES")) {
        debug_frames = true;
    }
    if (getenv("BROWSERCAST_DEBUG_EVENTS")) {
        debug_events = true;
    }
    if (getenv("BROWSERCAST_DEBUG_DEVTOOLS")) {
        debug_devtools = true;
    }
}

bool ServerConfig::validate(std::string& error) const {
    if (port <= 0 || port > 65535) {
        error = "port must be in 1..65535";
        return false;
    }
    if (fps <= 0) {
        error = "fps must be positive";
        return false;
    }
    if (viewport_width <= 0 || viewport_height <= 0) {
        error = "viewport must be positive";
        return false;
    }
    if (idle_interval_ms <= 0 || retry_interval_ms <= 0) {
        error = "idle and retry intervals must be positive";
        return false;
    }
    if (event_workers <= 0) {
        error = "at least one event worker is required";
        return false;
    }
    if (send_backlog <= 0) {
        error = "send backlog must be positive";
        return false;
    }
    if (debug_port <= 0 || debug_port > 65535 ||
        (mirror && (mirror_debug_port <= 0 || mirror_debug_port > 65535))) {
        error = "DevTools ports must be in 1..65535";
        return false;
    }
    if (mirror && mirror_debug_port == debug_port) {
        error = "mirror DevTools port must differ from the primary one";
        return false;
    }
    if (call_timeout_ms <= 0) {
        error = "DevTools call timeout must be positive";
        return false;
    }
    return true;
}

void ServerConfig::print_summary() const {
    fprintf(stderr, "\n=== browsercast ===\n");
    fprintf(stderr, "HTTP/WebSocket:   http://0.0.0.0:%d  (ws path /ws)\n", port);
    fprintf(stderr, "Static files:     %s\n", static_dir.c_str());
    fprintf(stderr, "Capture rate:     %d fps\n", fps);
    fprintf(stderr, "Viewport:         %dx%d\n", viewport_width, viewport_height);
    fprintf(stderr, "Event workers:    %d\n", event_workers);

    fprintf(stderr, "\nBrowser:\n");
    fprintf(stderr, "  Executable:     %s\n", browser_path.empty() ? "(search)" : browser_path.c_str());
    fprintf(stderr, "  Start URL:      %s\n", start_url.c_str());
    fprintf(stderr, "  DevTools port:  %d\n", debug_port);
    if (mirror) {
        fprintf(stderr, "  Mirror port:    %d\n", mirror_debug_port);
    } else {
        fprintf(stderr, "  Mirror:         disabled\n");
    }

    bool any_debug = debug_connection || debug_frames || debug_events || debug_devtools;
    if (any_debug) {
        fprintf(stderr, "\nDebug flags:\n");
        if (debug_connection) fprintf(stderr, "  - Connection (WebSocket)\n");
        if (debug_frames)     fprintf(stderr, "  - Frames (capture/broadcast)\n");
        if (debug_events)     fprintf(stderr, "  - Events (pipeline)\n");
        if (debug_devtools)   fprintf(stderr, "  - DevTools calls\n");
    }

    fprintf(stderr, "\n");
}

void ServerConfig::print_usage(const char* program_name) const {
    fprintf(stderr, "Usage: %s [options]\n\n", program_name);
    fprintf(stderr, "Options:\n");
    fprintf(stderr, "  -h, --help              Show this help\n");
    fprintf(stderr, "  -p, --port PORT         HTTP/WebSocket port (default: %d)\n", port);
    fprintf(stderr, "  -f, --fps N             Capture rate in frames per second (default: %d)\n", fps);
    fprintf(stderr, "  -c, --config FILE       JSON config file, applied before other options\n");
    fprintf(stderr, "  -b, --browser PATH      Chromium/Chrome executable\n");
    fprintf(stderr, "  -u, --start-url URL     Page opened at startup (default: %s)\n", start_url.c_str());
    fprintf(stderr, "  -s, --static DIR        Viewer page directory (default: %s)\n", static_dir.c_str());
    fprintf(stderr, "      --viewport WxH      Browser viewport (default: %dx%d)\n", viewport_width, viewport_height);
    fprintf(stderr, "      --debug-port PORT   DevTools port of the headless browser (default: %d)\n", debug_port);
    fprintf(stderr, "      --mirror-port PORT  DevTools port of the visible browser (default: %d)\n", mirror_debug_port);
    fprintf(stderr, "      --no-mirror         Don't launch the visible browser\n");
    fprintf(stderr, "      --workers N         Event pipeline workers (default: %d)\n", event_workers);
    fprintf(stderr, "\nEnvironment variables:\n");
    fprintf(stderr, "  BROWSERCAST_DEBUG_CONNECTION  WebSocket connection logs\n");
    fprintf(stderr, "  BROWSERCAST_DEBUG_FRAMES      Per-frame capture/broadcast logs\n");
    fprintf(stderr, "  BROWSERCAST_DEBUG_EVENTS      Per-event pipeline logs\n");
    fprintf(stderr, "  BROWSERCAST_DEBUG_DEVTOOLS    DevTools call logs\n");
    fprintf(stderr, "\n");
}

} // namespace server_config
