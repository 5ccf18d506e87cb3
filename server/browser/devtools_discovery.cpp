/*
 * DevTools Target Discovery Implementation
 */

#include "devtools_discovery.h"
#include "../utils/json_utils.h"
#include <sys/socket.h>
#include <netinet/in.h>
#include <arpa/inet.h>
#include <unistd.h>
#include <poll.h>
#include <cerrno>
#include <chrono>
#include <cstdio>
#include <cstring>
#include <thread>

namespace browser {

bool parse_target_list(const std::string& body, PageTarget& out) {
    json_utils::json j;
    std::string error;
    if (!json_utils::try_parse(body, j, error) || !j.is_array()) {
        return false;
    }

    for (const auto& target : j) {
        if (json_utils::get_string(target, "type") != "page") continue;

        std::string ws_url = json_utils::get_string(target, "webSocketDebuggerUrl");
        if (ws_url.empty()) continue;

        out.id = json_utils::get_string(target, "id");
        out.url = json_utils::get_string(target, "url");
        out.websocket_url = ws_url;
        return true;
    }

    return false;
}

// Blocking HTTP/1.1 GET against the local DevTools endpoint
static bool http_get_local(int port, const std::string& path, std::string& body, std::string& error) {
    int fd = socket(AF_INET, SOCK_STREAM, 0);
    if (fd < 0) {
        error = std::string("socket: ") + strerror(errno);
        return false;
    }

    struct sockaddr_in addr;
    memset(&addr, 0, sizeof(addr));
    addr.sin_family = AF_INET;
    addr.sin_port = htons(port);
    addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);

    if (connect(fd, (struct sockaddr*)&addr, sizeof(addr)) < 0) {
        error = std::string("connect: ") + strerror(errno);
        close(fd);
        return false;
    }

    std::string request = "GET " + path + " HTTP/1.1\r\n"
                          "Host: 127.0.0.1:" + std::to_string(port) + "\r\n"
                          "Connection: close\r\n\r\n";
    if (send(fd, request.c_str(), request.size(), MSG_NOSIGNAL) != (ssize_t)request.size()) {
        error = std::string("send: ") + strerror(errno);
        close(fd);
        return false;
    }

    std::string response;
    char buffer[8192];
    while (true) {
        struct pollfd pfd;
        pfd.fd = fd;
        pfd.events = POLLIN;
        int ret = poll(&pfd, 1, 2000);
        if (ret <= 0) {
            error = "timed out reading response";
            close(fd);
            return false;
        }
        ssize_t n = recv(fd, buffer, sizeof(buffer), 0);
        if (n < 0) {
            error = std::string("recv: ") + strerror(errno);
            close(fd);
            return false;
        }
        if (n == 0) break;
        response.append(buffer, n);
    }
    close(fd);

    if (response.compare(0, 12, "HTTP/1.1 200") != 0 && response.compare(0, 12, "HTTP/1.0 200") != 0) {
        error = "unexpected response: " + response.substr(0, response.find("\r\n"));
        return false;
    }

    size_t body_start = response.find("\r\n\r\n");
    if (body_start == std::string::npos) {
        error = "malformed response";
        return false;
    }

    body = response.substr(body_start + 4);
    return true;
}

bool fetch_page_target(int port, PageTarget& out, std::string& error) {
    std::string body;
    if (!http_get_local(port, "/json/list", body, error)) {
        return false;
    }

    if (!parse_target_list(body, out)) {
        error = "no page target yet";
        return false;
    }
    return true;
}

bool wait_for_page_target(int port, int timeout_ms, PageTarget& out,
                          const std::function<bool()>& should_abort) {
    auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(timeout_ms);
    std::string error;

    while (std::chrono::steady_clock::now() < deadline) {
        if (should_abort && should_abort()) {
            fprintf(stderr, "DevTools: Discovery on port %d aborted\n", port);
            return false;
        }

        if (fetch_page_target(port, out, error)) {
            fprintf(stderr, "DevTools: Found page target %s on port %d\n", out.id.c_str(), port);
            return true;
        }

        std::this_thread::sleep_for(std::chrono::milliseconds(200));
    }

    fprintf(stderr, "DevTools: No page target on port %d after %d ms (%s)\n",
            port, timeout_ms, error.c_str());
    return false;
}

} // namespace browser
