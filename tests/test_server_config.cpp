/*
 * Server configuration tests
 */

#include "test_framework.h"
#include "config/server_config.h"
#include <cstdio>
#include <cstdlib>
#include <initializer_list>
#include <stdexcept>
#include <string>
#include <unistd.h>
#include <vector>

using server_config::ServerConfig;

// getopt_long wants mutable argv
struct Args {
    std::vector<std::string> storage;
    std::vector<char*> argv;

    explicit Args(std::initializer_list<const char*> list) {
        for (const char* a : list) storage.push_back(a);
        for (auto& s : storage) argv.push_back(&s[0]);
        argv.push_back(nullptr);
    }
    int argc() const { return static_cast<int>(storage.size()); }
    char** data() { return argv.data(); }
};

static std::string write_temp_config(const std::string& contents) {
    char path[] = "/tmp/browsercast-config-XXXXXX";
    int fd = mkstemp(path);
    if (fd < 0) {
        throw std::runtime_error("mkstemp failed");
    }
    ssize_t n = write(fd, contents.data(), contents.size());
    close(fd);
    if (n != static_cast<ssize_t>(contents.size())) {
        throw std::runtime_error("short write");
    }
    return path;
}

TEST(defaults) {
    ServerConfig config;
    ASSERT_EQ(config.port, 8000);
    ASSERT_EQ(config.fps, 5);
    ASSERT_EQ(config.viewport_width, 1280);
    ASSERT_EQ(config.viewport_height, 720);
    ASSERT_EQ(config.idle_interval_ms, 500);
    ASSERT_EQ(config.retry_interval_ms, 1000);
    ASSERT_EQ(config.start_url, std::string("https://example.com"));
    ASSERT_EQ(config.debug_port, 9222);
    ASSERT_TRUE(config.mirror);
    ASSERT_EQ(config.mirror_debug_port, 9223);
    ASSERT_EQ(config.event_workers, 4);
    ASSERT_EQ(config.send_backlog, 8);

    std::string error;
    ASSERT_TRUE(config.validate(error));
}

TEST(command_line_options) {
    ServerConfig config;
    Args args({"browsercast", "-p", "9000", "--fps", "10", "--viewport", "800x600",
               "--no-mirror", "--workers", "2", "-u", "https://example.org",
               "-b", "/usr/bin/chromium", "--debug-port", "9333", "-s", "www"});
    ASSERT_TRUE(config.parse_command_line(args.argc(), args.data()));

    ASSERT_EQ(config.port, 9000);
    ASSERT_EQ(config.fps, 10);
    ASSERT_EQ(config.viewport_width, 800);
    ASSERT_EQ(config.viewport_height, 600);
    ASSERT_FALSE(config.mirror);
    ASSERT_EQ(config.event_workers, 2);
    ASSERT_EQ(config.start_url, std::string("https://example.org"));
    ASSERT_EQ(config.browser_path, std::string("/usr/bin/chromium"));
    ASSERT_EQ(config.debug_port, 9333);
    ASSERT_EQ(config.static_dir, std::string("www"));
}

TEST(invalid_command_line_values) {
    ServerConfig a;
    Args bad_port({"browsercast", "-p", "eighty"});
    ASSERT_FALSE(a.parse_command_line(bad_port.argc(), bad_port.data()));

    ServerConfig b;
    Args bad_viewport({"browsercast", "--viewport", "800by600"});
    ASSERT_FALSE(b.parse_command_line(bad_viewport.argc(), bad_viewport.data()));
}

TEST(config_file_then_command_line) {
    std::string path = write_temp_config(
        "{\"port\": 8100, \"fps\": 2, \"viewport\": {\"width\": 1920, \"height\": 1080},"
        " \"browser\": {\"start_url\": \"https://example.net\", \"mirror\": false,"
        " \"call_timeout_ms\": 2500}, \"send_backlog\": 3}");

    ServerConfig config;
    Args args({"browsercast", "--config", path.c_str(), "--fps", "7"});
    bool ok = config.parse_command_line(args.argc(), args.data());
    unlink(path.c_str());

    ASSERT_TRUE(ok);
    ASSERT_EQ(config.port, 8100);
    ASSERT_EQ(config.fps, 7);
    ASSERT_EQ(config.viewport_width, 1920);
    ASSERT_EQ(config.viewport_height, 1080);
    ASSERT_EQ(config.start_url, std::string("https://example.net"));
    ASSERT_FALSE(config.mirror);
    ASSERT_EQ(config.call_timeout_ms, 2500);
    ASSERT_EQ(config.send_backlog, 3);
    ASSERT_EQ(config.config_path, path);
}

TEST(unreadable_config_file) {
    ServerConfig config;
    ASSERT_FALSE(config.load_from_file("/nonexistent/browsercast.json"));

    std::string path = write_temp_config("{ not json");
    bool ok = config.load_from_file(path);
    unlink(path.c_str());
    ASSERT_FALSE(ok);
}

TEST(environment_debug_flags) {
    setenv("BROWSERCAST_DEBUG_FRAMES", "1", 1);
    setenv("BROWSERCAST_DEBUG_DEVTOOLS", "1", 1);
    unsetenv("BROWSERCAST_DEBUG_EVENTS");

    ServerConfig config;
    config.load_from_env();
    unsetenv("BROWSERCAST_DEBUG_FRAMES");
    unsetenv("BROWSERCAST_DEBUG_DEVTOOLS");

    ASSERT_TRUE(config.debug_frames);
    ASSERT_TRUE(config.debug_devtools);
    ASSERT_FALSE(config.debug_events);
}

TEST(validate_rejects_bad_values) {
    std::string error;

    ServerConfig fps;
    fps.fps = 0;
    ASSERT_FALSE(fps.validate(error));

    ServerConfig viewport;
    viewport.viewport_height = -1;
    ASSERT_FALSE(viewport.validate(error));

    ServerConfig ports;
    ports.mirror_debug_port = ports.debug_port;
    ASSERT_FALSE(ports.validate(error));
    ASSERT_FALSE(error.empty());

    ports.mirror = false;
    ASSERT_TRUE(ports.validate(error));
}

int main() {
    return test_framework::run_all_tests("server config");
}
