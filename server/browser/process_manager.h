/*
 * Browser Process Manager
 *
 * Starts and stops one Chromium/Chrome process with remote debugging
 * enabled. The headless instance feeds the stream; a second, visible
 * instance can be started as an operator mirror.
 */

#ifndef BROWSER_PROCESS_MANAGER_H
#define BROWSER_PROCESS_MANAGER_H

#include <string>
#include <vector>
#include <sys/types.h>

namespace browser {

struct LaunchOptions {
    std::string executable;    // Explicit path, searched when empty
    int debug_port = 9222;
    bool headless = true;
    int width = 1280;
    int height = 720;
    std::string profile_dir;   // Defaults to /tmp/browsercast-profile-<port>
};

class ProcessManager {
public:
    explicit ProcessManager(const LaunchOptions& options);
    ~ProcessManager();

    ProcessManager(const ProcessManager&) = delete;
    ProcessManager& operator=(const ProcessManager&) = delete;

    /**
     * Find browser executable
     * @return Path to browser, or empty string if not found
     */
    std::string find_browser() const;

    // Command line used for the launch (argv[0] included)
    std::vector<std::string> build_arguments(const std::string& executable) const;

    /**
     * Start the browser process
     * @return true if started (or already running)
     */
    bool start();

    /**
     * Stop the browser process (SIGTERM, then SIGKILL after 3 seconds)
     */
    void stop();

    /**
     * Reap the process if it has exited
     * @return true if the browser is no longer running
     */
    bool has_exited();

    pid_t get_pid() const { return started_pid_; }
    bool is_running() const { return started_pid_ > 0; }
    const LaunchOptions& options() const { return options_; }

private:
    LaunchOptions options_;
    pid_t started_pid_;
};

} // namespace browser

#endif // BROWSER_PROCESS_MANAGER_H
