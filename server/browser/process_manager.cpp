/*
 * Browser Process Manager Implementation
 */

#include "process_manager.h"
#include <cerrno>
#include <cstdio>
#include <cstring>
#include <cstdlib>
#include <unistd.h>
#include <signal.h>
#include <sys/wait.h>

namespace browser {

ProcessManager::ProcessManager(const LaunchOptions& options)
    : options_(options)
    , started_pid_(-1)
{
    if (options_.profile_dir.empty()) {
        options_.profile_dir = "/tmp/browsercast-profile-" + std::to_string(options_.debug_port);
    }
}

ProcessManager::~ProcessManager() {
    stop();
}

std::string ProcessManager::find_browser() const {
    if (!options_.executable.empty()) {
        if (access(options_.executable.c_str(), X_OK) == 0) {
            return options_.executable;
        }
        fprintf(stderr, "Browser: Specified path not executable: %s\n",
                options_.executable.c_str());
        return "";
    }

    const char* candidates[] = {
        "/usr/bin/chromium",
        "/usr/bin/chromium-browser",
        "/usr/bin/google-chrome",
        "/usr/bin/google-chrome-stable",
        "/snap/bin/chromium",
        "/opt/google/chrome/chrome",
        nullptr
    };

    for (int i = 0; candidates[i]; i++) {
        if (access(candidates[i], X_OK) == 0) {
            return candidates[i];
        }
    }

    return "";
}

std::vector<std::string> ProcessManager::build_arguments(const std::string& executable) const {
    std::vector<std::string> args;
    args.push_back(executable);
    args.push_back("--remote-debugging-port=" + std::to_string(options_.debug_port));
    args.push_back("--remote-allow-origins=*");
    args.push_back("--user-data-dir=" + options_.profile_dir);
    args.push_back("--window-size=" + std::to_string(options_.width) + "," +
                   std::to_string(options_.height));
    args.push_back("--no-first-run");
    args.push_back("--no-default-browser-check");
    args.push_back("--disable-background-timer-throttling");
    args.push_back("--disable-renderer-backgrounding");
    if (options_.headless) {
        args.push_back("--headless=new");
        args.push_back("--hide-scrollbars");
    } else {
        args.push_back("--start-maximized");
    }
    args.push_back("about:blank");
    return args;
}

bool ProcessManager::start() {
    if (started_pid_ > 0) {
        int status;
        pid_t result = waitpid(started_pid_, &status, WNOHANG);
        if (result == 0) {
            return true;
        }
        started_pid_ = -1;
    }

    std::string exe = find_browser();
    if (exe.empty()) {
        fprintf(stderr, "Browser: No Chromium/Chrome found. Use --browser PATH\n");
        return false;
    }

    std::vector<std::string> args = build_arguments(exe);
    fprintf(stderr, "Browser: Starting %s (%s, DevTools port %d)\n",
            exe.c_str(), options_.headless ? "headless" : "visible", options_.debug_port);

    // Build argv before fork, the child only execs
    std::vector<char*> argv;
    for (auto& arg : args) {
        argv.push_back(const_cast<char*>(arg.c_str()));
    }
    argv.push_back(nullptr);

    pid_t pid = fork();
    if (pid < 0) {
        fprintf(stderr, "Browser: Fork failed: %s\n", strerror(errno));
        return false;
    }

    if (pid == 0) {
        // Child: don't leak the server's sockets into the browser
        for (int fd = 3; fd < 1024; fd++) {
            close(fd);
        }

        execv(exe.c_str(), argv.data());

        fprintf(stderr, "Browser: Exec failed: %s\n", strerror(errno));
        _exit(1);
    }

    started_pid_ = pid;
    fprintf(stderr, "Browser: Started with PID %d\n", pid);
    return true;
}

void ProcessManager::stop() {
    if (started_pid_ <= 0) return;

    fprintf(stderr, "Browser: Stopping PID %d\n", started_pid_);

    kill(started_pid_, SIGTERM);

    for (int i = 0; i < 30; i++) {
        int status;
        pid_t result = waitpid(started_pid_, &status, WNOHANG);
        if (result != 0) {
            started_pid_ = -1;
            fprintf(stderr, "Browser: Stopped\n");
            return;
        }
        usleep(100000);  // 100ms
    }

    fprintf(stderr, "Browser: Force killing PID %d\n", started_pid_);
    kill(started_pid_, SIGKILL);
    waitpid(started_pid_, nullptr, 0);
    started_pid_ = -1;
}

bool ProcessManager::has_exited() {
    if (started_pid_ <= 0) return true;

    int status;
    pid_t result = waitpid(started_pid_, &status, WNOHANG);
    if (result == 0) {
        return false;
    }

    if (result > 0) {
        if (WIFEXITED(status)) {
            fprintf(stderr, "Browser: PID %d exited with code %d\n", started_pid_, WEXITSTATUS(status));
        } else if (WIFSIGNALED(status)) {
            fprintf(stderr, "Browser: PID %d killed by signal %d\n", started_pid_, WTERMSIG(status));
        }
    }
    started_pid_ = -1;
    return true;
}

} // namespace browser
