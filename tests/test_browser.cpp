/*
 * Browser adapter tests (no browser required)
 */

#include "test_framework.h"
#include "browser/devtools_discovery.h"
#include "browser/devtools_page.h"
#include "browser/process_manager.h"
#include <algorithm>
#include <atomic>
#include <string>
#include <thread>
#include <vector>

using browser::LaunchOptions;
using browser::PageTarget;
using browser::ProcessManager;

static bool has_arg(const std::vector<std::string>& args, const std::string& arg) {
    return std::find(args.begin(), args.end(), arg) != args.end();
}

TEST(picks_first_page_target) {
    const char* body =
        "[{\"id\":\"W1\",\"type\":\"service_worker\",\"url\":\"chrome://x\","
        "\"webSocketDebuggerUrl\":\"ws://127.0.0.1:9222/devtools/page/W1\"},"
        "{\"id\":\"P1\",\"type\":\"page\",\"url\":\"about:blank\","
        "\"webSocketDebuggerUrl\":\"ws://127.0.0.1:9222/devtools/page/P1\"},"
        "{\"id\":\"P2\",\"type\":\"page\",\"url\":\"about:blank\","
        "\"webSocketDebuggerUrl\":\"ws://127.0.0.1:9222/devtools/page/P2\"}]";

    PageTarget target;
    ASSERT_TRUE(browser::parse_target_list(body, target));
    ASSERT_EQ(target.id, std::string("P1"));
    ASSERT_EQ(target.url, std::string("about:blank"));
    ASSERT_EQ(target.websocket_url, std::string("ws://127.0.0.1:9222/devtools/page/P1"));
}

TEST(page_without_debugger_url_is_skipped) {
    PageTarget target;
    ASSERT_FALSE(browser::parse_target_list("[{\"id\":\"P1\",\"type\":\"page\"}]", target));
    ASSERT_FALSE(browser::parse_target_list("[]", target));
    ASSERT_FALSE(browser::parse_target_list("{\"type\":\"page\"}", target));
    ASSERT_FALSE(browser::parse_target_list("garbage", target));
}

TEST(headless_launch_arguments) {
    LaunchOptions options;
    options.debug_port = 9555;
    options.width = 1024;
    options.height = 768;
    ProcessManager manager(options);

    std::vector<std::string> args = manager.build_arguments("/usr/bin/chromium");
    ASSERT_EQ(args.front(), std::string("/usr/bin/chromium"));
    ASSERT_EQ(args.back(), std::string("about:blank"));
    ASSERT_TRUE(has_arg(args, "--remote-debugging-port=9555"));
    ASSERT_TRUE(has_arg(args, "--window-size=1024,768"));
    ASSERT_TRUE(has_arg(args, "--headless=new"));
    ASSERT_TRUE(has_arg(args, "--user-data-dir=/tmp/browsercast-profile-9555"));
    ASSERT_FALSE(manager.is_running());
}

TEST(visible_launch_arguments) {
    LaunchOptions options;
    options.headless = false;
    options.profile_dir = "/tmp/custom-profile";
    ProcessManager manager(options);

    std::vector<std::string> args = manager.build_arguments("chrome");
    ASSERT_FALSE(has_arg(args, "--headless=new"));
    ASSERT_TRUE(has_arg(args, "--user-data-dir=/tmp/custom-profile"));
    ASSERT_TRUE(has_arg(args, "--remote-debugging-port=9222"));
}

TEST(missing_explicit_browser_is_not_found) {
    LaunchOptions options;
    options.executable = "/nonexistent/chromium";
    ProcessManager manager(options);

    ASSERT_EQ(manager.find_browser(), std::string(""));
    ASSERT_FALSE(manager.start());
    ASSERT_TRUE(manager.has_exited());
}

TEST(viewport_cache_is_never_torn) {
    browser::ViewportCache cache;
    stream::Viewport initial;
    initial.width = 1;
    initial.height = 2;
    cache.set(initial);

    std::atomic<bool> done(false);
    std::atomic<int> torn(0);

    // Writers always store height == 2 * width
    std::vector<std::thread> threads;
    for (int t = 0; t < 2; t++) {
        threads.emplace_back([&cache, t]() {
            for (int i = 1; i <= 20000; i++) {
                stream::Viewport vp;
                vp.width = i + t;
                vp.height = 2 * (i + t);
                cache.set(vp);
            }
        });
    }
    for (int t = 0; t < 2; t++) {
        threads.emplace_back([&cache, &done, &torn]() {
            while (!done) {
                stream::Viewport vp = cache.get();
                if (vp.height != 2 * vp.width) torn++;
            }
        });
    }

    threads[0].join();
    threads[1].join();
    done = true;
    threads[2].join();
    threads[3].join();

    ASSERT_EQ(torn.load(), 0);
    stream::Viewport last = cache.get();
    ASSERT_EQ(last.height, 2 * last.width);
}

int main() {
    return test_framework::run_all_tests("browser adapter");
}
