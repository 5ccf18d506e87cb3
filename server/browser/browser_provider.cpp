/*
 * Browser Provider Implementation
 */

#include "browser_provider.h"
#include "devtools_discovery.h"
#include "devtools_page.h"
#include "process_manager.h"
#include <cstdio>

namespace browser {

BrowserProvider::BrowserProvider(const Options& options)
    : options_(options)
{
}

std::shared_ptr<DevToolsPage> BrowserProvider::launch(const std::string& name, int port, bool headless) {
    LaunchOptions launch;
    launch.executable = options_.browser_path;
    launch.debug_port = port;
    launch.headless = headless;
    launch.width = options_.viewport.width;
    launch.height = options_.viewport.height;

    std::unique_ptr<ProcessManager> process(new ProcessManager(launch));
    if (!process->start()) {
        return nullptr;
    }

    ProcessManager* proc = process.get();
    PageTarget target;
    if (!wait_for_page_target(port, options_.startup_timeout_ms, target,
                              [proc]() { return proc->has_exited(); })) {
        fprintf(stderr, "Browser: [%s] No DevTools page target, giving up\n", name.c_str());
        return nullptr;  // process stopped by its destructor
    }

    std::shared_ptr<DevToolsPage> page = std::make_shared<DevToolsPage>(
        name, std::move(process), options_.call_timeout_ms, options_.debug);
    if (!page->open(target, options_.viewport, options_.start_url)) {
        page->close();
        return nullptr;
    }
    return page;
}

stream::FrameSourcePtr BrowserProvider::acquire_primary() {
    return launch("headless", options_.debug_port, true);
}

std::vector<stream::FrameSourcePtr> BrowserProvider::acquire_mirrors() {
    std::vector<stream::FrameSourcePtr> mirrors;
    if (!options_.mirror) {
        return mirrors;
    }

    std::shared_ptr<DevToolsPage> visible = launch("visible", options_.mirror_debug_port, false);
    if (visible) {
        mirrors.push_back(visible);
    } else {
        fprintf(stderr, "Browser: Visible mirror unavailable, continuing headless only\n");
    }
    return mirrors;
}

void BrowserProvider::shutdown() {
    fprintf(stderr, "Browser: All browsers released\n");
}

} // namespace browser
