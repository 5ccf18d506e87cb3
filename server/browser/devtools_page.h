/*
 * DevTools Page
 *
 * stream::FrameSource backed by one Chromium tab. Owns the browser
 * process it was started from, so closing the page also stops the
 * browser.
 */

#ifndef BROWSER_DEVTOOLS_PAGE_H
#define BROWSER_DEVTOOLS_PAGE_H

#include "../stream/frame_source.h"
#include "devtools_client.h"
#include "devtools_discovery.h"
#include "process_manager.h"
#include <atomic>
#include <memory>
#include <mutex>
#include <string>

namespace browser {

// Last known viewport, shared by the scheduler, pipeline workers and the
// service thread
class ViewportCache {
public:
    stream::Viewport get() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return viewport_;
    }
    void set(const stream::Viewport& viewport) {
        std::lock_guard<std::mutex> lock(mutex_);
        viewport_ = viewport;
    }

private:
    mutable std::mutex mutex_;
    ViewportCache viewport_;
};

class DevToolsPage : public stream::FrameSource {
public:
    DevToolsPage(const std::string& name, std::unique_ptr<ProcessManager> process,
                 int call_timeout_ms, bool debug);
    ~DevToolsPage() override;

    /**
     * Attach to a discovered tab, size it and load the start URL
     * @return false if the tab could not be attached or sized. A failed
     *         start URL load is logged but does not fail the open.
     */
    bool open(const PageTarget& target, const stream::Viewport& viewport,
              const std::string& start_url);

    // FrameSource
    const char* name() const override { return name_.c_str(); }
    bool is_available() const override;
    bool capture(stream::Frame& out) override;
    bool viewport_size(stream::Viewport& out) override;
    std::string current_url() override;
    bool click(int x, int y) override;
    bool type_text(const std::string& text) override;
    bool press_key(const std::string& key) override;
    bool navigate(const std::string& url) override;
    bool scroll_by(double dy) override;
    bool close() override;

private:
    bool mouse_event(const char* type, int x, int y);
    bool key_event(const char* type, const std::string& key);
    bool wait_for_load(int timeout_ms);

    std::string name_;
    std::unique_ptr<ProcessManager> process_;
    DevToolsClient client_;
    bool debug_;
    std::atomic<bool> closed_;
    ViewportCache viewport_;
};

} // namespace browser

#endif // BROWSER_DEVTOOLS_PAGE_H
