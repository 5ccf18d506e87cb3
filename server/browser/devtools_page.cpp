/*
 * DevTools Page Implementation
 */

#include "devtools_page.h"
#include "../utils/base64.h"
#include "../utils/keyboard_map.h"
#include <chrono>
#include <cstdio>
#include <thread>

namespace browser {

using json_utils::json;

static const int SCREENSHOT_QUALITY = 60;
static const int LOAD_TIMEOUT_MS = 15000;

DevToolsPage::DevToolsPage(const std::string& name, std::unique_ptr<ProcessManager> process,
                           int call_timeout_ms, bool debug)
    : name_(name)
    , process_(std::move(process))
    , client_(call_timeout_ms, debug)
    , debug_(debug)
    , closed_(false)
{
}

DevToolsPage::~DevToolsPage() {
    close();
}

bool DevToolsPage::open(const PageTarget& target, const stream::Viewport& viewport,
                        const std::string& start_url) {
    if (!client_.connect(target.websocket_url)) {
        return false;
    }

    client_.call("Page.enable", json::object());

    json metrics;
    metrics["width"] = viewport.width;
    metrics["height"] = viewport.height;
    metrics["deviceScaleFactor"] = 1;
    metrics["mobile"] = false;
    if (!client_.call("Emulation.setDeviceMetricsOverride", metrics)) {
        fprintf(stderr, "DevTools: [%s] Could not set viewport %dx%d\n",
                name_.c_str(), viewport.width, viewport.height);
        client_.disconnect();
        return false;
    }
    viewport_.set(viewport);

    if (!start_url.empty() && !navigate(start_url)) {
        fprintf(stderr, "DevTools: [%s] Start URL %s did not load\n",
                name_.c_str(), start_url.c_str());
    }

    fprintf(stderr, "DevTools: [%s] Page ready (%dx%d)\n",
            name_.c_str(), viewport.width, viewport.height);
    return true;
}

bool DevToolsPage::is_available() const {
    return !closed_ && client_.is_connected();
}

bool DevToolsPage::capture(stream::Frame& out) {
    json params;
    params["format"] = "jpeg";
    params["quality"] = SCREENSHOT_QUALITY;

    json result;
    if (!client_.call("Page.captureScreenshot", params, result)) {
        return false;
    }

    std::string data = json_utils::get_string(result, "data");
    if (data.empty() || !base64::decode(data, out.image)) {
        fprintf(stderr, "DevTools: [%s] Screenshot reply carried no image\n", name_.c_str());
        return false;
    }

    stream::Viewport vp;
    if (!viewport_size(vp)) {
        vp = viewport_.get();
    }
    out.mime = "image/jpeg";
    out.width = vp.width;
    out.height = vp.height;
    return true;
}

bool DevToolsPage::viewport_size(stream::Viewport& out) {
    json result;
    if (!client_.call("Page.getLayoutMetrics", json::object(), result)) {
        return false;
    }

    // cssLayoutViewport is in CSS pixels; layoutViewport on older builds
    const char* keys[] = { "cssLayoutViewport", "layoutViewport" };
    for (const char* key : keys) {
        if (!result.contains(key)) continue;
        const json& lv = result[key];
        int w = json_utils::get_int(lv, "clientWidth");
        int h = json_utils::get_int(lv, "clientHeight");
        if (w > 0 && h > 0) {
            out.width = w;
            out.height = h;
            viewport_.set(out);
            return true;
        }
    }
    return false;
}

std::string DevToolsPage::current_url() {
    json result;
    if (!client_.call("Page.getNavigationHistory", json::object(), result)) {
        return "";
    }

    int index = json_utils::get_int(result, "currentIndex", -1);
    if (!result.contains("entries") || !result["entries"].is_array()) {
        return "";
    }
    const json& entries = result["entries"];
    if (index < 0 || index >= static_cast<int>(entries.size())) {
        return "";
    }
    return json_utils::get_string(entries[index], "url");
}

bool DevToolsPage::mouse_event(const char* type, int x, int y) {
    json params;
    params["type"] = type;
    params["x"] = x;
    params["y"] = y;
    params["button"] = "left";
    params["clickCount"] = 1;
    return client_.call("Input.dispatchMouseEvent", params);
}

bool DevToolsPage::click(int x, int y) {
    if (debug_) {
        fprintf(stderr, "DevTools: [%s] click %d,%d\n", name_.c_str(), x, y);
    }
    return mouse_event("mouseMoved", x, y) &&
           mouse_event("mousePressed", x, y) &&
           mouse_event("mouseReleased", x, y);
}

bool DevToolsPage::type_text(const std::string& text) {
    json params;
    params["text"] = text;
    return client_.call("Input.insertText", params);
}

bool DevToolsPage::key_event(const char* type, const std::string& key) {
    json params;
    params["type"] = type;
    params["key"] = key;

    keyboard_map::KeyInfo info;
    if (keyboard_map::lookup_named_key(key, info)) {
        params["key"] = info.key;
        params["code"] = info.code;
        params["windowsVirtualKeyCode"] = info.virtual_keycode;
        params["nativeVirtualKeyCode"] = info.virtual_keycode;
        if (!info.text.empty() && std::string(type) == "keyDown") {
            params["text"] = info.text;
            params["unmodifiedText"] = info.text;
        }
    }
    return client_.call("Input.dispatchKeyEvent", params);
}

bool DevToolsPage::press_key(const std::string& key) {
    keyboard_map::KeyInfo info;
    bool known = keyboard_map::lookup_named_key(key, info);

    // Non-printing keys go down as rawKeyDown
    const char* down = (known && !info.text.empty()) ? "keyDown" : "rawKeyDown";
    return key_event(down, key) && key_event("keyUp", key);
}

bool DevToolsPage::wait_for_load(int timeout_ms) {
    auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(timeout_ms);
    json params;
    params["expression"] = "document.readyState";
    params["returnByValue"] = true;

    while (std::chrono::steady_clock::now() < deadline) {
        json result;
        if (!client_.call("Runtime.evaluate", params, result)) {
            return false;
        }
        if (result.contains("result") &&
            json_utils::get_string(result["result"], "value") == "complete") {
            return true;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
    }
    return false;
}

bool DevToolsPage::navigate(const std::string& url) {
    json params;
    params["url"] = url;

    json result;
    std::string error;
    if (!client_.call("Page.navigate", params, result, &error)) {
        return false;
    }

    std::string nav_error = json_utils::get_string(result, "errorText");
    if (!nav_error.empty()) {
        fprintf(stderr, "DevTools: [%s] Navigation to %s failed: %s\n",
                name_.c_str(), url.c_str(), nav_error.c_str());
        return false;
    }

    if (!wait_for_load(LOAD_TIMEOUT_MS)) {
        fprintf(stderr, "DevTools: [%s] %s did not finish loading\n", name_.c_str(), url.c_str());
        return false;
    }
    return true;
}

bool DevToolsPage::scroll_by(double dy) {
    char expression[96];
    snprintf(expression, sizeof(expression), "window.scrollBy(0, %.3f)", dy);

    json params;
    params["expression"] = expression;
    json result;
    if (!client_.call("Runtime.evaluate", params, result)) {
        return false;
    }
    if (result.contains("exceptionDetails")) {
        fprintf(stderr, "DevTools: [%s] scrollBy threw\n", name_.c_str());
        return false;
    }
    return true;
}

bool DevToolsPage::close() {
    bool expected = false;
    if (!closed_.compare_exchange_strong(expected, true)) {
        return true;
    }

    client_.disconnect();

    bool clean = true;
    if (process_) {
        if (process_->has_exited()) {
            fprintf(stderr, "Browser: [%s] Process was already gone\n", name_.c_str());
            clean = false;
        } else {
            process_->stop();
        }
        process_.reset();
    }
    return clean;
}

} // namespace browser
