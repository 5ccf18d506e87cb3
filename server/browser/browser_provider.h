/*
 * Browser Provider
 *
 * Launches Chromium instances and hands them to the session as frame
 * sources: a headless primary that feeds the stream and, optionally, a
 * visible mirror that replays the same input for an operator.
 */

#ifndef BROWSER_BROWSER_PROVIDER_H
#define BROWSER_BROWSER_PROVIDER_H

#include "../stream/frame_source.h"
#include <memory>
#include <string>
#include <vector>

namespace browser {

class DevToolsPage;

class BrowserProvider : public stream::FrameSourceProvider {
public:
    struct Options {
        std::string browser_path;
        std::string start_url = "https://example.com";
        stream::Viewport viewport;
        int debug_port = 9222;
        bool mirror = true;
        int mirror_debug_port = 9223;
        int call_timeout_ms = 10000;
        int startup_timeout_ms = 20000;   // Launch until page target shows up
        bool debug = false;
    };

    explicit BrowserProvider(const Options& options);

    stream::FrameSourcePtr acquire_primary() override;
    std::vector<stream::FrameSourcePtr> acquire_mirrors() override;
    void shutdown() override;

private:
    std::shared_ptr<DevToolsPage> launch(const std::string& name, int port, bool headless);

    Options options_;
};

} // namespace browser

#endif // BROWSER_BROWSER_PROVIDER_H
