/*
 * DevTools Target Discovery
 *
 * A freshly started browser announces its tabs on
 * http://127.0.0.1:<port>/json/list. We poll that endpoint until a
 * "page" target with a WebSocket debugger URL shows up.
 */

#ifndef BROWSER_DEVTOOLS_DISCOVERY_H
#define BROWSER_DEVTOOLS_DISCOVERY_H

#include <functional>
#include <string>

namespace browser {

struct PageTarget {
    std::string id;
    std::string url;
    std::string websocket_url;
};

/**
 * Pick the first page target out of a /json/list response
 * @return false if the text is not a target list or has no page
 */
bool parse_target_list(const std::string& body, PageTarget& out);

/**
 * Fetch /json/list once
 * @param error Reason on failure
 */
bool fetch_page_target(int port, PageTarget& out, std::string& error);

/**
 * Poll until a page target appears
 * @param should_abort Checked between attempts (e.g. browser process died)
 */
bool wait_for_page_target(int port, int timeout_ms, PageTarget& out,
                          const std::function<bool()>& should_abort);

} // namespace browser

#endif // BROWSER_DEVTOOLS_DISCOVERY_H
