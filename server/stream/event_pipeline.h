/*
 * Event Pipeline
 *
 * Viewer input is submitted from the WebSocket thread without waiting.
 * Worker threads pick events up concurrently, but every application
 * runs behind a single gate, so the page only ever sees one action at
 * a time no matter how many viewers are typing.
 *
 * Under the gate each event is translated against the current viewport,
 * applied to the primary page, replayed best-effort on each mirror, and
 * followed by an immediate capture + broadcast so the viewer sees the
 * result without waiting for the next scheduled frame.
 */

#ifndef STREAM_EVENT_PIPELINE_H
#define STREAM_EVENT_PIPELINE_H

#include "broadcaster.h"
#include "protocol.h"
#include "session_context.h"
#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace stream {

// A control event resolved to page coordinates/values
struct PageAction {
    enum Kind {
        CLICK,
        TYPE_TEXT,
        PRESS_KEY,
        NAVIGATE,
        SCROLL,
    };

    Kind kind = CLICK;
    int x = 0;
    int y = 0;
    std::string text;    // typed text, key name or URL
    double dy = 0.0;
};

// Prepends "http://" unless the URL already starts with http:// or https://
std::string normalize_url(const std::string& url);

// delta_y * viewport_height / client_height, or delta_y when client_height is 0
double scale_wheel_delta(double delta_y, double client_height, int viewport_height);

// Number of UTF-8 code points (continuation bytes are not counted)
size_t utf8_length(const std::string& s);

/**
 * Resolve an event against a viewport
 * @return false if the event carries nothing to apply (empty key or URL)
 */
bool translate_event(const ControlEvent& event, const Viewport& viewport, PageAction& out);

// Run one action against a source
bool apply_action(FrameSource& source, const PageAction& action);

class EventPipeline {
public:
    struct Options {
        int workers = 4;
        bool debug_events = false;
    };

    enum class ApplyResult {
        Applied,
        Ignored,        // Nothing to do (empty key/URL)
        Unavailable,    // No primary frame source
        Failed,         // Primary rejected the action
    };

    EventPipeline(SessionContext& context, Broadcaster& broadcaster, const Options& options);
    ~EventPipeline();

    EventPipeline(const EventPipeline&) = delete;
    EventPipeline& operator=(const EventPipeline&) = delete;

    // Spawn workers; no-op if already running
    void start();

    // Finish queued events, then join the workers
    void stop();

    bool is_running() const { return running_; }

    /**
     * Queue an event for application and return immediately
     * @return false if the pipeline is not running (event dropped)
     */
    bool submit(const ControlEvent& event);

    // Apply on the calling thread, still behind the gate
    ApplyResult apply(const ControlEvent& event);

    // Block until every submitted event has been processed
    void wait_idle();

    struct Stats {
        uint64_t submitted;
        uint64_t applied;
        uint64_t ignored;
        uint64_t unavailable;
        uint64_t failed;
        uint64_t mirror_failures;
        uint64_t refresh_broadcasts;
    };
    Stats get_stats() const;

private:
    void worker_loop();
    ApplyResult apply_gated(const ControlEvent& event);
    void refresh_viewers(FrameSource& primary);

    SessionContext& context_;
    Broadcaster& broadcaster_;
    Options options_;

    // Serializes every page mutation
    std::mutex gate_;

    std::mutex queue_mutex_;
    std::condition_variable queue_cv_;
    std::condition_variable idle_cv_;
    std::deque<ControlEvent> queue_;
    size_t in_flight_;
    bool stopping_;
    std::atomic<bool> running_;
    std::vector<std::thread> workers_;

    std::atomic<uint64_t> submitted_{0};
    std::atomic<uint64_t> applied_{0};
    std::atomic<uint64_t> ignored_{0};
    std::atomic<uint64_t> unavailable_{0};
    std::atomic<uint64_t> failed_{0};
    std::atomic<uint64_t> mirror_failures_{0};
    std::atomic<uint64_t> refresh_broadcasts_{0};
};

const char* apply_result_name(EventPipeline::ApplyResult result);

} // namespace stream

#endif // STREAM_EVENT_PIPELINE_H
