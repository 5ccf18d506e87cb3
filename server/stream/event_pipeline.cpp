/*
 * Event Pipeline Implementation
 */

#include "event_pipeline.h"
#include <algorithm>
#include <cctype>
#include <cstdio>

namespace stream {

static bool has_prefix_nocase(const std::string& s, const char* prefix) {
    size_t i = 0;
    for (; prefix[i]; i++) {
        if (i >= s.size()) return false;
        if (tolower(static_cast<unsigned char>(s[i])) != prefix[i]) return false;
    }
    return true;
}

std::string normalize_url(const std::string& url) {
    if (has_prefix_nocase(url, "http://") || has_prefix_nocase(url, "https://")) {
        return url;
    }
    return "http://" + url;
}

double scale_wheel_delta(double delta_y, double client_height, int viewport_height) {
    if (client_height == 0.0) {
        return delta_y;
    }
    return delta_y * (static_cast<double>(viewport_height) / client_height);
}

size_t utf8_length(const std::string& s) {
    size_t n = 0;
    for (unsigned char c : s) {
        if ((c & 0xC0) != 0x80) n++;
    }
    return n;
}

bool translate_event(const ControlEvent& event, const Viewport& viewport, PageAction& out) {
    switch (event.type) {
        case ControlEventType::Click:
            out.kind = PageAction::CLICK;
            out.x = static_cast<int>(event.x_ratio * viewport.width);
            out.y = static_cast<int>(event.y_ratio * viewport.height);
            return true;

        case ControlEventType::Key:
            if (event.value.empty()) return false;
            out.kind = (utf8_length(event.value) == 1) ? PageAction::TYPE_TEXT : PageAction::PRESS_KEY;
            out.text = event.value;
            return true;

        case ControlEventType::Navigate:
            if (event.value.empty()) return false;
            out.kind = PageAction::NAVIGATE;
            out.text = normalize_url(event.value);
            return true;

        case ControlEventType::Wheel:
            out.kind = PageAction::SCROLL;
            out.dy = scale_wheel_delta(event.delta_y, event.client_height, viewport.height);
            return true;
    }
    return false;
}

bool apply_action(FrameSource& source, const PageAction& action) {
    switch (action.kind) {
        case PageAction::CLICK:     return source.click(action.x, action.y);
        case PageAction::TYPE_TEXT: return source.type_text(action.text);
        case PageAction::PRESS_KEY: return source.press_key(action.text);
        case PageAction::NAVIGATE:  return source.navigate(action.text);
        case PageAction::SCROLL:    return source.scroll_by(action.dy);
    }
    return false;
}

EventPipeline::EventPipeline(SessionContext& context, Broadcaster& broadcaster,
                             const Options& options)
    : context_(context)
    , broadcaster_(broadcaster)
    , options_(options)
    , in_flight_(0)
    , stopping_(false)
    , running_(false)
{
}

EventPipeline::~EventPipeline() {
    stop();
}

void EventPipeline::start() {
    if (running_) return;

    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        stopping_ = false;
    }
    running_ = true;

    int count = std::max(1, options_.workers);
    for (int i = 0; i < count; i++) {
        workers_.emplace_back(&EventPipeline::worker_loop, this);
    }

    fprintf(stderr, "Events: Pipeline started with %d workers\n", count);
}

void EventPipeline::stop() {
    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        stopping_ = true;
    }
    queue_cv_.notify_all();

    bool joined = false;
    for (auto& worker : workers_) {
        if (worker.joinable()) {
            worker.join();
            joined = true;
        }
    }
    workers_.clear();
    running_ = false;

    if (joined) {
        fprintf(stderr, "Events: Pipeline stopped\n");
    }
}

bool EventPipeline::submit(const ControlEvent& event) {
    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        if (!running_ || stopping_) {
            fprintf(stderr, "Events: Pipeline not running, dropping %s event\n",
                    event_name(event.type));
            return false;
        }
        queue_.push_back(event);
    }
    submitted_++;
    queue_cv_.notify_one();
    return true;
}

void EventPipeline::wait_idle() {
    std::unique_lock<std::mutex> lock(queue_mutex_);
    idle_cv_.wait(lock, [this]() { return queue_.empty() && in_flight_ == 0; });
}

void EventPipeline::worker_loop() {
    while (true) {
        ControlEvent event;
        {
            std::unique_lock<std::mutex> lock(queue_mutex_);
            queue_cv_.wait(lock, [this]() { return stopping_ || !queue_.empty(); });
            if (queue_.empty()) {
                // stopping_ and drained
                return;
            }
            event = queue_.front();
            queue_.pop_front();
            in_flight_++;
        }

        apply(event);

        {
            std::lock_guard<std::mutex> lock(queue_mutex_);
            in_flight_--;
            if (queue_.empty() && in_flight_ == 0) {
                idle_cv_.notify_all();
            }
        }
    }
}

EventPipeline::ApplyResult EventPipeline::apply(const ControlEvent& event) {
    ApplyResult result = ApplyResult::Failed;

    // The gate is released on every path, including exceptions
    std::lock_guard<std::mutex> gate(gate_);
    try {
        result = apply_gated(event);
    } catch (const std::exception& e) {
        fprintf(stderr, "Events: Error handling %s event: %s\n", event_name(event.type), e.what());
        result = ApplyResult::Failed;
    }

    switch (result) {
        case ApplyResult::Applied:     applied_++; break;
        case ApplyResult::Ignored:     ignored_++; break;
        case ApplyResult::Unavailable: unavailable_++; break;
        case ApplyResult::Failed:      failed_++; break;
    }

    if (options_.debug_events) {
        fprintf(stderr, "Events: %s -> %s\n", event_name(event.type), apply_result_name(result));
    }
    return result;
}

EventPipeline::ApplyResult EventPipeline::apply_gated(const ControlEvent& event) {
    FrameSourcePtr primary = context_.primary();
    if (!primary || !primary->is_available()) {
        fprintf(stderr, "Events: No frame source to handle %s event\n", event_name(event.type));
        return ApplyResult::Unavailable;
    }

    Viewport viewport;
    if (!primary->viewport_size(viewport) || viewport.width <= 0 || viewport.height <= 0) {
        viewport = context_.fallback_viewport();
    }

    PageAction action;
    if (!translate_event(event, viewport, action)) {
        return ApplyResult::Ignored;
    }

    if (options_.debug_events) {
        fprintf(stderr, "Events: Applying %s (x=%d y=%d text='%s' dy=%.1f) on %dx%d\n",
                event_name(event.type), action.x, action.y, action.text.c_str(), action.dy,
                viewport.width, viewport.height);
    }

    if (!apply_action(*primary, action)) {
        fprintf(stderr, "Events: %s event failed on %s\n", event_name(event.type), primary->name());
        return ApplyResult::Failed;
    }

    // Mirrors are best effort, each one on its own
    for (const auto& mirror : context_.mirrors()) {
        if (!mirror || !mirror->is_available()) continue;
        bool ok = false;
        try {
            ok = apply_action(*mirror, action);
        } catch (const std::exception& e) {
            fprintf(stderr, "Events: Mirror %s threw: %s\n", mirror->name(), e.what());
        }
        if (!ok) {
            mirror_failures_++;
            fprintf(stderr, "Events: %s event failed on mirror %s (ignored)\n",
                    event_name(event.type), mirror->name());
        }
    }

    refresh_viewers(*primary);
    return ApplyResult::Applied;
}

void EventPipeline::refresh_viewers(FrameSource& primary) {
    Frame frame;
    bool captured = false;
    try {
        captured = primary.capture(frame);
    } catch (const std::exception& e) {
        fprintf(stderr, "Events: Capture after event threw: %s\n", e.what());
    }

    if (!captured) {
        fprintf(stderr, "Events: Failed to capture frame after event\n");
        return;
    }

    broadcaster_.broadcast(frame);
    refresh_broadcasts_++;
}

EventPipeline::Stats EventPipeline::get_stats() const {
    Stats stats;
    stats.submitted = submitted_.load();
    stats.applied = applied_.load();
    stats.ignored = ignored_.load();
    stats.unavailable = unavailable_.load();
    stats.failed = failed_.load();
    stats.mirror_failures = mirror_failures_.load();
    stats.refresh_broadcasts = refresh_broadcasts_.load();
    return stats;
}

const char* apply_result_name(EventPipeline::ApplyResult result) {
    switch (result) {
        case EventPipeline::ApplyResult::Applied:     return "applied";
        case EventPipeline::ApplyResult::Ignored:     return "ignored";
        case EventPipeline::ApplyResult::Unavailable: return "unavailable";
        case EventPipeline::ApplyResult::Failed:      return "failed";
    }
    return "unknown";
}

} // namespace stream
