/*
 * Capture Scheduler Implementation
 */

#include "capture_scheduler.h"
#include <algorithm>
#include <cstdio>

namespace stream {

CaptureScheduler::CaptureScheduler(SessionContext& context, Broadcaster& broadcaster,
                                   const Options& options)
    : context_(context)
    , broadcaster_(broadcaster)
    , options_(options)
    , stop_requested_(false)
    , running_(false)
    , state_(State::Stopped)
{
}

CaptureScheduler::~CaptureScheduler() {
    stop();
}

void CaptureScheduler::start() {
    if (running_) return;

    {
        std::lock_guard<std::mutex> lock(mutex_);
        stop_requested_ = false;
    }
    running_ = true;
    state_ = State::Idle;
    thread_ = std::thread(&CaptureScheduler::run, this);

    fprintf(stderr, "Capture: Loop started (fps=%d)\n", std::max(1, options_.fps));
}

void CaptureScheduler::stop() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stop_requested_ = true;
    }
    cv_.notify_all();

    if (thread_.joinable()) {
        thread_.join();
        fprintf(stderr, "Capture: Loop stopped\n");
    }

    running_ = false;
    state_ = State::Stopped;
}

bool CaptureScheduler::wait(std::chrono::milliseconds duration) {
    std::unique_lock<std::mutex> lock(mutex_);
    cv_.wait_for(lock, duration, [this]() { return stop_requested_; });
    return !stop_requested_;
}

void CaptureScheduler::run() {
    const auto frame_interval = std::chrono::milliseconds(1000 / std::max(1, options_.fps));
    const auto idle_interval = std::chrono::milliseconds(options_.idle_interval_ms);
    const auto retry_interval = std::chrono::milliseconds(options_.retry_interval_ms);

    bool warned_unavailable = false;

    while (true) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (stop_requested_) break;
        }

        if (context_.registry().empty()) {
            state_ = State::Idle;
            if (!wait(idle_interval)) break;
            continue;
        }

        FrameSourcePtr source = context_.primary();
        if (!source || !source->is_available()) {
            if (!warned_unavailable) {
                fprintf(stderr, "Capture: Frame source not available, retrying every %d ms\n",
                        options_.retry_interval_ms);
                warned_unavailable = true;
            }
            state_ = State::Unavailable;
            if (!wait(retry_interval)) break;
            continue;
        }

        if (warned_unavailable) {
            fprintf(stderr, "Capture: Frame source available again\n");
            warned_unavailable = false;
        }
        state_ = State::Active;

        Frame frame;
        bool captured = false;
        try {
            captured = source->capture(frame);
        } catch (const std::exception& e) {
            fprintf(stderr, "Capture: Error during capture: %s\n", e.what());
        }

        if (captured) {
            captures_++;
            size_t delivered = broadcaster_.broadcast(frame);
            if (options_.debug_frames) {
                fprintf(stderr, "Capture: Frame #%llu delivered to %zu clients\n",
                        static_cast<unsigned long long>(captures_.load()), delivered);
            }
        } else {
            capture_failures_++;
            fprintf(stderr, "Capture: Capture from %s failed\n", source->name());
        }

        if (!wait(frame_interval)) break;
    }

    state_ = State::Stopped;
}

CaptureScheduler::Stats CaptureScheduler::get_stats() const {
    Stats stats;
    stats.captures = captures_.load();
    stats.capture_failures = capture_failures_.load();
    return stats;
}

const char* scheduler_state_name(CaptureScheduler::State state) {
    switch (state) {
        case CaptureScheduler::State::Stopped:     return "stopped";
        case CaptureScheduler::State::Idle:        return "idle";
        case CaptureScheduler::State::Active:      return "active";
        case CaptureScheduler::State::Unavailable: return "unavailable";
    }
    return "unknown";
}

} // namespace stream
