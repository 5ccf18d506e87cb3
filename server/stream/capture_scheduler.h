/*
 * Capture Scheduler
 *
 * Fixed-rate loop on its own thread. While at least one viewer is
 * registered it captures the primary page and broadcasts the frame,
 * then sleeps 1/fps. With no viewers it re-checks every idle interval;
 * with no usable frame source it backs off for the retry interval.
 *
 * stop() interrupts a sleep immediately but lets a capture that is
 * already running finish.
 */

#ifndef STREAM_CAPTURE_SCHEDULER_H
#define STREAM_CAPTURE_SCHEDULER_H

#include "broadcaster.h"
#include "session_context.h"
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <mutex>
#include <thread>

namespace stream {

class CaptureScheduler {
public:
    struct Options {
        int fps = 5;
        int idle_interval_ms = 500;
        int retry_interval_ms = 1000;
        bool debug_frames = false;
    };

    enum class State {
        Stopped,
        Idle,          // No viewers
        Active,        // Capturing
        Unavailable,   // Viewers present, no usable frame source
    };

    CaptureScheduler(SessionContext& context, Broadcaster& broadcaster, const Options& options);
    ~CaptureScheduler();

    CaptureScheduler(const CaptureScheduler&) = delete;
    CaptureScheduler& operator=(const CaptureScheduler&) = delete;

    // Start the loop thread; no-op if already running
    void start();

    // Cancel the loop and join; safe to call repeatedly or before start()
    void stop();

    bool is_running() const { return running_; }
    State state() const { return state_; }

    struct Stats {
        uint64_t captures;
        uint64_t capture_failures;
    };
    Stats get_stats() const;

private:
    void run();

    // Interruptible sleep; returns false when stop was requested
    bool wait(std::chrono::milliseconds duration);

    SessionContext& context_;
    Broadcaster& broadcaster_;
    Options options_;

    std::thread thread_;
    std::mutex mutex_;
    std::condition_variable cv_;
    bool stop_requested_;
    std::atomic<bool> running_;
    std::atomic<State> state_;

    std::atomic<uint64_t> captures_{0};
    std::atomic<uint64_t> capture_failures_{0};
};

const char* scheduler_state_name(CaptureScheduler::State state);

} // namespace stream

#endif // STREAM_CAPTURE_SCHEDULER_H
