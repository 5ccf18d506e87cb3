/*
 * Streaming Session
 *
 * Owns the session context and the three moving parts (broadcaster,
 * capture scheduler, event pipeline) and ties their lifetime to the
 * frame sources handed out by a FrameSourceProvider.
 *
 * If no primary source can be acquired the session still starts: the
 * transport keeps accepting viewers, the scheduler stays off and every
 * event is reported as unavailable.
 */

#ifndef STREAM_SESSION_H
#define STREAM_SESSION_H

#include "broadcaster.h"
#include "capture_scheduler.h"
#include "event_pipeline.h"
#include "frame_source.h"
#include "session_context.h"
#include <atomic>
#include <mutex>
#include <string>

namespace stream {

class Session {
public:
    struct Options {
        Viewport fallback_viewport;
        CaptureScheduler::Options capture;
        EventPipeline::Options events;
        bool debug_connection = false;
        bool debug_frames = false;
    };

    Session(FrameSourceProvider& provider, const Options& options);
    ~Session();

    Session(const Session&) = delete;
    Session& operator=(const Session&) = delete;

    /**
     * Acquire frame sources and start the loops
     * @return true if streaming is enabled (primary source acquired)
     */
    bool start();

    /**
     * Cancel the scheduler, drain the pipeline and release all sources
     * Release failures are logged; the remaining sources are still released.
     */
    void stop();

    bool is_started() const { return started_; }
    bool is_streaming() const { return streaming_; }

    SessionContext& context() { return context_; }
    ClientRegistry& registry() { return context_.registry(); }
    Broadcaster& broadcaster() { return broadcaster_; }
    CaptureScheduler& scheduler() { return scheduler_; }
    EventPipeline& pipeline() { return pipeline_; }

    // Meta message describing the primary page (fallback viewport, empty URL if none)
    std::string meta_message() const;

    // Transport hooks
    void on_client_connected(const ClientConnectionPtr& conn);
    void on_client_message(const ClientConnectionPtr& conn, const std::string& text);
    void on_client_disconnected(const ClientConnectionPtr& conn);

private:
    FrameSourceProvider& provider_;
    Options options_;

    SessionContext context_;
    Broadcaster broadcaster_;
    CaptureScheduler scheduler_;
    EventPipeline pipeline_;

    std::mutex lifecycle_mutex_;
    std::atomic<bool> started_;
    std::atomic<bool> streaming_;
};

} // namespace stream

#endif // STREAM_SESSION_H
