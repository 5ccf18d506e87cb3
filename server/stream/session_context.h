/*
 * Session Context
 *
 * State shared by the capture scheduler, the event pipeline and the
 * transport: the viewer registry and the currently acquired frame
 * sources. Owned by stream::Session and injected into each component.
 */

#ifndef STREAM_SESSION_CONTEXT_H
#define STREAM_SESSION_CONTEXT_H

#include "client_registry.h"
#include "frame_source.h"
#include <mutex>
#include <vector>

namespace stream {

class SessionContext {
public:
    explicit SessionContext(const Viewport& fallback_viewport = Viewport())
        : fallback_viewport_(fallback_viewport) {}

    ClientRegistry& registry() { return registry_; }
    const ClientRegistry& registry() const { return registry_; }

    // Reported when the primary cannot give its size
    const Viewport& fallback_viewport() const { return fallback_viewport_; }

    // nullptr while no primary is acquired
    FrameSourcePtr primary() const {
        std::lock_guard<std::mutex> lock(sources_mutex_);
        return primary_;
    }

    std::vector<FrameSourcePtr> mirrors() const {
        std::lock_guard<std::mutex> lock(sources_mutex_);
        return mirrors_;
    }

    void set_sources(const FrameSourcePtr& primary, const std::vector<FrameSourcePtr>& mirrors) {
        std::lock_guard<std::mutex> lock(sources_mutex_);
        primary_ = primary;
        mirrors_ = mirrors;
    }

    // Detach all sources and hand them back for release
    std::vector<FrameSourcePtr> take_sources() {
        std::lock_guard<std::mutex> lock(sources_mutex_);
        std::vector<FrameSourcePtr> all;
        if (primary_) all.push_back(primary_);
        all.insert(all.end(), mirrors_.begin(), mirrors_.end());
        primary_.reset();
        mirrors_.clear();
        return all;
    }

    /**
     * Current primary viewport, or the fallback if unavailable
     */
    Viewport current_viewport() const {
        FrameSourcePtr source = primary();
        Viewport vp;
        if (source && source->is_available() && source->viewport_size(vp) &&
            vp.width > 0 && vp.height > 0) {
            return vp;
        }
        return fallback_viewport_;
    }

private:
    ClientRegistry registry_;
    Viewport fallback_viewport_;

    mutable std::mutex sources_mutex_;
    FrameSourcePtr primary_;
    std::vector<FrameSourcePtr> mirrors_;
};

} // namespace stream

#endif // STREAM_SESSION_CONTEXT_H
