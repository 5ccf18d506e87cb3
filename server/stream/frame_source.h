/*
 * Frame Source Abstraction
 *
 * A live page that can be snapshotted and driven with input. The
 * production implementation talks to Chromium over DevTools
 * (browser::DevToolsPage); tests use an instrumented fake.
 *
 * Every call may block on I/O. Action methods return false when the
 * engine reports an error; the caller logs and moves on.
 */

#ifndef STREAM_FRAME_SOURCE_H
#define STREAM_FRAME_SOURCE_H

#include "frame.h"
#include <memory>
#include <string>
#include <vector>

namespace stream {

class FrameSource {
public:
    virtual ~FrameSource() = default;

    // Name for logging ("headless", "visible", ...)
    virtual const char* name() const = 0;

    // False once the underlying page is gone
    virtual bool is_available() const = 0;

    // Render the current page into a compressed frame
    virtual bool capture(Frame& out) = 0;

    virtual bool viewport_size(Viewport& out) = 0;

    // Empty string when unknown
    virtual std::string current_url() = 0;

    virtual bool click(int x, int y) = 0;
    virtual bool type_text(const std::string& text) = 0;
    virtual bool press_key(const std::string& key) = 0;
    virtual bool navigate(const std::string& url) = 0;
    virtual bool scroll_by(double dy) = 0;

    // Release the page; returns false if teardown reported an error
    virtual bool close() = 0;
};

using FrameSourcePtr = std::shared_ptr<FrameSource>;

/**
 * Acquires frame sources for a session
 *
 * acquire_primary() is required for streaming; acquire_mirrors() may
 * return an empty list.
 */
class FrameSourceProvider {
public:
    virtual ~FrameSourceProvider() = default;

    // nullptr on failure
    virtual FrameSourcePtr acquire_primary() = 0;

    virtual std::vector<FrameSourcePtr> acquire_mirrors() = 0;

    // Called once after all sources have been closed
    virtual void shutdown() {}
};

} // namespace stream

#endif // STREAM_FRAME_SOURCE_H
