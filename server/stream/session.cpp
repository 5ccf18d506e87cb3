/*
 * Streaming Session Implementation
 */

#include "session.h"
#include "protocol.h"
#include <cstdio>

namespace stream {

Session::Session(FrameSourceProvider& provider, const Options& options)
    : provider_(provider)
    , options_(options)
    , context_(options.fallback_viewport)
    , broadcaster_(context_.registry(), options.debug_frames)
    , scheduler_(context_, broadcaster_, options.capture)
    , pipeline_(context_, broadcaster_, options.events)
    , started_(false)
    , streaming_(false)
{
}

Session::~Session() {
    stop();
}

bool Session::start() {
    std::lock_guard<std::mutex> lock(lifecycle_mutex_);
    if (started_) return streaming_;

    FrameSourcePtr primary;
    try {
        primary = provider_.acquire_primary();
    } catch (const std::exception& e) {
        fprintf(stderr, "Session: Failed to acquire primary frame source: %s\n", e.what());
    }

    std::vector<FrameSourcePtr> mirrors;
    if (primary) {
        try {
            mirrors = provider_.acquire_mirrors();
        } catch (const std::exception& e) {
            fprintf(stderr, "Session: Failed to acquire mirrors, continuing without: %s\n", e.what());
            mirrors.clear();
        }
    }

    context_.set_sources(primary, mirrors);
    pipeline_.start();

    if (primary) {
        scheduler_.start();
        streaming_ = true;
        fprintf(stderr, "Session: Streaming from %s (%zu mirror%s)\n",
                primary->name(), mirrors.size(), mirrors.size() == 1 ? "" : "s");
    } else {
        streaming_ = false;
        fprintf(stderr, "Session: Primary frame source not available; streaming disabled\n");
    }

    started_ = true;
    return streaming_;
}

void Session::stop() {
    std::lock_guard<std::mutex> lock(lifecycle_mutex_);
    if (!started_) return;

    scheduler_.stop();
    pipeline_.stop();

    std::vector<FrameSourcePtr> sources = context_.take_sources();
    for (const auto& source : sources) {
        bool ok = false;
        try {
            ok = source->close();
        } catch (const std::exception& e) {
            fprintf(stderr, "Session: Error releasing %s: %s\n", source->name(), e.what());
        }
        if (!ok) {
            fprintf(stderr, "Session: Release of %s reported an error\n", source->name());
        }
    }

    try {
        provider_.shutdown();
    } catch (const std::exception& e) {
        fprintf(stderr, "Session: Error during provider shutdown: %s\n", e.what());
    }

    streaming_ = false;
    started_ = false;
    fprintf(stderr, "Session: Stopped\n");
}

std::string Session::meta_message() const {
    FrameSourcePtr primary = context_.primary();
    std::string url;
    if (primary && primary->is_available()) {
        url = primary->current_url();
    }
    return make_meta_message(context_.current_viewport(), url);
}

void Session::on_client_connected(const ClientConnectionPtr& conn) {
    context_.registry().add(conn);
    if (options_.debug_connection) {
        fprintf(stderr, "Session: Client %s connected. Total: %zu\n",
                conn->id().c_str(), context_.registry().size());
    }

    std::string meta;
    try {
        meta = meta_message();
    } catch (const std::exception& e) {
        fprintf(stderr, "Session: Error building meta for %s: %s\n", conn->id().c_str(), e.what());
        meta = make_meta_message(context_.fallback_viewport(), "");
    }

    if (!conn->send_text(meta)) {
        fprintf(stderr, "Session: Error sending meta to client %s\n", conn->id().c_str());
    }
}

void Session::on_client_message(const ClientConnectionPtr& conn, const std::string& text) {
    ControlEvent event;
    std::string error;
    ParseResult result = parse_client_message(text, event, error);
    if (result != ParseResult::Ok) {
        fprintf(stderr, "Session: Bad message from client %s: %s\n", conn->id().c_str(), error.c_str());
        return;
    }

    pipeline_.submit(event);
}

void Session::on_client_disconnected(const ClientConnectionPtr& conn) {
    if (context_.registry().remove(conn) && options_.debug_connection) {
        fprintf(stderr, "Session: Client %s disconnected. Total: %zu\n",
                conn->id().c_str(), context_.registry().size());
    }
}

} // namespace stream
