/*
 * Capture scheduler tests
 */

#include "test_framework.h"
#include "test_fakes.h"
#include "stream/broadcaster.h"
#include "stream/capture_scheduler.h"
#include "stream/session_context.h"
#include <chrono>
#include <memory>
#include <thread>

using stream::Broadcaster;
using stream::CaptureScheduler;
using stream::SessionContext;

static CaptureScheduler::Options fast_options(int idle_ms = 20) {
    CaptureScheduler::Options options;
    options.fps = 50;
    options.idle_interval_ms = idle_ms;
    options.retry_interval_ms = 20;
    return options;
}

TEST(no_capture_while_registry_empty) {
    SessionContext context;
    auto source = std::make_shared<FakeFrameSource>();
    context.set_sources(source, {});
    Broadcaster broadcaster(context.registry());
    CaptureScheduler scheduler(context, broadcaster, fast_options());

    scheduler.start();
    std::this_thread::sleep_for(std::chrono::milliseconds(150));
    ASSERT_EQ(source->captures(), 0);
    ASSERT_TRUE(scheduler.state() == CaptureScheduler::State::Idle);
    scheduler.stop();

    ASSERT_EQ(source->captures(), 0);
    ASSERT_TRUE(scheduler.state() == CaptureScheduler::State::Stopped);
}

TEST(resumes_within_one_idle_interval) {
    const int idle_ms = 200;
    SessionContext context;
    auto source = std::make_shared<FakeFrameSource>();
    context.set_sources(source, {});
    Broadcaster broadcaster(context.registry());
    CaptureScheduler scheduler(context, broadcaster, fast_options(idle_ms));

    scheduler.start();
    std::this_thread::sleep_for(std::chrono::milliseconds(50));

    auto client = std::make_shared<FakeConnection>("viewer");
    auto registered_at = std::chrono::steady_clock::now();
    context.registry().add(client);

    ASSERT_TRUE(wait_until([&]() { return source->captures() > 0; }, idle_ms + 300));
    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - registered_at).count();
    ASSERT_TRUE(elapsed <= idle_ms + 100);

    ASSERT_TRUE(wait_until([&]() { return client->sent_count() > 0; }, 500));
    scheduler.stop();
}

TEST(streams_frames_to_viewers) {
    SessionContext context;
    auto source = std::make_shared<FakeFrameSource>();
    context.set_sources(source, {});
    Broadcaster broadcaster(context.registry());
    CaptureScheduler scheduler(context, broadcaster, fast_options());
    auto client = std::make_shared<FakeConnection>("viewer");
    context.registry().add(client);

    scheduler.start();
    ASSERT_TRUE(wait_until([&]() { return client->sent_count() >= 3; }, 2000));
    ASSERT_TRUE(scheduler.state() == CaptureScheduler::State::Active);
    scheduler.stop();

    ASSERT_TRUE(scheduler.get_stats().captures >= 3);
}

TEST(backs_off_while_source_unavailable) {
    SessionContext context;
    auto source = std::make_shared<FakeFrameSource>();
    source->set_available(false);
    context.set_sources(source, {});
    Broadcaster broadcaster(context.registry());
    CaptureScheduler scheduler(context, broadcaster, fast_options());
    context.registry().add(std::make_shared<FakeConnection>("viewer"));

    scheduler.start();
    ASSERT_TRUE(wait_until([&]() {
        return scheduler.state() == CaptureScheduler::State::Unavailable;
    }, 1000));
    ASSERT_EQ(source->captures(), 0);

    source->set_available(true);
    ASSERT_TRUE(wait_until([&]() { return source->captures() > 0; }, 1000));
    scheduler.stop();
}

TEST(no_primary_is_unavailable) {
    SessionContext context;
    Broadcaster broadcaster(context.registry());
    CaptureScheduler scheduler(context, broadcaster, fast_options());
    context.registry().add(std::make_shared<FakeConnection>("viewer"));

    scheduler.start();
    ASSERT_TRUE(wait_until([&]() {
        return scheduler.state() == CaptureScheduler::State::Unavailable;
    }, 1000));
    scheduler.stop();
}

TEST(failed_capture_is_not_broadcast) {
    SessionContext context;
    auto source = std::make_shared<FakeFrameSource>();
    source->set_fail_capture(true);
    context.set_sources(source, {});
    Broadcaster broadcaster(context.registry());
    CaptureScheduler scheduler(context, broadcaster, fast_options());
    auto client = std::make_shared<FakeConnection>("viewer");
    context.registry().add(client);

    scheduler.start();
    ASSERT_TRUE(wait_until([&]() { return scheduler.get_stats().capture_failures >= 2; }, 1000));
    scheduler.stop();

    ASSERT_EQ(client->sent_count(), 0u);
    ASSERT_EQ(broadcaster.get_stats().broadcasts, 0u);
}

TEST(throwing_capture_keeps_loop_running) {
    SessionContext context;
    auto source = std::make_shared<FakeFrameSource>();
    source->set_throw_capture(true);
    context.set_sources(source, {});
    Broadcaster broadcaster(context.registry());
    CaptureScheduler scheduler(context, broadcaster, fast_options());
    auto client = std::make_shared<FakeConnection>("viewer");
    context.registry().add(client);

    scheduler.start();
    ASSERT_TRUE(wait_until([&]() { return scheduler.get_stats().capture_failures >= 2; }, 1000));
    ASSERT_EQ(client->sent_count(), 0u);

    source->set_throw_capture(false);
    ASSERT_TRUE(wait_until([&]() { return client->sent_count() > 0; }, 1000));
    scheduler.stop();
}

TEST(stop_interrupts_long_sleep) {
    SessionContext context;
    auto source = std::make_shared<FakeFrameSource>();
    context.set_sources(source, {});
    Broadcaster broadcaster(context.registry());
    CaptureScheduler scheduler(context, broadcaster, fast_options(10000));

    scheduler.start();
    std::this_thread::sleep_for(std::chrono::milliseconds(50));

    auto begin = std::chrono::steady_clock::now();
    scheduler.stop();
    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - begin).count();
    ASSERT_TRUE(elapsed < 1000);
}

TEST(stop_is_idempotent_and_restartable) {
    SessionContext context;
    auto source = std::make_shared<FakeFrameSource>();
    context.set_sources(source, {});
    Broadcaster broadcaster(context.registry());
    CaptureScheduler scheduler(context, broadcaster, fast_options());

    scheduler.stop();
    scheduler.start();
    scheduler.start();
    ASSERT_TRUE(scheduler.is_running());
    scheduler.stop();
    scheduler.stop();
    ASSERT_FALSE(scheduler.is_running());

    context.registry().add(std::make_shared<FakeConnection>("viewer"));
    scheduler.start();
    ASSERT_TRUE(wait_until([&]() { return source->captures() > 0; }, 1000));
    scheduler.stop();
}

int main() {
    return test_framework::run_all_tests("capture scheduler");
}
