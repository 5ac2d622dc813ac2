#include <slatewatch/app/config.hpp>
#include <slatewatch/app/watcher.hpp>
#include <slatewatch/core/metrics_registry.hpp>
#include <slatewatch/vision/reference_matcher.hpp>
#include <slatewatch/vision/synthetic_frame_source.hpp>
#include "support/fake_action_transport.hpp"
#include "support/test_frames.hpp"
#include <gtest/gtest.h>
#include <algorithm>
#include <chrono>
#include <string>
#include <thread>
#include <vector>

namespace sa = slatewatch::app;
namespace sc = slatewatch::core;
namespace sv = slatewatch::vision;
namespace st = slatewatch::test;
using namespace std::chrono_literals;

namespace {

sa::WatcherConfig test_config() {
  sa::WatcherConfig c;
  c.id = "watcher-test";
  c.source.transport = sc::Transport::Test;
  c.source.stall_timeout_ms = 1000;
  c.source.max_reconnect_attempts = 3;
  c.source.reconnect_backoff_ms = 1;
  c.references.push_back({"slate.png", "slate"});
  c.threshold = 0.9;
  c.debounce_frames = 2;
  c.shutdown_grace_ms = 2000;
  c.dispatch.workers = 1;
  sa::ActionTarget hook;
  hook.description = "hook";
  hook.url = "http://hooks.local/slate";
  hook.on = sa::ActionTrigger::Any;
  hook.payload_template = "{{state}}";
  hook.retry.max_retries = 0;
  c.actions.push_back(hook);
  return c;
}

sv::ReferenceMatcher slate_matcher() {
  std::vector<sv::ReferenceImage> refs;
  refs.push_back({"slate", st::make_slate_frame()});
  return sv::ReferenceMatcher(std::move(refs));
}

}  // namespace

class WatcherTest : public ::testing::Test {
 protected:
  sc::MetricsRegistry registry_;
  sv::SyntheticFrameSource source_;
  st::FakeActionTransport transport_;
};

TEST_F(WatcherTest, TransitionsAreDispatched) {
  for (int i = 0; i < 3; ++i) source_.push(st::make_content_frame());
  for (int i = 0; i < 3; ++i) source_.push(st::make_slate_frame());
  for (int i = 0; i < 3; ++i) source_.push(st::make_content_frame());
  source_.finish();

  sa::Watcher watcher(test_config(), source_, slate_matcher(), transport_, registry_);
  ASSERT_TRUE(watcher.run().has_value());

  const auto calls = transport_.calls();
  ASSERT_EQ(calls.size(), 2u);
  EXPECT_EQ(calls[0].body, "present");
  EXPECT_EQ(calls[1].body, "absent");
  EXPECT_EQ(watcher.metrics().frames_processed.value(), 9u);
  EXPECT_EQ(watcher.metrics().slate_found.value(), 3u);
  EXPECT_EQ(watcher.metrics().content_found.value(), 6u);
  EXPECT_EQ(watcher.metrics().actions_sent.value(), 2u);
  EXPECT_DOUBLE_EQ(watcher.metrics().current_state.value(), 0.0);
  EXPECT_EQ(watcher.state_machine().presence(), sc::PresenceState::Absent);
  EXPECT_EQ(watcher.metrics().scoring_latency.count(), 9u);
  ASSERT_NE(watcher.metrics().last_score("slate"), nullptr);
  EXPECT_LT(watcher.metrics().last_score("slate")->value(), 0.5);
}

TEST_F(WatcherTest, StartupStateIsNotReported) {
  for (int i = 0; i < 4; ++i) source_.push(st::make_slate_frame());
  source_.finish();
  sa::Watcher watcher(test_config(), source_, slate_matcher(), transport_, registry_);
  ASSERT_TRUE(watcher.run().has_value());
  EXPECT_TRUE(transport_.calls().empty());
  EXPECT_DOUBLE_EQ(watcher.metrics().current_state.value(), 1.0);
}

TEST_F(WatcherTest, PacketLossBelowStallTimeoutIsOnlyDropped) {
  source_.push(st::make_slate_frame(320, 240, 1));
  source_.push(st::make_slate_frame(320, 240, 2));
  source_.push(st::make_slate_frame(320, 240, 5), 600ms);  // 3 and 4 lost
  source_.push(st::make_slate_frame(320, 240, 6), 900ms);
  source_.finish();

  sa::Watcher watcher(test_config(), source_, slate_matcher(), transport_, registry_);
  ASSERT_TRUE(watcher.run().has_value());
  EXPECT_EQ(watcher.metrics().frames_dropped.value(), 2u);
  EXPECT_EQ(watcher.metrics().stream_stalls.value(), 0u);
  EXPECT_EQ(watcher.metrics().frames_processed.value(), 4u);
}

TEST_F(WatcherTest, LossBeyondStallTimeoutStallsOnce) {
  source_.push(st::make_slate_frame(320, 240, 1));
  source_.push(st::make_slate_frame(320, 240, 2));
  source_.push(st::make_slate_frame(320, 240, 9), 2500ms);  // two timeouts in a row
  source_.push(st::make_slate_frame(320, 240, 10));
  source_.finish();

  sa::Watcher watcher(test_config(), source_, slate_matcher(), transport_, registry_);
  ASSERT_TRUE(watcher.run().has_value());
  EXPECT_EQ(watcher.metrics().stream_stalls.value(), 1u);
  EXPECT_EQ(watcher.metrics().frames_dropped.value(), 6u);
  EXPECT_EQ(watcher.metrics().frames_processed.value(), 4u);
}

TEST_F(WatcherTest, InvalidFrameIsDroppedWithoutTouchingRuns) {
  source_.push(st::make_slate_frame());
  source_.push(sc::Frame{});
  source_.push(st::make_slate_frame());
  source_.finish();

  sa::Watcher watcher(test_config(), source_, slate_matcher(), transport_, registry_);
  ASSERT_TRUE(watcher.run().has_value());
  EXPECT_EQ(watcher.metrics().frames_dropped.value(), 1u);
  EXPECT_EQ(watcher.metrics().frames_processed.value(), 2u);
  // The two good frames still form one run of 2.
  EXPECT_EQ(watcher.state_machine().presence(), sc::PresenceState::Present);
}

TEST_F(WatcherTest, SamplingIntervalSkipsFramesTooCloseTogether) {
  auto config = test_config();
  config.sampling_interval_ms = 1000;
  const auto t0 = std::chrono::system_clock::now();
  for (int i = 0; i < 5; ++i) {
    source_.push(st::make_slate_frame(320, 240, 0, t0 + std::chrono::milliseconds(300 * i)));
  }
  source_.finish();

  sa::Watcher watcher(config, source_, slate_matcher(), transport_, registry_);
  ASSERT_TRUE(watcher.run().has_value());
  // Scored at 0 ms and 1200 ms.
  EXPECT_EQ(watcher.metrics().frames_processed.value() + watcher.metrics().scoring_overruns.value(),
            2u);
  EXPECT_EQ(watcher.metrics().frames_dropped.value(), watcher.metrics().scoring_overruns.value());
}

TEST_F(WatcherTest, SamplingRestartsAfterClockStepsBack) {
  auto config = test_config();
  config.sampling_interval_ms = 1000;
  const auto t0 = std::chrono::system_clock::now();
  const auto stepped = t0 - std::chrono::hours(1);
  source_.push(st::make_slate_frame(320, 240, 0, t0));
  source_.push(st::make_slate_frame(320, 240, 0, stepped));
  source_.push(st::make_slate_frame(320, 240, 0, stepped + 300ms));
  source_.push(st::make_slate_frame(320, 240, 0, stepped + 1200ms));
  source_.finish();

  sa::Watcher watcher(config, source_, slate_matcher(), transport_, registry_);
  ASSERT_TRUE(watcher.run().has_value());
  // Scored at t0, at the step and 1200 ms after it.
  EXPECT_EQ(watcher.metrics().frames_processed.value() + watcher.metrics().scoring_overruns.value(),
            3u);
}

TEST_F(WatcherTest, TimingOutActionDoesNotHoldBackFrames) {
  auto config = test_config();
  config.dispatch.workers = 2;
  config.shutdown_grace_ms = 500;
  auto& hook = config.actions.front();
  hook.retry.max_retries = 20;
  hook.retry.timeout_ms = 300;
  hook.retry.initial_backoff_ms = 200;
  hook.retry.max_backoff_ms = 200;
  transport_.always_time_out = true;

  for (int i = 0; i < 3; ++i) source_.push(st::make_slate_frame());
  for (int i = 0; i < 3; ++i) source_.push(st::make_content_frame());
  for (int i = 0; i < 5; ++i) source_.push(st::make_slate_frame());
  source_.finish();

  sa::Watcher watcher(config, source_, slate_matcher(), transport_, registry_);
  const auto started = std::chrono::steady_clock::now();
  ASSERT_TRUE(watcher.run().has_value());
  const auto elapsed = std::chrono::steady_clock::now() - started;

  EXPECT_EQ(watcher.metrics().frames_processed.value(), 11u);
  EXPECT_EQ(watcher.state_machine().presence(), sc::PresenceState::Present);

  // The second transition went out while the first was still being retried.
  const auto calls = transport_.calls();
  const auto has_body = [&](const std::string& body) {
    return std::any_of(calls.begin(), calls.end(), [&](const auto& c) { return c.body == body; });
  };
  EXPECT_TRUE(has_body("absent"));
  EXPECT_TRUE(has_body("present"));

  EXPECT_EQ(watcher.metrics().actions_sent.value(), 0u);
  EXPECT_EQ(watcher.metrics().actions_failed.value(), 2u);
  // Grace period plus at most one in-flight attempt, far short of the full retry schedule.
  EXPECT_LT(elapsed, 3s);
}

TEST_F(WatcherTest, ReconnectsWithinAttemptLimit) {
  source_.fail_open(2);
  source_.push(st::make_slate_frame());
  source_.finish();
  sa::Watcher watcher(test_config(), source_, slate_matcher(), transport_, registry_);
  ASSERT_TRUE(watcher.run().has_value());
  EXPECT_EQ(source_.open_calls(), 3u);
  EXPECT_EQ(watcher.metrics().frames_processed.value(), 1u);
}

TEST_F(WatcherTest, ExhaustedReconnectIsFatal) {
  source_.fail_open(10);
  auto config = test_config();
  config.source.max_reconnect_attempts = 2;
  sa::Watcher watcher(config, source_, slate_matcher(), transport_, registry_);
  auto result = watcher.run();
  ASSERT_FALSE(result.has_value());
  EXPECT_EQ(result.error(), sc::WatchError::SourceUnavailable);
  EXPECT_EQ(source_.open_calls(), 3u);
}

TEST_F(WatcherTest, StopEndsBlockedRun) {
  auto config = test_config();
  config.source.stall_timeout_ms = 60000;
  sa::Watcher watcher(config, source_, slate_matcher(), transport_, registry_);
  std::thread stopper([&] {
    std::this_thread::sleep_for(50ms);
    watcher.stop();
  });
  const auto started = std::chrono::steady_clock::now();
  auto result = watcher.run();
  stopper.join();
  EXPECT_TRUE(result.has_value());
  EXPECT_LT(std::chrono::steady_clock::now() - started, 5s);
}
