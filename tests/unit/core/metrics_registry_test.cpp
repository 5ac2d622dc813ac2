#include <slatewatch/core/detection.hpp>
#include <slatewatch/core/metrics_registry.hpp>
#include <slatewatch/core/watcher_metrics.hpp>
#include <gtest/gtest.h>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

namespace sc = slatewatch::core;

TEST(MetricsRegistry, CounterIncrements) {
  sc::MetricsRegistry registry;
  sc::Counter& c = registry.counter("frames_processed", "Frames");
  c.inc();
  c.inc(4);
  EXPECT_EQ(c.value(), 5u);
}

TEST(MetricsRegistry, SameNameAndLabelsReturnsSameSeries) {
  sc::MetricsRegistry registry;
  sc::Gauge& a = registry.gauge("last_score", "Score", {{"reference", "slate"}});
  sc::Gauge& b = registry.gauge("last_score", "Score", {{"reference", "slate"}});
  sc::Gauge& other = registry.gauge("last_score", "Score", {{"reference", "bars"}});
  EXPECT_EQ(&a, &b);
  EXPECT_NE(&a, &other);
}

TEST(MetricsRegistry, TypeMismatchThrows) {
  sc::MetricsRegistry registry;
  (void)registry.counter("frames_dropped", "Dropped");
  EXPECT_THROW((void)registry.gauge("frames_dropped", "Dropped"), std::invalid_argument);
}

TEST(MetricsRegistry, HistogramBuckets) {
  sc::MetricsRegistry registry;
  sc::Histogram& h = registry.histogram("scoring_latency_seconds", "Latency", {0.1, 0.5, 1.0});
  h.observe(0.05);
  h.observe(0.1);
  h.observe(0.3);
  h.observe(2.0);
  EXPECT_EQ(h.count(), 4u);
  EXPECT_EQ(h.bucket_count(0), 2u);
  EXPECT_EQ(h.bucket_count(1), 1u);
  EXPECT_EQ(h.bucket_count(2), 0u);
  EXPECT_NEAR(h.sum(), 2.45, 1e-9);
}

TEST(MetricsRegistry, ConcurrentWritesAreCounted) {
  sc::MetricsRegistry registry;
  sc::Counter& c = registry.counter("actions_sent", "Sent");
  std::vector<std::thread> threads;
  for (int t = 0; t < 4; ++t) {
    threads.emplace_back([&c] {
      for (int i = 0; i < 10000; ++i) c.inc();
    });
  }
  for (auto& t : threads) t.join();
  EXPECT_EQ(c.value(), 40000u);
}

TEST(MetricsRegistry, SnapshotListsEverySeries) {
  sc::MetricsRegistry registry;
  registry.counter("frames_processed", "Frames").inc(3);
  registry.gauge("current_state", "State").set(1.0);
  const auto samples = registry.snapshot();
  ASSERT_EQ(samples.size(), 2u);
  EXPECT_EQ(samples[0].name, "frames_processed");
  EXPECT_DOUBLE_EQ(samples[0].value, 3.0);
  EXPECT_EQ(samples[1].name, "current_state");
  EXPECT_DOUBLE_EQ(samples[1].value, 1.0);
}

TEST(MetricsRegistry, RenderTextUsesExpositionFormat) {
  sc::MetricsRegistry registry;
  registry.counter("frames_processed", "Frames scored").inc(7);
  registry.gauge("last_score", "Score", {{"reference", "slate"}}).set(0.5);
  registry.gauge("last_score", "Score", {{"reference", "bars"}}).set(0.25);
  registry.histogram("scoring_latency_seconds", "Latency", {0.1, 1.0}).observe(0.05);

  const std::string text = registry.render_text();
  EXPECT_NE(text.find("# HELP frames_processed Frames scored\n"), std::string::npos);
  EXPECT_NE(text.find("# TYPE frames_processed counter\n"), std::string::npos);
  EXPECT_NE(text.find("frames_processed 7\n"), std::string::npos);
  EXPECT_NE(text.find("last_score{reference=\"slate\"} 0.5\n"), std::string::npos);
  EXPECT_NE(text.find("last_score{reference=\"bars\"} 0.25\n"), std::string::npos);
  EXPECT_NE(text.find("scoring_latency_seconds_bucket{le=\"0.1\"} 1\n"), std::string::npos);
  EXPECT_NE(text.find("scoring_latency_seconds_bucket{le=\"1\"} 1\n"), std::string::npos);
  EXPECT_NE(text.find("scoring_latency_seconds_bucket{le=\"+Inf\"} 1\n"), std::string::npos);
  EXPECT_NE(text.find("scoring_latency_seconds_count 1\n"), std::string::npos);

  // One HELP line per family even with two label sets.
  const auto first = text.find("# TYPE last_score gauge");
  ASSERT_NE(first, std::string::npos);
  EXPECT_EQ(text.find("# TYPE last_score gauge", first + 1), std::string::npos);
}

TEST(WatcherMetrics, RegistersWatcherSeries) {
  sc::MetricsRegistry registry;
  sc::WatcherMetrics metrics(registry, {"slate", "bars"});
  EXPECT_DOUBLE_EQ(metrics.current_state.value(), -1.0);
  ASSERT_NE(metrics.last_score("slate"), nullptr);
  ASSERT_NE(metrics.last_score("bars"), nullptr);
  EXPECT_EQ(metrics.last_score("missing"), nullptr);

  metrics.set_state(sc::PresenceState::Present);
  EXPECT_DOUBLE_EQ(metrics.current_state.value(), 1.0);
  metrics.frames_dropped.inc(2);

  const std::string text = registry.render_text();
  EXPECT_NE(text.find("frames_dropped 2\n"), std::string::npos);
  EXPECT_NE(text.find("current_state 1\n"), std::string::npos);
  EXPECT_NE(text.find("# TYPE slate_found_in_stream counter"), std::string::npos);
  EXPECT_NE(text.find("# TYPE action_duration_seconds histogram"), std::string::npos);
}
