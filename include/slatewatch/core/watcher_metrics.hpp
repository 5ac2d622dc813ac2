#pragma once

#include <slatewatch/core/detection.hpp>
#include <slatewatch/core/metrics_registry.hpp>
#include <string>
#include <utility>
#include <vector>

namespace slatewatch::core {

/// Handles to every series a watcher writes, registered once at startup.
/// Components take this by reference instead of touching the registry.
class WatcherMetrics {
 public:
  WatcherMetrics(MetricsRegistry& registry, const std::vector<std::string>& reference_labels);

  Counter& frames_processed;
  Counter& frames_dropped;
  Counter& actions_sent;
  Counter& actions_failed;
  Counter& action_retries;
  Counter& stream_stalls;
  Counter& scoring_overruns;
  Counter& slate_found;
  Counter& content_found;
  Gauge& current_state;
  Histogram& scoring_latency;
  Histogram& action_duration;

  /// last_score gauge for \p label, nullptr if the label was not registered.
  [[nodiscard]] Gauge* last_score(const std::string& label) const;

  void set_state(PresenceState state) noexcept {
    current_state.set(static_cast<double>(static_cast<int>(state)));
  }

  [[nodiscard]] MetricsRegistry& registry() const noexcept { return registry_; }

 private:
  MetricsRegistry& registry_;
  std::vector<std::pair<std::string, Gauge*>> last_score_;
};

}  // namespace slatewatch::core
