#include <slatewatch/core/watcher_metrics.hpp>

namespace slatewatch::core {

WatcherMetrics::WatcherMetrics(MetricsRegistry& registry,
                               const std::vector<std::string>& reference_labels)
    : frames_processed(registry.counter("frames_processed", "Frames scored against the references")),
      frames_dropped(registry.counter("frames_dropped",
                                      "Frames lost to transport gaps, overwrite, late or failed scoring")),
      actions_sent(registry.counter("actions_sent", "Action deliveries that succeeded")),
      actions_failed(registry.counter("actions_failed",
                                      "Action deliveries dropped after exhausting retries")),
      action_retries(registry.counter("action_retries", "Action delivery re-attempts")),
      stream_stalls(registry.counter("stream_stalls", "Times no frame arrived within the stall timeout")),
      scoring_overruns(registry.counter("scoring_overruns",
                                        "Scores that took longer than the sampling interval")),
      slate_found(registry.counter("slate_found_in_stream",
                                   "Scored frames that matched a reference")),
      content_found(registry.counter("content_found_in_stream",
                                     "Scored frames that matched no reference")),
      current_state(registry.gauge("current_state",
                                   "Debounced presence: -1 unknown, 0 absent, 1 present")),
      scoring_latency(registry.histogram("scoring_latency_seconds", "Per-frame scoring time")),
      action_duration(registry.histogram("action_duration_seconds", "Duration of one delivery attempt")),
      registry_(registry) {
  current_state.set(static_cast<double>(static_cast<int>(PresenceState::Unknown)));
  last_score_.reserve(reference_labels.size());
  for (const auto& label : reference_labels) {
    Gauge& g = registry.gauge("last_score", "Most recent similarity score per reference",
                              {{"reference", label}});
    last_score_.emplace_back(label, &g);
  }
}

Gauge* WatcherMetrics::last_score(const std::string& label) const {
  for (const auto& [name, gauge] : last_score_) {
    if (name == label) return gauge;
  }
  return nullptr;
}

}  // namespace slatewatch::core
