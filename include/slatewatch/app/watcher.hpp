#pragma once

#include <slatewatch/app/action_dispatcher.hpp>
#include <slatewatch/app/config.hpp>
#include <slatewatch/core/detection_state_machine.hpp>
#include <slatewatch/core/error.hpp>
#include <slatewatch/core/frame_source.hpp>
#include <slatewatch/core/metrics_registry.hpp>
#include <slatewatch/core/watcher_metrics.hpp>
#include <slatewatch/vision/reference_matcher.hpp>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <expected>
#include <mutex>
#include <optional>

namespace slatewatch::app {

/// One watcher: pulls frames from a source, scores them against the references,
/// debounces the scores into presence changes and hands those to the dispatcher.
///
/// Frame ingestion runs in the source, scoring and the state machine on the
/// thread that calls run(), and delivery on the dispatcher's workers. Only
/// metrics and logs flow back from delivery.
class Watcher {
 public:
  /// \p source and \p transport must outlive the watcher. Metric series are
  /// registered in \p registry before run() starts.
  Watcher(WatcherConfig config,
          slatewatch::core::IFrameSource& source,
          slatewatch::vision::ReferenceMatcher matcher,
          IActionTransport& transport,
          slatewatch::core::MetricsRegistry& registry);
  ~Watcher();

  Watcher(const Watcher&) = delete;
  Watcher& operator=(const Watcher&) = delete;

  /// Blocks until the stream ends, stop() is called or the source fails for good.
  /// SourceUnavailable once reconnect attempts are exhausted; success otherwise.
  /// Delivery is drained within the configured grace period before returning.
  [[nodiscard]] std::expected<void, slatewatch::core::WatchError> run();

  /// Requests shutdown from any thread; wakes a blocked run().
  void stop();

  [[nodiscard]] const WatcherConfig& config() const noexcept { return config_; }
  [[nodiscard]] slatewatch::core::WatcherMetrics& metrics() noexcept { return metrics_; }
  /// Detection state; read it only while run() is not executing.
  [[nodiscard]] const slatewatch::core::DetectionStateMachine& state_machine() const noexcept {
    return state_machine_;
  }

 private:
  /// Opens the source, retrying with doubling backoff up to max_reconnect_attempts.
  [[nodiscard]] std::expected<void, slatewatch::core::WatchError> open_source();
  void process(const slatewatch::core::Frame& frame);
  /// False if stop() interrupted the wait.
  bool sleep_unless_stopped(std::chrono::milliseconds wait);
  void finish();

  const WatcherConfig config_;
  slatewatch::core::IFrameSource& source_;
  slatewatch::vision::ReferenceMatcher matcher_;
  slatewatch::core::MetricsRegistry& registry_;
  slatewatch::core::WatcherMetrics metrics_;
  slatewatch::core::DetectionStateMachine state_machine_;
  ActionDispatcher dispatcher_;

  std::atomic<bool> stop_requested_{false};
  std::mutex stop_mu_;
  std::condition_variable stop_cv_;

  std::optional<std::uint64_t> last_sequence_;
  std::optional<slatewatch::core::Timestamp> last_scored_;
};

}  // namespace slatewatch::app
