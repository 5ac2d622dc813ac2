#pragma once

#include <slatewatch/app/config.hpp>
#include <slatewatch/core/detection.hpp>
#include <slatewatch/core/error.hpp>
#include <slatewatch/core/watcher_metrics.hpp>
#include <tbb/concurrent_queue.h>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <expected>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace slatewatch::app {

/// Performs a single delivery attempt to an action target.
/// Implementations must honor \p timeout and be callable from several threads.
class IActionTransport {
 public:
  virtual ~IActionTransport() = default;

  /// ActionDeliveryError on connection failure, timeout or a non-2xx status.
  [[nodiscard]] virtual std::expected<void, slatewatch::core::WatchError> deliver(
      const ActionTarget& target, const std::string& body, std::chrono::milliseconds timeout) = 0;
};

/// HTTP(S) delivery with cpp-httplib: method, headers and basic auth from the target.
class HttpActionTransport : public IActionTransport {
 public:
  [[nodiscard]] std::expected<void, slatewatch::core::WatchError> deliver(
      const ActionTarget& target, const std::string& body,
      std::chrono::milliseconds timeout) override;
};

/// ISO 8601 UTC with milliseconds, e.g. "2024-05-01T12:00:00.250Z".
[[nodiscard]] std::string format_timestamp(slatewatch::core::Timestamp ts);

/// Request body for \p event. An empty template yields {"watcher_id","state","timestamp"};
/// otherwise {{watcher_id}}, {{state}}, {{previous_state}} and {{timestamp}} are substituted,
/// escaped as JSON string content.
[[nodiscard]] std::string render_payload(const ActionTarget& target,
                                         const slatewatch::core::ActionEvent& event);

/// True if a target with trigger \p on reacts to \p kind.
[[nodiscard]] bool triggers_on(ActionTrigger on, slatewatch::core::TransitionKind kind) noexcept;

/// Delivers transition events to every matching target on a pool of worker threads.
///
/// submit() never blocks: jobs go to a bounded queue and are dropped (counted in
/// actions_failed) when it is full. Each job holds a ticket taken at submit; a
/// worker issues a job's first attempt only after every earlier ticket has
/// issued its own, so deliveries start in the order the events were produced
/// even with several workers. Retries and completions may interleave.
/// Each job is retried per its target's RetryPolicy; terminal failures are
/// logged and counted, never reported back to the caller.
class ActionDispatcher {
 public:
  ActionDispatcher(std::vector<ActionTarget> targets,
                   IActionTransport& transport,
                   slatewatch::core::WatcherMetrics& metrics,
                   DispatchSettings settings = {});
  ~ActionDispatcher();

  ActionDispatcher(const ActionDispatcher&) = delete;
  ActionDispatcher& operator=(const ActionDispatcher&) = delete;

  /// Queues one job per target whose trigger matches. Returns the number queued.
  std::size_t submit(const slatewatch::core::ActionEvent& event);

  /// Stops accepting events, waits up to \p grace for queued and in-flight jobs,
  /// then aborts what is left (counted as failed) and joins the workers. Idempotent.
  void shutdown(std::chrono::milliseconds grace);

  /// Jobs queued or in flight.
  [[nodiscard]] std::size_t pending() const;

  [[nodiscard]] const std::vector<ActionTarget>& targets() const noexcept { return targets_; }

 private:
  struct Job {
    std::size_t target{0};
    slatewatch::core::ActionEvent event;
    bool stop{false};
    std::uint64_t ticket{0};
  };

  void worker_loop();
  void run(const Job& job);
  /// Sleeps for \p wait unless shutdown aborts first. False when aborted.
  bool wait_backoff(std::chrono::milliseconds wait);
  /// Blocks until \p ticket may start. False when shutdown aborts first.
  bool wait_turn(std::uint64_t ticket);
  void pass_turn();
  void finish_job();

  std::vector<ActionTarget> targets_;
  IActionTransport& transport_;
  slatewatch::core::WatcherMetrics& metrics_;

  tbb::concurrent_bounded_queue<Job> queue_;
  std::vector<std::thread> workers_;

  mutable std::mutex mu_;
  std::condition_variable cv_;
  std::size_t pending_{0};
  std::uint64_t next_ticket_{0};
  std::uint64_t next_start_{0};
  std::vector<std::optional<std::chrono::steady_clock::time_point>> last_success_;

  std::atomic<bool> accepting_{true};
  std::atomic<bool> aborting_{false};
  bool joined_{false};
};

}  // namespace slatewatch::app
