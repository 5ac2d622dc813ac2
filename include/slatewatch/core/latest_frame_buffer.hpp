#pragma once

#include <slatewatch/core/error.hpp>
#include <slatewatch/core/frame.hpp>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <expected>
#include <mutex>
#include <optional>

namespace slatewatch::core {

/// Single-slot hand-off between an ingestion thread and the scoring thread.
/// put() replaces any frame not yet taken, so the consumer always sees the
/// most recent arrival and backlog never accumulates.
/// Thread-safety: one producer and one consumer; close() from any thread.
class LatestFrameBuffer {
 public:
  /// Stores \p frame. Returns true if an unconsumed frame was overwritten.
  bool put(Frame frame);

  /// Waits up to \p timeout for a frame. StreamStalled on timeout; the close
  /// reason once closed and empty.
  [[nodiscard]] std::expected<Frame, WatchError> take(
      std::chrono::milliseconds timeout);

  /// Wakes the consumer. Later take() calls fail with \p reason once drained.
  void close(WatchError reason = WatchError::EndOfStream);

  /// Clears the slot and the closed flag so the buffer can be reused after a reconnect.
  void reset();

  [[nodiscard]] bool closed() const;
  [[nodiscard]] std::uint64_t overwritten() const;

 private:
  mutable std::mutex mu_;
  std::condition_variable cv_;
  std::optional<Frame> slot_;
  bool closed_{false};
  WatchError close_reason_{WatchError::EndOfStream};
  std::uint64_t overwritten_{0};
};

}  // namespace slatewatch::core
