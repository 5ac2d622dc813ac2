#pragma once

#include <slatewatch/core/error.hpp>
#include <slatewatch/core/frame.hpp>
#include <slatewatch/core/source_descriptor.hpp>
#include <chrono>
#include <expected>
#include <string>

namespace slatewatch::core {

/// Abstract frame source: one concrete adapter per transport.
///
/// Contract:
/// - open() starts ingestion or fails with SourceUnavailable.
/// - next_frame() returns the most recently arrived frame. Older unconsumed
///   frames are dropped, never queued; the gap shows in sequence numbers.
///   Fails with StreamStalled when nothing arrives within \p timeout and with
///   EndOfStream once the source is closed. Packet loss is not an error.
/// - close() may be called from another thread; it wakes a blocked next_frame().
class IFrameSource {
 public:
  virtual ~IFrameSource() = default;

  [[nodiscard]] virtual std::expected<void, WatchError> open(
      const SourceDescriptor& descriptor) = 0;

  [[nodiscard]] virtual std::expected<Frame, WatchError> next_frame(
      std::chrono::milliseconds timeout) = 0;

  virtual void close() = 0;

  /// Human-readable description for logs (e.g. "rtp://0.0.0.0:5000").
  [[nodiscard]] virtual std::string describe() const = 0;
};

}  // namespace slatewatch::core
