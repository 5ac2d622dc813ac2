#pragma once

#include <slatewatch/core/error.hpp>
#include <slatewatch/core/frame.hpp>
#include <slatewatch/core/frame_source.hpp>
#include <slatewatch/core/source_descriptor.hpp>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <expected>
#include <mutex>
#include <string>

namespace slatewatch::vision {

/// Scripted frame source for tests and demos.
///
/// Each pushed frame carries the delay after which it "arrives". A delay longer
/// than the timeout passed to next_frame() yields StreamStalled and shortens the
/// remaining delay by that timeout, so stalls are reproducible without sleeping.
/// With an empty script next_frame() blocks up to the timeout (push() and close()
/// wake it). After finish(), a drained script reports EndOfStream.
class SyntheticFrameSource : public slatewatch::core::IFrameSource {
 public:
  /// Queues \p frame. A zero sequence is replaced by the next running number.
  void push(slatewatch::core::Frame frame,
            std::chrono::milliseconds delay = std::chrono::milliseconds{0});

  /// Marks the end of the script.
  void finish();

  /// The next \p count open() calls fail with SourceUnavailable.
  void fail_open(std::uint32_t count);

  [[nodiscard]] std::uint32_t open_calls() const;
  [[nodiscard]] std::size_t pending() const;

  [[nodiscard]] std::expected<void, slatewatch::core::WatchError> open(
      const slatewatch::core::SourceDescriptor& descriptor) override;

  [[nodiscard]] std::expected<slatewatch::core::Frame, slatewatch::core::WatchError> next_frame(
      std::chrono::milliseconds timeout) override;

  void close() override;

  [[nodiscard]] std::string describe() const override;

 private:
  struct Scripted {
    slatewatch::core::Frame frame;
    std::chrono::milliseconds delay;
  };

  mutable std::mutex mu_;
  std::condition_variable cv_;
  std::deque<Scripted> script_;
  std::uint64_t next_sequence_{1};
  std::uint32_t failures_left_{0};
  std::uint32_t open_calls_{0};
  bool finished_{false};
  bool closed_{false};
  bool opened_{false};
};

}  // namespace slatewatch::vision
