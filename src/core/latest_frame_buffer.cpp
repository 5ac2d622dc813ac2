#include <slatewatch/core/latest_frame_buffer.hpp>
#include <utility>

namespace slatewatch::core {

bool LatestFrameBuffer::put(Frame frame) {
  bool replaced = false;
  {
    std::lock_guard lock(mu_);
    if (closed_) return false;
    replaced = slot_.has_value();
    if (replaced) ++overwritten_;
    slot_ = std::move(frame);
  }
  cv_.notify_one();
  return replaced;
}

std::expected<Frame, WatchError> LatestFrameBuffer::take(
    std::chrono::milliseconds timeout) {
  std::unique_lock lock(mu_);
  cv_.wait_for(lock, timeout, [this]() {
    return slot_.has_value() || closed_;
  });
  if (slot_) {
    Frame out = std::move(*slot_);
    slot_.reset();
    return out;
  }
  if (closed_) {
    return std::unexpected(close_reason_);
  }
  return std::unexpected(WatchError::StreamStalled);
}

void LatestFrameBuffer::close(WatchError reason) {
  {
    std::lock_guard lock(mu_);
    if (!closed_) {
      closed_ = true;
      close_reason_ = reason;
    }
  }
  cv_.notify_all();
}

void LatestFrameBuffer::reset() {
  std::lock_guard lock(mu_);
  slot_.reset();
  closed_ = false;
  close_reason_ = WatchError::EndOfStream;
}

bool LatestFrameBuffer::closed() const {
  std::lock_guard lock(mu_);
  return closed_;
}

std::uint64_t LatestFrameBuffer::overwritten() const {
  std::lock_guard lock(mu_);
  return overwritten_;
}

}  // namespace slatewatch::core
