#include <slatewatch/vision/synthetic_frame_source.hpp>
#include <utility>

namespace slatewatch::vision {

namespace sc = slatewatch::core;

void SyntheticFrameSource::push(sc::Frame frame, std::chrono::milliseconds delay) {
  {
    std::lock_guard lock(mu_);
    if (frame.sequence() == 0) {
      frame.set_sequence(next_sequence_);
    }
    next_sequence_ = frame.sequence() + 1;
    if (frame.timestamp() == sc::Timestamp{}) {
      frame.set_timestamp(std::chrono::system_clock::now());
    }
    script_.push_back(Scripted{std::move(frame), delay});
  }
  cv_.notify_all();
}

void SyntheticFrameSource::finish() {
  {
    std::lock_guard lock(mu_);
    finished_ = true;
  }
  cv_.notify_all();
}

void SyntheticFrameSource::fail_open(std::uint32_t count) {
  std::lock_guard lock(mu_);
  failures_left_ = count;
}

std::uint32_t SyntheticFrameSource::open_calls() const {
  std::lock_guard lock(mu_);
  return open_calls_;
}

std::size_t SyntheticFrameSource::pending() const {
  std::lock_guard lock(mu_);
  return script_.size();
}

std::expected<void, sc::WatchError> SyntheticFrameSource::open(
    const sc::SourceDescriptor& /*descriptor*/) {
  std::lock_guard lock(mu_);
  ++open_calls_;
  if (failures_left_ > 0) {
    --failures_left_;
    return std::unexpected(sc::WatchError::SourceUnavailable);
  }
  opened_ = true;
  closed_ = false;
  return {};
}

std::expected<sc::Frame, sc::WatchError> SyntheticFrameSource::next_frame(
    std::chrono::milliseconds timeout) {
  std::unique_lock lock(mu_);
  if (!opened_ || closed_) {
    return std::unexpected(sc::WatchError::EndOfStream);
  }
  if (script_.empty()) {
    if (finished_) {
      return std::unexpected(sc::WatchError::EndOfStream);
    }
    cv_.wait_for(lock, timeout, [this] { return closed_ || finished_ || !script_.empty(); });
    if (closed_ || (script_.empty() && finished_)) {
      return std::unexpected(sc::WatchError::EndOfStream);
    }
    if (script_.empty()) {
      return std::unexpected(sc::WatchError::StreamStalled);
    }
  }

  auto& head = script_.front();
  if (head.delay > timeout) {
    head.delay -= timeout;
    return std::unexpected(sc::WatchError::StreamStalled);
  }
  sc::Frame frame = std::move(head.frame);
  script_.pop_front();
  return frame;
}

void SyntheticFrameSource::close() {
  {
    std::lock_guard lock(mu_);
    closed_ = true;
  }
  cv_.notify_all();
}

std::string SyntheticFrameSource::describe() const { return "synthetic"; }

}  // namespace slatewatch::vision
