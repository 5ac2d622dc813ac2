#pragma once

#include <slatewatch/core/error.hpp>
#include <slatewatch/core/frame.hpp>
#include <slatewatch/core/frame_source.hpp>
#include <slatewatch/core/source_descriptor.hpp>
#include <chrono>
#include <expected>
#include <memory>
#include <string>

namespace slatewatch::vision {

/// GStreamer launch string for \p descriptor. The pipeline always ends in
/// "video/x-raw,format=BGR ! appsink name=sink".
[[nodiscard]] std::string pipeline_description(
    const slatewatch::core::SourceDescriptor& descriptor);

/// Frame source backed by a GStreamer pipeline (live RTP/UDP, file or test pattern).
///
/// The appsink new-sample callback runs on the GStreamer streaming thread and
/// hands frames to a LatestFrameBuffer, so the consumer always gets the newest
/// frame. Bus errors close the buffer with SourceUnavailable, EOS with EndOfStream.
/// open() may be called again after a failure to reconnect.
class GstFrameSource : public slatewatch::core::IFrameSource {
 public:
  GstFrameSource();
  ~GstFrameSource() override;

  GstFrameSource(const GstFrameSource&) = delete;
  GstFrameSource& operator=(const GstFrameSource&) = delete;

  [[nodiscard]] std::expected<void, slatewatch::core::WatchError> open(
      const slatewatch::core::SourceDescriptor& descriptor) override;

  [[nodiscard]] std::expected<slatewatch::core::Frame, slatewatch::core::WatchError> next_frame(
      std::chrono::milliseconds timeout) override;

  void close() override;

  [[nodiscard]] std::string describe() const override;

  /// Frames replaced in the hand-off buffer before the consumer took them.
  [[nodiscard]] std::uint64_t overwritten() const;

 private:
  struct Impl;
  std::unique_ptr<Impl> impl_;
};

}  // namespace slatewatch::vision
