#include <slatewatch/vision/load_image.hpp>
#include "frame_cv_utils.hpp"
#include <slatewatch/core/frame.hpp>
#include <opencv2/imgcodecs.hpp>

namespace slatewatch::vision {

namespace {

slatewatch::core::Frame to_frame(const cv::Mat& mat) {
  slatewatch::core::PixelFormat format = slatewatch::core::PixelFormat::BGR8;
  if (mat.channels() == 1) format = slatewatch::core::PixelFormat::Grayscale8;
  return detail::mat_to_frame(mat, format);
}

}  // namespace

std::expected<slatewatch::core::Frame, slatewatch::core::WatchError>
load_frame_from_image(const std::string& path) {
  cv::Mat mat = cv::imread(path, cv::IMREAD_COLOR);
  if (mat.empty()) return std::unexpected(slatewatch::core::WatchError::LoadFailed);
  return to_frame(mat);
}

std::expected<slatewatch::core::Frame, slatewatch::core::WatchError>
decode_frame_from_bytes(std::span<const std::byte> bytes) {
  if (bytes.empty()) return std::unexpected(slatewatch::core::WatchError::LoadFailed);
  const cv::Mat raw(1, static_cast<int>(bytes.size()), CV_8UC1,
                    const_cast<std::byte*>(bytes.data()));
  cv::Mat mat;
  try {
    mat = cv::imdecode(raw, cv::IMREAD_COLOR);
  } catch (const cv::Exception&) {
    return std::unexpected(slatewatch::core::WatchError::LoadFailed);
  }
  if (mat.empty()) return std::unexpected(slatewatch::core::WatchError::LoadFailed);
  return to_frame(mat);
}

}  // namespace slatewatch::vision
