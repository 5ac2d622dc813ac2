#include "frame_cv_utils.hpp"
#include <slatewatch/core/frame.hpp>
#include <opencv2/core.hpp>
#include <opencv2/imgproc.hpp>
#include <cstddef>
#include <cstring>
#include <vector>

namespace slatewatch::vision::detail {

namespace sc = slatewatch::core;

std::optional<cv::Mat> frame_to_mat(const sc::Frame& frame) {
  if (!frame.valid()) return std::nullopt;

  const int w = static_cast<int>(frame.width());
  const int h = static_cast<int>(frame.height());
  const std::size_t step = frame.size_bytes() / static_cast<std::size_t>(h);
  void* data = const_cast<std::byte*>(frame.data().data());

  switch (frame.format()) {
    case sc::PixelFormat::Grayscale8:
      return cv::Mat(h, w, CV_8UC1, data, step);
    case sc::PixelFormat::RGB8:
    case sc::PixelFormat::BGR8:
      return cv::Mat(h, w, CV_8UC3, data, step);
    case sc::PixelFormat::RGBA8:
    case sc::PixelFormat::BGRA8:
      return cv::Mat(h, w, CV_8UC4, data, step);
    case sc::PixelFormat::Unknown:
    default:
      return std::nullopt;
  }
}

sc::Frame mat_to_frame(const cv::Mat& mat, sc::PixelFormat format) {
  if (mat.empty()) return sc::Frame();

  const cv::Mat packed = mat.isContinuous() ? mat : mat.clone();
  const std::uint32_t w = static_cast<std::uint32_t>(packed.cols);
  const std::uint32_t h = static_cast<std::uint32_t>(packed.rows);
  const std::size_t len = packed.total() * packed.elemSize();
  std::vector<std::byte> buffer(len);
  std::memcpy(buffer.data(), packed.ptr(), len);
  return sc::Frame(w, h, format, std::move(buffer));
}

std::optional<cv::Mat> frame_to_gray(const sc::Frame& frame) {
  auto mat = frame_to_mat(frame);
  if (!mat) return std::nullopt;

  cv::Mat gray;
  switch (frame.format()) {
    case sc::PixelFormat::Grayscale8:
      return *mat;
    case sc::PixelFormat::RGB8:
      cv::cvtColor(*mat, gray, cv::COLOR_RGB2GRAY);
      break;
    case sc::PixelFormat::BGR8:
      cv::cvtColor(*mat, gray, cv::COLOR_BGR2GRAY);
      break;
    case sc::PixelFormat::RGBA8:
      cv::cvtColor(*mat, gray, cv::COLOR_RGBA2GRAY);
      break;
    case sc::PixelFormat::BGRA8:
      cv::cvtColor(*mat, gray, cv::COLOR_BGRA2GRAY);
      break;
    case sc::PixelFormat::Unknown:
    default:
      return std::nullopt;
  }
  return gray;
}

}  // namespace slatewatch::vision::detail
