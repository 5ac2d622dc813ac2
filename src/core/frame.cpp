#include <slatewatch/core/frame.hpp>
#include <cstddef>

namespace slatewatch::core {

std::size_t Frame::min_bytes(std::uint32_t width,
                             std::uint32_t height,
                             PixelFormat format) {
  const std::size_t pixels = static_cast<std::size_t>(width) * height;
  switch (format) {
    case PixelFormat::Grayscale8:
      return pixels;
    case PixelFormat::RGB8:
    case PixelFormat::BGR8:
      return pixels * 3;
    case PixelFormat::RGBA8:
    case PixelFormat::BGRA8:
      return pixels * 4;
    case PixelFormat::Unknown:
    default:
      return 0;
  }
}

bool Frame::valid() const noexcept {
  if (empty() || width_ == 0 || height_ == 0) return false;
  const std::size_t need = min_bytes(width_, height_, format_);
  return need > 0 && buffer_.size() >= need;
}

}  // namespace slatewatch::core
