#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <span>
#include <vector>

namespace slatewatch::core {

/// Wall-clock instant a frame arrived at its source.
using Timestamp = std::chrono::system_clock::time_point;

/// Memory: Frame owns a single contiguous buffer (std::vector<std::byte>);
/// move semantics and RAII throughout. Use data() for std::span views (non-owning).
/// Frames are ephemeral: the pipeline discards each one right after scoring.

/// Pixel layout / format.
enum class PixelFormat : std::uint8_t {
  Unknown,
  Grayscale8,
  RGB8,
  BGR8,
  RGBA8,
  BGRA8,
};

/// Single decoded video frame: dimensions, format, buffer, arrival time and
/// the sequence number assigned by the source.
class Frame {
 public:
  Frame() = default;

  Frame(std::uint32_t width,
        std::uint32_t height,
        PixelFormat format,
        std::vector<std::byte> buffer,
        std::uint64_t sequence = 0,
        Timestamp timestamp = {})
      : width_(width),
        height_(height),
        format_(format),
        buffer_(std::move(buffer)),
        sequence_(sequence),
        timestamp_(timestamp) {}

  [[nodiscard]] std::uint32_t width() const noexcept { return width_; }
  [[nodiscard]] std::uint32_t height() const noexcept { return height_; }
  [[nodiscard]] PixelFormat format() const noexcept { return format_; }
  [[nodiscard]] std::uint64_t sequence() const noexcept { return sequence_; }
  [[nodiscard]] Timestamp timestamp() const noexcept { return timestamp_; }

  void set_sequence(std::uint64_t sequence) noexcept { sequence_ = sequence; }
  void set_timestamp(Timestamp timestamp) noexcept { timestamp_ = timestamp; }

  [[nodiscard]] std::span<std::byte> data() noexcept {
    return std::span<std::byte>(buffer_.data(), buffer_.size());
  }
  [[nodiscard]] std::span<const std::byte> data() const noexcept {
    return std::span<const std::byte>(buffer_.data(), buffer_.size());
  }

  [[nodiscard]] bool empty() const noexcept { return buffer_.empty(); }
  [[nodiscard]] std::size_t size_bytes() const noexcept { return buffer_.size(); }

  /// Minimum bytes required for given dimensions and format (for validation).
  [[nodiscard]] static std::size_t min_bytes(std::uint32_t width,
                                             std::uint32_t height,
                                             PixelFormat format);

  /// True if the buffer is large enough for the declared dimensions and format.
  [[nodiscard]] bool valid() const noexcept;

 private:
  std::uint32_t width_{0};
  std::uint32_t height_{0};
  PixelFormat format_{PixelFormat::Unknown};
  std::vector<std::byte> buffer_;
  std::uint64_t sequence_{0};
  Timestamp timestamp_{};
};

}  // namespace slatewatch::core
