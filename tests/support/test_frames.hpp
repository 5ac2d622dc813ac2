#pragma once

#include <slatewatch/core/frame.hpp>
#include <cstddef>
#include <cstdint>
#include <vector>

namespace slatewatch::test {

namespace detail {

template <typename Fn>
core::Frame make_bgr(std::uint32_t w, std::uint32_t h, std::uint64_t sequence,
                     core::Timestamp ts, Fn&& intensity) {
  std::vector<std::byte> buf(static_cast<std::size_t>(w) * h * 3);
  for (std::uint32_t y = 0; y < h; ++y) {
    for (std::uint32_t x = 0; x < w; ++x) {
      const auto v = static_cast<std::byte>(intensity(x, y));
      const std::size_t i = (static_cast<std::size_t>(y) * w + x) * 3;
      buf[i] = v;
      buf[i + 1] = v;
      buf[i + 2] = v;
    }
  }
  return core::Frame(w, h, core::PixelFormat::BGR8, std::move(buf), sequence, ts);
}

}  // namespace detail

/// Vertical bars with a grey block in the middle: the "slate".
inline core::Frame make_slate_frame(std::uint32_t w = 320, std::uint32_t h = 240,
                                    std::uint64_t sequence = 0, core::Timestamp ts = {}) {
  return detail::make_bgr(w, h, sequence, ts, [w, h](std::uint32_t x, std::uint32_t y) {
    const std::uint32_t bar = w / 20 == 0 ? 1 : w / 20;
    if (x > w / 4 && x < 3 * w / 4 && y > h / 3 && y < 2 * h / 3) return 128;
    return (x / bar) % 2 ? 230 : 30;
  });
}

/// Slate with a small deterministic +-2 dither, as left by lossy encoding.
inline core::Frame make_noisy_slate_frame(std::uint32_t w = 320, std::uint32_t h = 240) {
  const core::Frame clean = make_slate_frame(w, h);
  const auto src = clean.data();
  std::vector<std::byte> buf(src.begin(), src.end());
  for (std::size_t i = 0; i < buf.size(); ++i) {
    const int v = static_cast<int>(buf[i]) + static_cast<int>((i * 7 + i / 3 * 13) % 5) - 2;
    buf[i] = static_cast<std::byte>(v);
  }
  return core::Frame(w, h, core::PixelFormat::BGR8, std::move(buf));
}

/// Diagonal stripes: ordinary programme content.
inline core::Frame make_content_frame(std::uint32_t w = 320, std::uint32_t h = 240,
                                      std::uint64_t sequence = 0, core::Timestamp ts = {}) {
  return detail::make_bgr(w, h, sequence, ts, [](std::uint32_t x, std::uint32_t y) {
    return ((x + 2 * y) / 9) % 3 == 0 ? 210 : 50;
  });
}

}  // namespace slatewatch::test
