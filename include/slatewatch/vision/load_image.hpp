#pragma once

#include <slatewatch/core/error.hpp>
#include <slatewatch/core/frame.hpp>
#include <cstddef>
#include <expected>
#include <span>
#include <string>

namespace slatewatch::vision {

/// Load an image file (any format OpenCV reads) as a BGR8 or Grayscale8 Frame.
[[nodiscard]] std::expected<slatewatch::core::Frame, slatewatch::core::WatchError>
load_frame_from_image(const std::string& path);

/// Decode an encoded image (PNG, JPEG, ...) held in memory.
[[nodiscard]] std::expected<slatewatch::core::Frame, slatewatch::core::WatchError>
decode_frame_from_bytes(std::span<const std::byte> bytes);

}  // namespace slatewatch::vision
