#pragma once

#include <slatewatch/core/frame.hpp>
#include <opencv2/core/mat.hpp>
#include <optional>

namespace slatewatch::vision::detail {

/// Convert Frame to cv::Mat (shared view, no copy). Returns nullopt if format unsupported.
std::optional<cv::Mat> frame_to_mat(const slatewatch::core::Frame& frame);

/// Convert cv::Mat to Frame (copy).
slatewatch::core::Frame mat_to_frame(const cv::Mat& mat,
                                     slatewatch::core::PixelFormat format);

/// Single-channel 8-bit view of \p frame. Returns nullopt if format unsupported.
std::optional<cv::Mat> frame_to_gray(const slatewatch::core::Frame& frame);

}  // namespace slatewatch::vision::detail
