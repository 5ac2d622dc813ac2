#pragma once

#include <slatewatch/core/detection.hpp>
#include <slatewatch/core/error.hpp>
#include <slatewatch/core/frame.hpp>
#include <cstddef>
#include <cstdint>
#include <expected>
#include <memory>
#include <string>
#include <vector>

namespace slatewatch::vision {

/// A labelled reference ("slate") image.
struct ReferenceImage {
  std::string label;
  slatewatch::core::Frame image;
};

/// Scores frames against reference images loaded once at construction.
///
/// Similarity is mean SSIM on grayscale, with the frame resized to each
/// reference's analysis size (reference height capped at analysis_height,
/// aspect preserved). Resizing plus the Gaussian SSIM window make the score
/// tolerant of compression noise and independent of stream resolution.
/// Identical frame bytes always give identical scores.
///
/// Thread-safety: score() is const and may be called concurrently.
class ReferenceMatcher {
 public:
  static constexpr std::uint32_t kDefaultAnalysisHeight = 240;

  /// Throws std::invalid_argument if \p references is empty or any image is invalid.
  explicit ReferenceMatcher(std::vector<ReferenceImage> references,
                            std::uint32_t analysis_height = kDefaultAnalysisHeight);
  ~ReferenceMatcher();

  ReferenceMatcher(ReferenceMatcher&&) noexcept;
  ReferenceMatcher& operator=(ReferenceMatcher&&) noexcept;

  /// One score per reference, in construction order. References are scored in
  /// parallel. Fails with ScoreComputeError on an invalid or unsupported frame.
  [[nodiscard]] std::expected<std::vector<slatewatch::core::SimilarityScore>,
                              slatewatch::core::WatchError>
  score(const slatewatch::core::Frame& frame) const;

  [[nodiscard]] std::size_t size() const noexcept;
  [[nodiscard]] std::vector<std::string> labels() const;

 private:
  struct Impl;
  std::unique_ptr<Impl> impl_;
};

}  // namespace slatewatch::vision
