#include <slatewatch/vision/reference_matcher.hpp>
#include "frame_cv_utils.hpp"
#include <opencv2/core.hpp>
#include <opencv2/imgproc.hpp>
#include <spdlog/spdlog.h>
#include <tbb/parallel_for.h>
#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <utility>

namespace slatewatch::vision {

namespace sc = slatewatch::core;

namespace {

// SSIM stabilizers for an 8-bit dynamic range: (0.01 * 255)^2, (0.03 * 255)^2.
constexpr double kC1 = 6.5025;
constexpr double kC2 = 58.5225;
const cv::Size kWindow(11, 11);
constexpr double kSigma = 1.5;

cv::Mat blur(const cv::Mat& m) {
  cv::Mat out;
  cv::GaussianBlur(m, out, kWindow, kSigma);
  return out;
}

cv::Size analysis_size(int width, int height, std::uint32_t max_height) {
  if (max_height == 0 || height <= static_cast<int>(max_height)) {
    return {width, height};
  }
  const double scale = static_cast<double>(max_height) / height;
  const int w = std::max(1, static_cast<int>(std::lround(width * scale)));
  return {w, static_cast<int>(max_height)};
}

}  // namespace

struct ReferenceMatcher::Impl {
  /// Reference-side SSIM terms are computed once.
  struct Prepared {
    std::string label;
    cv::Size size;
    cv::Mat image;     // CV_32F
    cv::Mat mu;
    cv::Mat mu_sq;
    cv::Mat sigma_sq;
  };

  std::vector<Prepared> refs;

  double ssim(const Prepared& ref, const cv::Mat& gray) const {
    cv::Mat resized;
    if (gray.size() == ref.size) {
      resized = gray;
    } else {
      cv::resize(gray, resized, ref.size, 0, 0, cv::INTER_AREA);
    }
    cv::Mat img;
    resized.convertTo(img, CV_32F);

    const cv::Mat mu = blur(img);
    const cv::Mat mu_sq = mu.mul(mu);
    const cv::Mat mu_cross = mu.mul(ref.mu);
    const cv::Mat sigma_sq = blur(img.mul(img)) - mu_sq;
    const cv::Mat sigma_cross = blur(img.mul(ref.image)) - mu_cross;

    const cv::Mat numerator = (2 * mu_cross + kC1).mul(2 * sigma_cross + kC2);
    const cv::Mat denominator = (mu_sq + ref.mu_sq + kC1).mul(sigma_sq + ref.sigma_sq + kC2);
    cv::Mat map;
    cv::divide(numerator, denominator, map);
    const double value = cv::mean(map)[0];
    return std::clamp(value, 0.0, 1.0);
  }
};

ReferenceMatcher::ReferenceMatcher(std::vector<ReferenceImage> references,
                                   std::uint32_t analysis_height)
    : impl_(std::make_unique<Impl>()) {
  if (references.empty()) {
    throw std::invalid_argument("ReferenceMatcher requires at least one reference image");
  }
  impl_->refs.reserve(references.size());
  for (auto& ref : references) {
    auto gray = detail::frame_to_gray(ref.image);
    if (!gray) {
      throw std::invalid_argument("reference '" + ref.label + "' is not a valid image");
    }
    Impl::Prepared p;
    p.label = std::move(ref.label);
    p.size = analysis_size(gray->cols, gray->rows, analysis_height);
    cv::Mat resized;
    if (gray->size() == p.size) {
      resized = *gray;
    } else {
      cv::resize(*gray, resized, p.size, 0, 0, cv::INTER_AREA);
    }
    resized.convertTo(p.image, CV_32F);
    p.mu = blur(p.image);
    p.mu_sq = p.mu.mul(p.mu);
    p.sigma_sq = blur(p.image.mul(p.image)) - p.mu_sq;
    spdlog::debug("Reference '{}' prepared at {}x{}", p.label, p.size.width, p.size.height);
    impl_->refs.push_back(std::move(p));
  }
}

ReferenceMatcher::~ReferenceMatcher() = default;
ReferenceMatcher::ReferenceMatcher(ReferenceMatcher&&) noexcept = default;
ReferenceMatcher& ReferenceMatcher::operator=(ReferenceMatcher&&) noexcept = default;

std::expected<std::vector<sc::SimilarityScore>, sc::WatchError>
ReferenceMatcher::score(const sc::Frame& frame) const {
  auto gray = detail::frame_to_gray(frame);
  if (!gray) {
    return std::unexpected(sc::WatchError::ScoreComputeError);
  }

  std::vector<sc::SimilarityScore> scores(impl_->refs.size());
  try {
    tbb::parallel_for(std::size_t{0}, impl_->refs.size(), [&](std::size_t i) {
      const auto& ref = impl_->refs[i];
      scores[i].timestamp = frame.timestamp();
      scores[i].label = ref.label;
      scores[i].value = impl_->ssim(ref, *gray);
    });
  } catch (const cv::Exception& e) {
    spdlog::warn("Scoring frame {} failed: {}", frame.sequence(), e.what());
    return std::unexpected(sc::WatchError::ScoreComputeError);
  }
  return scores;
}

std::size_t ReferenceMatcher::size() const noexcept { return impl_ ? impl_->refs.size() : 0; }

std::vector<std::string> ReferenceMatcher::labels() const {
  std::vector<std::string> out;
  if (!impl_) return out;
  out.reserve(impl_->refs.size());
  for (const auto& r : impl_->refs) out.push_back(r.label);
  return out;
}

}  // namespace slatewatch::vision
