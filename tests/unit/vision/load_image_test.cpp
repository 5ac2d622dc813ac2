#include <slatewatch/vision/load_image.hpp>
#include <gtest/gtest.h>
#include <opencv2/core.hpp>
#include <opencv2/imgcodecs.hpp>
#include <cstddef>
#include <filesystem>
#include <span>
#include <vector>

namespace sc = slatewatch::core;
namespace sv = slatewatch::vision;

namespace {

cv::Mat checker(int w, int h) {
  cv::Mat m(h, w, CV_8UC3);
  for (int y = 0; y < h; ++y) {
    for (int x = 0; x < w; ++x) {
      const auto v = static_cast<unsigned char>(((x / 8 + y / 8) % 2) ? 220 : 20);
      m.at<cv::Vec3b>(y, x) = cv::Vec3b(v, v, v);
    }
  }
  return m;
}

}  // namespace

TEST(LoadImage, MissingFileFails) {
  auto f = sv::load_frame_from_image("/nonexistent/slate.png");
  ASSERT_FALSE(f.has_value());
  EXPECT_EQ(f.error(), sc::WatchError::LoadFailed);
}

TEST(LoadImage, ReadsPngAsBgr) {
  const auto path = std::filesystem::temp_directory_path() / "slatewatch_load_image_test.png";
  ASSERT_TRUE(cv::imwrite(path.string(), checker(48, 32)));
  auto f = sv::load_frame_from_image(path.string());
  std::filesystem::remove(path);
  ASSERT_TRUE(f.has_value());
  EXPECT_EQ(f->width(), 48u);
  EXPECT_EQ(f->height(), 32u);
  EXPECT_EQ(f->format(), sc::PixelFormat::BGR8);
  EXPECT_TRUE(f->valid());
}

TEST(LoadImage, DecodesEncodedBytes) {
  std::vector<unsigned char> encoded;
  ASSERT_TRUE(cv::imencode(".png", checker(16, 16), encoded));
  const auto bytes = std::as_bytes(std::span(encoded.data(), encoded.size()));
  auto f = sv::decode_frame_from_bytes(bytes);
  ASSERT_TRUE(f.has_value());
  EXPECT_EQ(f->width(), 16u);
  EXPECT_EQ(f->height(), 16u);
}

TEST(LoadImage, GarbageBytesFail) {
  const std::vector<std::byte> junk(64, std::byte{0x5a});
  auto f = sv::decode_frame_from_bytes(junk);
  ASSERT_FALSE(f.has_value());
  EXPECT_EQ(f.error(), sc::WatchError::LoadFailed);
}
