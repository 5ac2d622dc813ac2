#include <slatewatch/core/frame.hpp>
#include <gtest/gtest.h>
#include <chrono>
#include <vector>

namespace sc = slatewatch::core;

TEST(Frame, DefaultEmpty) {
  sc::Frame f;
  EXPECT_EQ(f.width(), 0u);
  EXPECT_EQ(f.height(), 0u);
  EXPECT_TRUE(f.empty());
  EXPECT_EQ(f.size_bytes(), 0u);
  EXPECT_EQ(f.sequence(), 0u);
  EXPECT_FALSE(f.valid());
}

TEST(Frame, ConstructFromBuffer) {
  std::vector<std::byte> buf(100 * 100 * 3);
  const auto ts = std::chrono::system_clock::now();
  sc::Frame f(100, 100, sc::PixelFormat::BGR8, std::move(buf), 7, ts);
  EXPECT_EQ(f.width(), 100u);
  EXPECT_EQ(f.height(), 100u);
  EXPECT_EQ(f.format(), sc::PixelFormat::BGR8);
  EXPECT_EQ(f.sequence(), 7u);
  EXPECT_EQ(f.timestamp(), ts);
  EXPECT_FALSE(f.empty());
  EXPECT_EQ(f.data().size(), 100u * 100 * 3);
  EXPECT_TRUE(f.valid());
}

TEST(Frame, MinBytes) {
  EXPECT_EQ(sc::Frame::min_bytes(10, 10, sc::PixelFormat::Grayscale8), 100u);
  EXPECT_EQ(sc::Frame::min_bytes(10, 10, sc::PixelFormat::BGR8), 300u);
  EXPECT_EQ(sc::Frame::min_bytes(10, 10, sc::PixelFormat::BGRA8), 400u);
  EXPECT_EQ(sc::Frame::min_bytes(10, 10, sc::PixelFormat::Unknown), 0u);
}

TEST(Frame, ShortBufferIsInvalid) {
  sc::Frame f(10, 10, sc::PixelFormat::RGB8, std::vector<std::byte>(299));
  EXPECT_FALSE(f.valid());
  sc::Frame unknown(10, 10, sc::PixelFormat::Unknown, std::vector<std::byte>(300));
  EXPECT_FALSE(unknown.valid());
}

TEST(Frame, SetSequenceAndTimestamp) {
  sc::Frame f(1, 1, sc::PixelFormat::Grayscale8, std::vector<std::byte>(1));
  const auto ts = std::chrono::system_clock::time_point(std::chrono::seconds(5));
  f.set_sequence(42);
  f.set_timestamp(ts);
  EXPECT_EQ(f.sequence(), 42u);
  EXPECT_EQ(f.timestamp(), ts);
}
