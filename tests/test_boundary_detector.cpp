#include <gtest/gtest.h>

#include <cstdint>
#include <vector>

#include "action_shorts/boundary_detector.hpp"

namespace action_shorts {

namespace {

/// Solid colour RGB24 image with the given row padding
std::vector<uint8_t> solid_rgb(int width, int height, int stride, uint8_t r,
                               uint8_t g, uint8_t b) {
  std::vector<uint8_t> buf(static_cast<size_t>(stride) * height, 0);
  for (int y = 0; y < height; ++y) {
    for (int x = 0; x < width; ++x) {
      uint8_t *px = &buf[static_cast<size_t>(y) * stride + 3 * x];
      px[0] = r;
      px[1] = g;
      px[2] = b;
    }
  }
  return buf;
}

HsvFrame solid_hsv(int width, int height, uint8_t r, uint8_t g, uint8_t b) {
  auto rgb = solid_rgb(width, height, width * 3, r, g, b);
  return rgb_to_hsv(rgb.data(), width, height, width * 3);
}

} // namespace

TEST(BoundaryDetectorTest, HsvUsesEightBitHueScale) {
  struct Case {
    uint8_t r, g, b;
    int h, s, v;
  };
  const Case cases[] = {
      {255, 0, 0, 0, 255, 255},   {0, 255, 0, 60, 255, 255},
      {0, 0, 255, 120, 255, 255}, {255, 255, 0, 30, 255, 255},
      {128, 128, 128, 0, 0, 128}, {0, 0, 0, 0, 0, 0},
  };

  for (const Case &c : cases) {
    HsvFrame f = solid_hsv(2, 2, c.r, c.g, c.b);
    ASSERT_EQ(f.h.size(), 4u);
    EXPECT_EQ(f.h[3], c.h) << int(c.r) << "," << int(c.g) << "," << int(c.b);
    EXPECT_EQ(f.s[3], c.s) << int(c.r) << "," << int(c.g) << "," << int(c.b);
    EXPECT_EQ(f.v[3], c.v) << int(c.r) << "," << int(c.g) << "," << int(c.b);
  }
}

TEST(BoundaryDetectorTest, HsvHonoursRowStride) {
  auto rgb = solid_rgb(3, 2, 16, 0, 255, 0);
  HsvFrame f = rgb_to_hsv(rgb.data(), 3, 2, 16);
  ASSERT_EQ(f.width, 3);
  ASSERT_EQ(f.height, 2);
  for (size_t i = 0; i < f.h.size(); ++i) {
    EXPECT_EQ(f.h[i], 60);
    EXPECT_EQ(f.v[i], 255);
  }
}

TEST(BoundaryDetectorTest, ContentScoreOfIdenticalFramesIsZero) {
  HsvFrame a = solid_hsv(8, 8, 10, 200, 30);
  HsvFrame b = solid_hsv(8, 8, 10, 200, 30);
  EXPECT_DOUBLE_EQ(content_score(a, b), 0.0);
}

TEST(BoundaryDetectorTest, ContentScoreAveragesChannels) {
  /// Black to white changes only V, by 255
  HsvFrame black = solid_hsv(4, 4, 0, 0, 0);
  HsvFrame white = solid_hsv(4, 4, 255, 255, 255);
  EXPECT_DOUBLE_EQ(content_score(black, white), 85.0);

  /// Red to blue changes only H, by 120
  HsvFrame red = solid_hsv(4, 4, 255, 0, 0);
  HsvFrame blue = solid_hsv(4, 4, 0, 0, 255);
  EXPECT_DOUBLE_EQ(content_score(red, blue), 40.0);
}

TEST(BoundaryDetectorTest, ContentScoreIgnoresMismatchedFrames) {
  HsvFrame small = solid_hsv(4, 4, 0, 0, 0);
  HsvFrame large = solid_hsv(8, 8, 255, 255, 255);
  EXPECT_DOUBLE_EQ(content_score(small, large), 0.0);
  EXPECT_DOUBLE_EQ(content_score(HsvFrame(), large), 0.0);
}

TEST(BoundaryDetectorTest, CutTrackerEnforcesMinimumSceneLength) {
  CutTracker tracker(27.0, 15);

  EXPECT_FALSE(tracker.update(0, 100.0));
  EXPECT_FALSE(tracker.update(10, 100.0));
  EXPECT_TRUE(tracker.update(15, 100.0));
  EXPECT_FALSE(tracker.update(20, 100.0));
  EXPECT_FALSE(tracker.update(30, 26.9));
  EXPECT_TRUE(tracker.update(30, 27.0));
}

TEST(BoundaryDetectorTest, CutTrackerCountsFromFirstFrame) {
  CutTracker tracker(10.0, 5);
  EXPECT_FALSE(tracker.update(100, 50.0));
  EXPECT_FALSE(tracker.update(104, 50.0));
  EXPECT_TRUE(tracker.update(105, 50.0));
}

TEST(BoundaryDetectorTest, ScenesFromCutsCoverDuration) {
  auto scenes = scenes_from_cuts({5.0, 2.0, 2.0, 0.0, 12.0, -1.0}, 10.0);

  ASSERT_EQ(scenes.size(), 3u);
  EXPECT_DOUBLE_EQ(scenes[0].start, 0.0);
  EXPECT_DOUBLE_EQ(scenes[0].end, 2.0);
  EXPECT_DOUBLE_EQ(scenes[1].start, 2.0);
  EXPECT_DOUBLE_EQ(scenes[1].end, 5.0);
  EXPECT_DOUBLE_EQ(scenes[2].start, 5.0);
  EXPECT_DOUBLE_EQ(scenes[2].end, 10.0);
}

TEST(BoundaryDetectorTest, NoCutsGivesSingleScene) {
  auto scenes = scenes_from_cuts({}, 42.5);
  ASSERT_EQ(scenes.size(), 1u);
  EXPECT_DOUBLE_EQ(scenes[0].start, 0.0);
  EXPECT_DOUBLE_EQ(scenes[0].end, 42.5);
}

TEST(BoundaryDetectorTest, NonPositiveDurationGivesNoScenes) {
  EXPECT_TRUE(scenes_from_cuts({1.0, 2.0}, 0.0).empty());
  EXPECT_TRUE(scenes_from_cuts({}, -3.0).empty());
}

} // namespace action_shorts
