#include <gtest/gtest.h>

#include <vector>

#include "action_shorts/scene_ranker.hpp"
#include "action_shorts/scene_segmenter.hpp"

namespace action_shorts {

namespace {

/// One frame every `step` seconds over [0, duration) with score f(t)
template <typename F>
ActionProfile make_profile(double duration, double step, F score_at) {
  ActionProfile profile;
  for (int i = 0; i * step < duration; ++i) {
    double t = i * step;
    float s = static_cast<float>(score_at(t));
    profile.push_back({t, s, s, s});
  }
  return profile;
}

ShortsConfig limits(double min_len, double max_len, int scene_limit) {
  ShortsConfig c;
  c.min_short_length = min_len;
  c.max_short_length = max_len;
  c.scene_limit = scene_limit;
  return c;
}

} // namespace

TEST(SceneRankerTest, FramesAreAttributedHalfOpen) {
  ActionProfile profile = {
      {0.0, 0, 0, 0.2f}, {1.0, 0, 0, 0.4f}, {2.0, 0, 0, 1.0f}};
  auto scores = score_scenes(profile, {{0.0, 2.0}, {2.0, 3.0}});

  ASSERT_EQ(scores.size(), 2u);
  EXPECT_NEAR(scores[0], 0.3, 1e-6);
  EXPECT_NEAR(scores[1], 1.0, 1e-6);
}

TEST(SceneRankerTest, SceneWithoutFramesScoresZero) {
  ActionProfile profile = {{0.0, 0, 0, 0.9f}, {10.0, 0, 0, 0.9f}};
  auto scores = score_scenes(profile, {{1.0, 9.0}});
  ASSERT_EQ(scores.size(), 1u);
  EXPECT_DOUBLE_EQ(scores[0], 0.0);

  EXPECT_DOUBLE_EQ(score_scenes({}, {{0.0, 5.0}})[0], 0.0);
}

TEST(SceneRankerTest, UnsortedScenesKeepTheirOrder) {
  auto profile =
      make_profile(30.0, 0.5, [](double t) { return t < 10.0 ? 0.1 : 0.8; });
  auto scores = score_scenes(profile, {{20.0, 30.0}, {0.0, 10.0}});

  ASSERT_EQ(scores.size(), 2u);
  EXPECT_NEAR(scores[0], 0.8, 1e-6);
  EXPECT_NEAR(scores[1], 0.1, 1e-6);
}

TEST(SceneRankerTest, SortsByScoreDescending) {
  auto profile = make_profile(40.0, 0.25, [](double t) {
    if (t < 10.0)
      return 0.2;
    if (t < 20.0)
      return 0.9;
    if (t < 30.0)
      return 0.5;
    return 0.7;
  });
  std::vector<CombinedScene> scenes = {{0, 10}, {10, 20}, {20, 30}, {30, 40}};

  auto shortlist = rank_scenes(profile, scenes, limits(5, 179, 10));
  ASSERT_EQ(shortlist.size(), 4u);
  EXPECT_DOUBLE_EQ(shortlist[0].scene.start, 10.0);
  EXPECT_DOUBLE_EQ(shortlist[1].scene.start, 30.0);
  EXPECT_DOUBLE_EQ(shortlist[2].scene.start, 20.0);
  EXPECT_DOUBLE_EQ(shortlist[3].scene.start, 0.0);
  for (size_t i = 1; i < shortlist.size(); ++i) {
    EXPECT_GE(shortlist[i - 1].action_score, shortlist[i].action_score);
  }
}

TEST(SceneRankerTest, EqualScoresKeepChronologicalOrder) {
  auto profile = make_profile(60.0, 0.5, [](double) { return 0.5; });
  /// Deliberately out of order
  std::vector<CombinedScene> scenes = {{40, 60}, {0, 9}, {9, 40}};

  auto shortlist = rank_scenes(profile, scenes, limits(5, 179, 3));
  ASSERT_EQ(shortlist.size(), 3u);
  EXPECT_DOUBLE_EQ(shortlist[0].scene.start, 0.0);
  EXPECT_DOUBLE_EQ(shortlist[1].scene.start, 9.0);
  EXPECT_DOUBLE_EQ(shortlist[2].scene.start, 40.0);
}

TEST(SceneRankerTest, FiltersByDurationInclusive) {
  auto profile = make_profile(240.0, 1.0, [](double) { return 0.5; });
  std::vector<CombinedScene> scenes = {
      {0, 4}, {4, 9}, {9, 30}, {30, 130}, {130, 231}};

  auto shortlist = rank_scenes(profile, scenes, limits(5, 100, 10));
  ASSERT_EQ(shortlist.size(), 3u);
  EXPECT_DOUBLE_EQ(shortlist[0].scene.start, 4.0);
  EXPECT_DOUBLE_EQ(shortlist[1].scene.start, 9.0);
  EXPECT_DOUBLE_EQ(shortlist[2].scene.start, 30.0);
  for (const auto &entry : shortlist) {
    EXPECT_GE(entry.scene.duration(), 5.0);
    EXPECT_LE(entry.scene.duration(), 100.0);
  }
}

TEST(SceneRankerTest, TruncatesToSceneLimit) {
  auto profile = make_profile(100.0, 0.5, [](double t) { return t / 100.0; });
  std::vector<CombinedScene> scenes;
  for (int i = 0; i < 10; ++i)
    scenes.push_back({i * 10.0, i * 10.0 + 10.0});

  auto shortlist = rank_scenes(profile, scenes, limits(5, 179, 3));
  ASSERT_EQ(shortlist.size(), 3u);
  EXPECT_DOUBLE_EQ(shortlist[0].scene.start, 90.0);
  EXPECT_DOUBLE_EQ(shortlist[1].scene.start, 80.0);
  EXPECT_DOUBLE_EQ(shortlist[2].scene.start, 70.0);
}

TEST(SceneRankerTest, NoQualifyingScenesGivesEmptyShortlist) {
  auto profile = make_profile(10.0, 0.5, [](double) { return 1.0; });
  auto shortlist = rank_scenes(profile, {{0, 2}, {2, 10}}, limits(15, 179, 6));
  EXPECT_TRUE(shortlist.empty());
}

TEST(SceneRankerTest, SixtySecondScenario) {
  std::vector<RawScene> raw = {{0, 5}, {5, 9}, {9, 40}, {40, 60}};
  auto combined = combine_scenes(raw, 20.0);
  ASSERT_EQ(combined.size(), 3u);

  auto profile = make_profile(60.0, 512.0 / 44100.0, [](double) { return 0.5; });
  auto shortlist = rank_scenes(profile, combined, limits(5, 179, 2));

  ASSERT_EQ(shortlist.size(), 2u);
  EXPECT_DOUBLE_EQ(shortlist[0].scene.start, 0.0);
  EXPECT_DOUBLE_EQ(shortlist[0].scene.end, 9.0);
  EXPECT_NEAR(shortlist[0].action_score, 0.5, 1e-6);
  EXPECT_DOUBLE_EQ(shortlist[1].scene.start, 9.0);
  EXPECT_DOUBLE_EQ(shortlist[1].scene.end, 40.0);
  EXPECT_NEAR(shortlist[1].action_score, 0.5, 1e-6);
}

} // namespace action_shorts
