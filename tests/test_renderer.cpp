#include <gtest/gtest.h>

#include <string>
#include <utility>
#include <vector>

#include "action_shorts/errors.hpp"
#include "action_shorts/renderer.hpp"

namespace action_shorts {

namespace {

/**
 * @class ScriptedRenderer
 * @brief FfmpegRenderer whose process exits follow a fixed script.
 */
class ScriptedRenderer : public FfmpegRenderer {
public:
  ScriptedRenderer(const ShortsConfig &config, std::vector<int> statuses)
      : FfmpegRenderer(config), statuses_(std::move(statuses)) {}

  std::vector<std::string> commands;
  bool inspect_fails = false;

protected:
  int execute(const std::string &cmd) override {
    commands.push_back(cmd);
    size_t i = commands.size() - 1;
    return i < statuses_.size() ? statuses_[i] : 0;
  }

  VideoInfo inspect(const std::string &) override {
    if (inspect_fails)
      throw DecodeError("unreadable");
    VideoInfo info;
    info.width = 1920;
    info.height = 1080;
    info.fps = 30.0;
    info.duration = 600.0;
    return info;
  }

private:
  std::vector<int> statuses_;
};

VideoInfo video(int width, int height, double fps) {
  VideoInfo info;
  info.width = width;
  info.height = height;
  info.fps = fps;
  info.duration = 60.0;
  return info;
}

bool contains(const std::string &haystack, const std::string &needle) {
  return haystack.find(needle) != std::string::npos;
}

} // namespace

TEST(RendererTest, CropLandscapeToSquare) {
  CropRect c = crop_to_ratio(1920, 1080, 1, 1, 0.5, 0.5);
  EXPECT_EQ(c.width, 1080);
  EXPECT_EQ(c.height, 1080);
  EXPECT_EQ(c.x, 420);
  EXPECT_EQ(c.y, 0);
}

TEST(RendererTest, CropSizeIsEven) {
  CropRect c = crop_to_ratio(1920, 1080, 9, 16, 0.5, 0.5);
  EXPECT_EQ(c.width, 608);
  EXPECT_EQ(c.height, 1080);
  EXPECT_EQ(c.x, 656);
}

TEST(RendererTest, CropPortraitToSquare) {
  CropRect c = crop_to_ratio(1080, 1920, 1, 1, 0.5, 0.5);
  EXPECT_EQ(c.width, 1080);
  EXPECT_EQ(c.height, 1080);
  EXPECT_EQ(c.x, 0);
  EXPECT_EQ(c.y, 420);
}

TEST(RendererTest, CropIsClampedInsideFrame) {
  CropRect left = crop_to_ratio(1920, 1080, 1, 1, 0.0, 0.5);
  EXPECT_EQ(left.x, 0);

  CropRect right = crop_to_ratio(1920, 1080, 1, 1, 1.0, 0.5);
  EXPECT_EQ(right.x, 1920 - 1080);
}

TEST(RendererTest, BackgroundResolutionThresholds) {
  EXPECT_EQ(select_background_resolution(800), std::make_pair(720, 1280));
  EXPECT_EQ(select_background_resolution(840), std::make_pair(900, 1600));
  EXPECT_EQ(select_background_resolution(1080), std::make_pair(1080, 1920));
  EXPECT_EQ(select_background_resolution(1500), std::make_pair(1440, 2560));
  EXPECT_EQ(select_background_resolution(1800), std::make_pair(1800, 3200));
  EXPECT_EQ(select_background_resolution(2100), std::make_pair(2160, 3840));
}

TEST(RendererTest, FilterGraphCropsWideSourceOntoSquareBackground) {
  ShortsConfig config;
  std::string graph = build_filter_graph(video(1920, 1080, 30.0), config);

  EXPECT_TRUE(contains(graph, "crop=1080:1080:420:0,"));
  EXPECT_TRUE(contains(graph, "scale=1080:-2"));
  EXPECT_TRUE(contains(graph, "gblur=sigma=8"));
  EXPECT_TRUE(contains(graph, "overlay=(W-w)/2:(H-h)/2"));
  EXPECT_FALSE(contains(graph, "fps=60"));
  EXPECT_EQ(graph.substr(graph.size() - 3), "[v]");
}

TEST(RendererTest, FilterGraphCapsFrameRate) {
  ShortsConfig config;
  std::string graph = build_filter_graph(video(1920, 1080, 120.0), config);
  EXPECT_TRUE(contains(graph, ",fps=60[v]"));
}

TEST(RendererTest, FilterGraphPassesNineBySixteenThrough) {
  ShortsConfig config;
  std::string graph = build_filter_graph(video(1080, 1920, 30.0), config);
  EXPECT_EQ(graph, "[0:v]scale=1080:-2,setsar=1[v]");
}

TEST(RendererTest, FilterGraphPadsTallSource) {
  ShortsConfig config;
  std::string graph = build_filter_graph(video(600, 1600, 30.0), config);
  EXPECT_TRUE(contains(graph, "scale=720:1280,gblur=sigma=8"));
  EXPECT_TRUE(contains(graph, "overlay"));
}

TEST(RendererTest, SceneOutputName) {
  EXPECT_EQ(scene_output_name("/videos/My Game.mp4", 0),
            "My Game scene-0.mp4");
  EXPECT_EQ(scene_output_name("clip.mkv", 4), "clip scene-4.mkv");
}

TEST(RendererTest, ShellQuoteEscapesSingleQuotes) {
  EXPECT_EQ(shell_quote("plain"), "'plain'");
  EXPECT_EQ(shell_quote("it's"), "'it'\\''s'");
}

TEST(RendererTest, CommandCarriesRangeAndPaths) {
  ShortsConfig config;
  FfmpegRenderer renderer(config, "/opt/ffmpeg");
  std::string cmd = renderer.build_command(
      "in.mp4", video(1920, 1080, 30.0), {12.5, 20.0}, "out dir/a.mp4");

  EXPECT_EQ(cmd.rfind("'/opt/ffmpeg' ", 0), 0u);
  EXPECT_TRUE(contains(cmd, "-ss 12.500 -i 'in.mp4' -t 7.500"));
  EXPECT_TRUE(contains(cmd, "-c:v libx264"));
  EXPECT_TRUE(contains(cmd, "'out dir/a.mp4'"));
}

TEST(RendererTest, RetriesUntilSuccess) {
  ShortsConfig config;
  config.max_error_depth = 1;
  ScriptedRenderer renderer(config, {256, 0});

  EXPECT_TRUE(renderer.render("in.mp4", {0.0, 20.0}, "out.mp4"));
  EXPECT_EQ(renderer.commands.size(), 2u);
}

TEST(RendererTest, GivesUpAfterMaxErrorDepth) {
  ShortsConfig config;
  config.max_error_depth = 2;
  ScriptedRenderer renderer(config, {256, 256, 256, 0});

  EXPECT_FALSE(renderer.render("in.mp4", {0.0, 20.0}, "out.mp4"));
  EXPECT_EQ(renderer.commands.size(), 3u);
}

TEST(RendererTest, ZeroErrorDepthMeansSingleAttempt) {
  ShortsConfig config;
  config.max_error_depth = 0;
  ScriptedRenderer renderer(config, {256, 0});

  EXPECT_FALSE(renderer.render("in.mp4", {0.0, 20.0}, "out.mp4"));
  EXPECT_EQ(renderer.commands.size(), 1u);
}

TEST(RendererTest, UnreadableSourceIsNotExecuted) {
  ShortsConfig config;
  ScriptedRenderer renderer(config, {});
  renderer.inspect_fails = true;

  EXPECT_FALSE(renderer.render("in.mp4", {0.0, 20.0}, "out.mp4"));
  EXPECT_TRUE(renderer.commands.empty());
}

} // namespace action_shorts
