/*
 * auctv - Auction Listing Video Renderer
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "auctv/media_assembler.hpp"
#include "test_support.hpp"
#include <algorithm>
#include <atomic>
#include <thread>

using namespace auctv;
using auctv::testing::TempDirTest;

namespace {

SceneInput scene(const std::string& image, double seconds) {
    SceneInput s;
    s.image = image;
    if (seconds > 0.0) {
        s.audio = image + ".wav";
        s.narrationSeconds = seconds;
    }
    return s;
}

bool contains(const std::vector<std::string>& argv, const std::string& needle) {
    return std::any_of(argv.begin(), argv.end(), [&](const std::string& arg) {
        return arg.find(needle) != std::string::npos;
    });
}

}

TEST(RenderPlan, CrossfadesShortenTotalDuration) {
    RenderSettings settings;
    settings.transitionSeconds = 1.0;
    Storyboard board = planRender({scene("a.jpg", 5.0), scene("b.jpg", 4.0), scene("c.jpg", 6.0)}, settings);

    ASSERT_EQ(board.clips.size(), 3u);
    EXPECT_DOUBLE_EQ(board.totalSeconds, 13.0);
    EXPECT_DOUBLE_EQ(board.clips[0].offset, 0.0);
    EXPECT_DOUBLE_EQ(board.clips[1].offset, 4.0);
    EXPECT_DOUBLE_EQ(board.clips[2].offset, 7.0);
    EXPECT_EQ(board.clips[0].frames, 150);
    EXPECT_EQ(board.clips[1].frames, 120);
    EXPECT_EQ(board.clips[2].frames, 180);
}

TEST(RenderPlan, ZoomAlternatesByIndex) {
    Storyboard board = planRender({scene("a", 5), scene("b", 5), scene("c", 5), scene("d", 5)}, RenderSettings{});
    EXPECT_EQ(board.clips[0].zoom, Zoom::In);
    EXPECT_EQ(board.clips[1].zoom, Zoom::Out);
    EXPECT_EQ(board.clips[2].zoom, Zoom::In);
    EXPECT_EQ(board.clips[3].zoom, Zoom::Out);
}

TEST(RenderPlan, SilentScenesUseDefaultDuration) {
    Storyboard board = planRender({scene("a.jpg", 0.0)}, RenderSettings{});
    ASSERT_EQ(board.clips.size(), 1u);
    EXPECT_DOUBLE_EQ(board.clips[0].seconds, 4.0);
    EXPECT_FALSE(board.clips[0].audio);
    EXPECT_DOUBLE_EQ(board.totalSeconds, 4.0);
}

TEST(RenderPlan, ClipNeverShorterThanTransitionPlusTail) {
    RenderSettings settings;
    settings.transitionSeconds = 1.0;
    Storyboard board = planRender({scene("a", 0.8), scene("b", 5.0)}, settings);
    EXPECT_DOUBLE_EQ(board.clips[0].seconds, 1.5);
    EXPECT_DOUBLE_EQ(board.clips[1].offset, 0.5);
}

TEST(RenderPlan, SceneIsNeverShorterThanItsNarration) {
    Storyboard board = planRender({scene("a", 12.345)}, RenderSettings{});
    EXPECT_GE(board.clips[0].seconds, 12.345);
}

TEST(RenderPlan, EmptySceneListPlansNothing) {
    Storyboard board = planRender({}, RenderSettings{});
    EXPECT_TRUE(board.clips.empty());
    EXPECT_DOUBLE_EQ(board.totalSeconds, 0.0);
}

TEST(RenderPlan, ZoomExpressionIsLinearOverClip) {
    EXPECT_EQ(zoomExpression(Zoom::In, 150), "1+0.15*on/149");
    EXPECT_EQ(zoomExpression(Zoom::Out, 150), "1.15-0.15*on/149");
    EXPECT_EQ(zoomExpression(Zoom::In, 1), "1+0.15*on/1");
}

TEST(RenderPlan, ClipCommandSynthesizesSilenceWithoutNarration) {
    Storyboard board = planRender({scene("photo.jpg", 0.0)}, RenderSettings{});
    auto argv = clipCommand("ffmpeg", board.clips[0], board.settings, "out.mp4");

    EXPECT_EQ(argv.front(), "ffmpeg");
    EXPECT_EQ(argv.back(), "out.mp4");
    EXPECT_TRUE(contains(argv, "anullsrc=r=48000:cl=stereo"));
    EXPECT_TRUE(contains(argv, "zoompan=z='1+0.15*on/119'"));
    EXPECT_TRUE(contains(argv, "s=1920x1080"));
    EXPECT_TRUE(contains(argv, "atrim=0:4.000"));
}

TEST(RenderPlan, ClipCommandUsesNarrationAudio) {
    Storyboard board = planRender({scene("photo.jpg", 5.0)}, RenderSettings{});
    auto argv = clipCommand("ffmpeg", board.clips[0], board.settings, "out.mp4");
    EXPECT_TRUE(contains(argv, "photo.jpg.wav"));
    EXPECT_FALSE(contains(argv, "anullsrc"));
}

TEST(RenderPlan, JoinCommandChainsCrossfades) {
    Storyboard board = planRender({scene("a", 5.0), scene("b", 4.0), scene("c", 6.0)}, RenderSettings{});
    auto argv = joinCommand("ffmpeg", board, {"c0.mp4", "c1.mp4", "c2.mp4"}, "final.mp4");

    EXPECT_TRUE(contains(argv, "xfade=transition=fade:duration=1.000:offset=4.000[v1]"));
    EXPECT_TRUE(contains(argv, "[v1][2:v]xfade=transition=fade:duration=1.000:offset=7.000[v2]"));
    EXPECT_TRUE(contains(argv, "[a1][2:a]acrossfade=d=1.000[a2]"));
    EXPECT_TRUE(contains(argv, "+faststart"));
    EXPECT_EQ(argv.back(), "final.mp4");
}

TEST(RenderPlan, JoinCommandUsesConfiguredTransitionStyle) {
    RenderSettings settings;
    settings.transition = Transition::Slide;
    Storyboard board = planRender({scene("a", 5.0), scene("b", 4.0)}, settings);
    auto argv = joinCommand("ffmpeg", board, {"c0.mp4", "c1.mp4"}, "final.mp4");

    EXPECT_TRUE(contains(argv, "[0:v][1:v]xfade=transition=slideleft:duration=1.000:offset=4.000[v1]"));
    EXPECT_FALSE(contains(argv, "transition=fade"));
}

TEST(RenderPlan, PerSceneTransitionOverridesDefault) {
    SceneInput second = scene("b", 4.0);
    second.transition = Transition::Wipe;
    Storyboard board = planRender({scene("a", 5.0), second, scene("c", 6.0)}, RenderSettings{});
    EXPECT_EQ(board.clips[1].transition, Transition::Wipe);
    EXPECT_EQ(board.clips[2].transition, Transition::Fade);

    auto argv = joinCommand("ffmpeg", board, {"c0.mp4", "c1.mp4", "c2.mp4"}, "final.mp4");
    EXPECT_TRUE(contains(argv, "xfade=transition=wiperight:duration=1.000:offset=4.000[v1]"));
    EXPECT_TRUE(contains(argv, "[v1][2:v]xfade=transition=fade:duration=1.000:offset=7.000[v2]"));
}

TEST(RenderPlan, HardCutsDoNotOverlapClips) {
    RenderSettings settings;
    settings.transition = Transition::Cut;
    Storyboard board = planRender({scene("a", 5.0), scene("b", 4.0), scene("c", 6.0)}, settings);

    EXPECT_DOUBLE_EQ(board.totalSeconds, 15.0);
    EXPECT_DOUBLE_EQ(board.clips[1].overlap, 0.0);
    EXPECT_DOUBLE_EQ(board.clips[1].offset, 5.0);
    EXPECT_DOUBLE_EQ(board.clips[2].offset, 9.0);

    auto argv = joinCommand("ffmpeg", board, {"c0.mp4", "c1.mp4", "c2.mp4"}, "final.mp4");
    EXPECT_TRUE(contains(argv, "[0:v][1:v]concat=n=2:v=1:a=0[v1]"));
    EXPECT_TRUE(contains(argv, "[a1][2:a]concat=n=2:v=0:a=1[a2]"));
    EXPECT_FALSE(contains(argv, "xfade"));
    EXPECT_FALSE(contains(argv, "acrossfade"));
}

TEST(RenderPlan, MixedCutAndFadeKeepsOffsetsOnJoinedTimeline) {
    SceneInput second = scene("b", 4.0);
    second.transition = Transition::Cut;
    Storyboard board = planRender({scene("a", 5.0), second, scene("c", 6.0)}, RenderSettings{});

    EXPECT_DOUBLE_EQ(board.clips[2].offset, 8.0);
    EXPECT_DOUBLE_EQ(board.totalSeconds, 14.0);
}

TEST(RenderPlan, TransitionNamesParse) {
    Transition t = Transition::Fade;
    EXPECT_TRUE(parseTransition("Dissolve", t));
    EXPECT_EQ(t, Transition::Dissolve);
    EXPECT_TRUE(parseTransition("none", t));
    EXPECT_EQ(t, Transition::Cut);
    EXPECT_FALSE(parseTransition("spin", t));
    EXPECT_EQ(xfadeName(Transition::Zoom), std::string("circleopen"));
    EXPECT_EQ(xfadeName(Transition::Cut), nullptr);
}

class AssemblerTest : public TempDirTest {
protected:
    void SetUp() override {
        TempDirTest::SetUp();
        config_ = Config::withRoot(root_);
        workDir_ = root_ / "work";
        std::filesystem::create_directories(workDir_);
    }

    Config config_;
    std::filesystem::path workDir_;
};

TEST_F(AssemblerTest, AssemblesAndRemovesIntermediateClips) {
    config_.ffmpegPath = auctv::testing::fakeFfmpeg(root_ / "bin").string();
    MediaAssembler assembler(config_);
    Storyboard board = planRender({scene("a", 2.0), scene("b", 2.0), scene("c", 2.0)}, RenderSettings::from(config_));

    std::vector<double> seen;
    RenderResult result = assembler.assemble(board, workDir_, workDir_ / "render.mp4", Deadline(std::chrono::seconds(30)),
                                             [&](double f) { seen.push_back(f); });

    ASSERT_TRUE(result) << result.message;
    EXPECT_EQ(result.video, workDir_ / "render.mp4");
    EXPECT_TRUE(std::filesystem::exists(result.video));
    EXPECT_EQ(auctv::testing::countFiles(workDir_ / "clips"), 0u);
    ASSERT_FALSE(seen.empty());
    EXPECT_TRUE(std::is_sorted(seen.begin(), seen.end()));
    EXPECT_DOUBLE_EQ(seen.back(), 1.0);
}

TEST_F(AssemblerTest, EncoderFailureIsRenderError) {
    config_.ffmpegPath = auctv::testing::writeScript(root_ / "bin" / "ffmpeg", "exit 1\n").string();
    MediaAssembler assembler(config_);
    Storyboard board = planRender({scene("a", 2.0)}, RenderSettings::from(config_));

    RenderResult result = assembler.assemble(board, workDir_, workDir_ / "render.mp4", Deadline(std::chrono::seconds(30)), {});
    EXPECT_FALSE(result);
    EXPECT_EQ(result.code, ErrorCode::Render);
    EXPECT_EQ(result.message, "Video encoding failed");
    EXPECT_EQ(auctv::testing::countFiles(workDir_ / "clips"), 0u);
}

TEST_F(AssemblerTest, MissingEncoderIsReported) {
    config_.ffmpegPath = (root_ / "no-such-ffmpeg").string();
    MediaAssembler assembler(config_);
    Storyboard board = planRender({scene("a", 2.0)}, RenderSettings::from(config_));

    RenderResult result = assembler.assemble(board, workDir_, workDir_ / "render.mp4", Deadline(std::chrono::seconds(30)), {});
    EXPECT_EQ(result.code, ErrorCode::Render);
    EXPECT_EQ(result.message, "Video encoder unavailable");
}

TEST_F(AssemblerTest, CancelledEncodeStopsPromptly) {
    config_.ffmpegPath = auctv::testing::fakeFfmpeg(root_ / "bin", "sleep 30\n").string();
    MediaAssembler assembler(config_);
    Storyboard board = planRender({scene("a", 2.0), scene("b", 2.0)}, RenderSettings::from(config_));

    std::atomic<bool> cancel{false};
    std::thread canceller([&] {
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
        cancel.store(true);
    });
    const auto start = std::chrono::steady_clock::now();
    RenderResult result = assembler.assemble(board, workDir_, workDir_ / "render.mp4",
                                             Deadline(std::chrono::seconds(60), &cancel), {});
    canceller.join();

    EXPECT_EQ(result.code, ErrorCode::Cancelled);
    EXPECT_LT(std::chrono::steady_clock::now() - start, std::chrono::seconds(10));
    EXPECT_FALSE(std::filesystem::exists(workDir_ / "render.mp4"));
    EXPECT_EQ(auctv::testing::countFiles(workDir_ / "clips"), 0u);
}
