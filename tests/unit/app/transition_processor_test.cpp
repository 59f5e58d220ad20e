#include <transita/app/transition_processor.hpp>
#include <transita/transitions/builtin_transitions.hpp>
#include "test_frames.hpp"
#include "test_media.hpp"
#include "test_transitions.hpp"
#include <gtest/gtest.h>
#include <atomic>
#include <filesystem>
#include <memory>
#include <string>
#include <vector>

namespace fs = std::filesystem;
namespace ta = transita::app;
namespace tc = transita::core;
using transita::test::FakeDecoder;
using transita::test::FakeEncoder;
using transita::test::FakeMedia;
using transita::test::max_abs_diff;
using transita::test::pixel;
using transita::test::solid;

namespace {

class TransitionProcessorTest : public ::testing::Test {
 protected:
  void SetUp() override {
    ASSERT_TRUE(transita::transitions::register_builtin_transitions(registry_).has_value());
    ASSERT_TRUE(registry_
                    .register_transition(
                        "cut", [] { return std::make_unique<transita::test::CutTransition>(); },
                        "Test")
                    .has_value());
    ASSERT_TRUE(registry_
                    .register_transition(
                        "shrink",
                        [] { return std::make_unique<transita::test::ShrinkingTransition>(); },
                        "Test")
                    .has_value());
    ASSERT_TRUE(registry_
                    .register_transition(
                        "cancel_at_2",
                        [this] {
                          return std::make_unique<transita::test::CancellingTransition>(
                              cancel_, 2);
                        },
                        "Test")
                    .has_value());

    media_ = std::make_shared<FakeMedia>();
    media_->clips["red.png"] = {solid(32, 24, 255, 0, 0)};
    media_->clips["blue.png"] = {solid(32, 24, 0, 0, 255)};
    media_->clips["green.mp4"] = {solid(32, 24, 0, 255, 0), solid(32, 24, 0, 200, 0)};
    decoder_ = std::make_shared<FakeDecoder>(media_);
    encoder_ = std::make_shared<FakeEncoder>(media_);
  }

  ta::TransitionProcessor processor(ta::ProcessorOptions options = {}) {
    return ta::TransitionProcessor(factory_, decoder_, encoder_, options);
  }

  std::unique_ptr<tc::IFrameSource> open(const std::string& path) {
    auto source = decoder_->open(path);
    EXPECT_TRUE(source.has_value());
    return source ? std::move(*source) : nullptr;
  }

  static tc::TransitionRequest request(std::string effect, std::uint32_t frames = 5) {
    tc::TransitionRequest r;
    r.effect = std::move(effect);
    r.total_frames = frames;
    r.fps = 30;
    r.width = 320;
    r.height = 240;
    return r;
  }

  tc::TransitionRegistry registry_;
  tc::TransitionFactory factory_{registry_};
  std::atomic<bool> cancel_{false};
  std::shared_ptr<FakeMedia> media_;
  std::shared_ptr<FakeDecoder> decoder_;
  std::shared_ptr<FakeEncoder> encoder_;
};

}  // namespace

TEST_F(TransitionProcessorTest, ProducesRequestedFrames) {
  auto red = open("red.png");
  auto blue = open("blue.png");
  auto seq = processor().process(*red, *blue, request("crossfade", 7));
  ASSERT_TRUE(seq.has_value());
  ASSERT_EQ(seq->frames.size(), 7u);
  EXPECT_EQ(seq->fps, 30u);
  EXPECT_EQ(seq->width, 320u);
  EXPECT_EQ(seq->height, 240u);
  for (const auto& f : seq->frames) {
    EXPECT_EQ(f.width(), 320u);
    EXPECT_EQ(f.height(), 240u);
  }
  EXPECT_EQ(pixel(seq->frames.front(), 100, 100)[0], 255);
  EXPECT_EQ(pixel(seq->frames.back(), 100, 100)[2], 255);
}

TEST_F(TransitionProcessorTest, SamplesVideoSourcesByProgress) {
  auto green = open("green.mp4");
  auto red = open("red.png");
  auto seq = processor().process(*green, *red, request("cut", 3));
  ASSERT_TRUE(seq.has_value());
  EXPECT_EQ(pixel(seq->frames[0], 0, 0)[1], 255);  // green frame 0
  EXPECT_EQ(pixel(seq->frames[2], 0, 0)[0], 255);  // red
}

TEST_F(TransitionProcessorTest, MixedChannelCountsFollowFirstSource) {
  std::vector<tc::Frame> bgra_frames;
  bgra_frames.push_back(solid(32, 24, 255, 0, 0, tc::PixelFormat::BGRA8));  // blue
  auto bgra = tc::InMemoryFrameSource::create(std::move(bgra_frames));
  std::vector<tc::Frame> bgr_frames;
  bgr_frames.push_back(solid(32, 24, 0, 0, 255, tc::PixelFormat::BGR8));  // red
  auto bgr = tc::InMemoryFrameSource::create(std::move(bgr_frames));
  ASSERT_TRUE(bgra.has_value());
  ASSERT_TRUE(bgr.has_value());

  for (const char* effect : {"crossfade", "blinds", "page_turn"}) {
    auto seq = processor().process(**bgra, **bgr, request(effect));
    ASSERT_TRUE(seq.has_value()) << effect;
    for (const auto& f : seq->frames) {
      EXPECT_EQ(f.format(), tc::PixelFormat::BGRA8) << effect;
    }
    EXPECT_EQ(pixel(seq->frames.back(), 100, 100)[2], 255) << effect;
    EXPECT_EQ(pixel(seq->frames.back(), 100, 100)[3], 255) << effect;
  }

  // Reversed: the 3-channel source decides.
  auto seq = processor().process(**bgr, **bgra, request("crossfade"));
  ASSERT_TRUE(seq.has_value());
  EXPECT_EQ(seq->frames.front().format(), tc::PixelFormat::BGR8);
  EXPECT_EQ(pixel(seq->frames.back(), 100, 100)[0], 255);
}

TEST_F(TransitionProcessorTest, InvalidRequestRejected) {
  auto red = open("red.png");
  auto r = request("crossfade");
  r.fps = 5;
  auto seq = processor().process(*red, *red, r);
  ASSERT_FALSE(seq.has_value());
  EXPECT_EQ(seq.error(), tc::TransitionError::InvalidConfig);

  r = request("crossfade", 0);
  EXPECT_EQ(processor().process(*red, *red, r).error(), tc::TransitionError::InvalidConfig);
}

TEST_F(TransitionProcessorTest, UnknownEffectRejected) {
  auto red = open("red.png");
  auto seq = processor().process(*red, *red, request("dissolve_into_nothing"));
  ASSERT_FALSE(seq.has_value());
  EXPECT_EQ(seq.error(), tc::TransitionError::UnknownEffect);
}

TEST_F(TransitionProcessorTest, BadParamsRejectedBeforeAnyFrame) {
  auto red = open("red.png");
  int calls = 0;
  auto p = processor();
  p.set_progress_callback([&calls](std::uint32_t, std::uint32_t) { ++calls; });

  auto r = request("crossfade");
  r.params["background_color"] = std::string("not-a-color");
  auto seq = p.process(*red, *red, r);
  ASSERT_FALSE(seq.has_value());
  EXPECT_EQ(seq.error(), tc::TransitionError::InvalidConfig);

  r = request("blinds");
  r.params["slat_count"] = std::int64_t{100};
  EXPECT_EQ(p.process(*red, *red, r).error(), tc::TransitionError::InvalidConfig);
  EXPECT_EQ(calls, 0);
}

TEST_F(TransitionProcessorTest, CancelFlagStopsProcessing) {
  auto red = open("red.png");
  auto seq = processor({.parallel = false}).process(*red, *red, request("cancel_at_2", 10),
                                                    &cancel_);
  ASSERT_FALSE(seq.has_value());
  EXPECT_EQ(seq.error(), tc::TransitionError::Cancelled);
}

TEST_F(TransitionProcessorTest, PreRaisedCancelComputesNothing) {
  auto red = open("red.png");
  int calls = 0;
  auto p = processor();
  p.set_progress_callback([&calls](std::uint32_t, std::uint32_t) { ++calls; });
  std::atomic<bool> cancel{true};
  auto seq = p.process(*red, *red, request("crossfade"), &cancel);
  ASSERT_FALSE(seq.has_value());
  EXPECT_EQ(seq.error(), tc::TransitionError::Cancelled);
  EXPECT_EQ(calls, 0);
}

TEST_F(TransitionProcessorTest, WrongSizedOutputIsMismatch) {
  auto red = open("red.png");
  auto seq = processor().process(*red, *red, request("shrink"));
  ASSERT_FALSE(seq.has_value());
  EXPECT_EQ(seq.error(), tc::TransitionError::FrameDimensionMismatch);
}

TEST_F(TransitionProcessorTest, ProgressCallbackCountsEveryFrame) {
  auto red = open("red.png");
  std::atomic<std::uint32_t> calls{0};
  std::atomic<std::uint32_t> highest{0};
  auto p = processor();
  p.set_progress_callback([&](std::uint32_t done, std::uint32_t total) {
    EXPECT_EQ(total, 12u);
    ++calls;
    std::uint32_t seen = highest.load();
    while (done > seen && !highest.compare_exchange_weak(seen, done)) {
    }
  });
  ASSERT_TRUE(p.process(*red, *red, request("crossfade", 12)).has_value());
  EXPECT_EQ(calls.load(), 12u);
  EXPECT_EQ(highest.load(), 12u);
}

TEST_F(TransitionProcessorTest, ParallelMatchesSequential) {
  auto red = open("red.png");
  auto blue = open("blue.png");
  auto r = request("warp", 9);
  r.params["warp_type"] = std::string("liquid");
  auto sequential = processor({.parallel = false}).process(*red, *blue, r);
  auto parallel = processor({.parallel = true, .workers = 4}).process(*red, *blue, r);
  ASSERT_TRUE(sequential.has_value());
  ASSERT_TRUE(parallel.has_value());
  ASSERT_EQ(sequential->frames.size(), parallel->frames.size());
  for (std::size_t i = 0; i < sequential->frames.size(); ++i) {
    EXPECT_EQ(max_abs_diff(sequential->frames[i], parallel->frames[i]), 0) << "frame " << i;
  }
}

TEST_F(TransitionProcessorTest, LoadReportsMissingMedia) {
  auto source = processor().load("missing.mov");
  ASSERT_FALSE(source.has_value());
  EXPECT_EQ(source.error(), tc::TransitionError::MediaLoadFailed);
}

TEST_F(TransitionProcessorTest, RenderWritesOutput) {
  transita::test::TempDir dir;
  const auto out = dir.path() / "nested" / "crossfade.mp4";
  auto written = processor().render("red.png", "blue.png", request("crossfade"), out);
  ASSERT_TRUE(written.has_value());
  EXPECT_EQ(*written, out);
  EXPECT_TRUE(fs::exists(out));
  EXPECT_FALSE(fs::exists(dir.path() / "nested" / "crossfade.partial.mp4"));
  EXPECT_EQ(media_->last_written.size(), 5u);
}

TEST_F(TransitionProcessorTest, RenderMissingInputFails) {
  transita::test::TempDir dir;
  auto written = processor().render("red.png", "nope.png", request("crossfade"),
                                    dir.path() / "x.mp4");
  ASSERT_FALSE(written.has_value());
  EXPECT_EQ(written.error(), tc::TransitionError::MediaLoadFailed);
  EXPECT_EQ(media_->writes, 0);
}

TEST_F(TransitionProcessorTest, EncoderFailureLeavesNoFiles) {
  transita::test::TempDir dir;
  encoder_->fail_writes();
  auto written = processor().render("red.png", "blue.png", request("crossfade"),
                                    dir.path() / "fail.mp4");
  ASSERT_FALSE(written.has_value());
  EXPECT_EQ(written.error(), tc::TransitionError::EncodeFailed);
  EXPECT_TRUE(fs::is_empty(dir.path()));
}

TEST_F(TransitionProcessorTest, CancelDuringEncodeLeavesNoFiles) {
  transita::test::TempDir dir;
  std::atomic<bool> cancel{false};
  encoder_->cancel_after_write(&cancel);
  auto written = processor().render("red.png", "blue.png", request("crossfade"),
                                    dir.path() / "cancel.mp4", &cancel);
  ASSERT_FALSE(written.has_value());
  EXPECT_EQ(written.error(), tc::TransitionError::Cancelled);
  EXPECT_TRUE(fs::is_empty(dir.path()));
}

TEST_F(TransitionProcessorTest, RenderWithoutEncoderFails) {
  transita::test::TempDir dir;
  ta::TransitionProcessor p(factory_, decoder_, nullptr);
  auto written = p.render("red.png", "blue.png", request("crossfade"), dir.path() / "n.mp4");
  ASSERT_FALSE(written.has_value());
  EXPECT_EQ(written.error(), tc::TransitionError::EncodeFailed);
}

TEST_F(TransitionProcessorTest, ChainArgumentChecks) {
  transita::test::TempDir dir;
  auto p = processor();
  EXPECT_EQ(p.render_chain({"red.png"}, {}, request("crossfade"), dir.path()).error(),
            tc::TransitionError::InvalidConfig);
  EXPECT_EQ(p.render_chain({"red.png", "blue.png"}, {"crossfade", "blinds"},
                           request("crossfade"), dir.path())
                .error(),
            tc::TransitionError::InvalidConfig);
  EXPECT_EQ(p.render_chain({"red.png", "blue.png", "green.mp4"}, {"crossfade", "nope"},
                           request("crossfade"), dir.path())
                .error(),
            tc::TransitionError::UnknownEffect);
  EXPECT_EQ(media_->writes, 0);
}

TEST_F(TransitionProcessorTest, ChainRendersEachStep) {
  transita::test::TempDir dir;
  auto outputs = processor().render_chain({"red.png", "blue.png", "green.mp4"},
                                          {"crossfade", "cut"}, request("ignored"), dir.path());
  ASSERT_TRUE(outputs.has_value());
  ASSERT_EQ(outputs->size(), 2u);
  EXPECT_EQ((*outputs)[0], dir.path() / "01_crossfade.mp4");
  EXPECT_EQ((*outputs)[1], dir.path() / "02_cut.mp4");
  EXPECT_TRUE(fs::exists((*outputs)[0]));
  EXPECT_TRUE(fs::exists((*outputs)[1]));
  EXPECT_EQ(media_->writes, 2);
  // Step two cuts from step one's output (a red-to-blue fade) to green.mp4.
  ASSERT_EQ(media_->last_written.size(), 5u);
  const auto mixed = pixel(media_->last_written[1], 10, 10);
  EXPECT_GT(mixed[0], 0);
  EXPECT_GT(mixed[2], 0);
  EXPECT_EQ(pixel(media_->last_written.back(), 10, 10)[1], 200);
}
