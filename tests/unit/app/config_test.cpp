#include <transita/app/config.hpp>
#include "test_media.hpp"
#include <gtest/gtest.h>
#include <fstream>

namespace ta = transita::app;

TEST(Config, MissingFileGivesDefaults) {
  const auto c = ta::load_config("/nonexistent/transita.conf");
  const auto d = ta::default_config();
  EXPECT_EQ(c.output_dir, d.output_dir);
  EXPECT_EQ(c.workers, 0u);
  EXPECT_TRUE(c.parallel);
  EXPECT_EQ(c.log_level, "info");
  EXPECT_EQ(c.default_effect, "crossfade");
  EXPECT_EQ(c.default_total_frames, 30u);
}

TEST(Config, ParsesKeyValueFile) {
  transita::test::TempDir dir;
  const auto path = dir.path() / "transita.conf";
  {
    std::ofstream out(path);
    out << "# render settings\n"
        << "output_dir = renders\n"
        << "workers=4\n"
        << "parallel = no\n"
        << "\n"
        << "log_level=debug\n"
        << "log_file = /tmp/transita.log\n"
        << "default_total_frames = 48\n"
        << "default_fps=24\n"
        << "default_width=1280\n"
        << "default_height=720\n"
        << "default_effect = page_turn\n";
  }
  const auto c = ta::load_config(path.string());
  EXPECT_EQ(c.output_dir, "renders");
  EXPECT_EQ(c.workers, 4u);
  EXPECT_FALSE(c.parallel);
  EXPECT_EQ(c.log_level, "debug");
  EXPECT_EQ(c.log_file, "/tmp/transita.log");
  EXPECT_EQ(c.default_total_frames, 48u);
  EXPECT_EQ(c.default_fps, 24u);
  EXPECT_EQ(c.default_width, 1280u);
  EXPECT_EQ(c.default_height, 720u);
  EXPECT_EQ(c.default_effect, "page_turn");
}

TEST(Config, BadValuesAndUnknownKeysAreSkipped) {
  transita::test::TempDir dir;
  const auto path = dir.path() / "bad.conf";
  {
    std::ofstream out(path);
    out << "workers = many\n"
        << "default_fps = 24fps\n"
        << "parallel = maybe\n"
        << "colour = blue\n"
        << "no equals sign here\n"
        << "default_width = 800\n";
  }
  const auto c = ta::load_config(path.string());
  EXPECT_EQ(c.workers, 0u);
  EXPECT_EQ(c.default_fps, 30u);
  EXPECT_TRUE(c.parallel);
  EXPECT_EQ(c.default_width, 800u);
}

TEST(Config, DefaultRequestFollowsConfig) {
  auto c = ta::default_config();
  c.default_effect = "blinds";
  c.default_total_frames = 12;
  c.default_fps = 25;
  c.default_width = 800;
  c.default_height = 600;
  const auto r = ta::default_request(c);
  EXPECT_EQ(r.effect, "blinds");
  EXPECT_EQ(r.total_frames, 12u);
  EXPECT_EQ(r.fps, 25u);
  EXPECT_EQ(r.width, 800u);
  EXPECT_EQ(r.height, 600u);
  EXPECT_TRUE(r.params.empty());
}
