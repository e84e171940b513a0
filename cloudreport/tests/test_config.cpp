// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

/*
 * test_config.cpp
 *
 * Tests for YAML configuration loading and validation.
 */

#include <gtest/gtest.h>
#include <yaml-cpp/yaml.h>

#include <fstream>

#include "cloudreport/config/cloudreport.hpp"
#include "cloudreport/errors.hpp"

using namespace cloudreport;

// ─── Helpers ─────────────────────────────────────────────────────────────────

namespace {

std::string writeTempYaml(const std::string& content,
                          const std::string& name = "test_config.yaml") {
  std::string path = testing::TempDir() + "/" + name;
  std::ofstream fs(path);
  fs << content;
  return path;
}

}  // namespace

// ─── Loading ─────────────────────────────────────────────────────────────────

TEST(ConfigTest, LoadsDefaultYaml) {
  auto cfg = loadConfig(std::string(CLOUDREPORT_CONFIG_DIR) + "/default.yaml");

  Config defaults;
  EXPECT_EQ(cfg.log_level, "info");
  EXPECT_EQ(cfg.neighbor_search.sample_size, 1000u);
  EXPECT_FALSE(cfg.neighbor_search.seed.has_value());
  EXPECT_EQ(cfg.render.histogram_bins, 20);
  EXPECT_EQ(cfg.render.max_scatter_points, 50000u);
  EXPECT_FLOAT_EQ(cfg.render.elevation_deg, 20.0f);
  EXPECT_FLOAT_EQ(cfg.render.azimuth_deg, 45.0f);
  EXPECT_EQ(cfg.render.colormap, Colormap::VIRIDIS);
  EXPECT_EQ(cfg.render.png_compression, defaults.render.png_compression);
  EXPECT_EQ(cfg.report.title, defaults.report.title);
  EXPECT_DOUBLE_EQ(cfg.report.size_budget_mb, 2.0);
}

TEST(ConfigTest, EmptyFileGivesDefaults) {
  auto path = writeTempYaml("# empty config\n", "test_empty.yaml");
  auto cfg = loadConfig(path);

  Config defaults;
  EXPECT_EQ(cfg.neighbor_search.sample_size,
            defaults.neighbor_search.sample_size);
  EXPECT_EQ(cfg.render.scatter_width, defaults.render.scatter_width);
  EXPECT_EQ(cfg.report.title, defaults.report.title);
}

TEST(ConfigTest, NonexistentFileThrows) {
  EXPECT_THROW(loadConfig("/nonexistent/path.yaml"), ConfigError);
}

TEST(ConfigTest, MalformedYamlThrows) {
  auto path = writeTempYaml("analysis: [unclosed\n", "test_malformed.yaml");
  EXPECT_THROW(loadConfig(path), ConfigError);
}

TEST(ConfigTest, WrongValueTypeThrows) {
  auto node = YAML::Load("analysis:\n  sample_size: lots\n");
  EXPECT_THROW(parseConfig(node), ConfigError);
}

// ─── Overrides ───────────────────────────────────────────────────────────────

TEST(ConfigTest, PartialOverride) {
  auto node = YAML::Load(R"(
analysis:
  sample_size: 250
  seed: 42
render:
  scatter:
    max_points: 1000
    colormap: jet
report:
  title: Site Survey
)");
  auto cfg = parseConfig(node);

  EXPECT_EQ(cfg.neighbor_search.sample_size, 250u);
  ASSERT_TRUE(cfg.neighbor_search.seed.has_value());
  EXPECT_EQ(*cfg.neighbor_search.seed, 42u);
  EXPECT_EQ(cfg.render.max_scatter_points, 1000u);
  EXPECT_EQ(cfg.render.colormap, Colormap::JET);
  EXPECT_EQ(cfg.report.title, "Site Survey");

  // Untouched sections keep defaults
  EXPECT_EQ(cfg.render.histogram_bins, 20);
  EXPECT_DOUBLE_EQ(cfg.report.size_budget_mb, 2.0);
}

TEST(ConfigTest, NullSeedMeansRandom) {
  auto cfg = parseConfig(YAML::Load("analysis:\n  seed: ~\n"));
  EXPECT_FALSE(cfg.neighbor_search.seed.has_value());
}

TEST(ConfigTest, UnknownColormapFallsBack) {
  auto cfg = parseConfig(YAML::Load("render:\n  scatter:\n    colormap: rainbow\n"));
  EXPECT_EQ(cfg.render.colormap, Colormap::VIRIDIS);
}

TEST(ConfigTest, GrayAliases) {
  auto a = parseConfig(YAML::Load("render:\n  scatter:\n    colormap: gray\n"));
  auto b = parseConfig(
      YAML::Load("render:\n  scatter:\n    colormap: grayscale\n"));
  EXPECT_EQ(a.render.colormap, Colormap::GRAYSCALE);
  EXPECT_EQ(b.render.colormap, Colormap::GRAYSCALE);
}

TEST(ConfigTest, UnknownLogLevelFallsBack) {
  auto cfg = parseConfig(YAML::Load("log_level: chatty\n"));
  EXPECT_EQ(cfg.log_level, "info");

  auto off = parseConfig(YAML::Load("log_level: \"off\"\n"));
  EXPECT_EQ(off.log_level, "off");
}

// ─── Validation ──────────────────────────────────────────────────────────────

TEST(ConfigValidationTest, SampleSizeBelowTwoThrows) {
  EXPECT_THROW(parseConfig(YAML::Load("analysis:\n  sample_size: 1\n")),
               ConfigError);
  EXPECT_THROW(parseConfig(YAML::Load("analysis:\n  sample_size: 0\n")),
               ConfigError);
}

TEST(ConfigValidationTest, NonPositiveBudgetThrows) {
  EXPECT_THROW(parseConfig(YAML::Load("report:\n  size_budget_mb: 0\n")),
               ConfigError);
}

TEST(ConfigValidationTest, OutOfRangeValuesClamped) {
  auto cfg = parseConfig(YAML::Load(R"(
render:
  png_compression: 15
  histogram:
    width: 10
    bins: 0
  scatter:
    height: 100000
    elevation_deg: 120
    max_points: 0
)"));

  EXPECT_EQ(cfg.render.png_compression, 9);
  EXPECT_EQ(cfg.render.histogram_width, 64);
  EXPECT_EQ(cfg.render.histogram_bins, 1);
  EXPECT_EQ(cfg.render.scatter_height, 4096);
  EXPECT_FLOAT_EQ(cfg.render.elevation_deg, 90.0f);
  EXPECT_EQ(cfg.render.max_scatter_points, 50000u);
}

TEST(ConfigValidationTest, ErrorKindIsConfig) {
  try {
    loadConfig("/nonexistent/path.yaml");
    FAIL() << "expected ConfigError";
  } catch (const Error& e) {
    EXPECT_EQ(e.kind(), ErrorKind::Config);
    EXPECT_STREQ(toString(e.kind()), "ConfigError");
  }
}
