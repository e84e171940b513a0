// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

/*
 * test_render.cpp
 *
 * Tests for the histogram, canvas and scatter rendering.
 */

#include <gtest/gtest.h>

#include <algorithm>
#include <numeric>
#include <random>

#include "cloudreport/errors.hpp"
#include "cloudreport/render/canvas.hpp"
#include "cloudreport/render/colormap.hpp"
#include "cloudreport/render/renderer.hpp"

using namespace cloudreport;

namespace {

bool hasPngSignature(const std::vector<uint8_t>& png) {
  static const uint8_t kSignature[8] = {0x89, 'P', 'N', 'G',
                                        0x0D, 0x0A, 0x1A, 0x0A};
  return png.size() > 8 && std::equal(kSignature, kSignature + 8, png.begin());
}

PointSet randomCloud(size_t n, unsigned seed) {
  std::mt19937 gen(seed);
  std::uniform_real_distribution<double> dist(0.0, 30.0);
  PointSet points;
  points.reserve(n);
  for (size_t i = 0; i < n; ++i) points.add(dist(gen), dist(gen), dist(gen));
  return points;
}

config::Render smallRender() {
  config::Render cfg;
  cfg.histogram_width = 200;
  cfg.histogram_height = 120;
  cfg.scatter_width = 240;
  cfg.scatter_height = 180;
  return cfg;
}

}  // namespace

// ─── Histogram ───────────────────────────────────────────────────────────────

TEST(HistogramTest, CountsSumToPointCount) {
  auto points = randomCloud(1234, 1);
  auto h = computeHistogram(points, 20);
  ASSERT_EQ(h.counts.size(), 20u);
  EXPECT_EQ(std::accumulate(h.counts.begin(), h.counts.end(), size_t{0}),
            1234u);
}

TEST(HistogramTest, MaximumLandsInLastBin) {
  PointSet points;
  points.add(0, 0, 0.0);
  points.add(0, 0, 5.0);
  points.add(0, 0, 10.0);

  auto h = computeHistogram(points, 4);
  EXPECT_DOUBLE_EQ(h.min, 0.0);
  EXPECT_DOUBLE_EQ(h.max, 10.0);
  EXPECT_DOUBLE_EQ(h.binWidth(), 2.5);
  EXPECT_EQ(h.counts[0], 1u);
  EXPECT_EQ(h.counts[2], 1u);
  EXPECT_EQ(h.counts[3], 1u);
}

TEST(HistogramTest, ZeroRangeAllInFirstBin) {
  PointSet points;
  for (int i = 0; i < 7; ++i) points.add(i, -i, 3.0);

  auto h = computeHistogram(points, 20);
  EXPECT_EQ(h.counts[0], 7u);
  EXPECT_DOUBLE_EQ(h.binWidth(), 0.0);
}

TEST(HistogramTest, NonPositiveBinsThrows) {
  auto points = randomCloud(10, 2);
  EXPECT_THROW(computeHistogram(points, 0), RenderError);
}

// ─── Canvas ──────────────────────────────────────────────────────────────────

TEST(CanvasTest, ClipsOutOfBoundsWrites) {
  render::Canvas canvas(10, 10);
  canvas.setPixel(-1, 5, {255, 0, 0});
  canvas.setPixel(10, 5, {255, 0, 0});
  canvas.fillRect(-5, -5, 2, 2, {0, 0, 255});

  auto p = canvas.pixel(0, 0);
  EXPECT_EQ(p.b, 255);
  EXPECT_EQ(p.r, 0);
  auto q = canvas.pixel(9, 9);
  EXPECT_EQ(q.r, 255);
  EXPECT_EQ(q.g, 255);
}

TEST(CanvasTest, InvalidSizeThrows) {
  EXPECT_THROW(render::Canvas(0, 10), RenderError);
}

TEST(CanvasTest, EncodesPng) {
  render::Canvas canvas(16, 8);
  canvas.drawLine(0, 0, 15, 7, {0, 0, 0});
  auto png = render::encodePng(canvas);
  EXPECT_TRUE(hasPngSignature(png));
}

TEST(ColormapTest, GrayscaleEndpointsAndClamp) {
  auto lo = render::applyColormap(Colormap::GRAYSCALE, 0.0f);
  auto hi = render::applyColormap(Colormap::GRAYSCALE, 1.0f);
  auto over = render::applyColormap(Colormap::GRAYSCALE, 3.0f);
  EXPECT_EQ(lo.r, 0);
  EXPECT_EQ(hi.r, 255);
  EXPECT_EQ(over.g, 255);
}

TEST(ColormapTest, ViridisRunsDarkToLight) {
  auto lo = render::applyColormap(Colormap::VIRIDIS, 0.0f);
  auto hi = render::applyColormap(Colormap::VIRIDIS, 1.0f);
  EXPECT_LT(lo.r + lo.g + lo.b, hi.r + hi.g + hi.b);
}

// ─── Plots ───────────────────────────────────────────────────────────────────

TEST(RenderContextTest, HistogramImage) {
  RenderContext ctx(smallRender());
  auto img = ctx.renderHistogram(randomCloud(500, 3));
  EXPECT_TRUE(hasPngSignature(img.png));
  EXPECT_EQ(img.width, 200);
  EXPECT_EQ(img.height, 120);
  EXPECT_EQ(img.points_drawn, 500u);
}

TEST(RenderContextTest, ScatterDownsamplesLargeClouds) {
  auto cfg = smallRender();
  cfg.max_scatter_points = 300;
  RenderContext ctx(cfg);

  auto img = ctx.renderScatter(randomCloud(2000, 4), 17);
  EXPECT_TRUE(hasPngSignature(img.png));
  EXPECT_EQ(img.points_drawn, 300u);

  auto small = ctx.renderScatter(randomCloud(100, 4), 17);
  EXPECT_EQ(small.points_drawn, 100u);
}

TEST(RenderContextTest, ScatterIsDeterministicForSeed) {
  auto cfg = smallRender();
  cfg.max_scatter_points = 500;
  RenderContext ctx(cfg);
  auto points = randomCloud(3000, 5);

  auto a = ctx.renderScatter(points, 42);
  auto b = ctx.renderScatter(points, 42);
  EXPECT_EQ(a.png, b.png);
}

TEST(RenderContextTest, FlatCloudRenders) {
  PointSet points;
  for (int i = 0; i < 20; ++i) points.add(i, i * 0.5, 1.0);

  RenderContext ctx(smallRender());
  EXPECT_NO_THROW(ctx.renderScatter(points, 1));
  EXPECT_NO_THROW(ctx.renderHistogram(points));
}
