// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

/*
 * renderer.cpp
 *
 *  Created on: Mar 2025
 *      Author: Ikhyeon Cho
 *   Institute: Korea Univ. ISR (Intelligent Systems & Robotics) Lab
 *       Email: tre0430@korea.ac.kr
 */

#include "cloudreport/render/renderer.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <array>
#include <cmath>
#include <limits>

#include "cloudreport/analysis/sampling.hpp"
#include "cloudreport/errors.hpp"
#include "cloudreport/render/canvas.hpp"

namespace cloudreport {

namespace {

constexpr render::Rgb kBlack{0, 0, 0};
constexpr render::Rgb kGrid{210, 210, 210};
constexpr render::Rgb kBox{160, 160, 160};
constexpr render::Rgb kBar{70, 130, 180};  // steelblue

constexpr double kDegToRad = 3.14159265358979323846 / 180.0;

struct Extent {
  double lo = std::numeric_limits<double>::max();
  double hi = std::numeric_limits<double>::lowest();

  void add(double v) {
    lo = std::min(lo, v);
    hi = std::max(hi, v);
  }
  /// Map v to [-0.5, 0.5]; a degenerate axis collapses to 0.
  double normalize(double v) const {
    const double range = hi - lo;
    return range > 0.0 ? (v - lo) / range - 0.5 : 0.0;
  }
  /// Map v to [0, 1]; a degenerate axis collapses to 0.5.
  float unit(double v) const {
    const double range = hi - lo;
    return range > 0.0 ? static_cast<float>((v - lo) / range) : 0.5f;
  }
};

/// Orthographic camera looking at the unit cube.
struct View {
  Eigen::Vector3d right;
  Eigen::Vector3d up;
  Eigen::Vector3d toward;  ///< Unit vector pointing at the viewer

  View(double elevation_deg, double azimuth_deg) {
    const double el = elevation_deg * kDegToRad;
    const double az = azimuth_deg * kDegToRad;
    right = Eigen::Vector3d(-std::sin(az), std::cos(az), 0.0);
    up = Eigen::Vector3d(-std::sin(el) * std::cos(az),
                         -std::sin(el) * std::sin(az), std::cos(el));
    toward = Eigen::Vector3d(std::cos(el) * std::cos(az),
                             std::cos(el) * std::sin(az), std::sin(el));
  }
};

}  // namespace

// ─── Histogram ──────────────────────────────────────────────────────────────

Histogram computeHistogram(const PointSet& points, int bins) {
  if (bins <= 0) {
    throw RenderError("histogram needs at least one bin");
  }

  Histogram h;
  h.counts.assign(static_cast<size_t>(bins), 0);
  if (points.empty()) return h;

  Extent z;
  for (const auto& p : points) z.add(p.z());
  h.min = z.lo;
  h.max = z.hi;

  const double range = h.max - h.min;
  for (const auto& p : points) {
    size_t bin = 0;
    if (range > 0.0) {
      const double idx = std::floor((p.z() - h.min) / range * bins);
      bin = static_cast<size_t>(std::max(0.0, std::min<double>(idx, bins - 1)));
    }
    ++h.counts[bin];
  }
  return h;
}

RenderedImage RenderContext::renderHistogram(const PointSet& points) const {
  spdlog::info("[Render] Creating Z-histogram...");

  const auto hist = computeHistogram(points, cfg_.histogram_bins);
  const size_t max_count =
      hist.counts.empty()
          ? 0
          : *std::max_element(hist.counts.begin(), hist.counts.end());

  render::Canvas canvas(cfg_.histogram_width, cfg_.histogram_height);
  const int left = 50, right = canvas.width() - 15;
  const int top = 15, bottom = canvas.height() - 30;
  const int plot_h = bottom - top;
  const int plot_w = right - left;

  // Dashed horizontal grid at fifths of the (5% padded) count range
  for (int i = 1; i <= 5; ++i) {
    const int y = bottom - plot_h * i / 5;
    canvas.drawLine(left, y, right, y, kGrid, 3);
  }

  const double y_max = std::max<double>(1.0, max_count * 1.05);
  const int n_bins = static_cast<int>(hist.counts.size());
  for (int i = 0; i < n_bins; ++i) {
    const int x0 = left + plot_w * i / n_bins;
    const int x1 = left + plot_w * (i + 1) / n_bins;
    const int bar_h =
        static_cast<int>(std::lround(hist.counts[i] / y_max * plot_h));
    if (bar_h <= 0) continue;
    canvas.fillRect(x0, bottom - bar_h, x1, bottom, kBar);
    canvas.drawRect(x0, bottom - bar_h, x1, bottom, kBlack);
  }

  // Axes and bin-edge ticks
  canvas.drawLine(left, top, left, bottom, kBlack);
  canvas.drawLine(left, bottom, right, bottom, kBlack);
  for (int i = 0; i <= n_bins; ++i) {
    const int x = left + plot_w * i / n_bins;
    canvas.drawLine(x, bottom, x, bottom + 4, kBlack);
  }
  for (int i = 0; i <= 5; ++i) {
    const int y = bottom - plot_h * i / 5;
    canvas.drawLine(left - 4, y, left, y, kBlack);
  }

  RenderedImage image;
  image.width = canvas.width();
  image.height = canvas.height();
  image.points_drawn = points.size();
  image.png = render::encodePng(canvas, cfg_.png_compression);

  spdlog::info("[Render] Z-histogram created ({} bins, {} bytes)", n_bins,
               image.png.size());
  return image;
}

// ─── 3D scatter ─────────────────────────────────────────────────────────────

RenderedImage RenderContext::renderScatter(const PointSet& points,
                                           uint64_t seed) const {
  spdlog::info("[Render] Creating 3D point cloud visualization...");

  const auto indices =
      sampleIndices(points.size(), cfg_.max_scatter_points, seed);
  if (indices.size() < points.size()) {
    spdlog::info("[Render] Downsampled to {} points for visualization",
                 indices.size());
  }

  Extent ex, ey, ez;
  for (size_t i : indices) {
    ex.add(points[i].x());
    ey.add(points[i].y());
    ez.add(points[i].z());
  }

  render::Canvas canvas(cfg_.scatter_width, cfg_.scatter_height);
  const int bar_w = 18;
  const int bar_right = canvas.width() - 25;
  const int bar_left = bar_right - bar_w;
  const int margin = 20;
  const int plot_left = margin;
  const int plot_right = bar_left - 30;
  const int plot_top = margin;
  const int plot_bottom = canvas.height() - margin;

  const View view(cfg_.elevation_deg, cfg_.azimuth_deg);

  // Fit the projected unit cube into the plot area
  std::array<Eigen::Vector3d, 8> corners;
  for (int c = 0; c < 8; ++c) {
    corners[c] = Eigen::Vector3d((c & 1) ? 0.5 : -0.5, (c & 2) ? 0.5 : -0.5,
                                 (c & 4) ? 0.5 : -0.5);
  }
  double sx_max = 0.0, sy_max = 0.0;
  for (const auto& c : corners) {
    sx_max = std::max(sx_max, std::abs(c.dot(view.right)));
    sy_max = std::max(sy_max, std::abs(c.dot(view.up)));
  }
  const double scale =
      std::min((plot_right - plot_left) / (2.0 * sx_max),
               (plot_bottom - plot_top) / (2.0 * sy_max));
  const double cx = 0.5 * (plot_left + plot_right);
  const double cy = 0.5 * (plot_top + plot_bottom);

  auto project = [&](const Eigen::Vector3d& p, int& px, int& py) {
    px = static_cast<int>(std::lround(cx + p.dot(view.right) * scale));
    py = static_cast<int>(std::lround(cy - p.dot(view.up) * scale));
  };

  // Bounding box wireframe
  for (int a = 0; a < 8; ++a) {
    for (int b = a + 1; b < 8; ++b) {
      const int diff = a ^ b;
      if (diff != 1 && diff != 2 && diff != 4) continue;  // not an edge
      int ax, ay, bx, by;
      project(corners[a], ax, ay);
      project(corners[b], bx, by);
      canvas.drawLine(ax, ay, bx, by, kBox, 4);
    }
  }

  // Painter's order: farthest first
  struct Splat {
    double depth;
    int x;
    int y;
    render::Rgb color;
  };
  std::vector<Splat> splats;
  splats.reserve(indices.size());
  for (size_t i : indices) {
    const auto& p = points[i];
    const Eigen::Vector3d n(ex.normalize(p.x()), ey.normalize(p.y()),
                            ez.normalize(p.z()));
    Splat s;
    s.depth = n.dot(view.toward);
    project(n, s.x, s.y);
    s.color = render::applyColormap(cfg_.colormap, ez.unit(p.z()));
    splats.push_back(s);
  }
  std::stable_sort(splats.begin(), splats.end(),
                   [](const Splat& a, const Splat& b) { return a.depth < b.depth; });

  const int radius = indices.size() > 20000 ? 0 : 1;
  for (const auto& s : splats) canvas.fillDisc(s.x, s.y, radius, s.color);

  // Colorbar, high values on top
  const int bar_top = margin + 20;
  const int bar_bottom = canvas.height() - margin - 20;
  for (int y = bar_top; y <= bar_bottom; ++y) {
    const float t = static_cast<float>(bar_bottom - y) / (bar_bottom - bar_top);
    canvas.drawLine(bar_left, y, bar_right, y,
                    render::applyColormap(cfg_.colormap, t));
  }
  canvas.drawRect(bar_left, bar_top, bar_right, bar_bottom, kBlack);

  RenderedImage image;
  image.width = canvas.width();
  image.height = canvas.height();
  image.points_drawn = indices.size();
  image.png = render::encodePng(canvas, cfg_.png_compression);

  spdlog::info("[Render] 3D visualization created ({} points, {} bytes)",
               image.points_drawn, image.png.size());
  return image;
}

}  // namespace cloudreport
