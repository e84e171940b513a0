// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

/*
 * renderer.hpp
 *
 * Report plots: Z-value histogram and height-colored 3D scatter, encoded
 * as PNG buffers. Text (titles, axis labels) is laid out by the report,
 * not drawn into the images.
 *
 * All rendering state lives in a RenderContext. There is no process-wide
 * plotting backend, so several contexts (or several pipeline runs in one
 * process) never interfere.
 *
 *  Created on: Mar 2025
 *      Author: Ikhyeon Cho
 *   Institute: Korea Univ. ISR (Intelligent Systems & Robotics) Lab
 *       Email: tre0430@korea.ac.kr
 */

#ifndef CLOUDREPORT_RENDER_RENDERER_HPP
#define CLOUDREPORT_RENDER_RENDERER_HPP

#include <cstddef>
#include <cstdint>
#include <vector>

#include "cloudreport/config/render.hpp"
#include "cloudreport/point_types.hpp"

namespace cloudreport {

/// Encoded raster image handed to the report.
struct RenderedImage {
  std::vector<uint8_t> png;
  int width = 0;
  int height = 0;
  size_t points_drawn = 0;
};

/// Equal-width bins over [min, max]; the maximum lands in the last bin.
struct Histogram {
  double min = 0.0;
  double max = 0.0;
  std::vector<size_t> counts;

  double binWidth() const {
    return counts.empty() ? 0.0 : (max - min) / counts.size();
  }
};

/// Histogram of z values. A zero-width range puts every point in bin 0.
Histogram computeHistogram(const PointSet& points, int bins);

class RenderContext {
 public:
  RenderContext() = default;
  explicit RenderContext(const config::Render& cfg) : cfg_(cfg) {}

  const config::Render& config() const noexcept { return cfg_; }

  /// @throws RenderError
  RenderedImage renderHistogram(const PointSet& points) const;

  /**
   * @brief Orthographic 3D scatter colored by z, with a colorbar.
   *
   * Clouds larger than max_scatter_points are downsampled uniformly without
   * replacement using `seed`, so a fixed seed gives an identical image.
   *
   * @throws RenderError
   */
  RenderedImage renderScatter(const PointSet& points, uint64_t seed) const;

 private:
  config::Render cfg_;
};

}  // namespace cloudreport

#endif  // CLOUDREPORT_RENDER_RENDERER_HPP
