// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

/*
 * render.hpp
 *
 * Plot rendering configuration (image geometry, histogram, 3D view).
 *
 *  Created on: Mar 2025
 *      Author: Ikhyeon Cho
 *   Institute: Korea Univ. ISR (Intelligent Systems & Robotics) Lab
 *       Email: tre0430@korea.ac.kr
 */

#ifndef CLOUDREPORT_CONFIG_RENDER_HPP
#define CLOUDREPORT_CONFIG_RENDER_HPP

#include <cstddef>

namespace cloudreport {

/// Colormap used to shade scatter points by height.
enum class Colormap { VIRIDIS, JET, GRAYSCALE };

namespace config {

struct Render {
  int histogram_width = 720;
  int histogram_height = 420;
  int histogram_bins = 20;

  int scatter_width = 720;
  int scatter_height = 540;
  size_t max_scatter_points = 50000;  ///< Larger clouds are downsampled
  float elevation_deg = 20.0f;        ///< Camera elevation above XY plane
  float azimuth_deg = 45.0f;          ///< Camera rotation about Z
  Colormap colormap = Colormap::VIRIDIS;

  int png_compression = 8;  ///< zlib level passed to stb_image_write [0, 9]
};

}  // namespace config
}  // namespace cloudreport

#endif  // CLOUDREPORT_CONFIG_RENDER_HPP
