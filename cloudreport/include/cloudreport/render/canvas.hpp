// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

/*
 * canvas.hpp
 *
 * 8-bit RGB raster with the few primitives the plots need, and PNG
 * encoding into memory.
 *
 *  Created on: Mar 2025
 *      Author: Ikhyeon Cho
 *   Institute: Korea Univ. ISR (Intelligent Systems & Robotics) Lab
 *       Email: tre0430@korea.ac.kr
 */

#ifndef CLOUDREPORT_RENDER_CANVAS_HPP
#define CLOUDREPORT_RENDER_CANVAS_HPP

#include <cstdint>
#include <vector>

#include "cloudreport/render/colormap.hpp"

namespace cloudreport {
namespace render {

class Canvas {
 public:
  static constexpr int kChannels = 3;

  Canvas(int width, int height, Rgb background = {255, 255, 255});

  int width() const noexcept { return width_; }
  int height() const noexcept { return height_; }
  const std::vector<uint8_t>& pixels() const noexcept { return pixels_; }

  /// Out-of-bounds writes are clipped.
  void setPixel(int x, int y, Rgb color);
  Rgb pixel(int x, int y) const;

  /// Inclusive corners, any order.
  void fillRect(int x0, int y0, int x1, int y1, Rgb color);
  void drawRect(int x0, int y0, int x1, int y1, Rgb color);

  /// Bresenham; dash > 0 draws `dash` pixels on, `dash` pixels off.
  void drawLine(int x0, int y0, int x1, int y1, Rgb color, int dash = 0);

  void fillDisc(int cx, int cy, int radius, Rgb color);

 private:
  int width_;
  int height_;
  std::vector<uint8_t> pixels_;
};

/**
 * @brief Encode the canvas as an 8-bit RGB PNG.
 * @param compression zlib level [0, 9]
 * @throws RenderError if encoding fails
 */
std::vector<uint8_t> encodePng(const Canvas& canvas, int compression = 8);

}  // namespace render
}  // namespace cloudreport

#endif  // CLOUDREPORT_RENDER_CANVAS_HPP
