// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

/*
 * canvas.cpp
 *
 *  Created on: Mar 2025
 *      Author: Ikhyeon Cho
 *   Institute: Korea Univ. ISR (Intelligent Systems & Robotics) Lab
 *       Email: tre0430@korea.ac.kr
 */

#pragma GCC diagnostic push
#pragma GCC diagnostic ignored "-Wmissing-field-initializers"
#define STB_IMAGE_WRITE_IMPLEMENTATION
#include <stb_image_write.h>
#pragma GCC diagnostic pop

#include "cloudreport/render/canvas.hpp"

#include <algorithm>
#include <cstdlib>
#include <string>

#include "cloudreport/errors.hpp"

namespace cloudreport {
namespace render {

Canvas::Canvas(int width, int height, Rgb background)
    : width_(width), height_(height) {
  if (width <= 0 || height <= 0) {
    throw RenderError("invalid canvas size " + std::to_string(width) + "x" +
                      std::to_string(height));
  }
  pixels_.resize(static_cast<size_t>(width) * height * kChannels);
  for (size_t i = 0; i < pixels_.size(); i += kChannels) {
    pixels_[i] = background.r;
    pixels_[i + 1] = background.g;
    pixels_[i + 2] = background.b;
  }
}

void Canvas::setPixel(int x, int y, Rgb color) {
  if (x < 0 || y < 0 || x >= width_ || y >= height_) return;
  uint8_t* px = &pixels_[(static_cast<size_t>(y) * width_ + x) * kChannels];
  px[0] = color.r;
  px[1] = color.g;
  px[2] = color.b;
}

Rgb Canvas::pixel(int x, int y) const {
  if (x < 0 || y < 0 || x >= width_ || y >= height_) return {};
  const uint8_t* px =
      &pixels_[(static_cast<size_t>(y) * width_ + x) * kChannels];
  return {px[0], px[1], px[2]};
}

void Canvas::fillRect(int x0, int y0, int x1, int y1, Rgb color) {
  if (x0 > x1) std::swap(x0, x1);
  if (y0 > y1) std::swap(y0, y1);
  x0 = std::max(x0, 0);
  y0 = std::max(y0, 0);
  x1 = std::min(x1, width_ - 1);
  y1 = std::min(y1, height_ - 1);
  for (int y = y0; y <= y1; ++y) {
    for (int x = x0; x <= x1; ++x) setPixel(x, y, color);
  }
}

void Canvas::drawRect(int x0, int y0, int x1, int y1, Rgb color) {
  drawLine(x0, y0, x1, y0, color);
  drawLine(x1, y0, x1, y1, color);
  drawLine(x1, y1, x0, y1, color);
  drawLine(x0, y1, x0, y0, color);
}

void Canvas::drawLine(int x0, int y0, int x1, int y1, Rgb color, int dash) {
  const int dx = std::abs(x1 - x0);
  const int dy = -std::abs(y1 - y0);
  const int sx = x0 < x1 ? 1 : -1;
  const int sy = y0 < y1 ? 1 : -1;
  int err = dx + dy;
  int step = 0;

  while (true) {
    if (dash <= 0 || (step / dash) % 2 == 0) setPixel(x0, y0, color);
    if (x0 == x1 && y0 == y1) break;
    const int e2 = 2 * err;
    if (e2 >= dy) {
      err += dy;
      x0 += sx;
    }
    if (e2 <= dx) {
      err += dx;
      y0 += sy;
    }
    ++step;
  }
}

void Canvas::fillDisc(int cx, int cy, int radius, Rgb color) {
  const int r2 = radius * radius;
  for (int dy = -radius; dy <= radius; ++dy) {
    for (int dx = -radius; dx <= radius; ++dx) {
      if (dx * dx + dy * dy <= r2) setPixel(cx + dx, cy + dy, color);
    }
  }
}

namespace {

void appendToBuffer(void* context, void* data, int size) {
  auto* buffer = static_cast<std::vector<uint8_t>*>(context);
  const auto* bytes = static_cast<const uint8_t*>(data);
  buffer->insert(buffer->end(), bytes, bytes + size);
}

}  // namespace

std::vector<uint8_t> encodePng(const Canvas& canvas, int compression) {
  // stb keeps the level in a library global; set it for every encode so
  // callers with different settings never see each other's value.
  stbi_write_png_compression_level = std::max(0, std::min(9, compression));

  std::vector<uint8_t> png;
  const int stride = canvas.width() * Canvas::kChannels;
  if (!stbi_write_png_to_func(appendToBuffer, &png, canvas.width(),
                              canvas.height(), Canvas::kChannels,
                              canvas.pixels().data(), stride) ||
      png.empty()) {
    throw RenderError("PNG encoding failed (" + std::to_string(canvas.width()) +
                      "x" + std::to_string(canvas.height()) + ")");
  }
  return png;
}

}  // namespace render
}  // namespace cloudreport
