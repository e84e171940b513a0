// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

/*
 * colormap.hpp
 *
 * Scalar-to-color lookup for height shading.
 */

#ifndef CLOUDREPORT_RENDER_COLORMAP_HPP
#define CLOUDREPORT_RENDER_COLORMAP_HPP

#include <cstdint>

#include "cloudreport/config/render.hpp"

namespace cloudreport {
namespace render {

struct Rgb {
  uint8_t r = 0;
  uint8_t g = 0;
  uint8_t b = 0;
};

/// Map t in [0, 1] (clamped) to a color.
Rgb applyColormap(Colormap colormap, float t);

}  // namespace render
}  // namespace cloudreport

#endif  // CLOUDREPORT_RENDER_COLORMAP_HPP
