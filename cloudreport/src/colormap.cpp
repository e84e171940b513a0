// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

#include "cloudreport/render/colormap.hpp"

#include <algorithm>

namespace cloudreport {
namespace render {

namespace detail {

Rgb viridisLUT(float t) {
  static const float lut[][3] = {
      {0.267f, 0.005f, 0.329f},  // 0.0
      {0.283f, 0.141f, 0.458f},  // 0.14
      {0.254f, 0.265f, 0.530f},  // 0.29
      {0.207f, 0.372f, 0.553f},  // 0.43
      {0.164f, 0.471f, 0.558f},  // 0.57
      {0.128f, 0.567f, 0.551f},  // 0.71
      {0.267f, 0.679f, 0.481f},  // 0.86
      {0.993f, 0.906f, 0.144f}   // 1.0
  };

  float idx = t * 7.0f;
  int i0 = static_cast<int>(idx);
  int i1 = std::min(i0 + 1, 7);
  float frac = idx - i0;

  auto channel = [&](int c) {
    return static_cast<uint8_t>(
        (lut[i0][c] * (1 - frac) + lut[i1][c] * frac) * 255);
  };
  return {channel(0), channel(1), channel(2)};
}

Rgb jetColor(float t) {
  if (t < 0.25f) return {0, static_cast<uint8_t>(4 * t * 255), 255};
  if (t < 0.5f)
    return {0, 255, static_cast<uint8_t>((1 - 4 * (t - 0.25f)) * 255)};
  if (t < 0.75f) return {static_cast<uint8_t>(4 * (t - 0.5f) * 255), 255, 0};
  return {255, static_cast<uint8_t>((1 - 4 * (t - 0.75f)) * 255), 0};
}

}  // namespace detail

Rgb applyColormap(Colormap colormap, float t) {
  t = std::max(0.0f, std::min(1.0f, t));

  switch (colormap) {
    case Colormap::VIRIDIS:
      return detail::viridisLUT(t);
    case Colormap::JET:
      return detail::jetColor(t);
    case Colormap::GRAYSCALE:
    default: {
      const auto v = static_cast<uint8_t>(t * 255);
      return {v, v, v};
    }
  }
}

}  // namespace render
}  // namespace cloudreport
