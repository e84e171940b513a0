// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

/*
 * config_cloudreport.cpp
 *
 * YAML configuration loading.
 *
 *  Created on: Mar 2025
 *      Author: Ikhyeon Cho
 *   Institute: Korea Univ. ISR (Intelligent Systems & Robotics) Lab
 *       Email: tre0430@korea.ac.kr
 */

#include <spdlog/spdlog.h>
#include <yaml-cpp/yaml.h>

#include <algorithm>

#include "cloudreport/config/cloudreport.hpp"
#include "cloudreport/errors.hpp"

namespace cloudreport {
namespace detail {

template <typename T>
void load(const YAML::Node& node, const std::string& key, T& value) {
  if (node[key]) {
    value = node[key].as<T>();
  }
}

Colormap parseColormap(const std::string& name) {
  if (name == "viridis") return Colormap::VIRIDIS;
  if (name == "jet") return Colormap::JET;
  if (name == "grayscale" || name == "gray") return Colormap::GRAYSCALE;
  spdlog::warn("[Config] Unknown render.colormap '{}', defaulting to viridis",
               name);
  return Colormap::VIRIDIS;
}

Config parse(const YAML::Node& root) {
  Config cfg;

  load(root, "log_level", cfg.log_level);

  // Nearest-neighbor sampling
  if (auto n = root["analysis"]) {
    load(n, "sample_size", cfg.neighbor_search.sample_size);
    if (n["seed"] && !n["seed"].IsNull()) {
      cfg.neighbor_search.seed = n["seed"].as<uint64_t>();
    }
  }

  // Plot rendering
  if (auto n = root["render"]) {
    auto& r = cfg.render;
    if (auto h = n["histogram"]) {
      load(h, "width", r.histogram_width);
      load(h, "height", r.histogram_height);
      load(h, "bins", r.histogram_bins);
    }
    if (auto s = n["scatter"]) {
      load(s, "width", r.scatter_width);
      load(s, "height", r.scatter_height);
      load(s, "max_points", r.max_scatter_points);
      load(s, "elevation_deg", r.elevation_deg);
      load(s, "azimuth_deg", r.azimuth_deg);
      std::string colormap_str;
      load(s, "colormap", colormap_str);
      if (!colormap_str.empty()) r.colormap = parseColormap(colormap_str);
    }
    load(n, "png_compression", r.png_compression);
  }

  // Document
  if (auto n = root["report"]) {
    load(n, "title", cfg.report.title);
    load(n, "size_budget_mb", cfg.report.size_budget_mb);
  }

  return cfg;
}

void validate(Config& cfg) {
  // --- Fatal: values that leave nothing to compute ---
  if (cfg.neighbor_search.sample_size < 2) {
    throw ConfigError("analysis.sample_size (" +
                      std::to_string(cfg.neighbor_search.sample_size) +
                      ") must be >= 2");
  }
  if (cfg.report.size_budget_mb <= 0.0) {
    throw ConfigError("report.size_budget_mb (" +
                      std::to_string(cfg.report.size_budget_mb) +
                      ") must be > 0");
  }

  // --- Non-fatal: warn and clamp ---
  auto warn_clamp = [](const std::string& name, auto& val, auto lo, auto hi) {
    if (val < lo || val > hi) {
      spdlog::warn("[Config] {} ({}) out of range [{}, {}], clamping", name, val,
                   lo, hi);
      val = std::clamp(val, static_cast<decltype(val)>(lo),
                       static_cast<decltype(val)>(hi));
    }
  };

  auto& r = cfg.render;
  warn_clamp("render.histogram.width", r.histogram_width, 64, 4096);
  warn_clamp("render.histogram.height", r.histogram_height, 64, 4096);
  warn_clamp("render.histogram.bins", r.histogram_bins, 1, 1000);
  warn_clamp("render.scatter.width", r.scatter_width, 64, 4096);
  warn_clamp("render.scatter.height", r.scatter_height, 64, 4096);
  warn_clamp("render.scatter.elevation_deg", r.elevation_deg, -90.0f, 90.0f);
  warn_clamp("render.png_compression", r.png_compression, 0, 9);

  if (r.max_scatter_points == 0) {
    spdlog::warn(
        "[Config] render.scatter.max_points must be > 0, clamping to 50000");
    r.max_scatter_points = 50000;
  }

  if (cfg.log_level.empty() ||
      spdlog::level::from_str(cfg.log_level) == spdlog::level::off) {
    if (cfg.log_level != "off") {
      spdlog::warn("[Config] Unknown log_level '{}', defaulting to info",
                   cfg.log_level);
      cfg.log_level = "info";
    }
  }
}

}  // namespace detail

Config parseConfig(const YAML::Node& root) {
  Config cfg;
  try {
    cfg = detail::parse(root);
  } catch (const YAML::Exception& e) {
    throw ConfigError(std::string("Invalid value - ") + e.what());
  }
  detail::validate(cfg);
  return cfg;
}

Config loadConfig(const std::string& path) {
  YAML::Node root;
  try {
    root = YAML::LoadFile(path);
  } catch (const YAML::Exception& e) {
    throw ConfigError("Failed to load config: " + path + " - " + e.what());
  }
  return parseConfig(root);
}

}  // namespace cloudreport
