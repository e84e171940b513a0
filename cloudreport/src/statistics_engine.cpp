// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

#include "cloudreport/analysis/statistics_engine.hpp"

#include <spdlog/spdlog.h>

namespace cloudreport {

SpatialStatistics StatisticsEngine::compute(const PointSet& points) const {
  spdlog::info("[Analysis] Calculating statistics...");

  SpatialStatistics result;
  result.summary = computeStatistics(points);
  spdlog::info("[Analysis] Total points: {}", result.summary.count);
  spdlog::debug("[Analysis] Extent x={:.3f} y={:.3f} z={:.3f}",
                result.summary.x.extent, result.summary.y.extent,
                result.summary.z.extent);

  result.neighbor = computeAverageNearestNeighbor(points, cfg_);
  return result;
}

}  // namespace cloudreport
