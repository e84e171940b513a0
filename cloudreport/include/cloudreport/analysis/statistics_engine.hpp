// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

/*
 * statistics_engine.hpp
 *
 * Runs the axis statistics and the nearest-neighbor metric over one
 * point set.
 *
 *  Created on: Mar 2025
 *      Author: Ikhyeon Cho
 *   Institute: Korea Univ. ISR (Intelligent Systems & Robotics) Lab
 *       Email: tre0430@korea.ac.kr
 */

#ifndef CLOUDREPORT_ANALYSIS_STATISTICS_ENGINE_HPP
#define CLOUDREPORT_ANALYSIS_STATISTICS_ENGINE_HPP

#include <cstdint>
#include <optional>

#include "cloudreport/analysis/axis_statistics.hpp"
#include "cloudreport/analysis/nearest_neighbor.hpp"
#include "cloudreport/config/analysis.hpp"

namespace cloudreport {

struct SpatialStatistics {
  StatisticsSummary summary;
  NeighborMetric neighbor;
};

class StatisticsEngine {
 public:
  StatisticsEngine() = default;
  explicit StatisticsEngine(const config::NeighborSearch& cfg) : cfg_(cfg) {}

  /// Fix the sampling seed (reproducible runs). std::nullopt = random.
  StatisticsEngine& setSeed(std::optional<uint64_t> seed) noexcept {
    cfg_.seed = seed;
    return *this;
  }

  StatisticsEngine& setSampleSize(size_t sample_size) noexcept {
    cfg_.sample_size = sample_size;
    return *this;
  }

  const config::NeighborSearch& config() const noexcept { return cfg_; }

  /// @throws ComputationError (see computeStatistics and
  ///         computeAverageNearestNeighbor)
  SpatialStatistics compute(const PointSet& points) const;

 private:
  config::NeighborSearch cfg_;
};

}  // namespace cloudreport

#endif  // CLOUDREPORT_ANALYSIS_STATISTICS_ENGINE_HPP
