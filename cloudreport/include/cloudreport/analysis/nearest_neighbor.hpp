// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

/*
 * nearest_neighbor.hpp
 *
 * Average nearest-neighbor distance over a (sub)sampled working set,
 * answered by a KD-tree instead of O(n^2) pairwise search.
 *
 *  Created on: Mar 2025
 *      Author: Ikhyeon Cho
 *   Institute: Korea Univ. ISR (Intelligent Systems & Robotics) Lab
 *       Email: tre0430@korea.ac.kr
 */

#ifndef CLOUDREPORT_ANALYSIS_NEAREST_NEIGHBOR_HPP
#define CLOUDREPORT_ANALYSIS_NEAREST_NEIGHBOR_HPP

#include <cstddef>
#include <cstdint>

#include "cloudreport/config/analysis.hpp"
#include "cloudreport/point_types.hpp"

namespace cloudreport {

struct NeighborMetric {
  double average_distance = 0.0;
  size_t sample_size = 0;  ///< Points in the working set
  uint64_t seed = 0;       ///< Seed that drew the working set
};

/**
 * @brief Average distance from each working-set point to its nearest
 *        other point in the working set.
 *
 * If the cloud has more than cfg.sample_size points, the working set is a
 * uniform random subset of exactly cfg.sample_size points drawn without
 * replacement; otherwise it is the whole cloud. Each point queries its two
 * nearest neighbors in a KD-tree over the working set: the first is the
 * point itself, the second is the true neighbor. Coincident duplicates
 * contribute a distance of exactly 0.
 *
 * The subset, and therefore the result, depends on the seed. Repeated runs
 * without cfg.seed may differ slightly; the seed used is returned in the
 * metric so any run can be replayed.
 *
 * @throws ComputationError if the working set has fewer than 2 points
 */
NeighborMetric computeAverageNearestNeighbor(
    const PointSet& points, const config::NeighborSearch& cfg = {});

}  // namespace cloudreport

#endif  // CLOUDREPORT_ANALYSIS_NEAREST_NEIGHBOR_HPP
