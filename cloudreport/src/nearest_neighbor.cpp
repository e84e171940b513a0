// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

/*
 * nearest_neighbor.cpp
 *
 *  Created on: Mar 2025
 *      Author: Ikhyeon Cho
 *   Institute: Korea Univ. ISR (Intelligent Systems & Robotics) Lab
 *       Email: tre0430@korea.ac.kr
 */

#include "cloudreport/analysis/nearest_neighbor.hpp"

#include <nanopcl/core.hpp>
#include <nanopcl/search/kdtree.hpp>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <cmath>
#include <limits>
#include <vector>

#include "cloudreport/analysis/sampling.hpp"
#include "cloudreport/errors.hpp"

namespace cloudreport {

namespace {

/// Working set in the KD-tree's float storage, relative to its centroid.
/// Centering first keeps sub-millimeter spacing intact for compact clouds
/// with large absolute coordinates. `max_abs` receives the largest local
/// coordinate magnitude, which bounds the float rounding error.
nanopcl::PointCloud toCenteredCloud(const PointSet& points,
                                    const std::vector<size_t>& indices,
                                    double& max_abs) {
  Eigen::Vector3d centroid = Eigen::Vector3d::Zero();
  for (size_t i : indices) centroid += points[i];
  centroid /= static_cast<double>(indices.size());

  max_abs = 0.0;
  nanopcl::PointCloud cloud;
  cloud.reserve(indices.size());
  for (size_t i : indices) {
    const Eigen::Vector3d local = points[i] - centroid;
    max_abs = std::max(max_abs, local.cwiseAbs().maxCoeff());
    cloud.add(static_cast<float>(local.x()), static_cast<float>(local.y()),
              static_cast<float>(local.z()));
  }
  return cloud;
}

}  // namespace

NeighborMetric computeAverageNearestNeighbor(
    const PointSet& points, const config::NeighborSearch& cfg) {
  spdlog::info("[Analysis] Calculating nearest neighbor distance...");

  if (cfg.sample_size == 0) {
    throw ComputationError("nearest-neighbor sample size must be > 0");
  }

  NeighborMetric metric;
  metric.seed = resolveSeed(cfg.seed);

  const auto indices = sampleIndices(points.size(), cfg.sample_size, metric.seed);
  if (indices.size() < 2) {
    throw ComputationError(
        "nearest-neighbor distance needs at least 2 points, got " +
        std::to_string(indices.size()));
  }
  if (indices.size() < points.size()) {
    spdlog::info("[Analysis] Using {} sampled points for NN calculation (seed={})",
                 indices.size(), metric.seed);
  }

  double max_abs = 0.0;
  const auto cloud = toCenteredCloud(points, indices, max_abs);
  nanopcl::search::KdTree tree;
  tree.build(cloud);

  // The tree only proposes candidates; distances are measured in double on
  // the input points. Float storage can move a point by up to half an ulp
  // per axis, so every point the tree could have misordered lies within
  // `slack` of the best exact candidate.
  const double slack =
      4.0 * max_abs * std::numeric_limits<float>::epsilon() +
      std::numeric_limits<float>::min();
  auto exact = [&](size_t a, uint32_t b) {
    return (points[indices[a]] - points[indices[b]]).norm();
  };

  double sum = 0.0;
  std::vector<nanopcl::search::NearestResult> neighbors;
  std::vector<uint32_t> in_range;
  for (size_t i = 0; i < cloud.size(); ++i) {
    const nanopcl::Point query = cloud.point(i);

    // Duplicates may outrank the query itself, so ask for one extra
    tree.knn(query, 3, neighbors);
    double best = std::numeric_limits<double>::infinity();
    for (const auto& n : neighbors) {
      if (n.index != i) best = std::min(best, exact(i, n.index));
    }
    if (!std::isfinite(best)) {
      throw ComputationError("KD-tree returned no neighbor for point " +
                             std::to_string(i));
    }

    const float r = static_cast<float>(best * (1.0 + 1e-6) + slack);
    tree.radius(query, r, in_range);
    for (uint32_t j : in_range) {
      if (j != i) best = std::min(best, exact(i, j));
    }
    sum += best;
  }

  metric.sample_size = cloud.size();
  metric.average_distance = sum / static_cast<double>(cloud.size());

  spdlog::info("[Analysis] Average nearest neighbor distance: {:.4f}",
               metric.average_distance);
  return metric;
}

}  // namespace cloudreport
