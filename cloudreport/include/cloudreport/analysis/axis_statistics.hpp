// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

/*
 * axis_statistics.hpp
 *
 * Per-axis descriptive statistics of a point set.
 *
 *  Created on: Mar 2025
 *      Author: Ikhyeon Cho
 *   Institute: Korea Univ. ISR (Intelligent Systems & Robotics) Lab
 *       Email: tre0430@korea.ac.kr
 */

#ifndef CLOUDREPORT_ANALYSIS_AXIS_STATISTICS_HPP
#define CLOUDREPORT_ANALYSIS_AXIS_STATISTICS_HPP

#include <cstddef>

#include "cloudreport/point_types.hpp"

namespace cloudreport {

struct AxisStatistics {
  double min = 0.0;
  double max = 0.0;
  double extent = 0.0;  ///< max - min
  double mean = 0.0;
  double std_dev = 0.0;  ///< Population standard deviation (divide by N)
};

struct StatisticsSummary {
  size_t count = 0;
  AxisStatistics x;
  AxisStatistics y;
  AxisStatistics z;
};

/**
 * @brief Compute min/max/extent/mean/std dev for each axis.
 *
 * Single pass with Welford's update in double precision, so large
 * coordinate magnitudes (e.g. UTM) do not lose the variance to cancellation.
 *
 * @throws ComputationError if the point set is empty
 */
StatisticsSummary computeStatistics(const PointSet& points);

}  // namespace cloudreport

#endif  // CLOUDREPORT_ANALYSIS_AXIS_STATISTICS_HPP
