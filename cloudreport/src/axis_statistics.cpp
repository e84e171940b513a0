// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

#include "cloudreport/analysis/axis_statistics.hpp"

#include <cmath>
#include <limits>

#include "cloudreport/errors.hpp"

namespace cloudreport {

namespace {

/// Welford online accumulator for one axis.
struct AxisAccumulator {
  double mean = 0.0;
  double m2 = 0.0;
  double min = std::numeric_limits<double>::max();
  double max = std::numeric_limits<double>::lowest();
  size_t count = 0;

  void add(double v) {
    ++count;
    const double delta = v - mean;
    mean += delta / static_cast<double>(count);
    const double delta2 = v - mean;
    m2 += delta * delta2;

    if (v < min) min = v;
    if (v > max) max = v;
  }

  AxisStatistics finalize() const {
    AxisStatistics s;
    s.min = min;
    s.max = max;
    s.extent = max - min;
    s.mean = mean;
    s.std_dev = (count == 0) ? 0.0 : std::sqrt(m2 / static_cast<double>(count));
    // Rounding in the running mean can leave it an ulp outside [min, max]
    if (s.mean < s.min) s.mean = s.min;
    if (s.mean > s.max) s.mean = s.max;
    return s;
  }
};

}  // namespace

StatisticsSummary computeStatistics(const PointSet& points) {
  if (points.empty()) {
    throw ComputationError("statistics requested on an empty point set");
  }

  AxisAccumulator ax, ay, az;
  for (const auto& p : points) {
    ax.add(p.x());
    ay.add(p.y());
    az.add(p.z());
  }

  StatisticsSummary summary;
  summary.count = points.size();
  summary.x = ax.finalize();
  summary.y = ay.finalize();
  summary.z = az.finalize();
  return summary;
}

}  // namespace cloudreport
