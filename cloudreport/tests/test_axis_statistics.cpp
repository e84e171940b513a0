// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

#include <gtest/gtest.h>

#include <cmath>
#include <random>

#include "cloudreport/analysis/axis_statistics.hpp"
#include "cloudreport/errors.hpp"

using namespace cloudreport;

TEST(AxisStatisticsTest, TrianglePoints) {
  PointSet points;
  points.add(0, 0, 0);
  points.add(1, 0, 0);
  points.add(0, 1, 0);

  auto s = computeStatistics(points);

  EXPECT_EQ(s.count, 3u);
  EXPECT_DOUBLE_EQ(s.x.extent, 1.0);
  EXPECT_DOUBLE_EQ(s.y.extent, 1.0);
  EXPECT_DOUBLE_EQ(s.z.extent, 0.0);
  EXPECT_NEAR(s.x.mean, 1.0 / 3.0, 1e-12);
  EXPECT_NEAR(s.y.mean, 1.0 / 3.0, 1e-12);
  EXPECT_DOUBLE_EQ(s.z.mean, 0.0);
  // Population std dev of {0, 1, 0} = sqrt(2/9)
  EXPECT_NEAR(s.x.std_dev, std::sqrt(2.0 / 9.0), 1e-12);
  EXPECT_DOUBLE_EQ(s.z.std_dev, 0.0);
}

TEST(AxisStatisticsTest, PopulationNotSampleStdDev) {
  PointSet points;
  for (double v : {2.0, 4.0, 4.0, 4.0, 5.0, 5.0, 7.0, 9.0}) {
    points.add(v, 0.0, 0.0);
  }

  auto s = computeStatistics(points);
  EXPECT_DOUBLE_EQ(s.x.mean, 5.0);
  EXPECT_NEAR(s.x.std_dev, 2.0, 1e-12);  // N-1 would give ~2.138
}

TEST(AxisStatisticsTest, SingleRepeatedPointHasZeroSpread) {
  PointSet points;
  for (int i = 0; i < 50; ++i) points.add(3.3, -7.1, 12.25);

  auto s = computeStatistics(points);
  for (const auto* axis : {&s.x, &s.y, &s.z}) {
    EXPECT_DOUBLE_EQ(axis->std_dev, 0.0);
    EXPECT_DOUBLE_EQ(axis->extent, 0.0);
    EXPECT_DOUBLE_EQ(axis->min, axis->max);
    EXPECT_DOUBLE_EQ(axis->mean, axis->min);
  }
}

TEST(AxisStatisticsTest, SinglePoint) {
  PointSet points;
  points.add(1.0, 2.0, 3.0);

  auto s = computeStatistics(points);
  EXPECT_EQ(s.count, 1u);
  EXPECT_DOUBLE_EQ(s.y.mean, 2.0);
  EXPECT_DOUBLE_EQ(s.z.std_dev, 0.0);
}

TEST(AxisStatisticsTest, OrderingInvariantsOnRandomCloud) {
  std::mt19937 gen(42);
  std::uniform_real_distribution<double> dist(-50.0, 80.0);
  PointSet points;
  for (int i = 0; i < 5000; ++i) points.add(dist(gen), dist(gen), dist(gen));

  auto s = computeStatistics(points);
  for (const auto* axis : {&s.x, &s.y, &s.z}) {
    EXPECT_LE(axis->min, axis->mean);
    EXPECT_LE(axis->mean, axis->max);
    EXPECT_DOUBLE_EQ(axis->extent, axis->max - axis->min);
    EXPECT_GE(axis->std_dev, 0.0);
  }
}

TEST(AxisStatisticsTest, StableForLargeOffsets) {
  // UTM-like coordinates: naive sum of squares loses the variance entirely
  const double offset = 4.5e6;
  PointSet points;
  for (int i = 0; i < 1000; ++i) {
    points.add(offset + (i % 2 == 0 ? -0.001 : 0.001), offset, 0.0);
  }

  auto s = computeStatistics(points);
  EXPECT_NEAR(s.x.mean, offset, 1e-6);
  EXPECT_NEAR(s.x.std_dev, 0.001, 1e-7);
  EXPECT_DOUBLE_EQ(s.y.std_dev, 0.0);
}

TEST(AxisStatisticsTest, EmptyThrows) {
  PointSet points;
  EXPECT_THROW(computeStatistics(points), ComputationError);
}
