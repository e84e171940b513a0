// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

/*
 * point_types.hpp
 *
 * Point and PointSet types for cloudreport.
 */

#ifndef CLOUDREPORT_POINT_TYPES_HPP
#define CLOUDREPORT_POINT_TYPES_HPP

#include <Eigen/Core>
#include <cstddef>
#include <vector>

namespace cloudreport {

using Point = Eigen::Vector3d;

/**
 * @brief Ordered sequence of 3D points in file order.
 *
 * Owns its storage. Points are appended while parsing and are read-only
 * afterwards; every downstream stage takes the set by const reference.
 */
class PointSet {
 public:
  using Container = std::vector<Point, Eigen::aligned_allocator<Point>>;
  using const_iterator = Container::const_iterator;

  PointSet() = default;

  void reserve(size_t n) { points_.reserve(n); }
  void add(double x, double y, double z) { points_.emplace_back(x, y, z); }
  void add(const Point& p) { points_.push_back(p); }

  size_t size() const noexcept { return points_.size(); }
  bool empty() const noexcept { return points_.empty(); }

  const Point& operator[](size_t i) const { return points_[i]; }
  const_iterator begin() const noexcept { return points_.begin(); }
  const_iterator end() const noexcept { return points_.end(); }

 private:
  Container points_;
};

}  // namespace cloudreport

#endif  // CLOUDREPORT_POINT_TYPES_HPP
