// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

/*
 * xyz.hpp
 *
 * ASCII XYZ point cloud reader (.xyz / .txt / .csv).
 *
 * One point per line: the first three whitespace- or comma-separated tokens
 * are x, y, z. Extra columns (intensity, color, ...) are ignored. Blank lines
 * and lines starting with '#' are skipped, and so is any line whose first
 * three tokens are not all finite numbers (headers, stray text).
 *
 *  Created on: Mar 2025
 *      Author: Ikhyeon Cho
 *   Institute: Korea Univ. ISR (Intelligent Systems & Robotics) Lab
 *       Email: tre0430@korea.ac.kr
 */

#ifndef CLOUDREPORT_IO_XYZ_HPP
#define CLOUDREPORT_IO_XYZ_HPP

#include <cstddef>
#include <istream>
#include <string>

#include "cloudreport/point_types.hpp"

namespace cloudreport {
namespace io {

/// Line accounting for one parse.
struct ParseStats {
  size_t lines_total = 0;
  size_t lines_skipped = 0;  ///< Blank, comment, short or non-numeric lines
  size_t points = 0;
};

/**
 * @brief Parse one line into a point.
 * @return false if the line is skippable or malformed
 */
bool parseXyzLine(const std::string& line, Point& point);

/**
 * @brief Read all points from a stream.
 * @throws ParseError if no valid point was found
 */
PointSet parseXyz(std::istream& in, ParseStats* stats = nullptr);

/**
 * @brief Read all points from a file.
 * @throws ParseError if the file cannot be opened or has no valid point
 */
PointSet loadXyz(const std::string& filename, ParseStats* stats = nullptr);

}  // namespace io
}  // namespace cloudreport

#endif  // CLOUDREPORT_IO_XYZ_HPP
