// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

/*
 * io_xyz.cpp
 *
 *  Created on: Mar 2025
 *      Author: Ikhyeon Cho
 *   Institute: Korea Univ. ISR (Intelligent Systems & Robotics) Lab
 *       Email: tre0430@korea.ac.kr
 */

#include "cloudreport/io/xyz.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cmath>
#include <cstdlib>
#include <fstream>
#include <sstream>

#include "cloudreport/errors.hpp"

namespace cloudreport {
namespace io {

namespace detail {

// Whole-token, finite-only number parsing.
bool parseCoordinate(const std::string& token, double& value) {
  if (token.empty()) return false;
  // strtod also accepts hexadecimal floats; coordinate files never use them.
  if (token.find_first_of("xX") != std::string::npos) return false;

  const char* begin = token.c_str();
  char* end = nullptr;
  const double v = std::strtod(begin, &end);
  if (end != begin + token.size()) return false;
  // Underflow yields a denormal or zero and is kept; overflow yields
  // HUGE_VAL and is rejected with nan/inf.
  if (!std::isfinite(v)) return false;

  value = v;
  return true;
}

}  // namespace detail

bool parseXyzLine(const std::string& line, Point& point) {
  const auto first = line.find_first_not_of(" \t\r\n\f\v");
  if (first == std::string::npos) return false;  // blank
  if (line[first] == '#') return false;          // comment

  std::string normalized = line.substr(first);
  std::replace(normalized.begin(), normalized.end(), ',', ' ');

  std::istringstream tokens(normalized);
  std::string tx, ty, tz;
  if (!(tokens >> tx >> ty >> tz)) return false;  // fewer than 3 tokens

  double x, y, z;
  if (!detail::parseCoordinate(tx, x) || !detail::parseCoordinate(ty, y) ||
      !detail::parseCoordinate(tz, z)) {
    return false;
  }

  point = Point(x, y, z);
  return true;
}

PointSet parseXyz(std::istream& in, ParseStats* stats) {
  PointSet points;
  ParseStats local;

  std::string line;
  Point p;
  while (std::getline(in, line)) {
    ++local.lines_total;
    if (parseXyzLine(line, p)) {
      points.add(p);
    } else {
      ++local.lines_skipped;
    }
  }
  local.points = points.size();
  if (stats) *stats = local;

  if (points.empty()) {
    throw ParseError("no valid points");
  }
  return points;
}

PointSet loadXyz(const std::string& filename, ParseStats* stats) {
  spdlog::info("[Parser] Reading file: {}", filename);

  std::ifstream file(filename);
  if (!file.is_open()) {
    throw ParseError("cannot open " + filename);
  }

  ParseStats local;
  auto points = parseXyz(file, &local);
  if (stats) *stats = local;

  spdlog::info("[Parser] Loaded {} points ({} of {} lines skipped)",
               local.points, local.lines_skipped, local.lines_total);
  return points;
}

}  // namespace io
}  // namespace cloudreport
