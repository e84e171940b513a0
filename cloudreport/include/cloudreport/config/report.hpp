// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

/*
 * report.hpp
 *
 * PDF report configuration.
 *
 *  Created on: Mar 2025
 *      Author: Ikhyeon Cho
 *   Institute: Korea Univ. ISR (Intelligent Systems & Robotics) Lab
 *       Email: tre0430@korea.ac.kr
 */

#ifndef CLOUDREPORT_CONFIG_REPORT_HPP
#define CLOUDREPORT_CONFIG_REPORT_HPP

#include <string>

namespace cloudreport::config {

struct Report {
  std::string title = "Point Cloud Analysis Report";
  float page_width = 612.0f;   ///< US Letter [pt]
  float page_height = 792.0f;  ///< US Letter [pt]
  float margin = 43.2f;        ///< 0.6 inch [pt]

  /// Target document size. Exceeding it is reported, never enforced.
  double size_budget_mb = 2.0;
};

}  // namespace cloudreport::config

#endif  // CLOUDREPORT_CONFIG_REPORT_HPP
