// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

/*
 * report.hpp
 *
 * One-page PDF summary of an analyzed point cloud.
 *
 *  Created on: Mar 2025
 *      Author: Ikhyeon Cho
 *   Institute: Korea Univ. ISR (Intelligent Systems & Robotics) Lab
 *       Email: tre0430@korea.ac.kr
 */

#ifndef CLOUDREPORT_REPORT_REPORT_HPP
#define CLOUDREPORT_REPORT_REPORT_HPP

#include <cstddef>
#include <string>
#include <vector>

#include "cloudreport/analysis/statistics_engine.hpp"
#include "cloudreport/config/report.hpp"
#include "cloudreport/render/renderer.hpp"

namespace cloudreport {

/// Everything the report lays out.
struct AnalysisResult {
  SpatialStatistics statistics;
  RenderedImage histogram;
  RenderedImage scatter;
  std::vector<std::string> metadata;  ///< Project Information lines, if any
};

struct ReportArtifact {
  std::string path;
  size_t size_bytes = 0;

  double sizeMb() const { return size_bytes / (1024.0 * 1024.0); }
};

/**
 * @brief Lay out title, project information (when present), statistics
 *        table and both plots on one page and write the PDF.
 *
 * @param source_name Input file name shown in the subtitle
 * @param generated_at Timestamp shown in the subtitle; empty = now
 * @throws AssemblyError if an image cannot be embedded or the file cannot
 *         be written
 */
ReportArtifact assembleReport(const config::Report& cfg,
                              const AnalysisResult& analysis,
                              const std::string& source_name,
                              const std::string& output_path,
                              const std::string& generated_at = "");

/// Local time as "YYYY-MM-DD HH:MM:SS".
std::string currentTimestamp();

}  // namespace cloudreport

#endif  // CLOUDREPORT_REPORT_REPORT_HPP
