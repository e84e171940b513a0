// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

/*
 * report.cpp
 *
 *  Created on: Mar 2025
 *      Author: Ikhyeon Cho
 *   Institute: Korea Univ. ISR (Intelligent Systems & Robotics) Lab
 *       Email: tre0430@korea.ac.kr
 */

#include "cloudreport/report/report.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <ctime>
#include <iomanip>
#include <locale>
#include <sstream>
#include <vector>

#include "cloudreport/report/pdf_writer.hpp"

namespace cloudreport {

namespace {

const pdf::Color kTextColor = pdf::Color::hex(0x2c3e50);
const pdf::Color kTitleColor = pdf::Color::hex(0x1a1a1a);
const pdf::Color kHeaderFill = pdf::Color::hex(0x3498db);
const pdf::Color kCellFill = pdf::Color::hex(0xecf0f1);
const pdf::Color kGridColor = pdf::Color::hex(0x808080);
const pdf::Color kWhite = pdf::Color::hex(0xffffff);

std::string fixed(double value, int precision) {
  std::ostringstream ss;
  ss.imbue(std::locale::classic());
  ss << std::fixed << std::setprecision(precision) << value;
  return ss.str();
}

std::string withThousands(size_t value) {
  std::string digits = std::to_string(value);
  std::string out;
  const int n = static_cast<int>(digits.size());
  for (int i = 0; i < n; ++i) {
    if (i > 0 && (n - i) % 3 == 0) out.push_back(',');
    out.push_back(digits[i]);
  }
  return out;
}

// Lines beyond this are summarized so the plots stay on the page
constexpr size_t kMaxMetadataLines = 16;

/// Cut `text` with a trailing "..." so it fits in `max_width`.
std::string fitWidth(const std::string& text, float size, pdf::Font font,
                     float max_width) {
  if (pdf::textWidth(text, size, font) <= max_width) return text;
  std::string out = text;
  while (!out.empty() &&
         pdf::textWidth(out + "...", size, font) > max_width) {
    out.pop_back();
  }
  return out + "...";
}

/// 4-column metric/value table, header row first.
void drawTable(pdf::PdfDocument& doc, float x, float top,
               const std::vector<std::vector<std::string>>& rows) {
  const float col_w[4] = {129.6f, 86.4f, 129.6f, 86.4f};
  const float row_h = 16.0f;
  const float pad = 4.0f;

  float y = top;
  for (size_t r = 0; r < rows.size(); ++r) {
    const bool header = (r == 0);
    float cx = x;
    for (size_t c = 0; c < 4; ++c) {
      doc.fillRect(cx, y - row_h, col_w[c], row_h,
                   header ? kHeaderFill : kCellFill);
      doc.strokeRect(cx, y - row_h, col_w[c], row_h, kGridColor);

      const std::string& cell = c < rows[r].size() ? rows[r][c] : "";
      if (!cell.empty()) {
        const float size = header ? 9.0f : 8.0f;
        const bool label = header || c % 2 == 0;
        const auto font = label ? pdf::Font::BOLD : pdf::Font::REGULAR;
        const float w = pdf::textWidth(cell, size, font);
        float tx = cx + pad;
        if (header) {
          tx = cx + (col_w[c] - w) / 2.0f;
        } else if (c % 2 == 1) {
          tx = cx + col_w[c] - pad - w;  // right-align values
        }
        doc.text(tx, y - row_h + 5.0f, cell, size, font,
                 header ? kWhite : kTextColor);
      }
      cx += col_w[c];
    }
    y -= row_h;
  }
}

}  // namespace

std::string currentTimestamp() {
  const std::time_t now = std::time(nullptr);
  std::tm local{};
  localtime_r(&now, &local);
  std::ostringstream ss;
  ss << std::put_time(&local, "%Y-%m-%d %H:%M:%S");
  return ss.str();
}

ReportArtifact assembleReport(const config::Report& cfg,
                              const AnalysisResult& analysis,
                              const std::string& source_name,
                              const std::string& output_path,
                              const std::string& generated_at) {
  spdlog::info("[Report] Generating PDF report...");

  const auto& s = analysis.statistics.summary;
  const auto& nn = analysis.statistics.neighbor;

  pdf::PdfDocument doc(cfg.page_width, cfg.page_height);
  doc.setTitle(cfg.title);

  const float left = cfg.margin;
  const float content_w = cfg.page_width - 2.0f * cfg.margin;
  float y = cfg.page_height - 36.0f - 16.0f;

  // Title and subtitle
  const float title_w = pdf::textWidth(cfg.title, 16.0f, pdf::Font::BOLD);
  doc.text(left + (content_w - title_w) / 2.0f, y, cfg.title, 16.0f,
           pdf::Font::BOLD, kTitleColor);
  y -= 20.0f;
  doc.text(left, y,
           "File: " + source_name + " | Generated: " +
               (generated_at.empty() ? currentTimestamp() : generated_at),
           9.0f, pdf::Font::OBLIQUE, kTextColor);
  doc.line(left, y - 6.0f, left + content_w, y - 6.0f, kGridColor);
  y -= 18.0f;
  doc.text(left, y,
           "This report provides statistical analysis and visualization of the "
           "point cloud data, including spatial",
           9.0f, pdf::Font::REGULAR, kTextColor);
  y -= 11.0f;
  doc.text(left, y,
           "extent, distribution metrics, and a 3D view with height-based "
           "coloring.",
           9.0f, pdf::Font::REGULAR, kTextColor);

  // Project information from the sidecar file
  if (!analysis.metadata.empty()) {
    y -= 24.0f;
    doc.text(left, y, "Project Information", 11.0f, pdf::Font::BOLD,
             kTextColor);
    y -= 4.0f;

    const size_t shown = std::min(analysis.metadata.size(), kMaxMetadataLines);
    for (size_t i = 0; i < shown; ++i) {
      y -= 10.0f;
      doc.text(left, y,
               fitWidth(analysis.metadata[i], 8.0f, pdf::Font::REGULAR,
                        content_w),
               8.0f, pdf::Font::REGULAR, kTextColor);
    }
    if (analysis.metadata.size() > shown) {
      y -= 10.0f;
      doc.text(left, y,
               "(" + std::to_string(analysis.metadata.size() - shown) +
                   " more lines not shown)",
               8.0f, pdf::Font::OBLIQUE, kTextColor);
      spdlog::warn("[Report] Metadata truncated to {} of {} lines", shown,
                   analysis.metadata.size());
    }
  }

  // Statistics table
  y -= 24.0f;
  doc.text(left, y, "Statistical Summary", 11.0f, pdf::Font::BOLD, kTextColor);
  y -= 8.0f;

  const std::vector<std::vector<std::string>> rows = {
      {"Metric", "Value", "Metric", "Value"},
      {"Total Points", withThousands(s.count), "X Extent (m)",
       fixed(s.x.extent, 3)},
      {"X Mean (m)", fixed(s.x.mean, 3), "Y Extent (m)", fixed(s.y.extent, 3)},
      {"Y Mean (m)", fixed(s.y.mean, 3), "Z Extent (m)", fixed(s.z.extent, 3)},
      {"Z Mean (m)", fixed(s.z.mean, 3), "X Std Dev (m)",
       fixed(s.x.std_dev, 3)},
      {"Y Std Dev (m)", fixed(s.y.std_dev, 3), "Z Std Dev (m)",
       fixed(s.z.std_dev, 3)},
      {"Avg NN Distance (m)", fixed(nn.average_distance, 4), "NN Sample Size",
       withThousands(nn.sample_size)},
  };
  const float table_x = left + (content_w - 432.0f) / 2.0f;
  drawTable(doc, table_x, y, rows);
  y -= 16.0f * rows.size();

  // Plots, side by side
  y -= 24.0f;
  doc.text(left, y, "Visualizations", 11.0f, pdf::Font::BOLD, kTextColor);
  y -= 18.0f;

  const float col_w = content_w / 2.0f;
  const float img_w = 230.4f;  // 3.2 inch
  struct Panel {
    const RenderedImage* image;
    std::string title;
    std::string caption;
  };
  const Panel panels[2] = {
      {&analysis.histogram, "Z-value Distribution",
       "Z-value (m) [" + fixed(s.z.min, 2) + ", " + fixed(s.z.max, 2) +
           "] vs. frequency (count)"},
      {&analysis.scatter, "3D Point Cloud Visualization",
       "Colored by Z, " + withThousands(analysis.scatter.points_drawn) +
           " points shown"},
  };

  for (int i = 0; i < 2; ++i) {
    const auto& p = panels[i];
    const float x = left + i * col_w + (col_w - img_w) / 2.0f;
    doc.text(x, y, p.title, 10.0f, pdf::Font::BOLD, kTextColor);
    if (p.image->png.empty() || p.image->width <= 0) continue;

    const float img_h =
        img_w * static_cast<float>(p.image->height) / p.image->width;
    const float img_y = y - 6.0f - img_h;
    doc.image(p.image->png, x, img_y, img_w, img_h);
    doc.text(x, img_y - 11.0f, p.caption, 8.0f, pdf::Font::REGULAR,
             kTextColor);
  }

  ReportArtifact artifact;
  artifact.path = output_path;
  artifact.size_bytes = doc.save(output_path);

  spdlog::info("[Report] PDF generated successfully: {}", output_path);
  spdlog::info("[Report] File size: {:.2f} MB", artifact.sizeMb());
  return artifact;
}

}  // namespace cloudreport
