// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

/*
 * pdf_writer.hpp
 *
 * Minimal single-page PDF 1.4 writer: standard Helvetica text, filled and
 * stroked rectangles, lines, and PNG images.
 *
 * PNG images are embedded without re-encoding: the zlib stream of the IDAT
 * chunks is copied into a /FlateDecode image XObject with PNG predictors,
 * which PDF readers undo exactly as a PNG decoder would. Only 8-bit RGB,
 * non-interlaced PNGs are accepted.
 *
 * Coordinates are PDF points with the origin at the bottom-left corner.
 *
 *  Created on: Mar 2025
 *      Author: Ikhyeon Cho
 *   Institute: Korea Univ. ISR (Intelligent Systems & Robotics) Lab
 *       Email: tre0430@korea.ac.kr
 */

#ifndef CLOUDREPORT_REPORT_PDF_WRITER_HPP
#define CLOUDREPORT_REPORT_PDF_WRITER_HPP

#include <cstddef>
#include <cstdint>
#include <sstream>
#include <string>
#include <vector>

namespace cloudreport {
namespace pdf {

enum class Font { REGULAR, BOLD, OBLIQUE };

struct Color {
  float r = 0.0f;
  float g = 0.0f;
  float b = 0.0f;

  /// From 0xRRGGBB.
  static Color hex(uint32_t rgb) {
    return {((rgb >> 16) & 0xFF) / 255.0f, ((rgb >> 8) & 0xFF) / 255.0f,
            (rgb & 0xFF) / 255.0f};
  }
};

/// Header fields and raw zlib data of a PNG file.
struct PngImage {
  uint32_t width = 0;
  uint32_t height = 0;
  uint8_t bit_depth = 0;
  uint8_t color_type = 0;
  uint8_t interlace = 0;
  std::vector<uint8_t> idat;  ///< Concatenated IDAT payloads
};

/// @throws AssemblyError on a truncated or corrupt PNG
PngImage parsePng(const std::vector<uint8_t>& png);

/// Approximate Helvetica advance width of `text` at `size` [pt].
float textWidth(const std::string& text, float size, Font font = Font::REGULAR);

class PdfDocument {
 public:
  PdfDocument(float page_width, float page_height);

  float pageWidth() const noexcept { return page_width_; }
  float pageHeight() const noexcept { return page_height_; }

  void setTitle(const std::string& title) { title_ = title; }

  /// Baseline-left anchored text. Non-ASCII characters are replaced by '?'.
  void text(float x, float y, const std::string& text, float size,
            Font font = Font::REGULAR, Color color = {});

  void fillRect(float x, float y, float w, float h, Color color);
  void strokeRect(float x, float y, float w, float h, Color color,
                  float line_width = 0.5f);
  void line(float x0, float y0, float x1, float y1, Color color,
            float line_width = 0.5f);

  /**
   * @brief Place a PNG with its lower-left corner at (x, y), scaled to w x h.
   * @throws AssemblyError if the PNG is not 8-bit RGB non-interlaced
   */
  void image(const std::vector<uint8_t>& png, float x, float y, float w,
             float h);

  size_t imageCount() const noexcept { return images_.size(); }

  /// Complete file contents.
  std::string build() const;

  /**
   * @brief Write the document to disk.
   * @return Number of bytes written
   * @throws AssemblyError if the file cannot be written
   */
  size_t save(const std::string& filename) const;

 private:
  float page_width_;
  float page_height_;
  std::string title_;
  std::ostringstream content_;
  std::vector<PngImage> images_;
};

}  // namespace pdf
}  // namespace cloudreport

#endif  // CLOUDREPORT_REPORT_PDF_WRITER_HPP
