// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

/*
 * pdf_writer.cpp
 *
 *  Created on: Mar 2025
 *      Author: Ikhyeon Cho
 *   Institute: Korea Univ. ISR (Intelligent Systems & Robotics) Lab
 *       Email: tre0430@korea.ac.kr
 */

#include "cloudreport/report/pdf_writer.hpp"

#include <spdlog/spdlog.h>

#include <array>
#include <cstdio>
#include <cstring>
#include <fstream>
#include <iomanip>
#include <locale>

#include "cloudreport/errors.hpp"

namespace cloudreport {
namespace pdf {

namespace detail {

// ─── CRC32 (PNG chunk check) ────────────────────────────────────────────────

constexpr std::array<uint32_t, 256> buildCrc32Table() {
  std::array<uint32_t, 256> table{};
  for (uint32_t i = 0; i < 256; ++i) {
    uint32_t c = i;
    for (int j = 0; j < 8; ++j) {
      c = (c & 1) ? (0xEDB88320u ^ (c >> 1)) : (c >> 1);
    }
    table[i] = c;
  }
  return table;
}

static constexpr auto crc32Table = buildCrc32Table();

uint32_t crc32(const uint8_t* data, size_t len) {
  uint32_t crc = 0xFFFFFFFFu;
  for (size_t i = 0; i < len; ++i) {
    crc = crc32Table[(crc ^ data[i]) & 0xFF] ^ (crc >> 8);
  }
  return crc ^ 0xFFFFFFFFu;
}

// ─── Big-endian helpers ─────────────────────────────────────────────────────

uint32_t readBE32(const uint8_t* p) {
  return (static_cast<uint32_t>(p[0]) << 24) |
         (static_cast<uint32_t>(p[1]) << 16) |
         (static_cast<uint32_t>(p[2]) << 8) | static_cast<uint32_t>(p[3]);
}

// ─── PDF string helpers ─────────────────────────────────────────────────────

std::string escapeText(const std::string& text) {
  std::string out;
  out.reserve(text.size());
  for (unsigned char c : text) {
    if (c == '(' || c == ')' || c == '\\') {
      out.push_back('\\');
      out.push_back(static_cast<char>(c));
    } else if (c < 0x20 || c > 0x7E) {
      out.push_back('?');
    } else {
      out.push_back(static_cast<char>(c));
    }
  }
  return out;
}

const char* fontResource(Font font) {
  switch (font) {
    case Font::BOLD:
      return "/F2";
    case Font::OBLIQUE:
      return "/F3";
    case Font::REGULAR:
    default:
      return "/F1";
  }
}

/// Helvetica advance in 1/1000 em, coarse per character class.
int glyphWidth(unsigned char c) {
  if (c >= '0' && c <= '9') return 556;
  switch (c) {
    case ' ': case '.': case ',': case ':': case ';': case '!': case '/':
    case 'I': case 'f': case 't':
      return 278;
    case 'i': case 'j': case 'l':
      return 222;
    case '-': case '(': case ')': case 'r':
      return 333;
    case '|':
      return 260;
    case 'm':
      return 833;
    case 'w':
      return 722;
    case 'M':
      return 833;
    case 'W':
      return 944;
    default:
      break;
  }
  if (c >= 'A' && c <= 'Z') return 667;
  if (c >= 'a' && c <= 'z') return 556;
  return 556;
}

}  // namespace detail

// ─── PNG ────────────────────────────────────────────────────────────────────

PngImage parsePng(const std::vector<uint8_t>& png) {
  static const uint8_t kSignature[8] = {0x89, 'P', 'N', 'G', '\r', '\n', 0x1A,
                                        '\n'};
  if (png.size() < 8 || std::memcmp(png.data(), kSignature, 8) != 0) {
    throw AssemblyError("image is not a PNG");
  }

  PngImage image;
  bool have_header = false;
  bool have_end = false;
  size_t pos = 8;

  while (pos + 12 <= png.size() && !have_end) {
    const uint32_t length = detail::readBE32(&png[pos]);
    if (length > png.size() - pos - 12) {
      throw AssemblyError("truncated PNG chunk");
    }
    const uint8_t* type = &png[pos + 4];
    const uint8_t* data = &png[pos + 8];
    const uint32_t crc = detail::readBE32(&png[pos + 8 + length]);
    if (detail::crc32(type, length + 4) != crc) {
      throw AssemblyError("PNG chunk CRC mismatch");
    }

    if (std::memcmp(type, "IHDR", 4) == 0) {
      if (length < 13) throw AssemblyError("invalid PNG header");
      image.width = detail::readBE32(data);
      image.height = detail::readBE32(data + 4);
      image.bit_depth = data[8];
      image.color_type = data[9];
      image.interlace = data[12];
      have_header = true;
    } else if (std::memcmp(type, "IDAT", 4) == 0) {
      image.idat.insert(image.idat.end(), data, data + length);
    } else if (std::memcmp(type, "IEND", 4) == 0) {
      have_end = true;
    }
    pos += 12 + length;
  }

  if (!have_header || image.idat.empty()) {
    throw AssemblyError("PNG has no image data");
  }
  if (!have_end) throw AssemblyError("truncated PNG (missing IEND)");
  return image;
}

float textWidth(const std::string& text, float size, Font font) {
  int units = 0;
  for (unsigned char c : text) units += detail::glyphWidth(c);
  const float bold_factor = (font == Font::BOLD) ? 1.05f : 1.0f;
  return units * size * bold_factor / 1000.0f;
}

// ─── PdfDocument ────────────────────────────────────────────────────────────

PdfDocument::PdfDocument(float page_width, float page_height)
    : page_width_(page_width), page_height_(page_height) {
  content_.imbue(std::locale::classic());
  content_ << std::fixed << std::setprecision(2);
}

void PdfDocument::text(float x, float y, const std::string& text, float size,
                       Font font, Color color) {
  content_ << "BT " << detail::fontResource(font) << ' ' << size << " Tf "
           << color.r << ' ' << color.g << ' ' << color.b << " rg " << x
           << ' ' << y << " Td (" << detail::escapeText(text) << ") Tj ET\n";
}

void PdfDocument::fillRect(float x, float y, float w, float h, Color color) {
  content_ << color.r << ' ' << color.g << ' ' << color.b << " rg " << x << ' '
           << y << ' ' << w << ' ' << h << " re f\n";
}

void PdfDocument::strokeRect(float x, float y, float w, float h, Color color,
                             float line_width) {
  content_ << line_width << " w " << color.r << ' ' << color.g << ' '
           << color.b << " RG " << x << ' ' << y << ' ' << w << ' ' << h
           << " re S\n";
}

void PdfDocument::line(float x0, float y0, float x1, float y1, Color color,
                       float line_width) {
  content_ << line_width << " w " << color.r << ' ' << color.g << ' '
           << color.b << " RG " << x0 << ' ' << y0 << " m " << x1 << ' ' << y1
           << " l S\n";
}

void PdfDocument::image(const std::vector<uint8_t>& png, float x, float y,
                        float w, float h) {
  auto parsed = parsePng(png);
  if (parsed.bit_depth != 8 || parsed.color_type != 2 ||
      parsed.interlace != 0) {
    throw AssemblyError("unsupported PNG (bit_depth=" +
                        std::to_string(parsed.bit_depth) + ", color_type=" +
                        std::to_string(parsed.color_type) + ", interlace=" +
                        std::to_string(parsed.interlace) +
                        "), need 8-bit RGB");
  }
  images_.push_back(std::move(parsed));
  content_ << "q " << w << " 0 0 " << h << ' ' << x << ' ' << y << " cm /Im"
           << images_.size() << " Do Q\n";
}

std::string PdfDocument::build() const {
  std::ostringstream out;
  out.imbue(std::locale::classic());
  std::vector<size_t> offsets;  // offsets[i] = byte offset of object i+1

  auto begin_object = [&]() {
    offsets.push_back(static_cast<size_t>(out.tellp()));
    out << offsets.size() << " 0 obj\n";
  };

  // Object numbering: 1 catalog, 2 pages, 3 page, 4 content, 5-7 fonts,
  // 8 info, 9.. images
  const size_t first_image = 9;

  out << "%PDF-1.4\n%\xE2\xE3\xCF\xD3\n";

  begin_object();
  out << "<< /Type /Catalog /Pages 2 0 R >>\nendobj\n";

  begin_object();
  out << "<< /Type /Pages /Kids [3 0 R] /Count 1 >>\nendobj\n";

  begin_object();
  out << std::fixed << std::setprecision(2);
  out << "<< /Type /Page /Parent 2 0 R /MediaBox [0 0 " << page_width_ << ' '
      << page_height_ << "] /Contents 4 0 R /Resources << /Font << /F1 5 0 R "
      << "/F2 6 0 R /F3 7 0 R >>";
  if (!images_.empty()) {
    out << " /XObject <<";
    for (size_t i = 0; i < images_.size(); ++i) {
      out << " /Im" << (i + 1) << ' ' << (first_image + i) << " 0 R";
    }
    out << " >>";
  }
  out << " >> >>\nendobj\n";

  const std::string content = content_.str();
  begin_object();
  out << "<< /Length " << content.size() << " >>\nstream\n"
      << content << "\nendstream\nendobj\n";

  const char* fonts[] = {"Helvetica", "Helvetica-Bold", "Helvetica-Oblique"};
  for (const char* name : fonts) {
    begin_object();
    out << "<< /Type /Font /Subtype /Type1 /BaseFont /" << name
        << " /Encoding /WinAnsiEncoding >>\nendobj\n";
  }

  begin_object();
  out << "<< /Producer (cloudreport)";
  if (!title_.empty()) out << " /Title (" << detail::escapeText(title_) << ")";
  out << " >>\nendobj\n";

  for (const auto& img : images_) {
    begin_object();
    out << "<< /Type /XObject /Subtype /Image /Width " << img.width
        << " /Height " << img.height
        << " /ColorSpace /DeviceRGB /BitsPerComponent 8 /Filter /FlateDecode"
        << " /DecodeParms << /Predictor 15 /Colors 3 /BitsPerComponent 8"
        << " /Columns " << img.width << " >> /Length " << img.idat.size()
        << " >>\nstream\n";
    out.write(reinterpret_cast<const char*>(img.idat.data()),
              static_cast<std::streamsize>(img.idat.size()));
    out << "\nendstream\nendobj\n";
  }

  const size_t xref_offset = static_cast<size_t>(out.tellp());
  out << "xref\n0 " << (offsets.size() + 1) << "\n";
  out << "0000000000 65535 f \n";
  char entry[32];
  for (size_t off : offsets) {
    std::snprintf(entry, sizeof(entry), "%010zu 00000 n \n", off);
    out << entry;
  }
  out << "trailer\n<< /Size " << (offsets.size() + 1)
      << " /Root 1 0 R /Info 8 0 R >>\nstartxref\n"
      << xref_offset << "\n%%EOF\n";

  return out.str();
}

size_t PdfDocument::save(const std::string& filename) const {
  const std::string data = build();

  std::ofstream file(filename, std::ios::binary | std::ios::trunc);
  if (!file.is_open()) {
    throw AssemblyError("cannot create " + filename);
  }
  file.write(data.data(), static_cast<std::streamsize>(data.size()));
  file.close();
  if (file.fail()) {
    throw AssemblyError("write failed for " + filename);
  }

  spdlog::debug("[Report] Wrote {} bytes ({} images) to {}", data.size(),
                images_.size(), filename);
  return data.size();
}

}  // namespace pdf
}  // namespace cloudreport
