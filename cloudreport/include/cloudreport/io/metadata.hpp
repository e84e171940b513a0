// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

/*
 * metadata.hpp
 *
 * Optional project metadata stored beside a point cloud as a plain-text
 * sidecar with the same base name (scan.xyz -> scan.txt). Each non-blank
 * line is shown verbatim in the report.
 *
 *  Created on: Mar 2025
 *      Author: Ikhyeon Cho
 *   Institute: Korea Univ. ISR (Intelligent Systems & Robotics) Lab
 *       Email: tre0430@korea.ac.kr
 */

#ifndef CLOUDREPORT_IO_METADATA_HPP
#define CLOUDREPORT_IO_METADATA_HPP

#include <optional>
#include <string>
#include <vector>

namespace cloudreport {
namespace io {

/// Sidecar path for a cloud file: same directory and stem, ".txt" extension.
std::string metadataPathFor(const std::string& cloud_path);

/**
 * @brief Read the non-blank lines of a metadata file.
 *
 * A missing or unreadable file is not an error.
 *
 * @return std::nullopt if the file does not exist or cannot be read
 */
std::optional<std::vector<std::string>> readMetadata(const std::string& path);

/**
 * @brief Metadata for a cloud file, if its sidecar exists.
 *
 * A cloud that is itself named *.txt is its own sidecar path; it is never
 * read back as metadata.
 */
std::vector<std::string> loadMetadataFor(const std::string& cloud_path);

}  // namespace io
}  // namespace cloudreport

#endif  // CLOUDREPORT_IO_METADATA_HPP
