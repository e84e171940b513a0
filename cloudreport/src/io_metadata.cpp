// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

#include "cloudreport/io/metadata.hpp"

#include <spdlog/spdlog.h>

#include <filesystem>
#include <fstream>
#include <system_error>

namespace cloudreport {
namespace io {

namespace fs = std::filesystem;

std::string metadataPathFor(const std::string& cloud_path) {
  fs::path path(cloud_path);
  path.replace_extension(".txt");
  return path.string();
}

std::optional<std::vector<std::string>> readMetadata(const std::string& path) {
  spdlog::info("[Metadata] Checking for metadata file: {}", path);

  std::error_code ec;
  if (!fs::is_regular_file(path, ec)) {
    spdlog::info("[Metadata] No metadata file found");
    return std::nullopt;
  }

  std::ifstream file(path);
  if (!file.is_open()) {
    spdlog::warn("[Metadata] Cannot read metadata file: {}", path);
    return std::nullopt;
  }

  std::vector<std::string> lines;
  std::string line;
  while (std::getline(file, line)) {
    if (!line.empty() && line.back() == '\r') line.pop_back();
    if (line.find_first_not_of(" \t\f\v") == std::string::npos) continue;
    lines.push_back(line);
  }
  if (file.bad()) {
    spdlog::warn("[Metadata] Error reading metadata file: {}", path);
    return std::nullopt;
  }

  spdlog::info("[Metadata] Found {} lines of metadata", lines.size());
  return lines;
}

std::vector<std::string> loadMetadataFor(const std::string& cloud_path) {
  const std::string sidecar = metadataPathFor(cloud_path);

  std::error_code ec;
  if (fs::equivalent(sidecar, cloud_path, ec)) {
    spdlog::debug("[Metadata] Input is its own sidecar, skipping metadata");
    return {};
  }

  auto lines = readMetadata(sidecar);
  return lines ? *lines : std::vector<std::string>{};
}

}  // namespace io
}  // namespace cloudreport
