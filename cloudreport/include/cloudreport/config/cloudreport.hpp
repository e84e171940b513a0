// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

#ifndef CLOUDREPORT_CONFIG_CLOUDREPORT_HPP
#define CLOUDREPORT_CONFIG_CLOUDREPORT_HPP

#include <string>

namespace YAML {
class Node;
}

#include "cloudreport/config/analysis.hpp"
#include "cloudreport/config/render.hpp"
#include "cloudreport/config/report.hpp"

namespace cloudreport {

/// Pipeline configuration for cloudreport.
struct Config {
  config::NeighborSearch neighbor_search;
  config::Render render;
  config::Report report;
  std::string log_level = "info";
};

/// Parse and validate. Throws ConfigError on values that cannot be clamped.
Config parseConfig(const YAML::Node& root);

/// Load from a YAML file. Throws ConfigError if unreadable or invalid.
Config loadConfig(const std::string& path);

}  // namespace cloudreport

#endif  // CLOUDREPORT_CONFIG_CLOUDREPORT_HPP
