// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

/*
 * analysis.hpp
 *
 * Statistics engine configuration: nearest-neighbor working set size and
 * sampling seed.
 *
 *  Created on: Mar 2025
 *      Author: Ikhyeon Cho
 *   Institute: Korea Univ. ISR (Intelligent Systems & Robotics) Lab
 *       Email: tre0430@korea.ac.kr
 */

#ifndef CLOUDREPORT_CONFIG_ANALYSIS_HPP
#define CLOUDREPORT_CONFIG_ANALYSIS_HPP

#include <cstddef>
#include <cstdint>
#include <optional>

namespace cloudreport::config {

/**
 * @brief Average nearest-neighbor distance parameters.
 *
 * Clouds larger than sample_size are reduced to a uniform random subset of
 * exactly sample_size points. Without a seed the subset (and therefore the
 * metric) differs between runs; set one to make a run reproducible.
 */
struct NeighborSearch {
  size_t sample_size = 1000;
  std::optional<uint64_t> seed;
};

}  // namespace cloudreport::config

#endif  // CLOUDREPORT_CONFIG_ANALYSIS_HPP
