// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

/*
 * pipeline.hpp
 *
 * cloudreport: parse -> statistics -> plots -> PDF, as one batch run with
 * a structured, machine-readable outcome.
 *
 *  Created on: Mar 2025
 *      Author: Ikhyeon Cho
 *   Institute: Korea Univ. ISR (Intelligent Systems & Robotics) Lab
 *       Email: tre0430@korea.ac.kr
 */

#ifndef CLOUDREPORT_PIPELINE_HPP
#define CLOUDREPORT_PIPELINE_HPP

#include <cstddef>
#include <functional>
#include <optional>
#include <ostream>
#include <string>

#include "cloudreport/config/cloudreport.hpp"
#include "cloudreport/errors.hpp"

namespace cloudreport {

/// Prefix of the single result line written to stdout.
constexpr auto kResultPrefix = "JSON_RESULT:";

constexpr int kExitSuccess = 0;
constexpr int kExitFailure = 1;
constexpr int kExitUsage = 2;

/// Positional arguments: <input> <output> [config.yaml].
struct CommandLine {
  std::string input_path;
  std::string output_path;
  std::optional<std::string> config_path;
};

/// @throws UsageError unless 2 or 3 positional arguments are given
CommandLine parseCommandLine(int argc, const char* const* argv);

struct PipelineOptions {
  std::string input_path;
  std::string output_path;
  Config config;
};

/**
 * @brief Outcome of one pipeline run.
 *
 * Success carries the artifact fields; failure carries error_kind and
 * message. point_count is always the parsed cloud size, never a
 * visualization-downsampled count.
 */
struct PipelineResult {
  bool success = false;

  std::optional<std::string> output_file;
  std::optional<size_t> file_size_bytes;
  std::optional<size_t> point_count;
  std::optional<size_t> skipped_lines;
  bool size_warning = false;  ///< Artifact exceeds the size budget

  std::optional<ErrorKind> error_kind;
  std::optional<std::string> message;

  static PipelineResult failure(ErrorKind kind, const std::string& message);
};

/**
 * @brief Run the whole pipeline. Never throws: every failure is returned
 *        as a PipelineResult with success == false.
 */
PipelineResult runPipeline(const PipelineOptions& options) noexcept;

/// Run `stage`, mapping anything it throws to a failed PipelineResult.
PipelineResult runGuarded(
    const std::function<PipelineResult()>& stage) noexcept;

/**
 * @brief Command-line entry point.
 *
 * Writes usage help and diagnostics to `err`. Every run that gets past
 * argument parsing writes exactly one result line to `out`.
 *
 * @return kExitSuccess, kExitFailure or kExitUsage
 */
int runTool(int argc, const char* const* argv, std::ostream& out,
            std::ostream& err);

/// Megabytes (1024^2) rounded to 2 decimals.
double toMegabytes(size_t bytes);

/// JSON object for the result channel.
std::string toJson(const PipelineResult& result);

/// kResultPrefix + toJson(result).
std::string formatResultLine(const PipelineResult& result);

}  // namespace cloudreport

#endif  // CLOUDREPORT_PIPELINE_HPP
