// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

/*
 * pipeline.cpp
 *
 *  Created on: Mar 2025
 *      Author: Ikhyeon Cho
 *   Institute: Korea Univ. ISR (Intelligent Systems & Robotics) Lab
 *       Email: tre0430@korea.ac.kr
 */

#include "cloudreport/pipeline.hpp"

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <cmath>
#include <cstdio>
#include <filesystem>
#include <locale>
#include <sstream>

#include "cloudreport/analysis/statistics_engine.hpp"
#include "cloudreport/io/metadata.hpp"
#include "cloudreport/io/xyz.hpp"
#include "cloudreport/render/renderer.hpp"
#include "cloudreport/report/report.hpp"

namespace cloudreport {

namespace detail {

std::string escapeJson(const std::string& s) {
  std::string out;
  out.reserve(s.size());
  for (unsigned char c : s) {
    switch (c) {
      case '"':
        out += "\\\"";
        break;
      case '\\':
        out += "\\\\";
        break;
      case '\n':
        out += "\\n";
        break;
      case '\r':
        out += "\\r";
        break;
      case '\t':
        out += "\\t";
        break;
      default:
        if (c < 0x20) {
          char buf[8];
          std::snprintf(buf, sizeof(buf), "\\u%04x", c);
          out += buf;
        } else {
          out.push_back(static_cast<char>(c));
        }
    }
  }
  return out;
}

PipelineResult run(const PipelineOptions& options) {
  const auto& cfg = options.config;

  // Parse
  io::ParseStats parse_stats;
  const PointSet points = io::loadXyz(options.input_path, &parse_stats);

  // Statistics
  StatisticsEngine engine(cfg.neighbor_search);
  AnalysisResult analysis;
  analysis.statistics = engine.compute(points);
  analysis.metadata = io::loadMetadataFor(options.input_path);

  // Plots (scatter downsampling reuses the NN seed, so one seed replays
  // the whole run)
  RenderContext renderer(cfg.render);
  analysis.histogram = renderer.renderHistogram(points);
  analysis.scatter =
      renderer.renderScatter(points, analysis.statistics.neighbor.seed);

  // Document
  const std::string source_name =
      std::filesystem::path(options.input_path).filename().string();
  const auto artifact = assembleReport(cfg.report, analysis, source_name,
                                       options.output_path);

  PipelineResult result;
  result.success = true;
  result.output_file = artifact.path;
  result.file_size_bytes = artifact.size_bytes;
  result.point_count = points.size();
  result.skipped_lines = parse_stats.lines_skipped;
  result.size_warning = artifact.sizeMb() > cfg.report.size_budget_mb;
  if (result.size_warning) {
    spdlog::warn("[Pipeline] File size {:.2f} MB exceeds the {:.2f} MB budget",
                 artifact.sizeMb(), cfg.report.size_budget_mb);
  }
  return result;
}

}  // namespace detail

CommandLine parseCommandLine(int argc, const char* const* argv) {
  if (argc < 3) {
    throw UsageError("expected <input_file> <output_file>, got " +
                     std::to_string(argc < 1 ? 0 : argc - 1) + " argument(s)");
  }
  if (argc > 4) {
    throw UsageError("too many arguments (" + std::to_string(argc - 1) + ")");
  }

  CommandLine cmd;
  cmd.input_path = argv[1];
  cmd.output_path = argv[2];
  if (argc == 4) cmd.config_path = argv[3];
  return cmd;
}

PipelineResult PipelineResult::failure(ErrorKind kind,
                                       const std::string& message) {
  PipelineResult result;
  result.success = false;
  result.error_kind = kind;
  result.message = message;
  return result;
}

PipelineResult runGuarded(
    const std::function<PipelineResult()>& stage) noexcept {
  try {
    return stage();
  } catch (const Error& e) {
    spdlog::error("{}", e.what());
    return PipelineResult::failure(e.kind(), e.message());
  } catch (const std::exception& e) {
    spdlog::error("[Pipeline] {}", e.what());
    return PipelineResult::failure(ErrorKind::Internal, e.what());
  } catch (...) {
    spdlog::error("[Pipeline] Unknown exception");
    return PipelineResult::failure(ErrorKind::Internal, "unknown error");
  }
}

PipelineResult runPipeline(const PipelineOptions& options) noexcept {
  return runGuarded([&options] { return detail::run(options); });
}

int runTool(int argc, const char* const* argv, std::ostream& out,
            std::ostream& err) {
  CommandLine cmd;
  try {
    cmd = parseCommandLine(argc, argv);
  } catch (const UsageError& e) {
    err << "Usage: cloud_report <input_file> <output_file> [config.yaml]\n"
        << "  input_file:  XYZ/TXT/CSV point cloud (x y z per line)\n"
        << "  output_file: PDF report to write\n"
        << "  config.yaml: optional settings (see config/default.yaml)\n"
        << "error: " << e.message() << "\n";
    return kExitUsage;
  }

  // Reuse the logger when called more than once in a process
  auto logger = spdlog::get("cloudreport");
  if (!logger) {
    logger = spdlog::stderr_color_mt("cloudreport");
    logger->set_pattern("[%H:%M:%S.%e] [%^%l%$] %v");
  }
  spdlog::set_default_logger(logger);

  PipelineOptions options;
  options.input_path = cmd.input_path;
  options.output_path = cmd.output_path;

  if (cmd.config_path) {
    const auto loaded = runGuarded([&] {
      options.config = loadConfig(*cmd.config_path);
      PipelineResult ok;
      ok.success = true;
      return ok;
    });
    if (!loaded.success) {
      out << formatResultLine(loaded) << std::endl;
      return kExitFailure;
    }
  }
  spdlog::set_level(spdlog::level::from_str(options.config.log_level));

  spdlog::info("============================================================");
  spdlog::info("POINT CLOUD ANALYSIS AND REPORT GENERATION");
  spdlog::info("============================================================");

  const auto result = runPipeline(options);

  if (result.success) {
    spdlog::info("============================================================");
    spdlog::info("REPORT GENERATION COMPLETED SUCCESSFULLY");
    spdlog::info("============================================================");
  } else {
    err << "ERROR: " << result.message.value_or("unknown error") << "\n";
  }

  out << formatResultLine(result) << std::endl;
  return result.success ? kExitSuccess : kExitFailure;
}

double toMegabytes(size_t bytes) {
  return std::round(bytes / (1024.0 * 1024.0) * 100.0) / 100.0;
}

std::string toJson(const PipelineResult& result) {
  std::ostringstream json;
  json.imbue(std::locale::classic());
  json << "{\"success\": " << (result.success ? "true" : "false");

  if (result.success) {
    if (result.output_file) {
      json << ", \"output_file\": \"" << detail::escapeJson(*result.output_file)
           << "\"";
    }
    if (result.file_size_bytes) {
      json << ", \"file_size_mb\": " << toMegabytes(*result.file_size_bytes);
    }
    if (result.point_count) {
      json << ", \"point_count\": " << *result.point_count;
    }
    if (result.skipped_lines) {
      json << ", \"skipped_lines\": " << *result.skipped_lines;
    }
    json << ", \"size_warning\": " << (result.size_warning ? "true" : "false");
  } else {
    json << ", \"error\": \""
         << toString(result.error_kind.value_or(ErrorKind::Internal)) << "\"";
    json << ", \"message\": \"" << detail::escapeJson(result.message.value_or(""))
         << "\"";
  }

  json << "}";
  return json.str();
}

std::string formatResultLine(const PipelineResult& result) {
  return std::string(kResultPrefix) + toJson(result);
}

}  // namespace cloudreport
