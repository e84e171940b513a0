// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

/*
 * cloud_report: Analyze an ASCII point cloud and write a one-page PDF report.
 *
 * Pipeline: parse → statistics + NN distance → plots → PDF
 *
 * Usage:
 *   ./cloud_report input.xyz output.pdf [config.yaml]
 *
 * Exactly one line prefixed with JSON_RESULT: is written to stdout for
 * every pipeline run; progress and diagnostics go to stderr.
 *
 * Exit status: 0 success, 1 pipeline failure, 2 usage error.
 */

#include <cloudreport/pipeline.hpp>
#include <iostream>

int main(int argc, char** argv) {
  return cloudreport::runTool(argc, argv, std::cout, std::cerr);
}
