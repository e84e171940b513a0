// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

#include "cloudreport/errors.hpp"

namespace cloudreport {

const char* toString(ErrorKind kind) noexcept {
  switch (kind) {
    case ErrorKind::Usage:
      return "UsageError";
    case ErrorKind::Parse:
      return "ParseError";
    case ErrorKind::Computation:
      return "ComputationError";
    case ErrorKind::Render:
      return "RenderError";
    case ErrorKind::Assembly:
      return "AssemblyError";
    case ErrorKind::Config:
      return "ConfigError";
    case ErrorKind::Internal:
    default:
      return "InternalError";
  }
}

}  // namespace cloudreport
