// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

/*
 * errors.hpp
 *
 * Exception hierarchy for the analysis pipeline.
 *
 * Every fatal condition is thrown as a subclass of cloudreport::Error and
 * carries a closed ErrorKind, so the orchestrator can report a stable,
 * matchable error name next to the human-readable message.
 *
 *   Error (base, std::runtime_error)
 *   ├── UsageError       - wrong invocation arity
 *   ├── ParseError       - no valid points extracted from input
 *   ├── ComputationError - statistics undefined for the given input
 *   ├── RenderError      - image encoding failed
 *   ├── AssemblyError    - document could not be written
 *   └── ConfigError      - configuration file invalid or unreadable
 *
 *  Created on: Mar 2025
 *      Author: Ikhyeon Cho
 *   Institute: Korea Univ. ISR (Intelligent Systems & Robotics) Lab
 *       Email: tre0430@korea.ac.kr
 */

#ifndef CLOUDREPORT_ERRORS_HPP
#define CLOUDREPORT_ERRORS_HPP

#include <stdexcept>
#include <string>

namespace cloudreport {

enum class ErrorKind {
  Usage,
  Parse,
  Computation,
  Render,
  Assembly,
  Config,
  Internal  ///< Anything not raised as a cloudreport::Error
};

/// Stable name of an error kind (e.g. "ParseError").
const char* toString(ErrorKind kind) noexcept;

class Error : public std::runtime_error {
 public:
  Error(ErrorKind kind, const std::string& stage, const std::string& message)
      : std::runtime_error("[" + stage + "] " + message),
        kind_(kind),
        stage_(stage),
        message_(message) {}

  ErrorKind kind() const noexcept { return kind_; }
  const std::string& stage() const { return stage_; }
  const std::string& message() const { return message_; }

 private:
  ErrorKind kind_;
  std::string stage_;
  std::string message_;
};

class UsageError : public Error {
 public:
  explicit UsageError(const std::string& message)
      : Error(ErrorKind::Usage, "Usage", message) {}
};

class ParseError : public Error {
 public:
  explicit ParseError(const std::string& message)
      : Error(ErrorKind::Parse, "Parser", message) {}
};

class ComputationError : public Error {
 public:
  explicit ComputationError(const std::string& message)
      : Error(ErrorKind::Computation, "Analysis", message) {}
};

class RenderError : public Error {
 public:
  explicit RenderError(const std::string& message)
      : Error(ErrorKind::Render, "Render", message) {}
};

class AssemblyError : public Error {
 public:
  explicit AssemblyError(const std::string& message)
      : Error(ErrorKind::Assembly, "Report", message) {}
};

class ConfigError : public Error {
 public:
  explicit ConfigError(const std::string& message)
      : Error(ErrorKind::Config, "Config", message) {}
};

}  // namespace cloudreport

#endif  // CLOUDREPORT_ERRORS_HPP
