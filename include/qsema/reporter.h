// Copyright 2023 Matt Rudary

// Licensed under the Apache License, Version 2.0 (the "License");
// you may not use this file except in compliance with the License.
// You may obtain a copy of the License at

//     http://www.apache.org/licenses/LICENSE-2.0

// Unless required by applicable law or agreed to in writing, software
// distributed under the License is distributed on an "AS IS" BASIS,
// WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
// See the License for the specific language governing permissions and
// limitations under the License.

#pragma once

#include <cstdio>
#include <string_view>

namespace qsema {

struct Diagnostic;

/**
 * The diagnostics channel.
 *
 * The checking core never formats or prints anything itself; every
 * rejection and warning is handed to a Reporter as a structured
 * record.
 */
class Reporter {
 public:
  virtual ~Reporter();

  virtual void report_error(const Diagnostic& diagnostic) = 0;
  virtual void report_warning(const Diagnostic& diagnostic) = 0;
  /**
   * This should be used to report information to the user.
   *
   * Examples: the definitions accepted and the specializations
   * produced for them.
   */
  virtual void report_info(std::string_view text) = 0;
};

/** Prints diagnostics as `file:line: error: [Kind] message`. */
class ConsoleReporter : public Reporter {
 public:
  explicit ConsoleReporter(std::FILE* out = stderr) : out_(out) {}

  void report_error(const Diagnostic& diagnostic) override;
  void report_warning(const Diagnostic& diagnostic) override;
  void report_info(std::string_view text) override;

 private:
  std::FILE* out_;
};

}  // namespace qsema
