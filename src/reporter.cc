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

#include "qsema/reporter.h"

#include <fmt/core.h>

#include <cstdio>
#include <string_view>

#include "qsema/diagnostics.h"

namespace qsema {

Reporter::~Reporter() = default;

void ConsoleReporter::report_error(const Diagnostic& diagnostic) {
  fmt::print(out_, "{}: error: [{}] {}\n", diagnostic.location,
             diagnostic.kind ? ErrorKindText(*diagnostic.kind) : "Error",
             diagnostic.message);
}

void ConsoleReporter::report_warning(const Diagnostic& diagnostic) {
  fmt::print(out_, "{}: warning: {}\n", diagnostic.location,
             diagnostic.message);
}

void ConsoleReporter::report_info(std::string_view text) {
  fmt::print(out_, "{}", text);
  std::fflush(out_);
}

}  // namespace qsema
