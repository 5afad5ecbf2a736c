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

#include <fmt/format.h>

#include <string>

namespace qsema {

/**
 * The source position of a syntax tree node.
 *
 * Assigned by the front end that registers definitions. The checker
 * never interprets it; it is only threaded through to diagnostics.
 */
struct Location {
  std::string filename;
  int line = 0;
};

inline bool operator==(const Location& l, const Location& r) {
  return l.filename == r.filename && l.line == r.line;
}

}  // namespace qsema

template <>
struct fmt::formatter<qsema::Location> : formatter<std::string> {
  template <typename FormatContext>
  auto format(const qsema::Location& loc, FormatContext& ctx) const {
    return formatter<std::string>::format(
        fmt::format("{}:{}", loc.filename.empty() ? "<unknown>" : loc.filename,
                    loc.line),
        ctx);
  }
};
