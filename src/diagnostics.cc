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

#include "qsema/diagnostics.h"

#include <fmt/core.h>
#include <fmt/format.h>

#include <string>
#include <utility>
#include <vector>

#include "qsema/types.h"

namespace qsema {

SemanticError::SemanticError(ErrorKind kind, std::string msg,
                             const Location& location,
                             std::vector<std::string> names)
    : kind(kind),
      msg(std::move(msg)),
      location(location),
      names(std::move(names)),
      full_msg(fmt::format("{}: error: [{}] {}", this->location, kind,
                           this->msg)) {}

SemanticError::SemanticError(ErrorKind kind,
                             const typing::UnificationError& err,
                             const Location& location,
                             std::vector<std::string> names)
    : SemanticError(kind, fmt::format("Unification error: {}", err.what()),
                    location, std::move(names)) {}

Diagnostic SemanticError::to_diagnostic(std::string definition) const {
  return Diagnostic{.kind = kind,
                    .severity = Severity::Error,
                    .location = location,
                    .definition = std::move(definition),
                    .message = msg,
                    .names = names};
}

}  // namespace qsema
