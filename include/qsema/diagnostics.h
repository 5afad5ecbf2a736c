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

#include <exception>
#include <optional>
#include <string>
#include <vector>

#include "qsema/enum.h"
#include "qsema/location.h"

namespace qsema {

namespace typing {
class UnificationError;
}  // namespace typing

#define QSEMA_ERROR_KIND_LIST(DECLARE, X)  \
  DECLARE(UnknownNameError, X)             \
  DECLARE(DuplicateDefinitionError, X)     \
  DECLARE(TypeMismatchError, X)            \
  DECLARE(InconsistentBindingTypeError, X) \
  DECLARE(UnresolvedParameterError, X)     \
  DECLARE(UseBeforeDefinitionError, X)     \
  DECLARE(UseAfterConsumeError, X)         \
  DECLARE(ResourceLeakError, X)            \
  DECLARE(InconsistentConsumptionError, X) \
  DECLARE(ArityMismatchError, X)           \
  DECLARE(UnresolvedGenericError, X)       \
  DECLARE(RecursiveMonomorphisationError, X)

/** The kinds of user-facing rejection. */
QSEMA_ENUM_WITH_TEXT(ErrorKind, QSEMA_ERROR_KIND_LIST)

#define QSEMA_SEVERITY_LIST(DECLARE, X) \
  DECLARE(Error, X)                     \
  DECLARE(Warning, X)

QSEMA_ENUM_WITH_TEXT(Severity, QSEMA_SEVERITY_LIST)

/** A structured diagnostic record. Formatting is left to the Reporter. */
struct Diagnostic {
  /** Empty for warnings, which have no rejection kind. */
  std::optional<ErrorKind> kind;
  Severity severity = Severity::Error;
  Location location;
  /** The top-level definition being checked, if any. */
  std::string definition;
  std::string message;
  /** Names and printed types involved in the diagnostic. */
  std::vector<std::string> names;
};

/**
 * Error thrown when a definition is rejected.
 *
 * Thrown by the checker, the linearity checker, the signature table
 * and the monomorphiser. Checking of the current definition stops at
 * the first SemanticError.
 */
class SemanticError : public std::exception {
 public:
  SemanticError(ErrorKind kind, std::string msg, const Location& location,
                std::vector<std::string> names = {});
  SemanticError(ErrorKind kind, const typing::UnificationError& err,
                const Location& location, std::vector<std::string> names = {});

  const char* what() const noexcept override { return full_msg.c_str(); }

  /** Converts this error to a diagnostic attributed to `definition`. */
  Diagnostic to_diagnostic(std::string definition) const;

  const ErrorKind kind;
  const std::string msg;
  const Location location;
  const std::vector<std::string> names;
  const std::string full_msg;
};

}  // namespace qsema

QSEMA_ENUM_WITH_TEXT_FORMATTER(qsema::ErrorKind)
QSEMA_ENUM_WITH_TEXT_FORMATTER(qsema::Severity)
