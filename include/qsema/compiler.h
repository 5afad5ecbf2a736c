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

#include <memory>
#include <string_view>
#include <vector>

#include "qsema/ast.h"  // IWYU pragma: keep
#include "qsema/diagnostics.h"
#include "qsema/reporter.h"
#include "qsema/signatures.h"
#include "qsema/typed_ast.h"
#include "qsema/types.h"

namespace qsema {

struct CheckOptions {
  /** Check independent definitions concurrently. */
  bool parallel = false;
  /** Run definite-assignment and linearity analysis after typing. */
  bool run_linearity = true;
};

/** The outcome of checking a compilation unit. */
struct CheckedProgram {
  /** The finalized table the definitions were checked against. */
  std::shared_ptr<const SignatureTable> table;
  /** Accepted functions and methods, in definition order. */
  std::vector<std::shared_ptr<const TFunction>> functions;
  /** Accepted structs, in definition order. */
  std::vector<typing::StructDeclPtr> structs;
  /** Every diagnostic produced, in definition order. */
  std::vector<Diagnostic> diagnostics;

  /** Whether no definition was rejected. */
  bool ok() const;

  /** Finds an accepted function or method by its registered name. */
  const TFunction* find(std::string_view qualified_name) const;
};

/**
 * Checks a compilation unit.
 *
 * All definition headers are registered in a signature table together
 * with the prelude, then each definition is checked on its own. An
 * error rejects only the definition it occurs in; checking continues
 * with the next one. Diagnostics are handed to the reporter in
 * definition order.
 */
class Compiler {
 public:
  explicit Compiler(Reporter& reporter, CheckOptions options = {});

  CheckedProgram check(const std::vector<std::unique_ptr<Def>>& defs);

 private:
  Reporter& reporter_;
  const CheckOptions options_;
};

}  // namespace qsema
