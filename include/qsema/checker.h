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
#include <vector>

#include "qsema/ast.h"  // IWYU pragma: keep
#include "qsema/signatures.h"
#include "qsema/typed_ast.h"  // IWYU pragma: keep
#include "qsema/types.h"

namespace qsema {

/** The signature a function definition is registered under. */
Signature function_signature(const FunctionDef& def);

/**
 * The signature a method is registered under.
 *
 * The method's generic parameters follow those of the struct.
 * Throws a SemanticError of kind DuplicateDefinitionError if a method
 * parameter shadows a struct parameter.
 */
Signature method_signature(const StructDef& owner, const FunctionDef& method);

class CheckerImpl;

/**
 * Performs type checking and inference of definitions.
 *
 * Each definition is elaborated into a typed tree in which every
 * type is resolved with respect to the definition's own generic
 * parameters. Errors are reported by throwing a SemanticError; the
 * first error stops checking of the definition.
 *
 * A Checker reads the signature table but is otherwise independent of
 * other checkers, so separate instances may run concurrently.
 */
class Checker {
 public:
  explicit Checker(const SignatureTable& table);
  ~Checker();

  /** Type check a function definition. */
  std::unique_ptr<TFunction> check_function(const FunctionDef& def);

  /**
   * Type check a struct definition and its methods.
   *
   * Field types may mention only the struct's own generic
   * parameters. Returns the typed methods.
   */
  std::vector<std::unique_ptr<TFunction>> check_struct(const StructDef& def);

 private:
  std::unique_ptr<CheckerImpl> impl_;
};

}  // namespace qsema
