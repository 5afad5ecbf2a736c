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

#include <vector>

#include "qsema/diagnostics.h"
#include "qsema/enum.h"
#include "qsema/typed_ast.h"
#include "qsema/types.h"

namespace qsema {

#define QSEMA_BINDING_STATE_LIST(DECLARE, X) \
  DECLARE(Undefined, X)                      \
  DECLARE(Defined, X)                        \
  DECLARE(MaybeDefined, X)                   \
  DECLARE(Consumed, X)

/**
 * The state of a local binding at a program point.
 *
 * MaybeDefined arises only for non-Linear bindings defined on some but
 * not all paths into a merge.
 */
QSEMA_ENUM_WITH_TEXT(BindingState, QSEMA_BINDING_STATE_LIST)

/**
 * Definite-assignment and ownership analysis of typed functions.
 *
 * Tracks the state of every local binding along each control-flow
 * path. Linear values must be consumed exactly once on every path;
 * Affine values may be dropped but are consumed at most once.
 *
 * Projections are tracked at the granularity of the root binding:
 * moving a field or element out of a place consumes the whole binding,
 * and is rejected if it would leave a Linear value behind.
 */
class LinearityChecker {
 public:
  /**
   * Analyses `fn`.
   *
   * Throws a SemanticError on the first violation. Returns the
   * warnings produced, such as unreachable statements, which are not
   * analysed.
   */
  std::vector<Diagnostic> check(const TFunction& fn);

 private:
  typing::OwnershipClassifier classifier_;
};

}  // namespace qsema

QSEMA_ENUM_WITH_TEXT_FORMATTER(qsema::BindingState)
