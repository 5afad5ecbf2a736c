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

#include <cstddef>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <vector>

#include "qsema/location.h"
#include "qsema/signatures.h"
#include "qsema/typed_ast.h"
#include "qsema/types.h"

namespace qsema {

/** A definition name together with closed generic arguments. */
struct InstantiationKey {
  std::string name;
  typing::TypeList type_args;
  std::vector<typing::Nat> nat_args;

  /** Prints as `name[T1, T2; n1]`, or just `name` with no arguments. */
  std::string str() const;
};

/** A function or method specialized to closed generic arguments. */
struct ConcreteDefinition {
  std::string key;
  /** The typed tree with every type closed. */
  std::unique_ptr<const TFunction> function;
  /** Keys of the specialized definitions it calls, in order of first call. */
  std::vector<std::string> callees;
  /** Keys of the struct specializations its types mention. */
  std::vector<std::string> structs;
};

/** A struct specialized to closed generic arguments. */
struct ConcreteStruct {
  std::string key;
  std::string name;
  typing::TypeList type_args;
  std::vector<typing::Nat> nat_args;
  std::vector<typing::Field> fields;
  typing::OwnershipClass ownership;
};

/**
 * Produces closed specializations of checked definitions.
 *
 * Specializing a definition rewrites its whole typed tree and
 * specializes every definition it calls, recursively. Calls of
 * functions without a checked body, such as built-ins and struct
 * constructors, are recorded by key but not expanded.
 *
 * Results are cached by key and immutable once published, so a
 * Monomorphiser may be shared between threads. Concurrent requests
 * for the same key may both compute it; the first result stored wins.
 */
class Monomorphiser {
 public:
  Monomorphiser(const SignatureTable& table,
                std::vector<std::shared_ptr<const TFunction>> definitions);

  /**
   * Specializes the function or method registered as `name`.
   *
   * Throws a SemanticError of kind UnknownNameError if there is no
   * checked definition, ArityMismatchError if the argument counts are
   * wrong, UnresolvedGenericError if an argument is not closed,
   * TypeMismatchError if an argument violates a parameter bound and
   * RecursiveMonomorphisationError if the specialization re-enters a
   * definition already in progress.
   */
  std::shared_ptr<const ConcreteDefinition> specialize(
      const std::string& name, const typing::TypeList& type_args = {},
      const std::vector<typing::Nat>& nat_args = {},
      const Location& location = Location{"<specialize>", 0});

  /** Specializes the struct `name`. Errors are as for specialize. */
  std::shared_ptr<const ConcreteStruct> specialize_struct(
      const std::string& name, const typing::TypeList& type_args = {},
      const std::vector<typing::Nat>& nat_args = {},
      const Location& location = Location{"<specialize>", 0});

  /** Returns a cached specialization, or nullptr. */
  std::shared_ptr<const ConcreteDefinition> find(std::string_view key) const;
  std::shared_ptr<const ConcreteStruct> find_struct(std::string_view key) const;

  std::size_t size() const;

 private:
  class Specializer;

  const SignatureTable& table_;
  std::map<std::string, std::shared_ptr<const TFunction>, std::less<>>
      definitions_;

  mutable std::mutex mutex_;
  std::map<std::string, std::shared_ptr<const ConcreteDefinition>, std::less<>>
      cache_;
  std::map<std::string, std::shared_ptr<const ConcreteStruct>, std::less<>>
      struct_cache_;

  std::shared_ptr<const ConcreteDefinition> publish(
      std::shared_ptr<const ConcreteDefinition> result);
  std::shared_ptr<const ConcreteStruct> publish(
      std::shared_ptr<const ConcreteStruct> result);
};

}  // namespace qsema
