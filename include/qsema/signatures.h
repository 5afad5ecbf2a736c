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

#include <functional>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "qsema/location.h"
#include "qsema/types.h"

namespace qsema {

/** The declared interface of a function, method or operator. */
struct Signature {
  std::string name;
  typing::GenericParams generics;
  std::vector<typing::Param> params;
  typing::TypePtr return_type;
  Location location;

  bool is_generic() const { return !generics.empty(); }

  /** This signature as a (possibly generic) function type. */
  typing::TypePtr function_type() const;
};

/**
 * True if `l` and `r` declare the same interface.
 *
 * Parameter names and locations are ignored.
 */
bool same_signature(const Signature& l, const Signature& r);

/** True if `l` and `r` declare the same struct. */
bool same_struct(const typing::StructDecl& l, const typing::StructDecl& r);

/** The registry name of method `method` of `owner` ("Owner.method"). */
std::string method_name(std::string_view owner, std::string_view method);

/** The method implementing a binary operator, e.g. "+" -> "__add__". */
std::optional<std::string_view> binary_operator_method(std::string_view op);

/** The method implementing a unary operator, e.g. "not" -> "__not__". */
std::optional<std::string_view> unary_operator_method(std::string_view op);

/**
 * Maps names to signatures and struct declarations.
 *
 * The table is filled during a registration phase and then
 * finalized. After finalization it is only read, so it may be shared
 * by concurrent checkers.
 */
class SignatureTable {
 public:
  SignatureTable();

  /**
   * Registers a signature.
   *
   * Registering an equal signature under an existing name is a no-op;
   * any other reuse of a name throws a SemanticError of kind
   * DuplicateDefinitionError.
   */
  void add(Signature signature);

  /**
   * Registers a struct declaration together with its constructor,
   * which has the struct's name and one owned parameter per field.
   */
  void add_struct(typing::StructDeclPtr decl, Location location = {});

  /** Throws a SemanticError of kind UnknownNameError if absent. */
  const Signature& lookup(std::string_view name,
                          const Location& location = {}) const;
  const Signature* find(std::string_view name) const;

  /** Throws a SemanticError of kind UnknownNameError if absent. */
  const typing::StructDeclPtr& lookup_struct(
      std::string_view name, const Location& location = {}) const;
  typing::StructDeclPtr find_struct(std::string_view name) const;

  /**
   * Finds method `method` of the type of `receiver`, which must be a
   * primitive or struct type.
   */
  const Signature* find_method(const typing::TypePtr& receiver,
                               std::string_view method) const;

  /** Ends the registration phase. */
  void finalize() { finalized_ = true; }
  bool finalized() const { return finalized_; }

  std::size_t size() const { return signatures_.size(); }

 private:
  std::map<std::string, Signature, std::less<>> signatures_;
  std::map<std::string, typing::StructDeclPtr, std::less<>> structs_;
  bool finalized_ = false;

  void check_open(std::string_view name) const;
};

/** Registers the built-in functions, operators and conversions. */
void install_prelude(SignatureTable& table);

}  // namespace qsema
