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
#include <cstdint>
#include <exception>
#include <map>
#include <memory>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>
#include <vector>

#include "qsema/enum.h"

/**
 * @file types.h
 *
 * @brief The type algebra used during static analysis of programs.
 *
 * Types are immutable and shared between the signature table, the
 * typed trees produced by the checker and the specializations
 * produced by the monomorphiser. A type may mention three kinds of
 * variables:
 *
 * - type variables and nat variables, which are the generic
 *   parameters of a definition and are replaced by `instantiate`;
 * - undetermined types and undetermined nats, which are created
 *   during inference and are replaced by `apply_substitutions`.
 *
 * A type that mentions none of these is *closed*.
 */

namespace qsema::typing {

#define QSEMA_OWNERSHIP_CLASS_LIST(DECLARE, X) \
  DECLARE(Copyable, X)                         \
  DECLARE(Affine, X)                           \
  DECLARE(Linear, X)

/**
 * How values of a type may be used.
 *
 * Copyable values may be copied and dropped, Affine values may be
 * dropped but not copied, and Linear values must be used exactly
 * once. The enumerators are ordered from least to most restrictive.
 */
QSEMA_ENUM_WITH_TEXT(OwnershipClass, QSEMA_OWNERSHIP_CLASS_LIST)

#define QSEMA_OWNERSHIP_LIST(DECLARE, X) \
  DECLARE(Borrowed, X)                   \
  DECLARE(Owned, X)

/** How a function parameter receives its argument. */
QSEMA_ENUM_WITH_TEXT(Ownership, QSEMA_OWNERSHIP_LIST)

/** Generates ids for undetermined types and nats. */
class StampGenerator {
 public:
  StampGenerator() = default;

  std::uint64_t operator()() { return next_id_++; }

 private:
  std::uint64_t next_id_ = 1;

  StampGenerator(const StampGenerator&) = delete;
  StampGenerator& operator=(const StampGenerator&) = delete;
};

/**
 * A compile-time natural number, such as an array length.
 *
 * A nat is either a constant, a nat variable (a generic parameter of
 * a definition) or an undetermined nat created during inference.
 */
class Nat {
 public:
  enum class Kind { Constant, Variable, Undetermined };

  static Nat constant(std::uint64_t value);
  static Nat variable(std::string name);
  static Nat undetermined(std::uint64_t stamp);
  static Nat undetermined(StampGenerator& stamper);

  Kind kind() const { return kind_; }
  bool is_constant() const { return kind_ == Kind::Constant; }
  bool is_variable() const { return kind_ == Kind::Variable; }
  bool is_undetermined() const { return kind_ == Kind::Undetermined; }

  /** is_constant() must be true. */
  std::uint64_t value() const;
  /** is_variable() must be true. */
  const std::string& name() const;
  /** is_undetermined() must be true. */
  std::uint64_t stamp() const;

  friend bool operator==(const Nat& l, const Nat& r) = default;

 private:
  Nat(Kind kind, std::uint64_t value, std::string name)
      : kind_(kind), value_(value), name_(std::move(name)) {}

  Kind kind_;
  std::uint64_t value_;
  std::string name_;
};

class Type;
using TypePtr = std::shared_ptr<const Type>;
using TypeList = std::vector<TypePtr>;

/**
 * A generic type parameter.
 *
 * The flags bound the types that may instantiate the parameter:
 * a copyable parameter only accepts Copyable types, a droppable one
 * accepts Copyable or Affine types, and a parameter that is neither
 * accepts any type.
 */
struct TypeParam {
  std::string name;
  bool copyable = true;
  bool droppable = true;

  friend bool operator==(const TypeParam& l, const TypeParam& r) = default;
};

/** The ordered generic parameters of a definition. */
struct GenericParams {
  std::vector<TypeParam> types;
  std::vector<std::string> nats;

  bool empty() const { return types.empty() && nats.empty(); }
  const TypeParam* find_type(std::string_view name) const;
  bool has_nat(std::string_view name) const;

  friend bool operator==(const GenericParams& l,
                         const GenericParams& r) = default;
};

/** The variables mentioned by a type. */
struct FreeVariables {
  std::set<std::string> type_variables;
  std::set<std::string> nat_variables;
  std::set<std::uint64_t> undetermined_types;
  std::set<std::uint64_t> undetermined_nats;

  void merge(const FreeVariables& other);
  void add(const Nat& n);
  bool empty() const {
    return type_variables.empty() && nat_variables.empty() &&
           undetermined_types.empty() && undetermined_nats.empty();
  }
  bool has_undetermined() const {
    return !undetermined_types.empty() || !undetermined_nats.empty();
  }
};

class PrimitiveType;
class TypeVar;
class UndeterminedType;
class TupleType;
class ArrayType;
class StructType;
class FunctionType;
class OptionType;

class TypeVisitor {
 public:
  virtual ~TypeVisitor();
  virtual void visit(const PrimitiveType& t) = 0;
  virtual void visit(const TypeVar& t) = 0;
  virtual void visit(const UndeterminedType& t) = 0;
  virtual void visit(const TupleType& t) = 0;
  virtual void visit(const ArrayType& t) = 0;
  virtual void visit(const StructType& t) = 0;
  virtual void visit(const FunctionType& t) = 0;
  virtual void visit(const OptionType& t) = 0;
};

class Type {
 public:
  virtual ~Type();

  const FreeVariables& free_variables() const { return free_variables_; }

  /** True iff no type, nat or undetermined variable is mentioned. */
  bool is_closed() const { return free_variables_.empty(); }

  virtual void accept(TypeVisitor& v) const = 0;

 protected:
  explicit Type(FreeVariables free_variables);

 private:
  const FreeVariables free_variables_;
};

/**
 * A built-in leaf type.
 *
 * Leaves are the only types whose ownership class is stated rather
 * than derived.
 */
class PrimitiveType : public Type {
 public:
  PrimitiveType(std::string name, OwnershipClass ownership);

  const std::string& name() const { return name_; }
  OwnershipClass ownership() const { return ownership_; }

  void accept(TypeVisitor& v) const override { v.visit(*this); }

 private:
  const std::string name_;
  const OwnershipClass ownership_;
};

/** A generic type parameter mentioned in a type. */
class TypeVar : public Type {
 public:
  explicit TypeVar(TypeParam param);

  const std::string& name() const { return param_.name; }
  const TypeParam& param() const { return param_; }

  void accept(TypeVisitor& v) const override { v.visit(*this); }

 private:
  const TypeParam param_;
};

/** An as-yet undetermined type, produced during type inference. */
class UndeterminedType : public Type {
 public:
  explicit UndeterminedType(std::uint64_t stamp);
  explicit UndeterminedType(StampGenerator& stamper);

  std::uint64_t stamp() const { return stamp_; }
  std::string name() const;

  void accept(TypeVisitor& v) const override { v.visit(*this); }

 private:
  const std::uint64_t stamp_;
};

/** A tuple of the given types. */
class TupleType : public Type {
 public:
  explicit TupleType(TypeList types);

  const TypeList& types() const { return types_; }

  void accept(TypeVisitor& v) const override { v.visit(*this); }

 private:
  const TypeList types_;
};

/** A fixed-length array. */
class ArrayType : public Type {
 public:
  ArrayType(TypePtr element, Nat length);

  const TypePtr& element() const { return element_; }
  const Nat& length() const { return length_; }

  void accept(TypeVisitor& v) const override { v.visit(*this); }

 private:
  const TypePtr element_;
  const Nat length_;
};

struct Field {
  std::string name;
  TypePtr type;
};

/**
 * The declaration of a (possibly generic) struct.
 *
 * Field types may mention the struct's own generic parameters and
 * nothing else. Field ownership is never declared; it is derived
 * from the field types.
 */
class StructDecl {
 public:
  StructDecl(std::string name, GenericParams params, std::vector<Field> fields);

  const std::string& name() const { return name_; }
  const GenericParams& params() const { return params_; }
  const std::vector<Field>& fields() const { return fields_; }

  /** Returns the index of the named field, if it exists. */
  std::optional<std::size_t> field_index(std::string_view name) const;

  /** The field types with the generic parameters replaced by arguments. */
  std::vector<Field> instantiate_fields(const TypeList& type_args,
                                        const std::vector<Nat>& nat_args) const;

 private:
  const std::string name_;
  const GenericParams params_;
  const std::vector<Field> fields_;
};
using StructDeclPtr = std::shared_ptr<const StructDecl>;

/** A struct declaration applied to type and nat arguments. */
class StructType : public Type {
 public:
  StructType(StructDeclPtr decl, TypeList type_args, std::vector<Nat> nat_args);

  const StructDeclPtr& decl() const { return decl_; }
  const std::string& name() const { return decl_->name(); }
  const TypeList& type_args() const { return type_args_; }
  const std::vector<Nat>& nat_args() const { return nat_args_; }

  /** The fields of this struct, with this type's arguments applied. */
  std::vector<Field> fields() const;

  void accept(TypeVisitor& v) const override { v.visit(*this); }

 private:
  const StructDeclPtr decl_;
  const TypeList type_args_;
  const std::vector<Nat> nat_args_;
};

struct ParamType {
  TypePtr type;
  Ownership ownership = Ownership::Borrowed;
};

/**
 * The type of a function.
 *
 * `generics` are bound by the function type: they are not free
 * variables of it.
 */
class FunctionType : public Type {
 public:
  FunctionType(std::vector<ParamType> params, TypePtr result,
               GenericParams generics = {});

  const std::vector<ParamType>& params() const { return params_; }
  const TypePtr& result() const { return result_; }
  const GenericParams& generics() const { return generics_; }

  void accept(TypeVisitor& v) const override { v.visit(*this); }

 private:
  const std::vector<ParamType> params_;
  const TypePtr result_;
  const GenericParams generics_;
};

/** A named, typed parameter of a function signature or definition. */
struct Param {
  std::string name;
  TypePtr type;
  Ownership ownership = Ownership::Borrowed;
};

/** A value that may be absent. */
class OptionType : public Type {
 public:
  explicit OptionType(TypePtr inner);

  const TypePtr& inner() const { return inner_; }

  void accept(TypeVisitor& v) const override { v.visit(*this); }

 private:
  const TypePtr inner_;
};

/** The built-in leaf types. */
class BuiltinTypes {
 public:
  static const BuiltinTypes& get();

  static constexpr std::string_view INT = "int";
  static constexpr std::string_view NAT = "nat";
  static constexpr std::string_view FLOAT = "float";
  static constexpr std::string_view BOOL = "bool";
  static constexpr std::string_view NONE = "none";
  static constexpr std::string_view RANGE = "range";
  static constexpr std::string_view QUBIT = "qubit";
  static constexpr std::string_view RNG = "rng";

  const TypePtr& int_type() const { return int_; }
  const TypePtr& nat_type() const { return nat_; }
  const TypePtr& float_type() const { return float_; }
  const TypePtr& bool_type() const { return bool_; }
  const TypePtr& none_type() const { return none_; }
  const TypePtr& range_type() const { return range_; }
  const TypePtr& qubit_type() const { return qubit_; }
  const TypePtr& rng_type() const { return rng_; }

  /** Returns the named leaf type, if there is one. */
  std::optional<TypePtr> find(std::string_view name) const;

 private:
  BuiltinTypes();

  const TypePtr int_;
  const TypePtr nat_;
  const TypePtr float_;
  const TypePtr bool_;
  const TypePtr none_;
  const TypePtr range_;
  const TypePtr qubit_;
  const TypePtr rng_;
};

TypePtr type_var(std::string name, bool copyable = true, bool droppable = true);
TypePtr tuple_type(TypeList types);
TypePtr array_type(TypePtr element, Nat length);
TypePtr struct_type(StructDeclPtr decl, TypeList type_args = {},
                    std::vector<Nat> nat_args = {});
TypePtr function_type(std::vector<ParamType> params, TypePtr result,
                      GenericParams generics = {});
TypePtr option_type(TypePtr inner);

/** Returns `t` as a `T` if it is one, otherwise nullptr. */
template <typename T>
const T* as(const TypePtr& t) {
  return dynamic_cast<const T*>(t.get());
}

/** The primitive type name of `t`, if `t` is a primitive type. */
std::optional<std::string> primitive_name(const TypePtr& t);

enum class CanonicalizeUndeterminedTypes {
  NO,
  YES,
};

/**
 * Prints a type to string.
 *
 * If c is YES, undetermined types are renamed to '~0, '~1, etc. and
 * undetermined nats to '#0, '#1, etc. based on their order of
 * appearance in the string.
 */
std::string print_type(const TypePtr& t, CanonicalizeUndeterminedTypes c =
                                             CanonicalizeUndeterminedTypes::NO);
std::string print_type(const Type& t, CanonicalizeUndeterminedTypes c =
                                          CanonicalizeUndeterminedTypes::NO);
std::string print_nat(const Nat& n);

/** Mappings for undetermined types and nats, keyed by stamp. */
struct Substitutions {
  std::map<std::uint64_t, TypePtr> types;
  std::map<std::uint64_t, Nat> nats;

  bool empty() const { return types.empty() && nats.empty(); }
};

/** Mappings for type and nat variables, keyed by name. */
struct Instantiation {
  std::map<std::string, TypePtr> types;
  std::map<std::string, Nat> nats;

  bool empty() const { return types.empty() && nats.empty(); }
};

/** Apply the given substitutions to the given type. */
TypePtr apply_substitutions(const TypePtr& t,
                            const Substitutions& substitutions);
Nat apply_substitutions(const Nat& n, const Substitutions& substitutions);

/** Replace the type and nat variables of `t` that `inst` maps. */
TypePtr instantiate(const TypePtr& t, const Instantiation& inst);
Nat instantiate(const Nat& n, const Instantiation& inst);

/**
 * Maps each of `params` to a fresh undetermined type or nat.
 *
 * This is how a generic signature is opened at a call site.
 */
Instantiation fresh_instantiation(const GenericParams& params,
                                  StampGenerator& stamper);

/**
 * Maps each of `params` to the corresponding argument.
 *
 * The caller must check that the argument counts match the
 * parameter counts.
 */
Instantiation make_instantiation(const GenericParams& params,
                                 const TypeList& type_args,
                                 const std::vector<Nat>& nat_args);

/**
 * Structural equality of two types under a substitution.
 *
 * Struct types are compared nominally (by declaration name) and
 * then by their arguments.
 */
bool equal(const TypePtr& l, const TypePtr& r,
           const Substitutions& substitutions = {});

class UnificationError : public std::exception {
 public:
  explicit UnificationError(const std::string& msg);
  UnificationError(const std::string& msg, TypePtr l, TypePtr r);

  const char* what() const noexcept override { return full_msg_.c_str(); }

  /** Returns the types being unified from most specific subtype to most general
   * type. */
  const std::vector<std::pair<TypePtr, TypePtr>>& context() const {
    return context_;
  }

  /** Used to add context during stack unwinding. */
  void add_context(TypePtr l, TypePtr r);

 private:
  std::vector<std::pair<TypePtr, TypePtr>> context_;
  std::string full_msg_;
};

/**
 * The result of a unification.
 */
struct unification_t {
  // The type resulting from the unification.
  TypePtr unified_type;
};

/**
 * Unify l and r to a single type.
 *
 * The given substitutions are applied to l and r before unifying. New
 * substitutions deduced while unifying l and r are added to
 * substitutions.
 *
 * Throws a UnificationError if the types cannot be unified.
 */
unification_t unify(const TypePtr& l, const TypePtr& r,
                    Substitutions& substitutions);

/** Unify two nats, extending substitutions. */
Nat unify_nats(const Nat& l, const Nat& r, Substitutions& substitutions);

/**
 * Derives ownership classes.
 *
 * Leaves carry their class, compound types take the most restrictive
 * class of their components, function values are Copyable and type
 * variables take the class implied by their bound. Results for closed
 * types are memoized, so a classifier should not be shared between
 * threads.
 *
 * Throws std::logic_error if `t` mentions an undetermined type.
 */
class OwnershipClassifier {
 public:
  OwnershipClass classify(const TypePtr& t);

 private:
  std::unordered_map<std::string, OwnershipClass> cache_;
};

/** Classifies `t` without memoization. */
OwnershipClass classify(const TypePtr& t);

/** The class implied by a type parameter's bound. */
OwnershipClass bound_class(const TypeParam& param);

/** Whether a value of class `c` may instantiate `param`. */
bool satisfies_bound(OwnershipClass c, const TypeParam& param);

}  // namespace qsema::typing

QSEMA_ENUM_WITH_TEXT_FORMATTER(qsema::typing::OwnershipClass)
QSEMA_ENUM_WITH_TEXT_FORMATTER(qsema::typing::Ownership)
