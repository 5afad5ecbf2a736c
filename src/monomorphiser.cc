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

#include "qsema/monomorphiser.h"

#include <fmt/core.h>
#include <fmt/format.h>
#include <fmt/ranges.h>

#include <algorithm>
#include <stdexcept>
#include <utility>

#include "qsema/diagnostics.h"

namespace qsema {

using typing::Nat;
using typing::TypeList;
using typing::TypePtr;

std::string InstantiationKey::str() const {
  if (type_args.empty() && nat_args.empty()) return name;
  std::string out = name + "[";
  for (std::size_t i = 0; i < type_args.size(); ++i) {
    if (i > 0) out += ", ";
    out += typing::print_type(type_args[i]);
  }
  if (!nat_args.empty()) {
    if (!type_args.empty()) out += "; ";
    for (std::size_t i = 0; i < nat_args.size(); ++i) {
      if (i > 0) out += ", ";
      out += typing::print_nat(nat_args[i]);
    }
  }
  return out + "]";
}

namespace {

void add_unique(std::vector<std::string>& keys, const std::string& key) {
  if (std::find(keys.begin(), keys.end(), key) == keys.end()) {
    keys.push_back(key);
  }
}

/** Checks generic arguments against the parameters they instantiate. */
void check_arguments(const std::string& name,
                     const typing::GenericParams& generics,
                     const TypeList& type_args, const std::vector<Nat>& nat_args,
                     const Location& location) {
  if (type_args.size() != generics.types.size() ||
      nat_args.size() != generics.nats.size()) {
    throw SemanticError(
        ErrorKind::ArityMismatchError,
        fmt::format("{} takes {} type and {} nat arguments but was given {} "
                    "and {}",
                    name, generics.types.size(), generics.nats.size(),
                    type_args.size(), nat_args.size()),
        location, {name});
  }
  for (std::size_t i = 0; i < type_args.size(); ++i) {
    const auto& param = generics.types[i];
    if (!type_args[i]->is_closed()) {
      throw SemanticError(
          ErrorKind::UnresolvedGenericError,
          fmt::format("Type argument {} for {} of {} is not closed",
                      typing::print_type(
                          type_args[i],
                          typing::CanonicalizeUndeterminedTypes::YES),
                      param.name, name),
          location, {name, param.name});
    }
    const auto cls = typing::classify(type_args[i]);
    if (!typing::satisfies_bound(cls, param)) {
      throw SemanticError(
          ErrorKind::TypeMismatchError,
          fmt::format("{} is {} and cannot instantiate {} of {}",
                      typing::print_type(type_args[i]), cls, param.name, name),
          location, {name, param.name});
    }
  }
  for (std::size_t i = 0; i < nat_args.size(); ++i) {
    if (!nat_args[i].is_constant()) {
      throw SemanticError(
          ErrorKind::UnresolvedGenericError,
          fmt::format("Nat argument {} for {} of {} is not a constant",
                      typing::print_nat(nat_args[i]), generics.nats[i], name),
          location, {name, generics.nats[i]});
    }
  }
}

/** Finds the struct types a type mentions. */
class StructCollector : public typing::TypeVisitor {
 public:
  std::vector<const typing::StructType*> found;

  void visit(const typing::PrimitiveType&) override {}
  void visit(const typing::TypeVar&) override {}
  void visit(const typing::UndeterminedType&) override {}

  void visit(const typing::TupleType& t) override {
    for (const auto& e : t.types()) e->accept(*this);
  }

  void visit(const typing::ArrayType& t) override { t.element()->accept(*this); }

  void visit(const typing::StructType& t) override {
    found.push_back(&t);
    for (const auto& a : t.type_args()) a->accept(*this);
  }

  void visit(const typing::FunctionType& t) override {
    for (const auto& p : t.params()) p.type->accept(*this);
    t.result()->accept(*this);
  }

  void visit(const typing::OptionType& t) override { t.inner()->accept(*this); }
};

}  // namespace

/**
 * Performs one top-level specialization request, tracking the chain
 * of specializations in progress.
 */
class Monomorphiser::Specializer {
 public:
  explicit Specializer(Monomorphiser& m) : m_(m) {}

  bool has_definition(const std::string& name) const {
    return m_.definitions_.contains(name);
  }

  std::shared_ptr<const ConcreteDefinition> function(
      const std::string& name, const TypeList& type_args,
      const std::vector<Nat>& nat_args, const Location& location);

  std::shared_ptr<const ConcreteStruct> structure(
      const std::string& name, const TypeList& type_args,
      const std::vector<Nat>& nat_args, const Location& location);

 private:
  struct InProgress {
    std::string name;
    std::string key;
  };

  Monomorphiser& m_;
  std::vector<InProgress> chain_;
  std::vector<InProgress> struct_chain_;

  static void enter(std::vector<InProgress>& chain, const std::string& name,
                    const std::string& key, const Location& location);
};

/**
 * Pushes `key` onto `chain`.
 *
 * Generic bodies are parametric, so a chain that reaches a definition
 * already in progress either repeats a key or keeps growing its
 * arguments (f[T] calling f[Option[T]]). Both are rejected.
 */
void Monomorphiser::Specializer::enter(std::vector<InProgress>& chain,
                                       const std::string& name,
                                       const std::string& key,
                                       const Location& location) {
  const auto earlier =
      std::find_if(chain.begin(), chain.end(),
                   [&](const InProgress& p) { return p.name == name; });
  if (earlier != chain.end()) {
    std::vector<std::string> names;
    for (const auto& p : chain) names.push_back(p.key);
    names.push_back(key);
    const auto message =
        earlier->key == key
            ? fmt::format("Specializing {} requires itself: {}", key,
                          fmt::join(names, " -> "))
            : fmt::format(
                  "Specializing {} re-enters {} with new arguments and "
                  "would not terminate: {}",
                  key, name, fmt::join(names, " -> "));
    throw SemanticError(ErrorKind::RecursiveMonomorphisationError, message,
                        location, std::move(names));
  }
  chain.push_back(InProgress{name, key});
}

namespace {

/**
 * Replaces generic parameters with closed arguments throughout a
 * typed tree, specializing the callees and structs it meets.
 */
template <typename Specializer>
class SpecializingRewriter : public TypeRewriter {
 public:
  std::vector<std::string> callees;
  std::vector<std::string> structs;

  SpecializingRewriter(Specializer& specializer,
                       const typing::Instantiation& inst,
                       const Location& location)
      : specializer_(specializer), inst_(inst), location_(location) {}

  TypePtr map_type(const TypePtr& t) override {
    auto mapped = typing::instantiate(t, inst_);
    if (!mapped->is_closed()) {
      throw std::logic_error(
          fmt::format("Specialized type {} is not closed",
                      typing::print_type(mapped)));
    }
    StructCollector collector;
    mapped->accept(collector);
    for (const auto* s : collector.found) {
      const auto concrete = specializer_.structure(s->name(), s->type_args(),
                                                   s->nat_args(), location_);
      add_unique(structs, concrete->key);
    }
    return mapped;
  }

  Nat map_nat(const Nat& n) override {
    auto mapped = typing::instantiate(n, inst_);
    if (!mapped.is_constant()) {
      throw std::logic_error(fmt::format("Specialized nat {} is not constant",
                                         typing::print_nat(mapped)));
    }
    return mapped;
  }

  void on_call(TCallExpr& call) override {
    if (!specializer_.has_definition(call.callee)) {
      call.specialization =
          InstantiationKey{call.callee, call.type_args, call.nat_args}.str();
      return;
    }
    const auto callee = specializer_.function(call.callee, call.type_args,
                                              call.nat_args, call.location);
    call.specialization = callee->key;
    add_unique(callees, callee->key);
  }

 private:
  Specializer& specializer_;
  const typing::Instantiation& inst_;
  const Location& location_;
};

}  // namespace

std::shared_ptr<const ConcreteDefinition>
Monomorphiser::Specializer::function(const std::string& name,
                                     const TypeList& type_args,
                                     const std::vector<Nat>& nat_args,
                                     const Location& location) {
  const auto it = m_.definitions_.find(name);
  if (it == m_.definitions_.end()) {
    throw SemanticError(ErrorKind::UnknownNameError,
                        fmt::format("No checked definition of {}", name),
                        location, {name});
  }
  const auto& fn = *it->second;
  check_arguments(name, fn.generics, type_args, nat_args, location);
  const auto key = InstantiationKey{name, type_args, nat_args}.str();
  if (auto cached = m_.find(key)) return cached;

  enter(chain_, name, key, location);

  const auto inst = typing::make_instantiation(fn.generics, type_args, nat_args);
  SpecializingRewriter<Specializer> rewriter{*this, inst, fn.location};
  auto specialized = fn.map_types(rewriter);
  specialized->generics = {};

  chain_.pop_back();

  auto result = std::make_shared<ConcreteDefinition>();
  result->key = key;
  result->function = std::move(specialized);
  result->callees = std::move(rewriter.callees);
  result->structs = std::move(rewriter.structs);
  return m_.publish(std::move(result));
}

std::shared_ptr<const ConcreteStruct> Monomorphiser::Specializer::structure(
    const std::string& name, const TypeList& type_args,
    const std::vector<Nat>& nat_args, const Location& location) {
  const auto& decl = m_.table_.lookup_struct(name, location);
  check_arguments(name, decl->params(), type_args, nat_args, location);
  const auto key = InstantiationKey{name, type_args, nat_args}.str();
  if (auto cached = m_.find_struct(key)) return cached;

  enter(struct_chain_, name, key, location);

  auto result = std::make_shared<ConcreteStruct>();
  result->key = key;
  result->name = name;
  result->type_args = type_args;
  result->nat_args = nat_args;
  result->fields = decl->instantiate_fields(type_args, nat_args);
  for (const auto& f : result->fields) {
    StructCollector collector;
    f.type->accept(collector);
    for (const auto* s : collector.found) {
      structure(s->name(), s->type_args(), s->nat_args(), location);
    }
  }
  result->ownership = typing::classify(
      typing::struct_type(decl, type_args, nat_args));

  struct_chain_.pop_back();
  return m_.publish(std::move(result));
}

Monomorphiser::Monomorphiser(
    const SignatureTable& table,
    std::vector<std::shared_ptr<const TFunction>> definitions)
    : table_(table) {
  for (auto& d : definitions) {
    auto name = d->qualified_name();
    definitions_.emplace(std::move(name), std::move(d));
  }
}

std::shared_ptr<const ConcreteDefinition> Monomorphiser::specialize(
    const std::string& name, const TypeList& type_args,
    const std::vector<Nat>& nat_args, const Location& location) {
  Specializer specializer{*this};
  return specializer.function(name, type_args, nat_args, location);
}

std::shared_ptr<const ConcreteStruct> Monomorphiser::specialize_struct(
    const std::string& name, const TypeList& type_args,
    const std::vector<Nat>& nat_args, const Location& location) {
  Specializer specializer{*this};
  return specializer.structure(name, type_args, nat_args, location);
}

std::shared_ptr<const ConcreteDefinition> Monomorphiser::find(
    std::string_view key) const {
  std::lock_guard lock{mutex_};
  const auto it = cache_.find(key);
  return it == cache_.end() ? nullptr : it->second;
}

std::shared_ptr<const ConcreteStruct> Monomorphiser::find_struct(
    std::string_view key) const {
  std::lock_guard lock{mutex_};
  const auto it = struct_cache_.find(key);
  return it == struct_cache_.end() ? nullptr : it->second;
}

std::size_t Monomorphiser::size() const {
  std::lock_guard lock{mutex_};
  return cache_.size();
}

std::shared_ptr<const ConcreteDefinition> Monomorphiser::publish(
    std::shared_ptr<const ConcreteDefinition> result) {
  std::lock_guard lock{mutex_};
  auto key = result->key;
  return cache_.emplace(std::move(key), std::move(result)).first->second;
}

std::shared_ptr<const ConcreteStruct> Monomorphiser::publish(
    std::shared_ptr<const ConcreteStruct> result) {
  std::lock_guard lock{mutex_};
  auto key = result->key;
  return struct_cache_.emplace(std::move(key), std::move(result))
      .first->second;
}

}  // namespace qsema
