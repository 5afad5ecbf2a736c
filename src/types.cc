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

#include "qsema/types.h"

#include <fmt/core.h>
#include <fmt/format.h>

#include <algorithm>
#include <iterator>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <utility>

namespace qsema::typing {

namespace {

FreeVariables merge_free_variables(const TypeList& types) {
  FreeVariables v;
  for (const auto& t : types) v.merge(t->free_variables());
  return v;
}

FreeVariables merge_free_variables(const std::vector<Nat>& nats) {
  FreeVariables v;
  for (const auto& n : nats) v.add(n);
  return v;
}

FreeVariables function_free_variables(const std::vector<ParamType>& params,
                                      const TypePtr& result,
                                      const GenericParams& generics) {
  FreeVariables v;
  for (const auto& p : params) v.merge(p.type->free_variables());
  v.merge(result->free_variables());
  for (const auto& p : generics.types) v.type_variables.erase(p.name);
  for (const auto& n : generics.nats) v.nat_variables.erase(n);
  return v;
}

template <typename T, typename F>
std::string join(const std::vector<T>& items, F&& f) {
  std::string s;
  bool first = true;
  for (const auto& item : items) {
    if (first)
      first = false;
    else
      s += ", ";
    s += f(item);
  }
  return s;
}

}  // namespace

Nat Nat::constant(std::uint64_t value) {
  return Nat(Kind::Constant, value, "");
}

Nat Nat::variable(std::string name) {
  return Nat(Kind::Variable, 0, std::move(name));
}

Nat Nat::undetermined(std::uint64_t stamp) {
  return Nat(Kind::Undetermined, stamp, "");
}

Nat Nat::undetermined(StampGenerator& stamper) {
  return undetermined(stamper());
}

std::uint64_t Nat::value() const {
  if (kind_ != Kind::Constant) {
    throw std::logic_error(
        fmt::format("Nat {} is not a constant", print_nat(*this)));
  }
  return value_;
}

const std::string& Nat::name() const {
  if (kind_ != Kind::Variable) {
    throw std::logic_error(
        fmt::format("Nat {} is not a variable", print_nat(*this)));
  }
  return name_;
}

std::uint64_t Nat::stamp() const {
  if (kind_ != Kind::Undetermined) {
    throw std::logic_error(
        fmt::format("Nat {} is not undetermined", print_nat(*this)));
  }
  return value_;
}

const TypeParam* GenericParams::find_type(std::string_view name) const {
  auto it = std::find_if(types.begin(), types.end(),
                         [name](const TypeParam& p) { return p.name == name; });
  return it == types.end() ? nullptr : &*it;
}

bool GenericParams::has_nat(std::string_view name) const {
  return std::find(nats.begin(), nats.end(), name) != nats.end();
}

void FreeVariables::merge(const FreeVariables& other) {
  type_variables.insert(other.type_variables.begin(),
                        other.type_variables.end());
  nat_variables.insert(other.nat_variables.begin(), other.nat_variables.end());
  undetermined_types.insert(other.undetermined_types.begin(),
                            other.undetermined_types.end());
  undetermined_nats.insert(other.undetermined_nats.begin(),
                           other.undetermined_nats.end());
}

void FreeVariables::add(const Nat& n) {
  switch (n.kind()) {
    case Nat::Kind::Constant:
      break;
    case Nat::Kind::Variable:
      nat_variables.insert(n.name());
      break;
    case Nat::Kind::Undetermined:
      undetermined_nats.insert(n.stamp());
      break;
  }
}

TypeVisitor::~TypeVisitor() = default;

Type::Type(FreeVariables free_variables)
    : free_variables_(std::move(free_variables)) {}

Type::~Type() = default;

PrimitiveType::PrimitiveType(std::string name, OwnershipClass ownership)
    : Type({}), name_(std::move(name)), ownership_(ownership) {}

TypeVar::TypeVar(TypeParam param)
    : Type(FreeVariables{.type_variables = {param.name}}),
      param_(std::move(param)) {}

UndeterminedType::UndeterminedType(std::uint64_t stamp)
    : Type(FreeVariables{.undetermined_types = {stamp}}), stamp_(stamp) {}

UndeterminedType::UndeterminedType(StampGenerator& stamper)
    : UndeterminedType(stamper()) {}

std::string UndeterminedType::name() const {
  return fmt::format("'~{}", stamp_);
}

TupleType::TupleType(TypeList types)
    : Type(merge_free_variables(types)), types_(std::move(types)) {}

namespace {
FreeVariables array_free_variables(const TypePtr& element, const Nat& length) {
  FreeVariables v = element->free_variables();
  v.add(length);
  return v;
}

FreeVariables struct_free_variables(const TypeList& type_args,
                                    const std::vector<Nat>& nat_args) {
  FreeVariables v = merge_free_variables(type_args);
  v.merge(merge_free_variables(nat_args));
  return v;
}
}  // namespace

ArrayType::ArrayType(TypePtr element, Nat length)
    : Type(array_free_variables(element, length)),
      element_(std::move(element)),
      length_(std::move(length)) {}

StructDecl::StructDecl(std::string name, GenericParams params,
                       std::vector<Field> fields)
    : name_(std::move(name)),
      params_(std::move(params)),
      fields_(std::move(fields)) {}

std::optional<std::size_t> StructDecl::field_index(
    std::string_view name) const {
  for (std::size_t i = 0; i < fields_.size(); ++i) {
    if (fields_[i].name == name) return i;
  }
  return std::nullopt;
}

std::vector<Field> StructDecl::instantiate_fields(
    const TypeList& type_args, const std::vector<Nat>& nat_args) const {
  if (type_args.size() != params_.types.size() ||
      nat_args.size() != params_.nats.size()) {
    throw std::logic_error(
        fmt::format("Struct {} applied to the wrong number of arguments",
                    name_));
  }
  if (params_.empty()) return fields_;
  const auto inst = make_instantiation(params_, type_args, nat_args);
  std::vector<Field> fields;
  fields.reserve(fields_.size());
  for (const auto& f : fields_) {
    fields.push_back(Field{f.name, instantiate(f.type, inst)});
  }
  return fields;
}

StructType::StructType(StructDeclPtr decl, TypeList type_args,
                       std::vector<Nat> nat_args)
    : Type(struct_free_variables(type_args, nat_args)),
      decl_(std::move(decl)),
      type_args_(std::move(type_args)),
      nat_args_(std::move(nat_args)) {}

std::vector<Field> StructType::fields() const {
  return decl_->instantiate_fields(type_args_, nat_args_);
}

FunctionType::FunctionType(std::vector<ParamType> params, TypePtr result,
                           GenericParams generics)
    : Type(function_free_variables(params, result, generics)),
      params_(std::move(params)),
      result_(std::move(result)),
      generics_(std::move(generics)) {}

OptionType::OptionType(TypePtr inner)
    : Type(inner->free_variables()), inner_(std::move(inner)) {}

namespace {
TypePtr primitive(std::string_view name, OwnershipClass c) {
  return std::make_shared<PrimitiveType>(std::string(name), c);
}
}  // namespace

BuiltinTypes::BuiltinTypes()
    : int_(primitive(INT, OwnershipClass::Copyable)),
      nat_(primitive(NAT, OwnershipClass::Copyable)),
      float_(primitive(FLOAT, OwnershipClass::Copyable)),
      bool_(primitive(BOOL, OwnershipClass::Copyable)),
      none_(primitive(NONE, OwnershipClass::Copyable)),
      range_(primitive(RANGE, OwnershipClass::Copyable)),
      qubit_(primitive(QUBIT, OwnershipClass::Linear)),
      rng_(primitive(RNG, OwnershipClass::Affine)) {}

const BuiltinTypes& BuiltinTypes::get() {
  static const BuiltinTypes builtins;
  return builtins;
}

std::optional<TypePtr> BuiltinTypes::find(std::string_view name) const {
  for (const auto* t : {&int_, &nat_, &float_, &bool_, &none_, &range_,
                        &qubit_, &rng_}) {
    if (as<PrimitiveType>(*t)->name() == name) return *t;
  }
  return std::nullopt;
}

TypePtr type_var(std::string name, bool copyable, bool droppable) {
  return std::make_shared<TypeVar>(
      TypeParam{std::move(name), copyable, droppable});
}

TypePtr tuple_type(TypeList types) {
  return std::make_shared<TupleType>(std::move(types));
}

TypePtr array_type(TypePtr element, Nat length) {
  return std::make_shared<ArrayType>(std::move(element), std::move(length));
}

TypePtr struct_type(StructDeclPtr decl, TypeList type_args,
                    std::vector<Nat> nat_args) {
  return std::make_shared<StructType>(std::move(decl), std::move(type_args),
                                      std::move(nat_args));
}

TypePtr function_type(std::vector<ParamType> params, TypePtr result,
                      GenericParams generics) {
  return std::make_shared<FunctionType>(std::move(params), std::move(result),
                                        std::move(generics));
}

TypePtr option_type(TypePtr inner) {
  return std::make_shared<OptionType>(std::move(inner));
}

std::optional<std::string> primitive_name(const TypePtr& t) {
  const auto* p = as<PrimitiveType>(t);
  if (!p) return std::nullopt;
  return p->name();
}

namespace {

class TypePrinter : public TypeVisitor {
 public:
  explicit TypePrinter(CanonicalizeUndeterminedTypes c) : c_(c) {}

  std::string& contents() { return contents_; }

  void visit(const PrimitiveType& t) override { contents_ += t.name(); }

  void visit(const TypeVar& t) override { contents_ += t.name(); }

  void visit(const UndeterminedType& t) override {
    if (c_ == CanonicalizeUndeterminedTypes::NO) {
      contents_ += t.name();
      return;
    }
    fmt::format_to(std::back_inserter(contents_), "'~{}",
                   canonical_id(type_mappings_, t.stamp()));
  }

  void visit(const TupleType& t) override {
    contents_ += "(";
    print_list(t.types());
    if (t.types().size() == 1) contents_ += ",";
    contents_ += ")";
  }

  void visit(const ArrayType& t) override {
    contents_ += "array[";
    t.element()->accept(*this);
    contents_ += ", ";
    print(t.length());
    contents_ += "]";
  }

  void visit(const StructType& t) override {
    contents_ += t.name();
    print_args(t.type_args(), t.nat_args());
  }

  void visit(const FunctionType& t) override {
    if (!t.generics().empty()) {
      contents_ += "[";
      contents_ += join(t.generics().types,
                        [](const TypeParam& p) { return p.name; });
      if (!t.generics().nats.empty()) {
        if (!t.generics().types.empty()) contents_ += "; ";
        contents_ += join(t.generics().nats,
                          [](const std::string& n) { return n; });
      }
      contents_ += "]";
    }
    contents_ += "(";
    bool first = true;
    for (const auto& p : t.params()) {
      if (first)
        first = false;
      else
        contents_ += ", ";
      p.type->accept(*this);
      if (p.ownership == Ownership::Owned) contents_ += " @owned";
    }
    contents_ += ") -> ";
    t.result()->accept(*this);
  }

  void visit(const OptionType& t) override {
    contents_ += "Option[";
    t.inner()->accept(*this);
    contents_ += "]";
  }

  void print(const Nat& n) {
    if (n.is_undetermined() && c_ == CanonicalizeUndeterminedTypes::YES) {
      fmt::format_to(std::back_inserter(contents_), "'#{}",
                     canonical_id(nat_mappings_, n.stamp()));
      return;
    }
    contents_ += print_nat(n);
  }

  void print_args(const TypeList& types, const std::vector<Nat>& nats) {
    if (types.empty() && nats.empty()) return;
    contents_ += "[";
    print_list(types);
    if (!nats.empty()) {
      if (!types.empty()) contents_ += "; ";
      bool first = true;
      for (const auto& n : nats) {
        if (first)
          first = false;
        else
          contents_ += ", ";
        print(n);
      }
    }
    contents_ += "]";
  }

 private:
  const CanonicalizeUndeterminedTypes c_;
  std::unordered_map<std::uint64_t, std::uint64_t> type_mappings_;
  std::unordered_map<std::uint64_t, std::uint64_t> nat_mappings_;
  std::string contents_;

  static std::uint64_t canonical_id(
      std::unordered_map<std::uint64_t, std::uint64_t>& mappings,
      std::uint64_t id) {
    const auto it = mappings.find(id);
    if (it != mappings.end()) return it->second;
    const std::uint64_t new_id = mappings.size();
    mappings[id] = new_id;
    return new_id;
  }

  void print_list(const TypeList& types) {
    bool first = true;
    for (const auto& type : types) {
      if (first)
        first = false;
      else
        contents_ += ", ";
      type->accept(*this);
    }
  }
};

}  // namespace

std::string print_type(const TypePtr& t, CanonicalizeUndeterminedTypes c) {
  return print_type(*t, c);
}

std::string print_type(const Type& t, CanonicalizeUndeterminedTypes c) {
  TypePrinter printer{c};
  t.accept(printer);
  return std::move(printer.contents());
}

std::string print_nat(const Nat& n) {
  switch (n.kind()) {
    case Nat::Kind::Constant:
      return fmt::format("{}", n.value());
    case Nat::Kind::Variable:
      return n.name();
    case Nat::Kind::Undetermined:
      return fmt::format("'#{}", n.stamp());
  }
  return "";
}

namespace {

/**
 * Rebuilds a type, replacing the variables selected by a subclass.
 *
 * Subtrees that mention none of the variables of interest are shared
 * with the original.
 */
class TypeMapper : public TypeVisitor {
 public:
  TypePtr map(const TypePtr& t) {
    if (!affects(t->free_variables())) return t;
    TypePtr saved = std::move(result_);
    result_ = t;
    t->accept(*this);
    std::swap(saved, result_);
    return saved;
  }

  virtual Nat map_nat(const Nat& n) = 0;

  void visit(const PrimitiveType&) override {}

  void visit(const TypeVar& t) override {
    if (auto replacement = map_var(t)) result_ = std::move(*replacement);
  }

  void visit(const UndeterminedType& t) override {
    if (auto replacement = map_undetermined(t)) {
      result_ = std::move(*replacement);
    }
  }

  void visit(const TupleType& t) override {
    result_ = tuple_type(map_list(t.types()));
  }

  void visit(const ArrayType& t) override {
    result_ = array_type(map(t.element()), map_nat(t.length()));
  }

  void visit(const StructType& t) override {
    result_ = struct_type(t.decl(), map_list(t.type_args()),
                          map_nats(t.nat_args()));
  }

  void visit(const FunctionType& t) override {
    std::vector<ParamType> params;
    params.reserve(t.params().size());
    for (const auto& p : t.params()) {
      params.push_back(ParamType{map(p.type), p.ownership});
    }
    result_ = function_type(std::move(params), map(t.result()), t.generics());
  }

  void visit(const OptionType& t) override {
    result_ = option_type(map(t.inner()));
  }

 protected:
  virtual bool affects(const FreeVariables& v) const = 0;
  virtual std::optional<TypePtr> map_var(const TypeVar&) {
    return std::nullopt;
  }
  virtual std::optional<TypePtr> map_undetermined(const UndeterminedType&) {
    return std::nullopt;
  }

  TypeList map_list(const TypeList& types) {
    TypeList mapped;
    mapped.reserve(types.size());
    for (const auto& t : types) mapped.push_back(map(t));
    return mapped;
  }

  std::vector<Nat> map_nats(const std::vector<Nat>& nats) {
    std::vector<Nat> mapped;
    mapped.reserve(nats.size());
    for (const auto& n : nats) mapped.push_back(map_nat(n));
    return mapped;
  }

  TypePtr result_;
};

class Substitutor : public TypeMapper {
 public:
  explicit Substitutor(const Substitutions& substitutions)
      : substitutions_(substitutions) {}

  Nat map_nat(const Nat& n) override {
    if (!n.is_undetermined()) return n;
    const auto it = substitutions_.nats.find(n.stamp());
    return it == substitutions_.nats.end() ? n : it->second;
  }

 protected:
  bool affects(const FreeVariables& v) const override {
    return v.has_undetermined();
  }

  std::optional<TypePtr> map_undetermined(const UndeterminedType& t) override {
    const auto it = substitutions_.types.find(t.stamp());
    if (it == substitutions_.types.end()) return std::nullopt;
    return it->second;
  }

 private:
  const Substitutions& substitutions_;
};

class Instantiator : public TypeMapper {
 public:
  explicit Instantiator(const Instantiation& inst) : inst_(inst) {}

  Nat map_nat(const Nat& n) override {
    if (!n.is_variable()) return n;
    const auto it = inst_.nats.find(n.name());
    return it == inst_.nats.end() ? n : it->second;
  }

  void visit(const FunctionType& t) override {
    if (t.generics().empty()) {
      TypeMapper::visit(t);
      return;
    }
    // A generic function type binds its own parameters.
    Instantiation inner = inst_;
    for (const auto& p : t.generics().types) inner.types.erase(p.name);
    for (const auto& n : t.generics().nats) inner.nats.erase(n);
    Instantiator shadowed{inner};
    std::vector<ParamType> params;
    params.reserve(t.params().size());
    for (const auto& p : t.params()) {
      params.push_back(ParamType{shadowed.map(p.type), p.ownership});
    }
    result_ = function_type(std::move(params), shadowed.map(t.result()),
                            t.generics());
  }

 protected:
  bool affects(const FreeVariables& v) const override {
    return !v.type_variables.empty() || !v.nat_variables.empty();
  }

  std::optional<TypePtr> map_var(const TypeVar& t) override {
    const auto it = inst_.types.find(t.name());
    if (it == inst_.types.end()) return std::nullopt;
    return it->second;
  }

 private:
  const Instantiation& inst_;
};

}  // namespace

TypePtr apply_substitutions(const TypePtr& t,
                            const Substitutions& substitutions) {
  if (substitutions.empty() || !t->free_variables().has_undetermined()) {
    return t;
  }
  Substitutor s{substitutions};
  return s.map(t);
}

Nat apply_substitutions(const Nat& n, const Substitutions& substitutions) {
  Substitutor s{substitutions};
  return s.map_nat(n);
}

TypePtr instantiate(const TypePtr& t, const Instantiation& inst) {
  if (inst.empty()) return t;
  Instantiator i{inst};
  return i.map(t);
}

Nat instantiate(const Nat& n, const Instantiation& inst) {
  Instantiator i{inst};
  return i.map_nat(n);
}

Instantiation fresh_instantiation(const GenericParams& params,
                                  StampGenerator& stamper) {
  Instantiation inst;
  for (const auto& p : params.types) {
    inst.types.emplace(p.name, std::make_shared<UndeterminedType>(stamper));
  }
  for (const auto& n : params.nats) {
    inst.nats.emplace(n, Nat::undetermined(stamper));
  }
  return inst;
}

Instantiation make_instantiation(const GenericParams& params,
                                 const TypeList& type_args,
                                 const std::vector<Nat>& nat_args) {
  if (type_args.size() != params.types.size() ||
      nat_args.size() != params.nats.size()) {
    throw std::logic_error("Instantiation argument count mismatch");
  }
  Instantiation inst;
  for (std::size_t i = 0; i < type_args.size(); ++i) {
    inst.types.emplace(params.types[i].name, type_args[i]);
  }
  for (std::size_t i = 0; i < nat_args.size(); ++i) {
    inst.nats.emplace(params.nats[i], nat_args[i]);
  }
  return inst;
}

namespace {

class EqualityChecker : public TypeVisitor {
 public:
  bool result = false;

  explicit EqualityChecker(const Type& r) : r_(r) {}

  void visit(const PrimitiveType& l) override {
    const auto* r = dynamic_cast<const PrimitiveType*>(&r_);
    result = r && r->name() == l.name();
  }

  void visit(const TypeVar& l) override {
    const auto* r = dynamic_cast<const TypeVar*>(&r_);
    result = r && r->name() == l.name();
  }

  void visit(const UndeterminedType& l) override {
    const auto* r = dynamic_cast<const UndeterminedType*>(&r_);
    result = r && r->stamp() == l.stamp();
  }

  void visit(const TupleType& l) override {
    const auto* r = dynamic_cast<const TupleType*>(&r_);
    result = r && equal_lists(l.types(), r->types());
  }

  void visit(const ArrayType& l) override {
    const auto* r = dynamic_cast<const ArrayType*>(&r_);
    result = r && l.length() == r->length() &&
             equal_types(*l.element(), *r->element());
  }

  void visit(const StructType& l) override {
    const auto* r = dynamic_cast<const StructType*>(&r_);
    result = r && l.name() == r->name() && l.nat_args() == r->nat_args() &&
             equal_lists(l.type_args(), r->type_args());
  }

  void visit(const FunctionType& l) override {
    const auto* r = dynamic_cast<const FunctionType*>(&r_);
    if (!r || l.params().size() != r->params().size() ||
        !(l.generics() == r->generics())) {
      result = false;
      return;
    }
    for (std::size_t i = 0; i < l.params().size(); ++i) {
      if (l.params()[i].ownership != r->params()[i].ownership ||
          !equal_types(*l.params()[i].type, *r->params()[i].type)) {
        result = false;
        return;
      }
    }
    result = equal_types(*l.result(), *r->result());
  }

  void visit(const OptionType& l) override {
    const auto* r = dynamic_cast<const OptionType*>(&r_);
    result = r && equal_types(*l.inner(), *r->inner());
  }

  static bool equal_types(const Type& l, const Type& r) {
    if (&l == &r) return true;
    EqualityChecker e{r};
    l.accept(e);
    return e.result;
  }

 private:
  const Type& r_;

  static bool equal_lists(const TypeList& l, const TypeList& r) {
    if (l.size() != r.size()) return false;
    for (std::size_t i = 0; i < l.size(); ++i) {
      if (!equal_types(*l[i], *r[i])) return false;
    }
    return true;
  }
};

}  // namespace

bool equal(const TypePtr& l, const TypePtr& r,
           const Substitutions& substitutions) {
  return EqualityChecker::equal_types(*apply_substitutions(l, substitutions),
                                      *apply_substitutions(r, substitutions));
}

UnificationError::UnificationError(const std::string& msg) : full_msg_(msg) {}

UnificationError::UnificationError(const std::string& msg, TypePtr l, TypePtr r)
    : UnificationError(msg) {
  add_context(std::move(l), std::move(r));
}

void UnificationError::add_context(TypePtr l, TypePtr r) {
  fmt::format_to(std::back_inserter(full_msg_),
                 "\n----\nwhile trying to unify\n{}\nwith\n{}", print_type(l),
                 print_type(r));
  context_.emplace_back(std::move(l), std::move(r));
}

namespace {

/**
 * Add a new substitution mapping v to t.
 *
 * Existing substitutions that mention v are rewritten so that the
 * mapping stays idempotent.
 */
void add_substitution(Substitutions& substitutions, const UndeterminedType& v,
                      const TypePtr& type) {
  const auto t = apply_substitutions(type, substitutions);
  const auto stamp = v.stamp();
  if (t->free_variables().undetermined_types.contains(stamp)) {
    throw UnificationError(
        fmt::format("Recursive substitution failure: cannot map {} to {}",
                    v.name(), print_type(t)));
  }
  Substitutions single;
  single.types.emplace(stamp, t);
  for (auto& entry : substitutions.types) {
    if (entry.second->free_variables().undetermined_types.contains(stamp)) {
      entry.second = apply_substitutions(entry.second, single);
    }
  }
  substitutions.types.insert_or_assign(stamp, t);
}

void add_nat_substitution(Substitutions& substitutions, std::uint64_t stamp,
                          const Nat& nat) {
  const auto n = apply_substitutions(nat, substitutions);
  if (n.is_undetermined() && n.stamp() == stamp) return;
  const auto undetermined = Nat::undetermined(stamp);
  for (auto& entry : substitutions.nats) {
    if (entry.second == undetermined) entry.second = n;
  }
  Substitutions single;
  single.nats.emplace(stamp, n);
  for (auto& entry : substitutions.types) {
    if (entry.second->free_variables().undetermined_nats.contains(stamp)) {
      entry.second = apply_substitutions(entry.second, single);
    }
  }
  substitutions.nats.insert_or_assign(stamp, n);
}

/**
 * The base class for the second visitor (which visits r) in unify's double
 * dispatch.
 *
 * This class provides implementations of `visit` which will work except when
 * `l` is of the same type as `r`. Namely,
 *
 * - UndeterminedType creates a new substitution mapping r to l (r has
 *   no substitution yet, since unify applies the existing ones first).
 *
 * - The remaining types throw a UnificationError indicating that `l`
 *   and `r` are of different types and cannot be unified.
 *
 * Subclasses should (usually) just override the `visit` overload that
 * corresponds to `l` and `r` having the same type.
 */
class UnifierBase : public TypeVisitor {
 public:
  void visit(const PrimitiveType& r) override {
    throw UnificationError(
        fmt::format("Cannot unify {} with primitive type {}", type_name_,
                    r.name()));
  }

  void visit(const TypeVar& r) override {
    throw UnificationError(fmt::format(
        "Cannot unify {} with type variable {}", type_name_, r.name()));
  }

  void visit(const UndeterminedType& r) final {
    add_substitution(substitutions_, r, orig_l_);
  }

  void visit(const TupleType&) override {
    throw UnificationError(
        fmt::format("Cannot unify {} with tuple type", type_name_));
  }

  void visit(const ArrayType&) override {
    throw UnificationError(
        fmt::format("Cannot unify {} with array type", type_name_));
  }

  void visit(const StructType& r) override {
    throw UnificationError(fmt::format("Cannot unify {} with struct type {}",
                                       type_name_, r.name()));
  }

  void visit(const FunctionType&) override {
    throw UnificationError(
        fmt::format("Cannot unify {} with function type", type_name_));
  }

  void visit(const OptionType&) override {
    throw UnificationError(
        fmt::format("Cannot unify {} with option type", type_name_));
  }

 protected:
  UnifierBase(std::string type_name, TypePtr orig_l,
              Substitutions& substitutions)
      : type_name_(std::move(type_name)),
        orig_l_(std::move(orig_l)),
        substitutions_(substitutions) {}

  Substitutions& substitutions() { return substitutions_; }

  void unify_lists(const TypeList& ls, const TypeList& rs) {
    if (ls.size() != rs.size()) {
      throw UnificationError(
          fmt::format("Cannot unify {} type arguments with {}", ls.size(),
                      rs.size()));
    }
    for (std::size_t i = 0; i < ls.size(); ++i) {
      unify(ls[i], rs[i], substitutions_);
    }
  }

  void unify_nat_lists(const std::vector<Nat>& ls, const std::vector<Nat>& rs) {
    if (ls.size() != rs.size()) {
      throw UnificationError(fmt::format(
          "Cannot unify {} nat arguments with {}", ls.size(), rs.size()));
    }
    for (std::size_t i = 0; i < ls.size(); ++i) {
      unify_nats(ls[i], rs[i], substitutions_);
    }
  }

 private:
  const std::string type_name_;
  const TypePtr orig_l_;
  Substitutions& substitutions_;
};

/** Performs unification when l is a primitive type. */
class PrimitiveUnifier : public UnifierBase {
 public:
  PrimitiveUnifier(const PrimitiveType& l, TypePtr orig_l,
                   Substitutions& substitutions)
      : UnifierBase(fmt::format("primitive type {}", l.name()),
                    std::move(orig_l), substitutions),
        l_(l) {}

  void visit(const PrimitiveType& r) override {
    if (l_.name() != r.name()) {
      throw UnificationError(
          fmt::format("Cannot unify {} with {}", l_.name(), r.name()));
    }
  }

 private:
  const PrimitiveType& l_;
};

/** Performs unification when l is a type variable. */
class TypeVarUnifier : public UnifierBase {
 public:
  TypeVarUnifier(const TypeVar& l, TypePtr orig_l, Substitutions& substitutions)
      : UnifierBase(fmt::format("type variable {}", l.name()),
                    std::move(orig_l), substitutions),
        l_(l) {}

  void visit(const TypeVar& r) override {
    if (l_.name() != r.name()) {
      throw UnificationError(
          fmt::format("A type variable can only unify with itself. {} != {}",
                      l_.name(), r.name()));
    }
  }

 private:
  const TypeVar& l_;
};

/** Performs unification when l is an undetermined type. */
class UndeterminedUnifier : public TypeVisitor {
 public:
  UndeterminedUnifier(const UndeterminedType& l, TypePtr orig_r,
                      Substitutions& substitutions)
      : l_(l), orig_r_(std::move(orig_r)), substitutions_(substitutions) {}

  void visit(const PrimitiveType&) override { unify_by_substitution(); }

  void visit(const TypeVar&) override { unify_by_substitution(); }

  void visit(const UndeterminedType& r) override {
    if (l_.stamp() == r.stamp()) return;
    unify_by_substitution();
  }

  void visit(const TupleType&) override { unify_by_substitution(); }

  void visit(const ArrayType&) override { unify_by_substitution(); }

  void visit(const StructType&) override { unify_by_substitution(); }

  void visit(const FunctionType&) override { unify_by_substitution(); }

  void visit(const OptionType&) override { unify_by_substitution(); }

 private:
  const UndeterminedType& l_;
  const TypePtr orig_r_;
  Substitutions& substitutions_;

  void unify_by_substitution() {
    add_substitution(substitutions_, l_, orig_r_);
  }
};

/** Performs unification when l is a tuple type. */
class TupleUnifier : public UnifierBase {
 public:
  TupleUnifier(const TupleType& l, TypePtr orig_l, Substitutions& substitutions)
      : UnifierBase("tuple type", std::move(orig_l), substitutions), l_(l) {}

  void visit(const TupleType& r) override {
    if (l_.types().size() != r.types().size()) {
      throw UnificationError("Cannot unify tuples of different length");
    }
    unify_lists(l_.types(), r.types());
  }

 private:
  const TupleType& l_;
};

/** Performs unification when l is an array type. */
class ArrayUnifier : public UnifierBase {
 public:
  ArrayUnifier(const ArrayType& l, TypePtr orig_l, Substitutions& substitutions)
      : UnifierBase("array type", std::move(orig_l), substitutions), l_(l) {}

  void visit(const ArrayType& r) override {
    unify(l_.element(), r.element(), substitutions());
    unify_nats(l_.length(), r.length(), substitutions());
  }

 private:
  const ArrayType& l_;
};

/** Performs unification when l is a struct type. */
class StructUnifier : public UnifierBase {
 public:
  StructUnifier(const StructType& l, TypePtr orig_l,
                Substitutions& substitutions)
      : UnifierBase(fmt::format("struct type {}", l.name()), std::move(orig_l),
                    substitutions),
        l_(l) {}

  void visit(const StructType& r) override {
    if (l_.name() != r.name()) {
      throw UnificationError(fmt::format("Cannot unify distinct structs {} and {}",
                                         l_.name(), r.name()));
    }
    unify_lists(l_.type_args(), r.type_args());
    unify_nat_lists(l_.nat_args(), r.nat_args());
  }

 private:
  const StructType& l_;
};

/** Performs unification when l is a function type. */
class FunctionUnifier : public UnifierBase {
 public:
  FunctionUnifier(const FunctionType& l, TypePtr orig_l,
                  Substitutions& substitutions)
      : UnifierBase("function type", std::move(orig_l), substitutions), l_(l) {}

  void visit(const FunctionType& r) override {
    if (l_.params().size() != r.params().size()) {
      throw UnificationError(
          fmt::format("Cannot unify functions taking {} and {} parameters",
                      l_.params().size(), r.params().size()));
    }
    if (!(l_.generics() == r.generics())) {
      throw UnificationError(
          "Cannot unify functions with different generic parameters");
    }
    for (std::size_t i = 0; i < l_.params().size(); ++i) {
      if (l_.params()[i].ownership != r.params()[i].ownership) {
        throw UnificationError(fmt::format(
            "Parameter {} is {} in one function type and {} in the other", i,
            l_.params()[i].ownership, r.params()[i].ownership));
      }
      unify(l_.params()[i].type, r.params()[i].type, substitutions());
    }
    unify(l_.result(), r.result(), substitutions());
  }

 private:
  const FunctionType& l_;
};

/** Performs unification when l is an option type. */
class OptionUnifier : public UnifierBase {
 public:
  OptionUnifier(const OptionType& l, TypePtr orig_l,
                Substitutions& substitutions)
      : UnifierBase("option type", std::move(orig_l), substitutions), l_(l) {}

  void visit(const OptionType& r) override {
    unify(l_.inner(), r.inner(), substitutions());
  }

 private:
  const OptionType& l_;
};

/**
 * Unifies l and r.
 *
 * This is the first step in the double-dispatch approach. It visits `l` to
 * determine its type and then dispatches to the appropriate visitor to
 * visit `r`.
 */
class UnifyDispatcher : public TypeVisitor {
 public:
  UnifyDispatcher(TypePtr l, TypePtr r, Substitutions& substitutions)
      : orig_l_(std::move(l)),
        orig_r_(std::move(r)),
        substitutions_(substitutions) {}

  void visit(const PrimitiveType& l) override {
    PrimitiveUnifier u{l, orig_l_, substitutions_};
    orig_r_->accept(u);
  }

  void visit(const TypeVar& l) override {
    TypeVarUnifier u{l, orig_l_, substitutions_};
    orig_r_->accept(u);
  }

  void visit(const UndeterminedType& l) override {
    UndeterminedUnifier u{l, orig_r_, substitutions_};
    orig_r_->accept(u);
  }

  void visit(const TupleType& l) override {
    TupleUnifier u{l, orig_l_, substitutions_};
    orig_r_->accept(u);
  }

  void visit(const ArrayType& l) override {
    ArrayUnifier u{l, orig_l_, substitutions_};
    orig_r_->accept(u);
  }

  void visit(const StructType& l) override {
    StructUnifier u{l, orig_l_, substitutions_};
    orig_r_->accept(u);
  }

  void visit(const FunctionType& l) override {
    FunctionUnifier u{l, orig_l_, substitutions_};
    orig_r_->accept(u);
  }

  void visit(const OptionType& l) override {
    OptionUnifier u{l, orig_l_, substitutions_};
    orig_r_->accept(u);
  }

 private:
  const TypePtr orig_l_;
  const TypePtr orig_r_;
  Substitutions& substitutions_;
};

}  // namespace

/**
 * Implementation note: The general approach is through double
 * dispatch. First the UnifyDispatcher visitor determines the type of
 * l. It creates a second visitor of the appropriate subclass of
 * UnifierBase, which visits r to determine its type and unify it
 * appropriately. Each level of the recursion adds the pair it was
 * unifying to the context of a UnificationError on the way out.
 */
unification_t unify(const TypePtr& l, const TypePtr& r,
                    Substitutions& substitutions) {
  const auto sl = apply_substitutions(l, substitutions);
  const auto sr = apply_substitutions(r, substitutions);
  try {
    UnifyDispatcher u{sl, sr, substitutions};
    sl->accept(u);
  } catch (UnificationError& e) {
    e.add_context(sl, sr);
    throw;
  }
  return unification_t{apply_substitutions(sl, substitutions)};
}

Nat unify_nats(const Nat& l, const Nat& r, Substitutions& substitutions) {
  const auto sl = apply_substitutions(l, substitutions);
  const auto sr = apply_substitutions(r, substitutions);
  if (sl == sr) return sl;
  if (sl.is_undetermined()) {
    add_nat_substitution(substitutions, sl.stamp(), sr);
    return sr;
  }
  if (sr.is_undetermined()) {
    add_nat_substitution(substitutions, sr.stamp(), sl);
    return sl;
  }
  throw UnificationError(
      fmt::format("Cannot unify nat {} with {}", print_nat(sl), print_nat(sr)));
}

OwnershipClass bound_class(const TypeParam& param) {
  if (param.copyable) return OwnershipClass::Copyable;
  if (param.droppable) return OwnershipClass::Affine;
  return OwnershipClass::Linear;
}

bool satisfies_bound(OwnershipClass c, const TypeParam& param) {
  return static_cast<int>(c) <= static_cast<int>(bound_class(param));
}

namespace {

OwnershipClass most_restrictive(OwnershipClass l, OwnershipClass r) {
  return static_cast<int>(l) < static_cast<int>(r) ? r : l;
}

class Classifier : public TypeVisitor {
 public:
  OwnershipClass result = OwnershipClass::Copyable;

  explicit Classifier(OwnershipClassifier* memo) : memo_(memo) {}

  void visit(const PrimitiveType& t) override { result = t.ownership(); }

  void visit(const TypeVar& t) override { result = bound_class(t.param()); }

  void visit(const UndeterminedType& t) override {
    throw std::logic_error(
        fmt::format("Cannot classify undetermined type {}", t.name()));
  }

  void visit(const TupleType& t) override {
    result = OwnershipClass::Copyable;
    for (const auto& e : t.types()) result = most_restrictive(result, sub(e));
  }

  void visit(const ArrayType& t) override { result = sub(t.element()); }

  void visit(const StructType& t) override {
    auto c = OwnershipClass::Copyable;
    for (const auto& f : t.fields()) c = most_restrictive(c, sub(f.type));
    result = c;
  }

  void visit(const FunctionType&) override {
    result = OwnershipClass::Copyable;
  }

  void visit(const OptionType& t) override { result = sub(t.inner()); }

 private:
  OwnershipClassifier* memo_;

  OwnershipClass sub(const TypePtr& t) {
    if (memo_) return memo_->classify(t);
    Classifier c{nullptr};
    t->accept(c);
    return c.result;
  }
};

}  // namespace

OwnershipClass OwnershipClassifier::classify(const TypePtr& t) {
  if (!t->is_closed()) {
    // Type variables are named per definition, so open types aren't
    // memoized.
    Classifier c{this};
    t->accept(c);
    return c.result;
  }
  const auto key = print_type(t);
  const auto it = cache_.find(key);
  if (it != cache_.end()) return it->second;
  Classifier c{this};
  t->accept(c);
  cache_.emplace(key, c.result);
  return c.result;
}

OwnershipClass classify(const TypePtr& t) {
  Classifier c{nullptr};
  t->accept(c);
  return c.result;
}

}  // namespace qsema::typing
