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

#include "qsema/signatures.h"

#include <fmt/core.h>

#include <initializer_list>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "qsema/diagnostics.h"

namespace qsema {

using typing::GenericParams;
using typing::Nat;
using typing::Ownership;
using typing::Param;
using typing::TypePtr;

typing::TypePtr Signature::function_type() const {
  std::vector<typing::ParamType> param_types;
  param_types.reserve(params.size());
  for (const auto& p : params) {
    param_types.push_back(typing::ParamType{p.type, p.ownership});
  }
  return typing::function_type(std::move(param_types), return_type, generics);
}

bool same_signature(const Signature& l, const Signature& r) {
  if (l.name != r.name || !(l.generics == r.generics) ||
      l.params.size() != r.params.size() ||
      !typing::equal(l.return_type, r.return_type)) {
    return false;
  }
  for (std::size_t i = 0; i < l.params.size(); ++i) {
    if (l.params[i].ownership != r.params[i].ownership ||
        !typing::equal(l.params[i].type, r.params[i].type)) {
      return false;
    }
  }
  return true;
}

bool same_struct(const typing::StructDecl& l, const typing::StructDecl& r) {
  if (&l == &r) return true;
  if (l.name() != r.name() || !(l.params() == r.params()) ||
      l.fields().size() != r.fields().size()) {
    return false;
  }
  for (std::size_t i = 0; i < l.fields().size(); ++i) {
    if (l.fields()[i].name != r.fields()[i].name ||
        !typing::equal(l.fields()[i].type, r.fields()[i].type)) {
      return false;
    }
  }
  return true;
}

std::string method_name(std::string_view owner, std::string_view method) {
  return fmt::format("{}.{}", owner, method);
}

namespace {

struct OperatorEntry {
  std::string_view op;
  std::string_view method;
};

constexpr OperatorEntry BINARY_OPERATORS[] = {
    {"+", "__add__"}, {"-", "__sub__"}, {"*", "__mul__"},  {"/", "__div__"},
    {"%", "__mod__"}, {"==", "__eq__"}, {"!=", "__ne__"},  {"<", "__lt__"},
    {"<=", "__le__"}, {">", "__gt__"},  {">=", "__ge__"},  {"and", "__and__"},
    {"or", "__or__"},
};

constexpr OperatorEntry UNARY_OPERATORS[] = {
    {"-", "__neg__"},
    {"not", "__not__"},
};

template <std::size_t N>
std::optional<std::string_view> find_operator(
    const OperatorEntry (&entries)[N], std::string_view op) {
  for (const auto& e : entries) {
    if (e.op == op) return e.method;
  }
  return std::nullopt;
}

}  // namespace

std::optional<std::string_view> binary_operator_method(std::string_view op) {
  return find_operator(BINARY_OPERATORS, op);
}

std::optional<std::string_view> unary_operator_method(std::string_view op) {
  return find_operator(UNARY_OPERATORS, op);
}

SignatureTable::SignatureTable() = default;

void SignatureTable::check_open(std::string_view name) const {
  if (finalized_) {
    throw std::logic_error(fmt::format(
        "Cannot register {} after the signature table is finalized", name));
  }
}

void SignatureTable::add(Signature signature) {
  check_open(signature.name);
  const auto it = signatures_.find(signature.name);
  if (it != signatures_.end()) {
    if (same_signature(it->second, signature)) return;
    throw SemanticError(
        ErrorKind::DuplicateDefinitionError,
        fmt::format("{} is already defined with a different signature at {}",
                    signature.name, it->second.location),
        signature.location, {signature.name});
  }
  auto name = signature.name;
  signatures_.emplace(std::move(name), std::move(signature));
}

void SignatureTable::add_struct(typing::StructDeclPtr decl, Location location) {
  check_open(decl->name());
  const auto it = structs_.find(decl->name());
  if (it != structs_.end()) {
    if (same_struct(*it->second, *decl)) return;
    throw SemanticError(
        ErrorKind::DuplicateDefinitionError,
        fmt::format("Struct {} is already defined differently", decl->name()),
        location, {decl->name()});
  }

  Signature constructor{.name = decl->name(),
                        .generics = decl->params(),
                        .params = {},
                        .return_type = nullptr,
                        .location = location};
  typing::TypeList type_args;
  for (const auto& p : decl->params().types) {
    type_args.push_back(std::make_shared<typing::TypeVar>(p));
  }
  std::vector<Nat> nat_args;
  for (const auto& n : decl->params().nats) {
    nat_args.push_back(Nat::variable(n));
  }
  constructor.return_type =
      typing::struct_type(decl, std::move(type_args), std::move(nat_args));
  for (const auto& f : decl->fields()) {
    constructor.params.push_back(Param{f.name, f.type, Ownership::Owned});
  }
  add(std::move(constructor));
  structs_.emplace(decl->name(), std::move(decl));
}

const Signature& SignatureTable::lookup(std::string_view name,
                                        const Location& location) const {
  const auto* signature = find(name);
  if (!signature) {
    throw SemanticError(ErrorKind::UnknownNameError,
                        fmt::format("Unknown function {}", name), location,
                        {std::string(name)});
  }
  return *signature;
}

const Signature* SignatureTable::find(std::string_view name) const {
  const auto it = signatures_.find(name);
  return it == signatures_.end() ? nullptr : &it->second;
}

const typing::StructDeclPtr& SignatureTable::lookup_struct(
    std::string_view name, const Location& location) const {
  const auto it = structs_.find(name);
  if (it == structs_.end()) {
    throw SemanticError(ErrorKind::UnknownNameError,
                        fmt::format("Unknown struct {}", name), location,
                        {std::string(name)});
  }
  return it->second;
}

typing::StructDeclPtr SignatureTable::find_struct(std::string_view name) const {
  const auto it = structs_.find(name);
  return it == structs_.end() ? nullptr : it->second;
}

const Signature* SignatureTable::find_method(const typing::TypePtr& receiver,
                                             std::string_view method) const {
  if (const auto* p = typing::as<typing::PrimitiveType>(receiver)) {
    return find(method_name(p->name(), method));
  }
  if (const auto* s = typing::as<typing::StructType>(receiver)) {
    return find(method_name(s->name(), method));
  }
  return nullptr;
}

namespace {

Param borrowed(std::string name, TypePtr type) {
  return Param{std::move(name), std::move(type), Ownership::Borrowed};
}

Param owned(std::string name, TypePtr type) {
  return Param{std::move(name), std::move(type), Ownership::Owned};
}

void add_builtin(SignatureTable& table, std::string name,
                 std::vector<Param> params, TypePtr return_type,
                 GenericParams generics = {}) {
  table.add(Signature{.name = std::move(name),
                      .generics = std::move(generics),
                      .params = std::move(params),
                      .return_type = std::move(return_type),
                      .location = Location{"<prelude>", 0}});
}

void add_operators(SignatureTable& table, std::string_view owner,
                   const TypePtr& self,
                   std::initializer_list<std::string_view> arithmetic,
                   std::initializer_list<std::string_view> comparisons,
                   std::initializer_list<std::string_view> unary) {
  for (const auto op : arithmetic) {
    add_builtin(table, method_name(owner, *binary_operator_method(op)),
                {borrowed("self", self), borrowed("other", self)}, self);
  }
  const auto& bool_type = typing::BuiltinTypes::get().bool_type();
  for (const auto op : comparisons) {
    add_builtin(table, method_name(owner, *binary_operator_method(op)),
                {borrowed("self", self), borrowed("other", self)}, bool_type);
  }
  for (const auto op : unary) {
    add_builtin(table, method_name(owner, *unary_operator_method(op)),
                {borrowed("self", self)}, self);
  }
}

}  // namespace

void install_prelude(SignatureTable& table) {
  const auto& b = typing::BuiltinTypes::get();
  const auto& qubit = b.qubit_type();
  const auto& none = b.none_type();

  add_builtin(table, "qubit", {}, qubit);
  for (const auto* gate : {"h", "x", "z", "s", "t", "reset"}) {
    add_builtin(table, gate, {borrowed("q", qubit)}, none);
  }
  add_builtin(table, "cx", {borrowed("c", qubit), borrowed("t", qubit)}, none);
  add_builtin(table, "measure", {owned("q", qubit)}, b.bool_type());
  add_builtin(table, "discard", {owned("q", qubit)}, none);

  add_builtin(table, "rng", {borrowed("seed", b.int_type())}, b.rng_type());
  add_builtin(table, method_name(typing::BuiltinTypes::RNG, "random_int"),
              {borrowed("self", b.rng_type())}, b.int_type());

  const GenericParams linear_t{.types = {{"T", false, false}}, .nats = {}};
  const GenericParams linear_t_n{.types = {{"T", false, false}},
                                 .nats = {"n"}};
  const GenericParams n_only{.types = {}, .nats = {"n"}};
  const auto t = typing::type_var("T", false, false);
  const auto n = Nat::variable("n");

  add_builtin(table, "len", {borrowed("a", typing::array_type(t, n))},
              b.nat_type(), linear_t_n);
  add_builtin(table, "range", {borrowed("stop", b.int_type())}, b.range_type());
  add_builtin(table, "nothing", {}, typing::option_type(t), linear_t);
  add_builtin(table, "some", {owned("v", t)}, typing::option_type(t), linear_t);
  add_builtin(table, "unwrap", {owned("o", typing::option_type(t))}, t,
              linear_t);
  add_builtin(table, "is_some", {borrowed("o", typing::option_type(t))},
              b.bool_type(), linear_t);
  add_builtin(table, "discard_array",
              {owned("a", typing::array_type(qubit, n))}, none, n_only);
  add_builtin(table, "measure_array",
              {owned("a", typing::array_type(qubit, n))},
              typing::array_type(b.bool_type(), n), n_only);
  add_builtin(table, "int", {borrowed("n", b.nat_type())}, b.int_type());
  add_builtin(table, "nat", {borrowed("i", b.int_type())}, b.nat_type());
  add_builtin(table, "float", {borrowed("i", b.int_type())}, b.float_type());

  add_operators(table, typing::BuiltinTypes::INT, b.int_type(),
                {"+", "-", "*", "/", "%"},
                {"==", "!=", "<", "<=", ">", ">="}, {"-"});
  add_operators(table, typing::BuiltinTypes::NAT, b.nat_type(),
                {"+", "-", "*", "/", "%"},
                {"==", "!=", "<", "<=", ">", ">="}, {});
  add_operators(table, typing::BuiltinTypes::FLOAT, b.float_type(),
                {"+", "-", "*", "/"}, {"==", "!=", "<", "<=", ">", ">="},
                {"-"});
  add_operators(table, typing::BuiltinTypes::BOOL, b.bool_type(),
                {"and", "or"}, {"==", "!="}, {"not"});
}

}  // namespace qsema
