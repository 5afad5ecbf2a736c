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

#include "qsema/typed_ast.h"

#include <fmt/core.h>

#include <memory>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include "qsema/signatures.h"

namespace qsema {

TypeRewriter::~TypeRewriter() = default;

typing::TypePtr SubstitutionRewriter::map_type(const typing::TypePtr& t) {
  return typing::apply_substitutions(t, substitutions_);
}

typing::Nat SubstitutionRewriter::map_nat(const typing::Nat& n) {
  return typing::apply_substitutions(n, substitutions_);
}

namespace {

std::vector<TExprPtr> map_exprs(const std::vector<TExprPtr>& exprs,
                                TypeRewriter& rewriter) {
  std::vector<TExprPtr> mapped;
  mapped.reserve(exprs.size());
  for (const auto& e : exprs) mapped.push_back(e->map_types(rewriter));
  return mapped;
}

}  // namespace

TExpr::TExpr(const Location& location, typing::TypePtr type)
    : location(location), type(std::move(type)) {}

TExpr::~TExpr() = default;
TExpr::Visitor::~Visitor() = default;

TIntLiteralExpr::TIntLiteralExpr(const Location& location, typing::TypePtr type,
                                 std::int64_t value)
    : TExpr(location, std::move(type)), value(value) {}

TExprPtr TIntLiteralExpr::map_types(TypeRewriter& rewriter) const {
  return std::make_unique<TIntLiteralExpr>(location, rewriter.map_type(type),
                                           value);
}

TFloatLiteralExpr::TFloatLiteralExpr(const Location& location, double value)
    : TExpr(location, typing::BuiltinTypes::get().float_type()),
      value(value) {}

TExprPtr TFloatLiteralExpr::map_types(TypeRewriter&) const {
  return std::make_unique<TFloatLiteralExpr>(location, value);
}

TBoolLiteralExpr::TBoolLiteralExpr(const Location& location, bool value)
    : TExpr(location, typing::BuiltinTypes::get().bool_type()), value(value) {}

TExprPtr TBoolLiteralExpr::map_types(TypeRewriter&) const {
  return std::make_unique<TBoolLiteralExpr>(location, value);
}

TNameExpr::TNameExpr(const Location& location, typing::TypePtr type,
                     std::string name, UseKind use)
    : TExpr(location, std::move(type)), name(std::move(name)), use(use) {}

TExprPtr TNameExpr::map_types(TypeRewriter& rewriter) const {
  return std::make_unique<TNameExpr>(location, rewriter.map_type(type), name,
                                     use);
}

TNatParamExpr::TNatParamExpr(const Location& location, std::string name)
    : TExpr(location, typing::BuiltinTypes::get().nat_type()),
      name(std::move(name)) {}

TExprPtr TNatParamExpr::map_types(TypeRewriter& rewriter) const {
  const auto n = rewriter.map_nat(typing::Nat::variable(name));
  switch (n.kind()) {
    case typing::Nat::Kind::Constant:
      return std::make_unique<TIntLiteralExpr>(
          location, type, static_cast<std::int64_t>(n.value()));
    case typing::Nat::Kind::Variable:
      return std::make_unique<TNatParamExpr>(location, n.name());
    case typing::Nat::Kind::Undetermined:
      break;
  }
  throw std::logic_error(
      fmt::format("Nat parameter {} mapped to {}", name, typing::print_nat(n)));
}

TFunctionRefExpr::TFunctionRefExpr(const Location& location,
                                   typing::TypePtr type, std::string name)
    : TExpr(location, std::move(type)), name(std::move(name)) {}

TExprPtr TFunctionRefExpr::map_types(TypeRewriter& rewriter) const {
  return std::make_unique<TFunctionRefExpr>(location, rewriter.map_type(type),
                                            name);
}

TTupleExpr::TTupleExpr(const Location& location, typing::TypePtr type,
                       std::vector<TExprPtr> elements)
    : TExpr(location, std::move(type)), elements(std::move(elements)) {}

TExprPtr TTupleExpr::map_types(TypeRewriter& rewriter) const {
  return std::make_unique<TTupleExpr>(location, rewriter.map_type(type),
                                      map_exprs(elements, rewriter));
}

TArrayExpr::TArrayExpr(const Location& location, typing::TypePtr type,
                       std::vector<TExprPtr> elements)
    : TExpr(location, std::move(type)), elements(std::move(elements)) {}

TExprPtr TArrayExpr::map_types(TypeRewriter& rewriter) const {
  return std::make_unique<TArrayExpr>(location, rewriter.map_type(type),
                                      map_exprs(elements, rewriter));
}

TCallExpr::TCallExpr(const Location& location, typing::TypePtr type,
                     std::string callee, CallKind kind,
                     std::vector<TExprPtr> args,
                     std::vector<typing::Ownership> param_ownership,
                     typing::TypeList type_args,
                     std::vector<typing::Nat> nat_args)
    : TExpr(location, std::move(type)),
      callee(std::move(callee)),
      kind(kind),
      args(std::move(args)),
      param_ownership(std::move(param_ownership)),
      type_args(std::move(type_args)),
      nat_args(std::move(nat_args)) {}

TExprPtr TCallExpr::map_types(TypeRewriter& rewriter) const {
  typing::TypeList mapped_type_args;
  mapped_type_args.reserve(type_args.size());
  for (const auto& t : type_args) {
    mapped_type_args.push_back(rewriter.map_type(t));
  }
  std::vector<typing::Nat> mapped_nat_args;
  mapped_nat_args.reserve(nat_args.size());
  for (const auto& n : nat_args) mapped_nat_args.push_back(rewriter.map_nat(n));
  auto call = std::make_unique<TCallExpr>(
      location, rewriter.map_type(type), callee, kind,
      map_exprs(args, rewriter), param_ownership, std::move(mapped_type_args),
      std::move(mapped_nat_args));
  call->specialization = specialization;
  rewriter.on_call(*call);
  return call;
}

TFieldExpr::TFieldExpr(const Location& location, typing::TypePtr type,
                       TExprPtr object, std::string field, std::size_t index,
                       UseKind use)
    : TExpr(location, std::move(type)),
      object(std::move(object)),
      field(std::move(field)),
      index(index),
      use(use) {}

TExprPtr TFieldExpr::map_types(TypeRewriter& rewriter) const {
  return std::make_unique<TFieldExpr>(location, rewriter.map_type(type),
                                      object->map_types(rewriter), field, index,
                                      use);
}

TSubscriptExpr::TSubscriptExpr(const Location& location, typing::TypePtr type,
                               TExprPtr array, TExprPtr index, UseKind use)
    : TExpr(location, std::move(type)),
      array(std::move(array)),
      index(std::move(index)),
      use(use) {}

TExprPtr TSubscriptExpr::map_types(TypeRewriter& rewriter) const {
  return std::make_unique<TSubscriptExpr>(
      location, rewriter.map_type(type), array->map_types(rewriter),
      index->map_types(rewriter), use);
}

const TNameExpr* place_root(const TExpr& e) {
  if (const auto* n = dynamic_cast<const TNameExpr*>(&e)) return n;
  if (const auto* f = dynamic_cast<const TFieldExpr*>(&e)) {
    return place_root(*f->object);
  }
  if (const auto* s = dynamic_cast<const TSubscriptExpr*>(&e)) {
    return place_root(*s->array);
  }
  return nullptr;
}

TStmt::TStmt(const Location& location) : location(location) {}

TStmt::~TStmt() = default;
TStmt::Visitor::~Visitor() = default;

TBlock map_types(const TBlock& block, TypeRewriter& rewriter) {
  TBlock mapped;
  mapped.reserve(block.size());
  for (const auto& s : block) mapped.push_back(s->map_types(rewriter));
  return mapped;
}

TAssignStmt::TAssignStmt(const Location& location, std::string target,
                         TExprPtr value)
    : TStmt(location), target(std::move(target)), value(std::move(value)) {}

TStmtPtr TAssignStmt::map_types(TypeRewriter& rewriter) const {
  return std::make_unique<TAssignStmt>(location, target,
                                       value->map_types(rewriter));
}

TTupleAssignStmt::TTupleAssignStmt(const Location& location,
                                   std::vector<std::string> targets,
                                   TExprPtr value)
    : TStmt(location), targets(std::move(targets)), value(std::move(value)) {}

TStmtPtr TTupleAssignStmt::map_types(TypeRewriter& rewriter) const {
  return std::make_unique<TTupleAssignStmt>(location, targets,
                                            value->map_types(rewriter));
}

TExprStmt::TExprStmt(const Location& location, TExprPtr expr)
    : TStmt(location), expr(std::move(expr)) {}

TStmtPtr TExprStmt::map_types(TypeRewriter& rewriter) const {
  return std::make_unique<TExprStmt>(location, expr->map_types(rewriter));
}

TReturnStmt::TReturnStmt(const Location& location, TExprPtr value)
    : TStmt(location), value(std::move(value)) {}

TStmtPtr TReturnStmt::map_types(TypeRewriter& rewriter) const {
  return std::make_unique<TReturnStmt>(
      location, value ? value->map_types(rewriter) : nullptr);
}

TIfStmt::TIfStmt(const Location& location, TExprPtr condition,
                 TBlock then_body, TBlock else_body)
    : TStmt(location),
      condition(std::move(condition)),
      then_body(std::move(then_body)),
      else_body(std::move(else_body)) {}

TStmtPtr TIfStmt::map_types(TypeRewriter& rewriter) const {
  return std::make_unique<TIfStmt>(location, condition->map_types(rewriter),
                                   qsema::map_types(then_body, rewriter),
                                   qsema::map_types(else_body, rewriter));
}

TWhileStmt::TWhileStmt(const Location& location, TExprPtr condition,
                       TBlock body)
    : TStmt(location), condition(std::move(condition)), body(std::move(body)) {}

TStmtPtr TWhileStmt::map_types(TypeRewriter& rewriter) const {
  return std::make_unique<TWhileStmt>(location, condition->map_types(rewriter),
                                      qsema::map_types(body, rewriter));
}

TForStmt::TForStmt(const Location& location, std::string variable,
                   typing::TypePtr variable_type, TExprPtr iterable,
                   TBlock body)
    : TStmt(location),
      variable(std::move(variable)),
      variable_type(std::move(variable_type)),
      iterable(std::move(iterable)),
      body(std::move(body)) {}

TStmtPtr TForStmt::map_types(TypeRewriter& rewriter) const {
  return std::make_unique<TForStmt>(
      location, variable, rewriter.map_type(variable_type),
      iterable->map_types(rewriter), qsema::map_types(body, rewriter));
}

TBreakStmt::TBreakStmt(const Location& location) : TStmt(location) {}

TStmtPtr TBreakStmt::map_types(TypeRewriter&) const {
  return std::make_unique<TBreakStmt>(location);
}

TContinueStmt::TContinueStmt(const Location& location) : TStmt(location) {}

TStmtPtr TContinueStmt::map_types(TypeRewriter&) const {
  return std::make_unique<TContinueStmt>(location);
}

std::string TFunction::qualified_name() const {
  return owner.empty() ? name : method_name(owner, name);
}

std::unique_ptr<TFunction> TFunction::map_types(TypeRewriter& rewriter) const {
  auto f = std::make_unique<TFunction>();
  f->location = location;
  f->name = name;
  f->owner = owner;
  f->generics = generics;
  f->params.reserve(params.size());
  for (const auto& p : params) {
    f->params.push_back(
        typing::Param{p.name, rewriter.map_type(p.type), p.ownership});
  }
  f->return_type = rewriter.map_type(return_type);
  f->body = qsema::map_types(body, rewriter);
  return f;
}

}  // namespace qsema
