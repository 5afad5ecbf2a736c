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

#include "qsema/checker.h"

#include <fmt/core.h>

#include <map>
#include <memory>
#include <set>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "qsema/diagnostics.h"

namespace qsema {

using typing::Nat;
using typing::Ownership;
using typing::TypePtr;

namespace {

TypePtr none_type() { return typing::BuiltinTypes::get().none_type(); }

void check_distinct_generics(const typing::GenericParams& generics,
                             const Location& location) {
  std::set<std::string> seen;
  for (const auto& p : generics.types) {
    if (!seen.insert(p.name).second) {
      throw SemanticError(ErrorKind::DuplicateDefinitionError,
                          fmt::format("Generic parameter {} is declared twice",
                                      p.name),
                          location, {p.name});
    }
  }
  for (const auto& n : generics.nats) {
    if (!seen.insert(n).second) {
      throw SemanticError(ErrorKind::DuplicateDefinitionError,
                          fmt::format("Generic parameter {} is declared twice",
                                      n),
                          location, {n});
    }
  }
}

/**
 * Checks that `t` mentions only the given generic parameters and
 * registered structs applied to the right number of arguments.
 */
class WellFormedChecker : public typing::TypeVisitor {
 public:
  WellFormedChecker(const typing::GenericParams& generics,
                    const SignatureTable& table, const Location& location)
      : generics_(generics), table_(table), location_(location) {}

  void check(const TypePtr& t) { t->accept(*this); }

  void visit(const typing::PrimitiveType&) override {}

  void visit(const typing::TypeVar& t) override {
    if (!generics_.find_type(t.name())) {
      throw SemanticError(ErrorKind::UnknownNameError,
                          fmt::format("Unknown type parameter {}", t.name()),
                          location_, {t.name()});
    }
  }

  void visit(const typing::UndeterminedType& t) override {
    throw std::logic_error(fmt::format(
        "Declared type mentions undetermined type {}", t.name()));
  }

  void visit(const typing::TupleType& t) override {
    for (const auto& e : t.types()) check(e);
  }

  void visit(const typing::ArrayType& t) override {
    check(t.element());
    check(t.length());
  }

  void visit(const typing::StructType& t) override {
    const auto registered = table_.find_struct(t.name());
    if (!registered) {
      throw SemanticError(ErrorKind::UnknownNameError,
                          fmt::format("Unknown struct {}", t.name()), location_,
                          {t.name()});
    }
    if (!same_struct(*registered, *t.decl())) {
      throw SemanticError(
          ErrorKind::TypeMismatchError,
          fmt::format("Struct {} does not match its registered declaration",
                      t.name()),
          location_, {t.name()});
    }
    const auto& params = t.decl()->params();
    if (t.type_args().size() != params.types.size() ||
        t.nat_args().size() != params.nats.size()) {
      throw SemanticError(
          ErrorKind::ArityMismatchError,
          fmt::format("Struct {} takes {} type and {} nat arguments", t.name(),
                      params.types.size(), params.nats.size()),
          location_, {t.name()});
    }
    for (const auto& a : t.type_args()) check(a);
    for (const auto& n : t.nat_args()) check(n);
  }

  void visit(const typing::FunctionType& t) override {
    for (const auto& p : t.params()) check(p.type);
    check(t.result());
  }

  void visit(const typing::OptionType& t) override { check(t.inner()); }

 private:
  const typing::GenericParams& generics_;
  const SignatureTable& table_;
  const Location& location_;

  void check(const Nat& n) {
    if (n.is_variable() && !generics_.has_nat(n.name())) {
      throw SemanticError(ErrorKind::UnknownNameError,
                          fmt::format("Unknown nat parameter {}", n.name()),
                          location_, {n.name()});
    }
  }
};

void check_well_formed(const TypePtr& t, const typing::GenericParams& generics,
                       const SignatureTable& table, const Location& location) {
  WellFormedChecker c{generics, table, location};
  c.check(t);
}

/** Collects the names assigned anywhere in a function body. */
class AssignedNameCollector : public Stmt::Visitor {
 public:
  std::set<std::string> names;

  void collect(const std::vector<std::unique_ptr<Stmt>>& body) {
    for (const auto& s : body) s->accept(*this);
  }

  void visitAssignStmt(const AssignStmt& s) override {
    names.insert(s.target);
  }

  void visitTupleAssignStmt(const TupleAssignStmt& s) override {
    names.insert(s.targets.begin(), s.targets.end());
  }

  void visitExprStmt(const ExprStmt&) override {}
  void visitReturnStmt(const ReturnStmt&) override {}

  void visitIfStmt(const IfStmt& s) override {
    collect(s.then_body);
    collect(s.else_body);
  }

  void visitWhileStmt(const WhileStmt& s) override { collect(s.body); }

  void visitForStmt(const ForStmt& s) override {
    names.insert(s.variable);
    collect(s.body);
  }

  void visitBreakStmt(const BreakStmt&) override {}
  void visitContinueStmt(const ContinueStmt&) override {}
};

/**
 * The local bindings on the current control-flow path.
 *
 * Statements after a return, break or continue are still checked
 * against the bindings in effect at the jump, but the environment is
 * marked unreachable so that it does not take part in merges.
 */
struct Env {
  std::map<std::string, TypePtr> bindings;
  bool reachable = true;
};

struct PendingInstantiation {
  Location location;
  std::string callee;
  typing::GenericParams generics;
  typing::TypeList type_args;
  std::vector<Nat> nat_args;
};

struct PendingBinding {
  Location location;
  std::string name;
};

struct LoopFrame {
  std::vector<Env> breaks;
  std::vector<Env> continues;
};

bool is_comparison(std::string_view method) {
  return method == "__eq__" || method == "__ne__" || method == "__lt__" ||
         method == "__le__" || method == "__gt__" || method == "__ge__";
}

}  // namespace

class CheckerImpl {
 public:
  explicit CheckerImpl(const SignatureTable& table) : table_(table) {}

  std::unique_ptr<TFunction> check_function(const FunctionDef& def,
                                            const StructDef* owner);
  std::vector<std::unique_ptr<TFunction>> check_struct(const StructDef& def);

  const SignatureTable& table() const { return table_; }
  typing::StampGenerator& stamper() { return stamper_; }
  typing::OwnershipClassifier& classifier() { return classifier_; }

 private:
  const SignatureTable& table_;
  typing::StampGenerator stamper_;
  typing::OwnershipClassifier classifier_;
};

namespace {

/** Checks the body of one function. */
class FunctionChecker : public Stmt::Visitor {
 public:
  FunctionChecker(CheckerImpl& checker, std::string name,
                  typing::GenericParams generics, TypePtr return_type)
      : checker_(checker),
        name_(std::move(name)),
        generics_(std::move(generics)),
        return_type_(std::move(return_type)) {}

  void bind_param(const typing::Param& p) { env_.bindings[p.name] = p.type; }

  void collect_assigned_names(const std::vector<std::unique_ptr<Stmt>>& body) {
    AssignedNameCollector c;
    c.collect(body);
    assigned_ = std::move(c.names);
  }

  TBlock check_block(const std::vector<std::unique_ptr<Stmt>>& stmts) {
    TBlock block;
    block.reserve(stmts.size());
    for (const auto& s : stmts) block.push_back(check_stmt(*s));
    return block;
  }

  bool falls_through() const { return env_.reachable; }

  const typing::Substitutions& substitutions() const { return subs_; }

  TExprPtr check_expr(const Expr& e, const TypePtr& expected, UseKind ctx);

  /** Unifies the type of `e` with `t`, or throws TypeMismatchError. */
  void expect(const TExpr& e, const TypePtr& t, const Location& location,
              std::string_view what) {
    try {
      typing::unify(t, e.type, subs_);
    } catch (typing::UnificationError& err) {
      throw SemanticError(ErrorKind::TypeMismatchError, err, location,
                          {std::string(what)});
    }
  }

  TypePtr apply(const TypePtr& t) const {
    return typing::apply_substitutions(t, subs_);
  }

  TypePtr undetermined_type() {
    return std::make_shared<typing::UndeterminedType>(checker_.stamper());
  }

  const SignatureTable& checker_table() const { return checker_.table(); }

  void check_annotation(const TypePtr& t, const Location& location) const {
    check_well_formed(t, generics_, checker_.table(), location);
  }

  /** How a place of type `t` used in context `ctx` is recorded. */
  UseKind place_use(const TypePtr& t, UseKind ctx) {
    const auto resolved = apply(t);
    if (!resolved->free_variables().has_undetermined() &&
        checker_.classifier().classify(resolved) ==
            typing::OwnershipClass::Copyable) {
      return UseKind::Read;
    }
    return ctx;
  }

  void set_use(TExpr& e, UseKind ctx) {
    if (auto* n = dynamic_cast<TNameExpr*>(&e)) {
      n->use = place_use(n->type, ctx);
    } else if (auto* f = dynamic_cast<TFieldExpr*>(&e)) {
      f->use = place_use(f->type, ctx);
    } else if (auto* s = dynamic_cast<TSubscriptExpr*>(&e)) {
      s->use = place_use(s->type, ctx);
    }
  }

  TExprPtr lookup_name(const std::string& name, const Location& location,
                       UseKind ctx) {
    const auto it = env_.bindings.find(name);
    if (it != env_.bindings.end()) {
      return std::make_unique<TNameExpr>(location, it->second, name,
                                         place_use(it->second, ctx));
    }
    if (assigned_.contains(name)) {
      throw SemanticError(
          ErrorKind::UseBeforeDefinitionError,
          fmt::format("{} is used before it is defined", name), location,
          {name});
    }
    if (generics_.has_nat(name)) {
      return std::make_unique<TNatParamExpr>(location, name);
    }
    if (const auto* sig = checker_.table().find(name)) {
      if (sig->is_generic()) {
        throw SemanticError(
            ErrorKind::TypeMismatchError,
            fmt::format("Generic function {} can only be called", name),
            location, {name});
      }
      return std::make_unique<TFunctionRefExpr>(location, sig->function_type(),
                                                name);
    }
    throw SemanticError(ErrorKind::UnknownNameError,
                        fmt::format("Unknown name {}", name), location, {name});
  }

  TExprPtr check_call(const std::string& callee,
                      const std::vector<const Expr*>& args,
                      const Location& location, const TypePtr& expected) {
    const auto it = env_.bindings.find(callee);
    if (it != env_.bindings.end()) {
      return check_local_call(callee, it->second, args, location, expected);
    }
    if (assigned_.contains(callee)) {
      throw SemanticError(
          ErrorKind::UseBeforeDefinitionError,
          fmt::format("{} is used before it is defined", callee), location,
          {callee});
    }
    const auto* sig = checker_.table().find(callee);
    if (!sig) {
      throw SemanticError(ErrorKind::UnknownNameError,
                          fmt::format("Unknown function {}", callee), location,
                          {callee});
    }
    const auto kind = checker_.table().find_struct(callee)
                          ? CallKind::Constructor
                          : CallKind::Function;
    return check_signature_call(*sig, kind, nullptr, args, location, expected);
  }

  /**
   * Checks a call of a registered signature.
   *
   * The generic parameters are instantiated with fresh undetermined
   * types and nats, which the expected type and then the arguments
   * determine.
   */
  TExprPtr check_signature_call(const Signature& sig, CallKind kind,
                                TExprPtr receiver,
                                const std::vector<const Expr*>& args,
                                const Location& location,
                                const TypePtr& expected) {
    const auto arg_count = args.size() + (receiver ? 1 : 0);
    if (arg_count != sig.params.size()) {
      throw SemanticError(
          ErrorKind::ArityMismatchError,
          fmt::format("{} takes {} arguments but {} were given", sig.name,
                      sig.params.size(), arg_count),
          location, {sig.name});
    }
    const auto inst =
        typing::fresh_instantiation(sig.generics, checker_.stamper());
    const auto result = typing::instantiate(sig.return_type, inst);
    if (expected) {
      try {
        typing::unify(expected, result, subs_);
      } catch (typing::UnificationError& err) {
        throw SemanticError(ErrorKind::TypeMismatchError, err, location,
                            {sig.name});
      }
    }

    std::vector<TExprPtr> targs;
    std::vector<Ownership> ownership;
    std::size_t i = 0;
    if (receiver) {
      const auto& self = sig.params[0];
      expect(*receiver, typing::instantiate(self.type, inst), location,
             sig.name);
      set_use(*receiver, use_for(self.ownership));
      targs.push_back(std::move(receiver));
      ownership.push_back(self.ownership);
      i = 1;
    }
    for (const auto* a : args) {
      const auto& p = sig.params[i++];
      const auto param_type = typing::instantiate(p.type, inst);
      auto e = check_expr(*a, param_type, use_for(p.ownership));
      expect(*e, param_type, a->location, sig.name);
      targs.push_back(std::move(e));
      ownership.push_back(p.ownership);
    }

    typing::TypeList type_args;
    for (const auto& p : sig.generics.types) {
      type_args.push_back(inst.types.at(p.name));
    }
    std::vector<Nat> nat_args;
    for (const auto& n : sig.generics.nats) nat_args.push_back(inst.nats.at(n));
    if (!sig.generics.empty()) {
      pending_.push_back(PendingInstantiation{location, sig.name, sig.generics,
                                              type_args, nat_args});
    }
    return std::make_unique<TCallExpr>(location, result, sig.name, kind,
                                       std::move(targs), std::move(ownership),
                                       std::move(type_args),
                                       std::move(nat_args));
  }

  /** Checks a call of a function value held in a local binding. */
  TExprPtr check_local_call(const std::string& callee, const TypePtr& type,
                            const std::vector<const Expr*>& args,
                            const Location& location, const TypePtr& expected) {
    const auto t = apply(type);
    const auto* f = typing::as<typing::FunctionType>(t);
    if (!f) {
      throw SemanticError(
          ErrorKind::TypeMismatchError,
          fmt::format("{} has type {} and cannot be called", callee,
                      typing::print_type(
                          t, typing::CanonicalizeUndeterminedTypes::YES)),
          location, {callee});
    }
    if (args.size() != f->params().size()) {
      throw SemanticError(
          ErrorKind::ArityMismatchError,
          fmt::format("{} takes {} arguments but {} were given", callee,
                      f->params().size(), args.size()),
          location, {callee});
    }
    if (expected) {
      try {
        typing::unify(expected, f->result(), subs_);
      } catch (typing::UnificationError& err) {
        throw SemanticError(ErrorKind::TypeMismatchError, err, location,
                            {callee});
      }
    }
    std::vector<TExprPtr> targs;
    std::vector<Ownership> ownership;
    for (std::size_t i = 0; i < args.size(); ++i) {
      const auto& p = f->params()[i];
      auto e = check_expr(*args[i], p.type, use_for(p.ownership));
      expect(*e, p.type, args[i]->location, callee);
      targs.push_back(std::move(e));
      ownership.push_back(p.ownership);
    }
    return std::make_unique<TCallExpr>(location, f->result(), callee,
                                       CallKind::Local, std::move(targs),
                                       std::move(ownership));
  }

  TExprPtr check_method_call(TExprPtr receiver, std::string_view method,
                             const std::vector<const Expr*>& args,
                             const Location& location,
                             const TypePtr& expected) {
    const auto t = apply(receiver->type);
    const auto* sig = checker_.table().find_method(t, method);
    if (!sig) {
      if (t->free_variables().has_undetermined()) {
        throw SemanticError(
            ErrorKind::UnresolvedParameterError,
            fmt::format("Cannot call {} on a value of undetermined type {}",
                        method, typing::print_type(t)),
            location, {std::string(method)});
      }
      throw SemanticError(ErrorKind::UnknownNameError,
                          fmt::format("{} has no method {}",
                                      typing::print_type(t), method),
                          location, {std::string(method)});
    }
    return check_signature_call(*sig, CallKind::Method, std::move(receiver),
                                args, location, expected);
  }

  void visitAssignStmt(const AssignStmt& s) override {
    if (s.annotation) check_annotation(s.annotation, s.location);
    auto value = check_expr(*s.value, s.annotation, UseKind::Consume);
    if (s.annotation) expect(*value, s.annotation, s.location, s.target);
    bind(s.target, s.annotation ? s.annotation : value->type, s.location);
    result_ = std::make_unique<TAssignStmt>(s.location, s.target,
                                            std::move(value));
  }

  void visitTupleAssignStmt(const TupleAssignStmt& s) override {
    std::set<std::string> seen;
    typing::TypeList element_types;
    for (const auto& t : s.targets) {
      if (!seen.insert(t).second) {
        throw SemanticError(ErrorKind::DuplicateDefinitionError,
                            fmt::format("{} is bound twice", t), s.location,
                            {t});
      }
      element_types.push_back(undetermined_type());
    }
    const auto tuple = typing::tuple_type(element_types);
    auto value = check_expr(*s.value, tuple, UseKind::Consume);
    expect(*value, tuple, s.location, "tuple assignment");
    for (std::size_t i = 0; i < s.targets.size(); ++i) {
      bind(s.targets[i], element_types[i], s.location);
    }
    result_ = std::make_unique<TTupleAssignStmt>(s.location, s.targets,
                                                 std::move(value));
  }

  void visitExprStmt(const ExprStmt& s) override {
    result_ = std::make_unique<TExprStmt>(
        s.location, check_expr(*s.expr, nullptr, UseKind::Consume));
  }

  void visitReturnStmt(const ReturnStmt& s) override {
    TExprPtr value;
    if (s.value) {
      value = check_expr(*s.value, return_type_, UseKind::Consume);
      expect(*value, return_type_, s.location, name_);
    } else {
      try {
        typing::unify(return_type_, none_type(), subs_);
      } catch (typing::UnificationError& err) {
        throw SemanticError(ErrorKind::TypeMismatchError, err, s.location,
                            {name_});
      }
    }
    env_.reachable = false;
    result_ = std::make_unique<TReturnStmt>(s.location, std::move(value));
  }

  void visitIfStmt(const IfStmt& s) override {
    auto condition = check_condition(*s.condition);
    const Env before = env_;
    auto then_body = check_block(s.then_body);
    Env after_then = std::move(env_);
    env_ = before;
    auto else_body = check_block(s.else_body);
    env_ = merge(after_then, env_, s.location);
    result_ = std::make_unique<TIfStmt>(s.location, std::move(condition),
                                        std::move(then_body),
                                        std::move(else_body));
  }

  void visitWhileStmt(const WhileStmt& s) override {
    auto condition = check_condition(*s.condition);
    auto body = check_loop_body(s.body, s.location);
    result_ = std::make_unique<TWhileStmt>(s.location, std::move(condition),
                                           std::move(body));
  }

  void visitForStmt(const ForStmt& s) override {
    auto iterable = check_expr(*s.iterable, nullptr, UseKind::Consume);
    const auto t = apply(iterable->type);
    TypePtr variable_type;
    if (typing::primitive_name(t) == typing::BuiltinTypes::RANGE) {
      variable_type = typing::BuiltinTypes::get().int_type();
    } else if (const auto* a = typing::as<typing::ArrayType>(t)) {
      variable_type = a->element();
    } else {
      throw SemanticError(
          ErrorKind::TypeMismatchError,
          fmt::format("Cannot iterate over a value of type {}",
                      typing::print_type(
                          t, typing::CanonicalizeUndeterminedTypes::YES)),
          s.location, {s.variable});
    }
    if (variable_type->free_variables().has_undetermined()) {
      throw SemanticError(
          ErrorKind::UnresolvedParameterError,
          fmt::format("Cannot infer the type of loop variable {}", s.variable),
          s.location, {s.variable});
    }
    const Env saved = env_;
    env_.bindings[s.variable] = variable_type;
    auto body = check_loop_body(s.body, s.location);
    // The loop may run zero times.
    env_ = merge(saved, env_, s.location);
    result_ = std::make_unique<TForStmt>(s.location, s.variable, variable_type,
                                         std::move(iterable), std::move(body));
  }

  void visitBreakStmt(const BreakStmt& s) override {
    current_loop(s.location, "break").breaks.push_back(env_);
    env_.reachable = false;
    result_ = std::make_unique<TBreakStmt>(s.location);
  }

  void visitContinueStmt(const ContinueStmt& s) override {
    current_loop(s.location, "continue").continues.push_back(env_);
    env_.reachable = false;
    result_ = std::make_unique<TContinueStmt>(s.location);
  }

 private:
  CheckerImpl& checker_;
  const std::string name_;
  const typing::GenericParams generics_;
  const TypePtr return_type_;
  typing::Substitutions subs_;
  Env env_;
  std::set<std::string> assigned_;
  std::vector<LoopFrame> loops_;
  std::vector<PendingInstantiation> pending_;
  std::vector<PendingBinding> pending_bindings_;
  TStmtPtr result_;

  static UseKind use_for(Ownership ownership) {
    return ownership == Ownership::Owned ? UseKind::Consume : UseKind::Borrow;
  }

  TStmtPtr check_stmt(const Stmt& s) {
    auto saved_pending = std::exchange(pending_, {});
    auto saved_bindings = std::exchange(pending_bindings_, {});
    s.accept(*this);
    resolve_pending();
    pending_ = std::move(saved_pending);
    pending_bindings_ = std::move(saved_bindings);
    return std::move(result_);
  }

  void bind(const std::string& name, const TypePtr& type,
            const Location& location) {
    env_.bindings[name] = type;
    pending_bindings_.push_back(PendingBinding{location, name});
  }

  /**
   * At the end of a statement, every generic instantiation and every
   * binding it introduced must be resolved.
   */
  void resolve_pending() {
    for (const auto& p : pending_) {
      for (std::size_t i = 0; i < p.type_args.size(); ++i) {
        const auto t = apply(p.type_args[i]);
        const auto& param = p.generics.types[i];
        if (t->free_variables().has_undetermined()) {
          throw SemanticError(
              ErrorKind::UnresolvedParameterError,
              fmt::format("Cannot infer type parameter {} of {}; add a type "
                          "annotation",
                          param.name, p.callee),
              p.location, {p.callee, param.name});
        }
        if (!typing::satisfies_bound(checker_.classifier().classify(t),
                                     param)) {
          throw SemanticError(
              ErrorKind::TypeMismatchError,
              fmt::format("{} is {} and cannot instantiate type parameter {} "
                          "of {}",
                          typing::print_type(t),
                          checker_.classifier().classify(t), param.name,
                          p.callee),
              p.location, {p.callee, param.name});
        }
      }
      for (std::size_t i = 0; i < p.nat_args.size(); ++i) {
        if (typing::apply_substitutions(p.nat_args[i], subs_)
                .is_undetermined()) {
          throw SemanticError(
              ErrorKind::UnresolvedParameterError,
              fmt::format("Cannot infer nat parameter {} of {}; add a type "
                          "annotation",
                          p.generics.nats[i], p.callee),
              p.location, {p.callee, p.generics.nats[i]});
        }
      }
    }
    for (const auto& b : pending_bindings_) {
      const auto it = env_.bindings.find(b.name);
      if (it == env_.bindings.end()) continue;
      auto t = apply(it->second);
      if (t->free_variables().has_undetermined()) {
        throw SemanticError(
            ErrorKind::UnresolvedParameterError,
            fmt::format("Cannot infer the type of {}: {}", b.name,
                        typing::print_type(
                            t, typing::CanonicalizeUndeterminedTypes::YES)),
            b.location, {b.name});
      }
      it->second = std::move(t);
    }
  }

  TExprPtr check_condition(const Expr& e) {
    const auto& bool_type = typing::BuiltinTypes::get().bool_type();
    auto condition = check_expr(e, bool_type, UseKind::Borrow);
    expect(*condition, bool_type, e.location, "condition");
    return condition;
  }

  /**
   * Checks a loop body against the loop entry environment.
   *
   * The loop head joins the entry with every back edge; the exit
   * joins the head with every break.
   */
  TBlock check_loop_body(const std::vector<std::unique_ptr<Stmt>>& stmts,
                         const Location& location) {
    const Env entry = env_;
    loops_.emplace_back();
    auto body = check_block(stmts);
    LoopFrame frame = std::move(loops_.back());
    loops_.pop_back();
    Env head = merge(entry, env_, location);
    for (const auto& c : frame.continues) head = merge(head, c, location);
    for (const auto& b : frame.breaks) head = merge(head, b, location);
    env_ = std::move(head);
    return body;
  }

  LoopFrame& current_loop(const Location& location, std::string_view what) {
    if (loops_.empty()) {
      throw SemanticError(ErrorKind::TypeMismatchError,
                          fmt::format("{} outside of a loop", what), location,
                          {std::string(what)});
    }
    return loops_.back();
  }

  /**
   * Joins two environments.
   *
   * A binding present on both paths must have a single type. A
   * binding present on one path keeps its type; whether it is defined
   * is left to definite-assignment analysis.
   */
  Env merge(const Env& l, const Env& r, const Location& location) {
    if (!l.reachable && r.reachable) return r;
    if (!r.reachable) {
      if (l.reachable) return l;
      Env dead = l;
      dead.bindings.insert(r.bindings.begin(), r.bindings.end());
      return dead;
    }
    Env merged = l;
    for (const auto& [name, type] : r.bindings) {
      const auto it = merged.bindings.find(name);
      if (it == merged.bindings.end()) {
        merged.bindings.emplace(name, type);
        continue;
      }
      try {
        it->second = typing::unify(it->second, type, subs_).unified_type;
      } catch (typing::UnificationError& err) {
        throw SemanticError(
            ErrorKind::InconsistentBindingTypeError,
            fmt::format("{} has type {} on one path and {} on another", name,
                        typing::print_type(apply(it->second)),
                        typing::print_type(apply(type))),
            location, {name});
      }
    }
    return merged;
  }
};

class ExprChecker : public Expr::Visitor {
 public:
  TExprPtr result;

  ExprChecker(FunctionChecker& fc, const TypePtr& expected, UseKind ctx)
      : fc_(fc), expected_(expected), ctx_(ctx) {}

  void visitIntLiteralExpr(const IntLiteralExpr& e) override {
    const auto& b = typing::BuiltinTypes::get();
    auto type = b.int_type();
    if (expected_ && e.value >= 0 &&
        typing::primitive_name(fc_.apply(expected_)) ==
            typing::BuiltinTypes::NAT) {
      type = b.nat_type();
    }
    result = std::make_unique<TIntLiteralExpr>(e.location, type, e.value);
  }

  void visitFloatLiteralExpr(const FloatLiteralExpr& e) override {
    result = std::make_unique<TFloatLiteralExpr>(e.location, e.value);
  }

  void visitBoolLiteralExpr(const BoolLiteralExpr& e) override {
    result = std::make_unique<TBoolLiteralExpr>(e.location, e.value);
  }

  void visitNameExpr(const NameExpr& e) override {
    result = fc_.lookup_name(e.name, e.location, ctx_);
  }

  void visitTupleExpr(const TupleExpr& e) override {
    const typing::TupleType* hint = nullptr;
    TypePtr expected;
    if (expected_) {
      expected = fc_.apply(expected_);
      hint = typing::as<typing::TupleType>(expected);
      if (hint && hint->types().size() != e.elements.size()) hint = nullptr;
    }
    std::vector<TExprPtr> elements;
    typing::TypeList types;
    for (std::size_t i = 0; i < e.elements.size(); ++i) {
      auto el = fc_.check_expr(*e.elements[i],
                               hint ? hint->types()[i] : nullptr,
                               UseKind::Consume);
      types.push_back(el->type);
      elements.push_back(std::move(el));
    }
    result = std::make_unique<TTupleExpr>(
        e.location, typing::tuple_type(std::move(types)), std::move(elements));
  }

  void visitArrayExpr(const ArrayExpr& e) override {
    TypePtr element_type;
    if (expected_) {
      const auto expected = fc_.apply(expected_);
      if (const auto* a = typing::as<typing::ArrayType>(expected)) {
        element_type = a->element();
      }
    }
    if (!element_type) element_type = fc_.undetermined_type();
    std::vector<TExprPtr> elements;
    for (const auto& el : e.elements) {
      auto t = fc_.check_expr(*el, element_type, UseKind::Consume);
      fc_.expect(*t, element_type, el->location, "array element");
      elements.push_back(std::move(t));
    }
    result = std::make_unique<TArrayExpr>(
        e.location,
        typing::array_type(fc_.apply(element_type),
                           Nat::constant(e.elements.size())),
        std::move(elements));
  }

  void visitCallExpr(const CallExpr& e) override {
    result = fc_.check_call(e.callee, args_of(e.args), e.location, expected_);
  }

  void visitMethodCallExpr(const MethodCallExpr& e) override {
    auto receiver = fc_.check_expr(*e.receiver, nullptr, UseKind::Borrow);
    result = fc_.check_method_call(std::move(receiver), e.method,
                                   args_of(e.args), e.location, expected_);
  }

  void visitFieldExpr(const FieldExpr& e) override {
    auto object = fc_.check_expr(*e.object, nullptr, UseKind::Borrow);
    const auto t = fc_.apply(object->type);
    const auto* s = typing::as<typing::StructType>(t);
    if (!s) {
      throw SemanticError(
          ErrorKind::TypeMismatchError,
          fmt::format("Cannot access field {} of non-struct type {}", e.field,
                      typing::print_type(
                          t, typing::CanonicalizeUndeterminedTypes::YES)),
          e.location, {e.field});
    }
    const auto index = s->decl()->field_index(e.field);
    if (!index) {
      throw SemanticError(
          ErrorKind::UnknownNameError,
          fmt::format("{} has no field {}", s->name(), e.field), e.location,
          {e.field});
    }
    const auto field_type = s->fields()[*index].type;
    result = std::make_unique<TFieldExpr>(e.location, field_type,
                                          std::move(object), e.field, *index,
                                          fc_.place_use(field_type, ctx_));
  }

  void visitSubscriptExpr(const SubscriptExpr& e) override {
    auto array = fc_.check_expr(*e.array, nullptr, UseKind::Borrow);
    const auto t = fc_.apply(array->type);
    const auto* a = typing::as<typing::ArrayType>(t);
    if (!a) {
      throw SemanticError(
          ErrorKind::TypeMismatchError,
          fmt::format("Cannot index a value of type {}",
                      typing::print_type(
                          t, typing::CanonicalizeUndeterminedTypes::YES)),
          e.location, {});
    }
    auto index = fc_.check_expr(*e.index, nullptr, UseKind::Borrow);
    const auto index_type = fc_.apply(index->type);
    const auto name = typing::primitive_name(index_type);
    if (name != typing::BuiltinTypes::INT &&
        name != typing::BuiltinTypes::NAT) {
      if (!index_type->free_variables().has_undetermined()) {
        throw SemanticError(
            ErrorKind::TypeMismatchError,
            fmt::format("Array index must be int or nat, not {}",
                        typing::print_type(index_type)),
            e.index->location, {});
      }
      fc_.expect(*index, typing::BuiltinTypes::get().int_type(),
                 e.index->location, "array index");
    }
    const auto element_type = a->element();
    result = std::make_unique<TSubscriptExpr>(e.location, element_type,
                                              std::move(array),
                                              std::move(index),
                                              fc_.place_use(element_type, ctx_));
  }

  void visitBinaryOpExpr(const BinaryOpExpr& e) override {
    const auto method = binary_operator_method(e.op);
    if (!method) {
      throw SemanticError(ErrorKind::UnknownNameError,
                          fmt::format("Unknown operator {}", e.op), e.location,
                          {e.op});
    }
    const TypePtr hint = is_comparison(*method) ? nullptr : expected_;
    auto left = fc_.check_expr(*e.left, hint, UseKind::Borrow);
    result = check_operator(std::move(left), e.op, *method, {e.right.get()},
                            e.location);
  }

  void visitUnaryOpExpr(const UnaryOpExpr& e) override {
    const auto method = unary_operator_method(e.op);
    if (!method) {
      throw SemanticError(ErrorKind::UnknownNameError,
                          fmt::format("Unknown operator {}", e.op), e.location,
                          {e.op});
    }
    auto operand = fc_.check_expr(*e.operand, expected_, UseKind::Borrow);
    result = check_operator(std::move(operand), e.op, *method, {}, e.location);
  }

  void visitAnnotatedExpr(const AnnotatedExpr& e) override {
    fc_.check_annotation(e.type, e.location);
    auto inner = fc_.check_expr(*e.expr, e.type, ctx_);
    fc_.expect(*inner, e.type, e.location, "annotation");
    result = std::move(inner);
  }

 private:
  FunctionChecker& fc_;
  const TypePtr& expected_;
  const UseKind ctx_;

  static std::vector<const Expr*> args_of(
      const std::vector<std::unique_ptr<Expr>>& args) {
    std::vector<const Expr*> v;
    v.reserve(args.size());
    for (const auto& a : args) v.push_back(a.get());
    return v;
  }

  TExprPtr check_operator(TExprPtr left, const std::string& op,
                          std::string_view method,
                          const std::vector<const Expr*>& args,
                          const Location& location) {
    const auto t = fc_.apply(left->type);
    if (!fc_.checker_table().find_method(t, method)) {
      throw SemanticError(
          ErrorKind::TypeMismatchError,
          fmt::format("Operator {} is not defined for {}", op,
                      typing::print_type(
                          t, typing::CanonicalizeUndeterminedTypes::YES)),
          location, {op});
    }
    return fc_.check_method_call(std::move(left), method, args, location,
                                 is_comparison(method) ? nullptr : expected_);
  }
};

}  // namespace

namespace {

TExprPtr FunctionChecker::check_expr(const Expr& e, const TypePtr& expected,
                                     UseKind ctx) {
  ExprChecker checker{*this, expected, ctx};
  e.accept(checker);
  return std::move(checker.result);
}

/** The type of `self` in the methods of `decl`. */
TypePtr self_type(const typing::StructDeclPtr& decl) {
  typing::TypeList type_args;
  for (const auto& p : decl->params().types) {
    type_args.push_back(std::make_shared<typing::TypeVar>(p));
  }
  std::vector<Nat> nat_args;
  for (const auto& n : decl->params().nats) {
    nat_args.push_back(Nat::variable(n));
  }
  return typing::struct_type(decl, std::move(type_args), std::move(nat_args));
}

}  // namespace

Signature function_signature(const FunctionDef& def) {
  return Signature{.name = def.name,
                   .generics = def.generics,
                   .params = def.params,
                   .return_type = def.return_type ? def.return_type : none_type(),
                   .location = def.location};
}

Signature method_signature(const StructDef& owner, const FunctionDef& method) {
  auto generics = owner.decl->params();
  for (const auto& p : method.generics.types) {
    if (generics.find_type(p.name) || generics.has_nat(p.name)) {
      throw SemanticError(
          ErrorKind::DuplicateDefinitionError,
          fmt::format("Method {} redeclares parameter {} of struct {}",
                      method.name, p.name, owner.decl->name()),
          method.location, {p.name});
    }
    generics.types.push_back(p);
  }
  for (const auto& n : method.generics.nats) {
    if (generics.find_type(n) || generics.has_nat(n)) {
      throw SemanticError(
          ErrorKind::DuplicateDefinitionError,
          fmt::format("Method {} redeclares parameter {} of struct {}",
                      method.name, n, owner.decl->name()),
          method.location, {n});
    }
    generics.nats.push_back(n);
  }
  auto signature = function_signature(method);
  signature.name = method_name(owner.decl->name(), method.name);
  signature.generics = std::move(generics);
  return signature;
}

std::unique_ptr<TFunction> CheckerImpl::check_function(
    const FunctionDef& def, const StructDef* owner) {
  const auto signature =
      owner ? method_signature(*owner, def) : function_signature(def);
  check_distinct_generics(signature.generics, def.location);

  std::set<std::string> param_names;
  for (const auto& p : signature.params) {
    if (!param_names.insert(p.name).second) {
      throw SemanticError(ErrorKind::DuplicateDefinitionError,
                          fmt::format("Parameter {} of {} is declared twice",
                                      p.name, signature.name),
                          def.location, {p.name});
    }
    check_well_formed(p.type, signature.generics, table_, def.location);
  }
  check_well_formed(signature.return_type, signature.generics, table_,
                    def.location);

  if (owner) {
    const auto self = self_type(owner->decl);
    if (signature.params.empty() || signature.params[0].name != "self" ||
        !typing::equal(signature.params[0].type, self)) {
      throw SemanticError(
          ErrorKind::TypeMismatchError,
          fmt::format("The first parameter of method {} must be self: {}",
                      signature.name, typing::print_type(self)),
          def.location, {signature.name});
    }
  }

  FunctionChecker fc{*this, signature.name, signature.generics,
                     signature.return_type};
  for (const auto& p : signature.params) fc.bind_param(p);
  fc.collect_assigned_names(def.body);
  auto body = fc.check_block(def.body);
  if (fc.falls_through() &&
      !typing::equal(signature.return_type, none_type())) {
    throw SemanticError(
        ErrorKind::TypeMismatchError,
        fmt::format("{} can reach its end without returning a value of type {}",
                    signature.name, typing::print_type(signature.return_type)),
        def.location, {signature.name});
  }

  TFunction checked{.location = def.location,
                    .name = def.name,
                    .owner = owner ? owner->decl->name() : std::string(),
                    .generics = signature.generics,
                    .params = signature.params,
                    .return_type = signature.return_type,
                    .body = std::move(body)};
  SubstitutionRewriter rewriter{fc.substitutions()};
  return checked.map_types(rewriter);
}

std::vector<std::unique_ptr<TFunction>> CheckerImpl::check_struct(
    const StructDef& def) {
  const auto& decl = def.decl;
  check_distinct_generics(decl->params(), def.location);
  std::set<std::string> field_names;
  for (const auto& f : decl->fields()) {
    if (!field_names.insert(f.name).second) {
      throw SemanticError(ErrorKind::DuplicateDefinitionError,
                          fmt::format("Field {} of {} is declared twice",
                                      f.name, decl->name()),
                          def.location, {f.name});
    }
    check_well_formed(f.type, decl->params(), table_, def.location);
  }

  std::vector<std::unique_ptr<TFunction>> methods;
  for (const auto& m : def.methods) {
    methods.push_back(check_function(*m, &def));
  }
  return methods;
}

Checker::Checker(const SignatureTable& table)
    : impl_(std::make_unique<CheckerImpl>(table)) {}

Checker::~Checker() = default;

std::unique_ptr<TFunction> Checker::check_function(const FunctionDef& def) {
  return impl_->check_function(def, nullptr);
}

std::vector<std::unique_ptr<TFunction>> Checker::check_struct(
    const StructDef& def) {
  return impl_->check_struct(def);
}

}  // namespace qsema
