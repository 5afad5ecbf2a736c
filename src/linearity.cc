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

#include "qsema/linearity.h"

#include <fmt/core.h>

#include <cstddef>
#include <map>
#include <set>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace qsema {

using typing::OwnershipClass;

namespace {

struct Binding {
  BindingState state = BindingState::Undefined;
  OwnershipClass cls = OwnershipClass::Copyable;
  bool borrowed_param = false;
};

/** Binding states along one control-flow path. */
struct Flow {
  std::map<std::string, Binding> bindings;
  bool reachable = true;
};

struct LoopFrame {
  Flow entry;
  /** The loop variable of a for loop; empty for while loops. */
  std::string variable;
  /** Whether the loop iterates over an array of Linear elements. */
  bool linear_elements = false;
  std::vector<Flow> breaks;
  std::vector<Flow> continues;
};

/** The expression a chain of field and subscript projections starts from. */
const TExpr& projection_base(const TExpr& e) {
  if (const auto* f = dynamic_cast<const TFieldExpr*>(&e)) {
    return projection_base(*f->object);
  }
  if (const auto* s = dynamic_cast<const TSubscriptExpr*>(&e)) {
    return projection_base(*s->array);
  }
  return e;
}

class FlowAnalyzer : public TStmt::Visitor, public TExpr::Visitor {
 public:
  FlowAnalyzer(const TFunction& fn, typing::OwnershipClassifier& classifier)
      : fn_(fn), classifier_(classifier) {}

  std::vector<Diagnostic> run() {
    for (const auto& p : fn_.params) {
      const auto cls = classify(p.type);
      flow_.bindings[p.name] =
          Binding{BindingState::Defined, cls,
                  p.ownership == typing::Ownership::Borrowed &&
                      cls != OwnershipClass::Copyable};
    }
    check_block(fn_.body);
    if (flow_.reachable) check_exit(fn_.location);
    return std::move(warnings_);
  }

  // Expressions

  void visit(const TIntLiteralExpr&) override {}
  void visit(const TFloatLiteralExpr&) override {}
  void visit(const TBoolLiteralExpr&) override {}
  void visit(const TNatParamExpr&) override {}
  void visit(const TFunctionRefExpr&) override {}

  void visit(const TNameExpr& e) override {
    use_name(e.name, e.use, e.location);
  }

  void visit(const TTupleExpr& e) override {
    for (const auto& el : e.elements) evaluate(*el);
  }

  void visit(const TArrayExpr& e) override {
    for (const auto& el : e.elements) evaluate(*el);
  }

  void visit(const TCallExpr& e) override {
    if (e.kind == CallKind::Local) defined_binding(e.callee, e.location);
    std::set<std::string> linear_roots;
    for (std::size_t i = 0; i < e.args.size(); ++i) {
      const auto& arg = *e.args[i];
      if (const auto* root = place_root(arg)) {
        const auto it = flow_.bindings.find(root->name);
        if (it != flow_.bindings.end() &&
            it->second.cls == OwnershipClass::Linear &&
            classify(arg.type) != OwnershipClass::Copyable &&
            !linear_roots.insert(root->name).second) {
          throw SemanticError(
              ErrorKind::UseAfterConsumeError,
              fmt::format("{} is passed more than once to {}", root->name,
                          e.callee),
              arg.location, {root->name, e.callee});
        }
      } else if (e.param_ownership[i] == typing::Ownership::Borrowed &&
                 classify(arg.type) == OwnershipClass::Linear) {
        throw SemanticError(
            ErrorKind::ResourceLeakError,
            fmt::format("A linear value of type {} is lent to {} and never "
                        "consumed",
                        typing::print_type(arg.type), e.callee),
            arg.location, {e.callee});
      }
      evaluate(arg);
    }
  }

  void visit(const TFieldExpr& e) override { use_place(e, e.use); }
  void visit(const TSubscriptExpr& e) override { use_place(e, e.use); }

  // Statements

  void visit(const TAssignStmt& s) override {
    evaluate(*s.value);
    bind(s.target, s.value->type, s.location);
  }

  void visit(const TTupleAssignStmt& s) override {
    evaluate(*s.value);
    const auto* tuple = typing::as<typing::TupleType>(s.value->type);
    if (!tuple || tuple->types().size() != s.targets.size()) {
      throw std::logic_error(
          fmt::format("Tuple assignment from non-tuple type {}",
                      typing::print_type(s.value->type)));
    }
    for (std::size_t i = 0; i < s.targets.size(); ++i) {
      bind(s.targets[i], tuple->types()[i], s.location);
    }
  }

  void visit(const TExprStmt& s) override {
    evaluate(*s.expr);
    if (classify(s.expr->type) == OwnershipClass::Linear) {
      throw SemanticError(
          ErrorKind::ResourceLeakError,
          fmt::format("The linear result of type {} is never consumed",
                      typing::print_type(s.expr->type)),
          s.location, {typing::print_type(s.expr->type)});
    }
  }

  void visit(const TReturnStmt& s) override {
    if (s.value) evaluate(*s.value);
    for (const auto& loop : loops_) {
      if (loop.linear_elements) {
        throw SemanticError(
            ErrorKind::ResourceLeakError,
            fmt::format("Returning from the loop over {} leaks its remaining "
                        "elements",
                        loop.variable),
            s.location, {loop.variable});
      }
    }
    check_exit(s.location);
    flow_.reachable = false;
  }

  void visit(const TIfStmt& s) override {
    evaluate(*s.condition);
    Flow before = flow_;
    check_block(s.then_body);
    Flow after_then = std::move(flow_);
    flow_ = std::move(before);
    check_block(s.else_body);
    flow_ = merge(after_then, flow_, s.location);
  }

  void visit(const TWhileStmt& s) override {
    evaluate(*s.condition);
    LoopFrame frame;
    frame.entry = flow_;
    run_loop(s.body, s.location, std::move(frame));
  }

  void visit(const TForStmt& s) override {
    evaluate(*s.iterable);
    LoopFrame frame;
    frame.entry = flow_;
    frame.variable = s.variable;
    frame.linear_elements =
        typing::as<typing::ArrayType>(s.iterable->type) &&
        classify(s.variable_type) == OwnershipClass::Linear;
    bind(s.variable, s.variable_type, s.location);
    run_loop(s.body, s.location, std::move(frame));
  }

  void visit(const TBreakStmt& s) override {
    auto& frame = current_loop(s.location);
    if (frame.linear_elements) {
      throw SemanticError(
          ErrorKind::ResourceLeakError,
          fmt::format("Breaking out of the loop over {} leaks its remaining "
                      "elements",
                      frame.variable),
          s.location, {frame.variable});
    }
    check_loop_variable(frame, flow_, s.location);
    frame.breaks.push_back(flow_);
    flow_.reachable = false;
  }

  void visit(const TContinueStmt& s) override {
    current_loop(s.location).continues.push_back(flow_);
    flow_.reachable = false;
  }

 private:
  const TFunction& fn_;
  typing::OwnershipClassifier& classifier_;
  Flow flow_;
  std::vector<LoopFrame> loops_;
  std::vector<Diagnostic> warnings_;

  OwnershipClass classify(const typing::TypePtr& t) {
    return classifier_.classify(t);
  }

  void evaluate(const TExpr& e) { e.accept(static_cast<TExpr::Visitor&>(*this)); }

  void check_block(const TBlock& block) {
    for (const auto& s : block) {
      if (!flow_.reachable) {
        warnings_.push_back(Diagnostic{.kind = std::nullopt,
                                       .severity = Severity::Warning,
                                       .location = s->location,
                                       .definition = fn_.qualified_name(),
                                       .message = "Unreachable code",
                                       .names = {}});
        return;
      }
      s->accept(static_cast<TStmt::Visitor&>(*this));
    }
  }

  Binding& defined_binding(const std::string& name, const Location& location) {
    const auto it = flow_.bindings.find(name);
    if (it == flow_.bindings.end() ||
        it->second.state == BindingState::Undefined ||
        it->second.state == BindingState::MaybeDefined) {
      throw SemanticError(
          ErrorKind::UseBeforeDefinitionError,
          fmt::format("{} may be used before it is defined", name), location,
          {name});
    }
    if (it->second.state == BindingState::Consumed) {
      throw SemanticError(ErrorKind::UseAfterConsumeError,
                          fmt::format("{} is used after it was consumed", name),
                          location, {name});
    }
    return it->second;
  }

  void use_name(const std::string& name, UseKind use,
                const Location& location) {
    auto& b = defined_binding(name, location);
    if (use == UseKind::Consume && b.cls != OwnershipClass::Copyable) {
      b.state = BindingState::Consumed;
    }
  }

  /**
   * A field or element projection. Index expressions are evaluated,
   * then the root binding is used as a whole.
   */
  void use_place(const TExpr& e, UseKind use) {
    evaluate_indices(e);
    if (use == UseKind::Consume) check_move_out(e);
    if (const auto* root = place_root(e)) {
      use_name(root->name, use == UseKind::Consume ? use : UseKind::Borrow,
               e.location);
      return;
    }
    const auto& base = projection_base(e);
    evaluate(base);
    if (use != UseKind::Consume &&
        classify(base.type) == OwnershipClass::Linear) {
      throw SemanticError(
          ErrorKind::ResourceLeakError,
          fmt::format("A temporary of type {} is dropped after projection",
                      typing::print_type(base.type)),
          e.location, {typing::print_type(base.type)});
    }
  }

  void evaluate_indices(const TExpr& e) {
    if (const auto* f = dynamic_cast<const TFieldExpr*>(&e)) {
      evaluate_indices(*f->object);
    } else if (const auto* s = dynamic_cast<const TSubscriptExpr*>(&e)) {
      evaluate_indices(*s->array);
      evaluate(*s->index);
    }
  }

  /** Moving a value out of a projection must not leave a Linear value. */
  void check_move_out(const TExpr& e) {
    if (const auto* f = dynamic_cast<const TFieldExpr*>(&e)) {
      const auto* st = typing::as<typing::StructType>(f->object->type);
      if (!st) throw std::logic_error("Field projection of a non-struct");
      const auto fields = st->fields();
      for (std::size_t i = 0; i < fields.size(); ++i) {
        if (i != f->index && classify(fields[i].type) == OwnershipClass::Linear) {
          throw SemanticError(
              ErrorKind::ResourceLeakError,
              fmt::format("Moving {} out of {} leaks its field {}", f->field,
                          st->name(), fields[i].name),
              e.location, {f->field, fields[i].name});
        }
      }
      check_move_out(*f->object);
    } else if (const auto* s = dynamic_cast<const TSubscriptExpr*>(&e)) {
      const auto* at = typing::as<typing::ArrayType>(s->array->type);
      if (!at) throw std::logic_error("Subscript of a non-array");
      const auto& length = at->length();
      if (classify(at->element()) == OwnershipClass::Linear &&
          !(length.is_constant() && length.value() == 1)) {
        throw SemanticError(
            ErrorKind::ResourceLeakError,
            fmt::format("Moving an element out of {} leaks the remaining "
                        "elements",
                        typing::print_type(s->array->type)),
            e.location, {typing::print_type(s->array->type)});
      }
      check_move_out(*s->array);
    }
  }

  void bind(const std::string& name, const typing::TypePtr& type,
            const Location& location) {
    auto& b = flow_.bindings[name];
    if (b.state == BindingState::Defined && b.cls == OwnershipClass::Linear) {
      throw SemanticError(
          ErrorKind::ResourceLeakError,
          fmt::format("{} is reassigned while it holds a linear value", name),
          location, {name});
    }
    b.state = BindingState::Defined;
    b.cls = classify(type);
  }

  void check_exit(const Location& location) {
    for (const auto& [name, b] : flow_.bindings) {
      if (b.borrowed_param) {
        if (b.state != BindingState::Defined) {
          throw SemanticError(
              ErrorKind::UseAfterConsumeError,
              fmt::format("Borrowed parameter {} is consumed and not restored",
                          name),
              location, {name});
        }
      } else if (b.cls == OwnershipClass::Linear &&
                 b.state == BindingState::Defined) {
        throw SemanticError(
            ErrorKind::ResourceLeakError,
            fmt::format("{} holds a linear value that is never consumed", name),
            location, {name});
      }
    }
  }

  LoopFrame& current_loop(const Location& location) {
    if (loops_.empty()) {
      throw std::logic_error(
          fmt::format("{}: jump outside of a loop", location));
    }
    return loops_.back();
  }

  void check_loop_variable(const LoopFrame& frame, const Flow& flow,
                           const Location& location) {
    if (frame.variable.empty()) return;
    const auto it = flow.bindings.find(frame.variable);
    if (it != flow.bindings.end() &&
        it->second.cls == OwnershipClass::Linear &&
        it->second.state == BindingState::Defined) {
      throw SemanticError(
          ErrorKind::ResourceLeakError,
          fmt::format("Loop variable {} is not consumed in every iteration",
                      frame.variable),
          location, {frame.variable});
    }
  }

  static Binding binding_or_undefined(const Flow& flow, const std::string& name,
                                      const Binding& other) {
    const auto it = flow.bindings.find(name);
    if (it != flow.bindings.end()) return it->second;
    return Binding{BindingState::Undefined, other.cls, other.borrowed_param};
  }

  static bool holds_linear(const Binding& b) {
    return b.state != BindingState::Undefined &&
           b.cls == OwnershipClass::Linear;
  }

  /** A back edge must leave every Linear binding as it was on entry. */
  void check_back_edge(const LoopFrame& frame, const Flow& edge,
                       const Location& location) {
    check_loop_variable(frame, edge, location);
    std::set<std::string> names;
    for (const auto& [name, b] : frame.entry.bindings) names.insert(name);
    for (const auto& [name, b] : edge.bindings) names.insert(name);
    names.erase(frame.variable);
    for (const auto& name : names) {
      const auto it = edge.bindings.find(name);
      const Binding at_edge =
          it != edge.bindings.end() ? it->second : Binding{};
      const auto on_entry =
          binding_or_undefined(frame.entry, name, at_edge);
      if (!holds_linear(on_entry) && !holds_linear(at_edge)) continue;
      const bool entry_defined = on_entry.state == BindingState::Defined;
      const bool edge_defined = at_edge.state == BindingState::Defined;
      if (entry_defined && !edge_defined) {
        throw SemanticError(
            ErrorKind::InconsistentConsumptionError,
            fmt::format("{} is consumed in a loop iteration", name), location,
            {name});
      }
      if (edge_defined && !entry_defined) {
        throw SemanticError(
            ErrorKind::ResourceLeakError,
            fmt::format("{} is created in a loop iteration and not consumed",
                        name),
            location, {name});
      }
    }
  }

  void run_loop(const TBlock& body, const Location& location,
                LoopFrame frame) {
    loops_.push_back(std::move(frame));
    check_block(body);
    LoopFrame done = std::move(loops_.back());
    loops_.pop_back();

    Flow exit = done.entry;
    if (flow_.reachable) {
      check_back_edge(done, flow_, location);
      exit = merge(exit, flow_, location);
    }
    for (const auto& c : done.continues) {
      check_back_edge(done, c, location);
      exit = merge(exit, c, location);
    }
    for (const auto& b : done.breaks) exit = merge(exit, b, location);
    flow_ = std::move(exit);
  }

  /**
   * Joins two paths. Linear bindings must agree; other bindings that
   * disagree become MaybeDefined, or Consumed if consumed on either
   * path.
   */
  Flow merge(const Flow& l, const Flow& r, const Location& location) {
    if (!l.reachable) return r;
    if (!r.reachable) return l;
    Flow merged;
    std::set<std::string> names;
    for (const auto& [name, b] : l.bindings) names.insert(name);
    for (const auto& [name, b] : r.bindings) names.insert(name);
    for (const auto& name : names) {
      const auto lit = l.bindings.find(name);
      const auto rit = r.bindings.find(name);
      const Binding lb = lit != l.bindings.end()
                             ? lit->second
                             : binding_or_undefined(l, name, rit->second);
      const Binding rb = rit != r.bindings.end()
                             ? rit->second
                             : binding_or_undefined(r, name, lb);
      merged.bindings[name] = merge_binding(name, lb, rb, location);
    }
    return merged;
  }

  static Binding merge_binding(const std::string& name, const Binding& l,
                               const Binding& r, const Location& location) {
    if (l.state == r.state) return l;
    Binding merged = l.state == BindingState::Undefined ? r : l;
    const bool either_consumed = l.state == BindingState::Consumed ||
                                 r.state == BindingState::Consumed;
    if (holds_linear(l) || holds_linear(r)) {
      if (l.state == BindingState::Defined ||
          r.state == BindingState::Defined) {
        if (either_consumed) {
          throw SemanticError(
              ErrorKind::InconsistentConsumptionError,
              fmt::format("{} is consumed on one path but not on another",
                          name),
              location, {name});
        }
        throw SemanticError(
            ErrorKind::ResourceLeakError,
            fmt::format("{} holds a linear value on only one path", name),
            location, {name});
      }
      merged.state = BindingState::Consumed;
      return merged;
    }
    merged.state =
        either_consumed ? BindingState::Consumed : BindingState::MaybeDefined;
    return merged;
  }
};

}  // namespace

std::vector<Diagnostic> LinearityChecker::check(const TFunction& fn) {
  FlowAnalyzer analyzer{fn, classifier_};
  return analyzer.run();
}

}  // namespace qsema
