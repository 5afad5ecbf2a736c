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
#include <memory>
#include <string>
#include <utility>
#include <vector>

#include "qsema/enum.h"
#include "qsema/location.h"
#include "qsema/types.h"

/**
 * @file typed_ast.h
 *
 * @brief Provides classes for a syntax tree annotated with types and
 * ownership information.
 *
 * The checker produces typed trees, the linearity checker analyses
 * them and the monomorphiser rewrites them into closed trees.
 */

namespace qsema {

#define QSEMA_USE_KIND_LIST(DECLARE, X) \
  DECLARE(Read, X)                      \
  DECLARE(Borrow, X)                    \
  DECLARE(Consume, X)

/** How a place expression (name, field or subscript) is used. */
QSEMA_ENUM_WITH_TEXT(UseKind, QSEMA_USE_KIND_LIST)

#define QSEMA_CALL_KIND_LIST(DECLARE, X) \
  DECLARE(Function, X)                   \
  DECLARE(Method, X)                     \
  DECLARE(Constructor, X)                \
  DECLARE(Local, X)

/**
 * What a call invokes: a registered function, a registered method, a
 * struct constructor or a function value held in a local binding.
 */
QSEMA_ENUM_WITH_TEXT(CallKind, QSEMA_CALL_KIND_LIST)

class TCallExpr;

/**
 * Rewrites the types in a typed tree.
 *
 * Used to apply inference results and to substitute generic
 * arguments during specialization.
 */
class TypeRewriter {
 public:
  virtual ~TypeRewriter();

  virtual typing::TypePtr map_type(const typing::TypePtr& t) = 0;
  virtual typing::Nat map_nat(const typing::Nat& n) = 0;

  /** Called with each call node after its types are rewritten. */
  virtual void on_call(TCallExpr&) {}
};

/** Applies inference results. */
class SubstitutionRewriter : public TypeRewriter {
 public:
  explicit SubstitutionRewriter(const typing::Substitutions& substitutions)
      : substitutions_(substitutions) {}

  typing::TypePtr map_type(const typing::TypePtr& t) override;
  typing::Nat map_nat(const typing::Nat& n) override;

 private:
  const typing::Substitutions& substitutions_;
};

class TIntLiteralExpr;
class TFloatLiteralExpr;
class TBoolLiteralExpr;
class TNameExpr;
class TNatParamExpr;
class TFunctionRefExpr;
class TTupleExpr;
class TArrayExpr;
class TCallExpr;
class TFieldExpr;
class TSubscriptExpr;

/** A typed expression. */
class TExpr {
 public:
  /** The source location the expression starts. */
  const Location location;
  /** The type the expression evaluates to. */
  typing::TypePtr type;

  TExpr(const Location& location, typing::TypePtr type);
  virtual ~TExpr();

  class Visitor {
   public:
    virtual ~Visitor();

    virtual void visit(const TIntLiteralExpr& v) = 0;
    virtual void visit(const TFloatLiteralExpr& v) = 0;
    virtual void visit(const TBoolLiteralExpr& v) = 0;
    virtual void visit(const TNameExpr& v) = 0;
    virtual void visit(const TNatParamExpr& v) = 0;
    virtual void visit(const TFunctionRefExpr& v) = 0;
    virtual void visit(const TTupleExpr& v) = 0;
    virtual void visit(const TArrayExpr& v) = 0;
    virtual void visit(const TCallExpr& v) = 0;
    virtual void visit(const TFieldExpr& v) = 0;
    virtual void visit(const TSubscriptExpr& v) = 0;
  };

  virtual void accept(Visitor& visitor) const = 0;

  /** Returns a copy of this expression with all types rewritten. */
  virtual std::unique_ptr<TExpr> map_types(TypeRewriter& rewriter) const = 0;
};

using TExprPtr = std::unique_ptr<TExpr>;

/** An int literal. Its type is int, or nat when a nat was expected. */
class TIntLiteralExpr : public TExpr {
 public:
  const std::int64_t value;

  TIntLiteralExpr(const Location& location, typing::TypePtr type,
                  std::int64_t value);

  void accept(Visitor& visitor) const override { visitor.visit(*this); }
  TExprPtr map_types(TypeRewriter& rewriter) const override;
};

class TFloatLiteralExpr : public TExpr {
 public:
  const double value;

  TFloatLiteralExpr(const Location& location, double value);

  void accept(Visitor& visitor) const override { visitor.visit(*this); }
  TExprPtr map_types(TypeRewriter& rewriter) const override;
};

class TBoolLiteralExpr : public TExpr {
 public:
  const bool value;

  TBoolLiteralExpr(const Location& location, bool value);

  void accept(Visitor& visitor) const override { visitor.visit(*this); }
  TExprPtr map_types(TypeRewriter& rewriter) const override;
};

/** A reference to a local binding. */
class TNameExpr : public TExpr {
 public:
  const std::string name;
  UseKind use;

  TNameExpr(const Location& location, typing::TypePtr type, std::string name,
            UseKind use);

  void accept(Visitor& visitor) const override { visitor.visit(*this); }
  TExprPtr map_types(TypeRewriter& rewriter) const override;
};

/**
 * A nat parameter of the enclosing definition used as a value.
 *
 * Specialization replaces it with a nat-typed TIntLiteralExpr.
 */
class TNatParamExpr : public TExpr {
 public:
  const std::string name;

  TNatParamExpr(const Location& location, std::string name);

  void accept(Visitor& visitor) const override { visitor.visit(*this); }
  TExprPtr map_types(TypeRewriter& rewriter) const override;
};

/** A non-generic registered function used as a value. */
class TFunctionRefExpr : public TExpr {
 public:
  const std::string name;

  TFunctionRefExpr(const Location& location, typing::TypePtr type,
                   std::string name);

  void accept(Visitor& visitor) const override { visitor.visit(*this); }
  TExprPtr map_types(TypeRewriter& rewriter) const override;
};

class TTupleExpr : public TExpr {
 public:
  const std::vector<TExprPtr> elements;

  TTupleExpr(const Location& location, typing::TypePtr type,
             std::vector<TExprPtr> elements);

  void accept(Visitor& visitor) const override { visitor.visit(*this); }
  TExprPtr map_types(TypeRewriter& rewriter) const override;
};

class TArrayExpr : public TExpr {
 public:
  const std::vector<TExprPtr> elements;

  TArrayExpr(const Location& location, typing::TypePtr type,
             std::vector<TExprPtr> elements);

  void accept(Visitor& visitor) const override { visitor.visit(*this); }
  TExprPtr map_types(TypeRewriter& rewriter) const override;
};

/**
 * A call.
 *
 * For a Method call the receiver is args[0]. `param_ownership[i]`
 * is the ownership of the parameter receiving `args[i]`. `type_args`
 * and `nat_args` are the callee's generic arguments; once they are
 * closed, the monomorphiser records the specialization it used in
 * `specialization`.
 */
class TCallExpr : public TExpr {
 public:
  const std::string callee;
  const CallKind kind;
  const std::vector<TExprPtr> args;
  const std::vector<typing::Ownership> param_ownership;
  typing::TypeList type_args;
  std::vector<typing::Nat> nat_args;
  std::string specialization;

  TCallExpr(const Location& location, typing::TypePtr type, std::string callee,
            CallKind kind, std::vector<TExprPtr> args,
            std::vector<typing::Ownership> param_ownership,
            typing::TypeList type_args = {},
            std::vector<typing::Nat> nat_args = {});

  void accept(Visitor& visitor) const override { visitor.visit(*this); }
  TExprPtr map_types(TypeRewriter& rewriter) const override;
};

/** A struct field projection. */
class TFieldExpr : public TExpr {
 public:
  const TExprPtr object;
  const std::string field;
  const std::size_t index;
  UseKind use;

  TFieldExpr(const Location& location, typing::TypePtr type, TExprPtr object,
             std::string field, std::size_t index, UseKind use);

  void accept(Visitor& visitor) const override { visitor.visit(*this); }
  TExprPtr map_types(TypeRewriter& rewriter) const override;
};

/** An array element projection. Indices are not bounds-checked. */
class TSubscriptExpr : public TExpr {
 public:
  const TExprPtr array;
  const TExprPtr index;
  UseKind use;

  TSubscriptExpr(const Location& location, typing::TypePtr type,
                 TExprPtr array, TExprPtr index, UseKind use);

  void accept(Visitor& visitor) const override { visitor.visit(*this); }
  TExprPtr map_types(TypeRewriter& rewriter) const override;
};

/**
 * Returns the local binding a place expression projects from, or
 * nullptr if `e` is not a place rooted in a local binding.
 */
const TNameExpr* place_root(const TExpr& e);

class TAssignStmt;
class TTupleAssignStmt;
class TExprStmt;
class TReturnStmt;
class TIfStmt;
class TWhileStmt;
class TForStmt;
class TBreakStmt;
class TContinueStmt;

/** A typed statement. */
class TStmt {
 public:
  const Location location;

  explicit TStmt(const Location& location);
  virtual ~TStmt();

  class Visitor {
   public:
    virtual ~Visitor();

    virtual void visit(const TAssignStmt& v) = 0;
    virtual void visit(const TTupleAssignStmt& v) = 0;
    virtual void visit(const TExprStmt& v) = 0;
    virtual void visit(const TReturnStmt& v) = 0;
    virtual void visit(const TIfStmt& v) = 0;
    virtual void visit(const TWhileStmt& v) = 0;
    virtual void visit(const TForStmt& v) = 0;
    virtual void visit(const TBreakStmt& v) = 0;
    virtual void visit(const TContinueStmt& v) = 0;
  };

  virtual void accept(Visitor& visitor) const = 0;

  virtual std::unique_ptr<TStmt> map_types(TypeRewriter& rewriter) const = 0;
};

using TStmtPtr = std::unique_ptr<TStmt>;
using TBlock = std::vector<TStmtPtr>;

/** Binds `target` to `value`, whose type is the binding's new type. */
class TAssignStmt : public TStmt {
 public:
  const std::string target;
  const TExprPtr value;

  TAssignStmt(const Location& location, std::string target, TExprPtr value);

  void accept(Visitor& visitor) const override { visitor.visit(*this); }
  TStmtPtr map_types(TypeRewriter& rewriter) const override;
};

/** Destructures a tuple-typed value into several bindings. */
class TTupleAssignStmt : public TStmt {
 public:
  const std::vector<std::string> targets;
  const TExprPtr value;

  TTupleAssignStmt(const Location& location, std::vector<std::string> targets,
                   TExprPtr value);

  void accept(Visitor& visitor) const override { visitor.visit(*this); }
  TStmtPtr map_types(TypeRewriter& rewriter) const override;
};

class TExprStmt : public TStmt {
 public:
  const TExprPtr expr;

  TExprStmt(const Location& location, TExprPtr expr);

  void accept(Visitor& visitor) const override { visitor.visit(*this); }
  TStmtPtr map_types(TypeRewriter& rewriter) const override;
};

/** A return. `value` is null when returning none. */
class TReturnStmt : public TStmt {
 public:
  const TExprPtr value;

  TReturnStmt(const Location& location, TExprPtr value);

  void accept(Visitor& visitor) const override { visitor.visit(*this); }
  TStmtPtr map_types(TypeRewriter& rewriter) const override;
};

class TIfStmt : public TStmt {
 public:
  const TExprPtr condition;
  const TBlock then_body;
  const TBlock else_body;

  TIfStmt(const Location& location, TExprPtr condition, TBlock then_body,
          TBlock else_body);

  void accept(Visitor& visitor) const override { visitor.visit(*this); }
  TStmtPtr map_types(TypeRewriter& rewriter) const override;
};

class TWhileStmt : public TStmt {
 public:
  const TExprPtr condition;
  const TBlock body;

  TWhileStmt(const Location& location, TExprPtr condition, TBlock body);

  void accept(Visitor& visitor) const override { visitor.visit(*this); }
  TStmtPtr map_types(TypeRewriter& rewriter) const override;
};

/**
 * Iterates over a range or an array. The loop variable has the
 * element type (int for ranges).
 */
class TForStmt : public TStmt {
 public:
  const std::string variable;
  const typing::TypePtr variable_type;
  const TExprPtr iterable;
  const TBlock body;

  TForStmt(const Location& location, std::string variable,
           typing::TypePtr variable_type, TExprPtr iterable, TBlock body);

  void accept(Visitor& visitor) const override { visitor.visit(*this); }
  TStmtPtr map_types(TypeRewriter& rewriter) const override;
};

class TBreakStmt : public TStmt {
 public:
  explicit TBreakStmt(const Location& location);

  void accept(Visitor& visitor) const override { visitor.visit(*this); }
  TStmtPtr map_types(TypeRewriter& rewriter) const override;
};

class TContinueStmt : public TStmt {
 public:
  explicit TContinueStmt(const Location& location);

  void accept(Visitor& visitor) const override { visitor.visit(*this); }
  TStmtPtr map_types(TypeRewriter& rewriter) const override;
};

TBlock map_types(const TBlock& block, TypeRewriter& rewriter);

/**
 * A checked function or method.
 *
 * Methods have `owner` set to the struct name and are registered as
 * "owner.name"; their first parameter is `self`.
 */
struct TFunction {
  Location location;
  std::string name;
  std::string owner;
  typing::GenericParams generics;
  std::vector<typing::Param> params;
  typing::TypePtr return_type;
  TBlock body;

  /** The name this function is registered under. */
  std::string qualified_name() const;

  /** Returns a copy with all types rewritten. */
  std::unique_ptr<TFunction> map_types(TypeRewriter& rewriter) const;
};

}  // namespace qsema

QSEMA_ENUM_WITH_TEXT_FORMATTER(qsema::UseKind)
QSEMA_ENUM_WITH_TEXT_FORMATTER(qsema::CallKind)
