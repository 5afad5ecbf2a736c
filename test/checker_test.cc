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

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <cstddef>
#include <memory>
#include <stdexcept>
#include <vector>

#include "qsema/diagnostics.h"
#include "qsema/signatures.h"
#include "qsema/typed_ast.h"
#include "qsema/types.h"
#include "testing/test_util.h"

namespace qsema::testing {
namespace {

using ::testing::Throws;
using typing::BuiltinTypes;
using typing::Nat;

class CheckerTest : public ::testing::Test {
 protected:
  const BuiltinTypes& b = BuiltinTypes::get();
  SignatureTable table;

  CheckerTest() { install_prelude(table); }

  /** Registers `def` and checks it. */
  std::unique_ptr<TFunction> check(const FunctionDef& def) {
    table.add(function_signature(def));
    Checker checker{table};
    return checker.check_function(def);
  }

  void declare(const FunctionDef& def) { table.add(function_signature(def)); }

  /** Declares `make[n]() -> array[int, n]`. */
  void declare_make() {
    auto make = function("make", {},
                         typing::array_type(b.int_type(), Nat::variable("n")),
                         block(ret(array())), {.types = {}, .nats = {"n"}});
    declare(*make);
  }

  typing::StructDeclPtr counter_decl() {
    return std::make_shared<typing::StructDecl>(
        "Counter", typing::GenericParams{},
        std::vector<typing::Field>{{"value", b.int_type()}});
  }

  static const TReturnStmt& return_at(const TFunction& fn, std::size_t i) {
    const auto* r = dynamic_cast<const TReturnStmt*>(fn.body.at(i).get());
    if (!r) throw std::logic_error("not a return");
    return *r;
  }
};

TEST_F(CheckerTest, BranchAssignmentMergesWithParameter) {
  auto f = function("f",
                    {borrowed("x", b.int_type()), borrowed("cond", b.bool_type())},
                    b.int_type(),
                    block(if_stmt(name("cond"), block(assign("x", int_lit(4)))),
                          ret(name("x"))));
  auto fn = check(*f);
  ASSERT_EQ(fn->body.size(), 2u);
  EXPECT_EQ(typing::print_type(return_at(*fn, 1).value->type), "int");
}

TEST_F(CheckerTest, InconsistentBranchTypesAreRejected) {
  auto f = function(
      "f", {borrowed("b", b.bool_type())}, b.int_type(),
      block(if_stmt(name("b"), block(assign("x", int_lit(4))),
                    block(assign("x", bool_lit(true)))),
            ret(name("x"))));
  EXPECT_THAT([&] { check(*f); },
              Throws<SemanticError>(
                  HasKind(ErrorKind::InconsistentBindingTypeError)));
}

TEST_F(CheckerTest, UnknownNames) {
  auto f = function("f", {}, b.int_type(), block(ret(name("y"))));
  EXPECT_THAT([&] { check(*f); },
              Throws<SemanticError>(HasKind(ErrorKind::UnknownNameError)));
  auto g = function("g", {}, nullptr, block(expr_stmt(call("nope"))));
  EXPECT_THAT([&] { check(*g); },
              Throws<SemanticError>(HasKind(ErrorKind::UnknownNameError)));
}

TEST_F(CheckerTest, UnknownTypeParameterInSignature) {
  auto f = function("f", {borrowed("x", typing::type_var("T"))}, nullptr,
                    block());
  EXPECT_THAT([&] { check(*f); },
              Throws<SemanticError>(HasKind(ErrorKind::UnknownNameError)));
}

TEST_F(CheckerTest, ArityMismatch) {
  auto f = function("f", {borrowed("q", b.qubit_type())}, nullptr,
                    block(expr_stmt(call("h", name("q"), name("q")))));
  EXPECT_THAT([&] { check(*f); },
              Throws<SemanticError>(HasKind(ErrorKind::ArityMismatchError)));
}

TEST_F(CheckerTest, UseBeforeDefinition) {
  auto f = function("f", {}, nullptr,
                    block(assign("y", name("x")), assign("x", int_lit(1))));
  EXPECT_THAT([&] { check(*f); },
              Throws<SemanticError>(
                  HasKind(ErrorKind::UseBeforeDefinitionError)));
}

TEST_F(CheckerTest, ReturnTypeMismatch) {
  auto f = function("f", {borrowed("x", b.int_type())}, b.bool_type(),
                    block(ret(name("x"))));
  EXPECT_THAT([&] { check(*f); },
              Throws<SemanticError>(HasKind(ErrorKind::TypeMismatchError)));
}

TEST_F(CheckerTest, MissingReturn) {
  auto f = function("f", {borrowed("x", b.int_type())}, b.int_type(),
                    block(assign("x", int_lit(1))));
  EXPECT_THAT([&] { check(*f); },
              Throws<SemanticError>(HasKind(ErrorKind::TypeMismatchError)));
}

TEST_F(CheckerTest, DuplicateParameters) {
  auto f = function("f",
                    {borrowed("x", b.int_type()), borrowed("x", b.bool_type())},
                    nullptr, block());
  EXPECT_THAT([&] { Checker{table}.check_function(*f); },
              Throws<SemanticError>(
                  HasKind(ErrorKind::DuplicateDefinitionError)));
}

TEST_F(CheckerTest, UndeterminableNatIsUnresolved) {
  declare_make();
  auto f = function("f", {}, b.int_type(),
                    block(assign("a", call("make")), ret(int_lit(0))));
  EXPECT_THAT([&] { check(*f); },
              Throws<SemanticError>(
                  HasKind(ErrorKind::UnresolvedParameterError)));
}

TEST_F(CheckerTest, ExpectedTypeResolvesNat) {
  declare_make();
  const auto int3 = typing::array_type(b.int_type(), Nat::constant(3));
  auto f = function("f", {}, int3, block(ret(call("make"))));
  auto fn = check(*f);
  const auto* c =
      dynamic_cast<const TCallExpr*>(return_at(*fn, 0).value.get());
  ASSERT_NE(c, nullptr);
  ASSERT_EQ(c->nat_args.size(), 1u);
  EXPECT_EQ(c->nat_args[0], Nat::constant(3));
  EXPECT_EQ(typing::print_type(c->type), "array[int, 3]");

  auto g = function("g", {}, b.int_type(),
                    block(assign("a", call("make"), int3), ret(int_lit(0))));
  EXPECT_NO_THROW(check(*g));
}

TEST_F(CheckerTest, GenericArgumentsInferredFromArguments) {
  auto f = function("f", {owned("q", b.qubit_type())},
                    typing::option_type(b.qubit_type()),
                    block(ret(call("some", name("q")))));
  auto fn = check(*f);
  const auto* c =
      dynamic_cast<const TCallExpr*>(return_at(*fn, 0).value.get());
  ASSERT_NE(c, nullptr);
  ASSERT_EQ(c->type_args.size(), 1u);
  EXPECT_EQ(typing::print_type(c->type_args[0]), "qubit");
  EXPECT_EQ(c->param_ownership[0], typing::Ownership::Owned);
}

TEST_F(CheckerTest, UnresolvedTypeParameter) {
  auto f = function("f", {}, nullptr, block(assign("o", call("nothing"))));
  EXPECT_THAT([&] { check(*f); },
              Throws<SemanticError>(
                  HasKind(ErrorKind::UnresolvedParameterError)));
  auto g = function("g", {}, nullptr,
                    block(assign("o", call("nothing"),
                                 typing::option_type(b.int_type()))));
  EXPECT_NO_THROW(check(*g));
}

TEST_F(CheckerTest, BoundViolation) {
  auto dup = function(
      "dup", {borrowed("x", typing::type_var("T"))},
      typing::tuple_type({typing::type_var("T"), typing::type_var("T")}),
      block(ret(tuple(name("x"), name("x")))), {.types = {{"T"}}, .nats = {}});
  declare(*dup);
  auto f = function("f", {borrowed("i", b.int_type())}, nullptr,
                    block(assign("p", call("dup", name("i")))));
  EXPECT_NO_THROW(check(*f));
  auto g = function("g", {borrowed("q", b.qubit_type())}, nullptr,
                    block(assign("p", call("dup", name("q")))));
  EXPECT_THAT([&] { check(*g); },
              Throws<SemanticError>(HasKind(ErrorKind::TypeMismatchError)));
}

TEST_F(CheckerTest, IntLiteralTakesExpectedNatType) {
  auto f = function("f", {}, b.nat_type(), block(ret(int_lit(3))));
  auto fn = check(*f);
  EXPECT_EQ(typing::print_type(return_at(*fn, 0).value->type), "nat");
}

TEST_F(CheckerTest, NatParameterAsValue) {
  auto size = function(
      "size",
      {borrowed("a", typing::array_type(b.int_type(), Nat::variable("n")))},
      b.nat_type(), block(ret(name("n"))), {.types = {}, .nats = {"n"}});
  auto fn = check(*size);
  EXPECT_NE(dynamic_cast<const TNatParamExpr*>(return_at(*fn, 0).value.get()),
            nullptr);
}

TEST_F(CheckerTest, GenericBodyIndexesArray) {
  auto first = function(
      "first",
      {borrowed("a", typing::array_type(typing::type_var("T"),
                                        Nat::variable("n")))},
      typing::type_var("T"), block(ret(subscript(name("a"), int_lit(0)))),
      {.types = {{"T"}}, .nats = {"n"}});
  auto fn = check(*first);
  EXPECT_EQ(typing::print_type(return_at(*fn, 0).value->type), "T");
  EXPECT_EQ(fn->generics.nats.size(), 1u);
}

TEST_F(CheckerTest, OperatorsResolveToMethods) {
  auto f = function("f", {borrowed("x", b.int_type())}, b.bool_type(),
                    block(ret(binop("<", binop("+", name("x"), int_lit(1)),
                                    int_lit(10)))));
  auto fn = check(*f);
  const auto* c =
      dynamic_cast<const TCallExpr*>(return_at(*fn, 0).value.get());
  ASSERT_NE(c, nullptr);
  EXPECT_EQ(c->callee, "int.__lt__");
  EXPECT_EQ(c->kind, CallKind::Method);

  auto g = function("g", {borrowed("q", b.qubit_type())}, b.bool_type(),
                    block(ret(unop("not", name("q")))));
  EXPECT_THAT([&] { check(*g); },
              Throws<SemanticError>(HasKind(ErrorKind::TypeMismatchError)));
}

TEST_F(CheckerTest, ForLoopOverRange) {
  auto f = function(
      "f", {}, b.int_type(),
      block(assign("total", int_lit(0)),
            for_stmt("i", call("range", int_lit(3)),
                     block(assign("total", binop("+", name("total"),
                                                 name("i"))))),
            ret(name("total"))));
  EXPECT_NO_THROW(check(*f));
}

TEST_F(CheckerTest, ForLoopOverArray) {
  auto f = function(
      "f",
      {owned("qs", typing::array_type(b.qubit_type(), Nat::constant(2)))},
      nullptr, block(for_stmt("q", name("qs"),
                              block(expr_stmt(call("discard", name("q")))))));
  auto fn = check(*f);
  const auto* loop = dynamic_cast<const TForStmt*>(fn->body.at(0).get());
  ASSERT_NE(loop, nullptr);
  EXPECT_EQ(typing::print_type(loop->variable_type), "qubit");
}

TEST_F(CheckerTest, ForLoopOverNonIterable) {
  auto f = function("f", {borrowed("x", b.int_type())}, nullptr,
                    block(for_stmt("i", name("x"), block())));
  EXPECT_THAT([&] { check(*f); },
              Throws<SemanticError>(HasKind(ErrorKind::TypeMismatchError)));
}

TEST_F(CheckerTest, WhileLoopWithBreak) {
  auto f = function("f", {borrowed("b", b.bool_type())}, nullptr,
                    block(while_stmt(name("b"), block(break_stmt()))));
  EXPECT_NO_THROW(check(*f));
  auto g = function("g", {borrowed("x", b.int_type())}, nullptr,
                    block(while_stmt(name("x"), block())));
  EXPECT_THAT([&] { check(*g); },
              Throws<SemanticError>(HasKind(ErrorKind::TypeMismatchError)));
}

TEST_F(CheckerTest, BreakOutsideLoop) {
  auto f = function("f", {}, nullptr, block(break_stmt()));
  EXPECT_THAT([&] { check(*f); },
              Throws<SemanticError>(HasKind(ErrorKind::TypeMismatchError)));
}

TEST_F(CheckerTest, TupleAssignment) {
  auto f = function("f", {}, b.bool_type(),
                    block(tuple_assign({"a", "b"},
                                       tuple(int_lit(1), bool_lit(true))),
                          ret(name("b"))));
  EXPECT_NO_THROW(check(*f));
  auto g = function("g", {}, nullptr,
                    block(tuple_assign({"a", "a"},
                                       tuple(int_lit(1), int_lit(2)))));
  EXPECT_THAT([&] { check(*g); },
              Throws<SemanticError>(
                  HasKind(ErrorKind::DuplicateDefinitionError)));
}

TEST_F(CheckerTest, FunctionValueCall) {
  auto f = function("f", {borrowed("q", b.qubit_type())}, nullptr,
                    block(assign("gate", name("h")),
                          expr_stmt(call("gate", name("q")))));
  auto fn = check(*f);
  const auto* s = dynamic_cast<const TExprStmt*>(fn->body.at(1).get());
  ASSERT_NE(s, nullptr);
  const auto* c = dynamic_cast<const TCallExpr*>(s->expr.get());
  ASSERT_NE(c, nullptr);
  EXPECT_EQ(c->kind, CallKind::Local);
}

TEST_F(CheckerTest, StructFieldsAndMethods) {
  const auto decl = counter_decl();
  const auto counter = typing::struct_type(decl);
  auto get = function("get", {borrowed("self", counter)}, b.int_type(),
                      block(ret(field(name("self"), "value"))));
  std::vector<std::unique_ptr<FunctionDef>> methods;
  methods.push_back(std::move(get));
  auto def = struct_def(decl, std::move(methods));
  table.add_struct(decl, LOC);
  table.add(method_signature(*def, *def->methods[0]));

  Checker checker{table};
  auto checked = checker.check_struct(*def);
  ASSERT_EQ(checked.size(), 1u);
  EXPECT_EQ(checked[0]->qualified_name(), "Counter.get");

  auto f = function("f", {borrowed("c", counter)}, b.int_type(),
                    block(ret(method(name("c"), "get"))));
  EXPECT_NO_THROW(check(*f));

  auto g = function("g", {}, b.int_type(),
                    block(assign("c", call("Counter", int_lit(1))),
                          ret(field(name("c"), "missing"))));
  EXPECT_THAT([&] { check(*g); },
              Throws<SemanticError>(HasKind(ErrorKind::UnknownNameError)));
}

TEST_F(CheckerTest, MethodMustTakeSelf) {
  const auto decl = counter_decl();
  auto bad = function("bad", {borrowed("x", b.int_type())}, nullptr, block());
  std::vector<std::unique_ptr<FunctionDef>> methods;
  methods.push_back(std::move(bad));
  auto def = struct_def(decl, std::move(methods));
  table.add_struct(decl, LOC);
  table.add(method_signature(*def, *def->methods[0]));
  EXPECT_THAT([&] { Checker{table}.check_struct(*def); },
              Throws<SemanticError>(HasKind(ErrorKind::TypeMismatchError)));
}

TEST_F(CheckerTest, StructFieldTypesMustBeWellFormed) {
  auto decl = std::make_shared<typing::StructDecl>(
      "Bad", typing::GenericParams{},
      std::vector<typing::Field>{{"x", typing::type_var("T")}});
  auto def = struct_def(decl);
  table.add_struct(decl, LOC);
  EXPECT_THAT([&] { Checker{table}.check_struct(*def); },
              Throws<SemanticError>(HasKind(ErrorKind::UnknownNameError)));
}

TEST_F(CheckerTest, ExpressionAnnotationArityIsChecked) {
  auto box = std::make_shared<typing::StructDecl>(
      "Box", typing::GenericParams{.types = {{"T"}}, .nats = {}},
      std::vector<typing::Field>{{"value", typing::type_var("T")}});
  table.add_struct(box, LOC);
  auto f = function(
      "f", {}, nullptr,
      block(assign("y", annotated(call("Box", int_lit(1)),
                                  typing::struct_type(
                                      box, {b.int_type(), b.bool_type()})))));
  EXPECT_THAT([&] { check(*f); },
              Throws<SemanticError>(HasKind(ErrorKind::ArityMismatchError)));
}

TEST_F(CheckerTest, ExpressionAnnotationsMentionOnlyDeclaredParameters) {
  auto f = function(
      "f", {}, nullptr,
      block(assign("y", annotated(call("nothing"),
                                  typing::option_type(typing::type_var("T"))))));
  EXPECT_THAT([&] { check(*f); },
              Throws<SemanticError>(HasKind(ErrorKind::UnknownNameError)));
}

TEST_F(CheckerTest, StructTypeMustUseTheRegisteredDeclaration) {
  table.add_struct(counter_decl(), LOC);
  auto stale = std::make_shared<typing::StructDecl>(
      "Counter", typing::GenericParams{},
      std::vector<typing::Field>{{"count", b.bool_type()}});
  auto f = function("f", {borrowed("c", typing::struct_type(stale))},
                    b.bool_type(), block(ret(field(name("c"), "count"))));
  EXPECT_THAT([&] { check(*f); },
              Throws<SemanticError>(HasKind(ErrorKind::TypeMismatchError)));
}

}  // namespace
}  // namespace qsema::testing
