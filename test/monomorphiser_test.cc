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

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <cstddef>
#include <memory>
#include <thread>
#include <vector>

#include "qsema/checker.h"
#include "qsema/diagnostics.h"
#include "qsema/signatures.h"
#include "qsema/typed_ast.h"
#include "qsema/types.h"
#include "testing/test_util.h"

namespace qsema::testing {
namespace {

using ::testing::ElementsAre;
using ::testing::IsEmpty;
using ::testing::Throws;
using typing::BuiltinTypes;
using typing::Nat;

class MonomorphiserTest : public ::testing::Test {
 protected:
  const BuiltinTypes& b = BuiltinTypes::get();
  SignatureTable table;
  std::vector<std::unique_ptr<FunctionDef>> defs;
  std::vector<std::shared_ptr<const TFunction>> checked;

  MonomorphiserTest() { install_prelude(table); }

  void define(std::unique_ptr<FunctionDef> def) {
    table.add(function_signature(*def));
    defs.push_back(std::move(def));
  }

  /** Checks every defined function and builds a monomorphiser over them. */
  std::unique_ptr<Monomorphiser> build() {
    Checker checker{table};
    for (const auto& d : defs) checked.push_back(checker.check_function(*d));
    table.finalize();
    return std::make_unique<Monomorphiser>(table, checked);
  }

  /** size[T; n](a: array[T, n]) -> nat { return n } */
  void define_size() {
    define(function(
        "size",
        {borrowed("a", typing::array_type(typing::type_var("T"),
                                          Nat::variable("n")))},
        b.nat_type(), block(ret(name("n"))),
        {.types = {{"T"}}, .nats = {"n"}}));
  }

  void define_main() {
    define(function(
        "main", {}, b.nat_type(),
        block(assign("x", call("size", array(int_lit(1), int_lit(2)))),
              assign("y", call("size", array(bool_lit(true), bool_lit(false),
                                             bool_lit(true)))),
              ret(binop("+", name("x"), name("y"))))));
  }
};

TEST(InstantiationKeyTest, Prints) {
  const auto& b = BuiltinTypes::get();
  EXPECT_EQ((InstantiationKey{"f", {}, {}}.str()), "f");
  EXPECT_EQ((InstantiationKey{"f", {b.int_type()}, {}}.str()), "f[int]");
  EXPECT_EQ((InstantiationKey{"f", {}, {Nat::constant(3)}}.str()), "f[3]");
  EXPECT_EQ((InstantiationKey{"f",
                              {b.int_type(), b.qubit_type()},
                              {Nat::constant(3), Nat::constant(0)}}
                 .str()),
            "f[int, qubit; 3, 0]");
}

TEST_F(MonomorphiserTest, DistinctArgumentsGiveDistinctSpecializations) {
  define_size();
  define_main();
  auto m = build();
  const auto main = m->specialize("main");
  EXPECT_EQ(main->key, "main");
  EXPECT_THAT(main->callees, ElementsAre("size[int; 2]", "size[bool; 3]"));
  EXPECT_EQ(m->size(), 3u);

  const auto ints = m->find("size[int; 2]");
  const auto bools = m->find("size[bool; 3]");
  ASSERT_NE(ints, nullptr);
  ASSERT_NE(bools, nullptr);
  EXPECT_NE(ints, bools);
  EXPECT_NE(ints->function.get(), bools->function.get());
  EXPECT_EQ(typing::print_type(ints->function->params[0].type),
            "array[int, 2]");
  EXPECT_EQ(typing::print_type(bools->function->params[0].type),
            "array[bool, 3]");
}

TEST_F(MonomorphiserTest, SpecializedBodiesAreClosed) {
  define_size();
  auto m = build();
  const auto s = m->specialize("size", {b.int_type()}, {Nat::constant(4)});
  EXPECT_TRUE(s->function->generics.empty());
  const auto* r = dynamic_cast<const TReturnStmt*>(s->function->body.at(0).get());
  ASSERT_NE(r, nullptr);
  const auto* lit = dynamic_cast<const TIntLiteralExpr*>(r->value.get());
  ASSERT_NE(lit, nullptr);
  EXPECT_EQ(lit->value, 4);
  EXPECT_EQ(typing::print_type(lit->type), "nat");
}

TEST_F(MonomorphiserTest, CallSitesRecordTheirSpecialization) {
  define_size();
  define_main();
  auto m = build();
  const auto main = m->specialize("main");
  const auto* assign =
      dynamic_cast<const TAssignStmt*>(main->function->body.at(0).get());
  ASSERT_NE(assign, nullptr);
  const auto* c = dynamic_cast<const TCallExpr*>(assign->value.get());
  ASSERT_NE(c, nullptr);
  EXPECT_EQ(c->specialization, "size[int; 2]");

  const auto* r = dynamic_cast<const TReturnStmt*>(main->function->body.at(2).get());
  ASSERT_NE(r, nullptr);
  const auto* add = dynamic_cast<const TCallExpr*>(r->value.get());
  ASSERT_NE(add, nullptr);
  EXPECT_EQ(add->specialization, "nat.__add__");
}

TEST_F(MonomorphiserTest, ResultsAreCached) {
  define_size();
  auto m = build();
  const auto first = m->specialize("size", {b.int_type()}, {Nat::constant(2)});
  const auto second = m->specialize("size", {b.int_type()}, {Nat::constant(2)});
  EXPECT_EQ(first, second);
  EXPECT_EQ(m->size(), 1u);
  EXPECT_EQ(m->find("size[int; 2]"), first);
  EXPECT_EQ(m->find("size[int; 3]"), nullptr);
}

TEST_F(MonomorphiserTest, ArgumentErrors) {
  define_size();
  auto m = build();
  EXPECT_THAT([&] { m->specialize("size", {b.int_type()}); },
              Throws<SemanticError>(HasKind(ErrorKind::ArityMismatchError)));
  EXPECT_THAT(
      [&] {
        m->specialize("size", {typing::type_var("U")}, {Nat::constant(1)});
      },
      Throws<SemanticError>(HasKind(ErrorKind::UnresolvedGenericError)));
  EXPECT_THAT(
      [&] { m->specialize("size", {b.int_type()}, {Nat::variable("k")}); },
      Throws<SemanticError>(HasKind(ErrorKind::UnresolvedGenericError)));
  EXPECT_THAT(
      [&] { m->specialize("size", {b.qubit_type()}, {Nat::constant(1)}); },
      Throws<SemanticError>(HasKind(ErrorKind::TypeMismatchError)));
  EXPECT_THAT([&] { m->specialize("missing"); },
              Throws<SemanticError>(HasKind(ErrorKind::UnknownNameError)));
  EXPECT_EQ(m->size(), 0u);
}

TEST_F(MonomorphiserTest, BuiltinsAreNotExpanded) {
  define(function("f", {owned("q", b.qubit_type())}, b.bool_type(),
                  block(expr_stmt(call("h", name("q"))),
                        ret(call("measure", name("q"))))));
  auto m = build();
  const auto f = m->specialize("f");
  EXPECT_THAT(f->callees, IsEmpty());
  EXPECT_EQ(m->size(), 1u);
}

TEST_F(MonomorphiserTest, RecursionIsDetected) {
  define(function("f", {}, nullptr, block(expr_stmt(call("g")))));
  define(function("g", {}, nullptr, block(expr_stmt(call("f")))));
  auto m = build();
  try {
    m->specialize("f");
    FAIL() << "Expected a RecursiveMonomorphisationError";
  } catch (SemanticError& e) {
    EXPECT_EQ(e.kind, ErrorKind::RecursiveMonomorphisationError);
    EXPECT_THAT(e.names, ElementsAre("f", "g", "f"));
  }
  EXPECT_EQ(m->find("f"), nullptr);
}

TEST_F(MonomorphiserTest, GrowingRecursionIsDetected) {
  // f[T](x: T) { y = some(x); f(y) }
  const auto t = typing::type_var("T", false, false);
  define(function("f", {owned("x", t)}, nullptr,
                  block(assign("y", call("some", name("x"))),
                        expr_stmt(call("f", name("y")))),
                  {.types = {{"T", false, false}}, .nats = {}}));
  auto m = build();
  try {
    m->specialize("f", {b.int_type()});
    FAIL() << "Expected a RecursiveMonomorphisationError";
  } catch (SemanticError& e) {
    EXPECT_EQ(e.kind, ErrorKind::RecursiveMonomorphisationError);
    EXPECT_THAT(e.names, ElementsAre("f[int]", "f[Option[int]]"));
  }
  EXPECT_EQ(m->size(), 0u);
}

TEST_F(MonomorphiserTest, SharedCalleesAreNotCycles) {
  define(function("leaf", {}, nullptr, block()));
  define(function("left", {}, nullptr, block(expr_stmt(call("leaf")))));
  define(function("top", {}, nullptr,
                  block(expr_stmt(call("left")), expr_stmt(call("leaf")))));
  auto m = build();
  const auto top = m->specialize("top");
  EXPECT_THAT(top->callees, ElementsAre("left", "leaf"));
  EXPECT_EQ(m->size(), 3u);
}

TEST_F(MonomorphiserTest, StructSpecialization) {
  auto box = std::make_shared<typing::StructDecl>(
      "Box", typing::GenericParams{.types = {{"T", false, false}}, .nats = {}},
      std::vector<typing::Field>{{"item", typing::type_var("T", false, false)}});
  auto outer = std::make_shared<typing::StructDecl>(
      "Outer", typing::GenericParams{},
      std::vector<typing::Field>{
          {"inner", typing::struct_type(box, {b.int_type()})}});
  table.add_struct(box, LOC);
  table.add_struct(outer, LOC);
  auto m = build();

  const auto qbox = m->specialize_struct("Box", {b.qubit_type()});
  EXPECT_EQ(qbox->key, "Box[qubit]");
  ASSERT_EQ(qbox->fields.size(), 1u);
  EXPECT_EQ(typing::print_type(qbox->fields[0].type), "qubit");
  EXPECT_EQ(qbox->ownership, typing::OwnershipClass::Linear);

  const auto o = m->specialize_struct("Outer");
  EXPECT_EQ(o->ownership, typing::OwnershipClass::Copyable);
  ASSERT_NE(m->find_struct("Box[int]"), nullptr);
  EXPECT_EQ(m->find_struct("Box[int]")->ownership,
            typing::OwnershipClass::Copyable);
  EXPECT_THAT([&] { m->specialize_struct("Box"); },
              Throws<SemanticError>(HasKind(ErrorKind::ArityMismatchError)));
}

TEST_F(MonomorphiserTest, GenericMethods) {
  auto cell = std::make_shared<typing::StructDecl>(
      "Cell", typing::GenericParams{.types = {{"T"}}, .nats = {}},
      std::vector<typing::Field>{{"item", typing::type_var("T")}});
  table.add_struct(cell, LOC);
  std::vector<std::unique_ptr<FunctionDef>> methods;
  methods.push_back(function(
      "peek", {borrowed("self", typing::struct_type(cell, {typing::type_var("T")}))},
      typing::type_var("T"), block(ret(field(name("self"), "item")))));
  auto def = struct_def(cell, std::move(methods));
  table.add(method_signature(*def, *def->methods[0]));
  {
    Checker checker{table};
    for (auto& fn : checker.check_struct(*def)) checked.push_back(std::move(fn));
  }
  auto m = build();

  const auto peek = m->specialize("Cell.peek", {b.float_type()});
  EXPECT_EQ(peek->key, "Cell.peek[float]");
  EXPECT_EQ(typing::print_type(peek->function->params[0].type), "Cell[float]");
  EXPECT_EQ(typing::print_type(peek->function->return_type), "float");
  EXPECT_THAT(peek->structs, ElementsAre("Cell[float]"));
}

TEST_F(MonomorphiserTest, ConcurrentRequestsShareOneResult) {
  define_size();
  define_main();
  auto m = build();
  std::vector<std::shared_ptr<const ConcreteDefinition>> results(4);
  std::vector<std::thread> threads;
  for (std::size_t i = 0; i < results.size(); ++i) {
    threads.emplace_back([&, i] { results[i] = m->specialize("main"); });
  }
  for (auto& t : threads) t.join();
  for (const auto& r : results) EXPECT_EQ(r, m->find("main"));
  EXPECT_EQ(m->size(), 3u);
}

}  // namespace
}  // namespace qsema::testing
