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

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <memory>
#include <stdexcept>

#include "qsema/diagnostics.h"
#include "qsema/types.h"
#include "testing/test_util.h"

namespace qsema::testing {
namespace {

using ::testing::Eq;
using ::testing::Optional;
using ::testing::Throws;
using typing::BuiltinTypes;
using typing::Nat;
using typing::Ownership;

class SignatureTableTest : public ::testing::Test {
 protected:
  const BuiltinTypes& b = BuiltinTypes::get();
  SignatureTable table;

  Signature simple(std::string n, typing::TypePtr param,
                   typing::TypePtr result) {
    return Signature{.name = std::move(n),
                     .generics = {},
                     .params = {borrowed("x", std::move(param))},
                     .return_type = std::move(result),
                     .location = LOC};
  }

  typing::StructDeclPtr point_decl() {
    return std::make_shared<typing::StructDecl>(
        "Point", typing::GenericParams{},
        std::vector<typing::Field>{{"x", b.int_type()}, {"y", b.int_type()}});
  }
};

TEST_F(SignatureTableTest, AddAndLookup) {
  table.add(simple("f", b.int_type(), b.bool_type()));
  ASSERT_NE(table.find("f"), nullptr);
  EXPECT_EQ(table.lookup("f").params.size(), 1u);
  EXPECT_EQ(table.find("g"), nullptr);
  EXPECT_THAT([&] { table.lookup("g", LOC); },
              Throws<SemanticError>(HasKind(ErrorKind::UnknownNameError)));
}

TEST_F(SignatureTableTest, EqualRegistrationIsANoOp) {
  table.add(simple("f", b.int_type(), b.bool_type()));
  auto again = simple("f", b.int_type(), b.bool_type());
  again.params[0].name = "renamed";
  again.location = Location{"other.qs", 7};
  EXPECT_NO_THROW(table.add(std::move(again)));
  EXPECT_EQ(table.size(), 1u);
}

TEST_F(SignatureTableTest, ConflictingRegistrationIsRejected) {
  table.add(simple("f", b.int_type(), b.bool_type()));
  EXPECT_THAT([&] { table.add(simple("f", b.int_type(), b.int_type())); },
              Throws<SemanticError>(HasKind(ErrorKind::DuplicateDefinitionError)));
  auto owned_param = simple("f", b.int_type(), b.bool_type());
  owned_param.params[0].ownership = Ownership::Owned;
  EXPECT_THAT([&] { table.add(std::move(owned_param)); },
              Throws<SemanticError>(HasKind(ErrorKind::DuplicateDefinitionError)));
}

TEST_F(SignatureTableTest, FinalizedTableRejectsRegistration) {
  table.finalize();
  EXPECT_TRUE(table.finalized());
  EXPECT_THROW(table.add(simple("f", b.int_type(), b.bool_type())),
               std::logic_error);
}

TEST_F(SignatureTableTest, StructRegistersConstructor) {
  table.add_struct(point_decl(), LOC);
  ASSERT_NE(table.find_struct("Point"), nullptr);
  const auto& ctor = table.lookup("Point");
  ASSERT_EQ(ctor.params.size(), 2u);
  EXPECT_EQ(ctor.params[0].name, "x");
  EXPECT_EQ(ctor.params[0].ownership, Ownership::Owned);
  EXPECT_EQ(typing::print_type(ctor.return_type), "Point");
  EXPECT_THAT([&] { table.lookup_struct("Line", LOC); },
              Throws<SemanticError>(HasKind(ErrorKind::UnknownNameError)));
}

TEST_F(SignatureTableTest, GenericStructConstructor) {
  auto decl = std::make_shared<typing::StructDecl>(
      "Reg", typing::GenericParams{.types = {}, .nats = {"n"}},
      std::vector<typing::Field>{
          {"qs", typing::array_type(b.qubit_type(), Nat::variable("n"))}});
  table.add_struct(decl, LOC);
  EXPECT_EQ(typing::print_type(table.lookup("Reg").function_type()),
            "[n](array[qubit, n] @owned) -> Reg[n]");
}

TEST_F(SignatureTableTest, ConflictingStructIsRejected) {
  table.add_struct(point_decl(), LOC);
  EXPECT_NO_THROW(table.add_struct(point_decl(), LOC));
  auto other = std::make_shared<typing::StructDecl>(
      "Point", typing::GenericParams{},
      std::vector<typing::Field>{{"x", b.float_type()}});
  EXPECT_THAT([&] { table.add_struct(other, LOC); },
              Throws<SemanticError>(HasKind(ErrorKind::DuplicateDefinitionError)));
}

TEST_F(SignatureTableTest, FindMethod) {
  table.add_struct(point_decl(), LOC);
  table.add(Signature{.name = method_name("Point", "norm"),
                      .generics = {},
                      .params = {borrowed("self", table.lookup("Point").return_type)},
                      .return_type = b.int_type(),
                      .location = LOC});
  const auto point = table.lookup("Point").return_type;
  ASSERT_NE(table.find_method(point, "norm"), nullptr);
  EXPECT_EQ(table.find_method(point, "missing"), nullptr);
  EXPECT_EQ(table.find_method(typing::tuple_type({point}), "norm"), nullptr);
}

TEST(OperatorTest, MapsOperatorsToMethods) {
  EXPECT_THAT(binary_operator_method("+"), Optional(Eq("__add__")));
  EXPECT_THAT(binary_operator_method("<="), Optional(Eq("__le__")));
  EXPECT_THAT(binary_operator_method("and"), Optional(Eq("__and__")));
  EXPECT_EQ(binary_operator_method("**"), std::nullopt);
  EXPECT_THAT(unary_operator_method("-"), Optional(Eq("__neg__")));
  EXPECT_THAT(unary_operator_method("not"), Optional(Eq("__not__")));
  EXPECT_EQ(unary_operator_method("+"), std::nullopt);
  EXPECT_EQ(method_name("int", "__add__"), "int.__add__");
}

class PreludeTest : public SignatureTableTest {
 protected:
  void SetUp() override { install_prelude(table); }
};

TEST_F(PreludeTest, Gates) {
  EXPECT_EQ(typing::print_type(table.lookup("h").function_type()),
            "(qubit) -> none");
  EXPECT_EQ(typing::print_type(table.lookup("measure").function_type()),
            "(qubit @owned) -> bool");
  EXPECT_EQ(typing::print_type(table.lookup("qubit").function_type()),
            "() -> qubit");
}

TEST_F(PreludeTest, GenericBuiltins) {
  const auto& len = table.lookup("len");
  EXPECT_TRUE(len.is_generic());
  EXPECT_EQ(typing::print_type(len.function_type()),
            "[T; n](array[T, n]) -> nat");
  EXPECT_EQ(typing::print_type(table.lookup("discard_array").function_type()),
            "[n](array[qubit, n] @owned) -> none");
}

TEST_F(PreludeTest, PrimitiveOperators) {
  const auto* add = table.find_method(b.int_type(), "__add__");
  ASSERT_NE(add, nullptr);
  EXPECT_EQ(typing::print_type(add->function_type()), "(int, int) -> int");
  const auto* lt = table.find_method(b.float_type(), "__lt__");
  ASSERT_NE(lt, nullptr);
  EXPECT_EQ(typing::print_type(lt->return_type), "bool");
  EXPECT_NE(table.find_method(b.bool_type(), "__not__"), nullptr);
  EXPECT_EQ(table.find_method(b.bool_type(), "__add__"), nullptr);
  EXPECT_EQ(table.find_method(b.nat_type(), "__neg__"), nullptr);
  EXPECT_NE(table.find_method(b.rng_type(), "random_int"), nullptr);
}

TEST_F(PreludeTest, ReinstallingIsANoOp) {
  const auto size = table.size();
  install_prelude(table);
  EXPECT_EQ(table.size(), size);
}

}  // namespace
}  // namespace qsema::testing
