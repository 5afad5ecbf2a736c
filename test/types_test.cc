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
#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <memory>
#include <stdexcept>
#include <string>

namespace qsema::typing::testing {

using ::testing::ElementsAre;
using ::testing::Eq;
using ::testing::ExplainMatchResult;
using ::testing::HasSubstr;
using ::testing::PrintToString;

MATCHER_P2(PrintsCorrectly, no, yes,
           "prints as " + PrintToString(no) + " when not canonicalized and " +
               PrintToString(yes) + " when canonicalized") {
  const auto rn = print_type(arg, CanonicalizeUndeterminedTypes::NO);
  const auto ry = print_type(arg, CanonicalizeUndeterminedTypes::YES);
  *result_listener << "prints as " << PrintToString(rn) << "||"
                   << PrintToString(ry);
  return ExplainMatchResult(Eq(no), rn, result_listener) &&
         ExplainMatchResult(Eq(yes), ry, result_listener);
}

MATCHER_P(PrintsAs, expected, "") {
  auto s = print_type(arg, CanonicalizeUndeterminedTypes::YES);
  *result_listener << "prints as " << PrintToString(s);
  return ExplainMatchResult(Eq(expected), s, result_listener);
}

class TypesTestBase : public ::testing::Test {
 protected:
  StampGenerator stamper;
  const BuiltinTypes& b = BuiltinTypes::get();

  TypePtr int_type = b.int_type();
  TypePtr bool_type = b.bool_type();
  TypePtr qubit_type = b.qubit_type();
  TypePtr rng_type = b.rng_type();

  TypePtr undetermined_type() {
    return std::make_shared<UndeterminedType>(stamper);
  }

  StructDeclPtr pair_decl = std::make_shared<StructDecl>(
      "Pair", GenericParams{.types = {{"T", false, false}}, .nats = {}},
      std::vector<Field>{{"first", type_var("T", false, false)},
                         {"second", type_var("T", false, false)}});

  StructDeclPtr register_decl = std::make_shared<StructDecl>(
      "Register", GenericParams{.types = {}, .nats = {"n"}},
      std::vector<Field>{
          {"qubits", array_type(BuiltinTypes::get().qubit_type(),
                                Nat::variable("n"))},
          {"size", BuiltinTypes::get().int_type()}});
};

using NatTest = TypesTestBase;

TEST_F(NatTest, Accessors) {
  const auto c = Nat::constant(3);
  const auto v = Nat::variable("n");
  const auto u = Nat::undetermined(stamper);

  EXPECT_EQ(c.value(), 3u);
  EXPECT_EQ(v.name(), "n");
  EXPECT_TRUE(u.is_undetermined());
  EXPECT_THROW(c.name(), std::logic_error);
  EXPECT_THROW(v.value(), std::logic_error);
  EXPECT_THROW(u.value(), std::logic_error);
  EXPECT_EQ(print_nat(c), "3");
  EXPECT_EQ(print_nat(v), "n");
}

using PrintTypeTest = TypesTestBase;

TEST_F(PrintTypeTest, Primitives) {
  EXPECT_THAT(int_type, PrintsCorrectly("int", "int"));
  EXPECT_THAT(qubit_type, PrintsCorrectly("qubit", "qubit"));
}

TEST_F(PrintTypeTest, Tuples) {
  EXPECT_THAT(tuple_type({}), PrintsAs("()"));
  EXPECT_THAT(tuple_type({int_type}), PrintsAs("(int,)"));
  EXPECT_THAT(tuple_type({int_type, bool_type}), PrintsAs("(int, bool)"));
}

TEST_F(PrintTypeTest, ArraysAndStructs) {
  EXPECT_THAT(array_type(qubit_type, Nat::constant(4)),
              PrintsAs("array[qubit, 4]"));
  EXPECT_THAT(array_type(type_var("T"), Nat::variable("n")),
              PrintsAs("array[T, n]"));
  EXPECT_THAT(struct_type(pair_decl, {int_type}), PrintsAs("Pair[int]"));
  EXPECT_THAT(struct_type(register_decl, {}, {Nat::constant(3)}),
              PrintsAs("Register[3]"));
  EXPECT_THAT(option_type(qubit_type), PrintsAs("Option[qubit]"));
}

TEST_F(PrintTypeTest, Functions) {
  EXPECT_THAT(
      function_type({{int_type, Ownership::Borrowed},
                     {qubit_type, Ownership::Owned}},
                    bool_type),
      PrintsAs("(int, qubit @owned) -> bool"));
  EXPECT_THAT(
      function_type({{array_type(type_var("T"), Nat::variable("n")),
                      Ownership::Borrowed}},
                    type_var("T"),
                    GenericParams{.types = {{"T"}}, .nats = {"n"}}),
      PrintsAs("[T; n](array[T, n]) -> T"));
}

TEST_F(PrintTypeTest, CanonicalizesUndeterminedTypes) {
  // Throw away some stamps so the canonical ids differ.
  stamper();
  stamper();
  auto u0 = undetermined_type();
  auto u1 = undetermined_type();
  const auto n = Nat::undetermined(stamper);
  auto t = tuple_type({u1, u0, array_type(u1, n)});
  EXPECT_THAT(t, PrintsCorrectly(
                     fmt::format("({}, {}, array[{}, '#{}])",
                                 as<UndeterminedType>(u1)->name(),
                                 as<UndeterminedType>(u0)->name(),
                                 as<UndeterminedType>(u1)->name(), n.stamp()),
                     "('~0, '~1, array['~0, '#0])"));
}

using FreeVariablesTest = TypesTestBase;

TEST_F(FreeVariablesTest, FunctionGenericsAreBound) {
  auto f = function_type({{type_var("T"), Ownership::Borrowed},
                          {type_var("U"), Ownership::Borrowed}},
                         array_type(int_type, Nat::variable("n")),
                         GenericParams{.types = {{"T"}}, .nats = {}});
  EXPECT_THAT(f->free_variables().type_variables, ElementsAre("U"));
  EXPECT_THAT(f->free_variables().nat_variables, ElementsAre("n"));
  EXPECT_FALSE(f->is_closed());
  EXPECT_TRUE(struct_type(pair_decl, {int_type})->is_closed());
}

using InstantiateTest = TypesTestBase;

TEST_F(InstantiateTest, ReplacesParameters) {
  Instantiation inst;
  inst.types.emplace("T", qubit_type);
  inst.nats.emplace("n", Nat::constant(5));
  auto t = tuple_type({type_var("T"), array_type(type_var("T"),
                                                 Nat::variable("n")),
                       type_var("U")});
  EXPECT_THAT(instantiate(t, inst),
              PrintsAs("(qubit, array[qubit, 5], U)"));
}

TEST_F(InstantiateTest, FunctionGenericsShadow) {
  Instantiation inst;
  inst.types.emplace("T", qubit_type);
  auto f = function_type({{type_var("T"), Ownership::Borrowed}}, type_var("T"),
                         GenericParams{.types = {{"T"}}, .nats = {}});
  EXPECT_THAT(instantiate(f, inst), PrintsAs("[T](T) -> T"));
}

TEST_F(InstantiateTest, MakeInstantiationChecksCounts) {
  const GenericParams params{.types = {{"T"}}, .nats = {"n"}};
  EXPECT_THROW(make_instantiation(params, {int_type}, {}), std::logic_error);
  const auto inst = make_instantiation(params, {int_type}, {Nat::constant(2)});
  EXPECT_TRUE(equal(inst.types.at("T"), int_type));
  EXPECT_EQ(inst.nats.at("n"), Nat::constant(2));
}

TEST_F(InstantiateTest, FreshInstantiation) {
  const GenericParams params{.types = {{"T"}}, .nats = {"n"}};
  const auto inst = fresh_instantiation(params, stamper);
  EXPECT_NE(as<UndeterminedType>(inst.types.at("T")), nullptr);
  EXPECT_TRUE(inst.nats.at("n").is_undetermined());
}

using UnifyTest = TypesTestBase;

TEST_F(UnifyTest, IdenticalPrimitives) {
  Substitutions subs;
  EXPECT_THAT(unify(int_type, int_type, subs).unified_type, PrintsAs("int"));
  EXPECT_TRUE(subs.empty());
}

TEST_F(UnifyTest, DistinctPrimitivesFail) {
  Substitutions subs;
  EXPECT_THROW(unify(int_type, bool_type, subs), UnificationError);
}

TEST_F(UnifyTest, BindsUndeterminedTypes) {
  Substitutions subs;
  auto u = undetermined_type();
  auto unified =
      unify(tuple_type({u, int_type}), tuple_type({qubit_type, int_type}), subs)
          .unified_type;
  EXPECT_THAT(unified, PrintsAs("(qubit, int)"));
  EXPECT_THAT(apply_substitutions(u, subs), PrintsAs("qubit"));
}

TEST_F(UnifyTest, BindsUndeterminedNats) {
  Substitutions subs;
  const auto n = Nat::undetermined(stamper);
  unify(array_type(qubit_type, n), array_type(qubit_type, Nat::constant(3)),
        subs);
  EXPECT_EQ(apply_substitutions(n, subs), Nat::constant(3));
  EXPECT_THROW(unify(array_type(qubit_type, n),
                     array_type(qubit_type, Nat::constant(4)), subs),
               UnificationError);
}

TEST_F(UnifyTest, TypeVariablesAreRigid) {
  Substitutions subs;
  EXPECT_NO_THROW(unify(type_var("T"), type_var("T"), subs));
  EXPECT_THROW(unify(type_var("T"), int_type, subs), UnificationError);
  EXPECT_THROW(unify(type_var("T"), type_var("U"), subs), UnificationError);
}

TEST_F(UnifyTest, OccursCheck) {
  Substitutions subs;
  auto u = undetermined_type();
  EXPECT_THROW(unify(u, tuple_type({int_type, u}), subs), UnificationError);
}

TEST_F(UnifyTest, SubstitutionsStayIdempotent) {
  Substitutions subs;
  auto u0 = undetermined_type();
  auto u1 = undetermined_type();
  unify(u0, option_type(u1), subs);
  unify(u1, int_type, subs);
  EXPECT_THAT(apply_substitutions(u0, subs), PrintsAs("Option[int]"));
}

TEST_F(UnifyTest, StructsAreNominal) {
  Substitutions subs;
  auto u = undetermined_type();
  EXPECT_THAT(unify(struct_type(pair_decl, {u}),
                    struct_type(pair_decl, {qubit_type}), subs)
                  .unified_type,
              PrintsAs("Pair[qubit]"));
  auto other = std::make_shared<StructDecl>(
      "Other", GenericParams{.types = {{"T", false, false}}, .nats = {}},
      std::vector<Field>{{"first", type_var("T", false, false)}});
  EXPECT_THROW(unify(struct_type(pair_decl, {int_type}),
                     struct_type(other, {int_type}), subs),
               UnificationError);
}

TEST_F(UnifyTest, StructArgumentCountsMustMatch) {
  Substitutions subs;
  EXPECT_THROW(unify(struct_type(pair_decl, {int_type}),
                     struct_type(pair_decl, {int_type, bool_type}), subs),
               UnificationError);
  EXPECT_THROW(unify(struct_type(register_decl, {}, {Nat::constant(2)}),
                     struct_type(register_decl, {}, {}), subs),
               UnificationError);
}

TEST_F(UnifyTest, FunctionOwnershipMustMatch) {
  Substitutions subs;
  auto f = function_type({{qubit_type, Ownership::Owned}}, bool_type);
  auto g = function_type({{qubit_type, Ownership::Borrowed}}, bool_type);
  EXPECT_THROW(unify(f, g, subs), UnificationError);
}

TEST_F(UnifyTest, ErrorCarriesContext) {
  Substitutions subs;
  try {
    unify(tuple_type({int_type, option_type(int_type)}),
          tuple_type({int_type, option_type(bool_type)}), subs);
    FAIL() << "Expected a UnificationError";
  } catch (UnificationError& e) {
    EXPECT_GE(e.context().size(), 2u);
    EXPECT_THAT(e.what(), HasSubstr("while trying to unify"));
  }
}

TEST_F(UnifyTest, UnifyNats) {
  Substitutions subs;
  EXPECT_EQ(unify_nats(Nat::constant(2), Nat::constant(2), subs),
            Nat::constant(2));
  EXPECT_THROW(unify_nats(Nat::constant(2), Nat::constant(3), subs),
               UnificationError);
  EXPECT_THROW(unify_nats(Nat::variable("n"), Nat::constant(3), subs),
               UnificationError);
}

using EqualTest = TypesTestBase;

TEST_F(EqualTest, Structural) {
  EXPECT_TRUE(equal(tuple_type({int_type, qubit_type}),
                    tuple_type({int_type, qubit_type})));
  EXPECT_FALSE(equal(array_type(int_type, Nat::constant(2)),
                     array_type(int_type, Nat::constant(3))));
  EXPECT_FALSE(equal(struct_type(pair_decl, {int_type}),
                     struct_type(pair_decl, {bool_type})));
}

using ClassifyTest = TypesTestBase;

TEST_F(ClassifyTest, Leaves) {
  EXPECT_EQ(classify(int_type), OwnershipClass::Copyable);
  EXPECT_EQ(classify(qubit_type), OwnershipClass::Linear);
  EXPECT_EQ(classify(rng_type), OwnershipClass::Affine);
  EXPECT_EQ(classify(function_type({}, qubit_type)), OwnershipClass::Copyable);
}

TEST_F(ClassifyTest, CompoundTypesTakeMostRestrictive) {
  EXPECT_EQ(classify(tuple_type({int_type, bool_type})),
            OwnershipClass::Copyable);
  EXPECT_EQ(classify(tuple_type({int_type, rng_type})), OwnershipClass::Affine);
  EXPECT_EQ(classify(tuple_type({rng_type, qubit_type})),
            OwnershipClass::Linear);
  EXPECT_EQ(classify(array_type(qubit_type, Nat::constant(0))),
            OwnershipClass::Linear);
  EXPECT_EQ(classify(option_type(rng_type)), OwnershipClass::Affine);
}

TEST_F(ClassifyTest, StructsDeriveFromFields) {
  EXPECT_EQ(classify(struct_type(pair_decl, {int_type})),
            OwnershipClass::Copyable);
  EXPECT_EQ(classify(struct_type(pair_decl, {rng_type})),
            OwnershipClass::Affine);
  EXPECT_EQ(classify(struct_type(pair_decl, {qubit_type})),
            OwnershipClass::Linear);
  EXPECT_EQ(classify(struct_type(register_decl, {}, {Nat::constant(2)})),
            OwnershipClass::Linear);
  auto nested = struct_type(pair_decl, {struct_type(pair_decl, {qubit_type})});
  EXPECT_EQ(classify(nested), OwnershipClass::Linear);
}

TEST_F(ClassifyTest, MemoizedClassifierAgrees) {
  OwnershipClassifier classifier;
  for (const auto& t : {int_type, qubit_type, rng_type,
                        struct_type(pair_decl, {qubit_type}),
                        struct_type(pair_decl, {int_type})}) {
    EXPECT_EQ(classifier.classify(t), classify(t)) << print_type(t);
    EXPECT_EQ(classifier.classify(t), classify(t)) << print_type(t);
  }
}

TEST_F(ClassifyTest, TypeVariableBounds) {
  const TypeParam copyable{"T", true, true};
  const TypeParam droppable{"T", false, true};
  const TypeParam linear{"T", false, false};
  EXPECT_EQ(bound_class(copyable), OwnershipClass::Copyable);
  EXPECT_EQ(bound_class(droppable), OwnershipClass::Affine);
  EXPECT_EQ(bound_class(linear), OwnershipClass::Linear);

  EXPECT_TRUE(satisfies_bound(OwnershipClass::Copyable, copyable));
  EXPECT_FALSE(satisfies_bound(OwnershipClass::Affine, copyable));
  EXPECT_TRUE(satisfies_bound(OwnershipClass::Affine, droppable));
  EXPECT_FALSE(satisfies_bound(OwnershipClass::Linear, droppable));
  EXPECT_TRUE(satisfies_bound(OwnershipClass::Linear, linear));
}

TEST_F(ClassifyTest, UndeterminedTypesCannotBeClassified) {
  EXPECT_THROW(classify(undetermined_type()), std::logic_error);
}

}  // namespace qsema::typing::testing
