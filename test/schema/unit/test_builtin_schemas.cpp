/***
 * Name: test_builtin_schemas
 * Purpose: Versioned schema lookup and the flattened parameter list.
 */
#include <gtest/gtest.h>
#include "schema/BuiltinSchemas.h"
#include "schema/ParamSchema.h"

using namespace gsc;

TEST(BuiltinSchemas, LookupPicksNewestNotAfterVersion) {
  const schema::BuiltinSchemas reg;
  const auto* sq1 = reg.lookup("", "Squeeze", 12);
  ASSERT_NE(sq1, nullptr);
  EXPECT_EQ(sq1->sinceVersion, 1);
  EXPECT_NE(sq1->findAttribute("axes"), nullptr);
  const auto* sq13 = reg.lookup("", "Squeeze", 18);
  ASSERT_NE(sq13, nullptr);
  EXPECT_EQ(sq13->sinceVersion, 13);
  EXPECT_EQ(sq13->inputs.size(), 2u);
  EXPECT_EQ(sq13->findAttribute("axes"), nullptr);
}

TEST(BuiltinSchemas, UnknownOrTooNewIsNull) {
  const schema::BuiltinSchemas reg;
  EXPECT_EQ(reg.lookup("", "NoSuchOp", 18), nullptr);
  EXPECT_EQ(reg.lookup("", "CastLike", 14), nullptr);
  EXPECT_NE(reg.lookup("", "CastLike", 15), nullptr);
  EXPECT_EQ(reg.lookup("custom", "Add", 18), nullptr);
}

TEST(BuiltinSchemas, ReductionsMoveAxesToInputs) {
  const schema::BuiltinSchemas reg;
  EXPECT_NE(reg.lookup("", "ReduceSum", 11)->findAttribute("axes"), nullptr);
  EXPECT_EQ(reg.lookup("", "ReduceSum", 13)->inputs.size(), 2u);
  EXPECT_NE(reg.lookup("", "ReduceMean", 17)->findAttribute("axes"), nullptr);
  EXPECT_EQ(reg.lookup("", "ReduceMean", 18)->inputs.size(), 2u);
}

TEST(BuiltinSchemas, ControlFlowSignatures) {
  const schema::BuiltinSchemas reg;
  const auto* loop = reg.lookup("", "Loop", 18);
  ASSERT_NE(loop, nullptr);
  ASSERT_EQ(loop->inputs.size(), 3u);
  EXPECT_EQ(loop->inputs[0].option, schema::FormalOption::Optional);
  EXPECT_EQ(loop->inputs[2].option, schema::FormalOption::Variadic);
  EXPECT_FALSE(loop->inputs[2].homogeneous);
  const auto* iff = reg.lookup("", "If", 18);
  ASSERT_NE(iff, nullptr);
  EXPECT_TRUE(iff->findAttribute("then_branch")->required);
  EXPECT_EQ(iff->findAttribute("else_branch")->kind, ir::AttrKind::Graph);
}

TEST(BuiltinSchemas, AddCountsAndOrders) {
  schema::BuiltinSchemas reg;
  const auto before = reg.size();
  schema::OpSchema later;
  later.domain = "custom";
  later.name = "Foo";
  later.sinceVersion = 3;
  schema::OpSchema earlier = later;
  earlier.sinceVersion = 1;
  reg.add(later);
  reg.add(earlier);
  EXPECT_EQ(reg.size(), before + 2);
  EXPECT_EQ(reg.lookup("custom", "Foo", 2)->sinceVersion, 1);
  EXPECT_EQ(reg.lookup("custom", "Foo", 5)->sinceVersion, 3);
}

TEST(BuiltinSchemas, TypeVariablesVersusConcreteTypes) {
  EXPECT_TRUE(schema::isTypeVariable("T"));
  EXPECT_FALSE(schema::isTypeVariable("tensor(int64)"));
}

TEST(ParamSchema, InputsThenAttributes) {
  const schema::BuiltinSchemas reg;
  const auto params = schema::paramSchemasOf(*reg.lookup("", "Gemm", 18));
  ASSERT_EQ(params.size(), 7u);
  EXPECT_EQ(params[0].name, "A");
  EXPECT_TRUE(params[0].required);
  EXPECT_TRUE(params[2].isInput);
  EXPECT_FALSE(params[2].required);
  EXPECT_EQ(params[3].name, "alpha");
  EXPECT_FALSE(params[3].isInput);
  EXPECT_FALSE(params[3].required);
}
