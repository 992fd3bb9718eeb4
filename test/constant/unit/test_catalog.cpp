/***
 * Name: test_catalog
 * Purpose: Builtin module namespaces, builtin names and PyValue helpers.
 */
#include <gtest/gtest.h>
#include "constant/Catalog.h"
#include "constant/PyValue.h"

using namespace gsc;
using constant::PyValue;
using constant::ValueKind;

TEST(Catalog, RootModuleExposesOpsetsTypesAndSubmodules) {
  const auto gscMod = constant::lookupModule("gsc");
  ASSERT_TRUE(gscMod.has_value());
  ASSERT_EQ(gscMod->kind, ValueKind::Namespace);
  const auto& members = *gscMod->members;
  EXPECT_EQ(members.count("opset1"), 1u);
  EXPECT_EQ(members.count("opset18"), 1u);
  EXPECT_EQ(members.count("opset19"), 0u);
  EXPECT_EQ(members.at("opset18").opset, (values::Opset{"", 18}));
  ASSERT_EQ(members.at("FLOAT").kind, ValueKind::Type);
  EXPECT_EQ(members.at("FLOAT").type->toString(), "FLOAT");
  EXPECT_EQ(members.at("opsets").kind, ValueKind::Namespace);
  EXPECT_EQ(members.at("types").kind, ValueKind::Namespace);
}

TEST(Catalog, SubmodulesAndTyping) {
  const auto ops = constant::lookupModule("gsc.opsets");
  ASSERT_TRUE(ops.has_value());
  EXPECT_EQ(ops->members->size(), static_cast<size_t>(constant::kMaxDefaultOpsetVersion));
  const auto typesMod = constant::lookupModule("gsc.types");
  ASSERT_TRUE(typesMod.has_value());
  EXPECT_EQ(typesMod->members->at("INT64").type->elemType, ir::ElemType::Int64);
  const auto typing = constant::lookupModule("typing");
  ASSERT_TRUE(typing.has_value());
  EXPECT_EQ(typing->members->at("Sequence").type->toString(), "Sequence");
  EXPECT_FALSE(constant::lookupModule("numpy").has_value());
}

TEST(Catalog, BuiltinNames) {
  ASSERT_TRUE(constant::lookupBuiltin("float").has_value());
  EXPECT_EQ(constant::lookupBuiltin("float")->type->toString(), "float");
  EXPECT_EQ(constant::lookupBuiltin("list")->type->toString(), "List");
  EXPECT_FALSE(constant::lookupBuiltin("dict").has_value());
}

TEST(Catalog, ReprAndTruthiness) {
  EXPECT_EQ(PyValue::boolean(true).repr(), "True");
  EXPECT_EQ(PyValue::string("s").repr(), "'s'");
  EXPECT_EQ(PyValue::floating(2.0).repr(), "2.0");
  EXPECT_EQ(PyValue::floating(0.1).repr(), "0.1");
  EXPECT_EQ(PyValue::tuple({PyValue::integer(1)}).repr(), "(1,)");
  EXPECT_EQ(PyValue::none().repr(), "None");
  EXPECT_EQ(PyValue::makeOpset(values::Opset{"", 15}).repr(), "opset15");
  EXPECT_FALSE(PyValue::list({}).truthy());
  EXPECT_TRUE(PyValue::string("x").truthy());
  EXPECT_FALSE(PyValue::floating(0.0).truthy());
}

TEST(Catalog, EqualityIsByKindAndValue) {
  EXPECT_EQ(PyValue::integer(1), PyValue::integer(1));
  EXPECT_NE(PyValue::integer(1), PyValue::boolean(true));
  EXPECT_NE(PyValue::list({PyValue::integer(1)}), PyValue::tuple({PyValue::integer(1)}));
  const auto a = constant::lookupModule("gsc.types")->members->at("FLOAT");
  const auto b = constant::lookupModule("gsc")->members->at("FLOAT");
  EXPECT_EQ(a, b);
  EXPECT_STREQ(constant::to_string(ValueKind::Namespace), "module");
}
