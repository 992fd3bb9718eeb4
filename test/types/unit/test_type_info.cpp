/***
 * Name: test_type_info
 * Purpose: Annotation types: spelling, attribute/value classification and subscripting.
 */
#include <gtest/gtest.h>
#include "constant/PyValue.h"
#include "types/Annotations.h"
#include "types/TypeInfo.h"

using namespace gsc;
using constant::PyValue;
using types::GenericKind;
using types::ScalarKind;
using types::TypeInfo;

TEST(TypeInfo, ToStringForEachKind) {
  EXPECT_EQ(TypeInfo::tensor(ir::ElemType::Float)->toString(), "FLOAT");
  std::vector<types::Dim> dims{types::Dim{std::nullopt, "N"}, types::Dim{3, ""}, types::Dim{}};
  EXPECT_EQ(TypeInfo::tensor(ir::ElemType::Int64, dims)->toString(), "INT64[N,3,?]");
  EXPECT_EQ(TypeInfo::tensor(ir::ElemType::Float, std::vector<types::Dim>{})->toString(), "FLOAT[]");
  EXPECT_EQ(TypeInfo::scalarType(ScalarKind::Int)->toString(), "int");
  const auto listInt = TypeInfo::genericType(GenericKind::List, {TypeInfo::scalarType(ScalarKind::Int)});
  EXPECT_EQ(listInt->toString(), "List[int]");
  const auto tup = TypeInfo::genericType(GenericKind::Tuple, {TypeInfo::tensor(ir::ElemType::Float),
                                                             TypeInfo::tensor(ir::ElemType::Int64)});
  EXPECT_EQ(tup->toString(), "tuple[FLOAT,INT64]");
}

TEST(TypeInfo, AttributeTypesMapToAttrKinds) {
  EXPECT_EQ(types::toAttrKind(*TypeInfo::scalarType(ScalarKind::Int)), ir::AttrKind::Int);
  EXPECT_EQ(types::toAttrKind(*TypeInfo::scalarType(ScalarKind::Bool)), ir::AttrKind::Int);
  EXPECT_EQ(types::toAttrKind(*TypeInfo::scalarType(ScalarKind::Float)), ir::AttrKind::Float);
  EXPECT_EQ(types::toAttrKind(*TypeInfo::scalarType(ScalarKind::Str)), ir::AttrKind::String);
  const auto floats = TypeInfo::genericType(GenericKind::Sequence, {TypeInfo::scalarType(ScalarKind::Float)});
  EXPECT_EQ(types::toAttrKind(*floats), ir::AttrKind::Floats);
  const auto optInt = TypeInfo::genericType(GenericKind::Optional, {TypeInfo::scalarType(ScalarKind::Int)});
  EXPECT_EQ(types::toAttrKind(*optInt), ir::AttrKind::Int);
  EXPECT_TRUE(types::isAttrType(*optInt));
  EXPECT_FALSE(types::isAttrType(*TypeInfo::tensor(ir::ElemType::Float)));
  EXPECT_FALSE(types::isAttrType(*TypeInfo::genericType(GenericKind::List)));
}

TEST(TypeInfo, ValueTypesAndValidity) {
  const auto tensor = TypeInfo::tensor(ir::ElemType::Float);
  const auto optTensor = TypeInfo::genericType(GenericKind::Optional, {tensor});
  EXPECT_TRUE(types::isValueType(*tensor));
  EXPECT_TRUE(types::isValueType(*optTensor));
  EXPECT_FALSE(types::isValueType(*TypeInfo::scalarType(ScalarKind::Int)));
  EXPECT_TRUE(types::isValidType(*TypeInfo::scalarType(ScalarKind::Str)));
  EXPECT_FALSE(types::isValidType(*TypeInfo::genericType(GenericKind::Tuple)));
  EXPECT_EQ(types::unwrapOptional(optTensor), tensor);
  EXPECT_EQ(types::unwrapOptional(tensor), tensor);
}

TEST(TypeInfo, OnnxTypeStrings) {
  EXPECT_EQ(types::onnxTypeString(*TypeInfo::tensor(ir::ElemType::Float)), "tensor(float)");
  EXPECT_EQ(types::onnxTypeString(*TypeInfo::tensor(ir::ElemType::Int64)), "tensor(int64)");
  const auto opt = TypeInfo::genericType(GenericKind::Optional, {TypeInfo::tensor(ir::ElemType::Bool)});
  EXPECT_EQ(types::onnxTypeString(*opt), "optional(tensor(bool))");
  EXPECT_EQ(types::onnxTypeString(*TypeInfo::scalarType(ScalarKind::Int)), "");
}

TEST(TypeInfo, ParameterizeTensorShapes) {
  const auto base = TypeInfo::tensor(ir::ElemType::Float);
  auto shaped = types::parameterize(*base, {PyValue::string("B"), PyValue::integer(4), PyValue::none()});
  ASSERT_TRUE(shaped);
  ASSERT_TRUE(shaped->shape.has_value());
  ASSERT_EQ(shaped->shape->size(), 3u);
  EXPECT_EQ((*shaped->shape)[0].symbol, "B");
  ASSERT_TRUE((*shaped->shape)[1].value.has_value());
  EXPECT_EQ(*(*shaped->shape)[1].value, 4);
  EXPECT_FALSE((*shaped->shape)[2].value.has_value());
  EXPECT_FALSE(types::parameterize(*shaped, {PyValue::integer(1)}));
  EXPECT_FALSE(types::parameterize(*base, {PyValue::floating(1.0)}));
}

TEST(TypeInfo, ParameterizeGenerics) {
  const auto list = TypeInfo::genericType(GenericKind::List);
  const auto intT = PyValue::typeObject(TypeInfo::scalarType(ScalarKind::Int));
  auto listInt = types::parameterize(*list, {intT});
  ASSERT_TRUE(listInt);
  EXPECT_EQ(listInt->toString(), "List[int]");
  EXPECT_FALSE(types::parameterize(*list, {intT, intT}));
  EXPECT_FALSE(types::parameterize(*list, {PyValue::integer(1)}));
  EXPECT_FALSE(types::parameterize(*listInt, {intT}));
  const auto tup = TypeInfo::genericType(GenericKind::Tuple);
  auto pair = types::parameterize(*tup, {intT, intT});
  ASSERT_TRUE(pair);
  EXPECT_EQ(pair->args.size(), 2u);
  EXPECT_FALSE(types::parameterize(*TypeInfo::scalarType(ScalarKind::Int), {intT}));
}

TEST(TypeInfo, ReturnTypesSplitsTuples) {
  const auto f = TypeInfo::tensor(ir::ElemType::Float);
  const auto tup = TypeInfo::genericType(GenericKind::Tuple, {f, f});
  EXPECT_EQ(types::returnTypes(tup).size(), 2u);
  ASSERT_EQ(types::returnTypes(f).size(), 1u);
  EXPECT_EQ(types::returnTypes(f)[0], f);
}

TEST(TypeInfo, StructuralEquality) {
  EXPECT_TRUE(*TypeInfo::tensor(ir::ElemType::Float) == *TypeInfo::tensor(ir::ElemType::Float));
  EXPECT_FALSE(*TypeInfo::tensor(ir::ElemType::Float) == *TypeInfo::tensor(ir::ElemType::Double));
  EXPECT_FALSE(*TypeInfo::tensor(ir::ElemType::Float) ==
               *TypeInfo::tensor(ir::ElemType::Float, std::vector<types::Dim>{}));
}
