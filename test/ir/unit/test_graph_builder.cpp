/***
 * Name: test_graph_builder
 * Purpose: Attribute construction, function tables and opset collection.
 */
#include <gtest/gtest.h>
#include <memory>
#include "constant/PyValue.h"
#include "ir/GraphBuilder.h"
#include "types/TypeInfo.h"

using namespace gsc;
using constant::PyValue;

TEST(GraphBuilder, ScalarAttributes) {
  ir::GraphBuilder b;
  auto i = b.makeAttr("axis", PyValue::integer(-1));
  ASSERT_TRUE(i.has_value());
  EXPECT_EQ(i->kind, ir::AttrKind::Int);
  EXPECT_EQ(i->i, -1);
  EXPECT_EQ(i->name, "axis");

  auto flag = b.makeAttr("keepdims", PyValue::boolean(true));
  ASSERT_TRUE(flag.has_value());
  EXPECT_EQ(flag->kind, ir::AttrKind::Int);
  EXPECT_EQ(flag->i, 1);

  auto f = b.makeAttr("alpha", PyValue::floating(0.25));
  ASSERT_TRUE(f.has_value());
  EXPECT_EQ(f->kind, ir::AttrKind::Float);
  EXPECT_DOUBLE_EQ(f->f, 0.25);

  auto s = b.makeAttr("mode", PyValue::string("nearest"));
  ASSERT_TRUE(s.has_value());
  EXPECT_EQ(s->kind, ir::AttrKind::String);
  EXPECT_EQ(s->s, "nearest");
}

TEST(GraphBuilder, ListAttributes) {
  ir::GraphBuilder b;
  auto ints = b.makeAttr("perm", PyValue::list({PyValue::integer(1), PyValue::integer(0)}));
  ASSERT_TRUE(ints.has_value());
  EXPECT_EQ(ints->kind, ir::AttrKind::Ints);
  EXPECT_EQ(ints->ints, (std::vector<std::int64_t>{1, 0}));

  auto mixed = b.makeAttr("scales", PyValue::tuple({PyValue::integer(1), PyValue::floating(2.5)}));
  ASSERT_TRUE(mixed.has_value());
  EXPECT_EQ(mixed->kind, ir::AttrKind::Floats);
  EXPECT_EQ(mixed->floats, (std::vector<double>{1.0, 2.5}));

  auto strs = b.makeAttr("names", PyValue::list({PyValue::string("a"), PyValue::string("b")}));
  ASSERT_TRUE(strs.has_value());
  EXPECT_EQ(strs->kind, ir::AttrKind::Strings);
  EXPECT_EQ(strs->strings, (std::vector<std::string>{"a", "b"}));
}

TEST(GraphBuilder, ValuesWithoutAttributeForm) {
  ir::GraphBuilder b;
  EXPECT_FALSE(b.makeAttr("x", PyValue::none()).has_value());
  EXPECT_FALSE(b.makeAttr("x", PyValue::list({PyValue::string("a"), PyValue::integer(1)})).has_value());
  EXPECT_FALSE(b.makeAttr("x", PyValue::list({PyValue::list({PyValue::integer(1)})})).has_value());
  EXPECT_FALSE(b.makeAttr("x", PyValue::makeOpset(values::Opset{"", 18})).has_value());
}

TEST(GraphBuilder, ReferenceAndGraphAttributes) {
  ir::GraphBuilder b;
  const auto ref = b.makeAttrRef("alpha", "scale", ir::AttrKind::Float);
  EXPECT_TRUE(ref.isRef());
  EXPECT_EQ(ref.refAttrName, "scale");
  EXPECT_EQ(ref.kind, ir::AttrKind::Float);

  std::shared_ptr<const ir::Function> body = b.newFunction("loop_body", "");
  const auto g = b.makeGraphAttr("body", body);
  EXPECT_FALSE(g.isRef());
  EXPECT_EQ(g.kind, ir::AttrKind::Graph);
  EXPECT_EQ(g.graph.get(), body.get());
}

TEST(GraphBuilder, StatementsMergeFunctionTables) {
  ir::GraphBuilder b;
  auto fn = b.newFunction("f", "this");
  std::shared_ptr<const ir::Function> g = b.newFunction("g", "this");

  ir::Stmt call;
  call.domain = "this";
  call.opType = "g";
  call.version = 1;
  call.outputs = {"Y"};
  call.functions = {g};
  b.addStmt(*fn, call);
  b.addStmt(*fn, call);
  ASSERT_EQ(fn->functions.size(), 1u);
  EXPECT_EQ(fn->findFunction("g"), g.get());
  EXPECT_EQ(fn->findFunction("h"), nullptr);
  EXPECT_EQ(fn->stmts.size(), 2u);
  EXPECT_EQ(fn->assignedNames().count("Y"), 1u);
}

TEST(GraphBuilder, SignatureHelpers) {
  ir::GraphBuilder b;
  auto fn = b.newFunction("f", "this");
  b.addInput(*fn, "X", types::TypeInfo::tensor(ir::ElemType::Float));
  b.addOutput(*fn, "Y");
  b.addAttrParameter(*fn, "k", ir::AttrKind::Int, b.makeAttr("k", PyValue::integer(2)));
  EXPECT_TRUE(fn->hasInput("X"));
  EXPECT_FALSE(fn->hasInput("Y"));
  ASSERT_EQ(fn->attrParams.size(), 1u);
  ASSERT_TRUE(fn->attrParams[0].defaultValue.has_value());
  EXPECT_EQ(fn->attrParams[0].defaultValue->i, 2);
  EXPECT_FALSE(fn->outputs[0].type);
}

TEST(GraphBuilder, OpsetImportsIncludeSubgraphs) {
  ir::GraphBuilder b;
  auto body = b.newFunction("then", "");
  ir::Stmt inner;
  inner.domain = "com.example";
  inner.opType = "Custom";
  inner.version = 2;
  b.addStmt(*body, inner);

  auto fn = b.newFunction("f", "this");
  ir::Stmt node;
  node.opType = "If";
  node.version = 18;
  node.attrs.push_back(b.makeGraphAttr("then_branch", std::shared_ptr<const ir::Function>(std::move(body))));
  b.addStmt(*fn, node);

  const auto imports = ir::collectOpsetImports(*fn);
  ASSERT_EQ(imports.size(), 2u);
  EXPECT_EQ(imports.at(""), 18);
  EXPECT_EQ(imports.at("com.example"), 2);
}
