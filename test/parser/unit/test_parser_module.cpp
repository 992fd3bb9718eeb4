/***
 * Name: test_parser_module
 * Purpose: Module layout: imports, constants, function signatures and bodies.
 */
#include <gtest/gtest.h>
#include "ast/Nodes.h"
#include "lexer/Lexer.h"
#include "parser/Parser.h"

using namespace gsc;

static std::unique_ptr<ast::Module> parseSrc(const char* src) {
  lex::Lexer L; L.pushString(src, "test.py");
  parse::Parser P(L);
  return P.parseModule();
}

static const ast::FunctionDef& defAt(const ast::Module& mod, size_t idx) {
  const auto* stmt = mod.body.at(idx).get();
  EXPECT_EQ(stmt->kind, ast::NodeKind::DefStmt);
  return *static_cast<const ast::DefStmt*>(stmt)->func;
}

TEST(ParserModule, ImportsAndFunction) {
  const char* src =
      "import gsc\n"
      "from gsc import opset18 as op, FLOAT\n"
      "def f(X: FLOAT[\"N\"]) -> FLOAT[\"N\"]:\n"
      "    return op.Relu(X)\n";
  auto mod = parseSrc(src);
  ASSERT_TRUE(mod);
  ASSERT_EQ(mod->body.size(), 3u);

  ASSERT_EQ(mod->body[0]->kind, ast::NodeKind::Import);
  const auto* imp = static_cast<const ast::Import*>(mod->body[0].get());
  ASSERT_EQ(imp->names.size(), 1u);
  EXPECT_EQ(imp->names[0].name, "gsc");

  ASSERT_EQ(mod->body[1]->kind, ast::NodeKind::ImportFrom);
  const auto* from = static_cast<const ast::ImportFrom*>(mod->body[1].get());
  EXPECT_EQ(from->module, "gsc");
  ASSERT_EQ(from->names.size(), 2u);
  EXPECT_EQ(from->names[0].name, "opset18");
  EXPECT_EQ(from->names[0].asname, "op");
  EXPECT_EQ(from->names[1].asname, "");

  const auto& fn = defAt(*mod, 2);
  EXPECT_EQ(fn.name, "f");
  ASSERT_EQ(fn.params.size(), 1u);
  EXPECT_EQ(fn.params[0].name, "X");
  ASSERT_TRUE(fn.params[0].annotation);
  EXPECT_EQ(fn.params[0].annotation->kind, ast::NodeKind::Subscript);
  ASSERT_TRUE(fn.returns);
  ASSERT_EQ(fn.body.size(), 1u);
  EXPECT_EQ(fn.body[0]->kind, ast::NodeKind::ReturnStmt);
  EXPECT_EQ(fn.line, 3);
}

TEST(ParserModule, DottedImportAndParenthesizedNames) {
  auto mod = parseSrc("import gsc.opsets as ops\nfrom gsc.types import (FLOAT,\n    INT64,)\n");
  ASSERT_EQ(mod->body.size(), 2u);
  const auto* imp = static_cast<const ast::Import*>(mod->body[0].get());
  EXPECT_EQ(imp->names[0].name, "gsc.opsets");
  EXPECT_EQ(imp->names[0].asname, "ops");
  const auto* from = static_cast<const ast::ImportFrom*>(mod->body[1].get());
  EXPECT_EQ(from->module, "gsc.types");
  EXPECT_EQ(from->level, 0);
  ASSERT_EQ(from->names.size(), 2u);
  EXPECT_EQ(from->names[1].name, "INT64");
}

TEST(ParserModule, ParamsWithDefaultsAndStars) {
  const char* src =
      "def g(X, alpha: float = 1.0, *rest, axis: int = 0, **kw):\n"
      "    return X\n";
  auto mod = parseSrc(src);
  const auto& fn = defAt(*mod, 0);
  ASSERT_EQ(fn.params.size(), 5u);
  EXPECT_FALSE(fn.params[0].annotation);
  ASSERT_TRUE(fn.params[1].defaultValue);
  EXPECT_EQ(fn.params[1].defaultValue->kind, ast::NodeKind::FloatLiteral);
  EXPECT_TRUE(fn.params[2].isVarArg);
  EXPECT_TRUE(fn.params[3].isKwOnly);
  EXPECT_TRUE(fn.params[4].isKwVarArg);
  EXPECT_FALSE(fn.params[4].isKwOnly);
}

TEST(ParserModule, DecoratorsAttachToFunction) {
  auto mod = parseSrc("@script()\ndef f(X):\n    return X\n");
  const auto& fn = defAt(*mod, 0);
  ASSERT_EQ(fn.decorators.size(), 1u);
  EXPECT_EQ(fn.decorators[0]->kind, ast::NodeKind::Call);
}

TEST(ParserModule, ConstantAssignmentAtModuleLevel) {
  auto mod = parseSrc("SCALE = 2.5\nAXES: list = [0, 1]\n");
  ASSERT_EQ(mod->body.size(), 2u);
  const auto* a0 = static_cast<const ast::AssignStmt*>(mod->body[0].get());
  ASSERT_EQ(a0->targets.size(), 1u);
  EXPECT_EQ(a0->targets[0]->kind, ast::NodeKind::Name);
  EXPECT_EQ(a0->value->kind, ast::NodeKind::FloatLiteral);
  const auto* a1 = static_cast<const ast::AssignStmt*>(mod->body[1].get());
  ASSERT_TRUE(a1->annotation);
  EXPECT_EQ(a1->value->kind, ast::NodeKind::ListLiteral);
}

TEST(ParserModule, ControlFlowStatements) {
  const char* src =
      "def f(X, n):\n"
      "    if X:\n"
      "        Y = X\n"
      "    elif n:\n"
      "        Y = n\n"
      "    else:\n"
      "        Y = X\n"
      "    for i in range(n):\n"
      "        Y = Y\n"
      "    while Y:\n"
      "        break\n"
      "    return Y\n";
  auto mod = parseSrc(src);
  const auto& fn = defAt(*mod, 0);
  ASSERT_EQ(fn.body.size(), 4u);
  ASSERT_EQ(fn.body[0]->kind, ast::NodeKind::IfStmt);
  const auto* ifs = static_cast<const ast::IfStmt*>(fn.body[0].get());
  ASSERT_EQ(ifs->elseBody.size(), 1u);
  ASSERT_EQ(ifs->elseBody[0]->kind, ast::NodeKind::IfStmt);
  const auto* elif = static_cast<const ast::IfStmt*>(ifs->elseBody[0].get());
  EXPECT_EQ(elif->elseBody.size(), 1u);

  ASSERT_EQ(fn.body[1]->kind, ast::NodeKind::ForStmt);
  const auto* loop = static_cast<const ast::ForStmt*>(fn.body[1].get());
  ASSERT_EQ(loop->target->kind, ast::NodeKind::Name);
  EXPECT_EQ(static_cast<const ast::Name*>(loop->target.get())->ctx, ast::ExprContext::Store);
  EXPECT_EQ(loop->iterable->kind, ast::NodeKind::Call);

  ASSERT_EQ(fn.body[2]->kind, ast::NodeKind::WhileStmt);
  const auto* wl = static_cast<const ast::WhileStmt*>(fn.body[2].get());
  ASSERT_EQ(wl->thenBody.size(), 1u);
  EXPECT_EQ(wl->thenBody[0]->kind, ast::NodeKind::BreakStmt);
}

TEST(ParserModule, TupleAssignAndTupleReturn) {
  auto mod = parseSrc("def f(X):\n    a, b = X, X\n    return a, b\n");
  const auto& fn = defAt(*mod, 0);
  const auto* asg = static_cast<const ast::AssignStmt*>(fn.body[0].get());
  ASSERT_EQ(asg->targets.size(), 1u);
  EXPECT_EQ(asg->targets[0]->kind, ast::NodeKind::TupleLiteral);
  EXPECT_EQ(asg->value->kind, ast::NodeKind::TupleLiteral);
  const auto* ret = static_cast<const ast::ReturnStmt*>(fn.body[1].get());
  ASSERT_EQ(ret->value->kind, ast::NodeKind::TupleLiteral);
  EXPECT_EQ(static_cast<const ast::TupleLiteral*>(ret->value.get())->elements.size(), 2u);
}

TEST(ParserModule, ChainedAssignmentKeepsAllTargets) {
  auto mod = parseSrc("def f(X):\n    a = b = X\n    return a\n");
  const auto& fn = defAt(*mod, 0);
  const auto* asg = static_cast<const ast::AssignStmt*>(fn.body[0].get());
  EXPECT_EQ(asg->targets.size(), 2u);
}

TEST(ParserModule, SingleLineSuite) {
  auto mod = parseSrc("def f(X):\n    if X: return X\n    return X\n");
  const auto& fn = defAt(*mod, 0);
  const auto* ifs = static_cast<const ast::IfStmt*>(fn.body[0].get());
  ASSERT_EQ(ifs->thenBody.size(), 1u);
  EXPECT_EQ(ifs->thenBody[0]->kind, ast::NodeKind::ReturnStmt);
}

TEST(ParserModule, DocstringIsExpressionStatement) {
  auto mod = parseSrc("\"\"\"Module doc.\"\"\"\ndef f(X):\n    \"\"\"Fn doc.\"\"\"\n    return X\n");
  ASSERT_EQ(mod->body[0]->kind, ast::NodeKind::ExprStmt);
  const auto& fn = defAt(*mod, 1);
  ASSERT_EQ(fn.body[0]->kind, ast::NodeKind::ExprStmt);
  const auto* es = static_cast<const ast::ExprStmt*>(fn.body[0].get());
  ASSERT_EQ(es->value->kind, ast::NodeKind::StringLiteral);
  EXPECT_EQ(static_cast<const ast::StringLiteral*>(es->value.get())->value, "Fn doc.");
}

TEST(ParserModule, NestedFunctionIsDefStmt) {
  auto mod = parseSrc("def outer(X):\n    def inner(Y):\n        return Y\n    return inner(X)\n");
  const auto& fn = defAt(*mod, 0);
  ASSERT_EQ(fn.body.size(), 2u);
  ASSERT_EQ(fn.body[0]->kind, ast::NodeKind::DefStmt);
  EXPECT_EQ(static_cast<const ast::DefStmt*>(fn.body[0].get())->func->name, "inner");
}
