/***
 * Name: test_geometry
 * Purpose: Cover AST geometry summary and DepthScope nesting.
 */
#include <gtest/gtest.h>
#include "lexer/Lexer.h"
#include "parser/Parser.h"
#include "ast/GeometrySummary.h"

using namespace gsc;

static std::unique_ptr<ast::Module> parseSrcGeom(const char* src) {
  lex::Lexer L; L.pushString(src, "geo.py");
  parse::Parser P(L);
  return P.parseModule();
}

TEST(Geometry, NestedDepthIncreases) {
  const char* shallow =
      "def main(X):\n"
      "  return X + 2\n";
  const char* deep =
      "def main(X):\n"
      "  return X + (2 * (3 + X))\n";
  auto modS = parseSrcGeom(shallow);
  auto modD = parseSrcGeom(deep);
  const auto gS = ast::ComputeGeometry(*modS);
  const auto gD = ast::ComputeGeometry(*modD);
  EXPECT_GT(gS.nodes, 0u);
  EXPECT_GT(gD.nodes, gS.nodes);
  EXPECT_GT(gD.maxDepth, gS.maxDepth);
}

TEST(Geometry, EmptyModuleIsOneNode) {
  auto mod = parseSrcGeom("");
  const auto g = ast::ComputeGeometry(*mod);
  EXPECT_EQ(g.nodes, 1u);
  EXPECT_EQ(g.maxDepth, 0u);
}

TEST(Geometry, CountsControlFlowBodies) {
  const char* flat =
      "def main(X):\n"
      "  Y = X\n"
      "  return Y\n";
  const char* branchy =
      "def main(X):\n"
      "  Y = X\n"
      "  if X:\n"
      "    Y = X\n"
      "  else:\n"
      "    Y = X\n"
      "  return Y\n";
  const auto gF = ast::ComputeGeometry(*parseSrcGeom(flat));
  const auto gB = ast::ComputeGeometry(*parseSrcGeom(branchy));
  EXPECT_GT(gB.nodes, gF.nodes);
  EXPECT_GT(gB.maxDepth, gF.maxDepth);
}
