/***
 * Name: test_alias
 * Purpose: Import alias nodes are usable from their own header.
 */
#include <gtest/gtest.h>
#include "ast/Alias.h"

using namespace gsc;

TEST(Alias, StandaloneHeaderBuildsNode) {
  ast::Alias alias("opset18", "op");
  EXPECT_EQ(alias.kind, ast::NodeKind::Alias);
  EXPECT_EQ(ast::Alias::nodeKind, ast::NodeKind::Alias);
  EXPECT_EQ(alias.name, "opset18");
  EXPECT_EQ(alias.asname, "op");
  const ast::Node& base = alias;
  EXPECT_EQ(base.line, 0);
}

TEST(Alias, DefaultHasNoAsName) {
  ast::Alias alias;
  EXPECT_TRUE(alias.name.empty());
  EXPECT_TRUE(alias.asname.empty());
}
