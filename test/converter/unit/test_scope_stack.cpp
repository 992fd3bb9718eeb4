/***
 * Name: test_scope_stack
 * Purpose: Frame push/pop, shadowing and outer lookups; binding identity.
 */
#include <gtest/gtest.h>
#include "converter/ScopeStack.h"

using namespace gsc;
using values::Binding;
using values::DynamicKind;

TEST(ScopeStack, InnerShadowsOuterUntilPopped) {
  converter::ScopeStack scopes;
  scopes.push();
  scopes.bind("X", Binding::dynamic("X", DynamicKind::Input));
  scopes.push();
  scopes.bind("X", Binding::dynamic("X_1", DynamicKind::Intermediate));
  ASSERT_NE(scopes.lookup("X"), nullptr);
  EXPECT_EQ(scopes.lookup("X")->name, "X_1");
  ASSERT_NE(scopes.lookupOuter("X"), nullptr);
  EXPECT_EQ(scopes.lookupOuter("X")->name, "X");
  EXPECT_EQ(scopes.depth(), 2u);
  scopes.pop();
  EXPECT_EQ(scopes.lookup("X")->name, "X");
  EXPECT_EQ(scopes.depth(), 1u);
}

TEST(ScopeStack, CurrentFrameOnly) {
  converter::ScopeStack scopes;
  scopes.push();
  scopes.bind("A", Binding::dynamic("A", DynamicKind::Input));
  scopes.push();
  EXPECT_EQ(scopes.lookupCurrent("A"), nullptr);
  EXPECT_NE(scopes.lookup("A"), nullptr);
  scopes.bind("B", Binding::literal(constant::PyValue::integer(1)));
  EXPECT_NE(scopes.lookupCurrent("B"), nullptr);
  EXPECT_EQ(scopes.lookupOuter("B"), nullptr);
}

TEST(ScopeStack, EmptyStackBehaviour) {
  converter::ScopeStack scopes;
  EXPECT_EQ(scopes.lookup("A"), nullptr);
  EXPECT_EQ(scopes.lookupCurrent("A"), nullptr);
  EXPECT_EQ(scopes.lookupOuter("A"), nullptr);
  scopes.pop();
  EXPECT_EQ(scopes.depth(), 0u);
  scopes.bind("A", Binding::dynamic("A", DynamicKind::Input));
  EXPECT_EQ(scopes.depth(), 1u);
  scopes.reset();
  EXPECT_EQ(scopes.lookup("A"), nullptr);
}

TEST(ScopeStack, RebindReplacesInCurrentFrame) {
  converter::ScopeStack scopes;
  scopes.push();
  scopes.bind("Y", Binding::dynamic("Y", DynamicKind::Intermediate));
  scopes.bind("Y", Binding::dynamic("Y_0", DynamicKind::Intermediate));
  EXPECT_EQ(scopes.lookup("Y")->name, "Y_0");
}

TEST(Binding, SameValueIgnoresProvenance) {
  const auto a = Binding::dynamic("T", DynamicKind::Intermediate, sema::Provenance{"a.py", 1, 1});
  const auto b = Binding::dynamic("T", DynamicKind::LoopCarried, sema::Provenance{"a.py", 9, 9});
  EXPECT_TRUE(values::sameValue(a, b));
  EXPECT_FALSE(values::sameValue(a, Binding::dynamic("U", DynamicKind::Intermediate)));
  EXPECT_FALSE(values::sameValue(a, Binding::attrRef("T", nullptr)));
  EXPECT_TRUE(values::sameValue(Binding::literal(constant::PyValue::integer(2)),
                                Binding::literal(constant::PyValue::integer(2))));
}

TEST(Binding, FromValueMakesOpRefs) {
  const auto op = Binding::fromValue(constant::PyValue::op(values::Opset{"", 18}, "Relu"));
  EXPECT_EQ(op.kind, values::BindingKind::OpRef);
  EXPECT_EQ(op.describe(), "op opset18.Relu");
  const auto c = Binding::fromValue(constant::PyValue::floating(0.5));
  EXPECT_EQ(c.kind, values::BindingKind::Constant);
  EXPECT_EQ(c.describe(), "constant 0.5");
  EXPECT_EQ(Binding::attrRef("alpha", nullptr).describe(), "attribute parameter 'alpha'");
  EXPECT_EQ(Binding::dynamic("X", DynamicKind::Input).describe(), "input value 'X'");
}
