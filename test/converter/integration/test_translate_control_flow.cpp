/***
 * Name: test_translate_control_flow
 * Purpose: If and Loop lowering, subgraph outputs and subscript lowering.
 */
#include <gtest/gtest.h>
#include <string>
#include <vector>
#include "gsc/exceptions/unbound_name_error.h"
#include "gsc/exceptions/unsupported_construct_error.h"
#include "util/TranslateHelpers.h"

using namespace gsc;
using testutil::countOps;
using testutil::findOp;
using testutil::kPrelude;
using testutil::translateSource;

static std::vector<std::string> outputNames(const ir::Function& fn) {
  std::vector<std::string> out;
  for (const auto& v : fn.outputs) { out.push_back(v.name); }
  return out;
}

static std::vector<std::string> inputNames(const ir::Function& fn) {
  std::vector<std::string> out;
  for (const auto& v : fn.inputs) { out.push_back(v.name); }
  return out;
}

TEST(TranslateControlFlow, IfProducesLiveAssignedNames) {
  auto t = translateSource(std::string(kPrelude) +
                           "def f(X, C):\n"
                           "    if C:\n"
                           "        Y = opset18.Relu(X)\n"
                           "    else:\n"
                           "        Y = opset18.Neg(X)\n"
                           "    return Y\n");
  const auto& f = t.fn("f");
  const auto* node = findOp(f, "If");
  ASSERT_NE(node, nullptr);
  EXPECT_EQ(node->inputs, (std::vector<std::string>{"C"}));
  EXPECT_EQ(node->outputs, (std::vector<std::string>{"Y_1"}));
  EXPECT_EQ(node->line, 3);

  const auto* thenAttr = node->findAttr("then_branch");
  const auto* elseAttr = node->findAttr("else_branch");
  ASSERT_NE(thenAttr, nullptr);
  ASSERT_NE(elseAttr, nullptr);
  ASSERT_TRUE(thenAttr->graph);
  ASSERT_TRUE(elseAttr->graph);
  EXPECT_EQ(thenAttr->graph->name, "thenGraph_3");
  EXPECT_EQ(elseAttr->graph->name, "elseGraph_3");
  EXPECT_TRUE(thenAttr->graph->inputs.empty());
  EXPECT_EQ(outputNames(*thenAttr->graph), (std::vector<std::string>{"Y"}));
  EXPECT_EQ(outputNames(*elseAttr->graph), (std::vector<std::string>{"Y_0"}));
  EXPECT_EQ(countOps(*thenAttr->graph, "Relu"), 1u);
  EXPECT_EQ(countOps(*elseAttr->graph, "Neg"), 1u);
  EXPECT_EQ(outputNames(f), (std::vector<std::string>{"Y_1"}));
}

TEST(TranslateControlFlow, BranchWithoutAssignmentForwardsOuterValue) {
  auto t = translateSource(std::string(kPrelude) +
                           "def f(X, C):\n"
                           "    Y = opset18.Relu(X)\n"
                           "    if C:\n"
                           "        Y = opset18.Neg(Y)\n"
                           "    return Y\n");
  const auto* node = findOp(t.fn("f"), "If");
  ASSERT_NE(node, nullptr);
  const auto& elseGraph = *node->findAttr("else_branch")->graph;
  ASSERT_EQ(elseGraph.stmts.size(), 1u);
  EXPECT_EQ(elseGraph.stmts[0].opType, "Identity");
  EXPECT_EQ(elseGraph.stmts[0].inputs, (std::vector<std::string>{"Y"}));
  EXPECT_EQ(outputNames(elseGraph), elseGraph.stmts[0].outputs);
}

TEST(TranslateControlFlow, DeadAssignmentsAreNotIfOutputs) {
  auto t = translateSource(std::string(kPrelude) +
                           "def f(X, C):\n"
                           "    if C:\n"
                           "        T = opset18.Abs(X)\n"
                           "        Y = opset18.Relu(T)\n"
                           "    else:\n"
                           "        Y = opset18.Neg(X)\n"
                           "    return Y\n");
  const auto* node = findOp(t.fn("f"), "If");
  ASSERT_NE(node, nullptr);
  EXPECT_EQ(node->outputs.size(), 1u);
  EXPECT_EQ(node->findAttr("then_branch")->graph->outputs.size(), 1u);
}

TEST(TranslateControlFlow, ElifNestsIfInElseBranch) {
  auto t = translateSource(std::string(kPrelude) +
                           "def f(X, A, B):\n"
                           "    if A:\n"
                           "        Y = opset18.Relu(X)\n"
                           "    elif B:\n"
                           "        Y = opset18.Neg(X)\n"
                           "    else:\n"
                           "        Y = opset18.Abs(X)\n"
                           "    return Y\n");
  const auto* outer = findOp(t.fn("f"), "If");
  ASSERT_NE(outer, nullptr);
  const auto& elseGraph = *outer->findAttr("else_branch")->graph;
  EXPECT_EQ(countOps(elseGraph, "If"), 1u);
  EXPECT_EQ(elseGraph.outputs.size(), 1u);
}

TEST(TranslateControlFlow, NameMissingOnOneBranchIsUnbound) {
  try {
    translateSource(std::string(kPrelude) +
                    "def f(X, C):\n"
                    "    if C:\n"
                    "        Y = opset18.Relu(X)\n"
                    "    return Y\n");
    FAIL() << "expected UnboundNameError";
  } catch (const exceptions::UnboundNameError& e) {
    EXPECT_EQ(e.where().message, "variable 'Y' is not assigned a value along a conditional branch");
    EXPECT_EQ(e.where().line, 3);
    EXPECT_EQ(e.where().function, "f");
  }
}

TEST(TranslateControlFlow, IfWithoutLiveOutputsIsRejected) {
  EXPECT_THROW(translateSource(std::string(kPrelude) +
                               "def f(X, C):\n"
                               "    if C:\n"
                               "        Y = opset18.Relu(X)\n"
                               "    else:\n"
                               "        Y = opset18.Neg(X)\n"
                               "    return X\n"),
               exceptions::UnsupportedConstructError);
}

TEST(TranslateControlFlow, ReturnInsideBranchIsRejected) {
  try {
    translateSource(std::string(kPrelude) +
                    "def f(X, C):\n"
                    "    if C:\n"
                    "        return opset18.Relu(X)\n"
                    "    Y = opset18.Neg(X)\n"
                    "    return Y\n");
    FAIL() << "expected UnsupportedConstructError";
  } catch (const exceptions::UnsupportedConstructError& e) {
    EXPECT_NE(std::string(e.what()).find("return statements are not permitted"), std::string::npos);
  }
}

TEST(TranslateControlFlow, ForRangeBecomesLoop) {
  auto t = translateSource(std::string(kPrelude) +
                           "def f(X, N):\n"
                           "    S = X\n"
                           "    for i in range(N):\n"
                           "        S = opset18.Add(S, X)\n"
                           "    return S\n");
  const auto& f = t.fn("f");
  const auto* loop = findOp(f, "Loop");
  ASSERT_NE(loop, nullptr);
  EXPECT_EQ(loop->inputs, (std::vector<std::string>{"N", "true", "X"}));
  EXPECT_EQ(loop->outputs, (std::vector<std::string>{"S_1"}));
  EXPECT_EQ(countOps(f, "Constant"), 1u);

  const auto* body = loop->findAttr("body");
  ASSERT_NE(body, nullptr);
  ASSERT_TRUE(body->graph);
  const auto& g = *body->graph;
  EXPECT_EQ(g.name, "loop_body");
  EXPECT_EQ(inputNames(g), (std::vector<std::string>{"i", "cond_in", "S"}));
  EXPECT_EQ(outputNames(g), (std::vector<std::string>{"cond_out", "S_0"}));
  ASSERT_EQ(g.stmts.size(), 2u);
  EXPECT_EQ(g.stmts[0].opType, "Add");
  EXPECT_EQ(g.stmts[0].inputs, (std::vector<std::string>{"S", "X"}));
  EXPECT_EQ(g.stmts[1].opType, "Identity");
  EXPECT_EQ(g.stmts[1].inputs, (std::vector<std::string>{"cond_in"}));
  EXPECT_EQ(outputNames(f), (std::vector<std::string>{"S_1"}));
}

TEST(TranslateControlFlow, TrailingBreakGuardNegatesCondition) {
  auto t = translateSource(std::string(kPrelude) +
                           "def f(X, N):\n"
                           "    S = X\n"
                           "    for i in range(N):\n"
                           "        S = opset18.Add(S, X)\n"
                           "        done = opset18.Greater(S, X)\n"
                           "        if done:\n"
                           "            break\n"
                           "    return S\n");
  const auto* loop = findOp(t.fn("f"), "Loop");
  ASSERT_NE(loop, nullptr);
  EXPECT_EQ(loop->outputs.size(), 1u);
  const auto& g = *loop->findAttr("body")->graph;
  const auto* negate = findOp(g, "Not");
  ASSERT_NE(negate, nullptr);
  EXPECT_EQ(negate->inputs, (std::vector<std::string>{"done"}));
  EXPECT_EQ(negate->outputs, (std::vector<std::string>{"cond_out"}));
  EXPECT_EQ(findOp(g, "Identity"), nullptr);
}

TEST(TranslateControlFlow, BreakMustBeLast) {
  EXPECT_THROW(translateSource(std::string(kPrelude) +
                               "def f(X, N):\n"
                               "    S = X\n"
                               "    for i in range(N):\n"
                               "        done = opset18.Greater(S, X)\n"
                               "        if done:\n"
                               "            break\n"
                               "        S = opset18.Add(S, X)\n"
                               "    return S\n"),
               exceptions::UnsupportedConstructError);
}

TEST(TranslateControlFlow, WhileLoopCarriesCondition) {
  auto t = translateSource(std::string(kPrelude) +
                           "def f(X, c):\n"
                           "    S = X\n"
                           "    while c:\n"
                           "        S = opset18.Relu(S)\n"
                           "        c = opset18.Greater(S, X)\n"
                           "    return S\n");
  const auto* loop = findOp(t.fn("f"), "Loop");
  ASSERT_NE(loop, nullptr);
  ASSERT_GE(loop->inputs.size(), 2u);
  EXPECT_EQ(loop->inputs[0], "");
  EXPECT_EQ(loop->inputs[1], "c");
  const auto& g = *loop->findAttr("body")->graph;
  EXPECT_EQ(g.inputs[0].name, "infinite_loop");
  const auto* forward = findOp(g, "Identity");
  ASSERT_NE(forward, nullptr);
  EXPECT_EQ(forward->outputs, (std::vector<std::string>{"cond_out"}));
  EXPECT_NE(forward->inputs[0], g.inputs[1].name);
}

TEST(TranslateControlFlow, LoopBoundMustBeRange) {
  try {
    translateSource(std::string(kPrelude) +
                    "def f(X, N):\n"
                    "    for i in N:\n"
                    "        X = opset18.Relu(X)\n"
                    "    return X\n");
    FAIL() << "expected UnsupportedConstructError";
  } catch (const exceptions::UnsupportedConstructError& e) {
    EXPECT_EQ(e.where().message, "unsupported loop bound: only range(n) with a single argument is allowed");
  }
}

TEST(TranslateControlFlow, LoopElseIsRejected) {
  EXPECT_THROW(translateSource(std::string(kPrelude) +
                               "def f(X, N):\n"
                               "    for i in range(N):\n"
                               "        X = opset18.Relu(X)\n"
                               "    else:\n"
                               "        X = opset18.Neg(X)\n"
                               "    return X\n"),
               exceptions::UnsupportedConstructError);
}

TEST(TranslateControlFlow, LoopArityFollowsStateVariables) {
  auto t = translateSource(std::string(kPrelude) +
                           "def f(X, N):\n"
                           "    A = X\n"
                           "    B = X\n"
                           "    C = X\n"
                           "    for i in range(N):\n"
                           "        A = opset18.Add(A, X)\n"
                           "        B = opset18.Mul(B, X)\n"
                           "        C = opset18.Sub(C, X)\n"
                           "    return A, B, C\n");
  const auto* loop = findOp(t.fn("f"), "Loop");
  ASSERT_NE(loop, nullptr);
  ASSERT_EQ(loop->inputs.size(), 5u);
  EXPECT_EQ(loop->inputs[0], "N");
  EXPECT_EQ(loop->inputs[1], "true");
  EXPECT_EQ(loop->outputs.size(), 3u);
  const auto& g = *loop->findAttr("body")->graph;
  EXPECT_EQ(g.inputs.size(), 5u);
  EXPECT_EQ(g.outputs.size(), 4u);
  EXPECT_EQ(g.outputs[0].name, "cond_out");
}

TEST(TranslateControlFlow, LiteralIndexIsGather) {
  auto t = translateSource(std::string(kPrelude) +
                           "def f(A):\n"
                           "    B = A[0]\n"
                           "    return B\n");
  const auto& f = t.fn("f");
  const auto* gather = findOp(f, "Gather");
  ASSERT_NE(gather, nullptr);
  EXPECT_EQ(gather->inputs, (std::vector<std::string>{"A", "int64_0"}));
  EXPECT_EQ(gather->outputs, (std::vector<std::string>{"B"}));
  EXPECT_EQ(gather->findAttr("axis")->i, 0);
  EXPECT_EQ(countOps(f, "Slice"), 0u);
}

TEST(TranslateControlFlow, RangeIsSingleSlice) {
  auto t = translateSource(std::string(kPrelude) +
                           "def f(A):\n"
                           "    B = A[1:3]\n"
                           "    return B\n");
  const auto& f = t.fn("f");
  const auto* slice = findOp(f, "Slice");
  ASSERT_NE(slice, nullptr);
  EXPECT_EQ(slice->inputs,
            (std::vector<std::string>{"A", "int64_1_1d", "int64_3_1d", "int64_0_1d", "int64_1_1d"}));
  EXPECT_EQ(slice->outputs, (std::vector<std::string>{"B"}));
  EXPECT_EQ(countOps(f, "Constant"), 3u);
  EXPECT_EQ(countOps(f, "Concat"), 0u);
}

TEST(TranslateControlFlow, SeveralLiteralIndicesSliceThenSqueeze) {
  auto t = translateSource(std::string(kPrelude) +
                           "def f(A):\n"
                           "    B = A[2, 3]\n"
                           "    return B\n");
  const auto& f = t.fn("f");
  EXPECT_EQ(countOps(f, "Concat"), 4u);
  EXPECT_EQ(countOps(f, "Slice"), 1u);
  EXPECT_EQ(countOps(f, "Squeeze"), 1u);
  EXPECT_EQ(countOps(f, "Gather"), 0u);
  const auto* squeeze = findOp(f, "Squeeze");
  ASSERT_NE(squeeze, nullptr);
  EXPECT_EQ(squeeze->outputs, (std::vector<std::string>{"B"}));
}

TEST(TranslateControlFlow, ComputedIndicesChainGathers) {
  auto t = translateSource(std::string(kPrelude) +
                           "def f(A, I, J):\n"
                           "    B = A[I, J]\n"
                           "    return B\n");
  const auto& f = t.fn("f");
  ASSERT_EQ(countOps(f, "Gather"), 2u);
  EXPECT_EQ(f.stmts[0].outputs, (std::vector<std::string>{"A_axis_0"}));
  EXPECT_EQ(f.stmts[1].inputs, (std::vector<std::string>{"A_axis_0", "J"}));
  EXPECT_EQ(f.stmts[1].findAttr("axis")->i, 1);
  EXPECT_EQ(f.stmts[1].outputs, (std::vector<std::string>{"B"}));
}

TEST(TranslateControlFlow, FullSliceIsIdentity) {
  auto t = translateSource(std::string(kPrelude) +
                           "def f(A):\n"
                           "    B = A[:]\n"
                           "    return B\n");
  const auto& f = t.fn("f");
  ASSERT_EQ(f.stmts.size(), 1u);
  EXPECT_EQ(f.stmts[0].opType, "Identity");
}

TEST(TranslateControlFlow, NegativeStepDefaultsToFullReversedRange) {
  auto t = translateSource(std::string(kPrelude) +
                           "def f(A):\n"
                           "    B = A[::-1]\n"
                           "    return B\n");
  const auto* slice = findOp(t.fn("f"), "Slice");
  ASSERT_NE(slice, nullptr);
  EXPECT_EQ(slice->inputs, (std::vector<std::string>{"A", "int64_9223372036854775807_1d",
                                                     "int64_m9223372036854775808_1d", "int64_0_1d",
                                                     "int64_m1_1d"}));
  EXPECT_EQ(slice->outputs, (std::vector<std::string>{"B"}));
}

TEST(TranslateControlFlow, ComputedStepNeedsExplicitBounds) {
  for (const char* expr : {"A[:3:k]", "A[1::k]"}) {
    try {
      translateSource(std::string(kPrelude) +
                      "def f(A, k):\n"
                      "    B = " + expr + "\n"
                      "    return B\n");
      FAIL() << "expected UnsupportedConstructError for " << expr;
    } catch (const exceptions::UnsupportedConstructError& e) {
      EXPECT_EQ(e.where().message,
                "slice start and stop must be given explicitly when the step is not a literal");
    }
  }
}

TEST(TranslateControlFlow, ComputedBoundIsReshapedTo1d) {
  auto t = translateSource(std::string(kPrelude) +
                           "def f(A, i):\n"
                           "    B = A[i:]\n"
                           "    return B\n");
  const auto& f = t.fn("f");
  const auto* reshape = findOp(f, "Reshape");
  ASSERT_NE(reshape, nullptr);
  EXPECT_EQ(reshape->inputs, (std::vector<std::string>{"i", "int64_1_1d"}));
  EXPECT_EQ(reshape->outputs, (std::vector<std::string>{"i_reshaped"}));
  const auto* slice = findOp(f, "Slice");
  ASSERT_NE(slice, nullptr);
  EXPECT_EQ(slice->inputs, (std::vector<std::string>{"A", "i_reshaped", "int64_9223372036854775807_1d",
                                                     "int64_0_1d", "int64_1_1d"}));
}

TEST(TranslateControlFlow, LargestIndexSaturatesItsEnd) {
  auto t = translateSource(std::string(kPrelude) +
                           "def f(A):\n"
                           "    B = A[9223372036854775807, 0]\n"
                           "    return B\n");
  const auto& f = t.fn("f");
  const ir::Stmt* ends = nullptr;
  for (const auto& st : f.stmts) {
    if (st.opType == "Concat" && st.outputs.at(0) == "A_end") { ends = &st; }
  }
  ASSERT_NE(ends, nullptr);
  EXPECT_EQ(ends->inputs, (std::vector<std::string>{"int64_9223372036854775807_1d", "int64_1_1d"}));
  EXPECT_EQ(countOps(f, "Squeeze"), 1u);
}
