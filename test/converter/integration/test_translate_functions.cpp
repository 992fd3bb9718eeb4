/***
 * Name: test_translate_functions
 * Purpose: Signatures, attribute parameters, nested and called script
 *          functions, module-level statements and translation errors.
 */
#include <gtest/gtest.h>
#include <sstream>
#include <string>
#include <vector>
#include "gsc/exceptions/arity_error.h"
#include "gsc/exceptions/captured_variable_mutation_error.h"
#include "gsc/exceptions/empty_list_error.h"
#include "gsc/exceptions/unbound_name_error.h"
#include "gsc/exceptions/unsupported_construct_error.h"
#include "ir/TextPrinter.h"
#include "types/TypeInfo.h"
#include "util/TranslateHelpers.h"

using namespace gsc;
using testutil::countOps;
using testutil::findOp;
using testutil::kPrelude;
using testutil::translateSource;

static converter::ConverterOptions withOpset18() {
  converter::ConverterOptions o;
  o.defaultOpset = values::Opset{"", 18};
  return o;
}

static std::string moduleText(const ir::Module& m) {
  std::ostringstream os;
  ir::TextPrinter printer(os);
  printer.print(m);
  return os.str();
}

TEST(TranslateFunctions, TypedSignature) {
  auto t = translateSource(std::string(kPrelude) +
                           "def f(X: FLOAT['N'], Y: INT64) -> FLOAT['N']:\n"
                           "    Z = opset18.Relu(X)\n"
                           "    return Z\n");
  const auto& f = t.fn("f");
  EXPECT_EQ(f.name, "f");
  EXPECT_EQ(f.domain, "this");
  ASSERT_EQ(f.inputs.size(), 2u);
  ASSERT_TRUE(f.inputs[0].type);
  EXPECT_EQ(types::onnxTypeString(*f.inputs[0].type), "tensor(float)");
  ASSERT_TRUE(f.inputs[1].type);
  EXPECT_EQ(types::onnxTypeString(*f.inputs[1].type), "tensor(int64)");
  ASSERT_EQ(f.outputs.size(), 1u);
  ASSERT_TRUE(f.outputs[0].type);
  EXPECT_EQ(types::onnxTypeString(*f.outputs[0].type), "tensor(float)");
  EXPECT_TRUE(t.warnings.empty());
}

TEST(TranslateFunctions, ReturnCountMustMatchAnnotation) {
  EXPECT_THROW(translateSource(std::string(kPrelude) +
                               "def f(X) -> FLOAT:\n"
                               "    A = opset18.Relu(X)\n"
                               "    B = opset18.Neg(X)\n"
                               "    return A, B\n"),
               exceptions::ArityError);
}

TEST(TranslateFunctions, UnsupportedAnnotationWarns) {
  auto t = translateSource(std::string(kPrelude) +
                           "def f(X: 3):\n"
                           "    Z = opset18.Relu(X)\n"
                           "    return Z\n");
  ASSERT_EQ(t.warnings.size(), 1u);
  EXPECT_EQ(t.warnings[0].message, "Unsupported type annotation for argument X.");
  EXPECT_EQ(t.fn("f").inputs.size(), 1u);
}

TEST(TranslateFunctions, StarParametersWarn) {
  auto t = translateSource(std::string(kPrelude) +
                           "def f(X, *rest):\n"
                           "    Z = opset18.Relu(X)\n"
                           "    return Z\n");
  ASSERT_EQ(t.warnings.size(), 1u);
  EXPECT_EQ(t.warnings[0].message, "f: Unsupported feature in function signature.");
  EXPECT_EQ(t.fn("f").inputs.size(), 1u);
}

TEST(TranslateFunctions, AttributeParameterIsForwarded) {
  auto t = translateSource(std::string(kPrelude) +
                           "def f(A, B, alpha: float = 0.5):\n"
                           "    Y = opset18.Gemm(A, B, alpha=alpha)\n"
                           "    return Y\n");
  const auto& f = t.fn("f");
  EXPECT_EQ(f.inputs.size(), 2u);
  ASSERT_EQ(f.attrParams.size(), 1u);
  EXPECT_EQ(f.attrParams[0].name, "alpha");
  EXPECT_EQ(f.attrParams[0].kind, ir::AttrKind::Float);
  ASSERT_TRUE(f.attrParams[0].defaultValue.has_value());
  EXPECT_DOUBLE_EQ(f.attrParams[0].defaultValue->f, 0.5);

  const auto* gemm = findOp(f, "Gemm");
  ASSERT_NE(gemm, nullptr);
  EXPECT_EQ(gemm->inputs, (std::vector<std::string>{"A", "B"}));
  const auto* alpha = gemm->findAttr("alpha");
  ASSERT_NE(alpha, nullptr);
  EXPECT_TRUE(alpha->isRef());
  EXPECT_EQ(alpha->refAttrName, "alpha");
  EXPECT_EQ(alpha->kind, ir::AttrKind::Float);
}

TEST(TranslateFunctions, AttributeParameterAsValueIsConstantRef) {
  auto t = translateSource(std::string(kPrelude) +
                           "def f(X, n: int):\n"
                           "    C = n\n"
                           "    Z = opset18.Add(X, C)\n"
                           "    return Z\n");
  const auto& f = t.fn("f");
  ASSERT_FALSE(f.stmts.empty());
  EXPECT_EQ(f.stmts[0].opType, "Constant");
  EXPECT_EQ(f.stmts[0].outputs, (std::vector<std::string>{"C"}));
  const auto* ref = f.stmts[0].findAttr("value_int");
  ASSERT_NE(ref, nullptr);
  EXPECT_EQ(ref->refAttrName, "n");
  // The referenced attribute is still a constant operand.
  EXPECT_EQ(countOps(f, "CastLike"), 1u);
}

TEST(TranslateFunctions, CallingScriptFunction) {
  auto t = translateSource(std::string(kPrelude) +
                           "def g(X):\n"
                           "    Z = opset18.Relu(X)\n"
                           "    return Z\n"
                           "def f(X):\n"
                           "    Y = g(X)\n"
                           "    return Y\n");
  ASSERT_EQ(t.module.functions.size(), 2u);
  const auto& f = t.fn("f");
  const auto* call = findOp(f, "g");
  ASSERT_NE(call, nullptr);
  EXPECT_EQ(call->domain, "this");
  EXPECT_EQ(call->version, 1);
  EXPECT_EQ(call->inputs, (std::vector<std::string>{"X"}));
  EXPECT_NE(f.findFunction("g"), nullptr);
}

TEST(TranslateFunctions, NestedFunctionReadsOuterValue) {
  auto t = translateSource(std::string(kPrelude) +
                           "def f(X):\n"
                           "    K = opset18.Relu(X)\n"
                           "    def g(Y):\n"
                           "        Z = opset18.Add(Y, K)\n"
                           "        return Z\n"
                           "    R = g(X)\n"
                           "    return R\n");
  const auto& f = t.fn("f");
  const ir::Function* g = f.findFunction("g");
  ASSERT_NE(g, nullptr);
  EXPECT_EQ(g->domain, "this");
  const auto* add = findOp(*g, "Add");
  ASSERT_NE(add, nullptr);
  EXPECT_EQ(add->inputs, (std::vector<std::string>{"Y", "K"}));
  EXPECT_NE(findOp(f, "g"), nullptr);
}

TEST(TranslateFunctions, RebindingCapturedVariableIsRejected) {
  try {
    translateSource(std::string(kPrelude) +
                    "def f(X):\n"
                    "    K = opset18.Relu(X)\n"
                    "    def g(Y):\n"
                    "        Z = opset18.Add(Y, K)\n"
                    "        return Z\n"
                    "    K = opset18.Neg(X)\n"
                    "    R = g(X)\n"
                    "    return R\n");
    FAIL() << "expected CapturedVariableMutationError";
  } catch (const exceptions::CapturedVariableMutationError& e) {
    EXPECT_EQ(e.where().message, "outer scope variable 'K' referenced by function 'g' was modified");
    EXPECT_EQ(e.where().line, 8);
  }
}

TEST(TranslateFunctions, NestedFunctionAsGraphAttribute) {
  auto t = translateSource(std::string(kPrelude) +
                           "def f(X, N):\n"
                           "    def body(i, c, S):\n"
                           "        T = opset18.Relu(S)\n"
                           "        return c, T\n"
                           "    R = opset18.Loop(N, None, X, body=body)\n"
                           "    return R\n");
  const auto* loop = findOp(t.fn("f"), "Loop");
  ASSERT_NE(loop, nullptr);
  const auto* attr = loop->findAttr("body");
  ASSERT_NE(attr, nullptr);
  ASSERT_TRUE(attr->graph);
  EXPECT_EQ(attr->graph->name, "body");
  EXPECT_EQ(loop->inputs, (std::vector<std::string>{"N", "", "X"}));
}

TEST(TranslateFunctions, ModuleDocstringImportsAndConstants) {
  auto t = translateSource("\"\"\"Demo module.\"\"\"\n"
                           "import gsc\n"
                           "from gsc import opset18 as op\n"
                           "AXES, KEEP = [0], 1\n"
                           "def f(X):\n"
                           "    \"\"\"Sums over the first axis.\"\"\"\n"
                           "    Z = op.ReduceSum(X, AXES, keepdims=KEEP)\n"
                           "    return Z\n");
  EXPECT_EQ(t.module.docstring, "Demo module.");
  EXPECT_EQ(t.module.domain, "this");
  EXPECT_EQ(t.module.version, 1);
  const auto& f = t.fn("f");
  EXPECT_EQ(f.docstring, "Sums over the first axis.");
  const auto* reduce = findOp(f, "ReduceSum");
  ASSERT_NE(reduce, nullptr);
  EXPECT_EQ(reduce->inputs.size(), 2u);
  EXPECT_EQ(reduce->findAttr("keepdims")->i, 1);
}

TEST(TranslateFunctions, CustomDomainAndVersion) {
  converter::ConverterOptions o;
  o.domain = "my.domain";
  o.version = 3;
  auto t = translateSource(std::string(kPrelude) +
                           "def f(X):\n"
                           "    Z = opset18.Relu(X)\n"
                           "    return Z\n",
                           o);
  EXPECT_EQ(t.module.domain, "my.domain");
  EXPECT_EQ(t.module.version, 3);
  EXPECT_EQ(t.fn("f").domain, "my.domain");
}

TEST(TranslateFunctions, UnknownModuleIsUnbound) {
  try {
    translateSource("import numpy\n");
    FAIL() << "expected UnboundNameError";
  } catch (const exceptions::UnboundNameError& e) {
    EXPECT_EQ(e.where().message, "No module named 'numpy'");
    EXPECT_EQ(e.where().function, "");
  }
}

TEST(TranslateFunctions, UnboundNameInFunction) {
  try {
    translateSource(std::string(kPrelude) +
                    "def f(X):\n"
                    "    Z = opset18.Relu(Q)\n"
                    "    return Z\n");
    FAIL() << "expected UnboundNameError";
  } catch (const exceptions::UnboundNameError& e) {
    EXPECT_EQ(std::string(e.what()), "test.py:3:22: in function 'f': unbound name 'Q'");
  }
}

TEST(TranslateFunctions, TupleAssignmentArity) {
  EXPECT_THROW(translateSource(std::string(kPrelude) +
                               "def f(X):\n"
                               "    A, B = X, X, X\n"
                               "    return A\n",
                               withOpset18()),
               exceptions::ArityError);
}

TEST(TranslateFunctions, EmptyListLiteralIsRejected) {
  EXPECT_THROW(translateSource(std::string(kPrelude) +
                               "def f(X):\n"
                               "    Z = opset18.Add(X, [])\n"
                               "    return Z\n"),
               exceptions::EmptyListError);
}

TEST(TranslateFunctions, TwoDefaultOpsetsAreRejected) {
  try {
    translateSource("from gsc import opset15, opset18\n"
                    "def f(X):\n"
                    "    Y = opset15.Relu(X)\n"
                    "    Z = opset18.Relu(Y)\n"
                    "    return Z\n");
    FAIL() << "expected UnsupportedConstructError";
  } catch (const exceptions::UnsupportedConstructError& e) {
    EXPECT_EQ(e.where().message, "two distinct opsets were used (opset18 != opset15)");
    EXPECT_EQ(e.where().line, 4);
  }
}

TEST(TranslateFunctions, MissingDefaultOpsetIsRejected) {
  EXPECT_THROW(translateSource("def f(X, Y):\n"
                               "    Z = X + Y\n"
                               "    return Z\n"),
               exceptions::UnsupportedConstructError);
}

TEST(TranslateFunctions, ChainedComparisonIsRejected) {
  try {
    translateSource(std::string(kPrelude) +
                    "def f(X, Y):\n"
                    "    Z = X < Y < X\n"
                    "    return Z\n");
    FAIL() << "expected UnsupportedConstructError";
  } catch (const exceptions::UnsupportedConstructError& e) {
    EXPECT_EQ(e.where().message, "chained comparisons are not supported");
  }
}

TEST(TranslateFunctions, BareExpressionStatementIsRejected) {
  EXPECT_THROW(translateSource(std::string(kPrelude) +
                               "def f(X):\n"
                               "    opset18.Relu(X)\n"
                               "    return X\n"),
               exceptions::UnsupportedConstructError);
}

TEST(TranslateFunctions, PrintStatementIsIgnored) {
  auto t = translateSource(std::string(kPrelude) +
                           "def f(X):\n"
                           "    Z = opset18.Relu(X)\n"
                           "    print(Z)\n"
                           "    return Z\n");
  EXPECT_EQ(t.fn("f").stmts.size(), 1u);
}

TEST(TranslateFunctions, RetranslationIsDeterministic) {
  const std::string src = std::string(kPrelude) +
                          "def f(X, C, N):\n"
                          "    if C:\n"
                          "        Y = opset18.Add(X, 1.5)\n"
                          "    else:\n"
                          "        Y = X[0]\n"
                          "    for i in range(N):\n"
                          "        Y = opset18.Mul(Y, 2)\n"
                          "    return Y\n";
  const auto first = translateSource(src);
  const auto second = translateSource(src);
  EXPECT_EQ(moduleText(first.module), moduleText(second.module));
  EXPECT_NE(moduleText(first.module).find("Loop"), std::string::npos);
}
