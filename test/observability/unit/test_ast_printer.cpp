/***
 * Name: test_ast_printer
 * Purpose: AST dump layout used by --ast-log.
 */
#include <gtest/gtest.h>
#include "lexer/Lexer.h"
#include "observability/AstPrinter.h"
#include "parser/Parser.h"

using namespace gsc;

static std::string dump(const char* src) {
  lex::Lexer L; L.pushString(src, "p.py");
  parse::Parser P(L);
  auto mod = P.parseModule();
  obs::AstPrinter printer;
  return printer.print(*mod);
}

TEST(AstPrinter, FunctionWithCall) {
  const std::string expected =
      "Module\n"
      "  DefStmt\n"
      "    FunctionDef name=f, params=[X]\n"
      "      AssignStmt\n"
      "        Targets:\n"
      "          Name Y\n"
      "        Call\n"
      "          Attribute .Relu\n"
      "            Name opset18\n"
      "          Name X\n"
      "      ReturnStmt\n"
      "        Name Y\n";
  EXPECT_EQ(dump("def f(X):\n    Y = opset18.Relu(X)\n    return Y\n"), expected);
}

TEST(AstPrinter, ImportsAndAnnotations) {
  const auto text = dump("from gsc import opset18 as op\n"
                         "def f(X: FLOAT, k: int = 2) -> FLOAT:\n"
                         "    return X\n");
  EXPECT_NE(text.find("ImportFrom module=gsc\n    Alias opset18 as op\n"), std::string::npos);
  EXPECT_NE(text.find("FunctionDef name=f, params=[X, k]\n"), std::string::npos);
  EXPECT_NE(text.find("Param k:\n        Name int\n        Default:\n          IntLiteral 2\n"), std::string::npos);
  EXPECT_NE(text.find("Returns:\n        Name FLOAT\n"), std::string::npos);
}

TEST(AstPrinter, ControlFlowLabels) {
  const auto text = dump("def f(X, C, N):\n"
                         "    if C:\n"
                         "        Y = X\n"
                         "    else:\n"
                         "        Y = -X\n"
                         "    for i in range(N):\n"
                         "        Y = Y[1:]\n"
                         "    return Y\n");
  EXPECT_NE(text.find("IfStmt\n        Cond:\n          Name C\n        Then:\n"), std::string::npos);
  EXPECT_NE(text.find("Else:\n"), std::string::npos);
  EXPECT_NE(text.find("Unary -\n"), std::string::npos);
  EXPECT_NE(text.find("ForStmt\n        Target:\n          Name i\n        Iter:\n"), std::string::npos);
  EXPECT_NE(text.find("Subscript\n"), std::string::npos);
  EXPECT_NE(text.find("Slice\n"), std::string::npos);
  EXPECT_NE(text.find("Lower:\n"), std::string::npos);
  EXPECT_EQ(text.find("Upper:\n"), std::string::npos);
}

TEST(AstPrinter, ReusableAcrossModules) {
  lex::Lexer L; L.pushString("x = 1\n", "p.py");
  parse::Parser P(L);
  auto mod = P.parseModule();
  obs::AstPrinter printer;
  const auto first = printer.print(*mod);
  EXPECT_EQ(printer.print(*mod), first);
  EXPECT_EQ(first, "Module\n  AssignStmt\n    Targets:\n      Name x\n    IntLiteral 1\n");
}
