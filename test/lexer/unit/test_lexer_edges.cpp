/***
 * Name: test_lexer_edges
 * Purpose: Cover lexer edge cases: blank/comment lines, indentation, line joining, errors.
 */
#include <gtest/gtest.h>
#include <fstream>
#include <filesystem>
#include "gsc/exceptions/file_read_error.h"
#include "gsc/exceptions/parse_error.h"
#include "lexer/Lexer.h"

using namespace gsc;

static std::vector<lex::Token> lexAll(const char* src) {
  lex::Lexer L; L.pushString(src, "lex.py");
  return L.tokens();
}

static int countKind(const std::vector<lex::Token>& toks, lex::TokenKind k) {
  int n = 0;
  for (const auto& t : toks) { if (t.kind == k) ++n; }
  return n;
}

TEST(LexerEdges, BlankAndCommentLinesEmitNothing) {
  auto toks = lexAll("\n# comment only\n\nx = 1  # trailing\n");
  ASSERT_EQ(toks.size(), 5u);
  EXPECT_EQ(toks[0].kind, lex::TokenKind::Ident);
  EXPECT_EQ(toks[3].kind, lex::TokenKind::Newline);
  EXPECT_EQ(toks[4].kind, lex::TokenKind::End);
}

TEST(LexerEdges, IndentDedentBalanced) {
  const char* src =
      "def f(X):\n"
      "    if X:\n"
      "        Y = X\n"
      "    return Y\n"
      "def g(X):\n"
      "    return X\n";
  auto toks = lexAll(src);
  EXPECT_EQ(countKind(toks, lex::TokenKind::Indent), 3);
  EXPECT_EQ(countKind(toks, lex::TokenKind::Dedent), 3);
}

TEST(LexerEdges, BracketsJoinLines) {
  auto toks = lexAll("y = f(a,\n      b)\n");
  EXPECT_EQ(countKind(toks, lex::TokenKind::Newline), 1);
  EXPECT_EQ(countKind(toks, lex::TokenKind::Indent), 0);
}

TEST(LexerEdges, BackslashJoinsLines) {
  auto toks = lexAll("y = a + \\\n    b\n");
  EXPECT_EQ(countKind(toks, lex::TokenKind::Newline), 1);
  EXPECT_EQ(countKind(toks, lex::TokenKind::Indent), 0);
}

TEST(LexerEdges, TripleQuotedStringSpansLines) {
  auto toks = lexAll("def f(X):\n    \"\"\"first\n    second\"\"\"\n    return X\n");
  bool found = false;
  for (const auto& t : toks) {
    if (t.kind == lex::TokenKind::String) {
      found = true;
      EXPECT_NE(t.text.find("first\n"), std::string::npos);
      EXPECT_EQ(t.line, 2);
    }
  }
  EXPECT_TRUE(found);
}

TEST(LexerEdges, InconsistentDedentFails) {
  const char* src =
      "def f(X):\n"
      "    Y = X\n"
      "  return Y\n";
  EXPECT_THROW(lexAll(src), exceptions::ParseError);
}

TEST(LexerEdges, UnterminatedStringFails) {
  try {
    lexAll("s = 'abc\n");
    FAIL() << "expected ParseError";
  } catch (const exceptions::ParseError& e) {
    const std::string msg = e.what();
    EXPECT_EQ(msg.rfind("lex.py:1:5: ", 0), 0u);
    EXPECT_NE(msg.find("unterminated"), std::string::npos);
  }
}

TEST(LexerEdges, UnclosedBracketFails) {
  EXPECT_THROW(lexAll("y = f(a,\n"), exceptions::ParseError);
}

TEST(LexerEdges, UnexpectedCharacterFails) {
  EXPECT_THROW(lexAll("y = a $ b\n"), exceptions::ParseError);
}

TEST(LexerEdges, MissingFileRaisesFileReadError) {
  lex::Lexer L;
  EXPECT_THROW(L.pushFile("/nonexistent/dir/missing.py"), exceptions::FileReadError);
}

TEST(LexerEdges, FileInputTokenizes) {
  const auto path = std::filesystem::temp_directory_path() / "gsc_lexer_fileinput.py";
  { std::ofstream out(path); out << "x = 1\n"; }
  lex::Lexer L; L.pushFile(path.string());
  auto toks = L.tokens();
  ASSERT_EQ(toks.size(), 5u);
  EXPECT_EQ(toks[0].file, path.string());
  std::filesystem::remove(path);
}

TEST(LexerEdges, PeekAndNextWalkTheStream) {
  lex::Lexer L; L.pushString("a = b\n", "p.py");
  EXPECT_EQ(L.peek().kind, lex::TokenKind::Ident);
  EXPECT_EQ(L.peek(1).kind, lex::TokenKind::Equal);
  EXPECT_EQ(L.next().text, "a");
  EXPECT_EQ(L.next().kind, lex::TokenKind::Equal);
  EXPECT_EQ(L.peek(100).kind, lex::TokenKind::End);
}
