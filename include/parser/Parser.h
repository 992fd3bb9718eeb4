/***
 * Name: gsc::parse::Parser
 * Purpose: Build an AST for the graph-script subset from a token stream.
 * Inputs:
 *   - Token stream from Lexer (pull-based)
 * Outputs:
 *   - Module AST: imports, constant assignments and function definitions.
 * Theory of Operation:
 *   Recursive descent over a buffered token vector. It recognizes:
 *     module   := { stmt }
 *     funcdef  := {'@' expr NEWLINE} 'def' IDENT '(' [params] ')' ['->' expr] ':' suite
 *     stmt     := funcdef | if | while | for | return | break | continue | pass
 *               | import | from-import | assign | annotated-assign | expr-stmt
 *     suite    := NEWLINE INDENT stmt+ DEDENT | simple-stmt
 *   Expressions follow Python precedence from `or` down to postfix
 *   call/subscript/attribute. A single comparison yields ast::Binary; a
 *   chained comparison yields ast::Compare. Malformed input raises
 *   exceptions::ParseError; well-formed constructs outside the subset
 *   (classes, try, with, lambda, augmented assignment, comprehensions, ...)
 *   raise exceptions::UnsupportedConstructError with the source position.
 */
#pragma once

#include "ast/Nodes.h"
#include "lexer/ITokenStream.h"
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace gsc::parse {

class Parser {
 public:
  explicit Parser(lex::ITokenStream& stream) : ts_(stream) {}
  std::unique_ptr<ast::Module> parseModule();

 private:
  lex::ITokenStream& ts_;
  std::vector<lex::Token> tokens_{};
  size_t pos_{0};
  bool initialized_{false};

  void initBuffer();
  const lex::Token& peek() const;
  const lex::Token& peekNext() const;
  lex::Token get();
  bool match(lex::TokenKind tokenKind);
  lex::Token expect(lex::TokenKind tokenKind, const char* msg);
  [[noreturn]] void fail(const lex::Token& tok, const std::string& msg) const;
  [[noreturn]] static void unsupported(const lex::Token& tok, const std::string& what);

  // statements
  std::unique_ptr<ast::Stmt> parseStatement();
  std::unique_ptr<ast::Stmt> parseSimpleStatement();
  std::unique_ptr<ast::FunctionDef> parseFunction(std::vector<std::unique_ptr<ast::Expr>> decorators);
  std::vector<std::unique_ptr<ast::Expr>> parseDecorators();
  void parseParamList(std::vector<ast::Param>& outParams);
  void parseSuiteInto(std::vector<std::unique_ptr<ast::Stmt>>& out);
  std::unique_ptr<ast::Stmt> parseIfStmt();
  std::unique_ptr<ast::Stmt> parseWhileStmt();
  std::unique_ptr<ast::Stmt> parseForStmt();
  std::unique_ptr<ast::Stmt> parseImportStmt();
  std::unique_ptr<ast::Stmt> parseFromImportStmt();
  std::string parseDottedName();

  // expressions
  std::unique_ptr<ast::Expr> parseExprList();
  std::unique_ptr<ast::Expr> parseTargetList();
  std::unique_ptr<ast::Expr> parseExpr();
  std::unique_ptr<ast::Expr> parseLogicalOr();
  std::unique_ptr<ast::Expr> parseLogicalAnd();
  std::unique_ptr<ast::Expr> parseLogicalNot();
  std::unique_ptr<ast::Expr> parseComparison();
  std::unique_ptr<ast::Expr> parseBitwiseOr();
  std::unique_ptr<ast::Expr> parseBitwiseXor();
  std::unique_ptr<ast::Expr> parseBitwiseAnd();
  std::unique_ptr<ast::Expr> parseShift();
  std::unique_ptr<ast::Expr> parseAdditive();
  std::unique_ptr<ast::Expr> parseMultiplicative();
  std::unique_ptr<ast::Expr> parseUnary();
  std::unique_ptr<ast::Expr> parsePower();
  std::unique_ptr<ast::Expr> parsePostfix(std::unique_ptr<ast::Expr> base);
  std::unique_ptr<ast::Expr> parseAtom();
  std::unique_ptr<ast::Expr> parseListLiteral(const lex::Token& openTok);
  std::unique_ptr<ast::Expr> parseTupleOrParen(const lex::Token& openTok);
  std::unique_ptr<ast::Expr> parseSubscriptItems(const lex::Token& openTok);
  std::unique_ptr<ast::Expr> parseSubscriptItem();
  void parseCallArgs(ast::Call& call);

  static std::string unquoteString(const lex::Token& tok);
  std::int64_t parseIntText(const lex::Token& tok) const;
  static void setTargetContext(ast::Expr* e, ast::ExprContext ctx);
};

} // namespace gsc::parse
