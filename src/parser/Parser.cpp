/***
 * Name: gsc::parse::Parser (statements)
 * Purpose: Token buffering, error reporting and statement-level grammar.
 */
#include "parser/Parser.h"
#include "gsc/exceptions/parse_error.h"
#include "gsc/exceptions/unsupported_construct_error.h"
#include "lexer/Lexer.h"

#include <cstddef>
#include <memory>
#include <sstream>
#include <string>
#include <utility>
#include <vector>

namespace gsc::parse {

using TK = lex::TokenKind;

namespace {
template <typename NodeT>
NodeT* stamp(NodeT* node, const lex::Token& tok) {
  node->file = tok.file;
  node->line = tok.line;
  node->col = tok.col;
  return node;
}
} // namespace

void Parser::initBuffer() {
  if (initialized_) { return; }
  if (auto* lx = dynamic_cast<lex::Lexer*>(&ts_)) {
    tokens_ = lx->tokens();
  } else {
    tokens_.clear();
    for (;;) {
      auto tok = ts_.next();
      tokens_.push_back(tok);
      if (tok.kind == TK::End) { break; }
    }
  }
  pos_ = 0;
  initialized_ = true;
}

const lex::Token& Parser::peek() const {
  return tokens_[pos_ < tokens_.size() ? pos_ : (tokens_.size() - 1)];
}

const lex::Token& Parser::peekNext() const {
  const size_t idx = pos_ + 1;
  return tokens_[idx < tokens_.size() ? idx : (tokens_.size() - 1)];
}

lex::Token Parser::get() {
  if (pos_ < tokens_.size()) { return tokens_[pos_++]; }
  return tokens_.back();
}

bool Parser::match(TK tokenKind) {
  if (peek().kind == tokenKind) { (void)get(); return true; }
  return false;
}

lex::Token Parser::expect(TK tokenKind, const char* msg) {
  if (peek().kind != tokenKind) {
    fail(peek(), std::string("expected ") + msg);
  }
  return get();
}

void Parser::fail(const lex::Token& tok, const std::string& msg) const {
  std::ostringstream out;
  out << tok.file << ":" << tok.line << ":" << tok.col << ": parse error: " << msg
      << " (got " << to_string(tok.kind) << " '" << (tok.kind == TK::Newline ? "\\n" : tok.text) << "')";
  throw exceptions::ParseError(out.str());
}

void Parser::unsupported(const lex::Token& tok, const std::string& what) {
  throw exceptions::UnsupportedConstructError(what + " is not supported in graph scripts",
                                              sema::Diagnostic{"", tok.file, tok.line, tok.col});
}

std::unique_ptr<ast::Module> Parser::parseModule() {
  initBuffer();
  auto mod = std::make_unique<ast::Module>();
  stamp(mod.get(), peek());
  while (peek().kind != TK::End) {
    if (match(TK::Newline)) { continue; }
    if (peek().kind == TK::Indent) { fail(peek(), "unexpected indent"); }
    mod->body.push_back(parseStatement());
  }
  return mod;
}

// NOLINTNEXTLINE(readability-function-cognitive-complexity)
std::unique_ptr<ast::Stmt> Parser::parseStatement() {
  const auto& tok = peek();
  switch (tok.kind) {
    case TK::At:
    case TK::Def: {
      const auto startTok = tok;
      auto decorators = parseDecorators();
      auto fn = parseFunction(std::move(decorators));
      auto stmt = std::make_unique<ast::DefStmt>(std::move(fn));
      stamp(stmt.get(), startTok);
      return stmt;
    }
    case TK::If: return parseIfStmt();
    case TK::While: return parseWhileStmt();
    case TK::For: return parseForStmt();
    case TK::Reserved: unsupported(tok, "'" + tok.text + "'");
    default: break;
  }
  auto stmt = parseSimpleStatement();
  if (peek().kind == TK::Comma || peek().kind == TK::Colon) { fail(peek(), "unexpected token"); }
  if (!match(TK::Newline) && peek().kind != TK::End && peek().kind != TK::Dedent) {
    fail(peek(), "expected end of line");
  }
  return stmt;
}

// NOLINTNEXTLINE(readability-function-cognitive-complexity)
std::unique_ptr<ast::Stmt> Parser::parseSimpleStatement() {
  const auto tok = peek();
  switch (tok.kind) {
    case TK::Return: {
      (void)get();
      std::unique_ptr<ast::Expr> value;
      if (peek().kind != TK::Newline && peek().kind != TK::End && peek().kind != TK::Dedent) {
        value = parseExprList();
      }
      auto ret = std::make_unique<ast::ReturnStmt>(std::move(value));
      stamp(ret.get(), tok);
      return ret;
    }
    case TK::Break: { (void)get(); auto stmt = std::make_unique<ast::BreakStmt>(); stamp(stmt.get(), tok); return stmt; }
    case TK::Continue: { (void)get(); auto stmt = std::make_unique<ast::ContinueStmt>(); stamp(stmt.get(), tok); return stmt; }
    case TK::Pass: { (void)get(); auto stmt = std::make_unique<ast::PassStmt>(); stamp(stmt.get(), tok); return stmt; }
    case TK::Import: return parseImportStmt();
    case TK::From: return parseFromImportStmt();
    case TK::Reserved: unsupported(tok, "'" + tok.text + "'");
    default: break;
  }

  auto first = parseExprList();
  if (peek().kind == TK::AugAssign) { unsupported(peek(), "augmented assignment '" + peek().text + "'"); }
  if (match(TK::Colon)) {
    // annotated assignment: target ':' annotation ['=' value]
    auto annotation = parseExpr();
    if (!match(TK::Equal)) { unsupported(tok, "annotation without value"); }
    auto stmt = std::make_unique<ast::AssignStmt>(parseExprList());
    setTargetContext(first.get(), ast::ExprContext::Store);
    stmt->targets.push_back(std::move(first));
    stmt->annotation = std::move(annotation);
    stamp(stmt.get(), tok);
    return stmt;
  }
  if (peek().kind == TK::Equal) {
    std::vector<std::unique_ptr<ast::Expr>> chain;
    chain.push_back(std::move(first));
    while (match(TK::Equal)) { chain.push_back(parseExprList()); }
    auto value = std::move(chain.back());
    chain.pop_back();
    auto stmt = std::make_unique<ast::AssignStmt>(std::move(value));
    for (auto& target : chain) {
      const auto kind = target->kind;
      if (kind != ast::NodeKind::Name && kind != ast::NodeKind::TupleLiteral && kind != ast::NodeKind::Subscript &&
          kind != ast::NodeKind::Attribute && kind != ast::NodeKind::ListLiteral) {
        fail(tok, "invalid assignment target");
      }
      setTargetContext(target.get(), ast::ExprContext::Store);
      stmt->targets.push_back(std::move(target));
    }
    stamp(stmt.get(), tok);
    return stmt;
  }
  auto stmt = std::make_unique<ast::ExprStmt>(std::move(first));
  stamp(stmt.get(), tok);
  return stmt;
}

std::vector<std::unique_ptr<ast::Expr>> Parser::parseDecorators() {
  std::vector<std::unique_ptr<ast::Expr>> decorators;
  while (match(TK::At)) {
    decorators.push_back(parseExpr());
    expect(TK::Newline, "newline after decorator");
  }
  return decorators;
}

std::unique_ptr<ast::FunctionDef> Parser::parseFunction(std::vector<std::unique_ptr<ast::Expr>> decorators) {
  const auto defTok = expect(TK::Def, "'def'");
  const auto nameTok = expect(TK::Ident, "function name");
  auto fn = std::make_unique<ast::FunctionDef>(nameTok.text);
  stamp(fn.get(), defTok);
  fn->decorators = std::move(decorators);
  expect(TK::LParen, "'('");
  parseParamList(fn->params);
  expect(TK::RParen, "')'");
  if (match(TK::Arrow)) { fn->returns = parseExpr(); }
  expect(TK::Colon, "':' after function signature");
  parseSuiteInto(fn->body);
  return fn;
}

// NOLINTNEXTLINE(readability-function-cognitive-complexity)
void Parser::parseParamList(std::vector<ast::Param>& outParams) {
  bool kwOnly = false;
  while (peek().kind != TK::RParen) {
    ast::Param param;
    const auto startTok = peek();
    if (match(TK::Slash)) {
      // positional-only marker carries no meaning for graph functions
      if (!match(TK::Comma)) { break; }
      continue;
    }
    if (match(TK::StarStar)) {
      param.isKwVarArg = true;
    } else if (match(TK::Star)) {
      if (peek().kind != TK::Ident) {
        kwOnly = true;
        if (!match(TK::Comma)) { break; }
        continue;
      }
      param.isVarArg = true;
    }
    const auto nameTok = expect(TK::Ident, "parameter name");
    param.name = nameTok.text;
    param.line = startTok.line;
    param.col = startTok.col;
    param.isKwOnly = kwOnly && !param.isVarArg && !param.isKwVarArg;
    if (param.isVarArg) { kwOnly = true; }
    if (match(TK::Colon)) { param.annotation = parseExpr(); }
    if (match(TK::Equal)) { param.defaultValue = parseExpr(); }
    outParams.push_back(std::move(param));
    if (!match(TK::Comma)) { break; }
  }
}

void Parser::parseSuiteInto(std::vector<std::unique_ptr<ast::Stmt>>& out) {
  if (!match(TK::Newline)) {
    // single-line suite: if x: y = 1
    out.push_back(parseSimpleStatement());
    if (!match(TK::Newline) && peek().kind != TK::End) { fail(peek(), "expected end of line"); }
    return;
  }
  expect(TK::Indent, "indented block");
  while (peek().kind != TK::Dedent && peek().kind != TK::End) {
    if (match(TK::Newline)) { continue; }
    out.push_back(parseStatement());
  }
  (void)match(TK::Dedent);
}

std::unique_ptr<ast::Stmt> Parser::parseIfStmt() {
  const auto ifTok = get(); // 'if' or 'elif'
  auto cond = parseExpr();
  expect(TK::Colon, "':' after condition");
  auto stmt = std::make_unique<ast::IfStmt>(std::move(cond));
  stamp(stmt.get(), ifTok);
  parseSuiteInto(stmt->thenBody);
  if (peek().kind == TK::Elif) {
    stmt->elseBody.push_back(parseIfStmt());
  } else if (match(TK::Else)) {
    expect(TK::Colon, "':' after else");
    parseSuiteInto(stmt->elseBody);
  }
  return stmt;
}

std::unique_ptr<ast::Stmt> Parser::parseWhileStmt() {
  const auto whileTok = get();
  auto cond = parseExpr();
  expect(TK::Colon, "':' after while condition");
  auto stmt = std::make_unique<ast::WhileStmt>(std::move(cond));
  stamp(stmt.get(), whileTok);
  parseSuiteInto(stmt->thenBody);
  if (match(TK::Else)) {
    expect(TK::Colon, "':' after else");
    parseSuiteInto(stmt->elseBody);
  }
  return stmt;
}

std::unique_ptr<ast::Stmt> Parser::parseForStmt() {
  const auto forTok = get();
  auto target = parseTargetList();
  setTargetContext(target.get(), ast::ExprContext::Store);
  expect(TK::In, "'in' in for statement");
  auto iterable = parseExprList();
  expect(TK::Colon, "':' after for header");
  auto stmt = std::make_unique<ast::ForStmt>(std::move(target), std::move(iterable));
  stamp(stmt.get(), forTok);
  parseSuiteInto(stmt->thenBody);
  if (match(TK::Else)) {
    expect(TK::Colon, "':' after else");
    parseSuiteInto(stmt->elseBody);
  }
  return stmt;
}

std::string Parser::parseDottedName() {
  std::string name = expect(TK::Ident, "module name").text;
  while (match(TK::Dot)) {
    name += ".";
    name += expect(TK::Ident, "name after '.'").text;
  }
  return name;
}

std::unique_ptr<ast::Stmt> Parser::parseImportStmt() {
  const auto importTok = get();
  auto stmt = std::make_unique<ast::Import>();
  stamp(stmt.get(), importTok);
  do {
    const auto nameTok = peek();
    ast::Alias alias;
    stamp(&alias, nameTok);
    alias.name = parseDottedName();
    if (match(TK::As)) { alias.asname = expect(TK::Ident, "alias name").text; }
    stmt->names.push_back(std::move(alias));
  } while (match(TK::Comma));
  return stmt;
}

std::unique_ptr<ast::Stmt> Parser::parseFromImportStmt() {
  const auto fromTok = get();
  auto stmt = std::make_unique<ast::ImportFrom>();
  stamp(stmt.get(), fromTok);
  if (peek().kind == TK::Dot) { unsupported(peek(), "relative import"); }
  stmt->module = parseDottedName();
  expect(TK::Import, "'import'");
  if (peek().kind == TK::Star) { unsupported(peek(), "wildcard import"); }
  const bool paren = match(TK::LParen);
  do {
    if (paren && peek().kind == TK::RParen) { break; }
    const auto nameTok = expect(TK::Ident, "imported name");
    ast::Alias alias(nameTok.text, "");
    stamp(&alias, nameTok);
    if (match(TK::As)) { alias.asname = expect(TK::Ident, "alias name").text; }
    stmt->names.push_back(std::move(alias));
  } while (match(TK::Comma));
  if (paren) { expect(TK::RParen, "')'"); }
  return stmt;
}

void Parser::setTargetContext(ast::Expr* e, const ast::ExprContext ctx) {
  if (e == nullptr) { return; }
  switch (e->kind) {
    case ast::NodeKind::Name: static_cast<ast::Name*>(e)->ctx = ctx; break;
    case ast::NodeKind::Subscript: static_cast<ast::Subscript*>(e)->ctx = ctx; break;
    case ast::NodeKind::Attribute: static_cast<ast::Attribute*>(e)->ctx = ctx; break;
    case ast::NodeKind::TupleLiteral:
      for (auto& el : static_cast<ast::TupleLiteral*>(e)->elements) { setTargetContext(el.get(), ctx); }
      break;
    case ast::NodeKind::ListLiteral:
      for (auto& el : static_cast<ast::ListLiteral*>(e)->elements) { setTargetContext(el.get(), ctx); }
      break;
    default: break;
  }
}

} // namespace gsc::parse
