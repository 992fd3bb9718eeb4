/***
 * Name: gsc::parse::Parser (expressions)
 * Purpose: Expression grammar, literals and subscripts.
 */
#include "parser/Parser.h"
#include "gsc/exceptions/parse_error.h"
#include "gsc/exceptions/unsupported_construct_error.h"

#include <cerrno>
#include <cmath>
#include <cstdint>
#include <cstdlib>
#include <memory>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace gsc::parse {

using TK = lex::TokenKind;

namespace {
template <typename NodeT>
std::unique_ptr<NodeT> located(std::unique_ptr<NodeT> node, const lex::Token& tok) {
  node->file = tok.file;
  node->line = tok.line;
  node->col = tok.col;
  return node;
}

std::unique_ptr<ast::Expr> binary(ast::BinaryOperator op, std::unique_ptr<ast::Expr> lhs, std::unique_ptr<ast::Expr> rhs,
                                  const lex::Token& tok) {
  return located(std::make_unique<ast::Binary>(op, std::move(lhs), std::move(rhs)), tok);
}

bool startsExpression(TK kind) {
  switch (kind) {
    case TK::Ident: case TK::Int: case TK::Float: case TK::String: case TK::BoolLit: case TK::NoneLit:
    case TK::LParen: case TK::LBracket: case TK::LBrace: case TK::Minus: case TK::Plus: case TK::Tilde:
    case TK::Not: case TK::Ellipsis: case TK::Reserved:
      return true;
    default:
      return false;
  }
}
} // namespace

std::unique_ptr<ast::Expr> Parser::parseExprList() {
  const auto startTok = peek();
  auto first = parseExpr();
  if (peek().kind != TK::Comma) { return first; }
  auto tuple = located(std::make_unique<ast::TupleLiteral>(), startTok);
  tuple->elements.push_back(std::move(first));
  while (match(TK::Comma)) {
    if (!startsExpression(peek().kind)) { break; }
    tuple->elements.push_back(parseExpr());
  }
  return tuple;
}

// Loop targets stop before 'in', so they are parsed at postfix level.
std::unique_ptr<ast::Expr> Parser::parseTargetList() {
  const auto startTok = peek();
  auto first = parsePostfix(parseAtom());
  if (peek().kind != TK::Comma) { return first; }
  auto tuple = located(std::make_unique<ast::TupleLiteral>(), startTok);
  tuple->elements.push_back(std::move(first));
  while (match(TK::Comma)) {
    if (peek().kind == TK::In) { break; }
    tuple->elements.push_back(parsePostfix(parseAtom()));
  }
  return tuple;
}

std::unique_ptr<ast::Expr> Parser::parseExpr() {
  auto expr = parseLogicalOr();
  if (peek().kind == TK::If) { unsupported(peek(), "conditional expression"); }
  if (peek().kind == TK::For) { unsupported(peek(), "comprehension"); }
  return expr;
}

std::unique_ptr<ast::Expr> Parser::parseLogicalOr() {
  auto lhs = parseLogicalAnd();
  while (peek().kind == TK::Or) {
    const auto opTok = get();
    lhs = binary(ast::BinaryOperator::Or, std::move(lhs), parseLogicalAnd(), opTok);
  }
  return lhs;
}

std::unique_ptr<ast::Expr> Parser::parseLogicalAnd() {
  auto lhs = parseLogicalNot();
  while (peek().kind == TK::And) {
    const auto opTok = get();
    lhs = binary(ast::BinaryOperator::And, std::move(lhs), parseLogicalNot(), opTok);
  }
  return lhs;
}

std::unique_ptr<ast::Expr> Parser::parseLogicalNot() {
  if (peek().kind == TK::Not) {
    const auto opTok = get();
    return located(std::make_unique<ast::Unary>(ast::UnaryOperator::Not, parseLogicalNot()), opTok);
  }
  return parseComparison();
}

// NOLINTNEXTLINE(readability-function-cognitive-complexity)
std::unique_ptr<ast::Expr> Parser::parseComparison() {
  const auto startTok = peek();
  auto left = parseBitwiseOr();
  std::vector<ast::BinaryOperator> ops;
  std::vector<std::unique_ptr<ast::Expr>> comps;
  lex::Token firstOpTok;
  for (;;) {
    const auto kind = peek().kind;
    if (!(kind == TK::EqEq || kind == TK::NotEq || kind == TK::Lt || kind == TK::Le || kind == TK::Gt ||
          kind == TK::Ge || kind == TK::Is || kind == TK::In || (kind == TK::Not && peekNext().kind == TK::In))) {
      break;
    }
    const auto opTok = get();
    if (ops.empty()) { firstOpTok = opTok; }
    ast::BinaryOperator binOp = ast::BinaryOperator::Eq;
    switch (opTok.kind) {
      case TK::EqEq: binOp = ast::BinaryOperator::Eq; break;
      case TK::NotEq: binOp = ast::BinaryOperator::Ne; break;
      case TK::Lt: binOp = ast::BinaryOperator::Lt; break;
      case TK::Le: binOp = ast::BinaryOperator::Le; break;
      case TK::Gt: binOp = ast::BinaryOperator::Gt; break;
      case TK::Ge: binOp = ast::BinaryOperator::Ge; break;
      case TK::Is: binOp = match(TK::Not) ? ast::BinaryOperator::IsNot : ast::BinaryOperator::Is; break;
      case TK::In: binOp = ast::BinaryOperator::In; break;
      case TK::Not: (void)get(); binOp = ast::BinaryOperator::NotIn; break;
      default: break;
    }
    ops.push_back(binOp);
    comps.push_back(parseBitwiseOr());
  }
  if (ops.empty()) { return left; }
  if (ops.size() == 1) { return binary(ops[0], std::move(left), std::move(comps[0]), firstOpTok); }
  auto cmp = located(std::make_unique<ast::Compare>(), startTok);
  cmp->left = std::move(left);
  cmp->ops = std::move(ops);
  cmp->comparators = std::move(comps);
  return cmp;
}

std::unique_ptr<ast::Expr> Parser::parseBitwiseOr() {
  auto lhs = parseBitwiseXor();
  while (peek().kind == TK::Pipe) {
    const auto opTok = get();
    lhs = binary(ast::BinaryOperator::BitOr, std::move(lhs), parseBitwiseXor(), opTok);
  }
  return lhs;
}

std::unique_ptr<ast::Expr> Parser::parseBitwiseXor() {
  auto lhs = parseBitwiseAnd();
  while (peek().kind == TK::Caret) {
    const auto opTok = get();
    lhs = binary(ast::BinaryOperator::BitXor, std::move(lhs), parseBitwiseAnd(), opTok);
  }
  return lhs;
}

std::unique_ptr<ast::Expr> Parser::parseBitwiseAnd() {
  auto lhs = parseShift();
  while (peek().kind == TK::Amp) {
    const auto opTok = get();
    lhs = binary(ast::BinaryOperator::BitAnd, std::move(lhs), parseShift(), opTok);
  }
  return lhs;
}

std::unique_ptr<ast::Expr> Parser::parseShift() {
  auto lhs = parseAdditive();
  while (peek().kind == TK::LShift || peek().kind == TK::RShift) {
    const auto opTok = get();
    const auto op = opTok.kind == TK::LShift ? ast::BinaryOperator::LShift : ast::BinaryOperator::RShift;
    lhs = binary(op, std::move(lhs), parseAdditive(), opTok);
  }
  return lhs;
}

std::unique_ptr<ast::Expr> Parser::parseAdditive() {
  auto lhs = parseMultiplicative();
  while (peek().kind == TK::Plus || peek().kind == TK::Minus) {
    const auto opTok = get();
    const auto op = opTok.kind == TK::Plus ? ast::BinaryOperator::Add : ast::BinaryOperator::Sub;
    lhs = binary(op, std::move(lhs), parseMultiplicative(), opTok);
  }
  return lhs;
}

std::unique_ptr<ast::Expr> Parser::parseMultiplicative() {
  auto lhs = parseUnary();
  for (;;) {
    ast::BinaryOperator op{};
    switch (peek().kind) {
      case TK::Star: op = ast::BinaryOperator::Mul; break;
      case TK::Slash: op = ast::BinaryOperator::Div; break;
      case TK::SlashSlash: op = ast::BinaryOperator::FloorDiv; break;
      case TK::Percent: op = ast::BinaryOperator::Mod; break;
      case TK::At: op = ast::BinaryOperator::MatMul; break;
      default: return lhs;
    }
    const auto opTok = get();
    lhs = binary(op, std::move(lhs), parseUnary(), opTok);
  }
}

std::unique_ptr<ast::Expr> Parser::parseUnary() {
  const auto kind = peek().kind;
  if (kind == TK::Minus || kind == TK::Plus || kind == TK::Tilde) {
    const auto opTok = get();
    const auto op = kind == TK::Minus ? ast::UnaryOperator::Neg
                    : kind == TK::Plus ? ast::UnaryOperator::Pos
                                       : ast::UnaryOperator::BitNot;
    return located(std::make_unique<ast::Unary>(op, parseUnary()), opTok);
  }
  return parsePower();
}

// power binds tighter than unary on its left and looser on its right: -a ** -b == -(a ** (-b))
std::unique_ptr<ast::Expr> Parser::parsePower() {
  auto base = parsePostfix(parseAtom());
  if (peek().kind == TK::StarStar) {
    const auto opTok = get();
    return binary(ast::BinaryOperator::Pow, std::move(base), parseUnary(), opTok);
  }
  return base;
}

std::unique_ptr<ast::Expr> Parser::parsePostfix(std::unique_ptr<ast::Expr> base) {
  for (;;) {
    const auto tok = peek();
    if (tok.kind == TK::LParen) {
      (void)get();
      auto call = located(std::make_unique<ast::Call>(std::move(base)), tok);
      parseCallArgs(*call);
      expect(TK::RParen, "')' to close call");
      base = std::move(call);
    } else if (tok.kind == TK::LBracket) {
      (void)get();
      auto slice = parseSubscriptItems(tok);
      expect(TK::RBracket, "']' to close subscript");
      base = located(std::make_unique<ast::Subscript>(std::move(base), std::move(slice)), tok);
    } else if (tok.kind == TK::Dot) {
      (void)get();
      const auto attrTok = expect(TK::Ident, "attribute name");
      base = located(std::make_unique<ast::Attribute>(std::move(base), attrTok.text), attrTok);
    } else {
      return base;
    }
  }
}

void Parser::parseCallArgs(ast::Call& call) {
  while (peek().kind != TK::RParen) {
    if (peek().kind == TK::Star || peek().kind == TK::StarStar) { unsupported(peek(), "argument unpacking"); }
    if (peek().kind == TK::Ident && peekNext().kind == TK::Equal) {
      const auto nameTok = get();
      (void)get();
      call.keywords.push_back(ast::KeywordArg{nameTok.text, parseExpr()});
    } else {
      if (!call.keywords.empty()) { fail(peek(), "positional argument follows keyword argument"); }
      call.args.push_back(parseExpr());
    }
    if (!match(TK::Comma)) { break; }
  }
}

std::unique_ptr<ast::Expr> Parser::parseSubscriptItems(const lex::Token& openTok) {
  auto first = parseSubscriptItem();
  if (peek().kind != TK::Comma) { return first; }
  auto tuple = located(std::make_unique<ast::TupleLiteral>(), openTok);
  tuple->elements.push_back(std::move(first));
  while (match(TK::Comma)) {
    if (peek().kind == TK::RBracket) { break; }
    tuple->elements.push_back(parseSubscriptItem());
  }
  return tuple;
}

std::unique_ptr<ast::Expr> Parser::parseSubscriptItem() {
  const auto startTok = peek();
  std::unique_ptr<ast::Expr> lower;
  if (startTok.kind != TK::Colon) {
    lower = parseExpr();
    if (peek().kind != TK::Colon) { return lower; }
  }
  auto slice = located(std::make_unique<ast::Slice>(), startTok);
  slice->lower = std::move(lower);
  expect(TK::Colon, "':' in slice");
  auto endsPart = [&]() {
    const auto kind = peek().kind;
    return kind == TK::Colon || kind == TK::Comma || kind == TK::RBracket;
  };
  if (!endsPart()) { slice->upper = parseExpr(); }
  if (match(TK::Colon) && !endsPart()) { slice->step = parseExpr(); }
  return slice;
}

// NOLINTNEXTLINE(readability-function-cognitive-complexity)
std::unique_ptr<ast::Expr> Parser::parseAtom() {
  const auto tok = get();
  switch (tok.kind) {
    case TK::Ident: return located(std::make_unique<ast::Name>(tok.text), tok);
    case TK::Int: return located(std::make_unique<ast::IntLiteral>(parseIntText(tok)), tok);
    case TK::Float: {
      std::string text;
      for (const char chr : tok.text) { if (chr != '_') { text.push_back(chr); } }
      // Underflow keeps the rounded value (0.0 for 1e-400); overflow is an error.
      errno = 0;
      char* end = nullptr;
      const double value = std::strtod(text.c_str(), &end);
      if (end != text.c_str() + text.size()) { fail(tok, "malformed float literal"); }
      if (errno == ERANGE && std::isinf(value)) { fail(tok, "float literal out of range"); }
      return located(std::make_unique<ast::FloatLiteral>(value), tok);
    }
    case TK::String: {
      std::string value = unquoteString(tok);
      while (peek().kind == TK::String) { value += unquoteString(get()); }
      return located(std::make_unique<ast::StringLiteral>(std::move(value)), tok);
    }
    case TK::BoolLit: return located(std::make_unique<ast::BoolLiteral>(tok.text == "True"), tok);
    case TK::NoneLit: return located(std::make_unique<ast::NoneLiteral>(), tok);
    case TK::LParen: return parseTupleOrParen(tok);
    case TK::LBracket: return parseListLiteral(tok);
    case TK::LBrace: unsupported(tok, "dict/set display");
    case TK::Ellipsis: unsupported(tok, "'...'");
    case TK::Reserved: unsupported(tok, "'" + tok.text + "'");
    default: break;
  }
  fail(tok, "expected expression");
}

std::unique_ptr<ast::Expr> Parser::parseListLiteral(const lex::Token& openTok) {
  auto list = located(std::make_unique<ast::ListLiteral>(), openTok);
  while (peek().kind != TK::RBracket) {
    list->elements.push_back(parseExpr());
    if (!match(TK::Comma)) { break; }
  }
  expect(TK::RBracket, "']' to close list");
  return list;
}

std::unique_ptr<ast::Expr> Parser::parseTupleOrParen(const lex::Token& openTok) {
  if (match(TK::RParen)) { return located(std::make_unique<ast::TupleLiteral>(), openTok); }
  auto first = parseExpr();
  if (match(TK::RParen)) { return first; }
  auto tuple = located(std::make_unique<ast::TupleLiteral>(), openTok);
  tuple->elements.push_back(std::move(first));
  while (match(TK::Comma)) {
    if (peek().kind == TK::RParen) { break; }
    tuple->elements.push_back(parseExpr());
  }
  expect(TK::RParen, "')' to close tuple");
  return tuple;
}

// NOLINTNEXTLINE(readability-function-cognitive-complexity)
std::string Parser::unquoteString(const lex::Token& tok) {
  const std::string& text = tok.text;
  size_t start = 0;
  bool raw = false;
  while (start < text.size() && text[start] != '"' && text[start] != '\'') {
    const char prefix = text[start];
    if (prefix == 'r' || prefix == 'R') { raw = true; }
    else if (prefix == 'b' || prefix == 'B') { unsupported(tok, "bytes literal"); }
    else if (prefix == 'f' || prefix == 'F') { unsupported(tok, "f-string"); }
    ++start;
  }
  const char quote = text[start];
  const bool triple = text.size() >= start + 6 && text[start + 1] == quote && text[start + 2] == quote;
  const size_t quoteLen = triple ? 3 : 1;
  const std::string body = text.substr(start + quoteLen, text.size() - start - 2 * quoteLen);
  if (raw) { return body; }
  std::string out;
  out.reserve(body.size());
  for (size_t i = 0; i < body.size(); ++i) {
    const char chr = body[i];
    if (chr != '\\' || i + 1 >= body.size()) { out.push_back(chr); continue; }
    const char esc = body[++i];
    switch (esc) {
      case 'n': out.push_back('\n'); break;
      case 't': out.push_back('\t'); break;
      case 'r': out.push_back('\r'); break;
      case '0': out.push_back('\0'); break;
      case '\\': out.push_back('\\'); break;
      case '\'': out.push_back('\''); break;
      case '"': out.push_back('"'); break;
      case '\n': break; // line continuation inside triple-quoted string
      default: out.push_back('\\'); out.push_back(esc); break;
    }
  }
  return out;
}

std::int64_t Parser::parseIntText(const lex::Token& tok) const {
  std::string digits;
  for (const char chr : tok.text) { if (chr != '_') { digits.push_back(chr); } }
  int base = 10;
  if (digits.size() > 2 && digits[0] == '0') {
    const char marker = digits[1];
    if (marker == 'x' || marker == 'X') { base = 16; }
    else if (marker == 'o' || marker == 'O') { base = 8; }
    else if (marker == 'b' || marker == 'B') { base = 2; }
    if (base != 10) { digits = digits.substr(2); }
  }
  try {
    size_t used = 0;
    const long long value = std::stoll(digits, &used, base);
    if (used != digits.size()) { fail(tok, "malformed integer literal"); }
    return static_cast<std::int64_t>(value);
  } catch (const std::out_of_range&) {
    fail(tok, "integer literal out of range");
  } catch (const std::invalid_argument&) {
    fail(tok, "malformed integer literal");
  }
}

} // namespace gsc::parse
