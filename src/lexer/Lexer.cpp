/***
 * Name: gsc::lex::Lexer
 * Purpose: Tokenize script source(s) into a single token stream (LIFO inputs).
 */
#include "lexer/Lexer.h"
#include "lexer/FileInput.h"
#include "lexer/StringInput.h"
#include "gsc/exceptions/parse_error.h"

#include <cctype>
#include <cstddef>
#include <memory>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace gsc::lex {

namespace {

bool isIdentStart(char chr) { return (std::isalpha(static_cast<unsigned char>(chr)) != 0) || chr == '_'; }
bool isIdentChar(char chr) { return (std::isalnum(static_cast<unsigned char>(chr)) != 0) || chr == '_'; }
bool isDigit(char chr) { return std::isdigit(static_cast<unsigned char>(chr)) != 0; }

const std::unordered_map<std::string, TokenKind>& keywords() {
  static const std::unordered_map<std::string, TokenKind> table{
      {"def", TokenKind::Def},         {"return", TokenKind::Return},   {"if", TokenKind::If},
      {"else", TokenKind::Else},       {"elif", TokenKind::Elif},       {"while", TokenKind::While},
      {"for", TokenKind::For},         {"in", TokenKind::In},           {"break", TokenKind::Break},
      {"continue", TokenKind::Continue}, {"pass", TokenKind::Pass},     {"import", TokenKind::Import},
      {"from", TokenKind::From},       {"as", TokenKind::As},           {"and", TokenKind::And},
      {"or", TokenKind::Or},           {"not", TokenKind::Not},         {"is", TokenKind::Is},
      {"True", TokenKind::BoolLit},    {"False", TokenKind::BoolLit},   {"None", TokenKind::NoneLit},
      {"class", TokenKind::Reserved},  {"try", TokenKind::Reserved},    {"except", TokenKind::Reserved},
      {"finally", TokenKind::Reserved}, {"with", TokenKind::Reserved},  {"lambda", TokenKind::Reserved},
      {"yield", TokenKind::Reserved},  {"await", TokenKind::Reserved},  {"async", TokenKind::Reserved},
      {"global", TokenKind::Reserved}, {"nonlocal", TokenKind::Reserved}, {"del", TokenKind::Reserved},
      {"raise", TokenKind::Reserved},  {"assert", TokenKind::Reserved}};
  return table;
}

[[noreturn]] void fail(const std::string& file, int line, int col, const std::string& msg) {
  throw exceptions::ParseError(file + ":" + std::to_string(line) + ":" + std::to_string(col) + ": " + msg);
}

} // namespace

void Lexer::pushFile(const std::string& path) {
  State state;
  state.src = std::make_unique<FileInput>(path);
  stack_.push_back(std::move(state));
}

void Lexer::pushString(const std::string& text, const std::string& name) {
  State state;
  state.src = std::make_unique<StringInput>(text, name);
  stack_.push_back(std::move(state));
}

bool Lexer::readNextLine(State& state) {
  state.line.clear();
  if (!state.src->getline(state.line)) { return false; }
  ++state.lineNo;
  state.index = 0;
  if (!state.line.empty() && state.line.back() == '\r') { state.line.pop_back(); }
  return true;
}

void Lexer::emitIndentTokens(State& state, const size_t width) {
  auto makeTok = [&](TokenKind kind, const char* text) {
    Token tok; tok.kind = kind; tok.text = text; tok.file = state.src->name(); tok.line = state.lineNo; tok.col = 1;
    return tok;
  };
  if (width > state.indentStack.back()) {
    state.indentStack.push_back(width);
    tokens_.push_back(makeTok(TokenKind::Indent, "<INDENT>"));
    return;
  }
  while (width < state.indentStack.back()) {
    state.indentStack.pop_back();
    tokens_.push_back(makeTok(TokenKind::Dedent, "<DEDENT>"));
  }
  if (width != state.indentStack.back()) {
    fail(state.src->name(), state.lineNo, static_cast<int>(width + 1), "unindent does not match any outer indentation level");
  }
}

// Scans a (possibly prefixed, possibly triple-quoted) string. Triple-quoted
// strings may continue on following physical lines.
Token Lexer::scanString(State& state, const size_t start, const size_t quotePos) {
  const int startLine = state.lineNo;
  const char quote = state.line[quotePos];
  const bool triple = quotePos + 2 < state.line.size() && state.line[quotePos + 1] == quote && state.line[quotePos + 2] == quote;
  std::string text = state.line.substr(start, quotePos - start);
  Token tok; tok.kind = TokenKind::String; tok.file = state.src->name(); tok.line = startLine; tok.col = static_cast<int>(start + 1);
  if (!triple) {
    size_t pos = quotePos + 1;
    bool escape = false;
    for (; pos < state.line.size(); ++pos) {
      const char chr = state.line[pos];
      if (escape) { escape = false; continue; }
      if (chr == '\\') { escape = true; continue; }
      if (chr == quote) { break; }
    }
    if (pos >= state.line.size()) { fail(tok.file, startLine, tok.col, "unterminated string literal"); }
    tok.text = text + state.line.substr(quotePos, pos + 1 - quotePos);
    state.index = pos + 1;
    return tok;
  }
  const std::string delim(3, quote);
  text += delim;
  size_t from = quotePos + 3;
  while (true) {
    const size_t close = state.line.find(delim, from);
    if (close != std::string::npos) {
      text += state.line.substr(from, close + 3 - from);
      state.index = close + 3;
      tok.text = std::move(text);
      return tok;
    }
    text += state.line.substr(from);
    text += '\n';
    if (!readNextLine(state)) { fail(tok.file, startLine, tok.col, "unterminated triple-quoted string"); }
    from = 0;
  }
}

Token Lexer::scanNumber(State& state) {
  const auto& line = state.line;
  const size_t start = state.index;
  size_t pos = start;
  TokenKind kind = TokenKind::Int;
  auto digits = [&](auto accept) { while (pos < line.size() && (accept(line[pos]) || line[pos] == '_')) { ++pos; } };
  if (line[pos] == '0' && pos + 1 < line.size() && std::string("xXoObB").find(line[pos + 1]) != std::string::npos) {
    pos += 2;
    digits([](char c) { return std::isxdigit(static_cast<unsigned char>(c)) != 0; });
  } else {
    digits(isDigit);
    if (pos < line.size() && line[pos] == '.') {
      kind = TokenKind::Float;
      ++pos;
      digits(isDigit);
    }
    if (pos < line.size() && (line[pos] == 'e' || line[pos] == 'E')) {
      size_t exp = pos + 1;
      if (exp < line.size() && (line[exp] == '+' || line[exp] == '-')) { ++exp; }
      if (exp < line.size() && isDigit(line[exp])) {
        kind = TokenKind::Float;
        pos = exp;
        digits(isDigit);
      }
    }
  }
  Token tok; tok.kind = kind; tok.text = line.substr(start, pos - start); tok.file = state.src->name(); tok.line = state.lineNo; tok.col = static_cast<int>(start + 1);
  state.index = pos;
  return tok;
}

// NOLINTNEXTLINE(readability-function-size,readability-function-cognitive-complexity)
Token Lexer::scanOne(State& state) {
  const auto& line = state.line;
  size_t& idx = state.index;
  auto makeTok = [&](TokenKind kind, size_t len) {
    Token tok; tok.kind = kind; tok.text = line.substr(idx, len); tok.file = state.src->name(); tok.line = state.lineNo; tok.col = static_cast<int>(idx + 1);
    idx += len;
    return tok;
  };
  auto at = [&](size_t off) { return idx + off < line.size() ? line[idx + off] : '\0'; };

  const char chr = line[idx];
  if (chr == '"' || chr == '\'') { return scanString(state, idx, idx); }
  if (isIdentStart(chr)) {
    size_t end = idx + 1;
    while (end < line.size() && isIdentChar(line[end])) { ++end; }
    const std::string ident = line.substr(idx, end - idx);
    // string prefixes (r, b, u, f and two-letter combinations)
    if (ident.size() <= 2 && end < line.size() && (line[end] == '"' || line[end] == '\'') &&
        ident.find_first_not_of("rRbBuUfF") == std::string::npos) {
      return scanString(state, idx, end);
    }
    const auto found = keywords().find(ident);
    return makeTok(found != keywords().end() ? found->second : TokenKind::Ident, end - idx);
  }
  if (isDigit(chr) || (chr == '.' && isDigit(at(1)))) { return scanNumber(state); }

  switch (chr) {
    case '(': ++state.depth; return makeTok(TokenKind::LParen, 1);
    case '[': ++state.depth; return makeTok(TokenKind::LBracket, 1);
    case '{': ++state.depth; return makeTok(TokenKind::LBrace, 1);
    case ')': if (state.depth > 0) { --state.depth; } return makeTok(TokenKind::RParen, 1);
    case ']': if (state.depth > 0) { --state.depth; } return makeTok(TokenKind::RBracket, 1);
    case '}': if (state.depth > 0) { --state.depth; } return makeTok(TokenKind::RBrace, 1);
    case ':': return makeTok(TokenKind::Colon, 1);
    case ',': return makeTok(TokenKind::Comma, 1);
    case '.':
      if (at(1) == '.' && at(2) == '.') { return makeTok(TokenKind::Ellipsis, 3); }
      return makeTok(TokenKind::Dot, 1);
    case '~': return makeTok(TokenKind::Tilde, 1);
    case '-':
      if (at(1) == '>') { return makeTok(TokenKind::Arrow, 2); }
      break;
    case '=':
      if (at(1) == '=') { return makeTok(TokenKind::EqEq, 2); }
      return makeTok(TokenKind::Equal, 1);
    case '!':
      if (at(1) == '=') { return makeTok(TokenKind::NotEq, 2); }
      fail(state.src->name(), state.lineNo, static_cast<int>(idx + 1), "unexpected character '!'");
    case '<':
      if (at(1) == '=') { return makeTok(TokenKind::Le, 2); }
      if (at(1) == '<') { return at(2) == '=' ? makeTok(TokenKind::AugAssign, 3) : makeTok(TokenKind::LShift, 2); }
      return makeTok(TokenKind::Lt, 1);
    case '>':
      if (at(1) == '=') { return makeTok(TokenKind::Ge, 2); }
      if (at(1) == '>') { return at(2) == '=' ? makeTok(TokenKind::AugAssign, 3) : makeTok(TokenKind::RShift, 2); }
      return makeTok(TokenKind::Gt, 1);
    case '*':
      if (at(1) == '*') { return at(2) == '=' ? makeTok(TokenKind::AugAssign, 3) : makeTok(TokenKind::StarStar, 2); }
      break;
    case '/':
      if (at(1) == '/') { return at(2) == '=' ? makeTok(TokenKind::AugAssign, 3) : makeTok(TokenKind::SlashSlash, 2); }
      break;
    default: break;
  }
  // single-char operators that may be followed by '=' to form augmented assignment
  static const std::unordered_map<char, TokenKind> singles{
      {'+', TokenKind::Plus}, {'-', TokenKind::Minus}, {'*', TokenKind::Star}, {'/', TokenKind::Slash},
      {'%', TokenKind::Percent}, {'&', TokenKind::Amp}, {'|', TokenKind::Pipe}, {'^', TokenKind::Caret},
      {'@', TokenKind::At}};
  const auto single = singles.find(chr);
  if (single != singles.end()) {
    if (at(1) == '=') { return makeTok(TokenKind::AugAssign, 2); }
    return makeTok(single->second, 1);
  }
  fail(state.src->name(), state.lineNo, static_cast<int>(idx + 1), std::string("unexpected character '") + chr + "'");
}

// NOLINTNEXTLINE(readability-function-size,readability-function-cognitive-complexity)
void Lexer::tokenizeSource(State& state) {
  bool continuation = false; // inside a logical line spanning physical lines
  while (readNextLine(state)) {
    if (!continuation) {
      size_t width = 0;
      size_t idx = 0;
      for (; idx < state.line.size(); ++idx) {
        if (state.line[idx] == ' ') { ++width; }
        else if (state.line[idx] == '\t') { width = (width / 8 + 1) * 8; }
        else { break; }
      }
      if (idx >= state.line.size() || state.line[idx] == '#') { continue; }
      emitIndentTokens(state, width);
      state.index = idx;
    }
    continuation = false;
    bool explicitJoin = false;
    while (state.index < state.line.size()) {
      const char chr = state.line[state.index];
      if (chr == ' ' || chr == '\t') { ++state.index; continue; }
      if (chr == '#') { break; }
      if (chr == '\\' && state.index + 1 == state.line.size()) { explicitJoin = true; break; }
      tokens_.push_back(scanOne(state));
    }
    if (explicitJoin || state.depth > 0) {
      continuation = true;
      continue;
    }
    Token newlineTok;
    newlineTok.kind = TokenKind::Newline; newlineTok.text = "\n"; newlineTok.file = state.src->name();
    newlineTok.line = state.lineNo; newlineTok.col = static_cast<int>(state.line.size() + 1);
    tokens_.push_back(std::move(newlineTok));
  }
  if (state.depth > 0) { fail(state.src->name(), state.lineNo, 1, "unexpected end of input inside brackets"); }
  while (state.indentStack.size() > 1) {
    state.indentStack.pop_back();
    Token ded; ded.kind = TokenKind::Dedent; ded.text = "<DEDENT>"; ded.file = state.src->name(); ded.line = state.lineNo + 1; ded.col = 1;
    tokens_.push_back(std::move(ded));
  }
}

void Lexer::buildAll() {
  if (finalized_) { return; }
  finalized_ = true;
  while (!stack_.empty()) {
    State state = std::move(stack_.back());
    stack_.pop_back();
    tokenizeSource(state);
  }
  Token eof; eof.kind = TokenKind::End; eof.text = "<EOF>"; eof.line = 0; eof.col = 1;
  tokens_.push_back(std::move(eof));
}

const Token& Lexer::peek(size_t lookahead) {
  if (!finalized_) { buildAll(); }
  if (pos_ + lookahead < tokens_.size()) {
    return tokens_[pos_ + lookahead];
  }
  return tokens_.back();
}

Token Lexer::next() {
  if (!finalized_) { buildAll(); }
  if (pos_ < tokens_.size()) {
    return tokens_[pos_++];
  }
  return tokens_.back();
}

std::vector<Token> Lexer::tokens() {
  if (!finalized_) { buildAll(); }
  return tokens_;
}

} // namespace gsc::lex
