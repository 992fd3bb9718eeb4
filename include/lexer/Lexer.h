/**
 * Name: gsc::lex::Lexer
 * Purpose: Tokenize a stack of script sources (LIFO) into one token stream.
 * Theory of Operation:
 *   Sources are tokenized eagerly on first access. Each physical line is
 *   split into tokens; indentation changes at the start of a logical line
 *   produce Indent/Dedent, and the end of a logical line produces Newline.
 *   Lines inside open brackets, lines ending in a backslash and triple-quoted
 *   strings join into one logical line. Blank and comment-only lines emit
 *   nothing. Malformed input raises exceptions::ParseError.
 */
#pragma once

#include <cstddef>
#include <memory>
#include <string>
#include <vector>
#include "lexer/ITokenStream.h"
#include "lexer/InputSource.h"

namespace gsc::lex {

class Lexer : public ITokenStream {
public:
    Lexer() = default;

    void pushFile(const std::string& path);

    void pushString(const std::string& text, const std::string& name);

    // ITokenStream
    const Token& peek(size_t lookahead = 0) override;

    Token next() override;

    std::vector<Token> tokens();

private:
    bool finalized_{false};
    std::vector<Token> tokens_{};
    size_t pos_{0};

    struct State {
        std::unique_ptr<InputSource> src;
        std::string line;
        size_t index{0};
        int lineNo{0};
        std::vector<size_t> indentStack{0};
        int depth{0}; // open bracket nesting
    };

    std::vector<State> stack_{}; // LIFO of inputs

    static bool readNextLine(State& state);
    void emitIndentTokens(State& state, size_t width);
    void tokenizeSource(State& state);
    Token scanOne(State& state);
    Token scanString(State& state, size_t start, size_t quotePos);
    Token scanNumber(State& state);

    void buildAll(); // build tokens_ from all inputs (LIFO)
};

} // namespace gsc::lex
