/**
 * Name: gsc::lex::TokenKind
 * Purpose: Token kinds for the script lexer.
 */
#pragma once

namespace gsc::lex {

enum class TokenKind {
    End, // EOF
    Newline, // logical end of line
    Indent, // indentation increase
    Dedent, // indentation decrease

    Def, // def
    Return, // return
    If, // if
    Else, // else
    Elif, // elif
    While, // while
    For, // for
    In, // in
    Break, // break
    Continue, // continue
    Pass, // pass
    Import, // import
    From, // from
    As, // as
    And, // and
    Or, // or
    Not, // not
    Is, // is
    Reserved, // keyword outside the accepted subset (class, try, with, lambda, ...)

    At, // @ (decorator or matrix multiply)
    Arrow, // ->
    Colon, // :
    Comma, // ,
    Dot, // .
    Equal, // =
    AugAssign, // +=, -=, *=, ...
    Plus, // +
    Minus, // -
    Star, // *
    StarStar, // **
    Slash, // /
    SlashSlash, // //
    Percent, // %
    Amp, // &
    Pipe, // |
    Caret, // ^
    Tilde, // ~
    LShift, // <<
    RShift, // >>
    EqEq, // ==
    NotEq, // !=
    Lt, // <
    Le, // <=
    Gt, // >
    Ge, // >=
    LParen, // (
    RParen, // )
    LBracket, // [
    RBracket, // ]
    LBrace, // {
    RBrace, // }

    Ident, // identifier
    Int, // integer literal
    Float, // float literal
    String, // string literal (raw text including quotes/prefix)
    BoolLit, // True/False
    NoneLit, // None
    Ellipsis // ...
};

const char* to_string(TokenKind k);

} // namespace gsc::lex
