/**
 * Name: gsc::lex::to_string(TokenKind)
 * Purpose: Printable token kind names for diagnostics and tests.
 */
#include "lexer/TokenKind.h"

namespace gsc::lex {
    const char *to_string(const TokenKind k) {
        using enum gsc::lex::TokenKind;
        switch (k) {
            case End: return "End";
            case Newline: return "Newline";
            case Indent: return "Indent";
            case Dedent: return "Dedent";
            case Def: return "Def";
            case Return: return "Return";
            case If: return "If";
            case Else: return "Else";
            case Elif: return "Elif";
            case While: return "While";
            case For: return "For";
            case In: return "In";
            case Break: return "Break";
            case Continue: return "Continue";
            case Pass: return "Pass";
            case Import: return "Import";
            case From: return "From";
            case As: return "As";
            case And: return "And";
            case Or: return "Or";
            case Not: return "Not";
            case Is: return "Is";
            case Reserved: return "Reserved";
            case At: return "At";
            case Arrow: return "Arrow";
            case Colon: return "Colon";
            case Comma: return "Comma";
            case Dot: return "Dot";
            case Equal: return "Equal";
            case AugAssign: return "AugAssign";
            case Plus: return "Plus";
            case Minus: return "Minus";
            case Star: return "Star";
            case StarStar: return "StarStar";
            case Slash: return "Slash";
            case SlashSlash: return "SlashSlash";
            case Percent: return "Percent";
            case Amp: return "Amp";
            case Pipe: return "Pipe";
            case Caret: return "Caret";
            case Tilde: return "Tilde";
            case LShift: return "LShift";
            case RShift: return "RShift";
            case EqEq: return "EqEq";
            case NotEq: return "NotEq";
            case Lt: return "Lt";
            case Le: return "Le";
            case Gt: return "Gt";
            case Ge: return "Ge";
            case LParen: return "LParen";
            case RParen: return "RParen";
            case LBracket: return "LBracket";
            case RBracket: return "RBracket";
            case LBrace: return "LBrace";
            case RBrace: return "RBrace";
            case Ident: return "Ident";
            case Int: return "Int";
            case Float: return "Float";
            case String: return "String";
            case BoolLit: return "BoolLit";
            case NoneLit: return "NoneLit";
            case Ellipsis: return "Ellipsis";
        }
        return "Unknown";
    }
} // namespace gsc::lex
