/**
 * @file
 * @brief AST call expression declarations.
 */
#pragma once
#include <memory>
#include <string>
#include <vector>

#include "Expr.h"
#include "ast/Acceptable.h"

namespace gsc::ast {
    struct KeywordArg { std::string name; std::unique_ptr<Expr> value; };

    struct Call final : Expr, Acceptable<Call, NodeKind::Call> {
        std::unique_ptr<Expr> callee; // Name or Attribute (opset.Op)
        std::vector<std::unique_ptr<Expr>> args;      // positional
        std::vector<KeywordArg> keywords;             // named args
        explicit Call(std::unique_ptr<Expr> c) : Expr(NodeKind::Call), callee(std::move(c)) {}
    };

} // namespace gsc::ast
