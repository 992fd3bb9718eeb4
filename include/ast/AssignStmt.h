/**
 * @file
 * @brief AST assignment statement declarations.
 */
#pragma once

#include <memory>
#include <vector>

#include "Expr.h"
#include "Stmt.h"
#include "ast/Acceptable.h"

namespace gsc::ast {

    // targets holds one entry per '=' (a = b = v has two); each target is a
    // Name or a TupleLiteral of Names. annotation is set for `x: T = v`.
    struct AssignStmt final : Stmt, Acceptable<AssignStmt, NodeKind::AssignStmt> {
        std::vector<std::unique_ptr<Expr>> targets;
        std::unique_ptr<Expr> value;
        std::unique_ptr<Expr> annotation{};
        explicit AssignStmt(std::unique_ptr<Expr> v)
            : Stmt(NodeKind::AssignStmt), value(std::move(v)) {}
    };
} // namespace gsc::ast
