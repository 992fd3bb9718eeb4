/***
 * Name: gsc::ast::ContinueStmt
 * Purpose: Loop continue statement (parsed, rejected during translation).
 */
#pragma once

#include "Stmt.h"
#include "ast/Acceptable.h"

namespace gsc::ast {
    struct ContinueStmt final : Stmt, Acceptable<ContinueStmt, NodeKind::ContinueStmt> {
        ContinueStmt() : Stmt(NodeKind::ContinueStmt) {}
    };
}

