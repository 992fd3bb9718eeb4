/***
 * Name: gsc::ast::PassStmt
 * Purpose: No-op statement (parsed, rejected during translation).
 */
#pragma once

#include "Stmt.h"
#include "ast/Acceptable.h"

namespace gsc::ast {
    struct PassStmt final : Stmt, Acceptable<PassStmt, NodeKind::PassStmt> {
        PassStmt() : Stmt(NodeKind::PassStmt) {}
    };
}

