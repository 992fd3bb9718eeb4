#pragma once

#include <memory>
#include <string>
#include "Expr.h"
#include "Stmt.h"
#include "ast/HasBodyPair.h"
#include "ast/Acceptable.h"

namespace gsc::ast {
    // thenBody is the loop body, elseBody the (unsupported) loop else-clause.
    struct ForStmt final : Stmt, HasBodyPair<Stmt>, Acceptable<ForStmt, NodeKind::ForStmt> {
        std::unique_ptr<Expr> target;   // loop variable (Name)
        std::unique_ptr<Expr> iterable; // range(...) call
        ForStmt(std::unique_ptr<Expr> t, std::unique_ptr<Expr> it)
            : Stmt(NodeKind::ForStmt), target(std::move(t)), iterable(std::move(it)) {}
    };
}
