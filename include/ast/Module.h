/**
 * @file
 * @brief AST module node declarations.
 */
#pragma once

#include "ast/Node.h"
#include "ast/HasBody.h"
#include "ast/Stmt.h"
#include "ast/Acceptable.h"

namespace gsc::ast {
    // Top-level statements in source order: imports, constant assignments and
    // DefStmt-wrapped function definitions.
    struct Module final : Node, HasBody<Stmt>, Acceptable<Module, NodeKind::Module> {
        Module() : Node(NodeKind::Module) {}
    };
} // namespace gsc::ast
