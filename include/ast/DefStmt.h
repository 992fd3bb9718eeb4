#pragma once

#include <memory>
#include "ast/Stmt.h"
#include "ast/FunctionDef.h"
#include "ast/Acceptable.h"

namespace gsc::ast {

// Statement wrapper for a function definition at module level or nested in a body.
struct DefStmt final : Stmt, Acceptable<DefStmt, NodeKind::DefStmt> {
  std::unique_ptr<FunctionDef> func;
  explicit DefStmt(std::unique_ptr<FunctionDef> f)
      : Stmt(NodeKind::DefStmt), func(std::move(f)) {}
};

} // namespace gsc::ast
