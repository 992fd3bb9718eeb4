/**
 * @file
 * @brief AST slice (lower:upper:step) declarations.
 */
/***
 * Name: gsc::ast::Slice
 * Purpose: One ranged specifier inside a subscript; each bound is optional.
 */
#pragma once

#include <memory>
#include "ast/Expr.h"
#include "ast/Acceptable.h"

namespace gsc::ast {

struct Slice final : Expr, Acceptable<Slice, NodeKind::Slice> {
  std::unique_ptr<Expr> lower;
  std::unique_ptr<Expr> upper;
  std::unique_ptr<Expr> step;
  Slice() : Expr(NodeKind::Slice) {}
};

} // namespace gsc::ast
