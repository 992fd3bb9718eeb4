/**
 * @file
 * @brief AST list literal declarations.
 */
/***
 * Name: gsc::ast::ListLiteral
 * Purpose: Represent a list literal; element values may be folded to constants.
 */
#pragma once

#include <memory>
#include <vector>
#include "ast/Expr.h"
#include "ast/Acceptable.h"

namespace gsc::ast {

struct ListLiteral final : Expr, Acceptable<ListLiteral, NodeKind::ListLiteral> {
  std::vector<std::unique_ptr<Expr>> elements;
  ListLiteral() : Expr(NodeKind::ListLiteral) {}
};

} // namespace gsc::ast
