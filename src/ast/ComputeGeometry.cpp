/**
 * @file
 * @brief AST geometry computation implementation.
 */
/***
 * Name: gsc::ast::ComputeGeometry
 * Purpose: Traverse AST and compute node count and max depth.
 */
#include "ast/GeometrySummary.h"
#include "ast/GeometryVisitor.h"

namespace gsc::ast {

GeometrySummary ComputeGeometry(const Module& module) {
  GeometryVisitor visitor;
  module.accept(visitor);
  return GeometrySummary{visitor.nodes, visitor.maxDepth};
}

} // namespace gsc::ast
