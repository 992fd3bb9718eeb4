/**
 * @file
 * @brief AST expression base declarations.
 */
#pragma once

#include "Node.h"

namespace gsc::ast {
    struct Expr : Node {
        using Node::Node;
    };
} // namespace gsc::ast
