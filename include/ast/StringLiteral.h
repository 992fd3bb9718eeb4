/***
 * Name: gsc::ast::StringLiteral
 * Purpose: String literal node.
 */
#pragma once

#include <string>
#include "ast/Literal.h"

namespace gsc::ast {
    using StringLiteral = Literal<std::string, NodeKind::StringLiteral>;
}

