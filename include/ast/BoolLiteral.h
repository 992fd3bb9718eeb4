#pragma once

#include "ast/Literal.h"

namespace gsc::ast {

    using BoolLiteral = Literal<bool, NodeKind::BoolLiteral>;

} // namespace gsc::ast
