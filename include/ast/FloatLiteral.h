#pragma once

#include "ast/Literal.h"

namespace gsc::ast {

    using FloatLiteral = Literal<double, NodeKind::FloatLiteral>;

} // namespace gsc::ast

