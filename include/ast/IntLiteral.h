#pragma once

#include <cstdint>
#include "ast/Literal.h"

namespace gsc::ast {

    using IntLiteral = Literal<std::int64_t, NodeKind::IntLiteral>;

} // namespace gsc::ast
