#pragma once

namespace gsc::ast {

// Whether a name/subscript/attribute is read or is an assignment target.
enum class ExprContext {
    Load,
    Store
};

} // namespace gsc::ast
