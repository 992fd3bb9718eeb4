/***
 * Name: gsc::types annotations
 * Purpose: Turn evaluated annotation subscripts into types.
 * Theory of Operation:
 *   Annotations are evaluated as literal expressions; `T[...]` on a type
 *   object lands here. `FLOAT[2, "N", None]` yields a shaped tensor type,
 *   `List[int]` a parameterized generic. A subscript that does not make a
 *   meaningful type yields null so the caller can report it.
 */
#pragma once

#include "constant/PyValue.h"
#include "types/TypeInfo.h"
#include <vector>

namespace gsc::types {

    TypePtr parameterize(const TypeInfo &base, const std::vector<constant::PyValue> &items);

    // Elements of a tuple[...] return annotation, or the single annotation itself.
    std::vector<TypePtr> returnTypes(const TypePtr &annotation);

} // namespace gsc::types
