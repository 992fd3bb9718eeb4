/***
 * Name: gsc::autocast promotion
 * Purpose: Literal-to-tensor promotion rules shared by compiled and
 *          interpreted argument handling.
 * Theory of Operation:
 *   bool -> BOOL, int -> INT64, float -> FLOAT, str -> STRING, each rank 0.
 *   A list is rank 1 with the promoted type of its first element; every
 *   element must have that element's kind. Empty lists have no type.
 */
#pragma once

#include "constant/PyValue.h"
#include "ir/Attr.h"
#include "ir/ElemType.h"
#include "sema/Diagnostic.h"
#include <optional>

namespace gsc::autocast {

    // bool/int/float, or a list whose first element is one (empty lists count,
    // so that they are reported rather than passed through).
    bool isPromotable(const constant::PyValue &v);

    // Throws EmptyListError, TypeMismatchError.
    ir::ElemType promotedElemType(const constant::PyValue &v, const sema::Diagnostic &where);

    // Tensor payload of a literal, converted to target when given.
    ir::TensorConst toTensorConst(const constant::PyValue &v, std::optional<ir::ElemType> target,
                                  const sema::Diagnostic &where);

} // namespace gsc::autocast
