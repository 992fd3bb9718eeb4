/***
 * Name: gsc::autocast::staticCastInputs
 * Purpose: Compile-time specialization of castInputs.
 * Inputs:
 *   - schema: callee schema or null
 *   - args: lowered argument handles
 *   - emitCastLike: emits CastLike(operand, like) and returns its output name
 * Outputs: Input names for the node, one per argument
 * Theory of Operation:
 *   A non-constant argument's value name is its type evidence. A constant
 *   argument whose type variable is bound is cast to the bound sibling's
 *   type; every other argument is used unchanged.
 */
#pragma once

#include "schema/OpSchema.h"
#include "sema/Diagnostic.h"
#include "values/ValueHandle.h"
#include <functional>
#include <string>
#include <vector>

namespace gsc::autocast {

    using EmitCastLike = std::function<std::string(const std::string &operand, const std::string &like)>;

    std::vector<std::string> staticCastInputs(const schema::OpSchema *schema, const std::vector<values::ValueHandle> &args,
                                              const EmitCastLike &emitCastLike, const sema::Diagnostic &where);

} // namespace gsc::autocast
