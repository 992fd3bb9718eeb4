/***
 * Name: gsc::autocast::dynamicCastInputs
 * Purpose: Interpreted-mode specialization of castInputs.
 * Theory of Operation:
 *   A runtime tensor contributes its element type. A promotable literal is
 *   turned into a tensor of the bound type, or of its own promoted type
 *   when unbound; every other argument passes through unchanged. Decisions
 *   match the compiled path: Add(x, 1) with a DOUBLE x yields a DOUBLE 1.
 */
#pragma once

#include "constant/PyValue.h"
#include "runtime/Tensor.h"
#include "schema/OpSchema.h"
#include "sema/Diagnostic.h"
#include <variant>
#include <vector>

namespace gsc::autocast {

    using RuntimeValue = std::variant<runtime::Tensor, constant::PyValue>;

    std::vector<RuntimeValue> dynamicCastInputs(const schema::OpSchema *schema, const std::vector<RuntimeValue> &args,
                                                const sema::Diagnostic &where = {});

} // namespace gsc::autocast
