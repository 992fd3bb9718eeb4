/***
 * Name: gsc::autocast::dynamicCastInputs
 * Purpose: Literal promotion for interpreted calls.
 */
#include "autocast/DynamicCast.h"
#include "autocast/CastInputs.h"
#include "autocast/Promotion.h"
#include <optional>

namespace gsc::autocast {

    std::vector<RuntimeValue> dynamicCastInputs(const schema::OpSchema *schema, const std::vector<RuntimeValue> &args,
                                                const sema::Diagnostic &where) {
        const auto getTypeInfo = [](const RuntimeValue &x) -> std::optional<ir::ElemType> {
            if (const auto *t = std::get_if<runtime::Tensor>(&x)) { return t->elemType(); }
            return std::nullopt;
        };
        const auto cast = [&where](const RuntimeValue &x, const std::optional<ir::ElemType> &type) -> RuntimeValue {
            const auto *literal = std::get_if<constant::PyValue>(&x);
            if (literal == nullptr || !isPromotable(*literal)) { return x; }
            return runtime::Tensor(toTensorConst(*literal, type, where));
        };
        return castInputs<RuntimeValue>(getTypeInfo, cast, schema, args, where);
    }

} // namespace gsc::autocast
