/***
 * Name: gsc::autocast::staticCastInputs
 * Purpose: CastLike insertion for constant operands during translation.
 */
#include "autocast/StaticCast.h"
#include "autocast/CastInputs.h"
#include <optional>

namespace gsc::autocast {

    std::vector<std::string> staticCastInputs(const schema::OpSchema *schema, const std::vector<values::ValueHandle> &args,
                                              const EmitCastLike &emitCastLike, const sema::Diagnostic &where) {
        const auto getTypeInfo = [](const values::ValueHandle &x) -> std::optional<std::string> {
            if (x.isConst || x.names.empty() || x.name().empty()) { return std::nullopt; }
            return x.name();
        };
        const auto cast = [&emitCastLike](const values::ValueHandle &x, const std::optional<std::string> &like) -> std::string {
            const std::string name = x.names.empty() ? std::string{} : x.name();
            if (x.isConst && like && !name.empty()) { return emitCastLike(name, *like); }
            return name;
        };
        return castInputs<values::ValueHandle>(getTypeInfo, cast, schema, args, where);
    }

} // namespace gsc::autocast
