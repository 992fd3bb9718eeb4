/***
 * Name: gsc::schema::paramSchemasOf
 * Purpose: Flatten an operator schema into the ordered parameter list.
 */
#include "schema/ParamSchema.h"

namespace gsc::schema {

    std::vector<ParamSchema> paramSchemasOf(const OpSchema &schema) {
        std::vector<ParamSchema> params;
        for (const auto &in : schema.inputs) {
            ParamSchema p;
            p.name = in.name;
            p.isInput = true;
            p.isVariadicInput = in.option == FormalOption::Variadic;
            p.required = in.option == FormalOption::Single;
            params.push_back(std::move(p));
        }
        for (const auto &a : schema.attributes) {
            ParamSchema p;
            p.name = a.name;
            p.isInput = false;
            p.required = a.required;
            params.push_back(std::move(p));
        }
        return params;
    }

} // namespace gsc::schema
