/***
 * Name: gsc::autocast::castInputs
 * Purpose: Schema-driven promotion and casting of call arguments.
 * Inputs:
 *   - getTypeInfo: Arg -> std::optional<TypeInfo>, the type an argument
 *     contributes to its formal's type variable (nullopt: contributes none)
 *   - cast: (Arg, std::optional<TypeInfo>) -> Result
 *   - schema: callee schema, or null for an unknown operator
 *   - args: actual input arguments in order
 * Outputs: One Result per argument, in order
 * Theory of Operation:
 *   Two passes. The first pairs each argument with its formal (a trailing
 *   variadic formal repeats) and binds the formal's type variable to the
 *   first argument whose type is known. Heterogeneous variadic arguments
 *   take part in no binding. The second pass casts every argument with the
 *   binding of its type variable, so in Add(1, X) the literal follows X.
 */
#pragma once

#include "gsc/exceptions/arity_error.h"
#include "schema/OpSchema.h"
#include "sema/Diagnostic.h"
#include <map>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace gsc::autocast {

    template <typename Arg, typename GetTypeInfo, typename Cast>
    auto castInputs(GetTypeInfo &&getTypeInfo, Cast &&cast, const schema::OpSchema *schema,
                    const std::vector<Arg> &args, const sema::Diagnostic &where) {
        using TypeInfoT = typename decltype(getTypeInfo(std::declval<const Arg&>()))::value_type;
        using Result = decltype(cast(std::declval<const Arg&>(), std::optional<TypeInfoT>{}));

        std::vector<Result> out;
        out.reserve(args.size());
        if (schema == nullptr) {
            for (const auto &x : args) { out.push_back(cast(x, std::nullopt)); }
            return out;
        }

        const auto &formals = schema->inputs;
        std::map<std::string, TypeInfoT> bindings;
        std::vector<std::optional<std::string>> typeVars;
        typeVars.reserve(args.size());
        for (std::size_t i = 0; i < args.size(); ++i) {
            const schema::FormalParameter *expected = nullptr;
            if (i < formals.size()) {
                expected = &formals[i];
            } else if (!formals.empty() && formals.back().option == schema::FormalOption::Variadic) {
                expected = &formals.back();
            } else {
                throw exceptions::ArityError("Number of actual parameters " + std::to_string(args.size()) +
                                                 " exceeds number of formal parameters " + std::to_string(formals.size()),
                                             where);
            }
            if (expected->option == schema::FormalOption::Variadic && !expected->homogeneous) {
                typeVars.emplace_back(std::nullopt);
                continue;
            }
            const std::string &typeVar = expected->typeStr;
            if (schema::isTypeVariable(typeVar) && bindings.find(typeVar) == bindings.end()) {
                if (auto info = getTypeInfo(args[i])) { bindings.emplace(typeVar, std::move(*info)); }
            }
            typeVars.emplace_back(typeVar);
        }

        for (std::size_t i = 0; i < args.size(); ++i) {
            std::optional<TypeInfoT> binding;
            if (typeVars[i]) {
                const auto it = bindings.find(*typeVars[i]);
                if (it != bindings.end()) { binding = it->second; }
            }
            out.push_back(cast(args[i], binding));
        }
        return out;
    }

} // namespace gsc::autocast
