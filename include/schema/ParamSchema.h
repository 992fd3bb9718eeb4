/***
 * Name: gsc::schema parameter separation
 * Purpose: Split call arguments into operator inputs and attributes.
 * Inputs:
 *   - params: callee parameters, inputs then attributes, in declaration order
 *   - positional / keywords: the call's arguments
 * Outputs: SeparatedArgs (inputs in order, attributes in parameter order)
 * Theory of Operation:
 *   Positional arguments fill parameters in order; a variadic input absorbs
 *   every remaining positional argument. A parameter not given positionally
 *   is looked up among the keywords. Defaults are never filled in, so an
 *   omitted attribute stays absent from the node. Unknown keywords, too many
 *   positional arguments and missing required parameters raise ArityError.
 */
#pragma once

#include "gsc/exceptions/arity_error.h"
#include "schema/OpSchema.h"
#include "sema/Diagnostic.h"
#include <string>
#include <utility>
#include <vector>

namespace gsc::schema {

    struct ParamSchema {
        std::string name;
        bool isInput{true};
        bool isVariadicInput{false};
        bool required{false};
    };

    std::vector<ParamSchema> paramSchemasOf(const OpSchema &schema);

    template <typename Arg>
    struct SeparatedArgs {
        std::vector<Arg> inputs;
        std::vector<std::pair<std::string, Arg>> attributes;
    };

    template <typename Arg>
    SeparatedArgs<Arg> separateInputsAndAttributes(const std::vector<ParamSchema> &params,
                                                   const std::vector<Arg> &positional,
                                                   const std::vector<std::pair<std::string, Arg>> &keywords,
                                                   const sema::Diagnostic &where) {
        for (const auto& [key, value] : keywords) {
            bool known = false;
            for (const auto &p : params) {
                if (p.name == key) {
                    known = true;
                    break;
                }
            }
            if (!known) { throw exceptions::ArityError("unexpected keyword argument '" + key + "'", where); }
        }
        const auto findKeyword = [&keywords](const std::string &name) -> const Arg* {
            for (const auto &kw : keywords) {
                if (kw.first == name) { return &kw.second; }
            }
            return nullptr;
        };
        SeparatedArgs<Arg> out;
        bool absorbed = false;
        for (std::size_t i = 0; i < params.size(); ++i) {
            const ParamSchema &p = params[i];
            if (p.isVariadicInput) {
                for (std::size_t k = i; k < positional.size(); ++k) { out.inputs.push_back(positional[k]); }
                absorbed = true;
                continue;
            }
            if (!absorbed && i < positional.size()) {
                if (p.isInput) { out.inputs.push_back(positional[i]); }
                else { out.attributes.emplace_back(p.name, positional[i]); }
            } else if (const Arg *kw = findKeyword(p.name)) {
                if (p.isInput) { out.inputs.push_back(*kw); }
                else { out.attributes.emplace_back(p.name, *kw); }
            } else if (p.required) {
                throw exceptions::ArityError(std::string("required ") + (p.isInput ? "input" : "attribute") + " '" + p.name +
                                                 "' was not provided",
                                             where);
            }
        }
        if (!absorbed && positional.size() > params.size()) {
            throw exceptions::ArityError("too many positional arguments: " + std::to_string(positional.size()) +
                                             " given, at most " + std::to_string(params.size()) + " accepted",
                                         where);
        }
        return out;
    }

} // namespace gsc::schema
