/***
 * Name: gsc::schema::OpSchema
 * Purpose: Signature of an operator: formal inputs, outputs and attributes.
 * Theory of Operation:
 *   A formal's type string is either concrete ("tensor(int64)") or a type
 *   variable ("T"); a string without '(' is a type variable. Variadic
 *   formals repeat for the remaining arguments; heterogeneous variadics
 *   (Loop state, If outputs) never bind a type variable.
 */
#pragma once

#include "ir/AttrKind.h"
#include <string>
#include <vector>

namespace gsc::schema {

    enum class FormalOption { Single, Optional, Variadic };

    struct FormalParameter {
        std::string name;
        std::string typeStr;
        FormalOption option{FormalOption::Single};
        bool homogeneous{true};
    };

    struct AttributeSchema {
        std::string name;
        ir::AttrKind kind{ir::AttrKind::Undefined};
        bool required{false};
        bool hasDefault{false};
    };

    struct OpSchema {
        std::string domain;
        std::string name;
        int sinceVersion{1};
        std::vector<FormalParameter> inputs;
        std::vector<FormalParameter> outputs;
        std::vector<AttributeSchema> attributes;

        const AttributeSchema *findAttribute(const std::string &attrName) const {
            for (const auto &a : attributes) {
                if (a.name == attrName) { return &a; }
            }
            return nullptr;
        }
    };

    // A type string names a type variable unless it spells a concrete type.
    inline bool isTypeVariable(const std::string &typeStr) { return typeStr.find('(') == std::string::npos; }

} // namespace gsc::schema
