/***
 * Name: gsc::values::Binding
 * Purpose: What a script name denotes during translation.
 * Theory of Operation:
 *   OpRef names an operator of an opset (`Relu = opset18.Relu`). AttrRef is
 *   an attribute parameter of the enclosing function; it is promoted to a
 *   Constant node on first use as a value. Dynamic is a graph value with a
 *   provenance tag. Function is a translated script function or nested
 *   function together with the outer values it captured when defined.
 *   Constant is a module-level literal.
 */
#pragma once

#include "constant/PyValue.h"
#include "sema/Provenance.h"
#include "types/TypeInfo.h"
#include "values/Opset.h"
#include <map>
#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace gsc::ir {
    struct Function;
}

namespace gsc::values {

    enum class BindingKind { OpRef, AttrRef, Dynamic, Function, Constant };
    enum class DynamicKind { Input, LoopCarried, Intermediate, Constant };

    const char *to_string(BindingKind k);
    const char *to_string(DynamicKind k);

    struct FunctionRef;

    struct Binding {
        BindingKind kind{BindingKind::Constant};
        // OpRef: operator name; AttrRef: attribute parameter name; Dynamic: value name
        std::string name;
        DynamicKind dynamicKind{DynamicKind::Intermediate};
        types::TypePtr type{};
        Opset opset{};
        std::shared_ptr<const FunctionRef> function{};
        constant::PyValue constant{};
        sema::Provenance info{};

        static Binding opRef(Opset opset, std::string opName, sema::Provenance info = {});
        static Binding attrRef(std::string attrName, types::TypePtr type, sema::Provenance info = {});
        static Binding dynamic(std::string valueName, DynamicKind kind, sema::Provenance info = {},
                               types::TypePtr type = nullptr);
        static Binding functionRef(std::shared_ptr<const FunctionRef> fn, sema::Provenance info = {});
        static Binding literal(constant::PyValue value, sema::Provenance info = {});
        // Op literals become OpRef bindings, everything else a Constant binding.
        static Binding fromValue(constant::PyValue value, sema::Provenance info = {});

        std::string describe() const;
    };

    struct FunctionRef {
        std::shared_ptr<const ir::Function> function;
        // (outer name, binding at definition time); empty for top-level functions
        std::vector<std::pair<std::string, Binding>> captures;
        bool nested{false};
    };

    // Same denoted value: equal value names, attribute names, operators,
    // literals or function objects; provenance is ignored.
    bool sameValue(const Binding &a, const Binding &b);

    using GlobalEnv = std::map<std::string, Binding>;

} // namespace gsc::values
