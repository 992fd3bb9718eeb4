/***
 * Name: gsc::values::Binding
 * Purpose: Binding constructors, descriptions and value identity.
 */
#include "values/Binding.h"
#include "ir/Function.h"

namespace gsc::values {

    const char *to_string(const BindingKind k) {
        switch (k) {
            case BindingKind::OpRef: return "op";
            case BindingKind::AttrRef: return "attribute";
            case BindingKind::Dynamic: return "value";
            case BindingKind::Function: return "function";
            case BindingKind::Constant: return "constant";
        }
        return "?";
    }

    const char *to_string(const DynamicKind k) {
        switch (k) {
            case DynamicKind::Input: return "input";
            case DynamicKind::LoopCarried: return "loop-carried";
            case DynamicKind::Intermediate: return "intermediate";
            case DynamicKind::Constant: return "constant";
        }
        return "?";
    }

    Binding Binding::opRef(Opset opset, std::string opName, sema::Provenance info) {
        Binding b;
        b.kind = BindingKind::OpRef;
        b.opset = std::move(opset);
        b.name = std::move(opName);
        b.info = std::move(info);
        return b;
    }

    Binding Binding::attrRef(std::string attrName, types::TypePtr type, sema::Provenance info) {
        Binding b;
        b.kind = BindingKind::AttrRef;
        b.name = std::move(attrName);
        b.type = std::move(type);
        b.info = std::move(info);
        return b;
    }

    Binding Binding::dynamic(std::string valueName, const DynamicKind kind, sema::Provenance info, types::TypePtr type) {
        Binding b;
        b.kind = BindingKind::Dynamic;
        b.name = std::move(valueName);
        b.dynamicKind = kind;
        b.info = std::move(info);
        b.type = std::move(type);
        return b;
    }

    Binding Binding::functionRef(std::shared_ptr<const FunctionRef> fn, sema::Provenance info) {
        Binding b;
        b.kind = BindingKind::Function;
        if (fn && fn->function) { b.name = fn->function->name; }
        b.function = std::move(fn);
        b.info = std::move(info);
        return b;
    }

    Binding Binding::literal(constant::PyValue value, sema::Provenance info) {
        Binding b;
        b.kind = BindingKind::Constant;
        b.constant = std::move(value);
        b.info = std::move(info);
        return b;
    }

    Binding Binding::fromValue(constant::PyValue value, sema::Provenance info) {
        if (value.kind == constant::ValueKind::Op) {
            return opRef(value.opset, value.s, std::move(info));
        }
        return literal(std::move(value), std::move(info));
    }

    std::string Binding::describe() const {
        switch (kind) {
            case BindingKind::OpRef: return "op " + opset.str() + "." + name;
            case BindingKind::AttrRef: return "attribute parameter '" + name + "'";
            case BindingKind::Dynamic: return std::string(to_string(dynamicKind)) + " value '" + name + "'";
            case BindingKind::Function: return "function '" + name + "'";
            case BindingKind::Constant: return "constant " + constant.repr();
        }
        return "?";
    }

    bool sameValue(const Binding &a, const Binding &b) {
        if (a.kind != b.kind) { return false; }
        switch (a.kind) {
            case BindingKind::OpRef: return a.opset == b.opset && a.name == b.name;
            case BindingKind::AttrRef:
            case BindingKind::Dynamic: return a.name == b.name;
            case BindingKind::Function:
                return a.function == b.function ||
                       (a.function && b.function && a.function->function == b.function->function);
            case BindingKind::Constant: return a.constant == b.constant;
        }
        return false;
    }

} // namespace gsc::values
