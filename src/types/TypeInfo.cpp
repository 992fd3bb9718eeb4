/***
 * Name: gsc::types::TypeInfo
 * Purpose: Construction, printing and classification of annotation types.
 */
#include "types/TypeInfo.h"
#include <sstream>
#include <utility>

namespace gsc::types {

    TypePtr TypeInfo::tensor(const ir::ElemType t, std::optional<std::vector<Dim>> shape) {
        auto info = std::make_shared<TypeInfo>();
        info->kind = TypeKind::Tensor;
        info->elemType = t;
        info->shape = std::move(shape);
        return info;
    }

    TypePtr TypeInfo::scalarType(const ScalarKind s) {
        auto info = std::make_shared<TypeInfo>();
        info->kind = TypeKind::Scalar;
        info->scalar = s;
        return info;
    }

    TypePtr TypeInfo::genericType(const GenericKind g, std::vector<TypePtr> args) {
        auto info = std::make_shared<TypeInfo>();
        info->kind = TypeKind::Generic;
        info->generic = g;
        info->args = std::move(args);
        return info;
    }

    const char *to_string(const ScalarKind s) {
        switch (s) {
            case ScalarKind::Int: return "int";
            case ScalarKind::Float: return "float";
            case ScalarKind::Str: return "str";
            case ScalarKind::Bool: return "bool";
        }
        return "?";
    }

    const char *to_string(const GenericKind g) {
        switch (g) {
            case GenericKind::List: return "List";
            case GenericKind::Sequence: return "Sequence";
            case GenericKind::Tuple: return "tuple";
            case GenericKind::Optional: return "Optional";
        }
        return "?";
    }

    std::string TypeInfo::toString() const {
        std::ostringstream os;
        switch (kind) {
            case TypeKind::Tensor:
                os << ir::to_string(elemType);
                if (shape) {
                    os << '[';
                    for (std::size_t i = 0; i < shape->size(); ++i) {
                        if (i != 0) { os << ','; }
                        const Dim &d = (*shape)[i];
                        if (d.value) { os << *d.value; }
                        else if (!d.symbol.empty()) { os << d.symbol; }
                        else { os << '?'; }
                    }
                    os << ']';
                }
                break;
            case TypeKind::Scalar:
                os << to_string(scalar);
                break;
            case TypeKind::Generic:
                os << to_string(generic);
                if (!args.empty()) {
                    os << '[';
                    for (std::size_t i = 0; i < args.size(); ++i) {
                        if (i != 0) { os << ','; }
                        os << args[i]->toString();
                    }
                    os << ']';
                }
                break;
        }
        return os.str();
    }

    bool TypeInfo::operator==(const TypeInfo &other) const {
        if (kind != other.kind) { return false; }
        switch (kind) {
            case TypeKind::Tensor: return elemType == other.elemType && shape == other.shape;
            case TypeKind::Scalar: return scalar == other.scalar;
            case TypeKind::Generic:
                if (generic != other.generic || args.size() != other.args.size()) { return false; }
                for (std::size_t i = 0; i < args.size(); ++i) {
                    if (!(*args[i] == *other.args[i])) { return false; }
                }
                return true;
        }
        return false;
    }

    TypePtr unwrapOptional(const TypePtr &t) {
        if (t && t->kind == TypeKind::Generic && t->generic == GenericKind::Optional && t->args.size() == 1) {
            return t->args.front();
        }
        return t;
    }

    ir::AttrKind toAttrKind(const TypeInfo &t) {
        if (t.kind == TypeKind::Scalar) {
            switch (t.scalar) {
                case ScalarKind::Int:
                case ScalarKind::Bool: return ir::AttrKind::Int;
                case ScalarKind::Float: return ir::AttrKind::Float;
                case ScalarKind::Str: return ir::AttrKind::String;
            }
        }
        if (t.kind == TypeKind::Generic && t.args.size() == 1) {
            const TypeInfo &arg = *t.args.front();
            if (t.generic == GenericKind::Optional) { return toAttrKind(arg); }
            if ((t.generic == GenericKind::List || t.generic == GenericKind::Sequence) && arg.kind == TypeKind::Scalar) {
                switch (arg.scalar) {
                    case ScalarKind::Int:
                    case ScalarKind::Bool: return ir::AttrKind::Ints;
                    case ScalarKind::Float: return ir::AttrKind::Floats;
                    case ScalarKind::Str: return ir::AttrKind::Strings;
                }
            }
        }
        return ir::AttrKind::Undefined;
    }

    bool isAttrType(const TypeInfo &t) { return toAttrKind(t) != ir::AttrKind::Undefined; }

    bool isValueType(const TypeInfo &t) {
        if (t.kind == TypeKind::Tensor) { return true; }
        return t.kind == TypeKind::Generic && t.generic == GenericKind::Optional && t.args.size() == 1 &&
               t.args.front()->kind == TypeKind::Tensor;
    }

    bool isValidType(const TypeInfo &t) { return isAttrType(t) || isValueType(t); }

    std::string onnxTypeString(const TypeInfo &t) {
        if (t.kind == TypeKind::Tensor && t.elemType != ir::ElemType::Undefined) {
            return ir::tensorTypeString(t.elemType);
        }
        if (t.kind == TypeKind::Generic && t.generic == GenericKind::Optional && t.args.size() == 1) {
            const std::string inner = onnxTypeString(*t.args.front());
            return inner.empty() ? inner : "optional(" + inner + ")";
        }
        return {};
    }

} // namespace gsc::types
