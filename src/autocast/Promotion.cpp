/***
 * Name: gsc::autocast promotion
 * Purpose: Element type selection and tensor construction for literals.
 */
#include "autocast/Promotion.h"
#include "gsc/exceptions/empty_list_error.h"
#include "gsc/exceptions/type_mismatch_error.h"
#include <string>

namespace gsc::autocast {

    using constant::PyValue;
    using constant::ValueKind;
    using exceptions::EmptyListError;
    using exceptions::TypeMismatchError;

    namespace {

        ir::ElemType scalarElemType(const PyValue &v, const sema::Diagnostic &where) {
            switch (v.kind) {
                case ValueKind::Bool: return ir::ElemType::Bool;
                case ValueKind::Int: return ir::ElemType::Int64;
                case ValueKind::Float: return ir::ElemType::Float;
                case ValueKind::Str: return ir::ElemType::String;
                default:
                    throw TypeMismatchError(std::string("cannot convert a value of type '") + constant::to_string(v.kind) +
                                                "' to a tensor",
                                            where);
            }
        }

        bool isFloating(const ir::ElemType t) {
            return t == ir::ElemType::Float || t == ir::ElemType::Double || t == ir::ElemType::Float16 ||
                   t == ir::ElemType::Bfloat16;
        }

        void appendElement(ir::TensorConst &out, const PyValue &v, const sema::Diagnostic &where) {
            if (out.elemType == ir::ElemType::String) {
                if (v.kind != ValueKind::Str) { throw TypeMismatchError("cannot store a number in a string tensor", where); }
                out.strings.push_back(v.s);
                return;
            }
            if (!v.isNumber()) {
                throw TypeMismatchError(std::string("cannot store a value of type '") + constant::to_string(v.kind) + "' in a " +
                                            ir::elemTypeTag(out.elemType) + " tensor",
                                        where);
            }
            const double asDouble = v.kind == ValueKind::Float ? v.f : static_cast<double>(v.kind == ValueKind::Bool ? v.b : v.i);
            if (isFloating(out.elemType)) {
                out.floats.push_back(asDouble);
            } else if (out.elemType == ir::ElemType::Bool) {
                out.ints.push_back(asDouble != 0.0 ? 1 : 0);
            } else {
                out.ints.push_back(v.kind == ValueKind::Float ? static_cast<std::int64_t>(v.f)
                                                              : (v.kind == ValueKind::Bool ? (v.b ? 1 : 0) : v.i));
            }
        }

    } // namespace

    bool isPromotable(const PyValue &v) {
        if (v.kind == ValueKind::Bool || v.kind == ValueKind::Int || v.kind == ValueKind::Float) { return true; }
        if (v.kind == ValueKind::List) { return v.items.empty() || isPromotable(v.items.front()); }
        return false;
    }

    ir::ElemType promotedElemType(const PyValue &v, const sema::Diagnostic &where) {
        if (v.kind != ValueKind::List) { return scalarElemType(v, where); }
        if (v.items.empty()) { throw EmptyListError("cannot determine the element type of an empty list", where); }
        const ValueKind first = v.items.front().kind;
        for (const auto &item : v.items) {
            if (item.kind != first) {
                throw TypeMismatchError("cannot convert a list with elements of different types to a tensor", where);
            }
        }
        return scalarElemType(v.items.front(), where);
    }

    ir::TensorConst toTensorConst(const PyValue &v, const std::optional<ir::ElemType> target,
                                  const sema::Diagnostic &where) {
        const ir::ElemType natural = promotedElemType(v, where);
        ir::TensorConst out;
        out.elemType = target.value_or(natural);
        if (v.kind == ValueKind::List) {
            out.dims.push_back(static_cast<std::int64_t>(v.items.size()));
            for (const auto &item : v.items) { appendElement(out, item, where); }
        } else {
            appendElement(out, v, where);
        }
        return out;
    }

} // namespace gsc::autocast
