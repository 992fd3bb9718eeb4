/***
 * Name: gsc::types annotations
 * Purpose: Shape and generic-argument application for annotation types.
 */
#include "types/Annotations.h"
#include <utility>

namespace gsc::types {

    using constant::PyValue;
    using constant::ValueKind;

    TypePtr parameterize(const TypeInfo &base, const std::vector<PyValue> &items) {
        if (base.kind == TypeKind::Tensor) {
            if (base.shape) { return nullptr; }
            std::vector<Dim> dims;
            for (const auto &item : items) {
                Dim d;
                if (item.kind == ValueKind::Int) { d.value = item.i; }
                else if (item.kind == ValueKind::Str) { d.symbol = item.s; }
                else if (item.kind != ValueKind::None) { return nullptr; }
                dims.push_back(std::move(d));
            }
            return TypeInfo::tensor(base.elemType, std::move(dims));
        }
        if (base.kind == TypeKind::Generic) {
            if (!base.args.empty() || items.empty()) { return nullptr; }
            if (base.generic != GenericKind::Tuple && items.size() != 1) { return nullptr; }
            std::vector<TypePtr> args;
            for (const auto &item : items) {
                if (item.kind != ValueKind::Type || !item.type) { return nullptr; }
                args.push_back(item.type);
            }
            return TypeInfo::genericType(base.generic, std::move(args));
        }
        return nullptr;
    }

    std::vector<TypePtr> returnTypes(const TypePtr &annotation) {
        if (annotation && annotation->kind == TypeKind::Generic && annotation->generic == GenericKind::Tuple) {
            return annotation->args;
        }
        return {annotation};
    }

} // namespace gsc::types
