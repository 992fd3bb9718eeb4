/***
 * Name: gsc::types::TypeInfo
 * Purpose: Describe the type objects a script annotation can name.
 * Theory of Operation:
 *   Tensor types carry an element type and an optional shape (absent means
 *   unranked). Scalar types are the Python builtins int/float/str/bool used
 *   for attribute parameters. Generic types are the parameterizable
 *   containers List/Sequence/Tuple/Optional; an unparameterized generic has
 *   no args. TypeInfo values are immutable and shared by pointer.
 */
#pragma once

#include "ir/AttrKind.h"
#include "ir/ElemType.h"
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace gsc::types {

    enum class TypeKind { Tensor, Scalar, Generic };
    enum class ScalarKind { Int, Float, Str, Bool };
    enum class GenericKind { List, Sequence, Tuple, Optional };

    // One dimension of a tensor shape: a fixed size, a symbolic name, or unknown.
    struct Dim {
        std::optional<std::int64_t> value;
        std::string symbol;

        bool operator==(const Dim &other) const { return value == other.value && symbol == other.symbol; }
    };

    struct TypeInfo;
    using TypePtr = std::shared_ptr<const TypeInfo>;

    struct TypeInfo {
        TypeKind kind{TypeKind::Tensor};
        ir::ElemType elemType{ir::ElemType::Undefined};
        std::optional<std::vector<Dim>> shape;
        ScalarKind scalar{ScalarKind::Int};
        GenericKind generic{GenericKind::List};
        std::vector<TypePtr> args;

        static TypePtr tensor(ir::ElemType t, std::optional<std::vector<Dim>> shape = std::nullopt);
        static TypePtr scalarType(ScalarKind s);
        static TypePtr genericType(GenericKind g, std::vector<TypePtr> args = {});

        // Source-like spelling: FLOAT[N,3], int, List[int], tuple[FLOAT,INT64]
        std::string toString() const;
        bool operator==(const TypeInfo &other) const;
    };

    const char *to_string(ScalarKind s);
    const char *to_string(GenericKind g);

    // True for int/float/str/bool and List/Sequence of those (Optional unwrapped).
    bool isAttrType(const TypeInfo &t);
    // True for tensor types and Optional of a tensor type.
    bool isValueType(const TypeInfo &t);
    bool isValidType(const TypeInfo &t);

    // Attribute kind of an attribute type; Undefined for anything else.
    ir::AttrKind toAttrKind(const TypeInfo &t);

    // "tensor(float)" for tensor types; "" when no concrete element type is known.
    std::string onnxTypeString(const TypeInfo &t);

    // Strip one level of Optional[...].
    TypePtr unwrapOptional(const TypePtr &t);

} // namespace gsc::types
