/***
 * Name: gsc::ir::ElemType
 * Purpose: Tensor element types, numbered as in the ONNX TensorProto enum.
 */
#pragma once

#include <optional>
#include <string>

namespace gsc::ir {

    enum class ElemType {
        Undefined = 0,
        Float = 1,
        Uint8 = 2,
        Int8 = 3,
        Uint16 = 4,
        Int16 = 5,
        Int32 = 6,
        Int64 = 7,
        String = 8,
        Bool = 9,
        Float16 = 10,
        Double = 11,
        Uint32 = 12,
        Uint64 = 13,
        Bfloat16 = 16
    };

    // Upper-case element type name ("FLOAT", "INT64", ...).
    const char *to_string(ElemType t);

    // Lower-case name used in type strings: tensor(float), tensor(int64).
    const char *elemTypeTag(ElemType t);

    // "tensor(<tag>)"
    std::string tensorTypeString(ElemType t);

    std::optional<ElemType> elemTypeFromName(const std::string &upperName);

} // namespace gsc::ir
