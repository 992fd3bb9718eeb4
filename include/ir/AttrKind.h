/***
 * Name: gsc::ir::AttrKind
 * Purpose: Attribute value kinds, numbered as in the ONNX AttributeProto enum.
 */
#pragma once

namespace gsc::ir {

    enum class AttrKind {
        Undefined = 0,
        Float = 1,
        Int = 2,
        String = 3,
        Tensor = 4,
        Graph = 5,
        Floats = 6,
        Ints = 7,
        Strings = 8
    };

    inline const char *to_string(const AttrKind k) {
        switch (k) {
            case AttrKind::Undefined: return "undefined";
            case AttrKind::Float: return "float";
            case AttrKind::Int: return "int";
            case AttrKind::String: return "string";
            case AttrKind::Tensor: return "tensor";
            case AttrKind::Graph: return "graph";
            case AttrKind::Floats: return "floats";
            case AttrKind::Ints: return "ints";
            case AttrKind::Strings: return "strings";
        }
        return "undefined";
    }

} // namespace gsc::ir
