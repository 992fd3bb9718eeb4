/***
 * Name: gsc::ir::Attr
 * Purpose: A named node attribute.
 * Theory of Operation:
 *   Exactly one payload is meaningful, selected by kind. A reference
 *   attribute (refAttrName non-empty) carries no value; it forwards the
 *   enclosing function's attribute parameter of that name. Graph attributes
 *   hold a lowered subgraph shared with the function table.
 */
#pragma once

#include "ir/AttrKind.h"
#include "ir/ElemType.h"
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace gsc::ir {

    struct Function;

    // Constant tensor payload; BOOL and integer elements are stored in ints.
    struct TensorConst {
        ElemType elemType{ElemType::Undefined};
        std::vector<std::int64_t> dims;
        std::vector<std::int64_t> ints;
        std::vector<double> floats;
        std::vector<std::string> strings;
    };

    struct Attr {
        std::string name;
        AttrKind kind{AttrKind::Undefined};
        std::int64_t i{0};
        double f{0.0};
        std::string s;
        std::vector<std::int64_t> ints;
        std::vector<double> floats;
        std::vector<std::string> strings;
        std::optional<TensorConst> tensor;
        std::shared_ptr<const Function> graph;
        std::string refAttrName;

        bool isRef() const { return !refAttrName.empty(); }
    };

} // namespace gsc::ir
