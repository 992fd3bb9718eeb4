/***
 * Name: gsc::ir::Stmt
 * Purpose: One graph node.
 * Theory of Operation:
 *   Identifies the operator by (domain, opType, version). An omitted
 *   optional input is the empty string. `functions` lists the script
 *   functions referenced from this node or its subgraphs.
 */
#pragma once

#include "ir/Attr.h"
#include <memory>
#include <string>
#include <vector>

namespace gsc::ir {

    struct Function;

    struct Stmt {
        std::string domain;
        std::string opType;
        int version{0};
        std::vector<std::string> inputs;
        std::vector<std::string> outputs;
        std::vector<Attr> attrs;
        std::vector<std::shared_ptr<const Function>> functions;
        int line{0};

        const Attr *findAttr(const std::string &attrName) const {
            for (const auto &a : attrs) {
                if (a.name == attrName) { return &a; }
            }
            return nullptr;
        }
    };

} // namespace gsc::ir
