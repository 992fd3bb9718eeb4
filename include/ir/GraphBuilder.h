/***
 * Name: gsc::ir::GraphBuilder
 * Purpose: Assemble functions, nodes and attributes.
 * Inputs: Function under construction, node/attribute payloads
 * Outputs: Mutated Function; Attr values
 * Theory of Operation:
 *   Stateless helpers the converter calls for every graph mutation. Adding
 *   a node merges the node's function table into the enclosing function so
 *   script functions referenced inside subgraphs stay reachable from the
 *   top-level function. makeAttr maps a literal value to an attribute kind
 *   and returns nullopt when the value has no attribute representation.
 */
#pragma once

#include "constant/PyValue.h"
#include "ir/Function.h"
#include <memory>
#include <optional>
#include <string>

namespace gsc::ir {

    class GraphBuilder {
    public:
        std::unique_ptr<Function> newFunction(const std::string &name, const std::string &domain) const;

        void addStmt(Function &fn, Stmt stmt) const;
        void addInput(Function &fn, const std::string &name, types::TypePtr type = nullptr) const;
        void addOutput(Function &fn, const std::string &name, types::TypePtr type = nullptr) const;
        void addAttrParameter(Function &fn, const std::string &name, AttrKind kind,
                              std::optional<Attr> defaultValue = std::nullopt) const;
        void addFunction(Function &fn, const std::shared_ptr<const Function> &callee) const;

        std::optional<Attr> makeAttr(const std::string &name, const constant::PyValue &value) const;
        Attr makeGraphAttr(const std::string &name, std::shared_ptr<const Function> graph) const;
        Attr makeTensorAttr(const std::string &name, TensorConst tensor) const;
        Attr makeAttrRef(const std::string &name, const std::string &refAttrName, AttrKind kind) const;
    };

} // namespace gsc::ir
