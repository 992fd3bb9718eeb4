/***
 * Name: gsc::ir::Function / gsc::ir::Module
 * Purpose: Lowered script functions, subgraphs and the module holding them.
 * Theory of Operation:
 *   A Function is both a top-level script function and a control-flow
 *   subgraph (then/else branch, loop body, nested function). Nodes are kept
 *   in emission order. `functions` is the table of script functions this
 *   graph calls or defines, in first-use order without duplicates.
 */
#pragma once

#include "ir/Attr.h"
#include "ir/Stmt.h"
#include "ir/ValueInfo.h"
#include <map>
#include <memory>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace gsc::ir {

    struct AttrParameter {
        std::string name;
        AttrKind kind{AttrKind::Undefined};
        std::optional<Attr> defaultValue;
    };

    struct Function {
        std::string name;
        std::string domain;
        std::string docstring;
        std::vector<ValueInfo> inputs;
        std::vector<ValueInfo> outputs;
        std::vector<AttrParameter> attrParams;
        std::vector<Stmt> stmts;
        std::vector<std::shared_ptr<const Function>> functions;

        // Output names of every node in this graph (not its subgraphs).
        std::set<std::string> assignedNames() const;
        bool hasInput(const std::string &valueName) const;
        const Function *findFunction(const std::string &fnName) const;
    };

    // (domain -> version) of every node reachable from fn, subgraphs included.
    std::map<std::string, int> collectOpsetImports(const Function &fn);

    struct Module {
        std::string domain;
        int version{1};
        std::string docstring;
        std::vector<std::shared_ptr<const Function>> functions;

        const Function *find(const std::string &fnName) const;
    };

} // namespace gsc::ir
