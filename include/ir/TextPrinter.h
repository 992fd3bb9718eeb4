/***
 * Name: gsc::ir::TextPrinter
 * Purpose: Render lowered modules and functions as readable text.
 * Inputs: Module or Function
 * Outputs: Text on the given stream
 * Theory of Operation:
 *   Loosely follows the ONNX textual syntax. Each function prints its
 *   signature, attribute parameters, opset imports and function table, then
 *   one node per line as `outs = [domain.]Op <attrs> (ins)`. Graph
 *   attributes print their subgraph inline, indented one level deeper.
 */
#pragma once

#include "ir/Function.h"
#include <ostream>
#include <string>

namespace gsc::ir {

    class TextPrinter {
    public:
        explicit TextPrinter(std::ostream &os) : os_(os) {}

        void print(const Module &m);
        void print(const Function &fn);

    private:
        void printGraph(const Function &fn, int indent, bool topLevel);
        void printStmt(const Stmt &s, int indent);
        void printAttrValue(const Attr &a, int indent);

        std::ostream &os_;
    };

    // Single function as text; convenient in tests.
    std::string toText(const Function &fn);

} // namespace gsc::ir
