/***
 * Name: gsc::ir::JsonWriter
 * Purpose: Serialize a lowered module as JSON, the interchange form.
 * Inputs: Module
 * Outputs: JSON document on the given stream
 * Theory of Operation:
 *   Hand-formatted output with stable key order. Subgraphs are written inline
 *   under their graph attribute; function tables are written as name lists
 *   since every referenced function also appears at module level or as a
 *   nested graph.
 */
#pragma once

#include "ir/Function.h"
#include <ostream>
#include <string>

namespace gsc::ir {

    class JsonWriter {
    public:
        explicit JsonWriter(std::ostream &os) : os_(os) {}

        void write(const Module &m);

    private:
        void writeFunction(const Function &fn, int indent);
        void writeStmt(const Stmt &s, int indent);
        void writeAttr(const Attr &a, int indent);

        std::ostream &os_;
    };

    std::string jsonEscape(const std::string &s);

} // namespace gsc::ir
