/***
 * Name: gsc::ir::Function / gsc::ir::Module
 * Purpose: Queries over lowered graphs.
 */
#include "ir/Function.h"

namespace gsc::ir {

    namespace {

        void collectInto(const Function &fn, std::map<std::string, int> &out) {
            for (const auto &s : fn.stmts) {
                out.emplace(s.domain, s.version);
                for (const auto &a : s.attrs) {
                    if (a.graph) { collectInto(*a.graph, out); }
                }
            }
        }

    } // namespace

    std::set<std::string> Function::assignedNames() const {
        std::set<std::string> names;
        for (const auto &s : stmts) {
            for (const auto &out : s.outputs) {
                if (!out.empty()) { names.insert(out); }
            }
        }
        return names;
    }

    bool Function::hasInput(const std::string &valueName) const {
        for (const auto &in : inputs) {
            if (in.name == valueName) { return true; }
        }
        return false;
    }

    const Function *Function::findFunction(const std::string &fnName) const {
        for (const auto &fn : functions) {
            if (fn->name == fnName) { return fn.get(); }
        }
        return nullptr;
    }

    std::map<std::string, int> collectOpsetImports(const Function &fn) {
        std::map<std::string, int> out;
        collectInto(fn, out);
        return out;
    }

    const Function *Module::find(const std::string &fnName) const {
        for (const auto &fn : functions) {
            if (fn->name == fnName) { return fn.get(); }
        }
        return nullptr;
    }

} // namespace gsc::ir
