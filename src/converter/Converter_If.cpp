/***
 * Name: gsc::converter::Converter (conditionals)
 * Purpose: Lower `if` statements to If nodes with branch subgraphs.
 * Theory of Operation:
 *   The names an `if` assigns that are still live after it become the If
 *   node's outputs. Each branch is translated in its own graph and scope
 *   frame and must produce every such name, either by assigning it or by
 *   forwarding the value it had before the statement.
 */
#include "converter/Converter.h"
#include "gsc/exceptions/unbound_name_error.h"
#include "gsc/exceptions/unsupported_construct_error.h"

namespace gsc::converter {

    using exceptions::UnsupportedConstructError;
    using values::Binding;
    using values::DynamicKind;

    void Converter::translateIf(const ast::IfStmt &s) {
        const auto live = liveness_->liveOut(s);
        std::vector<std::string> liveDefs;
        for (const auto &d : liveness_->assignedNames(s)) {
            if (live.count(d) != 0) { liveDefs.push_back(d); }
        }

        const std::string test = translateExpr(*s.cond, {"cond"}).name();
        const std::string line = std::to_string(s.line);
        const auto thenGraph = translateBlock(s.thenBody, "thenGraph_" + line, liveDefs, s);
        const auto elseGraph = translateBlock(s.elseBody, "elseGraph_" + line, liveDefs, s);

        if (liveDefs.empty()) {
            throw UnsupportedConstructError("an if statement must assign at least one variable used afterwards", where(s));
        }
        std::vector<std::string> renamed;
        for (const auto &pv : liveDefs) {
            renamed.push_back(names_.unique(pv));
        }
        if (renamed.size() == 1 && renamed.front() == test) {
            throw UnsupportedConstructError("the if statement output '" + test + "' collides with its condition", where(s));
        }

        ir::Stmt stmt;
        const values::Opset &opset = defaultOpset(s);
        stmt.domain = opset.domain;
        stmt.version = opset.version;
        stmt.opType = "If";
        stmt.inputs = {test};
        stmt.outputs = renamed;
        stmt.attrs = {builder_.makeGraphAttr("then_branch", thenGraph), builder_.makeGraphAttr("else_branch", elseGraph)};
        stmt.functions = thenGraph->functions;
        for (const auto &f : elseGraph->functions) { stmt.functions.push_back(f); }
        stmt.line = s.line;
        builder_.addStmt(*current_, std::move(stmt));

        for (std::size_t i = 0; i < liveDefs.size(); ++i) {
            bind(liveDefs[i], Binding::dynamic(renamed[i], DynamicKind::Intermediate, provenance(s)));
        }
    }

    std::shared_ptr<ir::Function> Converter::translateBlock(const Block &stmts, const std::string &name,
                                                            const std::vector<std::string> &liveDefs,
                                                            const ast::Node &at) {
        enterScope(name);
        for (const auto &s : stmts) { translateStmt(*s); }
        for (const auto &pv : liveDefs) {
            if (const Binding *b = scopes_.lookupCurrent(pv)) {
                std::string out = toOnnxVar(*b, pv, at).name();
                // Outputs of a subgraph must be produced inside it.
                if (current_->assignedNames().count(out) == 0) { out = emitCopy(out, pv, at); }
                builder_.addOutput(*current_, out, b->type);
                continue;
            }
            const Binding *outer = scopes_.lookupOuter(pv);
            if (outer == nullptr) {
                throw exceptions::UnboundNameError(
                    "variable '" + pv + "' is not assigned a value along a conditional branch", where(at));
            }
            const std::string source = toOnnxVar(*outer, pv, at).name();
            const std::string out = names_.unique(pv);
            emit({out}, "Identity", {source}, {}, at);
            builder_.addOutput(*current_, out, outer->type);
        }
        return exitScope();
    }

} // namespace gsc::converter
