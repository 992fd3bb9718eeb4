/***
 * Name: gsc::converter::Converter (loops)
 * Purpose: Lower `for i in range(n)` and `while cond` to Loop nodes.
 * Theory of Operation:
 *   The body graph receives (iteration counter, incoming condition, state
 *   values) and yields (continuation condition, state values). State values
 *   are the names the body assigns that it reads before assigning or that
 *   are live after the loop. A trailing `if c: break` becomes the
 *   continuation condition Not(c); a while loop continues with the value
 *   its condition name has at the end of the body.
 */
#include "converter/Converter.h"
#include "analysis/Liveness.h"
#include "gsc/exceptions/unbound_name_error.h"
#include "gsc/exceptions/unsupported_construct_error.h"
#include <algorithm>

namespace gsc::converter {

    using constant::PyValue;
    using exceptions::UnboundNameError;
    using exceptions::UnsupportedConstructError;
    using values::Binding;
    using values::DynamicKind;

    namespace {

        // `if <name>: break` with no else branch.
        const ast::IfStmt *asBreakGuard(const ast::Stmt &s) {
            if (s.kind != ast::NodeKind::IfStmt) { return nullptr; }
            const auto &i = static_cast<const ast::IfStmt&>(s);
            if (i.thenBody.size() != 1 || i.thenBody.front()->kind != ast::NodeKind::BreakStmt) { return nullptr; }
            return &i;
        }

    } // namespace

    void Converter::translateLoop(const ast::Stmt &s) {
        const bool isFor = s.kind == ast::NodeKind::ForStmt;
        const Block &body = isFor ? static_cast<const ast::ForStmt&>(s).thenBody : static_cast<const ast::WhileStmt&>(s).thenBody;
        const Block &orelse = isFor ? static_cast<const ast::ForStmt&>(s).elseBody : static_cast<const ast::WhileStmt&>(s).elseBody;
        if (!orelse.empty()) { throw UnsupportedConstructError("an else clause on a loop is not supported", where(s)); }

        std::string loopVarName;
        std::string bound;
        std::string initialCond;
        std::string condIn;
        const ast::Name *whileCond = nullptr;
        if (isFor) {
            const auto &f = static_cast<const ast::ForStmt&>(s);
            if (f.target->kind != ast::NodeKind::Name) {
                throw UnsupportedConstructError("the target of a for loop must be a single name", where(*f.target));
            }
            loopVarName = static_cast<const ast::Name&>(*f.target).id;
            const auto *call = f.iterable->kind == ast::NodeKind::Call ? static_cast<const ast::Call*>(f.iterable.get()) : nullptr;
            const bool isRange = call != nullptr && call->callee->kind == ast::NodeKind::Name &&
                                 static_cast<const ast::Name&>(*call->callee).id == "range";
            if (!isRange || call->args.size() != 1 || !call->keywords.empty()) {
                throw UnsupportedConstructError("unsupported loop bound: only range(n) with a single argument is allowed",
                                                where(*f.iterable));
            }
            bound = translateExpr(*call->args.front(), {"loop_bound"}).name();
            condIn = names_.unique("cond_in");
            initialCond = emitConst(PyValue::boolean(true), "true", s).name();
        } else {
            const auto &w = static_cast<const ast::WhileStmt&>(s);
            if (w.cond->kind != ast::NodeKind::Name) {
                throw UnsupportedConstructError("the condition of a while loop must be a name: 'while <cond>:'", where(*w.cond));
            }
            whileCond = static_cast<const ast::Name*>(w.cond.get());
            loopVarName = "infinite_loop";
            initialCond = translateName(*whileCond).name();
            condIn = names_.unique(whileCond->id);
        }

        const auto exposed = analysis::exposedUses(body);
        const auto live = liveness_->liveOut(s);
        std::vector<std::string> stateVars;
        for (const auto &st : body) {
            for (const auto &v : liveness_->assignedNames(*st)) {
                const bool carried = exposed.count(v) != 0 || live.count(v) != 0;
                if (carried && std::find(stateVars.begin(), stateVars.end(), v) == stateVars.end()) { stateVars.push_back(v); }
            }
        }

        enterScope("loop_body");
        const std::string loopVar = names_.unique(loopVarName);
        builder_.addInput(*current_, loopVar, types::TypeInfo::tensor(ir::ElemType::Int64));
        bind(loopVarName, Binding::dynamic(loopVar, DynamicKind::LoopCarried, provenance(s)));
        builder_.addInput(*current_, condIn, types::TypeInfo::tensor(ir::ElemType::Bool));
        for (const auto &pv : stateVars) {
            const std::string ov = names_.unique(pv);
            builder_.addInput(*current_, ov);
            bind(pv, Binding::dynamic(ov, DynamicKind::LoopCarried, provenance(s)));
        }

        std::string breakCond;
        for (std::size_t i = 0; i < body.size(); ++i) {
            const ast::IfStmt *guard = asBreakGuard(*body[i]);
            if (guard == nullptr) {
                translateStmt(*body[i]);
                continue;
            }
            if (!guard->elseBody.empty()) {
                throw UnsupportedConstructError("'if <cond>: break' must not have an else branch", where(*guard));
            }
            if (guard->cond->kind != ast::NodeKind::Name) {
                throw UnsupportedConstructError("break must be guarded by a condition name: 'if <cond>: break'",
                                                where(*guard->cond));
            }
            if (i + 1 != body.size()) {
                throw UnsupportedConstructError("'if <cond>: break' must be the last statement of the loop body", where(*guard));
            }
            const auto &condName = static_cast<const ast::Name&>(*guard->cond);
            const Binding *b = scopes_.lookupCurrent(condName.id);
            if (b == nullptr) {
                throw UnboundNameError("break condition '" + condName.id + "' must be assigned in the loop body",
                                       where(condName));
            }
            breakCond = toOnnxVar(*b, condName.id, condName).name();
        }

        std::string condSource = condIn;
        if (whileCond != nullptr) {
            const Binding *b = scopes_.lookupCurrent(whileCond->id);
            if (b == nullptr) {
                throw UnboundNameError("while condition '" + whileCond->id + "' must be assigned in the loop body",
                                       where(*whileCond));
            }
            condSource = toOnnxVar(*b, whileCond->id, *whileCond).name();
        }
        const std::string condOut = names_.unique("cond_out");
        if (breakCond.empty()) {
            emit({condOut}, "Identity", {condSource}, {}, s);
        } else {
            emit({condOut}, "Not", {breakCond}, {}, s);
        }
        builder_.addOutput(*current_, condOut, types::TypeInfo::tensor(ir::ElemType::Bool));
        for (const auto &pv : stateVars) {
            const Binding *b = scopes_.lookup(pv);
            std::string ov = toOnnxVar(*b, pv, s).name();
            if (current_->assignedNames().count(ov) == 0) { ov = emitCopy(ov, pv, s); }
            builder_.addOutput(*current_, ov, b->type);
        }
        const std::shared_ptr<ir::Function> loopBody = exitScope();

        std::vector<std::string> inputs{bound, initialCond};
        for (const auto &pv : stateVars) {
            const Binding *b = lookup(pv);
            if (b == nullptr) {
                throw UnboundNameError("loop variable '" + pv + "' is used before it is assigned", where(s));
            }
            inputs.push_back(toOnnxVar(*b, pv, s).name());
        }
        std::vector<std::string> outputs;
        for (const auto &pv : stateVars) { outputs.push_back(names_.unique(pv)); }

        ir::Stmt stmt;
        const values::Opset &opset = defaultOpset(s);
        stmt.domain = opset.domain;
        stmt.version = opset.version;
        stmt.opType = "Loop";
        stmt.inputs = std::move(inputs);
        stmt.outputs = outputs;
        stmt.attrs = {builder_.makeGraphAttr("body", loopBody)};
        stmt.functions = loopBody->functions;
        stmt.line = s.line;
        builder_.addStmt(*current_, std::move(stmt));

        for (std::size_t i = 0; i < stateVars.size(); ++i) {
            bind(stateVars[i], Binding::dynamic(outputs[i], DynamicKind::Intermediate, provenance(s)));
        }
    }

} // namespace gsc::converter
