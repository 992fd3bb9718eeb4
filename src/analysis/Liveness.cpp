/***
 * Name: gsc::analysis::Liveness
 * Purpose: Backward liveness, assigned-name and exposed-use queries.
 */
#include "analysis/Liveness.h"
#include <algorithm>
#include <functional>

namespace gsc::analysis {

    namespace {

        void appendUnique(std::vector<std::string> &out, const std::string &name) {
            if (std::find(out.begin(), out.end(), name) == out.end()) { out.push_back(name); }
        }

        void targetNames(const ast::Expr &target, std::vector<std::string> &out) {
            if (target.kind == ast::NodeKind::Name) {
                appendUnique(out, static_cast<const ast::Name&>(target).id);
            } else if (target.kind == ast::NodeKind::TupleLiteral) {
                for (const auto &e : static_cast<const ast::TupleLiteral&>(target).elements) { targetNames(*e, out); }
            }
        }

        NameSet unite(NameSet a, const NameSet &b) {
            a.insert(b.begin(), b.end());
            return a;
        }

        NameSet minus(NameSet a, const std::vector<std::string> &names) {
            for (const auto &n : names) { a.erase(n); }
            return a;
        }

        // Child expressions in source order; call targets are skipped when
        // skipCallee is set.
        void forEachChild(const ast::Expr &e, const bool skipCallee, const std::function<void(const ast::Expr&)> &fn) {
            switch (e.kind) {
                case ast::NodeKind::Call: {
                    const auto &c = static_cast<const ast::Call&>(e);
                    if (!skipCallee) { fn(*c.callee); }
                    for (const auto &a : c.args) { fn(*a); }
                    for (const auto &kw : c.keywords) { fn(*kw.value); }
                    break;
                }
                case ast::NodeKind::BinaryExpr: {
                    const auto &b = static_cast<const ast::Binary&>(e);
                    fn(*b.lhs);
                    fn(*b.rhs);
                    break;
                }
                case ast::NodeKind::UnaryExpr: fn(*static_cast<const ast::Unary&>(e).operand); break;
                case ast::NodeKind::Compare: {
                    const auto &c = static_cast<const ast::Compare&>(e);
                    fn(*c.left);
                    for (const auto &x : c.comparators) { fn(*x); }
                    break;
                }
                case ast::NodeKind::TupleLiteral:
                    for (const auto &x : static_cast<const ast::TupleLiteral&>(e).elements) { fn(*x); }
                    break;
                case ast::NodeKind::ListLiteral:
                    for (const auto &x : static_cast<const ast::ListLiteral&>(e).elements) { fn(*x); }
                    break;
                case ast::NodeKind::Attribute: fn(*static_cast<const ast::Attribute&>(e).value); break;
                case ast::NodeKind::Subscript: {
                    const auto &s = static_cast<const ast::Subscript&>(e);
                    fn(*s.value);
                    fn(*s.slice);
                    break;
                }
                case ast::NodeKind::Slice: {
                    const auto &s = static_cast<const ast::Slice&>(e);
                    if (s.lower) { fn(*s.lower); }
                    if (s.upper) { fn(*s.upper); }
                    if (s.step) { fn(*s.step); }
                    break;
                }
                default:
                    break;
            }
        }

        // Shared backward transfer; records per-statement live-out when a map is given.
        class BackwardWalker {
        public:
            explicit BackwardWalker(std::unordered_map<const ast::Stmt*, NameSet> *record) : record_(record) {}

            NameSet block(const Block &stmts, NameSet live) {
                for (auto it = stmts.rbegin(); it != stmts.rend(); ++it) { live = stmt(**it, live); }
                return live;
            }

            NameSet stmt(const ast::Stmt &s, const NameSet &live) {
                if (record_ != nullptr) { (*record_)[&s] = live; }
                switch (s.kind) {
                    case ast::NodeKind::AssignStmt: {
                        const auto &a = static_cast<const ast::AssignStmt&>(s);
                        return unite(minus(live, assignedVars(s)), usedVars(*a.value));
                    }
                    case ast::NodeKind::ExprStmt:
                        return unite(live, usedVars(*static_cast<const ast::ExprStmt&>(s).value));
                    case ast::NodeKind::ReturnStmt: {
                        const auto &r = static_cast<const ast::ReturnStmt&>(s);
                        return r.value ? usedVars(*r.value) : NameSet{};
                    }
                    case ast::NodeKind::IfStmt: {
                        const auto &i = static_cast<const ast::IfStmt&>(s);
                        NameSet out = unite(block(i.thenBody, live), block(i.elseBody, live));
                        return unite(std::move(out), usedVars(*i.cond));
                    }
                    case ast::NodeKind::ForStmt: {
                        const auto &f = static_cast<const ast::ForStmt&>(s);
                        std::vector<std::string> loopVars;
                        targetNames(*f.target, loopVars);
                        NameSet bodyIn = loop(f.thenBody, live, loopVars, NameSet{});
                        return unite(unite(minus(bodyIn, loopVars), live), usedVars(*f.iterable));
                    }
                    case ast::NodeKind::WhileStmt: {
                        const auto &w = static_cast<const ast::WhileStmt&>(s);
                        const NameSet testUses = usedVars(*w.cond);
                        NameSet bodyIn = loop(w.thenBody, live, {}, testUses);
                        return unite(unite(std::move(bodyIn), live), testUses);
                    }
                    case ast::NodeKind::DefStmt: {
                        const auto &d = static_cast<const ast::DefStmt&>(s);
                        if (record_ != nullptr) { (void)block(d.func->body, NameSet{}); }
                        NameSet out = minus(live, {d.func->name});
                        for (const auto &n : outerScopeVariables(*d.func)) { out.insert(n); }
                        return out;
                    }
                    default:
                        return live;
                }
            }

        private:
            NameSet loop(const Block &body, const NameSet &live, const std::vector<std::string> &loopVars,
                         const NameSet &testUses) {
                NameSet bodyOut = unite(live, testUses);
                NameSet bodyIn;
                for (;;) {
                    bodyIn = block(body, bodyOut);
                    NameSet next = unite(unite(live, testUses), minus(bodyIn, loopVars));
                    if (next == bodyOut) { break; }
                    bodyOut = std::move(next);
                }
                return bodyIn;
            }

            std::unordered_map<const ast::Stmt*, NameSet> *record_;
        };

        void namesInOrder(const ast::Expr &e, std::vector<std::string> &out) {
            if (e.kind == ast::NodeKind::Name) {
                appendUnique(out, static_cast<const ast::Name&>(e).id);
                return;
            }
            forEachChild(e, true, [&out](const ast::Expr &child) { namesInOrder(child, out); });
        }

        void namesInOrder(const Block &stmts, std::vector<std::string> &out) {
            for (const auto &s : stmts) {
                switch (s->kind) {
                    case ast::NodeKind::AssignStmt: namesInOrder(*static_cast<const ast::AssignStmt&>(*s).value, out); break;
                    case ast::NodeKind::ExprStmt: namesInOrder(*static_cast<const ast::ExprStmt&>(*s).value, out); break;
                    case ast::NodeKind::ReturnStmt: {
                        const auto &r = static_cast<const ast::ReturnStmt&>(*s);
                        if (r.value) { namesInOrder(*r.value, out); }
                        break;
                    }
                    case ast::NodeKind::IfStmt: {
                        const auto &i = static_cast<const ast::IfStmt&>(*s);
                        namesInOrder(*i.cond, out);
                        namesInOrder(i.thenBody, out);
                        namesInOrder(i.elseBody, out);
                        break;
                    }
                    case ast::NodeKind::ForStmt: {
                        const auto &f = static_cast<const ast::ForStmt&>(*s);
                        namesInOrder(*f.iterable, out);
                        namesInOrder(f.thenBody, out);
                        break;
                    }
                    case ast::NodeKind::WhileStmt: {
                        const auto &w = static_cast<const ast::WhileStmt&>(*s);
                        namesInOrder(*w.cond, out);
                        namesInOrder(w.thenBody, out);
                        break;
                    }
                    case ast::NodeKind::DefStmt: namesInOrder(static_cast<const ast::DefStmt&>(*s).func->body, out); break;
                    default: break;
                }
            }
        }

    } // namespace

    NameSet usedVars(const ast::Expr &expr) {
        NameSet out;
        if (expr.kind == ast::NodeKind::Name) {
            out.insert(static_cast<const ast::Name&>(expr).id);
            return out;
        }
        forEachChild(expr, true, [&out](const ast::Expr &child) {
            const NameSet sub = usedVars(child);
            out.insert(sub.begin(), sub.end());
        });
        return out;
    }

    std::vector<std::string> assignedVars(const ast::Stmt &stmt) {
        std::vector<std::string> out;
        switch (stmt.kind) {
            case ast::NodeKind::AssignStmt:
                for (const auto &t : static_cast<const ast::AssignStmt&>(stmt).targets) { targetNames(*t, out); }
                break;
            case ast::NodeKind::IfStmt: {
                const auto &i = static_cast<const ast::IfStmt&>(stmt);
                for (const auto &n : assignedVars(i.thenBody)) { appendUnique(out, n); }
                for (const auto &n : assignedVars(i.elseBody)) { appendUnique(out, n); }
                break;
            }
            case ast::NodeKind::ForStmt: {
                const auto &f = static_cast<const ast::ForStmt&>(stmt);
                targetNames(*f.target, out);
                for (const auto &n : assignedVars(f.thenBody)) { appendUnique(out, n); }
                break;
            }
            case ast::NodeKind::WhileStmt:
                for (const auto &n : assignedVars(static_cast<const ast::WhileStmt&>(stmt).thenBody)) { appendUnique(out, n); }
                break;
            case ast::NodeKind::DefStmt:
                out.push_back(static_cast<const ast::DefStmt&>(stmt).func->name);
                break;
            default:
                break;
        }
        return out;
    }

    std::vector<std::string> assignedVars(const Block &block) {
        std::vector<std::string> out;
        for (const auto &s : block) {
            for (const auto &n : assignedVars(*s)) { appendUnique(out, n); }
        }
        return out;
    }

    NameSet exposedUses(const Block &block) {
        BackwardWalker walker(nullptr);
        return walker.block(block, NameSet{});
    }

    std::vector<std::string> outerScopeVariables(const ast::FunctionDef &fn) {
        NameSet exposed = exposedUses(fn.body);
        for (const auto &p : fn.params) { exposed.erase(p.name); }
        std::vector<std::string> ordered;
        namesInOrder(fn.body, ordered);
        std::vector<std::string> out;
        for (const auto &n : ordered) {
            if (exposed.count(n) != 0) { out.push_back(n); }
        }
        return out;
    }

    void Liveness::analyze(const ast::FunctionDef &fn) {
        liveOut_.clear();
        BackwardWalker walker(&liveOut_);
        (void)walker.block(fn.body, NameSet{});
    }

    std::vector<std::string> Liveness::assignedNames(const ast::Stmt &stmt) const { return assignedVars(stmt); }

    NameSet Liveness::liveOut(const ast::Stmt &stmt) const {
        const auto it = liveOut_.find(&stmt);
        if (it == liveOut_.end()) { return {}; }
        return it->second;
    }

} // namespace gsc::analysis
