/**
 * @file
 * @brief AST geometry visitor implementation.
 */
/***
 * Name: gsc::ast::GeometryVisitor
 * Purpose: AST visitor computing node count and max depth.
 */
#include "ast/GeometryVisitor.h"

#include "ast/Nodes.h"

#include <algorithm>

namespace gsc::ast {
    void GeometryVisitor::bump() {
        ++nodes;
        maxDepth = std::max(maxDepth, depth);
    }

    GeometryVisitor::DepthScope::DepthScope(uint64_t &ref) : d(ref) { ++d; }
    GeometryVisitor::DepthScope::~DepthScope() { --d; }

    void GeometryVisitor::child(const Node *n) {
        if (n == nullptr) { return; }
        const DepthScope scope{depth};
        n->accept(*this);
    }

    void GeometryVisitor::children(const std::vector<std::unique_ptr<Stmt>> &stmts) {
        for (const auto &stmt: stmts) { child(stmt.get()); }
    }

    void GeometryVisitor::visit(const Module &module) {
        bump();
        children(module.body);
    }

    void GeometryVisitor::visit(const FunctionDef &func) {
        bump();
        for (const auto &p: func.params) {
            child(p.annotation.get());
            child(p.defaultValue.get());
        }
        child(func.returns.get());
        children(func.body);
    }

    void GeometryVisitor::visit(const DefStmt &def) {
        bump();
        child(def.func.get());
    }

    void GeometryVisitor::visit(const ReturnStmt &ret) {
        bump();
        child(ret.value.get());
    }

    void GeometryVisitor::visit(const AssignStmt &asg) {
        bump();
        for (const auto &t: asg.targets) { child(t.get()); }
        child(asg.annotation.get());
        child(asg.value.get());
    }

    void GeometryVisitor::visit(const ExprStmt &expr) {
        bump();
        child(expr.value.get());
    }

    void GeometryVisitor::visit(const IfStmt &iff) {
        bump();
        child(iff.cond.get());
        children(iff.thenBody);
        children(iff.elseBody);
    }

    void GeometryVisitor::visit(const WhileStmt &loop) {
        bump();
        child(loop.cond.get());
        children(loop.thenBody);
        children(loop.elseBody);
    }

    void GeometryVisitor::visit(const ForStmt &loop) {
        bump();
        child(loop.target.get());
        child(loop.iterable.get());
        children(loop.thenBody);
        children(loop.elseBody);
    }

    void GeometryVisitor::visit(const BreakStmt &) { bump(); }
    void GeometryVisitor::visit(const ContinueStmt &) { bump(); }
    void GeometryVisitor::visit(const PassStmt &) { bump(); }
    void GeometryVisitor::visit(const Import &) { bump(); }
    void GeometryVisitor::visit(const ImportFrom &) { bump(); }

    void GeometryVisitor::visit(const Literal<std::int64_t, NodeKind::IntLiteral> &) { bump(); }
    void GeometryVisitor::visit(const Literal<bool, NodeKind::BoolLiteral> &) { bump(); }
    void GeometryVisitor::visit(const Literal<double, NodeKind::FloatLiteral> &) { bump(); }
    void GeometryVisitor::visit(const Literal<std::string, NodeKind::StringLiteral> &) { bump(); }
    void GeometryVisitor::visit(const NoneLiteral &) { bump(); }
    void GeometryVisitor::visit(const Name &) { bump(); }

    void GeometryVisitor::visit(const Attribute &attr) {
        bump();
        child(attr.value.get());
    }

    void GeometryVisitor::visit(const Subscript &sub) {
        bump();
        child(sub.value.get());
        child(sub.slice.get());
    }

    void GeometryVisitor::visit(const Slice &slice) {
        bump();
        child(slice.lower.get());
        child(slice.upper.get());
        child(slice.step.get());
    }

    void GeometryVisitor::visit(const Call &call) {
        bump();
        child(call.callee.get());
        for (const auto &arg: call.args) { child(arg.get()); }
        for (const auto &kw: call.keywords) { child(kw.value.get()); }
    }

    void GeometryVisitor::visit(const Binary &bin) {
        bump();
        child(bin.lhs.get());
        child(bin.rhs.get());
    }

    void GeometryVisitor::visit(const Unary &unary) {
        bump();
        child(unary.operand.get());
    }

    void GeometryVisitor::visit(const Compare &cmp) {
        bump();
        child(cmp.left.get());
        for (const auto &c: cmp.comparators) { child(c.get()); }
    }

    void GeometryVisitor::visit(const TupleLiteral &tuple) {
        bump();
        for (const auto &e: tuple.elements) { child(e.get()); }
    }

    void GeometryVisitor::visit(const ListLiteral &list) {
        bump();
        for (const auto &e: list.elements) { child(e.get()); }
    }
} // namespace gsc::ast
