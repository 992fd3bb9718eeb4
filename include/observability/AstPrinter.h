/***
 * Name: gsc::obs::AstPrinter
 * Purpose: Visitor-based AST pretty-printer for diagnostics/logging.
 * Inputs:
 *   - ast::Module
 * Outputs:
 *   - Formatted string with node kinds and salient fields.
 * Theory of Operation:
 *   Implements ast::VisitorBase to traverse nodes, collecting a textual
 *   representation with indentation reflecting tree depth.
 */
#pragma once

#include <string>
#include <sstream>
#include "ast/Nodes.h"
#include "ast/VisitorBase.h"

namespace gsc::obs {

class AstPrinter : public ast::VisitorBase {
 public:
  std::string print(const ast::Module& m) {
    ss_.str(""); ss_.clear(); depth_ = 0;
    m.accept(*this);
    return ss_.str();
  }

  void visit(const ast::Module& m) override { line("Module"); block(m.body); }
  void visit(const ast::FunctionDef& f) override {
    std::string params;
    for (const auto& p : f.params) { params += (params.empty() ? "" : ", ") + p.name; }
    line(std::string("FunctionDef name=") + f.name + ", params=[" + params + "]");
    depth_++;
    for (const auto& p : f.params) {
      if (!p.annotation && !p.defaultValue) continue;
      line("Param " + p.name + ":"); depth_++;
      if (p.annotation) p.annotation->accept(*this);
      if (p.defaultValue) { line("Default:"); depth_++; p.defaultValue->accept(*this); depth_--; }
      depth_--;
    }
    if (f.returns) { line("Returns:"); depth_++; f.returns->accept(*this); depth_--; }
    depth_--;
    block(f.body);
  }
  void visit(const ast::DefStmt& d) override { line("DefStmt"); depth_++; if (d.func) d.func->accept(*this); depth_--; }
  void visit(const ast::ReturnStmt& r) override { line("ReturnStmt"); depth_++; if (r.value) r.value->accept(*this); depth_--; }
  void visit(const ast::AssignStmt& a) override {
    line("AssignStmt"); depth_++;
    line("Targets:"); depth_++; for (const auto& t : a.targets) t->accept(*this); depth_--;
    if (a.annotation) { line("Annotation:"); depth_++; a.annotation->accept(*this); depth_--; }
    if (a.value) a.value->accept(*this);
    depth_--;
  }
  void visit(const ast::ExprStmt& a) override { line("ExprStmt"); depth_++; if (a.value) a.value->accept(*this); depth_--; }
  void visit(const ast::IfStmt& i) override { line("IfStmt"); depth_++; labelled("Cond:", i.cond.get()); branches(i.thenBody, i.elseBody); depth_--; }
  void visit(const ast::WhileStmt& w) override { line("WhileStmt"); depth_++; labelled("Cond:", w.cond.get()); branches(w.thenBody, w.elseBody); depth_--; }
  void visit(const ast::ForStmt& f) override { line("ForStmt"); depth_++; labelled("Target:", f.target.get()); labelled("Iter:", f.iterable.get()); branches(f.thenBody, f.elseBody); depth_--; }
  void visit(const ast::BreakStmt&) override { line("BreakStmt"); }
  void visit(const ast::ContinueStmt&) override { line("ContinueStmt"); }
  void visit(const ast::PassStmt&) override { line("PassStmt"); }
  void visit(const ast::Import& i) override { line("Import"); depth_++; for (const auto& a : i.names) a.accept(*this); depth_--; }
  void visit(const ast::ImportFrom& i) override { line(std::string("ImportFrom module=") + i.module); depth_++; for (const auto& a : i.names) a.accept(*this); depth_--; }
  void visit(const ast::Alias& a) override { line(std::string("Alias ") + a.name + (a.asname.empty() ? "" : " as " + a.asname)); }
  void visit(const ast::IntLiteral& lit) override { line(std::string("IntLiteral ") + std::to_string(lit.value)); }
  void visit(const ast::BoolLiteral& lit) override { line(std::string("BoolLiteral ") + (lit.value ? "True" : "False")); }
  void visit(const ast::FloatLiteral& lit) override { line(std::string("FloatLiteral ") + std::to_string(lit.value)); }
  void visit(const ast::StringLiteral& lit) override { line(std::string("StringLiteral \"") + lit.value + "\""); }
  void visit(const ast::NoneLiteral&) override { line("NoneLiteral"); }
  void visit(const ast::Name& n) override { line(std::string("Name ") + n.id); }
  void visit(const ast::Attribute& a) override { line(std::string("Attribute .") + a.attr); depth_++; if (a.value) a.value->accept(*this); depth_--; }
  void visit(const ast::Subscript& s) override { line("Subscript"); depth_++; if (s.value) s.value->accept(*this); labelled("Index:", s.slice.get()); depth_--; }
  void visit(const ast::Slice& s) override {
    line("Slice"); depth_++;
    labelled("Lower:", s.lower.get()); labelled("Upper:", s.upper.get()); labelled("Step:", s.step.get());
    depth_--;
  }
  void visit(const ast::Call& c) override {
    line("Call"); depth_++;
    if (c.callee) c.callee->accept(*this);
    for (const auto& a : c.args) a->accept(*this);
    for (const auto& kw : c.keywords) { line("Keyword " + kw.name + ":"); depth_++; kw.value->accept(*this); depth_--; }
    depth_--;
  }
  void visit(const ast::Binary& b) override { line(std::string("Binary ") + ast::to_symbol(b.op)); depth_++; if (b.lhs) b.lhs->accept(*this); if (b.rhs) b.rhs->accept(*this); depth_--; }
  void visit(const ast::Unary& u) override { line(std::string("Unary ") + ast::to_symbol(u.op)); depth_++; if (u.operand) u.operand->accept(*this); depth_--; }
  void visit(const ast::Compare& c) override {
    std::string ops;
    for (const auto op : c.ops) { ops += (ops.empty() ? "" : " ") + std::string(ast::to_symbol(op)); }
    line("Compare " + ops); depth_++;
    if (c.left) c.left->accept(*this);
    for (const auto& e : c.comparators) e->accept(*this);
    depth_--;
  }
  void visit(const ast::TupleLiteral& t) override { line("TupleLiteral"); depth_++; for (const auto& e : t.elements) e->accept(*this); depth_--; }
  void visit(const ast::ListLiteral& t) override { line("ListLiteral"); depth_++; for (const auto& e : t.elements) e->accept(*this); depth_--; }

 private:
  template <typename StmtList>
  void block(const StmtList& stmts) { depth_++; for (const auto& s : stmts) s->accept(*this); depth_--; }
  template <typename StmtList>
  void branches(const StmtList& thenBody, const StmtList& elseBody) {
    if (!thenBody.empty()) { line("Then:"); block(thenBody); }
    if (!elseBody.empty()) { line("Else:"); block(elseBody); }
  }
  void labelled(const char* label, const ast::Node* n) {
    if (n == nullptr) return;
    line(label); depth_++; n->accept(*this); depth_--;
  }
  void indent() { for (int i = 0; i < depth_; ++i) ss_ << "  "; }
  void line(const std::string& s) { indent(); ss_ << s << "\n"; }
  std::ostringstream ss_{};
  int depth_{0};
};

} // namespace gsc::obs
