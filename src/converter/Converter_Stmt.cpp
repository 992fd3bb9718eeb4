/***
 * Name: gsc::converter::Converter (statements)
 * Purpose: Lower assignments, returns and expression statements.
 */
#include "converter/Converter.h"
#include "gsc/exceptions/arity_error.h"
#include "gsc/exceptions/unsupported_construct_error.h"

namespace gsc::converter {

    using exceptions::ArityError;
    using exceptions::UnsupportedConstructError;
    using values::Binding;
    using values::DynamicKind;
    using values::ValueHandle;

    namespace {

        bool isPrintCall(const ast::Expr &e) {
            if (e.kind != ast::NodeKind::Call) { return false; }
            const auto &callee = *static_cast<const ast::Call&>(e).callee;
            return callee.kind == ast::NodeKind::Name && static_cast<const ast::Name&>(callee).id == "print";
        }

    } // namespace

    void Converter::translateStmt(const ast::Stmt &s, const std::optional<std::size_t> indexInFunction) {
        switch (s.kind) {
            case ast::NodeKind::AssignStmt: translateAssign(static_cast<const ast::AssignStmt&>(s)); return;
            case ast::NodeKind::ReturnStmt:
                if (!indexInFunction) {
                    throw UnsupportedConstructError("return statements are not permitted inside control-flow statements",
                                                    where(s));
                }
                translateReturn(static_cast<const ast::ReturnStmt&>(s));
                return;
            case ast::NodeKind::IfStmt: translateIf(static_cast<const ast::IfStmt&>(s)); return;
            case ast::NodeKind::ForStmt:
            case ast::NodeKind::WhileStmt: translateLoop(s); return;
            case ast::NodeKind::DefStmt: translateNestedFunctionDef(*static_cast<const ast::DefStmt&>(s).func); return;
            case ast::NodeKind::ExprStmt: {
                const auto &value = *static_cast<const ast::ExprStmt&>(s).value;
                if (value.kind == ast::NodeKind::StringLiteral) {
                    if (indexInFunction && *indexInFunction == 0) {
                        current_->docstring = static_cast<const ast::StringLiteral&>(value).value;
                        return;
                    }
                    throw UnsupportedConstructError("a string statement is only allowed as the first statement (docstring)",
                                                    where(s));
                }
                if (isPrintCall(value)) { return; }
                throw UnsupportedConstructError("expression statements other than print(...) are not supported", where(s));
            }
            case ast::NodeKind::BreakStmt:
                throw UnsupportedConstructError("break is only supported as the final 'if <name>: break' of a loop body",
                                                where(s));
            case ast::NodeKind::ContinueStmt: throw UnsupportedConstructError("continue is not supported", where(s));
            case ast::NodeKind::PassStmt: throw UnsupportedConstructError("pass is not supported", where(s));
            default:
                throw UnsupportedConstructError(std::string("unsupported statement: ") + ast::to_string(s.kind), where(s));
        }
    }

    void Converter::translateAssign(const ast::AssignStmt &s) {
        if (s.targets.size() != 1) {
            throw UnsupportedConstructError("chained assignment (a = b = ...) is not supported", where(s));
        }
        const ast::Expr &lhs = *s.targets.front();
        const ast::Expr &rhs = *s.value;
        if (rhs.kind == ast::NodeKind::TupleLiteral) {
            if (lhs.kind != ast::NodeKind::TupleLiteral) {
                throw UnsupportedConstructError("a tuple value must be assigned to a tuple of names", where(s));
            }
            const auto &targets = static_cast<const ast::TupleLiteral&>(lhs).elements;
            const auto &values = static_cast<const ast::TupleLiteral&>(rhs).elements;
            if (targets.size() != values.size()) {
                throw ArityError("cannot assign " + std::to_string(values.size()) + " values to " +
                                     std::to_string(targets.size()) + " names",
                                 where(s));
            }
            for (std::size_t i = 0; i < targets.size(); ++i) { assignTarget(s, *targets[i], *values[i]); }
            return;
        }
        assignTarget(s, lhs, rhs);
    }

    void Converter::assignTarget(const ast::AssignStmt &s, const ast::Expr &lhs, const ast::Expr &rhs) {
        if (lhs.kind == ast::NodeKind::Name) {
            const auto &n = static_cast<const ast::Name&>(lhs);
            const ValueHandle h = translateExpr(rhs, {n.id});
            types::TypePtr type;
            if (s.annotation) {
                type = evalAnnotation(*s.annotation);
                if (!type) { warn(*s.annotation, "Unsupported type annotation for variable " + n.id + "."); }
            }
            bind(n.id, Binding::dynamic(h.name(), h.isConst ? DynamicKind::Constant : DynamicKind::Intermediate,
                                        provenance(n), type));
            return;
        }
        if (lhs.kind == ast::NodeKind::TupleLiteral) {
            std::vector<std::string> ids;
            for (const auto &e : static_cast<const ast::TupleLiteral&>(lhs).elements) {
                if (e->kind != ast::NodeKind::Name) {
                    throw UnsupportedConstructError("only names can be assigned to in a tuple target", where(*e));
                }
                ids.push_back(static_cast<const ast::Name&>(*e).id);
            }
            const ValueHandle h = translateExpr(rhs, ids);
            if (h.names.size() != ids.size()) {
                throw ArityError("cannot assign " + std::to_string(h.names.size()) + " value(s) to " +
                                     std::to_string(ids.size()) + " names",
                                 where(s));
            }
            for (std::size_t i = 0; i < ids.size(); ++i) {
                bind(ids[i], Binding::dynamic(h.names[i], DynamicKind::Intermediate, provenance(lhs)));
            }
            return;
        }
        throw UnsupportedConstructError(std::string("unsupported assignment target: ") + ast::to_string(lhs.kind),
                                        where(lhs));
    }

    void Converter::translateReturn(const ast::ReturnStmt &s) {
        if (!s.value) { throw UnsupportedConstructError("a return statement must return a value", where(s)); }
        std::vector<const ast::Expr*> values;
        const bool isTuple = s.value->kind == ast::NodeKind::TupleLiteral;
        if (isTuple) {
            for (const auto &e : static_cast<const ast::TupleLiteral&>(*s.value).elements) { values.push_back(e.get()); }
        } else {
            values.push_back(s.value.get());
        }
        if (returnTypes_ && returnTypes_->size() != values.size()) {
            throw ArityError("Mismatch in number of return values and types: " + std::to_string(values.size()) +
                                 " values, " + std::to_string(returnTypes_->size()) + " types",
                             where(s));
        }
        for (std::size_t i = 0; i < values.size(); ++i) {
            const std::string preferred = "return_val" + (isTuple ? std::to_string(i) : std::string{});
            std::string name = translateExpr(*values[i], {preferred}).name();
            if (current_->hasInput(name)) { name = emitCopy(name, preferred, *values[i]); }
            for (const auto &out : current_->outputs) {
                if (out.name == name) {
                    name = emitCopy(name, name + "_copy", *values[i]);
                    break;
                }
            }
            builder_.addOutput(*current_, name, returnTypes_ ? (*returnTypes_)[i] : nullptr);
        }
    }

} // namespace gsc::converter
