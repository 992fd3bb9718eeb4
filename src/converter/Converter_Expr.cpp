/***
 * Name: gsc::converter::Converter (expressions)
 * Purpose: Lower expressions to nodes of the innermost graph.
 * Theory of Operation:
 *   Literal expressions are folded and emitted as one Constant node. Calls
 *   and operators produce a CallPlan whose outputs are named from the
 *   assignment targets when there are any, "tmp" otherwise. Names resolve
 *   through the scope stack and then the module environment.
 */
#include "converter/Converter.h"
#include "constant/ConstEvaluator.h"
#include "gsc/exceptions/unbound_name_error.h"
#include "gsc/exceptions/unsupported_construct_error.h"

namespace gsc::converter {

    using exceptions::UnsupportedConstructError;
    using values::ValueHandle;

    namespace {

        const char *primitiveOp(const ast::BinaryOperator op) {
            switch (op) {
                case ast::BinaryOperator::Add: return "Add";
                case ast::BinaryOperator::Sub: return "Sub";
                case ast::BinaryOperator::Mul: return "Mul";
                case ast::BinaryOperator::Div: return "Div";
                case ast::BinaryOperator::Mod: return "Mod";
                case ast::BinaryOperator::Pow: return "Pow";
                case ast::BinaryOperator::MatMul: return "MatMul";
                case ast::BinaryOperator::BitAnd: return "And";
                case ast::BinaryOperator::BitOr: return "Or";
                case ast::BinaryOperator::And: return "And";
                case ast::BinaryOperator::Or: return "Or";
                case ast::BinaryOperator::Eq: return "Equal";
                case ast::BinaryOperator::Ne: return "NotEqual";
                case ast::BinaryOperator::Lt: return "Less";
                case ast::BinaryOperator::Le: return "LessOrEqual";
                case ast::BinaryOperator::Gt: return "Greater";
                case ast::BinaryOperator::Ge: return "GreaterOrEqual";
                default: return nullptr;
            }
        }

        bool isComparison(const ast::BinaryOperator op) {
            switch (op) {
                case ast::BinaryOperator::Eq:
                case ast::BinaryOperator::Ne:
                case ast::BinaryOperator::Lt:
                case ast::BinaryOperator::Le:
                case ast::BinaryOperator::Gt:
                case ast::BinaryOperator::Ge:
                    return true;
                default:
                    return false;
            }
        }

    } // namespace

    ValueHandle Converter::translateExpr(const ast::Expr &e, const std::vector<std::string> &targets) {
        const std::string target = targets.empty() ? std::string{} : targets.front();
        if (constant::ConstEvaluator::isConstantExpr(e)) { return emitConst(evalConstant(e), target, e); }
        switch (e.kind) {
            case ast::NodeKind::Call: return emitPlan(translateCall(static_cast<const ast::Call&>(e)), targets, e);
            case ast::NodeKind::BinaryExpr: {
                const auto &b = static_cast<const ast::Binary&>(e);
                return emitPlan(isComparison(b.op) ? translateComparison(b) : translateBinary(b), targets, e);
            }
            case ast::NodeKind::UnaryExpr: return emitPlan(translateUnary(static_cast<const ast::Unary&>(e)), targets, e);
            case ast::NodeKind::Compare:
                throw UnsupportedConstructError("chained comparisons are not supported", where(e));
            case ast::NodeKind::Name: return translateName(static_cast<const ast::Name&>(e));
            case ast::NodeKind::Subscript: return translateSubscript(static_cast<const ast::Subscript&>(e), target);
            default:
                throw UnsupportedConstructError(std::string("unsupported expression: ") + ast::to_string(e.kind), where(e));
        }
    }

    ValueHandle Converter::translateOptExpr(const ast::Expr &e) {
        if (e.kind == ast::NodeKind::NoneLiteral) { return ValueHandle(std::string{}, false); }
        return translateExpr(e);
    }

    ValueHandle Converter::emitPlan(const CallPlan &plan, const std::vector<std::string> &targets, const ast::Node &at) {
        std::vector<std::string> outputs;
        if (targets.empty()) {
            outputs.push_back(names_.unique("tmp"));
        } else {
            for (const auto &t : targets) { outputs.push_back(names_.unique(t)); }
        }
        emitCall(outputs, plan, at);
        return ValueHandle(std::move(outputs));
    }

    CallPlan Converter::translateBinary(const ast::Binary &b) {
        const char *opType = primitiveOp(b.op);
        if (opType == nullptr) {
            throw UnsupportedConstructError(std::string("unsupported operator '") + ast::to_symbol(b.op) + "'", where(b));
        }
        CallPlan plan;
        plan.callee = opCallee(defaultOpset(b), opType);
        if (b.op == ast::BinaryOperator::Mod && constant::ConstEvaluator::isConstantExpr(*b.rhs) &&
            evalConstant(*b.rhs).kind == constant::ValueKind::Float) {
            plan.attrs.push_back(*builder_.makeAttr("fmod", constant::PyValue::integer(1)));
        }
        const ValueHandle lhs = translateExpr(*b.lhs);
        const ValueHandle rhs = translateExpr(*b.rhs);
        plan.inputs = castInputs(plan.callee.schema, {lhs, rhs}, b);
        return plan;
    }

    CallPlan Converter::translateComparison(const ast::Binary &b) {
        if (b.op != ast::BinaryOperator::Ne) { return translateBinary(b); }
        // a != b lowers to Not(Equal(a, b)).
        CallPlan equal;
        equal.callee = opCallee(defaultOpset(b), "Equal");
        const ValueHandle lhs = translateExpr(*b.lhs);
        const ValueHandle rhs = translateExpr(*b.rhs);
        equal.inputs = castInputs(equal.callee.schema, {lhs, rhs}, b);
        const std::string tmp = names_.unique("tmp");
        emitCall({tmp}, equal, b);
        CallPlan plan;
        plan.callee = opCallee(defaultOpset(b), "Not");
        plan.inputs = {tmp};
        return plan;
    }

    CallPlan Converter::translateUnary(const ast::Unary &u) {
        const char *opType = nullptr;
        switch (u.op) {
            case ast::UnaryOperator::Neg: opType = "Neg"; break;
            case ast::UnaryOperator::Not: opType = "Not"; break;
            default:
                throw UnsupportedConstructError(std::string("unsupported unary operator '") + ast::to_symbol(u.op) +
                                                    "' on a non-constant operand",
                                                where(u));
        }
        CallPlan plan;
        plan.callee = opCallee(defaultOpset(u), opType);
        plan.inputs = {translateExpr(*u.operand).name()};
        return plan;
    }

    ValueHandle Converter::translateName(const ast::Name &n) {
        const values::Binding *b = lookup(n.id);
        if (b == nullptr) { throw exceptions::UnboundNameError("unbound name '" + n.id + "'", where(n)); }
        return toOnnxVar(*b, n.id, n);
    }

} // namespace gsc::converter
