/***
 * Name: gsc::constant::ConstEvaluator
 * Purpose: Literal expression evaluation with Python semantics.
 */
#include "constant/ConstEvaluator.h"
#include "constant/Catalog.h"
#include "gsc/exceptions/type_mismatch_error.h"
#include "gsc/exceptions/unbound_name_error.h"
#include "gsc/exceptions/unsupported_construct_error.h"
#include "types/Annotations.h"
#include <algorithm>
#include <cmath>
#include <cstdint>
#include <limits>
#include <utility>

namespace gsc::constant {

    using ast::BinaryOperator;
    using exceptions::TypeMismatchError;
    using exceptions::UnboundNameError;
    using exceptions::UnsupportedConstructError;

    namespace {

        bool isIntLike(const PyValue &v) { return v.kind == ValueKind::Int || v.kind == ValueKind::Bool; }

        std::int64_t asInt(const PyValue &v) { return v.kind == ValueKind::Bool ? (v.b ? 1 : 0) : v.i; }

        double asDouble(const PyValue &v) {
            if (v.kind == ValueKind::Float) { return v.f; }
            return static_cast<double>(asInt(v));
        }

        bool isSequence(const PyValue &v) { return v.kind == ValueKind::List || v.kind == ValueKind::Tuple; }

        constexpr std::int64_t kMinInt = std::numeric_limits<std::int64_t>::min();
        // Upper bound on the length of a repeated string, list or tuple.
        constexpr std::int64_t kMaxRepeatLength = std::int64_t{1} << 20;

        std::int64_t floorDiv(const std::int64_t a, const std::int64_t b) {
            std::int64_t q = a / b;
            if ((a % b != 0) && ((a < 0) != (b < 0))) { --q; }
            return q;
        }

        std::int64_t floorMod(const std::int64_t a, const std::int64_t b) {
            if (b == -1) { return 0; }
            std::int64_t r = a % b;
            if (r != 0 && ((r < 0) != (b < 0))) { r += b; }
            return r;
        }

        // Normalize a possibly negative index against a length; -1 when out of range.
        std::int64_t normalizeIndex(std::int64_t idx, const std::int64_t len) {
            if (idx < 0) { idx += len; }
            return (idx < 0 || idx >= len) ? -1 : idx;
        }

    } // namespace

    ConstEvaluator::ConstEvaluator(Lookup lookup, std::string functionName)
        : lookup_(std::move(lookup)), function_(std::move(functionName)) {}

    std::int64_t ConstEvaluator::checked(const bool overflowed, const std::int64_t &value, const ast::Node &at) const {
        if (overflowed) {
            throw UnsupportedConstructError("integer overflow in constant expression (values must fit in int64)", where(at));
        }
        return value;
    }

    std::int64_t ConstEvaluator::power(std::int64_t base, std::int64_t exponent, const ast::Node &at) const {
        std::int64_t result = 1;
        while (exponent > 0) {
            if ((exponent & 1) != 0) { result = checked(__builtin_mul_overflow(result, base, &result), result, at); }
            exponent >>= 1;
            if (exponent > 0) { base = checked(__builtin_mul_overflow(base, base, &base), base, at); }
        }
        return result;
    }

    sema::Diagnostic ConstEvaluator::where(const ast::Node &n) const {
        return sema::Diagnostic{"", n.file, n.line, n.col, function_};
    }

    bool ConstEvaluator::isConstantExpr(const ast::Expr &expr) {
        switch (expr.kind) {
            case ast::NodeKind::IntLiteral:
            case ast::NodeKind::FloatLiteral:
            case ast::NodeKind::BoolLiteral:
            case ast::NodeKind::StringLiteral:
            case ast::NodeKind::NoneLiteral:
                return true;
            case ast::NodeKind::ListLiteral: {
                for (const auto &e : static_cast<const ast::ListLiteral&>(expr).elements) {
                    if (!isConstantExpr(*e)) { return false; }
                }
                return true;
            }
            case ast::NodeKind::UnaryExpr:
                return isConstantExpr(*static_cast<const ast::Unary&>(expr).operand);
            case ast::NodeKind::BinaryExpr: {
                const auto &b = static_cast<const ast::Binary&>(expr);
                return isConstantExpr(*b.lhs) && isConstantExpr(*b.rhs);
            }
            case ast::NodeKind::Compare: {
                const auto &c = static_cast<const ast::Compare&>(expr);
                if (!isConstantExpr(*c.left)) { return false; }
                for (const auto &e : c.comparators) {
                    if (!isConstantExpr(*e)) { return false; }
                }
                return true;
            }
            default:
                return false;
        }
    }

    PyValue ConstEvaluator::evaluate(const ast::Expr &expr) const {
        switch (expr.kind) {
            case ast::NodeKind::IntLiteral: return PyValue::integer(static_cast<const ast::IntLiteral&>(expr).value);
            case ast::NodeKind::FloatLiteral: return PyValue::floating(static_cast<const ast::FloatLiteral&>(expr).value);
            case ast::NodeKind::BoolLiteral: return PyValue::boolean(static_cast<const ast::BoolLiteral&>(expr).value);
            case ast::NodeKind::StringLiteral: return PyValue::string(static_cast<const ast::StringLiteral&>(expr).value);
            case ast::NodeKind::NoneLiteral: return PyValue::none();
            case ast::NodeKind::ListLiteral: {
                std::vector<PyValue> items;
                for (const auto &e : static_cast<const ast::ListLiteral&>(expr).elements) { items.push_back(evaluate(*e)); }
                return PyValue::list(std::move(items));
            }
            case ast::NodeKind::TupleLiteral: {
                std::vector<PyValue> items;
                for (const auto &e : static_cast<const ast::TupleLiteral&>(expr).elements) { items.push_back(evaluate(*e)); }
                return PyValue::tuple(std::move(items));
            }
            case ast::NodeKind::Name: return evalName(static_cast<const ast::Name&>(expr));
            case ast::NodeKind::Attribute: return evalAttribute(static_cast<const ast::Attribute&>(expr));
            case ast::NodeKind::UnaryExpr: return evalUnary(static_cast<const ast::Unary&>(expr));
            case ast::NodeKind::BinaryExpr: return evalBinary(static_cast<const ast::Binary&>(expr));
            case ast::NodeKind::Compare: return evalCompare(static_cast<const ast::Compare&>(expr));
            case ast::NodeKind::Subscript: return evalSubscript(static_cast<const ast::Subscript&>(expr));
            case ast::NodeKind::Call:
                throw UnsupportedConstructError("function calls are not allowed in a constant expression", where(expr));
            default:
                throw UnsupportedConstructError(std::string("cannot evaluate ") + ast::to_string(expr.kind) +
                                                    " as a constant expression",
                                                where(expr));
        }
    }

    PyValue ConstEvaluator::evalName(const ast::Name &n) const {
        if (lookup_) {
            if (auto v = lookup_(n)) { return *v; }
        }
        if (auto v = lookupBuiltin(n.id)) { return *v; }
        throw UnboundNameError("name '" + n.id + "' is not defined", where(n));
    }

    PyValue ConstEvaluator::evalAttribute(const ast::Attribute &a) const {
        const PyValue base = evaluate(*a.value);
        if (base.kind == ValueKind::Namespace && base.members) {
            const auto it = base.members->find(a.attr);
            if (it == base.members->end()) {
                throw UnboundNameError("module '" + base.s + "' has no attribute '" + a.attr + "'", where(a));
            }
            return it->second;
        }
        if (base.kind == ValueKind::Opset) { return PyValue::op(base.opset, a.attr); }
        throw TypeMismatchError(std::string("'") + to_string(base.kind) + "' object has no attribute '" + a.attr + "'",
                                where(a));
    }

    PyValue ConstEvaluator::evalUnary(const ast::Unary &u) const {
        const PyValue v = evaluate(*u.operand);
        switch (u.op) {
            case ast::UnaryOperator::Not: return PyValue::boolean(!v.truthy());
            case ast::UnaryOperator::Neg:
                if (v.kind == ValueKind::Float) { return PyValue::floating(-v.f); }
                if (isIntLike(v)) {
                    const std::int64_t x = asInt(v);
                    return PyValue::integer(checked(x == kMinInt, x == kMinInt ? x : -x, u));
                }
                break;
            case ast::UnaryOperator::Pos:
                if (v.kind == ValueKind::Float) { return v; }
                if (isIntLike(v)) { return PyValue::integer(asInt(v)); }
                break;
            case ast::UnaryOperator::BitNot:
                if (isIntLike(v)) { return PyValue::integer(~asInt(v)); }
                break;
        }
        throw TypeMismatchError(std::string("bad operand type for unary ") + ast::to_symbol(u.op) + ": '" +
                                    to_string(v.kind) + "'",
                                where(u));
    }

    PyValue ConstEvaluator::evalBinary(const ast::Binary &b) const {
        if (b.op == BinaryOperator::And || b.op == BinaryOperator::Or) {
            PyValue lhs = evaluate(*b.lhs);
            const bool shortCircuit = b.op == BinaryOperator::And ? !lhs.truthy() : lhs.truthy();
            if (shortCircuit) { return lhs; }
            return evaluate(*b.rhs);
        }
        const PyValue lhs = evaluate(*b.lhs);
        const PyValue rhs = evaluate(*b.rhs);
        switch (b.op) {
            case BinaryOperator::Eq:
            case BinaryOperator::Ne:
            case BinaryOperator::Lt:
            case BinaryOperator::Le:
            case BinaryOperator::Gt:
            case BinaryOperator::Ge:
            case BinaryOperator::Is:
            case BinaryOperator::IsNot:
            case BinaryOperator::In:
            case BinaryOperator::NotIn:
                return PyValue::boolean(applyComparison(b.op, lhs, rhs, b));
            default:
                return applyBinary(b.op, lhs, rhs, b);
        }
    }

    PyValue ConstEvaluator::evalCompare(const ast::Compare &c) const {
        PyValue lhs = evaluate(*c.left);
        for (std::size_t i = 0; i < c.ops.size(); ++i) {
            PyValue rhs = evaluate(*c.comparators[i]);
            if (!applyComparison(c.ops[i], lhs, rhs, c)) { return PyValue::boolean(false); }
            lhs = std::move(rhs);
        }
        return PyValue::boolean(true);
    }

    PyValue ConstEvaluator::applyBinary(const BinaryOperator op, const PyValue &lhs, const PyValue &rhs,
                                        const ast::Node &at) const {
        if (lhs.isNumber() && rhs.isNumber()) {
            const bool useFloat = lhs.kind == ValueKind::Float || rhs.kind == ValueKind::Float;
            if (op == BinaryOperator::Div || op == BinaryOperator::FloorDiv || op == BinaryOperator::Mod) {
                if (asDouble(rhs) == 0.0) { throw TypeMismatchError("division by zero in constant expression", where(at)); }
            }
            if (useFloat) {
                const double a = asDouble(lhs);
                const double c = asDouble(rhs);
                switch (op) {
                    case BinaryOperator::Add: return PyValue::floating(a + c);
                    case BinaryOperator::Sub: return PyValue::floating(a - c);
                    case BinaryOperator::Mul: return PyValue::floating(a * c);
                    case BinaryOperator::Div: return PyValue::floating(a / c);
                    case BinaryOperator::FloorDiv: return PyValue::floating(std::floor(a / c));
                    case BinaryOperator::Mod: {
                        double r = std::fmod(a, c);
                        if (r != 0.0 && ((r < 0) != (c < 0))) { r += c; }
                        return PyValue::floating(r);
                    }
                    case BinaryOperator::Pow: return PyValue::floating(std::pow(a, c));
                    default: break;
                }
            } else {
                const std::int64_t a = asInt(lhs);
                const std::int64_t c = asInt(rhs);
                const bool bothBool = lhs.kind == ValueKind::Bool && rhs.kind == ValueKind::Bool;
                std::int64_t r = 0;
                switch (op) {
                    case BinaryOperator::Add: return PyValue::integer(checked(__builtin_add_overflow(a, c, &r), r, at));
                    case BinaryOperator::Sub: return PyValue::integer(checked(__builtin_sub_overflow(a, c, &r), r, at));
                    case BinaryOperator::Mul: return PyValue::integer(checked(__builtin_mul_overflow(a, c, &r), r, at));
                    case BinaryOperator::Div: return PyValue::floating(static_cast<double>(a) / static_cast<double>(c));
                    case BinaryOperator::FloorDiv:
                        return PyValue::integer(checked(a == kMinInt && c == -1, a == kMinInt && c == -1 ? 0 : floorDiv(a, c), at));
                    case BinaryOperator::Mod: return PyValue::integer(floorMod(a, c));
                    case BinaryOperator::Pow: {
                        if (c < 0) { return PyValue::floating(std::pow(static_cast<double>(a), static_cast<double>(c))); }
                        return PyValue::integer(power(a, c, at));
                    }
                    case BinaryOperator::LShift:
                    case BinaryOperator::RShift: {
                        if (c < 0 || c > 63) {
                            throw UnsupportedConstructError("shift count " + std::to_string(c) + " is outside [0, 63]", where(at));
                        }
                        if (op == BinaryOperator::RShift) { return PyValue::integer(a >> c); }
                        const std::int64_t shifted = a << c;
                        return PyValue::integer(checked((shifted >> c) != a, shifted, at));
                    }
                    case BinaryOperator::BitAnd: return bothBool ? PyValue::boolean(lhs.b && rhs.b) : PyValue::integer(a & c);
                    case BinaryOperator::BitOr: return bothBool ? PyValue::boolean(lhs.b || rhs.b) : PyValue::integer(a | c);
                    case BinaryOperator::BitXor: return bothBool ? PyValue::boolean(lhs.b != rhs.b) : PyValue::integer(a ^ c);
                    default: break;
                }
            }
        }
        if (op == BinaryOperator::Add) {
            if (lhs.kind == ValueKind::Str && rhs.kind == ValueKind::Str) { return PyValue::string(lhs.s + rhs.s); }
            if (isSequence(lhs) && lhs.kind == rhs.kind) {
                std::vector<PyValue> items = lhs.items;
                items.insert(items.end(), rhs.items.begin(), rhs.items.end());
                return lhs.kind == ValueKind::List ? PyValue::list(std::move(items)) : PyValue::tuple(std::move(items));
            }
        }
        if (op == BinaryOperator::Mul && isIntLike(rhs) && (isSequence(lhs) || lhs.kind == ValueKind::Str)) {
            const auto unit = static_cast<std::int64_t>(lhs.kind == ValueKind::Str ? lhs.s.size() : lhs.items.size());
            const std::int64_t n = unit == 0 ? 0 : std::max<std::int64_t>(asInt(rhs), 0);
            if (unit != 0 && n > kMaxRepeatLength / unit) {
                throw UnsupportedConstructError("repeated sequence in constant expression is longer than " +
                                                    std::to_string(kMaxRepeatLength) + " elements",
                                                where(at));
            }
            if (lhs.kind == ValueKind::Str) {
                std::string out;
                for (std::int64_t k = 0; k < n; ++k) { out += lhs.s; }
                return PyValue::string(std::move(out));
            }
            std::vector<PyValue> items;
            for (std::int64_t k = 0; k < n; ++k) { items.insert(items.end(), lhs.items.begin(), lhs.items.end()); }
            return lhs.kind == ValueKind::List ? PyValue::list(std::move(items)) : PyValue::tuple(std::move(items));
        }
        throw TypeMismatchError(std::string("unsupported operand type(s) for ") + ast::to_symbol(op) + ": '" +
                                    to_string(lhs.kind) + "' and '" + to_string(rhs.kind) + "'",
                                where(at));
    }

    bool ConstEvaluator::applyComparison(const BinaryOperator op, const PyValue &lhs, const PyValue &rhs,
                                         const ast::Node &at) const {
        const bool numeric = lhs.isNumber() && rhs.isNumber();
        switch (op) {
            case BinaryOperator::Eq:
                return numeric ? asDouble(lhs) == asDouble(rhs) : lhs == rhs;
            case BinaryOperator::Ne:
                return numeric ? asDouble(lhs) != asDouble(rhs) : lhs != rhs;
            case BinaryOperator::Is:
                return lhs.kind == rhs.kind && lhs == rhs;
            case BinaryOperator::IsNot:
                return !(lhs.kind == rhs.kind && lhs == rhs);
            case BinaryOperator::In:
            case BinaryOperator::NotIn: {
                bool found = false;
                if (isSequence(rhs)) {
                    for (const auto &item : rhs.items) {
                        if (applyComparison(BinaryOperator::Eq, lhs, item, at)) {
                            found = true;
                            break;
                        }
                    }
                } else if (rhs.kind == ValueKind::Str && lhs.kind == ValueKind::Str) {
                    found = rhs.s.find(lhs.s) != std::string::npos;
                } else {
                    throw TypeMismatchError(std::string("argument of type '") + to_string(rhs.kind) + "' is not iterable",
                                            where(at));
                }
                return op == BinaryOperator::In ? found : !found;
            }
            default:
                break;
        }
        int order = 0;
        if (numeric) {
            const double a = asDouble(lhs);
            const double c = asDouble(rhs);
            order = a < c ? -1 : (a > c ? 1 : 0);
        } else if (lhs.kind == ValueKind::Str && rhs.kind == ValueKind::Str) {
            order = lhs.s.compare(rhs.s);
        } else {
            throw TypeMismatchError(std::string("'") + ast::to_symbol(op) + "' not supported between instances of '" +
                                        to_string(lhs.kind) + "' and '" + to_string(rhs.kind) + "'",
                                    where(at));
        }
        switch (op) {
            case BinaryOperator::Lt: return order < 0;
            case BinaryOperator::Le: return order <= 0;
            case BinaryOperator::Gt: return order > 0;
            case BinaryOperator::Ge: return order >= 0;
            default: return false;
        }
    }

    PyValue ConstEvaluator::evalSubscript(const ast::Subscript &s) const {
        const PyValue base = evaluate(*s.value);
        if (base.kind == ValueKind::Type && base.type) {
            std::vector<PyValue> items;
            if (s.slice->kind == ast::NodeKind::TupleLiteral) {
                for (const auto &e : static_cast<const ast::TupleLiteral&>(*s.slice).elements) { items.push_back(evaluate(*e)); }
            } else {
                items.push_back(evaluate(*s.slice));
            }
            auto t = types::parameterize(*base.type, items);
            if (!t) {
                throw TypeMismatchError("invalid type subscript '" + base.type->toString() + "[...]'", where(s));
            }
            return PyValue::typeObject(std::move(t));
        }
        if (!isSequence(base) && base.kind != ValueKind::Str) {
            throw TypeMismatchError(std::string("'") + to_string(base.kind) + "' object is not subscriptable", where(s));
        }
        const auto len = static_cast<std::int64_t>(base.kind == ValueKind::Str ? base.s.size() : base.items.size());
        if (s.slice->kind == ast::NodeKind::Slice) {
            const auto &sl = static_cast<const ast::Slice&>(*s.slice);
            auto bound = [&](const std::unique_ptr<ast::Expr> &e) -> std::optional<std::int64_t> {
                if (!e) { return std::nullopt; }
                const PyValue v = evaluate(*e);
                if (v.isNone()) { return std::nullopt; }
                if (!isIntLike(v)) { throw TypeMismatchError("slice indices must be integers", where(*e)); }
                return asInt(v);
            };
            const std::int64_t step = bound(sl.step).value_or(1);
            if (step == 0) { throw TypeMismatchError("slice step cannot be zero", where(sl)); }
            auto clamp = [&](std::optional<std::int64_t> v, const std::int64_t dflt) {
                if (!v) { return dflt; }
                std::int64_t x = *v < 0 ? *v + len : *v;
                if (step > 0) { return x < 0 ? 0 : (x > len ? len : x); }
                return x < -1 ? -1 : (x >= len ? len - 1 : x);
            };
            const std::int64_t start = clamp(bound(sl.lower), step > 0 ? 0 : len - 1);
            const std::int64_t stop = clamp(bound(sl.upper), step > 0 ? len : -1);
            std::vector<PyValue> items;
            std::string chars;
            for (std::int64_t k = start; step > 0 ? k < stop : k > stop;) {
                if (base.kind == ValueKind::Str) { chars.push_back(base.s[static_cast<std::size_t>(k)]); }
                else { items.push_back(base.items[static_cast<std::size_t>(k)]); }
                // A step that overflows leaves the valid range either way.
                if (__builtin_add_overflow(k, step, &k)) { break; }
            }
            if (base.kind == ValueKind::Str) { return PyValue::string(std::move(chars)); }
            return base.kind == ValueKind::List ? PyValue::list(std::move(items)) : PyValue::tuple(std::move(items));
        }
        const PyValue index = evaluate(*s.slice);
        if (!isIntLike(index)) {
            throw TypeMismatchError(std::string("indices must be integers, not '") + to_string(index.kind) + "'", where(s));
        }
        const std::int64_t k = normalizeIndex(asInt(index), len);
        if (k < 0) { throw TypeMismatchError("index out of range", where(s)); }
        if (base.kind == ValueKind::Str) { return PyValue::string(std::string(1, base.s[static_cast<std::size_t>(k)])); }
        return base.items[static_cast<std::size_t>(k)];
    }

} // namespace gsc::constant
