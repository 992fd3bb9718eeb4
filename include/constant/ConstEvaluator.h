/***
 * Name: gsc::constant::ConstEvaluator
 * Purpose: Evaluate literal expressions at translation time.
 * Inputs:
 *   - lookup: resolves a Name to a literal value (nullopt when unbound; may
 *     throw when the name is bound to something that is not a literal)
 *   - functionName: enclosing script function, for diagnostics
 * Outputs: PyValue results; TranslationError subclasses on failure
 * Theory of Operation:
 *   A narrow evaluator: literals, list/tuple displays, arithmetic, bitwise,
 *   boolean and comparison operators over literals, indexing and slicing of
 *   lists/tuples/strings, attribute access on modules and opsets, and
 *   subscripting of type objects (annotations). Calls are never evaluated.
 *   Names the lookup does not know fall back to the builtin type names.
 */
#pragma once

#include "ast/Nodes.h"
#include "constant/PyValue.h"
#include "sema/Diagnostic.h"
#include <cstdint>
#include <functional>
#include <optional>
#include <string>

namespace gsc::constant {

    class ConstEvaluator {
    public:
        using Lookup = std::function<std::optional<PyValue>(const ast::Name&)>;

        explicit ConstEvaluator(Lookup lookup, std::string functionName = {});

        PyValue evaluate(const ast::Expr &expr) const;

        // Literals, lists of constants and operators over constants; names and
        // calls are never constant.
        static bool isConstantExpr(const ast::Expr &expr);

    private:
        PyValue evalName(const ast::Name &n) const;
        PyValue evalAttribute(const ast::Attribute &a) const;
        PyValue evalUnary(const ast::Unary &u) const;
        PyValue evalBinary(const ast::Binary &b) const;
        PyValue evalCompare(const ast::Compare &c) const;
        PyValue evalSubscript(const ast::Subscript &s) const;
        PyValue applyBinary(ast::BinaryOperator op, const PyValue &lhs, const PyValue &rhs, const ast::Node &at) const;
        bool applyComparison(ast::BinaryOperator op, const PyValue &lhs, const PyValue &rhs, const ast::Node &at) const;

        // Throws UnsupportedConstructError when an int64 operation overflowed. value may be
        // written by an overflow builtin in the same call expression.
        std::int64_t checked(bool overflowed, const std::int64_t &value, const ast::Node &at) const;
        std::int64_t power(std::int64_t base, std::int64_t exponent, const ast::Node &at) const;
        sema::Diagnostic where(const ast::Node &n) const;

        Lookup lookup_;
        std::string function_;
    };

} // namespace gsc::constant
