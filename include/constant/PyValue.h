/***
 * Name: gsc::constant::PyValue
 * Purpose: A literal value known at translation time.
 * Theory of Operation:
 *   Covers the scalar and container literals a script may write plus the
 *   module-level objects the builtin catalog provides: opsets, operators of
 *   an opset, type objects and namespaces (imported modules). Values are
 *   plain data and compare by value; namespaces and types compare by
 *   identity of their shared payload.
 */
#pragma once

#include "types/TypeInfo.h"
#include "values/Opset.h"
#include <cstdint>
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace gsc::constant {

    enum class ValueKind { None, Bool, Int, Float, Str, List, Tuple, Opset, Op, Type, Namespace };

    const char *to_string(ValueKind k);

    struct PyValue;
    using Members = std::map<std::string, PyValue>;

    struct PyValue {
        ValueKind kind{ValueKind::None};
        bool b{false};
        std::int64_t i{0};
        double f{0.0};
        std::string s;               // Str payload, Op name, Namespace name
        std::vector<PyValue> items;  // List/Tuple elements
        values::Opset opset;         // Opset, and the owning opset of an Op
        types::TypePtr type;         // Type
        std::shared_ptr<const Members> members; // Namespace

        static PyValue none() { return PyValue{}; }
        static PyValue boolean(bool v);
        static PyValue integer(std::int64_t v);
        static PyValue floating(double v);
        static PyValue string(std::string v);
        static PyValue list(std::vector<PyValue> v);
        static PyValue tuple(std::vector<PyValue> v);
        static PyValue makeOpset(values::Opset o);
        static PyValue op(values::Opset o, std::string name);
        static PyValue typeObject(types::TypePtr t);
        static PyValue ns(std::string name, Members m);

        bool isNone() const { return kind == ValueKind::None; }
        bool isNumber() const { return kind == ValueKind::Bool || kind == ValueKind::Int || kind == ValueKind::Float; }
        // Python truthiness for literal kinds.
        bool truthy() const;
        // Python repr() style spelling, used for diagnostics and constant names.
        std::string repr() const;

        bool operator==(const PyValue &other) const;
        bool operator!=(const PyValue &other) const { return !(*this == other); }
    };

} // namespace gsc::constant
