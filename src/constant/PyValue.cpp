/***
 * Name: gsc::constant::PyValue
 * Purpose: Constructors, truthiness, repr and equality for literal values.
 */
#include "constant/PyValue.h"
#include <cmath>
#include <sstream>
#include <utility>

namespace gsc::constant {

    const char *to_string(const ValueKind k) {
        switch (k) {
            case ValueKind::None: return "NoneType";
            case ValueKind::Bool: return "bool";
            case ValueKind::Int: return "int";
            case ValueKind::Float: return "float";
            case ValueKind::Str: return "str";
            case ValueKind::List: return "list";
            case ValueKind::Tuple: return "tuple";
            case ValueKind::Opset: return "opset";
            case ValueKind::Op: return "op";
            case ValueKind::Type: return "type";
            case ValueKind::Namespace: return "module";
        }
        return "?";
    }

    PyValue PyValue::boolean(const bool v) {
        PyValue p;
        p.kind = ValueKind::Bool;
        p.b = v;
        return p;
    }

    PyValue PyValue::integer(const std::int64_t v) {
        PyValue p;
        p.kind = ValueKind::Int;
        p.i = v;
        return p;
    }

    PyValue PyValue::floating(const double v) {
        PyValue p;
        p.kind = ValueKind::Float;
        p.f = v;
        return p;
    }

    PyValue PyValue::string(std::string v) {
        PyValue p;
        p.kind = ValueKind::Str;
        p.s = std::move(v);
        return p;
    }

    PyValue PyValue::list(std::vector<PyValue> v) {
        PyValue p;
        p.kind = ValueKind::List;
        p.items = std::move(v);
        return p;
    }

    PyValue PyValue::tuple(std::vector<PyValue> v) {
        PyValue p;
        p.kind = ValueKind::Tuple;
        p.items = std::move(v);
        return p;
    }

    PyValue PyValue::makeOpset(values::Opset o) {
        PyValue p;
        p.kind = ValueKind::Opset;
        p.opset = std::move(o);
        return p;
    }

    PyValue PyValue::op(values::Opset o, std::string name) {
        PyValue p;
        p.kind = ValueKind::Op;
        p.opset = std::move(o);
        p.s = std::move(name);
        return p;
    }

    PyValue PyValue::typeObject(types::TypePtr t) {
        PyValue p;
        p.kind = ValueKind::Type;
        p.type = std::move(t);
        return p;
    }

    PyValue PyValue::ns(std::string name, Members m) {
        PyValue p;
        p.kind = ValueKind::Namespace;
        p.s = std::move(name);
        p.members = std::make_shared<const Members>(std::move(m));
        return p;
    }

    bool PyValue::truthy() const {
        switch (kind) {
            case ValueKind::None: return false;
            case ValueKind::Bool: return b;
            case ValueKind::Int: return i != 0;
            case ValueKind::Float: return f != 0.0;
            case ValueKind::Str: return !s.empty();
            case ValueKind::List:
            case ValueKind::Tuple: return !items.empty();
            default: return true;
        }
    }

    namespace {
        std::string floatRepr(const double v) {
            if (std::isinf(v)) { return v > 0 ? "inf" : "-inf"; }
            if (std::isnan(v)) { return "nan"; }
            std::ostringstream os;
            os.precision(17);
            os << v;
            std::string text = os.str();
            // Shortest form that still reads back as the same double
            for (int prec = 1; prec < 17; ++prec) {
                std::ostringstream trial;
                trial.precision(prec);
                trial << v;
                if (std::stod(trial.str()) == v) {
                    text = trial.str();
                    break;
                }
            }
            if (text.find_first_of(".eni") == std::string::npos) { text += ".0"; }
            return text;
        }
    } // namespace

    std::string PyValue::repr() const {
        switch (kind) {
            case ValueKind::None: return "None";
            case ValueKind::Bool: return b ? "True" : "False";
            case ValueKind::Int: return std::to_string(i);
            case ValueKind::Float: return floatRepr(f);
            case ValueKind::Str: return "'" + s + "'";
            case ValueKind::List:
            case ValueKind::Tuple: {
                std::string out = kind == ValueKind::List ? "[" : "(";
                for (std::size_t idx = 0; idx < items.size(); ++idx) {
                    if (idx != 0) { out += ", "; }
                    out += items[idx].repr();
                }
                if (kind == ValueKind::Tuple && items.size() == 1) { out += ","; }
                out += kind == ValueKind::List ? "]" : ")";
                return out;
            }
            case ValueKind::Opset: return opset.str();
            case ValueKind::Op: return opset.str() + "." + s;
            case ValueKind::Type: return type ? type->toString() : "type";
            case ValueKind::Namespace: return "<module '" + s + "'>";
        }
        return "?";
    }

    bool PyValue::operator==(const PyValue &other) const {
        if (kind != other.kind) { return false; }
        switch (kind) {
            case ValueKind::None: return true;
            case ValueKind::Bool: return b == other.b;
            case ValueKind::Int: return i == other.i;
            case ValueKind::Float: return f == other.f;
            case ValueKind::Str: return s == other.s;
            case ValueKind::List:
            case ValueKind::Tuple: return items == other.items;
            case ValueKind::Opset: return opset == other.opset;
            case ValueKind::Op: return opset == other.opset && s == other.s;
            case ValueKind::Type: return type == other.type || (type && other.type && *type == *other.type);
            case ValueKind::Namespace: return members == other.members;
        }
        return false;
    }

} // namespace gsc::constant
