/***
 * Name: gsc::ir::JsonWriter
 * Purpose: JSON rendering of lowered modules.
 */
#include "ir/JsonWriter.h"
#include <cmath>
#include <iomanip>
#include <sstream>

namespace gsc::ir {

    namespace {

        constexpr int kIndentStep = 2;

        std::string pad(const int n) { return std::string(static_cast<std::size_t>(n), ' '); }

        std::string str(const std::string &s) { return "\"" + jsonEscape(s) + "\""; }

        std::string num(const double v) {
            if (!std::isfinite(v)) { return "null"; }
            std::ostringstream os;
            os << std::setprecision(17) << v;
            return os.str();
        }

        template <typename T, typename F>
        std::string array(const std::vector<T> &items, F &&render) {
            std::string out = "[";
            for (std::size_t i = 0; i < items.size(); ++i) {
                if (i != 0) { out += ", "; }
                out += render(items[i]);
            }
            return out + "]";
        }

        std::string valueInfoJson(const ValueInfo &v) {
            std::string out = "{\"name\": " + str(v.name);
            if (v.type) { out += ", \"type\": " + str(v.type->toString()); }
            return out + "}";
        }

    } // namespace

    std::string jsonEscape(const std::string &s) {
        std::ostringstream os;
        for (const char c : s) {
            switch (c) {
                case '"': os << "\\\""; break;
                case '\\': os << "\\\\"; break;
                case '\n': os << "\\n"; break;
                case '\t': os << "\\t"; break;
                case '\r': os << "\\r"; break;
                default:
                    if (static_cast<unsigned char>(c) < 0x20) {
                        os << "\\u" << std::hex << std::setw(4) << std::setfill('0') << static_cast<int>(c) << std::dec;
                    } else {
                        os << c;
                    }
            }
        }
        return os.str();
    }

    void JsonWriter::write(const Module &m) {
        os_ << "{\n" << pad(kIndentStep) << "\"domain\": " << str(m.domain) << ",\n"
            << pad(kIndentStep) << "\"version\": " << m.version << ",\n";
        if (!m.docstring.empty()) { os_ << pad(kIndentStep) << "\"doc\": " << str(m.docstring) << ",\n"; }
        os_ << pad(kIndentStep) << "\"functions\": [";
        for (std::size_t i = 0; i < m.functions.size(); ++i) {
            os_ << (i == 0 ? "\n" : ",\n") << pad(2 * kIndentStep);
            writeFunction(*m.functions[i], 2 * kIndentStep);
        }
        os_ << "\n" << pad(kIndentStep) << "]\n}\n";
    }

    void JsonWriter::writeFunction(const Function &fn, const int indent) {
        const std::string in = pad(indent + kIndentStep);
        os_ << "{\n" << in << "\"name\": " << str(fn.name) << ",\n";
        os_ << in << "\"domain\": " << str(fn.domain) << ",\n";
        if (!fn.docstring.empty()) { os_ << in << "\"doc\": " << str(fn.docstring) << ",\n"; }
        os_ << in << "\"inputs\": " << array(fn.inputs, valueInfoJson) << ",\n";
        os_ << in << "\"outputs\": " << array(fn.outputs, valueInfoJson) << ",\n";
        os_ << in << "\"attributes\": [";
        for (std::size_t i = 0; i < fn.attrParams.size(); ++i) {
            const auto &p = fn.attrParams[i];
            os_ << (i == 0 ? "" : ", ") << "{\"name\": " << str(p.name) << ", \"type\": " << str(to_string(p.kind));
            if (p.defaultValue) {
                os_ << ", \"default\": ";
                writeAttr(*p.defaultValue, indent + kIndentStep);
            }
            os_ << "}";
        }
        os_ << "],\n";
        os_ << in << "\"opset_import\": {";
        bool first = true;
        for (const auto& [domain, version] : collectOpsetImports(fn)) {
            os_ << (first ? "" : ", ") << str(domain) << ": " << version;
            first = false;
        }
        os_ << "},\n";
        os_ << in << "\"functions\": "
            << array(fn.functions, [](const std::shared_ptr<const Function> &f) { return str(f->name); }) << ",\n";
        os_ << in << "\"nodes\": [";
        for (std::size_t i = 0; i < fn.stmts.size(); ++i) {
            os_ << (i == 0 ? "\n" : ",\n") << pad(indent + 2 * kIndentStep);
            writeStmt(fn.stmts[i], indent + 2 * kIndentStep);
        }
        if (!fn.stmts.empty()) { os_ << "\n" << in; }
        os_ << "]\n" << pad(indent) << "}";
    }

    void JsonWriter::writeStmt(const Stmt &s, const int indent) {
        const auto quote = [](const std::string &v) { return str(v); };
        os_ << "{\"op_type\": " << str(s.opType) << ", \"domain\": " << str(s.domain) << ", \"version\": " << s.version
            << ", \"inputs\": " << array(s.inputs, quote) << ", \"outputs\": " << array(s.outputs, quote);
        if (!s.attrs.empty()) {
            os_ << ", \"attributes\": [";
            for (std::size_t i = 0; i < s.attrs.size(); ++i) {
                if (i != 0) { os_ << ", "; }
                writeAttr(s.attrs[i], indent);
            }
            os_ << "]";
        }
        os_ << "}";
    }

    void JsonWriter::writeAttr(const Attr &a, const int indent) {
        const auto intText = [](std::int64_t v) { return std::to_string(v); };
        os_ << "{\"name\": " << str(a.name) << ", \"type\": " << str(to_string(a.kind));
        if (a.isRef()) {
            os_ << ", \"ref_attr_name\": " << str(a.refAttrName) << "}";
            return;
        }
        os_ << ", \"value\": ";
        switch (a.kind) {
            case AttrKind::Int: os_ << a.i; break;
            case AttrKind::Float: os_ << num(a.f); break;
            case AttrKind::String: os_ << str(a.s); break;
            case AttrKind::Ints: os_ << array(a.ints, intText); break;
            case AttrKind::Floats: os_ << array(a.floats, num); break;
            case AttrKind::Strings: os_ << array(a.strings, str); break;
            case AttrKind::Tensor:
                if (a.tensor) {
                    const TensorConst &t = *a.tensor;
                    os_ << "{\"elem_type\": " << str(elemTypeTag(t.elemType)) << ", \"dims\": " << array(t.dims, intText);
                    if (t.elemType == ElemType::String) { os_ << ", \"strings\": " << array(t.strings, str); }
                    else if (!t.floats.empty()) { os_ << ", \"floats\": " << array(t.floats, num); }
                    else { os_ << ", \"ints\": " << array(t.ints, intText); }
                    os_ << "}";
                } else {
                    os_ << "null";
                }
                break;
            case AttrKind::Graph:
                if (a.graph) { writeFunction(*a.graph, indent); }
                else { os_ << "null"; }
                break;
            case AttrKind::Undefined: os_ << "null"; break;
        }
        os_ << "}";
    }

} // namespace gsc::ir
