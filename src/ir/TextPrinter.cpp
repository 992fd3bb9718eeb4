/***
 * Name: gsc::ir::TextPrinter
 * Purpose: Text rendering of graphs.
 */
#include "ir/TextPrinter.h"
#include "constant/PyValue.h"
#include <sstream>

namespace gsc::ir {

    namespace {

        constexpr int kIndentStep = 2;

        std::string pad(const int n) { return std::string(static_cast<std::size_t>(n), ' '); }

        std::string quoted(const std::string &s) {
            std::string out = "\"";
            for (const char c : s) {
                if (c == '"' || c == '\\') { out.push_back('\\'); }
                if (c == '\n') {
                    out += "\\n";
                    continue;
                }
                out.push_back(c);
            }
            out.push_back('"');
            return out;
        }

        std::string floatText(const double v) { return constant::PyValue::floating(v).repr(); }

        template <typename T, typename F>
        std::string joined(const std::vector<T> &items, F &&render) {
            std::string out;
            for (std::size_t i = 0; i < items.size(); ++i) {
                if (i != 0) { out += ", "; }
                out += render(items[i]);
            }
            return out;
        }

        std::string valueInfoText(const ValueInfo &v) {
            if (v.type) { return v.type->toString() + " " + v.name; }
            return v.name;
        }

        std::string tensorText(const TensorConst &t) {
            std::string out = elemTypeTag(t.elemType);
            if (!t.dims.empty()) {
                out += "[" + joined(t.dims, [](std::int64_t d) { return std::to_string(d); }) + "]";
            }
            out += " {";
            if (t.elemType == ElemType::String) {
                out += joined(t.strings, [](const std::string &s) { return quoted(s); });
            } else if (t.elemType == ElemType::Float || t.elemType == ElemType::Double || t.elemType == ElemType::Float16) {
                out += joined(t.floats, [](double d) { return floatText(d); });
            } else {
                out += joined(t.ints, [](std::int64_t d) { return std::to_string(d); });
            }
            out += "}";
            return out;
        }

    } // namespace

    void TextPrinter::print(const Module &m) {
        os_ << "<\n" << pad(kIndentStep) << "domain: " << quoted(m.domain) << ",\n"
            << pad(kIndentStep) << "version: " << m.version << "\n>\n";
        for (const auto &fn : m.functions) {
            os_ << "\n";
            print(*fn);
        }
    }

    void TextPrinter::print(const Function &fn) { printGraph(fn, 0, true); }

    void TextPrinter::printGraph(const Function &fn, const int indent, const bool topLevel) {
        os_ << fn.name << " (" << joined(fn.inputs, valueInfoText) << ") => ("
            << joined(fn.outputs, valueInfoText) << ")";
        if (topLevel) {
            os_ << "\n";
            if (!fn.attrParams.empty()) {
                os_ << pad(indent + kIndentStep) << "<";
                os_ << joined(fn.attrParams, [](const AttrParameter &p) {
                    std::string out = p.name + ": " + to_string(p.kind);
                    if (p.defaultValue) {
                        std::ostringstream tmp;
                        TextPrinter inner(tmp);
                        inner.printAttrValue(*p.defaultValue, 0);
                        out += " = " + tmp.str();
                    }
                    return out;
                });
                os_ << ">\n";
            }
            const auto imports = collectOpsetImports(fn);
            if (!imports.empty()) {
                os_ << pad(indent + kIndentStep) << "opset_import: [";
                bool first = true;
                for (const auto& [domain, version] : imports) {
                    if (!first) { os_ << ", "; }
                    first = false;
                    os_ << quoted(domain) << " : " << version;
                }
                os_ << "]\n";
            }
            if (!fn.functions.empty()) {
                os_ << pad(indent + kIndentStep) << "functions: ["
                    << joined(fn.functions, [](const std::shared_ptr<const Function> &f) { return f->name; }) << "]\n";
            }
            os_ << pad(indent) << "{\n";
        } else {
            os_ << " {\n";
        }
        for (const auto &s : fn.stmts) { printStmt(s, indent + kIndentStep); }
        os_ << pad(indent) << "}";
        if (topLevel) { os_ << "\n"; }
    }

    void TextPrinter::printStmt(const Stmt &s, const int indent) {
        os_ << pad(indent);
        if (!s.outputs.empty()) { os_ << joined(s.outputs, [](const std::string &o) { return o; }) << " = "; }
        if (!s.domain.empty()) { os_ << s.domain << "."; }
        os_ << s.opType;
        if (!s.attrs.empty()) {
            os_ << " <";
            for (std::size_t i = 0; i < s.attrs.size(); ++i) {
                if (i != 0) { os_ << ", "; }
                os_ << s.attrs[i].name << " = ";
                printAttrValue(s.attrs[i], indent);
            }
            os_ << ">";
        }
        os_ << " (" << joined(s.inputs, [](const std::string &in) { return in; }) << ")\n";
    }

    void TextPrinter::printAttrValue(const Attr &a, const int indent) {
        if (a.isRef()) {
            os_ << "@" << a.refAttrName;
            return;
        }
        switch (a.kind) {
            case AttrKind::Int: os_ << a.i; break;
            case AttrKind::Float: os_ << floatText(a.f); break;
            case AttrKind::String: os_ << quoted(a.s); break;
            case AttrKind::Ints: os_ << "[" << joined(a.ints, [](std::int64_t v) { return std::to_string(v); }) << "]"; break;
            case AttrKind::Floats: os_ << "[" << joined(a.floats, [](double v) { return floatText(v); }) << "]"; break;
            case AttrKind::Strings: os_ << "[" << joined(a.strings, [](const std::string &v) { return quoted(v); }) << "]"; break;
            case AttrKind::Tensor:
                if (a.tensor) { os_ << tensorText(*a.tensor); }
                break;
            case AttrKind::Graph:
                if (a.graph) {
                    os_ << "graph ";
                    printGraph(*a.graph, indent + kIndentStep, false);
                }
                break;
            case AttrKind::Undefined: os_ << "?"; break;
        }
    }

    std::string toText(const Function &fn) {
        std::ostringstream os;
        TextPrinter printer(os);
        printer.print(fn);
        return os.str();
    }

} // namespace gsc::ir
