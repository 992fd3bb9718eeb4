/***
 * Name: gsc::ir::GraphBuilder
 * Purpose: Graph mutation and attribute construction helpers.
 */
#include "ir/GraphBuilder.h"
#include <utility>

namespace gsc::ir {

    using constant::PyValue;
    using constant::ValueKind;

    std::unique_ptr<Function> GraphBuilder::newFunction(const std::string &name, const std::string &domain) const {
        auto fn = std::make_unique<Function>();
        fn->name = name;
        fn->domain = domain;
        return fn;
    }

    void GraphBuilder::addStmt(Function &fn, Stmt stmt) const {
        for (const auto &callee : stmt.functions) { addFunction(fn, callee); }
        fn.stmts.push_back(std::move(stmt));
    }

    void GraphBuilder::addInput(Function &fn, const std::string &name, types::TypePtr type) const {
        fn.inputs.push_back(ValueInfo{name, std::move(type)});
    }

    void GraphBuilder::addOutput(Function &fn, const std::string &name, types::TypePtr type) const {
        fn.outputs.push_back(ValueInfo{name, std::move(type)});
    }

    void GraphBuilder::addAttrParameter(Function &fn, const std::string &name, const AttrKind kind,
                                        std::optional<Attr> defaultValue) const {
        fn.attrParams.push_back(AttrParameter{name, kind, std::move(defaultValue)});
    }

    void GraphBuilder::addFunction(Function &fn, const std::shared_ptr<const Function> &callee) const {
        if (!callee || fn.findFunction(callee->name) != nullptr) { return; }
        fn.functions.push_back(callee);
    }

    std::optional<Attr> GraphBuilder::makeAttr(const std::string &name, const PyValue &value) const {
        Attr a;
        a.name = name;
        switch (value.kind) {
            case ValueKind::Bool:
                a.kind = AttrKind::Int;
                a.i = value.b ? 1 : 0;
                return a;
            case ValueKind::Int:
                a.kind = AttrKind::Int;
                a.i = value.i;
                return a;
            case ValueKind::Float:
                a.kind = AttrKind::Float;
                a.f = value.f;
                return a;
            case ValueKind::Str:
                a.kind = AttrKind::String;
                a.s = value.s;
                return a;
            case ValueKind::List:
            case ValueKind::Tuple: {
                bool anyFloat = false;
                bool allStr = !value.items.empty();
                for (const auto &item : value.items) {
                    if (item.kind == ValueKind::Float) { anyFloat = true; }
                    else if (item.kind == ValueKind::Str) { continue; }
                    else if (item.kind != ValueKind::Int && item.kind != ValueKind::Bool) { return std::nullopt; }
                    allStr = false;
                }
                if (allStr) {
                    a.kind = AttrKind::Strings;
                    for (const auto &item : value.items) { a.strings.push_back(item.s); }
                    return a;
                }
                for (const auto &item : value.items) {
                    if (item.kind == ValueKind::Str) { return std::nullopt; }
                }
                if (anyFloat) {
                    a.kind = AttrKind::Floats;
                    for (const auto &item : value.items) {
                        a.floats.push_back(item.kind == ValueKind::Float ? item.f
                                                                         : static_cast<double>(item.kind == ValueKind::Bool ? item.b : item.i));
                    }
                    return a;
                }
                a.kind = AttrKind::Ints;
                for (const auto &item : value.items) { a.ints.push_back(item.kind == ValueKind::Bool ? (item.b ? 1 : 0) : item.i); }
                return a;
            }
            default:
                return std::nullopt;
        }
    }

    Attr GraphBuilder::makeGraphAttr(const std::string &name, std::shared_ptr<const Function> graph) const {
        Attr a;
        a.name = name;
        a.kind = AttrKind::Graph;
        a.graph = std::move(graph);
        return a;
    }

    Attr GraphBuilder::makeTensorAttr(const std::string &name, TensorConst tensor) const {
        Attr a;
        a.name = name;
        a.kind = AttrKind::Tensor;
        a.tensor = std::move(tensor);
        return a;
    }

    Attr GraphBuilder::makeAttrRef(const std::string &name, const std::string &refAttrName, const AttrKind kind) const {
        Attr a;
        a.name = name;
        a.kind = kind;
        a.refAttrName = refAttrName;
        return a;
    }

} // namespace gsc::ir
