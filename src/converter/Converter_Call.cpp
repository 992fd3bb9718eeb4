/***
 * Name: gsc::converter::Converter (calls)
 * Purpose: Resolve callees, split arguments and lower attribute values.
 * Theory of Operation:
 *   `opset.Op(...)` fixes the default opset on first use. A bare name is a
 *   script function, an imported operator, or else an operator of the
 *   default opset (with a warning). When the callee has a schema, its
 *   parameter list decides which arguments are inputs and which are
 *   attributes; otherwise positional arguments are inputs and keywords are
 *   attributes. Constant inputs then go through autocast.
 */
#include "converter/Converter.h"
#include "gsc/exceptions/captured_variable_mutation_error.h"
#include "gsc/exceptions/type_mismatch_error.h"
#include "gsc/exceptions/unsupported_construct_error.h"
#include "types/TypeInfo.h"

namespace gsc::converter {

    using constant::PyValue;
    using constant::ValueKind;
    using exceptions::UnsupportedConstructError;
    using values::Binding;
    using values::BindingKind;
    using values::ValueHandle;

    CallPlan Converter::translateCall(const ast::Call &c) {
        CallPlan plan;
        plan.callee = translateCallee(*c.callee);
        const std::vector<schema::ParamSchema> params = paramSchemasOf(plan.callee);

        std::vector<const ast::Expr*> positional;
        positional.reserve(c.args.size());
        for (const auto &a : c.args) { positional.push_back(a.get()); }
        std::vector<std::pair<std::string, const ast::Expr*>> keywords;
        for (const auto &kw : c.keywords) { keywords.emplace_back(kw.name, kw.value.get()); }

        std::vector<ValueHandle> args;
        if (!params.empty()) {
            const auto separated = schema::separateInputsAndAttributes<const ast::Expr*>(params, positional, keywords, where(c));
            for (const ast::Expr *e : separated.inputs) { args.push_back(translateOptExpr(*e)); }
            for (const auto& [name, e] : separated.attributes) {
                if (auto attr = translateAttr(name, *e)) { plan.attrs.push_back(std::move(*attr)); }
            }
        } else {
            for (const ast::Expr *e : positional) { args.push_back(translateOptExpr(*e)); }
            for (const auto& [name, e] : keywords) {
                if (auto attr = translateAttr(name, *e)) { plan.attrs.push_back(std::move(*attr)); }
            }
        }
        plan.inputs = castInputs(plan.callee.schema, args, c);
        return plan;
    }

    CalleeRef Converter::translateCallee(const ast::Expr &callee) {
        if (callee.kind == ast::NodeKind::Attribute) {
            const auto &a = static_cast<const ast::Attribute&>(callee);
            const values::Opset opset = translateOpsetExpr(*a.value);
            setDefaultOpset(opset, a);
            CalleeRef ref = opCallee(opset, a.attr);
            if (ref.schema == nullptr && opset.domain.empty()) {
                warn(a, "'" + a.attr + "' is not a known op in '" + opset.str() + "'");
            }
            return ref;
        }
        if (callee.kind == ast::NodeKind::Name) {
            const auto &n = static_cast<const ast::Name&>(callee);
            const Binding *b = lookup(n.id);
            if (b == nullptr) {
                CalleeRef ref = opCallee(defaultOpset(n), n.id);
                if (ref.schema == nullptr) { warn(n, "Unknown function name '" + n.id + "'. The graph may not work."); }
                return ref;
            }
            if (b->kind == BindingKind::Function) {
                if (b->function->nested) { checkCaptures(*b->function, n); }
                return functionCallee(b->function);
            }
            if (b->kind == BindingKind::OpRef) { return opCallee(b->opset, b->name); }
            throw UnsupportedConstructError("'" + n.id + "' is not callable (bound to a " + b->describe() + ")", where(n));
        }
        throw UnsupportedConstructError(std::string("invalid callee: ") + ast::to_string(callee.kind), where(callee));
    }

    values::Opset Converter::translateOpsetExpr(const ast::Expr &e) {
        if (e.kind == ast::NodeKind::Name || e.kind == ast::NodeKind::Attribute) {
            const PyValue v = evalConstant(e);
            if (v.kind == ValueKind::Opset) { return v.opset; }
            throw exceptions::TypeMismatchError("expected an opset, found " + v.repr(), where(e));
        }
        throw UnsupportedConstructError("invalid opset expression", where(e));
    }

    CalleeRef Converter::opCallee(const values::Opset &opset, const std::string &name) const {
        CalleeRef ref;
        ref.opset = opset;
        ref.name = name;
        ref.schema = schemas_.lookup(opset.domain, name, opset.version);
        return ref;
    }

    CalleeRef Converter::functionCallee(const std::shared_ptr<const values::FunctionRef> &fn) const {
        const ir::Function &graph = *fn->function;
        auto sig = std::make_shared<schema::OpSchema>();
        sig->domain = options_.domain;
        sig->name = graph.name;
        sig->sinceVersion = options_.version;
        for (const auto &in : graph.inputs) {
            // Untyped inputs get a type variable of their own, which never binds a sibling.
            const std::string typeStr = in.type ? types::onnxTypeString(*in.type) : std::string{};
            sig->inputs.push_back(schema::FormalParameter{in.name, typeStr.empty() ? "T_" + in.name : typeStr,
                                                                     schema::FormalOption::Single, true});
        }
        for (const auto &out : graph.outputs) {
            sig->outputs.push_back(schema::FormalParameter{out.name, "T_" + out.name, schema::FormalOption::Single, true});
        }
        for (const auto &p : graph.attrParams) {
            const bool hasDefault = p.defaultValue.has_value();
            sig->attributes.push_back(schema::AttributeSchema{p.name, p.kind, !hasDefault, hasDefault});
        }
        CalleeRef ref;
        ref.opset = values::Opset{options_.domain, options_.version};
        ref.name = graph.name;
        ref.ownedSchema = sig;
        ref.schema = sig.get();
        ref.function = fn;
        return ref;
    }

    std::vector<schema::ParamSchema> Converter::paramSchemasOf(const CalleeRef &callee) const {
        if (callee.schema == nullptr) { return {}; }
        return schema::paramSchemasOf(*callee.schema);
    }

    std::optional<ir::Attr> Converter::translateAttr(const std::string &attrName, const ast::Expr &e) {
        if (e.kind == ast::NodeKind::Name) {
            const auto &n = static_cast<const ast::Name&>(e);
            if (const Binding *b = lookup(n.id)) {
                if (b->kind == BindingKind::AttrRef) {
                    const ir::AttrKind kind = b->type ? types::toAttrKind(*b->type) : ir::AttrKind::Undefined;
                    return builder_.makeAttrRef(attrName, b->name, kind);
                }
                if (b->kind == BindingKind::Function) {
                    if (b->function->nested) { checkCaptures(*b->function, n); }
                    return builder_.makeGraphAttr(attrName, b->function->function);
                }
            }
        }
        const PyValue v = evalConstant(e);
        if (v.isNone()) { return std::nullopt; }
        auto attr = builder_.makeAttr(attrName, v);
        if (!attr) {
            throw exceptions::TypeMismatchError("value " + v.repr() + " cannot be used as attribute '" + attrName + "'",
                                                where(e));
        }
        return attr;
    }

    void Converter::checkCaptures(const values::FunctionRef &fn, const ast::Node &at) const {
        for (const auto& [name, previous] : fn.captures) {
            const Binding *current = lookup(name);
            if (current == nullptr || !values::sameValue(*current, previous)) {
                throw exceptions::CapturedVariableMutationError(
                    "outer scope variable '" + name + "' referenced by function '" + fn.function->name + "' was modified",
                    where(at));
            }
        }
    }

} // namespace gsc::converter
