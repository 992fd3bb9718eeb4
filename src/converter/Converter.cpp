/***
 * Name: gsc::converter::Converter (state, scopes, emission)
 * Purpose: Scope management, diagnostics, opset tracking and node emission.
 */
#include "converter/Converter.h"
#include "autocast/Promotion.h"
#include "autocast/StaticCast.h"
#include "constant/ConstEvaluator.h"
#include "gsc/exceptions/unsupported_construct_error.h"
#include <cstdint>
#include <utility>

namespace gsc::converter {

    using constant::PyValue;
    using constant::ValueKind;
    using exceptions::UnsupportedConstructError;
    using values::Binding;
    using values::BindingKind;
    using values::ValueHandle;

    Converter::Converter(const schema::ISchemaRegistry &schemas, ConverterOptions options)
        : schemas_(schemas), options_(std::move(options)), defaultOpset_(options_.defaultOpset) {}

    void Converter::bindGlobal(const std::string &name, Binding binding) {
        trace("global " + name + " -> " + binding.describe());
        globals_[name] = std::move(binding);
    }

    void Converter::initFunctionTranslation(const ast::FunctionDef &fn) {
        outer_.clear();
        scopes_.reset();
        names_.reset();
        returnTypes_.reset();
        functionName_ = fn.name;
        current_ = builder_.newFunction(fn.name, options_.domain);
        scopes_.push();
        trace("begin function " + fn.name);
    }

    void Converter::enterScope(const std::string &name) {
        outer_.push_back(std::move(current_));
        current_ = builder_.newFunction(name, "");
        scopes_.push();
        trace("enter scope " + name + " depth=" + std::to_string(scopes_.depth()));
    }

    std::shared_ptr<ir::Function> Converter::exitScope() {
        trace("exit scope " + current_->name + " depth=" + std::to_string(scopes_.depth()));
        std::shared_ptr<ir::Function> graph = std::move(current_);
        current_ = std::move(outer_.back());
        outer_.pop_back();
        scopes_.pop();
        return graph;
    }

    void Converter::bind(const std::string &name, Binding binding) {
        trace("bind " + name + " -> " + binding.describe());
        scopes_.bind(name, std::move(binding));
    }

    const Binding *Converter::lookup(const std::string &name) const {
        if (const Binding *local = scopes_.lookup(name)) { return local; }
        const auto it = globals_.find(name);
        return it == globals_.end() ? nullptr : &it->second;
    }

    sema::Diagnostic Converter::where(const ast::Node &n) const {
        return sema::Diagnostic{"", n.file.empty() ? options_.fileName : n.file, n.line, n.col, functionName_};
    }

    sema::Provenance Converter::provenance(const ast::Node &n) const {
        return sema::Provenance{n.file.empty() ? options_.fileName : n.file, n.line, n.col};
    }

    void Converter::warn(const ast::Node &n, const std::string &msg) {
        sema::Diagnostic d = where(n);
        d.message = msg;
        trace("warning " + msg);
        warnings_.push_back(std::move(d));
    }

    void Converter::trace(const std::string &event) const {
        if (trace_ != nullptr) { *trace_ << "[translate] " << event << '\n'; }
    }

    const values::Opset &Converter::defaultOpset(const ast::Node &at) const {
        if (!defaultOpset_) {
            throw UnsupportedConstructError(
                "a default opset must be specified: call an operator through an opset (e.g. opset18.Add) or pass --opset",
                where(at));
        }
        return *defaultOpset_;
    }

    void Converter::setDefaultOpset(const values::Opset &opset, const ast::Node &at) {
        if (!opset.domain.empty()) { return; }
        if (defaultOpset_) {
            if (*defaultOpset_ != opset) {
                throw UnsupportedConstructError("two distinct opsets were used (" + opset.str() + " != " +
                                                    defaultOpset_->str() + ")",
                                                where(at));
            }
            return;
        }
        trace("default opset " + opset.str());
        defaultOpset_ = opset;
    }

    PyValue Converter::evalConstant(const ast::Expr &e) const {
        const constant::ConstEvaluator evaluator(
            [this](const ast::Name &n) -> std::optional<PyValue> {
                const Binding *b = lookup(n.id);
                if (b == nullptr) { return std::nullopt; }
                switch (b->kind) {
                    case BindingKind::Constant: return b->constant;
                    case BindingKind::OpRef: return PyValue::op(b->opset, b->name);
                    default:
                        throw UnsupportedConstructError("'" + n.id + "' is bound to a " + b->describe() +
                                                            ", not a compile-time constant",
                                                        where(n));
                }
            },
            functionName_);
        return evaluator.evaluate(e);
    }

    types::TypePtr Converter::evalAnnotation(const ast::Expr &e) {
        const PyValue v = evalConstant(e);
        if (v.kind != ValueKind::Type || !v.type || !types::isValidType(*v.type)) { return nullptr; }
        return v.type;
    }

    void Converter::emit(std::vector<std::string> outputs, const std::string &opType, std::vector<std::string> inputs,
                         std::vector<ir::Attr> attrs, const ast::Node &at) {
        const values::Opset &opset = defaultOpset(at);
        ir::Stmt stmt;
        stmt.domain = opset.domain;
        stmt.opType = opType;
        stmt.version = opset.version;
        stmt.inputs = std::move(inputs);
        stmt.outputs = std::move(outputs);
        stmt.attrs = std::move(attrs);
        stmt.line = at.line;
        builder_.addStmt(*current_, std::move(stmt));
    }

    void Converter::emitCall(std::vector<std::string> outputs, const CallPlan &plan, const ast::Node &at) {
        ir::Stmt stmt;
        if (plan.callee.function) {
            stmt.domain = options_.domain;
            stmt.version = options_.version;
            stmt.functions.push_back(plan.callee.function->function);
        } else {
            stmt.domain = plan.callee.opset.domain;
            stmt.version = plan.callee.opset.version;
        }
        stmt.opType = plan.callee.name;
        stmt.inputs = plan.inputs;
        stmt.outputs = std::move(outputs);
        stmt.attrs = plan.attrs;
        stmt.line = at.line;
        builder_.addStmt(*current_, std::move(stmt));
    }

    std::string Converter::emitCopy(const std::string &original, const std::string &suggested, const ast::Node &at) {
        std::string copy = names_.unique(suggested);
        emit({copy}, "Identity", {original}, {}, at);
        return copy;
    }

    ValueHandle Converter::emitConst(const PyValue &value, const std::string &suggested, const ast::Node &at) {
        std::string candidate = suggested;
        if (candidate.empty()) {
            const auto intName = [](const std::int64_t v) {
                return v >= 0 ? "int64_" + std::to_string(v) : "int64_m" + std::to_string(0 - static_cast<std::uint64_t>(v));
            };
            if (value.kind == ValueKind::Int) {
                candidate = intName(value.i);
            } else if (value.kind == ValueKind::List && value.items.size() == 1 && value.items.front().kind == ValueKind::Int) {
                candidate = intName(value.items.front().i) + "_1d";
            } else {
                candidate = "const";
            }
        }
        const std::string name = names_.unique(candidate);
        ir::TensorConst tensor = autocast::toTensorConst(value, std::nullopt, where(at));
        emit({name}, "Constant", {}, {builder_.makeTensorAttr("value", std::move(tensor))}, at);
        return ValueHandle(name, true);
    }

    ir::Attr Converter::toOnnxAttrRef(const Binding &b, const ast::Node &at) const {
        const ir::AttrKind kind = b.type ? types::toAttrKind(*b.type) : ir::AttrKind::Undefined;
        switch (kind) {
            case ir::AttrKind::Float: return builder_.makeAttrRef("value_float", b.name, kind);
            case ir::AttrKind::Int: return builder_.makeAttrRef("value_int", b.name, kind);
            case ir::AttrKind::String: return builder_.makeAttrRef("value_string", b.name, kind);
            case ir::AttrKind::Ints: return builder_.makeAttrRef("value_ints", b.name, kind);
            default:
                throw UnsupportedConstructError("attribute parameter '" + b.name + "' of type " +
                                                    (b.type ? b.type->toString() : std::string("?")) +
                                                    " cannot be used as a value",
                                                where(at));
        }
    }

    ValueHandle Converter::toOnnxVar(const Binding &b, const std::string &target, const ast::Node &at) {
        switch (b.kind) {
            case BindingKind::AttrRef: {
                const std::string result = names_.unique(target.empty() ? "tmp" : target);
                emit({result}, "Constant", {}, {toOnnxAttrRef(b, at)}, at);
                return ValueHandle(result, true);
            }
            case BindingKind::Dynamic:
                return ValueHandle(b.name, b.dynamicKind == values::DynamicKind::Constant);
            case BindingKind::Constant:
                switch (b.constant.kind) {
                    case ValueKind::Opset:
                    case ValueKind::Op:
                    case ValueKind::Type:
                    case ValueKind::Namespace:
                        break;
                    default:
                        return emitConst(b.constant, target.empty() ? "tmp" : target, at);
                }
                break;
            default:
                break;
        }
        throw UnsupportedConstructError(b.describe() + " cannot be used as a graph value", where(at));
    }

    std::vector<std::string> Converter::castInputs(const schema::OpSchema *schema, const std::vector<ValueHandle> &args,
                                                   const ast::Node &at) {
        return autocast::staticCastInputs(
            schema, args,
            [this, &at](const std::string &operand, const std::string &like) {
                std::string cast = names_.unique(operand + "_cast");
                emit({cast}, "CastLike", {operand, like}, {}, at);
                return cast;
            },
            where(at));
    }

} // namespace gsc::converter
