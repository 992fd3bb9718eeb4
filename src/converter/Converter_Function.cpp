/***
 * Name: gsc::converter::Converter (functions and modules)
 * Purpose: Translate signatures, function bodies, nested definitions and
 *          module-level statements.
 * Theory of Operation:
 *   Parameters annotated with an attribute type (int, float, str, bool and
 *   lists of those) become attribute parameters; every other parameter is a
 *   graph input. A nested def is translated in a fresh graph and scope frame
 *   and bound as a function value together with the outer bindings it
 *   reads, so a later use can detect that one of them was rebound.
 */
#include "converter/Converter.h"
#include "analysis/Liveness.h"
#include "constant/Catalog.h"
#include "gsc/exceptions/type_mismatch_error.h"
#include "gsc/exceptions/unbound_name_error.h"
#include "gsc/exceptions/unsupported_construct_error.h"
#include "types/Annotations.h"
#include <functional>

namespace gsc::converter {

    using constant::PyValue;
    using constant::ValueKind;
    using exceptions::UnsupportedConstructError;
    using values::Binding;
    using values::DynamicKind;

    namespace {

        // Calls in source order, descending into nested blocks and definitions.
        void forEachCall(const ast::Expr &e, const std::function<void(const ast::Call&)> &fn) {
            switch (e.kind) {
                case ast::NodeKind::Call: {
                    const auto &c = static_cast<const ast::Call&>(e);
                    fn(c);
                    for (const auto &a : c.args) { forEachCall(*a, fn); }
                    for (const auto &kw : c.keywords) { forEachCall(*kw.value, fn); }
                    break;
                }
                case ast::NodeKind::BinaryExpr: {
                    const auto &b = static_cast<const ast::Binary&>(e);
                    forEachCall(*b.lhs, fn);
                    forEachCall(*b.rhs, fn);
                    break;
                }
                case ast::NodeKind::UnaryExpr: forEachCall(*static_cast<const ast::Unary&>(e).operand, fn); break;
                case ast::NodeKind::Subscript: {
                    const auto &s = static_cast<const ast::Subscript&>(e);
                    forEachCall(*s.value, fn);
                    forEachCall(*s.slice, fn);
                    break;
                }
                case ast::NodeKind::TupleLiteral:
                    for (const auto &x : static_cast<const ast::TupleLiteral&>(e).elements) { forEachCall(*x, fn); }
                    break;
                default:
                    break;
            }
        }

        void forEachCall(const std::vector<std::unique_ptr<ast::Stmt>> &block, const std::function<void(const ast::Call&)> &fn) {
            for (const auto &s : block) {
                switch (s->kind) {
                    case ast::NodeKind::AssignStmt: forEachCall(*static_cast<const ast::AssignStmt&>(*s).value, fn); break;
                    case ast::NodeKind::ExprStmt: forEachCall(*static_cast<const ast::ExprStmt&>(*s).value, fn); break;
                    case ast::NodeKind::ReturnStmt: {
                        const auto &r = static_cast<const ast::ReturnStmt&>(*s);
                        if (r.value) { forEachCall(*r.value, fn); }
                        break;
                    }
                    case ast::NodeKind::IfStmt: {
                        const auto &i = static_cast<const ast::IfStmt&>(*s);
                        forEachCall(*i.cond, fn);
                        forEachCall(i.thenBody, fn);
                        forEachCall(i.elseBody, fn);
                        break;
                    }
                    case ast::NodeKind::ForStmt: forEachCall(static_cast<const ast::ForStmt&>(*s).thenBody, fn); break;
                    case ast::NodeKind::WhileStmt: forEachCall(static_cast<const ast::WhileStmt&>(*s).thenBody, fn); break;
                    case ast::NodeKind::DefStmt: forEachCall(static_cast<const ast::DefStmt&>(*s).func->body, fn); break;
                    default: break;
                }
            }
        }

    } // namespace

    std::shared_ptr<const ir::Function> Converter::translateFunction(const ast::FunctionDef &fn,
                                                                     const analysis::ILivenessOracle &liveness) {
        initFunctionTranslation(fn);
        if (!defaultOpset_) {
            if (auto opset = findOnnxOpset(fn)) { setDefaultOpset(*opset, fn); }
        }
        liveness_ = &liveness;
        translateFunctionDef(fn);
        liveness_ = nullptr;
        std::shared_ptr<const ir::Function> result = std::move(current_);
        scopes_.reset();
        trace("end function " + fn.name);
        return result;
    }

    std::optional<values::Opset> Converter::findOnnxOpset(const ast::FunctionDef &fn) const {
        std::optional<values::Opset> found;
        forEachCall(fn.body, [this, &found](const ast::Call &c) {
            if (found || c.callee->kind != ast::NodeKind::Attribute) { return; }
            const auto &base = *static_cast<const ast::Attribute&>(*c.callee).value;
            if (base.kind != ast::NodeKind::Name) { return; }
            const auto it = globals_.find(static_cast<const ast::Name&>(base).id);
            if (it == globals_.end() || it->second.kind != values::BindingKind::Constant) { return; }
            const PyValue &v = it->second.constant;
            if (v.kind == ValueKind::Opset && v.opset.domain.empty()) { found = v.opset; }
        });
        return found;
    }

    void Converter::translateFunctionSignature(const ast::FunctionDef &fn) {
        for (const auto &p : fn.params) {
            if (p.isVarArg || p.isKwVarArg || p.isKwOnly) {
                warn(fn, fn.name + ": Unsupported feature in function signature.");
                break;
            }
        }
        for (const auto &p : fn.params) {
            if (p.isVarArg || p.isKwVarArg || p.isKwOnly) { continue; }
            ast::Node at(ast::NodeKind::FunctionDef);
            at.line = p.line;
            at.col = p.col;
            at.file = fn.file;

            std::optional<PyValue> defaultValue;
            if (p.defaultValue) { defaultValue = evalConstant(*p.defaultValue); }
            types::TypePtr type;
            if (p.annotation) {
                type = evalAnnotation(*p.annotation);
                if (!type) { warn(*p.annotation, "Unsupported type annotation for argument " + p.name + "."); }
            }

            if (type && types::isAttrType(*type)) {
                std::optional<ir::Attr> defaultAttr;
                if (defaultValue && !defaultValue->isNone()) {
                    defaultAttr = builder_.makeAttr(p.name, *defaultValue);
                    if (!defaultAttr) {
                        throw exceptions::TypeMismatchError("default value " + defaultValue->repr() + " of attribute parameter '" +
                                                                p.name + "' is not an attribute value",
                                                            where(at));
                    }
                }
                builder_.addAttrParameter(*current_, p.name, types::toAttrKind(*type), std::move(defaultAttr));
                bind(p.name, Binding::attrRef(p.name, type, provenance(at)));
            } else {
                const std::string name = names_.unique(p.name);
                builder_.addInput(*current_, name, type);
                bind(p.name, Binding::dynamic(name, DynamicKind::Input, provenance(at), type));
            }
        }

        returnTypes_.reset();
        if (fn.returns) {
            const PyValue v = evalConstant(*fn.returns);
            bool valid = v.kind == ValueKind::Type && v.type;
            std::vector<types::TypePtr> declared;
            if (valid) {
                declared = types::returnTypes(v.type);
                for (const auto &t : declared) { valid = valid && t && types::isValidType(*t); }
            }
            if (valid) {
                returnTypes_ = std::move(declared);
            } else {
                warn(*fn.returns, "Unsupported type annotation for return value " + v.repr() + ".");
            }
        }
    }

    void Converter::translateFunctionDef(const ast::FunctionDef &fn) {
        translateFunctionSignature(fn);
        for (std::size_t i = 0; i < fn.body.size(); ++i) { translateStmt(*fn.body[i], i); }
    }

    void Converter::translateNestedFunctionDef(const ast::FunctionDef &fn) {
        auto savedReturnTypes = returnTypes_;
        enterScope(fn.name);
        current_->domain = options_.domain;
        translateFunctionDef(fn);
        std::shared_ptr<const ir::Function> graph = exitScope();
        returnTypes_ = std::move(savedReturnTypes);

        auto ref = std::make_shared<values::FunctionRef>();
        ref->function = graph;
        ref->nested = true;
        for (const auto &name : analysis::outerScopeVariables(fn)) {
            if (const Binding *b = lookup(name)) { ref->captures.emplace_back(name, *b); }
        }
        bind(fn.name, Binding::functionRef(ref, provenance(fn)));
        builder_.addFunction(*current_, graph);
    }

    ir::Module Converter::translateModule(const ast::Module &mod) {
        ir::Module out;
        out.domain = options_.domain;
        out.version = options_.version;
        functionName_.clear();
        for (std::size_t i = 0; i < mod.body.size(); ++i) {
            const ast::Stmt &s = *mod.body[i];
            switch (s.kind) {
                case ast::NodeKind::Import: translateImport(static_cast<const ast::Import&>(s)); break;
                case ast::NodeKind::ImportFrom: translateImportFrom(static_cast<const ast::ImportFrom&>(s)); break;
                case ast::NodeKind::AssignStmt: translateModuleAssign(static_cast<const ast::AssignStmt&>(s)); break;
                case ast::NodeKind::DefStmt: {
                    const ast::FunctionDef &def = *static_cast<const ast::DefStmt&>(s).func;
                    analysis::Liveness liveness;
                    if (metrics_ != nullptr) { metrics_->start("Liveness"); }
                    liveness.analyze(def);
                    if (metrics_ != nullptr) { metrics_->stop("Liveness"); }
                    auto fn = translateFunction(def, liveness);
                    functionName_.clear();
                    if (metrics_ != nullptr) { metrics_->incCounter("translate.functions"); }
                    out.functions.push_back(fn);
                    auto ref = std::make_shared<values::FunctionRef>();
                    ref->function = fn;
                    bindGlobal(def.name, Binding::functionRef(ref, provenance(def)));
                    break;
                }
                case ast::NodeKind::ExprStmt: {
                    const auto &value = *static_cast<const ast::ExprStmt&>(s).value;
                    if (i == 0 && value.kind == ast::NodeKind::StringLiteral) {
                        out.docstring = static_cast<const ast::StringLiteral&>(value).value;
                        break;
                    }
                    throw UnsupportedConstructError("only imports, constant assignments and function definitions are allowed "
                                                    "at module level",
                                                    where(s));
                }
                default:
                    throw UnsupportedConstructError(std::string("unsupported module-level statement: ") + ast::to_string(s.kind),
                                                    where(s));
            }
        }
        return out;
    }

    void Converter::translateImport(const ast::Import &s) {
        for (const auto &alias : s.names) {
            const auto full = constant::lookupModule(alias.name);
            if (!full) { throw exceptions::UnboundNameError("No module named '" + alias.name + "'", where(s)); }
            if (!alias.asname.empty()) {
                bindGlobal(alias.asname, Binding::fromValue(*full, provenance(s)));
                continue;
            }
            // `import a.b` binds `a`.
            const std::string root = alias.name.substr(0, alias.name.find('.'));
            bindGlobal(root, Binding::fromValue(*constant::lookupModule(root), provenance(s)));
        }
    }

    void Converter::translateImportFrom(const ast::ImportFrom &s) {
        if (s.level != 0) { throw UnsupportedConstructError("relative imports are not supported", where(s)); }
        const auto module = constant::lookupModule(s.module);
        if (!module) { throw exceptions::UnboundNameError("No module named '" + s.module + "'", where(s)); }
        for (const auto &alias : s.names) {
            if (alias.name == "*") { throw UnsupportedConstructError("wildcard imports are not supported", where(s)); }
            std::optional<PyValue> member;
            if (module->members) {
                const auto it = module->members->find(alias.name);
                if (it != module->members->end()) { member = it->second; }
            }
            if (!member) { member = constant::lookupModule(s.module + "." + alias.name); }
            if (!member) {
                throw exceptions::UnboundNameError("cannot import name '" + alias.name + "' from '" + s.module + "'", where(s));
            }
            bindGlobal(alias.asname.empty() ? alias.name : alias.asname, Binding::fromValue(*member, provenance(s)));
        }
    }

    void Converter::translateModuleAssign(const ast::AssignStmt &s) {
        if (s.targets.size() != 1) {
            throw UnsupportedConstructError("chained assignment (a = b = ...) is not supported", where(s));
        }
        const ast::Expr &target = *s.targets.front();
        const PyValue value = evalConstant(*s.value);
        if (target.kind == ast::NodeKind::Name) {
            bindGlobal(static_cast<const ast::Name&>(target).id, Binding::fromValue(value, provenance(s)));
            return;
        }
        if (target.kind == ast::NodeKind::TupleLiteral &&
            (value.kind == ValueKind::Tuple || value.kind == ValueKind::List)) {
            const auto &names = static_cast<const ast::TupleLiteral&>(target).elements;
            bool allNames = names.size() == value.items.size();
            for (const auto &n : names) { allNames = allNames && n->kind == ast::NodeKind::Name; }
            if (allNames) {
                for (std::size_t i = 0; i < names.size(); ++i) {
                    bindGlobal(static_cast<const ast::Name&>(*names[i]).id, Binding::fromValue(value.items[i], provenance(s)));
                }
                return;
            }
        }
        throw UnsupportedConstructError("unsupported module-level assignment", where(s));
    }

} // namespace gsc::converter
