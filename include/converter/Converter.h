/***
 * Name: gsc::converter::Converter
 * Purpose: Lower script functions into dataflow graphs.
 * Inputs:
 *   - schemas: operator schema registry (argument split and autocast)
 *   - options: custom domain/version of the module, optional default opset
 *   - an ILivenessOracle per top-level function
 * Outputs: ir::Function per script function; ir::Module per source module;
 *   collected warnings
 * Theory of Operation:
 *   Single-threaded recursive descent over the AST. All mutable state (scope
 *   stack, unique-name generator, stack of graphs under construction) lives
 *   here and is reset at the start of each top-level function. Expressions
 *   lower to nodes appended to the innermost graph; control flow opens a new
 *   graph and scope frame for each branch or loop body and closes it into a
 *   graph attribute of an If or Loop node, reconciling live names as
 *   explicit, freshly named outputs. Any failure throws a TranslationError
 *   subclass and nothing is registered for that function.
 */
#pragma once

#include "analysis/ILivenessOracle.h"
#include "ast/Nodes.h"
#include "constant/PyValue.h"
#include "converter/NameGenerator.h"
#include "converter/ScopeStack.h"
#include "ir/Function.h"
#include "ir/GraphBuilder.h"
#include "observability/Metrics.h"
#include "schema/ISchemaRegistry.h"
#include "schema/ParamSchema.h"
#include "sema/Diagnostic.h"
#include "values/Binding.h"
#include "values/ValueHandle.h"
#include <memory>
#include <optional>
#include <ostream>
#include <string>
#include <vector>

namespace gsc::converter {

    struct ConverterOptions {
        std::string domain{"this"};
        int version{1};
        std::optional<values::Opset> defaultOpset{};
        // Used for diagnostics of nodes that carry no file name.
        std::string fileName{};
    };

    // Resolved call target: an operator of an opset or a script function.
    struct CalleeRef {
        values::Opset opset;
        std::string name;
        const schema::OpSchema *schema{nullptr};
        std::shared_ptr<const schema::OpSchema> ownedSchema{};
        std::shared_ptr<const values::FunctionRef> function{};
    };

    // A node ready to be emitted once its output names are chosen.
    struct CallPlan {
        CalleeRef callee;
        std::vector<std::string> inputs;
        std::vector<ir::Attr> attrs;
    };

    class Converter {
    public:
        explicit Converter(const schema::ISchemaRegistry &schemas, ConverterOptions options = {});

        // Imports, module constants and every def, in order.
        ir::Module translateModule(const ast::Module &mod);

        // One top-level function; liveness must have been computed for fn.
        std::shared_ptr<const ir::Function> translateFunction(const ast::FunctionDef &fn,
                                                              const analysis::ILivenessOracle &liveness);

        void bindGlobal(const std::string &name, values::Binding binding);
        const values::GlobalEnv &globals() const { return globals_; }
        const std::vector<sema::Diagnostic> &warnings() const { return warnings_; }
        void setTrace(std::ostream *trace) { trace_ = trace; }
        // Times the Liveness stage and counts translate.functions in translateModule.
        void setMetrics(obs::Metrics *metrics) { metrics_ = metrics; }

    private:
        using Block = std::vector<std::unique_ptr<ast::Stmt>>;

        // Scope and state (Converter.cpp)
        void initFunctionTranslation(const ast::FunctionDef &fn);
        void enterScope(const std::string &name);
        std::shared_ptr<ir::Function> exitScope();
        void bind(const std::string &name, values::Binding binding);
        const values::Binding *lookup(const std::string &name) const;
        sema::Diagnostic where(const ast::Node &n) const;
        sema::Provenance provenance(const ast::Node &n) const;
        void warn(const ast::Node &n, const std::string &msg);
        void trace(const std::string &event) const;

        const values::Opset &defaultOpset(const ast::Node &at) const;
        void setDefaultOpset(const values::Opset &opset, const ast::Node &at);
        std::optional<values::Opset> findOnnxOpset(const ast::FunctionDef &fn) const;

        constant::PyValue evalConstant(const ast::Expr &e) const;
        types::TypePtr evalAnnotation(const ast::Expr &e);

        // Emission (Converter.cpp)
        void emit(std::vector<std::string> outputs, const std::string &opType, std::vector<std::string> inputs,
                  std::vector<ir::Attr> attrs, const ast::Node &at);
        void emitCall(std::vector<std::string> outputs, const CallPlan &plan, const ast::Node &at);
        std::string emitCopy(const std::string &original, const std::string &suggested, const ast::Node &at);
        values::ValueHandle emitConst(const constant::PyValue &value, const std::string &suggested, const ast::Node &at);
        values::ValueHandle toOnnxVar(const values::Binding &b, const std::string &target, const ast::Node &at);
        ir::Attr toOnnxAttrRef(const values::Binding &b, const ast::Node &at) const;
        std::vector<std::string> castInputs(const schema::OpSchema *schema, const std::vector<values::ValueHandle> &args,
                                            const ast::Node &at);

        // Expressions (Converter_Expr.cpp)
        values::ValueHandle translateExpr(const ast::Expr &e, const std::vector<std::string> &targets = {});
        values::ValueHandle translateOptExpr(const ast::Expr &e);
        values::ValueHandle emitPlan(const CallPlan &plan, const std::vector<std::string> &targets, const ast::Node &at);
        CallPlan translateBinary(const ast::Binary &b);
        CallPlan translateComparison(const ast::Binary &b);
        CallPlan translateUnary(const ast::Unary &u);
        values::ValueHandle translateName(const ast::Name &n);

        // Subscripts (Converter_Subscript.cpp)
        values::ValueHandle translateSubscript(const ast::Subscript &s, const std::string &target);

        // Calls (Converter_Call.cpp)
        CallPlan translateCall(const ast::Call &c);
        CalleeRef translateCallee(const ast::Expr &callee);
        values::Opset translateOpsetExpr(const ast::Expr &e);
        CalleeRef opCallee(const values::Opset &opset, const std::string &name) const;
        CalleeRef functionCallee(const std::shared_ptr<const values::FunctionRef> &fn) const;
        std::vector<schema::ParamSchema> paramSchemasOf(const CalleeRef &callee) const;
        std::optional<ir::Attr> translateAttr(const std::string &attrName, const ast::Expr &e);
        void checkCaptures(const values::FunctionRef &fn, const ast::Node &at) const;

        // Statements (Converter_Stmt.cpp)
        void translateStmt(const ast::Stmt &s, std::optional<std::size_t> indexInFunction = std::nullopt);
        void translateAssign(const ast::AssignStmt &s);
        void assignTarget(const ast::AssignStmt &s, const ast::Expr &lhs, const ast::Expr &rhs);
        void translateReturn(const ast::ReturnStmt &s);

        // Control flow (Converter_If.cpp, Converter_Loop.cpp)
        void translateIf(const ast::IfStmt &s);
        std::shared_ptr<ir::Function> translateBlock(const Block &stmts, const std::string &name,
                                                     const std::vector<std::string> &liveDefs, const ast::Node &at);
        void translateLoop(const ast::Stmt &s);

        // Functions and modules (Converter_Function.cpp)
        void translateFunctionSignature(const ast::FunctionDef &fn);
        void translateFunctionDef(const ast::FunctionDef &fn);
        void translateNestedFunctionDef(const ast::FunctionDef &fn);
        void translateImport(const ast::Import &s);
        void translateImportFrom(const ast::ImportFrom &s);
        void translateModuleAssign(const ast::AssignStmt &s);

        const schema::ISchemaRegistry &schemas_;
        ConverterOptions options_;
        ir::GraphBuilder builder_;
        values::GlobalEnv globals_;
        std::optional<values::Opset> defaultOpset_;
        ScopeStack scopes_;
        NameGenerator names_;
        std::vector<std::unique_ptr<ir::Function>> outer_;
        std::unique_ptr<ir::Function> current_;
        std::optional<std::vector<types::TypePtr>> returnTypes_;
        const analysis::ILivenessOracle *liveness_{nullptr};
        std::string functionName_;
        std::vector<sema::Diagnostic> warnings_;
        std::ostream *trace_{nullptr};
        obs::Metrics *metrics_{nullptr};
    };

} // namespace gsc::converter
