/***
 * Name: gsc::analysis::Liveness
 * Purpose: Backward liveness over a script function body.
 * Inputs: FunctionDef to analyze
 * Outputs: Per-statement live-out sets; assigned-name queries
 * Theory of Operation:
 *   Walks each block last statement first, threading the live set backward:
 *   an assignment kills its targets and generates the names its value
 *   reads; a return generates only its value's names; an if joins both
 *   branches; a loop iterates its body to a fixed point with the loop's
 *   live-out plus whatever the body needs at entry. Callee names of calls
 *   are not uses. A nested def generates the outer names its body reads.
 */
#pragma once

#include "analysis/ILivenessOracle.h"
#include "ast/Nodes.h"
#include <memory>
#include <set>
#include <string>
#include <unordered_map>
#include <vector>

namespace gsc::analysis {

    using NameSet = std::set<std::string>;
    using Block = std::vector<std::unique_ptr<ast::Stmt>>;

    class Liveness final : public ILivenessOracle {
    public:
        void analyze(const ast::FunctionDef &fn);

        std::vector<std::string> assignedNames(const ast::Stmt &stmt) const override;
        NameSet liveOut(const ast::Stmt &stmt) const override;

    private:
        std::unordered_map<const ast::Stmt*, NameSet> liveOut_;
    };

    // Names read by an expression (call targets excluded).
    NameSet usedVars(const ast::Expr &expr);

    // Names a statement may bind, ordered by first assignment.
    std::vector<std::string> assignedVars(const ast::Stmt &stmt);
    std::vector<std::string> assignedVars(const Block &block);

    // Names a block reads before (possibly) assigning them.
    NameSet exposedUses(const Block &block);

    // Names a nested function reads from enclosing scopes, in first-use order.
    std::vector<std::string> outerScopeVariables(const ast::FunctionDef &fn);

} // namespace gsc::analysis
