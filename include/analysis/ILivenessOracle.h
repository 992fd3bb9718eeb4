/***
 * Name: gsc::analysis::ILivenessOracle
 * Purpose: Liveness facts the converter consults for control-flow lowering.
 * Theory of Operation:
 *   assignedNames lists the names a statement may bind, in order of first
 *   assignment. liveOut is the set of names read after the statement before
 *   being reassigned. Both are answered per statement node of the function
 *   last analyzed.
 */
#pragma once

#include "ast/Stmt.h"
#include <set>
#include <string>
#include <vector>

namespace gsc::analysis {

    class ILivenessOracle {
    public:
        virtual ~ILivenessOracle() = default;
        virtual std::vector<std::string> assignedNames(const ast::Stmt &stmt) const = 0;
        virtual std::set<std::string> liveOut(const ast::Stmt &stmt) const = 0;
    };

} // namespace gsc::analysis
