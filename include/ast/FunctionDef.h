#pragma once

#include <memory>
#include <string>
#include <vector>
#include "ast/Acceptable.h"
#include "ast/Expr.h"
#include "ast/HasBody.h"
#include "ast/HasParams.h"
#include "ast/HasName.h"
#include "ast/Param.h"
#include "ast/Stmt.h"

namespace gsc::ast {
    struct FunctionDef final : Node, Acceptable<FunctionDef, NodeKind::FunctionDef>, HasBody<Stmt>, HasParams<Param>, HasName {
        std::unique_ptr<Expr> returns{};                // optional return annotation
        std::vector<std::unique_ptr<Expr>> decorators; // accepted and ignored
        explicit FunctionDef(std::string n)
            : Node(NodeKind::FunctionDef), HasName{std::move(n)} {}
    };

} // namespace gsc::ast
