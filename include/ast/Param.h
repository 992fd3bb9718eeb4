#pragma once

#include <string>
#include <memory>

namespace gsc::ast {
    struct Expr; // fwd
    struct Param {
        std::string name;
        std::unique_ptr<Expr> annotation{};   // optional type annotation expression
        std::unique_ptr<Expr> defaultValue{}; // optional
        bool isVarArg{false};   // *args
        bool isKwVarArg{false}; // **kwargs
        bool isKwOnly{false};   // kw-only param (after bare *)
        int line{0};
        int col{0};
    };
} // namespace gsc::ast
