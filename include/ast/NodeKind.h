#pragma once

namespace gsc::ast {
    enum class NodeKind {
        Module,
        FunctionDef,
        ReturnStmt,
        AssignStmt,
        ExprStmt,
        IfStmt,
        IntLiteral,
        BoolLiteral,
        FloatLiteral,
        StringLiteral,
        Name,
        Call,
        BinaryExpr,
        UnaryExpr,
        TupleLiteral,
        ListLiteral,
        NoneLiteral,
        Attribute,
        Subscript,
        Slice,
        WhileStmt,
        ForStmt,
        BreakStmt,
        ContinueStmt,
        PassStmt,
        Import,
        ImportFrom,
        Alias,
        DefStmt,
        Compare
    };

    inline const char *to_string(const NodeKind element) {
        switch (element) {
            case NodeKind::Module: return "Module";
            case NodeKind::FunctionDef: return "FunctionDef";
            case NodeKind::ReturnStmt: return "ReturnStmt";
            case NodeKind::AssignStmt: return "AssignStmt";
            case NodeKind::ExprStmt: return "ExprStmt";
            case NodeKind::IfStmt: return "IfStmt";
            case NodeKind::IntLiteral: return "IntLiteral";
            case NodeKind::BoolLiteral: return "BoolLiteral";
            case NodeKind::FloatLiteral: return "FloatLiteral";
            case NodeKind::StringLiteral: return "StringLiteral";
            case NodeKind::Name: return "Name";
            case NodeKind::Call: return "Call";
            case NodeKind::BinaryExpr: return "BinaryExpr";
            case NodeKind::UnaryExpr: return "UnaryExpr";
            case NodeKind::TupleLiteral: return "TupleLiteral";
            case NodeKind::ListLiteral: return "ListLiteral";
            case NodeKind::NoneLiteral: return "NoneLiteral";
            case NodeKind::Attribute: return "Attribute";
            case NodeKind::Subscript: return "Subscript";
            case NodeKind::Slice: return "Slice";
            case NodeKind::WhileStmt: return "WhileStmt";
            case NodeKind::ForStmt: return "ForStmt";
            case NodeKind::BreakStmt: return "BreakStmt";
            case NodeKind::ContinueStmt: return "ContinueStmt";
            case NodeKind::PassStmt: return "PassStmt";
            case NodeKind::Import: return "Import";
            case NodeKind::ImportFrom: return "ImportFrom";
            case NodeKind::Alias: return "Alias";
            case NodeKind::DefStmt: return "DefStmt";
            case NodeKind::Compare: return "Compare";
        }
        return "unknown";
    }
} // namespace gsc::ast
