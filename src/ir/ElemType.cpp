/***
 * Name: gsc::ir::ElemType helpers
 * Purpose: Name conversions for tensor element types.
 */
#include "ir/ElemType.h"
#include <array>
#include <utility>

namespace gsc::ir {

    namespace {
        struct ElemTypeNames {
            ElemType type;
            const char *upper;
            const char *tag;
        };

        constexpr std::array<ElemTypeNames, 15> kNames{{
            {ElemType::Undefined, "UNDEFINED", "undefined"},
            {ElemType::Float, "FLOAT", "float"},
            {ElemType::Uint8, "UINT8", "uint8"},
            {ElemType::Int8, "INT8", "int8"},
            {ElemType::Uint16, "UINT16", "uint16"},
            {ElemType::Int16, "INT16", "int16"},
            {ElemType::Int32, "INT32", "int32"},
            {ElemType::Int64, "INT64", "int64"},
            {ElemType::String, "STRING", "string"},
            {ElemType::Bool, "BOOL", "bool"},
            {ElemType::Float16, "FLOAT16", "float16"},
            {ElemType::Double, "DOUBLE", "double"},
            {ElemType::Uint32, "UINT32", "uint32"},
            {ElemType::Uint64, "UINT64", "uint64"},
            {ElemType::Bfloat16, "BFLOAT16", "bfloat16"},
        }};
    } // namespace

    const char *to_string(const ElemType t) {
        for (const auto &entry : kNames) {
            if (entry.type == t) { return entry.upper; }
        }
        return "UNDEFINED";
    }

    const char *elemTypeTag(const ElemType t) {
        for (const auto &entry : kNames) {
            if (entry.type == t) { return entry.tag; }
        }
        return "undefined";
    }

    std::string tensorTypeString(const ElemType t) { return std::string("tensor(") + elemTypeTag(t) + ")"; }

    std::optional<ElemType> elemTypeFromName(const std::string &upperName) {
        for (const auto &entry : kNames) {
            if (upperName == entry.upper && entry.type != ElemType::Undefined) { return entry.type; }
        }
        return std::nullopt;
    }

} // namespace gsc::ir
