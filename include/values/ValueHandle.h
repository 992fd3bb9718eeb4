/***
 * Name: gsc::values::ValueHandle
 * Purpose: Result of lowering one expression.
 * Theory of Operation:
 *   Names the graph value(s) an expression produced. isConst marks values
 *   produced by a Constant node, which autocast may still cast to match a
 *   sibling argument. An empty name stands for an omitted optional input.
 */
#pragma once

#include <string>
#include <utility>
#include <vector>

namespace gsc::values {

    struct ValueHandle {
        std::vector<std::string> names;
        bool isConst{false};

        ValueHandle() = default;
        ValueHandle(std::string name, const bool constant) : names{std::move(name)}, isConst(constant) {}
        explicit ValueHandle(std::vector<std::string> ns) : names(std::move(ns)) {}

        const std::string &name() const { return names.front(); }
    };

} // namespace gsc::values
