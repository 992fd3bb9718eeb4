/***
 * Name: gsc::converter::ScopeStack
 * Purpose: Nested name -> Binding frames for the function being translated.
 * Theory of Operation:
 *   Frames live in a vector indexed from the outermost (the top-level
 *   function) to the innermost (current branch, loop body or nested
 *   function) and are pushed and popped strictly LIFO. Lookup walks from
 *   the innermost frame outward; module-level names are resolved by the
 *   converter after the stack is exhausted.
 */
#pragma once

#include "values/Binding.h"
#include <cstddef>
#include <map>
#include <string>
#include <vector>

namespace gsc::converter {

    class ScopeStack {
    public:
        void push();
        void pop();
        void reset() { frames_.clear(); }
        std::size_t depth() const { return frames_.size(); }

        // Binds in the innermost frame, replacing an existing binding there.
        void bind(const std::string &name, values::Binding binding);

        const values::Binding *lookup(const std::string &name) const;
        const values::Binding *lookupCurrent(const std::string &name) const;
        // Lookup skipping the innermost frame.
        const values::Binding *lookupOuter(const std::string &name) const;

    private:
        std::vector<std::map<std::string, values::Binding>> frames_;
    };

} // namespace gsc::converter
