/***
 * Name: gsc::converter::ScopeStack
 * Purpose: Frame management and name resolution.
 */
#include "converter/ScopeStack.h"
#include <utility>

namespace gsc::converter {

    void ScopeStack::push() { frames_.emplace_back(); }

    void ScopeStack::pop() {
        if (!frames_.empty()) { frames_.pop_back(); }
    }

    void ScopeStack::bind(const std::string &name, values::Binding binding) {
        if (frames_.empty()) { frames_.emplace_back(); }
        frames_.back()[name] = std::move(binding);
    }

    const values::Binding *ScopeStack::lookup(const std::string &name) const {
        for (auto it = frames_.rbegin(); it != frames_.rend(); ++it) {
            const auto found = it->find(name);
            if (found != it->end()) { return &found->second; }
        }
        return nullptr;
    }

    const values::Binding *ScopeStack::lookupCurrent(const std::string &name) const {
        if (frames_.empty()) { return nullptr; }
        const auto found = frames_.back().find(name);
        return found == frames_.back().end() ? nullptr : &found->second;
    }

    const values::Binding *ScopeStack::lookupOuter(const std::string &name) const {
        if (frames_.size() < 2) { return nullptr; }
        for (auto it = frames_.rbegin() + 1; it != frames_.rend(); ++it) {
            const auto found = it->find(name);
            if (found != it->end()) { return &found->second; }
        }
        return nullptr;
    }

} // namespace gsc::converter
