/***
 * Name: gsc::converter::NameGenerator
 * Purpose: Fresh graph value names for one translation run.
 * Theory of Operation:
 *   A candidate is returned unchanged the first time; afterwards
 *   `<candidate>_<n>` with a run-wide monotonic counter until unused.
 *   Every returned name is recorded, so names are never reused.
 */
#pragma once

#include <string>
#include <unordered_set>

namespace gsc::converter {

    class NameGenerator {
    public:
        std::string unique(const std::string &candidate = "tmp");
        void reserve(const std::string &name) { used_.insert(name); }
        bool used(const std::string &name) const { return used_.count(name) != 0; }
        void reset();

    private:
        std::unordered_set<std::string> used_;
        int next_{0};
    };

} // namespace gsc::converter
