/***
 * Name: gsc::converter::NameGenerator
 * Purpose: Unique name generation.
 */
#include "converter/NameGenerator.h"

namespace gsc::converter {

    std::string NameGenerator::unique(const std::string &candidate) {
        std::string name = candidate;
        while (used_.count(name) != 0) {
            name = candidate + "_" + std::to_string(next_);
            ++next_;
        }
        used_.insert(name);
        return name;
    }

    void NameGenerator::reset() {
        used_.clear();
        next_ = 0;
    }

} // namespace gsc::converter
