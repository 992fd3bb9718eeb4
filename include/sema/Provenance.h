#pragma once

#include <string>

namespace gsc::sema {
    /***
     * Name: gsc::sema::Provenance
     * Purpose: Record source location where a binding was introduced.
     */
    struct Provenance {
        std::string file;
        int line{0};
        int col{0};
    };
} // namespace gsc::sema
