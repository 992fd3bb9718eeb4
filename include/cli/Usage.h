#pragma once

#include <string>

namespace gsc::cli {

    // Full help text printed for -h/--help and after usage errors.
    std::string Usage();

} // namespace gsc::cli
