#include "cli/ParseArgsInternals.h"

namespace gsc::cli::detail {
    /***
     * Name: gsc::cli::detail::isFlag
     * Purpose: Check if an argument exactly matches a flag.
     */
    bool isFlag(const std::string_view arg, const std::string_view flag) {
        return arg == flag;
    }
} // namespace gsc::cli::detail
