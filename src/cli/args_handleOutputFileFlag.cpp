#include "cli/ParseArgsInternals.h"

namespace gsc::cli::detail {
    /***
     * Name: gsc::cli::detail::handleOutputFileFlag
     * Purpose: Handle `-o <file>` output flag by consuming the next argument.
     */
    bool handleOutputFileFlag(int &idx, int argc, char **argv, Options &out) {
        // -o <file>
        // NOLINTNEXTLINE(cppcoreguidelines-pro-bounds-pointer-arithmetic)
        if (const std::string_view arg{argv[idx]}; !isFlag(arg, "-o")) { return false; }
        if (idx + 1 >= argc) { return false; }
        // NOLINTNEXTLINE(cppcoreguidelines-pro-bounds-pointer-arithmetic)
        out.outputFile = argv[++idx];
        return true;
    }
} // namespace gsc::cli::detail
