#include "cli/ParseArgs.h"
#include "cli/ColorMode.h"
#include "cli/Options.h"
#include "cli/ParseArgsInternals.h"
#include <iostream>

namespace gsc::cli {
    /***
     * Name: gsc::cli::ParseArgs
     * Purpose: Minimal GCC-like CLI argument parser for gsc.
     */
    bool ParseArgs(const int argc, char **argv, Options &out) {
        for (int i = 1; i < argc; ++i) {
            // NOLINTNEXTLINE(cppcoreguidelines-pro-bounds-pointer-arithmetic)
            const std::string_view arg{argv[i]};
            if (detail::isFlag(arg, "--")) {
                detail::collectRemainingAsInputs(i + 1, argc, argv, out);
                break;
            }
            if (detail::isFlag(arg, "-o") && i + 1 >= argc) {
                std::cerr << "gsc: missing file name after '-o'\n";
                return false;
            }
            if (detail::handleOutputFileFlag(i, argc, argv, out)) { continue; }
            if (detail::applySimpleBoolFlags(arg, out)) { continue; }
            if (detail::isInvalidOptionValue(arg)) {
                std::cerr << "gsc: invalid value in '" << arg << "'\n";
                return false;
            }
            if (detail::applyPrefixedOptions(arg, out)) { continue; }

            // Positional
            if (detail::isUnknownOptionArg(arg)) {
                std::cerr << "gsc: unknown option '" << arg << "'\n";
                return false;
            }
            out.inputs.emplace_back(std::string(arg));
        }

        if (detail::hasConflictingModes(out)) {
            std::cerr << "gsc: cannot use --metrics and --metrics-json together\n";
            return false;
        }

        return true;
    }
} // namespace gsc::cli
