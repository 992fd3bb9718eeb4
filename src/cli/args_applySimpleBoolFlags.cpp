#include "cli/ParseArgsInternals.h"

namespace gsc::cli::detail {
    /***
     * Name: gsc::cli::detail::applySimpleBoolFlags
     * Purpose: Handle flag-only boolean options and set outputs.
     */
    bool applySimpleBoolFlags(std::string_view arg, Options &out) {
        if (isFlag(arg, "-h")) {
            out.showHelp = true;
            return true;
        }
        if (isFlag(arg, "--help")) {
            out.showHelp = true;
            return true;
        }
        if (isFlag(arg, "--metrics")) {
            out.metrics = true;
            return true;
        }
        if (isFlag(arg, "--metrics-json")) {
            out.metricsJson = true;
            return true;
        }
        if (isFlag(arg, "--log-translate")) {
            out.logTranslate = true;
            return true;
        }
        if (isFlag(arg, "--Werror")) {
            out.werror = true;
            return true;
        }
        if (isFlag(arg, "--ast-log")) {
            out.astLog = AstLogMode::Before;
            return true;
        }
        return false;
    }
} // namespace gsc::cli::detail
