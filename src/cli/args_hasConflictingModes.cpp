#include "cli/ParseArgsInternals.h"

namespace gsc::cli::detail {
    /***
     * Name: gsc::cli::detail::hasConflictingModes
     * Purpose: Validate mutually exclusive metrics formats.
     */
    bool hasConflictingModes(const Options &opts) {
        return opts.metrics && opts.metricsJson;
    }
} // namespace gsc::cli::detail
