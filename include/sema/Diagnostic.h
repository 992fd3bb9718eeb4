/***
 * Name: gsc::sema::Diagnostic
 * Purpose: Carry a diagnostic message with optional source location.
 * Theory of Operation:
 *   Used for fatal translation errors (via TranslationError::where), for
 *   parse failures reported by the driver and for non-fatal warnings
 *   collected during translation. `function` names the script function being
 *   translated when the diagnostic was produced.
 */
#pragma once

#include <string>

namespace gsc::sema {
    struct Diagnostic {
        std::string message;
        std::string file;
        int line{0};
        int col{0};
        std::string function{};
    };
} // namespace gsc::sema
