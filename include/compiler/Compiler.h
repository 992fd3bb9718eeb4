#ifndef GSC_COMPILER_COMPILER_H
#define GSC_COMPILER_COMPILER_H

/***
 * Name: gsc::Compiler
 * Purpose: Orchestrate the end-to-end translation pipeline.
 * Inputs:
 *   - CLI options
 * Outputs:
 *   - Translated graph module (text or JSON) on stdout or in -o; exit code
 * Theory of Operation:
 *   Reads source, lexes, parses, computes geometry, runs liveness and the
 *   converter per function, then writes the module with the text printer or
 *   JSON writer and reports optional metrics and logs.
 */

// Forward declarations to reduce header coupling
namespace gsc { namespace cli { struct Options; } }
namespace gsc { namespace sema { struct Diagnostic; } }

namespace gsc {
    class Compiler {
    public:
        static int run(const cli::Options &opts);

        static bool use_env_color();

        static void print_error(const sema::Diagnostic &diag, bool color, int context);

        static void print_warning(const sema::Diagnostic &diag, bool color, int context);
    };
} // namespace gsc

#endif // GSC_COMPILER_COMPILER_H
