#include "cli/ParseArgsInternals.h"

namespace gsc::cli::detail {

/***
 * Name: gsc::cli::detail::parseAstLogValue
 * Purpose: Parse --ast-log value into AstLogMode with default.
 * Theory of Operation:
 *   The AST is only dumped before translation, so every value selects
 *   Before except an explicit "none".
 */
AstLogMode parseAstLogValue(std::string_view value) {
    using enum gsc::cli::AstLogMode;
    if (value == "none") { return None; }
    return Before;
}

} // namespace gsc::cli::detail
