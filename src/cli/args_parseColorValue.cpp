#include "cli/ParseArgsInternals.h"

namespace gsc::cli::detail {

/***
 * Name: gsc::cli::detail::parseColorValue
 * Purpose: Parse --color value into ColorMode with default.
 */
ColorMode parseColorValue(std::string_view value) {
    using enum gsc::cli::ColorMode;
    if (value == "always") { return Always; }
    if (value == "never") { return Never; }
    return Auto;
}

} // namespace gsc::cli::detail
