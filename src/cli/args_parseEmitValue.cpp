#include "cli/ParseArgsInternals.h"

namespace gsc::cli::detail {

/***
 * Name: gsc::cli::detail::parseEmitValue
 * Purpose: Parse --emit value into EmitFormat.
 */
std::optional<EmitFormat> parseEmitValue(std::string_view value) {
    using enum gsc::cli::EmitFormat;
    if (value == "text") { return Text; }
    if (value == "json") { return Json; }
    return std::nullopt;
}

} // namespace gsc::cli::detail
