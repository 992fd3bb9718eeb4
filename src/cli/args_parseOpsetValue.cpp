#include "cli/ParseArgsInternals.h"

#include <charconv>

namespace gsc::cli::detail {

/***
 * Name: gsc::cli::detail::parseOpsetValue
 * Purpose: Parse --opset value into a positive opset version.
 */
std::optional<int> parseOpsetValue(std::string_view value) {
    int version = 0;
    const char* end = value.data() + value.size();
    const auto [ptr, ec] = std::from_chars(value.data(), end, version);
    if (ec != std::errc{} || ptr != end || version <= 0) { return std::nullopt; }
    return version;
}

} // namespace gsc::cli::detail
