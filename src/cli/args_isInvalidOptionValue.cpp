#include "cli/ParseArgsInternals.h"

namespace gsc::cli::detail {
    /***
     * Name: gsc::cli::detail::isInvalidOptionValue
     * Purpose: Reject --emit, --opset and --domain values that cannot be used.
     */
    bool isInvalidOptionValue(const std::string_view arg) {
        if (constexpr std::string_view emitPrefix{"--emit="}; arg.rfind(emitPrefix, 0) == 0) {
            return !parseEmitValue(arg.substr(emitPrefix.size())).has_value();
        }
        if (constexpr std::string_view opsetPrefix{"--opset="}; arg.rfind(opsetPrefix, 0) == 0) {
            return !parseOpsetValue(arg.substr(opsetPrefix.size())).has_value();
        }
        if (constexpr std::string_view domainPrefix{"--domain="}; arg.rfind(domainPrefix, 0) == 0) {
            return arg.size() == domainPrefix.size();
        }
        return false;
    }
} // namespace gsc::cli::detail
