#include "cli/ParseArgsInternals.h"

#include <algorithm>
#include <stdexcept>
#include <string>

namespace gsc::cli::detail {
    /***
     * Name: gsc::cli::detail::applyPrefixedOptions
     * Purpose: Parse and apply --key=value options like emit/opset/color/diag-context.
     * Theory of Operation:
     *   Values are assumed to have passed isInvalidOptionValue; ast-log and
     *   color fall back to their defaults on unknown values.
     */
    bool applyPrefixedOptions(std::string_view arg, Options &out) {
        if (constexpr std::string_view emitPrefix{"--emit="}; arg.rfind(emitPrefix, 0) == 0) {
            out.emit = parseEmitValue(arg.substr(emitPrefix.size())).value_or(EmitFormat::Text);
            return true;
        }

        if (constexpr std::string_view domainPrefix{"--domain="}; arg.rfind(domainPrefix, 0) == 0) {
            out.domain = std::string(arg.substr(domainPrefix.size()));
            return true;
        }

        if (constexpr std::string_view opsetPrefix{"--opset="}; arg.rfind(opsetPrefix, 0) == 0) {
            out.opset = parseOpsetValue(arg.substr(opsetPrefix.size()));
            return true;
        }

        if (constexpr std::string_view astLogPrefix{"--ast-log="}; arg.rfind(astLogPrefix, 0) == 0) {
            out.astLog = parseAstLogValue(arg.substr(astLogPrefix.size()));
            return true;
        }

        if (constexpr std::string_view logPathPrefix{"--log-path="}; arg.rfind(logPathPrefix, 0) == 0) {
            out.logPath = std::string(arg.substr(logPathPrefix.size()));
            return true;
        }

        if (constexpr std::string_view colorPrefix{"--color="}; arg.rfind(colorPrefix, 0) == 0) {
            out.color = parseColorValue(arg.substr(colorPrefix.size()));
            return true;
        }

        if (constexpr std::string_view diagPrefix{"--diag-context="}; arg.rfind(diagPrefix, 0) == 0) {
            int numLines = 0;
            try {
                numLines = std::stoi(std::string(arg.substr(diagPrefix.size())));
            } catch (const std::logic_error &) {
                numLines = 0;
            }
            out.diagContext = std::max(numLines, 0);
            return true;
        }
        return false;
    }
} // namespace gsc::cli::detail
