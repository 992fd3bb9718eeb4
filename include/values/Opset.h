/***
 * Name: gsc::values::Opset
 * Purpose: Identify an operator set by domain and version.
 * Theory of Operation:
 *   The default operator domain is the empty string. Opsets are compared by
 *   value; `opset18` in a script is Opset{"", 18}.
 */
#pragma once

#include <string>

namespace gsc::values {

    struct Opset {
        std::string domain;
        int version{0};

        bool operator==(const Opset &other) const { return domain == other.domain && version == other.version; }
        bool operator!=(const Opset &other) const { return !(*this == other); }

        // "opset18" for the default domain, "<domain>:<version>" otherwise
        std::string str() const {
            if (domain.empty()) { return "opset" + std::to_string(version); }
            return domain + ":" + std::to_string(version);
        }
    };

} // namespace gsc::values
