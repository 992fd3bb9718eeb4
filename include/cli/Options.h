#pragma once

#include <optional>
#include <string>
#include <vector>

#include "ColorMode.h"

namespace gsc::cli {

    enum class AstLogMode {
        None,
        Before
    };

    enum class EmitFormat {
        Text,
        Json
    };

    struct Options {
        bool showHelp{false};
        bool metrics{false};          // --metrics
        bool metricsJson{false};      // --metrics-json
        bool werror{false};           // --Werror
        std::string outputFile{};     // -o <file>; empty writes to stdout
        EmitFormat emit{EmitFormat::Text};
        std::string domain{"this"};   // --domain=<name>
        std::optional<int> opset{};   // --opset=<N>
        std::vector<std::string> inputs{};
        ColorMode color{ColorMode::Auto};
        int diagContext{1};
        AstLogMode astLog{AstLogMode::None};
        std::string logPath{"."};     // --log-path=<dir> (defaults to ./)
        bool logTranslate{false};     // --log-translate
    };

} // namespace gsc::cli
