#include "cli/Usage.h"
#include <string>
#include <string_view>
namespace gsc::cli {

namespace {
// Keep help text as a compile-time constant to avoid reallocation work.
constexpr std::string_view kUsageText = R"(gsc [options] file

Options:
  -h, --help           Print this help and exit
  -o <file>            Write the translated graphs to <file> (default: stdout)
  --emit=<format>      Output format: text|json (default: text)
  --domain=<name>      Custom domain of the translated functions (default: this)
  --opset=<N>          Default opset version when a function names none
  --metrics            Print compilation metrics summary
  --metrics-json       Print compilation metrics in JSON
  --ast-log[=before]   Dump the parsed AST before translation
  --log-path=<dir>     Directory where logs are written (default: .)
  --log-translate      Write a translation trace log (under --log-path)
  --color=<mode>       Color diagnostics: always|never|auto (default: auto)
  --diag-context=<N>   Lines of context to show around errors (default: 1)
  --Werror             Treat translation warnings as errors
  --                   End of options
)";
} // namespace

std::string Usage() { return std::string(kUsageText); }
} // namespace gsc::cli
