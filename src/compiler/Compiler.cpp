/***
 * Name: gsc::Compiler::run
 * Purpose: Execute the translation pipeline end-to-end.
 */
#include "compiler/Compiler.h"
#include "ast/GeometrySummary.h"
#include "ast/Module.h"
#include "cli/ColorMode.h"
#include "cli/Options.h"
#include "converter/Converter.h"
#include "gsc/exceptions/file_read_error.h"
#include "gsc/exceptions/parse_error.h"
#include "gsc/exceptions/translation_error.h"
#include "ir/JsonWriter.h"
#include "ir/TextPrinter.h"
#include "lexer/Lexer.h"
#include "observability/AstPrinter.h"
#include "observability/Metrics.h"
#include "parser/Parser.h"
#include "schema/BuiltinSchemas.h"
#include "sema/Diagnostic.h"

#include <chrono>
#include <cstdint>
#include <ctime>
#include <exception>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <memory>
#include <sstream>
#include <string>
#include <system_error>
#include <unistd.h>
#include <vector>

namespace gsc {

namespace {

bool resolveColor(const cli::ColorMode mode) {
  if (mode == cli::ColorMode::Always) { return true; }
  if (mode == cli::ColorMode::Never) { return false; }
  constexpr int kStderrFd = 2;
  return (isatty(kStderrFd) != 0) || Compiler::use_env_color();
}

// Messages look like "file:line:col: text"; fall back to 1:1 when they don't.
sema::Diagnostic diagnosticFromMessage(const std::string& input, const std::string& what) {
  sema::Diagnostic diag;
  diag.file = input;
  diag.line = 1;
  diag.col = 1;
  diag.message = what;
  const auto prefix = input + ":";
  if (what.rfind(prefix, 0) != 0) { return diag; }
  std::istringstream rest(what.substr(prefix.size()));
  int line = 0;
  int col = 0;
  char sep1 = 0;
  char sep2 = 0;
  if (rest >> line >> sep1 >> col >> sep2 && sep1 == ':' && sep2 == ':') {
    diag.line = line;
    diag.col = col;
    std::string text;
    std::getline(rest, text);
    diag.message = text.empty() || text.front() != ' ' ? text : text.substr(1);
  }
  return diag;
}

std::string timestampPrefix() {
  auto tsNow = std::chrono::system_clock::now();
  const std::time_t tsTime = std::chrono::system_clock::to_time_t(tsNow);
  std::tm tmBuf{};
#ifdef _WIN32
  localtime_s(&tmBuf, &tsTime);
#else
  localtime_r(&tsTime, &tmBuf);
#endif
  std::ostringstream timestampStream;
  timestampStream << std::put_time(&tmBuf, "%Y%m%d-%H%M%S");
  return timestampStream.str() + "-";
}

// Nodes of a graph and of every subgraph held in its attributes.
uint64_t countNodes(const ir::Function& fn) {
  uint64_t total = fn.stmts.size();
  for (const auto& stmt : fn.stmts) {
    for (const auto& attr : stmt.attrs) {
      if (attr.graph) { total += countNodes(*attr.graph); }
    }
  }
  return total;
}

void emitModule(const ir::Module& module, const cli::EmitFormat format, std::ostream& out) {
  if (format == cli::EmitFormat::Json) {
    ir::JsonWriter writer(out);
    writer.write(module);
    return;
  }
  ir::TextPrinter printer(out);
  printer.print(module);
}

} // namespace

int Compiler::run(const cli::Options& opts) { // NOLINT(readability-function-size,readability-function-cognitive-complexity)
  if (opts.inputs.empty()) {
    std::cerr << "gsc: no input files provided\n";
    return 2;
  }
  if (opts.inputs.size() > 1) {
    std::cerr << "gsc: exactly one input file expected, got " << opts.inputs.size() << "\n";
    return 2;
  }
  const std::string input = opts.inputs.front();
  const bool color = resolveColor(opts.color);

  obs::Metrics metrics;
  lex::Lexer lexer; // NOLINT(misc-const-correctness)
  std::unique_ptr<ast::Module> mod;
  try {
    metrics.start("Lex");
    lexer.pushFile(input);
    const auto toks = lexer.tokens();
    metrics.stop("Lex");
    metrics.setCounter("lex.tokens", static_cast<uint64_t>(toks.size()));

    metrics.start("Parse");
    parse::Parser parser(lexer);
    mod = parser.parseModule();
    metrics.stop("Parse");
  } catch (const exceptions::FileReadError& ex) {
    std::cerr << "gsc: " << ex.what() << "\n";
    return 1;
  } catch (const exceptions::ParseError& ex) {
    print_error(diagnosticFromMessage(input, ex.what()), color, opts.diagContext);
    return 1;
  } catch (const exceptions::TranslationError& ex) {
    print_error(ex.where(), color, opts.diagContext);
    return 1;
  }

  auto geom = ast::ComputeGeometry(*mod);
  metrics.setAstGeometry({geom.nodes, geom.maxDepth});

  // Optional log directory creation
  bool logsEnabled = true;
  const std::string logDir = opts.logPath.empty() ? std::string(".") : opts.logPath;
  const bool wantsLogs = opts.logTranslate || opts.metrics || opts.metricsJson;
  if (wantsLogs) {
    std::error_code errCode;
    namespace fs = std::filesystem;
    if (!fs::exists(logDir, errCode)) {
      if (!fs::create_directories(logDir, errCode) && !fs::exists(logDir)) {
        std::cerr << "gsc: failed to create log directory '" << logDir << "': " << errCode.message() << "\n";
        logsEnabled = false;
      }
    }
  }
  const std::string tsPrefix = timestampPrefix();

  if (opts.astLog == cli::AstLogMode::Before) {
    obs::AstPrinter printer; // NOLINT(misc-const-correctness)
    std::cout << "== AST ==\n" << printer.print(*mod);
  }

  converter::ConverterOptions copts;
  copts.domain = opts.domain;
  copts.fileName = input;
  if (opts.opset) { copts.defaultOpset = values::Opset{"", *opts.opset}; }
  const schema::BuiltinSchemas schemas;
  converter::Converter conv(schemas, copts);
  conv.setMetrics(&metrics);
  std::ofstream traceFile;
  if (opts.logTranslate && logsEnabled) {
    traceFile.open(logDir + "/" + tsPrefix + "translate.log");
    if (traceFile) { conv.setTrace(&traceFile); }
    else { std::cerr << "gsc: cannot open translate log in '" << logDir << "'\n"; }
  }

  ir::Module module;
  try {
    metrics.start("Translate");
    module = conv.translateModule(*mod);
    metrics.stop("Translate");
  } catch (const exceptions::TranslationError& ex) {
    for (const auto& warning : conv.warnings()) { print_warning(warning, color, opts.diagContext); }
    print_error(ex.where(), color, opts.diagContext);
    return 1;
  }

  const auto& warnings = conv.warnings();
  for (const auto& warning : warnings) { print_warning(warning, color, opts.diagContext); }
  metrics.setCounter("translate.warnings", static_cast<uint64_t>(warnings.size()));
  uint64_t nodes = 0;
  for (const auto& fn : module.functions) { nodes += countNodes(*fn); }
  metrics.setCounter("translate.nodes", nodes);
  if (opts.werror && !warnings.empty()) {
    std::cerr << "gsc: " << warnings.size() << " warning(s) treated as errors\n";
    return 1;
  }

  metrics.start("Emit");
  if (opts.outputFile.empty()) {
    emitModule(module, opts.emit, std::cout);
  } else {
    std::ofstream outFile(opts.outputFile);
    if (!outFile) {
      std::cerr << "gsc: cannot open output file '" << opts.outputFile << "'\n";
      return 1;
    }
    emitModule(module, opts.emit, outFile);
  }
  metrics.stop("Emit");

  if (opts.metricsJson) {
    std::cout << metrics.summaryJson();
  } else if (opts.metrics) {
    std::cout << metrics.summaryText();
  }

  // Always write metrics JSON to log directory when any metrics requested
  if (opts.metrics || opts.metricsJson) {
    const std::string metricsPath = logsEnabled
        ? (logDir + "/" + tsPrefix + "metrics.json")
        : (std::string("./") + tsPrefix + std::string("metrics.json"));
    std::ofstream metricsFile(metricsPath);
    metricsFile << metrics.summaryJson();
  }
  return 0;
}

} // namespace gsc
