#include "compiler/Compiler.h"
#include "cli/ParseArgs.h"
#include "cli/Usage.h"
#include "gsc/exceptions/gsc_exception.h"
#include <exception>
#include <iostream>
/***
 * Name: gsc::main
 * Purpose: CLI entry point for the gsc graph-script compiler.
 * Inputs:
 *   - argv
 * Outputs:
 *   - Exit status: 0 ok, 1 compile error, 2 usage error
 * Theory of Operation:
 *   Parse args then invoke Compiler::run.
 */
int main(const int argc, char** argv) {
  try {
    gsc::cli::Options opts;
    if (!gsc::cli::ParseArgs(argc, argv, opts)) {
      std::cerr << "gsc: argument parse error\n";
      std::cerr << gsc::cli::Usage();
      return 2;
    }
    if (opts.showHelp) {
      std::cout << gsc::cli::Usage();
      return 0;
    }
    return gsc::Compiler::run(opts);
  } catch (const gsc::exceptions::GscException& ex) {
    std::cerr << "gsc: " << ex.what() << "\n";
    return 1;
  } catch (const std::exception& ex) {
    std::cerr << "gsc: internal error: " << ex.what() << "\n";
    return 1;
  }
}
