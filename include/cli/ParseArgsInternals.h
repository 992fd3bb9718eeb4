/**
 * @file
 * @brief Declarations for gsc CLI argument parsing helpers.
 */
#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>

#include "cli/Options.h"
#include "cli/ColorMode.h"

namespace gsc::cli::detail {

/** Return true if `arg` exactly matches the `flag`. */
bool isFlag(std::string_view arg, std::string_view flag);

/** Parse `--ast-log=<value>` to AstLogMode with default fallback. */
AstLogMode parseAstLogValue(std::string_view value);

/** Parse `--color=<value>` to ColorMode with default fallback. */
ColorMode parseColorValue(std::string_view value);

/** Parse `--emit=<value>`; nullopt for anything but text or json. */
std::optional<EmitFormat> parseEmitValue(std::string_view value);

/** Parse `--opset=<N>`; nullopt unless N is a positive integer. */
std::optional<int> parseOpsetValue(std::string_view value);

/** Collect remaining argv items as input paths starting at index. */
void collectRemainingAsInputs(std::size_t startIndex, int argc, char** argv, Options& out);

/** Detect unknown option-like arguments beginning with '-' that aren't supported. */
bool isUnknownOptionArg(std::string_view arg);

/** Detect `--key=value` options whose value cannot be used (emit, opset, domain). */
bool isInvalidOptionValue(std::string_view arg);

/** Validate incompatible modes (e.g., --metrics and --metrics-json together). */
bool hasConflictingModes(const Options& opts);

/** Handle boolean, flag-only options like -h, --metrics, --Werror, etc. */
bool applySimpleBoolFlags(std::string_view arg, Options& out);

/** Handle `--key=value` style options (emit, domain, opset, ast-log, log-path, color, diag-context). */
bool applyPrefixedOptions(std::string_view arg, Options& out);

/** Handle `-o <file>` output flag by consuming the next argv item. */
bool handleOutputFileFlag(int& idx, int argc, char** argv, Options& out);

} // namespace gsc::cli::detail
