/***
 * Name: gsc::exceptions::TranslationError::TranslationError
 * Purpose: Construct a located translation error.
 * Inputs:
 *   - msg: bare error description
 *   - where: source position; where.message is overwritten with msg
 * Outputs: Exception with formatted what() text
 */
#include "gsc/exceptions/translation_error.h"

#include <string>
#include <utility>

namespace gsc::exceptions {

namespace {
std::string formatLocated(const std::string& msg, const sema::Diagnostic& where) {
  std::string out;
  if (!where.file.empty()) {
    out += where.file;
    out += ":" + std::to_string(where.line) + ":" + std::to_string(where.col) + ": ";
  }
  if (!where.function.empty()) { out += "in function '" + where.function + "': "; }
  out += msg;
  return out;
}
} // namespace

TranslationError::TranslationError(std::string msg, sema::Diagnostic where) noexcept
    : GscException(formatLocated(msg, where)), where_(std::move(where)) {
  where_.message = std::move(msg);
}

} // namespace gsc::exceptions
