/***
 * Name: gsc::exceptions::TranslationError
 * Purpose: Base for every fatal error raised while lowering a script function.
 * Inputs:
 *   - msg: human-readable description of the failure
 *   - where: source position (file, line, column, enclosing function)
 * Outputs: Exception whose what() is "file:line:col: in function 'f': msg"
 * Theory of Operation:
 *   The position is kept separately so the driver can render it with the
 *   same caret printer it uses for parse diagnostics. The message in where()
 *   is the bare message; what() carries the formatted form.
 */
#pragma once

#include "gsc/exceptions/gsc_exception.h"
#include "sema/Diagnostic.h"

namespace gsc {
namespace exceptions {

class TranslationError : public GscException {
 public:
  TranslationError(std::string msg, sema::Diagnostic where) noexcept;

  const sema::Diagnostic& where() const noexcept { return where_; }

 private:
  sema::Diagnostic where_;
};

}  // namespace exceptions
}  // namespace gsc
