/***
 * Name: gsc::exceptions::ParseError
 * Purpose: Exception for frontend lexing/parsing failures.
 * Inputs: Error message (already carrying file:line:col context)
 * Outputs: Exception object
 * Theory of Operation: Marker type deriving from GscException.
 */
#pragma once

#include "gsc/exceptions/gsc_exception.h"

#include <string>
#include <utility>

namespace gsc {
namespace exceptions {

class ParseError : public GscException {
 public:
  explicit ParseError(std::string msg) noexcept : GscException(std::move(msg)) {}
};

}  // namespace exceptions
}  // namespace gsc
