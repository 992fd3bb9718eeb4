/***
 * Name: gsc::exceptions::GscException::what
 * Purpose: Return the stored error message.
 * Inputs: none
 * Outputs: C-string pointer valid for the lifetime of the exception
 * Theory of Operation: Returns message_.c_str(); noexcept.
 */
#include "gsc/exceptions/gsc_exception.h"

namespace gsc::exceptions {

const char* GscException::what() const noexcept { return message_.c_str(); }

}  // namespace gsc::exceptions
