/***
 * Name: gsc::exceptions::GscException::GscException
 * Purpose: Construct base exception with a message.
 * Inputs:
 *   - msg: human-readable error description
 * Outputs: Initialized exception object
 * Theory of Operation: Stores the message for later retrieval by what().
 */
#include "gsc/exceptions/gsc_exception.h"

#include <utility>

namespace gsc {
namespace exceptions {

GscException::GscException(std::string msg) noexcept : message_(std::move(msg)) {}

}  // namespace exceptions
}  // namespace gsc
