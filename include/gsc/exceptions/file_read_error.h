/***
 * Name: gsc::exceptions::FileReadError
 * Purpose: Exception for filesystem read failures.
 * Inputs: Error message
 * Outputs: Exception object
 * Theory of Operation: Marker type deriving from GscException.
 */
#pragma once

#include "gsc/exceptions/gsc_exception.h"

#include <string>
#include <utility>

namespace gsc {
namespace exceptions {

class FileReadError : public GscException {
 public:
  explicit FileReadError(std::string msg) noexcept : GscException(std::move(msg)) {}
};

}  // namespace exceptions
}  // namespace gsc
