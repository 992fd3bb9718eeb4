/***
 * Name: gsc::exceptions::GscException
 * Purpose: Base class for all gsc exceptions; do not use built-in exceptions directly.
 * Inputs: Message string describing the error condition
 * Outputs: Exception object providing `what()` text
 * Theory of Operation: Derives from std::exception to interoperate with catch sites,
 *   but all throws in gsc must use a custom type derived from this base.
 */
#pragma once

#include <exception>
#include <string>

namespace gsc {
namespace exceptions {

class GscException : public std::exception {
 public:
  virtual ~GscException() noexcept = default;
  const char* what() const noexcept override;

 protected:
  explicit GscException(std::string msg) noexcept;
  std::string message_;
};

}  // namespace exceptions
}  // namespace gsc
