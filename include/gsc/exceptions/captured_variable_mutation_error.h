/***
 * Name: gsc::exceptions::CapturedVariableMutationError
 * Purpose: Outer variable captured by a nested function changed between definition and use.
 * Theory of Operation: Marker type deriving from TranslationError.
 */
#pragma once

#include "gsc/exceptions/translation_error.h"

namespace gsc {
namespace exceptions {

class CapturedVariableMutationError : public TranslationError {
 public:
  using TranslationError::TranslationError;
};

}  // namespace exceptions
}  // namespace gsc
