/***
 * Name: gsc::exceptions::ArityError
 * Purpose: Argument/parameter or return-value count mismatch.
 * Theory of Operation: Marker type deriving from TranslationError.
 */
#pragma once

#include "gsc/exceptions/translation_error.h"

namespace gsc {
namespace exceptions {

class ArityError : public TranslationError {
 public:
  using TranslationError::TranslationError;
};

}  // namespace exceptions
}  // namespace gsc
