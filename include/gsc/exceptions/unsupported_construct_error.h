/***
 * Name: gsc::exceptions::UnsupportedConstructError
 * Purpose: Construct outside the accepted script subset (statement, expression, operator shape, loop bound, break placement).
 * Theory of Operation: Marker type deriving from TranslationError.
 */
#pragma once

#include "gsc/exceptions/translation_error.h"

namespace gsc {
namespace exceptions {

class UnsupportedConstructError : public TranslationError {
 public:
  using TranslationError::TranslationError;
};

}  // namespace exceptions
}  // namespace gsc

namespace gsc::exceptions {
using SyntaxUnsupportedError = UnsupportedConstructError;
} // namespace gsc::exceptions
