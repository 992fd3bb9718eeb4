/***
 * Name: gsc::exceptions::TypeMismatchError
 * Purpose: Value of an unexpected type (heterogeneous list, non-int slice bound, bad attribute value).
 * Theory of Operation: Marker type deriving from TranslationError.
 */
#pragma once

#include "gsc/exceptions/translation_error.h"

namespace gsc {
namespace exceptions {

class TypeMismatchError : public TranslationError {
 public:
  using TranslationError::TranslationError;
};

}  // namespace exceptions
}  // namespace gsc
