/***
 * Name: gsc::exceptions::EmptyListError
 * Purpose: Empty list literal where a typed tensor must be produced.
 * Theory of Operation: Marker type deriving from TranslationError.
 */
#pragma once

#include "gsc/exceptions/translation_error.h"

namespace gsc {
namespace exceptions {

class EmptyListError : public TranslationError {
 public:
  using TranslationError::TranslationError;
};

}  // namespace exceptions
}  // namespace gsc
