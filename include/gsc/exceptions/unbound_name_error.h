/***
 * Name: gsc::exceptions::UnboundNameError
 * Purpose: Name not bound in any scope frame nor in the module environment.
 * Theory of Operation: Marker type deriving from TranslationError.
 */
#pragma once

#include "gsc/exceptions/translation_error.h"

namespace gsc {
namespace exceptions {

class UnboundNameError : public TranslationError {
 public:
  using TranslationError::TranslationError;
};

}  // namespace exceptions
}  // namespace gsc
