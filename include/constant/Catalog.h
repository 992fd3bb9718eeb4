/***
 * Name: gsc::constant catalog
 * Purpose: Builtin modules and names a script can reference.
 * Theory of Operation:
 *   `gsc.opsets` exposes opset1..opset18 of the default domain, `gsc.types`
 *   exposes the tensor type objects (FLOAT, INT64, ...), `gsc` is the union
 *   of both plus the two submodules, and `typing` exposes the generic
 *   containers. Builtins are the scalar type names int/float/str/bool and
 *   the unparameterized list/tuple generics.
 */
#pragma once

#include "constant/PyValue.h"
#include <optional>
#include <string>

namespace gsc::constant {

    constexpr int kMaxDefaultOpsetVersion = 18;

    std::optional<PyValue> lookupModule(const std::string &dottedPath);

    std::optional<PyValue> lookupBuiltin(const std::string &name);

} // namespace gsc::constant
