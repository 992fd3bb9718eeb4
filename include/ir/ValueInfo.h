/***
 * Name: gsc::ir::ValueInfo
 * Purpose: A graph input or output: value name plus optional annotated type.
 */
#pragma once

#include "types/TypeInfo.h"
#include <string>

namespace gsc::ir {

    struct ValueInfo {
        std::string name;
        types::TypePtr type{};
    };

} // namespace gsc::ir
