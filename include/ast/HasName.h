/**
 * @file
 * @brief AST utility declarations (HasName mixin).
 */
#pragma once

#include <string>

namespace gsc::ast {

struct HasName {
    std::string name;
};

}
