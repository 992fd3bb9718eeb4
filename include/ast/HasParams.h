/**
 * @file
 * @brief AST utility declarations (HasParams mixin).
 */
#pragma once

#include <vector>

namespace gsc::ast {

template <typename ParamT>
struct HasParams {
    std::vector<ParamT> params;
};

}
