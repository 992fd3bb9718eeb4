/***
 * Name: gsc::runtime::Tensor
 * Purpose: Element count of a tensor.
 */
#include "runtime/Tensor.h"

namespace gsc::runtime {

    std::int64_t Tensor::size() const {
        std::int64_t n = 1;
        for (const auto d : data_.dims) { n *= d; }
        return n;
    }

} // namespace gsc::runtime
