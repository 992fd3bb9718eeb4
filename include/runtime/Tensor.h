/***
 * Name: gsc::runtime::Tensor
 * Purpose: Minimal tensor value for interpreted argument handling.
 * Theory of Operation:
 *   Holds element type, dimensions and flat data. Operators are not
 *   executed; the tensor only records the outcome of literal promotion.
 */
#pragma once

#include "ir/Attr.h"
#include <cstdint>
#include <utility>
#include <vector>

namespace gsc::runtime {

    class Tensor {
    public:
        explicit Tensor(ir::TensorConst data) : data_(std::move(data)) {}

        ir::ElemType elemType() const { return data_.elemType; }
        const std::vector<std::int64_t> &dims() const { return data_.dims; }
        std::size_t rank() const { return data_.dims.size(); }
        std::int64_t size() const;
        const ir::TensorConst &data() const { return data_; }

    private:
        ir::TensorConst data_;
    };

} // namespace gsc::runtime
