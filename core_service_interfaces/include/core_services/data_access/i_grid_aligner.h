#pragma once

#include "core_services/gridded_array.h"

namespace rastercube {
namespace core_services {

/**
 * @brief 网格对齐接口
 *
 * 把数组重采样到目标网格。时间轴（如有）保持不变，重采样延迟到数组
 * 物化时进行。
 */
class IGridAligner {
public:
    virtual ~IGridAligner() = default;

    virtual GriddedArray align(const GriddedArray& source, const GridGeometry& target) = 0;
};

} // namespace core_services
} // namespace rastercube
