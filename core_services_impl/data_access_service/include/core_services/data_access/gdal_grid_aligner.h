/**
 * @file gdal_grid_aligner.h
 * @brief 基于 GDAL warper 的网格对齐（最近邻）
 */

#pragma once

#include "core_services/data_access/i_grid_aligner.h"

namespace rastercube::core_services::data_access {

/**
 * @brief 在内存数据集 (MEM 驱动) 之间执行 GDALReprojectImage
 *
 * 源与目标网格相同时原样返回输入数组。目标范围外的像元为 NaN。
 */
class GdalGridAligner : public IGridAligner {
public:
    GriddedArray align(const GriddedArray& source, const GridGeometry& target) override;
};

} // namespace rastercube::core_services::data_access
