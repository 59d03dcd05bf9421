/**
 * @file common_data_types.h
 * @brief Defines shared data types for core service interfaces
 */

#pragma once

#ifndef RASTERCUBE_CORE_SERVICES_COMMON_DATA_TYPES_H
#define RASTERCUBE_CORE_SERVICES_COMMON_DATA_TYPES_H

#include <array>
#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace rastercube::core_services
{
    /**
     * @brief 像素数据类型
     */
    enum class DataType
    {
        Unknown,
        Byte,
        Int8,
        UInt16,
        Int16,
        UInt32,
        Int32,
        Float32,
        Float64
    };

    /**
     * @brief 数据类型名称，与 numpy 风格一致 ("uint8", "float32" ...)
     */
    std::string dataTypeToString(DataType dataType);

    /**
     * @brief 解析数据类型名称，大小写不敏感；无法识别时返回 Unknown
     *
     * 同时接受 GDAL 名称 ("Byte", "Float32" ...)。
     */
    DataType dataTypeFromString(const std::string& name);

    /**
     * @struct CRSInfo
     * @brief 坐标参考系统信息
     */
    struct CRSInfo
    {
        std::string wkt;                  // WKT格式的完整CRS描述
        std::optional<int> epsgCode;      // EPSG代码，如果可用

        CRSInfo() = default;

        static CRSInfo fromEpsg(int code, const std::string& wktText = "");

        bool empty() const { return wkt.empty() && !epsgCode.has_value(); }

        /**
         * @brief "EPSG:4326"，无 EPSG 代码时返回 WKT
         */
        std::string identifier() const;

        // 两侧都有EPSG代码时只比较代码，否则比较WKT文本
        bool operator==(const CRSInfo& other) const;
        bool operator!=(const CRSInfo& other) const { return !(*this == other); }
    };

    /**
     * @struct GridGeometry
     * @brief 二维平面的网格几何
     *
     * geoTransform 采用 GDAL 六参数仿射变换：
     * Xgeo = gt[0] + col*gt[1] + row*gt[2]
     * Ygeo = gt[3] + col*gt[4] + row*gt[5]
     */
    struct GridGeometry
    {
        size_t rows = 0;
        size_t cols = 0;
        std::array<double, 6> geoTransform{{0.0, 1.0, 0.0, 0.0, 0.0, -1.0}};
        CRSInfo crs;

        /// 像元中心 y 坐标，长度 rows
        std::vector<double> yCoordinates() const;

        /// 像元中心 x 坐标，长度 cols
        std::vector<double> xCoordinates() const;

        bool sameShape(const GridGeometry& other) const
        {
            return rows == other.rows && cols == other.cols;
        }

        /**
         * @brief 形状、坐标和 CRS 完全相同（不做容差比较）
         */
        bool operator==(const GridGeometry& other) const;
        bool operator!=(const GridGeometry& other) const { return !(*this == other); }

        std::string toString() const;
    };

} // namespace rastercube::core_services

#endif // RASTERCUBE_CORE_SERVICES_COMMON_DATA_TYPES_H
