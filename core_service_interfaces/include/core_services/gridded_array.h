/**
 * @file gridded_array.h
 * @brief 延迟物化的网格数组
 *
 * GriddedArray 是 {空间平面 (y, x), 时空立方体 (time, y, x)} 两种形态的
 * 标记联合。像素数据由 DeferredPixels 持有，只有在调用 values() 时才读取。
 * 所有变换 (expandTime, concatenateTime) 都返回新实例，不修改原数组。
 */

#pragma once

#include "core_services/common_data_types.h"
#include "common_utils/time/time_types.h"

#include <cstddef>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace rastercube::core_services {

using common_utils::time::CalendarTime;

/**
 * @brief 延迟计算句柄
 *
 * 持有形状、数据类型和物化函数。物化函数至多成功执行一次，结果由所有
 * 副本共享；物化失败时异常传给调用方，下次调用重新尝试。
 */
class DeferredPixels {
public:
    using Materializer = std::function<std::vector<double>()>;

    DeferredPixels();
    DeferredPixels(std::vector<size_t> shape, DataType dataType, Materializer materializer);

    /**
     * @brief 由已知数据构造（已物化）
     * @throws ValidationException 数据长度与形状不符
     */
    static DeferredPixels fromValues(std::vector<size_t> shape, DataType dataType,
                                     std::vector<double> values);

    const std::vector<size_t>& shape() const { return shape_; }
    DataType dataType() const { return dataType_; }
    size_t elementCount() const;

    bool isMaterialized() const;

    /**
     * @brief 强制物化并返回像素值（行优先）
     * @throws DataAccessException 物化结果长度与形状不符；物化函数自身的异常原样传播
     */
    const std::vector<double>& materialize() const;

    /**
     * @brief 元素个数不变的新形状，与当前句柄共享物化状态和缓存
     * @throws ValidationException 元素个数不同
     */
    DeferredPixels reshaped(std::vector<size_t> newShape) const;

    /**
     * @brief 以当前句柄为输入构造新的延迟句柄
     */
    DeferredPixels transform(std::vector<size_t> newShape,
                             std::function<std::vector<double>(const std::vector<double>&)> fn) const;

private:
    struct State {
        std::mutex mutex;
        Materializer materializer;
        std::optional<std::vector<double>> values;
    };

    std::vector<size_t> shape_;
    DataType dataType_ = DataType::Unknown;
    std::shared_ptr<State> state_;
};

/**
 * @brief 纯空间平面，维度 (y, x)
 */
struct SpatialGrid {
    GridGeometry geometry;
    DeferredPixels pixels;
};

/**
 * @brief 时空立方体，维度 (time, y, x)
 */
struct SpatioTemporalGrid {
    GridGeometry geometry;
    std::vector<CalendarTime> times;
    DeferredPixels pixels;
};

class GriddedArray {
public:
    using Storage = std::variant<SpatialGrid, SpatioTemporalGrid>;

    explicit GriddedArray(SpatialGrid grid);
    explicit GriddedArray(SpatioTemporalGrid grid);

    /**
     * @throws ValidationException 像素形状不是 {rows, cols}
     */
    static GriddedArray spatial(GridGeometry geometry, DeferredPixels pixels);

    bool hasTimeAxis() const { return std::holds_alternative<SpatioTemporalGrid>(storage_); }

    const Storage& storage() const { return storage_; }

    const GridGeometry& geometry() const;

    const DeferredPixels& pixels() const;

    /// {"y", "x"} 或 {"time", "y", "x"}
    std::vector<std::string> dims() const;

    std::vector<size_t> shape() const;

    /// 空间轴名称及长度，按轴名排序
    std::vector<std::pair<std::string, size_t>> spatialSizes() const;

    /// 无时间轴时为空
    const std::vector<CalendarTime>& timeCoordinates() const;

    std::vector<double> yCoordinates() const { return geometry().yCoordinates(); }
    std::vector<double> xCoordinates() const { return geometry().xCoordinates(); }
    const CRSInfo& crs() const { return geometry().crs; }
    DataType dataType() const { return pixels().dataType(); }

    /**
     * @brief 物化并返回像素值
     */
    const std::vector<double>& values() const { return pixels().materialize(); }

    /**
     * @brief 在最前面加入长度为 1 的时间轴
     * @throws ValidationException 已有时间轴或时间为哨兵值
     */
    GriddedArray expandTime(const CalendarTime& time) const;

    /**
     * @brief 沿时间轴拼接，要求所有部分空间轴完全一致
     * @throws DimensionMismatchException 空间轴不一致或存在无时间轴的部分
     */
    static GriddedArray concatenateTime(const std::vector<GriddedArray>& parts);

    std::string describe() const;

private:
    Storage storage_;
};

} // namespace rastercube::core_services
