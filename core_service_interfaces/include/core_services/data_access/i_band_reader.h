#pragma once

#include "core_services/data_access/request_metadata.h"
#include "core_services/gridded_array.h"

#include <string>

namespace rastercube {
namespace core_services {

/**
 * @brief 波段读取器接口
 *
 * 打开一个栅格数据源并把其中一个波段暴露为二维 (y, x) 平面。
 * 像素读取延迟到平面被物化时进行。
 *
 * 异常约定：
 * - 打开失败 / 网络错误：TransientIOException（可重试）
 * - 波段号越界：BandOutOfRangeException（不可重试）
 */
class IBandReader {
public:
    virtual ~IBandReader() = default;

    /**
     * @brief 只读取文件头
     */
    virtual RasterHeader readHeader(const std::string& location, const AccessContext& access) = 0;

    /**
     * @brief 打开文件头并返回延迟读取的波段平面
     */
    virtual GriddedArray read(const std::string& location,
                              const BandDescriptor& band,
                              const AccessContext& access) = 0;

    /**
     * @brief 使用已知文件头构造波段平面，不打开文件
     */
    virtual GriddedArray readWithHeader(const std::string& location,
                                        const BandDescriptor& band,
                                        const RasterHeader& header,
                                        const AccessContext& access) = 0;
};

} // namespace core_services
} // namespace rastercube
