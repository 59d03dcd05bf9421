/**
 * @file gdal_band_reader.h
 * @brief 基于 GDAL 的延迟波段读取器
 */

#pragma once

#include "core_services/data_access/i_band_reader.h"
#include "common_utils/async/retry_policy.h"

#include <optional>

namespace rastercube::core_services::data_access {

/**
 * @brief GDAL 波段读取器
 *
 * readHeader/read 只打开文件头（尺寸、地理变换、CRS、波段数、数据类型、
 * 无效值）后立即关闭。像素在物化时重新打开数据源，按
 * chunkSize × chunkSize 窗口以 float64 读取，无效值映射为 NaN。
 *
 * 支持本地路径、/vsicurl/ 和 /vsis3/ 路径。
 */
class GdalBandReader : public IBandReader {
public:
    struct Options {
        int chunkSize = 2000;
        // 物化阶段打开文件失败时的重试策略，未设置时不重试
        std::optional<common_utils::async::RetryPolicy> materializeRetry;
    };

    GdalBandReader();
    explicit GdalBandReader(Options options);

    /**
     * @throws TransientIOException 无法打开数据源
     */
    RasterHeader readHeader(const std::string& location, const AccessContext& access) override;

    /**
     * @throws TransientIOException 无法打开数据源
     * @throws BandOutOfRangeException 波段号越界
     */
    GriddedArray read(const std::string& location,
                      const BandDescriptor& band,
                      const AccessContext& access) override;

    /**
     * @throws BandOutOfRangeException 波段号越界
     */
    GriddedArray readWithHeader(const std::string& location,
                                const BandDescriptor& band,
                                const RasterHeader& header,
                                const AccessContext& access) override;

    const Options& options() const { return options_; }

private:
    Options options_;
};

} // namespace rastercube::core_services::data_access
