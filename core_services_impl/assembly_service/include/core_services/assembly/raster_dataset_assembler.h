/**
 * @file raster_dataset_assembler.h
 * @brief 栅格时间序列数据集装配器
 */

#pragma once

#include "core_services/assembly/assembler_options.h"
#include "core_services/assembly/i_dataset_assembler.h"
#include "core_services/data_access/i_band_reader.h"
#include "core_services/data_access/i_grid_aligner.h"
#include "core_services/data_access/i_object_store_client.h"
#include "common_utils/async/retry_policy.h"

#include <memory>

namespace rastercube::core_services::assembly {

/**
 * @brief IDatasetAssembler 的实现
 *
 * 流程：解析文件 (FileLocator) -> 按变量首次出现顺序分组波段 ->
 * 逐变量合并 (VariableMerger) -> 组合 (DatasetCombiner) -> 绑定属性。
 * 每次 assemble() 创建自己的工作线程池，返回前全部回收。
 */
class RasterDatasetAssembler : public IDatasetAssembler {
public:
    /**
     * @param objectStore 只处理直接 URL 形态的请求时可为空
     * @param aligner 可为空，options.alignGrids 为 false 时不使用
     * @param sleeper 重试等待函数，测试中可替换
     */
    RasterDatasetAssembler(std::shared_ptr<IBandReader> reader,
                           std::shared_ptr<IObjectStoreClient> objectStore,
                           AssemblerOptions options,
                           std::shared_ptr<IGridAligner> aligner = nullptr,
                           common_utils::async::RetryExecutor::Sleeper sleeper =
                               common_utils::async::RetryExecutor::defaultSleeper());

    /**
     * @brief 使用 GDAL 读取器、/vsis3/ 客户端和 GDAL 对齐器创建装配器
     */
    static std::unique_ptr<RasterDatasetAssembler> createDefault(const AssemblerOptions& options);

    AssembledDataset assemble(const RequestMetadata& metadata,
                              const common_utils::async::CancellationToken& cancellation) override;

    const AssemblerOptions& options() const { return options_; }

    /**
     * @brief 只重试 TransientIOException
     */
    static bool isTransient(const std::exception& error);

private:
    std::shared_ptr<IBandReader> reader_;
    std::shared_ptr<IObjectStoreClient> objectStore_;
    AssemblerOptions options_;
    std::shared_ptr<IGridAligner> aligner_;
    common_utils::async::RetryExecutor::Sleeper sleeper_;
};

} // namespace rastercube::core_services::assembly
