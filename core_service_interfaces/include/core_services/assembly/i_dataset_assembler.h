#pragma once

#include "core_services/assembly/assembled_dataset.h"
#include "core_services/data_access/request_metadata.h"
#include "common_utils/async/cancellation_token.h"

namespace rastercube {
namespace core_services {

/**
 * @brief 栅格时间序列数据集装配接口
 *
 * 一次调用同步执行完整的装配流程并返回结果，不保留后台任务。
 */
class IDatasetAssembler {
public:
    virtual ~IDatasetAssembler() = default;

    /**
     * @throws OperationCancelledException 在检查点发现取消请求
     * @throws ServiceException 及其子类：无法恢复的装配错误
     */
    virtual AssembledDataset assemble(const RequestMetadata& metadata,
                                      const common_utils::async::CancellationToken& cancellation) = 0;
};

} // namespace core_services
} // namespace rastercube
