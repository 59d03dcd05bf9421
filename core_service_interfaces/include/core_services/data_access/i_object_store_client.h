#pragma once

#include "core_services/data_access/request_metadata.h"

#include <memory>
#include <string>
#include <vector>

namespace rastercube {
namespace core_services {

/**
 * @brief 对象列举游标，逐页返回对象键
 */
class IObjectListing {
public:
    virtual ~IObjectListing() = default;

    /**
     * @brief 下一页对象键
     * @return 没有更多对象时返回空列表
     * @throws TransientIOException 列举失败
     */
    virtual std::vector<std::string> nextPage() = 0;
};

/**
 * @brief 对象存储客户端接口
 */
class IObjectStoreClient {
public:
    virtual ~IObjectStoreClient() = default;

    /**
     * @brief 列举 bucket 前缀下的所有对象
     */
    virtual std::unique_ptr<IObjectListing> list(const BucketLocation& bucket,
                                                 const AccessContext& access) = 0;

    /**
     * @brief 对象键对应的、可交给 IBandReader 的数据源路径
     */
    virtual std::string objectLocation(const BucketLocation& bucket, const std::string& key) const = 0;
};

} // namespace core_services
} // namespace rastercube
