/**
 * @file vsi_object_store_client.h
 * @brief 基于 GDAL 虚拟文件系统 (/vsis3/) 的对象存储客户端
 */

#pragma once

#include "core_services/data_access/i_object_store_client.h"

#include <cstddef>
#include <optional>
#include <string>

namespace rastercube::core_services::data_access {

class VsiObjectStoreClient : public IObjectStoreClient {
public:
    /**
     * @brief S3 前缀拆分结果
     *
     * 前缀 "a/b/c" 拆为目录 "/vsis3/<bucket>/a/b"、键前缀 "a/b/" 与名称过滤 "c"。
     */
    struct PrefixSplit {
        std::string directory;   ///< 交给 VSIOpenDir 的目录
        std::string keyPrefix;   ///< 目录项相对名之前补回的部分
        std::string nameFilter;  ///< 相对名必须以此开头，空表示不过滤
    };

    static PrefixSplit splitPrefix(const BucketLocation& bucket);

    /**
     * @brief 由目录项相对名还原对象键，不匹配名称过滤时返回空
     */
    static std::optional<std::string> keyForEntry(const PrefixSplit& split, const std::string& entryName);

    /**
     * @param pageSize 每页返回的最大对象数
     */
    explicit VsiObjectStoreClient(size_t pageSize = 1000);

    /**
     * @throws TransientIOException 无法列举前缀
     */
    std::unique_ptr<IObjectListing> list(const BucketLocation& bucket,
                                         const AccessContext& access) override;

    /// "/vsis3/<bucket>/<key>"
    std::string objectLocation(const BucketLocation& bucket, const std::string& key) const override;

private:
    size_t pageSize_;
};

} // namespace rastercube::core_services::data_access
