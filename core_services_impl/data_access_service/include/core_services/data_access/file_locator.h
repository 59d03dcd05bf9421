/**
 * @file file_locator.h
 * @brief 解析一次请求涉及的栅格文件
 *
 * 直接 URL 形态原样返回文件列表；对象存储形态分页列举前缀下的所有对象，
 * 按文件名查找波段布局，从对象键中提取时间，并按位置为波段编号。
 */

#pragma once

#include "core_services/assembly/assembled_dataset.h"
#include "core_services/data_access/i_band_reader.h"
#include "core_services/data_access/i_object_store_client.h"
#include "common_utils/async/cancellation_token.h"
#include "common_utils/async/retry_policy.h"

#include <optional>
#include <string>
#include <vector>

namespace rastercube::core_services::data_access {

/**
 * @brief 对象存储文件的网格几何策略
 */
enum class GeometryPolicy {
    VERIFY,        // 检查每个文件头，与首个文件不一致时失败
    TRUST_FIRST    // 只检查首个文件，其余文件沿用其几何
};

/**
 * @throws ValidationException 无法识别的名称
 */
GeometryPolicy geometryPolicyFromString(const std::string& name);
std::string toString(GeometryPolicy policy);

struct FileLocatorOptions {
    GeometryPolicy geometryPolicy = GeometryPolicy::VERIFY;
    // true 时无法打开的对象被跳过并记录诊断，否则失败
    bool skipUnreadableFiles = false;
};

/**
 * @brief 文件解析结果
 */
struct ResolvedFiles {
    std::vector<FileDescriptor> files;
    AccessContext access;                          // 读取这些文件所需的上下文
    std::optional<RasterHeader> authoritativeHeader;
    std::vector<AssemblyDiagnostic> diagnostics;
};

class FileLocator {
public:
    static constexpr const char* kKeyTimestampFormat = "%Y/%m/%d/%H/%M/%S";
    static constexpr const char* kNoTimeTimestamp = "0000/00/00/00/00/00";

    FileLocator(IObjectStoreClient& objectStore,
                IBandReader& reader,
                const common_utils::async::RetryExecutor& retry,
                FileLocatorOptions options = {});

    /**
     * @param baseAccess 区域、端点等与请求无关的访问设置
     */
    ResolvedFiles resolve(const RequestMetadata& metadata,
                          const AccessContext& baseAccess,
                          const common_utils::async::CancellationToken& cancellation);

    /**
     * @brief 对象键最后一段去掉扩展名，如 "a/b/c.tif" -> "c"
     */
    static std::string filenameFromKey(const std::string& key);

    /**
     * @brief 提取键中的 YYYY/MM/DD/HH/MM/SS 时间段
     */
    static std::optional<std::string> extractTimestamp(const std::string& key);

private:
    ResolvedFiles resolveObjectStore(const RequestMetadata& metadata,
                                     const AccessContext& baseAccess,
                                     const common_utils::async::CancellationToken& cancellation);

    std::vector<std::string> listAllKeys(const ObjectStoreSource& source,
                                         const AccessContext& access,
                                         const common_utils::async::CancellationToken& cancellation);

    void inspectGeometry(ResolvedFiles& resolved,
                         const common_utils::async::CancellationToken& cancellation);

    IObjectStoreClient& objectStore_;
    IBandReader& reader_;
    const common_utils::async::RetryExecutor& retry_;
    FileLocatorOptions options_;
};

} // namespace rastercube::core_services::data_access
