/**
 * @file request_metadata.h
 * @brief 数据请求元数据 - 装配运行的输入
 *
 * 两种等价形态：
 * - 直接 URL 形态：files 列表，每个文件带有波段描述
 * - 对象存储形态：bucket + 临时凭证 + 文件名到波段布局的映射
 */

#pragma once

#include "core_services/common_data_types.h"

#include <map>
#include <optional>
#include <string>
#include <vector>

namespace rastercube {
namespace core_services {

/**
 * @brief 单个波段的描述
 */
struct BandDescriptor {
    int number = 1;                            // 1 起始的波段号
    std::string variableName;                  // 变量名
    std::optional<std::string> time;           // 原始时间字符串
    std::optional<std::string> timePattern;    // 显式时间格式
    std::optional<DataType> dataType;
    std::optional<double> noData;
};

/**
 * @brief 栅格文件头信息（不含像素）
 */
struct RasterHeader {
    GridGeometry geometry;
    int bandCount = 0;
    DataType dataType = DataType::Unknown;
    std::optional<double> noData;
};

/**
 * @brief 单个栅格文件及其波段
 */
struct FileDescriptor {
    std::string location;                      // URL、本地路径或 /vsis3/ 路径
    std::vector<BandDescriptor> bands;
    std::optional<RasterHeader> knownHeader;   // 已检查过的文件头，存在时读取不再打开文件
};

struct BucketLocation {
    std::string name;
    std::string prefix;
};

/**
 * @brief 对象存储临时凭证，只在一次装配运行内有效
 */
struct TemporaryCredentials {
    std::string accessKeyId;
    std::string secretAccessKey;
    std::string sessionToken;
    std::string expiration;
};

/**
 * @brief 访问数据源所需的上下文，按值传递给每次读取
 */
struct AccessContext {
    std::optional<TemporaryCredentials> credentials;
    std::string region;
    std::string endpoint;
};

/**
 * @brief 对象存储中一类文件的波段布局
 */
struct FileLayout {
    std::vector<std::string> bands;            // 按波段顺序排列的变量名
    std::string dtype;
};

struct ObjectStoreSource {
    BucketLocation bucket;
    TemporaryCredentials credentials;
    std::map<std::string, FileLayout> fileMapping;
};

struct RequestMetadata {
    std::string providerName;
    std::string datasetId;
    std::string datasetName;
    std::optional<std::string> datasetCrs;
    std::string aoiId;
    std::string dataRequestId;

    std::vector<FileDescriptor> files;
    std::optional<ObjectStoreSource> objectStore;

    bool isObjectStoreForm() const { return objectStore.has_value(); }
};

} // namespace core_services
} // namespace rastercube
