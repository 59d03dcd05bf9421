/**
 * @file assembler_options.h
 * @brief 装配运行选项及其配置键映射
 */

#pragma once

#include "core_services/data_access/file_locator.h"
#include "common_utils/async/retry_policy.h"

#include <cstddef>
#include <string>
#include <vector>

namespace rastercube::common_utils {
class AppConfigLoader;
}

namespace rastercube::core_services::assembly {

/**
 * @brief 同一变量出现会被丢弃的平面时的处理方式
 */
enum class UntimedPlanePolicy {
    REJECT,        // 失败 (AmbiguousTimeAxisException)
    KEEP_FIRST     // 只保留第一个数组，其余记录为警告
};

/**
 * @brief 平面加载重试耗尽后的处理方式
 */
enum class LoadFailurePolicy {
    FAIL,          // 终止运行
    SKIP           // 丢弃该平面并记录错误诊断
};

UntimedPlanePolicy untimedPlanePolicyFromString(const std::string& name);
LoadFailurePolicy loadFailurePolicyFromString(const std::string& name);
std::string toString(UntimedPlanePolicy policy);
std::string toString(LoadFailurePolicy policy);

struct AssemblerOptions {
    common_utils::async::RetryPolicy retry;
    size_t maxConcurrentLoads = 4;
    UntimedPlanePolicy untimedPlanePolicy = UntimedPlanePolicy::REJECT;
    LoadFailurePolicy loadFailurePolicy = LoadFailurePolicy::FAIL;
    data_access::GeometryPolicy geometryPolicy = data_access::GeometryPolicy::VERIFY;
    bool alignGrids = false;
    std::vector<std::string> fallbackTimeFormats{"%Y-%m-%d", "%Y"};
    int chunkSize = 2000;
    size_t pageSize = 1000;
    std::string objectStoreRegion;
    std::string objectStoreEndpoint;

    /**
     * @brief 登记所有配置键的默认值和描述
     */
    static void registerDefaults(common_utils::AppConfigLoader& config);

    /**
     * @throws ConfigurationException 配置值无效
     */
    static AssemblerOptions fromConfig(const common_utils::AppConfigLoader& config);

    /**
     * @throws ConfigurationException
     */
    void validate() const;

    std::string toString() const;
};

} // namespace rastercube::core_services::assembly
