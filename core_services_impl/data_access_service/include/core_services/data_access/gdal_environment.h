/**
 * @file gdal_environment.h
 * @brief GDAL 全局初始化与线程本地配置作用域
 */

#pragma once

#include "core_services/data_access/request_metadata.h"

#include <mutex>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace rastercube::core_services::data_access {

/**
 * @brief 一次性的 GDAL 全局初始化（注册驱动，GDAL 错误转发到日志）
 *
 * 只设置与凭证无关的进程级选项；凭证一律通过 ScopedCredentialOptions
 * 以线程本地方式设置。
 */
class GdalGlobalInitializer {
public:
    static void initialize();

private:
    static std::once_flag initFlag_;
};

/**
 * @brief 线程本地 GDAL 配置项作用域
 *
 * 析构时按相反顺序恢复设置前的线程本地值。
 */
class ScopedThreadLocalConfig {
public:
    ScopedThreadLocalConfig() = default;
    ~ScopedThreadLocalConfig();

    ScopedThreadLocalConfig(const ScopedThreadLocalConfig&) = delete;
    ScopedThreadLocalConfig& operator=(const ScopedThreadLocalConfig&) = delete;

    /**
     * @param value std::nullopt 表示清除该项
     */
    void set(const std::string& key, const std::optional<std::string>& value);

private:
    std::vector<std::pair<std::string, std::optional<std::string>>> previous_;
};

/**
 * @brief 在一次 GDAL 调用期间应用访问上下文
 *
 * 设置 GDAL_DISABLE_READDIR_ON_OPEN，以及（存在时）AWS 临时凭证、区域
 * 和端点。所有选项均为线程本地，其他线程不可见。
 */
class ScopedCredentialOptions {
public:
    explicit ScopedCredentialOptions(const AccessContext& access);

private:
    ScopedThreadLocalConfig config_;
};

/**
 * @brief 当前线程最近一次 GDAL 错误信息
 */
std::string lastGdalError();

} // namespace rastercube::core_services::data_access
