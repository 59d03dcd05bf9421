/**
 * @file gdal_environment.cpp
 * @brief GDAL 全局初始化与线程本地配置作用域实现
 */

#include "core_services/data_access/gdal_environment.h"
#include "common_utils/utilities/logging_utils.h"

#include <gdal_priv.h>
#include <cpl_conv.h>
#include <cpl_error.h>

#include <algorithm>

namespace rastercube::core_services::data_access {

namespace {

// GDAL 诊断转发到 DataAccess 日志，不再直接写 stderr
void CPL_STDCALL forwardGdalError(CPLErr severity, CPLErrorNum errorNumber, const char* message) {
    const char* text = message ? message : "";
    switch (severity) {
        case CE_None:
        case CE_Debug:
            RASTERCUBE_LOG_DEBUG("DataAccess", "GDAL: {}", text);
            break;
        case CE_Warning:
            RASTERCUBE_LOG_WARN("DataAccess", "GDAL warning {}: {}", static_cast<int>(errorNumber), text);
            break;
        default:
            RASTERCUBE_LOG_ERROR("DataAccess", "GDAL error {}: {}", static_cast<int>(errorNumber), text);
            break;
    }
}

} // namespace

std::once_flag GdalGlobalInitializer::initFlag_;

void GdalGlobalInitializer::initialize() {
    std::call_once(initFlag_, []() {
        RASTERCUBE_LOG_INFO("DataAccess", "Performing one-time GDAL global initialization...");

        GDALAllRegister();
        CPLSetErrorHandler(forwardGdalError);

        // 只读访问，不写 .aux.xml
        CPLSetConfigOption("GDAL_PAM_ENABLED", "NO");

        RASTERCUBE_LOG_INFO("DataAccess", "GDAL {} initialized", GDALVersionInfo("RELEASE_NAME"));
    });
}

ScopedThreadLocalConfig::~ScopedThreadLocalConfig() {
    for (auto it = previous_.rbegin(); it != previous_.rend(); ++it) {
        CPLSetThreadLocalConfigOption(it->first.c_str(), it->second ? it->second->c_str() : nullptr);
    }
}

void ScopedThreadLocalConfig::set(const std::string& key, const std::optional<std::string>& value) {
    const char* current = CPLGetThreadLocalConfigOption(key.c_str(), nullptr);
    previous_.emplace_back(key, current ? std::optional<std::string>(current) : std::nullopt);
    CPLSetThreadLocalConfigOption(key.c_str(), value ? value->c_str() : nullptr);
}

ScopedCredentialOptions::ScopedCredentialOptions(const AccessContext& access) {
    config_.set("GDAL_DISABLE_READDIR_ON_OPEN", std::string("EMPTY_DIR"));

    if (access.credentials) {
        config_.set("AWS_ACCESS_KEY_ID", access.credentials->accessKeyId);
        config_.set("AWS_SECRET_ACCESS_KEY", access.credentials->secretAccessKey);
        config_.set("AWS_SESSION_TOKEN", access.credentials->sessionToken.empty()
                                             ? std::nullopt
                                             : std::optional<std::string>(access.credentials->sessionToken));
    }
    if (!access.region.empty()) {
        config_.set("AWS_REGION", access.region);
    }
    if (!access.endpoint.empty()) {
        config_.set("AWS_S3_ENDPOINT", access.endpoint);
    }
}

std::string lastGdalError() {
    const char* message = CPLGetLastErrorMsg();
    if (message == nullptr || message[0] == '\0') {
        return "unknown GDAL error";
    }
    return message;
}

} // namespace rastercube::core_services::data_access
