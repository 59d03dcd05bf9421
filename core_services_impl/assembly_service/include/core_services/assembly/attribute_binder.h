/**
 * @file attribute_binder.h
 * @brief 数据集来源属性
 */

#pragma once

#include "core_services/data_access/request_metadata.h"

#include <map>
#include <optional>
#include <string>

namespace rastercube::core_services::assembly {

class AttributeBinder {
public:
    static constexpr const char* kProviderName = "provider_name";
    static constexpr const char* kDatasetId = "dataset_id";
    static constexpr const char* kDatasetName = "dataset_name";
    static constexpr const char* kDatasetCrs = "dataset_crs";
    static constexpr const char* kAoiId = "aoi_id";
    static constexpr const char* kDataRequestId = "data_request_id";

    /**
     * @param gridCrs 请求未给出 CRS 时使用的权威网格 CRS
     */
    static std::map<std::string, std::string> bind(const RequestMetadata& metadata,
                                                   const std::optional<CRSInfo>& gridCrs);
};

} // namespace rastercube::core_services::assembly
