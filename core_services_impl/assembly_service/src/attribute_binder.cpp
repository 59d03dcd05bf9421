#include "core_services/assembly/attribute_binder.h"

namespace rastercube::core_services::assembly {

std::map<std::string, std::string> AttributeBinder::bind(const RequestMetadata& metadata,
                                                         const std::optional<CRSInfo>& gridCrs) {
    std::string datasetCrs;
    if (metadata.datasetCrs && !metadata.datasetCrs->empty()) {
        datasetCrs = *metadata.datasetCrs;
    } else if (gridCrs && !gridCrs->empty()) {
        datasetCrs = gridCrs->identifier();
    }

    return {
        {kProviderName, metadata.providerName},
        {kDatasetId, metadata.datasetId},
        {kDatasetName, metadata.datasetName},
        {kDatasetCrs, datasetCrs},
        {kAoiId, metadata.aoiId},
        {kDataRequestId, metadata.dataRequestId},
    };
}

} // namespace rastercube::core_services::assembly
