#include "core_services/assembly/raster_dataset_assembler.h"
#include "core_services/assembly/attribute_binder.h"
#include "core_services/assembly/dataset_combiner.h"
#include "core_services/assembly/variable_merger.h"
#include "core_services/data_access/file_locator.h"
#include "core_services/data_access/gdal_band_reader.h"
#include "core_services/data_access/gdal_grid_aligner.h"
#include "core_services/data_access/request_metadata_parser.h"
#include "core_services/data_access/vsi_object_store_client.h"
#include "core_services/exceptions.h"
#include "common_utils/infrastructure/task_pool.h"
#include "common_utils/time/time_parser.h"
#include "common_utils/utilities/exceptions.h"
#include "common_utils/utilities/logging_utils.h"

#include <map>
#include <utility>

namespace rastercube::core_services::assembly {

using common_utils::async::CancellationToken;
using common_utils::async::RetryExecutor;

RasterDatasetAssembler::RasterDatasetAssembler(std::shared_ptr<IBandReader> reader,
                                               std::shared_ptr<IObjectStoreClient> objectStore,
                                               AssemblerOptions options,
                                               std::shared_ptr<IGridAligner> aligner,
                                               RetryExecutor::Sleeper sleeper)
    : reader_(std::move(reader)),
      objectStore_(std::move(objectStore)),
      options_(std::move(options)),
      aligner_(std::move(aligner)),
      sleeper_(std::move(sleeper)) {
    if (!reader_) {
        throw common_utils::ConfigurationException("RasterDatasetAssembler requires a band reader");
    }
    options_.validate();
}

std::unique_ptr<RasterDatasetAssembler> RasterDatasetAssembler::createDefault(const AssemblerOptions& options) {
    data_access::GdalBandReader::Options readerOptions;
    readerOptions.chunkSize = options.chunkSize;
    readerOptions.materializeRetry = options.retry;

    std::shared_ptr<IGridAligner> aligner;
    if (options.alignGrids) {
        aligner = std::make_shared<data_access::GdalGridAligner>();
    }

    return std::make_unique<RasterDatasetAssembler>(
        std::make_shared<data_access::GdalBandReader>(readerOptions),
        std::make_shared<data_access::VsiObjectStoreClient>(options.pageSize),
        options,
        std::move(aligner));
}

bool RasterDatasetAssembler::isTransient(const std::exception& error) {
    return dynamic_cast<const TransientIOException*>(&error) != nullptr;
}

AssembledDataset RasterDatasetAssembler::assemble(const RequestMetadata& metadata,
                                                  const CancellationToken& cancellation) {
    data_access::RequestMetadataParser::validate(metadata);
    if (metadata.isObjectStoreForm() && !objectStore_) {
        throw common_utils::ConfigurationException(
            "Request " + metadata.dataRequestId + " uses an object store but no object store client is configured");
    }

    RASTERCUBE_LOG_INFO("Assembly", "Assembling request {} (dataset {}, {})",
                        metadata.dataRequestId, metadata.datasetId, options_.toString());

    RetryExecutor retry(options_.retry, sleeper_, &RasterDatasetAssembler::isTransient);
    retry.setCancellationToken(cancellation);

    std::vector<AssemblyDiagnostic> diagnostics;

    // 1. 文件解析
    AccessContext baseAccess;
    baseAccess.region = options_.objectStoreRegion;
    baseAccess.endpoint = options_.objectStoreEndpoint;

    data_access::FileLocatorOptions locatorOptions;
    locatorOptions.geometryPolicy = options_.geometryPolicy;
    locatorOptions.skipUnreadableFiles = options_.loadFailurePolicy == LoadFailurePolicy::SKIP;

    data_access::ResolvedFiles resolved = [&]() {
        if (objectStore_) {
            data_access::FileLocator locator(*objectStore_, *reader_, retry, locatorOptions);
            return locator.resolve(metadata, baseAccess, cancellation);
        }
        data_access::ResolvedFiles direct;
        direct.files = metadata.files;
        direct.access = baseAccess;
        return direct;
    }();
    diagnostics.insert(diagnostics.end(), resolved.diagnostics.begin(), resolved.diagnostics.end());

    // 2. 按变量首次出现顺序分组
    std::vector<std::string> variableOrder;
    std::map<std::string, std::vector<PlaneSource>> sourcesByVariable;
    for (const auto& file : resolved.files) {
        for (const auto& band : file.bands) {
            auto& sources = sourcesByVariable[band.variableName];
            if (sources.empty()) {
                variableOrder.push_back(band.variableName);
            }
            sources.push_back({file.location, band, file.knownHeader});
        }
    }
    RASTERCUBE_LOG_INFO("Assembly", "{} file(s), {} variable(s) to merge",
                        resolved.files.size(), variableOrder.size());

    // 3. 逐变量合并
    common_utils::time::TimeParser timeParser(options_.fallbackTimeFormats);
    common_utils::infrastructure::TaskPool pool(options_.maxConcurrentLoads);
    VariableMerger merger(*reader_, retry, timeParser, pool, options_, aligner_.get());

    std::vector<AssembledDataset::Variable> merged;
    for (const auto& name : variableOrder) {
        cancellation.throwIfCancelled("merging variable '" + name + "'");
        MergeResult result = merger.merge(name, sourcesByVariable[name], resolved.access, cancellation);
        diagnostics.insert(diagnostics.end(), result.diagnostics.begin(), result.diagnostics.end());
        if (result.array) {
            merged.emplace_back(name, std::move(*result.array));
        }
    }
    pool.shutdown();

    // 4. 组合
    cancellation.throwIfCancelled("combine");
    CombineResult combined = DatasetCombiner().combine(std::move(merged));
    diagnostics.insert(diagnostics.end(), combined.diagnostics.begin(), combined.diagnostics.end());

    std::optional<CRSInfo> gridCrs;
    if (resolved.authoritativeHeader) {
        gridCrs = resolved.authoritativeHeader->geometry.crs;
    } else {
        gridCrs = combined.variables.front().second.crs();
    }

    // 5. 属性
    auto attributes = AttributeBinder::bind(metadata, gridCrs);

    for (const auto& diagnostic : diagnostics) {
        RASTERCUBE_LOG_DEBUG("Assembly", "{}", diagnostic.toString());
    }
    RASTERCUBE_LOG_INFO("Assembly", "Request {} assembled: {} variable(s), {} diagnostic(s)",
                        metadata.dataRequestId, combined.variables.size(), diagnostics.size());

    return AssembledDataset(std::move(combined.variables), std::move(attributes), std::move(diagnostics));
}

} // namespace rastercube::core_services::assembly
