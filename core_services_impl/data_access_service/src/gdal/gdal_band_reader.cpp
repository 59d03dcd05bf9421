/**
 * @file gdal_band_reader.cpp
 * @brief GDAL 延迟波段读取器实现
 */

#include "core_services/data_access/gdal_band_reader.h"
#include "core_services/data_access/gdal_environment.h"
#include "core_services/exceptions.h"
#include "common_utils/utilities/logging_utils.h"

#include <gdal_priv.h>
#include <ogr_spatialref.h>
#include <cpl_conv.h>

#include <algorithm>
#include <cmath>
#include <limits>

namespace rastercube::core_services::data_access {

namespace {

DataType fromGdalType(GDALDataType type) {
    switch (type) {
        case GDT_Byte: return DataType::Byte;
        case GDT_UInt16: return DataType::UInt16;
        case GDT_Int16: return DataType::Int16;
        case GDT_UInt32: return DataType::UInt32;
        case GDT_Int32: return DataType::Int32;
        case GDT_Float32: return DataType::Float32;
        case GDT_Float64: return DataType::Float64;
        default: return DataType::Unknown;
    }
}

CRSInfo extractCrs(GDALDataset& dataset) {
    CRSInfo crsInfo;
    const char* projRef = dataset.GetProjectionRef();
    if (!projRef || projRef[0] == '\0') {
        return crsInfo;
    }

    crsInfo.wkt = projRef;

    // 尝试提取EPSG代码
    OGRSpatialReference srs;
    if (srs.importFromWkt(projRef) == OGRERR_NONE) {
        srs.AutoIdentifyEPSG();
        const char* authName = srs.GetAuthorityName(nullptr);
        const char* authCode = srs.GetAuthorityCode(nullptr);
        if (authName && authCode && std::string(authName) == "EPSG") {
            try {
                crsInfo.epsgCode = std::stoi(authCode);
            } catch (const std::exception& e) {
                RASTERCUBE_LOG_DEBUG("DataAccess", "Unparseable EPSG code '{}': {}", authCode, e.what());
            }
        }
    }
    return crsInfo;
}

GDALDatasetUniquePtr openDataset(const std::string& location, const AccessContext& access) {
    GdalGlobalInitializer::initialize();
    ScopedCredentialOptions scope(access);

    CPLErrorReset();
    GDALDatasetUniquePtr dataset(GDALDataset::Open(location.c_str(), GDAL_OF_RASTER | GDAL_OF_READONLY));
    if (!dataset) {
        throw TransientIOException::forSource(location, lastGdalError());
    }
    return dataset;
}

RasterHeader headerOf(GDALDataset& dataset) {
    RasterHeader header;
    header.geometry.rows = static_cast<size_t>(dataset.GetRasterYSize());
    header.geometry.cols = static_cast<size_t>(dataset.GetRasterXSize());
    header.bandCount = dataset.GetRasterCount();

    double geoTransform[6];
    if (dataset.GetGeoTransform(geoTransform) == CE_None) {
        std::copy(geoTransform, geoTransform + 6, header.geometry.geoTransform.begin());
    }
    header.geometry.crs = extractCrs(dataset);

    if (header.bandCount > 0) {
        GDALRasterBand* first = dataset.GetRasterBand(1);
        header.dataType = fromGdalType(first->GetRasterDataType());
        int hasNoData = 0;
        double noData = first->GetNoDataValue(&hasNoData);
        if (hasNoData) {
            header.noData = noData;
        }
    }
    return header;
}

/**
 * 分块读取整个波段为 float64，无效值映射为 NaN
 */
std::vector<double> readBandPixels(const std::string& location,
                                   int bandNumber,
                                   const RasterHeader& header,
                                   std::optional<double> noDataOverride,
                                   const AccessContext& access,
                                   int chunkSize) {
    GDALDatasetUniquePtr dataset = openDataset(location, access);
    ScopedCredentialOptions scope(access);

    const int cols = dataset->GetRasterXSize();
    const int rows = dataset->GetRasterYSize();
    if (static_cast<size_t>(cols) != header.geometry.cols || static_cast<size_t>(rows) != header.geometry.rows) {
        throw GeometryMismatchException("Raster '" + location + "' is " + std::to_string(rows) + "x" +
                                        std::to_string(cols) + ", expected " + header.geometry.toString());
    }
    if (bandNumber < 1 || bandNumber > dataset->GetRasterCount()) {
        throw BandOutOfRangeException(location, bandNumber, dataset->GetRasterCount());
    }

    GDALRasterBand* band = dataset->GetRasterBand(bandNumber);
    std::vector<double> values(static_cast<size_t>(rows) * static_cast<size_t>(cols));
    const int step = std::max(1, chunkSize);

    for (int yOff = 0; yOff < rows; yOff += step) {
        const int ySize = std::min(step, rows - yOff);
        for (int xOff = 0; xOff < cols; xOff += step) {
            const int xSize = std::min(step, cols - xOff);
            double* target = values.data() + static_cast<size_t>(yOff) * cols + xOff;
            CPLErr err = band->RasterIO(GF_Read, xOff, yOff, xSize, ySize,
                                        target, xSize, ySize, GDT_Float64,
                                        sizeof(double),
                                        static_cast<GSpacing>(sizeof(double)) * cols,
                                        nullptr);
            if (err != CE_None) {
                throw TransientIOException("Failed to read window (" + std::to_string(xOff) + ", " +
                                           std::to_string(yOff) + ") of band " + std::to_string(bandNumber) +
                                           " in '" + location + "': " + lastGdalError());
            }
        }
    }

    int hasNoData = 0;
    double noData = band->GetNoDataValue(&hasNoData);
    std::optional<double> effectiveNoData = noDataOverride;
    if (!effectiveNoData && hasNoData) {
        effectiveNoData = noData;
    }
    if (effectiveNoData && !std::isnan(*effectiveNoData)) {
        const double nan = std::numeric_limits<double>::quiet_NaN();
        std::replace(values.begin(), values.end(), *effectiveNoData, nan);
    }

    RASTERCUBE_LOG_DEBUG("DataAccess", "Materialized band {} of '{}' ({}x{})", bandNumber, location, rows, cols);
    return values;
}

} // namespace

GdalBandReader::GdalBandReader() : GdalBandReader(Options{}) {}

GdalBandReader::GdalBandReader(Options options) : options_(std::move(options)) {
    if (options_.chunkSize <= 0) {
        throw common_utils::ValidationException("reader.chunk_size must be positive");
    }
}

RasterHeader GdalBandReader::readHeader(const std::string& location, const AccessContext& access) {
    GDALDatasetUniquePtr dataset = openDataset(location, access);
    RasterHeader header = headerOf(*dataset);
    RASTERCUBE_LOG_DEBUG("DataAccess", "Read header of '{}': {} band(s), {}", location, header.bandCount,
                         header.geometry.toString());
    return header;
}

GriddedArray GdalBandReader::read(const std::string& location,
                                  const BandDescriptor& band,
                                  const AccessContext& access) {
    return readWithHeader(location, band, readHeader(location, access), access);
}

GriddedArray GdalBandReader::readWithHeader(const std::string& location,
                                            const BandDescriptor& band,
                                            const RasterHeader& header,
                                            const AccessContext& access) {
    if (band.number < 1 || band.number > header.bandCount) {
        throw BandOutOfRangeException(location, band.number, header.bandCount);
    }

    const DataType dataType = band.dataType.value_or(header.dataType);
    const int chunkSize = options_.chunkSize;
    const int bandNumber = band.number;
    const std::optional<double> noData = band.noData;
    const std::optional<common_utils::async::RetryPolicy> retryPolicy = options_.materializeRetry;

    // 凭证按值捕获，物化时在执行线程上以线程本地方式应用
    auto materializer = [location, bandNumber, header, noData, access, chunkSize, retryPolicy]() {
        auto load = [&]() {
            return readBandPixels(location, bandNumber, header, noData, access, chunkSize);
        };
        if (!retryPolicy) {
            return load();
        }
        common_utils::async::RetryExecutor retry(
            *retryPolicy, common_utils::async::RetryExecutor::defaultSleeper(),
            [](const std::exception& e) { return dynamic_cast<const TransientIOException*>(&e) != nullptr; });
        return retry.execute(load, "materialize band " + std::to_string(bandNumber) + " of '" + location + "'");
    };

    DeferredPixels pixels({header.geometry.rows, header.geometry.cols}, dataType, std::move(materializer));
    return GriddedArray::spatial(header.geometry, std::move(pixels));
}

} // namespace rastercube::core_services::data_access
