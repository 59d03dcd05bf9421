#include "core_services/data_access/gdal_grid_aligner.h"
#include "core_services/data_access/gdal_environment.h"
#include "core_services/exceptions.h"
#include "common_utils/utilities/logging_utils.h"

#include <gdal_priv.h>
#include <gdalwarper.h>
#include <ogr_spatialref.h>
#include <cpl_conv.h>

#include <limits>

namespace rastercube::core_services::data_access {

namespace {

std::string crsToWkt(const CRSInfo& crs) {
    if (!crs.wkt.empty()) {
        return crs.wkt;
    }
    if (!crs.epsgCode) {
        return "";
    }
    OGRSpatialReference srs;
    if (srs.importFromEPSG(*crs.epsgCode) != OGRERR_NONE) {
        throw DataAccessException("Unknown EPSG code " + std::to_string(*crs.epsgCode));
    }
    char* wkt = nullptr;
    srs.exportToWkt(&wkt);
    std::string result = wkt ? wkt : "";
    CPLFree(wkt);
    return result;
}

GDALDatasetUniquePtr createMemDataset(const GridGeometry& geometry, const std::string& wkt) {
    GDALDriver* driver = GetGDALDriverManager()->GetDriverByName("MEM");
    if (driver == nullptr) {
        throw DataAccessException("GDAL MEM driver is not available");
    }
    GDALDatasetUniquePtr dataset(driver->Create("", static_cast<int>(geometry.cols), static_cast<int>(geometry.rows),
                                                1, GDT_Float64, nullptr));
    if (!dataset) {
        throw DataAccessException("Failed to create in-memory dataset: " + lastGdalError());
    }
    double geoTransform[6];
    std::copy(geometry.geoTransform.begin(), geometry.geoTransform.end(), geoTransform);
    dataset->SetGeoTransform(geoTransform);
    if (!wkt.empty()) {
        dataset->SetProjection(wkt.c_str());
    }
    dataset->GetRasterBand(1)->SetNoDataValue(std::numeric_limits<double>::quiet_NaN());
    return dataset;
}

std::vector<double> warpPlane(const double* plane, const GridGeometry& sourceGeometry,
                              const GridGeometry& target) {
    const std::string sourceWkt = crsToWkt(sourceGeometry.crs);
    const std::string targetWkt = crsToWkt(target.crs);

    GDALDatasetUniquePtr src = createMemDataset(sourceGeometry, sourceWkt);
    GDALDatasetUniquePtr dst = createMemDataset(target, targetWkt);

    const int srcCols = static_cast<int>(sourceGeometry.cols);
    const int srcRows = static_cast<int>(sourceGeometry.rows);
    if (src->GetRasterBand(1)->RasterIO(GF_Write, 0, 0, srcCols, srcRows, const_cast<double*>(plane),
                                        srcCols, srcRows, GDT_Float64, 0, 0, nullptr) != CE_None) {
        throw DataAccessException("Failed to fill source dataset: " + lastGdalError());
    }

    const int dstCols = static_cast<int>(target.cols);
    const int dstRows = static_cast<int>(target.rows);
    std::vector<double> result(target.rows * target.cols, std::numeric_limits<double>::quiet_NaN());
    if (dst->GetRasterBand(1)->RasterIO(GF_Write, 0, 0, dstCols, dstRows, result.data(),
                                        dstCols, dstRows, GDT_Float64, 0, 0, nullptr) != CE_None) {
        throw DataAccessException("Failed to initialise target dataset: " + lastGdalError());
    }

    CPLErr err = GDALReprojectImage(GDALDataset::ToHandle(src.get()), sourceWkt.empty() ? nullptr : sourceWkt.c_str(),
                                    GDALDataset::ToHandle(dst.get()), targetWkt.empty() ? nullptr : targetWkt.c_str(),
                                    GRA_NearestNeighbour, 0.0, 0.0, nullptr, nullptr, nullptr);
    if (err != CE_None) {
        throw DataAccessException("Grid alignment failed: " + lastGdalError());
    }

    if (dst->GetRasterBand(1)->RasterIO(GF_Read, 0, 0, dstCols, dstRows, result.data(),
                                        dstCols, dstRows, GDT_Float64, 0, 0, nullptr) != CE_None) {
        throw DataAccessException("Failed to read aligned plane: " + lastGdalError());
    }
    return result;
}

} // namespace

GriddedArray GdalGridAligner::align(const GriddedArray& source, const GridGeometry& target) {
    const GridGeometry& sourceGeometry = source.geometry();
    if (sourceGeometry == target) {
        return source;
    }
    GdalGlobalInitializer::initialize();

    RASTERCUBE_LOG_DEBUG("DataAccess", "Aligning {} onto {}", sourceGeometry.toString(), target.toString());

    const size_t planes = source.hasTimeAxis() ? source.timeCoordinates().size() : 1;
    const size_t sourcePlaneSize = sourceGeometry.rows * sourceGeometry.cols;

    std::vector<size_t> shape = source.hasTimeAxis()
                                    ? std::vector<size_t>{planes, target.rows, target.cols}
                                    : std::vector<size_t>{target.rows, target.cols};

    DeferredPixels pixels = source.pixels().transform(
        shape, [sourceGeometry, target, planes, sourcePlaneSize](const std::vector<double>& values) {
            std::vector<double> aligned;
            aligned.reserve(planes * target.rows * target.cols);
            for (size_t i = 0; i < planes; ++i) {
                std::vector<double> plane = warpPlane(values.data() + i * sourcePlaneSize, sourceGeometry, target);
                aligned.insert(aligned.end(), plane.begin(), plane.end());
            }
            return aligned;
        });

    if (source.hasTimeAxis()) {
        return GriddedArray(SpatioTemporalGrid{target, source.timeCoordinates(), std::move(pixels)});
    }
    return GriddedArray(SpatialGrid{target, std::move(pixels)});
}

} // namespace rastercube::core_services::data_access
