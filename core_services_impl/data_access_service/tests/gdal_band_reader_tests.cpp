/**
 * @file gdal_band_reader_tests.cpp
 * @brief GDAL 读取器、网格对齐与线程本地凭证测试
 *
 * 在临时目录中用 GTiff 驱动写小文件，不访问网络。
 */

#include <gtest/gtest.h>

#include <gdal_priv.h>
#include <cpl_conv.h>
#include <cpl_error.h>
#include <ogr_spatialref.h>

#include <cmath>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <thread>
#include <vector>

#include "core_services/data_access/gdal_band_reader.h"
#include "core_services/data_access/gdal_environment.h"
#include "core_services/data_access/gdal_grid_aligner.h"
#include "core_services/exceptions.h"
#include "common_utils/utilities/exceptions.h"

namespace rastercube::core_services::data_access::tests {

namespace fs = std::filesystem;

class GdalBandReaderTest : public ::testing::Test {
protected:
    static constexpr int kRows = 5;
    static constexpr int kCols = 7;
    static constexpr double kNoData = -9999.0;

    void SetUp() override {
        GdalGlobalInitializer::initialize();
        tempDir_ = fs::temp_directory_path() /
                   ("rastercube_gdal_" + std::to_string(reinterpret_cast<std::uintptr_t>(this)));
        fs::create_directories(tempDir_);
        path_ = (tempDir_ / "two_bands.tif").string();
        writeTwoBandTiff(path_);
    }

    void TearDown() override {
        std::error_code ec;
        fs::remove_all(tempDir_, ec);
    }

    static double expectedValue(int band, int row, int col) {
        return band * 1000.0 + row * kCols + col;
    }

    void writeTwoBandTiff(const std::string& path) {
        GDALDriver* driver = GetGDALDriverManager()->GetDriverByName("GTiff");
        ASSERT_NE(driver, nullptr);
        GDALDatasetUniquePtr dataset(driver->Create(path.c_str(), kCols, kRows, 2, GDT_Float32, nullptr));
        ASSERT_TRUE(dataset);

        double geoTransform[6] = {500000.0, 30.0, 0.0, 4600000.0, 0.0, -30.0};
        dataset->SetGeoTransform(geoTransform);
        OGRSpatialReference srs;
        srs.importFromEPSG(32633);
        dataset->SetSpatialRef(&srs);

        for (int b = 1; b <= 2; ++b) {
            std::vector<float> values(kRows * kCols);
            for (int r = 0; r < kRows; ++r) {
                for (int c = 0; c < kCols; ++c) {
                    values[r * kCols + c] = static_cast<float>(expectedValue(b, r, c));
                }
            }
            // 第 2 波段左上角为无效值
            if (b == 2) {
                values[0] = static_cast<float>(kNoData);
            }
            GDALRasterBand* band = dataset->GetRasterBand(b);
            band->SetNoDataValue(kNoData);
            ASSERT_EQ(band->RasterIO(GF_Write, 0, 0, kCols, kRows, values.data(), kCols, kRows,
                                     GDT_Float32, 0, 0, nullptr),
                      CE_None);
        }
    }

    BandDescriptor band(int number) {
        BandDescriptor descriptor;
        descriptor.number = number;
        descriptor.variableName = "v" + std::to_string(number);
        return descriptor;
    }

    fs::path tempDir_;
    std::string path_;
    AccessContext access_;
};

TEST_F(GdalBandReaderTest, ReadHeaderOpensHeaderOnly) {
    GdalBandReader reader;
    RasterHeader header = reader.readHeader(path_, access_);

    EXPECT_EQ(header.geometry.rows, static_cast<size_t>(kRows));
    EXPECT_EQ(header.geometry.cols, static_cast<size_t>(kCols));
    EXPECT_EQ(header.bandCount, 2);
    EXPECT_EQ(header.dataType, DataType::Float32);
    EXPECT_DOUBLE_EQ(header.geometry.geoTransform[0], 500000.0);
    EXPECT_DOUBLE_EQ(header.geometry.geoTransform[5], -30.0);
    ASSERT_TRUE(header.geometry.crs.epsgCode.has_value());
    EXPECT_EQ(*header.geometry.crs.epsgCode, 32633);
    ASSERT_TRUE(header.noData.has_value());
    EXPECT_DOUBLE_EQ(*header.noData, kNoData);
}

TEST_F(GdalBandReaderTest, ReadIsDeferredUntilMaterialized) {
    GdalBandReader reader;
    GriddedArray plane = reader.read(path_, band(1), access_);

    EXPECT_FALSE(plane.hasTimeAxis());
    EXPECT_FALSE(plane.pixels().isMaterialized());
    EXPECT_EQ(plane.shape(), (std::vector<size_t>{kRows, kCols}));

    const auto& values = plane.values();
    ASSERT_EQ(values.size(), static_cast<size_t>(kRows * kCols));
    EXPECT_DOUBLE_EQ(values[0], expectedValue(1, 0, 0));
    EXPECT_DOUBLE_EQ(values[kCols + 3], expectedValue(1, 1, 3));
}

TEST_F(GdalBandReaderTest, NoDataBecomesNaN) {
    GdalBandReader reader;
    const auto& values = reader.read(path_, band(2), access_).values();
    EXPECT_TRUE(std::isnan(values[0]));
    EXPECT_DOUBLE_EQ(values[1], expectedValue(2, 0, 1));
}

TEST_F(GdalBandReaderTest, BandNoDataOverride) {
    GdalBandReader reader;
    BandDescriptor descriptor = band(1);
    descriptor.noData = expectedValue(1, 0, 2);
    const auto& values = reader.read(path_, descriptor, access_).values();
    EXPECT_FALSE(std::isnan(values[0]));
    EXPECT_TRUE(std::isnan(values[2]));
}

TEST_F(GdalBandReaderTest, ChunkedReadMatchesWholeRead) {
    GdalBandReader::Options options;
    options.chunkSize = 3;
    GdalBandReader chunked(options);
    GdalBandReader whole;

    const auto& a = chunked.read(path_, band(1), access_).values();
    const auto& b = whole.read(path_, band(1), access_).values();
    EXPECT_EQ(a, b);
    EXPECT_DOUBLE_EQ(a[4 * kCols + 6], expectedValue(1, 4, 6));
}

TEST_F(GdalBandReaderTest, ReadWithHeaderDoesNotOpenUntilMaterialized) {
    GdalBandReader reader;
    RasterHeader header = reader.readHeader(path_, access_);
    const std::string missing = (tempDir_ / "not_there.tif").string();

    GriddedArray plane = reader.readWithHeader(missing, band(1), header, access_);
    EXPECT_EQ(plane.geometry(), header.geometry);
    EXPECT_THROW(plane.values(), TransientIOException);
}

TEST_F(GdalBandReaderTest, ErrorsAreClassified) {
    GdalBandReader reader;
    EXPECT_THROW(reader.read(path_, band(3), access_), BandOutOfRangeException);
    EXPECT_THROW(reader.read(path_, band(0), access_), BandOutOfRangeException);
    EXPECT_THROW(reader.readHeader((tempDir_ / "missing.tif").string(), access_), TransientIOException);

    GdalBandReader::Options options;
    options.chunkSize = 0;
    EXPECT_THROW(GdalBandReader{options}, common_utils::ValidationException);
}

TEST_F(GdalBandReaderTest, GdalDiagnosticsAreForwardedToLog) {
    // 初始化后 GDAL 不再使用默认的 stderr 处理器
    CPLErrorHandler installed = CPLSetErrorHandler(CPLQuietErrorHandler);
    EXPECT_NE(installed, nullptr);
    EXPECT_NE(installed, &CPLDefaultErrorHandler);
    EXPECT_NE(installed, &CPLQuietErrorHandler);
    CPLSetErrorHandler(installed);

    // 转发后仍保留 last-error 状态，读取器依赖它生成异常消息
    CPLErrorReset();
    CPLError(CE_Warning, CPLE_AppDefined, "forwarded warning %d", 7);
    EXPECT_EQ(CPLGetLastErrorType(), CE_Warning);
    EXPECT_STREQ(CPLGetLastErrorMsg(), "forwarded warning 7");
    CPLErrorReset();
}

// =============================================================================
// 网格对齐
// =============================================================================

class GdalGridAlignerTest : public ::testing::Test {
protected:
    void SetUp() override { GdalGlobalInitializer::initialize(); }

    static GridGeometry grid(double originX) {
        GridGeometry geometry;
        geometry.rows = 4;
        geometry.cols = 4;
        geometry.geoTransform = {originX, 1.0, 0.0, 4.0, 0.0, -1.0};
        geometry.crs = CRSInfo::fromEpsg(32633);
        return geometry;
    }

    static GriddedArray ramp(const GridGeometry& geometry) {
        std::vector<double> values(16);
        for (size_t i = 0; i < values.size(); ++i) {
            values[i] = static_cast<double>(i);
        }
        return GriddedArray::spatial(geometry, DeferredPixels::fromValues({4, 4}, DataType::Float64, values));
    }
};

TEST_F(GdalGridAlignerTest, IdenticalGridReturnsSource) {
    GdalGridAligner aligner;
    auto source = ramp(grid(0.0));
    auto aligned = aligner.align(source, grid(0.0));
    EXPECT_EQ(aligned.values(), source.values());
}

TEST_F(GdalGridAlignerTest, ShiftedGridUsesNearestNeighbour) {
    GdalGridAligner aligner;
    auto source = ramp(grid(0.0)).expandTime(common_utils::time::CalendarTime::fromCivil(2020, 1, 1));
    auto aligned = aligner.align(source, grid(1.0));

    EXPECT_TRUE(aligned.hasTimeAxis());
    EXPECT_EQ(aligned.geometry(), grid(1.0));
    EXPECT_EQ(aligned.timeCoordinates(), source.timeCoordinates());
    EXPECT_FALSE(aligned.pixels().isMaterialized());

    const auto& values = aligned.values();
    ASSERT_EQ(values.size(), 16u);
    for (size_t row = 0; row < 4; ++row) {
        for (size_t col = 0; col < 3; ++col) {
            EXPECT_DOUBLE_EQ(values[row * 4 + col], static_cast<double>(row * 4 + col + 1));
        }
        EXPECT_TRUE(std::isnan(values[row * 4 + 3]));
    }
}

// =============================================================================
// 线程本地凭证
// =============================================================================

class ScopedCredentialOptionsTest : public ::testing::Test {
protected:
    static std::optional<std::string> option(const char* key) {
        const char* value = CPLGetConfigOption(key, nullptr);
        return value ? std::optional<std::string>(value) : std::nullopt;
    }

    AccessContext access() {
        AccessContext context;
        context.credentials = TemporaryCredentials{"AKIA-TEST", "secret", "token", ""};
        context.region = "eu-central-1";
        return context;
    }
};

TEST_F(ScopedCredentialOptionsTest, AppliedOnlyWithinScope) {
    const auto keyBefore = option("AWS_ACCESS_KEY_ID");
    const auto regionBefore = option("AWS_REGION");
    {
        ScopedCredentialOptions scope(access());
        EXPECT_EQ(option("AWS_ACCESS_KEY_ID").value_or(""), "AKIA-TEST");
        EXPECT_EQ(option("AWS_SESSION_TOKEN").value_or(""), "token");
        EXPECT_EQ(option("AWS_REGION").value_or(""), "eu-central-1");
        EXPECT_EQ(option("GDAL_DISABLE_READDIR_ON_OPEN").value_or(""), "EMPTY_DIR");
    }
    EXPECT_EQ(option("AWS_ACCESS_KEY_ID"), keyBefore);
    EXPECT_EQ(option("AWS_REGION"), regionBefore);
}

TEST_F(ScopedCredentialOptionsTest, InvisibleToOtherThreads) {
    const auto keyBefore = option("AWS_ACCESS_KEY_ID");
    ScopedCredentialOptions scope(access());
    std::optional<std::string> seen = std::string("unset");
    std::thread other([&seen]() { seen = option("AWS_ACCESS_KEY_ID"); });
    other.join();
    EXPECT_EQ(seen, keyBefore);
    EXPECT_EQ(option("AWS_ACCESS_KEY_ID").value_or(""), "AKIA-TEST");
}

TEST_F(ScopedCredentialOptionsTest, RestoresPreviousThreadLocalValue) {
    CPLSetThreadLocalConfigOption("AWS_REGION", "us-east-1");
    {
        ScopedCredentialOptions scope(access());
        EXPECT_EQ(option("AWS_REGION").value_or(""), "eu-central-1");
    }
    EXPECT_EQ(option("AWS_REGION").value_or(""), "us-east-1");
    CPLSetThreadLocalConfigOption("AWS_REGION", nullptr);
}

} // namespace rastercube::core_services::data_access::tests
