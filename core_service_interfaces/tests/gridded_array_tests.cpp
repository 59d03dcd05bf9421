/**
 * @file gridded_array_tests.cpp
 * @brief 网格几何、延迟像素和 GriddedArray 变换测试
 */

#include <gtest/gtest.h>

#include <atomic>
#include <memory>
#include <stdexcept>
#include <vector>

#include "core_services/assembly/assembled_dataset.h"
#include "core_services/common_data_types.h"
#include "core_services/exceptions.h"
#include "core_services/gridded_array.h"
#include "common_utils/utilities/exceptions.h"

namespace rastercube::core_services::tests {

namespace {

GridGeometry makeGeometry(size_t rows, size_t cols, double originX = 100.0, double originY = 50.0) {
    GridGeometry geometry;
    geometry.rows = rows;
    geometry.cols = cols;
    geometry.geoTransform = {originX, 10.0, 0.0, originY, 0.0, -10.0};
    geometry.crs = CRSInfo::fromEpsg(32633);
    return geometry;
}

GriddedArray makePlane(const GridGeometry& geometry, double fill) {
    std::vector<double> values(geometry.rows * geometry.cols, fill);
    return GriddedArray::spatial(geometry,
                                 DeferredPixels::fromValues({geometry.rows, geometry.cols}, DataType::Float32,
                                                            std::move(values)));
}

} // anonymous namespace

// =============================================================================
// 几何与类型
// =============================================================================

class GridGeometryTest : public ::testing::Test {};

TEST_F(GridGeometryTest, PixelCentreCoordinates) {
    auto geometry = makeGeometry(2, 3);
    EXPECT_EQ(geometry.xCoordinates(), (std::vector<double>{105.0, 115.0, 125.0}));
    EXPECT_EQ(geometry.yCoordinates(), (std::vector<double>{45.0, 35.0}));
}

TEST_F(GridGeometryTest, EqualityIsExact) {
    auto a = makeGeometry(2, 3);
    auto b = makeGeometry(2, 3);
    EXPECT_EQ(a, b);
    b.geoTransform[0] += 1e-9;
    EXPECT_NE(a, b);
    auto c = makeGeometry(2, 3);
    c.crs = CRSInfo::fromEpsg(4326);
    EXPECT_NE(a, c);
    EXPECT_NE(a, makeGeometry(3, 3));
}

TEST_F(GridGeometryTest, CrsIdentifier) {
    EXPECT_EQ(CRSInfo::fromEpsg(4326).identifier(), "EPSG:4326");
    CRSInfo wktOnly;
    wktOnly.wkt = "LOCAL_CS[\"grid\"]";
    EXPECT_EQ(wktOnly.identifier(), "LOCAL_CS[\"grid\"]");
    EXPECT_TRUE(CRSInfo().empty());
}

TEST_F(GridGeometryTest, DataTypeNames) {
    EXPECT_EQ(dataTypeFromString("uint8"), DataType::Byte);
    EXPECT_EQ(dataTypeFromString("Float32"), DataType::Float32);
    EXPECT_EQ(dataTypeFromString("complex64"), DataType::Unknown);
}

// =============================================================================
// 延迟像素
// =============================================================================

class DeferredPixelsTest : public ::testing::Test {};

TEST_F(DeferredPixelsTest, MaterializesOnceAndSharesResult) {
    auto calls = std::make_shared<std::atomic<int>>(0);
    DeferredPixels pixels({2, 2}, DataType::Float64, [calls]() {
        calls->fetch_add(1);
        return std::vector<double>{1, 2, 3, 4};
    });
    DeferredPixels copy = pixels;

    EXPECT_FALSE(pixels.isMaterialized());
    EXPECT_EQ(calls->load(), 0);
    EXPECT_EQ(pixels.materialize(), (std::vector<double>{1, 2, 3, 4}));
    EXPECT_TRUE(copy.isMaterialized());
    copy.materialize();
    EXPECT_EQ(calls->load(), 1);
}

TEST_F(DeferredPixelsTest, FailedMaterializationCanBeRetried) {
    auto calls = std::make_shared<int>(0);
    DeferredPixels pixels({1, 2}, DataType::Float64, [calls]() {
        if (++*calls == 1) {
            throw common_utils::IOException("transient");
        }
        return std::vector<double>{7, 8};
    });
    EXPECT_THROW(pixels.materialize(), common_utils::IOException);
    EXPECT_EQ(pixels.materialize(), (std::vector<double>{7, 8}));
}

TEST_F(DeferredPixelsTest, SizeMismatchIsReported) {
    DeferredPixels pixels({2, 2}, DataType::Float64, []() { return std::vector<double>{1}; });
    EXPECT_THROW(pixels.materialize(), DataAccessException);
    EXPECT_THROW(DeferredPixels::fromValues({2, 2}, DataType::Float64, {1, 2, 3}),
                 common_utils::ValidationException);
}

TEST_F(DeferredPixelsTest, ReshapedViewSharesCache) {
    auto calls = std::make_shared<std::atomic<int>>(0);
    DeferredPixels pixels({2, 3}, DataType::Float32, [calls]() {
        calls->fetch_add(1);
        return std::vector<double>{1, 2, 3, 4, 5, 6};
    });
    auto view = pixels.reshaped({1, 2, 3});

    EXPECT_EQ(view.shape(), (std::vector<size_t>{1, 2, 3}));
    EXPECT_EQ(pixels.shape(), (std::vector<size_t>{2, 3}));
    EXPECT_EQ(view.materialize().data(), pixels.materialize().data());
    EXPECT_EQ(calls->load(), 1);
    EXPECT_THROW(pixels.reshaped({4, 2}), common_utils::ValidationException);
}

// =============================================================================
// GriddedArray
// =============================================================================

class GriddedArrayTest : public ::testing::Test {
protected:
    GridGeometry geometry_ = makeGeometry(2, 2);
};

TEST_F(GriddedArrayTest, SpatialPlaneHasNoTimeAxis) {
    auto plane = makePlane(geometry_, 3.0);
    EXPECT_FALSE(plane.hasTimeAxis());
    EXPECT_EQ(plane.dims(), (std::vector<std::string>{"y", "x"}));
    EXPECT_EQ(plane.shape(), (std::vector<size_t>{2, 2}));
    EXPECT_TRUE(plane.timeCoordinates().empty());
    auto sizes = plane.spatialSizes();
    ASSERT_EQ(sizes.size(), 2u);
    EXPECT_EQ(sizes[0].first, "x");
    EXPECT_EQ(sizes[1].first, "y");
}

TEST_F(GriddedArrayTest, ExpandTimeAddsLeadingAxis) {
    auto plane = makePlane(geometry_, 3.0);
    auto t = CalendarTime::fromCivil(2020, 1, 1);
    auto cube = plane.expandTime(t);

    EXPECT_TRUE(cube.hasTimeAxis());
    EXPECT_EQ(cube.dims(), (std::vector<std::string>{"time", "y", "x"}));
    EXPECT_EQ(cube.shape(), (std::vector<size_t>{1, 2, 2}));
    ASSERT_EQ(cube.timeCoordinates().size(), 1u);
    EXPECT_EQ(cube.timeCoordinates()[0], t);
    EXPECT_EQ(cube.values(), plane.values());
    // 时间轴视图不复制平面数据
    EXPECT_EQ(cube.values().data(), plane.values().data());
    EXPECT_FALSE(plane.hasTimeAxis());

    EXPECT_THROW(cube.expandTime(t), common_utils::ValidationException);
    EXPECT_THROW(plane.expandTime(CalendarTime()), common_utils::ValidationException);
}

TEST_F(GriddedArrayTest, ConcatenateAlongTimeIsDeferred) {
    auto calls = std::make_shared<std::atomic<int>>(0);
    DeferredPixels lazy({2, 2}, DataType::Float32, [calls]() {
        calls->fetch_add(1);
        return std::vector<double>{5, 6, 7, 8};
    });
    auto first = makePlane(geometry_, 1.0).expandTime(CalendarTime::fromCivil(2020, 1, 1));
    auto second = GriddedArray::spatial(geometry_, lazy).expandTime(CalendarTime::fromCivil(2021, 1, 1));

    auto merged = GriddedArray::concatenateTime({first, second});
    EXPECT_EQ(calls->load(), 0);
    EXPECT_EQ(merged.shape(), (std::vector<size_t>{2, 2, 2}));
    ASSERT_EQ(merged.timeCoordinates().size(), 2u);
    EXPECT_EQ(merged.timeCoordinates()[1], CalendarTime::fromCivil(2021, 1, 1));
    EXPECT_EQ(merged.values(), (std::vector<double>{1, 1, 1, 1, 5, 6, 7, 8}));
    EXPECT_EQ(calls->load(), 1);
}

TEST_F(GriddedArrayTest, ConcatenateRejectsMismatchedGrids) {
    auto a = makePlane(geometry_, 1.0).expandTime(CalendarTime::fromCivil(2020, 1, 1));
    auto b = makePlane(makeGeometry(2, 2, 200.0), 1.0).expandTime(CalendarTime::fromCivil(2021, 1, 1));
    auto untimed = makePlane(geometry_, 1.0);

    EXPECT_THROW(GriddedArray::concatenateTime({a, b}), DimensionMismatchException);
    EXPECT_THROW(GriddedArray::concatenateTime({a, untimed}), DimensionMismatchException);
    EXPECT_THROW(GriddedArray::concatenateTime({}), DimensionMismatchException);
}

// =============================================================================
// AssembledDataset
// =============================================================================

TEST(AssembledDatasetTest, LookupAndDiagnostics) {
    auto geometry = makeGeometry(1, 1);
    AssembledDataset dataset(
        {{"ndvi", makePlane(geometry, 0.5)}, {"elev", makePlane(geometry, 12.0)}},
        {{"dataset_id", "ds-1"}},
        {{DiagnosticSeverity::Warning, DiagnosticKind::EMPTY_VARIABLE, "lst", "no planes"}});

    EXPECT_EQ(dataset.variableNames(), (std::vector<std::string>{"ndvi", "elev"}));
    EXPECT_TRUE(dataset.contains("elev"));
    EXPECT_EQ(dataset.variable("elev").values()[0], 12.0);
    EXPECT_THROW(dataset.variable("lst"), common_utils::ResourceNotFoundException);
    EXPECT_EQ(dataset.attribute("dataset_id").value_or(""), "ds-1");
    EXPECT_FALSE(dataset.attribute("aoi_id").has_value());
    EXPECT_EQ(dataset.diagnosticsOfKind(DiagnosticKind::EMPTY_VARIABLE).size(), 1u);
    EXPECT_TRUE(dataset.diagnosticsOfKind(DiagnosticKind::LOAD_FAILURE).empty());
}

} // namespace rastercube::core_services::tests
