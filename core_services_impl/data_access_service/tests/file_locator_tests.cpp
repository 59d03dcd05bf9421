/**
 * @file file_locator_tests.cpp
 * @brief 直接 URL 与对象存储两种形态的文件解析测试
 */

#include <gtest/gtest.h>

#include <algorithm>
#include <chrono>
#include <memory>

#include "core_services/data_access/file_locator.h"
#include "core_services/exceptions.h"
#include "fakes/fake_data_sources.h"

namespace rastercube::core_services::data_access::tests {

using common_utils::async::CancellationToken;
using common_utils::async::RetryExecutor;
using common_utils::async::RetryPolicy;
using fakes::FakeBandReader;
using fakes::FakeObjectStoreClient;
using fakes::FakeRaster;
using fakes::makeTestGeometry;

class FileLocatorTest : public ::testing::Test {
protected:
    void SetUp() override {
        RetryPolicy policy;
        policy.maxAttempts = 3;
        policy.initialDelay = std::chrono::milliseconds(1);
        retry_ = std::make_unique<RetryExecutor>(
            policy, [](std::chrono::milliseconds) {},
            [](const std::exception& e) { return dynamic_cast<const TransientIOException*>(&e) != nullptr; });
    }

    RequestMetadata objectStoreRequest() {
        RequestMetadata metadata;
        metadata.dataRequestId = "req-1";
        ObjectStoreSource source;
        source.bucket = {"imagery", "aoi-7/"};
        source.credentials = {"AKIA", "secret", "token", "2030-01-01T00:00:00Z"};
        source.fileMapping["optical"] = {{"red", "nir"}, "uint16"};
        source.fileMapping["dem"] = {{"elev"}, "float32"};
        metadata.objectStore = source;
        return metadata;
    }

    void addObject(const std::string& key, size_t bands, const GridGeometry& geometry) {
        reader_.addRaster("/vsis3/imagery/" + key, FakeRaster::filled(geometry, std::vector<double>(bands, 1.0)));
    }

    FakeBandReader reader_;
    FakeObjectStoreClient store_;
    std::unique_ptr<RetryExecutor> retry_;
    CancellationToken cancellation_;
    GridGeometry grid_ = makeTestGeometry(4, 4);
};

TEST_F(FileLocatorTest, KeyHelpers) {
    EXPECT_EQ(FileLocator::filenameFromKey("aoi/2020/01/01/00/00/00/optical.tif"), "optical");
    EXPECT_EQ(FileLocator::filenameFromKey("dem"), "dem");
    EXPECT_EQ(FileLocator::extractTimestamp("aoi/2020/05/17/10/30/00/optical.tif").value_or(""),
              "2020/05/17/10/30/00");
    EXPECT_FALSE(FileLocator::extractTimestamp("aoi/static/dem.tif").has_value());
}

TEST_F(FileLocatorTest, DirectFormPassesFilesThrough) {
    RequestMetadata metadata;
    FileDescriptor file;
    file.location = "https://example.org/a.tif";
    file.bands.push_back({1, "ndvi", std::string("2020"), std::nullopt, std::nullopt, std::nullopt});
    metadata.files.push_back(file);

    FileLocator locator(store_, reader_, *retry_);
    AccessContext base;
    base.region = "eu-west-1";
    auto resolved = locator.resolve(metadata, base, cancellation_);

    ASSERT_EQ(resolved.files.size(), 1u);
    EXPECT_EQ(resolved.files[0].location, "https://example.org/a.tif");
    EXPECT_FALSE(resolved.files[0].knownHeader.has_value());
    EXPECT_EQ(resolved.access.region, "eu-west-1");
    EXPECT_EQ(store_.listCalls.load(), 0);
    EXPECT_EQ(reader_.headerReads.load(), 0);
}

TEST_F(FileLocatorTest, ObjectStoreKeysMappedPositionally) {
    store_.setPages({
        {"aoi-7/2020/01/01/00/00/00/optical.tif", "aoi-7/readme.txt"},
        {"aoi-7/0000/00/00/00/00/00/dem.tif"},
        {"aoi-7/2021/01/01/00/00/00/optical.tif"},
    });
    addObject("aoi-7/2020/01/01/00/00/00/optical.tif", 2, grid_);
    addObject("aoi-7/0000/00/00/00/00/00/dem.tif", 1, grid_);
    addObject("aoi-7/2021/01/01/00/00/00/optical.tif", 2, grid_);

    FileLocator locator(store_, reader_, *retry_);
    auto resolved = locator.resolve(objectStoreRequest(), AccessContext{}, cancellation_);

    // 所有分页都被读取
    EXPECT_EQ(store_.pagesServed->load(), 3);
    EXPECT_EQ(store_.lastBucket.prefix, "aoi-7/");
    ASSERT_TRUE(store_.lastAccess.credentials.has_value());
    EXPECT_EQ(store_.lastAccess.credentials->accessKeyId, "AKIA");

    ASSERT_EQ(resolved.files.size(), 3u);
    const auto& optical = resolved.files[0];
    EXPECT_EQ(optical.location, "/vsis3/imagery/aoi-7/2020/01/01/00/00/00/optical.tif");
    ASSERT_EQ(optical.bands.size(), 2u);
    EXPECT_EQ(optical.bands[0].number, 1);
    EXPECT_EQ(optical.bands[0].variableName, "red");
    EXPECT_EQ(optical.bands[1].number, 2);
    EXPECT_EQ(optical.bands[1].variableName, "nir");
    EXPECT_EQ(optical.bands[1].time.value_or(""), "2020/01/01/00/00/00");
    EXPECT_EQ(optical.bands[1].timePattern.value_or(""), FileLocator::kKeyTimestampFormat);
    EXPECT_EQ(optical.bands[1].dataType.value_or(DataType::Unknown), DataType::UInt16);

    const auto& dem = resolved.files[1];
    ASSERT_EQ(dem.bands.size(), 1u);
    EXPECT_FALSE(dem.bands[0].time.has_value());

    auto unmapped = std::count_if(resolved.diagnostics.begin(), resolved.diagnostics.end(),
                                  [](const AssemblyDiagnostic& d) {
                                      return d.kind == DiagnosticKind::UNMAPPED_OBJECT_KEY;
                                  });
    EXPECT_EQ(unmapped, 1);
}

TEST_F(FileLocatorTest, KeyWithoutTimestampIsUntimedWithWarning) {
    store_.setPages({{"aoi-7/static/dem.tif"}});
    addObject("aoi-7/static/dem.tif", 1, grid_);

    FileLocator locator(store_, reader_, *retry_);
    auto resolved = locator.resolve(objectStoreRequest(), AccessContext{}, cancellation_);

    ASSERT_EQ(resolved.files.size(), 1u);
    EXPECT_FALSE(resolved.files[0].bands[0].time.has_value());
    ASSERT_EQ(resolved.diagnostics.size(), 1u);
    EXPECT_EQ(resolved.diagnostics[0].kind, DiagnosticKind::MISSING_TIMESTAMP);
    EXPECT_EQ(resolved.diagnostics[0].severity, DiagnosticSeverity::Warning);
}

TEST_F(FileLocatorTest, VerifyPolicyInspectsEveryFile) {
    store_.setPages({{"aoi-7/2020/01/01/00/00/00/optical.tif", "aoi-7/2021/01/01/00/00/00/optical.tif"}});
    addObject("aoi-7/2020/01/01/00/00/00/optical.tif", 2, grid_);
    addObject("aoi-7/2021/01/01/00/00/00/optical.tif", 2, grid_);

    FileLocator locator(store_, reader_, *retry_);
    auto resolved = locator.resolve(objectStoreRequest(), AccessContext{}, cancellation_);

    EXPECT_EQ(reader_.headerReads.load(), 2);
    ASSERT_TRUE(resolved.authoritativeHeader.has_value());
    EXPECT_EQ(resolved.authoritativeHeader->geometry, grid_);
    for (const auto& file : resolved.files) {
        ASSERT_TRUE(file.knownHeader.has_value());
        EXPECT_EQ(file.knownHeader->geometry, grid_);
    }
}

TEST_F(FileLocatorTest, VerifyPolicyRejectsGeometryMismatch) {
    store_.setPages({{"aoi-7/2020/01/01/00/00/00/optical.tif", "aoi-7/2021/01/01/00/00/00/optical.tif"}});
    addObject("aoi-7/2020/01/01/00/00/00/optical.tif", 2, grid_);
    addObject("aoi-7/2021/01/01/00/00/00/optical.tif", 2, makeTestGeometry(4, 4, 300.0));

    FileLocator locator(store_, reader_, *retry_);
    EXPECT_THROW(locator.resolve(objectStoreRequest(), AccessContext{}, cancellation_),
                 GeometryMismatchException);
}

TEST_F(FileLocatorTest, TrustFirstPolicyInspectsOnlyFirstFile) {
    store_.setPages({{"aoi-7/2020/01/01/00/00/00/optical.tif", "aoi-7/2021/01/01/00/00/00/optical.tif"}});
    addObject("aoi-7/2020/01/01/00/00/00/optical.tif", 2, grid_);
    addObject("aoi-7/2021/01/01/00/00/00/optical.tif", 2, makeTestGeometry(4, 4, 300.0));

    FileLocatorOptions options;
    options.geometryPolicy = GeometryPolicy::TRUST_FIRST;
    FileLocator locator(store_, reader_, *retry_, options);
    auto resolved = locator.resolve(objectStoreRequest(), AccessContext{}, cancellation_);

    EXPECT_EQ(reader_.headerReads.load(), 1);
    ASSERT_EQ(resolved.files.size(), 2u);
    EXPECT_EQ(resolved.files[1].knownHeader->geometry, grid_);
}

TEST_F(FileLocatorTest, TransientHeaderReadFailureIsRetried) {
    store_.setPages({{"aoi-7/2020/01/01/00/00/00/optical.tif"}});
    addObject("aoi-7/2020/01/01/00/00/00/optical.tif", 2, grid_);
    reader_.failNextOpens("/vsis3/imagery/aoi-7/2020/01/01/00/00/00/optical.tif", 2);

    FileLocator locator(store_, reader_, *retry_);
    auto resolved = locator.resolve(objectStoreRequest(), AccessContext{}, cancellation_);
    EXPECT_EQ(reader_.headerReads.load(), 3);
    EXPECT_EQ(resolved.files.size(), 1u);
}

TEST_F(FileLocatorTest, UnreadableObjectSkippedWhenAllowed) {
    store_.setPages({{"aoi-7/2020/01/01/00/00/00/optical.tif", "aoi-7/2021/01/01/00/00/00/optical.tif"}});
    addObject("aoi-7/2021/01/01/00/00/00/optical.tif", 2, grid_);

    FileLocatorOptions options;
    options.skipUnreadableFiles = true;
    FileLocator locator(store_, reader_, *retry_, options);
    auto resolved = locator.resolve(objectStoreRequest(), AccessContext{}, cancellation_);

    ASSERT_EQ(resolved.files.size(), 1u);
    EXPECT_EQ(resolved.files[0].location, "/vsis3/imagery/aoi-7/2021/01/01/00/00/00/optical.tif");
    ASSERT_EQ(resolved.diagnostics.size(), 1u);
    EXPECT_EQ(resolved.diagnostics[0].kind, DiagnosticKind::LOAD_FAILURE);
    EXPECT_EQ(resolved.diagnostics[0].severity, DiagnosticSeverity::Error);
}

TEST_F(FileLocatorTest, UnreadableObjectFailsByDefault) {
    store_.setPages({{"aoi-7/2020/01/01/00/00/00/optical.tif"}});

    FileLocator locator(store_, reader_, *retry_);
    EXPECT_THROW(locator.resolve(objectStoreRequest(), AccessContext{}, cancellation_), TransientIOException);
}

TEST_F(FileLocatorTest, CancellationStopsListing) {
    store_.setPages({{"aoi-7/2020/01/01/00/00/00/optical.tif"}});
    cancellation_.cancel();

    FileLocator locator(store_, reader_, *retry_);
    EXPECT_THROW(locator.resolve(objectStoreRequest(), AccessContext{}, cancellation_),
                 common_utils::OperationCancelledException);
}

TEST(GeometryPolicyTest, NamesRoundTrip) {
    EXPECT_EQ(geometryPolicyFromString("VERIFY"), GeometryPolicy::VERIFY);
    EXPECT_EQ(geometryPolicyFromString("trust_first"), GeometryPolicy::TRUST_FIRST);
    EXPECT_EQ(toString(GeometryPolicy::TRUST_FIRST), "trust_first");
    EXPECT_THROW(geometryPolicyFromString("sometimes"), common_utils::ValidationException);
}

} // namespace rastercube::core_services::data_access::tests
