/**
 * @file fake_data_sources.h
 * @brief 测试用内存波段读取器和对象存储客户端
 *
 * 不访问网络和文件系统。可以按数据源脚本化失败次数，并记录调用次数和
 * 收到的访问上下文。
 */

#pragma once

#include "core_services/data_access/i_band_reader.h"
#include "core_services/data_access/i_object_store_client.h"
#include "core_services/exceptions.h"

#include <atomic>
#include <map>
#include <memory>
#include <mutex>
#include <set>
#include <string>
#include <vector>

namespace rastercube::core_services::fakes {

inline GridGeometry makeTestGeometry(size_t rows, size_t cols, double originX = 0.0, double originY = 0.0,
                                     int epsg = 32633) {
    GridGeometry geometry;
    geometry.rows = rows;
    geometry.cols = cols;
    geometry.geoTransform = {originX, 30.0, 0.0, originY, 0.0, -30.0};
    geometry.crs = CRSInfo::fromEpsg(epsg);
    return geometry;
}

/**
 * @brief 内存栅格：文件头加每个波段的像素
 */
struct FakeRaster {
    RasterHeader header;
    std::vector<std::vector<double>> bands;

    static FakeRaster filled(const GridGeometry& geometry, const std::vector<double>& bandFills) {
        FakeRaster raster;
        raster.header.geometry = geometry;
        raster.header.bandCount = static_cast<int>(bandFills.size());
        raster.header.dataType = DataType::Float32;
        for (double fill : bandFills) {
            raster.bands.emplace_back(geometry.rows * geometry.cols, fill);
        }
        return raster;
    }
};

class FakeBandReader : public IBandReader {
public:
    void addRaster(const std::string& location, FakeRaster raster) {
        std::lock_guard<std::mutex> lock(mutex_);
        rasters_[location] = std::move(raster);
    }

    /// 接下来 count 次打开该数据源时抛出 TransientIOException
    void failNextOpens(const std::string& location, int count) {
        std::lock_guard<std::mutex> lock(mutex_);
        pendingFailures_[location] = count;
    }

    RasterHeader readHeader(const std::string& location, const AccessContext& access) override {
        headerReads.fetch_add(1);
        return open(location, access).header;
    }

    GriddedArray read(const std::string& location, const BandDescriptor& band,
                      const AccessContext& access) override {
        readCalls.fetch_add(1);
        FakeRaster raster = open(location, access);
        return makePlane(location, band, raster.header, raster);
    }

    GriddedArray readWithHeader(const std::string& location, const BandDescriptor& band,
                                const RasterHeader& header, const AccessContext& access) override {
        readWithHeaderCalls.fetch_add(1);
        FakeRaster raster;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            accessSeen_.push_back(access);
            auto it = rasters_.find(location);
            if (it != rasters_.end()) {
                raster = it->second;
            }
        }
        return makePlane(location, band, header, raster);
    }

    std::vector<AccessContext> accessSeen() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return accessSeen_;
    }

    std::atomic<int> headerReads{0};
    std::atomic<int> readCalls{0};
    std::atomic<int> readWithHeaderCalls{0};
    std::shared_ptr<std::atomic<int>> materializations = std::make_shared<std::atomic<int>>(0);

private:
    FakeRaster open(const std::string& location, const AccessContext& access) {
        std::lock_guard<std::mutex> lock(mutex_);
        accessSeen_.push_back(access);
        auto failure = pendingFailures_.find(location);
        if (failure != pendingFailures_.end() && failure->second > 0) {
            --failure->second;
            throw TransientIOException::forSource(location, "simulated connection reset");
        }
        auto it = rasters_.find(location);
        if (it == rasters_.end()) {
            throw TransientIOException::forSource(location, "no such object");
        }
        return it->second;
    }

    GriddedArray makePlane(const std::string& location, const BandDescriptor& band,
                           const RasterHeader& header, const FakeRaster& raster) {
        if (band.number < 1 || band.number > header.bandCount) {
            throw BandOutOfRangeException(location, band.number, header.bandCount);
        }
        const GridGeometry& geometry = header.geometry;
        std::vector<double> values(geometry.rows * geometry.cols, 0.0);
        if (static_cast<size_t>(band.number) <= raster.bands.size()) {
            values = raster.bands[band.number - 1];
        }
        auto counter = materializations;
        DeferredPixels pixels({geometry.rows, geometry.cols}, band.dataType.value_or(header.dataType),
                              [values, counter]() {
                                  counter->fetch_add(1);
                                  return values;
                              });
        return GriddedArray::spatial(geometry, pixels);
    }

    mutable std::mutex mutex_;
    std::map<std::string, FakeRaster> rasters_;
    std::map<std::string, int> pendingFailures_;
    std::vector<AccessContext> accessSeen_;
};

/**
 * @brief 按预设分页返回对象键的对象存储客户端
 */
class FakeObjectStoreClient : public IObjectStoreClient {
public:
    explicit FakeObjectStoreClient(std::vector<std::vector<std::string>> pages = {})
        : pages_(std::move(pages)) {}

    void setPages(std::vector<std::vector<std::string>> pages) { pages_ = std::move(pages); }

    std::unique_ptr<IObjectListing> list(const BucketLocation& bucket, const AccessContext& access) override {
        listCalls.fetch_add(1);
        lastBucket = bucket;
        lastAccess = access;
        return std::make_unique<Listing>(pages_, pagesServed);
    }

    std::string objectLocation(const BucketLocation& bucket, const std::string& key) const override {
        return "/vsis3/" + bucket.name + "/" + key;
    }

    std::atomic<int> listCalls{0};
    std::shared_ptr<std::atomic<int>> pagesServed = std::make_shared<std::atomic<int>>(0);
    BucketLocation lastBucket;
    AccessContext lastAccess;

private:
    class Listing : public IObjectListing {
    public:
        Listing(std::vector<std::vector<std::string>> pages, std::shared_ptr<std::atomic<int>> served)
            : pages_(std::move(pages)), served_(std::move(served)) {}

        std::vector<std::string> nextPage() override {
            if (next_ >= pages_.size()) {
                return {};
            }
            served_->fetch_add(1);
            return pages_[next_++];
        }

    private:
        std::vector<std::vector<std::string>> pages_;
        std::shared_ptr<std::atomic<int>> served_;
        size_t next_ = 0;
    };

    std::vector<std::vector<std::string>> pages_;
};

} // namespace rastercube::core_services::fakes
