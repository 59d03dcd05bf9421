/**
 * @file vsi_object_store_client.cpp
 * @brief /vsis3/ 对象列举实现
 *
 * S3 前缀不一定以 '/' 结尾：目录部分交给 VSIOpenDir 递归列举，剩余部分
 * 作为文件名前缀过滤。
 */

#include "core_services/data_access/vsi_object_store_client.h"
#include "core_services/data_access/gdal_environment.h"
#include "core_services/exceptions.h"
#include "common_utils/utilities/logging_utils.h"
#include "common_utils/utilities/string_utils.h"

#include <cpl_vsi.h>
#include <cpl_error.h>

namespace rastercube::core_services::data_access {

using common_utils::StringUtils;

namespace {

class VsiObjectListing : public IObjectListing {
public:
    VsiObjectListing(VSIDIR* dir, VsiObjectStoreClient::PrefixSplit split,
                     AccessContext access, size_t pageSize)
        : dir_(dir), split_(std::move(split)), access_(std::move(access)), pageSize_(pageSize) {}

    ~VsiObjectListing() override {
        if (dir_) {
            VSICloseDir(dir_);
        }
    }

    VsiObjectListing(const VsiObjectListing&) = delete;
    VsiObjectListing& operator=(const VsiObjectListing&) = delete;

    std::vector<std::string> nextPage() override {
        std::vector<std::string> keys;
        if (!dir_) {
            return keys;
        }

        ScopedCredentialOptions scope(access_);
        while (keys.size() < pageSize_) {
            const VSIDIREntry* entry = VSIGetNextDirEntry(dir_);
            if (entry == nullptr) {
                VSICloseDir(dir_);
                dir_ = nullptr;
                break;
            }
            if (entry->bModeKnown && VSI_ISDIR(entry->nMode)) {
                continue;
            }
            if (auto key = VsiObjectStoreClient::keyForEntry(split_, entry->pszName)) {
                keys.push_back(std::move(*key));
            }
        }

        ++pageCount_;
        RASTERCUBE_LOG_DEBUG("ObjectStore", "Listing page {}: {} key(s)", pageCount_, keys.size());
        return keys;
    }

private:
    VSIDIR* dir_;
    VsiObjectStoreClient::PrefixSplit split_;
    AccessContext access_;
    size_t pageSize_;
    size_t pageCount_ = 0;
};

} // namespace

VsiObjectStoreClient::VsiObjectStoreClient(size_t pageSize) : pageSize_(pageSize == 0 ? 1000 : pageSize) {}

VsiObjectStoreClient::PrefixSplit VsiObjectStoreClient::splitPrefix(const BucketLocation& bucket) {
    PrefixSplit split;
    const auto slash = bucket.prefix.rfind('/');
    if (slash == std::string::npos) {
        split.nameFilter = bucket.prefix;
    } else {
        split.keyPrefix = bucket.prefix.substr(0, slash + 1);
        split.nameFilter = bucket.prefix.substr(slash + 1);
    }

    split.directory = "/vsis3/" + bucket.name;
    if (!split.keyPrefix.empty()) {
        split.directory += "/" + split.keyPrefix.substr(0, split.keyPrefix.size() - 1);
    }
    return split;
}

std::optional<std::string> VsiObjectStoreClient::keyForEntry(const PrefixSplit& split,
                                                             const std::string& entryName) {
    if (!split.nameFilter.empty() && !StringUtils::startsWith(entryName, split.nameFilter)) {
        return std::nullopt;
    }
    return split.keyPrefix + entryName;
}

std::unique_ptr<IObjectListing> VsiObjectStoreClient::list(const BucketLocation& bucket,
                                                           const AccessContext& access) {
    GdalGlobalInitializer::initialize();

    PrefixSplit split = splitPrefix(bucket);

    VSIDIR* dir = nullptr;
    {
        ScopedCredentialOptions scope(access);
        CPLErrorReset();
        dir = VSIOpenDir(split.directory.c_str(), -1, nullptr);
    }
    if (dir == nullptr) {
        throw TransientIOException("Failed to list '" + split.directory + "': " + lastGdalError());
    }

    RASTERCUBE_LOG_INFO("ObjectStore", "Listing objects under s3://{}/{}", bucket.name, bucket.prefix);
    return std::make_unique<VsiObjectListing>(dir, std::move(split), access, pageSize_);
}

std::string VsiObjectStoreClient::objectLocation(const BucketLocation& bucket, const std::string& key) const {
    return "/vsis3/" + bucket.name + "/" + key;
}

} // namespace rastercube::core_services::data_access
