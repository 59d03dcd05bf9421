/**
 * @file vsi_object_store_client_tests.cpp
 * @brief /vsis3/ 前缀拆分与对象键还原测试（不访问网络）
 */

#include <gtest/gtest.h>

#include "core_services/data_access/vsi_object_store_client.h"

namespace rastercube::core_services::data_access::tests {

class VsiObjectStoreClientTest : public ::testing::Test {
protected:
    static BucketLocation bucket(const std::string& prefix) {
        BucketLocation location;
        location.name = "tiles";
        location.prefix = prefix;
        return location;
    }
};

// =============================================================================
// 前缀拆分
// =============================================================================

TEST_F(VsiObjectStoreClientTest, PartialNameAfterDirectoryBecomesFilter) {
    auto split = VsiObjectStoreClient::splitPrefix(bucket("a/b/c"));
    EXPECT_EQ(split.directory, "/vsis3/tiles/a/b");
    EXPECT_EQ(split.keyPrefix, "a/b/");
    EXPECT_EQ(split.nameFilter, "c");
}

TEST_F(VsiObjectStoreClientTest, TrailingSlashListsWholeDirectory) {
    auto split = VsiObjectStoreClient::splitPrefix(bucket("a/"));
    EXPECT_EQ(split.directory, "/vsis3/tiles/a");
    EXPECT_EQ(split.keyPrefix, "a/");
    EXPECT_TRUE(split.nameFilter.empty());
}

TEST_F(VsiObjectStoreClientTest, BarePrefixFiltersBucketRoot) {
    auto split = VsiObjectStoreClient::splitPrefix(bucket("c"));
    EXPECT_EQ(split.directory, "/vsis3/tiles");
    EXPECT_TRUE(split.keyPrefix.empty());
    EXPECT_EQ(split.nameFilter, "c");

    auto whole = VsiObjectStoreClient::splitPrefix(bucket(""));
    EXPECT_EQ(whole.directory, "/vsis3/tiles");
    EXPECT_TRUE(whole.keyPrefix.empty());
    EXPECT_TRUE(whole.nameFilter.empty());
}

// =============================================================================
// 对象键还原
// =============================================================================

TEST_F(VsiObjectStoreClientTest, EntryNamesAreRestoredToFullKeys) {
    auto split = VsiObjectStoreClient::splitPrefix(bucket("a/b/c"));

    EXPECT_EQ(VsiObjectStoreClient::keyForEntry(split, "c_2020.tif"), std::string("a/b/c_2020.tif"));
    // 递归列举时相对名带子目录，过滤只作用于第一段开头
    EXPECT_EQ(VsiObjectStoreClient::keyForEntry(split, "cx/d.tif"), std::string("a/b/cx/d.tif"));
    EXPECT_FALSE(VsiObjectStoreClient::keyForEntry(split, "other.tif").has_value());
    EXPECT_FALSE(VsiObjectStoreClient::keyForEntry(split, "x/c.tif").has_value());
}

TEST_F(VsiObjectStoreClientTest, RestoredKeyMapsBackToObjectLocation) {
    VsiObjectStoreClient client;
    BucketLocation location = bucket("a/");
    auto split = VsiObjectStoreClient::splitPrefix(location);

    auto key = VsiObjectStoreClient::keyForEntry(split, "b/c.tif");
    ASSERT_TRUE(key.has_value());
    EXPECT_EQ(*key, "a/b/c.tif");
    EXPECT_EQ(client.objectLocation(location, *key), "/vsis3/tiles/a/b/c.tif");
}

} // namespace rastercube::core_services::data_access::tests
