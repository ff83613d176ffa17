#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include <cstdlib>
#include <filesystem>
#include <limits>
#include <set>
#include <sstream>
#include <string>
#include <vector>
#include "shardcache.h"

using ShardCache::ShardRouter;
using ShardCache::Status;
using ShardCache::Value;

class ShardRouterTest : public ::testing::Test {
protected:
    std::string path_;
    ShardCache::Options options_;
    std::unique_ptr<ShardRouter> cache_;

    void SetUp() override {
        path_ = std::string("./shard_router_test.") + ::testing::UnitTest::GetInstance()->current_test_info()->name();
        std::filesystem::remove_all(path_);
        options_.shard_count = 4;
        options_.timeout = 1.0;
        options_.inline_size_threshold = 1024;
        open_cache();
    }

    void TearDown() override {
        cache_.reset();
        std::filesystem::remove_all(path_);
    }

    void open_cache() {
        cache_.reset();
        auto status = ShardRouter::Open(path_, options_, &cache_);
        ASSERT_TRUE(status.ok()) << status.ToString();
    }

    std::string get_bytes(const std::string& key) {
        Value value;
        auto status = cache_->Get(key, &value);
        EXPECT_TRUE(status.ok()) << status.ToString();
        return status.ok() ? std::get<std::string>(value) : std::string();
    }

    void set_tagged(const std::string& key, const std::string& tag) {
        ShardCache::PutOptions put;
        put.tag = tag;
        auto status = cache_->Set(key, Value(key), put);
        ASSERT_TRUE(status.ok()) << status.ToString();
    }
};

TEST_F(ShardRouterTest, SetThenGet) {
    ASSERT_TRUE(cache_->Set("key", Value(std::string("value"))).ok());
    EXPECT_EQ(get_bytes("key"), "value");
    ASSERT_TRUE(cache_->Set("key", Value(std::string("other"))).ok());
    EXPECT_EQ(get_bytes("key"), "other");

    ASSERT_TRUE(cache_->Set("large", Value(std::string(100000, 'z'))).ok());
    EXPECT_EQ(get_bytes("large"), std::string(100000, 'z'));

    Value value;
    auto status = cache_->Get("missing", &value);
    EXPECT_TRUE(status.not_found()) << status.ToString();
}

TEST_F(ShardRouterTest, SetReportsWrite) {
    bool written = false;
    ASSERT_TRUE(cache_->Set("key", Value(int64_t(1)), ShardCache::PutOptions(), &written).ok());
    EXPECT_TRUE(written);

    std::istringstream in(std::string(5000, 'w'));
    written = false;
    ASSERT_TRUE(cache_->Set("stream", in, ShardCache::PutOptions(), &written).ok());
    EXPECT_TRUE(written);

    ShardCache::PutOptions bad;
    bad.ttl = std::numeric_limits<double>::quiet_NaN();
    EXPECT_TRUE(cache_->Set("key", Value(int64_t(2)), bad, &written).invalid_argument());
    EXPECT_FALSE(written);

    cache_->Close();
    written = true;
    EXPECT_TRUE(cache_->Set("key", Value(int64_t(3)), ShardCache::PutOptions(), &written).closed());
    EXPECT_FALSE(written);
}

TEST_F(ShardRouterTest, GetReturnsDefaultForMissingKey) {
    Value value;
    ShardCache::GetOptions get;
    get.default_value = Value(int64_t(-1));
    ASSERT_TRUE(cache_->Get("missing", &value, get).ok());
    EXPECT_EQ(std::get<int64_t>(value), -1);
}

TEST_F(ShardRouterTest, AddDoesNotOverwrite) {
    bool added = false;
    ASSERT_TRUE(cache_->Add("key", Value(std::string("first")), ShardCache::PutOptions(), &added).ok());
    EXPECT_TRUE(added);
    ASSERT_TRUE(cache_->Add("key", Value(std::string("second")), ShardCache::PutOptions(), &added).ok());
    EXPECT_FALSE(added);
    EXPECT_EQ(get_bytes("key"), "first");
}

TEST_F(ShardRouterTest, AddReplacesExpiredEntry) {
    ShardCache::PutOptions expired;
    expired.ttl = 0;
    ASSERT_TRUE(cache_->Set("key", Value(std::string("stale")), expired).ok());
    bool added = false;
    ASSERT_TRUE(cache_->Add("key", Value(std::string("fresh")), ShardCache::PutOptions(), &added).ok());
    EXPECT_TRUE(added);
    EXPECT_EQ(get_bytes("key"), "fresh");
}

TEST_F(ShardRouterTest, ZeroTtlIsExpiredImmediately) {
    ShardCache::PutOptions put;
    put.ttl = 0;
    ASSERT_TRUE(cache_->Set("key", Value(int64_t(1)), put).ok());

    bool found = true;
    ASSERT_TRUE(cache_->Contains("key", &found).ok());
    EXPECT_FALSE(found);

    Value value;
    ShardCache::GetOptions get;
    get.default_value = Value(std::string("default"));
    ASSERT_TRUE(cache_->Get("key", &value, get).ok());
    EXPECT_EQ(std::get<std::string>(value), "default");
}

TEST_F(ShardRouterTest, GetReportsEntryInfo) {
    ShardCache::PutOptions put;
    put.ttl = 60;
    put.tag = "group";
    double before = ShardCache::now_micros() / 1e6;
    ASSERT_TRUE(cache_->Set("key", Value(std::string("12345")), put).ok());

    Value value;
    ShardCache::EntryInfo info;
    ShardCache::GetOptions get;
    get.info = &info;
    ASSERT_TRUE(cache_->Get("key", &value, get).ok());
    ASSERT_TRUE(info.expire_time.has_value());
    EXPECT_GE(*info.expire_time, before + 59);
    EXPECT_LE(*info.expire_time, before + 61);
    EXPECT_EQ(info.tag, std::optional<std::string>("group"));
    EXPECT_EQ(info.size, 5u);

    ASSERT_TRUE(cache_->Set("plain", Value(2.0)).ok());
    ASSERT_TRUE(cache_->Get("plain", &value, get).ok());
    EXPECT_FALSE(info.expire_time.has_value());
    EXPECT_FALSE(info.tag.has_value());
}

TEST_F(ShardRouterTest, IncrAndDecr) {
    int64_t result = 0;
    auto status = cache_->Incr("counter", 1, std::nullopt, &result);
    EXPECT_TRUE(status.not_found()) << status.ToString();
    bool found = true;
    ASSERT_TRUE(cache_->Contains("counter", &found).ok());
    EXPECT_FALSE(found);

    ASSERT_TRUE(cache_->Incr("counter", 1, 5, &result).ok());
    EXPECT_EQ(result, 6);
    ASSERT_TRUE(cache_->Incr("counter", 10, std::nullopt, &result).ok());
    EXPECT_EQ(result, 16);
    ASSERT_TRUE(cache_->Decr("counter", 20, std::nullopt, &result).ok());
    EXPECT_EQ(result, -4);

    Value value;
    ASSERT_TRUE(cache_->Get("counter", &value).ok());
    EXPECT_EQ(std::get<int64_t>(value), -4);
}

TEST_F(ShardRouterTest, PopRemovesEntry) {
    ASSERT_TRUE(cache_->Set("key", Value(int64_t(3))).ok());
    Value value;
    ASSERT_TRUE(cache_->Pop("key", &value).ok());
    EXPECT_EQ(std::get<int64_t>(value), 3);
    EXPECT_TRUE(cache_->Pop("key", &value).not_found());
}

TEST_F(ShardRouterTest, DeleteReportsRemoval) {
    ASSERT_TRUE(cache_->Set("key", Value(int64_t(3))).ok());
    bool deleted = false;
    ASSERT_TRUE(cache_->Delete("key", true, &deleted).ok());
    EXPECT_TRUE(deleted);
    ASSERT_TRUE(cache_->Delete("key", true, &deleted).ok());
    EXPECT_FALSE(deleted);
}

TEST_F(ShardRouterTest, TouchChangesExpireTime) {
    ShardCache::PutOptions put;
    put.ttl = 3600;
    ASSERT_TRUE(cache_->Set("key", Value(int64_t(1)), put).ok());
    bool touched = false;
    ASSERT_TRUE(cache_->Touch("key", 0, &touched).ok());
    EXPECT_TRUE(touched);
    bool found = true;
    ASSERT_TRUE(cache_->Contains("key", &found).ok());
    EXPECT_FALSE(found);

    ASSERT_TRUE(cache_->Touch("missing", 10, &touched).ok());
    EXPECT_FALSE(touched);
}

TEST_F(ShardRouterTest, StreamsLargeValues) {
    std::string data(200000, 's');
    std::istringstream in(data);
    ASSERT_TRUE(cache_->Set("blob", in).ok());

    std::unique_ptr<ShardCache::ReadStream> stream;
    ASSERT_TRUE(cache_->OpenStream("blob", &stream).ok());
    EXPECT_EQ(stream->Size(), data.size());
    std::string read_back;
    ASSERT_TRUE(stream->ReadAll(&read_back).ok());
    EXPECT_EQ(read_back, data);

    auto status = cache_->OpenStream("missing", &stream);
    EXPECT_TRUE(status.not_found()) << status.ToString();
}

TEST_F(ShardRouterTest, StreamSurvivesDelete) {
    std::string data(50000, 'd');
    ASSERT_TRUE(cache_->Set("blob", Value(data)).ok());
    std::unique_ptr<ShardCache::ReadStream> stream;
    ASSERT_TRUE(cache_->OpenStream("blob", &stream).ok());
    bool deleted = false;
    ASSERT_TRUE(cache_->Delete("blob", true, &deleted).ok());
    EXPECT_TRUE(deleted);

    std::string read_back;
    ASSERT_TRUE(stream->ReadAll(&read_back).ok());
    EXPECT_EQ(read_back, data);
}

TEST_F(ShardRouterTest, EvictRemovesExactlyTaggedEntries) {
    for (int i = 0; i < 60; i++) {
        set_tagged("a" + std::to_string(i), "alpha");
        set_tagged("b" + std::to_string(i), "beta");
    }
    ASSERT_TRUE(cache_->Set("untagged", Value(int64_t(0))).ok());

    uint64_t count = 0;
    ASSERT_TRUE(cache_->Evict("alpha", &count).ok());
    EXPECT_EQ(count, 60u);
    ASSERT_TRUE(cache_->Count(&count).ok());
    EXPECT_EQ(count, 61u);

    ASSERT_TRUE(cache_->CreateTagIndex().ok());
    ASSERT_TRUE(cache_->Evict("beta", &count).ok());
    EXPECT_EQ(count, 60u);
    ASSERT_TRUE(cache_->Evict("beta", &count).ok());
    EXPECT_EQ(count, 0u);
    ASSERT_TRUE(cache_->Count(&count).ok());
    EXPECT_EQ(count, 1u);
}

TEST_F(ShardRouterTest, EvictIncludesExpiredEntries) {
    ShardCache::PutOptions put;
    put.tag = "t";
    put.ttl = 0;
    ASSERT_TRUE(cache_->Set("expired", Value(int64_t(1)), put).ok());
    set_tagged("live", "t");
    uint64_t count = 0;
    ASSERT_TRUE(cache_->Evict("t", &count).ok());
    EXPECT_EQ(count, 2u);
}

TEST_F(ShardRouterTest, ExpireRemovesExactlyExpiredEntries) {
    ShardCache::PutOptions expired, later;
    expired.ttl = 0;
    later.ttl = 3600;
    for (int i = 0; i < 30; i++) {
        ASSERT_TRUE(cache_->Set("e" + std::to_string(i), Value(int64_t(i)), expired).ok());
        ASSERT_TRUE(cache_->Set("l" + std::to_string(i), Value(int64_t(i)), later).ok());
        ASSERT_TRUE(cache_->Set("f" + std::to_string(i), Value(int64_t(i))).ok());
    }
    uint64_t count = 0;
    ASSERT_TRUE(cache_->Expire(&count).ok());
    EXPECT_EQ(count, 30u);
    ASSERT_TRUE(cache_->Expire(&count).ok());
    EXPECT_EQ(count, 0u);
    ASSERT_TRUE(cache_->Count(&count).ok());
    EXPECT_EQ(count, 60u);
}

TEST_F(ShardRouterTest, ClearRemovesEverything) {
    for (int i = 0; i < 50; i++) {
        ASSERT_TRUE(cache_->Set("k" + std::to_string(i), Value(std::string(2000, 'c'))).ok());
    }
    uint64_t count = 0;
    ASSERT_TRUE(cache_->Clear(&count).ok());
    EXPECT_EQ(count, 50u);
    ASSERT_TRUE(cache_->Count(&count).ok());
    EXPECT_EQ(count, 0u);
}

TEST_F(ShardRouterTest, StatsAreCollectedWhenEnabled) {
    options_.statistics = true;
    open_cache();
    ASSERT_TRUE(cache_->Set("key", Value(int64_t(1))).ok());
    Value value;
    ASSERT_TRUE(cache_->Get("key", &value).ok());
    ASSERT_TRUE(cache_->Get("key", &value).ok());
    EXPECT_TRUE(cache_->Get("missing", &value).not_found());

    ShardCache::CacheStats stats;
    ASSERT_TRUE(cache_->Stats(true, &stats).ok());
    EXPECT_EQ(stats.hits, 2u);
    EXPECT_EQ(stats.misses, 1u);
    ASSERT_TRUE(cache_->Stats(false, &stats).ok());
    EXPECT_EQ(stats.hits, 0u);
}

TEST_F(ShardRouterTest, CloseIsIdempotentAndFinal) {
    cache_->Close();
    cache_->Close();
    EXPECT_TRUE(cache_->closed());

    Value value;
    uint64_t count = 0;
    int64_t result = 0;
    bool flag = false;
    std::unique_ptr<ShardCache::ReadStream> stream;
    EXPECT_TRUE(cache_->Set("key", Value(int64_t(1))).closed());
    EXPECT_TRUE(cache_->Add("key", Value(int64_t(1)), ShardCache::PutOptions(), &flag).closed());
    EXPECT_TRUE(cache_->Get("key", &value).closed());
    EXPECT_TRUE(cache_->OpenStream("key", &stream).closed());
    EXPECT_TRUE(cache_->Pop("key", &value).closed());
    EXPECT_TRUE(cache_->Delete("key").closed());
    EXPECT_TRUE(cache_->Incr("key", 1, 0, &result).closed());
    EXPECT_TRUE(cache_->Decr("key", 1, 0, &result).closed());
    EXPECT_TRUE(cache_->Touch("key", 1, &flag).closed());
    EXPECT_TRUE(cache_->Contains("key", &flag).closed());
    EXPECT_TRUE(cache_->Expire(&count).closed());
    EXPECT_TRUE(cache_->Evict("tag", &count).closed());
    EXPECT_TRUE(cache_->Clear(&count).closed());
    EXPECT_TRUE(cache_->Count(&count).closed());
    EXPECT_TRUE(cache_->CreateTagIndex().closed());
}

TEST_F(ShardRouterTest, DataSurvivesReopen) {
    ASSERT_TRUE(cache_->Set("persistent", Value(std::string("yes"))).ok());
    ASSERT_TRUE(cache_->Set("blob", Value(std::string(5000, 'p'))).ok());
    open_cache();
    EXPECT_EQ(get_bytes("persistent"), "yes");
    EXPECT_EQ(get_bytes("blob"), std::string(5000, 'p'));
}

TEST_F(ShardRouterTest, ShardCountIsFixed) {
    cache_.reset();
    options_.shard_count = 8;
    std::unique_ptr<ShardRouter> other;
    auto status = ShardRouter::Open(path_, options_, &other);
    EXPECT_TRUE(status.invalid_argument()) << status.ToString();
}

TEST_F(ShardRouterTest, InvalidOptionsAreRejected) {
    std::unique_ptr<ShardRouter> other;
    ShardCache::Options bad;
    bad.shard_count = 0;
    EXPECT_TRUE(ShardRouter::Open(path_ + ".bad", bad, &other).invalid_argument());
    bad.shard_count = 1;
    bad.timeout = -1;
    EXPECT_TRUE(ShardRouter::Open(path_ + ".bad", bad, &other).invalid_argument());
    bad.timeout = std::numeric_limits<double>::infinity();
    EXPECT_TRUE(ShardRouter::Open(path_ + ".bad", bad, &other).invalid_argument());
    std::filesystem::remove_all(path_ + ".bad");
}

TEST_F(ShardRouterTest, ShardIndexIsStableAndSpread) {
    std::set<size_t> used;
    for (int i = 0; i < 200; i++) {
        auto key = "key_" + std::to_string(i);
        auto index = cache_->ShardIndex(key);
        ASSERT_LT(index, 4u);
        EXPECT_EQ(index, cache_->ShardIndex(key));
        used.insert(index);
    }
    EXPECT_EQ(used.size(), 4u);
}

TEST(ShardRouterDigestTest, MatchesKnownSha1) {
    // sha1("abc") = a9993e364706816aba3e25717850c26c9cd0d89d
    auto digest = ShardRouter::make_digest("abc");
    EXPECT_EQ(digest[0], 0xa9);
    EXPECT_EQ(digest[1], 0x99);
    EXPECT_EQ(digest[19], 0x9d);
}

TEST(OptionsTest, EnvironmentOverridesDefaults) {
    setenv("SHARDCACHE_SHARDS", "16", 1);
    setenv("SHARDCACHE_TIMEOUT", "0.5", 1);
    setenv("SHARDCACHE_TAG_INDEX", "true", 1);
    setenv("SHARDCACHE_EXCLUSIVE", "not-a-bool", 1);
    auto options = ShardCache::Options::FromEnv();
    unsetenv("SHARDCACHE_SHARDS");
    unsetenv("SHARDCACHE_TIMEOUT");
    unsetenv("SHARDCACHE_TAG_INDEX");
    unsetenv("SHARDCACHE_EXCLUSIVE");

    EXPECT_EQ(options.shard_count, 16);
    EXPECT_DOUBLE_EQ(options.timeout, 0.5);
    EXPECT_TRUE(options.tag_index);
    EXPECT_TRUE(options.exclusive);
    EXPECT_EQ(options.inline_size_threshold, 32u * ShardCache::KB);
}
