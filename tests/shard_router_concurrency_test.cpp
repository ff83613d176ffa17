#include <gtest/gtest.h>
#include <atomic>
#include <filesystem>
#include <string>
#include <thread>
#include <vector>
#include "shardcache.h"
#include "rocksdb/db.h"
#include <spdlog/fmt/fmt.h>

using ShardCache::ShardRouter;
using ShardCache::Status;
using ShardCache::Value;

class ShardRouterConcurrencyTest : public ::testing::Test {
protected:
    std::string path_;
    ShardCache::Options options_;

    void SetUp() override {
        path_ = std::string("./shard_router_concurrency_test.") + ::testing::UnitTest::GetInstance()->current_test_info()->name();
        std::filesystem::remove_all(path_);
        options_.shard_count = 4;
        options_.timeout = 30.0;
    }

    void TearDown() override {
        std::filesystem::remove_all(path_);
    }

    std::unique_ptr<ShardRouter> open(const ShardCache::Options& options) {
        std::unique_ptr<ShardRouter> router;
        auto status = ShardRouter::Open(path_, options, &router);
        EXPECT_TRUE(status.ok()) << status.ToString();
        return router;
    }

    // Two keys that land on different shards.
    std::pair<std::string, std::string> keys_on_two_shards(ShardRouter& router) {
        std::string first = "key_0";
        for (int i = 1; i < 1000; i++) {
            std::string second = "key_" + std::to_string(i);
            if (router.ShardIndex(second) != router.ShardIndex(first)) {
                return {first, second};
            }
        }
        ADD_FAILURE() << "all keys map to one shard";
        return {first, first};
    }
};

TEST_F(ShardRouterConcurrencyTest, ConcurrentIncrIsExact) {
    auto cache = open(options_);
    ASSERT_TRUE(cache);

    const int num_threads = 8;
    const int increments = 200;
    std::atomic<int> failures{0};
    std::vector<std::thread> threads;
    for (int t = 0; t < num_threads; t++) {
        threads.emplace_back([&]() {
            for (int i = 0; i < increments; i++) {
                int64_t result = 0;
                if (!cache->Incr("counter", 1, 0, &result).ok()) {
                    failures++;
                }
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }

    EXPECT_EQ(failures.load(), 0);
    Value value;
    ASSERT_TRUE(cache->Get("counter", &value).ok());
    EXPECT_EQ(std::get<int64_t>(value), num_threads * increments);
}

TEST_F(ShardRouterConcurrencyTest, ConcurrentWritersOnDistinctKeys) {
    auto cache = open(options_);
    ASSERT_TRUE(cache);

    const int num_threads = 4;
    const int keys_per_thread = 250;
    std::atomic<int> failures{0};
    std::vector<std::thread> threads;
    for (int t = 0; t < num_threads; t++) {
        threads.emplace_back([&, t]() {
            for (int i = 0; i < keys_per_thread; i++) {
                auto key = "t" + std::to_string(t) + "_" + std::to_string(i);
                if (!cache->Set(key, Value(key)).ok()) {
                    failures++;
                }
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }

    EXPECT_EQ(failures.load(), 0);
    uint64_t count = 0;
    ASSERT_TRUE(cache->Count(&count).ok());
    EXPECT_EQ(count, static_cast<uint64_t>(num_threads * keys_per_thread));
}

// A held shard does not block writes to another shard.
TEST_F(ShardRouterConcurrencyTest, ShardsLockIndependently) {
    options_.exclusive = false;
    options_.timeout = 0.05;
    auto cache = open(options_);
    ASSERT_TRUE(cache);
    auto [held_key, free_key] = keys_on_two_shards(*cache);

    auto held_dir = fmt::format("{}/{:03d}/db", path_, cache->ShardIndex(held_key));
    rocksdb::DB *holder = nullptr;
    auto s = rocksdb::DB::Open(ShardCache::ShardStore::default_rocksdb_options(), held_dir, &holder);
    ASSERT_TRUE(s.ok()) << s.ToString();

    ShardCache::PutOptions no_retry;
    no_retry.retry = false;
    auto status = cache->Set(free_key, Value(int64_t(1)), no_retry);
    EXPECT_TRUE(status.ok()) << status.ToString();
    status = cache->Set(held_key, Value(int64_t(1)), no_retry);
    EXPECT_TRUE(status.timeout()) << status.ToString();
    status = cache->Set(held_key, Value(int64_t(1)));
    EXPECT_TRUE(status.timeout()) << status.ToString();

    delete holder;
    status = cache->Set(held_key, Value(int64_t(1)), no_retry);
    EXPECT_TRUE(status.ok()) << status.ToString();
}

TEST_F(ShardRouterConcurrencyTest, SharedHandlesSeeEachOther) {
    options_.exclusive = false;
    auto first = open(options_);
    auto second = open(options_);
    ASSERT_TRUE(first && second);

    ASSERT_TRUE(first->Set("greeting", Value(std::string("hello"))).ok());
    Value value;
    ASSERT_TRUE(second->Get("greeting", &value).ok());
    EXPECT_EQ(std::get<std::string>(value), "hello");

    bool deleted = false;
    ASSERT_TRUE(second->Delete("greeting", true, &deleted).ok());
    EXPECT_TRUE(deleted);
    EXPECT_TRUE(first->Get("greeting", &value).not_found());
}

TEST_F(ShardRouterConcurrencyTest, SharedHandlesIncrementExactly) {
    options_.exclusive = false;
    auto first = open(options_);
    auto second = open(options_);
    ASSERT_TRUE(first && second);

    const int increments = 25;
    std::atomic<int> failures{0};
    auto worker = [&](ShardRouter* cache) {
        for (int i = 0; i < increments; i++) {
            int64_t result = 0;
            if (!cache->Incr("counter", 1, 0, &result).ok()) {
                failures++;
            }
        }
    };
    std::thread a(worker, first.get());
    std::thread b(worker, second.get());
    a.join();
    b.join();

    EXPECT_EQ(failures.load(), 0);
    Value value;
    ASSERT_TRUE(first->Get("counter", &value).ok());
    EXPECT_EQ(std::get<int64_t>(value), 2 * increments);
}

TEST_F(ShardRouterConcurrencyTest, ExclusiveHandleKeepsOthersOut) {
    auto owner = open(options_);
    ASSERT_TRUE(owner);

    auto options = options_;
    options.timeout = 0.05;
    std::unique_ptr<ShardRouter> other;
    auto status = ShardRouter::Open(path_, options, &other);
    EXPECT_TRUE(status.timeout()) << status.ToString();

    owner.reset();
    status = ShardRouter::Open(path_, options, &other);
    EXPECT_TRUE(status.ok()) << status.ToString();
}

TEST_F(ShardRouterConcurrencyTest, ReadersAndWritersOnOneBlobKey) {
    options_.inline_size_threshold = 16;
    auto cache = open(options_);
    ASSERT_TRUE(cache);
    ASSERT_TRUE(cache->Set("blob", Value(std::string(4096, 'a'))).ok());

    std::atomic<bool> stop{false};
    std::atomic<int> bad_reads{0};
    std::thread writer([&]() {
        for (int i = 0; i < 100; i++) {
            char c = static_cast<char>('a' + i % 26);
            if (!cache->Set("blob", Value(std::string(4096, c))).ok()) {
                bad_reads++;
            }
        }
        stop = true;
    });
    std::thread reader([&]() {
        while (!stop) {
            std::unique_ptr<ShardCache::ReadStream> stream;
            if (!cache->OpenStream("blob", &stream).ok()) {
                bad_reads++;
                continue;
            }
            std::string data;
            if (!stream->ReadAll(&data).ok() || data.size() != 4096 ||
                data.find_first_not_of(data[0]) != std::string::npos) {
                bad_reads++;
            }
        }
    });
    writer.join();
    reader.join();

    EXPECT_EQ(bad_reads.load(), 0);
    EXPECT_EQ(cache->shard(cache->ShardIndex("blob")).blobs().PendingRemovals(), 0u);
}
