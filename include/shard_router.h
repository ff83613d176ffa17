#ifndef SHARDCACHE_SHARD_ROUTER_H
#define SHARDCACHE_SHARD_ROUTER_H

#include "entry.h"
#include "options.h"
#include "shard_store.h"
#include "status.h"

#include <array>
#include <atomic>
#include <istream>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace ShardCache
{
    static constexpr int kDigestLength = 20;

    // sha1 digest
    using Digest = std::array<unsigned char, kDigestLength>;

    // ShardRouter is the cache handle. Every key lives in exactly one shard,
    // chosen by ShardIndex. Single-key operations only touch their shard;
    // aggregate operations visit shards in order and stop at the first
    // failure, leaving earlier shards' work committed and counted.
    class ShardRouter
    {
    public:
        static Status Open(const std::string &path, const Options &options, std::unique_ptr<ShardRouter> *router);

        ShardRouter(const ShardRouter &other) = delete;
        ShardRouter &operator=(const ShardRouter &other) = delete;
        ~ShardRouter();

        // *added is false when a live entry already holds the key.
        Status Add(std::string_view key, const Value &value, const PutOptions &options, bool *added);
        // Stores the remaining bytes of in as a blob file.
        Status Add(std::string_view key, std::istream &in, const PutOptions &options, bool *added);
        // *written, when given, reports whether the entry was stored.
        Status Set(std::string_view key, const Value &value, const PutOptions &options = PutOptions(), bool *written = nullptr);
        Status Set(std::string_view key, std::istream &in, const PutOptions &options = PutOptions(), bool *written = nullptr);

        Status Get(std::string_view key, Value *value, const GetOptions &options = GetOptions());
        // Streaming variant of Get. A bytes default_value is served as a stream.
        Status Get(std::string_view key, std::unique_ptr<ReadStream> *stream, const GetOptions &options = GetOptions());
        // NotFound when the key is missing or expired.
        Status OpenStream(std::string_view key, std::unique_ptr<ReadStream> *stream);
        Status Pop(std::string_view key, Value *value, const GetOptions &options = GetOptions());

        Status Delete(std::string_view key, bool retry = true, bool *deleted = nullptr);
        // NotFound when the key is missing and default_value is empty.
        Status Incr(std::string_view key, int64_t delta, std::optional<int64_t> default_value, int64_t *result, bool retry = true);
        Status Decr(std::string_view key, int64_t delta, std::optional<int64_t> default_value, int64_t *result, bool retry = true);
        Status Touch(std::string_view key, std::optional<double> ttl, bool *touched, bool retry = true);
        Status Contains(std::string_view key, bool *found);

        Status Expire(uint64_t *count);
        Status Evict(std::string_view tag, uint64_t *count);
        Status Clear(uint64_t *count);
        Status Count(uint64_t *count);
        Status CreateTagIndex();
        Status DropTagIndex();
        Status Stats(bool reset, CacheStats *stats);

        // Idempotent. Only handles of this process are released.
        void Close();
        bool closed() const { return closed_; }

        size_t ShardIndex(std::string_view key) const;
        int shard_count() const { return options_.shard_count; }
        const std::string &path() const { return path_; }
        ShardStore &shard(size_t index) { return *shards_[index]; }

        static Digest make_digest(std::string_view key);

    private:
        ShardRouter(std::string path, const Options &options);

        std::string path_;
        Options options_;
        std::vector<std::unique_ptr<ShardStore>> shards_;
        std::atomic_bool closed_;

        Status check_open() const;
        ShardStore &route(std::string_view key) { return *shards_[ShardIndex(key)]; }
        template <typename F>
        Status for_each_shard(F &&func);
    };
} // namespace ShardCache

#endif
