#ifndef SHARDCACHE_OPTIONS_H
#define SHARDCACHE_OPTIONS_H

#include "status.h"
#include <cstddef>

namespace ShardCache
{
    static constexpr int KB = 1024;
    static constexpr int MB = 1024 * 1024;
    // Largest accepted Options::timeout, in seconds.
    static constexpr double kMaxTimeout = 1e9;

    struct Options
    {
        // Number of shards. Fixed for the lifetime of the cache directory.
        int shard_count;
        // Retry budget in seconds for lock contention. 0 means a single attempt.
        double timeout;
        // Whether to build the tag index on every shard at open.
        bool tag_index;
        // Values of at least this many bytes are stored as blob files.
        size_t inline_size_threshold;
        // Keep each shard database open for the lifetime of the handle.
        // When false, every transaction opens and closes the database so that
        // other processes can use the same directory.
        bool exclusive;
        // fsync the RocksDB WAL on every commit.
        bool sync_writes;
        // Count hits and misses of get, pop and stream reads.
        bool statistics;

        Options()
        {
            shard_count = 8;
            timeout = 0.025;
            tag_index = false;
            inline_size_threshold = 32 * KB;
            exclusive = true;
            sync_writes = false;
            statistics = false;
        }

        static Options DefaultOptions()
        {
            Options options;
            return options;
        }

        // Overlays SHARDCACHE_SHARDS, SHARDCACHE_TIMEOUT, SHARDCACHE_TAG_INDEX,
        // SHARDCACHE_INLINE_SIZE_THRESHOLD and SHARDCACHE_EXCLUSIVE on top of base.
        // Unparsable values are ignored.
        static Options FromEnv(const Options &base = Options());

        Status Validate() const;
    };
}

#endif
