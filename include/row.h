#ifndef SHARDCACHE_ROW_H
#define SHARDCACHE_ROW_H

#include "entry.h"
#include "status.h"
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace ShardCache
{
    // Key layout of a shard database:
    //
    // /meta/shard_index             decimal shard index
    // /meta/shard_count             decimal shard count the cache was created with
    // /meta/tag_index               present while the tag index exists
    // /entries/<key>                encoded Row
    // /expiry/<be64 micros><key>    empty, one per entry with an expire time
    // /tags/<be32 len><tag><key>    empty, one per tagged entry while the tag index exists
    static const std::string kShardIndexKey = "/meta/shard_index";
    static const std::string kShardCountKey = "/meta/shard_count";
    static const std::string kTagIndexKey = "/meta/tag_index";
    static const std::string kEntryPrefix = "/entries/";
    static const std::string kExpiryPrefix = "/expiry/";
    static const std::string kTagPrefix = "/tags/";

    std::string entry_key(std::string_view key);
    std::string expiry_key(int64_t expire_us, std::string_view key);
    std::string tag_prefix(std::string_view tag);
    std::string tag_key(std::string_view tag, std::string_view key);
    // Decodes the timestamp of an expiry index key.
    int64_t expiry_key_time(std::string_view expiry_key);
    // Smallest key greater than every key starting with prefix.
    std::string prefix_end(std::string prefix);

    int64_t now_micros();
    int64_t expire_micros(double ttl, int64_t now_us);

    enum class ValueKind : uint8_t
    {
        kInteger = 1,
        kReal = 2,
        kBytes = 3,
        // data holds the blob name instead of the value.
        kBlob = 4,
    };

    // Row is the persisted metadata of one entry.
    //
    // Encoding (little endian):
    // [u8 version][u8 kind][u8 flags][i64 store_us][u64 size]
    // [i64 expire_us if flags & kHasExpire][u32 tag_len, tag if flags & kHasTag]
    // [payload: i64 | f64 | bytes]
    struct Row
    {
        ValueKind kind = ValueKind::kBytes;
        int64_t store_us = 0;
        uint64_t size = 0;
        std::optional<int64_t> expire_us;
        std::optional<std::string> tag;
        int64_t integer = 0;
        double real = 0;
        std::string data;

        bool expired(int64_t now_us) const { return expire_us && *expire_us <= now_us; }
        bool is_blob() const { return kind == ValueKind::kBlob; }

        void FillInfo(EntryInfo *info) const;

        std::string Encode() const;
        static Status Decode(std::string_view input, Row *row);
    };
}

#endif
