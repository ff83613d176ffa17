#ifndef SHARDCACHE_ENTRY_H
#define SHARDCACHE_ENTRY_H

#include <cstdint>
#include <optional>
#include <string>
#include <variant>

namespace ShardCache
{
    // A cached value: integer, real or bytes. Only integers can be
    // incremented.
    using Value = std::variant<int64_t, double, std::string>;

    inline bool is_integer(const Value &value) { return std::holds_alternative<int64_t>(value); }
    inline bool is_bytes(const Value &value) { return std::holds_alternative<std::string>(value); }

    // Metadata of an entry, filled on request by reads.
    struct EntryInfo
    {
        // Seconds since the Unix epoch, empty when the entry never expires.
        std::optional<double> expire_time;
        std::optional<std::string> tag;
        uint64_t size = 0;
    };

    struct PutOptions
    {
        // Seconds until the entry expires. Empty means never; 0 or less
        // produces an entry that is already expired.
        std::optional<double> ttl;
        std::optional<std::string> tag;
        // Retry lock contention until Options::timeout elapses.
        bool retry = true;
    };

    struct GetOptions
    {
        // Returned with an OK status when the key is missing or expired.
        // Without it a missing key reports NotFound.
        std::optional<Value> default_value;
        // Receives expire_time, tag and size of the entry that was found.
        EntryInfo *info = nullptr;
        bool retry = false;
    };

    struct CacheStats
    {
        uint64_t hits = 0;
        uint64_t misses = 0;
    };
}

#endif
