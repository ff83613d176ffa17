#include "options.h"
#include "log.h"

#include <cstdlib>
#include <string>
#include <stdexcept>

namespace ShardCache
{
    namespace
    {
        template <typename T, typename Parse>
        void overlay(const char *name, T *field, Parse &&parse)
        {
            const char *raw = std::getenv(name);
            if (raw == nullptr || *raw == '\0')
            {
                return;
            }
            try
            {
                *field = parse(std::string(raw));
            }
            catch (const std::exception &e)
            {
                Logger()->warn("ignoring {}={}: {}", name, raw, e.what());
            }
        }

        bool parse_bool(const std::string &value)
        {
            if (value == "1" || value == "true" || value == "on")
            {
                return true;
            }
            if (value == "0" || value == "false" || value == "off")
            {
                return false;
            }
            throw std::invalid_argument("not a boolean");
        }
    }

    Options Options::FromEnv(const Options &base)
    {
        Options options = base;
        overlay("SHARDCACHE_SHARDS", &options.shard_count, [](const std::string &v)
                { return std::stoi(v); });
        overlay("SHARDCACHE_TIMEOUT", &options.timeout, [](const std::string &v)
                { return std::stod(v); });
        overlay("SHARDCACHE_TAG_INDEX", &options.tag_index, parse_bool);
        overlay("SHARDCACHE_INLINE_SIZE_THRESHOLD", &options.inline_size_threshold, [](const std::string &v)
                { return static_cast<size_t>(std::stoull(v)); });
        overlay("SHARDCACHE_EXCLUSIVE", &options.exclusive, parse_bool);
        return options;
    }

    Status Options::Validate() const
    {
        if (shard_count < 1)
        {
            return Status::InvalidArgument(fmt::format("shard_count must be at least 1, got {}", shard_count));
        }
        if (!(timeout >= 0) || !(timeout <= kMaxTimeout))
        {
            return Status::InvalidArgument(fmt::format("timeout must be between 0 and {} seconds, got {}", kMaxTimeout, timeout));
        }
        return Status::OK();
    }
}
