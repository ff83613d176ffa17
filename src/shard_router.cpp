#include "shard_router.h"
#include "log.h"

#include <openssl/evp.h>
#include <filesystem>
#include <limits>
#include <stdexcept>
#include <system_error>

namespace ShardCache
{
    ShardRouter::ShardRouter(std::string path, const Options &options)
        : path_(std::move(path)), options_(options), closed_(false)
    {
    }

    ShardRouter::~ShardRouter()
    {
        Close();
    }

    Status ShardRouter::Open(const std::string &path, const Options &options, std::unique_ptr<ShardRouter> *router)
    {
        auto status = options.Validate();
        if (!status.ok())
        {
            return status;
        }
        std::error_code ec;
        std::filesystem::create_directories(path, ec);
        if (ec)
        {
            return Status::IOError(fmt::format("create {}: {}", path, ec.message()));
        }

        std::unique_ptr<ShardRouter> result(new ShardRouter(path, options));
        for (int i = 0; i < options.shard_count; i++)
        {
            auto shard = std::make_unique<ShardStore>(fmt::format("{}/{:03d}", path, i), i, options);
            status = shard->Open();
            if (!status.ok())
            {
                Logger()->error("failed to open shard {} of {}: {}", i, path, status.ToString());
                return status;
            }
            result->shards_.push_back(std::move(shard));
        }
        Logger()->info("opened cache {} with {} shards", path, options.shard_count);
        *router = std::move(result);
        return Status::OK();
    }

    void ShardRouter::Close()
    {
        if (closed_.exchange(true))
        {
            return;
        }
        for (auto &shard : shards_)
        {
            shard->Close();
        }
        Logger()->info("closed cache {}", path_);
    }

    Status ShardRouter::check_open() const
    {
        if (closed_)
        {
            return Status::Closed("cache is closed");
        }
        return Status::OK();
    }

    Digest ShardRouter::make_digest(std::string_view key)
    {
        Digest digest;
        EVP_MD_CTX *ctx = EVP_MD_CTX_new();

        if (!ctx)
        {
            throw std::runtime_error("Failed to allocate EVP_MD_CTX");
        }

        if (1 != EVP_DigestInit_ex(ctx, EVP_sha1(), nullptr))
        {
            EVP_MD_CTX_free(ctx);
            throw std::runtime_error("SHA-1 initialization failed");
        }

        if (1 != EVP_DigestUpdate(ctx, key.data(), key.size()))
        {
            EVP_MD_CTX_free(ctx);
            throw std::runtime_error("SHA-1 update failed");
        }

        unsigned int digest_len = 0;
        if (1 != EVP_DigestFinal_ex(ctx, digest.data(), &digest_len))
        {
            EVP_MD_CTX_free(ctx);
            throw std::runtime_error("SHA-1 finalization failed");
        }

        EVP_MD_CTX_free(ctx);

        return digest;
    }

    // First eight digest bytes, big endian, modulo the shard count. Stable
    // across processes and platforms, unlike std::hash.
    size_t ShardRouter::ShardIndex(std::string_view key) const
    {
        auto digest = make_digest(key);
        uint64_t hash = 0;
        for (int i = 0; i < 8; i++)
        {
            hash = (hash << 8) | digest[i];
        }
        return hash % static_cast<uint64_t>(options_.shard_count);
    }

    template <typename F>
    Status ShardRouter::for_each_shard(F &&func)
    {
        for (auto &shard : shards_)
        {
            auto status = check_open();
            if (status.ok())
            {
                status = func(*shard);
            }
            if (!status.ok())
            {
                return status;
            }
        }
        return Status::OK();
    }

    Status ShardRouter::Add(std::string_view key, const Value &value, const PutOptions &options, bool *added)
    {
        *added = false;
        auto status = check_open();
        if (!status.ok())
        {
            return status;
        }
        return route(key).Add(key, value, options, added);
    }

    Status ShardRouter::Add(std::string_view key, std::istream &in, const PutOptions &options, bool *added)
    {
        *added = false;
        auto status = check_open();
        if (!status.ok())
        {
            return status;
        }
        return route(key).Add(key, in, options, added);
    }

    Status ShardRouter::Set(std::string_view key, const Value &value, const PutOptions &options, bool *written)
    {
        if (written)
        {
            *written = false;
        }
        auto status = check_open();
        if (!status.ok())
        {
            return status;
        }
        return route(key).Set(key, value, options, written);
    }

    Status ShardRouter::Set(std::string_view key, std::istream &in, const PutOptions &options, bool *written)
    {
        if (written)
        {
            *written = false;
        }
        auto status = check_open();
        if (!status.ok())
        {
            return status;
        }
        return route(key).Set(key, in, options, written);
    }

    Status ShardRouter::Get(std::string_view key, Value *value, const GetOptions &options)
    {
        auto status = check_open();
        if (!status.ok())
        {
            return status;
        }
        return route(key).Get(key, value, options);
    }

    Status ShardRouter::Get(std::string_view key, std::unique_ptr<ReadStream> *stream, const GetOptions &options)
    {
        auto status = check_open();
        if (!status.ok())
        {
            return status;
        }
        return route(key).Read(key, stream, options);
    }

    Status ShardRouter::OpenStream(std::string_view key, std::unique_ptr<ReadStream> *stream)
    {
        GetOptions options;
        options.retry = true;
        return Get(key, stream, options);
    }

    Status ShardRouter::Pop(std::string_view key, Value *value, const GetOptions &options)
    {
        auto status = check_open();
        if (!status.ok())
        {
            return status;
        }
        return route(key).Pop(key, value, options);
    }

    Status ShardRouter::Delete(std::string_view key, bool retry, bool *deleted)
    {
        bool ignored = false;
        if (!deleted)
        {
            deleted = &ignored;
        }
        *deleted = false;
        auto status = check_open();
        if (!status.ok())
        {
            return status;
        }
        return route(key).Delete(key, retry, deleted);
    }

    Status ShardRouter::Incr(std::string_view key, int64_t delta, std::optional<int64_t> default_value, int64_t *result, bool retry)
    {
        auto status = check_open();
        if (!status.ok())
        {
            return status;
        }
        return route(key).Incr(key, delta, default_value, retry, result);
    }

    Status ShardRouter::Decr(std::string_view key, int64_t delta, std::optional<int64_t> default_value, int64_t *result, bool retry)
    {
        auto status = check_open();
        if (!status.ok())
        {
            return status;
        }
        if (delta == std::numeric_limits<int64_t>::min())
        {
            return Status::InvalidArgument("delta cannot be negated");
        }
        return Incr(key, -delta, default_value, result, retry);
    }

    Status ShardRouter::Touch(std::string_view key, std::optional<double> ttl, bool *touched, bool retry)
    {
        *touched = false;
        auto status = check_open();
        if (!status.ok())
        {
            return status;
        }
        return route(key).Touch(key, ttl, retry, touched);
    }

    Status ShardRouter::Contains(std::string_view key, bool *found)
    {
        *found = false;
        auto status = check_open();
        if (!status.ok())
        {
            return status;
        }
        return route(key).Contains(key, found);
    }

    // One cut-off for every shard, so entries that expire during the sweep
    // are left for the next one.
    Status ShardRouter::Expire(uint64_t *count)
    {
        *count = 0;
        int64_t now_us = now_micros();
        return for_each_shard([&](ShardStore &shard)
                              {
            uint64_t removed = 0;
            auto status = shard.Expire(now_us, true, &removed);
            *count += removed;
            return status; });
    }

    Status ShardRouter::Evict(std::string_view tag, uint64_t *count)
    {
        *count = 0;
        return for_each_shard([&](ShardStore &shard)
                              {
            uint64_t removed = 0;
            auto status = shard.Evict(tag, true, &removed);
            *count += removed;
            return status; });
    }

    Status ShardRouter::Clear(uint64_t *count)
    {
        *count = 0;
        return for_each_shard([&](ShardStore &shard)
                              {
            uint64_t removed = 0;
            auto status = shard.Clear(true, &removed);
            *count += removed;
            return status; });
    }

    Status ShardRouter::Count(uint64_t *count)
    {
        *count = 0;
        return for_each_shard([&](ShardStore &shard)
                              {
            uint64_t live = 0;
            auto status = shard.Count(&live);
            *count += live;
            return status; });
    }

    Status ShardRouter::CreateTagIndex()
    {
        return for_each_shard([](ShardStore &shard)
                              { return shard.CreateTagIndex(true); });
    }

    Status ShardRouter::DropTagIndex()
    {
        return for_each_shard([](ShardStore &shard)
                              { return shard.DropTagIndex(true); });
    }

    Status ShardRouter::Stats(bool reset, CacheStats *stats)
    {
        *stats = CacheStats();
        return for_each_shard([&](ShardStore &shard)
                              {
            auto shard_stats = shard.Stats(reset);
            stats->hits += shard_stats.hits;
            stats->misses += shard_stats.misses;
            return Status::OK(); });
    }
} // namespace ShardCache
