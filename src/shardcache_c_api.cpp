#include "shardcache_c_api.h"
#include "shardcache.h"
#include "log.h"
#include <string.h>
#include <memory>

namespace {

int to_code(const ShardCache::Status& status, char** errptr) {
    if (status.ok()) {
        return SHARDCACHE_OK;
    }
    if (errptr) *errptr = strdup(status.ToString().c_str());
    switch (status.code()) {
    case ShardCache::kNotFound: return SHARDCACHE_NOT_FOUND;
    case ShardCache::kTimeout: return SHARDCACHE_TIMEOUT;
    case ShardCache::kClosed: return SHARDCACHE_CLOSED;
    default: return SHARDCACHE_ERROR;
    }
}

int from_exception(const std::exception& e, char** errptr) {
    if (errptr) *errptr = strdup(e.what());
    return SHARDCACHE_ERROR;
}

ShardCache::PutOptions put_options(const double* ttl, const char* tag) {
    ShardCache::PutOptions options;
    if (ttl) options.ttl = *ttl;
    if (tag) options.tag = std::string(tag);
    return options;
}

// Numbers are copied in decimal text form.
int copy_value(const ShardCache::Value& value, char* value_buf, size_t buf_len, size_t* value_len, char** errptr) {
    std::string bytes;
    if (auto integer = std::get_if<int64_t>(&value)) {
        bytes = std::to_string(*integer);
    } else if (auto real = std::get_if<double>(&value)) {
        bytes = fmt::format("{}", *real);
    } else {
        bytes = std::get<std::string>(value);
    }
    *value_len = bytes.size();
    if (bytes.size() > buf_len) {
        if (errptr) *errptr = strdup("Buffer is too small");
        return SHARDCACHE_ERROR;
    }
    memcpy(value_buf, bytes.data(), bytes.size());
    return SHARDCACHE_OK;
}

} // namespace

extern "C" {

struct shardcache_t {
    std::unique_ptr<ShardCache::ShardRouter> router;
};

struct shardcache_options_t {
    ShardCache::Options options;
};

struct shardcache_stream_t {
    std::unique_ptr<ShardCache::ReadStream> stream;
};

shardcache_options_t* shardcache_options_create() {
    auto options = new shardcache_options_t();
    options->options = ShardCache::Options::FromEnv();
    return options;
}

void shardcache_options_destroy(shardcache_options_t* options) {
    delete options;
}

void shardcache_options_set_shard_count(shardcache_options_t* options, int shard_count) {
    options->options.shard_count = shard_count;
}

void shardcache_options_set_timeout(shardcache_options_t* options, double timeout) {
    options->options.timeout = timeout;
}

void shardcache_options_set_tag_index(shardcache_options_t* options, bool tag_index) {
    options->options.tag_index = tag_index;
}

void shardcache_options_set_inline_size_threshold(shardcache_options_t* options, size_t threshold) {
    options->options.inline_size_threshold = threshold;
}

void shardcache_options_set_exclusive(shardcache_options_t* options, bool exclusive) {
    options->options.exclusive = exclusive;
}

shardcache_t* shardcache_open(const char* path, const shardcache_options_t* options, char** errptr) {
    try {
        auto cache = std::make_unique<shardcache_t>();
        auto status = ShardCache::ShardRouter::Open(path, options->options, &cache->router);
        if (!status.ok()) {
            to_code(status, errptr);
            return nullptr;
        }
        return cache.release();
    } catch (const std::exception& e) {
        from_exception(e, errptr);
        return nullptr;
    }
}

void shardcache_close(shardcache_t* cache) {
    cache->router->Close();
}

void shardcache_destroy(shardcache_t* cache) {
    delete cache;
}

int shardcache_set(shardcache_t* cache, const char* key, size_t key_len, const char* value, size_t value_len,
                   const double* ttl, const char* tag, char** errptr) {
    try {
        auto status = cache->router->Set(std::string_view(key, key_len),
                                         ShardCache::Value(std::string(value, value_len)),
                                         put_options(ttl, tag));
        return to_code(status, errptr);
    } catch (const std::exception& e) {
        return from_exception(e, errptr);
    }
}

int shardcache_add(shardcache_t* cache, const char* key, size_t key_len, const char* value, size_t value_len,
                   const double* ttl, const char* tag, bool* added, char** errptr) {
    try {
        auto status = cache->router->Add(std::string_view(key, key_len),
                                         ShardCache::Value(std::string(value, value_len)),
                                         put_options(ttl, tag), added);
        return to_code(status, errptr);
    } catch (const std::exception& e) {
        return from_exception(e, errptr);
    }
}

int shardcache_get(shardcache_t* cache, const char* key, size_t key_len, char* value_buf, size_t buf_len,
                   size_t* value_len, char** errptr) {
    return shardcache_get_with_default(cache, key, key_len, nullptr, 0, value_buf, buf_len, value_len, errptr);
}

int shardcache_get_with_default(shardcache_t* cache, const char* key, size_t key_len, const char* default_value,
                                size_t default_len, char* value_buf, size_t buf_len, size_t* value_len,
                                char** errptr) {
    try {
        ShardCache::GetOptions options;
        if (default_value) options.default_value = ShardCache::Value(std::string(default_value, default_len));
        ShardCache::Value value;
        auto status = cache->router->Get(std::string_view(key, key_len), &value, options);
        if (!status.ok()) {
            return to_code(status, errptr);
        }
        return copy_value(value, value_buf, buf_len, value_len, errptr);
    } catch (const std::exception& e) {
        return from_exception(e, errptr);
    }
}

int shardcache_pop(shardcache_t* cache, const char* key, size_t key_len, char* value_buf, size_t buf_len,
                   size_t* value_len, char** errptr) {
    try {
        ShardCache::Value value;
        auto status = cache->router->Pop(std::string_view(key, key_len), &value);
        if (!status.ok()) {
            return to_code(status, errptr);
        }
        return copy_value(value, value_buf, buf_len, value_len, errptr);
    } catch (const std::exception& e) {
        return from_exception(e, errptr);
    }
}

int shardcache_delete(shardcache_t* cache, const char* key, size_t key_len, bool* deleted, char** errptr) {
    try {
        return to_code(cache->router->Delete(std::string_view(key, key_len), true, deleted), errptr);
    } catch (const std::exception& e) {
        return from_exception(e, errptr);
    }
}

int shardcache_incr(shardcache_t* cache, const char* key, size_t key_len, int64_t delta, const int64_t* default_value,
                    int64_t* result, char** errptr) {
    try {
        std::optional<int64_t> seed;
        if (default_value) seed = *default_value;
        return to_code(cache->router->Incr(std::string_view(key, key_len), delta, seed, result), errptr);
    } catch (const std::exception& e) {
        return from_exception(e, errptr);
    }
}

int shardcache_decr(shardcache_t* cache, const char* key, size_t key_len, int64_t delta, const int64_t* default_value,
                    int64_t* result, char** errptr) {
    try {
        std::optional<int64_t> seed;
        if (default_value) seed = *default_value;
        return to_code(cache->router->Decr(std::string_view(key, key_len), delta, seed, result), errptr);
    } catch (const std::exception& e) {
        return from_exception(e, errptr);
    }
}

int shardcache_touch(shardcache_t* cache, const char* key, size_t key_len, const double* ttl, bool* touched,
                     char** errptr) {
    try {
        std::optional<double> expire;
        if (ttl) expire = *ttl;
        return to_code(cache->router->Touch(std::string_view(key, key_len), expire, touched), errptr);
    } catch (const std::exception& e) {
        return from_exception(e, errptr);
    }
}

int shardcache_contains(shardcache_t* cache, const char* key, size_t key_len, bool* found, char** errptr) {
    try {
        return to_code(cache->router->Contains(std::string_view(key, key_len), found), errptr);
    } catch (const std::exception& e) {
        return from_exception(e, errptr);
    }
}

int shardcache_open_stream(shardcache_t* cache, const char* key, size_t key_len, shardcache_stream_t** stream,
                           char** errptr) {
    try {
        auto result = std::make_unique<shardcache_stream_t>();
        auto status = cache->router->OpenStream(std::string_view(key, key_len), &result->stream);
        if (!status.ok()) {
            return to_code(status, errptr);
        }
        *stream = result.release();
        return SHARDCACHE_OK;
    } catch (const std::exception& e) {
        return from_exception(e, errptr);
    }
}

uint64_t shardcache_stream_size(const shardcache_stream_t* stream) {
    return stream->stream->Size();
}

int shardcache_stream_read(shardcache_stream_t* stream, char* buf, size_t buf_len, size_t* nread, char** errptr) {
    try {
        return to_code(stream->stream->Read(buf, buf_len, nread), errptr);
    } catch (const std::exception& e) {
        return from_exception(e, errptr);
    }
}

void shardcache_stream_destroy(shardcache_stream_t* stream) {
    delete stream;
}

int shardcache_expire(shardcache_t* cache, uint64_t* count, char** errptr) {
    try {
        return to_code(cache->router->Expire(count), errptr);
    } catch (const std::exception& e) {
        return from_exception(e, errptr);
    }
}

int shardcache_evict(shardcache_t* cache, const char* tag, uint64_t* count, char** errptr) {
    try {
        if (!tag) {
            *count = 0;
            if (errptr) *errptr = strdup("tag must not be NULL");
            return SHARDCACHE_ERROR;
        }
        return to_code(cache->router->Evict(tag, count), errptr);
    } catch (const std::exception& e) {
        return from_exception(e, errptr);
    }
}

int shardcache_clear(shardcache_t* cache, uint64_t* count, char** errptr) {
    try {
        return to_code(cache->router->Clear(count), errptr);
    } catch (const std::exception& e) {
        return from_exception(e, errptr);
    }
}

int shardcache_count(shardcache_t* cache, uint64_t* count, char** errptr) {
    try {
        return to_code(cache->router->Count(count), errptr);
    } catch (const std::exception& e) {
        return from_exception(e, errptr);
    }
}

int shardcache_create_tag_index(shardcache_t* cache, char** errptr) {
    try {
        return to_code(cache->router->CreateTagIndex(), errptr);
    } catch (const std::exception& e) {
        return from_exception(e, errptr);
    }
}

int shardcache_drop_tag_index(shardcache_t* cache, char** errptr) {
    try {
        return to_code(cache->router->DropTagIndex(), errptr);
    } catch (const std::exception& e) {
        return from_exception(e, errptr);
    }
}

} // extern "C"
