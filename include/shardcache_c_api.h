#ifndef SHARDCACHE_C_API_H
#define SHARDCACHE_C_API_H

#ifdef __cplusplus
extern "C" {
#endif

#include <stdbool.h>
#include <stddef.h>
#include <stdint.h>

typedef struct shardcache_t shardcache_t;
typedef struct shardcache_options_t shardcache_options_t;
typedef struct shardcache_stream_t shardcache_stream_t;

// Return codes. KeyNotFound and Timeout are the only errors a host needs to
// tell apart; everything else is SHARDCACHE_ERROR with a message in errptr.
#define SHARDCACHE_OK 0
#define SHARDCACHE_NOT_FOUND 1
#define SHARDCACHE_TIMEOUT 2
#define SHARDCACHE_CLOSED 3
#define SHARDCACHE_ERROR -1

// Options API
shardcache_options_t* shardcache_options_create();
void shardcache_options_destroy(shardcache_options_t* options);
void shardcache_options_set_shard_count(shardcache_options_t* options, int shard_count);
void shardcache_options_set_timeout(shardcache_options_t* options, double timeout);
void shardcache_options_set_tag_index(shardcache_options_t* options, bool tag_index);
void shardcache_options_set_inline_size_threshold(shardcache_options_t* options, size_t threshold);
void shardcache_options_set_exclusive(shardcache_options_t* options, bool exclusive);

// Cache API
shardcache_t* shardcache_open(const char* path, const shardcache_options_t* options, char** errptr);
void shardcache_close(shardcache_t* cache);
void shardcache_destroy(shardcache_t* cache);

// ttl may be NULL for entries that never expire; tag may be NULL.
int shardcache_set(shardcache_t* cache, const char* key, size_t key_len, const char* value, size_t value_len,
                   const double* ttl, const char* tag, char** errptr);
int shardcache_add(shardcache_t* cache, const char* key, size_t key_len, const char* value, size_t value_len,
                   const double* ttl, const char* tag, bool* added, char** errptr);
// Numbers are returned in decimal text form. When value_buf is too small the
// call fails and *value_len holds the required size.
int shardcache_get(shardcache_t* cache, const char* key, size_t key_len, char* value_buf, size_t buf_len,
                   size_t* value_len, char** errptr);
// default_value, when not NULL, is returned for a missing or expired key.
int shardcache_get_with_default(shardcache_t* cache, const char* key, size_t key_len, const char* default_value,
                                size_t default_len, char* value_buf, size_t buf_len, size_t* value_len,
                                char** errptr);
// The entry is removed even when value_buf turns out to be too small.
int shardcache_pop(shardcache_t* cache, const char* key, size_t key_len, char* value_buf, size_t buf_len,
                   size_t* value_len, char** errptr);
int shardcache_delete(shardcache_t* cache, const char* key, size_t key_len, bool* deleted, char** errptr);
// default_value may be NULL.
int shardcache_incr(shardcache_t* cache, const char* key, size_t key_len, int64_t delta, const int64_t* default_value,
                    int64_t* result, char** errptr);
int shardcache_decr(shardcache_t* cache, const char* key, size_t key_len, int64_t delta, const int64_t* default_value,
                    int64_t* result, char** errptr);
// ttl may be NULL to make the entry never expire.
int shardcache_touch(shardcache_t* cache, const char* key, size_t key_len, const double* ttl, bool* touched,
                     char** errptr);
int shardcache_contains(shardcache_t* cache, const char* key, size_t key_len, bool* found, char** errptr);

// Stream API. A stream keeps reading the value it was opened on, even after
// the key is overwritten or deleted. *nread is 0 at the end of the value.
int shardcache_open_stream(shardcache_t* cache, const char* key, size_t key_len, shardcache_stream_t** stream,
                           char** errptr);
uint64_t shardcache_stream_size(const shardcache_stream_t* stream);
int shardcache_stream_read(shardcache_stream_t* stream, char* buf, size_t buf_len, size_t* nread, char** errptr);
void shardcache_stream_destroy(shardcache_stream_t* stream);

int shardcache_expire(shardcache_t* cache, uint64_t* count, char** errptr);
int shardcache_evict(shardcache_t* cache, const char* tag, uint64_t* count, char** errptr);
int shardcache_clear(shardcache_t* cache, uint64_t* count, char** errptr);
int shardcache_count(shardcache_t* cache, uint64_t* count, char** errptr);
int shardcache_create_tag_index(shardcache_t* cache, char** errptr);
int shardcache_drop_tag_index(shardcache_t* cache, char** errptr);

#ifdef __cplusplus
}
#endif

#endif // SHARDCACHE_C_API_H
