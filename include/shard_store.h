#ifndef SHARDCACHE_SHARD_STORE_H
#define SHARDCACHE_SHARD_STORE_H

#include "blob_store.h"
#include "entry.h"
#include "options.h"
#include "retry.h"
#include "row.h"
#include "status.h"
#include "rocksdb/db.h"
#include "rocksdb/write_batch.h"

#include <atomic>
#include <functional>
#include <istream>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace ShardCache
{
    // ShardStore is one partition of the cache: a RocksDB database holding
    // entry rows and secondary indexes, plus a BlobStore for large values.
    //
    // Every operation is one short transaction: the shard lock is tried
    // without blocking, rows are read, and all changes are committed with a
    // single WriteBatch. A locked shard makes the attempt report Busy and the
    // RetryPolicy decides whether to try again. Blob files are written before
    // the transaction and removed after it, so the lock is never held across
    // large IO.
    class ShardStore
    {
    public:
        // Number of rows removed per transaction by bulk operations.
        static constexpr size_t kBatchSize = 100;

        ShardStore(std::string dir, int index, const Options &options);
        ShardStore(const ShardStore &other) = delete;
        ShardStore &operator=(const ShardStore &other) = delete;
        ~ShardStore();

        static rocksdb::Options default_rocksdb_options();

        Status Open();
        // Release process-local handles. Idempotent.
        void Close();

        Status Add(std::string_view key, const Value &value, const PutOptions &options, bool *added);
        Status Add(std::string_view key, std::istream &in, const PutOptions &options, bool *added);
        // *written, when given, is true once the row is committed.
        Status Set(std::string_view key, const Value &value, const PutOptions &options, bool *written = nullptr);
        Status Set(std::string_view key, std::istream &in, const PutOptions &options, bool *written = nullptr);
        Status Get(std::string_view key, Value *value, const GetOptions &options);
        Status Read(std::string_view key, std::unique_ptr<ReadStream> *stream, const GetOptions &options);
        Status Pop(std::string_view key, Value *value, const GetOptions &options);
        Status Delete(std::string_view key, bool retry, bool *deleted);
        Status Incr(std::string_view key, int64_t delta, std::optional<int64_t> default_value, bool retry, int64_t *result);
        Status Touch(std::string_view key, std::optional<double> ttl, bool retry, bool *touched);
        Status Contains(std::string_view key, bool *found);

        // Remove entries whose expire time is at or before now_us.
        Status Expire(int64_t now_us, bool retry, uint64_t *count);
        Status Evict(std::string_view tag, bool retry, uint64_t *count);
        Status Clear(bool retry, uint64_t *count);
        Status Count(uint64_t *count);

        Status CreateTagIndex(bool retry);
        Status DropTagIndex(bool retry);
        Status HasTagIndex(bool *exists);

        CacheStats Stats(bool reset);

        int index() const { return index_; }
        const std::string &dir() const { return dir_; }
        BlobStore &blobs() { return *blobs_; }

    private:
        // A row being written together with the blob it may own.
        struct PendingRow
        {
            Row row;
            bool owns_blob = false;
        };

        std::string dir_;
        std::string db_path_;
        int index_;
        Options options_;
        RetryPolicy retry_;
        rocksdb::WriteOptions write_options_;
        std::shared_ptr<BlobStore> blobs_;

        std::mutex mutex_;
        // Open for the lifetime of the store in exclusive mode, otherwise
        // only during a transaction.
        rocksdb::DB *db_ = nullptr;    // GUARDED_BY(mutex_)
        bool tag_index_ = false;       // GUARDED_BY(mutex_)
        std::atomic_bool closed_;

        std::atomic<uint64_t> hits_;
        std::atomic<uint64_t> misses_;

        template <typename F>
        Status transact(bool retry, F &&body);
        Status open_db(rocksdb::DB **db);
        Status close_db(rocksdb::DB *db);
        Status check_meta(rocksdb::DB *db);

        Status read_row(rocksdb::DB *db, std::string_view key, Row *row, bool *found);
        // read_row that treats an expired entry as absent and removes it.
        Status lookup(rocksdb::DB *db, std::string_view key, Row *row, bool *found);
        Status commit(rocksdb::DB *db, rocksdb::WriteBatch *batch, const std::vector<std::string> &dead_blobs);
        Status stage_put(rocksdb::WriteBatch *batch, std::string_view key, const Row &row);
        // Blob names the row owns are appended to dead_blobs when it is not null.
        Status stage_delete(rocksdb::WriteBatch *batch, std::string_view key, const Row &row, std::vector<std::string> *dead_blobs);

        Status prepare(const Value &value, const PutOptions &options, PendingRow *pending);
        Status prepare(std::istream &in, const PutOptions &options, PendingRow *pending);
        Status put(std::string_view key, PendingRow &pending, bool retry, bool only_if_absent, bool *written);
        Status materialize(const Row &row, Value *value, std::unique_ptr<ReadStream> *blob);
        Status read_blob(Status status, std::unique_ptr<ReadStream> &blob, Value *value);
        Status finish_read(Status status, const GetOptions &options, Value *value);
        Status remove_batch(rocksdb::DB *db, const std::vector<std::string> &keys, uint64_t *removed);
        Status for_each_prefix(rocksdb::DB *db, const std::string &prefix, const std::string &start,
                               const std::function<bool(const rocksdb::Slice &key, const rocksdb::Slice &value)> &func);
        void record(bool hit);
    };
}

#endif
