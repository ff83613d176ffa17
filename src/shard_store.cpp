#include "shard_store.h"
#include "log.h"

#include <rocksdb/iterator.h>

#include <cmath>

namespace ShardCache
{
    namespace
    {
        Status from_rocksdb(const rocksdb::Status &status, const std::string &what)
        {
            if (status.ok())
            {
                return Status::OK();
            }
            if (status.IsCorruption())
            {
                return Status::Corruption(what + ": " + status.ToString());
            }
            return Status::IOError(what + ": " + status.ToString());
        }

        std::string_view suffix(const rocksdb::Slice &key, size_t prefix_len)
        {
            return std::string_view(key.data() + prefix_len, key.size() - prefix_len);
        }

        Status check_ttl(const std::optional<double> &ttl)
        {
            if (ttl && !std::isfinite(*ttl))
            {
                return Status::InvalidArgument(fmt::format("ttl must be finite, got {}", *ttl));
            }
            return Status::OK();
        }
    }

    rocksdb::Options ShardStore::default_rocksdb_options()
    {
        rocksdb::Options options;
        options.create_if_missing = true;
        options.compression = rocksdb::kNoCompression;
        options.write_buffer_size = 4 << 20;
        options.info_log_level = rocksdb::InfoLogLevel::WARN_LEVEL;
        options.keep_log_file_num = 2;
        return options;
    }

    ShardStore::ShardStore(std::string dir, int index, const Options &options)
        : dir_(std::move(dir)), index_(index), options_(options), retry_(options.timeout),
          closed_(false), hits_(0), misses_(0)
    {
        db_path_ = dir_ + "/db";
        blobs_ = std::make_shared<BlobStore>(dir_ + "/blobs");
        write_options_.sync = options_.sync_writes;
    }

    ShardStore::~ShardStore()
    {
        Close();
    }

    template <typename F>
    Status ShardStore::transact(bool retry, F &&body)
    {
        auto status = retry_.Run(retry, [&]() -> Status
                                 {
            if (closed_)
            {
                return Status::Closed(fmt::format("shard {} is closed", index_));
            }
            std::unique_lock<std::mutex> lock(mutex_, std::try_to_lock);
            if (!lock.owns_lock())
            {
                return Status::Busy(fmt::format("shard {} is locked", index_));
            }
            if (closed_)
            {
                return Status::Closed(fmt::format("shard {} is closed", index_));
            }
            if (options_.exclusive)
            {
                if (!db_)
                {
                    return Status::IOError(fmt::format("shard {} is not open", index_));
                }
                return body(db_);
            }
            rocksdb::DB *db = nullptr;
            auto status = open_db(&db);
            if (!status.ok())
            {
                return status;
            }
            status = body(db);
            auto close_status = close_db(db);
            if (!close_status.ok())
            {
                Logger()->error("shard {}: {}", index_, close_status.ToString());
            }
            return status; });
        if (status.timeout())
        {
            Logger()->warn("shard {}: gave up after {} ms: {}", index_,
                           std::chrono::duration_cast<std::chrono::milliseconds>(retry_.budget()).count(), status.msg());
        }
        else if (status.io_error() || status.corruption())
        {
            Logger()->error("shard {}: {}", index_, status.ToString());
        }
        return status;
    }

    // Another handle holding the database makes Open fail with an IO error
    // about the LOCK file; that is contention, not failure.
    Status ShardStore::open_db(rocksdb::DB **db)
    {
        rocksdb::DB *raw = nullptr;
        rocksdb::Status s = rocksdb::DB::Open(default_rocksdb_options(), db_path_, &raw);
        if (!s.ok())
        {
            if (s.IsIOError() && s.ToString().find("lock") != std::string::npos)
            {
                return Status::Busy(fmt::format("shard {} database is held by another handle", index_));
            }
            return from_rocksdb(s, "open " + db_path_);
        }
        auto status = check_meta(raw);
        if (!status.ok())
        {
            delete raw;
            return status;
        }
        *db = raw;
        return Status::OK();
    }

    Status ShardStore::close_db(rocksdb::DB *db)
    {
        rocksdb::Status s = db->Close();
        delete db;
        return from_rocksdb(s, "close " + db_path_);
    }

    Status ShardStore::check_meta(rocksdb::DB *db)
    {
        rocksdb::ReadOptions read_options;
        std::string value;
        rocksdb::Status s = db->Get(read_options, kShardCountKey, &value);
        if (s.IsNotFound())
        {
            rocksdb::WriteBatch batch;
            s = batch.Put(kShardIndexKey, std::to_string(index_));
            if (s.ok())
            {
                s = batch.Put(kShardCountKey, std::to_string(options_.shard_count));
            }
            if (s.ok())
            {
                s = db->Write(write_options_, &batch);
            }
            if (!s.ok())
            {
                return from_rocksdb(s, "write shard metadata");
            }
        }
        else if (!s.ok())
        {
            return from_rocksdb(s, "read shard_count");
        }
        else
        {
            if (value != std::to_string(options_.shard_count))
            {
                return Status::InvalidArgument(fmt::format("cache was created with {} shards, opened with {}",
                                                           value, options_.shard_count));
            }
            s = db->Get(read_options, kShardIndexKey, &value);
            if (!s.ok() || value != std::to_string(index_))
            {
                return Status::Corruption(fmt::format("{} does not belong to shard {}", db_path_, index_));
            }
        }

        s = db->Get(read_options, kTagIndexKey, &value);
        if (!s.ok() && !s.IsNotFound())
        {
            return from_rocksdb(s, "read tag_index");
        }
        tag_index_ = s.ok();
        return Status::OK();
    }

    Status ShardStore::Open()
    {
        auto status = blobs_->Init();
        if (!status.ok())
        {
            return status;
        }
        if (options_.exclusive)
        {
            status = retry_.Run(true, [this]()
                                {
                std::lock_guard<std::mutex> lock(mutex_);
                return open_db(&db_); });
        }
        else
        {
            status = transact(true, [](rocksdb::DB *)
                              { return Status::OK(); });
        }
        if (!status.ok())
        {
            return status;
        }
        Logger()->debug("opened shard {} at {}", index_, dir_);
        if (options_.tag_index)
        {
            return CreateTagIndex(true);
        }
        return Status::OK();
    }

    void ShardStore::Close()
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (closed_.exchange(true))
        {
            return;
        }
        if (db_)
        {
            auto status = close_db(db_);
            db_ = nullptr;
            if (!status.ok())
            {
                Logger()->error("shard {}: {}", index_, status.ToString());
            }
        }
        Logger()->debug("closed shard {}", index_);
    }

    Status ShardStore::read_row(rocksdb::DB *db, std::string_view key, Row *row, bool *found)
    {
        std::string raw;
        rocksdb::Status s = db->Get(rocksdb::ReadOptions(), entry_key(key), &raw);
        if (s.IsNotFound())
        {
            *found = false;
            return Status::OK();
        }
        if (!s.ok())
        {
            return from_rocksdb(s, "read row");
        }
        *found = true;
        return Row::Decode(raw, row);
    }

    Status ShardStore::lookup(rocksdb::DB *db, std::string_view key, Row *row, bool *found)
    {
        auto status = read_row(db, key, row, found);
        if (!status.ok() || !*found || !row->expired(now_micros()))
        {
            return status;
        }
        *found = false;
        rocksdb::WriteBatch batch;
        std::vector<std::string> dead_blobs;
        status = stage_delete(&batch, key, *row, &dead_blobs);
        if (!status.ok())
        {
            return status;
        }
        return commit(db, &batch, dead_blobs);
    }

    Status ShardStore::commit(rocksdb::DB *db, rocksdb::WriteBatch *batch, const std::vector<std::string> &dead_blobs)
    {
        rocksdb::Status s = db->Write(write_options_, batch);
        if (!s.ok())
        {
            return from_rocksdb(s, "commit");
        }
        for (const auto &name : dead_blobs)
        {
            blobs_->Remove(name);
        }
        return Status::OK();
    }

    Status ShardStore::stage_put(rocksdb::WriteBatch *batch, std::string_view key, const Row &row)
    {
        rocksdb::Status s = batch->Put(entry_key(key), row.Encode());
        if (s.ok() && row.expire_us)
        {
            s = batch->Put(expiry_key(*row.expire_us, key), rocksdb::Slice());
        }
        if (s.ok() && row.tag && tag_index_)
        {
            s = batch->Put(tag_key(*row.tag, key), rocksdb::Slice());
        }
        return from_rocksdb(s, "stage put");
    }

    Status ShardStore::stage_delete(rocksdb::WriteBatch *batch, std::string_view key, const Row &row,
                                    std::vector<std::string> *dead_blobs)
    {
        rocksdb::Status s = batch->Delete(entry_key(key));
        if (s.ok() && row.expire_us)
        {
            s = batch->Delete(expiry_key(*row.expire_us, key));
        }
        if (s.ok() && row.tag && tag_index_)
        {
            s = batch->Delete(tag_key(*row.tag, key));
        }
        if (s.ok() && row.is_blob() && dead_blobs)
        {
            dead_blobs->push_back(row.data);
        }
        return from_rocksdb(s, "stage delete");
    }

    Status ShardStore::prepare(const Value &value, const PutOptions &options, PendingRow *pending)
    {
        auto ttl_status = check_ttl(options.ttl);
        if (!ttl_status.ok())
        {
            return ttl_status;
        }
        Row &row = pending->row;
        if (auto integer = std::get_if<int64_t>(&value))
        {
            row.kind = ValueKind::kInteger;
            row.integer = *integer;
            row.size = sizeof(int64_t);
        }
        else if (auto real = std::get_if<double>(&value))
        {
            row.kind = ValueKind::kReal;
            row.real = *real;
            row.size = sizeof(double);
        }
        else
        {
            const auto &bytes = std::get<std::string>(value);
            row.size = bytes.size();
            if (bytes.size() >= options_.inline_size_threshold)
            {
                auto status = blobs_->Write(bytes, &row.data);
                if (!status.ok())
                {
                    return status;
                }
                row.kind = ValueKind::kBlob;
                pending->owns_blob = true;
            }
            else
            {
                row.kind = ValueKind::kBytes;
                row.data = bytes;
            }
        }
        row.store_us = now_micros();
        if (options.ttl)
        {
            row.expire_us = expire_micros(*options.ttl, row.store_us);
        }
        row.tag = options.tag;
        return Status::OK();
    }

    Status ShardStore::prepare(std::istream &in, const PutOptions &options, PendingRow *pending)
    {
        auto status = check_ttl(options.ttl);
        if (!status.ok())
        {
            return status;
        }
        Row &row = pending->row;
        status = blobs_->Write(in, &row.data, &row.size);
        if (!status.ok())
        {
            return status;
        }
        row.kind = ValueKind::kBlob;
        pending->owns_blob = true;
        row.store_us = now_micros();
        if (options.ttl)
        {
            row.expire_us = expire_micros(*options.ttl, row.store_us);
        }
        row.tag = options.tag;
        return Status::OK();
    }

    // The blob of a row that was not committed is removed here, so a failed or
    // skipped write leaves no file behind.
    Status ShardStore::put(std::string_view key, PendingRow &pending, bool retry, bool only_if_absent, bool *written)
    {
        *written = false;
        auto status = transact(retry, [&](rocksdb::DB *db) -> Status
                               {
            Row old;
            bool found = false;
            auto status = read_row(db, key, &old, &found);
            if (!status.ok())
            {
                return status;
            }
            if (found && only_if_absent && !old.expired(now_micros()))
            {
                return Status::OK();
            }
            rocksdb::WriteBatch batch;
            std::vector<std::string> dead_blobs;
            if (found)
            {
                status = stage_delete(&batch, key, old, &dead_blobs);
                if (!status.ok())
                {
                    return status;
                }
            }
            status = stage_put(&batch, key, pending.row);
            if (!status.ok())
            {
                return status;
            }
            status = commit(db, &batch, dead_blobs);
            if (status.ok())
            {
                *written = true;
            }
            return status; });
        if (pending.owns_blob && !*written)
        {
            blobs_->Remove(pending.row.data);
        }
        return status;
    }

    Status ShardStore::Add(std::string_view key, const Value &value, const PutOptions &options, bool *added)
    {
        PendingRow pending;
        auto status = prepare(value, options, &pending);
        if (!status.ok())
        {
            return status;
        }
        return put(key, pending, options.retry, true, added);
    }

    Status ShardStore::Add(std::string_view key, std::istream &in, const PutOptions &options, bool *added)
    {
        PendingRow pending;
        auto status = prepare(in, options, &pending);
        if (!status.ok())
        {
            return status;
        }
        return put(key, pending, options.retry, true, added);
    }

    Status ShardStore::Set(std::string_view key, const Value &value, const PutOptions &options, bool *written)
    {
        bool ignored = false;
        if (!written)
        {
            written = &ignored;
        }
        *written = false;
        PendingRow pending;
        auto status = prepare(value, options, &pending);
        if (!status.ok())
        {
            return status;
        }
        return put(key, pending, options.retry, false, written);
    }

    Status ShardStore::Set(std::string_view key, std::istream &in, const PutOptions &options, bool *written)
    {
        bool ignored = false;
        if (!written)
        {
            written = &ignored;
        }
        *written = false;
        PendingRow pending;
        auto status = prepare(in, options, &pending);
        if (!status.ok())
        {
            return status;
        }
        return put(key, pending, options.retry, false, written);
    }

    // Blob values are only opened here. The caller reads them with
    // read_blob once the shard lock is released.
    Status ShardStore::materialize(const Row &row, Value *value, std::unique_ptr<ReadStream> *blob)
    {
        switch (row.kind)
        {
        case ValueKind::kInteger:
            *value = row.integer;
            return Status::OK();
        case ValueKind::kReal:
            *value = row.real;
            return Status::OK();
        case ValueKind::kBytes:
            *value = row.data;
            return Status::OK();
        case ValueKind::kBlob:
            return blobs_->Open(row.data, blob);
        }
        return Status::Corruption("unknown value kind");
    }

    Status ShardStore::read_blob(Status status, std::unique_ptr<ReadStream> &blob, Value *value)
    {
        if (!status.ok() || !blob)
        {
            return status;
        }
        std::string data;
        data.reserve(blob->Size());
        status = blob->ReadAll(&data);
        blob.reset();
        if (status.ok())
        {
            *value = std::move(data);
        }
        return status;
    }

    void ShardStore::record(bool hit)
    {
        if (!options_.statistics)
        {
            return;
        }
        if (hit)
        {
            hits_++;
        }
        else
        {
            misses_++;
        }
    }

    Status ShardStore::finish_read(Status status, const GetOptions &options, Value *value)
    {
        if (status.ok())
        {
            record(true);
            return status;
        }
        if (!status.not_found())
        {
            return status;
        }
        record(false);
        if (options.default_value)
        {
            *value = *options.default_value;
            return Status::OK();
        }
        return status;
    }

    Status ShardStore::Get(std::string_view key, Value *value, const GetOptions &options)
    {
        std::unique_ptr<ReadStream> blob;
        auto status = transact(options.retry, [&](rocksdb::DB *db) -> Status
                               {
            Row row;
            bool found = false;
            auto status = lookup(db, key, &row, &found);
            if (!status.ok())
            {
                return status;
            }
            if (!found)
            {
                return Status::NotFound("key not found");
            }
            status = materialize(row, value, &blob);
            if (status.ok() && options.info)
            {
                row.FillInfo(options.info);
            }
            return status; });
        return finish_read(read_blob(status, blob, value), options, value);
    }

    Status ShardStore::Read(std::string_view key, std::unique_ptr<ReadStream> *stream, const GetOptions &options)
    {
        auto status = transact(options.retry, [&](rocksdb::DB *db) -> Status
                               {
            Row row;
            bool found = false;
            auto status = lookup(db, key, &row, &found);
            if (!status.ok())
            {
                return status;
            }
            if (!found)
            {
                return Status::NotFound("key not found");
            }
            if (row.is_blob())
            {
                status = blobs_->Open(row.data, stream);
            }
            else if (row.kind == ValueKind::kBytes)
            {
                *stream = std::make_unique<MemoryReadStream>(row.data);
            }
            else
            {
                return Status::InvalidArgument("value is not bytes");
            }
            if (status.ok() && options.info)
            {
                row.FillInfo(options.info);
            }
            return status; });
        if (status.ok())
        {
            record(true);
            return status;
        }
        if (!status.not_found())
        {
            return status;
        }
        record(false);
        if (!options.default_value)
        {
            return status;
        }
        if (!is_bytes(*options.default_value))
        {
            return Status::InvalidArgument("default value is not bytes");
        }
        *stream = std::make_unique<MemoryReadStream>(std::get<std::string>(*options.default_value));
        return Status::OK();
    }

    // The open blob stream keeps the file until it has been read, even though
    // the row is already gone.
    Status ShardStore::Pop(std::string_view key, Value *value, const GetOptions &options)
    {
        std::unique_ptr<ReadStream> blob;
        auto status = transact(options.retry, [&](rocksdb::DB *db) -> Status
                               {
            Row row;
            bool found = false;
            auto status = lookup(db, key, &row, &found);
            if (!status.ok())
            {
                return status;
            }
            if (!found)
            {
                return Status::NotFound("key not found");
            }
            status = materialize(row, value, &blob);
            if (!status.ok())
            {
                return status;
            }
            if (options.info)
            {
                row.FillInfo(options.info);
            }
            rocksdb::WriteBatch batch;
            std::vector<std::string> dead_blobs;
            status = stage_delete(&batch, key, row, &dead_blobs);
            if (!status.ok())
            {
                return status;
            }
            return commit(db, &batch, dead_blobs); });
        return finish_read(read_blob(status, blob, value), options, value);
    }

    Status ShardStore::Delete(std::string_view key, bool retry, bool *deleted)
    {
        *deleted = false;
        return transact(retry, [&](rocksdb::DB *db) -> Status
                        {
            Row row;
            bool found = false;
            auto status = read_row(db, key, &row, &found);
            if (!status.ok() || !found)
            {
                return status;
            }
            rocksdb::WriteBatch batch;
            std::vector<std::string> dead_blobs;
            status = stage_delete(&batch, key, row, &dead_blobs);
            if (status.ok())
            {
                status = commit(db, &batch, dead_blobs);
            }
            if (status.ok())
            {
                *deleted = !row.expired(now_micros());
            }
            return status; });
    }

    // Counters keep their expire time and tag. A missing or expired counter is
    // recreated from default_value without either.
    Status ShardStore::Incr(std::string_view key, int64_t delta, std::optional<int64_t> default_value, bool retry, int64_t *result)
    {
        return transact(retry, [&](rocksdb::DB *db) -> Status
                        {
            Row row;
            bool found = false;
            auto status = read_row(db, key, &row, &found);
            if (!status.ok())
            {
                return status;
            }
            int64_t now = now_micros();
            rocksdb::WriteBatch batch;
            std::vector<std::string> dead_blobs;
            int64_t next = 0;
            if (found && !row.expired(now))
            {
                if (row.kind != ValueKind::kInteger)
                {
                    return Status::InvalidArgument("value is not an integer");
                }
                if (__builtin_add_overflow(row.integer, delta, &next))
                {
                    return Status::InvalidArgument("integer overflow");
                }
                row.integer = next;
                status = from_rocksdb(batch.Put(entry_key(key), row.Encode()), "stage put");
            }
            else
            {
                if (!default_value)
                {
                    return Status::NotFound("key not found");
                }
                if (__builtin_add_overflow(*default_value, delta, &next))
                {
                    return Status::InvalidArgument("integer overflow");
                }
                if (found)
                {
                    status = stage_delete(&batch, key, row, &dead_blobs);
                }
                Row fresh;
                fresh.kind = ValueKind::kInteger;
                fresh.integer = next;
                fresh.size = sizeof(int64_t);
                fresh.store_us = now;
                if (status.ok())
                {
                    status = stage_put(&batch, key, fresh);
                }
            }
            if (status.ok())
            {
                status = commit(db, &batch, dead_blobs);
            }
            if (status.ok())
            {
                *result = next;
            }
            return status; });
    }

    Status ShardStore::Touch(std::string_view key, std::optional<double> ttl, bool retry, bool *touched)
    {
        *touched = false;
        auto status = check_ttl(ttl);
        if (!status.ok())
        {
            return status;
        }
        return transact(retry, [&](rocksdb::DB *db) -> Status
                        {
            Row row;
            bool found = false;
            auto status = lookup(db, key, &row, &found);
            if (!status.ok() || !found)
            {
                return status;
            }
            rocksdb::WriteBatch batch;
            status = stage_delete(&batch, key, row, nullptr);
            if (!status.ok())
            {
                return status;
            }
            row.expire_us.reset();
            if (ttl)
            {
                row.expire_us = expire_micros(*ttl, now_micros());
            }
            status = stage_put(&batch, key, row);
            if (status.ok())
            {
                status = commit(db, &batch, {});
            }
            *touched = status.ok();
            return status; });
    }

    Status ShardStore::Contains(std::string_view key, bool *found)
    {
        *found = false;
        return transact(true, [&](rocksdb::DB *db) -> Status
                        {
            Row row;
            return lookup(db, key, &row, found); });
    }

    Status ShardStore::for_each_prefix(rocksdb::DB *db, const std::string &prefix, const std::string &start,
                                       const std::function<bool(const rocksdb::Slice &key, const rocksdb::Slice &value)> &func)
    {
        std::unique_ptr<rocksdb::Iterator> it(db->NewIterator(rocksdb::ReadOptions()));
        for (it->Seek(start); it->Valid(); it->Next())
        {
            if (!it->key().starts_with(prefix))
            {
                break;
            }
            if (!func(it->key(), it->value()))
            {
                break;
            }
        }
        return from_rocksdb(it->status(), "iterate " + prefix);
    }

    Status ShardStore::remove_batch(rocksdb::DB *db, const std::vector<std::string> &keys, uint64_t *removed)
    {
        *removed = 0;
        rocksdb::WriteBatch batch;
        std::vector<std::string> dead_blobs;
        uint64_t staged = 0;
        for (const auto &key : keys)
        {
            Row row;
            bool found = false;
            auto status = read_row(db, key, &row, &found);
            if (status.ok() && found)
            {
                status = stage_delete(&batch, key, row, &dead_blobs);
                staged++;
            }
            if (!status.ok())
            {
                return status;
            }
        }
        if (staged == 0)
        {
            return Status::OK();
        }
        auto status = commit(db, &batch, dead_blobs);
        if (status.ok())
        {
            *removed = staged;
        }
        return status;
    }

    Status ShardStore::Expire(int64_t now_us, bool retry, uint64_t *count)
    {
        *count = 0;
        while (true)
        {
            uint64_t removed = 0;
            size_t collected = 0;
            auto status = transact(retry, [&](rocksdb::DB *db) -> Status
                                   {
                std::vector<std::string> keys;
                auto status = for_each_prefix(db, kExpiryPrefix, kExpiryPrefix, [&](const rocksdb::Slice &key, const rocksdb::Slice &)
                                              {
                    auto raw = std::string_view(key.data(), key.size());
                    if (raw.size() < kExpiryPrefix.size() + 8 || expiry_key_time(raw) > now_us)
                    {
                        return false;
                    }
                    keys.emplace_back(raw.substr(kExpiryPrefix.size() + 8));
                    return keys.size() < kBatchSize; });
                collected = keys.size();
                if (status.ok())
                {
                    status = remove_batch(db, keys, &removed);
                }
                if (status.ok() && removed == 0 && !keys.empty())
                {
                    return Status::Corruption("expiry index refers to missing entries");
                }
                return status; });
            *count += removed;
            if (!status.ok())
            {
                return status;
            }
            if (collected < kBatchSize)
            {
                break;
            }
        }
        Logger()->debug("shard {}: expired {} entries", index_, *count);
        return Status::OK();
    }

    Status ShardStore::Evict(std::string_view tag, bool retry, uint64_t *count)
    {
        *count = 0;
        auto prefix = tag_prefix(tag);
        // Resume point of the scan used without a tag index.
        std::string cursor = kEntryPrefix;
        while (true)
        {
            uint64_t removed = 0;
            bool done = false;
            auto status = transact(retry, [&](rocksdb::DB *db) -> Status
                                   {
                std::vector<std::string> keys;
                Status status;
                if (tag_index_)
                {
                    status = for_each_prefix(db, prefix, prefix, [&](const rocksdb::Slice &key, const rocksdb::Slice &)
                                             {
                        keys.emplace_back(suffix(key, prefix.size()));
                        return keys.size() < kBatchSize; });
                    done = keys.size() < kBatchSize;
                }
                else
                {
                    Status decode_status;
                    bool stopped = false;
                    status = for_each_prefix(db, kEntryPrefix, cursor, [&](const rocksdb::Slice &key, const rocksdb::Slice &value)
                                             {
                        Row row;
                        decode_status = Row::Decode(std::string_view(value.data(), value.size()), &row);
                        if (!decode_status.ok())
                        {
                            stopped = true;
                            return false;
                        }
                        cursor.assign(key.data(), key.size());
                        cursor.push_back('\0');
                        if (row.tag && *row.tag == tag)
                        {
                            keys.emplace_back(suffix(key, kEntryPrefix.size()));
                        }
                        stopped = keys.size() >= kBatchSize;
                        return !stopped; });
                    if (status.ok())
                    {
                        status = decode_status;
                    }
                    done = !stopped;
                }
                if (status.ok())
                {
                    status = remove_batch(db, keys, &removed);
                }
                if (status.ok() && tag_index_ && removed == 0 && !keys.empty())
                {
                    return Status::Corruption("tag index refers to missing entries");
                }
                return status; });
            *count += removed;
            if (!status.ok())
            {
                return status;
            }
            if (done)
            {
                break;
            }
        }
        Logger()->debug("shard {}: evicted {} entries", index_, *count);
        return Status::OK();
    }

    Status ShardStore::Clear(bool retry, uint64_t *count)
    {
        *count = 0;
        while (true)
        {
            uint64_t removed = 0;
            size_t collected = 0;
            auto status = transact(retry, [&](rocksdb::DB *db) -> Status
                                   {
                std::vector<std::string> keys;
                auto status = for_each_prefix(db, kEntryPrefix, kEntryPrefix, [&](const rocksdb::Slice &key, const rocksdb::Slice &)
                                              {
                    keys.emplace_back(suffix(key, kEntryPrefix.size()));
                    return keys.size() < kBatchSize; });
                collected = keys.size();
                if (!status.ok())
                {
                    return status;
                }
                return remove_batch(db, keys, &removed); });
            *count += removed;
            if (!status.ok())
            {
                return status;
            }
            if (collected < kBatchSize)
            {
                break;
            }
        }
        Logger()->debug("shard {}: cleared {} entries", index_, *count);
        return Status::OK();
    }

    Status ShardStore::Count(uint64_t *count)
    {
        *count = 0;
        return transact(true, [&](rocksdb::DB *db) -> Status
                        {
            uint64_t live = 0;
            int64_t now = now_micros();
            Status decode_status;
            auto status = for_each_prefix(db, kEntryPrefix, kEntryPrefix, [&](const rocksdb::Slice &, const rocksdb::Slice &value)
                                          {
                Row row;
                decode_status = Row::Decode(std::string_view(value.data(), value.size()), &row);
                if (!decode_status.ok())
                {
                    return false;
                }
                if (!row.expired(now))
                {
                    live++;
                }
                return true; });
            if (status.ok())
            {
                status = decode_status;
            }
            if (status.ok())
            {
                *count = live;
            }
            return status; });
    }

    Status ShardStore::CreateTagIndex(bool retry)
    {
        return transact(retry, [&](rocksdb::DB *db) -> Status
                        {
            if (tag_index_)
            {
                return Status::OK();
            }
            rocksdb::WriteBatch batch;
            Status decode_status;
            rocksdb::Status put_status;
            auto status = for_each_prefix(db, kEntryPrefix, kEntryPrefix, [&](const rocksdb::Slice &key, const rocksdb::Slice &value)
                                          {
                Row row;
                decode_status = Row::Decode(std::string_view(value.data(), value.size()), &row);
                if (!decode_status.ok())
                {
                    return false;
                }
                if (row.tag)
                {
                    put_status = batch.Put(tag_key(*row.tag, suffix(key, kEntryPrefix.size())), rocksdb::Slice());
                }
                return put_status.ok(); });
            if (status.ok())
            {
                status = decode_status;
            }
            if (status.ok())
            {
                status = from_rocksdb(put_status, "stage tag index");
            }
            if (status.ok())
            {
                status = from_rocksdb(batch.Put(kTagIndexKey, "1"), "stage tag index");
            }
            if (status.ok())
            {
                status = commit(db, &batch, {});
            }
            if (status.ok())
            {
                tag_index_ = true;
                Logger()->debug("shard {}: created tag index", index_);
            }
            return status; });
    }

    Status ShardStore::DropTagIndex(bool retry)
    {
        return transact(retry, [&](rocksdb::DB *db) -> Status
                        {
            if (!tag_index_)
            {
                return Status::OK();
            }
            rocksdb::WriteBatch batch;
            rocksdb::Status s = batch.DeleteRange(kTagPrefix, prefix_end(kTagPrefix));
            if (s.ok())
            {
                s = batch.Delete(kTagIndexKey);
            }
            auto status = from_rocksdb(s, "stage drop tag index");
            if (status.ok())
            {
                status = commit(db, &batch, {});
            }
            if (status.ok())
            {
                tag_index_ = false;
                Logger()->debug("shard {}: dropped tag index", index_);
            }
            return status; });
    }

    Status ShardStore::HasTagIndex(bool *exists)
    {
        *exists = false;
        return transact(true, [&](rocksdb::DB *) -> Status
                        {
            *exists = tag_index_;
            return Status::OK(); });
    }

    CacheStats ShardStore::Stats(bool reset)
    {
        CacheStats stats;
        if (reset)
        {
            stats.hits = hits_.exchange(0);
            stats.misses = misses_.exchange(0);
        }
        else
        {
            stats.hits = hits_.load();
            stats.misses = misses_.load();
        }
        return stats;
    }
}
