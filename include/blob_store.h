#ifndef SHARDCACHE_BLOB_STORE_H
#define SHARDCACHE_BLOB_STORE_H

#include "status.h"
#include <istream>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <unordered_map>
#include <unordered_set>

namespace ShardCache
{
    // A byte stream over a cached value.
    class ReadStream
    {
    public:
        virtual ~ReadStream() = default;

        // Reads up to n bytes. *nread is 0 at the end of the stream.
        virtual Status Read(char *buffer, size_t n, size_t *nread) = 0;
        virtual uint64_t Size() const = 0;

        Status ReadAll(std::string *out);
    };

    // Stream over a value that is stored inline in its row.
    class MemoryReadStream : public ReadStream
    {
    public:
        explicit MemoryReadStream(std::string data) : data_(std::move(data)) {}

        Status Read(char *buffer, size_t n, size_t *nread) override;
        uint64_t Size() const override { return data_.size(); }

    private:
        std::string data_;
        size_t pos_ = 0;
    };

    // BlobStore is the content area of one shard.
    //
    // Disk layout:
    // <dir>/tmp/<hex>.tmp      in-flight writes
    // <dir>/<ab>/<cd>/<hex>.val placed values, named by 128 random bits
    //
    // Names handed out by Write are relative to <dir>. A file that still has
    // open streams is only unlinked when its last stream is destroyed.
    class BlobStore : public std::enable_shared_from_this<BlobStore>
    {
    public:
        explicit BlobStore(std::string dir);
        BlobStore(const BlobStore &) = delete;
        BlobStore &operator=(const BlobStore &) = delete;

        Status Init();

        // Write the value to a temporary file, fsync it and rename it into
        // place. On success the file is durable and *name refers to it.
        Status Write(std::string_view value, std::string *name);
        Status Write(std::istream &in, std::string *name, uint64_t *size);

        Status Read(const std::string &name, std::string *value);
        Status Open(const std::string &name, std::unique_ptr<ReadStream> *stream);

        // Remove the file now, or once no stream references it.
        void Remove(const std::string &name);

        size_t OpenStreams(const std::string &name);
        size_t PendingRemovals();
        const std::string &dir() const { return dir_; }

    private:
        class FileReadStream;

        std::string dir_;
        std::mutex mutex_;
        std::unordered_map<std::string, size_t> refs_; // GUARDED_BY(mutex_)
        std::unordered_set<std::string> doomed_;       // GUARDED_BY(mutex_)

        std::string path(const std::string &name) const;
        static std::string random_hex();
        Status create_temp(std::string *temp_path, int *fd);
        Status place(const std::string &temp_path, int fd, std::string *name);
        void release(const std::string &name);
        void unlink_file(const std::string &name);
    };
}

#endif
