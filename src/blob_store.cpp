#include "blob_store.h"
#include "log.h"

#include <openssl/rand.h>
#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

#include <algorithm>
#include <array>
#include <cerrno>
#include <cstring>
#include <filesystem>
#include <stdexcept>
#include <system_error>

namespace ShardCache
{
    static constexpr size_t kChunkSize = 64 * 1024;
    static const std::string kTempDir = "tmp";

    namespace
    {
        std::string errno_msg(const std::string &what, const std::string &path)
        {
            return fmt::format("{} {}: {}", what, path, strerror(errno));
        }

        Status write_fully(int fd, const char *data, size_t len, const std::string &path)
        {
            while (len > 0)
            {
                ssize_t nwrite = ::write(fd, data, len);
                if (nwrite < 0)
                {
                    if (errno == EINTR)
                    {
                        continue;
                    }
                    return Status::IOError(errno_msg("write", path));
                }
                data += nwrite;
                len -= nwrite;
            }
            return Status::OK();
        }

        Status fsync_dir(const std::string &dir)
        {
            int dfd = ::open(dir.c_str(), O_RDONLY | O_DIRECTORY);
            if (dfd < 0)
            {
                return Status::IOError(errno_msg("open", dir));
            }
            int rc = ::fsync(dfd);
            ::close(dfd);
            if (rc != 0)
            {
                return Status::IOError(errno_msg("fsync", dir));
            }
            return Status::OK();
        }
    }

    Status ReadStream::ReadAll(std::string *out)
    {
        out->clear();
        char buffer[kChunkSize];
        while (true)
        {
            size_t nread = 0;
            auto status = Read(buffer, sizeof(buffer), &nread);
            if (!status.ok())
            {
                return status;
            }
            if (nread == 0)
            {
                return Status::OK();
            }
            out->append(buffer, nread);
        }
    }

    Status MemoryReadStream::Read(char *buffer, size_t n, size_t *nread)
    {
        *nread = std::min(n, data_.size() - pos_);
        memcpy(buffer, data_.data() + pos_, *nread);
        pos_ += *nread;
        return Status::OK();
    }

    // Holds one reference on its file until destroyed.
    class BlobStore::FileReadStream : public ReadStream
    {
    public:
        FileReadStream(std::shared_ptr<BlobStore> store, std::string name, int fd, uint64_t size)
            : store_(std::move(store)), name_(std::move(name)), fd_(fd), size_(size) {}

        ~FileReadStream() override
        {
            ::close(fd_);
            store_->release(name_);
        }

        Status Read(char *buffer, size_t n, size_t *nread) override
        {
            while (true)
            {
                ssize_t rc = ::read(fd_, buffer, n);
                if (rc < 0)
                {
                    if (errno == EINTR)
                    {
                        continue;
                    }
                    *nread = 0;
                    return Status::IOError(errno_msg("read", name_));
                }
                *nread = static_cast<size_t>(rc);
                return Status::OK();
            }
        }

        uint64_t Size() const override { return size_; }

    private:
        std::shared_ptr<BlobStore> store_;
        std::string name_;
        int fd_;
        uint64_t size_;
    };

    BlobStore::BlobStore(std::string dir) : dir_(std::move(dir)) {}

    Status BlobStore::Init()
    {
        std::error_code ec;
        std::filesystem::create_directories(std::filesystem::path(dir_) / kTempDir, ec);
        if (ec)
        {
            return Status::IOError(fmt::format("create {}: {}", dir_, ec.message()));
        }
        return Status::OK();
    }

    std::string BlobStore::path(const std::string &name) const
    {
        return dir_ + "/" + name;
    }

    std::string BlobStore::random_hex()
    {
        std::array<unsigned char, 16> bytes;
        if (1 != RAND_bytes(bytes.data(), bytes.size()))
        {
            throw std::runtime_error("RAND_bytes failed");
        }
        static const char digits[] = "0123456789abcdef";
        std::string hex;
        hex.reserve(bytes.size() * 2);
        for (auto b : bytes)
        {
            hex.push_back(digits[b >> 4]);
            hex.push_back(digits[b & 0xf]);
        }
        return hex;
    }

    Status BlobStore::create_temp(std::string *temp_path, int *fd)
    {
        *temp_path = path(kTempDir + "/" + random_hex() + ".tmp");
        *fd = ::open(temp_path->c_str(), O_WRONLY | O_CREAT | O_EXCL, 0644);
        if (*fd < 0)
        {
            return Status::IOError(errno_msg("create", *temp_path));
        }
        return Status::OK();
    }

    // Takes ownership of fd. The temporary file is removed on failure.
    Status BlobStore::place(const std::string &temp_path, int fd, std::string *name)
    {
        if (::fsync(fd) != 0)
        {
            auto status = Status::IOError(errno_msg("fsync", temp_path));
            ::close(fd);
            ::unlink(temp_path.c_str());
            return status;
        }
        ::close(fd);

        auto hex = random_hex();
        auto sub_dir = hex.substr(0, 2) + "/" + hex.substr(2, 2);
        auto final_name = sub_dir + "/" + hex.substr(4) + ".val";

        std::error_code ec;
        std::filesystem::create_directories(path(sub_dir), ec);
        if (ec)
        {
            ::unlink(temp_path.c_str());
            return Status::IOError(fmt::format("create {}: {}", path(sub_dir), ec.message()));
        }
        if (::rename(temp_path.c_str(), path(final_name).c_str()) != 0)
        {
            auto status = Status::IOError(errno_msg("rename", temp_path));
            ::unlink(temp_path.c_str());
            return status;
        }
        auto status = fsync_dir(path(sub_dir));
        if (!status.ok())
        {
            ::unlink(path(final_name).c_str());
            return status;
        }
        *name = final_name;
        return Status::OK();
    }

    Status BlobStore::Write(std::string_view value, std::string *name)
    {
        std::string temp_path;
        int fd = -1;
        auto status = create_temp(&temp_path, &fd);
        if (!status.ok())
        {
            return status;
        }
        status = write_fully(fd, value.data(), value.size(), temp_path);
        if (!status.ok())
        {
            ::close(fd);
            ::unlink(temp_path.c_str());
            return status;
        }
        return place(temp_path, fd, name);
    }

    Status BlobStore::Write(std::istream &in, std::string *name, uint64_t *size)
    {
        std::string temp_path;
        int fd = -1;
        auto status = create_temp(&temp_path, &fd);
        if (!status.ok())
        {
            return status;
        }
        char buffer[kChunkSize];
        uint64_t total = 0;
        while (in)
        {
            in.read(buffer, sizeof(buffer));
            auto nread = in.gcount();
            if (nread <= 0)
            {
                break;
            }
            status = write_fully(fd, buffer, static_cast<size_t>(nread), temp_path);
            if (!status.ok())
            {
                break;
            }
            total += nread;
        }
        if (status.ok() && in.bad())
        {
            status = Status::IOError("input stream failed");
        }
        if (!status.ok())
        {
            ::close(fd);
            ::unlink(temp_path.c_str());
            return status;
        }
        *size = total;
        return place(temp_path, fd, name);
    }

    Status BlobStore::Read(const std::string &name, std::string *value)
    {
        std::unique_ptr<ReadStream> stream;
        auto status = Open(name, &stream);
        if (!status.ok())
        {
            return status;
        }
        value->reserve(stream->Size());
        return stream->ReadAll(value);
    }

    Status BlobStore::Open(const std::string &name, std::unique_ptr<ReadStream> *stream)
    {
        std::unique_lock<std::mutex> lock(mutex_);
        auto file = path(name);
        int fd = ::open(file.c_str(), O_RDONLY);
        if (fd < 0)
        {
            if (errno == ENOENT)
            {
                return Status::Corruption(fmt::format("blob {} is missing", file));
            }
            return Status::IOError(errno_msg("open", file));
        }
        struct stat st;
        if (::fstat(fd, &st) != 0)
        {
            auto status = Status::IOError(errno_msg("stat", file));
            ::close(fd);
            return status;
        }
        refs_[name]++;
        lock.unlock();
        *stream = std::make_unique<FileReadStream>(shared_from_this(), name, fd, static_cast<uint64_t>(st.st_size));
        return Status::OK();
    }

    void BlobStore::Remove(const std::string &name)
    {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (refs_.count(name))
            {
                doomed_.insert(name);
                return;
            }
        }
        unlink_file(name);
    }

    void BlobStore::release(const std::string &name)
    {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            auto it = refs_.find(name);
            if (it == refs_.end() || --it->second > 0)
            {
                return;
            }
            refs_.erase(it);
            if (doomed_.erase(name) == 0)
            {
                return;
            }
        }
        unlink_file(name);
    }

    void BlobStore::unlink_file(const std::string &name)
    {
        auto file = path(name);
        if (::unlink(file.c_str()) != 0 && errno != ENOENT)
        {
            Logger()->error("failed to remove blob {}: {}", file, strerror(errno));
        }
    }

    size_t BlobStore::OpenStreams(const std::string &name)
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = refs_.find(name);
        return it == refs_.end() ? 0 : it->second;
    }

    size_t BlobStore::PendingRemovals()
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return doomed_.size();
    }
}
