#ifndef SHARDCACHE_STATUS_H
#define SHARDCACHE_STATUS_H

#include <string>
namespace ShardCache {

enum Code {
    kOK,
    kNotFound,
    kTimeout,
    kClosed,
    kBusy,
    kIOError,
    kCorruption,
    kInvalidArgument,
};

class Status {
public:
    Status() = default;
    Status(Code code, const std::string& msg) noexcept;
    ~Status()= default;

    bool ok() const;
    bool not_found() const;
    bool timeout() const;
    bool closed() const;
    // busy is only seen inside the store: RetryPolicy turns it into timeout.
    bool busy() const;
    bool io_error() const;
    bool corruption() const;
    bool invalid_argument() const;
    Code code() const;
    std::string msg() const;
    std::string ToString() const;

    static Status OK();
    static Status NotFound(const std::string& msg = std::string());
    static Status Timeout(const std::string& msg = std::string());
    static Status Closed(const std::string& msg = std::string());
    static Status Busy(const std::string& msg = std::string());
    static Status IOError(const std::string& msg = std::string());
    static Status Corruption(const std::string& msg = std::string());
    static Status InvalidArgument(const std::string& msg = std::string());
private:
    Code code_ = kOK;
    std::string msg_;
};


}

#endif
