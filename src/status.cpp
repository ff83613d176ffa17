#include "status.h"

namespace ShardCache {

Status::Status(Code code, const std::string& msg) noexcept : code_(code), msg_(msg) {}


bool Status::ok() const {
    return code_ == kOK;
}

bool Status::not_found() const {
    return code_ == kNotFound;
}

bool Status::timeout() const {
    return code_ == kTimeout;
}

bool Status::closed() const {
    return code_ == kClosed;
}

bool Status::busy() const {
    return code_ == kBusy;
}

bool Status::io_error() const {
    return code_ == kIOError;
}

bool Status::corruption() const {
    return code_ == kCorruption;
}

bool Status::invalid_argument() const {
    return code_ == kInvalidArgument;
}

Code Status::code() const {
    return code_;
}

std::string Status::msg() const {
    return msg_;
}

std::string Status::ToString() const {
    const char* name = "";
    switch (code_) {
    case kOK: return "OK";
    case kNotFound: name = "NotFound"; break;
    case kTimeout: name = "Timeout"; break;
    case kClosed: name = "Closed"; break;
    case kBusy: name = "Busy"; break;
    case kIOError: name = "IOError"; break;
    case kCorruption: name = "Corruption"; break;
    case kInvalidArgument: name = "InvalidArgument"; break;
    }
    if (msg_.empty()) {
        return name;
    }
    return std::string(name) + ": " + msg_;
}

Status Status::OK() {
    return Status(kOK, "");
}

Status Status::NotFound(const std::string& msg) {
    return Status(kNotFound, msg);
}

Status Status::Timeout(const std::string& msg) {
    return Status(kTimeout, msg);
}

Status Status::Closed(const std::string& msg) {
    return Status(kClosed, msg);
}

Status Status::Busy(const std::string& msg) {
    return Status(kBusy, msg);
}

Status Status::IOError(const std::string& msg) {
    return Status(kIOError, msg);
}

Status Status::Corruption(const std::string& msg) {
    return Status(kCorruption, msg);
}

Status Status::InvalidArgument(const std::string& msg) {
    return Status(kInvalidArgument, msg);
}

}
